#include "search_cache/codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <random>

using namespace search_cache;

namespace {
Bytes random_bytes(std::size_t n, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  Bytes out(n);
  for (auto &b : out)
    b = static_cast<std::uint8_t>(rng() & 0xff);
  return out;
}
} // namespace

TEST_CASE("Every codec round-trips arbitrary payloads including empty ones",
          "[codec]") {
  const std::string text(4096, 'r');
  const std::vector<Bytes> payloads = {
      Bytes{}, Bytes{0x00}, Bytes(text.begin(), text.end()),
      random_bytes(10000, 7)};
  for (auto id : {CodecId::None, CodecId::ZlibFast, CodecId::ZlibDefault,
                  CodecId::ZlibBest}) {
    auto codec = make_codec(id);
    REQUIRE(codec);
    REQUIRE(codec->available());
    for (const auto &p : payloads) {
      Bytes packed, restored;
      std::string err;
      REQUIRE(codec->compress(p, &packed, &err));
      REQUIRE(codec->decompress(packed, &restored, &err));
      CHECK(restored == p);
    }
  }
}

TEST_CASE("Registry prefers the configured codec and keeps a static chain",
          "[codec]") {
  CodecRegistry reg(CodecId::ZlibBest);
  CHECK(reg.active().id() == CodecId::ZlibBest);
  const auto chain = reg.chain();
  REQUIRE(chain.size() == 4);
  CHECK(chain.front() == CodecId::ZlibFast);
  CHECK(chain.back() == CodecId::None);

  const std::string text(2048, 'z');
  const Bytes raw(text.begin(), text.end());
  auto packed = reg.compress(raw);
  REQUIRE(packed.has_value());
  CHECK(packed->codec == CodecId::ZlibBest);
  CHECK(packed->data.size() < raw.size());

  // Reads go by the stored id, whatever the active codec is.
  CodecRegistry other(CodecId::ZlibFast);
  Bytes out;
  REQUIRE(other.decompress(packed->codec, packed->data, &out));
  CHECK(out == raw);
}

TEST_CASE("Corrupt or unknown payloads fail to decode", "[codec]") {
  CodecRegistry reg;
  Bytes out;
  std::string err;

  CHECK_FALSE(reg.decompress(static_cast<CodecId>(42), Bytes{1, 2, 3}, &out,
                             &err));
  CHECK(err.find("codec unavailable") != std::string::npos);

  CHECK_FALSE(reg.decompress(CodecId::ZlibFast, Bytes{1, 2}, &out, &err));

  auto packed = reg.compress(random_bytes(512, 3));
  REQUIRE(packed.has_value());
  auto damaged = packed->data;
  for (std::size_t i = 8; i < damaged.size(); ++i)
    damaged[i] ^= 0x5a;
  CHECK_FALSE(reg.decompress(packed->codec, damaged, &out, &err));

  Bytes huge(16, 0xff);
  CHECK_FALSE(reg.decompress(CodecId::ZlibFast, huge, &out, &err));
  CHECK(err.find("out of range") != std::string::npos);
}

TEST_CASE("Codec names map both ways", "[codec]") {
  for (auto id : {CodecId::None, CodecId::ZlibFast, CodecId::ZlibDefault,
                  CodecId::ZlibBest}) {
    auto back = codec_id_by_name(codec_name(id));
    REQUIRE(back.has_value());
    CHECK(*back == id);
  }
  CHECK_FALSE(codec_id_by_name("lz4").has_value());
}
