#include "search_cache/codec.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace search_cache {
namespace {
constexpr std::size_t kLengthPrefix = 8;
constexpr std::uint64_t kMaxRawBytes = 1ULL << 31;

class IdentityCodec final : public ICodec {
public:
  CodecId id() const override { return CodecId::None; }
  std::string name() const override { return "none"; }
  bool available() const override { return true; }
  bool compress(const Bytes &in, Bytes *out, std::string *) const override {
    *out = in;
    return true;
  }
  bool decompress(const Bytes &in, Bytes *out, std::string *) const override {
    *out = in;
    return true;
  }
};

class ZlibCodec final : public ICodec {
public:
  ZlibCodec(CodecId id, int level, std::string name)
      : id_(id), level_(level), name_(std::move(name)) {}

  CodecId id() const override { return id_; }
  std::string name() const override { return name_; }
  bool available() const override { return zlibVersion()[0] == ZLIB_VERSION[0]; }

  bool compress(const Bytes &in, Bytes *out, std::string *err) const override {
    uLongf bound = compressBound(static_cast<uLong>(in.size()));
    out->assign(kLengthPrefix + bound, 0);
    const std::uint64_t raw = in.size();
    for (std::size_t i = 0; i < kLengthPrefix; ++i)
      (*out)[i] = static_cast<std::uint8_t>((raw >> (8 * i)) & 0xff);
    const int rc = compress2(out->data() + kLengthPrefix, &bound, in.data(),
                             static_cast<uLong>(in.size()), level_);
    if (rc != Z_OK) {
      if (err)
        *err = "zlib compress failed: " + std::to_string(rc);
      return false;
    }
    out->resize(kLengthPrefix + bound);
    return true;
  }

  bool decompress(const Bytes &in, Bytes *out, std::string *err) const override {
    if (in.size() < kLengthPrefix) {
      if (err)
        *err = "zlib payload truncated";
      return false;
    }
    std::uint64_t raw = 0;
    for (std::size_t i = 0; i < kLengthPrefix; ++i)
      raw |= static_cast<std::uint64_t>(in[i]) << (8 * i);
    if (raw > kMaxRawBytes) {
      if (err)
        *err = "zlib payload length out of range";
      return false;
    }
    out->assign(static_cast<std::size_t>(raw), 0);
    uLongf dest_len = static_cast<uLongf>(raw);
    // uncompress() rejects a null destination even for empty payloads.
    Bytef scratch = 0;
    Bytef *dest = raw == 0 ? &scratch : out->data();
    if (raw == 0)
      dest_len = 1;
    const int rc = uncompress(dest, &dest_len, in.data() + kLengthPrefix,
                              static_cast<uLong>(in.size() - kLengthPrefix));
    if (rc != Z_OK || (raw > 0 && dest_len != raw) ||
        (raw == 0 && dest_len != 0)) {
      if (err)
        *err = "zlib decompress failed: " + std::to_string(rc);
      out->clear();
      return false;
    }
    return true;
  }

private:
  CodecId id_;
  int level_;
  std::string name_;
};
} // namespace

const char *codec_name(CodecId id) {
  switch (id) {
  case CodecId::None:
    return "none";
  case CodecId::ZlibFast:
    return "zlib_fast";
  case CodecId::ZlibDefault:
    return "zlib";
  case CodecId::ZlibBest:
    return "zlib_best";
  }
  return "unknown";
}

std::optional<CodecId> codec_id_by_name(const std::string &name) {
  for (auto id : {CodecId::None, CodecId::ZlibFast, CodecId::ZlibDefault,
                  CodecId::ZlibBest}) {
    if (name == codec_name(id))
      return id;
  }
  return std::nullopt;
}

std::unique_ptr<ICodec> make_codec(CodecId id) {
  switch (id) {
  case CodecId::None:
    return std::make_unique<IdentityCodec>();
  case CodecId::ZlibFast:
    return std::make_unique<ZlibCodec>(id, Z_BEST_SPEED, codec_name(id));
  case CodecId::ZlibDefault:
    return std::make_unique<ZlibCodec>(id, Z_DEFAULT_COMPRESSION,
                                       codec_name(id));
  case CodecId::ZlibBest:
    return std::make_unique<ZlibCodec>(id, Z_BEST_COMPRESSION, codec_name(id));
  }
  return nullptr;
}

CodecRegistry::CodecRegistry(CodecId preferred) {
  for (auto id : {CodecId::ZlibFast, CodecId::ZlibDefault, CodecId::ZlibBest,
                  CodecId::None}) {
    auto codec = make_codec(id);
    if (codec && codec->available())
      codecs_.push_back(std::move(codec));
  }
  active_ = find(preferred);
  if (active_ == nullptr) {
    active_ = codecs_.front().get();
    spdlog::warn("codec {} not available, falling back to {}",
                 codec_name(preferred), active_->name());
  }
}

const ICodec *CodecRegistry::find(CodecId id) const {
  for (const auto &c : codecs_)
    if (c->id() == id)
      return c.get();
  return nullptr;
}

std::vector<CodecId> CodecRegistry::chain() const {
  std::vector<CodecId> out;
  out.reserve(codecs_.size());
  for (const auto &c : codecs_)
    out.push_back(c->id());
  return out;
}

std::optional<CompressedPayload>
CodecRegistry::compress(const Bytes &raw, std::string *err) const {
  CompressedPayload out;
  out.codec = active_->id();
  if (!active_->compress(raw, &out.data, err))
    return std::nullopt;
  return out;
}

bool CodecRegistry::decompress(CodecId id, const Bytes &data, Bytes *out,
                               std::string *err) const {
  const ICodec *codec = find(id);
  if (codec == nullptr) {
    if (err)
      *err = std::string("codec unavailable: ") + codec_name(id);
    return false;
  }
  return codec->decompress(data, out, err);
}

} // namespace search_cache
