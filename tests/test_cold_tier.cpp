#include "search_cache/cold_tier.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace search_cache;
using search_cache::test::key_of;
using search_cache::test::make_entry;
using search_cache::test::TempDir;

namespace {
ColdConfig cold_config(const TempDir &dir, std::uint64_t budget = 1 << 20) {
  return ColdConfig{dir.str(), budget, FsyncMode::Never};
}

void flip_last_byte(const std::string &path) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  f.seekg(-1, std::ios::end);
  char c = 0;
  f.read(&c, 1);
  f.seekp(-1, std::ios::end);
  c = static_cast<char>(c ^ 0x7f);
  f.write(&c, 1);
}
} // namespace

TEST_CASE("Cold tier persists one compressed record per key", "[cold]") {
  TempDir dir;
  CodecRegistry codecs;
  ColdTier cold(cold_config(dir), codecs);
  REQUIRE(cold.init());
  REQUIRE(cold.available());

  auto e = make_entry(7, 2048);
  auto report = cold.put(e);
  REQUIRE(report.stored);
  const auto path = cold.record_path(e.key);
  CHECK(std::filesystem::exists(path));
  CHECK(path.find(e.key.hex()) != std::string::npos);
  CHECK(cold.current_usage_bytes() == report.stored_bytes);
  CHECK(report.stored_bytes < 2048);

  auto got = cold.get(e.key);
  REQUIRE(got.has_value());
  CHECK(got->tier == TierKind::Cold);
  CHECK(got->codec == CodecId::ZlibFast);
  CHECK(got->access_count == 1);
  Bytes raw;
  REQUIRE(codecs.decompress(got->codec, got->payload, &raw));
  CHECK(raw == e.payload);

  auto removed = cold.remove(e.key);
  REQUIRE(removed.has_value());
  CHECK_FALSE(std::filesystem::exists(path));
  CHECK(cold.size() == 0);
  CHECK(cold.current_usage_bytes() == 0);
}

TEST_CASE("Cold index is rebuilt from records after a restart", "[cold]") {
  TempDir dir;
  CodecRegistry codecs;
  {
    ColdTier cold(cold_config(dir), codecs);
    REQUIRE(cold.init());
    REQUIRE(cold.put(make_entry(1, 300)).stored);
    REQUIRE(cold.put(make_entry(2, 400)).stored);
    REQUIRE(cold.get(key_of(1)).has_value());
    REQUIRE(cold.get(key_of(1)).has_value());
    CHECK(cold.flush() == 1);
  }

  // Records written by another codec stay readable.
  CodecRegistry other(CodecId::ZlibBest);
  ColdTier reopened(cold_config(dir), other);
  REQUIRE(reopened.init());
  CHECK(reopened.size() == 2);
  auto got = reopened.get(key_of(1));
  REQUIRE(got.has_value());
  CHECK(got->access_count == 3);
  Bytes raw;
  REQUIRE(other.decompress(got->codec, got->payload, &raw));
  CHECK(raw == make_entry(1, 300).payload);
}

TEST_CASE("A corrupted record reads as a miss and is removed", "[cold]") {
  TempDir dir;
  CodecRegistry codecs;
  ColdTier cold(cold_config(dir), codecs);
  REQUIRE(cold.init());
  auto e = make_entry(3, 1024);
  REQUIRE(cold.put(e).stored);
  const auto path = cold.record_path(e.key);
  flip_last_byte(path);

  CHECK_FALSE(cold.get(e.key).has_value());
  CHECK_FALSE(std::filesystem::exists(path));
  CHECK_FALSE(cold.contains(e.key));
  CHECK(cold.current_usage_bytes() == 0);
  CHECK(cold.stats().corrupt_records == 1);
  CHECK(cold.available());
}

TEST_CASE("Rebuild drops corrupt, foreign and expired records", "[cold]") {
  TempDir dir;
  CodecRegistry codecs;
  std::string corrupt_path, expired_path;
  {
    ColdTier cold(cold_config(dir), codecs);
    REQUIRE(cold.init());
    REQUIRE(cold.put(make_entry(1, 100)).stored);
    REQUIRE(cold.put(make_entry(2, 100)).stored);
    REQUIRE(cold.put(make_entry(3, 100, std::chrono::milliseconds(30))).stored);
    corrupt_path = cold.record_path(key_of(2));
    expired_path = cold.record_path(key_of(3));
  }
  flip_last_byte(corrupt_path);
  std::filesystem::create_directories(dir.path() / "ab");
  {
    std::ofstream junk(dir.path() / "ab" / "not-a-key.rec");
    junk << "garbage";
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  ColdTier cold(cold_config(dir), codecs);
  REQUIRE(cold.init());
  CHECK(cold.size() == 1);
  CHECK(cold.contains(key_of(1)));
  CHECK_FALSE(std::filesystem::exists(corrupt_path));
  CHECK_FALSE(std::filesystem::exists(expired_path));
  CHECK_FALSE(std::filesystem::exists(dir.path() / "ab" / "not-a-key.rec"));
  CHECK(cold.stats().corrupt_records == 2);
}

TEST_CASE("Cold tier evicts the least recently accessed record", "[cold]") {
  TempDir dir;
  CodecRegistry codecs(CodecId::None);
  ColdTier cold(cold_config(dir, 300), codecs);
  REQUIRE(cold.init());
  for (std::uint8_t tag = 1; tag <= 3; ++tag) {
    REQUIRE(cold.put(make_entry(tag, 100)).stored);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  REQUIRE(cold.get(key_of(1)).has_value());

  auto report = cold.put(make_entry(4, 100));
  REQUIRE(report.stored);
  REQUIRE(report.evicted.size() == 1);
  CHECK(report.evicted[0].key == key_of(2));
  CHECK_FALSE(std::filesystem::exists(cold.record_path(key_of(2))));
  CHECK(cold.current_usage_bytes() <= 300);

  // A demotion older than every resident is refused and changes nothing.
  auto old = make_entry(5, 100);
  old.last_accessed_at -= std::chrono::seconds(30);
  auto refused = cold.put(old, PutMode::Demote);
  CHECK_FALSE(refused.stored);
  CHECK(refused.reason == RejectReason::LowerPriority);
  CHECK(cold.size() == 3);
  auto victim = cold.victim();
  REQUIRE(victim.has_value());
  CHECK(*victim == key_of(3));
}

TEST_CASE("Unusable storage degrades to always-miss until it recovers",
          "[cold]") {
  TempDir dir;
  const auto blocker = dir.path() / "blocked";
  { std::ofstream f(blocker); }
  CodecRegistry codecs;
  ColdTier cold(ColdConfig{blocker.string(), 1 << 20, FsyncMode::Never},
                codecs);
  std::string err;
  CHECK_FALSE(cold.init(&err));
  CHECK_FALSE(err.empty());
  CHECK_FALSE(cold.available());

  auto report = cold.put(make_entry(1, 10));
  CHECK_FALSE(report.stored);
  CHECK(report.reason == RejectReason::StorageUnavailable);
  CHECK_FALSE(cold.get(key_of(1)).has_value());
  CHECK_FALSE(cold.probe());

  std::filesystem::remove(blocker);
  CHECK(cold.probe());
  CHECK(cold.available());
  CHECK(cold.put(make_entry(1, 10)).stored);
  CHECK(cold.get(key_of(1)).has_value());
}
