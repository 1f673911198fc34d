#include "search_cache/reaper.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <thread>

using namespace search_cache;
using search_cache::test::key_of;
using search_cache::test::make_entry;
using search_cache::test::TempDir;

TEST_CASE("Reaper clears expired entries from every tier in batches",
          "[reaper]") {
  TempDir dir;
  CodecRegistry codecs;
  StatsCollector stats;
  KeyLocks locks;
  HotTier hot(1 << 20, codecs);
  WarmTier warm(1 << 20, codecs, PolicyParams{});
  ColdTier cold(ColdConfig{dir.str(), 1 << 20, FsyncMode::Never}, codecs);
  REQUIRE(cold.init());
  TierSet tiers{&hot, &warm, &cold};
  TierMigrator migrator(tiers, locks, stats, MigratorConfig{});

  const auto short_ttl = std::chrono::milliseconds(30);
  for (std::uint8_t tag = 0; tag < 50; ++tag)
    REQUIRE(hot.put(make_entry(tag, 16, short_ttl)).stored);
  for (std::uint8_t tag = 50; tag < 60; ++tag)
    REQUIRE(warm.put(make_entry(tag, 16, short_ttl)).stored);
  for (std::uint8_t tag = 60; tag < 65; ++tag)
    REQUIRE(cold.put(make_entry(tag, 16, short_ttl)).stored);
  REQUIRE(hot.put(make_entry(100, 16)).stored);
  REQUIRE(cold.put(make_entry(101, 16)).stored);
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  ExpiryReaper reaper(tiers, &cold, &migrator, ReaperConfig{Millis(1000), 8});
  const auto result = reaper.sweep(Clock::now());
  CHECK(result.expired == 65);
  CHECK(result.batches > 3);
  CHECK(hot.size() == 1);
  CHECK(warm.size() == 0);
  CHECK(cold.size() == 1);
  CHECK(hot.contains(key_of(100)));
  CHECK(cold.contains(key_of(101)));
  CHECK_FALSE(std::filesystem::exists(cold.record_path(key_of(60))));
  CHECK(hot.expirations() + warm.expirations() + cold.expirations() == 65);
}

TEST_CASE("Background reaper runs on its interval and stops cleanly",
          "[reaper]") {
  CodecRegistry codecs;
  HotTier hot(1 << 20, codecs);
  WarmTier warm(1 << 20, codecs, PolicyParams{});
  TempDir dir;
  ColdTier cold(ColdConfig{dir.str(), 1 << 20, FsyncMode::Never}, codecs);
  REQUIRE(cold.init());
  ExpiryReaper reaper(TierSet{&hot, &warm, &cold}, &cold, nullptr,
                      ReaperConfig{Millis(20), 4});
  for (std::uint8_t tag = 0; tag < 10; ++tag)
    REQUIRE(hot.put(make_entry(tag, 8, std::chrono::milliseconds(10))).stored);
  reaper.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  reaper.stop();
  CHECK(hot.size() == 0);
  CHECK(hot.expirations() == 10);
}

TEST_CASE("Reaper probes an unavailable cold tier back to life", "[reaper]") {
  TempDir dir;
  const auto blocker = dir.path() / "cold";
  { std::ofstream f(blocker); }
  CodecRegistry codecs;
  HotTier hot(1024, codecs);
  WarmTier warm(1024, codecs, PolicyParams{});
  ColdTier cold(ColdConfig{blocker.string(), 1024, FsyncMode::Never}, codecs);
  CHECK_FALSE(cold.init());
  ExpiryReaper reaper(TierSet{&hot, &warm, &cold}, &cold, nullptr,
                      ReaperConfig{});

  CHECK_FALSE(reaper.sweep(Clock::now()).cold_recovered);
  std::filesystem::remove(blocker);
  CHECK(reaper.sweep(Clock::now()).cold_recovered);
  CHECK(cold.available());
}

TEST_CASE("Cold metadata is flushed in bounded batches", "[reaper]") {
  TempDir dir;
  CodecRegistry codecs;
  HotTier hot(1024, codecs);
  WarmTier warm(1024, codecs, PolicyParams{});
  ColdTier cold(ColdConfig{dir.str(), 1 << 20, FsyncMode::Never}, codecs);
  REQUIRE(cold.init());
  for (std::uint8_t tag = 0; tag < 10; ++tag) {
    REQUIRE(cold.put(make_entry(tag, 32)).stored);
    REQUIRE(cold.get(key_of(tag)).has_value());
  }
  CHECK(cold.flush(4) == 4);
  CHECK(cold.flush(4) == 4);
  CHECK(cold.flush(4) == 2);
  CHECK(cold.flush(4) == 0);

  for (std::uint8_t tag = 0; tag < 10; ++tag)
    REQUIRE(cold.get(key_of(tag)).has_value());
  ExpiryReaper reaper(TierSet{&hot, &warm, &cold}, &cold, nullptr,
                      ReaperConfig{Millis(1000), 3});
  const auto result = reaper.sweep(Clock::now());
  CHECK(result.flushed == 10);
  CHECK(cold.flush() == 0);
}
