#include "search_cache/cold_tier.hpp"
#include "search_cache/migrator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace search_cache;
using search_cache::test::key_of;
using search_cache::test::make_entry;
using search_cache::test::random_entry;
using search_cache::test::TempDir;

namespace {
struct Rig {
  explicit Rig(MigratorConfig cfg = {}, std::uint64_t hot_budget = 300,
               std::uint64_t warm_budget = 1 << 20)
      : hot(hot_budget, codecs), warm(warm_budget, codecs, PolicyParams{}),
        cold(ColdConfig{dir.str(), 1 << 20, FsyncMode::Never}, codecs),
        migrator(TierSet{&hot, &warm, &cold}, locks, stats, cfg) {
    cold.init();
  }

  // Puts into a tier the way the cache does: evictions go to the migrator.
  void put(Tier &t, CacheEntry e) {
    const auto epoch = migrator.epoch();
    auto report = t.put(std::move(e));
    migrator.on_evicted(t.kind(), report, epoch);
  }

  int residency(const CacheKey &k) const {
    return static_cast<int>(hot.contains(k)) +
           static_cast<int>(warm.contains(k)) +
           static_cast<int>(cold.contains(k));
  }

  void drain() {
    while (migrator.tick() > 0) {
    }
  }

  TempDir dir;
  CodecRegistry codecs;
  StatsCollector stats;
  KeyLocks locks;
  HotTier hot;
  WarmTier warm;
  ColdTier cold;
  TierMigrator migrator;
};

MigratorConfig no_pressure() {
  MigratorConfig cfg;
  cfg.demotion_pressure = 1.0;
  return cfg;
}

void pause() { std::this_thread::sleep_for(std::chrono::milliseconds(2)); }
} // namespace

TEST_CASE("Entries evicted from the hot tier are demoted to warm",
          "[migrator]") {
  Rig rig(no_pressure());
  for (std::uint8_t tag = 1; tag <= 4; ++tag) {
    rig.put(rig.hot, make_entry(tag, 100));
    pause();
  }
  // The write that evicted key 1 also placed it in warm; no tick ran.
  CHECK_FALSE(rig.hot.contains(key_of(1)));
  CHECK(rig.warm.contains(key_of(1)));
  CHECK(rig.residency(key_of(1)) == 1);
  CHECK(rig.migrator.backlog() == 0);
  const auto s = rig.stats.snapshot();
  CHECK(s.counter(Counter::Evictions) == 1);
  CHECK(s.counter(Counter::Demotions) == 1);
  CHECK(s.compression_ratio < 1.0);

  auto warm_copy = rig.warm.get(key_of(1));
  REQUIRE(warm_copy.has_value());
  CHECK(warm_copy->codec != CodecId::None);
}

TEST_CASE("Warm evictions cascade to the cold tier", "[migrator]") {
  Rig rig(no_pressure(), 1 << 20, 200);
  WarmTier &warm = rig.warm;
  rig.put(warm, random_entry(1, 150));
  pause();
  rig.put(warm, random_entry(2, 150));
  CHECK(warm.contains(key_of(2)));
  CHECK(rig.cold.contains(key_of(1)));
  CHECK(rig.residency(key_of(1)) == 1);
}

TEST_CASE("Repeated cold hits promote the entry one tier up", "[migrator]") {
  MigratorConfig cfg = no_pressure();
  cfg.promotion_threshold = 3;
  Rig rig(cfg);
  auto e = make_entry(5, 64);
  REQUIRE(rig.cold.put(e).stored);

  for (int i = 0; i < 2; ++i) {
    REQUIRE(rig.cold.get(e.key).has_value());
    rig.migrator.record_hit(e.key, TierKind::Cold);
  }
  rig.drain();
  CHECK(rig.cold.contains(e.key));

  REQUIRE(rig.cold.get(e.key).has_value());
  rig.migrator.record_hit(e.key, TierKind::Cold);
  rig.drain();
  CHECK(rig.warm.contains(e.key));
  CHECK_FALSE(rig.cold.contains(e.key));
  CHECK(rig.stats.snapshot().counter(Counter::Promotions) == 1);

  for (int i = 0; i < 3; ++i)
    rig.migrator.record_hit(e.key, TierKind::Warm);
  rig.drain();
  auto hot_copy = rig.hot.get(e.key);
  REQUIRE(hot_copy.has_value());
  CHECK(hot_copy->codec == CodecId::None);
  CHECK(hot_copy->payload == e.payload);
  CHECK(rig.residency(e.key) == 1);
}

TEST_CASE("Hits spread wider than the promotion window do not promote",
          "[migrator]") {
  MigratorConfig cfg = no_pressure();
  cfg.promotion_threshold = 2;
  cfg.promotion_window = std::chrono::milliseconds(40);
  Rig rig(cfg);
  REQUIRE(rig.warm.put(make_entry(1, 32)).stored);
  rig.migrator.record_hit(key_of(1), TierKind::Warm);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  rig.migrator.record_hit(key_of(1), TierKind::Warm);
  CHECK(rig.migrator.backlog() == 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK(rig.migrator.prune_history(Clock::now()) == 1);
}

TEST_CASE("A demotion loses to a newer write of the same key", "[migrator]") {
  Rig rig(no_pressure());
  for (std::uint8_t tag = 1; tag <= 3; ++tag) {
    rig.put(rig.hot, make_entry(tag, 100));
    pause();
  }
  const auto epoch = rig.migrator.epoch();
  auto victim = rig.hot.remove(key_of(1));
  REQUIRE(victim.has_value());

  // Key 1 comes back through a fresh write before its eviction is handled.
  {
    auto stripe = rig.locks.lock(key_of(1));
    rig.migrator.cancel(key_of(1));
  }
  rig.put(rig.hot, make_entry(1, 100));
  EvictionReport late;
  late.evicted.push_back(std::move(*victim));
  rig.migrator.on_evicted(TierKind::Hot, late, epoch);
  CHECK(rig.hot.contains(key_of(1)));
  CHECK(rig.residency(key_of(1)) == 1);
  CHECK(rig.stats.snapshot().counter(Counter::Demotions) == 0);

  // Without the cancel, residency alone keeps the stale copy out.
  const auto epoch2 = rig.migrator.epoch();
  EvictionReport stale;
  stale.evicted.push_back(make_entry(2, 100));
  rig.migrator.on_evicted(TierKind::Hot, stale, epoch2);
  CHECK(rig.residency(key_of(2)) == 1);
  CHECK(rig.hot.contains(key_of(2)));
}

TEST_CASE("Cancelled keys are neither promoted nor demoted", "[migrator]") {
  MigratorConfig cfg = no_pressure();
  cfg.promotion_threshold = 1;
  Rig rig(cfg);
  REQUIRE(rig.warm.put(make_entry(9, 10)).stored);
  CHECK(rig.migrator.record_hit(key_of(9), TierKind::Warm));
  CHECK_FALSE(rig.migrator.record_hit(key_of(9), TierKind::Warm));
  REQUIRE(rig.migrator.backlog() == 1);
  {
    auto stripe = rig.locks.lock(key_of(9));
    rig.migrator.cancel(key_of(9));
  }
  CHECK(rig.migrator.backlog() == 0);
  rig.drain();
  CHECK(rig.warm.contains(key_of(9)));
  CHECK_FALSE(rig.hot.contains(key_of(9)));

  // An eviction read before the cancel is discarded.
  for (std::uint8_t tag = 1; tag <= 3; ++tag)
    rig.put(rig.hot, make_entry(tag, 100));
  const auto epoch = rig.migrator.epoch();
  auto victim_key = rig.hot.victim();
  REQUIRE(victim_key.has_value());
  auto victim = rig.hot.remove(*victim_key);
  REQUIRE(victim.has_value());
  {
    auto stripe = rig.locks.lock(victim->key);
    rig.migrator.cancel(victim->key);
  }
  EvictionReport late;
  const auto key = victim->key;
  late.evicted.push_back(std::move(*victim));
  rig.migrator.on_evicted(TierKind::Hot, late, epoch);
  CHECK(rig.residency(key) == 0);
}

TEST_CASE("A clear while a demotion waits on its stripe wins", "[migrator]") {
  Rig rig(no_pressure());
  EvictionReport report;
  report.evicted.push_back(make_entry(7, 100));
  const auto epoch = rig.migrator.epoch();

  auto stripe = rig.locks.lock(key_of(7));
  std::thread mover(
      [&] { rig.migrator.on_evicted(TierKind::Hot, report, epoch); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  rig.migrator.clear();
  rig.hot.clear();
  rig.warm.clear();
  rig.cold.clear();
  stripe.unlock();
  mover.join();

  CHECK(rig.residency(key_of(7)) == 0);
  CHECK(rig.stats.snapshot().counter(Counter::Demotions) == 0);
}

TEST_CASE("A refused demotion drops the entry", "[migrator]") {
  Rig rig(no_pressure(), 1 << 20, 150);
  auto resident = random_entry(1, 100);
  resident.access_count = 100;
  REQUIRE(rig.warm.put(resident).stored);

  auto incoming = random_entry(2, 100);
  incoming.created_at -= std::chrono::seconds(20);
  incoming.last_accessed_at = incoming.created_at;
  EvictionReport report;
  report.evicted.push_back(incoming);
  rig.migrator.on_evicted(TierKind::Hot, report, rig.migrator.epoch());
  rig.drain();
  CHECK(rig.residency(key_of(2)) == 0);
  CHECK(rig.warm.contains(key_of(1)));
  CHECK(rig.stats.snapshot().counter(Counter::DroppedDemotions) == 1);
}

TEST_CASE("The pressure sweep demotes from a tier above its threshold",
          "[migrator]") {
  MigratorConfig cfg;
  cfg.demotion_pressure = 0.5;
  Rig rig(cfg, 400);
  for (std::uint8_t tag = 1; tag <= 4; ++tag) {
    REQUIRE(rig.hot.put(make_entry(tag, 100)).stored);
    pause();
  }
  rig.drain();
  CHECK(rig.hot.current_usage_bytes() <= 200);
  CHECK(rig.warm.contains(key_of(1)));
  CHECK(rig.warm.contains(key_of(2)));
  CHECK(rig.hot.contains(key_of(4)));
  for (std::uint8_t tag = 1; tag <= 4; ++tag)
    CHECK(rig.residency(key_of(tag)) == 1);
}
