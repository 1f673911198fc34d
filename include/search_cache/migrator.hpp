#pragma once

#include "search_cache/lock_pool.hpp"
#include "search_cache/stats.hpp"
#include "search_cache/tier.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace search_cache {

struct MigratorConfig {
  std::uint32_t promotion_threshold{3};
  Millis promotion_window{60000};
  std::size_t batch{64};
  // Fraction of a tier's budget above which the sweep starts demoting;
  // 1.0 leaves demotion to evictions alone.
  double demotion_pressure{0.9};
};

using TierSet = std::array<Tier *, kTierCount>;

// Moves entries between adjacent tiers. Readers only enqueue promotions,
// which tick() carries out. Evictions are demoted right away by the thread
// that caused them. Every move holds the key's stripe lock.
class TierMigrator {
public:
  TierMigrator(TierSet tiers, KeyLocks &locks, StatsCollector &stats,
               MigratorConfig cfg);

  // Returns true when the hit queued a promotion.
  bool record_hit(const CacheKey &key, TierKind tier);
  // Read before a put whose evictions will be handed to on_evicted(); keys
  // invalidated after that point are not demoted.
  std::uint64_t epoch() const { return epoch_.load(); }
  // Demotes every entry evicted from `from` one tier down, following the
  // evictions that causes. The caller must not hold a stripe lock.
  void on_evicted(TierKind from, EvictionReport &report, std::uint64_t epoch);

  // Processes up to cfg.batch queued promotions, then the pressure sweep.
  std::size_t tick();
  std::size_t prune_history(TimePoint now);

  // Callers hold the key's stripe lock.
  void cancel(const CacheKey &key);
  void clear();

  std::size_t backlog() const;
  const MigratorConfig &config() const { return cfg_; }

private:
  struct Promotion {
    std::uint64_t seq;
    CacheKey key;
    TierKind from;
  };
  // Entries a move pushed out of `from`, still to be demoted.
  struct Spill {
    TierKind from{TierKind::Hot};
    EvictionReport report;
    std::uint64_t epoch{0};
  };

  bool promote_one();
  Spill promote_locked(const CacheKey &key, TierKind from);
  Spill demote_locked(CacheEntry entry, TierKind to);
  std::size_t pressure_sweep(std::size_t budget);
  bool resident_anywhere(const CacheKey &key) const;
  bool invalidated_since_locked(const CacheKey &key, std::uint64_t epoch) const;
  Tier &tier(TierKind kind) { return *tiers_[static_cast<std::size_t>(kind)]; }

  TierSet tiers_;
  KeyLocks &locks_;
  StatsCollector &stats_;
  MigratorConfig cfg_;

  std::atomic<std::uint64_t> epoch_{0};
  mutable std::mutex mu_;
  std::uint64_t next_seq_{0};
  std::uint64_t cleared_epoch_{0};
  std::uint64_t prune_mark_{0};
  std::unordered_map<CacheKey, std::uint64_t, CacheKeyHash> invalidated_;
  std::deque<Promotion> promote_queue_;
  std::unordered_set<CacheKey, CacheKeyHash> promoting_;
  std::unordered_map<CacheKey, std::deque<TimePoint>, CacheKeyHash> history_;
};

} // namespace search_cache
