#pragma once

#include "search_cache/codec.hpp"
#include "search_cache/cold_tier.hpp"
#include "search_cache/config.hpp"
#include "search_cache/key_deriver.hpp"
#include "search_cache/lock_pool.hpp"
#include "search_cache/migrator.hpp"
#include "search_cache/periodic_task.hpp"
#include "search_cache/reaper.hpp"
#include "search_cache/stats.hpp"
#include "search_cache/tier.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace search_cache {

// Produces the value for a missed key. Returning nullopt is a failure; the
// message left in *err reaches the caller unchanged.
using FillFn = std::function<std::optional<Bytes>(std::string *err)>;

using InflightMap =
    std::unordered_map<CacheKey, std::shared_future<std::optional<Bytes>>,
                       CacheKeyHash>;

enum class LookupOutcome { HitHot, HitWarm, HitCold, Miss };

// Hot/warm/cold cache in front of an expensive backend. One instance is
// built at startup and shared by reference.
class TieredCache {
public:
  explicit TieredCache(CacheConfig cfg);
  ~TieredCache();

  TieredCache(const TieredCache &) = delete;
  TieredCache &operator=(const TieredCache &) = delete;

  // A ttl of zero or less computes without caching.
  std::optional<Bytes> get_or_compute(const KeyParams &params,
                                      std::optional<Millis> ttl,
                                      const FillFn &fill,
                                      std::string *err = nullptr);
  std::optional<Bytes> get(const KeyParams &params,
                           LookupOutcome *outcome = nullptr);
  bool put(const KeyParams &params, Bytes value,
           std::optional<Millis> ttl = std::nullopt);
  bool invalidate(const KeyParams &params);
  void clear_all();

  std::optional<TierKind> locate(const KeyParams &params) const;
  StatsSnapshot stats() const;
  std::string info() const { return stats().render_info(); }

  // One reaper sweep, then migration ticks until the queues drain.
  void run_maintenance();
  void shutdown();

  const CacheConfig &config() const { return cfg_; }
  ColdTier &cold_tier() { return cold_; }

private:
  std::optional<Bytes> lookup(const CacheKey &key, LookupOutcome *outcome);
  // Probes every tier under the key's stripe lock, after any move of the
  // key has finished. Records no statistics.
  std::optional<Bytes> recheck(const CacheKey &key);
  void note_hit(const CacheKey &key, TierKind tier);
  std::optional<Bytes> decode(Tier &tier, const CacheEntry &entry,
                              bool stripe_held = false);
  bool store(const CacheKey &key, Bytes value, Millis ttl);

  CacheConfig cfg_;
  CodecRegistry codecs_;
  StatsCollector stats_;
  KeyLocks locks_;
  HotTier hot_;
  WarmTier warm_;
  ColdTier cold_;
  TierMigrator migrator_;
  ExpiryReaper reaper_;
  std::unique_ptr<PeriodicTask> migration_task_;

  std::mutex inflight_mu_;
  InflightMap inflight_;
  std::atomic<bool> shut_down_{false};
};

} // namespace search_cache
