#include "search_cache/cache.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace search_cache {
namespace {
double elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}

// Marks a key as being filled. Waiters block on the shared future; whatever
// way the leader leaves, the slot is erased before they are woken.
class InflightSlot {
public:
  InflightSlot(std::mutex &mu, InflightMap &map, const CacheKey &key,
               std::promise<std::optional<Bytes>> promise)
      : mu_(mu), map_(map), key_(key), promise_(std::move(promise)) {}
  ~InflightSlot() { release(std::nullopt); }

  InflightSlot(const InflightSlot &) = delete;
  InflightSlot &operator=(const InflightSlot &) = delete;

  void release(std::optional<Bytes> value) {
    if (released_)
      return;
    released_ = true;
    {
      std::lock_guard<std::mutex> lock(mu_);
      map_.erase(key_);
    }
    promise_.set_value(std::move(value));
  }

private:
  std::mutex &mu_;
  InflightMap &map_;
  CacheKey key_;
  std::promise<std::optional<Bytes>> promise_;
  bool released_{false};
};

spdlog::level::level_enum level_from_name(const std::string &name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "warn")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}
} // namespace

TieredCache::TieredCache(CacheConfig cfg)
    : cfg_(std::move(cfg)), codecs_(cfg_.codec), stats_(cfg_.hot_keys_top_n),
      hot_(cfg_.hot_budget_bytes, codecs_),
      warm_(cfg_.warm_budget_bytes, codecs_,
            PolicyParams{cfg_.w_frequency, cfg_.w_recency}),
      cold_(ColdConfig{cfg_.cold_dir, cfg_.cold_budget_bytes, cfg_.fsync},
            codecs_),
      migrator_(TierSet{&hot_, &warm_, &cold_}, locks_, stats_,
                MigratorConfig{cfg_.promotion_threshold, cfg_.promotion_window,
                               cfg_.migration_batch, cfg_.demotion_pressure}),
      reaper_(TierSet{&hot_, &warm_, &cold_}, &cold_, &migrator_,
              ReaperConfig{cfg_.reaper_interval, cfg_.reaper_batch}) {
  spdlog::set_level(level_from_name(cfg_.log_level));
  std::string err;
  if (!cold_.init(&err))
    spdlog::warn("continuing without cold tier until {} is usable",
                 cfg_.cold_dir);
  if (cfg_.enabled && cfg_.background_threads) {
    reaper_.start();
    migration_task_ = std::make_unique<PeriodicTask>(
        "tier migrator", cfg_.migration_interval, [this] { migrator_.tick(); });
    migration_task_->start();
  }
  spdlog::info("search cache up: enabled={} hot={}B warm={}B cold={}B "
               "codec={} fsync={} ttl={}ms",
               cfg_.enabled, cfg_.hot_budget_bytes, cfg_.warm_budget_bytes,
               cfg_.cold_budget_bytes, codecs_.active().name(),
               fsync_mode_name(cfg_.fsync), cfg_.default_ttl.count());
}

TieredCache::~TieredCache() { shutdown(); }

std::optional<Bytes> TieredCache::get_or_compute(const KeyParams &params,
                                                 std::optional<Millis> ttl,
                                                 const FillFn &fill,
                                                 std::string *err) {
  if (!cfg_.enabled) {
    auto value = fill(err);
    stats_.add(value.has_value() ? Counter::Fills : Counter::FillFailures);
    return value;
  }
  const auto key = derive_key(params);
  const Millis effective_ttl = ttl.value_or(cfg_.default_ttl);

  while (true) {
    if (auto hit = lookup(key, nullptr))
      return hit;

    std::promise<std::optional<Bytes>> promise;
    std::shared_future<std::optional<Bytes>> pending;
    bool leader = false;
    {
      std::lock_guard<std::mutex> lock(inflight_mu_);
      auto it = inflight_.find(key);
      if (it != inflight_.end()) {
        pending = it->second;
      } else {
        inflight_.emplace(key, promise.get_future().share());
        leader = true;
      }
    }
    if (!leader) {
      stats_.add(Counter::CoalescedWaits);
      auto value = pending.get();
      if (value.has_value())
        return value;
      // The leader failed; nothing was cached. Try the fill ourselves.
      continue;
    }

    InflightSlot slot(inflight_mu_, inflight_, key, std::move(promise));
    // The key may have been stored by a leader that finished after our
    // lookup, or been in the middle of a move between tiers.
    if (auto raced = recheck(key)) {
      slot.release(raced);
      return raced;
    }

    std::string fill_err;
    auto value = fill(&fill_err);
    if (!value.has_value()) {
      stats_.add(Counter::FillFailures);
      spdlog::debug("fill failed for {}: {}", key.hex(), fill_err);
      if (err)
        *err = fill_err;
      return std::nullopt;
    }
    stats_.add(Counter::Fills);
    if (effective_ttl.count() > 0)
      store(key, *value, effective_ttl);
    slot.release(value);
    return value;
  }
}

std::optional<Bytes> TieredCache::get(const KeyParams &params,
                                      LookupOutcome *outcome) {
  if (!cfg_.enabled) {
    if (outcome)
      *outcome = LookupOutcome::Miss;
    return std::nullopt;
  }
  return lookup(derive_key(params), outcome);
}

bool TieredCache::put(const KeyParams &params, Bytes value,
                      std::optional<Millis> ttl) {
  const Millis effective_ttl = ttl.value_or(cfg_.default_ttl);
  if (!cfg_.enabled || effective_ttl.count() <= 0)
    return false;
  return store(derive_key(params), std::move(value), effective_ttl);
}

bool TieredCache::invalidate(const KeyParams &params) {
  const auto key = derive_key(params);
  auto stripe = locks_.lock(key);
  migrator_.cancel(key);
  bool removed = false;
  for (Tier *t : {static_cast<Tier *>(&hot_), static_cast<Tier *>(&warm_),
                  static_cast<Tier *>(&cold_)}) {
    if (t->contains(key)) {
      t->remove(key);
      removed = true;
    }
  }
  if (removed)
    spdlog::debug("invalidated {}", key.hex());
  return removed;
}

void TieredCache::clear_all() {
  {
    // No move can be half done while the tiers are emptied.
    auto stripes = locks_.lock_all();
    migrator_.clear();
    hot_.clear();
    warm_.clear();
    cold_.clear();
  }
  stats_.reset();
  spdlog::info("search cache cleared");
}

std::optional<TierKind> TieredCache::locate(const KeyParams &params) const {
  const auto key = derive_key(params);
  if (hot_.contains(key))
    return TierKind::Hot;
  if (warm_.contains(key))
    return TierKind::Warm;
  if (cold_.contains(key))
    return TierKind::Cold;
  return std::nullopt;
}

StatsSnapshot TieredCache::stats() const {
  auto s = stats_.snapshot();
  const Tier *tiers[] = {&hot_, &warm_, &cold_};
  std::uint64_t expirations = 0;
  for (std::size_t i = 0; i < kTierCount; ++i) {
    s.per_tier_usage_bytes[i] = tiers[i]->current_usage_bytes();
    s.tiers[i].usage_bytes = s.per_tier_usage_bytes[i];
    s.tiers[i].budget_bytes = tiers[i]->budget_bytes();
    s.tiers[i].entries = tiers[i]->size();
    expirations += tiers[i]->expirations();
  }
  s.counters[static_cast<std::size_t>(Counter::Expirations)] = expirations;
  const auto cold_stats = cold_.stats();
  s.cold_reads = cold_stats.reads;
  s.cold_writes = cold_stats.writes;
  s.cold_read_mb = cold_stats.read_mb;
  s.cold_write_mb = cold_stats.write_mb;
  s.counters[static_cast<std::size_t>(Counter::CorruptEntries)] +=
      cold_stats.corrupt_records;
  s.cold_available = cold_.available();
  s.migration_backlog = migrator_.backlog();
  return s;
}

void TieredCache::run_maintenance() {
  reaper_.sweep(Clock::now());
  // Bounded so a pathological workload cannot pin the caller here.
  for (int i = 0; i < 1024; ++i) {
    if (migrator_.tick() == 0)
      break;
  }
}

void TieredCache::shutdown() {
  if (shut_down_.exchange(true))
    return;
  if (migration_task_)
    migration_task_->stop();
  reaper_.stop();
  const auto flushed = cold_.available() ? cold_.flush() : 0;
  const auto s = stats();
  spdlog::info("search cache shut down: hits={} misses={} cold records "
               "flushed={}",
               s.hits, s.misses, flushed);
}

std::optional<Bytes> TieredCache::lookup(const CacheKey &key,
                                         LookupOutcome *outcome) {
  const auto start = std::chrono::steady_clock::now();
  auto finish = [&](std::optional<Bytes> value, LookupOutcome result) {
    stats_.record_lookup(key, value.has_value(), elapsed_ms(start));
    if (outcome)
      *outcome = result;
    return value;
  };

  auto t0 = std::chrono::steady_clock::now();
  auto entry = hot_.get(key);
  stats_.record_tier(TierKind::Hot, entry.has_value(), elapsed_ms(t0));
  if (entry.has_value())
    return finish(std::move(entry->payload), LookupOutcome::HitHot);

  t0 = std::chrono::steady_clock::now();
  entry = warm_.get(key);
  auto value = entry.has_value() ? decode(warm_, *entry) : std::nullopt;
  stats_.record_tier(TierKind::Warm, value.has_value(), elapsed_ms(t0));
  if (value.has_value()) {
    note_hit(key, TierKind::Warm);
    return finish(std::move(value), LookupOutcome::HitWarm);
  }

  t0 = std::chrono::steady_clock::now();
  entry = cold_.get(key);
  value = entry.has_value() ? decode(cold_, *entry) : std::nullopt;
  stats_.record_tier(TierKind::Cold, value.has_value(), elapsed_ms(t0));
  if (value.has_value()) {
    note_hit(key, TierKind::Cold);
    return finish(std::move(value), LookupOutcome::HitCold);
  }
  return finish(std::nullopt, LookupOutcome::Miss);
}

std::optional<Bytes> TieredCache::recheck(const CacheKey &key) {
  auto stripe = locks_.lock(key);
  if (auto entry = hot_.get(key))
    return std::move(entry->payload);
  for (Tier *t : {static_cast<Tier *>(&warm_), static_cast<Tier *>(&cold_)}) {
    auto entry = t->get(key);
    if (!entry.has_value())
      continue;
    if (auto value = decode(*t, *entry, true))
      return value;
  }
  return std::nullopt;
}

void TieredCache::note_hit(const CacheKey &key, TierKind tier) {
  if (migrator_.record_hit(key, tier) && migration_task_)
    migration_task_->poke();
}

std::optional<Bytes> TieredCache::decode(Tier &tier, const CacheEntry &entry,
                                         bool stripe_held) {
  if (entry.codec == CodecId::None)
    return entry.payload;
  Bytes raw;
  std::string err;
  if (codecs_.decompress(entry.codec, entry.payload, &raw, &err))
    return raw;
  stats_.add(Counter::CorruptEntries);
  spdlog::warn("{} tier: corrupt entry {}: {}", tier_name(tier.kind()),
               entry.key.hex(), err);
  if (stripe_held) {
    tier.remove(entry.key);
  } else {
    auto stripe = locks_.lock(entry.key);
    tier.remove(entry.key);
  }
  return std::nullopt;
}

bool TieredCache::store(const CacheKey &key, Bytes value, Millis ttl) {
  const auto now = Clock::now();
  CacheEntry entry;
  entry.key = key;
  entry.codec = CodecId::None;
  entry.raw_size = value.size();
  entry.payload = std::move(value);
  entry.created_at = now;
  entry.ttl = ttl;
  entry.last_accessed_at = now;
  entry.tier = TierKind::Hot;

  std::uint64_t epoch = 0;
  EvictionReport report;
  {
    auto stripe = locks_.lock(key);
    // Queued moves of an older copy must not outlive this write.
    migrator_.cancel(key);
    warm_.remove(key);
    if (cold_.contains(key))
      cold_.remove(key);
    epoch = migrator_.epoch();
    report = hot_.put(std::move(entry));
    if (!report.stored)
      hot_.remove(key);
  }
  const bool stored = report.stored;
  if (!stored) {
    stats_.add(Counter::RejectedInserts);
    spdlog::debug("not caching {}: {}", key.hex(),
                  reject_reason_name(report.reason));
  }
  // Victims go one tier down before this write returns.
  migrator_.on_evicted(TierKind::Hot, report, epoch);
  return stored;
}

} // namespace search_cache
