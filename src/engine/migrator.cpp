#include "search_cache/migrator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace search_cache {
namespace {
std::size_t idx(TierKind kind) { return static_cast<std::size_t>(kind); }
} // namespace

TierMigrator::TierMigrator(TierSet tiers, KeyLocks &locks,
                           StatsCollector &stats, MigratorConfig cfg)
    : tiers_(tiers), locks_(locks), stats_(stats), cfg_(cfg) {
  cfg_.promotion_threshold = std::max<std::uint32_t>(1, cfg_.promotion_threshold);
  cfg_.batch = std::max<std::size_t>(1, cfg_.batch);
}

bool TierMigrator::record_hit(const CacheKey &key, TierKind from) {
  if (from == TierKind::Hot)
    return false;
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  if (promoting_.count(key))
    return false;
  auto &hits = history_[key];
  hits.push_back(now);
  while (!hits.empty() && hits.front() + cfg_.promotion_window < now)
    hits.pop_front();
  if (hits.size() < cfg_.promotion_threshold)
    return false;
  history_.erase(key);
  promoting_.insert(key);
  promote_queue_.push_back({++next_seq_, key, from});
  return true;
}

void TierMigrator::on_evicted(TierKind from, EvictionReport &report,
                              std::uint64_t epoch) {
  std::deque<Spill> pending;
  pending.push_back({from, std::move(report), epoch});
  report.evicted.clear();

  while (!pending.empty()) {
    Spill spill = std::move(pending.front());
    pending.pop_front();
    if (spill.report.evicted.empty())
      continue;
    stats_.add(Counter::Evictions, spill.report.evicted.size());
    if (spill.from == TierKind::Cold) {
      for (const auto &e : spill.report.evicted)
        spdlog::debug("cold tier evicted {}", e.key.hex());
      continue;
    }
    const auto to = static_cast<TierKind>(idx(spill.from) + 1);
    for (auto &e : spill.report.evicted) {
      const auto key = e.key;
      auto stripe = locks_.lock(key);
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (invalidated_since_locked(key, spill.epoch))
          continue;
      }
      auto next = demote_locked(std::move(e), to);
      stripe.unlock();
      pending.push_back(std::move(next));
    }
  }
}

std::size_t TierMigrator::tick() {
  std::size_t work = 0;
  while (work < cfg_.batch && promote_one())
    ++work;
  if (work < cfg_.batch)
    work += pressure_sweep(cfg_.batch - work);
  return work;
}

std::size_t TierMigrator::prune_history(TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t pruned = 0;
  for (auto it = history_.begin(); it != history_.end();) {
    if (it->second.empty() || it->second.back() + cfg_.promotion_window < now) {
      it = history_.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }
  // An invalidation stays on record for one full prune interval, longer
  // than any demotion in flight when it was made.
  for (auto it = invalidated_.begin(); it != invalidated_.end();) {
    if (it->second <= prune_mark_)
      it = invalidated_.erase(it);
    else
      ++it;
  }
  prune_mark_ = epoch_.load();
  return pruned;
}

void TierMigrator::cancel(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(mu_);
  invalidated_[key] = ++epoch_;
  history_.erase(key);
  promoting_.erase(key);
  promote_queue_.erase(
      std::remove_if(promote_queue_.begin(), promote_queue_.end(),
                     [&](const Promotion &p) { return p.key == key; }),
      promote_queue_.end());
}

void TierMigrator::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  cleared_epoch_ = ++epoch_;
  invalidated_.clear();
  history_.clear();
  promoting_.clear();
  promote_queue_.clear();
}

std::size_t TierMigrator::backlog() const {
  std::lock_guard<std::mutex> lock(mu_);
  return promote_queue_.size();
}

bool TierMigrator::promote_one() {
  std::uint64_t seq = 0;
  CacheKey key;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (promote_queue_.empty())
      return false;
    seq = promote_queue_.front().seq;
    key = promote_queue_.front().key;
  }
  auto stripe = locks_.lock(key);
  TierKind from = TierKind::Warm;
  {
    std::lock_guard<std::mutex> lock(mu_);
    // Cancelled or taken by another tick while we waited on the stripe.
    if (promote_queue_.empty() || promote_queue_.front().seq != seq)
      return true;
    from = promote_queue_.front().from;
    promote_queue_.pop_front();
    promoting_.erase(key);
  }
  auto spill = promote_locked(key, from);
  stripe.unlock();
  on_evicted(spill.from, spill.report, spill.epoch);
  return true;
}

TierMigrator::Spill TierMigrator::promote_locked(const CacheKey &key,
                                                 TierKind from) {
  Spill spill;
  if (from == TierKind::Hot)
    return spill;
  auto entry = tier(from).remove(key);
  if (!entry.has_value())
    return spill;
  const auto to = static_cast<TierKind>(idx(from) - 1);
  spill.epoch = this->epoch();
  auto report = tier(to).put(*entry, PutMode::Insert);
  if (!report.stored) {
    spdlog::debug("promotion of {} to {} refused: {}", key.hex(),
                  tier_name(to), reject_reason_name(report.reason));
    spill.from = from;
    spill.report = tier(from).put(std::move(*entry), PutMode::Insert);
    if (!spill.report.stored)
      stats_.add(Counter::RejectedInserts);
    return spill;
  }
  stats_.add(Counter::Promotions);
  if (to != TierKind::Hot)
    stats_.record_compression(report.raw_bytes, report.stored_bytes);
  spdlog::debug("promoted {} {} -> {}", key.hex(), tier_name(from),
                tier_name(to));
  spill.from = to;
  spill.report = std::move(report);
  return spill;
}

TierMigrator::Spill TierMigrator::demote_locked(CacheEntry entry,
                                                TierKind to) {
  Spill spill;
  spill.from = to;
  const auto key = entry.key;
  // Re-inserted by a writer since it was evicted; the newer copy wins.
  if (resident_anywhere(key))
    return spill;
  spill.epoch = this->epoch();
  auto report = tier(to).put(std::move(entry), PutMode::Demote);
  if (!report.stored) {
    stats_.add(Counter::DroppedDemotions);
    spdlog::debug("demotion of {} to {} dropped: {}", key.hex(),
                  tier_name(to), reject_reason_name(report.reason));
    return spill;
  }
  stats_.add(Counter::Demotions);
  stats_.record_compression(report.raw_bytes, report.stored_bytes);
  spdlog::debug("demoted {} -> {}", key.hex(), tier_name(to));
  spill.report = std::move(report);
  return spill;
}

std::size_t TierMigrator::pressure_sweep(std::size_t budget) {
  std::size_t moved = 0;
  for (auto kind : {TierKind::Hot, TierKind::Warm}) {
    auto &t = tier(kind);
    const auto to = static_cast<TierKind>(idx(kind) + 1);
    const auto limit =
        static_cast<double>(t.budget_bytes()) * cfg_.demotion_pressure;
    while (moved < budget && t.budget_bytes() > 0 &&
           static_cast<double>(t.current_usage_bytes()) > limit) {
      const auto key = t.victim();
      if (!key.has_value())
        break;
      ++moved;
      auto stripe = locks_.lock(*key);
      // Removed and re-placed under the stripe, so readers that wait on it
      // find the entry in one tier or the other.
      auto entry = t.remove(*key);
      if (!entry.has_value())
        continue;
      stats_.add(Counter::Evictions);
      auto spill = demote_locked(std::move(*entry), to);
      stripe.unlock();
      on_evicted(spill.from, spill.report, spill.epoch);
    }
  }
  return moved;
}

bool TierMigrator::resident_anywhere(const CacheKey &key) const {
  return std::any_of(tiers_.begin(), tiers_.end(),
                     [&](const Tier *t) { return t->contains(key); });
}

bool TierMigrator::invalidated_since_locked(const CacheKey &key,
                                            std::uint64_t epoch) const {
  if (epoch < cleared_epoch_)
    return true;
  auto it = invalidated_.find(key);
  return it != invalidated_.end() && it->second > epoch;
}

} // namespace search_cache
