#include "search_cache/reaper.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace search_cache {

ExpiryReaper::ExpiryReaper(TierSet tiers, ColdTier *cold,
                           TierMigrator *migrator, ReaperConfig cfg)
    : tiers_(tiers), cold_(cold), migrator_(migrator), cfg_(cfg) {
  cfg_.batch = std::max<std::size_t>(1, cfg_.batch);
}

ExpiryReaper::~ExpiryReaper() { stop(); }

SweepResult ExpiryReaper::sweep(TimePoint now) {
  SweepResult result;
  if (cold_ != nullptr && !cold_->available())
    result.cold_recovered = cold_->probe();

  for (auto *t : tiers_) {
    while (true) {
      const auto removed = t->erase_expired(cfg_.batch, now);
      result.expired += removed;
      ++result.batches;
      if (removed < cfg_.batch)
        break;
      std::this_thread::yield();
    }
  }
  if (migrator_ != nullptr)
    result.history_pruned = migrator_->prune_history(now);
  if (cold_ != nullptr && cold_->available()) {
    while (true) {
      const auto taken = cold_->flush(cfg_.batch);
      result.flushed += taken;
      if (taken < cfg_.batch)
        break;
      std::this_thread::yield();
    }
  }
  if (result.expired > 0)
    spdlog::debug("reaper expired {} entries in {} batches", result.expired,
                  result.batches);
  return result;
}

void ExpiryReaper::start() {
  if (!task_)
    task_ = std::make_unique<PeriodicTask>(
        "expiry reaper", cfg_.interval, [this] { sweep(Clock::now()); });
  task_->start();
}

void ExpiryReaper::stop() {
  if (task_)
    task_->stop();
}

} // namespace search_cache
