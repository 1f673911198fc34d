#pragma once

#include "search_cache/cold_tier.hpp"
#include "search_cache/migrator.hpp"
#include "search_cache/periodic_task.hpp"

#include <cstddef>
#include <memory>

namespace search_cache {

struct ReaperConfig {
  Millis interval{1000};
  std::size_t batch{256};
};

struct SweepResult {
  std::size_t expired{0};
  std::size_t batches{0};
  std::size_t history_pruned{0};
  std::size_t flushed{0};
  bool cold_recovered{false};
};

// Removes expired entries and flushes cold metadata in bounded batches.
// Each batch takes and drops the tier lock, so readers interleave between
// batches.
class ExpiryReaper {
public:
  ExpiryReaper(TierSet tiers, ColdTier *cold, TierMigrator *migrator,
               ReaperConfig cfg);
  ~ExpiryReaper();

  SweepResult sweep(TimePoint now);

  void start();
  void stop();

private:
  TierSet tiers_;
  ColdTier *cold_;
  TierMigrator *migrator_;
  ReaperConfig cfg_;
  std::unique_ptr<PeriodicTask> task_;
};

} // namespace search_cache
