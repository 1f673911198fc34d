#pragma once

#include "search_cache/types.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace search_cache {

enum class Counter : std::size_t {
  Evictions,
  Expirations,
  Promotions,
  Demotions,
  DroppedDemotions,
  Fills,
  FillFailures,
  CoalescedWaits,
  CorruptEntries,
  RejectedInserts,
  Count,
};

const char *counter_name(Counter c);

// Fixed window of the most recent latency samples. Writers never block;
// readers may see a sample being overwritten.
class LatencyRing {
public:
  static constexpr std::size_t kSlots = 1024;

  void record(double ms);
  double average_ms() const;
  double p99_ms() const;
  std::uint64_t recorded() const { return next_.load(); }

private:
  std::array<std::atomic<std::uint32_t>, kSlots> micros_{};
  std::atomic<std::uint64_t> next_{0};
};

struct TierStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  double avg_latency_ms{0.0};
  double p99_latency_ms{0.0};
  std::uint64_t usage_bytes{0};
  std::uint64_t budget_bytes{0};
  std::size_t entries{0};
};

struct HotKey {
  std::string key;
  std::uint64_t count{0};
};

struct StatsSnapshot {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  double hit_rate{0.0};
  double avg_latency_ms{0.0};
  double p99_latency_ms{0.0};
  std::array<std::uint64_t, kTierCount> per_tier_usage_bytes{};
  std::vector<std::string> hot_keys;
  std::vector<HotKey> hot_key_counts;
  std::array<TierStats, kTierCount> tiers{};
  std::array<std::uint64_t, static_cast<std::size_t>(Counter::Count)>
      counters{};
  double compression_ratio{1.0};
  std::uint64_t cold_reads{0};
  std::uint64_t cold_writes{0};
  double cold_read_mb{0.0};
  double cold_write_mb{0.0};
  bool cold_available{false};
  std::size_t migration_backlog{0};

  std::uint64_t counter(Counter c) const {
    return counters[static_cast<std::size_t>(c)];
  }
  std::string render_info() const;
};

class StatsCollector {
public:
  explicit StatsCollector(std::size_t hot_keys_top_n = 10);

  // One probe of one tier during a lookup.
  void record_tier(TierKind tier, bool hit, double latency_ms);
  // Outcome of a whole lookup across all tiers.
  void record_lookup(const CacheKey &key, bool hit, double latency_ms);
  void add(Counter c, std::uint64_t n = 1);
  // Stored/raw size of a payload written to a compressed tier.
  void record_compression(std::size_t raw_bytes, std::size_t stored_bytes);
  void reset();

  // Counters only; the caller fills in tier usage.
  StatsSnapshot snapshot() const;
  std::vector<HotKey> hot_keys(std::size_t n) const;

private:
  static constexpr std::size_t kShards = 16;
  static constexpr std::size_t kMaxTrackedPerShard = 4096;

  struct TierCounters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    LatencyRing latency;
  };

  struct HotShard {
    mutable std::mutex mu;
    std::unordered_map<CacheKey, std::uint64_t, CacheKeyHash> counts;
  };

  std::size_t top_n_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  LatencyRing latency_;
  std::array<TierCounters, kTierCount> tiers_;
  std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(Counter::Count)>
      counters_{};
  std::atomic<double> compression_ratio_{1.0};
  std::array<HotShard, kShards> hot_;
};

} // namespace search_cache
