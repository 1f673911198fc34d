#include "search_cache/stats.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace search_cache {

const char *counter_name(Counter c) {
  switch (c) {
  case Counter::Evictions:
    return "evictions";
  case Counter::Expirations:
    return "expirations";
  case Counter::Promotions:
    return "promotions";
  case Counter::Demotions:
    return "demotions";
  case Counter::DroppedDemotions:
    return "dropped_demotions";
  case Counter::Fills:
    return "fills";
  case Counter::FillFailures:
    return "fill_failures";
  case Counter::CoalescedWaits:
    return "coalesced_waits";
  case Counter::CorruptEntries:
    return "corrupt_entries";
  case Counter::RejectedInserts:
    return "rejected_inserts";
  case Counter::Count:
    break;
  }
  return "unknown";
}

void LatencyRing::record(double ms) {
  const auto slot = next_.fetch_add(1, std::memory_order_relaxed) % kSlots;
  const double us = std::clamp(ms * 1000.0, 0.0, 4.0e9);
  micros_[slot].store(static_cast<std::uint32_t>(us),
                      std::memory_order_relaxed);
}

double LatencyRing::average_ms() const {
  const auto n = std::min<std::uint64_t>(next_.load(), kSlots);
  if (n == 0)
    return 0.0;
  double total = 0.0;
  for (std::size_t i = 0; i < n; ++i)
    total += micros_[i].load(std::memory_order_relaxed);
  return total / static_cast<double>(n) / 1000.0;
}

double LatencyRing::p99_ms() const {
  const auto n = std::min<std::uint64_t>(next_.load(), kSlots);
  if (n == 0)
    return 0.0;
  std::vector<std::uint32_t> samples;
  samples.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    samples.push_back(micros_[i].load(std::memory_order_relaxed));
  const auto idx = static_cast<std::size_t>(
      std::ceil(0.99 * static_cast<double>(n)) - 1);
  std::nth_element(samples.begin(), samples.begin() + idx, samples.end());
  return samples[idx] / 1000.0;
}

std::string StatsSnapshot::render_info() const {
  std::ostringstream os;
  os << "hits:" << hits << "\n";
  os << "misses:" << misses << "\n";
  os << "hit_rate:" << hit_rate << "\n";
  os << "avg_latency_ms:" << avg_latency_ms << "\n";
  os << "p99_latency_ms:" << p99_latency_ms << "\n";
  for (std::size_t i = 0; i < kTierCount; ++i) {
    const char *name = tier_name(static_cast<TierKind>(i));
    const auto &t = tiers[i];
    os << name << "_hits:" << t.hits << "\n";
    os << name << "_misses:" << t.misses << "\n";
    os << name << "_avg_latency_ms:" << t.avg_latency_ms << "\n";
    os << name << "_p99_latency_ms:" << t.p99_latency_ms << "\n";
    os << name << "_keys:" << t.entries << "\n";
    os << name << "_used_bytes:" << per_tier_usage_bytes[i] << "\n";
    os << name << "_budget_bytes:" << t.budget_bytes << "\n";
  }
  for (std::size_t i = 0; i < counters.size(); ++i)
    os << counter_name(static_cast<Counter>(i)) << ":" << counters[i] << "\n";
  os << "compression_ratio:" << compression_ratio << "\n";
  os << "cold_reads:" << cold_reads << "\n";
  os << "cold_writes:" << cold_writes << "\n";
  os << "cold_read_mb:" << cold_read_mb << "\n";
  os << "cold_write_mb:" << cold_write_mb << "\n";
  os << "cold_available:" << (cold_available ? 1 : 0) << "\n";
  os << "migration_backlog:" << migration_backlog << "\n";
  os << "hot_keys:";
  for (std::size_t i = 0; i < hot_key_counts.size(); ++i) {
    if (i)
      os << ",";
    os << hot_key_counts[i].key.substr(0, 16) << ":"
       << hot_key_counts[i].count;
  }
  os << "\n";
  return os.str();
}

StatsCollector::StatsCollector(std::size_t hot_keys_top_n)
    : top_n_(hot_keys_top_n) {}

void StatsCollector::record_tier(TierKind tier, bool hit, double latency_ms) {
  auto &t = tiers_[static_cast<std::size_t>(tier)];
  if (hit)
    t.hits.fetch_add(1, std::memory_order_relaxed);
  else
    t.misses.fetch_add(1, std::memory_order_relaxed);
  t.latency.record(latency_ms);
}

void StatsCollector::record_lookup(const CacheKey &key, bool hit,
                                   double latency_ms) {
  if (hit)
    hits_.fetch_add(1, std::memory_order_relaxed);
  else
    misses_.fetch_add(1, std::memory_order_relaxed);
  latency_.record(latency_ms);

  // Hot-key sampling skips a contended shard rather than wait on it.
  auto &shard = hot_[CacheKeyHash{}(key) % kShards];
  std::unique_lock<std::mutex> lock(shard.mu, std::try_to_lock);
  if (!lock.owns_lock())
    return;
  ++shard.counts[key];
  if (shard.counts.size() > kMaxTrackedPerShard) {
    for (auto it = shard.counts.begin(); it != shard.counts.end();) {
      it->second /= 2;
      if (it->second == 0)
        it = shard.counts.erase(it);
      else
        ++it;
    }
  }
}

void StatsCollector::add(Counter c, std::uint64_t n) {
  counters_[static_cast<std::size_t>(c)].fetch_add(n,
                                                   std::memory_order_relaxed);
}

void StatsCollector::record_compression(std::size_t raw_bytes,
                                        std::size_t stored_bytes) {
  if (raw_bytes == 0)
    return;
  const double ratio =
      static_cast<double>(stored_bytes) / static_cast<double>(raw_bytes);
  double cur = compression_ratio_.load(std::memory_order_relaxed);
  while (!compression_ratio_.compare_exchange_weak(cur, cur * 0.9 + ratio * 0.1,
                                                   std::memory_order_relaxed))
    ;
}

void StatsCollector::reset() {
  hits_ = 0;
  misses_ = 0;
  for (auto &t : tiers_) {
    t.hits = 0;
    t.misses = 0;
  }
  for (auto &c : counters_)
    c = 0;
  compression_ratio_ = 1.0;
  for (auto &shard : hot_) {
    std::lock_guard<std::mutex> lock(shard.mu);
    shard.counts.clear();
  }
}

StatsSnapshot StatsCollector::snapshot() const {
  StatsSnapshot s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  const auto total = s.hits + s.misses;
  s.hit_rate = total == 0 ? 0.0
                          : static_cast<double>(s.hits) /
                                static_cast<double>(total);
  s.avg_latency_ms = latency_.average_ms();
  s.p99_latency_ms = latency_.p99_ms();
  for (std::size_t i = 0; i < kTierCount; ++i) {
    s.tiers[i].hits = tiers_[i].hits.load(std::memory_order_relaxed);
    s.tiers[i].misses = tiers_[i].misses.load(std::memory_order_relaxed);
    s.tiers[i].avg_latency_ms = tiers_[i].latency.average_ms();
    s.tiers[i].p99_latency_ms = tiers_[i].latency.p99_ms();
  }
  for (std::size_t i = 0; i < counters_.size(); ++i)
    s.counters[i] = counters_[i].load(std::memory_order_relaxed);
  s.compression_ratio = compression_ratio_.load(std::memory_order_relaxed);
  s.hot_key_counts = hot_keys(top_n_);
  for (const auto &hk : s.hot_key_counts)
    s.hot_keys.push_back(hk.key);
  return s;
}

std::vector<HotKey> StatsCollector::hot_keys(std::size_t n) const {
  std::vector<std::pair<CacheKey, std::uint64_t>> counts;
  for (const auto &shard : hot_) {
    std::lock_guard<std::mutex> lock(shard.mu);
    counts.insert(counts.end(), shard.counts.begin(), shard.counts.end());
  }
  std::sort(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
    if (a.second == b.second)
      return a.first < b.first;
    return a.second > b.second;
  });
  std::vector<HotKey> out;
  for (std::size_t i = 0; i < std::min(n, counts.size()); ++i)
    out.push_back({counts[i].first.hex(), counts[i].second});
  return out;
}

} // namespace search_cache
