#include "search_cache/policy.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>

namespace search_cache {
namespace {

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }

  void on_insert(const CacheEntry &entry) override { touch(entry); }
  void on_access(const CacheEntry &entry) override { touch(entry); }

  void on_erase(const CacheKey &key) override {
    auto it = stamps_.find(key);
    if (it == stamps_.end())
      return;
    order_.erase({it->second, key});
    stamps_.erase(it);
  }

  void clear() override {
    order_.clear();
    stamps_.clear();
  }

  double priority(const CacheEntry &entry, TimePoint) const override {
    return std::chrono::duration<double>(
               entry.last_accessed_at.time_since_epoch())
        .count();
  }

  std::optional<CacheKey> pick_victim(const EntryMap &,
                                      TimePoint) const override {
    if (order_.empty())
      return std::nullopt;
    return order_.begin()->second;
  }

  std::vector<CacheKey> eviction_order(const EntryMap &entries,
                                       std::size_t bytes_needed,
                                       TimePoint) const override {
    std::vector<CacheKey> out;
    std::size_t covered = 0;
    for (const auto &[stamp, key] : order_) {
      if (covered >= bytes_needed)
        break;
      auto it = entries.find(key);
      if (it == entries.end())
        continue;
      out.push_back(key);
      covered += it->second.size_bytes();
    }
    return out;
  }

  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  void touch(const CacheEntry &entry) {
    on_erase(entry.key);
    stamps_[entry.key] = entry.last_accessed_at;
    order_.insert({entry.last_accessed_at, entry.key});
  }

  PolicyParams params_{};
  std::set<std::pair<TimePoint, CacheKey>> order_;
  std::unordered_map<CacheKey, TimePoint, CacheKeyHash> stamps_;
};

// Blends access frequency over the entry's lifetime with idle time.
class RecencyFrequencyPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "recency_frequency"; }
  void on_insert(const CacheEntry &) override {}
  void on_access(const CacheEntry &) override {}
  void on_erase(const CacheKey &) override {}
  void clear() override {}

  double priority(const CacheEntry &e, TimePoint now) const override {
    const double age_s = std::max(
        1.0, std::chrono::duration<double>(now - e.created_at).count());
    const double idle_s = std::max(
        0.0, std::chrono::duration<double>(now - e.last_accessed_at).count());
    const double frequency = static_cast<double>(e.access_count + 1) / age_s;
    return params_.w_frequency * frequency - params_.w_recency * idle_s;
  }

  std::optional<CacheKey> pick_victim(const EntryMap &entries,
                                      TimePoint now) const override {
    if (entries.empty())
      return std::nullopt;
    auto victim = entries.begin();
    double worst = priority(victim->second, now);
    for (auto it = std::next(entries.begin()); it != entries.end(); ++it) {
      const double score = priority(it->second, now);
      if (score < worst || (score == worst && it->first < victim->first)) {
        worst = score;
        victim = it;
      }
    }
    return victim->first;
  }

  std::vector<CacheKey> eviction_order(const EntryMap &entries,
                                       std::size_t bytes_needed,
                                       TimePoint now) const override {
    std::vector<std::pair<double, const CacheEntry *>> scored;
    scored.reserve(entries.size());
    for (const auto &[k, e] : entries)
      scored.emplace_back(priority(e, now), &e);
    std::sort(scored.begin(), scored.end(), [](const auto &a, const auto &b) {
      if (a.first == b.first)
        return a.second->key < b.second->key;
      return a.first < b.first;
    });
    std::vector<CacheKey> out;
    std::size_t covered = 0;
    for (const auto &[score, e] : scored) {
      if (covered >= bytes_needed)
        break;
      out.push_back(e->key);
      covered += e->size_bytes();
    }
    return out;
  }

  void set_params(const PolicyParams &params) override { params_ = params; }
  const PolicyParams &params() const override { return params_; }

private:
  PolicyParams params_{};
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  if (mode == "recency_frequency")
    return std::make_unique<RecencyFrequencyPolicy>();
  return std::make_unique<LruPolicy>();
}

} // namespace search_cache
