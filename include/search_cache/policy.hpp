#pragma once

#include "search_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace search_cache {

struct PolicyParams {
  double w_frequency{1.0};
  double w_recency{0.01};
};

using EntryMap = std::unordered_map<CacheKey, CacheEntry, CacheKeyHash>;

// Orders the residents of one tier. Lower priority is evicted first; equal
// priorities fall back to the smaller key.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const CacheEntry &entry) = 0;
  virtual void on_access(const CacheEntry &entry) = 0;
  virtual void on_erase(const CacheKey &key) = 0;
  virtual void clear() = 0;
  virtual double priority(const CacheEntry &entry, TimePoint now) const = 0;
  virtual std::optional<CacheKey> pick_victim(const EntryMap &entries,
                                              TimePoint now) const = 0;
  // Victims in eviction order until their payloads cover `bytes_needed`.
  virtual std::vector<CacheKey> eviction_order(const EntryMap &entries,
                                               std::size_t bytes_needed,
                                               TimePoint now) const = 0;
  virtual void set_params(const PolicyParams &params) = 0;
  virtual const PolicyParams &params() const = 0;
};

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace search_cache
