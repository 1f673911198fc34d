#pragma once

#include "search_cache/types.hpp"

#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace search_cache {

// Deadline min-heap. Rescheduling a key bumps its generation so stale heap
// nodes are skipped instead of searched for.
class ExpiryQueue {
public:
  void schedule(const CacheKey &key, TimePoint deadline);
  void forget(const CacheKey &key);
  void clear();

  std::vector<CacheKey> pop_due(TimePoint now, std::size_t max_items);

private:
  struct ExpiryNode {
    TimePoint deadline;
    CacheKey key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      heap_;
  std::unordered_map<CacheKey, std::uint64_t, CacheKeyHash> generation_;
  std::uint64_t next_generation_{0};
};

} // namespace search_cache
