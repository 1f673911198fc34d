#include "search_cache/expiry_queue.hpp"

namespace search_cache {

void ExpiryQueue::schedule(const CacheKey &key, TimePoint deadline) {
  const auto gen = ++next_generation_;
  generation_[key] = gen;
  heap_.push({deadline, key, gen});
}

void ExpiryQueue::forget(const CacheKey &key) { generation_.erase(key); }

void ExpiryQueue::clear() {
  heap_ = {};
  generation_.clear();
}

std::vector<CacheKey> ExpiryQueue::pop_due(TimePoint now,
                                           std::size_t max_items) {
  std::vector<CacheKey> due;
  // Stale nodes count against a wider bound so one call stays short.
  std::size_t scanned = 0;
  const std::size_t scan_limit = max_items * 4 + 16;
  while (!heap_.empty() && due.size() < max_items && scanned < scan_limit) {
    const auto &node = heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    heap_.pop();
    ++scanned;
    auto it = generation_.find(key);
    if (it == generation_.end() || it->second != gen)
      continue;
    generation_.erase(it);
    due.push_back(key);
  }
  if (heap_.size() > 4 * generation_.size() + 1024) {
    // Rebuild when stale nodes dominate the heap.
    decltype(heap_) live;
    while (!heap_.empty()) {
      const auto &node = heap_.top();
      auto it = generation_.find(node.key);
      if (it != generation_.end() && it->second == node.generation)
        live.push(node);
      heap_.pop();
    }
    heap_ = std::move(live);
  }
  return due;
}

} // namespace search_cache
