#pragma once

#include "search_cache/types.hpp"

#include <array>
#include <cstddef>
#include <mutex>
#include <vector>

namespace search_cache {

// Striped per-key locks. Serializes moves of one key across tiers without a
// global lock; unrelated keys only collide when they share a stripe.
template <std::size_t N = 64> class KeyLockPool {
  static_assert(N > 0 && (N & (N - 1)) == 0, "stripe count must be a power of two");

public:
  KeyLockPool() = default;
  KeyLockPool(const KeyLockPool &) = delete;
  KeyLockPool &operator=(const KeyLockPool &) = delete;

  static std::size_t index(const CacheKey &key) {
    // The hash reads the leading bytes; stripe on the trailing ones.
    return key.bytes[31] & (N - 1);
  }

  std::unique_lock<std::mutex> lock(const CacheKey &key) {
    return std::unique_lock<std::mutex>(mutexes_[index(key)]);
  }

  // Every stripe in index order. Callers of lock() hold at most one stripe,
  // so this cannot deadlock against them.
  std::vector<std::unique_lock<std::mutex>> lock_all() {
    std::vector<std::unique_lock<std::mutex>> held;
    held.reserve(N);
    for (auto &mu : mutexes_)
      held.emplace_back(mu);
    return held;
  }

private:
  std::array<std::mutex, N> mutexes_{};
};

using KeyLocks = KeyLockPool<64>;

} // namespace search_cache
