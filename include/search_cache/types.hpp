#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace search_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Bytes = std::vector<std::uint8_t>;

enum class TierKind : std::uint8_t { Hot = 0, Warm = 1, Cold = 2 };

constexpr std::size_t kTierCount = 3;

const char *tier_name(TierKind tier);

enum class CodecId : std::uint8_t {
  None = 0,
  ZlibFast = 1,
  ZlibDefault = 2,
  ZlibBest = 3,
};

struct CacheKey {
  std::array<std::uint8_t, 32> bytes{};

  bool operator==(const CacheKey &other) const { return bytes == other.bytes; }
  bool operator!=(const CacheKey &other) const { return bytes != other.bytes; }
  bool operator<(const CacheKey &other) const { return bytes < other.bytes; }

  std::string hex() const;
  static bool from_hex(const std::string &hex, CacheKey *out);
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey &key) const noexcept {
    std::size_t h = 0;
    for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
      h = (h << 8) | key.bytes[i];
    return h;
  }
};

struct CacheEntry {
  CacheKey key;
  CodecId codec{CodecId::None};
  Bytes payload;
  std::size_t raw_size{0};
  TimePoint created_at{};
  Millis ttl{0};
  std::uint64_t access_count{0};
  TimePoint last_accessed_at{};
  TierKind tier{TierKind::Hot};

  TimePoint expires_at() const { return created_at + ttl; }
  bool expired(TimePoint now) const { return expires_at() <= now; }
  std::size_t size_bytes() const { return payload.size(); }
};

} // namespace search_cache

template <> struct std::hash<search_cache::CacheKey> {
  std::size_t operator()(const search_cache::CacheKey &key) const noexcept {
    return search_cache::CacheKeyHash{}(key);
  }
};
