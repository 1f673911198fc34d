#pragma once

#include "search_cache/codec.hpp"
#include "search_cache/expiry_queue.hpp"
#include "search_cache/policy.hpp"
#include "search_cache/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace search_cache {

enum class PutMode { Insert, Demote };

enum class RejectReason {
  None,
  Expired,
  CapacityExceeded,
  CorruptEntry,
  StorageUnavailable,
  LowerPriority,
  Resident,
};

const char *reject_reason_name(RejectReason reason);

struct EvictionReport {
  bool stored{false};
  RejectReason reason{RejectReason::None};
  std::vector<CacheEntry> evicted;
  std::size_t raw_bytes{0};
  std::size_t stored_bytes{0};
};

// A bounded key -> entry store. Every tier owns its own lock; tiers never
// call into each other.
class Tier {
public:
  Tier(TierKind kind, std::uint64_t budget_bytes)
      : kind_(kind), budget_bytes_(budget_bytes) {}
  virtual ~Tier() = default;

  Tier(const Tier &) = delete;
  Tier &operator=(const Tier &) = delete;

  TierKind kind() const { return kind_; }
  std::uint64_t budget_bytes() const { return budget_bytes_; }
  std::uint64_t expirations() const { return expirations_.load(); }

  virtual std::optional<CacheEntry> get(const CacheKey &key) = 0;
  virtual EvictionReport put(CacheEntry entry,
                             PutMode mode = PutMode::Insert) = 0;
  virtual std::optional<CacheEntry> remove(const CacheKey &key) = 0;
  virtual bool contains(const CacheKey &key) const = 0;
  virtual std::size_t erase_expired(std::size_t max_items, TimePoint now) = 0;
  // The key the eviction policy would pick next, left in place.
  virtual std::optional<CacheKey> victim() const = 0;
  virtual void clear() = 0;
  virtual std::uint64_t current_usage_bytes() const = 0;
  virtual std::size_t size() const = 0;

protected:
  TierKind kind_;
  std::uint64_t budget_bytes_;
  std::atomic<std::uint64_t> expirations_{0};
};

class MemoryTier : public Tier {
public:
  MemoryTier(TierKind kind, std::uint64_t budget_bytes,
             std::unique_ptr<IEvictionPolicy> policy,
             const CodecRegistry &codecs);

  std::optional<CacheEntry> get(const CacheKey &key) override;
  EvictionReport put(CacheEntry entry, PutMode mode = PutMode::Insert) override;
  std::optional<CacheEntry> remove(const CacheKey &key) override;
  bool contains(const CacheKey &key) const override;
  std::size_t erase_expired(std::size_t max_items, TimePoint now) override;
  std::optional<CacheKey> victim() const override;
  void clear() override;
  std::uint64_t current_usage_bytes() const override;
  std::size_t size() const override;

  const IEvictionPolicy &policy() const { return *policy_; }

protected:
  // Converts an incoming entry into this tier's payload format.
  virtual bool to_storage_format(CacheEntry &entry, std::string *err) const = 0;

  const CodecRegistry &codecs_;

private:
  void erase_locked(EntryMap::iterator it);

  mutable std::mutex mu_;
  EntryMap entries_;
  std::unique_ptr<IEvictionPolicy> policy_;
  ExpiryQueue expiry_;
  std::uint64_t usage_bytes_{0};
};

// Uncompressed payloads, strict LRU.
class HotTier final : public MemoryTier {
public:
  HotTier(std::uint64_t budget_bytes, const CodecRegistry &codecs);

protected:
  bool to_storage_format(CacheEntry &entry, std::string *err) const override;
};

// Compressed payloads, recency/frequency score.
class WarmTier final : public MemoryTier {
public:
  WarmTier(std::uint64_t budget_bytes, const CodecRegistry &codecs,
           const PolicyParams &params);

protected:
  bool to_storage_format(CacheEntry &entry, std::string *err) const override;
};

// Shared by the warm and cold tiers: compress raw payloads, keep already
// compressed ones so their codec id survives the move.
bool ensure_compressed(const CodecRegistry &codecs, CacheEntry &entry,
                       std::string *err);
bool ensure_raw(const CodecRegistry &codecs, CacheEntry &entry,
                std::string *err);

} // namespace search_cache
