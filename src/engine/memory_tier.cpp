#include "search_cache/tier.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace search_cache {

const char *reject_reason_name(RejectReason reason) {
  switch (reason) {
  case RejectReason::None:
    return "none";
  case RejectReason::Expired:
    return "expired";
  case RejectReason::CapacityExceeded:
    return "capacity_exceeded";
  case RejectReason::CorruptEntry:
    return "corrupt_entry";
  case RejectReason::StorageUnavailable:
    return "storage_unavailable";
  case RejectReason::LowerPriority:
    return "lower_priority";
  case RejectReason::Resident:
    return "resident";
  }
  return "unknown";
}

bool ensure_compressed(const CodecRegistry &codecs, CacheEntry &entry,
                       std::string *err) {
  if (entry.codec != CodecId::None)
    return true;
  auto packed = codecs.compress(entry.payload, err);
  if (!packed.has_value())
    return false;
  entry.raw_size = entry.payload.size();
  entry.codec = packed->codec;
  entry.payload = std::move(packed->data);
  return true;
}

bool ensure_raw(const CodecRegistry &codecs, CacheEntry &entry,
                std::string *err) {
  if (entry.codec == CodecId::None) {
    entry.raw_size = entry.payload.size();
    return true;
  }
  Bytes raw;
  if (!codecs.decompress(entry.codec, entry.payload, &raw, err))
    return false;
  entry.codec = CodecId::None;
  entry.payload = std::move(raw);
  entry.raw_size = entry.payload.size();
  return true;
}

MemoryTier::MemoryTier(TierKind kind, std::uint64_t budget_bytes,
                       std::unique_ptr<IEvictionPolicy> policy,
                       const CodecRegistry &codecs)
    : Tier(kind, budget_bytes), codecs_(codecs), policy_(std::move(policy)) {}

std::optional<CacheEntry> MemoryTier::get(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  const auto now = Clock::now();
  if (it->second.expired(now)) {
    erase_locked(it);
    ++expirations_;
    return std::nullopt;
  }
  auto &e = it->second;
  ++e.access_count;
  e.last_accessed_at = std::max(e.last_accessed_at, now);
  policy_->on_access(e);
  return e;
}

EvictionReport MemoryTier::put(CacheEntry entry, PutMode mode) {
  EvictionReport report;
  const auto now = Clock::now();
  if (entry.expired(now)) {
    report.reason = RejectReason::Expired;
    return report;
  }
  std::string err;
  if (!to_storage_format(entry, &err)) {
    spdlog::warn("{} tier: dropping {}: {}", tier_name(kind_),
                 entry.key.hex(), err);
    report.reason = RejectReason::CorruptEntry;
    return report;
  }
  const std::size_t size = entry.size_bytes();
  if (size > budget_bytes_) {
    report.reason = RejectReason::CapacityExceeded;
    return report;
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto existing = entries_.find(entry.key);
  if (existing != entries_.end()) {
    if (mode == PutMode::Demote) {
      report.reason = RejectReason::Resident;
      return report;
    }
    erase_locked(existing);
  }

  if (usage_bytes_ + size > budget_bytes_) {
    const std::size_t need =
        static_cast<std::size_t>(usage_bytes_ + size - budget_bytes_);
    const auto victims = policy_->eviction_order(entries_, need, now);
    if (mode == PutMode::Demote) {
      const double incoming = policy_->priority(entry, now);
      for (const auto &k : victims) {
        if (policy_->priority(entries_.at(k), now) >= incoming) {
          report.reason = RejectReason::LowerPriority;
          return report;
        }
      }
    }
    for (const auto &k : victims) {
      auto it = entries_.find(k);
      if (it == entries_.end())
        continue;
      report.evicted.push_back(it->second);
      erase_locked(it);
    }
  }

  entry.tier = kind_;
  report.raw_bytes = entry.raw_size;
  report.stored_bytes = size;
  usage_bytes_ += size;
  expiry_.schedule(entry.key, entry.expires_at());
  auto [it, inserted] = entries_.emplace(entry.key, std::move(entry));
  policy_->on_insert(it->second);
  report.stored = true;
  return report;
}

std::optional<CacheEntry> MemoryTier::remove(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  CacheEntry out = std::move(it->second);
  erase_locked(it);
  return out;
}

bool MemoryTier::contains(const CacheKey &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.find(key) != entries_.end();
}

std::size_t MemoryTier::erase_expired(std::size_t max_items, TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t removed = 0;
  for (const auto &key : expiry_.pop_due(now, max_items)) {
    auto it = entries_.find(key);
    if (it == entries_.end() || !it->second.expired(now))
      continue;
    erase_locked(it);
    ++expirations_;
    ++removed;
  }
  return removed;
}

std::optional<CacheKey> MemoryTier::victim() const {
  std::lock_guard<std::mutex> lock(mu_);
  return policy_->pick_victim(entries_, Clock::now());
}

void MemoryTier::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  policy_->clear();
  expiry_.clear();
  usage_bytes_ = 0;
}

std::uint64_t MemoryTier::current_usage_bytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return usage_bytes_;
}

std::size_t MemoryTier::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void MemoryTier::erase_locked(EntryMap::iterator it) {
  usage_bytes_ -= it->second.size_bytes();
  policy_->on_erase(it->first);
  expiry_.forget(it->first);
  entries_.erase(it);
}

HotTier::HotTier(std::uint64_t budget_bytes, const CodecRegistry &codecs)
    : MemoryTier(TierKind::Hot, budget_bytes, make_policy_by_name("lru"),
                 codecs) {}

bool HotTier::to_storage_format(CacheEntry &entry, std::string *err) const {
  return ensure_raw(codecs_, entry, err);
}

namespace {
std::unique_ptr<IEvictionPolicy> scored_policy(const PolicyParams &params) {
  auto policy = make_policy_by_name("recency_frequency");
  policy->set_params(params);
  return policy;
}
} // namespace

WarmTier::WarmTier(std::uint64_t budget_bytes, const CodecRegistry &codecs,
                   const PolicyParams &params)
    : MemoryTier(TierKind::Warm, budget_bytes, scored_policy(params), codecs) {
}

bool WarmTier::to_storage_format(CacheEntry &entry, std::string *err) const {
  return ensure_compressed(codecs_, entry, err);
}

} // namespace search_cache
