#pragma once

#include "search_cache/tier.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace search_cache {

enum class FsyncMode { Never, EverySec, Always };

struct ColdConfig {
  std::string dir{"./search_cache_data"};
  std::uint64_t budget_bytes{256ULL * 1024 * 1024};
  FsyncMode fsync{FsyncMode::EverySec};
};

struct ColdStats {
  std::uint64_t reads{0};
  std::uint64_t writes{0};
  double read_mb{0.0};
  double write_mb{0.0};
  std::uint64_t corrupt_records{0};
  std::uint64_t io_errors{0};
  std::size_t index_rebuild_ms{0};
};

// One self-describing record file per key under <dir>/<hh>/<key-hex>.rec.
// The index lives in memory and is rebuilt from the records on init().
class ColdTier final : public Tier {
public:
  ColdTier(ColdConfig cfg, const CodecRegistry &codecs);

  bool init(std::string *err = nullptr);
  bool available() const { return available_.load(); }
  // Re-checks an unavailable directory; rebuilds the index on recovery.
  bool probe();
  // Persists access counters updated by reads since the last flush, at most
  // max_items records per call. Returns how many dirty records it took.
  std::size_t flush(std::size_t max_items = SIZE_MAX);
  std::string record_path(const CacheKey &key) const;

  std::optional<CacheEntry> get(const CacheKey &key) override;
  EvictionReport put(CacheEntry entry, PutMode mode = PutMode::Insert) override;
  std::optional<CacheEntry> remove(const CacheKey &key) override;
  bool contains(const CacheKey &key) const override;
  std::size_t erase_expired(std::size_t max_items, TimePoint now) override;
  std::optional<CacheKey> victim() const override;
  void clear() override;
  std::uint64_t current_usage_bytes() const override;
  std::size_t size() const override;

  ColdStats stats() const;

private:
  enum class ReadStatus { Ok, Missing, Corrupt, IoError };

  bool rebuild_index_locked(std::string *err);
  ReadStatus read_record(const std::string &path, CacheEntry *out);
  bool write_record(const CacheEntry &entry, std::string *err);
  bool sync_for_policy(int fd);
  void drop_locked(const CacheKey &key);
  void mark_unavailable(const std::string &why);
  std::optional<CacheEntry> load_locked(const CacheKey &key);

  ColdConfig cfg_;
  const CodecRegistry &codecs_;
  std::atomic<bool> available_{false};

  mutable std::mutex mu_;
  // Metadata only; payloads stay on disk.
  EntryMap index_;
  std::unordered_map<CacheKey, std::uint32_t, CacheKeyHash> lengths_;
  std::unordered_set<CacheKey, CacheKeyHash> dirty_;
  std::unique_ptr<IEvictionPolicy> policy_;
  ExpiryQueue expiry_;
  std::uint64_t usage_bytes_{0};
  std::uint64_t last_fsync_epoch_s_{0};
  ColdStats stats_;
};

} // namespace search_cache
