#include "search_cache/cold_tier.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace search_cache {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint16_t version;
  std::uint8_t codec;
  std::uint8_t reserved;
  std::uint32_t checksum;
  std::uint32_t payload_len;
  std::int64_t created_at_ms;
  std::int64_t ttl_ms;
  std::uint64_t raw_size;
  std::uint8_t key[32];
  // Mutable tail, rewritten in place by flush() and not checksummed.
  std::uint64_t access_count;
  std::int64_t last_accessed_ms;
};

struct RecordTail {
  std::uint64_t access_count;
  std::int64_t last_accessed_ms;
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x53434b31; // SCK1
constexpr std::uint16_t kVersion = 1;
constexpr std::size_t kChecksummedBytes = offsetof(RecordHeader, access_count);
constexpr std::uint32_t kMaxPayload = 1U << 30;
static_assert(sizeof(RecordHeader) - kChecksummedBytes == sizeof(RecordTail),
              "record tail must close the header");

std::uint32_t checksum32(const RecordHeader &h, const Bytes &payload) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < kChecksummedBytes; ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (auto b : payload)
    mix(b);
  return sum;
}

std::int64_t to_epoch_ms(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

bool write_all(int fd, const void *data, std::size_t len) {
  auto *p = static_cast<const std::uint8_t *>(data);
  while (len > 0) {
    const ssize_t n = ::write(fd, p, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

bool read_all(int fd, void *data, std::size_t len, off_t off) {
  auto *p = static_cast<std::uint8_t *>(data);
  while (len > 0) {
    const ssize_t n = ::pread(fd, p, len, off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (n == 0)
      return false;
    p += n;
    off += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

CacheEntry metadata_of(const CacheEntry &e) {
  CacheEntry meta;
  meta.key = e.key;
  meta.codec = e.codec;
  meta.raw_size = e.raw_size;
  meta.created_at = e.created_at;
  meta.ttl = e.ttl;
  meta.access_count = e.access_count;
  meta.last_accessed_at = e.last_accessed_at;
  meta.tier = TierKind::Cold;
  return meta;
}
} // namespace

ColdTier::ColdTier(ColdConfig cfg, const CodecRegistry &codecs)
    : Tier(TierKind::Cold, cfg.budget_bytes), cfg_(std::move(cfg)),
      codecs_(codecs), policy_(make_policy_by_name("lru")) {}

bool ColdTier::init(std::string *err) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string why;
  const bool ok = rebuild_index_locked(&why);
  available_ = ok;
  if (!ok) {
    spdlog::warn("cold tier unavailable at {}: {}", cfg_.dir, why);
    if (err)
      *err = why;
    return false;
  }
  spdlog::info("cold tier ready at {}: {} records, {} bytes, rebuilt in {}ms",
               cfg_.dir, index_.size(), usage_bytes_,
               stats_.index_rebuild_ms);
  return true;
}

bool ColdTier::probe() {
  if (available_.load())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec)
    return false;
  const std::string probe_path = cfg_.dir + "/.probe";
  int fd = ::open(probe_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0)
    return false;
  const bool wrote = write_all(fd, "ok", 2);
  ::close(fd);
  ::unlink(probe_path.c_str());
  if (!wrote)
    return false;

  std::lock_guard<std::mutex> lock(mu_);
  std::string why;
  if (!rebuild_index_locked(&why))
    return false;
  available_ = true;
  spdlog::info("cold tier recovered at {}: {} records", cfg_.dir,
               index_.size());
  return true;
}

std::size_t ColdTier::flush(std::size_t max_items) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t taken = 0;
  for (auto dit = dirty_.begin(); dit != dirty_.end() && taken < max_items;) {
    const CacheKey key = *dit;
    dit = dirty_.erase(dit);
    ++taken;
    auto it = index_.find(key);
    if (it == index_.end())
      continue;
    const std::string path = record_path(key);
    int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0)
      continue;
    const RecordTail tail{it->second.access_count,
                          to_epoch_ms(it->second.last_accessed_at)};
    if (::pwrite(fd, &tail, sizeof(tail),
                 static_cast<off_t>(kChecksummedBytes)) !=
        static_cast<ssize_t>(sizeof(tail)))
      spdlog::debug("cold tier: metadata write failed for {}", key.hex());
    sync_for_policy(fd);
    ::close(fd);
  }
  return taken;
}

std::string ColdTier::record_path(const CacheKey &key) const {
  const std::string hex = key.hex();
  return cfg_.dir + "/" + hex.substr(0, 2) + "/" + hex + ".rec";
}

std::optional<CacheEntry> ColdTier::get(const CacheKey &key) {
  if (!available_.load())
    return std::nullopt;
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  const auto now = Clock::now();
  if (it->second.expired(now)) {
    drop_locked(key);
    ++expirations_;
    return std::nullopt;
  }
  auto loaded = load_locked(key);
  if (!loaded.has_value())
    return std::nullopt;

  auto &meta = index_.at(key);
  ++meta.access_count;
  meta.last_accessed_at = std::max(meta.last_accessed_at, now);
  policy_->on_access(meta);
  dirty_.insert(key);
  loaded->access_count = meta.access_count;
  loaded->last_accessed_at = meta.last_accessed_at;
  return loaded;
}

EvictionReport ColdTier::put(CacheEntry entry, PutMode mode) {
  EvictionReport report;
  if (!available_.load()) {
    report.reason = RejectReason::StorageUnavailable;
    return report;
  }
  const auto now = Clock::now();
  if (entry.expired(now)) {
    report.reason = RejectReason::Expired;
    return report;
  }
  std::string err;
  if (!ensure_compressed(codecs_, entry, &err)) {
    spdlog::warn("cold tier: dropping {}: {}", entry.key.hex(), err);
    report.reason = RejectReason::CorruptEntry;
    return report;
  }
  const std::size_t size = entry.size_bytes();
  if (size > budget_bytes_ || size > kMaxPayload) {
    report.reason = RejectReason::CapacityExceeded;
    return report;
  }

  std::lock_guard<std::mutex> lock(mu_);
  std::uint64_t old_len = 0;
  auto existing = index_.find(entry.key);
  if (existing != index_.end()) {
    if (mode == PutMode::Demote) {
      report.reason = RejectReason::Resident;
      return report;
    }
    old_len = lengths_[entry.key];
    policy_->on_erase(entry.key);
  }

  // Victims leave the recency order tentatively so a refused insert can put
  // them back exactly where they were.
  std::vector<CacheKey> victims;
  const std::uint64_t projected = usage_bytes_ - old_len + size;
  if (projected > budget_bytes_) {
    std::uint64_t covered = 0;
    while (covered < projected - budget_bytes_) {
      auto victim = policy_->pick_victim(index_, now);
      if (!victim.has_value())
        break;
      policy_->on_erase(*victim);
      victims.push_back(*victim);
      covered += lengths_[*victim];
    }
  }
  auto restore = [&] {
    for (const auto &k : victims)
      policy_->on_insert(index_.at(k));
    if (existing != index_.end())
      policy_->on_insert(existing->second);
  };

  if (mode == PutMode::Demote) {
    const double incoming = policy_->priority(entry, now);
    for (const auto &k : victims) {
      if (policy_->priority(index_.at(k), now) >= incoming) {
        restore();
        report.reason = RejectReason::LowerPriority;
        return report;
      }
    }
  }

  entry.tier = TierKind::Cold;
  if (!write_record(entry, &err)) {
    restore();
    mark_unavailable(err);
    report.reason = RejectReason::StorageUnavailable;
    return report;
  }

  for (const auto &k : victims) {
    report.evicted.push_back(index_.at(k));
    drop_locked(k);
  }
  if (existing != index_.end()) {
    usage_bytes_ -= old_len;
    dirty_.erase(entry.key);
  }

  report.raw_bytes = entry.raw_size;
  report.stored_bytes = size;
  CacheEntry meta = metadata_of(entry);
  lengths_[entry.key] = static_cast<std::uint32_t>(size);
  usage_bytes_ += size;
  expiry_.schedule(entry.key, meta.expires_at());
  index_[entry.key] = meta;
  policy_->on_insert(meta);
  report.stored = true;
  return report;
}

std::optional<CacheEntry> ColdTier::remove(const CacheKey &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  auto loaded = load_locked(key);
  if (!loaded.has_value())
    return std::nullopt;
  loaded->access_count = it->second.access_count;
  loaded->last_accessed_at = it->second.last_accessed_at;
  drop_locked(key);
  return loaded;
}

bool ColdTier::contains(const CacheKey &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  return index_.find(key) != index_.end();
}

std::size_t ColdTier::erase_expired(std::size_t max_items, TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t removed = 0;
  for (const auto &key : expiry_.pop_due(now, max_items)) {
    auto it = index_.find(key);
    if (it == index_.end() || !it->second.expired(now))
      continue;
    drop_locked(key);
    ++expirations_;
    ++removed;
  }
  return removed;
}

std::optional<CacheKey> ColdTier::victim() const {
  std::lock_guard<std::mutex> lock(mu_);
  return policy_->pick_victim(index_, Clock::now());
}

void ColdTier::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  for (const auto &[key, meta] : index_)
    std::filesystem::remove(record_path(key), ec);
  index_.clear();
  lengths_.clear();
  dirty_.clear();
  policy_->clear();
  expiry_.clear();
  usage_bytes_ = 0;
}

std::uint64_t ColdTier::current_usage_bytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return usage_bytes_;
}

std::size_t ColdTier::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return index_.size();
}

ColdStats ColdTier::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

bool ColdTier::rebuild_index_locked(std::string *err) {
  const auto start = std::chrono::steady_clock::now();
  index_.clear();
  lengths_.clear();
  dirty_.clear();
  policy_->clear();
  expiry_.clear();
  usage_bytes_ = 0;

  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create " + cfg_.dir + ": " + ec.message();
    return false;
  }

  const auto now = Clock::now();
  std::vector<std::filesystem::path> files;
  std::filesystem::recursive_directory_iterator it(cfg_.dir, ec), end;
  if (ec) {
    if (err)
      *err = "cannot scan " + cfg_.dir + ": " + ec.message();
    return false;
  }
  for (; it != end; it.increment(ec)) {
    if (ec)
      break;
    if (it->is_regular_file(ec))
      files.push_back(it->path());
  }

  for (const auto &path : files) {
    if (path.extension() == ".tmp") {
      std::filesystem::remove(path, ec);
      continue;
    }
    if (path.extension() != ".rec")
      continue;
    CacheEntry entry;
    const auto status = read_record(path.string(), &entry);
    if (status == ReadStatus::IoError) {
      spdlog::warn("cold tier: cannot read {}", path.string());
      continue;
    }
    if (status != ReadStatus::Ok ||
        path.stem().string() != entry.key.hex()) {
      ++stats_.corrupt_records;
      spdlog::warn("cold tier: removing corrupt record {}", path.string());
      std::filesystem::remove(path, ec);
      continue;
    }
    if (entry.expired(now)) {
      std::filesystem::remove(path, ec);
      continue;
    }
    const auto size = entry.size_bytes();
    CacheEntry meta = metadata_of(entry);
    lengths_[meta.key] = static_cast<std::uint32_t>(size);
    usage_bytes_ += size;
    expiry_.schedule(meta.key, meta.expires_at());
    index_[meta.key] = meta;
    policy_->on_insert(meta);
  }

  // The budget may have shrunk since the records were written.
  while (usage_bytes_ > budget_bytes_) {
    auto victim = policy_->pick_victim(index_, now);
    if (!victim.has_value())
      break;
    drop_locked(*victim);
  }

  stats_.index_rebuild_ms = static_cast<std::size_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  return true;
}

ColdTier::ReadStatus ColdTier::read_record(const std::string &path,
                                           CacheEntry *out) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0)
    return errno == ENOENT ? ReadStatus::Missing : ReadStatus::IoError;
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    ::close(fd);
    return ReadStatus::IoError;
  }
  RecordHeader h{};
  if (static_cast<std::size_t>(st.st_size) < sizeof(h) ||
      !read_all(fd, &h, sizeof(h), 0)) {
    ::close(fd);
    return ReadStatus::Corrupt;
  }
  if (h.magic != kMagic || h.version != kVersion ||
      h.payload_len > kMaxPayload ||
      static_cast<std::size_t>(st.st_size) != sizeof(h) + h.payload_len) {
    ::close(fd);
    return ReadStatus::Corrupt;
  }
  Bytes payload(h.payload_len);
  if (h.payload_len > 0 &&
      !read_all(fd, payload.data(), payload.size(),
                static_cast<off_t>(sizeof(h)))) {
    ::close(fd);
    return ReadStatus::Corrupt;
  }
  ::close(fd);
  if (checksum32(h, payload) != h.checksum)
    return ReadStatus::Corrupt;

  std::memcpy(out->key.bytes.data(), h.key, sizeof(h.key));
  out->codec = static_cast<CodecId>(h.codec);
  out->payload = std::move(payload);
  out->raw_size = static_cast<std::size_t>(h.raw_size);
  out->created_at = from_epoch_ms(h.created_at_ms);
  out->ttl = Millis(h.ttl_ms);
  out->access_count = h.access_count;
  out->last_accessed_at = from_epoch_ms(h.last_accessed_ms);
  out->tier = TierKind::Cold;
  ++stats_.reads;
  stats_.read_mb +=
      static_cast<double>(sizeof(h) + h.payload_len) / (1024.0 * 1024.0);
  return ReadStatus::Ok;
}

bool ColdTier::write_record(const CacheEntry &entry, std::string *err) {
  const std::string path = record_path(entry.key);
  const std::string tmp = path + ".tmp";
  std::error_code ec;
  std::filesystem::create_directories(
      std::filesystem::path(path).parent_path(), ec);
  if (ec) {
    if (err)
      *err = "cannot create shard dir: " + ec.message();
    return false;
  }

  RecordHeader h{};
  h.magic = kMagic;
  h.version = kVersion;
  h.codec = static_cast<std::uint8_t>(entry.codec);
  h.payload_len = static_cast<std::uint32_t>(entry.payload.size());
  h.created_at_ms = to_epoch_ms(entry.created_at);
  h.ttl_ms = static_cast<std::int64_t>(entry.ttl.count());
  h.raw_size = entry.raw_size;
  std::memcpy(h.key, entry.key.bytes.data(), sizeof(h.key));
  h.access_count = entry.access_count;
  h.last_accessed_ms = to_epoch_ms(entry.last_accessed_at);
  h.checksum = checksum32(h, entry.payload);

  int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0) {
    if (err)
      *err = "open " + tmp + ": " + std::strerror(errno);
    return false;
  }
  bool ok = write_all(fd, &h, sizeof(h));
  if (ok && !entry.payload.empty())
    ok = write_all(fd, entry.payload.data(), entry.payload.size());
  if (ok)
    ok = sync_for_policy(fd);
  ::close(fd);
  if (!ok || ::rename(tmp.c_str(), path.c_str()) != 0) {
    if (err)
      *err = "write " + path + ": " + std::strerror(errno);
    ::unlink(tmp.c_str());
    return false;
  }
  ++stats_.writes;
  stats_.write_mb += static_cast<double>(sizeof(h) + entry.payload.size()) /
                     (1024.0 * 1024.0);
  return true;
}

bool ColdTier::sync_for_policy(int fd) {
  if (cfg_.fsync == FsyncMode::Never)
    return true;
  if (cfg_.fsync == FsyncMode::Always)
    return ::fsync(fd) == 0;
  const auto now_s = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (now_s != last_fsync_epoch_s_) {
    last_fsync_epoch_s_ = now_s;
    return ::fsync(fd) == 0;
  }
  return true;
}

void ColdTier::drop_locked(const CacheKey &key) {
  std::error_code ec;
  std::filesystem::remove(record_path(key), ec);
  auto len = lengths_.find(key);
  if (len != lengths_.end()) {
    usage_bytes_ -= len->second;
    lengths_.erase(len);
  }
  policy_->on_erase(key);
  expiry_.forget(key);
  dirty_.erase(key);
  index_.erase(key);
}

void ColdTier::mark_unavailable(const std::string &why) {
  available_ = false;
  ++stats_.io_errors;
  spdlog::warn("cold tier unavailable at {}: {}", cfg_.dir, why);
}

std::optional<CacheEntry> ColdTier::load_locked(const CacheKey &key) {
  CacheEntry entry;
  switch (read_record(record_path(key), &entry)) {
  case ReadStatus::Ok:
    if (entry.key == key)
      return entry;
    [[fallthrough]];
  case ReadStatus::Corrupt:
    ++stats_.corrupt_records;
    spdlog::warn("cold tier: corrupt record for {}, evicting", key.hex());
    drop_locked(key);
    return std::nullopt;
  case ReadStatus::Missing:
    drop_locked(key);
    return std::nullopt;
  case ReadStatus::IoError:
    mark_unavailable("read failed for " + key.hex());
    return std::nullopt;
  }
  return std::nullopt;
}

} // namespace search_cache
