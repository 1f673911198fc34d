#pragma once

#include "search_cache/cold_tier.hpp"
#include "search_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace search_cache {

struct CacheConfig {
  bool enabled{true};
  Millis default_ttl{Millis(3600 * 1000)};
  std::uint64_t hot_budget_bytes{64ULL * 1024 * 1024};
  std::uint64_t warm_budget_bytes{128ULL * 1024 * 1024};
  std::uint64_t cold_budget_bytes{1024ULL * 1024 * 1024};
  Millis reaper_interval{Millis(60 * 1000)};
  std::uint32_t promotion_threshold{3};
  Millis promotion_window{Millis(60 * 1000)};
  Millis migration_interval{Millis(100)};
  std::size_t migration_batch{64};
  std::size_t reaper_batch{256};
  double demotion_pressure{0.9};
  double w_frequency{1.0};
  double w_recency{0.01};
  CodecId codec{CodecId::ZlibFast};
  std::string cold_dir{"./search_cache_data"};
  FsyncMode fsync{FsyncMode::EverySec};
  std::size_t hot_keys_top_n{10};
  // Off: maintenance runs only through run_maintenance().
  bool background_threads{true};
  std::string log_level{"info"};
};

// Unknown keys are ignored and numbers are clamped. A malformed document or
// an unrecognised enum value leaves *out untouched.
bool parse_config(const std::string &text, CacheConfig *out,
                  std::string *err = nullptr);
bool load_config(const std::string &path, CacheConfig *out,
                 std::string *err = nullptr);

std::optional<FsyncMode> fsync_mode_by_name(const std::string &name);
const char *fsync_mode_name(FsyncMode mode);

} // namespace search_cache
