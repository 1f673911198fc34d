#include "search_cache/config.hpp"

#include "search_cache/codec.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace search_cache {
namespace {
bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  // Saturates to HUGE_VAL on overflow.
  out = std::strtod(m[1].str().c_str(), nullptr);
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]{1,19})");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

std::uint64_t clamp_u(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

bool known_level(const std::string &level) {
  static const char *kLevels[] = {"trace", "debug", "info", "warn",
                                  "error", "critical", "off"};
  return std::find(std::begin(kLevels), std::end(kLevels), level) !=
         std::end(kLevels);
}
} // namespace

std::optional<FsyncMode> fsync_mode_by_name(const std::string &name) {
  if (name == "never")
    return FsyncMode::Never;
  if (name == "everysec")
    return FsyncMode::EverySec;
  if (name == "always")
    return FsyncMode::Always;
  return std::nullopt;
}

const char *fsync_mode_name(FsyncMode mode) {
  switch (mode) {
  case FsyncMode::Never:
    return "never";
  case FsyncMode::EverySec:
    return "everysec";
  case FsyncMode::Always:
    return "always";
  }
  return "unknown";
}

bool parse_config(const std::string &text, CacheConfig *out,
                  std::string *err) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  constexpr std::uint64_t kMaxBudget = 1ULL << 40;
  constexpr std::uint64_t kDay = 24ULL * 3600 * 1000;
  CacheConfig c = *out;
  double d;
  std::uint64_t u;
  std::string s;
  bool b;
  if (extract_bool(text, "enabled", b))
    c.enabled = b;
  if (extract_u64(text, "default_ttl_ms", u))
    c.default_ttl = Millis(clamp_u(u, 1, 30 * kDay));
  if (extract_u64(text, "hot_budget_bytes", u))
    c.hot_budget_bytes = clamp_u(u, 0, kMaxBudget);
  if (extract_u64(text, "warm_budget_bytes", u))
    c.warm_budget_bytes = clamp_u(u, 0, kMaxBudget);
  if (extract_u64(text, "cold_budget_bytes", u))
    c.cold_budget_bytes = clamp_u(u, 0, kMaxBudget);
  if (extract_u64(text, "reaper_interval_ms", u))
    c.reaper_interval = Millis(clamp_u(u, 10, kDay));
  if (extract_u64(text, "promotion_threshold", u))
    c.promotion_threshold = static_cast<std::uint32_t>(clamp_u(u, 1, 1000000));
  if (extract_u64(text, "promotion_window_ms", u))
    c.promotion_window = Millis(clamp_u(u, 1, kDay));
  if (extract_u64(text, "migration_interval_ms", u))
    c.migration_interval = Millis(clamp_u(u, 1, 60 * 1000));
  if (extract_u64(text, "migration_batch", u))
    c.migration_batch = static_cast<std::size_t>(clamp_u(u, 1, 100000));
  if (extract_u64(text, "reaper_batch", u))
    c.reaper_batch = static_cast<std::size_t>(clamp_u(u, 1, 100000));
  if (extract_u64(text, "hot_keys_top_n", u))
    c.hot_keys_top_n = static_cast<std::size_t>(clamp_u(u, 0, 1000));
  if (extract_double(text, "demotion_pressure", d))
    c.demotion_pressure = std::clamp(d, 0.1, 1.0);
  if (extract_double(text, "w_frequency", d))
    c.w_frequency = std::clamp(d, 0.0, 1000.0);
  if (extract_double(text, "w_recency", d))
    c.w_recency = std::clamp(d, 0.0, 1000.0);
  if (extract_bool(text, "background_threads", b))
    c.background_threads = b;
  if (extract_string(text, "cold_dir", s)) {
    if (s.empty()) {
      if (err)
        *err = "cold_dir must not be empty";
      return false;
    }
    c.cold_dir = s;
  }
  if (extract_string(text, "codec", s)) {
    auto id = codec_id_by_name(s);
    if (!id.has_value()) {
      if (err)
        *err = "unknown codec: " + s;
      return false;
    }
    c.codec = *id;
  }
  if (extract_string(text, "fsync", s)) {
    auto mode = fsync_mode_by_name(s);
    if (!mode.has_value()) {
      if (err)
        *err = "unknown fsync mode: " + s;
      return false;
    }
    c.fsync = *mode;
  }
  if (extract_string(text, "log_level", s)) {
    if (!known_level(s)) {
      if (err)
        *err = "unknown log level: " + s;
      return false;
    }
    c.log_level = s;
  }

  *out = std::move(c);
  return true;
}

bool load_config(const std::string &path, CacheConfig *out,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), out, err))
    return false;
  spdlog::info("loaded cache config from {}", path);
  return true;
}

} // namespace search_cache
