#include "search_cache/types.hpp"

namespace search_cache {
namespace {
int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

const char *tier_name(TierKind tier) {
  switch (tier) {
  case TierKind::Hot:
    return "hot";
  case TierKind::Warm:
    return "warm";
  case TierKind::Cold:
    return "cold";
  }
  return "unknown";
}

std::string CacheKey::hex() const {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

bool CacheKey::from_hex(const std::string &hex, CacheKey *out) {
  if (hex.size() != out->bytes.size() * 2)
    return false;
  for (std::size_t i = 0; i < out->bytes.size(); ++i) {
    const int hi = hex_digit(hex[2 * i]);
    const int lo = hex_digit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    out->bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace search_cache
