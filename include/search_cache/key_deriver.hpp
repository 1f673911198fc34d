#pragma once

#include "search_cache/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace search_cache {

using KeyParams = std::map<std::string, std::string>;

struct SearchQuery {
  std::string query;
  std::vector<std::string> categories;
  std::vector<std::string> engines;
  std::string language;
  std::string time_range;
  std::string safesearch;
  std::uint32_t pageno{1};

  KeyParams to_key_params() const;
};

// Fields every search key carries. Missing ones are encoded as "".
const std::vector<std::string> &recognized_key_fields();

std::string canonical_form(const KeyParams &params);
CacheKey derive_key(const KeyParams &params);
CacheKey derive_key(const SearchQuery &query);

// Parses "words... [page=N] [lang=X] [engine=Y]". Page numbers must be
// decimal and fit in 1..UINT32_MAX.
bool parse_search_terms(const std::string &text, SearchQuery *out,
                        std::string *err);

} // namespace search_cache
