#include "search_cache/key_deriver.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <sstream>

#include <openssl/sha.h>

namespace search_cache {
namespace {
std::string join_set(std::vector<std::string> items) {
  std::sort(items.begin(), items.end());
  items.erase(std::unique(items.begin(), items.end()), items.end());
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += items[i];
  }
  return out;
}

void append_field(std::string &out, const std::string &name,
                  const std::string &value) {
  out += std::to_string(name.size());
  out += ':';
  out += name;
  out += '=';
  out += std::to_string(value.size());
  out += ':';
  out += value;
  out += ';';
}
} // namespace

KeyParams SearchQuery::to_key_params() const {
  KeyParams p;
  p["query"] = query;
  p["categories"] = join_set(categories);
  p["engines"] = join_set(engines);
  p["language"] = language;
  p["time_range"] = time_range;
  p["safesearch"] = safesearch;
  p["pageno"] = std::to_string(pageno);
  return p;
}

const std::vector<std::string> &recognized_key_fields() {
  static const std::vector<std::string> fields = {
      "query",      "categories", "engines", "language",
      "time_range", "safesearch", "pageno"};
  return fields;
}

std::string canonical_form(const KeyParams &params) {
  KeyParams normalized = params;
  for (const auto &field : recognized_key_fields())
    normalized.try_emplace(field, std::string{});

  std::string out;
  for (const auto &[name, value] : normalized)
    append_field(out, name, value);
  return out;
}

CacheKey derive_key(const KeyParams &params) {
  const std::string canonical = canonical_form(params);
  CacheKey key;
  SHA256(reinterpret_cast<const unsigned char *>(canonical.data()),
         canonical.size(), key.bytes.data());
  return key;
}

CacheKey derive_key(const SearchQuery &query) {
  return derive_key(query.to_key_params());
}

bool parse_search_terms(const std::string &text, SearchQuery *out,
                        std::string *err) {
  SearchQuery q;
  std::istringstream in(text);
  std::string word;
  while (in >> word) {
    if (word.rfind("page=", 0) == 0) {
      const char *first = word.data() + 5;
      const char *last = word.data() + word.size();
      std::uint64_t page = 0;
      const auto res = std::from_chars(first, last, page);
      if (first == last || res.ec != std::errc() || res.ptr != last ||
          page == 0 || page > std::numeric_limits<std::uint32_t>::max()) {
        if (err)
          *err = "bad page";
        return false;
      }
      q.pageno = static_cast<std::uint32_t>(page);
    } else if (word.rfind("lang=", 0) == 0) {
      q.language = word.substr(5);
    } else if (word.rfind("engine=", 0) == 0) {
      q.engines.push_back(word.substr(7));
    } else {
      q.query += (q.query.empty() ? "" : " ") + word;
    }
  }
  *out = std::move(q);
  return true;
}

} // namespace search_cache
