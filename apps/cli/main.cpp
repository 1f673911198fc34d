#include "search_cache/cache.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace search_cache;

namespace {
// Stands in for the rate-limited search backend.
std::optional<Bytes> slow_search(const SearchQuery &q, std::string *err) {
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (q.query.find("fail") != std::string::npos) {
    if (err)
      *err = "backend error: upstream returned 503 for '" + q.query + "'";
    return std::nullopt;
  }
  const std::string body = "{\"query\":\"" + q.query + "\",\"page\":" +
                           std::to_string(q.pageno) +
                           ",\"results\":[\"result one\",\"result two\"]}";
  return Bytes(body.begin(), body.end());
}

} // namespace

int main(int argc, char **argv) {
  CacheConfig cfg;
  if (argc > 1) {
    std::string err;
    if (!load_config(argv[1], &cfg, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 1;
    }
  }
  TieredCache cache(cfg);

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty())
      continue;
    if (cmd == "quit")
      break;
    if (cmd == "info") {
      std::cout << cache.info();
    } else if (cmd == "clear") {
      cache.clear_all();
      std::cout << "OK\n";
    } else if (cmd == "maint") {
      cache.run_maintenance();
      std::cout << "OK\n";
    } else if (cmd == "invalidate" || cmd == "search") {
      std::string rest;
      std::getline(in, rest);
      SearchQuery q;
      std::string err;
      if (!parse_search_terms(rest, &q, &err)) {
        std::cout << "ERR " << err << "\n";
        continue;
      }
      const auto params = q.to_key_params();
      if (cmd == "invalidate") {
        std::cout << (cache.invalidate(params) ? "1" : "0") << "\n";
        continue;
      }
      const auto where = cache.locate(params);
      const auto t0 = std::chrono::steady_clock::now();
      auto value = cache.get_or_compute(
          params, std::nullopt,
          [&](std::string *e) { return slow_search(q, e); }, &err);
      const auto ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - t0)
                          .count();
      if (!value.has_value()) {
        std::cout << "ERR " << err << "\n";
        continue;
      }
      std::cout << (where ? tier_name(*where) : "miss") << " " << ms << "ms "
                << std::string(value->begin(), value->end()) << "\n";
    } else {
      std::cout << "ERR unknown command '" << cmd << "'\n";
    }
  }
  cache.shutdown();
  return 0;
}
