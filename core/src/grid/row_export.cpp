#include "sqlterm/result_grid.h"

#include <unordered_set>

#include <nlohmann/json.hpp>

#include "util/string_util.h"

namespace sqlterm {

std::vector<std::string> json_keys(const std::vector<std::string>& headers) {
  std::unordered_set<std::string> used(headers.begin(), headers.end());
  std::unordered_set<std::string> taken;
  std::vector<std::string> keys;
  keys.reserve(headers.size());
  for (const auto& header : headers) {
    std::string key = header;
    if (!taken.insert(key).second) {
      // Skip suffixes that collide with a real header or an earlier rename.
      size_t n = 2;
      do {
        key = header + "_" + std::to_string(n++);
      } while (used.count(key) != 0 || taken.count(key) != 0);
      taken.insert(key);
    }
    keys.push_back(std::move(key));
  }
  return keys;
}

std::string row_to_json(const std::vector<std::string>& headers,
                        const std::vector<std::string>& row) {
  using nlohmann::ordered_json;
  std::vector<std::string> keys = json_keys(headers);
  ordered_json obj = ordered_json::object();
  for (size_t i = 0; i < keys.size() && i < row.size(); ++i) {
    if (util::iequals(row[i], "null")) {
      obj[keys[i]] = nullptr;
    } else {
      obj[keys[i]] = row[i];
    }
  }
  return obj.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

}  // namespace sqlterm
