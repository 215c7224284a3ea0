#include "cli_utils.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "sqlterm/result_grid.h"
#include "util/string_util.h"
#include "ui/color.h"

namespace sqlterm::cli {

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string trim_semicolon(std::string value) {
  while (!value.empty() && (value.back() == ';' || std::isspace(static_cast<unsigned char>(value.back())))) {
    value.pop_back();
  }
  return value;
}

namespace {

/// Length of the JSON literal (true, false, null) starting at i, or 0.
size_t literal_length(const std::string& input, size_t i, const char*& color) {
  if (input.compare(i, 4, "true") == 0) {
    color = kColor.yellow;
    return 4;
  }
  if (input.compare(i, 5, "false") == 0) {
    color = kColor.yellow;
    return 5;
  }
  if (input.compare(i, 4, "null") == 0) {
    color = kColor.magenta;
    return 4;
  }
  return 0;
}

/// End of the JSON string whose opening quote is at start (one past the closing quote).
size_t string_end(const std::string& input, size_t start) {
  size_t i = start + 1;
  while (i < input.size()) {
    if (input[i] == '\\') {
      i += 2;
      continue;
    }
    if (input[i] == '"') return i + 1;
    ++i;
  }
  return input.size();
}

bool is_number_char(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == 'e' ||
         c == 'E';
}

}  // namespace

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  size_t i = 0;
  while (i < input.size()) {
    char c = input[i];
    size_t end = i + 1;
    const char* color = nullptr;
    if (c == '"') {
      end = string_end(input, i);
      color = kColor.green;
    } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      while (end < input.size() && is_number_char(input[end])) ++end;
      color = kColor.cyan;
    } else if (size_t len = literal_length(input, i, color)) {
      end = i + len;
    } else if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      color = kColor.dim;
    }
    if (color) out += color;
    out.append(input, i, end - i);
    if (color) out += kColor.reset;
    i = end;
  }
  return out;
}

std::string build_json(const std::vector<std::string>& headers,
                       const std::vector<std::vector<std::string>>& rows) {
  using nlohmann::ordered_json;
  std::vector<std::string> keys = sqlterm::json_keys(headers);
  ordered_json out = ordered_json::array();
  for (const auto& row : rows) {
    ordered_json obj = ordered_json::object();
    for (size_t i = 0; i < keys.size() && i < row.size(); ++i) {
      if (sqlterm::util::iequals(row[i], "null")) {
        obj[keys[i]] = nullptr;
      } else {
        obj[keys[i]] = row[i];
      }
    }
    out.push_back(std::move(obj));
  }
  return out.dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

std::string build_plain(const std::vector<std::string>& headers,
                        const std::vector<std::vector<std::string>>& rows) {
  std::ostringstream oss;
  for (size_t i = 0; i < headers.size(); ++i) {
    if (i > 0) oss << '\t';
    oss << headers[i];
  }
  oss << '\n';
  for (const auto& row : rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) oss << '\t';
      oss << row[i];
    }
    oss << '\n';
  }
  return oss.str();
}

}  // namespace sqlterm::cli
