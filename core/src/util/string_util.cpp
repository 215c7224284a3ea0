#include "string_util.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace sqlterm::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string first_token(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = start;
  while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end]))) {
    ++end;
  }
  return s.substr(start, end - start);
}

std::string hex_blob_literal(const unsigned char* bytes, size_t size) {
  static const char kDigits[] = "0123456789ABCDEF";
  std::string out = "X'";
  out.reserve(size * 2 + 3);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[bytes[i] >> 4]);
    out.push_back(kDigits[bytes[i] & 0x0F]);
  }
  out.push_back('\'');
  return out;
}

bool parse_positive_size(const std::string& raw, size_t& out) {
  if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size() || value == 0) return false;
    if (value > std::numeric_limits<size_t>::max()) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

}  // namespace sqlterm::util
