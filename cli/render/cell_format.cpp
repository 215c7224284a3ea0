#include "render/cell_format.h"

#include <algorithm>
#include <cctype>
#include <sys/ioctl.h>
#include <unistd.h>

#include "util/utf8.h"

namespace sqlterm::render {

size_t detect_terminal_width() {
  struct winsize w {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
    return static_cast<size_t>(w.ws_col);
  }
  return 120;
}

std::string sanitize_cell(std::string value) {
  std::replace_if(
      value.begin(), value.end(), [](char c) { return c == '\n' || c == '\r' || c == '\t'; }, ' ');
  return value;
}

bool is_numeric(const std::string& value) {
  size_t i = 0;
  auto skip_sign = [&]() {
    if (i < value.size() && (value[i] == '-' || value[i] == '+')) ++i;
  };
  auto skip_digits = [&]() {
    size_t start = i;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) ++i;
    return i - start;
  };
  skip_sign();
  size_t mantissa = skip_digits();
  if (i < value.size() && value[i] == '.') {
    ++i;
    mantissa += skip_digits();
  }
  if (mantissa == 0) return false;
  if (i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
    ++i;
    skip_sign();
    if (skip_digits() == 0) return false;
  }
  return i == value.size();
}

std::string truncate_with_ellipsis(const std::string& value, size_t width) {
  if (util::display_width(value) <= width) return value;
  if (width == 0) return "";
  const std::string ellipsis = "…";
  if (width == 1) return ellipsis;
  size_t target = width - 1;
  std::string out;
  size_t used = 0;
  size_t i = 0;
  while (i < value.size() && used < target) {
    size_t len = 0;
    uint32_t cp = util::decode_utf8(value, i, &len);
    size_t add = static_cast<size_t>(util::display_width(cp));
    if (used + add > target) break;
    out.append(value, i, len);
    i += len;
    used += add;
  }
  out += ellipsis;
  return out;
}

std::string pad_cell(const std::string& value, size_t width, bool right_align) {
  size_t used = util::display_width(value);
  if (used >= width) return value;
  std::string fill(width - used, ' ');
  return right_align ? fill + value : value + fill;
}

std::string fit_cell(const std::string& value, size_t width, bool right_align) {
  return pad_cell(truncate_with_ellipsis(sanitize_cell(value), width), width, right_align);
}

}  // namespace sqlterm::render
