#include "utf8.h"

namespace sqlterm::util {

size_t utf8_sequence_length(unsigned char lead) {
  if ((lead & 0x80) == 0x00) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

uint32_t decode_utf8(const std::string& text, size_t index, size_t* bytes) {
  constexpr uint32_t kReplacement = 0xFFFD;
  if (index >= text.size()) {
    if (bytes) *bytes = 0;
    return 0;
  }
  if (bytes) *bytes = 1;
  unsigned char lead = static_cast<unsigned char>(text[index]);
  if (lead < 0x80) return lead;
  size_t len = utf8_sequence_length(lead);
  if (len == 1 || index + len > text.size()) return kReplacement;
  uint32_t cp = 0;
  if (len == 2) {
    cp = lead & 0x1F;
  } else if (len == 3) {
    cp = lead & 0x0F;
  } else {
    cp = lead & 0x07;
  }
  for (size_t i = 1; i < len; ++i) {
    unsigned char c = static_cast<unsigned char>(text[index + i]);
    if ((c & 0xC0) != 0x80) return kReplacement;
    cp = (cp << 6) | (c & 0x3F);
  }
  static const uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return kReplacement;
  }
  if (bytes) *bytes = len;
  return cp;
}

void encode_utf8(char32_t cp, std::string& out) {
  uint32_t value = static_cast<uint32_t>(cp);
  if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    value = 0xFFFD;
  }
  if (value < 0x80) {
    out.push_back(static_cast<char>(value));
  } else if (value < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (value >> 6)));
    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
  } else if (value < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (value >> 12)));
    out.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (value >> 18)));
    out.push_back(static_cast<char>(0x80 | ((value >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
  }
}

std::u32string utf8_to_u32(const std::string& text) {
  std::u32string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    size_t bytes = 0;
    uint32_t cp = decode_utf8(text, i, &bytes);
    out.push_back(static_cast<char32_t>(cp));
    i += bytes ? bytes : 1;
  }
  return out;
}

std::string u32_to_utf8(const std::u32string& text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : text) {
    encode_utf8(cp, out);
  }
  return out;
}

bool is_combining_mark(uint32_t cp) {
  if ((cp >= 0x0300 && cp <= 0x036F) ||
      (cp >= 0x1AB0 && cp <= 0x1AFF) ||
      (cp >= 0x1DC0 && cp <= 0x1DFF) ||
      (cp >= 0x20D0 && cp <= 0x20FF) ||
      (cp >= 0xFE20 && cp <= 0xFE2F)) {
    return true;
  }
  if (cp == 0x200B || cp == 0x200C || cp == 0x200D) {
    return true;
  }
  return false;
}

namespace {

bool is_wide(uint32_t cp) {
  return (cp >= 0x1100 && cp <= 0x115F) ||
         (cp >= 0x2E80 && cp <= 0x303E) ||
         (cp >= 0x3041 && cp <= 0x33FF) ||
         (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0x4E00 && cp <= 0x9FFF) ||
         (cp >= 0xA000 && cp <= 0xA4CF) ||
         (cp >= 0xAC00 && cp <= 0xD7A3) ||
         (cp >= 0xF900 && cp <= 0xFAFF) ||
         (cp >= 0xFE30 && cp <= 0xFE4F) ||
         (cp >= 0xFF00 && cp <= 0xFF60) ||
         (cp >= 0xFFE0 && cp <= 0xFFE6) ||
         (cp >= 0x1F300 && cp <= 0x1F64F) ||
         (cp >= 0x1F900 && cp <= 0x1F9FF) ||
         (cp >= 0x20000 && cp <= 0x3FFFD);
}

}  // namespace

int display_width(uint32_t cp) {
  if (cp == 0) return 0;
  if (is_combining_mark(cp)) return 0;
  if (is_wide(cp)) return 2;
  return 1;
}

size_t display_width(const std::string& text) {
  size_t i = 0;
  size_t col = 0;
  while (i < text.size()) {
    size_t bytes = 0;
    uint32_t cp = decode_utf8(text, i, &bytes);
    col += static_cast<size_t>(display_width(cp));
    i += bytes ? bytes : 1;
  }
  return col;
}

}  // namespace sqlterm::util
