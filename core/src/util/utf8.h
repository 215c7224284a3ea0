#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlterm::util {

/// Computes the UTF-8 sequence length from a leading byte.
/// MUST return 1 for invalid sequences to avoid infinite loops.
/// Inputs are raw bytes; outputs are byte counts with no side effects.
size_t utf8_sequence_length(unsigned char lead);

/// Decodes a UTF-8 codepoint and reports its byte length.
/// MUST return U+FFFD and consume one byte for an invalid lead, a truncated sequence,
/// a bad continuation byte, an overlong form or a surrogate.
/// Inputs are text/index; outputs are codepoint + bytes consumed.
uint32_t decode_utf8(const std::string& text, size_t index, size_t* bytes);

/// Appends the UTF-8 encoding of a scalar value to out.
/// MUST encode surrogates and out-of-range values as U+FFFD.
void encode_utf8(char32_t cp, std::string& out);

/// Converts UTF-8 text into Unicode scalars, replacing malformed bytes one by one.
std::u32string utf8_to_u32(const std::string& text);
/// Converts Unicode scalars back to UTF-8.
std::string u32_to_utf8(const std::u32string& text);

/// Returns whether a codepoint is a combining mark.
/// MUST treat zero-width joiners as combining to preserve cursor width.
bool is_combining_mark(uint32_t cp);

/// Returns terminal column width for a codepoint (0, 1 or 2).
/// MUST treat combining marks as width 0 and East Asian wide ranges as width 2.
/// Inputs are codepoints; outputs are width with no side effects.
int display_width(uint32_t cp);

/// Computes display width of a UTF-8 string.
/// MUST count combining marks as zero-width and MUST not depend on the process locale.
size_t display_width(const std::string& text);

}  // namespace sqlterm::util
