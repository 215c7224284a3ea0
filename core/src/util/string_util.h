#pragma once

#include <cstddef>
#include <string>

namespace sqlterm::util {

/// ASCII lowercase; used for config keys, backend names and flag values.
std::string to_lower(const std::string& s);
/// ASCII uppercase; statement keywords are classified in this form.
std::string to_upper(const std::string& s);
/// Strips ASCII whitespace at both ends, keeping inner whitespace.
std::string trim_ws(const std::string& s);
/// Case-insensitive ASCII equality, e.g. for the "null" cell marker.
bool iequals(const std::string& a, const std::string& b);
/// Returns the first whitespace-delimited token of a statement or command line.
/// MUST return an empty string for blank input.
std::string first_token(const std::string& s);
/// Formats raw bytes as an SQL hex literal, e.g. X'00FF'.
std::string hex_blob_literal(const unsigned char* bytes, size_t size);
/// Parses a decimal count such as a page size or a 1-based row number.
/// MUST reject empty input, signs, whitespace, trailing junk, zero and values past size_t.
bool parse_positive_size(const std::string& raw, size_t& out);

}  // namespace sqlterm::util
