#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolgate {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Current calendar year (UTC)
int current_year();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

bool starts_with(const std::string& s, const std::string& prefix);

// Percent-encode for use in a URL query component (RFC 3986 unreserved kept).
std::string url_encode(const std::string& s);

// Number of UTF-8 code points in s (invalid bytes count as one each).
size_t utf8_length(const std::string& s);

// First max_chars code points of s; never splits a multi-byte sequence.
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Well-formed UTF-8: no stray continuation bytes, overlong forms,
// surrogates or code points above U+10FFFF.
bool is_valid_utf8(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// $HOME, falling back to the passwd entry, then "."
std::string home_dir();

// Write via temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace toolgate
