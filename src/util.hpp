#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace karltui {

// Trim whitespace
std::string trim(const std::string& s);

// Strip every leading and trailing occurrence of ch
std::string trim_char(const std::string& s, char ch);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive substring test (empty needle always matches)
bool contains_ci(const std::string& haystack, const std::string& needle);

bool starts_with(const std::string& s, const std::string& prefix);

// Strict number parsing: the whole (trimmed) string must be consumed.
std::optional<double> parse_real(const std::string& s);
std::optional<uint64_t> parse_unsigned(const std::string& s,
                                       uint64_t max = UINT64_MAX);

// Shortest round-trippable text for a double ("0.7", "1.0")
std::string format_real(double value);

// UTF-8 character boundaries around a byte offset. Continuation bytes
// (10xxxxxx) are skipped so the result never splits a sequence.
size_t utf8_prev(const std::string& s, size_t pos);
size_t utf8_next(const std::string& s, size_t pos);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace karltui
