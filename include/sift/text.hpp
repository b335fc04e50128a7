#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sift {

// Bytes checked for an embedded NUL when deciding whether a file is binary.
constexpr size_t kBinarySniffBytes = 8192;

// Longer lines (minified or generated code) are never pattern-matched.
constexpr size_t kMaxPatternLine = 4096;

std::string to_lower(std::string_view s);

// Lowercase runs of [A-Za-z0-9_] with length >= 2, in order of appearance.
std::vector<std::string> tokenize(std::string_view text);

// tokenize() with duplicates removed, first occurrence kept.
std::vector<std::string> unique_tokens(std::string_view text);

bool looks_binary(std::string_view content);

// Splits on '\n', dropping a trailing '\r' from each line. A trailing
// newline does not produce an empty final line.
std::vector<std::string> split_lines(std::string_view content);

// Case-insensitive search; needle must already be lowercase.
size_t find_ci(std::string_view haystack, std::string_view lower_needle, size_t from = 0);

} // namespace sift
