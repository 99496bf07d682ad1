#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace trackmatch::util {

std::string ToLower(std::string_view value);

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// Last path component; accepts both '\' (peer paths) and '/' separators.
std::string_view Basename(std::string_view path);

// Lowercase extension without the dot, empty when there is none.
std::string Extension(std::string_view path);

// Lowercase runs of alphanumeric characters. Non-ASCII bytes count as
// alphanumeric so accented and non-Latin words survive intact.
std::vector<std::string> Tokenize(std::string_view value);

std::string Join(const std::vector<std::string>& parts, std::string_view sep);

std::string Trim(std::string_view value);

} // namespace trackmatch::util
