#include "text.hpp"

#include <algorithm>
#include <cctype>

namespace trackmatch::util {

namespace {

bool IsWordByte(unsigned char c) {
  return c >= 0x80 || std::isalnum(c) != 0;
}

} // namespace

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::string_view Basename(std::string_view path) {
  const auto pos = path.find_last_of("\\/");
  if (pos == std::string_view::npos) return path;
  return path.substr(pos + 1);
}

std::string Extension(std::string_view path) {
  const auto base = Basename(path);
  const auto dot  = base.find_last_of('.');
  if (dot == std::string_view::npos || dot + 1 == base.size()) return {};
  return ToLower(base.substr(dot + 1));
}

std::vector<std::string> Tokenize(std::string_view value) {
  std::vector<std::string> tokens;
  std::string              current;
  for (unsigned char c : value) {
    if (IsWordByte(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(sep);
    out.append(parts[i]);
  }
  return out;
}

std::string Trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

} // namespace trackmatch::util
