#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace xdgdirs::util {

// Separator between entries of a search-path variable (XDG_DATA_DIRS etc.)
inline constexpr char kListSeparator = ':';

// Separator between path segments
inline constexpr char kPathSeparator = '/';

// Split a search-path value into its entries.
// An empty value yields no entries; interior empty entries are kept.
std::vector<std::string> splitList(std::string_view value);

// Join entries with kListSeparator (inverse of splitList)
std::string joinList(const std::vector<std::string>& entries);

// Lexically join path elements.
// Empty elements are ignored and the result is cleaned: doubled separators
// collapse, "." is dropped, ".." is resolved lexically and a trailing
// separator is removed. Joining only empty elements yields "".
std::string joinPath(std::initializer_list<std::string_view> elements);

inline std::string joinPath(std::string_view base, std::string_view segment) {
  return joinPath({base, segment});
}

// Lexically clean a path (see joinPath). An empty path stays empty.
std::string cleanPath(std::string_view path);

}  // namespace xdgdirs::util
