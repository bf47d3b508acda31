#include "xdgdirs/util/search_path.hpp"

#include <filesystem>

namespace xdgdirs::util {

std::vector<std::string> splitList(std::string_view value) {
  std::vector<std::string> entries;
  if (value.empty()) {
    return entries;
  }

  size_t start = 0;
  while (true) {
    auto pos = value.find(kListSeparator, start);
    if (pos == std::string_view::npos) {
      entries.emplace_back(value.substr(start));
      break;
    }
    entries.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return entries;
}

std::string joinList(const std::vector<std::string>& entries) {
  std::string result;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) result += kListSeparator;
    result += entries[i];
  }
  return result;
}

std::string cleanPath(std::string_view path) {
  if (path.empty()) {
    return {};
  }

  auto cleaned = std::filesystem::path(path).lexically_normal().string();
  while (cleaned.size() > 1 && cleaned.back() == kPathSeparator) {
    cleaned.pop_back();
  }
  return cleaned;
}

std::string joinPath(std::initializer_list<std::string_view> elements) {
  std::string joined;
  for (auto element : elements) {
    if (element.empty()) continue;
    if (!joined.empty()) joined += kPathSeparator;
    joined.append(element);
  }
  return cleanPath(joined);
}

}  // namespace xdgdirs::util
