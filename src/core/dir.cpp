#include "xdgdirs/core/dir.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "xdgdirs/util/search_path.hpp"

namespace xdgdirs::core {

namespace {

constexpr auto kDirPerms = std::filesystem::perms::owner_all |
                           std::filesystem::perms::group_read |
                           std::filesystem::perms::group_exec |
                           std::filesystem::perms::others_read |
                           std::filesystem::perms::others_exec;

bool isPermissionError(const std::error_code& ec) {
  return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

// Components of a normalized path that do not exist yet, outermost first.
// Everything before the first missing component exists; ".." never counts.
std::vector<std::filesystem::path> missingComponents(const std::filesystem::path& path) {
  std::vector<std::filesystem::path> missing;
  std::filesystem::path current;
  for (const auto& part : path) {
    current /= part;
    if (part.empty() || part == "..") {
      continue;
    }
    if (!missing.empty()) {
      missing.push_back(current);
      continue;
    }
    std::error_code ec;
    if (!std::filesystem::exists(current, ec) && !ec) {
      missing.push_back(current);
    }
  }
  return missing;
}

}  // namespace

bool Dir::exists() const {
  return status() != PathStatus::kAbsent;
}

PathStatus Dir::status() const {
  struct stat st;
  if (::stat(path_.c_str(), &st) == 0) {
    return PathStatus::kPresent;
  }
  // Only ENOENT means absent; ENOTDIR and EACCES leave the answer open
  const int err = errno;
  if (err == ENOENT) {
    return PathStatus::kAbsent;
  }
  spdlog::debug("stat {} failed: {}", path_, std::strerror(err));
  return PathStatus::kIndeterminate;
}

Result<void> Dir::create() const {
  if (path_.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Cannot create directory: empty path"));
  }

  const auto target = std::filesystem::path(path_).lexically_normal();
  auto missing = missingComponents(target);

  std::error_code ec;
  std::filesystem::create_directories(target, ec);
  if (ec) {
    spdlog::warn("Cannot create directory {}: {}", path_, ec.message());
    auto code = isPermissionError(ec) ? ErrorCode::kFilePermissionDenied
                                      : ErrorCode::kDirectoryCreateError;
    return std::unexpected(makeError(code, "Cannot create directory " + path_ + ": " + ec.message()));
  }

  for (const auto& created : missing) {
    std::filesystem::permissions(created, kDirPerms, std::filesystem::perm_options::replace, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                       "Cannot set directory permissions: " + ec.message()));
    }
  }

  if (!missing.empty()) {
    spdlog::debug("Created directory {}", path_);
  }
  return {};
}

Dir Dir::append(std::string_view segment) const {
  return Dir(util::joinPath(path_, segment));
}

std::vector<std::string> Dir::split() const {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    auto pos = path_.find(util::kPathSeparator, start);
    if (pos == std::string::npos) {
      parts.push_back(path_.substr(start));
      break;
    }
    parts.push_back(path_.substr(start, pos - start));
    start = pos + 1;
  }

  if (!parts.empty() && parts.front().empty()) {
    parts.erase(parts.begin());
  }
  if (!parts.empty() && parts.back().empty()) {
    parts.pop_back();
  }
  return parts;
}

std::ostream& operator<<(std::ostream& os, const Dir& dir) {
  return os << dir.string();
}

}  // namespace xdgdirs::core
