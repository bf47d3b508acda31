#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "xdgdirs/common.hpp"

namespace xdgdirs::core {

// Outcome of probing a path on disk
enum class PathStatus {
  kPresent,       // stat succeeded
  kAbsent,        // stat failed with ENOENT
  kIndeterminate  // stat failed otherwise (EACCES or ENOTDIR on a parent)
};

/**
 * @brief Immutable directory path value
 *
 * Wraps a path string exactly as given. An empty Dir means the location
 * could not be resolved. Dir does not own the directory it names; only
 * create() touches the filesystem.
 */
class Dir {
 public:
  Dir() = default;
  explicit Dir(std::string path) : path_(std::move(path)) {}

  // True unless the path is known not to exist.
  // An indeterminate stat result counts as existing.
  bool exists() const;

  // Three-valued existence check
  PathStatus status() const;

  // Create the directory and any missing parents with mode 0755.
  // The path is normalized first; directories that already exist keep their mode.
  Result<void> create() const;

  // New Dir with segment joined as a trailing component (no filesystem access)
  Dir append(std::string_view segment) const;

  // Textual split on '/': one leading and one trailing empty segment are
  // dropped, interior empty segments are kept
  std::vector<std::string> split() const;

  const std::string& string() const { return path_; }
  std::filesystem::path path() const { return path_; }
  bool empty() const { return path_.empty(); }

  bool operator==(const Dir& other) const = default;

 private:
  std::string path_;
};

std::ostream& operator<<(std::ostream& os, const Dir& dir);

}  // namespace xdgdirs::core
