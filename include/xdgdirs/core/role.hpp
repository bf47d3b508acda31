#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <vector>

#include "xdgdirs/common.hpp"

namespace xdgdirs::core {

// Directory roles defined by the XDG Base Directory Specification
enum class Role {
  kConfigHome,
  kCacheHome,
  kDataHome,
  kStateHome,
  kRuntimeDir,
  kConfigDirs,
  kDataDirs
};

inline constexpr std::array<Role, 7> kAllRoles = {
    Role::kConfigHome, Role::kCacheHome, Role::kDataHome,  Role::kStateHome,
    Role::kRuntimeDir, Role::kConfigDirs, Role::kDataDirs};

// Roles resolving to a single directory
inline constexpr std::array<Role, 5> kSingleRoles = {
    Role::kConfigHome, Role::kCacheHome, Role::kDataHome, Role::kStateHome,
    Role::kRuntimeDir};

// Roles with a default location beneath the home directory
inline constexpr std::array<Role, 4> kHomeRoles = {
    Role::kConfigHome, Role::kCacheHome, Role::kDataHome, Role::kStateHome};

// Environment variable consulted for a role (e.g. "XDG_CONFIG_HOME")
std::string_view envVarName(Role role);

// Short name used on the command line and in config files (e.g. "config-dirs")
std::string_view roleToString(Role role);

// Parse a short role name
Result<Role> roleFromString(std::string_view name);

// True for ConfigDirs and DataDirs
bool isSearchPathRole(Role role);

// Default base beneath $HOME (".config", ".local/share", ...).
// std::nullopt for roles without a home default.
std::optional<std::string_view> defaultHomeBase(Role role);

// Default entries for search-path roles; empty for other roles
std::vector<std::string_view> defaultSearchPaths(Role role);

}  // namespace xdgdirs::core
