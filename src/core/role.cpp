#include "xdgdirs/core/role.hpp"

#include <string>

namespace xdgdirs::core {

std::string_view envVarName(Role role) {
  switch (role) {
    case Role::kConfigHome:
      return "XDG_CONFIG_HOME";
    case Role::kCacheHome:
      return "XDG_CACHE_HOME";
    case Role::kDataHome:
      return "XDG_DATA_HOME";
    case Role::kStateHome:
      return "XDG_STATE_HOME";
    case Role::kRuntimeDir:
      return "XDG_RUNTIME_DIR";
    case Role::kConfigDirs:
      return "XDG_CONFIG_DIRS";
    case Role::kDataDirs:
      return "XDG_DATA_DIRS";
  }
  return "";
}

std::string_view roleToString(Role role) {
  switch (role) {
    case Role::kConfigHome:
      return "config";
    case Role::kCacheHome:
      return "cache";
    case Role::kDataHome:
      return "data";
    case Role::kStateHome:
      return "state";
    case Role::kRuntimeDir:
      return "runtime";
    case Role::kConfigDirs:
      return "config-dirs";
    case Role::kDataDirs:
      return "data-dirs";
  }
  return "unknown";
}

Result<Role> roleFromString(std::string_view name) {
  for (auto role : kAllRoles) {
    if (roleToString(role) == name) {
      return role;
    }
  }
  return makeErrorResult<Role>(ErrorCode::kInvalidArgument,
                               "Unknown role: " + std::string(name));
}

bool isSearchPathRole(Role role) {
  return role == Role::kConfigDirs || role == Role::kDataDirs;
}

std::optional<std::string_view> defaultHomeBase(Role role) {
  switch (role) {
    case Role::kConfigHome:
      return ".config";
    case Role::kCacheHome:
      return ".cache";
    case Role::kDataHome:
      return ".local/share";
    case Role::kStateHome:
      return ".local/state";
    case Role::kRuntimeDir:
    case Role::kConfigDirs:
    case Role::kDataDirs:
      return std::nullopt;
  }
  return std::nullopt;
}

std::vector<std::string_view> defaultSearchPaths(Role role) {
  switch (role) {
    case Role::kConfigDirs:
      return {"/etc/xdg"};
    case Role::kDataDirs:
      return {"/usr/local/share/", "/usr/share/"};
    default:
      return {};
  }
}

}  // namespace xdgdirs::core
