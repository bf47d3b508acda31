#pragma once

#include <memory>
#include <string>
#include <vector>

#include "xdgdirs/core/dir.hpp"
#include "xdgdirs/core/environment.hpp"
#include "xdgdirs/core/role.hpp"

namespace xdgdirs::core {

// Every role resolved at once
struct Resolution {
  Dir config;
  Dir cache;
  Dir data;
  Dir state;
  Dir runtime;
  std::vector<Dir> config_dirs;
  std::vector<Dir> data_dirs;
};

/**
 * @brief Resolves XDG base directories for one application
 *
 * Every call reads the environment afresh; nothing is cached. Resolution
 * never fails: a location that cannot be determined comes back as an
 * empty Dir (or an empty list for search-path roles).
 */
class Resolver {
 public:
  explicit Resolver(std::string app_name,
                    std::shared_ptr<const Environment> env = ProcessEnvironment::instance());

  const std::string& appName() const { return app_name_; }

  // Single-path roles. RuntimeDir is delegated to resolveRuntime(); search-path
  // roles have no home default and yield fallbackDir().
  Dir resolveHome(Role role) const;

  // $XDG_RUNTIME_DIR/<app>, or empty when the variable is unset
  Dir resolveRuntime() const;

  // Search-path roles; empty for any other role
  std::vector<Dir> resolveSearchPaths(Role role) const;

  // $HOME/.<app>, or empty when the home directory is unknown
  Dir fallbackDir() const;

  Dir config() const { return resolveHome(Role::kConfigHome); }
  Dir cache() const { return resolveHome(Role::kCacheHome); }
  Dir data() const { return resolveHome(Role::kDataHome); }
  Dir state() const { return resolveHome(Role::kStateHome); }
  Dir runtime() const { return resolveRuntime(); }
  std::vector<Dir> configDirs() const { return resolveSearchPaths(Role::kConfigDirs); }
  std::vector<Dir> dataDirs() const { return resolveSearchPaths(Role::kDataDirs); }

  Resolution resolveAll() const;

 private:
  std::string app_name_;
  std::shared_ptr<const Environment> env_;
};

}  // namespace xdgdirs::core
