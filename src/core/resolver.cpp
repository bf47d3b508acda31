#include "xdgdirs/core/resolver.hpp"

#include <spdlog/spdlog.h>

#include "xdgdirs/util/search_path.hpp"

namespace xdgdirs::core {

Resolver::Resolver(std::string app_name, std::shared_ptr<const Environment> env)
    : app_name_(std::move(app_name)), env_(std::move(env)) {}

Dir Resolver::resolveHome(Role role) const {
  if (role == Role::kRuntimeDir) {
    return resolveRuntime();
  }

  const auto var = envVarName(role);
  if (auto value = env_->lookup(var)) {
    spdlog::debug("{} set, resolving {} from environment", var, roleToString(role));
    return Dir(util::joinPath(*value, app_name_));
  }

  auto base = defaultHomeBase(role);
  if (!base) {
    spdlog::debug("{} has no home default, using fallback directory", roleToString(role));
    return fallbackDir();
  }

  auto home = env_->homeDirectory();
  if (!home) {
    spdlog::debug("Home directory unknown, {} unresolvable", roleToString(role));
    return Dir();
  }
  return Dir(util::joinPath({*home, *base, app_name_}));
}

Dir Resolver::resolveRuntime() const {
  if (auto value = env_->lookup(envVarName(Role::kRuntimeDir))) {
    return Dir(util::joinPath(*value, app_name_));
  }
  // No default exists for the runtime directory
  spdlog::debug("XDG_RUNTIME_DIR unset, runtime directory unresolvable");
  return Dir();
}

std::vector<Dir> Resolver::resolveSearchPaths(Role role) const {
  if (!isSearchPathRole(role)) {
    return {};
  }

  std::vector<std::string> entries;
  if (auto value = env_->lookup(envVarName(role))) {
    entries = util::splitList(*value);
  } else {
    for (auto entry : defaultSearchPaths(role)) {
      entries.emplace_back(entry);
    }
  }

  std::vector<Dir> dirs;
  dirs.reserve(entries.size());
  for (const auto& entry : entries) {
    dirs.emplace_back(util::joinPath(entry, app_name_));
  }
  return dirs;
}

Dir Resolver::fallbackDir() const {
  auto home = env_->homeDirectory();
  if (!home) {
    return Dir();
  }
  return Dir(util::joinPath(*home, "." + app_name_));
}

Resolution Resolver::resolveAll() const {
  return Resolution{
      .config = config(),
      .cache = cache(),
      .data = data(),
      .state = state(),
      .runtime = runtime(),
      .config_dirs = configDirs(),
      .data_dirs = dataDirs(),
  };
}

}  // namespace xdgdirs::core
