#include "xdgdirs/cli/commands/show_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "xdgdirs/util/search_path.hpp"

namespace xdgdirs::cli {

namespace {

std::vector<std::string> toStrings(const std::vector<core::Dir>& dirs) {
  std::vector<std::string> out;
  out.reserve(dirs.size());
  for (const auto& dir : dirs) {
    out.push_back(dir.string());
  }
  return out;
}

}  // namespace

ShowCommand::ShowCommand(Application& app) : app_(app) {}

void ShowCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("app", app_name_, "Application name (default: default_app from config)");
  cmd->add_option("-r,--role", roles_, "Role to show (repeatable; default: all)");
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  auto app_name = app_.resolveAppName(app_name_);
  if (!app_name.has_value()) {
    return std::unexpected(app_name.error());
  }

  auto roles = parseRoleNames(roles_);
  if (!roles.has_value()) {
    return std::unexpected(roles.error());
  }

  const auto resolver = app_.resolver(*app_name);

  if (app_.jsonOutput()) {
    nlohmann::ordered_json output;
    output["app"] = *app_name;
    for (auto role : *roles) {
      const std::string key(core::roleToString(role));
      if (core::isSearchPathRole(role)) {
        output[key] = toStrings(resolver.resolveSearchPaths(role));
      } else {
        output[key] = resolver.resolveHome(role).string();
      }
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (options.quiet) {
    return 0;
  }

  for (auto role : *roles) {
    std::cout << core::roleToString(role) << "\t";
    if (core::isSearchPathRole(role)) {
      std::cout << util::joinList(toStrings(resolver.resolveSearchPaths(role)));
    } else {
      std::cout << resolver.resolveHome(role);
    }
    std::cout << "\n";
  }
  return 0;
}

} // namespace xdgdirs::cli
