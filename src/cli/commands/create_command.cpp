#include "xdgdirs/cli/commands/create_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace xdgdirs::cli {

CreateCommand::CreateCommand(Application& app) : app_(app) {}

void CreateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("app", app_name_, "Application name (default: default_app from config)");
  cmd->add_option("-r,--role", roles_,
                  "Role to create: config, cache, data, state, runtime (repeatable)");
}

Result<int> CreateCommand::execute(const GlobalOptions& options) {
  auto app_name = app_.resolveAppName(app_name_);
  if (!app_name.has_value()) {
    return std::unexpected(app_name.error());
  }

  std::vector<core::Role> roles = app_.config().create_roles;
  if (!roles_.empty()) {
    auto parsed = parseRoleNames(roles_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    roles = std::move(*parsed);
  }

  for (auto role : roles) {
    if (core::isSearchPathRole(role)) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
          "Cannot create search-path role: " + std::string(core::roleToString(role))));
    }
  }

  const auto resolver = app_.resolver(*app_name);
  nlohmann::ordered_json created = nlohmann::ordered_json::object();
  std::vector<std::string> skipped;

  for (auto role : roles) {
    const auto role_name = std::string(core::roleToString(role));
    auto dir = resolver.resolveHome(role);
    if (dir.empty()) {
      spdlog::warn("{} directory of {} cannot be resolved, skipping", role_name, *app_name);
      skipped.push_back(role_name);
      continue;
    }

    auto result = dir.create();
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    created[role_name] = dir.string();

    if (!app_.jsonOutput() && !options.quiet) {
      std::cout << role_name << "\t" << dir << "\n";
    }
  }

  if (app_.jsonOutput()) {
    nlohmann::ordered_json output;
    output["app"] = *app_name;
    output["created"] = created;
    output["skipped"] = skipped;
    std::cout << output.dump(2) << std::endl;
  }
  return 0;
}

} // namespace xdgdirs::cli
