#include "xdgdirs/cli/commands/env_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "xdgdirs/util/search_path.hpp"

namespace xdgdirs::cli {

std::string shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

EnvCommand::EnvCommand(Application& app) : app_(app) {}

void EnvCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("app", app_name_, "Application name (default: default_app from config)");
  cmd->add_flag("--export", export_, "Prefix each line with 'export'");
}

Result<int> EnvCommand::execute(const GlobalOptions& options) {
  auto app_name = app_.resolveAppName(app_name_);
  if (!app_name.has_value()) {
    return std::unexpected(app_name.error());
  }

  const auto resolver = app_.resolver(*app_name);

  // Variable name -> value, skipping roles that did not resolve
  std::vector<std::pair<std::string, std::string>> assignments;
  for (auto role : core::kAllRoles) {
    std::string value;
    if (core::isSearchPathRole(role)) {
      std::vector<std::string> entries;
      for (const auto& dir : resolver.resolveSearchPaths(role)) {
        entries.push_back(dir.string());
      }
      value = util::joinList(entries);
    } else {
      value = resolver.resolveHome(role).string();
    }
    if (!value.empty()) {
      assignments.emplace_back(std::string(core::envVarName(role)), value);
    }
  }

  if (app_.jsonOutput()) {
    nlohmann::ordered_json output = nlohmann::ordered_json::object();
    for (const auto& [var, value] : assignments) {
      output[var] = value;
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (options.quiet) {
    return 0;
  }

  for (const auto& [var, value] : assignments) {
    if (export_) std::cout << "export ";
    std::cout << var << "=" << shellQuote(value) << "\n";
  }
  return 0;
}

} // namespace xdgdirs::cli
