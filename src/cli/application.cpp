#include "xdgdirs/cli/application.hpp"

#include <iostream>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "xdgdirs/util/logging.hpp"

// Command includes
#include "xdgdirs/cli/commands/show_command.hpp"
#include "xdgdirs/cli/commands/env_command.hpp"
#include "xdgdirs/cli/commands/create_command.hpp"

namespace xdgdirs::cli {

Result<std::vector<core::Role>> parseRoleNames(const std::vector<std::string>& names) {
  if (names.empty()) {
    return std::vector<core::Role>(core::kAllRoles.begin(), core::kAllRoles.end());
  }

  std::vector<core::Role> roles;
  for (const auto& name : names) {
    auto role = core::roleFromString(name);
    if (!role.has_value()) {
      return std::unexpected(role.error());
    }
    roles.push_back(*role);
  }
  return roles;
}

Application::Application()
    : Application(core::ProcessEnvironment::instance()) {}

Application::Application(std::shared_ptr<const core::Environment> env)
    : app_("xdgdirs", "Resolve XDG base directories for an application")
    , env_(std::move(env))
    , initialized_(false) {

  app_.set_version_flag("--version", xdgdirs::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose (debug) logging");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ShowCommand>(*this));
  registerCommand(std::make_unique<EnvCommand>(*this));
  registerCommand(std::make_unique<CreateCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Roles:
  config, cache, data, state, runtime, config-dirs, data-dirs

Examples:
  xdgdirs show myapp
  xdgdirs show myapp --role config --role data-dirs --json
  xdgdirs env myapp
  xdgdirs create myapp --role cache

For more information on a specific command, run:
  xdgdirs <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initialize();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initialize() {
  if (initialized_) {
    return {};
  }

  const bool explicit_config = !global_options_.config_file.empty();
  std::filesystem::path config_path = explicit_config
      ? std::filesystem::path(global_options_.config_file)
      : settings::Config::defaultConfigPath(env_);

  if (!config_path.empty()) {
    auto load_result = config_.load(config_path);
    if (!load_result.has_value()) {
      // A missing default config is normal; anything else is reported
      if (explicit_config || load_result.error().code() != ErrorCode::kFileNotFound) {
        return std::unexpected(load_result.error());
      }
    }
  }

  auto level = util::parseLogLevel(config_.log_level).value_or(spdlog::level::warn);
  if (global_options_.verbose > 0) {
    level = spdlog::level::debug;
  } else if (global_options_.quiet) {
    level = spdlog::level::err;
  }
  util::setupLogging(level);

  if (!config_.configPath().empty()) {
    spdlog::debug("Loaded config from {}", config_.configPath().string());
  }

  initialized_ = true;
  return {};
}

void Application::printError(const Error& error) const {
  if (jsonOutput()) {
    nlohmann::json error_json;
    error_json["error"] = error.message();
    error_json["code"] = static_cast<int>(error.code());
    std::cout << error_json.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

const settings::Config& Application::config() const {
  return config_;
}

Result<std::string> Application::resolveAppName(const std::string& requested) const {
  if (!requested.empty()) {
    return requested;
  }
  if (!config_.default_app.empty()) {
    return config_.default_app;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "No application name given and no default_app configured"));
}

core::Resolver Application::resolver(const std::string& app_name) const {
  return core::Resolver(app_name, env_);
}

bool Application::jsonOutput() const {
  return global_options_.json || config_.output == settings::Config::OutputFormat::kJson;
}

} // namespace xdgdirs::cli
