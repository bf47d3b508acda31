#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "xdgdirs/common.hpp"
#include "xdgdirs/core/environment.hpp"
#include "xdgdirs/core/role.hpp"

namespace xdgdirs::settings {

// Configuration for the xdgdirs command-line tool
class Config {
 public:
  enum class OutputFormat {
    kText,
    kJson
  };

  // Defaults only; call load() to read a file
  Config() = default;

  // Application used when none is given on the command line
  std::string default_app;

  OutputFormat output = OutputFormat::kText;

  // Roles created by `xdgdirs create` when no --role is given
  std::vector<core::Role> create_roles = {core::Role::kConfigHome, core::Role::kCacheHome,
                                          core::Role::kDataHome, core::Role::kStateHome};

  std::string log_level = "warn";

  // Load settings from a TOML file, overriding defaults for keys present.
  // kFileNotFound when the file is missing, kConfigError when it is invalid.
  Result<void> load(const std::filesystem::path& config_path);

  // Path of the file last loaded, empty if none
  const std::filesystem::path& configPath() const { return config_path_; }

  // <config home of xdgdirs>/config.toml; empty when it cannot be resolved
  static std::filesystem::path defaultConfigPath(
      std::shared_ptr<const core::Environment> env = core::ProcessEnvironment::instance());

  static std::string outputFormatToString(OutputFormat format);
  static Result<OutputFormat> stringToOutputFormat(const std::string& str);

 private:
  std::filesystem::path config_path_;
};

}  // namespace xdgdirs::settings
