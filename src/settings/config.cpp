#include "xdgdirs/settings/config.hpp"

#include <toml++/toml.hpp>

#include "xdgdirs/core/resolver.hpp"
#include "xdgdirs/util/logging.hpp"

namespace xdgdirs::settings {

Result<void> Config::load(const std::filesystem::path& config_path) {
  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["default_app"].value<std::string>()) {
      default_app = *value;
    }

    if (auto value = config_data["output"].value<std::string>()) {
      auto format = stringToOutputFormat(*value);
      if (!format.has_value()) {
        return std::unexpected(format.error());
      }
      output = *format;
    }

    if (auto create_table = config_data["create"].as_table()) {
      if (auto roles = (*create_table)["roles"].as_array()) {
        std::vector<core::Role> parsed;
        for (const auto& node : *roles) {
          auto name = node.value<std::string>();
          if (!name) {
            return std::unexpected(makeError(ErrorCode::kConfigError,
                                             "create.roles must contain strings"));
          }
          auto role = core::roleFromString(*name);
          if (!role.has_value()) {
            return std::unexpected(makeError(ErrorCode::kConfigError,
                                             "create.roles: " + role.error().message()));
          }
          if (core::isSearchPathRole(*role)) {
            return std::unexpected(makeError(ErrorCode::kConfigError,
                                             "create.roles: search-path role not allowed: " + *name));
          }
          parsed.push_back(*role);
        }
        create_roles = std::move(parsed);
      }
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        auto level = util::parseLogLevel(*value);
        if (!level.has_value()) {
          return std::unexpected(level.error());
        }
        log_level = *value;
      }
    }

    config_path_ = config_path;
    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

std::filesystem::path Config::defaultConfigPath(std::shared_ptr<const core::Environment> env) {
  auto dir = core::Resolver("xdgdirs", std::move(env)).config();
  if (dir.empty()) {
    return {};
  }
  return dir.path() / "config.toml";
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText:
      return "text";
    case OutputFormat::kJson:
      return "json";
  }
  return "text";
}

Result<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown output format: " + str));
}

}  // namespace xdgdirs::settings
