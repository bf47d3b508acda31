#include "xdgdirs/util/logging.hpp"

#include <array>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace xdgdirs::util {

namespace {

constexpr const char* kLoggerName = "xdgdirs";

}  // namespace

void setupLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    try {
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      spdlog::register_logger(logger);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      // Keep spdlog's built-in default logger
      spdlog::warn("Failed to setup logging: {}", e.what());
    }
  }
  spdlog::set_level(level);
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
  static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels = {{
      {"trace", spdlog::level::trace},
      {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},
      {"error", spdlog::level::err},
      {"critical", spdlog::level::critical},
      {"off", spdlog::level::off},
  }};

  for (const auto& [level_name, level] : kLevels) {
    if (level_name == name) {
      return level;
    }
  }
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown log level: " + std::string(name)));
}

}  // namespace xdgdirs::util
