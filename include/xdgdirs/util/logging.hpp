#pragma once

#include <string_view>

#include <spdlog/common.h>

#include "xdgdirs/common.hpp"

namespace xdgdirs::util {

// Install the "xdgdirs" stderr logger as spdlog's default and set its level.
// Safe to call more than once; later calls only change the level.
void setupLogging(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
Result<spdlog::level::level_enum> parseLogLevel(std::string_view name);

}  // namespace xdgdirs::util
