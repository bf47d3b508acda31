#include "xdgdirs/common.hpp"

#include <sstream>

namespace xdgdirs {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef XDGDIRS_VERSION_MAJOR
  return Version{XDGDIRS_VERSION_MAJOR, XDGDIRS_VERSION_MINOR, XDGDIRS_VERSION_PATCH, ""};
#else
  // Fallback when built without version definitions
  return Version{0, 1, 0, "unknown"};
#endif
}

}  // namespace xdgdirs
