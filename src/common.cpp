#include "docsync/common.hpp"

#include <sstream>

#ifndef DOCSYNC_VERSION_MAJOR
#define DOCSYNC_VERSION_MAJOR 0
#define DOCSYNC_VERSION_MINOR 1
#define DOCSYNC_VERSION_PATCH 0
#endif

namespace docsync {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kAuthError:
      return "Authentication error";
    case ErrorCode::kRateLimited:
      return "Rate limited";
    case ErrorCode::kRemoteError:
      return "Remote error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

bool isTransportError(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNetworkError:
    case ErrorCode::kTimeout:
    case ErrorCode::kAuthError:
    case ErrorCode::kRateLimited:
    case ErrorCode::kRemoteError:
      return true;
    default:
      return false;
  }
}

bool isFilesystemError(ErrorCode code) {
  switch (code) {
    case ErrorCode::kFileNotFound:
    case ErrorCode::kFileReadError:
    case ErrorCode::kFileWriteError:
    case ErrorCode::kDirectoryCreateError:
      return true;
    default:
      return false;
  }
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
  return Version{DOCSYNC_VERSION_MAJOR, DOCSYNC_VERSION_MINOR, DOCSYNC_VERSION_PATCH, ""};
}

}  // namespace docsync
