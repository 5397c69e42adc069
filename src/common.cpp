#include "noted/common.hpp"

#include <sstream>

#ifndef NOTED_VERSION_MAJOR
#define NOTED_VERSION_MAJOR 0
#define NOTED_VERSION_MINOR 1
#define NOTED_VERSION_PATCH 0
#endif

namespace noted {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;
  return oss.str();
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
#ifdef NOTED_VERSION_BUILD
  return Version{NOTED_VERSION_MAJOR, NOTED_VERSION_MINOR, NOTED_VERSION_PATCH,
                 NOTED_VERSION_BUILD};
#else
  return Version{NOTED_VERSION_MAJOR, NOTED_VERSION_MINOR, NOTED_VERSION_PATCH, ""};
#endif
}

}  // namespace noted
