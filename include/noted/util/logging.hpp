#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "noted/common.hpp"

namespace noted::util {

struct LoggingOptions {
  std::string level = "info";
  std::filesystem::path file;  // empty = console only
  size_t max_file_size = 1024 * 1024 * 5;
  size_t max_files = 3;
};

// Parse "trace".."critical"/"off" (case-insensitive, "warning" accepted)
Result<spdlog::level::level_enum> parseLogLevel(const std::string& level);

// Install the process-wide "noted" logger as spdlog's default logger
Result<void> initializeLogging(const LoggingOptions& options);

}  // namespace noted::util
