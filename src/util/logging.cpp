#include "noted/util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace noted::util {

Result<spdlog::level::level_enum> parseLogLevel(const std::string& level) {
  std::string lower = level;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace") return spdlog::level::trace;
  if (lower == "debug") return spdlog::level::debug;
  if (lower == "info") return spdlog::level::info;
  if (lower == "warn" || lower == "warning") return spdlog::level::warn;
  if (lower == "error") return spdlog::level::err;
  if (lower == "critical") return spdlog::level::critical;
  if (lower == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown log level: " + level));
}

Result<void> initializeLogging(const LoggingOptions& options) {
  auto level = parseLogLevel(options.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.file.empty()) {
      auto parent = options.file.parent_path();
      if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "Failed to create log directory: " + ec.message()));
        }
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), options.max_file_size, options.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("noted", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(*level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to set up logging: " + std::string(e.what())));
  }

  return {};
}

}  // namespace noted::util
