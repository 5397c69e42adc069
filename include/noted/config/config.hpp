#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "noted/common.hpp"

namespace noted::config {

// Configuration for the noted server.
// Precedence: defaults < TOML file < environment < command line.
class Config {
 public:
  Config() = default;

  // HTTP listener
  struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8081;
    unsigned threads = 0;                 // 0 = hardware concurrency
    size_t body_limit = 1024 * 1024;      // bytes
    int read_timeout_seconds = 60;
  };
  ServerConfig server;

  // SQLite store
  struct DatabaseConfig {
    std::filesystem::path path = "./notes.db";
    size_t pool_size = 4;
    int busy_timeout_ms = 5000;
    int acquire_timeout_ms = 5000;
    std::string journal_mode = "WAL";
    bool create_schema = true;
  };
  DatabaseConfig database;

  struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
  };
  LoggingConfig logging;

  // Environment lookup, replaceable in tests
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Load configuration from TOML text
  Result<void> loadFromString(std::string_view toml_text);

  // Apply NOTED_* environment overrides
  Result<void> applyEnvironment(const EnvLookup& lookup = processEnvironment());

  // Validate configuration
  Result<void> validate() const;

  // Path of the file this config was loaded from, empty if none
  const std::filesystem::path& sourcePath() const { return config_path_; }

  // Default configuration file path (./noted.toml)
  static std::filesystem::path defaultConfigPath();

  // std::getenv wrapper
  static EnvLookup processEnvironment();

  // Environment variable resolution for "env:VARNAME" values
  static std::string resolveEnvVar(const std::string& value, const EnvLookup& lookup);

 private:
  std::filesystem::path config_path_;
};

}  // namespace noted::config
