#include "noted/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

#include <toml++/toml.hpp>

#include "noted/util/logging.hpp"

namespace noted::config {

namespace {

// Environment variable names
constexpr const char* kEnvLogLevel = "NOTED_LOG";
constexpr const char* kEnvDatabase = "NOTED_DATABASE";
constexpr const char* kEnvAddress = "NOTED_ADDRESS";
constexpr const char* kEnvPort = "NOTED_PORT";

constexpr std::string_view kJournalModes[] = {
  "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"
};

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

Result<uint16_t> toPort(int64_t value, const std::string& source) {
  if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid port from " + source + ": " + std::to_string(value)));
  }
  return static_cast<uint16_t>(value);
}

Result<int64_t> nonNegative(int64_t value, const std::string& key) {
  if (value < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     key + " must not be negative"));
  }
  return value;
}

Result<void> applyTable(Config& config, const toml::table& config_data) {
  // [server]
  if (auto server = config_data["server"].as_table()) {
    if (auto value = (*server)["address"].value<std::string>()) {
      config.server.address = *value;
    }
    if (auto value = (*server)["port"].value<int64_t>()) {
      auto port = toPort(*value, "server.port");
      if (!port.has_value()) {
        return std::unexpected(port.error());
      }
      config.server.port = *port;
    }
    if (auto value = (*server)["threads"].value<int64_t>()) {
      auto threads = nonNegative(*value, "server.threads");
      if (!threads.has_value()) {
        return std::unexpected(threads.error());
      }
      config.server.threads = static_cast<unsigned>(*threads);
    }
    if (auto value = (*server)["body_limit"].value<int64_t>()) {
      auto limit = nonNegative(*value, "server.body_limit");
      if (!limit.has_value()) {
        return std::unexpected(limit.error());
      }
      config.server.body_limit = static_cast<size_t>(*limit);
    }
    if (auto value = (*server)["read_timeout_seconds"].value<int64_t>()) {
      config.server.read_timeout_seconds = static_cast<int>(*value);
    }
  }

  // [database]
  if (auto database = config_data["database"].as_table()) {
    if (auto value = (*database)["path"].value<std::string>()) {
      config.database.path = Config::resolveEnvVar(*value, Config::processEnvironment());
    }
    if (auto value = (*database)["pool_size"].value<int64_t>()) {
      auto size = nonNegative(*value, "database.pool_size");
      if (!size.has_value()) {
        return std::unexpected(size.error());
      }
      config.database.pool_size = static_cast<size_t>(*size);
    }
    if (auto value = (*database)["busy_timeout_ms"].value<int64_t>()) {
      config.database.busy_timeout_ms = static_cast<int>(*value);
    }
    if (auto value = (*database)["acquire_timeout_ms"].value<int64_t>()) {
      config.database.acquire_timeout_ms = static_cast<int>(*value);
    }
    if (auto value = (*database)["journal_mode"].value<std::string>()) {
      config.database.journal_mode = toUpper(*value);
    }
    if (auto value = (*database)["create_schema"].value<bool>()) {
      config.database.create_schema = *value;
    }
  }

  // [logging]
  if (auto logging = config_data["logging"].as_table()) {
    if (auto value = (*logging)["level"].value<std::string>()) {
      config.logging.level = *value;
    }
    if (auto value = (*logging)["file"].value<std::string>()) {
      config.logging.file = *value;
    }
  }

  return {};
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    auto result = applyTable(*this, config_data);
    if (!result.has_value()) {
      return result;
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error in " + config_path.string() + ": " +
                                     std::string(e.description())));
  }

  config_path_ = config_path;
  return {};
}

Result<void> Config::loadFromString(std::string_view toml_text) {
  try {
    auto config_data = toml::parse(toml_text);
    return applyTable(*this, config_data);
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.description())));
  }
}

Result<void> Config::applyEnvironment(const EnvLookup& lookup) {
  if (auto value = lookup(kEnvLogLevel)) {
    logging.level = *value;
  }
  if (auto value = lookup(kEnvDatabase)) {
    database.path = *value;
  }
  if (auto value = lookup(kEnvAddress)) {
    server.address = *value;
  }
  if (auto value = lookup(kEnvPort)) {
    int64_t port = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), port);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       std::string("Invalid ") + kEnvPort + ": " + *value));
    }
    auto checked = toPort(port, kEnvPort);
    if (!checked.has_value()) {
      return std::unexpected(checked.error());
    }
    server.port = *checked;
  }
  return {};
}

Result<void> Config::validate() const {
  if (server.port == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid port: 0"));
  }

  if (server.address.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Listen address is empty"));
  }

  if (server.read_timeout_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "server.read_timeout_seconds must be positive"));
  }

  if (database.path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Database path is empty"));
  }

  if (database.pool_size == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "database.pool_size must be at least 1"));
  }

  if (database.busy_timeout_ms < 0 || database.acquire_timeout_ms < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Database timeouts must not be negative"));
  }

  auto mode = toUpper(database.journal_mode);
  if (std::find(std::begin(kJournalModes), std::end(kJournalModes), mode) ==
      std::end(kJournalModes)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid journal mode: " + database.journal_mode));
  }

  auto level = noted::util::parseLogLevel(logging.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return std::filesystem::path("noted.toml");
}

Config::EnvLookup Config::processEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

std::string Config::resolveEnvVar(const std::string& value, const EnvLookup& lookup) {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    return lookup(var_name).value_or("");
  }
  return value;
}

}  // namespace noted::config
