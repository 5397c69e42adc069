#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "noted/common.hpp"
#include "noted/config/config.hpp"

namespace noted::app {

// Command line overrides. Unset options leave the file/environment value.
struct CommandLineOptions {
  std::optional<std::string> config_file;            // -c,--config
  std::optional<uint16_t> port;                      // -p,--port
  std::optional<std::string> address;               // --address
  std::optional<std::string> database;               // --db
  std::optional<unsigned> threads;                   // --threads
  std::optional<std::string> log_level;              // --log-level
  std::optional<std::string> log_file;               // --log-file
  bool no_create_schema = false;                     // --no-create-schema
};

// The noted server process: parses the command line, resolves configuration,
// wires repository -> service -> HTTP handler and serves until SIGINT/SIGTERM.
class Application {
 public:
  Application();

  // Run the application with command line arguments. Returns the exit code.
  int run(int argc, char* argv[]);

  // Defaults < TOML file < environment < command line, then validation.
  // An explicit --config must exist; ./noted.toml is used only if present.
  static Result<noted::config::Config> resolveConfig(
      const CommandLineOptions& options,
      const noted::config::Config::EnvLookup& lookup);

 private:
  void setupCommandLine();

  Result<void> serve(const noted::config::Config& config);

  CLI::App app_;
  CommandLineOptions options_;
};

}  // namespace noted::app
