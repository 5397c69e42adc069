#include "noted/app/application.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "noted/http/request_handler.hpp"
#include "noted/http/server.hpp"
#include "noted/service/note_service.hpp"
#include "noted/store/connection_pool.hpp"
#include "noted/store/sqlite_note_repository.hpp"
#include "noted/util/logging.hpp"

namespace noted::app {

Application::Application() : app_("noted - notes CRUD service over HTTP", "noted") {
  setupCommandLine();
}

void Application::setupCommandLine() {
  app_.set_version_flag("--version", noted::getVersion().toString());

  app_.add_option("-c,--config", options_.config_file, "Path to TOML config file");
  app_.add_option("-p,--port", options_.port, "Port to listen on");
  app_.add_option("--address", options_.address, "Address to bind");
  app_.add_option("--db", options_.database, "Path to the SQLite database file");
  app_.add_option("--threads", options_.threads, "I/O threads (0 = hardware concurrency)");
  app_.add_option("--log-level", options_.log_level,
                  "trace, debug, info, warn, error, critical or off");
  app_.add_option("--log-file", options_.log_file, "Also log to this rotating file");
  app_.add_flag("--no-create-schema", options_.no_create_schema,
                "Do not create the note table at startup");

  app_.footer(R"(Environment:
  NOTED_ADDRESS    Address to bind
  NOTED_PORT       Port to listen on
  NOTED_DATABASE   Path to the SQLite database file
  NOTED_LOG        Log level)");
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  }

  auto config = resolveConfig(options_, noted::config::Config::processEnvironment());
  if (!config.has_value()) {
    spdlog::error("Invalid configuration: {}", config.error().message());
    return 1;
  }

  noted::util::LoggingOptions logging;
  logging.level = config->logging.level;
  logging.file = config->logging.file;
  auto logging_result = noted::util::initializeLogging(logging);
  if (!logging_result.has_value()) {
    spdlog::error("Failed to initialize logging: {}", logging_result.error().message());
    return 1;
  }

  auto served = serve(*config);
  if (!served.has_value()) {
    spdlog::critical("{}", served.error().describe());
    spdlog::shutdown();
    return 1;
  }

  spdlog::info("Shut down cleanly");
  spdlog::shutdown();
  return 0;
}

Result<noted::config::Config> Application::resolveConfig(
    const CommandLineOptions& options,
    const noted::config::Config::EnvLookup& lookup) {
  noted::config::Config config;

  std::filesystem::path config_path;
  if (options.config_file.has_value()) {
    config_path = *options.config_file;
    if (!std::filesystem::exists(config_path)) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Config file not found: " + config_path.string()));
    }
  } else if (std::filesystem::exists(noted::config::Config::defaultConfigPath())) {
    config_path = noted::config::Config::defaultConfigPath();
  }

  if (!config_path.empty()) {
    auto loaded = config.load(config_path);
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  }

  auto env = config.applyEnvironment(lookup);
  if (!env.has_value()) {
    return std::unexpected(env.error());
  }

  if (options.port) config.server.port = *options.port;
  if (options.address) config.server.address = *options.address;
  if (options.database) config.database.path = *options.database;
  if (options.threads) config.server.threads = *options.threads;
  if (options.log_level) config.logging.level = *options.log_level;
  if (options.log_file) config.logging.file = *options.log_file;
  if (options.no_create_schema) config.database.create_schema = false;

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<void> Application::serve(const noted::config::Config& config) {
  spdlog::info("noted {} starting", noted::getVersion().toString());
  if (!config.sourcePath().empty()) {
    spdlog::info("Configuration loaded from {}", config.sourcePath().string());
  }
  spdlog::info("Database {} (pool {}, journal {})", config.database.path.string(),
               config.database.pool_size, config.database.journal_mode);

  noted::store::ConnectionPool::Options pool_options;
  pool_options.path = config.database.path;
  pool_options.size = config.database.pool_size;
  pool_options.busy_timeout = std::chrono::milliseconds(config.database.busy_timeout_ms);
  pool_options.acquire_timeout = std::chrono::milliseconds(config.database.acquire_timeout_ms);
  pool_options.journal_mode = config.database.journal_mode;

  auto pool = noted::store::ConnectionPool::create(pool_options);
  if (!pool.has_value()) {
    return std::unexpected(pool.error());
  }

  auto repository = std::make_shared<noted::store::SqliteNoteRepository>(*pool);
  if (config.database.create_schema) {
    auto schema = repository->ensureSchema();
    if (!schema.has_value()) {
      return std::unexpected(schema.error());
    }
  }

  auto service = std::make_shared<noted::service::NoteServiceImpl>(repository);
  auto handler = std::make_shared<const noted::http::RequestHandler>(service);

  unsigned threads = config.server.threads;
  if (threads == 0) {
    threads = std::max(1u, std::thread::hardware_concurrency());
  }

  boost::asio::io_context io_context(static_cast<int>(threads));

  noted::http::HttpServer::Options server_options;
  server_options.address = config.server.address;
  server_options.port = config.server.port;
  server_options.body_limit = config.server.body_limit;
  server_options.read_timeout = std::chrono::seconds(config.server.read_timeout_seconds);
  server_options.handler_threads = config.database.pool_size;

  noted::http::HttpServer server(io_context, handler, server_options);
  auto endpoint = server.listen();
  if (!endpoint.has_value()) {
    return std::unexpected(endpoint.error());
  }
  spdlog::info("Listening on {}:{} with {} I/O threads",
               endpoint->address().to_string(), endpoint->port(), threads);

  boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    spdlog::info("Received signal {}, shutting down", signal_number);
    server.stop();
    io_context.stop();
  });

  server.start();

  std::vector<std::thread> workers;
  workers.reserve(threads - 1);
  for (unsigned i = 1; i < threads; ++i) {
    workers.emplace_back([&io_context] { io_context.run(); });
  }
  io_context.run();

  for (auto& worker : workers) {
    worker.join();
  }
  return {};
}

}  // namespace noted::app
