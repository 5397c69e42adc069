#include "noted/store/connection_pool.hpp"

#include <spdlog/spdlog.h>

namespace noted::store {

Error makeSqliteError(sqlite3* db, const std::string& operation) {
  std::string message = operation;
  if (db) {
    message += ": " + std::string(sqlite3_errmsg(db));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

ConnectionPool::Lease::~Lease() {
  release();
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), db_(other.db_) {
  other.pool_ = nullptr;
  other.db_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    db_ = other.db_;
    other.pool_ = nullptr;
    other.db_ = nullptr;
  }
  return *this;
}

void ConnectionPool::Lease::release() noexcept {
  if (pool_ && db_) {
    pool_->giveBack(db_);
  }
  pool_ = nullptr;
  db_ = nullptr;
}

Result<std::shared_ptr<ConnectionPool>> ConnectionPool::create(const Options& options) {
  if (options.size == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Connection pool size must be at least 1"));
  }

  std::shared_ptr<ConnectionPool> pool(new ConnectionPool(options));
  auto open_result = pool->open();
  if (!open_result.has_value()) {
    return std::unexpected(open_result.error());
  }

  spdlog::debug("Opened {} SQLite connections to {}", pool->size(), options.path.string());
  return pool;
}

ConnectionPool::ConnectionPool(Options options) : options_(std::move(options)) {}

ConnectionPool::~ConnectionPool() {
  for (auto* db : connections_) {
    sqlite3_close_v2(db);
  }
}

Result<void> ConnectionPool::open() {
  // Ensure parent directory exists
  auto parent = options_.path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                       "Failed to create database directory: " + ec.message()));
    }
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI |
                    SQLITE_OPEN_NOMUTEX;

  for (size_t i = 0; i < options_.size; ++i) {
    sqlite3* db = nullptr;
    int result = sqlite3_open_v2(options_.path.c_str(), &db, flags, nullptr);
    if (result != SQLITE_OK) {
      auto error = makeSqliteError(db, "Failed to open database " + options_.path.string());
      sqlite3_close_v2(db);
      return std::unexpected(error);
    }
    connections_.push_back(db);

    auto configure_result = configureConnection(db);
    if (!configure_result.has_value()) {
      return configure_result;
    }
  }

  idle_ = connections_;
  return {};
}

Result<void> ConnectionPool::configureConnection(sqlite3* db) {
  int result = sqlite3_busy_timeout(db, static_cast<int>(options_.busy_timeout.count()));
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError(db, "Failed to set busy timeout"));
  }

  std::string pragmas = "PRAGMA journal_mode = " + options_.journal_mode + ";";
  if (options_.journal_mode == "WAL") {
    pragmas += "PRAGMA synchronous = NORMAL;";
  }

  result = sqlite3_exec(db, pragmas.c_str(), nullptr, nullptr, nullptr);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError(db, "Configure database pragmas"));
  }

  return {};
}

Result<ConnectionPool::Lease> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  if (!available_cv_.wait_for(lock, options_.acquire_timeout, [this] { return !idle_.empty(); })) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Timed out waiting for a database connection"));
  }

  sqlite3* db = idle_.back();
  idle_.pop_back();
  return Lease(this, db);
}

Result<void> ConnectionPool::execute(const std::string& sql) {
  auto lease = acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }

  int result = sqlite3_exec(lease->get(), sql.c_str(), nullptr, nullptr, nullptr);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError(lease->get(), "Execute statement"));
  }
  return {};
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::giveBack(sqlite3* db) noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(db);
  }
  available_cv_.notify_one();
}

}  // namespace noted::store
