#pragma once

#include <sqlite3.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "noted/common.hpp"

namespace noted::store {

// Fixed-size pool of SQLite connections to one database file.
// Shared by all request handlers for the lifetime of the process.
class ConnectionPool {
 public:
  struct Options {
    std::filesystem::path path;
    size_t size = 4;
    std::chrono::milliseconds busy_timeout{5000};
    std::chrono::milliseconds acquire_timeout{5000};
    std::string journal_mode = "WAL";
  };

  // A connection checked out of the pool; returned on destruction
  class Lease {
   public:
    Lease(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    sqlite3* get() const noexcept { return db_; }

   private:
    void release() noexcept;

    ConnectionPool* pool_ = nullptr;
    sqlite3* db_ = nullptr;
  };

  // Open every connection up front; fails if any of them cannot be opened
  static Result<std::shared_ptr<ConnectionPool>> create(const Options& options);

  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Wait up to acquire_timeout for an idle connection
  Result<Lease> acquire();

  // Run a batch of SQL statements on one connection
  Result<void> execute(const std::string& sql);

  size_t size() const noexcept { return connections_.size(); }
  size_t available() const;
  const std::filesystem::path& path() const noexcept { return options_.path; }

 private:
  explicit ConnectionPool(Options options);

  Result<void> open();
  Result<void> configureConnection(sqlite3* db);
  void giveBack(sqlite3* db) noexcept;

  Options options_;
  std::vector<sqlite3*> connections_;  // owned
  std::vector<sqlite3*> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
};

// Error carrying sqlite3_errmsg for the given connection
Error makeSqliteError(sqlite3* db, const std::string& operation);

}  // namespace noted::store
