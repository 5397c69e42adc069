#pragma once

#include <sqlite3.h>

#include <memory>

#include "noted/store/connection_pool.hpp"
#include "noted/store/note_repository.hpp"

namespace noted::store {

// NoteRepository over the `note` table of a SQLite database.
// Mutations are single statements with a RETURNING clause; "no row returned"
// is the not-found signal.
class SqliteNoteRepository : public NoteRepository {
 public:
  explicit SqliteNoteRepository(std::shared_ptr<ConnectionPool> pool);

  // CREATE TABLE IF NOT EXISTS note (...)
  Result<void> ensureSchema();

  Result<std::vector<noted::core::Note>> list() override;
  Result<noted::core::Note> get(const std::string& id) override;
  Result<noted::core::Note> create(const noted::core::NewNote& note) override;
  Result<noted::core::Note> update(const std::string& id,
                                   const noted::core::UpdateNote& note) override;
  Result<noted::core::Note> remove(const std::string& id) override;

 private:
  // Step a prepared statement expected to return at most one note row
  Result<noted::core::Note> fetchSingle(sqlite3* db, sqlite3_stmt* stmt,
                                        const std::string& operation,
                                        const std::string& id);

  static noted::core::Note extractNote(sqlite3_stmt* stmt);

  std::shared_ptr<ConnectionPool> pool_;
};

}  // namespace noted::store
