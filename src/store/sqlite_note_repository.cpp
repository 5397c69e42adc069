#include "noted/store/sqlite_note_repository.hpp"

#include <spdlog/spdlog.h>

namespace noted::store {

// SQL schemas and queries
namespace sql {

constexpr const char* kCreateNoteTable = R"(
CREATE TABLE IF NOT EXISTS note (
  id TEXT PRIMARY KEY,
  title TEXT NOT NULL,
  content TEXT NOT NULL,
  created_at TEXT NOT NULL
)
)";

constexpr const char* kListNotes = R"(
SELECT id, title, content, created_at FROM note
ORDER BY created_at, id
)";

constexpr const char* kGetNote = R"(
SELECT id, title, content, created_at FROM note WHERE id = ?
)";

constexpr const char* kInsertNote = R"(
INSERT INTO note (id, title, content, created_at) VALUES (?, ?, ?, ?)
RETURNING id, title, content, created_at
)";

constexpr const char* kUpdateNote = R"(
UPDATE note SET title = ?, content = ? WHERE id = ?
RETURNING id, title, content, created_at
)";

constexpr const char* kDeleteNote = R"(
DELETE FROM note WHERE id = ?
RETURNING id, title, content, created_at
)";

}  // namespace sql

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Result<StatementPtr> prepare(sqlite3* db, const char* query) {
  sqlite3_stmt* stmt = nullptr;
  int result = sqlite3_prepare_v2(db, query, -1, &stmt, nullptr);
  if (result != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return std::unexpected(makeSqliteError(db, "Failed to prepare statement"));
  }
  return StatementPtr(stmt, &sqlite3_finalize);
}

Result<void> bindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
  int result = sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError(db, "Failed to bind parameter"));
  }
  return {};
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  if (!text) {
    return "";
  }
  return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

}  // namespace

SqliteNoteRepository::SqliteNoteRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Result<void> SqliteNoteRepository::ensureSchema() {
  return pool_->execute(sql::kCreateNoteTable);
}

Result<std::vector<noted::core::Note>> SqliteNoteRepository::list() {
  auto lease = pool_->acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }
  sqlite3* db = lease->get();

  auto stmt = prepare(db, sql::kListNotes);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  std::vector<noted::core::Note> notes;
  while (true) {
    int result = sqlite3_step(stmt->get());
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError(db, "List notes query failed"));
    }
    notes.push_back(extractNote(stmt->get()));
  }

  return notes;
}

Result<noted::core::Note> SqliteNoteRepository::get(const std::string& id) {
  auto lease = pool_->acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }
  sqlite3* db = lease->get();

  auto stmt = prepare(db, sql::kGetNote);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = bindText(db, stmt->get(), 1, id);
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  return fetchSingle(db, stmt->get(), "Get note", id);
}

Result<noted::core::Note> SqliteNoteRepository::create(const noted::core::NewNote& note) {
  auto lease = pool_->acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }
  sqlite3* db = lease->get();

  auto stmt = prepare(db, sql::kInsertNote);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  const std::string* params[] = {&note.id, &note.title, &note.content, &note.created_at};
  for (int i = 0; i < 4; ++i) {
    auto bind_result = bindText(db, stmt->get(), i + 1, *params[i]);
    if (!bind_result.has_value()) {
      return std::unexpected(bind_result.error());
    }
  }

  auto created = fetchSingle(db, stmt->get(), "Insert note", note.id);
  if (!created.has_value() && created.error().code() == ErrorCode::kNotFound) {
    // An INSERT ... RETURNING that yields nothing is a driver fault, not a missing row
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Insert note returned no row"));
  }
  return created;
}

Result<noted::core::Note> SqliteNoteRepository::update(const std::string& id,
                                                       const noted::core::UpdateNote& note) {
  auto lease = pool_->acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }
  sqlite3* db = lease->get();

  auto stmt = prepare(db, sql::kUpdateNote);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  const std::string* params[] = {&note.title, &note.content, &id};
  for (int i = 0; i < 3; ++i) {
    auto bind_result = bindText(db, stmt->get(), i + 1, *params[i]);
    if (!bind_result.has_value()) {
      return std::unexpected(bind_result.error());
    }
  }

  return fetchSingle(db, stmt->get(), "Update note", id);
}

Result<noted::core::Note> SqliteNoteRepository::remove(const std::string& id) {
  auto lease = pool_->acquire();
  if (!lease.has_value()) {
    return std::unexpected(lease.error());
  }
  sqlite3* db = lease->get();

  auto stmt = prepare(db, sql::kDeleteNote);
  if (!stmt.has_value()) {
    return std::unexpected(stmt.error());
  }

  auto bind_result = bindText(db, stmt->get(), 1, id);
  if (!bind_result.has_value()) {
    return std::unexpected(bind_result.error());
  }

  return fetchSingle(db, stmt->get(), "Delete note", id);
}

Result<noted::core::Note> SqliteNoteRepository::fetchSingle(sqlite3* db, sqlite3_stmt* stmt,
                                                            const std::string& operation,
                                                            const std::string& id) {
  int result = sqlite3_step(stmt);
  if (result == SQLITE_DONE) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "Note not found: " + id));
  }
  if (result != SQLITE_ROW) {
    return std::unexpected(makeSqliteError(db, operation + " failed"));
  }

  auto note = extractNote(stmt);

  // Run the statement to completion so a RETURNING write is fully applied
  result = sqlite3_step(stmt);
  if (result != SQLITE_DONE) {
    return std::unexpected(makeSqliteError(db, operation + " failed"));
  }

  spdlog::trace("{} {}", operation, id);
  return note;
}

noted::core::Note SqliteNoteRepository::extractNote(sqlite3_stmt* stmt) {
  return noted::core::Note{
    columnText(stmt, 0),
    columnText(stmt, 1),
    columnText(stmt, 2),
    columnText(stmt, 3),
  };
}

}  // namespace noted::store
