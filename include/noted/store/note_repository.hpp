#pragma once

#include <string>
#include <vector>

#include "noted/common.hpp"
#include "noted/core/note.hpp"

namespace noted::store {

// Abstract interface for note storage.
//
// Implementations report a missing row as ErrorCode::kNotFound and every other
// storage fault as ErrorCode::kDatabaseError. They must be safe to call from
// many threads at once.
class NoteRepository {
 public:
  virtual ~NoteRepository() = default;

  // All notes, ordered by created_at then id
  virtual Result<std::vector<noted::core::Note>> list() = 0;

  virtual Result<noted::core::Note> get(const std::string& id) = 0;

  // Persist a fully populated note; a duplicate id is a kDatabaseError
  virtual Result<noted::core::Note> create(const noted::core::NewNote& note) = 0;

  // Returns the note as it is after the write
  virtual Result<noted::core::Note> update(const std::string& id,
                                           const noted::core::UpdateNote& note) = 0;

  // Returns the note as it was immediately before deletion
  virtual Result<noted::core::Note> remove(const std::string& id) = 0;
};

}  // namespace noted::store
