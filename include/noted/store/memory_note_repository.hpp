#pragma once

#include <map>
#include <mutex>

#include "noted/store/note_repository.hpp"

namespace noted::store {

// In-process NoteRepository with the same contract as the SQLite one
class MemoryNoteRepository : public NoteRepository {
 public:
  MemoryNoteRepository() = default;

  Result<std::vector<noted::core::Note>> list() override;
  Result<noted::core::Note> get(const std::string& id) override;
  Result<noted::core::Note> create(const noted::core::NewNote& note) override;
  Result<noted::core::Note> update(const std::string& id,
                                   const noted::core::UpdateNote& note) override;
  Result<noted::core::Note> remove(const std::string& id) override;

  size_t size() const;

 private:
  std::map<std::string, noted::core::Note> notes_;
  mutable std::mutex mutex_;
};

}  // namespace noted::store
