#include "noted/store/memory_note_repository.hpp"

#include <algorithm>

namespace noted::store {

namespace {

Error notFound(const std::string& id) {
  return makeError(ErrorCode::kNotFound, "Note not found: " + id);
}

}  // namespace

Result<std::vector<noted::core::Note>> MemoryNoteRepository::list() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<noted::core::Note> notes;
  notes.reserve(notes_.size());
  for (const auto& [id, note] : notes_) {
    notes.push_back(note);
  }

  std::stable_sort(notes.begin(), notes.end(),
                   [](const noted::core::Note& a, const noted::core::Note& b) {
                     return a.created_at < b.created_at;
                   });
  return notes;
}

Result<noted::core::Note> MemoryNoteRepository::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = notes_.find(id);
  if (it == notes_.end()) {
    return std::unexpected(notFound(id));
  }
  return it->second;
}

Result<noted::core::Note> MemoryNoteRepository::create(const noted::core::NewNote& note) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto [it, inserted] = notes_.emplace(note.id, note.toNote());
  if (!inserted) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "UNIQUE constraint failed: note.id"));
  }
  return it->second;
}

Result<noted::core::Note> MemoryNoteRepository::update(const std::string& id,
                                                       const noted::core::UpdateNote& note) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = notes_.find(id);
  if (it == notes_.end()) {
    return std::unexpected(notFound(id));
  }
  it->second.apply(note);
  return it->second;
}

Result<noted::core::Note> MemoryNoteRepository::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = notes_.find(id);
  if (it == notes_.end()) {
    return std::unexpected(notFound(id));
  }
  auto note = std::move(it->second);
  notes_.erase(it);
  return note;
}

size_t MemoryNoteRepository::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notes_.size();
}

}  // namespace noted::store
