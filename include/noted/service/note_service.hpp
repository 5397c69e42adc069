#pragma once

#include <memory>
#include <string>
#include <vector>

#include "noted/common.hpp"
#include "noted/core/note.hpp"
#include "noted/store/note_repository.hpp"

namespace noted::service {

// Domain operations on notes, one-for-one with the repository
class NoteService {
 public:
  virtual ~NoteService() = default;

  virtual Result<std::vector<noted::core::Note>> list() = 0;
  virtual Result<noted::core::Note> get(const std::string& id) = 0;
  virtual Result<noted::core::Note> create(const noted::core::NewNote& note) = 0;
  virtual Result<noted::core::Note> update(const std::string& id,
                                           const noted::core::UpdateNote& note) = 0;
  virtual Result<noted::core::Note> remove(const std::string& id) = 0;
};

// Validates create/update input, then delegates to the repository.
// Title must be non-empty; it is not trimmed, so "   " is accepted.
class NoteServiceImpl : public NoteService {
 public:
  explicit NoteServiceImpl(std::shared_ptr<noted::store::NoteRepository> repository);

  Result<std::vector<noted::core::Note>> list() override;
  Result<noted::core::Note> get(const std::string& id) override;
  Result<noted::core::Note> create(const noted::core::NewNote& note) override;
  Result<noted::core::Note> update(const std::string& id,
                                   const noted::core::UpdateNote& note) override;
  Result<noted::core::Note> remove(const std::string& id) override;

  // Validation rules shared by create and update
  static Result<void> validateTitle(const std::string& title);

 private:
  std::shared_ptr<noted::store::NoteRepository> repository_;
};

}  // namespace noted::service
