#include "noted/service/note_service.hpp"

namespace noted::service {

NoteServiceImpl::NoteServiceImpl(std::shared_ptr<noted::store::NoteRepository> repository)
    : repository_(std::move(repository)) {}

Result<std::vector<noted::core::Note>> NoteServiceImpl::list() {
  return repository_->list();
}

Result<noted::core::Note> NoteServiceImpl::get(const std::string& id) {
  return repository_->get(id);
}

Result<noted::core::Note> NoteServiceImpl::create(const noted::core::NewNote& note) {
  auto valid = validateTitle(note.title);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return repository_->create(note);
}

Result<noted::core::Note> NoteServiceImpl::update(const std::string& id,
                                                  const noted::core::UpdateNote& note) {
  auto valid = validateTitle(note.title);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return repository_->update(id, note);
}

Result<noted::core::Note> NoteServiceImpl::remove(const std::string& id) {
  return repository_->remove(id);
}

Result<void> NoteServiceImpl::validateTitle(const std::string& title) {
  if (title.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "title must not be empty"));
  }
  return {};
}

}  // namespace noted::service
