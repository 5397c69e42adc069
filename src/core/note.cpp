#include "noted/core/note.hpp"

namespace noted::core {

void Note::apply(const UpdateNote& update) {
  title = update.title;
  content = update.content;
}

Note NewNote::toNote() const {
  return Note{id, title, content, created_at};
}

}  // namespace noted::core
