#pragma once

#include <string>

namespace noted::core {

struct UpdateNote;

// A persisted note as returned by every layer
struct Note {
  std::string id;
  std::string title;
  std::string content;
  std::string created_at;  // ISO-8601 UTC

  // Replace the mutable fields; id and created_at are untouched
  void apply(const UpdateNote& update);

  bool operator==(const Note& other) const = default;
};

// Input to create. id and created_at are assigned before it reaches the service.
struct NewNote {
  std::string id;
  std::string title;
  std::string content;
  std::string created_at;

  Note toNote() const;
};

// Input to update
struct UpdateNote {
  std::string title;
  std::string content;
};

}  // namespace noted::core
