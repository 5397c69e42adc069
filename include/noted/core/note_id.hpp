#pragma once

#include <string>
#include <string_view>

#include "noted/common.hpp"

namespace noted::core {

// Random (version 4) UUID used as note identifier.
// Canonical lower-case form: xxxxxxxx-xxxx-4xxx-Yxxx-xxxxxxxxxxxx, Y in [89ab]
class NoteId {
 public:
  // Create new random UUID v4
  static NoteId generate();

  // Parse UUID v4 from string (accepts upper-case hex, normalizes to lower-case)
  static Result<NoteId> fromString(std::string_view str);

  // Check the canonical UUID v4 shape without constructing an id
  static bool isUuidV4(std::string_view str) noexcept;

  // Default constructor creates invalid ID
  NoteId() = default;

  // Get string representation
  const std::string& toString() const noexcept { return id_; }

  bool operator==(const NoteId& other) const noexcept { return id_ == other.id_; }
  bool operator!=(const NoteId& other) const noexcept { return id_ != other.id_; }

  // Check if ID is valid
  bool isValid() const noexcept;

 private:
  explicit NoteId(std::string id);

  std::string id_;
};

}  // namespace noted::core
