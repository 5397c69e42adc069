#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "noted/common.hpp"
#include "noted/core/note.hpp"

namespace noted::http {

// Body of POST /notes and PUT /notes/{id}: {"title": string, "content": string}
struct NoteRequest {
  std::string title;
  std::string content;
};

// Parse and shape-check a request body. Malformed JSON is kParseError,
// a well-formed body of the wrong shape is kInvalidArgument.
Result<NoteRequest> parseNoteRequest(std::string_view body);

// Note with camelCase field names
nlohmann::json noteToJson(const noted::core::Note& note);

// {"note": Note}
nlohmann::json singleNoteBody(const noted::core::Note& note);

// {"notes": [Note, ...]}
nlohmann::json noteListBody(const std::vector<noted::core::Note>& notes);

// {"message": ...}
nlohmann::json messageBody(std::string_view message);

// {"message": ..., "error": ...}
nlohmann::json errorBody(std::string_view message, std::string_view error);

}  // namespace noted::http
