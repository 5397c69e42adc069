#include "noted/http/api_types.hpp"

namespace noted::http {

namespace {

Result<std::string> requireString(const nlohmann::json& object, const char* field) {
  auto it = object.find(field);
  if (it == object.end()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     std::string("missing field `") + field + "`"));
  }
  if (!it->is_string()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     std::string("field `") + field + "` must be a string"));
  }
  return it->get<std::string>();
}

}  // namespace

Result<NoteRequest> parseNoteRequest(std::string_view body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(makeError(ErrorCode::kParseError, "request body is not valid JSON"));
  }

  if (!parsed.is_object()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "request body must be a JSON object"));
  }

  auto title = requireString(parsed, "title");
  if (!title.has_value()) {
    return std::unexpected(title.error());
  }

  auto content = requireString(parsed, "content");
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  return NoteRequest{std::move(*title), std::move(*content)};
}

nlohmann::json noteToJson(const noted::core::Note& note) {
  return {
    {"id", note.id},
    {"title", note.title},
    {"content", note.content},
    {"createdAt", note.created_at}
  };
}

nlohmann::json singleNoteBody(const noted::core::Note& note) {
  nlohmann::json body;
  body["note"] = noteToJson(note);
  return body;
}

nlohmann::json noteListBody(const std::vector<noted::core::Note>& notes) {
  nlohmann::json notes_array = nlohmann::json::array();
  for (const auto& note : notes) {
    notes_array.push_back(noteToJson(note));
  }

  nlohmann::json body;
  body["notes"] = notes_array;
  return body;
}

nlohmann::json messageBody(std::string_view message) {
  nlohmann::json body;
  body["message"] = message;
  return body;
}

nlohmann::json errorBody(std::string_view message, std::string_view error) {
  nlohmann::json body;
  body["message"] = message;
  body["error"] = error;
  return body;
}

}  // namespace noted::http
