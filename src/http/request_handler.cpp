#include "noted/http/request_handler.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <optional>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <spdlog/spdlog.h>

#include "noted/core/note.hpp"
#include "noted/core/note_id.hpp"
#include "noted/http/api_error.hpp"
#include "noted/http/openapi.hpp"
#include "noted/util/time.hpp"

namespace noted::http {

namespace beast_http = boost::beast::http;

namespace {

std::string_view toStringView(boost::beast::string_view value) {
  return {value.data(), value.size()};
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::string> percentDecode(std::string_view segment) {
  std::string decoded;
  decoded.reserve(segment.size());

  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] != '%') {
      decoded += segment[i];
      continue;
    }
    if (i + 2 >= segment.size()) {
      return std::nullopt;
    }
    int high = hexValue(segment[i + 1]);
    int low = hexValue(segment[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    decoded += static_cast<char>((high << 4) | low);
    i += 2;
  }

  return decoded;
}

bool isJsonContentType(std::string_view value) {
  auto semicolon = value.find(';');
  if (semicolon != std::string_view::npos) {
    value = value.substr(0, semicolon);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }

  constexpr std::string_view kJson = "application/json";
  return value.size() == kJson.size() &&
         std::equal(value.begin(), value.end(), kJson.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == b;
         });
}

}  // namespace

std::optional<std::vector<std::string>> splitTarget(std::string_view target) {
  auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }

  if (target.empty() || target.front() != '/') {
    return std::nullopt;
  }
  target.remove_prefix(1);

  std::vector<std::string> segments;
  while (true) {
    auto slash = target.find('/');
    auto decoded = percentDecode(target.substr(0, slash));
    if (!decoded.has_value()) {
      return std::nullopt;
    }
    segments.push_back(std::move(*decoded));
    if (slash == std::string_view::npos) {
      break;
    }
    target.remove_prefix(slash + 1);
  }

  return segments;
}

RequestHandler::RequestHandler(std::shared_ptr<noted::service::NoteService> service)
    : service_(std::move(service)),
      openapi_json_(buildOpenApiDocument(getVersion()).dump()),
      server_name_("noted/" + getVersion().toString()) {}

Response RequestHandler::handle(const Request& request) const {
  auto start = std::chrono::steady_clock::now();

  Response response;
  try {
    response = dispatch(request);
  } catch (const std::exception& e) {
    spdlog::error("Unhandled exception in {} {}: {}",
                  toStringView(request.method_string()), toStringView(request.target()),
                  e.what());
    response = jsonResponse(request, beast_http::status::internal_server_error,
                            messageBody("internal error").dump());
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::info("{} {} {} {}",
               toStringView(request.method_string()), toStringView(request.target()),
               response.result_int(), noted::util::Time::formatDuration(elapsed));
  return response;
}

Response RequestHandler::dispatch(const Request& request) const {
  auto segments = splitTarget(toStringView(request.target()));
  if (!segments.has_value()) {
    return notFound(request);
  }

  const auto& path = *segments;
  const auto method = request.method();

  if (path.size() == 1 && path[0] == "notes") {
    if (method == beast_http::verb::get) return listNotes(request);
    if (method == beast_http::verb::post) return createNote(request);
    return notFound(request);
  }

  if (path.size() == 2 && path[0] == "notes" && !path[1].empty()) {
    if (method == beast_http::verb::get) return getNote(request, path[1]);
    if (method == beast_http::verb::put) return updateNote(request, path[1]);
    if (method == beast_http::verb::delete_) return deleteNote(request, path[1]);
    return notFound(request);
  }

  if (path.size() == 2 && path[0] == "api-docs" && path[1] == "openapi.json" &&
      method == beast_http::verb::get) {
    return openApi(request);
  }

  return notFound(request);
}

Response RequestHandler::listNotes(const Request& request) const {
  auto notes = service_->list();
  if (!notes.has_value()) {
    return errorResponse(request, notes.error());
  }
  return jsonResponse(request, beast_http::status::ok, noteListBody(*notes).dump());
}

Response RequestHandler::getNote(const Request& request, const std::string& id) const {
  auto note = service_->get(id);
  if (!note.has_value()) {
    return errorResponse(request, note.error());
  }
  return jsonResponse(request, beast_http::status::ok, singleNoteBody(*note).dump());
}

Response RequestHandler::createNote(const Request& request) const {
  auto body = readNoteRequest(request);
  if (!body.has_value()) {
    return errorResponse(request, body.error());
  }

  noted::core::NewNote new_note;
  new_note.id = noted::core::NoteId::generate().toString();
  new_note.title = std::move(body->title);
  new_note.content = std::move(body->content);
  new_note.created_at = noted::util::Time::toRfc3339(noted::util::Time::now());

  auto note = service_->create(new_note);
  if (!note.has_value()) {
    return errorResponse(request, note.error());
  }
  return jsonResponse(request, beast_http::status::created, singleNoteBody(*note).dump());
}

Response RequestHandler::updateNote(const Request& request, const std::string& id) const {
  auto body = readNoteRequest(request);
  if (!body.has_value()) {
    return errorResponse(request, body.error());
  }

  noted::core::UpdateNote update{std::move(body->title), std::move(body->content)};
  auto note = service_->update(id, update);
  if (!note.has_value()) {
    return errorResponse(request, note.error());
  }
  return jsonResponse(request, beast_http::status::ok, singleNoteBody(*note).dump());
}

Response RequestHandler::deleteNote(const Request& request, const std::string& id) const {
  auto note = service_->remove(id);
  if (!note.has_value()) {
    return errorResponse(request, note.error());
  }
  spdlog::debug("Deleted note {}", note->id);
  return emptyResponse(request, beast_http::status::no_content);
}

Response RequestHandler::openApi(const Request& request) const {
  return jsonResponse(request, beast_http::status::ok, openapi_json_);
}

Response RequestHandler::jsonResponse(const Request& request, beast_http::status status,
                                      const std::string& body) const {
  Response response{status, request.version()};
  response.set(beast_http::field::server, server_name_);
  response.set(beast_http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  response.body() = body;
  response.prepare_payload();
  return response;
}

Response RequestHandler::emptyResponse(const Request& request, beast_http::status status) const {
  Response response{status, request.version()};
  response.set(beast_http::field::server, server_name_);
  response.keep_alive(request.keep_alive());
  response.prepare_payload();
  return response;
}

Response RequestHandler::errorResponse(const Request& request, const Error& error) const {
  auto api_error = ApiError::fromError(error);
  if (api_error.isServerError()) {
    spdlog::error("{} {} failed: {}",
                  toStringView(request.method_string()), toStringView(request.target()),
                  error.describe());
  } else {
    spdlog::debug("{} {} rejected: {}",
                  toStringView(request.method_string()), toStringView(request.target()),
                  error.describe());
  }
  return jsonResponse(request, api_error.status, api_error.body.dump());
}

Response RequestHandler::notFound(const Request& request) const {
  return jsonResponse(request, beast_http::status::not_found, messageBody("not found").dump());
}

Result<NoteRequest> RequestHandler::readNoteRequest(const Request& request) {
  auto content_type = request.find(beast_http::field::content_type);
  if (content_type != request.end() && !isJsonContentType(toStringView(content_type->value()))) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Content-Type must be application/json"));
  }
  return parseNoteRequest(request.body());
}

}  // namespace noted::http
