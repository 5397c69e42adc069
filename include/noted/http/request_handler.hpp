#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <nlohmann/json.hpp>

#include "noted/common.hpp"
#include "noted/http/api_types.hpp"
#include "noted/service/note_service.hpp"

namespace noted::http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Routes a parsed HTTP request to the note service and renders the result.
//
// Routes:
//   GET    /notes                  list
//   POST   /notes                  create (201)
//   GET    /notes/{id}             get
//   PUT    /notes/{id}             update
//   DELETE /notes/{id}             delete (204, empty body)
//   GET    /api-docs/openapi.json  OpenAPI document
// Anything else is 404 {"message":"not found"}.
//
// handle() is safe to call from several threads at once and never throws.
class RequestHandler {
 public:
  explicit RequestHandler(std::shared_ptr<noted::service::NoteService> service);

  Response handle(const Request& request) const;

 private:
  Response dispatch(const Request& request) const;

  Response listNotes(const Request& request) const;
  Response getNote(const Request& request, const std::string& id) const;
  Response createNote(const Request& request) const;
  Response updateNote(const Request& request, const std::string& id) const;
  Response deleteNote(const Request& request, const std::string& id) const;
  Response openApi(const Request& request) const;

  Response jsonResponse(const Request& request, boost::beast::http::status status,
                        const std::string& body) const;
  Response emptyResponse(const Request& request, boost::beast::http::status status) const;
  Response errorResponse(const Request& request, const Error& error) const;
  Response notFound(const Request& request) const;

  // Content-Type check followed by body parsing
  static Result<NoteRequest> readNoteRequest(const Request& request);

  std::shared_ptr<noted::service::NoteService> service_;
  std::string openapi_json_;
  std::string server_name_;
};

// Split the path of a request target into percent-decoded segments.
// The query string is dropped. "/notes/" yields {"notes", ""}.
// Returns nullopt for a target that is not an origin-form path or holds a
// malformed escape.
std::optional<std::vector<std::string>> splitTarget(std::string_view target);

}  // namespace noted::http
