#include "noted/http/api_error.hpp"

#include "noted/http/api_types.hpp"

namespace noted::http {

ApiError ApiError::fromError(const Error& error) {
  namespace beast_http = boost::beast::http;

  switch (error.code()) {
    case ErrorCode::kNotFound:
      return {beast_http::status::not_found, messageBody("note not found")};
    case ErrorCode::kValidationError:
    case ErrorCode::kParseError:
    case ErrorCode::kInvalidArgument:
      return {beast_http::status::bad_request, errorBody("body not valid", error.message())};
    default:
      return {beast_http::status::internal_server_error, messageBody("internal error")};
  }
}

bool ApiError::isServerError() const {
  return static_cast<unsigned>(status) >= 500;
}

}  // namespace noted::http
