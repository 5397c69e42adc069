#pragma once

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include "noted/common.hpp"

namespace noted::http {

// HTTP rendition of an Error: status plus JSON body.
// Internal failures never carry their cause in the body.
struct ApiError {
  boost::beast::http::status status;
  nlohmann::json body;

  static ApiError fromError(const Error& error);

  bool isServerError() const;
};

}  // namespace noted::http
