#pragma once

#include <nlohmann/json.hpp>

#include "noted/common.hpp"

namespace noted::http {

// OpenAPI 3.0.3 description of the notes routes, served at
// GET /api-docs/openapi.json
nlohmann::json buildOpenApiDocument(const Version& version);

}  // namespace noted::http
