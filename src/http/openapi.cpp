#include "noted/http/openapi.hpp"

#include <string>

namespace noted::http {

namespace {

using nlohmann::json;

const char* const kExampleId = "14322988-32fe-447c-ac38-06fb6c699b4a";

json schemaRef(const std::string& name) {
  return {{"$ref", "#/components/schemas/" + name}};
}

json exampleNote() {
  return {
    {"id", kExampleId},
    {"title", "Note 1"},
    {"content", "This is note #1."},
    {"createdAt", "2021-01-01T00:00:00Z"}
  };
}

json jsonContent(const std::string& schema, json example) {
  return {
    {"application/json", {
      {"schema", schemaRef(schema)},
      {"example", std::move(example)}
    }}
  };
}

json response(const std::string& description, const std::string& schema, json example) {
  return {
    {"description", description},
    {"content", jsonContent(schema, std::move(example))}
  };
}

json notFoundResponse() {
  return response("Note not found by id", "MessageResponse", {{"message", "note not found"}});
}

json invalidBodyResponse() {
  return response("Note not valid", "ErrorResponse",
                  {{"message", "body not valid"}, {"error", "title must not be empty"}});
}

json internalErrorResponse() {
  return response("Internal error", "MessageResponse", {{"message", "internal error"}});
}

json idParameter() {
  return json::array({
    {
      {"name", "id"},
      {"in", "path"},
      {"required", true},
      {"description", "Unique id"},
      {"schema", {{"type", "string"}}}
    }
  });
}

json requestBody(const std::string& schema) {
  return {
    {"required", true},
    {"content", jsonContent(schema, {{"title", "Note 1"}, {"content", "This is note #1."}})}
  };
}

json stringProperty(const std::string& description, const std::string& example) {
  return {{"type", "string"}, {"description", description}, {"example", example}};
}

json noteWrapperSchema() {
  return {
    {"type", "object"},
    {"required", json::array({"note"})},
    {"properties", {{"note", schemaRef("Note")}}}
  };
}

json noteRequestSchema() {
  return {
    {"type", "object"},
    {"required", json::array({"title", "content"})},
    {"properties", {
      {"title", stringProperty("Title of the note", "Note 1")},
      {"content", stringProperty("Content of the note", "This is note #1.")}
    }}
  };
}

json buildPaths() {
  json paths;

  paths["/notes"]["get"] = {
    {"tags", json::array({"notes"})},
    {"operationId", "list_notes"},
    {"responses", {
      {"200", response("List notes", "ListNotesResponse",
                       {{"notes", json::array({exampleNote()})}})},
      {"500", internalErrorResponse()}
    }}
  };

  paths["/notes"]["post"] = {
    {"tags", json::array({"notes"})},
    {"operationId", "create_note"},
    {"requestBody", requestBody("CreateNoteRequest")},
    {"responses", {
      {"201", response("Note created successfully", "CreateNoteResponse",
                       {{"note", exampleNote()}})},
      {"400", invalidBodyResponse()},
      {"500", internalErrorResponse()}
    }}
  };

  paths["/notes/{id}"]["get"] = {
    {"tags", json::array({"notes"})},
    {"operationId", "get_note"},
    {"parameters", idParameter()},
    {"responses", {
      {"200", response("Get note", "GetNoteResponse", {{"note", exampleNote()}})},
      {"404", notFoundResponse()},
      {"500", internalErrorResponse()}
    }}
  };

  paths["/notes/{id}"]["put"] = {
    {"tags", json::array({"notes"})},
    {"operationId", "put_note"},
    {"parameters", idParameter()},
    {"requestBody", requestBody("UpdateNoteRequest")},
    {"responses", {
      {"200", response("Note updated successfully", "UpdateNoteResponse",
                       {{"note", exampleNote()}})},
      {"400", invalidBodyResponse()},
      {"404", notFoundResponse()},
      {"500", internalErrorResponse()}
    }}
  };

  paths["/notes/{id}"]["delete"] = {
    {"tags", json::array({"notes"})},
    {"operationId", "delete_note"},
    {"parameters", idParameter()},
    {"responses", {
      {"204", {{"description", "Note deleted successfully"}}},
      {"404", notFoundResponse()},
      {"500", internalErrorResponse()}
    }}
  };

  return paths;
}

json buildSchemas() {
  json schemas;

  schemas["Note"] = {
    {"type", "object"},
    {"required", json::array({"id", "title", "content", "createdAt"})},
    {"properties", {
      {"id", stringProperty("Unique id", kExampleId)},
      {"title", stringProperty("Title of the note", "Note 1")},
      {"content", stringProperty("Content of the note", "This is note #1.")},
      {"createdAt", stringProperty("Date of creation", "2021-01-01T00:00:00Z")}
    }}
  };

  schemas["CreateNoteRequest"] = noteRequestSchema();
  schemas["UpdateNoteRequest"] = noteRequestSchema();
  schemas["CreateNoteResponse"] = noteWrapperSchema();
  schemas["UpdateNoteResponse"] = noteWrapperSchema();
  schemas["GetNoteResponse"] = noteWrapperSchema();

  schemas["ListNotesResponse"] = {
    {"type", "object"},
    {"required", json::array({"notes"})},
    {"properties", {
      {"notes", {{"type", "array"}, {"items", schemaRef("Note")}}}
    }}
  };

  schemas["MessageResponse"] = {
    {"type", "object"},
    {"required", json::array({"message"})},
    {"properties", {
      {"message", stringProperty("Human readable message", "note not found")}
    }}
  };

  schemas["ErrorResponse"] = {
    {"type", "object"},
    {"required", json::array({"message", "error"})},
    {"properties", {
      {"message", stringProperty("Human readable message", "body not valid")},
      {"error", stringProperty("Error detail", "title too long")}
    }}
  };

  return schemas;
}

}  // namespace

json buildOpenApiDocument(const Version& version) {
  json document;
  document["openapi"] = "3.0.3";
  document["info"] = {
    {"title", "noted"},
    {"description", "CRUD service for notes"},
    {"version", version.toString()}
  };
  document["tags"] = json::array({
    {{"name", "notes"}, {"description", "Note management endpoints."}}
  });
  document["paths"] = buildPaths();
  document["components"]["schemas"] = buildSchemas();
  return document;
}

}  // namespace noted::http
