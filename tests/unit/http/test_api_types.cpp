#include <gtest/gtest.h>

#include "noted/http/api_error.hpp"
#include "noted/http/api_types.hpp"
#include "test_helpers.hpp"

using namespace noted::http;
using noted::ErrorCode;
namespace beast_http = boost::beast::http;

class ApiTypesTest : public ::testing::Test {};

TEST_F(ApiTypesTest, NoteUsesCamelCase) {
  noted::core::Note note{"14322988-32fe-447c-ac38-06fb6c699b4a", "Note 1", "This is note #1.",
                         "2021-01-01T00:00:00.000Z"};

  auto json = noteToJson(note);
  EXPECT_EQ(json["id"], note.id);
  EXPECT_EQ(json["title"], "Note 1");
  EXPECT_EQ(json["content"], "This is note #1.");
  EXPECT_EQ(json["createdAt"], "2021-01-01T00:00:00.000Z");
  EXPECT_FALSE(json.contains("created_at"));
}

TEST_F(ApiTypesTest, ListBodyOfNothingIsEmptyArray) {
  EXPECT_EQ(noteListBody({}).dump(), R"({"notes":[]})");
}

TEST_F(ApiTypesTest, ParseValidRequest) {
  auto request = parseNoteRequest(R"({"title":"t","content":"c","extra":1})");
  ASSERT_OK(request);
  EXPECT_EQ(request->title, "t");
  EXPECT_EQ(request->content, "c");
}

TEST_F(ApiTypesTest, ParseMalformedJson) {
  EXPECT_ERROR(parseNoteRequest("{"), ErrorCode::kParseError);
  EXPECT_ERROR(parseNoteRequest(""), ErrorCode::kParseError);
}

TEST_F(ApiTypesTest, ParseWrongShape) {
  EXPECT_ERROR(parseNoteRequest("[]"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteRequest(R"({"title":"t"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteRequest(R"({"content":"c"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteRequest(R"({"title":1,"content":"c"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteRequest(R"({"title":"t","content":null})"),
               ErrorCode::kInvalidArgument);
}

TEST_F(ApiTypesTest, ErrorTranslation) {
  auto not_found = ApiError::fromError(noted::makeError(ErrorCode::kNotFound, "Note not found: x"));
  EXPECT_EQ(not_found.status, beast_http::status::not_found);
  EXPECT_EQ(not_found.body.dump(), R"({"message":"note not found"})");

  auto invalid = ApiError::fromError(
      noted::makeError(ErrorCode::kValidationError, "title must not be empty"));
  EXPECT_EQ(invalid.status, beast_http::status::bad_request);
  EXPECT_EQ(invalid.body["message"], "body not valid");
  EXPECT_EQ(invalid.body["error"], "title must not be empty");

  auto parse = ApiError::fromError(noted::makeError(ErrorCode::kParseError, "bad json"));
  EXPECT_EQ(parse.status, beast_http::status::bad_request);
  EXPECT_EQ(parse.body["error"], "bad json");
  EXPECT_FALSE(parse.isServerError());

  auto storage = ApiError::fromError(
      noted::makeError(ErrorCode::kDatabaseError, "database is locked"));
  EXPECT_EQ(storage.status, beast_http::status::internal_server_error);
  EXPECT_EQ(storage.body.dump(), R"({"message":"internal error"})");
  EXPECT_TRUE(storage.isServerError());
}
