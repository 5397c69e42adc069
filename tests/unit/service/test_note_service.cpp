#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "noted/service/note_service.hpp"
#include "noted/store/note_repository.hpp"
#include "test_helpers.hpp"

using namespace noted::core;
using namespace noted::service;
using namespace noted::test;
using noted::ErrorCode;
using noted::Result;
using ::testing::_;
using ::testing::Return;

namespace {

class MockNoteRepository : public noted::store::NoteRepository {
 public:
  MOCK_METHOD((Result<std::vector<Note>>), list, (), (override));
  MOCK_METHOD(Result<Note>, get, (const std::string& id), (override));
  MOCK_METHOD(Result<Note>, create, (const NewNote& note), (override));
  MOCK_METHOD(Result<Note>, update, (const std::string& id, const UpdateNote& note),
              (override));
  MOCK_METHOD(Result<Note>, remove, (const std::string& id), (override));
};

Result<Note> notFound() {
  return std::unexpected(noted::makeError(ErrorCode::kNotFound, "Note not found"));
}

}  // namespace

class NoteServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    repository_ = std::make_shared<::testing::StrictMock<MockNoteRepository>>();
    service_ = std::make_unique<NoteServiceImpl>(repository_);
  }

  std::shared_ptr<::testing::StrictMock<MockNoteRepository>> repository_;
  std::unique_ptr<NoteServiceImpl> service_;
};

TEST_F(NoteServiceTest, CreateDelegatesValidNote) {
  auto new_note = makeNewNote("Note 1", "This is note #1.");
  EXPECT_CALL(*repository_, create(_)).WillOnce(Return(Result<Note>(new_note.toNote())));

  auto created = service_->create(new_note);
  ASSERT_OK(created);
  EXPECT_EQ(*created, new_note.toNote());
}

TEST_F(NoteServiceTest, CreateRejectsEmptyTitleWithoutTouchingRepository) {
  auto new_note = makeNewNote("", "content");

  auto result = service_->create(new_note);
  EXPECT_ERROR(result, ErrorCode::kValidationError);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "title must not be empty");
}

TEST_F(NoteServiceTest, WhitespaceTitleIsAccepted) {
  auto new_note = makeNewNote("   ", "");
  EXPECT_CALL(*repository_, create(_)).WillOnce(Return(Result<Note>(new_note.toNote())));

  EXPECT_OK(service_->create(new_note));
}

TEST_F(NoteServiceTest, UpdateRejectsEmptyTitleWithoutTouchingRepository) {
  EXPECT_ERROR(service_->update("id", UpdateNote{"", "content"}), ErrorCode::kValidationError);
}

TEST_F(NoteServiceTest, UpdateDelegatesValidNote) {
  Note updated{"id", "New", "body", "2021-01-01T00:00:00.000Z"};
  EXPECT_CALL(*repository_, update("id", _)).WillOnce(Return(Result<Note>(updated)));

  auto result = service_->update("id", UpdateNote{"New", "body"});
  ASSERT_OK(result);
  EXPECT_EQ(*result, updated);
}

TEST_F(NoteServiceTest, NotFoundPassesThrough) {
  EXPECT_CALL(*repository_, get("missing")).WillOnce(Return(notFound()));
  EXPECT_CALL(*repository_, update("missing", _)).WillOnce(Return(notFound()));
  EXPECT_CALL(*repository_, remove("missing")).WillOnce(Return(notFound()));

  EXPECT_ERROR(service_->get("missing"), ErrorCode::kNotFound);
  EXPECT_ERROR(service_->update("missing", UpdateNote{"t", "c"}), ErrorCode::kNotFound);
  EXPECT_ERROR(service_->remove("missing"), ErrorCode::kNotFound);
}

TEST_F(NoteServiceTest, ListPassesThrough) {
  std::vector<Note> notes{
    Note{"a", "A", "", "2021-01-01T00:00:00.000Z"},
    Note{"b", "B", "", "2021-01-02T00:00:00.000Z"},
  };
  EXPECT_CALL(*repository_, list()).WillOnce(Return(Result<std::vector<Note>>(notes)));

  auto result = service_->list();
  ASSERT_OK(result);
  EXPECT_EQ(*result, notes);
}

TEST_F(NoteServiceTest, DatabaseErrorPassesThrough) {
  EXPECT_CALL(*repository_, list())
      .WillOnce(Return(Result<std::vector<Note>>(
          std::unexpected(noted::makeError(ErrorCode::kDatabaseError, "disk I/O error")))));

  EXPECT_ERROR(service_->list(), ErrorCode::kDatabaseError);
}

TEST_F(NoteServiceTest, ValidateTitle) {
  EXPECT_OK(NoteServiceImpl::validateTitle("x"));
  EXPECT_ERROR(NoteServiceImpl::validateTitle(""), ErrorCode::kValidationError);
}
