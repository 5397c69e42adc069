#include <gtest/gtest.h>

#include "noted/core/note.hpp"
#include "test_helpers.hpp"

using namespace noted::core;
using namespace noted::test;

class NoteTest : public ::testing::Test {};

TEST_F(NoteTest, NewNoteToNoteCopiesAllFields) {
  auto new_note = makeNewNote("14322988-32fe-447c-ac38-06fb6c699b4a", "Note 1",
                              "This is note #1.", "2021-01-01T00:00:00.000Z");

  auto note = new_note.toNote();

  EXPECT_EQ(note.id, new_note.id);
  EXPECT_EQ(note.title, "Note 1");
  EXPECT_EQ(note.content, "This is note #1.");
  EXPECT_EQ(note.created_at, "2021-01-01T00:00:00.000Z");
}

TEST_F(NoteTest, ApplyReplacesMutableFieldsOnly) {
  Note note{"14322988-32fe-447c-ac38-06fb6c699b4a", "Old", "old body",
            "2021-01-01T00:00:00.000Z"};

  note.apply(UpdateNote{"New", ""});

  EXPECT_EQ(note.id, "14322988-32fe-447c-ac38-06fb6c699b4a");
  EXPECT_EQ(note.created_at, "2021-01-01T00:00:00.000Z");
  EXPECT_EQ(note.title, "New");
  EXPECT_EQ(note.content, "");
}

TEST_F(NoteTest, Equality) {
  Note a{"id", "t", "c", "2021-01-01T00:00:00.000Z"};
  Note b = a;
  EXPECT_EQ(a, b);

  b.content = "changed";
  EXPECT_FALSE(a == b);
}
