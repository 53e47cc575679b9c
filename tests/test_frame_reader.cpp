#include <gtest/gtest.h>

#include "frame_reader.hpp"

#include <string>

using gateway::FrameReader;

class FrameReaderTest : public ::testing::Test {
 protected:
  FrameReader reader{64};
};

TEST_F(FrameReaderTest, SplitsCompleteLines) {
  auto r = reader.Feed("{\"a\":1}\n{\"b\":2}\n");
  ASSERT_EQ(r.lines.size(), 2u);
  EXPECT_EQ(r.lines[0], "{\"a\":1}");
  EXPECT_EQ(r.lines[1], "{\"b\":2}");
  EXPECT_FALSE(r.overflowed);
  EXPECT_EQ(reader.Buffered(), 0u);
}

TEST_F(FrameReaderTest, RetainsPartialLineAcrossChunks) {
  auto r1 = reader.Feed("{\"method\":");
  EXPECT_TRUE(r1.lines.empty());
  EXPECT_EQ(reader.Buffered(), 10u);

  auto r2 = reader.Feed("\"x\"}\n{\"tail\"");
  ASSERT_EQ(r2.lines.size(), 1u);
  EXPECT_EQ(r2.lines[0], "{\"method\":\"x\"}");
  EXPECT_EQ(reader.Buffered(), 7u);
}

TEST_F(FrameReaderTest, TrimsCarriageReturn) {
  auto r = reader.Feed("abc\r\n");
  ASSERT_EQ(r.lines.size(), 1u);
  EXPECT_EQ(r.lines[0], "abc");
}

TEST_F(FrameReaderTest, IgnoresBlankLines) {
  auto r = reader.Feed("\n   \n\t\r\nx\n\n");
  ASSERT_EQ(r.lines.size(), 1u);
  EXPECT_EQ(r.lines[0], "x");
}

TEST_F(FrameReaderTest, OverflowDiscardsBufferAndRecovers) {
  auto r = reader.Feed(std::string(100, 'a'));
  EXPECT_TRUE(r.overflowed);
  EXPECT_EQ(r.overflow_bytes, 100u);
  EXPECT_TRUE(r.lines.empty());
  EXPECT_EQ(reader.Buffered(), 0u);

  auto next = reader.Feed("tail\nok\n");
  EXPECT_FALSE(next.overflowed);
  ASSERT_EQ(next.lines.size(), 1u);
  EXPECT_EQ(next.lines[0], "ok");
}

TEST_F(FrameReaderTest, RestOfOversizedLineIsDroppedAcrossChunks) {
  EXPECT_TRUE(reader.Feed(std::string(100, 'a')).overflowed);
  EXPECT_TRUE(reader.Discarding());

  auto more = reader.Feed(std::string(30, 'a'));
  EXPECT_FALSE(more.overflowed);
  EXPECT_TRUE(more.lines.empty());
  EXPECT_EQ(reader.Buffered(), 0u);

  auto end = reader.Feed("aaa\n{\"id\":1}\n{\"id\"");
  ASSERT_EQ(end.lines.size(), 1u);
  EXPECT_EQ(end.lines[0], "{\"id\":1}");
  EXPECT_FALSE(reader.Discarding());
  EXPECT_EQ(reader.Buffered(), 6u);
}

TEST_F(FrameReaderTest, ResetClearsDiscardState) {
  reader.Feed(std::string(100, 'a'));
  reader.Reset();
  auto r = reader.Feed("ok\n");
  ASSERT_EQ(r.lines.size(), 1u);
  EXPECT_EQ(r.lines[0], "ok");
}

TEST_F(FrameReaderTest, OverflowAccumulatedOverManyChunks) {
  bool overflowed = false;
  for (int i = 0; i < 10 && !overflowed; i++) {
    overflowed = reader.Feed(std::string(10, 'b')).overflowed;
  }
  EXPECT_TRUE(overflowed);
  EXPECT_LE(reader.Buffered(), reader.MaxBytes());
}

TEST_F(FrameReaderTest, CompleteLinesBeforeOverflowAreKept) {
  auto r = reader.Feed("first\n" + std::string(80, 'z'));
  ASSERT_EQ(r.lines.size(), 1u);
  EXPECT_EQ(r.lines[0], "first");
  EXPECT_TRUE(r.overflowed);
}

TEST(FrameReaderDefaults, DefaultCapIsOneMebibyte) {
  FrameReader reader;
  EXPECT_EQ(reader.MaxBytes(), 1024u * 1024u);
}
