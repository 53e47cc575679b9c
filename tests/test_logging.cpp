#include <gtest/gtest.h>

#include "logging.hpp"

#include <atomic>

using gateway::LogEntry;
using gateway::LogLevel;
using gateway::LogRingBuffer;

class LogRingBufferTest : public ::testing::Test {
 protected:
  static LogEntry Entry(const std::string& message) {
    LogEntry e;
    e.tag = "test";
    e.message = message;
    return e;
  }

  LogRingBuffer buffer{3};
};

TEST_F(LogRingBufferTest, KeepsMostRecentLines) {
  for (int i = 0; i < 5; i++) buffer.Append(Entry("line" + std::to_string(i)));
  auto lines = buffer.Snapshot();
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines.front().message, "line2");
  EXPECT_EQ(lines.back().message, "line4");
}

TEST_F(LogRingBufferTest, ShrinkingCapacityDropsOldest) {
  for (int i = 0; i < 3; i++) buffer.Append(Entry("line" + std::to_string(i)));
  buffer.SetCapacity(1);
  EXPECT_EQ(buffer.Capacity(), 1u);
  ASSERT_EQ(buffer.Size(), 1u);
  EXPECT_EQ(buffer.Snapshot()[0].message, "line2");
}

TEST_F(LogRingBufferTest, ObserversSeeCountUntilRemoved) {
  std::atomic<size_t> last{0};
  std::atomic<int> calls{0};
  int id = buffer.AddObserver([&](size_t count) {
    last = count;
    calls++;
  });
  buffer.Append(Entry("a"));
  buffer.Append(Entry("b"));
  EXPECT_EQ(last.load(), 2u);
  EXPECT_EQ(calls.load(), 2);

  buffer.RemoveObserver(id);
  buffer.Append(Entry("c"));
  EXPECT_EQ(calls.load(), 2);
}

TEST_F(LogRingBufferTest, ClearEmptiesBuffer) {
  buffer.Append(Entry("a"));
  buffer.Clear();
  EXPECT_EQ(buffer.Size(), 0u);
}

TEST(LoggerTest, CapturesEveryLevelRegardlessOfVerbosity) {
  auto& logger = gateway::Logger::Instance();
  logger.SetVerbose(false);
  logger.Buffer().Clear();
  gateway::LogInfo("t", "quiet");
  gateway::LogWarn("t", "loud");
  auto lines = logger.Buffer().Snapshot();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].level, LogLevel::kInfo);
  EXPECT_EQ(lines[1].level, LogLevel::kWarn);
  EXPECT_STREQ(gateway::LogLevelName(lines[1].level), "WARN");
}

TEST(LogFormattingTest, TruncatesLongText) {
  EXPECT_EQ(gateway::TruncateForLog("short", 100), "short");
  auto out = gateway::TruncateForLog(std::string(100, 'x'), 30);
  EXPECT_EQ(out.size(), 30u);
  EXPECT_NE(out.find("(truncated)"), std::string::npos);
}

TEST(LogFormattingTest, RedactsSecretKeys) {
  nlohmann::json body = {{"query", "cats"}, {"api_key", "sk-123"}, {"nested", {{"Authorization", "Bearer x"}}}};
  auto out = gateway::SanitizeJsonForLog(body);
  EXPECT_EQ(out.find("sk-123"), std::string::npos);
  EXPECT_EQ(out.find("Bearer x"), std::string::npos);
  EXPECT_NE(out.find("cats"), std::string::npos);
}
