#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/log.h"
#include "serial/line_receiver.h"

struct LogLine {
  LogLevel level;
  std::string tag;
  std::string message;
};

static std::vector<LogLine> g_lines;

static void captureSink(LogLevel level, const char* tag, const char* message) {
  LogLine line;
  line.level = level;
  line.tag = tag;
  line.message = message;
  g_lines.push_back(line);
}

class LogTest : public ::testing::Test {
protected:
  void SetUp() {
    g_lines.clear();
    logSetSink(captureSink);
  }
  void TearDown() {
    logSetSink(nullptr);
  }
};

TEST_F(LogTest, FormatsThroughSink) {
  LOG_I("ENG", "profile %c cap %u", 'A', 6u);
  ASSERT_EQ(1u, g_lines.size());
  EXPECT_EQ(LOG_LEVEL_INFO, g_lines[0].level);
  EXPECT_EQ("ENG", g_lines[0].tag);
  EXPECT_EQ("profile A cap 6", g_lines[0].message);
}

TEST_F(LogTest, NoSinkDropsSilently) {
  logSetSink(nullptr);
  LOG_E("X", "lost %d", 1);
  EXPECT_TRUE(g_lines.empty());
  EXPECT_TRUE(logGetSink() == nullptr);
}

TEST_F(LogTest, OverlongFrameWarns) {
  LineReceiver rx;
  rx.configure(DELIM_SEMICOLON);
  for (int i = 0; i < LINE_MAX_LENGTH + 1; i++) {
    rx.processByte('A');
  }
  ASSERT_EQ(1u, g_lines.size());
  EXPECT_EQ(LOG_LEVEL_WARN, g_lines[0].level);
  EXPECT_EQ("RX", g_lines[0].tag);
}

TEST_F(LogTest, LongMessagesAreTruncated) {
  std::string big(300, 'x');
  LOG_W("T", "%s", big.c_str());
  ASSERT_EQ(1u, g_lines.size());
  EXPECT_LT(g_lines[0].message.size(), 100u);
}

TEST_F(LogTest, LevelNames) {
  EXPECT_STREQ("WARN", logLevelName(LOG_LEVEL_WARN));
  EXPECT_STREQ("ERROR", logLevelName(LOG_LEVEL_ERROR));
}
