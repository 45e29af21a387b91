#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>

#include <string>

#include "guardkit/guardkit.hpp"

namespace {

using guardkit::LogLevel;

// Points the logger at a private tmpfile for the duration of a test and
// restores the suite defaults afterwards.
class LogCapture : public ::testing::Test {
 protected:
  void SetUp() override {
    out_ = tmpfile();
    ASSERT_NE(out_, nullptr);
    saved_level_ = guardkit::GetLogLevel();
    guardkit::SetLogStream(out_);
    guardkit::SetLogLevel(LogLevel::kInfo);
    guardkit::SetLogByteBudget(0);
    guardkit::ResetLogStats();
  }
  void TearDown() override {
    guardkit::SetLogByteBudget(0);
    guardkit::ResetLogStats();
    guardkit::SetLogLevel(saved_level_);
    guardkit::SetLogStream(nullptr);
    if (out_) fclose(out_);
  }

  std::string Captured() {
    std::string s;
    fflush(out_);
    rewind(out_);
    char buf[1024];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), out_)) > 0) s.append(buf, n);
    return s;
  }

  FILE* out_ = nullptr;
  LogLevel saved_level_ = LogLevel::kInfo;
};

TEST_F(LogCapture, Case001_PrefixAndLevelFilter) {
  guardkit::Logf(LogLevel::kDebug, "hidden %d", 1);
  guardkit::Logf(LogLevel::kWarning, "shown %d", 2);
  EXPECT_EQ(Captured(), "[guardkit][WARN] shown 2\n");
}

TEST_F(LogCapture, Case002_LongLineTruncated) {
  std::string big(4 * guardkit::kLogLineMax, 'q');
  guardkit::Logf(LogLevel::kError, "%s", big.c_str());
  const std::string out = Captured();
  EXPECT_LT(out.size(), guardkit::kLogLineMax);
  EXPECT_EQ(out[out.size() - 1], '\n');
  EXPECT_EQ(out.find("[guardkit][ERROR] qqq"), 0u);
}

/**
 * @brief Case003: Total log volume is bounded.
 *
 * Steps:
 * - Budget 100 bytes; log 50 lines of ~30 bytes each.
 * Expected:
 * - Everything that reaches the stream, notice included, is counted and stays
 *   within the budget; exactly one exhaustion notice; the rest are counted as
 *   dropped.
 */
TEST_F(LogCapture, Case003_ByteBudget) {
  guardkit::SetLogByteBudget(100);
  for (int i = 0; i < 50; ++i) {
    guardkit::Logf(LogLevel::kInfo, "line number %02d", i);
  }
  EXPECT_LE(guardkit::LogBytesWritten(), 100u);
  const std::string out = Captured();
  size_t notices = 0;
  for (size_t pos = out.find("log budget exhausted"); pos != std::string::npos;
       pos = out.find("log budget exhausted", pos + 1)) {
    ++notices;
  }
  EXPECT_EQ(notices, 1u);
  EXPECT_EQ(guardkit::LogBytesWritten(), out.size());
  // "[guardkit][INFO] line number NN\n" is 32 bytes and the notice 38: one
  // line plus the notice fit in 100, a second line would not leave room.
  EXPECT_EQ(guardkit::LogBytesWritten(), 70u);
  EXPECT_EQ(guardkit::LogLinesDropped(), 49u);

  guardkit::ResetLogStats();
  guardkit::Logf(LogLevel::kInfo, "again");
  EXPECT_EQ(guardkit::LogLinesDropped(), 0u);
  EXPECT_GT(guardkit::LogBytesWritten(), 0u);
}

TEST_F(LogCapture, Case004_BudgetFromLimits) {
  guardkit::ResourceLimits l = guardkit::ResourceLimits::Defaults();
  l.max_log_bytes = 10;
  guardkit::ApplyLogLimits(l);
  guardkit::Logf(LogLevel::kInfo, "does not fit");
  // Too small for the notice as well: nothing at all is written.
  EXPECT_EQ(guardkit::LogBytesWritten(), 0u);
  EXPECT_EQ(guardkit::LogLinesDropped(), 1u);
  EXPECT_TRUE(Captured().empty());
}

}  // namespace
