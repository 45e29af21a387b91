#include <gtest/gtest.h>
#include <stdio.h>

#include "guardkit/guardkit.hpp"

namespace {

// Keeps library log output out of the test report.
class GuardkitEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    log_ = tmpfile();
    ASSERT_NE(log_, nullptr) << "tmpfile failed";
    guardkit::SetLogStream(log_);
    guardkit::SetLogLevel(guardkit::LogLevel::kDebug);
    guardkit::SetLogByteBudget(0);
  }
  void TearDown() override {
    guardkit::SetLogStream(nullptr);
    if (log_) {
      fclose(log_);
      log_ = nullptr;
    }
  }

 private:
  FILE* log_ = nullptr;
};

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new GuardkitEnv());
  return RUN_ALL_TESTS();
}
