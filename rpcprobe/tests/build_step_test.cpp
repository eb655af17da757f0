#include <gtest/gtest.h>

#include "build_step.hpp"
#include "test_helpers.hpp"

#include <chrono>

namespace {

using namespace std::chrono_literals;

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

TEST(BuildStep, SuccessfulCommand) {
    auto result = rpcprobe::run_build("echo compiling; true", 10s);

    EXPECT_TRUE(result.ok);
}

TEST(BuildStep, FailingCommandKeepsStderr) {
    auto result = rpcprobe::run_build("echo 'error: linker failed' >&2; exit 101", 10s);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.detail, "error: linker failed\n");
}

TEST(BuildStep, FailingCommandWithoutOutputReportsStatus) {
    auto result = rpcprobe::run_build("exit 2", 10s);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.detail, "build exited with status 2");
}

TEST(BuildStep, SlowCommandTimesOut) {
    auto result = rpcprobe::run_build("sleep 30", 200ms);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.detail.find("no exit within 200 ms"), std::string::npos) << result.detail;
}
