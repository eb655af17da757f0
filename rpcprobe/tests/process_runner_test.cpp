#include <gtest/gtest.h>

#include "process_runner.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

#include <dirent.h>

namespace {

using namespace std::chrono_literals;
using rpcprobe::transport::ExchangeStatus;

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

const std::string kInitialize = R"({"id":1,"jsonrpc":"2.0","method":"initialize","params":{}})";

size_t open_fd_count() {
    size_t count = 0;
    if (DIR* dir = ::opendir("/proc/self/fd")) {
        while (::readdir(dir) != nullptr) {
            ++count;
        }
        ::closedir(dir);
    }
    return count;
}

// True once pid no longer runs: gone from /proc or left as an unreaped zombie.
bool process_gone(long pid) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        if (!stat) {
            return true;
        }
        std::string line;
        std::getline(stat, line);
        auto paren = line.rfind(')');
        if (paren != std::string::npos && paren + 2 < line.size() && line[paren + 2] == 'Z') {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return false;
}

long first_pid(const std::string& out) {
    return std::strtol(out.c_str(), nullptr, 10);
}

} // namespace

TEST(ProcessRunner, ExchangeCollectsReply) {
    ScopedFakeMode mode("conformant");

    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.exit_code, 0);
    auto reply = nlohmann::json::parse(raw.out);
    EXPECT_EQ(reply.at("id"), 1);
    EXPECT_EQ(reply.at("result").at("protocolVersion"), "2024-11-05");
}

TEST(ProcessRunner, ExchangeTerminatesRequestLine) {
    ScopedFakeMode mode("echo_stdin");

    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);

    ASSERT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.out, kInitialize + "\n");
}

TEST(ProcessRunner, NonZeroExitIsStillCompleted) {
    ScopedFakeMode mode("exit_nonzero");

    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.exit_code, 3);
    EXPECT_FALSE(raw.out.empty());
}

TEST(ProcessRunner, StderrIsCapturedSeparately) {
    ScopedFakeMode mode("stderr_noise");

    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);

    ASSERT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.err, "warming up\nstill warming up\n");
    EXPECT_NO_THROW(nlohmann::json::parse(raw.out));
}

TEST(ProcessRunner, MissingExecutableIsSpawnFailure) {
    auto raw = rpcprobe::transport::exchange("/nonexistent/rpcprobe/server", kInitialize, 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::spawn_failed);
    EXPECT_NE(raw.detail.find("No such file"), std::string::npos) << raw.detail;
    EXPECT_TRUE(raw.out.empty());
}

TEST(ProcessRunner, NonExecutableFileIsSpawnFailure) {
    std::string path = write_temp_file("not_executable.sh", "#!/bin/sh\necho hi\n", false);

    auto raw = rpcprobe::transport::exchange(path, kInitialize, 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::spawn_failed);
    EXPECT_FALSE(raw.detail.empty());
}

TEST(ProcessRunner, HangingServerIsKilledAtTimeout) {
    ScopedFakeMode mode("hang");

    const auto start = std::chrono::steady_clock::now();
    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(raw.status, ExchangeStatus::timed_out);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(raw.exit_code, 128 + 9);
}

TEST(ProcessRunner, TimeoutKeepsPartialOutput) {
    ScopedFakeMode mode("linger");

    auto raw = rpcprobe::transport::exchange(fake_server_path(), kInitialize, 500ms);

    EXPECT_EQ(raw.status, ExchangeStatus::timed_out);
    EXPECT_NE(raw.out.find("protocolVersion"), std::string::npos) << raw.out;
}

TEST(ProcessRunner, TimeoutKillsDescendants) {
    auto raw = rpcprobe::transport::run_process({"/bin/sh", "-c", "sleep 37 & echo $!; wait; true"}, "", 300ms);

    ASSERT_EQ(raw.status, ExchangeStatus::timed_out);
    long pid = first_pid(raw.out);
    ASSERT_GT(pid, 0) << raw.out;
    EXPECT_TRUE(process_gone(pid)) << "sleep 37 (pid " << pid << ") survived";
}

TEST(ProcessRunner, DescendantHoldingStdoutIsKilledAfterChildExits) {
    // The shell exits at once; the background sleep keeps stdout open until the deadline.
    auto raw = rpcprobe::transport::run_process({"/bin/sh", "-c", "sleep 38 & echo $!"}, "", 300ms);

    EXPECT_EQ(raw.status, ExchangeStatus::timed_out);
    long pid = first_pid(raw.out);
    ASSERT_GT(pid, 0) << raw.out;
    EXPECT_TRUE(process_gone(pid)) << "sleep 38 (pid " << pid << ") survived";
}

TEST(ProcessRunner, CapturedOutputIsCapped) {
    auto raw = rpcprobe::transport::run_process(
        {"/bin/sh", "-c", "head -c 10485760 /dev/zero; echo finished >&2"}, "", 10s);

    EXPECT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_EQ(raw.out.size(), rpcprobe::transport::kMaxCapturedBytes);
    EXPECT_EQ(raw.err, "finished\n");
}

TEST(ProcessRunner, RunProcessPassesArguments) {
    auto raw = rpcprobe::transport::run_process({"/bin/sh", "-c", "cat; echo done >&2; exit 4"}, "ping\n", 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.out, "ping\n");
    EXPECT_EQ(raw.err, "done\n");
    EXPECT_EQ(raw.exit_code, 4);
}

TEST(ProcessRunner, ChildThatIgnoresStdinDoesNotBreakHarness) {
    std::string big(1 << 20, 'x');

    auto raw = rpcprobe::transport::run_process({"/bin/sh", "-c", "exec 0<&-; echo closed"}, big, 5000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::completed);
    EXPECT_EQ(raw.out, "closed\n");
}

TEST(ProcessRunner, EmptyCommandLineIsSpawnFailure) {
    auto raw = rpcprobe::transport::run_process({}, "", 1000ms);

    EXPECT_EQ(raw.status, ExchangeStatus::spawn_failed);
}

TEST(ProcessRunner, NoDescriptorsLeakAcrossExchanges) {
    ScopedFakeMode mode("conformant");
    rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);
    const size_t before = open_fd_count();

    for (int i = 0; i < 5; ++i) {
        rpcprobe::transport::exchange(fake_server_path(), kInitialize, 5000ms);
    }
    rpcprobe::transport::exchange("/nonexistent/rpcprobe/server", kInitialize, 5000ms);

    EXPECT_EQ(open_fd_count(), before);
}

TEST(ProcessRunner, StatusNames) {
    EXPECT_STREQ(rpcprobe::transport::to_string(ExchangeStatus::completed), "completed");
    EXPECT_STREQ(rpcprobe::transport::to_string(ExchangeStatus::timed_out), "timed-out");
    EXPECT_STREQ(rpcprobe::transport::to_string(ExchangeStatus::spawn_failed), "spawn-failed");
}
