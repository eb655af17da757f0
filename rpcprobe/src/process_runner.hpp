#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace rpcprobe::transport {

constexpr std::chrono::milliseconds kDefaultTimeout{5000};

// Per-stream capture limit. Output past it is read and dropped.
constexpr size_t kMaxCapturedBytes = 4 * 1024 * 1024;

enum class ExchangeStatus {
    completed,
    timed_out,
    spawn_failed,
};

const char* to_string(ExchangeStatus status);

/// Everything one child process produced. The exit code is informational only.
struct RawOutput {
    ExchangeStatus status = ExchangeStatus::spawn_failed;
    std::string out;
    std::string err;
    std::string detail;
    int exit_code = -1;
};

/**
 * Run argv[0] (no PATH lookup) with argv as its arguments, feed it stdin_data,
 * close its stdin and collect stdout/stderr until it exits or timeout elapses.
 *
 * The child runs in its own process group. The group is killed on timeout and
 * the child is always reaped before returning. Each stream keeps at most
 * kMaxCapturedBytes.
 */
RawOutput run_process(const std::vector<std::string>& argv,
                      const std::string& stdin_data,
                      std::chrono::milliseconds timeout);

/// One request/response exchange with a fresh instance of executable.
RawOutput exchange(const std::string& executable,
                   const std::string& request_line,
                   std::chrono::milliseconds timeout = kDefaultTimeout);

} // namespace rpcprobe::transport
