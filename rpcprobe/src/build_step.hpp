#pragma once

#include <chrono>
#include <string>

namespace rpcprobe {

constexpr std::chrono::milliseconds kDefaultBuildTimeout{600000};

struct BuildResult {
    bool ok = false;
    std::string detail; // captured stderr, or the launch/timeout reason
};

/// Runs `command` through /bin/sh -c with an empty stdin. Success means exit status 0 in time.
BuildResult run_build(const std::string& command, std::chrono::milliseconds timeout = kDefaultBuildTimeout);

} // namespace rpcprobe
