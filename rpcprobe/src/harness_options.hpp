#pragma once

#include "build_step.hpp"
#include "process_runner.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace rpcprobe {

constexpr const char* kDefaultServerPath = "./target/release/chat-mcp-server";
constexpr const char* kDefaultBuildCommand = "cargo build --release --features mcp --bin chat-mcp-server";

struct HarnessOptions {
    std::string server_path = kDefaultServerPath;
    std::optional<std::string> build_command = std::string(kDefaultBuildCommand);
    std::chrono::milliseconds timeout = transport::kDefaultTimeout;
    std::chrono::milliseconds build_timeout = kDefaultBuildTimeout;
    std::string log_config = "log4cplus.ini";
    bool color = true;
    bool parse_error_case = false;
    bool show_version = false;
    bool show_help = false;
};

/// Fills `options` from argv. On a bad flag returns false and sets `error`.
bool parse_options(int argc, const char* const* argv, HarnessOptions& options, std::string& error);

std::string usage(const std::string& program);

} // namespace rpcprobe
