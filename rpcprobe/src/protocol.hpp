#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace rpcprobe {

constexpr const char* kJsonRpcVersion = "2.0";

struct Request {
    int64_t id = 0;
    std::string method;
    std::optional<nlohmann::json> params; // omitted from the wire when empty
};

struct Success {
    nlohmann::json result;
};

struct Failure {
    int64_t code = 0;
    std::string message;
    nlohmann::json error; // the full error member, kept for reporting
};

/// Decoded reply: exactly one of the two JSON-RPC shapes.
using Response = std::variant<Success, Failure>;

struct Decoded {
    Response response;
};

struct TransportError {
    std::string reason;
};

struct DecodeError {
    std::string reason;
    std::string raw_text;
};

/// What one probe produced. Assertions only ever look at this.
using Outcome = std::variant<Decoded, TransportError, DecodeError>;

struct Verdict {
    bool passed = false;
    std::optional<std::string> detail;
};

struct Result {
    std::string name;
    bool passed = false;
    std::optional<std::string> detail;
};

} // namespace rpcprobe
