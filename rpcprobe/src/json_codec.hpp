#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace rpcprobe::codec {

constexpr const char* kEmptyResponse = "empty response";
constexpr const char* kInvalidResponse = "invalid response";

using DecodeResult = std::variant<Response, DecodeError>;

/// Single-line wire form of a request, without the trailing newline.
std::string encode_request(const Request& request);

/// Decodes the first non-empty line of a server's stdout.
DecodeResult decode_response(const std::string& output);

std::optional<std::string> first_non_empty_line(const std::string& output);

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key);
std::string as_string(const nlohmann::json& value, const std::string& fallback = "");
int64_t as_int64(const nlohmann::json& value, int64_t fallback = 0);

} // namespace rpcprobe::codec
