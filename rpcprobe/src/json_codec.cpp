#include "json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rpcprobe::codec {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

DecodeError invalid(const std::string& line) {
    return DecodeError{kInvalidResponse, line};
}

} // namespace

std::string encode_request(const Request& request) {
    nlohmann::json root = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", request.id},
        {"method", request.method},
    };
    if (request.params) {
        root["params"] = *request.params;
    }
    return root.dump();
}

std::optional<std::string> first_non_empty_line(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!is_blank(line)) {
            return line;
        }
    }
    return std::nullopt;
}

DecodeResult decode_response(const std::string& output) {
    auto line = first_non_empty_line(output);
    if (!line) {
        return DecodeError{kEmptyResponse, ""};
    }

    nlohmann::json root = nlohmann::json::parse(*line, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return invalid(*line);
    }

    const nlohmann::json* result = find_key(root, "result");
    const nlohmann::json* error = find_key(root, "error");
    if ((result != nullptr) == (error != nullptr)) {
        return invalid(*line);
    }

    if (result) {
        return Response{Success{*result}};
    }

    const nlohmann::json* code = find_key(*error, "code");
    const nlohmann::json* message = find_key(*error, "message");
    if (!code || !code->is_number_integer() || !message || !message->is_string()) {
        return invalid(*line);
    }

    return Response{Failure{as_int64(*code), as_string(*message), *error}};
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }

    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const nlohmann::json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const nlohmann::json& value, int64_t fallback) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    return fallback;
}

} // namespace rpcprobe::codec
