#include "assertions.hpp"
#include "case_base.hpp"
#include "case_registry.hpp"

#include "../json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace rpcprobe::cases {

namespace {

const std::vector<std::string> kRequiredTools = {"list_sources", "list_chats", "get_messages"};

std::string join(const std::vector<std::string>& items) {
    std::string text;
    for (const auto& item : items) {
        if (!text.empty()) {
            text += ", ";
        }
        text += item;
    }
    return text;
}

nlohmann::json tool_call(const std::string& tool) {
    return {{"name", tool}, {"arguments", nlohmann::json::object()}};
}

class InitializeCase final : public RequestCase {
public:
    const char* name() const override { return "Initialize"; }

    Request request() const override { return {1, "initialize", nlohmann::json::object()}; }

    Verdict evaluate(const Outcome& outcome) const override {
        Verdict verdict = expect_success_with(outcome, "protocolVersion");
        if (verdict.passed) {
            const auto& version = as_success(outcome)->result.at("protocolVersion");
            verdict.detail = "Protocol version: " + (version.is_string() ? version.get<std::string>() : version.dump());
        }
        return verdict;
    }
};

class ListToolsCase final : public RequestCase {
public:
    const char* name() const override { return "List Tools"; }

    Request request() const override { return {2, "tools/list", std::nullopt}; }

    Verdict evaluate(const Outcome& outcome) const override {
        const Success* success = as_success(outcome);
        if (!success) {
            return {false, describe(outcome)};
        }

        const nlohmann::json* tools = codec::find_key(success->result, "tools");
        if (!tools || !tools->is_array()) {
            return {false, "Missing tools list\n" + describe(outcome)};
        }

        std::vector<std::string> names;
        for (size_t i = 0; i < tools->size(); ++i) {
            const nlohmann::json* name = codec::find_key((*tools)[i], "name");
            if (!name) {
                return {false, "tools[" + std::to_string(i) + "] has no name\n" + describe(outcome)};
            }
            names.push_back(name->is_string() ? name->get<std::string>() : name->dump());
        }

        std::vector<std::string> missing;
        for (const auto& required : kRequiredTools) {
            if (std::find(names.begin(), names.end(), required) == names.end()) {
                missing.push_back(required);
            }
        }
        if (!missing.empty()) {
            return {false, "Missing tools: " + join(missing) + "\n" + describe(outcome)};
        }
        return {true, "Found tools: " + join(names)};
    }
};

class ListSourcesToolCase final : public RequestCase {
public:
    const char* name() const override { return "List Sources Tool"; }

    Request request() const override { return {3, "tools/call", tool_call("list_sources")}; }

    Verdict evaluate(const Outcome& outcome) const override {
        Verdict verdict = expect_success_with(outcome, "content");
        if (verdict.passed) {
            verdict.detail = "Response has content field";
        }
        return verdict;
    }
};

class InvalidMethodCase final : public RequestCase {
public:
    const char* name() const override { return "Invalid Method Error"; }

    Request request() const override { return {4, "invalid_method", std::nullopt}; }

    Verdict evaluate(const Outcome& outcome) const override { return expect_failure(outcome); }
};

class InvalidToolCase final : public RequestCase {
public:
    const char* name() const override { return "Invalid Tool Error"; }

    Request request() const override { return {5, "tools/call", tool_call("invalid_tool")}; }

    Verdict evaluate(const Outcome& outcome) const override { return expect_failure(outcome); }
};

// Not a request object at all: the server has to answer with a parse error.
class ParseErrorCase final : public ConformanceCase {
public:
    const char* name() const override { return "Parse Error"; }

    std::string request_line() const override { return "{invalid json}"; }

    Verdict evaluate(const Outcome& outcome) const override { return expect_failure(outcome); }
};

} // namespace

void register_default_cases(CaseRegistry& registry) {
    registry.add(std::make_unique<InitializeCase>());
    registry.add(std::make_unique<ListToolsCase>());
    registry.add(std::make_unique<ListSourcesToolCase>());
    registry.add(std::make_unique<InvalidMethodCase>());
    registry.add(std::make_unique<InvalidToolCase>());
}

void register_parse_error_case(CaseRegistry& registry) {
    registry.add(std::make_unique<ParseErrorCase>());
}

} // namespace rpcprobe::cases
