#include "assertions.hpp"

#include "../json_codec.hpp"

#include <nlohmann/json.hpp>

namespace rpcprobe::cases {

namespace {

struct Describe {
	std::string operator()(const Decoded& decoded) const {
		if (const auto* success = std::get_if<Success>(&decoded.response)) {
			return "Response: " + nlohmann::json{{"result", success->result}}.dump(2);
		}
		const auto& failure = std::get<Failure>(decoded.response);
		return "Response: " + nlohmann::json{{"error", failure.error}}.dump(2);
	}

	std::string operator()(const TransportError& error) const {
		return "Transport error: " + error.reason;
	}

	std::string operator()(const DecodeError& error) const {
		std::string text = "Decode error: " + error.reason;
		if (!error.raw_text.empty()) {
			text += "\nRaw: " + error.raw_text;
		}
		return text;
	}
};

} // namespace

const Success* as_success(const Outcome& outcome) {
	const auto* decoded = std::get_if<Decoded>(&outcome);
	if (!decoded) {
		return nullptr;
	}
	return std::get_if<Success>(&decoded->response);
}

const Failure* as_failure(const Outcome& outcome) {
	const auto* decoded = std::get_if<Decoded>(&outcome);
	if (!decoded) {
		return nullptr;
	}
	return std::get_if<Failure>(&decoded->response);
}

std::string describe(const Outcome& outcome) {
	return std::visit(Describe{}, outcome);
}

Verdict expect_success_with(const Outcome& outcome, const std::string& field) {
	const Success* success = as_success(outcome);
	if (!success) {
		return {false, describe(outcome)};
	}
	if (!codec::find_key(success->result, field)) {
		return {false, "Missing " + field + " in result\n" + describe(outcome)};
	}
	return {true, std::nullopt};
}

Verdict expect_failure(const Outcome& outcome) {
	const Failure* failure = as_failure(outcome);
	if (!failure) {
		return {false, "Expected error response, got: " + describe(outcome)};
	}
	return {true, "Error code: " + std::to_string(failure->code) + "\nError message: " + failure->message};
}

} // namespace rpcprobe::cases
