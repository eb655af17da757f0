#pragma once

#include "../protocol.hpp"

#include <chrono>
#include <string>

namespace rpcprobe::cases {

struct CaseContext {
	const std::string& executable;
	std::chrono::milliseconds timeout;
};

/// One conformance check: the line sent to a fresh target and the assertion over what came back.
class ConformanceCase {
public:
	virtual ~ConformanceCase() = default;
	virtual const char* name() const = 0;
	virtual std::string request_line() const = 0;
	virtual Verdict evaluate(const Outcome& outcome) const = 0;

	Verdict run(const CaseContext& ctx) const;
};

/// A case whose request is a regular JSON-RPC request object.
class RequestCase : public ConformanceCase {
public:
	virtual Request request() const = 0;
	std::string request_line() const override;
};

} // namespace rpcprobe::cases
