#pragma once

#include "../protocol.hpp"

#include <string>

namespace rpcprobe::cases {

const Success* as_success(const Outcome& outcome);
const Failure* as_failure(const Outcome& outcome);

/// Human-readable rendering of an outcome, used as failure detail.
std::string describe(const Outcome& outcome);

/// Passes iff the outcome is a decoded success whose result object has `field`.
Verdict expect_success_with(const Outcome& outcome, const std::string& field);

/// Passes iff the outcome is a decoded JSON-RPC error.
Verdict expect_failure(const Outcome& outcome);

} // namespace rpcprobe::cases
