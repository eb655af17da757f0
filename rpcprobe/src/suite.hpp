#pragma once

#include "cases/case_registry.hpp"
#include "process_runner.hpp"
#include "report.hpp"

#include <chrono>
#include <string>

namespace rpcprobe {

struct SuiteOptions {
    std::string executable;
    std::chrono::milliseconds timeout = transport::kDefaultTimeout;
};

/**
 * Runs every registered case once, in registration order.
 *
 * A case that throws is recorded as failed and the run continues, so the
 * report always holds exactly one Result per case.
 */
class Suite {
public:
    explicit Suite(cases::CaseRegistry registry);

    SuiteReport run(const SuiteOptions& options, Reporter& reporter) const;

    size_t size() const { return registry_.size(); }

private:
    cases::CaseRegistry registry_;
};

} // namespace rpcprobe
