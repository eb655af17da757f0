#include "suite.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>
#include <utility>

namespace rpcprobe {

Suite::Suite(cases::CaseRegistry registry) : registry_(std::move(registry)) {}

SuiteReport Suite::run(const SuiteOptions& options, Reporter& reporter) const {
    SuiteReport report;
    report.results.reserve(registry_.size());

    LOG4CPLUS_INFO(suite_logger(), "Running " << registry_.size() << " cases against " << options.executable
                                              << " (timeout " << options.timeout.count() << " ms)");
    reporter.suite_started();

    const cases::CaseContext ctx{options.executable, options.timeout};
    for (const auto& test_case : registry_.cases()) {
        Result result{test_case->name(), false, std::nullopt};
        reporter.case_started(result.name);

        bool faulted = false;
        try {
            Verdict verdict = test_case->run(ctx);
            result.passed = verdict.passed;
            result.detail = std::move(verdict.detail);
        } catch (const std::exception& exc) {
            faulted = true;
            result.detail = exc.what();
            LOG4CPLUS_ERROR(suite_logger(), result.name << " raised: " << exc.what());
        } catch (...) {
            faulted = true;
            result.detail = "unknown exception";
            LOG4CPLUS_ERROR(suite_logger(), result.name << " raised a non-standard exception");
        }

        LOG4CPLUS_DEBUG(suite_logger(), result.name << ": " << (result.passed ? "PASSED" : "FAILED"));
        if (faulted) {
            reporter.case_faulted(result);
        } else {
            reporter.case_finished(result);
        }
        report.results.push_back(std::move(result));
    }

    reporter.summary(report);
    LOG4CPLUS_INFO(suite_logger(), report.passed() << "/" << report.total() << " tests passed");
    return report;
}

} // namespace rpcprobe
