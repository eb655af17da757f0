#include "harness.hpp"

#include "build_step.hpp"
#include "cases/case_registry.hpp"
#include "logger.hpp"
#include "suite.hpp"

#include <log4cplus/loggingmacros.h>

#include <utility>

namespace rpcprobe {

int run_harness(const HarnessOptions& options, Reporter& reporter) {
    if (options.build_command) {
        reporter.build_started();
        BuildResult build = run_build(*options.build_command, options.build_timeout);
        reporter.build_finished(build.ok, build.detail);
        if (!build.ok) {
            LOG4CPLUS_ERROR(harness_logger(), "Build failed, no cases run");
            return 1;
        }
    }

    cases::CaseRegistry registry;
    cases::register_default_cases(registry);
    if (options.parse_error_case) {
        cases::register_parse_error_case(registry);
    }

    Suite suite(std::move(registry));
    SuiteReport report = suite.run({options.server_path, options.timeout}, reporter);
    return report.exit_code();
}

} // namespace rpcprobe
