#include "build_step.hpp"

#include "logger.hpp"
#include "process_runner.hpp"

#include <log4cplus/loggingmacros.h>

namespace rpcprobe {

BuildResult run_build(const std::string& command, std::chrono::milliseconds timeout) {
    LOG4CPLUS_INFO(build_logger(), "Build command: " << command);

    transport::RawOutput raw = transport::run_process({"/bin/sh", "-c", command}, "", timeout);

    BuildResult result;
    switch (raw.status) {
        case transport::ExchangeStatus::spawn_failed:
            result.detail = "cannot run /bin/sh: " + raw.detail;
            break;
        case transport::ExchangeStatus::timed_out:
            result.detail = "build " + raw.detail + "\n" + raw.err;
            break;
        case transport::ExchangeStatus::completed:
            result.ok = raw.exit_code == 0;
            result.detail = raw.err;
            if (!result.ok && result.detail.empty()) {
                result.detail = "build " + raw.detail;
            }
            break;
    }

    if (result.ok) {
        LOG4CPLUS_INFO(build_logger(), "Build succeeded");
    } else {
        LOG4CPLUS_ERROR(build_logger(), "Build failed (" << transport::to_string(raw.status)
                                                         << ", exit=" << raw.exit_code << ")");
    }
    return result;
}

} // namespace rpcprobe
