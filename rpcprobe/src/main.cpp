#include "harness.hpp"
#include "harness_options.hpp"
#include "logger.hpp"
#include "report.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    rpcprobe::HarnessOptions options;
    std::string error;
    if (!rpcprobe::parse_options(argc, argv, options, error)) {
        std::cerr << error << "\n\n" << rpcprobe::usage(argv[0]);
        return 2;
    }

    if (options.show_help) {
        std::cout << rpcprobe::usage(argv[0]);
        return 0;
    }

    if (options.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

    init_logging(options.log_config);

    LOG4CPLUS_INFO(harness_logger(), "rpcprobe starting");
    LOG4CPLUS_INFO(harness_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(harness_logger(), "Target: " << options.server_path);

    const bool color = options.color && std::getenv("NO_COLOR") == nullptr && ::isatty(STDOUT_FILENO) == 1;
    rpcprobe::Reporter reporter(std::cout, color ? rpcprobe::Palette::colored() : rpcprobe::Palette::plain());

    return rpcprobe::run_harness(options, reporter);
}
