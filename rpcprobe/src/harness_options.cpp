#include "harness_options.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace rpcprobe {

namespace {

bool parse_millis(const std::string& text, std::chrono::milliseconds& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value <= 0) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

} // namespace

bool parse_options(int argc, const char* const* argv, HarnessOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            options.show_version = true;
            continue;
        }

        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            options.show_help = true;
            continue;
        }

        if (std::strcmp(argv[i], "--no-build") == 0) {
            options.build_command.reset();
            continue;
        }

        if (std::strcmp(argv[i], "--no-color") == 0) {
            options.color = false;
            continue;
        }

        if (std::strcmp(argv[i], "--parse-error-case") == 0) {
            options.parse_error_case = true;
            continue;
        }

        if (argv[i][0] != '-') {
            options.server_path = argv[i];
            continue;
        }

        // Valued flags accept both "--flag value" and "--flag=value".
        std::string flag = argv[i];
        std::string value;
        bool inline_value = false;
        if (auto eq = flag.find('='); eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag.erase(eq);
            inline_value = true;
        }
        auto take_value = [&]() {
            if (inline_value) {
                return true;
            }
            if (i + 1 >= argc) {
                error = "missing value for " + flag;
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (flag == "--server") {
            if (!take_value()) {
                return false;
            }
            options.server_path = value;
        } else if (flag == "--build") {
            if (!take_value()) {
                return false;
            }
            options.build_command = value;
        } else if (flag == "--config") {
            if (!take_value()) {
                return false;
            }
            options.log_config = value;
        } else if (flag == "--timeout-ms") {
            if (!take_value()) {
                return false;
            }
            if (!parse_millis(value, options.timeout)) {
                error = "invalid --timeout-ms value: " + value;
                return false;
            }
        } else if (flag == "--build-timeout-ms") {
            if (!take_value()) {
                return false;
            }
            if (!parse_millis(value, options.build_timeout)) {
                error = "invalid --build-timeout-ms value: " + value;
                return false;
            }
        } else {
            error = std::string("unknown option: ") + argv[i];
            return false;
        }
    }
    return true;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options] [SERVER]\n"
           "\n"
           "Runs the stdio JSON-RPC conformance suite against SERVER.\n"
           "\n"
           "  --server PATH            target executable (default " + std::string(kDefaultServerPath) + ")\n"
           "  --build CMD              build command run before probing\n"
           "  --no-build               skip the build step\n"
           "  --timeout-ms N           per-probe timeout (default 5000)\n"
           "  --build-timeout-ms N     build timeout (default 600000)\n"
           "  --config PATH            log4cplus configuration (default log4cplus.ini)\n"
           "  --no-color               disable colored output\n"
           "  --parse-error-case       also send a malformed request line\n"
           "  -v, --version            print version and exit\n"
           "  -h, --help               print this help and exit\n";
}

} // namespace rpcprobe
