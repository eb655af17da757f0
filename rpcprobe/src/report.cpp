#include "report.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace rpcprobe {

Palette Palette::colored() {
    return Palette{"\033[0;31m", "\033[0;32m", "\033[1;33m", "\033[0m"};
}

Palette Palette::plain() {
    return Palette{};
}

size_t SuiteReport::passed() const {
    return static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const Result& result) { return result.passed; }));
}

Reporter::Reporter(std::ostream& out, Palette palette) : out_(out), palette_(std::move(palette)) {}

void Reporter::suite_started() {
    out_ << palette_.yellow << "=== Running conformance tests ===" << palette_.reset << std::endl;
}

void Reporter::case_started(const std::string& name) {
    out_ << '\n' << palette_.yellow << "Test: " << name << palette_.reset << std::endl;
}

void Reporter::case_finished(const Result& result) {
    if (result.passed) {
        out_ << palette_.green << "✓ PASSED" << palette_.reset << '\n';
    } else {
        out_ << palette_.red << "✗ FAILED" << palette_.reset << '\n';
    }
    if (result.detail) {
        print_detail(*result.detail);
    }
    out_.flush();
}

void Reporter::case_faulted(const Result& result) {
    out_ << palette_.red << "✗ EXCEPTION: " << result.detail.value_or("unknown error") << palette_.reset
         << std::endl;
}

void Reporter::summary(const SuiteReport& report) {
    out_ << '\n' << palette_.yellow << "=== Test Summary ===" << palette_.reset << '\n';
    for (const auto& result : report.results) {
        out_ << "  " << result.name << ": ";
        if (result.passed) {
            out_ << palette_.green << "PASSED" << palette_.reset << '\n';
        } else {
            out_ << palette_.red << "FAILED" << palette_.reset << '\n';
        }
    }

    out_ << '\n' << palette_.yellow << "Total: " << report.passed() << "/" << report.total() << " tests passed"
         << palette_.reset << '\n';
    if (report.exit_code() == 0) {
        out_ << palette_.green << "All tests passed!" << palette_.reset << std::endl;
    } else {
        out_ << palette_.red << "Some tests failed" << palette_.reset << std::endl;
    }
}

void Reporter::build_started() {
    out_ << palette_.yellow << "Building target..." << palette_.reset << std::endl;
}

void Reporter::build_finished(bool ok, const std::string& detail) {
    if (ok) {
        out_ << palette_.green << "Target built successfully" << palette_.reset << std::endl;
        return;
    }
    out_ << palette_.red << "Failed to build target" << palette_.reset << '\n';
    if (!detail.empty()) {
        out_ << detail;
        if (detail.back() != '\n') {
            out_ << '\n';
        }
    }
    out_.flush();
}

void Reporter::print_detail(const std::string& detail) {
    std::istringstream lines(detail);
    std::string line;
    while (std::getline(lines, line)) {
        out_ << "  " << line << '\n';
    }
}

} // namespace rpcprobe
