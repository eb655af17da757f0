#pragma once

#include "protocol.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace rpcprobe {

/// ANSI colors for the report. plain() yields empty sequences.
struct Palette {
    std::string red;
    std::string green;
    std::string yellow;
    std::string reset;

    static Palette colored();
    static Palette plain();
};

struct SuiteReport {
    std::vector<Result> results;

    size_t passed() const;
    size_t total() const { return results.size(); }
    int exit_code() const { return passed() == total() ? 0 : 1; }
};

class Reporter {
public:
    Reporter(std::ostream& out, Palette palette);

    void suite_started();
    void case_started(const std::string& name);
    void case_finished(const Result& result);
    void case_faulted(const Result& result);
    void summary(const SuiteReport& report);

    void build_started();
    void build_finished(bool ok, const std::string& detail);

private:
    void print_detail(const std::string& detail);

    std::ostream& out_;
    Palette palette_;
};

} // namespace rpcprobe
