#pragma once

#include "case_base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rpcprobe::cases {

/// Cases in registration order; that order is the run and report order.
class CaseRegistry {
public:
    void add(std::unique_ptr<ConformanceCase> test_case);
    const ConformanceCase* find(const std::string& name) const;

    const std::vector<std::unique_ptr<ConformanceCase>>& cases() const { return cases_; }
    size_t size() const { return cases_.size(); }

private:
    std::vector<std::unique_ptr<ConformanceCase>> cases_;
};

void register_default_cases(CaseRegistry& registry);
void register_parse_error_case(CaseRegistry& registry);

} // namespace rpcprobe::cases
