#include "case_registry.hpp"

#include <utility>

namespace rpcprobe::cases {

void CaseRegistry::add(std::unique_ptr<ConformanceCase> test_case) {
    if (!test_case) {
        return;
    }
    cases_.push_back(std::move(test_case));
}

const ConformanceCase* CaseRegistry::find(const std::string& name) const {
    for (const auto& test_case : cases_) {
        if (name == test_case->name()) {
            return test_case.get();
        }
    }
    return nullptr;
}

} // namespace rpcprobe::cases
