#pragma once

#include "harness_options.hpp"
#include "report.hpp"

namespace rpcprobe {

/**
 * Optional build, then the case set selected by `options` against the target.
 *
 * A failed build returns 1 before any case runs. Otherwise the suite's exit
 * code: 0 iff every case passed.
 */
int run_harness(const HarnessOptions& options, Reporter& reporter);

} // namespace rpcprobe
