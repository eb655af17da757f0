#pragma once

#include "process_runner.hpp"
#include "protocol.hpp"

#include <chrono>
#include <string>

namespace rpcprobe {

/// Single attempt: spawn, exchange one line, decode. No retries.
Outcome run_probe(const std::string& executable,
                  const Request& request,
                  std::chrono::milliseconds timeout = transport::kDefaultTimeout);

/// Same as run_probe, for a request line that is already encoded.
Outcome run_probe_line(const std::string& executable,
                       const std::string& request_line,
                       std::chrono::milliseconds timeout = transport::kDefaultTimeout);

/// Maps one exchange onto an Outcome. The codec only sees completed exchanges.
Outcome classify(const transport::RawOutput& raw, std::chrono::milliseconds timeout);

} // namespace rpcprobe
