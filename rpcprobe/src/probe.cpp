#include "probe.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace rpcprobe {

namespace {

struct OutcomeFromDecode {
    Outcome operator()(const Response& response) const { return Decoded{response}; }
    Outcome operator()(const DecodeError& error) const { return error; }
};

} // namespace

Outcome classify(const transport::RawOutput& raw, std::chrono::milliseconds timeout) {
    switch (raw.status) {
        case transport::ExchangeStatus::spawn_failed:
            return TransportError{"failed to start target: " + raw.detail};

        case transport::ExchangeStatus::timed_out: {
            std::string reason = "timed out after " + std::to_string(timeout.count()) + " ms";
            if (!raw.out.empty()) {
                reason += "; partial output: " + raw.out;
            }
            return TransportError{reason};
        }

        case transport::ExchangeStatus::completed:
            break;
    }

    Outcome outcome = std::visit(OutcomeFromDecode{}, codec::decode_response(raw.out));
    if (const auto* error = std::get_if<DecodeError>(&outcome)) {
        LOG4CPLUS_WARN(transport_logger(), "Undecodable reply (" << error->reason << "), exit=" << raw.exit_code
                                                                 << ", stderr: " << raw.err);
    } else if (raw.exit_code != 0) {
        LOG4CPLUS_DEBUG(transport_logger(), "Target exited with status " << raw.exit_code << " after a valid reply");
    }
    return outcome;
}

Outcome run_probe_line(const std::string& executable,
                       const std::string& request_line,
                       std::chrono::milliseconds timeout) {
    LOG4CPLUS_DEBUG(transport_logger(), "-> " << request_line);
    transport::RawOutput raw = transport::exchange(executable, request_line, timeout);
    LOG4CPLUS_DEBUG(transport_logger(), "<- [" << transport::to_string(raw.status) << "] " << raw.out);
    return classify(raw, timeout);
}

Outcome run_probe(const std::string& executable, const Request& request, std::chrono::milliseconds timeout) {
    return run_probe_line(executable, codec::encode_request(request), timeout);
}

} // namespace rpcprobe
