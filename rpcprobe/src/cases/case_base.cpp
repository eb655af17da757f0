#include "case_base.hpp"

#include "../json_codec.hpp"
#include "../probe.hpp"

namespace rpcprobe::cases {

Verdict ConformanceCase::run(const CaseContext& ctx) const {
	return evaluate(run_probe_line(ctx.executable, request_line(), ctx.timeout));
}

std::string RequestCase::request_line() const {
	return codec::encode_request(request());
}

} // namespace rpcprobe::cases
