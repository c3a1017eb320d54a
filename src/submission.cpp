//
// Copyright (c) 2024-2025 JLGxy
//

#include "submission.h"

#include <string>
#include <string_view>

#include "fmt/core.h"

namespace arena {

std::string status_to_str(submission_status_t st) {
    switch (st) {
        case submission_status_t::_pending: return "pending";
        case submission_status_t::_processing: return "processing";
        case submission_status_t::_scored: return "scored";
        case submission_status_t::_error: return "error";
    }
    return "unknown";
}

std::string_view run_error_code(run_verdict_t ver) {
    switch (ver) {
        case run_verdict_t::_tle:
        case run_verdict_t::_cle: return codes::_timeout;
        case run_verdict_t::_mle: return codes::_memory;
        case run_verdict_t::_ok:
        case run_verdict_t::_re:
        case run_verdict_t::_ole: break;
    }
    return codes::_runtime;
}

std::string submission_t::to_str() const {
    auto head = fmt::format(ARENA_FMT("{} [{}] agent {} challenge {}"), id, status_to_str(status),
                            agent_id, challenge_id);
    if (score) {
        return head + fmt::format(ARENA_FMT(": score {} (compressed {} + decompressor {}), {}ms"),
                                  *score, breakdown.compressed_bytes,
                                  breakdown.decompressor_bytes, execution_ms);
    }
    if (error) return head + fmt::format(ARENA_FMT(": {}: {}"), error->code, error->message);
    return head;
}

}  // namespace arena
