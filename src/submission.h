//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "sandbox.h"
#include "scorer.h"

namespace arena {

enum class submission_status_t : std::int8_t { _pending, _processing, _scored, _error };

std::string status_to_str(submission_status_t st);

namespace codes {

inline constexpr std::string_view _mismatch = "DECOMPRESSION_MISMATCH";
inline constexpr std::string_view _timeout = "DECOMPRESSION_TIMEOUT";
inline constexpr std::string_view _memory = "DECOMPRESSION_MEMORY";
inline constexpr std::string_view _runtime = "DECOMPRESSION_ERROR";
inline constexpr std::string_view _invalid_base64 = "INVALID_BASE64";
inline constexpr std::string_view _rate_limited = "RATE_LIMITED";
inline constexpr std::string_view _payload_too_large = "PAYLOAD_TOO_LARGE";
inline constexpr std::string_view _invalid_agent_id = "INVALID_AGENT_ID";
inline constexpr std::string_view _challenge_not_found = "CHALLENGE_NOT_FOUND";
inline constexpr std::string_view _challenge_inactive = "CHALLENGE_INACTIVE";
inline constexpr std::string_view _queue_full = "QUEUE_FULL";
inline constexpr std::string_view _internal = "INTERNAL_ERROR";

}  // namespace codes

// Maps an isolator verdict other than _ok to the submission error code.
std::string_view run_error_code(run_verdict_t ver);

struct submission_error_t {
    std::string code;
    std::string message;
};

// One record. The pipeline replaces the stored snapshot on every transition, so a
// `shared_ptr<const submission_t>` handed out by a poll never changes.
struct submission_t {
    std::string id;
    std::uint64_t seq{};  // arrival order, assigned by the store
    std::string challenge_id, agent_id;
    std::shared_ptr<const std::string> payload;  // decoded compressed bytes
    std::shared_ptr<const std::string> source;   // decompressor text
    submission_status_t status = submission_status_t::_pending;
    std::optional<std::int64_t> score;
    breakdown_t breakdown;
    std::optional<submission_error_t> error;
    tm_usage_t execution_ms{};
    std::chrono::system_clock::time_point created;

    bool is_terminal() const {
        return status == submission_status_t::_scored || status == submission_status_t::_error;
    }
    std::string to_str() const;
};

}  // namespace arena
