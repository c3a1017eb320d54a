//
// Copyright (c) 2024-2025 JLGxy
//

#include "pipeline.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "arena_logs.h"
#include "base64.h"
#include "fmt/core.h"
#include "scorer.h"

namespace arena {

namespace chrono = std::chrono;

Pipeline::Pipeline(const arena_conf_t &conf, ChallengeRegistry &challenges,
                   AgentRegistry &agents, SubmissionStore &store, RateLimiter &limiter,
                   IsolatedRunner &runner)
        : limits_(conf.sandbox),
          pipeline_conf_(conf.pipeline),
          validator_conf_(conf.validator),
          challenges_(challenges),
          agents_(agents),
          store_(store),
          limiter_(limiter),
          runner_(runner),
          queue_(conf.pipeline.queue_capacity) {}

void Pipeline::start() {
    const std::lock_guard guard(workers_lock_);
    if (!workers_.empty()) return;
    workers_.reserve(pipeline_conf_.workers);
    for (std::size_t i = 0; i < pipeline_conf_.workers; i++) {
        workers_.emplace_back(&Pipeline::worker_loop, this);
    }
}

void Pipeline::stop() {
    queue_.close();
    const std::lock_guard guard(workers_lock_);
    for (auto &t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

std::string Pipeline::new_id() {
    const std::lock_guard guard(uuid_lock_);
    return boost::uuids::to_string(uuid_gen_());
}

void Pipeline::check_agent_id(const std::string &agent_id) {
    if (!is_valid_agent_id(agent_id)) {
        throw IntakeError(codes::_invalid_agent_id, "agent id must be 1-64 characters of "
                                                    "[A-Za-z0-9_.-]");
    }
}

std::string Pipeline::submit(const std::string &challenge_id, const std::string &agent_id,
                             const std::string_view compressed_base64,
                             std::string decompressor_source) {
    check_agent_id(agent_id);
    auto payload = sb_base64::base64_decode(compressed_base64);
    if (!payload) throw IntakeError(codes::_invalid_base64, "compressed data is not valid base64");
    return admit(challenge_id, agent_id, std::move(*payload), std::move(decompressor_source));
}

std::string Pipeline::submit_raw(const std::string &challenge_id, const std::string &agent_id,
                                 std::string payload, std::string decompressor_source) {
    check_agent_id(agent_id);
    return admit(challenge_id, agent_id, std::move(payload), std::move(decompressor_source));
}

std::string Pipeline::admit(const std::string &challenge_id, const std::string &agent_id,
                            std::string payload, std::string decompressor_source) {
    auto ch = challenges_.find(challenge_id);
    if (!ch) {
        throw IntakeError(codes::_challenge_not_found,
                          fmt::format(ARENA_FMT("challenge '{}' not found"), challenge_id));
    }
    if (!ch->active) {
        throw IntakeError(codes::_challenge_inactive,
                          fmt::format(ARENA_FMT("challenge '{}' is not active"), challenge_id));
    }
    if (payload.size() > pipeline_conf_.max_payload_bytes) {
        throw IntakeError(codes::_payload_too_large,
                          fmt::format(ARENA_FMT("compressed payload is {} bytes, the limit is {}"),
                                      payload.size(), pipeline_conf_.max_payload_bytes));
    }
    if (!limiter_.check_and_record(agent_id, challenge_id)) {
        auto st = limiter_.status(agent_id, challenge_id);
        throw IntakeError(codes::_rate_limited,
                          fmt::format(ARENA_FMT("at most {} submissions per {}s, retry in {}s"),
                                      limiter_.conf().cap, limiter_.conf().window.count(),
                                      st.reset_seconds));
    }
    if (!queue_.try_reserve()) {
        limiter_.rollback(agent_id, challenge_id);
        throw IntakeError(codes::_queue_full, "judging queue is full, try again later");
    }

    submission_t sub;
    try {
        agents_.get_or_create(agent_id);
        sub.id = new_id();
        sub.challenge_id = challenge_id;
        sub.agent_id = agent_id;
        sub.breakdown = {payload.size(), decompressor_source.size()};
        sub.payload = std::make_shared<const std::string>(std::move(payload));
        sub.source = std::make_shared<const std::string>(std::move(decompressor_source));
        sub.created = sys_clock::now();
        auto snap = store_.create(std::move(sub));
        queue_.push_reserved(snap->id);
        return snap->id;
    } catch (const std::exception &e) {
        queue_.cancel_reservation();
        limiter_.rollback(agent_id, challenge_id);
        jl::prog.error(ARENA_FMT("intake failed: {}"), e.what());
        throw IntakeError(codes::_internal, "internal error");
    }
}

submission_ptr Pipeline::wait(const std::string &id, chrono::milliseconds timeout) {
    const auto deadline = chrono::steady_clock::now() + timeout;
    std::unique_lock guard(done_lock_);
    while (true) {
        auto snap = store_.get(id);
        if (!snap || snap->is_terminal()) return snap;
        if (done_cv_.wait_until(guard, deadline) == std::cv_status::timeout) {
            return store_.get(id);
        }
    }
}

void Pipeline::worker_loop() {
    while (auto id = queue_.pop()) {
        process(*id);
    }
}

bool Pipeline::run_isolated(const analyzed_program_t &program, const std::string &input,
                            run_result_t &res, submission_error_t &err) {
    for (int attempt = 0;; attempt++) {
        try {
            res = runner_.run(program, input, limits_);
            return true;
        } catch (const SpawnError &e) {
            if (attempt >= limits_.spawn_retries) {
                jl::prog.error(ARENA_FMT("sandbox unavailable after {} attempts: {}"),
                               attempt + 1, e.message());
                err = {std::string(codes::_internal), "sandbox unavailable"};
                return false;
            }
            jl::prog.warn(ARENA_FMT("spawn failed ({}), retrying"), e.message());
            std::this_thread::sleep_for(
                    chrono::milliseconds(pipeline_conf_.retry_backoff_ms * (attempt + 1)));
        }
    }
}

Pipeline::outcome_t Pipeline::judge(const submission_t &sub) {
    outcome_t out{false, 0, {}, 0};

    auto ch = challenges_.find(sub.challenge_id);
    if (!ch) {
        out.error = {std::string(codes::_challenge_not_found), "challenge no longer exists"};
        return out;
    }
    if (!ch->active) {
        out.error = {std::string(codes::_challenge_inactive), "challenge is no longer active"};
        return out;
    }

    auto checked = validate(*sub.source, validator_conf_);
    if (!checked.ok()) {
        out.error = {checked.error_code(), checked.message()};
        return out;
    }

    run_result_t run{run_verdict_t::_re};
    if (!run_isolated(*checked.program, *sub.payload, run, out.error)) return out;
    out.execution_ms = run.wall_ms;
    if (!run.ok()) {
        out.error = {std::string(run_error_code(run.verdict)), run.info};
        return out;
    }

    auto sc = score(*ch->dataset, run.output, sub.breakdown.compressed_bytes,
                    sub.breakdown.decompressor_bytes);
    if (!sc.ok()) {
        out.error = {sc.error_code(), sc.mismatch->to_str()};
        return out;
    }
    out.scored = true;
    out.score = *sc.score;
    return out;
}

void Pipeline::process(const std::string &id) {
    if (!store_.claim(id)) {
        jl::prog.warn(ARENA_FMT("submission {} is not pending, skipped"), id);
        return;
    }
    const auto start = chrono::steady_clock::now();
    auto sub = store_.get(id);
    bool committed = false;
    try {
        auto out = judge(*sub);
        if (out.execution_ms == 0) {
            out.execution_ms = chrono::duration_cast<chrono::milliseconds>(
                                       chrono::steady_clock::now() - start)
                                       .count();
        }
        if (out.scored) {
            committed = store_.finish_scored(id, out.score, out.execution_ms);
            jl::prog.println(ARENA_FMT("submission {} by {} on {}: scored {}"), id, sub->agent_id,
                             sub->challenge_id, out.score);
        } else {
            committed = store_.finish_error(id, out.error, out.execution_ms);
            jl::prog.println(ARENA_FMT("submission {} by {} on {}: {}"), id, sub->agent_id,
                             sub->challenge_id, out.error.code);
        }
    } catch (const std::exception &e) {
        jl::prog.error(ARENA_FMT("submission {}: unexpected failure: {}"), id, e.what());
        committed = store_.finish_error(id, {std::string(codes::_internal), "internal error"},
                                        chrono::duration_cast<chrono::milliseconds>(
                                                chrono::steady_clock::now() - start)
                                                .count());
    }
    if (!committed) jl::prog.error(ARENA_FMT("submission {}: terminal state not recorded"), id);
    {
        const std::lock_guard guard(done_lock_);
    }
    done_cv_.notify_all();
}

}  // namespace arena
