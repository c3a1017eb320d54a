//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "arena_conf.h"
#include "arena_error.h"
#include "rate_limiter.h"
#include "registry.h"
#include "sandbox.h"
#include "store.h"
#include "submission.h"
#include "validator.h"
#include "work_queue.h"

namespace arena {

// A submission refused before any record exists. `code` is one of the intake codes.
class IntakeError : public ArenaError {
  public:
    IntakeError(const std::string_view code, const std::string_view what_arg)
            : ArenaError(what_arg), code_(code) {}
    const std::string &code() const { return code_; }

  private:
    std::string code_;
};

// Intake, bounded queue and worker pool. Each worker owns one submission from claim to its
// terminal state; stages run in order admission -> validation -> isolation -> scoring.
class Pipeline {
  public:
    Pipeline(const arena_conf_t &conf, ChallengeRegistry &challenges, AgentRegistry &agents,
             SubmissionStore &store, RateLimiter &limiter, IsolatedRunner &runner);
    Pipeline(const Pipeline &) = delete;
    Pipeline &operator=(const Pipeline &) = delete;
    ~Pipeline() { stop(); }

    void start();
    // Closes the queue and joins the workers. Queued submissions stay pending.
    void stop();

    // Returns the new submission id. Throws IntakeError.
    std::string submit(const std::string &challenge_id, const std::string &agent_id,
                       std::string_view compressed_base64, std::string decompressor_source);
    std::string submit_raw(const std::string &challenge_id, const std::string &agent_id,
                           std::string payload, std::string decompressor_source);

    submission_ptr poll(const std::string &id) const { return store_.get(id); }
    // Blocks until the submission is terminal or `timeout` passes. Returns the latest snapshot.
    submission_ptr wait(const std::string &id, std::chrono::milliseconds timeout);

    // Runs every stage of one claimed-or-pending submission on the calling thread.
    void process(const std::string &id);

  private:
    struct outcome_t {
        bool scored;
        std::int64_t score;
        submission_error_t error;
        tm_usage_t execution_ms;
    };

    sandbox_limits_t limits_;
    pipeline_conf_t pipeline_conf_;
    validator_conf_t validator_conf_;
    ChallengeRegistry &challenges_;
    AgentRegistry &agents_;
    SubmissionStore &store_;
    RateLimiter &limiter_;
    IsolatedRunner &runner_;

    WorkQueue<std::string> queue_;
    std::vector<std::thread> workers_;
    std::mutex workers_lock_;

    std::mutex uuid_lock_;
    boost::uuids::random_generator uuid_gen_;

    std::mutex done_lock_;
    std::condition_variable done_cv_;

    std::string new_id();
    static void check_agent_id(const std::string &agent_id);
    // Intake after the agent id and the payload encoding were accepted.
    std::string admit(const std::string &challenge_id, const std::string &agent_id,
                      std::string payload, std::string decompressor_source);
    void worker_loop();
    outcome_t judge(const submission_t &sub);
    bool run_isolated(const analyzed_program_t &program, const std::string &input,
                      run_result_t &res, submission_error_t &err);
};

}  // namespace arena
