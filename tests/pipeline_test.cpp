//
// Copyright (c) 2024-2025 JLGxy
//

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arena_conf.h"
#include "base64.h"
#include "gtest/gtest.h"
#include "interpreter.h"
#include "pipeline.h"
#include "rate_limiter.h"
#include "registry.h"
#include "sandbox.h"
#include "store.h"

using arena::IntakeError;
using arena::run_result_t;
using arena::run_verdict_t;
using arena::submission_status_t;
using namespace std::chrono_literals;

namespace {

const std::string _identity = "def decompress(data):\n    return data\n";

// Interprets the program on the calling thread. `hook` may replace the outcome.
class InProcessRunner : public arena::IsolatedRunner {
  public:
    std::function<run_result_t(std::string_view)> hook;
    int spawn_failures = 0;
    std::atomic<int> calls{0};

    run_result_t run(const arena::analyzed_program_t &program, std::string_view input,
                     const arena::sandbox_limits_t &limits) override {
        calls++;
        if (spawn_failures > 0) {
            spawn_failures--;
            throw arena::SpawnError("fork: resource temporarily unavailable");
        }
        if (hook) return hook(input);
        run_result_t res{run_verdict_t::_ok};
        res.wall_ms = 7;
        try {
            arena::script::Interpreter interp(program.module(), limits.max_call_depth);
            interp.run_module();
            res.output = interp.call_entry(input);
        } catch (const arena::script::ScriptError &e) {
            res.verdict = run_verdict_t::_re;
            res.info = e.what();
        }
        return res;
    }
};

struct arena_fixture_t {
    arena::arena_conf_t conf;
    arena::ChallengeRegistry challenges;
    arena::AgentRegistry agents;
    arena::MemoryStore store;
    arena::RateLimiter limiter;
    InProcessRunner runner;
    arena::Pipeline pipeline;

    explicit arena_fixture_t(arena::arena_conf_t c)
            : conf(std::move(c)),
              limiter(conf.rate_limit),
              pipeline(conf, challenges, agents, store, limiter, runner) {
        challenges.add(arena::make_challenge("text", "Text", "bytes", dataset()));
        challenges.add(arena::make_challenge("closed", "Closed", "bytes", "x", false));
    }

    static std::string dataset() {
        std::string s;
        for (int i = 0; i < 100; i++) s += "hello arena ";
        return s;
    }

    std::string error_code_of(const std::string &id) {
        auto snap = store.get(id);
        return snap && snap->error ? snap->error->code : "";
    }
};

arena::arena_conf_t test_conf() {
    arena::arena_conf_t conf;
    conf.pipeline.workers = 2;
    conf.pipeline.retry_backoff_ms = 1;
    return conf;
}

std::string intake_code(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const IntakeError &e) {
        return e.code();
    }
    return "";
}

}  // namespace

TEST(pipeline, identityScoresDatasetPlusSource) {
    arena_fixture_t a(test_conf());
    auto data = arena_fixture_t::dataset();
    auto id = a.pipeline.submit_raw("text", "agent-1", data, _identity);
    EXPECT_EQ(a.store.get(id)->status, submission_status_t::_pending);

    a.pipeline.process(id);
    auto snap = a.store.get(id);
    ASSERT_EQ(snap->status, submission_status_t::_scored) << snap->to_str();
    EXPECT_EQ(*snap->score, static_cast<std::int64_t>(data.size() + _identity.size()));
    EXPECT_EQ(snap->breakdown.compressed_bytes, data.size());
    EXPECT_EQ(snap->breakdown.decompressor_bytes, _identity.size());
    EXPECT_EQ(snap->execution_ms, 7);
    EXPECT_NE(a.agents.find("agent-1"), nullptr);
}

TEST(pipeline, base64Intake) {
    arena_fixture_t a(test_conf());
    const std::string src = "def decompress(data):\n    return data * 100\n";
    auto id = a.pipeline.submit("text", "agent", arena::sb_base64::base64_encode("hello arena "),
                                src);
    a.pipeline.process(id);
    auto snap = a.pipeline.poll(id);
    ASSERT_EQ(snap->status, submission_status_t::_scored) << snap->to_str();
    EXPECT_EQ(*snap->score, static_cast<std::int64_t>(12 + src.size()));

    EXPECT_EQ(intake_code([&] { a.pipeline.submit("text", "agent", "not base64!", src); }),
              "INVALID_BASE64");
    // the agent id is checked before the payload encoding
    EXPECT_EQ(intake_code([&] { a.pipeline.submit("text", "bad id", "not base64!", src); }),
              "INVALID_AGENT_ID");
    EXPECT_EQ(intake_code([&] {
                  a.pipeline.submit("text", "", arena::sb_base64::base64_encode("x"), src);
              }),
              "INVALID_AGENT_ID");
    EXPECT_EQ(a.store.list().size(), 1u);
}

TEST(pipeline, importNeverReachesTheRunner) {
    arena_fixture_t a(test_conf());
    auto id = a.pipeline.submit_raw(
            "text", "agent", "x", "def decompress(data):\n    import zlib\n    return data\n");
    a.pipeline.process(id);
    EXPECT_EQ(a.store.get(id)->status, submission_status_t::_error);
    EXPECT_EQ(a.error_code_of(id), "DECOMPRESSION_ImportError");
    EXPECT_EQ(a.runner.calls.load(), 0);
}

TEST(pipeline, mismatchReportsOffset) {
    arena_fixture_t a(test_conf());
    auto id = a.pipeline.submit_raw("text", "agent", arena_fixture_t::dataset(),
                                    "def decompress(data):\n    return data[:40] + b'!'\n");
    a.pipeline.process(id);
    auto snap = a.store.get(id);
    EXPECT_EQ(a.error_code_of(id), "DECOMPRESSION_MISMATCH");
    EXPECT_NE(snap->error->message.find("offset 40"), std::string::npos) << snap->to_str();
    EXPECT_FALSE(snap->score.has_value());
}

TEST(pipeline, rateLimitCreatesNoRecord) {
    arena_fixture_t a(test_conf());
    for (int i = 0; i < 10; i++) a.pipeline.submit_raw("text", "agent", "x", _identity);
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("text", "agent", "x", _identity); }),
              "RATE_LIMITED");
    EXPECT_EQ(a.store.list().size(), 10u);
    // the cap is per (agent, challenge)
    EXPECT_NO_THROW(a.pipeline.submit_raw("text", "other", "x", _identity));
}

TEST(pipeline, intakeRejections) {
    auto conf = test_conf();
    conf.pipeline.max_payload_bytes = 16;
    arena_fixture_t a(conf);
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("text", "bad id", "x", _identity); }),
              "INVALID_AGENT_ID");
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("text", "a..b", "x", _identity); }),
              "INVALID_AGENT_ID");
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("nope", "agent", "x", _identity); }),
              "CHALLENGE_NOT_FOUND");
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("closed", "agent", "x", _identity); }),
              "CHALLENGE_INACTIVE");
    EXPECT_EQ(intake_code([&] {
                  a.pipeline.submit_raw("text", "agent", std::string(17, 'x'), _identity);
              }),
              "PAYLOAD_TOO_LARGE");
    EXPECT_TRUE(a.store.list().empty());
    EXPECT_EQ(a.limiter.status("agent", "text").used, 0u);
    EXPECT_EQ(a.agents.size(), 0u);
}

TEST(pipeline, queueFullRollsBack) {
    auto conf = test_conf();
    conf.pipeline.queue_capacity = 2;
    arena_fixture_t a(conf);
    a.pipeline.submit_raw("text", "agent", "x", _identity);
    a.pipeline.submit_raw("text", "agent", "x", _identity);
    EXPECT_EQ(intake_code([&] { a.pipeline.submit_raw("text", "agent", "x", _identity); }),
              "QUEUE_FULL");
    EXPECT_EQ(a.store.list().size(), 2u);
    EXPECT_EQ(a.limiter.status("agent", "text").used, 2u);
}

TEST(pipeline, spawnFailuresAreRetried) {
    arena_fixture_t a(test_conf());
    a.runner.spawn_failures = 2;
    auto id = a.pipeline.submit_raw("text", "agent", arena_fixture_t::dataset(), _identity);
    a.pipeline.process(id);
    EXPECT_EQ(a.store.get(id)->status, submission_status_t::_scored);
    EXPECT_EQ(a.runner.calls.load(), 3);
}

TEST(pipeline, sandboxUnavailable) {
    auto conf = test_conf();
    conf.sandbox.spawn_retries = 1;
    arena_fixture_t a(conf);
    a.runner.spawn_failures = 5;
    auto id = a.pipeline.submit_raw("text", "agent", "x", _identity);
    a.pipeline.process(id);
    EXPECT_EQ(a.error_code_of(id), "INTERNAL_ERROR");
    EXPECT_EQ(a.runner.calls.load(), 2);
}

TEST(pipeline, runnerVerdictsMapToCodes) {
    arena_fixture_t a(test_conf());
    const std::pair<run_verdict_t, std::string> cases[] = {
            {run_verdict_t::_tle, "DECOMPRESSION_TIMEOUT"},
            {run_verdict_t::_cle, "DECOMPRESSION_TIMEOUT"},
            {run_verdict_t::_mle, "DECOMPRESSION_MEMORY"},
            {run_verdict_t::_re, "DECOMPRESSION_ERROR"},
            {run_verdict_t::_ole, "DECOMPRESSION_ERROR"},
    };
    for (const auto &[verdict, code] : cases) {
        a.runner.hook = [v = verdict](std::string_view) {
            run_result_t r{v};
            r.wall_ms = 61000;
            r.info = "limit";
            return r;
        };
        auto id = a.pipeline.submit_raw("text", "agent", "x", _identity);
        a.pipeline.process(id);
        auto snap = a.store.get(id);
        EXPECT_EQ(a.error_code_of(id), code);
        EXPECT_EQ(snap->execution_ms, 61000);
    }
}

TEST(pipeline, admissionRecheckedByWorker) {
    arena_fixture_t a(test_conf());
    auto id = a.pipeline.submit_raw("text", "agent", "x", _identity);
    a.challenges.set_active("text", false);
    a.pipeline.process(id);
    EXPECT_EQ(a.error_code_of(id), "CHALLENGE_INACTIVE");
    EXPECT_EQ(a.runner.calls.load(), 0);
}

TEST(pipeline, terminalStateIsFinal) {
    arena_fixture_t a(test_conf());
    auto id = a.pipeline.submit_raw("text", "agent", arena_fixture_t::dataset(), _identity);
    a.pipeline.process(id);
    auto first = a.store.get(id);
    a.pipeline.process(id);
    EXPECT_EQ(a.store.get(id), first);
    EXPECT_EQ(a.runner.calls.load(), 1);
}

TEST(pipeline, workersDrainTheQueue) {
    arena_fixture_t a(test_conf());
    std::vector<std::string> ids;
    for (int i = 0; i < 6; i++) {
        ids.push_back(a.pipeline.submit_raw("text", "agent" + std::to_string(i),
                                            arena_fixture_t::dataset(), _identity));
    }
    a.pipeline.start();
    for (const auto &id : ids) {
        auto snap = a.pipeline.wait(id, 10s);
        ASSERT_NE(snap, nullptr);
        EXPECT_EQ(snap->status, submission_status_t::_scored);
    }
    a.pipeline.stop();
    EXPECT_EQ(a.pipeline.wait("unknown", 1ms), nullptr);
}

TEST(pipeline, realSandboxEndToEnd) {
    auto conf = test_conf();
    conf.sandbox.timeout_ms = 300;
    conf.sandbox.grace_ms = 100;
    conf.sandbox.memory_bytes = 256L << 20;
    arena::ChallengeRegistry challenges;
    arena::AgentRegistry agents;
    arena::MemoryStore store;
    arena::RateLimiter limiter(conf.rate_limit);
    arena::PosixRunner runner(ARENA_SANDBOX_HELPER);
    arena::Pipeline pipeline(conf, challenges, agents, store, limiter, runner);
    challenges.add(arena::make_challenge("text", "Text", "bytes", arena_fixture_t::dataset()));
    pipeline.start();

    auto loop = pipeline.submit_raw("text", "looper", "x",
                                    "def decompress(data):\n    while True:\n        pass\n");
    auto good = pipeline.submit_raw("text", "agent", arena_fixture_t::dataset(), _identity);

    auto looped = pipeline.wait(loop, 20s);
    ASSERT_TRUE(looped->is_terminal());
    EXPECT_EQ(looped->error->code, "DECOMPRESSION_TIMEOUT");
    EXPECT_LT(looped->execution_ms, 300 + 100 + 2000);

    auto scored = pipeline.wait(good, 20s);
    ASSERT_EQ(scored->status, submission_status_t::_scored) << scored->to_str();
    EXPECT_EQ(*scored->score,
              static_cast<std::int64_t>(arena_fixture_t::dataset().size() + _identity.size()));
    pipeline.stop();
}
