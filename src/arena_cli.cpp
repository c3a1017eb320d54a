//
// Copyright (c) 2024-2025 JLGxy
//

#include "arena_cli.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "arena_conf.h"
#include "arena_error.h"
#include "arena_logs.h"
#include "config.h"
#include "fmt/core.h"
#include "leaderboard.h"
#include "pipeline.h"
#include "rate_limiter.h"
#include "registry.h"
#include "sandbox.h"
#include "store.h"
#include "validator.h"

namespace arena::cli {

namespace {

constexpr std::string_view _payload_name = "payload.bin";
constexpr std::string_view _source_name = "decompress.py";

std::string read_file(const fs::path &src) {
    std::ifstream in(src, std::ios::binary);
    if (!fs::is_regular_file(src) || !in) throw ArenaError("cannot read " + src.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Everything a submission needs, wired together in dependency order.
class Arena {
  public:
    explicit Arena(arena_conf_t conf)
            : conf_(std::move(conf)),
              limiter_(conf_.rate_limit),
              runner_(conf_.sandbox_helper.value_or(PosixRunner::default_helper_path())),
              pipeline_(conf_, challenges_, agents_, store_, limiter_, runner_) {
        if (conf_.log_file) jl::prog.open_log(*conf_.log_file);
        load_challenges(conf_, challenges_);
    }
    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    Pipeline &pipeline() { return pipeline_; }
    SubmissionStore &store() { return store_; }
    const ChallengeRegistry &challenges() const { return challenges_; }

    // Blocks until `id` is terminal.
    submission_ptr wait_done(const std::string &id) {
        auto snap = pipeline_.wait(id, std::chrono::seconds(1));
        while (snap && !snap->is_terminal()) snap = pipeline_.wait(id, std::chrono::seconds(1));
        return snap;
    }

  private:
    arena_conf_t conf_;
    ChallengeRegistry challenges_;
    AgentRegistry agents_;
    MemoryStore store_;
    RateLimiter limiter_;
    PosixRunner runner_;
    Pipeline pipeline_;
};

class Check : public po::CommandBase {
  public:
    std::string_view get_name() const override { return "check"; }
    std::string_view get_desc() const override { return "validate a decompressor"; }
    void init_parser() override {
        parser.add("source", 's', "decompressor source file", false, 1, 1);
        parser.add("config", 'c', "take the validator limits from this config", true, 1, 1);
    }
    int run() override {
        validator_conf_t vconf;
        auto conf_file = parser.get<std::string>("config", "");
        if (!conf_file.empty()) vconf = load_config(conf_file).validator;

        auto res = validate(read_file(parser.get<std::string>("source")), vconf);
        if (res.ok()) {
            std::cout << "ok" << std::endl;
            return 0;
        }
        for (const auto &v : res.violations) std::cout << v.to_str() << '\n';
        std::cout << res.error_code() << std::endl;
        return 1;
    }
};

class Run : public po::CommandBase {
  public:
    std::string_view get_name() const override { return "run"; }
    std::string_view get_desc() const override { return "judge one submission"; }
    void init_parser() override {
        parser.add("config", 'c', "arena config file", false, 1, 1);
        parser.add("challenge", 'C', "challenge id", false, 1, 1);
        parser.add("agent", 'a', "agent id", false, 1, 1);
        parser.add("payload", 'p', "compressed data file", false, 1, 1);
        parser.add("source", 'd', "decompressor source file", false, 1, 1);
        parser.add("base64", 0, "the payload file holds base64 text", true, 0, 0);
    }
    int run() override {
        auto conf = load_config(parser.get<std::string>("config"));
        conf.pipeline.workers = 1;
        Arena arena(std::move(conf));

        auto challenge = parser.get<std::string>("challenge");
        auto agent = parser.get<std::string>("agent");
        auto payload = read_file(parser.get<std::string>("payload"));
        auto source = read_file(parser.get<std::string>("source"));

        std::string id;
        try {
            id = parser.get<bool>("base64")
                         ? arena.pipeline().submit(challenge, agent, payload, std::move(source))
                         : arena.pipeline().submit_raw(challenge, agent, std::move(payload),
                                                       std::move(source));
        } catch (const IntakeError &e) {
            jl::prog.error(ARENA_FMT("rejected ({}): {}"), e.code(), e.message());
            return 1;
        }
        arena.pipeline().start();
        auto snap = arena.wait_done(id);
        arena.pipeline().stop();

        std::cout << snap->to_str() << std::endl;
        return snap->status == submission_status_t::_scored ? 0 : 1;
    }
};

class Batch : public po::CommandBase {
  public:
    std::string_view get_name() const override { return "batch"; }
    std::string_view get_desc() const override {
        return "judge DIR/<agent>/<challenge>/ and print the rankings";
    }
    void init_parser() override {
        parser.add("config", 'c', "arena config file", false, 1, 1);
        parser.add("dir", 'd', "submissions directory", false, 1, 1);
    }
    int run() override {
        auto jobs = find_batch_jobs(parser.get<std::string>("dir"));
        if (jobs.empty()) {
            jl::prog.warn(ARENA_FMT("no submissions found"));
            return 0;
        }
        auto conf = load_config(parser.get<std::string>("config"));
        // every job must fit in the queue at once
        conf.pipeline.queue_capacity = std::max(conf.pipeline.queue_capacity, jobs.size());
        Arena arena(std::move(conf));

        std::vector<std::string> ids;
        int rejected = 0;
        for (const auto &job : jobs) {
            try {
                ids.emplace_back(arena.pipeline().submit_raw(job.challenge_id, job.agent_id,
                                                             read_file(job.payload),
                                                             read_file(job.source)));
            } catch (const IntakeError &e) {
                jl::prog.error(ARENA_FMT("{} on {} rejected ({}): {}"), job.agent_id,
                               job.challenge_id, e.code(), e.message());
                rejected++;
            }
        }

        const std::size_t total = ids.size();
        auto finished = std::make_shared<std::atomic<std::size_t>>(0);
        arena.store().add_listener([finished, total](const submission_ptr &snap) {
            if (!snap->is_terminal() || total == 0) return;
            jl::prog.setprogress(static_cast<double>(++*finished) / static_cast<double>(total));
        });

        {
            jl::ProgressBarWrapper bar;
            arena.pipeline().start();
            for (const auto &id : ids) arena.wait_done(id);
            arena.pipeline().stop();
        }

        int failed = rejected;
        auto subs = arena.store().list();
        for (const auto &sub : subs) {
            if (sub->status != submission_status_t::_scored) failed++;
        }
        for (const auto &challenge_id : arena.challenges().ids()) {
            auto rows = rank_challenge(subs, challenge_id);
            if (rows.empty()) continue;
            std::cout << format_leaderboard(challenge_id, rows) << std::endl;
        }
        jl::prog.println(ARENA_FMT("{} judged, {} scored, {} failed or rejected"), jobs.size(),
                         static_cast<int>(jobs.size()) - failed, failed);
        return failed ? 1 : 0;
    }
};

}  // namespace

std::vector<batch_job_t> find_batch_jobs(const fs::path &dir) {
    if (!fs::is_directory(dir)) throw ArenaError("not a directory: " + dir.string());
    std::vector<batch_job_t> jobs;
    for (const auto &agent_dir : fs::directory_iterator(dir)) {
        if (!agent_dir.is_directory()) continue;
        for (const auto &ch_dir : fs::directory_iterator(agent_dir.path())) {
            if (!ch_dir.is_directory()) continue;
            auto payload = ch_dir.path() / _payload_name;
            auto source = ch_dir.path() / _source_name;
            if (!fs::is_regular_file(payload) || !fs::is_regular_file(source)) continue;
            jobs.push_back({agent_dir.path().filename().string(),
                            ch_dir.path().filename().string(), payload, source});
        }
    }
    std::ranges::sort(jobs, [](const batch_job_t &a, const batch_job_t &b) {
        if (a.agent_id != b.agent_id) return a.agent_id < b.agent_id;
        return a.challenge_id < b.challenge_id;
    });
    return jobs;
}

CliHandler::CliHandler() {
    handler_.set_name("arena", ARENA_VERSION);
    handler_.add_command(std::make_unique<Check>());
    handler_.add_command(std::make_unique<Run>());
    handler_.add_command(std::make_unique<Batch>());
}

int CliHandler::run(int argc, char **argv) {
    try {
        return handler_.parse_and_run(po::strvec(argv + 1, argv + argc));
    } catch (const po::OptionError &e) {
        jl::prog.println(ARENA_FMT("{}"), e.what());
        std::cerr << handler_.usage();
        return 2;
    } catch (const std::exception &e) {
        jl::prog.finish();
        jl::prog.println(ARENA_FMT("{}"), e.what());
        return 2;
    }
}

}  // namespace arena::cli
