//
// Copyright (c) 2024-2025 JLGxy
//

#include <unistd.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "arena_conf.h"
#include "gtest/gtest.h"
#include "registry.h"
#include "scorer.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

arena::getenv_fn env_of(const std::map<std::string, std::string> &vars) {
    return [vars](const char *name) -> const char * {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

std::string error_key(const std::string &yaml) {
    try {
        arena::parse_config(YAML::Load(yaml), "/base");
    } catch (const arena::ConfigError &e) {
        return e.key();
    }
    return "";
}

class TempDir {
  public:
    TempDir() {
        path_ = fs::temp_directory_path() /
                ("arena_test_" + std::to_string(getpid()) + "_" + std::to_string(counter_++));
        fs::create_directories(path_);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path &path() const { return path_; }

  private:
    fs::path path_;
    static inline int counter_ = 0;
};

}  // namespace

TEST(config, defaults) {
    auto conf = arena::parse_config(YAML::Load(""), "/base");
    EXPECT_EQ(conf.sandbox.timeout_ms, 60000);
    EXPECT_EQ(conf.sandbox.memory_bytes, 512L << 20);
    EXPECT_EQ(conf.sandbox.spawn_retries, 3);
    EXPECT_EQ(conf.rate_limit.cap, 10u);
    EXPECT_EQ(conf.rate_limit.window, 3600s);
    EXPECT_EQ(conf.validator.max_code_length, 100000u);
    EXPECT_FALSE(conf.log_file.has_value());
    EXPECT_FALSE(conf.sandbox_helper.has_value());
    EXPECT_TRUE(conf.challenges.empty());
}

TEST(config, fullFile) {
    const char *text = R"(
sandbox:
  timeout_ms: 1500
  cpu_ms: 1000
  memory_mb: 64
  grace_period_ms: 100
  max_output_bytes: 4096
  spawn_retries: 1
  helper: bin/arena-sandbox
rate_limit:
  submissions: 5
  window_seconds: 60
pipeline:
  workers: 2
  queue_capacity: 8
validator:
  max_code_length: 2000
log_file: arena.log
challenges:
  - id: enwik
    title: English text
    scoring: compressed + decompressor bytes
    input: data/enwik.bin
  - id: old
    input: /abs/old.bin
    active: false
)";
    auto conf = arena::parse_config(YAML::Load(text), "/srv/arena");
    EXPECT_EQ(conf.sandbox.timeout_ms, 1500);
    EXPECT_EQ(conf.sandbox.cpu_ms, 1000);
    EXPECT_EQ(conf.sandbox.memory_bytes, 64L << 20);
    EXPECT_EQ(conf.sandbox.grace_ms, 100);
    EXPECT_EQ(conf.sandbox.max_output_bytes, 4096u);
    EXPECT_EQ(conf.sandbox.spawn_retries, 1);
    EXPECT_EQ(*conf.sandbox_helper, fs::path("/srv/arena/bin/arena-sandbox"));
    EXPECT_EQ(conf.rate_limit.cap, 5u);
    EXPECT_EQ(conf.rate_limit.window, 60s);
    EXPECT_EQ(conf.pipeline.workers, 2u);
    EXPECT_EQ(conf.pipeline.queue_capacity, 8u);
    EXPECT_EQ(conf.validator.max_code_length, 2000u);
    EXPECT_EQ(*conf.log_file, fs::path("/srv/arena/arena.log"));
    ASSERT_EQ(conf.challenges.size(), 2u);
    EXPECT_EQ(conf.challenges[0].id, "enwik");
    EXPECT_EQ(conf.challenges[0].input, fs::path("/srv/arena/data/enwik.bin"));
    EXPECT_TRUE(conf.challenges[0].active);
    EXPECT_EQ(conf.challenges[1].title, "old");
    EXPECT_EQ(conf.challenges[1].input, fs::path("/abs/old.bin"));
    EXPECT_FALSE(conf.challenges[1].active);
}

TEST(config, invalidValuesNameTheKey) {
    EXPECT_EQ(error_key("sandbox:\n  timeout_ms: fast\n"), "sandbox.timeout_ms");
    EXPECT_EQ(error_key("sandbox:\n  memory_mb: 0\n"), "sandbox.memory_mb");
    EXPECT_EQ(error_key("pipeline:\n  workers: 0\n"), "pipeline.workers");
    EXPECT_EQ(error_key("sandbox: 5\n"), "sandbox");
    EXPECT_EQ(error_key("challenges:\n  - title: x\n"), "challenges[0].id");
    EXPECT_EQ(error_key("challenges:\n  - id: a\n    input: a\n  - id: a\n    input: b\n"),
              "challenges[1].id");
    EXPECT_EQ(error_key("challenges:\n  - id: a\n    input: a\n    active: maybe\n"),
              "challenges[0].active");
}

TEST(config, environmentOverrides) {
    arena::arena_conf_t conf;
    arena::apply_env_overrides(conf, env_of({{"SANDBOX_TIMEOUT", "30"},
                                             {"SANDBOX_MEMORY_MB", "128"},
                                             {"SANDBOX_MAX_OUTPUT", "1000"},
                                             {"SUBMISSIONS_PER_HOUR", "3"}}));
    EXPECT_EQ(conf.sandbox.timeout_ms, 30000);
    EXPECT_EQ(conf.sandbox.cpu_ms, 30000);
    EXPECT_EQ(conf.sandbox.memory_bytes, 128L << 20);
    EXPECT_EQ(conf.sandbox.max_output_bytes, 1000u);
    EXPECT_EQ(conf.rate_limit.cap, 3u);
    EXPECT_EQ(conf.rate_limit.window, 3600s);

    arena::arena_conf_t untouched;
    arena::apply_env_overrides(untouched, env_of({}));
    EXPECT_EQ(untouched.sandbox.timeout_ms, 60000);

    EXPECT_THROW(arena::apply_env_overrides(conf, env_of({{"SANDBOX_TIMEOUT", "abc"}})),
                 arena::ConfigError);
    EXPECT_THROW(arena::apply_env_overrides(conf, env_of({{"SANDBOX_MEMORY_MB", "0"}})),
                 arena::ConfigError);
}

TEST(config, loadFileAndDatasets) {
    TempDir dir;
    std::ofstream(dir.path() / "data.bin", std::ios::binary) << "the dataset";
    std::ofstream(dir.path() / "arena.yaml") << "sandbox:\n  timeout_ms: 2000\n"
                                                "challenges:\n  - id: c1\n    input: data.bin\n";

    auto conf = arena::load_config(dir.path() / "arena.yaml",
                                   env_of({{"SANDBOX_MEMORY_MB", "32"}}));
    EXPECT_EQ(conf.sandbox.timeout_ms, 2000);
    EXPECT_EQ(conf.sandbox.memory_bytes, 32L << 20);

    arena::ChallengeRegistry reg;
    arena::load_challenges(conf, reg);
    auto ch = reg.find("c1");
    ASSERT_TRUE(ch.has_value());
    EXPECT_EQ(*ch->dataset, "the dataset");
    EXPECT_EQ(ch->dataset_size(), 11u);
    EXPECT_EQ(ch->dataset_sha256, arena::sha256_hex("the dataset"));

    conf.challenges[0].input = dir.path() / "missing.bin";
    arena::ChallengeRegistry other;
    EXPECT_THROW(arena::load_challenges(conf, other), arena::ConfigError);
    EXPECT_THROW(arena::load_config(dir.path() / "nope.yaml", env_of({})), arena::ConfigError);
}
