//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "arena_error.h"
#include "rate_limiter.h"
#include "registry.h"
#include "sandbox.h"
#include "validator.h"

namespace YAML {
class Node;
}

namespace arena {

namespace fs = std::filesystem;

struct pipeline_conf_t {
    std::size_t workers = 4;
    std::size_t queue_capacity = 64;
    std::size_t max_payload_bytes = std::size_t{16} << 20;
    tm_usage_t retry_backoff_ms = 100;
};

struct challenge_conf_t {
    std::string id, title, scoring;
    fs::path input;  // resolved against the config file's directory
    bool active = true;
};

struct arena_conf_t {
    sandbox_limits_t sandbox;
    std::optional<fs::path> sandbox_helper;  // default: arena-sandbox beside the executable
    rate_limit_conf_t rate_limit;
    pipeline_conf_t pipeline;
    validator_conf_t validator;
    std::optional<fs::path> log_file;
    std::vector<challenge_conf_t> challenges;
};

using getenv_fn = std::function<const char *(const char *)>;

// Reads `file` and applies the environment overrides. Throws ConfigError.
arena_conf_t load_config(const fs::path &file, const getenv_fn &env = std::getenv);
arena_conf_t parse_config(const YAML::Node &root, const fs::path &base_dir);
// SANDBOX_TIMEOUT (seconds), SANDBOX_MEMORY_MB, SANDBOX_MAX_OUTPUT (bytes),
// SUBMISSIONS_PER_HOUR.
void apply_env_overrides(arena_conf_t &conf, const getenv_fn &env);

// Loads every configured dataset into `reg`. Throws ConfigError if a file cannot be read.
void load_challenges(const arena_conf_t &conf, ChallengeRegistry &reg);

}  // namespace arena
