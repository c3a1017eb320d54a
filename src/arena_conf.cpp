//
// Copyright (c) 2024-2025 JLGxy
//

#include "arena_conf.h"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "fmt/core.h"

namespace arena {

namespace {

long long read_int(const YAML::Node &node, const std::string &key, long long min_value) {
    long long v = 0;
    try {
        v = node.as<long long>();
    } catch (const YAML::Exception &) {
        throw ConfigError(key, "expected an integer");
    }
    if (v < min_value) {
        throw ConfigError(key, fmt::format(ARENA_FMT("must be at least {}"), min_value));
    }
    return v;
}

template <typename T>
void read_opt(const YAML::Node &section, const std::string &prefix, const char *key, T &out,
              long long min_value) {
    const YAML::Node &n = section[key];
    if (!n.IsDefined() || n.IsNull()) return;
    out = static_cast<T>(read_int(n, prefix + "." + key, min_value));
}

std::string read_str(const YAML::Node &node, const std::string &key) {
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception &) {
        throw ConfigError(key, "expected a string");
    }
}

bool read_bool(const YAML::Node &node, const std::string &key) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception &) {
        throw ConfigError(key, "expected true or false");
    }
}

YAML::Node section_of(const YAML::Node &root, const char *name) {
    YAML::Node n = root[name];
    if (n.IsDefined() && !n.IsNull() && !n.IsMap()) throw ConfigError(name, "expected a mapping");
    return n;
}

long long env_int(const getenv_fn &env, const char *name, long long min_value) {
    const char *s = env(name);
    if (s == nullptr || *s == '\0') return -1;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < min_value) {
        throw ConfigError(name, fmt::format(ARENA_FMT("invalid value '{}'"), s));
    }
    return v;
}

}  // namespace

arena_conf_t parse_config(const YAML::Node &root, const fs::path &base_dir) {
    arena_conf_t conf;
    if (root.IsNull() || !root.IsDefined()) return conf;
    if (!root.IsMap()) throw ConfigError("<root>", "expected a mapping");

    if (auto sb = section_of(root, "sandbox"); sb.IsMap()) {
        auto &lim = conf.sandbox;
        read_opt(sb, "sandbox", "timeout_ms", lim.timeout_ms, 1);
        read_opt(sb, "sandbox", "cpu_ms", lim.cpu_ms, 1);
        if (sb["memory_mb"].IsDefined()) {
            lim.memory_bytes = static_cast<mem_usage_t>(
                    read_int(sb["memory_mb"], "sandbox.memory_mb", 1) << 20);
        }
        read_opt(sb, "sandbox", "grace_period_ms", lim.grace_ms, 0);
        read_opt(sb, "sandbox", "max_output_bytes", lim.max_output_bytes, 0);
        read_opt(sb, "sandbox", "spawn_retries", lim.spawn_retries, 0);
        read_opt(sb, "sandbox", "max_call_depth", lim.max_call_depth, 1);
        if (sb["helper"].IsDefined() && !sb["helper"].IsNull()) {
            conf.sandbox_helper = base_dir / read_str(sb["helper"], "sandbox.helper");
        }
    }
    if (auto rl = section_of(root, "rate_limit"); rl.IsMap()) {
        read_opt(rl, "rate_limit", "submissions", conf.rate_limit.cap, 0);
        if (rl["window_seconds"].IsDefined()) {
            conf.rate_limit.window = std::chrono::seconds(
                    read_int(rl["window_seconds"], "rate_limit.window_seconds", 1));
        }
    }
    if (auto pl = section_of(root, "pipeline"); pl.IsMap()) {
        read_opt(pl, "pipeline", "workers", conf.pipeline.workers, 1);
        read_opt(pl, "pipeline", "queue_capacity", conf.pipeline.queue_capacity, 1);
        read_opt(pl, "pipeline", "max_payload_bytes", conf.pipeline.max_payload_bytes, 0);
        read_opt(pl, "pipeline", "retry_backoff_ms", conf.pipeline.retry_backoff_ms, 0);
    }
    if (auto vd = section_of(root, "validator"); vd.IsMap()) {
        read_opt(vd, "validator", "max_code_length", conf.validator.max_code_length, 1);
        read_opt(vd, "validator", "max_nesting_depth", conf.validator.max_nesting_depth, 1);
    }
    if (root["log_file"].IsDefined() && !root["log_file"].IsNull()) {
        conf.log_file = base_dir / read_str(root["log_file"], "log_file");
    }

    const YAML::Node &chs = root["challenges"];
    if (chs.IsDefined() && !chs.IsNull()) {
        if (!chs.IsSequence()) throw ConfigError("challenges", "expected a list");
        for (std::size_t i = 0; i < chs.size(); i++) {
            const YAML::Node &c = chs[i];
            auto key = fmt::format(ARENA_FMT("challenges[{}]"), i);
            if (!c.IsMap()) throw ConfigError(key, "expected a mapping");
            challenge_conf_t ch;
            if (!c["id"].IsDefined()) throw ConfigError(key + ".id", "missing");
            if (!c["input"].IsDefined()) throw ConfigError(key + ".input", "missing");
            ch.id = read_str(c["id"], key + ".id");
            if (ch.id.empty()) throw ConfigError(key + ".id", "must not be empty");
            ch.title = c["title"].IsDefined() ? read_str(c["title"], key + ".title") : ch.id;
            if (c["scoring"].IsDefined()) ch.scoring = read_str(c["scoring"], key + ".scoring");
            ch.input = base_dir / read_str(c["input"], key + ".input");
            if (c["active"].IsDefined()) ch.active = read_bool(c["active"], key + ".active");
            for (const auto &other : conf.challenges) {
                if (other.id == ch.id) throw ConfigError(key + ".id", "duplicate id " + ch.id);
            }
            conf.challenges.push_back(std::move(ch));
        }
    }
    return conf;
}

void apply_env_overrides(arena_conf_t &conf, const getenv_fn &env) {
    if (auto v = env_int(env, "SANDBOX_TIMEOUT", 1); v != -1) {
        conf.sandbox.timeout_ms = static_cast<tm_usage_t>(v * 1000);
        conf.sandbox.cpu_ms = static_cast<tm_usage_t>(v * 1000);
    }
    if (auto v = env_int(env, "SANDBOX_MEMORY_MB", 1); v != -1) {
        conf.sandbox.memory_bytes = static_cast<mem_usage_t>(v << 20);
    }
    if (auto v = env_int(env, "SANDBOX_MAX_OUTPUT", 0); v != -1) {
        conf.sandbox.max_output_bytes = static_cast<std::size_t>(v);
    }
    if (auto v = env_int(env, "SUBMISSIONS_PER_HOUR", 0); v != -1) {
        conf.rate_limit.cap = static_cast<std::size_t>(v);
        conf.rate_limit.window = std::chrono::seconds(3600);
    }
}

arena_conf_t load_config(const fs::path &file, const getenv_fn &env) {
    std::ifstream conf_stream(file);
    if (!conf_stream) throw ConfigError(file.string(), "cannot open config file");
    YAML::Node node;
    try {
        node = YAML::Load(conf_stream);
    } catch (const YAML::Exception &e) {
        throw ConfigError(file.string(), e.what());
    }
    auto conf = parse_config(node, file.parent_path());
    apply_env_overrides(conf, env);
    return conf;
}

void load_challenges(const arena_conf_t &conf, ChallengeRegistry &reg) {
    for (const auto &ch : conf.challenges) {
        std::ifstream in(ch.input, std::ios::binary);
        if (!fs::is_regular_file(ch.input) || !in) {
            throw ConfigError("challenges." + ch.id + ".input",
                              "cannot read dataset " + ch.input.string());
        }
        std::stringstream ss;
        ss << in.rdbuf();
        reg.add(make_challenge(ch.id, ch.title, ch.scoring, ss.str(), ch.active));
    }
}

}  // namespace arena
