//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <boost/circular_buffer.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace arena {

using sys_clock = std::chrono::system_clock;

struct rate_limit_conf_t {
    std::size_t cap = 10;
    std::chrono::seconds window{3600};
};

struct rate_status_t {
    std::size_t used;
    std::size_t remaining;
    long long reset_seconds;  // until the oldest admission leaves the window, 0 if not full
};

// Rolling-window admission counter per (agent, challenge) pair. An admission at `t` counts
// against every check in (t, t + window).
class RateLimiter {
  public:
    using clock_fn = std::function<sys_clock::time_point()>;

    explicit RateLimiter(rate_limit_conf_t conf, clock_fn clock = [] { return sys_clock::now(); })
            : conf_(conf), clock_(std::move(clock)) {}
    RateLimiter(const RateLimiter &) = delete;
    RateLimiter &operator=(const RateLimiter &) = delete;

    // Records the admission and returns true iff fewer than `cap` admissions are in the window.
    bool check_and_record(const std::string &agent, const std::string &challenge);
    bool check_and_record(const std::string &agent, const std::string &challenge,
                          sys_clock::time_point now);
    // Forgets the newest admission of the pair.
    void rollback(const std::string &agent, const std::string &challenge);
    rate_status_t status(const std::string &agent, const std::string &challenge) const;

    const rate_limit_conf_t &conf() const { return conf_; }
    // Pairs with at least one admission that may still be in the window.
    std::size_t tracked_pairs() const;

  private:
    using window_t = boost::circular_buffer<sys_clock::time_point>;

    rate_limit_conf_t conf_;
    clock_fn clock_;
    std::map<std::pair<std::string, std::string>, window_t> windows_;
    std::size_t sweep_at_ = _min_sweep_size;
    mutable std::mutex lock_;

    static constexpr std::size_t _min_sweep_size = 64;

    void prune(window_t &w, sys_clock::time_point now) const;
    void sweep(sys_clock::time_point now);
};

}  // namespace arena
