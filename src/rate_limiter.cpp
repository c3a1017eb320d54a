//
// Copyright (c) 2024-2025 JLGxy
//

#include "rate_limiter.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace arena {

namespace chrono = std::chrono;

void RateLimiter::prune(window_t &w, sys_clock::time_point now) const {
    while (!w.empty() && w.front() <= now - conf_.window) w.pop_front();
}

// Drops every pair whose newest admission has left the window.
void RateLimiter::sweep(sys_clock::time_point now) {
    std::erase_if(windows_, [&](const auto &kv) {
        return kv.second.empty() || kv.second.back() <= now - conf_.window;
    });
    sweep_at_ = std::max(_min_sweep_size, windows_.size() * 2);
}

bool RateLimiter::check_and_record(const std::string &agent, const std::string &challenge) {
    return check_and_record(agent, challenge, clock_());
}

bool RateLimiter::check_and_record(const std::string &agent, const std::string &challenge,
                                   sys_clock::time_point now) {
    const std::lock_guard guard(lock_);
    if (windows_.size() >= sweep_at_) sweep(now);
    auto it = windows_.try_emplace(std::make_pair(agent, challenge), conf_.cap).first;
    window_t &w = it->second;
    prune(w, now);
    if (w.size() >= conf_.cap) {
        if (w.empty()) windows_.erase(it);
        return false;
    }
    w.push_back(now);
    return true;
}

void RateLimiter::rollback(const std::string &agent, const std::string &challenge) {
    const std::lock_guard guard(lock_);
    auto it = windows_.find({agent, challenge});
    if (it == windows_.end()) return;
    if (!it->second.empty()) it->second.pop_back();
    if (it->second.empty()) windows_.erase(it);
}

std::size_t RateLimiter::tracked_pairs() const {
    const std::lock_guard guard(lock_);
    return windows_.size();
}

rate_status_t RateLimiter::status(const std::string &agent, const std::string &challenge) const {
    const auto now = clock_();
    const std::lock_guard guard(lock_);
    auto it = windows_.find({agent, challenge});
    if (it == windows_.end()) return {0, conf_.cap, 0};
    window_t w = it->second;
    prune(w, now);
    rate_status_t st{w.size(), conf_.cap - w.size(), 0};
    if (st.remaining == 0 && !w.empty()) {
        auto left = w.front() + conf_.window - now;
        st.reset_seconds = chrono::ceil<chrono::seconds>(left).count();
    }
    return st;
}

}  // namespace arena
