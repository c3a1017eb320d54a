//
// Copyright (c) 2024-2025 JLGxy
//

#include "store.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace arena {

submission_ptr MemoryStore::create(submission_t sub) {
    submission_ptr snap;
    {
        const std::lock_guard guard(lock_);
        if (subs_.count(sub.id) != 0) {
            throw std::invalid_argument("duplicate submission id " + sub.id);
        }
        sub.seq = next_seq_++;
        sub.status = submission_status_t::_pending;
        sub.score.reset();
        sub.error.reset();
        snap = std::make_shared<const submission_t>(std::move(sub));
        subs_.emplace(snap->id, snap);
    }
    notify(snap);
    return snap;
}

bool MemoryStore::transition(const std::string &id, submission_status_t from,
                             const std::function<void(submission_t &)> &apply) {
    submission_ptr snap;
    {
        const std::lock_guard guard(lock_);
        auto it = subs_.find(id);
        if (it == subs_.end() || it->second->status != from) return false;
        auto next = std::make_shared<submission_t>(*it->second);
        apply(*next);
        snap = std::move(next);
        it->second = snap;
    }
    notify(snap);
    return true;
}

bool MemoryStore::claim(const std::string &id) {
    return transition(id, submission_status_t::_pending,
                      [](submission_t &s) { s.status = submission_status_t::_processing; });
}

bool MemoryStore::finish_scored(const std::string &id, std::int64_t score,
                                tm_usage_t execution_ms) {
    return transition(id, submission_status_t::_processing, [&](submission_t &s) {
        s.status = submission_status_t::_scored;
        s.score = score;
        s.execution_ms = execution_ms;
    });
}

bool MemoryStore::finish_error(const std::string &id, submission_error_t err,
                               tm_usage_t execution_ms) {
    return transition(id, submission_status_t::_processing, [&](submission_t &s) {
        s.status = submission_status_t::_error;
        s.error = std::move(err);
        s.execution_ms = execution_ms;
    });
}

submission_ptr MemoryStore::get(const std::string &id) const {
    const std::lock_guard guard(lock_);
    auto it = subs_.find(id);
    return it == subs_.end() ? nullptr : it->second;
}

std::vector<submission_ptr> MemoryStore::list() const {
    std::vector<submission_ptr> out;
    {
        const std::lock_guard guard(lock_);
        out.reserve(subs_.size());
        for (const auto &[id, snap] : subs_) out.push_back(snap);
    }
    std::sort(out.begin(), out.end(),
              [](const submission_ptr &a, const submission_ptr &b) { return a->seq < b->seq; });
    return out;
}

void MemoryStore::add_listener(listener_t fn) {
    const std::lock_guard guard(lock_);
    listeners_.push_back(std::move(fn));
}

void MemoryStore::notify(const submission_ptr &snap) const {
    std::vector<listener_t> fns;
    {
        const std::lock_guard guard(lock_);
        fns = listeners_;
    }
    for (const auto &fn : fns) fn(snap);
}

}  // namespace arena
