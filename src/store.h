//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "submission.h"

namespace arena {

using submission_ptr = std::shared_ptr<const submission_t>;

// Persistence hook for submissions. Every method is atomic with respect to the others;
// transitions only move forward and fail (return false) from any other state.
class SubmissionStore {
  public:
    using listener_t = std::function<void(const submission_ptr &)>;

    SubmissionStore() = default;
    SubmissionStore(const SubmissionStore &) = delete;
    SubmissionStore &operator=(const SubmissionStore &) = delete;
    virtual ~SubmissionStore() = default;

    // Stores a new pending record and assigns `seq`. Throws std::invalid_argument if the id
    // is taken.
    virtual submission_ptr create(submission_t sub) = 0;
    // pending -> processing. A second claim of the same id fails.
    virtual bool claim(const std::string &id) = 0;
    // processing -> scored
    virtual bool finish_scored(const std::string &id, std::int64_t score,
                               tm_usage_t execution_ms) = 0;
    // processing -> error
    virtual bool finish_error(const std::string &id, submission_error_t err,
                              tm_usage_t execution_ms) = 0;

    virtual submission_ptr get(const std::string &id) const = 0;
    virtual std::vector<submission_ptr> list() const = 0;

    // Called after each successful create or transition, outside the store lock.
    virtual void add_listener(listener_t fn) = 0;
};

class MemoryStore : public SubmissionStore {
  public:
    submission_ptr create(submission_t sub) override;
    bool claim(const std::string &id) override;
    bool finish_scored(const std::string &id, std::int64_t score,
                       tm_usage_t execution_ms) override;
    bool finish_error(const std::string &id, submission_error_t err,
                      tm_usage_t execution_ms) override;

    submission_ptr get(const std::string &id) const override;
    std::vector<submission_ptr> list() const override;

    void add_listener(listener_t fn) override;

  private:
    mutable std::mutex lock_;
    std::unordered_map<std::string, submission_ptr> subs_;
    std::uint64_t next_seq_ = 0;
    std::vector<listener_t> listeners_;

    bool transition(const std::string &id, submission_status_t from,
                    const std::function<void(submission_t &)> &apply);
    void notify(const submission_ptr &snap) const;
};

}  // namespace arena
