//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace arena {

// Bounded multi-producer multi-consumer queue. `try_push` never blocks; `pop` blocks until
// an item arrives or the queue is closed.
template <typename T>
class WorkQueue {
  public:
    explicit WorkQueue(std::size_t capacity) : capacity_(capacity) {}
    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    bool try_push(T item) {
        if (!try_reserve()) return false;
        push_reserved(std::move(item));
        return true;
    }

    // Claims a slot without publishing anything yet. Every successful call must be followed
    // by exactly one push_reserved or cancel_reservation.
    bool try_reserve() {
        std::lock_guard guard(lock_);
        if (closed_ || items_.size() + reserved_ >= capacity_) return false;
        reserved_++;
        return true;
    }
    void push_reserved(T item) {
        {
            std::lock_guard guard(lock_);
            reserved_--;
            items_.push(std::move(item));
        }
        cv_.notify_one();
    }
    void cancel_reservation() {
        std::lock_guard guard(lock_);
        reserved_--;
    }

    std::optional<T> pop() {
        std::unique_lock guard(lock_);
        cv_.wait(guard, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop();
        return item;
    }

    // Wakes every waiting consumer. Items still queued are left behind.
    void close() {
        {
            std::lock_guard guard(lock_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard guard(lock_);
        return items_.size();
    }
    std::size_t capacity() const { return capacity_; }

  private:
    const std::size_t capacity_;
    std::queue<T> items_;
    std::size_t reserved_ = 0;
    bool closed_ = false;
    mutable std::mutex lock_;
    std::condition_variable cv_;
};

}  // namespace arena
