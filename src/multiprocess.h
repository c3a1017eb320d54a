//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <concepts>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace arena::multiproc {

using steady_clock = std::chrono::steady_clock;

// A forked child running a callable. The child never returns into the caller's stack: it
// leaves through `_exit` so no atexit handler or static destructor of the parent runs twice.
class Process {
  public:
    Process() = default;
    Process(Process &&o) noexcept
            : pid_(std::exchange(o.pid_, 0)),
              status_(std::exchange(o.status_, 0)),
              alive_(std::exchange(o.alive_, false)),
              fail_(std::exchange(o.fail_, false)),
              usage_(o.usage_) {}
    template <typename T, typename... Args>
        requires(!std::same_as<Process, std::remove_cvref_t<T>>) && std::invocable<T, Args...>
    explicit Process(T &&f, Args &&...args) {
        pid_t pid = fork();
        if (pid == -1) {
            fail_ = true;
            return;
        }
        if (pid == 0) {
            std::invoke(std::forward<T>(f), std::forward<Args>(args)...);
            _exit(0);
        }
        pid_ = pid;
        alive_ = true;
    }
    Process(const Process &) = delete;
    Process &operator=(const Process &) = delete;
    Process &operator=(Process &&) = delete;
    ~Process() {
        if (alive_) {
            kill(SIGKILL);
            join();
        }
    }

    // Blocks until the child is reaped.
    void join() {
        while (alive_) {
            int status = 0;
            pid_t wid = wait4(pid_, &status, 0, &usage_);
            if (wid == pid_) {
                status_ = status;
                alive_ = false;
            } else if (wid == -1 && errno != EINTR) {
                alive_ = false;
            }
        }
    }

    // Reaps the child if it has terminated. Returns whether it is still running.
    bool is_alive() {
        if (!alive_) return false;
        int status = 0;
        pid_t wid = wait4(pid_, &status, WNOHANG, &usage_);
        if (wid == pid_) {
            status_ = status;
            alive_ = false;
        } else if (wid == -1 && errno != EINTR) {
            alive_ = false;
        }
        return alive_;
    }

    // Polls until the child is reaped or `deadline` passes. Returns true if reaped.
    bool wait_until(steady_clock::time_point deadline) {
        constexpr auto _poll_interval = std::chrono::milliseconds(2);
        while (is_alive()) {
            if (steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(_poll_interval);
        }
        return true;
    }

    bool failed() const { return fail_; }
    bool if_exited() const { return !alive_ && WIFEXITED(status_); }
    bool if_signaled() const { return !alive_ && WIFSIGNALED(status_); }
    int exit_status() const { return WIFEXITED(status_) ? WEXITSTATUS(status_) : -1; }
    int term_sig() const { return WIFSIGNALED(status_) ? WTERMSIG(status_) : 0; }
    const rusage &usage() const { return usage_; }

    int kill(int sig) const { return alive_ ? ::kill(pid_, sig) : -1; }

  private:
    pid_t pid_{};
    int status_{};
    bool alive_{false}, fail_{false};
    rusage usage_{};
};

}  // namespace arena::multiproc
