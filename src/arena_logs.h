//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <fcntl.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#define ARENA_FMT_COMPILE 0

#if ARENA_FMT_COMPILE
#include "fmt/compile.h"
#define ARENA_FMT FMT_COMPILE
#else
#define ARENA_FMT FMT_STRING
#endif

namespace arena::jl {

class FileLock {
  public:
    explicit FileLock(int fd) : fd_(fd) {
        if (flock(fd_, LOCK_EX) == -1) {
            throw std::runtime_error(std::string{"failed to get lock "} + strerror(errno));
        }
    }
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    ~FileLock() { flock(fd_, LOCK_UN); }

  private:
    const int fd_;
};

inline constexpr std::string_view _error_prefix = "\033[31m\033[1merror:\033[0m ";
inline constexpr std::string_view _warn_prefix = "\033[33m\033[1mwarning:\033[0m ";

// Console output of the service. Every line is also appended to the log file once one is
// opened. The sandbox helper never prints.
class ProgressBar {
  public:
    ProgressBar() = default;
    ProgressBar(const ProgressBar &) = delete;
    ProgressBar &operator=(const ProgressBar &) = delete;
    ~ProgressBar() {
        finish();
        if (log_file_fd_ != -1) close(log_file_fd_);
    }

    void open_log(const std::filesystem::path &file) {
        const std::lock_guard guard(file_lock_);
        int fd = openat(AT_FDCWD, file.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                        S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (fd == -1) {
            throw std::runtime_error(std::string{"failed to open log file "} + file.string() +
                                     ": " + strerror(errno));
        }
        if (log_file_fd_ != -1) close(log_file_fd_);
        log_file_fd_ = fd;
    }

    void init() {
        const std::lock_guard guard(lock_);
        if (!isatty(STDOUT_FILENO)) {
            return;
        }
        if (!init_) {
            init_ = true;
            std::cout << "\033[?25l";
            std::cout << std::nounitbuf;
            printbar();
        }
    }
    void finish() {
        const std::lock_guard guard(lock_);
        if (!init_) return;
        clearbar();
        std::cout << "\033[?25h" << std::flush;
        init_ = false;
    }

    template <typename... Args>
    auto println(fmt::format_string<Args...> f, Args &&...args) -> void {
        emit(fmt::format(f, std::forward<Args>(args)...), {});
    }

    template <typename... Args>
    auto warn(fmt::format_string<Args...> f, Args &&...args) -> void {
        emit(fmt::format(f, std::forward<Args>(args)...), _warn_prefix);
    }

    template <typename... Args>
    auto error(fmt::format_string<Args...> f, Args &&...args) -> void {
        emit(fmt::format(f, std::forward<Args>(args)...), _error_prefix);
    }

    auto setprogress(double prog) -> void {
        const std::lock_guard guard(lock_);
        progress_ = prog;
        clearbar();
        printbar();
    }

  private:
    double progress_ = 0;
    bool init_ = false;
    std::mutex lock_, file_lock_;
    int log_file_fd_{-1};
    std::ostream *out_ = &std::cerr;  // stdout stays machine readable

    auto write_log(std::string_view s) -> void {
        const std::lock_guard guard(file_lock_);
        if (log_file_fd_ == -1) return;
        FileLock f_lock(log_file_fd_);
        std::string_view rest = s;
        while (!rest.empty()) {
            ::ssize_t t = ::write(log_file_fd_, rest.data(), rest.size());
            if (t <= 0) break;
            rest.remove_prefix(static_cast<std::size_t>(t));
        }
    }

    auto emit(const std::string &line, std::string_view prefix) -> void {
        {
            const std::lock_guard guard(lock_);
            clearbar();
            *out_ << prefix << line << '\n';
            printbar();
        }
        write_log(line + '\n');
    }

    auto printbar() const -> void {
        if (!init_) return;

        winsize sz;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &sz) == -1) {
            return;
        }
        std::cout << "\033[0m";

        int perc = static_cast<int>(std::round(progress_ * 100));
        if (sz.ws_col <= 16) {
            std::cout << perc << "%";
            std::cout << std::flush;
            return;
        }
        int tot = sz.ws_col - 11;
        int fill = static_cast<int>(std::round(tot * progress_));
        int blank = tot - fill;

        std::cout << "[";
        for (int i = 0; i < fill; i++) std::cout << '#';
        for (int i = 0; i < blank; i++) std::cout << '.';
        std::cout << "] ";
        std::cout << "\033[42m";
        std::cout << fmt::format(ARENA_FMT("[{: >3}%]"), perc);
        std::cout << "\033[0m";
        std::cout << std::flush;
    }
    auto clearbar() const -> void {
        if (!init_) return;
        std::cout << "\033[2K\r" << std::flush;
    }
};

inline jl::ProgressBar prog;

class ProgressBarWrapper {
  public:
    ProgressBarWrapper() { prog.init(); }
    ProgressBarWrapper(const ProgressBarWrapper &) = delete;
    ProgressBarWrapper &operator=(const ProgressBarWrapper &) = delete;
    ~ProgressBarWrapper() { prog.finish(); }
};

}  // namespace arena::jl
