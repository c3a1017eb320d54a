//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>

#include "arena_error.h"
#include "interpreter.h"
#include "validator.h"

#ifndef __linux__
#error "only linux is supported"
#endif

static_assert(sizeof(void *) == 8, "can only compile and run on 64-bit machines");

namespace arena {

using tm_usage_t = long;
using mem_usage_t = long;

enum class run_verdict_t : std::int8_t {
    _ok = 0,
    _re = 3,   // runtime failure
    _tle = 4,  // wall clock deadline
    _mle = 5,
    _ole = 7,
    _cle = 8,  // cpu time
};

std::string run_verdict_to_str(run_verdict_t ver);

struct sandbox_limits_t {
    tm_usage_t timeout_ms = 60000;
    tm_usage_t cpu_ms = 60000;
    mem_usage_t memory_bytes = 512L << 20;
    tm_usage_t grace_ms = 2000;
    std::size_t max_output_bytes = std::size_t{64} << 20;
    int spawn_retries = 3;
    int max_call_depth = script::_default_max_call_depth;
};

struct run_result_t {
    run_verdict_t verdict;
    std::string output;  // set only for _ok
    tm_usage_t wall_ms{};
    tm_usage_t cpu_ms{};
    mem_usage_t max_rss_kib{};
    std::string info;

    bool ok() const { return verdict == run_verdict_t::_ok; }
    std::string to_str() const;
};

// The pipe, the process or the helper could not be started. Never caused by the submitted
// program.
class SpawnError : public ArenaError {
  public:
    using ArenaError::ArenaError;
};

class IsolatedRunner {
  public:
    IsolatedRunner() = default;
    IsolatedRunner(const IsolatedRunner &) = delete;
    IsolatedRunner &operator=(const IsolatedRunner &) = delete;
    virtual ~IsolatedRunner() = default;

    // Runs `decompress(input)` of `program` and classifies the outcome. Throws SpawnError.
    virtual run_result_t run(const analyzed_program_t &program, std::string_view input,
                             const sandbox_limits_t &limits) = 0;
};

// One anonymous pipe. Both ends are closed on destruction.
class MyPipe {
  public:
    MyPipe();
    MyPipe(const MyPipe &) = delete;
    MyPipe &operator=(const MyPipe &) = delete;
    ~MyPipe() { close(); }

    void close_read() {
        if (!closed_[0]) ::close(fd_[0]), closed_[0] = true;
    }
    void close_write() {
        if (!closed_[1]) ::close(fd_[1]), closed_[1] = true;
    }
    void close() {
        close_read();
        close_write();
    }

    // Returns false on error. Retries short writes.
    bool write_all(std::string_view s) const;
    // Reads until EOF. Keeps at most `limit` bytes and sets `truncated` if more arrived.
    // Returns false on error.
    bool read_all(std::string &s, std::size_t limit, bool &truncated) const;

    int read_fd() const { return fd_[0]; }
    int write_fd() const { return fd_[1]; }
    bool failed() const { return closed_[0] && closed_[1]; }

  private:
    int fd_[2]{-1, -1};
    bool closed_[2]{false, false};
};

// Result channel framing:
// tag (1 byte) | peak rss in KiB (8 bytes) | payload length (8 bytes) | payload.
// Integers are in host order.
enum class channel_tag : std::uint8_t {
    _ok = 1,
    _fault = 2,
    _memory = 3,
    _output_limit = 4,
};

struct channel_message_t {
    channel_tag tag;
    std::uint64_t peak_rss_kib;  // measured by the helper on its own image
    std::string payload;
};

std::string encode_message(const channel_message_t &msg);
// Returns false if `raw` is not exactly one well-formed message.
bool decode_message(std::string_view raw, channel_message_t &msg);

// Request framing, parent to helper: eight 8-byte fields (cpu_ms, memory_bytes,
// max_output_bytes, max_call_depth, max_code_length, max_nesting_depth, source length,
// input length), then the source, then the input.
std::string encode_request_header(const analyzed_program_t &program, std::size_t input_size,
                                  const sandbox_limits_t &limits);

// Runs each program in a fresh `arena-sandbox` process: fork, then execve of the helper
// with an empty environment, so the child image holds none of the parent's memory. The
// helper reads the request from stdin, sets rlimits, installs the seccomp filter and
// answers on fd 3. The wall deadline is enforced by the parent.
class PosixRunner : public IsolatedRunner {
  public:
    explicit PosixRunner(std::filesystem::path helper = default_helper_path());

    run_result_t run(const analyzed_program_t &program, std::string_view input,
                     const sandbox_limits_t &limits) override;

    const std::filesystem::path &helper() const { return helper_; }

    // `arena-sandbox` next to the running executable.
    static std::filesystem::path default_helper_path();
    // Installs the syscall filter in the calling process. Returns false on failure.
    static bool configure_seccomp();

  private:
    std::filesystem::path helper_;
};

// Entry point of the `arena-sandbox` helper image. Returns its exit status.
int sandbox_main();

}  // namespace arena
