//
// Copyright (c) 2024-2025 JLGxy
//

#include "sandbox.h"

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "multiprocess.h"
#include "script_value.h"

namespace arena {

namespace mpc = multiproc;
namespace chrono = std::chrono;

namespace {

constexpr std::size_t _header_size = 17;
constexpr std::size_t _request_fields = 8;
constexpr std::size_t _request_header_size = _request_fields * 8;
constexpr int _channel_fd = 3;
// Descriptors are parked above this before being moved to 0..3.
constexpr int _park_fd = 10;
// The child exits with this when it could not sandbox itself.
constexpr int _setup_failed_status = 121;
constexpr std::string_view _helper_name = "arena-sandbox";

constexpr unsigned _syscalls_denied[] = {
        __NR_execve,
        __NR_execveat,
#ifdef __NR_fork
        __NR_fork,
#endif
#ifdef __NR_vfork
        __NR_vfork,
#endif
        __NR_clone,
#ifdef __NR_clone3
        __NR_clone3,
#endif
#ifdef __NR_open
        __NR_open,
#endif
        __NR_openat,
#ifdef __NR_openat2
        __NR_openat2,
#endif
#ifdef __NR_creat
        __NR_creat,
#endif
        __NR_open_by_handle_at,
        __NR_socket,
        __NR_socketpair,
        __NR_connect,
        __NR_ptrace,
        __NR_process_vm_readv,
        __NR_process_vm_writev,
};

bool write_fd_all(int fd, std::string_view s) {
    while (!s.empty()) {
        ::ssize_t t = ::write(fd, s.data(), s.size());
        if (t == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        s.remove_prefix(static_cast<std::size_t>(t));
    }
    return true;
}

bool read_fd_exact(int fd, char *buf, std::size_t n) {
    while (n > 0) {
        ::ssize_t t = ::read(fd, buf, n);
        if (t == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        if (t == 0) return false;
        buf += t;
        n -= static_cast<std::size_t>(t);
    }
    return true;
}

void put_u64(std::string &s, std::size_t pos, std::uint64_t v) {
    std::memcpy(s.data() + pos, &v, sizeof(v));
}

std::uint64_t get_u64(const char *p) {
    std::uint64_t v = 0;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

std::string make_header(channel_tag tag, std::uint64_t peak_kib, std::uint64_t len) {
    std::string h(_header_size, '\0');
    h[0] = static_cast<char>(tag);
    put_u64(h, 1, peak_kib);
    put_u64(h, 9, len);
    return h;
}

bool set_limit(int resource, rlim_t soft, rlim_t hard) {
    rlimit rlim;
    rlim.rlim_cur = soft;
    rlim.rlim_max = hard;
    return setrlimit(resource, &rlim) == 0;
}

// Runs between fork and execve, so only async-signal-safe calls are allowed here.
[[noreturn]] void exec_helper(const char *path, char *const argv[], char *const envp[],
                              int request_fd, int result_fd, pid_t parent) {
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) _exit(_setup_failed_status);
    if (getppid() != parent) _exit(_setup_failed_status);

    sigset_t none;
    sigemptyset(&none);
    if (sigprocmask(SIG_SETMASK, &none, nullptr) == -1) _exit(_setup_failed_status);

    int req = fcntl(request_fd, F_DUPFD, _park_fd);
    int res = fcntl(result_fd, F_DUPFD, _park_fd);
    int raw_null = open("/dev/null", O_RDWR);
    int null_fd = raw_null == -1 ? -1 : fcntl(raw_null, F_DUPFD, _park_fd);
    if (req == -1 || res == -1 || null_fd == -1) _exit(_setup_failed_status);
    if (dup2(req, STDIN_FILENO) == -1 || dup2(null_fd, STDOUT_FILENO) == -1 ||
        dup2(null_fd, STDERR_FILENO) == -1 || dup2(res, _channel_fd) == -1) {
        _exit(_setup_failed_status);
    }

    // close everything above the channel
    bool closed = false;
#ifdef SYS_close_range
    closed = syscall(SYS_close_range, _channel_fd + 1, ~0U, 0) == 0;
#endif
    if (!closed) {
        rlimit rlim;
        long maxfd = 65536;
        if (getrlimit(RLIMIT_NOFILE, &rlim) == 0 && rlim.rlim_cur != RLIM_INFINITY) {
            maxfd = static_cast<long>(rlim.rlim_cur);
        }
        for (long fd = _channel_fd + 1; fd < maxfd; fd++) ::close(static_cast<int>(fd));
    }

    execve(path, argv, envp);
    _exit(_setup_failed_status);
}

struct child_outcome_t {
    channel_tag tag;
    std::string payload;
};

child_outcome_t run_program(const analyzed_program_t &program, std::string_view input,
                            const sandbox_limits_t &limits) {
    try {
        script::Interpreter interp(program.module(), limits.max_call_depth);
        interp.run_module();
        std::string out = interp.call_entry(input);
        if (out.size() > limits.max_output_bytes) {
            return {channel_tag::_output_limit, std::to_string(out.size())};
        }
        return {channel_tag::_ok, std::move(out)};
    } catch (const script::ScriptError &e) {
        if (e.type() == "MemoryError") return {channel_tag::_memory, {}};
        return {channel_tag::_fault, e.what()};
    } catch (const std::bad_alloc &) {
        return {channel_tag::_memory, {}};
    } catch (const std::length_error &) {
        return {channel_tag::_memory, {}};
    } catch (const std::exception &e) {
        return {channel_tag::_fault, std::string("internal: ") + e.what()};
    }
}

// VmHWM of /proc/self/status through a descriptor opened before the filter went up.
// Allocation free: it also runs after the program hit the memory ceiling.
std::uint64_t peak_rss_kib(int status_fd) {
    if (status_fd == -1) return 0;
    char buf[8192];
    ::ssize_t n = pread(status_fd, buf, sizeof(buf), 0);
    if (n <= 0) return 0;
    std::string_view text(buf, static_cast<std::size_t>(n));
    auto pos = text.find("VmHWM:");
    if (pos == std::string_view::npos) return 0;
    std::uint64_t kib = 0;
    for (pos += 6; pos < text.size() && (text[pos] == ' ' || text[pos] == '\t'); pos++) {
    }
    for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; pos++) {
        kib = kib * 10 + static_cast<std::uint64_t>(text[pos] - '0');
    }
    return kib;
}

struct request_t {
    sandbox_limits_t limits;
    validator_conf_t vconf;
    std::string source, input;
};

bool read_request(int fd, request_t &req) {
    char head[_request_header_size];
    if (!read_fd_exact(fd, head, sizeof(head))) return false;
    std::uint64_t f[_request_fields];
    for (std::size_t i = 0; i < _request_fields; i++) f[i] = get_u64(head + i * 8);
    req.limits.cpu_ms = static_cast<tm_usage_t>(f[0]);
    req.limits.memory_bytes = static_cast<mem_usage_t>(f[1]);
    req.limits.max_output_bytes = static_cast<std::size_t>(f[2]);
    req.limits.max_call_depth = static_cast<int>(f[3]);
    req.vconf.max_code_length = static_cast<std::size_t>(f[4]);
    req.vconf.max_nesting_depth = static_cast<int>(f[5]);
    req.source.resize(static_cast<std::size_t>(f[6]));
    req.input.resize(static_cast<std::size_t>(f[7]));
    return read_fd_exact(fd, req.source.data(), req.source.size()) &&
           read_fd_exact(fd, req.input.data(), req.input.size());
}

bool send_result(channel_tag tag, std::uint64_t peak_kib, std::string_view payload) {
    return write_fd_all(_channel_fd, make_header(tag, peak_kib, payload.size())) &&
           write_fd_all(_channel_fd, payload);
}

tm_usage_t to_ms(const timeval &tv) {
    return static_cast<tm_usage_t>(tv.tv_sec) * 1000 + static_cast<tm_usage_t>(tv.tv_usec) / 1000;
}

}  // namespace

std::string run_verdict_to_str(run_verdict_t ver) {
    switch (ver) {
        case run_verdict_t::_ok: return "Finished";
        case run_verdict_t::_re: return "Runtime Error";
        case run_verdict_t::_tle: return "Time Limit Exceeded";
        case run_verdict_t::_mle: return "Memory Limit Exceeded";
        case run_verdict_t::_ole: return "Output Limit Exceeded";
        case run_verdict_t::_cle: return "CPU Time Limit Exceeded";
    }
    return "Unknown";
}

std::string run_result_t::to_str() const {
    return fmt::format(ARENA_FMT("{}, wall {}ms, cpu {}ms, rss {}KiB{}{}"),
                       run_verdict_to_str(verdict), wall_ms, cpu_ms, max_rss_kib,
                       info.empty() ? "" : ": ", info);
}

MyPipe::MyPipe() {
    if (pipe2(fd_, O_CLOEXEC) == -1) closed_[0] = closed_[1] = true;
}

bool MyPipe::write_all(const std::string_view s) const { return write_fd_all(write_fd(), s); }

bool MyPipe::read_all(std::string &s, std::size_t limit, bool &truncated) const {
    std::vector<char> buf(1 << 16);
    s.clear();
    truncated = false;
    while (true) {
        ::ssize_t t = ::read(read_fd(), buf.data(), buf.size());
        if (t == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        if (t == 0) break;
        auto n = static_cast<std::size_t>(t);
        if (s.size() + n > limit) {
            s.append(buf.data(), limit - s.size());
            truncated = true;
        } else if (!truncated) {
            s.append(buf.data(), n);
        }
    }
    return true;
}

std::string encode_message(const channel_message_t &msg) {
    return make_header(msg.tag, msg.peak_rss_kib, msg.payload.size()) + msg.payload;
}

bool decode_message(const std::string_view raw, channel_message_t &msg) {
    if (raw.size() < _header_size) return false;
    auto t = static_cast<std::uint8_t>(raw[0]);
    if (t < static_cast<std::uint8_t>(channel_tag::_ok) ||
        t > static_cast<std::uint8_t>(channel_tag::_output_limit)) {
        return false;
    }
    if (get_u64(raw.data() + 9) != raw.size() - _header_size) return false;
    msg.tag = static_cast<channel_tag>(t);
    msg.peak_rss_kib = get_u64(raw.data() + 1);
    msg.payload.assign(raw.substr(_header_size));
    return true;
}

std::string encode_request_header(const analyzed_program_t &program, std::size_t input_size,
                                  const sandbox_limits_t &limits) {
    std::string h(_request_header_size, '\0');
    const std::uint64_t f[_request_fields] = {
            static_cast<std::uint64_t>(limits.cpu_ms),
            static_cast<std::uint64_t>(limits.memory_bytes),
            limits.max_output_bytes,
            static_cast<std::uint64_t>(limits.max_call_depth),
            program.conf().max_code_length,
            static_cast<std::uint64_t>(program.conf().max_nesting_depth),
            program.source_bytes(),
            input_size,
    };
    for (std::size_t i = 0; i < _request_fields; i++) put_u64(h, i * 8, f[i]);
    return h;
}

PosixRunner::PosixRunner(std::filesystem::path helper) : helper_(std::move(helper)) {
    // a helper that dies early must not take the service down with it
    signal(SIGPIPE, SIG_IGN);
}

std::filesystem::path PosixRunner::default_helper_path() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::path(_helper_name);
    return self.parent_path() / _helper_name;
}

bool PosixRunner::configure_seccomp() {
    std::vector<sock_filter> filt;
#if defined(__x86_64__)
    filt.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filt.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AUDIT_ARCH_X86_64, 1, 0));
    filt.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL));
#endif
    filt.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

#ifdef SECCOMP_RET_KILL_PROCESS
    constexpr unsigned _kill = SECCOMP_RET_KILL_PROCESS;
#else
    constexpr unsigned _kill = SECCOMP_RET_KILL;
#endif
    auto add_rule = [&](unsigned nr, unsigned act) {
        filt.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, nr, 0, 1));
        filt.push_back(BPF_STMT(BPF_RET | BPF_K, act));
    };
    for (auto nr : _syscalls_denied) add_rule(nr, _kill);
    filt.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {
            static_cast<unsigned short>(filt.size()),
            filt.data(),
    };
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) return false;
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == -1) return false;
    return true;
}

run_result_t PosixRunner::run(const analyzed_program_t &program, const std::string_view input,
                              const sandbox_limits_t &limits) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(helper_, ec)) {
        throw SpawnError("sandbox helper not found: " + helper_.string());
    }
    MyPipe request, chan;
    if (request.failed() || chan.failed()) {
        throw SpawnError(fmt::format(ARENA_FMT("failed to create pipe: {}"), strerror(errno)));
    }

    // everything the child touches before execve is prepared here
    std::string path = helper_.string();
    char *argv[] = {path.data(), nullptr};
    char *envp[] = {nullptr};
    const pid_t parent = getpid();
    const int request_fd = request.read_fd(), result_fd = chan.write_fd();

    const auto start = mpc::steady_clock::now();
    mpc::Process proc([&] { exec_helper(path.c_str(), argv, envp, request_fd, result_fd, parent); });
    if (proc.failed()) {
        throw SpawnError(fmt::format(ARENA_FMT("failed to fork: {}"), strerror(errno)));
    }
    request.close_read();
    chan.close_write();

    bool sent = false;
    std::thread writer([&] {
        sent = request.write_all(encode_request_header(program, input.size(), limits)) &&
               request.write_all(program.source()) && request.write_all(input);
        request.close_write();
    });

    std::string raw;
    bool truncated = false, read_ok = true;
    std::thread reader([&] {
        try {
            read_ok = chan.read_all(raw, limits.max_output_bytes + _header_size, truncated);
        } catch (const std::bad_alloc &) {
            read_ok = false;
        }
    });

    bool timed_out = !proc.wait_until(start + chrono::milliseconds(limits.timeout_ms));
    if (timed_out) {
        proc.kill(SIGTERM);
        if (!proc.wait_until(mpc::steady_clock::now() + chrono::milliseconds(limits.grace_ms))) {
            proc.kill(SIGKILL);
            proc.join();
        }
    }
    writer.join();
    reader.join();

    run_result_t res{run_verdict_t::_re};
    res.wall_ms = chrono::duration_cast<chrono::milliseconds>(mpc::steady_clock::now() - start)
                          .count();
    const rusage &usage = proc.usage();
    res.cpu_ms = to_ms(usage.ru_utime) + to_ms(usage.ru_stime);

    channel_message_t msg{};
    bool has_msg = read_ok && !truncated && decode_message(raw, msg);
    // ru_maxrss would include the pages of the forked image before execve
    if (has_msg) res.max_rss_kib = static_cast<mem_usage_t>(msg.peak_rss_kib);

    if (timed_out) {
        res.verdict = run_verdict_t::_tle;
        res.info = fmt::format(ARENA_FMT("wall clock limit of {}ms exceeded"), limits.timeout_ms);
        return res;
    }
    if ((proc.if_signaled() && proc.term_sig() == SIGXCPU) ||
        (proc.if_signaled() && proc.term_sig() == SIGKILL && res.cpu_ms >= limits.cpu_ms) ||
        res.cpu_ms > limits.cpu_ms) {
        res.verdict = run_verdict_t::_cle;
        res.info = fmt::format(ARENA_FMT("cpu time limit of {}ms exceeded"), limits.cpu_ms);
        return res;
    }
    if ((has_msg && msg.tag == channel_tag::_memory) ||
        res.max_rss_kib * 1024 > limits.memory_bytes) {
        res.verdict = run_verdict_t::_mle;
        res.info = fmt::format(ARENA_FMT("memory limit of {} bytes exceeded"), limits.memory_bytes);
        return res;
    }
    if (proc.if_signaled()) {
        res.info = proc.term_sig() == SIGSYS
                           ? std::string("bad system call")
                           : fmt::format(ARENA_FMT("killed by signal {}"), proc.term_sig());
        return res;
    }
    if (truncated || (has_msg && msg.tag == channel_tag::_output_limit)) {
        res.verdict = run_verdict_t::_ole;
        res.info = fmt::format(ARENA_FMT("output exceeds {} bytes"), limits.max_output_bytes);
        return res;
    }
    if (!has_msg) {
        if (proc.if_exited() && proc.exit_status() == _setup_failed_status) {
            throw SpawnError("sandbox setup failed in the child process");
        }
        res.info = sent ? fmt::format(ARENA_FMT("no result from sandbox (exit code {})"),
                                      proc.exit_status())
                        : fmt::format(ARENA_FMT("sandbox exited (code {}) before reading the "
                                                "request"),
                                      proc.exit_status());
        return res;
    }
    if (msg.tag == channel_tag::_fault) {
        res.info = std::move(msg.payload);
        return res;
    }
    res.verdict = run_verdict_t::_ok;
    res.output = std::move(msg.payload);
    return res;
}

int sandbox_main() {
    signal(SIGPIPE, SIG_IGN);
    request_t req;
    try {
        if (!read_request(STDIN_FILENO, req)) return _setup_failed_status;
    } catch (const std::exception &) {
        // the sizes in the header could not be allocated
        return _setup_failed_status;
    }
    ::close(STDIN_FILENO);

    auto checked = validate(req.source, req.vconf);
    if (!checked.ok()) {
        return send_result(channel_tag::_fault, 0, "rejected by validation: " + checked.message())
                       ? 0
                       : 1;
    }

    auto cpu_sec = static_cast<rlim_t>((req.limits.cpu_ms + 999) / 1000);
    auto mem = static_cast<rlim_t>(req.limits.memory_bytes);
    if (!set_limit(RLIMIT_CPU, cpu_sec, cpu_sec + 1) || !set_limit(RLIMIT_DATA, mem, mem) ||
        !set_limit(RLIMIT_STACK, mem, mem) || !set_limit(RLIMIT_NPROC, 0, 0) ||
        !set_limit(RLIMIT_FSIZE, 0, 0) || !set_limit(RLIMIT_CORE, 0, 0)) {
        return _setup_failed_status;
    }

    int status_fd = open("/proc/self/status", O_RDONLY | O_CLOEXEC);
    if (!PosixRunner::configure_seccomp()) return _setup_failed_status;

    auto res = run_program(*checked.program, req.input, req.limits);
    return send_result(res.tag, peak_rss_kib(status_fd), res.payload) ? 0 : 1;
}

}  // namespace arena
