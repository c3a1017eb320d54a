//
// Copyright (c) 2024-2025 JLGxy
//

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "multiprocess.h"
#include "sandbox.h"
#include "validator.h"

using arena::run_verdict_t;
using arena::sandbox_limits_t;

namespace {

sandbox_limits_t small_limits() {
    sandbox_limits_t lim;
    lim.timeout_ms = 5000;
    lim.cpu_ms = 5000;
    lim.memory_bytes = 256L << 20;
    lim.grace_ms = 200;
    lim.max_output_bytes = 1 << 20;
    return lim;
}

arena::run_result_t run_script(const std::string &src, const std::string &input,
                               const sandbox_limits_t &lim = small_limits()) {
    auto prog = arena::validate_or_throw(src);
    arena::PosixRunner runner(ARENA_SANDBOX_HELPER);
    return runner.run(prog, input, lim);
}

}  // namespace

TEST(channel, framing) {
    auto raw = arena::encode_message({arena::channel_tag::_ok, 2048, "payload"});
    EXPECT_EQ(raw.size(), 17u + 7u);
    arena::channel_message_t msg{};
    ASSERT_TRUE(arena::decode_message(raw, msg));
    EXPECT_EQ(msg.tag, arena::channel_tag::_ok);
    EXPECT_EQ(msg.peak_rss_kib, 2048u);
    EXPECT_EQ(msg.payload, "payload");

    EXPECT_FALSE(arena::decode_message(raw.substr(0, raw.size() - 1), msg));
    EXPECT_FALSE(arena::decode_message(raw + "x", msg));
    EXPECT_FALSE(arena::decode_message("", msg));
    raw[0] = 42;
    EXPECT_FALSE(arena::decode_message(raw, msg));
}

TEST(channel, requestHeader) {
    auto prog = arena::validate_or_throw("def decompress(data):\n    return data\n");
    auto lim = small_limits();
    auto head = arena::encode_request_header(prog, 5, lim);
    ASSERT_EQ(head.size(), 64u);
    std::uint64_t f[8];
    std::memcpy(f, head.data(), sizeof(f));
    EXPECT_EQ(f[0], static_cast<std::uint64_t>(lim.cpu_ms));
    EXPECT_EQ(f[1], static_cast<std::uint64_t>(lim.memory_bytes));
    EXPECT_EQ(f[2], lim.max_output_bytes);
    EXPECT_EQ(f[6], prog.source_bytes());
    EXPECT_EQ(f[7], 5u);
}

TEST(channel, pipeReadLimit) {
    arena::MyPipe p;
    ASSERT_FALSE(p.failed());
    std::thread writer([&] {
        EXPECT_TRUE(p.write_all(std::string(1000, 'x')));
        p.close_write();
    });
    std::string got;
    bool truncated = false;
    EXPECT_TRUE(p.read_all(got, 100, truncated));
    writer.join();
    EXPECT_TRUE(truncated);
    EXPECT_EQ(got.size(), 100u);
}

TEST(sandbox, identity) {
    std::string data(100000, '\0');
    for (std::size_t i = 0; i < data.size(); i++) data[i] = static_cast<char>(i * 7);
    auto res = run_script("def decompress(data):\n    return data\n", data);
    ASSERT_EQ(res.verdict, run_verdict_t::_ok) << res.to_str();
    EXPECT_EQ(res.output, data);
    EXPECT_GE(res.wall_ms, 0);
}

TEST(sandbox, scriptFault) {
    auto res = run_script("def decompress(data):\n    raise ValueError('corrupt stream')\n", "");
    EXPECT_EQ(res.verdict, run_verdict_t::_re);
    EXPECT_NE(res.info.find("ValueError"), std::string::npos);
    EXPECT_NE(res.info.find("corrupt stream"), std::string::npos);
    EXPECT_TRUE(res.output.empty());
}

TEST(sandbox, wallClockTimeout) {
    auto lim = small_limits();
    lim.timeout_ms = 500;
    lim.cpu_ms = 30000;
    auto start = std::chrono::steady_clock::now();
    auto res = run_script("def decompress(data):\n    while True:\n        pass\n", "", lim);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(res.verdict, run_verdict_t::_tle);
    EXPECT_LT(elapsed, std::chrono::milliseconds(lim.timeout_ms + lim.grace_ms + 2000));

    // the runner is reusable after a kill
    auto again = run_script("def decompress(data):\n    return b'ok'\n", "");
    EXPECT_EQ(again.verdict, run_verdict_t::_ok);
    EXPECT_EQ(again.output, "ok");
}

TEST(sandbox, cpuLimit) {
    auto lim = small_limits();
    lim.timeout_ms = 20000;
    lim.cpu_ms = 1000;
    auto res = run_script("def decompress(data):\n    x = 0\n    while True:\n        x += 1\n", "",
                          lim);
    EXPECT_EQ(res.verdict, run_verdict_t::_cle) << res.to_str();
}

TEST(sandbox, memoryLimit) {
    auto res = run_script("def decompress(data):\n    return b'x' * (1 << 30)\n", "");
    EXPECT_EQ(res.verdict, run_verdict_t::_mle) << res.to_str();
}

// The child is a fresh image: memory held by the service does not count against it.
TEST(sandbox, parentHeapNotCharged) {
    auto lim = small_limits();
    lim.memory_bytes = 64L << 20;
    std::vector<char> held(static_cast<std::size_t>(lim.memory_bytes + (32L << 20)), 'h');

    const std::string data = "payload held next to a large parent heap";
    auto res = run_script("def decompress(data):\n    return data\n", data, lim);
    ASSERT_EQ(res.verdict, run_verdict_t::_ok) << res.to_str();
    EXPECT_EQ(res.output, data);
    EXPECT_LT(res.max_rss_kib * 1024, lim.memory_bytes);
    EXPECT_GT(res.max_rss_kib, 0);
    EXPECT_EQ(held.back(), 'h');
}

TEST(sandbox, missingHelper) {
    auto prog = arena::validate_or_throw("def decompress(data):\n    return data\n");
    arena::PosixRunner runner("/nonexistent/arena-sandbox");
    EXPECT_THROW(runner.run(prog, "", small_limits()), arena::SpawnError);
}

TEST(sandbox, outputLimit) {
    auto lim = small_limits();
    lim.max_output_bytes = 1024;
    auto res = run_script("def decompress(data):\n    return b'y' * 4096\n", "", lim);
    EXPECT_EQ(res.verdict, run_verdict_t::_ole) << res.to_str();
    EXPECT_TRUE(res.output.empty());

    auto fits = run_script("def decompress(data):\n    return b'y' * 1024\n", "", lim);
    EXPECT_EQ(fits.verdict, run_verdict_t::_ok);
}

TEST(sandbox, syscallFilter) {
    arena::multiproc::Process p([] {
        if (!arena::PosixRunner::configure_seccomp()) _exit(3);
        int fd = ::open("/dev/null", O_RDONLY);
        _exit(fd >= 0 ? 0 : 1);
    });
    ASSERT_FALSE(p.failed());
    p.join();
    EXPECT_TRUE(p.if_signaled());
    EXPECT_EQ(p.term_sig(), SIGSYS);
}

TEST(sandbox, verdictNames) {
    EXPECT_EQ(arena::run_verdict_to_str(run_verdict_t::_tle), "Time Limit Exceeded");
    arena::run_result_t r{run_verdict_t::_mle};
    r.info = "memory limit of 1 bytes exceeded";
    EXPECT_NE(r.to_str().find("Memory Limit Exceeded"), std::string::npos);
}
