//
// Copyright (c) 2024-2025 JLGxy
//

#include "scorer.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "arena_logs.h"

namespace arena {

std::string sha256_hex(const std::string_view data) {
    static constexpr char _digits[] = "0123456789abcdef";
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += _digits[md[i] >> 4];
        out += _digits[md[i] & 15];
    }
    return out;
}

std::string mismatch_t::to_str() const {
    return fmt::format(ARENA_FMT("output differs at offset {} (expected {} bytes, sha256 {}; got "
                                 "{} bytes, sha256 {})"),
                       offset, expected_length, expected_sha256, actual_length, actual_sha256);
}

std::string score_result_t::error_code() const {
    return mismatch ? "DECOMPRESSION_MISMATCH" : "";
}

score_result_t score(const std::string_view expected, const std::string_view actual,
                     std::size_t compressed_bytes, std::size_t decompressor_bytes) {
    score_result_t res;
    res.breakdown = {compressed_bytes, decompressor_bytes};
    if (expected.size() == actual.size() && expected == actual) {
        res.score = static_cast<std::int64_t>(compressed_bytes + decompressor_bytes);
        return res;
    }
    auto diff = std::mismatch(expected.begin(), expected.end(), actual.begin(), actual.end());
    mismatch_t m;
    m.offset = static_cast<std::size_t>(diff.first - expected.begin());
    m.expected_length = expected.size();
    m.actual_length = actual.size();
    m.expected_sha256 = sha256_hex(expected);
    m.actual_sha256 = sha256_hex(actual);
    res.mismatch = std::move(m);
    return res;
}

}  // namespace arena
