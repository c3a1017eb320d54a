//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arena {

struct breakdown_t {
    std::size_t compressed_bytes{};
    std::size_t decompressor_bytes{};
};

struct mismatch_t {
    std::size_t offset;  // first differing byte, or the shorter length for a strict prefix
    std::size_t expected_length, actual_length;
    std::string expected_sha256, actual_sha256;

    std::string to_str() const;
};

struct score_result_t {
    std::optional<std::int64_t> score;  // lower is better
    breakdown_t breakdown;
    std::optional<mismatch_t> mismatch;

    bool ok() const { return score.has_value(); }
    // "DECOMPRESSION_MISMATCH" on mismatch, empty otherwise.
    std::string error_code() const;
};

// Lowercase hex SHA-256.
std::string sha256_hex(std::string_view data);

// Byte-exact comparison of the decompressed output against the dataset.
score_result_t score(std::string_view expected, std::string_view actual,
                     std::size_t compressed_bytes, std::size_t decompressor_bytes);

}  // namespace arena
