//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace arena::sb_base64 {

inline const char _alphabet_map[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(std::string_view text);

// Standard alphabet with mandatory padding. ASCII whitespace is skipped, any other
// character outside the alphabet makes the input invalid.
std::optional<std::string> base64_decode(std::string_view text);

}  // namespace arena::sb_base64
