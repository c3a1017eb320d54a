//
// Copyright (c) 2024-2025 JLGxy
//

#include "base64.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arena::sb_base64 {

namespace {

constexpr int _invalid = -1;
constexpr int _pad = -2;
constexpr int _space = -3;

constexpr std::array<int, 256> make_reverse_map() {
    std::array<int, 256> map{};
    for (auto &v : map) v = _invalid;
    for (int i = 0; i < 64; i++) map[static_cast<unsigned char>(_alphabet_map[i])] = i;
    map['='] = _pad;
    for (unsigned char c : {' ', '\t', '\n', '\r', '\v', '\f'}) map[c] = _space;
    return map;
}

constexpr std::array<int, 256> _reverse_map = make_reverse_map();

}  // namespace

std::string base64_encode(const std::string_view text) {
    std::string ret;
    ret.reserve((text.length() + 2) / 3 * 4);
    auto at = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    std::size_t i;
    for (i = 0; i + 3 <= text.length(); i += 3) {
        ret.push_back(_alphabet_map[at(i) >> 2]);
        ret.push_back(_alphabet_map[((at(i) << 4) & 0x30) | (at(i + 1) >> 4)]);
        ret.push_back(_alphabet_map[((at(i + 1) << 2) & 0x3c) | (at(i + 2) >> 6)]);
        ret.push_back(_alphabet_map[at(i + 2) & 0x3f]);
    }

    if (i < text.length()) {
        std::size_t tail = text.length() - i;
        if (tail == 1) {
            ret.push_back(_alphabet_map[at(i) >> 2]);
            ret.push_back(_alphabet_map[(at(i) << 4) & 0x30]);
            ret.push_back('=');
            ret.push_back('=');
        } else {
            ret.push_back(_alphabet_map[at(i) >> 2]);
            ret.push_back(_alphabet_map[((at(i) << 4) & 0x30) | (at(i + 1) >> 4)]);
            ret.push_back(_alphabet_map[(at(i + 1) << 2) & 0x3c]);
            ret.push_back('=');
        }
    }
    return ret;
}

std::optional<std::string> base64_decode(const std::string_view text) {
    std::string ret;
    ret.reserve(text.length() / 4 * 3);
    std::uint32_t acc = 0;
    int quad = 0;  // sextets collected in the current group
    int pads = 0;
    for (char ch : text) {
        int v = _reverse_map[static_cast<unsigned char>(ch)];
        if (v == _space) continue;
        if (v == _invalid) return std::nullopt;
        if (v == _pad) {
            // padding may only complete the last group: "xx==" or "xxx="
            if (quad < 2) return std::nullopt;
            pads++;
            quad++;
            if (quad == 4) {
                if (pads == 2) {
                    ret.push_back(static_cast<char>((acc >> 4) & 0xff));
                } else {
                    ret.push_back(static_cast<char>((acc >> 10) & 0xff));
                    ret.push_back(static_cast<char>((acc >> 2) & 0xff));
                }
                quad = 0;
            }
            continue;
        }
        if (pads > 0) return std::nullopt;
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        quad++;
        if (quad == 4) {
            ret.push_back(static_cast<char>((acc >> 16) & 0xff));
            ret.push_back(static_cast<char>((acc >> 8) & 0xff));
            ret.push_back(static_cast<char>(acc & 0xff));
            acc = 0;
            quad = 0;
        }
    }
    if (quad != 0) return std::nullopt;
    return ret;
}

}  // namespace arena::sb_base64
