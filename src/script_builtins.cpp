//
// Copyright (c) 2024-2025 JLGxy
//

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "interpreter.h"
#include "script_value.h"

namespace arena::script {

namespace {

using i64 = std::int64_t;
using opt_value_t = std::optional<value_t>;

[[noreturn]] void type_error(std::string msg) { throw ScriptError("TypeError", std::move(msg)); }
[[noreturn]] void value_error(std::string msg) { throw ScriptError("ValueError", std::move(msg)); }

bool is_intlike(const value_t &v) {
    return std::holds_alternative<i64>(v) || std::holds_alternative<bool>(v);
}
bool is_none(const opt_value_t &v) { return !v || std::holds_alternative<none_t>(*v); }

// Binds positional and keyword arguments against `names`. The first `required` are mandatory.
std::vector<opt_value_t> bind_args(call_args_t &args, const std::string &fname,
                                   std::initializer_list<const char *> names,
                                   std::size_t required) {
    std::vector<const char *> params(names);
    std::vector<opt_value_t> out(params.size());
    if (args.pos.size() > params.size()) {
        type_error(fname + "() takes at most " + std::to_string(params.size()) +
                   " arguments (" + std::to_string(args.pos.size()) + " given)");
    }
    for (std::size_t i = 0; i < args.pos.size(); i++) out[i] = std::move(args.pos[i]);
    for (auto &[name, value] : args.kw) {
        auto it = std::find_if(params.begin(), params.end(),
                               [&](const char *p) { return name == p; });
        if (it == params.end()) {
            type_error(fname + "() got an unexpected keyword argument '" + name + "'");
        }
        auto idx = static_cast<std::size_t>(it - params.begin());
        if (out[idx]) type_error(fname + "() got multiple values for argument '" + name + "'");
        out[idx] = std::move(value);
    }
    for (std::size_t i = 0; i < required; i++) {
        if (!out[i]) {
            type_error(fname + "() missing required argument '" + params[i] + "'");
        }
    }
    return out;
}

void no_kwargs(const call_args_t &args, const std::string &fname) {
    if (!args.kw.empty()) type_error(fname + "() takes no keyword arguments");
}

std::string lowered(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c == '_') c = '-';
    }
    return s;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\x0b' || c == '\x0c';
}

// ---- integers ----

i64 parse_int_text(const std::string &text, i64 base) {
    auto invalid = [&]() -> void {
        value_error("invalid literal for int() with base " + std::to_string(base) + ": " +
                    repr(make_str(text)));
    };
    if (base != 0 && (base < 2 || base > 36)) value_error("int() base must be >= 2 and <= 36, or 0");
    std::size_t i = 0, n = text.size();
    while (i < n && is_space(text[i])) i++;
    while (n > i && is_space(text[n - 1])) n--;
    bool neg = false;
    if (i < n && (text[i] == '+' || text[i] == '-')) neg = text[i++] == '-';
    auto has_prefix = [&](char p) {
        return i + 1 < n && text[i] == '0' && std::tolower(static_cast<unsigned char>(text[i + 1])) == p;
    };
    if ((base == 0 || base == 16) && has_prefix('x')) {
        base = 16, i += 2;
    } else if ((base == 0 || base == 8) && has_prefix('o')) {
        base = 8, i += 2;
    } else if ((base == 0 || base == 2) && has_prefix('b')) {
        base = 2, i += 2;
    } else if (base == 0) {
        base = 10;
    }
    if (i < n && text[i] == '_') i++;
    if (i >= n) invalid();
    __int128 acc = 0;
    bool last_underscore = false;
    for (; i < n; i++) {
        char c = text[i];
        if (c == '_') {
            if (last_underscore) invalid();
            last_underscore = true;
            continue;
        }
        last_underscore = false;
        int d = std::isdigit(static_cast<unsigned char>(c)) ? c - '0'
                : std::isalpha(static_cast<unsigned char>(c))
                        ? std::tolower(static_cast<unsigned char>(c)) - 'a' + 10
                        : 99;
        if (d >= base) invalid();
        acc = acc * base + d;
        if (acc > static_cast<__int128>(std::numeric_limits<i64>::max()) + 1) {
            throw ScriptError("OverflowError", "integer overflow");
        }
    }
    if (last_underscore) invalid();
    if (neg) acc = -acc;
    if (acc > std::numeric_limits<i64>::max()) throw ScriptError("OverflowError", "integer overflow");
    return static_cast<i64>(acc);
}

std::string format_int(i64 x, unsigned base, const char *prefix) {
    static constexpr char _digits[] = "0123456789abcdef";
    std::uint64_t mag = x < 0 ? 0 - static_cast<std::uint64_t>(x) : static_cast<std::uint64_t>(x);
    std::string digits;
    do {
        digits += _digits[mag % base];
        mag /= base;
    } while (mag != 0);
    std::reverse(digits.begin(), digits.end());
    return (x < 0 ? "-" : "") + std::string(prefix) + digits;
}

bool parse_byteorder(const opt_value_t &v) {
    if (is_none(v)) return true;
    const std::string &s = expect_str(*v, "byteorder");
    if (s == "big") return true;
    if (s == "little") return false;
    value_error("byteorder must be either 'little' or 'big'");
}

i64 int_from_bytes(std::string data, bool big, bool is_signed) {
    if (!big) std::reverse(data.begin(), data.end());
    if (data.empty()) return 0;
    bool negative = is_signed && (static_cast<unsigned char>(data[0]) & 0x80);
    char fill = negative ? '\xff' : '\0';
    std::size_t skip = 0;
    while (data.size() - skip > 8 && data[skip] == fill) skip++;
    std::size_t n = data.size() - skip;
    if (n > 8) throw ScriptError("OverflowError", "int too big to convert");
    std::uint64_t u = 0;
    for (std::size_t i = skip; i < data.size(); i++) u = (u << 8) | static_cast<unsigned char>(data[i]);
    bool top = (static_cast<unsigned char>(data[skip]) & 0x80) != 0;
    if (n == 8) {
        if (negative != top) throw ScriptError("OverflowError", "int too big to convert");
        return static_cast<i64>(u);
    }
    if (negative) return static_cast<i64>(u | (~std::uint64_t{0} << (8 * n)));
    return static_cast<i64>(u);
}

std::string int_to_bytes(i64 x, i64 length, bool big, bool is_signed) {
    if (length < 0) value_error("length argument must be non-negative");
    if (!is_signed && x < 0) throw ScriptError("OverflowError", "can't convert negative int to unsigned");
    if (length < 8) {
        bool fits;
        if (is_signed) {
            i64 lim = i64{1} << (8 * length - 1 + (length == 0 ? 1 : 0));
            fits = length == 0 ? x == 0 : (x >= -lim && x < lim);
        } else {
            fits = x < (i64{1} << (8 * length));
        }
        if (!fits) throw ScriptError("OverflowError", "int too big to convert");
    }
    std::string out(static_cast<std::size_t>(length), x < 0 ? '\xff' : '\0');
    auto u = static_cast<std::uint64_t>(x);
    for (i64 i = 0; i < std::min<i64>(length, 8); i++) {
        out[static_cast<std::size_t>(i)] = static_cast<char>((u >> (8 * i)) & 0xff);
    }
    if (big) std::reverse(out.begin(), out.end());
    return out;
}

std::string from_hex(const std::string &s) {
    auto hexval = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    for (std::size_t i = 0; i < s.size();) {
        if (is_space(s[i])) {
            i++;
            continue;
        }
        int hi = hexval(s[i]);
        int lo = i + 1 < s.size() ? hexval(s[i + 1]) : -1;
        if (hi < 0 || lo < 0) {
            value_error("non-hexadecimal number found in fromhex() arg at position " +
                        std::to_string(hi < 0 ? i : i + 1));
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::string to_hex(const std::string &data) {
    static constexpr char _digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (char ch : data) {
        auto c = static_cast<unsigned char>(ch);
        out += _digits[c >> 4];
        out += _digits[c & 15];
    }
    return out;
}

// ---- text codecs ----

// Length of the well-formed UTF-8 sequence at `i`, or 0.
std::size_t utf8_sequence(const std::string &s, std::size_t i) {
    auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;
    std::size_t len = (c >> 5) == 6 ? 2 : (c >> 4) == 14 ? 3 : (c >> 3) == 30 ? 4 : 0;
    if (len == 0 || i + len > s.size()) return 0;
    try {
        check_utf8(std::string_view(s).substr(i, len));
    } catch (const ScriptError &) {
        return 0;
    }
    return len;
}

std::string decode_text(const std::string &data, const opt_value_t &encoding,
                        const opt_value_t &errors) {
    std::string enc = is_none(encoding) ? "utf-8" : lowered(expect_str(*encoding, "encoding"));
    std::string err = is_none(errors) ? "strict" : expect_str(*errors, "errors");
    if (err != "strict" && err != "ignore" && err != "replace") {
        throw ScriptError("LookupError", "unknown error handler name '" + err + "'");
    }
    auto bad = [&](std::size_t pos, std::string &out) {
        if (err == "strict") {
            throw ScriptError("UnicodeDecodeError", "'" + enc + "' codec can't decode byte 0x" +
                                                            to_hex(data.substr(pos, 1)) +
                                                            " in position " + std::to_string(pos));
        }
        if (err == "replace") append_utf8(out, 0xfffd);
    };
    std::string out;
    if (enc == "utf-8" || enc == "utf8") {
        if (err == "strict") {
            check_utf8(data);
            return data;
        }
        for (std::size_t i = 0; i < data.size();) {
            std::size_t len = utf8_sequence(data, i);
            if (len == 0) {
                bad(i, out);
                i++;
            } else {
                out.append(data, i, len);
                i += len;
            }
        }
        return out;
    }
    if (enc == "ascii") {
        for (std::size_t i = 0; i < data.size(); i++) {
            if (static_cast<unsigned char>(data[i]) >= 0x80) {
                bad(i, out);
            } else {
                out += data[i];
            }
        }
        return out;
    }
    if (enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1") {
        for (char c : data) append_utf8(out, static_cast<unsigned char>(c));
        return out;
    }
    throw ScriptError("LookupError", "unknown encoding: " + enc);
}

std::string encode_text(const std::string &text, const opt_value_t &encoding,
                        const opt_value_t &errors) {
    std::string enc = is_none(encoding) ? "utf-8" : lowered(expect_str(*encoding, "encoding"));
    std::string err = is_none(errors) ? "strict" : expect_str(*errors, "errors");
    if (enc == "utf-8" || enc == "utf8") return text;
    std::uint32_t limit = 0;
    if (enc == "ascii") {
        limit = 0x80;
    } else if (enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1") {
        limit = 0x100;
    } else {
        throw ScriptError("LookupError", "unknown encoding: " + enc);
    }
    std::string out;
    auto cps = code_points(text);
    for (std::size_t i = 0; i < cps.size(); i++) {
        if (cps[i] < limit) {
            out += static_cast<char>(cps[i]);
        } else if (err == "replace") {
            out += '?';
        } else if (err != "ignore") {
            throw ScriptError("UnicodeEncodeError", "'" + enc +
                                                            "' codec can't encode character in "
                                                            "position " +
                                                            std::to_string(i));
        }
    }
    return out;
}

// ---- searching, shared by str and bytes ----

template <typename Str>
i64 find_in(const Str &s, const Str &sub, const opt_value_t &start, const opt_value_t &end) {
    auto sb = adjust_slice(static_cast<i64>(s.size()), start.value_or(make_none()),
                           end.value_or(make_none()), make_none());
    if (sb.stop - sb.start < static_cast<i64>(sub.size())) return -1;
    auto pos = s.find(sub, static_cast<std::size_t>(sb.start));
    if (pos == Str::npos || static_cast<i64>(pos + sub.size()) > sb.stop) return -1;
    return static_cast<i64>(pos);
}

template <typename Str>
i64 count_in(const Str &s, const Str &sub, const opt_value_t &start, const opt_value_t &end) {
    auto sb = adjust_slice(static_cast<i64>(s.size()), start.value_or(make_none()),
                           end.value_or(make_none()), make_none());
    if (sb.stop < sb.start) return 0;
    if (sub.empty()) return sb.stop - sb.start + 1;
    i64 cnt = 0;
    auto pos = static_cast<std::size_t>(sb.start);
    while (true) {
        pos = s.find(sub, pos);
        if (pos == Str::npos || static_cast<i64>(pos + sub.size()) > sb.stop) break;
        cnt++;
        pos += sub.size();
    }
    return cnt;
}

template <typename Str>
bool affix_in(const Str &s, const Str &affix, bool at_end, const opt_value_t &start,
              const opt_value_t &end) {
    auto sb = adjust_slice(static_cast<i64>(s.size()), start.value_or(make_none()),
                           end.value_or(make_none()), make_none());
    if (sb.stop - sb.start < static_cast<i64>(affix.size())) return false;
    auto at = static_cast<std::size_t>(at_end ? sb.stop - static_cast<i64>(affix.size()) : sb.start);
    return s.compare(at, affix.size(), affix) == 0;
}

std::u32string to_u32(const std::string &s) {
    auto cps = code_points(s);
    return {cps.begin(), cps.end()};
}

std::vector<std::string> split_text(const std::string &s, const std::string *sep, i64 maxsplit) {
    std::vector<std::string> out;
    if (sep == nullptr) {
        std::size_t i = 0;
        while (true) {
            while (i < s.size() && is_space(s[i])) i++;
            if (i >= s.size()) break;
            if (maxsplit >= 0 && static_cast<i64>(out.size()) == maxsplit) {
                out.push_back(s.substr(i));
                break;
            }
            std::size_t j = i;
            while (j < s.size() && !is_space(s[j])) j++;
            out.push_back(s.substr(i, j - i));
            i = j;
        }
        return out;
    }
    if (sep->empty()) value_error("empty separator");
    std::size_t start = 0;
    while (maxsplit < 0 || static_cast<i64>(out.size()) < maxsplit) {
        auto pos = s.find(*sep, start);
        if (pos == std::string::npos) break;
        out.push_back(s.substr(start, pos - start));
        start = pos + sep->size();
    }
    out.push_back(s.substr(start));
    return out;
}

// Inserts at every boundary when `old` is empty; `bounds` lists the permitted offsets.
std::string replace_text(const std::string &s, const std::string &old, const std::string &repl,
                         i64 count, const std::vector<std::size_t> &bounds) {
    std::string out;
    i64 done = 0;
    if (old.empty()) {
        std::size_t prev = 0;
        for (auto b : bounds) {
            out.append(s, prev, b - prev);
            prev = b;
            if (count < 0 || done < count) {
                out += repl;
                done++;
            }
        }
        out.append(s, prev, std::string::npos);
        return out;
    }
    std::size_t start = 0;
    while (count < 0 || done < count) {
        auto pos = s.find(old, start);
        if (pos == std::string::npos) break;
        out.append(s, start, pos - start);
        out += repl;
        start = pos + old.size();
        done++;
    }
    out.append(s, start, std::string::npos);
    return out;
}

std::vector<std::size_t> byte_bounds(const std::string &s) {
    std::vector<std::size_t> b(s.size() + 1);
    std::iota(b.begin(), b.end(), std::size_t{0});
    return b;
}

std::vector<std::size_t> char_bounds(const std::string &s) {
    std::vector<std::size_t> b;
    for (std::size_t i = 0; i < s.size(); i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xc0) != 0x80) b.push_back(i);
    }
    b.push_back(s.size());
    return b;
}

std::string bytes_of(const value_t &v) {
    if (const auto *p = bytes_like(v)) return *p;
    if (is_intlike(v)) {
        i64 n = expect_int(v, "count");
        if (n < 0) value_error("negative count");
        return std::string(static_cast<std::size_t>(n), '\0');
    }
    if (std::holds_alternative<str_v>(v)) type_error("string argument without an encoding");
    std::string out;
    iterate(v, [&](const value_t &x) {
        out += expect_byte(x);
        return true;
    });
    return out;
}

value_t same_kind(const value_t &self, std::string s) {
    if (std::holds_alternative<bytes_v>(self)) return make_bytes(std::move(s));
    return make_bytearray(std::move(s));
}

std::string needle_bytes(const value_t &v) {
    if (is_intlike(v)) return std::string(1, expect_byte(v));
    return expect_bytes_like(v, "argument");
}

// ---- builtin functions ----

value_t b_int(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "int", {"x", "base"}, 0);
    if (!p[0]) return make_int(0);
    const value_t &x = *p[0];
    if (p[1]) {
        i64 base = expect_int(*p[1], "base");
        if (const auto *s = std::get_if<str_v>(&x)) return make_int(parse_int_text(s->get(), base));
        if (const auto *b = bytes_like(x)) return make_int(parse_int_text(*b, base));
        type_error("int() can't convert non-string with explicit base");
    }
    if (is_intlike(x)) return make_int(expect_int(x, "x"));
    if (const auto *s = std::get_if<str_v>(&x)) return make_int(parse_int_text(s->get(), 10));
    if (const auto *b = bytes_like(x)) return make_int(parse_int_text(*b, 10));
    type_error("int() argument must be a string, a bytes-like object or a number, not '" +
               type_name(x) + "'");
}

value_t b_bool(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "bool", {"x"}, 0);
    return make_bool(p[0] && truthy(*p[0]));
}

value_t b_str(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "str", {"object", "encoding", "errors"}, 0);
    if (!p[0]) return make_str("");
    if (p[1] || p[2]) {
        return make_str(decode_text(expect_bytes_like(*p[0], "decoding str()"), p[1], p[2]));
    }
    return make_str(to_str(*p[0]));
}

std::string bytes_source(call_args_t &args, const char *fname) {
    auto p = bind_args(args, fname, {"source", "encoding", "errors"}, 0);
    if (!p[0]) return {};
    if (const auto *s = std::get_if<str_v>(&*p[0])) {
        if (!p[1]) type_error("string argument without an encoding");
        return encode_text(s->get(), p[1], p[2]);
    }
    if (p[1] || p[2]) type_error("encoding without a string argument");
    return bytes_of(*p[0]);
}

value_t b_bytes(Interpreter &, call_args_t &args) { return make_bytes(bytes_source(args, "bytes")); }
value_t b_bytearray(Interpreter &, call_args_t &args) {
    return make_bytearray(bytes_source(args, "bytearray"));
}

value_t b_list(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "list", {"iterable"}, 0);
    return make_list(p[0] ? to_vector(*p[0]) : std::vector<value_t>{});
}

value_t b_tuple(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "tuple", {"iterable"}, 0);
    if (!p[0]) return make_tuple();
    if (std::holds_alternative<std::shared_ptr<const tuple_obj>>(*p[0])) return *p[0];
    return make_tuple(to_vector(*p[0]));
}

void dict_update(dict_obj &d, const value_t &src) {
    if (const auto *other = std::get_if<std::shared_ptr<dict_obj>>(&src)) {
        auto entries = (*other)->entries;
        for (auto &[k, v] : entries) d.set(k, std::move(v));
        return;
    }
    iterate(src, [&](const value_t &item) {
        auto kv = to_vector(item);
        if (kv.size() != 2) {
            value_error("dictionary update sequence element has length " +
                        std::to_string(kv.size()) + "; 2 is required");
        }
        d.set(kv[0], std::move(kv[1]));
        return true;
    });
}

value_t b_dict(Interpreter &, call_args_t &args) {
    if (args.pos.size() > 1) type_error("dict expected at most 1 argument");
    auto d = std::make_shared<dict_obj>();
    if (!args.pos.empty()) dict_update(*d, args.pos[0]);
    for (auto &[k, v] : args.kw) d->set(make_str(k), std::move(v));
    return value_t{std::move(d)};
}

value_t b_range(Interpreter &, call_args_t &args) {
    no_kwargs(args, "range");
    if (args.pos.empty() || args.pos.size() > 3) {
        type_error("range expected 1 to 3 arguments, got " + std::to_string(args.pos.size()));
    }
    range_v r{0, 0, 1};
    if (args.pos.size() == 1) {
        r.stop = expect_int(args.pos[0], "range() argument");
    } else {
        r.start = expect_int(args.pos[0], "range() argument");
        r.stop = expect_int(args.pos[1], "range() argument");
        if (args.pos.size() == 3) r.step = expect_int(args.pos[2], "range() argument");
    }
    if (r.step == 0) value_error("range() arg 3 must not be zero");
    return value_t{std::in_place_type<range_v>, r};
}

value_t b_len(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "len", {"obj"}, 1);
    return make_int(length_of(*p[0]));
}

value_t b_abs(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "abs", {"x"}, 1);
    i64 x = expect_int(*p[0], "abs() argument");
    return make_int(x < 0 ? checked_sub(0, x) : x);
}

value_t b_all(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "all", {"iterable"}, 1);
    bool r = true;
    iterate(*p[0], [&](const value_t &v) { return r = truthy(v); });
    return make_bool(r);
}

value_t b_any(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "any", {"iterable"}, 1);
    bool r = false;
    iterate(*p[0], [&](const value_t &v) { return !(r = truthy(v)); });
    return make_bool(r);
}

value_t b_bin(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "bin", {"x"}, 1);
    return make_str(format_int(expect_int(*p[0], "bin() argument"), 2, "0b"));
}
value_t b_hex(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "hex", {"x"}, 1);
    return make_str(format_int(expect_int(*p[0], "hex() argument"), 16, "0x"));
}
value_t b_oct(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "oct", {"x"}, 1);
    return make_str(format_int(expect_int(*p[0], "oct() argument"), 8, "0o"));
}

value_t b_chr(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "chr", {"i"}, 1);
    i64 cp = expect_int(*p[0], "chr() argument");
    if (cp < 0 || cp > 0x10ffff) value_error("chr() arg not in range(0x110000)");
    std::string s;
    append_utf8(s, static_cast<std::uint32_t>(cp));
    return make_str(std::move(s));
}

value_t b_ord(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "ord", {"c"}, 1);
    const value_t &c = *p[0];
    if (const auto *s = std::get_if<str_v>(&c)) {
        auto cps = code_points(s->get());
        if (cps.size() != 1) {
            type_error("ord() expected a character, but string of length " +
                       std::to_string(cps.size()) + " found");
        }
        return make_int(cps[0]);
    }
    if (const auto *b = bytes_like(c)) {
        if (b->size() != 1) {
            type_error("ord() expected a character, but string of length " +
                       std::to_string(b->size()) + " found");
        }
        return make_int(static_cast<unsigned char>((*b)[0]));
    }
    type_error("ord() expected string of length 1, but " + type_name(c) + " found");
}

value_t b_divmod(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "divmod", {"a", "b"}, 2);
    i64 a = expect_int(*p[0], "divmod() argument");
    i64 b = expect_int(*p[1], "divmod() argument");
    return make_tuple({make_int(floor_div(a, b)), make_int(floor_mod(a, b))});
}

value_t b_enumerate(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "enumerate", {"iterable", "start"}, 1);
    i64 i = p[1] ? expect_int(*p[1], "start") : 0;
    std::vector<value_t> out;
    iterate(*p[0], [&](const value_t &v) {
        out.push_back(make_tuple({make_int(i), v}));
        i = checked_add(i, 1);
        return true;
    });
    return make_list(std::move(out));
}

value_t b_zip(Interpreter &, call_args_t &args) {
    no_kwargs(args, "zip");
    std::vector<std::vector<value_t>> cols;
    std::size_t n = std::numeric_limits<std::size_t>::max();
    for (const auto &a : args.pos) {
        cols.push_back(to_vector(a));
        n = std::min(n, cols.back().size());
    }
    if (cols.empty()) n = 0;
    std::vector<value_t> out;
    for (std::size_t i = 0; i < n; i++) {
        std::vector<value_t> row;
        for (const auto &c : cols) row.push_back(c[i]);
        out.push_back(make_tuple(std::move(row)));
    }
    return make_list(std::move(out));
}

value_t b_reversed(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "reversed", {"sequence"}, 1);
    auto items = to_vector(*p[0]);
    std::reverse(items.begin(), items.end());
    return make_list(std::move(items));
}

// Keys for sorted/min/max, computed once per element.
std::vector<value_t> sort_keys(Interpreter &interp, const std::vector<value_t> &items,
                               const opt_value_t &key) {
    if (is_none(key)) return items;
    std::vector<value_t> keys;
    keys.reserve(items.size());
    for (const auto &item : items) {
        call_args_t a;
        a.pos.push_back(item);
        keys.push_back(interp.call(*key, a));
    }
    return keys;
}

value_t b_sorted(Interpreter &interp, call_args_t &args) {
    if (args.pos.size() != 1) type_error("sorted expected 1 argument");
    value_t iterable = std::move(args.pos[0]);
    args.pos.clear();
    auto p = bind_args(args, "sorted", {"key", "reverse"}, 0);
    auto items = to_vector(iterable);
    auto keys = sort_keys(interp, items, p[0]);
    bool rev = p[1] && truthy(*p[1]);
    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return rev ? compare_values(keys[b], keys[a]) < 0 : compare_values(keys[a], keys[b]) < 0;
    });
    std::vector<value_t> out;
    out.reserve(items.size());
    for (auto i : order) out.push_back(std::move(items[i]));
    return make_list(std::move(out));
}

value_t b_sum(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "sum", {"iterable", "start"}, 1);
    value_t acc = p[1] ? *p[1] : make_int(0);
    if (std::holds_alternative<str_v>(acc)) type_error("sum() can't sum strings");
    iterate(*p[0], [&](const value_t &v) {
        acc = binary_operation(binary_op::_add, acc, v);
        return true;
    });
    return acc;
}

value_t min_max(Interpreter &interp, call_args_t &args, const char *fname, bool want_max) {
    opt_value_t key, dflt;
    for (auto &[name, value] : args.kw) {
        if (name == "key") {
            key = std::move(value);
        } else if (name == "default") {
            dflt = std::move(value);
        } else {
            type_error(std::string(fname) + "() got an unexpected keyword argument '" + name + "'");
        }
    }
    if (args.pos.empty()) type_error(std::string(fname) + " expected at least 1 argument, got 0");
    std::vector<value_t> items = args.pos.size() == 1 ? to_vector(args.pos[0]) : args.pos;
    if (items.empty()) {
        if (dflt) return *dflt;
        value_error(std::string(fname) + "() arg is an empty sequence");
    }
    auto keys = sort_keys(interp, items, key);
    std::size_t best = 0;
    for (std::size_t i = 1; i < items.size(); i++) {
        int c = compare_values(keys[i], keys[best]);
        if (want_max ? c > 0 : c < 0) best = i;
    }
    return items[best];
}

value_t b_min(Interpreter &interp, call_args_t &args) { return min_max(interp, args, "min", false); }
value_t b_max(Interpreter &interp, call_args_t &args) { return min_max(interp, args, "max", true); }

value_t b_pow(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "pow", {"base", "exp", "mod"}, 2);
    i64 base = expect_int(*p[0], "pow() base");
    i64 exp = expect_int(*p[1], "pow() exponent");
    if (is_none(p[2])) return make_int(int_pow(base, exp));
    i64 mod = expect_int(*p[2], "pow() modulus");
    if (mod == 0) value_error("pow() 3rd argument cannot be 0");
    if (exp < 0) value_error("negative exponents are not supported");
    __int128 m = mod < 0 ? -static_cast<__int128>(mod) : mod;
    __int128 b = ((static_cast<__int128>(base) % m) + m) % m;
    __int128 r = 1 % m;
    while (exp > 0) {
        if (exp & 1) r = r * b % m;
        b = b * b % m;
        exp >>= 1;
    }
    if (mod < 0 && r != 0) r -= m;
    return make_int(static_cast<i64>(r));
}

bool instance_of(const value_t &v, const builtin_obj *type) {
    switch (type->tag) {
        case type_tag::_int: return is_intlike(v);
        case type_tag::_bool: return std::holds_alternative<bool>(v);
        case type_tag::_str: return std::holds_alternative<str_v>(v);
        case type_tag::_bytes: return std::holds_alternative<bytes_v>(v);
        case type_tag::_bytearray: return std::holds_alternative<std::shared_ptr<bytearray_obj>>(v);
        case type_tag::_list: return std::holds_alternative<std::shared_ptr<list_obj>>(v);
        case type_tag::_tuple: return std::holds_alternative<std::shared_ptr<const tuple_obj>>(v);
        case type_tag::_dict: return std::holds_alternative<std::shared_ptr<dict_obj>>(v);
        case type_tag::_range: return std::holds_alternative<range_v>(v);
        case type_tag::_exception: {
            const auto *e = std::get_if<std::shared_ptr<const exception_obj>>(&v);
            return e != nullptr &&
                   (std::string_view(type->name) == "Exception" || (*e)->type == type->name);
        }
        default: type_error("isinstance() arg 2 must be a type or tuple of types");
    }
}

value_t b_isinstance(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "isinstance", {"obj", "class_or_tuple"}, 2);
    const value_t &cls = *p[1];
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&cls)) {
        for (const auto &c : (*t)->items) {
            const auto *b = std::get_if<const builtin_obj *>(&c);
            if (b == nullptr) type_error("isinstance() arg 2 must be a type or tuple of types");
            if (instance_of(*p[0], *b)) return make_bool(true);
        }
        return make_bool(false);
    }
    const auto *b = std::get_if<const builtin_obj *>(&cls);
    if (b == nullptr) type_error("isinstance() arg 2 must be a type or tuple of types");
    return make_bool(instance_of(*p[0], *b));
}

value_t b_map(Interpreter &interp, call_args_t &args) {
    no_kwargs(args, "map");
    if (args.pos.size() < 2) type_error("map() must have at least two arguments.");
    std::vector<std::vector<value_t>> cols;
    std::size_t n = std::numeric_limits<std::size_t>::max();
    for (std::size_t i = 1; i < args.pos.size(); i++) {
        cols.push_back(to_vector(args.pos[i]));
        n = std::min(n, cols.back().size());
    }
    std::vector<value_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; i++) {
        call_args_t a;
        for (const auto &c : cols) a.pos.push_back(c[i]);
        out.push_back(interp.call(args.pos[0], a));
    }
    return make_list(std::move(out));
}

value_t b_filter(Interpreter &interp, call_args_t &args) {
    no_kwargs(args, "filter");
    if (args.pos.size() != 2) type_error("filter expected 2 arguments");
    std::vector<value_t> out;
    const value_t &fn = args.pos[0];
    iterate(args.pos[1], [&](const value_t &v) {
        bool keep = false;
        if (std::holds_alternative<none_t>(fn)) {
            keep = truthy(v);
        } else {
            call_args_t a;
            a.pos.push_back(v);
            keep = truthy(interp.call(fn, a));
        }
        if (keep) out.push_back(v);
        return true;
    });
    return make_list(std::move(out));
}

constexpr const char *_exception_names[] = {
        "Exception",     "ValueError",        "TypeError",     "KeyError",       "IndexError",
        "RuntimeError",  "ZeroDivisionError", "OverflowError", "AssertionError",
};

template <int I>
value_t b_exception(Interpreter &, call_args_t &args) {
    no_kwargs(args, _exception_names[I]);
    std::string msg;
    if (args.pos.size() == 1) {
        msg = to_str(args.pos[0]);
    } else if (args.pos.size() > 1) {
        msg = repr(make_tuple(args.pos));
    }
    return value_t{std::in_place_type<std::shared_ptr<const exception_obj>>,
                   std::make_shared<const exception_obj>(
                           exception_obj{_exception_names[I], std::move(msg)})};
}

value_t t_int_from_bytes(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "from_bytes", {"bytes", "byteorder", "signed"}, 1);
    bool big = parse_byteorder(p[1]);
    bool is_signed = p[2] && truthy(*p[2]);
    return make_int(int_from_bytes(bytes_of(*p[0]), big, is_signed));
}

value_t t_bytes_fromhex(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "fromhex", {"string"}, 1);
    return make_bytes(from_hex(expect_str(*p[0], "fromhex() argument")));
}

value_t t_bytearray_fromhex(Interpreter &, call_args_t &args) {
    auto p = bind_args(args, "fromhex", {"string"}, 1);
    return make_bytearray(from_hex(expect_str(*p[0], "fromhex() argument")));
}

const builtin_obj _builtins[] = {
        {"int", b_int, type_tag::_int},
        {"bool", b_bool, type_tag::_bool},
        {"str", b_str, type_tag::_str},
        {"bytes", b_bytes, type_tag::_bytes},
        {"bytearray", b_bytearray, type_tag::_bytearray},
        {"list", b_list, type_tag::_list},
        {"tuple", b_tuple, type_tag::_tuple},
        {"dict", b_dict, type_tag::_dict},
        {"range", b_range, type_tag::_range},
        {"len", b_len},
        {"abs", b_abs},
        {"all", b_all},
        {"any", b_any},
        {"bin", b_bin},
        {"hex", b_hex},
        {"oct", b_oct},
        {"chr", b_chr},
        {"ord", b_ord},
        {"divmod", b_divmod},
        {"enumerate", b_enumerate},
        {"zip", b_zip},
        {"reversed", b_reversed},
        {"sorted", b_sorted},
        {"sum", b_sum},
        {"min", b_min},
        {"max", b_max},
        {"pow", b_pow},
        {"isinstance", b_isinstance},
        {"map", b_map},
        {"filter", b_filter},
        {"Exception", b_exception<0>, type_tag::_exception},
        {"ValueError", b_exception<1>, type_tag::_exception},
        {"TypeError", b_exception<2>, type_tag::_exception},
        {"KeyError", b_exception<3>, type_tag::_exception},
        {"IndexError", b_exception<4>, type_tag::_exception},
        {"RuntimeError", b_exception<5>, type_tag::_exception},
        {"ZeroDivisionError", b_exception<6>, type_tag::_exception},
        {"OverflowError", b_exception<7>, type_tag::_exception},
        {"AssertionError", b_exception<8>, type_tag::_exception},
};

const builtin_obj _int_from_bytes{"from_bytes", t_int_from_bytes};
const builtin_obj _bytes_fromhex{"fromhex", t_bytes_fromhex};
const builtin_obj _bytearray_fromhex{"fromhex", t_bytearray_fromhex};

// Built once during static initialization.
const std::unordered_map<std::string_view, const builtin_obj *> _builtin_index = [] {
    std::unordered_map<std::string_view, const builtin_obj *> m;
    for (const auto &b : _builtins) m.emplace(b.name, &b);
    return m;
}();

// ---- methods ----

value_t int_method(const value_t &self, const std::string &name, call_args_t &args) {
    i64 x = expect_int(self, "self");
    if (name == "to_bytes") {
        auto p = bind_args(args, name, {"length", "byteorder", "signed"}, 0);
        i64 length = p[0] ? expect_int(*p[0], "length") : 1;
        bool big = parse_byteorder(p[1]);
        bool is_signed = p[2] && truthy(*p[2]);
        return make_bytes(int_to_bytes(x, length, big, is_signed));
    }
    if (name == "bit_length") {
        bind_args(args, name, {}, 0);
        std::uint64_t mag = x < 0 ? 0 - static_cast<std::uint64_t>(x) : static_cast<std::uint64_t>(x);
        return make_int(mag == 0 ? 0 : 64 - __builtin_clzll(mag));
    }
    throw ScriptError("AttributeError", "'int' object has no attribute '" + name + "'");
}

value_t bytes_method(const value_t &self, const std::string &name, call_args_t &args) {
    const std::string &data = *bytes_like(self);
    bool mutable_ = std::holds_alternative<std::shared_ptr<bytearray_obj>>(self);
    if (name == "decode") {
        auto p = bind_args(args, name, {"encoding", "errors"}, 0);
        return make_str(decode_text(data, p[0], p[1]));
    }
    if (name == "hex") {
        bind_args(args, name, {}, 0);
        return make_str(to_hex(data));
    }
    if (name == "find" || name == "count") {
        auto p = bind_args(args, name, {"sub", "start", "end"}, 1);
        std::string sub = needle_bytes(*p[0]);
        if (name == "find") return make_int(find_in(data, sub, p[1], p[2]));
        return make_int(count_in(data, sub, p[1], p[2]));
    }
    if (name == "startswith" || name == "endswith") {
        auto p = bind_args(args, name, {"prefix", "start", "end"}, 1);
        bool at_end = name == "endswith";
        if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&*p[0])) {
            for (const auto &a : (*t)->items) {
                if (affix_in(data, expect_bytes_like(a, name + " first arg"), at_end, p[1], p[2])) {
                    return make_bool(true);
                }
            }
            return make_bool(false);
        }
        return make_bool(affix_in(data, expect_bytes_like(*p[0], name + " first arg"), at_end,
                                  p[1], p[2]));
    }
    if (name == "join" && !mutable_) {
        auto p = bind_args(args, name, {"iterable"}, 1);
        std::string out;
        bool first = true;
        iterate(*p[0], [&](const value_t &v) {
            if (!first) out += data;
            first = false;
            out += expect_bytes_like(v, "sequence item");
            return true;
        });
        return make_bytes(std::move(out));
    }
    if (name == "replace") {
        auto p = bind_args(args, name, {"old", "new", "count"}, 2);
        const std::string &old = expect_bytes_like(*p[0], "replace() argument 1");
        const std::string &repl = expect_bytes_like(*p[1], "replace() argument 2");
        i64 count = p[2] ? expect_int(*p[2], "count") : -1;
        return same_kind(self, replace_text(data, old, repl, count, byte_bounds(data)));
    }
    if (name == "split") {
        auto p = bind_args(args, name, {"sep", "maxsplit"}, 0);
        i64 maxsplit = p[1] ? expect_int(*p[1], "maxsplit") : -1;
        std::vector<std::string> parts;
        if (is_none(p[0])) {
            parts = split_text(data, nullptr, maxsplit);
        } else {
            std::string sep = expect_bytes_like(*p[0], "sep");
            parts = split_text(data, &sep, maxsplit);
        }
        std::vector<value_t> out;
        out.reserve(parts.size());
        for (auto &s : parts) out.push_back(same_kind(self, std::move(s)));
        return make_list(std::move(out));
    }
    if (mutable_) {
        auto &arr = std::get<std::shared_ptr<bytearray_obj>>(self)->data;
        if (name == "append") {
            auto p = bind_args(args, name, {"item"}, 1);
            arr += expect_byte(*p[0]);
            return make_none();
        }
        if (name == "extend") {
            auto p = bind_args(args, name, {"iterable"}, 1);
            if (is_intlike(*p[0])) type_error("can't extend bytearray with int");
            arr += bytes_of(*p[0]);
            return make_none();
        }
        if (name == "pop") {
            auto p = bind_args(args, name, {"index"}, 0);
            if (arr.empty()) throw ScriptError("IndexError", "pop from empty bytearray");
            i64 i = normalize_index(p[0] ? expect_int(*p[0], "index") : -1,
                                    static_cast<i64>(arr.size()), "pop");
            auto c = static_cast<unsigned char>(arr[static_cast<std::size_t>(i)]);
            arr.erase(static_cast<std::size_t>(i), 1);
            return make_int(c);
        }
        if (name == "clear") {
            bind_args(args, name, {}, 0);
            arr.clear();
            return make_none();
        }
        if (name == "copy") {
            bind_args(args, name, {}, 0);
            return make_bytearray(arr);
        }
    }
    throw ScriptError("AttributeError",
                      "'" + type_name(self) + "' object has no attribute '" + name + "'");
}

value_t str_method(const value_t &self, const std::string &name, call_args_t &args) {
    const std::string &s = std::get<str_v>(self).get();
    if (name == "encode") {
        auto p = bind_args(args, name, {"encoding", "errors"}, 0);
        return make_bytes(encode_text(s, p[0], p[1]));
    }
    if (name == "join") {
        auto p = bind_args(args, name, {"iterable"}, 1);
        std::string out;
        std::size_t idx = 0;
        iterate(*p[0], [&](const value_t &v) {
            const auto *item = std::get_if<str_v>(&v);
            if (item == nullptr) {
                type_error("sequence item " + std::to_string(idx) + ": expected str instance, " +
                           type_name(v) + " found");
            }
            if (idx++ != 0) out += s;
            out += item->get();
            return true;
        });
        return make_str(std::move(out));
    }
    if (name == "split") {
        auto p = bind_args(args, name, {"sep", "maxsplit"}, 0);
        i64 maxsplit = p[1] ? expect_int(*p[1], "maxsplit") : -1;
        std::vector<std::string> parts =
                is_none(p[0]) ? split_text(s, nullptr, maxsplit)
                              : split_text(s, &expect_str(*p[0], "sep"), maxsplit);
        std::vector<value_t> out;
        out.reserve(parts.size());
        for (auto &part : parts) out.push_back(make_str(std::move(part)));
        return make_list(std::move(out));
    }
    if (name == "replace") {
        auto p = bind_args(args, name, {"old", "new", "count"}, 2);
        const std::string &old = expect_str(*p[0], "replace() argument 1");
        const std::string &repl = expect_str(*p[1], "replace() argument 2");
        i64 count = p[2] ? expect_int(*p[2], "count") : -1;
        return make_str(replace_text(s, old, repl, count, char_bounds(s)));
    }
    if (name == "find") {
        auto p = bind_args(args, name, {"sub", "start", "end"}, 1);
        const std::string &sub = expect_str(*p[0], "find() argument");
        if (is_ascii(s) && is_ascii(sub)) return make_int(find_in(s, sub, p[1], p[2]));
        return make_int(find_in(to_u32(s), to_u32(sub), p[1], p[2]));
    }
    if (name == "startswith" || name == "endswith") {
        auto p = bind_args(args, name, {"prefix", "start", "end"}, 1);
        bool at_end = name == "endswith";
        auto test = [&](const value_t &a) {
            const std::string &affix = expect_str(a, name + " first arg");
            if (is_ascii(s) && is_ascii(affix)) return affix_in(s, affix, at_end, p[1], p[2]);
            return affix_in(to_u32(s), to_u32(affix), at_end, p[1], p[2]);
        };
        if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&*p[0])) {
            return make_bool(std::any_of((*t)->items.begin(), (*t)->items.end(), test));
        }
        return make_bool(test(*p[0]));
    }
    throw ScriptError("AttributeError", "'str' object has no attribute '" + name + "'");
}

value_t list_method(const value_t &self, const std::string &name, call_args_t &args) {
    auto lst = std::get<std::shared_ptr<list_obj>>(self);
    auto &items = lst->items;
    if (name == "append") {
        auto p = bind_args(args, name, {"object"}, 1);
        items.push_back(std::move(*p[0]));
        return make_none();
    }
    if (name == "extend") {
        auto p = bind_args(args, name, {"iterable"}, 1);
        auto more = to_vector(*p[0]);
        items.insert(items.end(), more.begin(), more.end());
        return make_none();
    }
    if (name == "pop") {
        auto p = bind_args(args, name, {"index"}, 0);
        if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
        i64 i = normalize_index(p[0] ? expect_int(*p[0], "index") : -1,
                                static_cast<i64>(items.size()), "pop");
        value_t v = std::move(items[static_cast<std::size_t>(i)]);
        items.erase(items.begin() + i);
        return v;
    }
    if (name == "insert") {
        auto p = bind_args(args, name, {"index", "object"}, 2);
        auto n = static_cast<i64>(items.size());
        i64 i = expect_int(*p[0], "index");
        if (i < 0) i = std::max<i64>(0, i + n);
        i = std::min(i, n);
        items.insert(items.begin() + i, std::move(*p[1]));
        return make_none();
    }
    if (name == "index") {
        auto p = bind_args(args, name, {"value", "start", "stop"}, 1);
        auto sb = adjust_slice(static_cast<i64>(items.size()), p[1].value_or(make_none()),
                               p[2].value_or(make_none()), make_none());
        for (i64 i = sb.start; i < sb.stop && i < static_cast<i64>(items.size()); i++) {
            if (values_equal(items[static_cast<std::size_t>(i)], *p[0])) return make_int(i);
        }
        value_error(repr(*p[0]) + " is not in list");
    }
    if (name == "count") {
        auto p = bind_args(args, name, {"value"}, 1);
        i64 cnt = 0;
        for (std::size_t i = 0; i < items.size(); i++) {
            if (values_equal(items[i], *p[0])) cnt++;
        }
        return make_int(cnt);
    }
    if (name == "reverse") {
        bind_args(args, name, {}, 0);
        std::reverse(items.begin(), items.end());
        return make_none();
    }
    if (name == "clear") {
        bind_args(args, name, {}, 0);
        items.clear();
        return make_none();
    }
    if (name == "copy") {
        bind_args(args, name, {}, 0);
        return make_list(items);
    }
    throw ScriptError("AttributeError", "'list' object has no attribute '" + name + "'");
}

value_t dict_method(const value_t &self, const std::string &name, call_args_t &args) {
    auto d = std::get<std::shared_ptr<dict_obj>>(self);
    if (name == "get") {
        auto p = bind_args(args, name, {"key", "default"}, 1);
        if (const value_t *v = d->find(*p[0])) return *v;
        return p[1] ? *p[1] : make_none();
    }
    if (name == "keys" || name == "values" || name == "items") {
        bind_args(args, name, {}, 0);
        std::vector<value_t> out;
        out.reserve(d->entries.size());
        for (const auto &[k, v] : d->entries) {
            if (name == "keys") {
                out.push_back(k);
            } else if (name == "values") {
                out.push_back(v);
            } else {
                out.push_back(make_tuple({k, v}));
            }
        }
        return make_list(std::move(out));
    }
    if (name == "pop") {
        auto p = bind_args(args, name, {"key", "default"}, 1);
        value_t removed;
        if (d->erase(*p[0], &removed)) return removed;
        if (p[1]) return *p[1];
        throw ScriptError("KeyError", repr(*p[0]));
    }
    if (name == "setdefault") {
        auto p = bind_args(args, name, {"key", "default"}, 1);
        if (const value_t *v = d->find(*p[0])) return *v;
        value_t v = p[1] ? *p[1] : make_none();
        d->set(*p[0], v);
        return v;
    }
    if (name == "update") {
        if (args.pos.size() > 1) type_error("update expected at most 1 argument");
        if (!args.pos.empty()) dict_update(*d, args.pos[0]);
        for (auto &[k, v] : args.kw) d->set(make_str(k), std::move(v));
        return make_none();
    }
    if (name == "copy") {
        bind_args(args, name, {}, 0);
        return std::make_shared<dict_obj>(*d);
    }
    if (name == "clear") {
        bind_args(args, name, {}, 0);
        d->clear();
        return make_none();
    }
    throw ScriptError("AttributeError", "'dict' object has no attribute '" + name + "'");
}

bool in_list(std::string_view name, std::initializer_list<std::string_view> names) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

const builtin_obj *find_builtin(const std::string_view name) {
    auto it = _builtin_index.find(name);
    return it == _builtin_index.end() ? nullptr : it->second;
}

const builtin_obj *find_type_attribute(const builtin_obj *type, const std::string_view attr) {
    if (type->tag == type_tag::_int && attr == "from_bytes") return &_int_from_bytes;
    if (type->tag == type_tag::_bytes && attr == "fromhex") return &_bytes_fromhex;
    if (type->tag == type_tag::_bytearray && attr == "fromhex") return &_bytearray_fromhex;
    return nullptr;
}

bool has_method(const value_t &self, const std::string_view name) {
    if (is_intlike(self)) return in_list(name, {"to_bytes", "bit_length"});
    if (std::holds_alternative<bytes_v>(self)) {
        return in_list(name, {"decode", "hex", "find", "count", "startswith", "endswith", "join",
                              "replace", "split"});
    }
    if (std::holds_alternative<std::shared_ptr<bytearray_obj>>(self)) {
        return in_list(name, {"decode", "hex", "find", "count", "startswith", "endswith",
                              "replace", "split", "append", "extend", "pop", "clear", "copy"});
    }
    if (std::holds_alternative<str_v>(self)) {
        return in_list(name,
                       {"encode", "join", "split", "replace", "find", "startswith", "endswith"});
    }
    if (std::holds_alternative<std::shared_ptr<list_obj>>(self)) {
        return in_list(name, {"append", "extend", "pop", "insert", "index", "count", "reverse",
                              "clear", "copy"});
    }
    if (std::holds_alternative<std::shared_ptr<dict_obj>>(self)) {
        return in_list(name, {"get", "keys", "values", "items", "pop", "setdefault", "update",
                              "copy", "clear"});
    }
    return false;
}

value_t call_method(Interpreter &, const value_t &self, const std::string &name,
                    call_args_t &args) {
    if (!has_method(self, name)) {
        throw ScriptError("AttributeError",
                          "'" + type_name(self) + "' object has no attribute '" + name + "'");
    }
    if (is_intlike(self)) return int_method(self, name, args);
    if (bytes_like(self) != nullptr) return bytes_method(self, name, args);
    if (std::holds_alternative<str_v>(self)) return str_method(self, name, args);
    if (std::holds_alternative<std::shared_ptr<list_obj>>(self)) {
        return list_method(self, name, args);
    }
    return dict_method(self, name, args);
}

}  // namespace arena::script
