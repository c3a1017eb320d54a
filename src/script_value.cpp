//
// Copyright (c) 2024-2025 JLGxy
//

#include "script_value.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arena::script {

namespace {

constexpr int _max_compare_depth = 500;

using i64 = std::int64_t;

bool is_intlike(const value_t &v) {
    return std::holds_alternative<i64>(v) || std::holds_alternative<bool>(v);
}
i64 int_of(const value_t &v) {
    if (const auto *b = std::get_if<bool>(&v)) return *b ? 1 : 0;
    return std::get<i64>(v);
}

[[noreturn]] void type_error(std::string msg) { throw ScriptError("TypeError", std::move(msg)); }
[[noreturn]] void overflow() { throw ScriptError("OverflowError", "integer overflow"); }

std::string quote(std::string_view s, char q) {
    static constexpr char _hex[] = "0123456789abcdef";
    std::string r(1, q);
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\\' || c == static_cast<unsigned char>(q)) {
            r += '\\';
            r += ch;
        } else if (c == '\n') {
            r += "\\n";
        } else if (c == '\r') {
            r += "\\r";
        } else if (c == '\t') {
            r += "\\t";
        } else if (c < 0x20 || c == 0x7f) {
            r += "\\x";
            r += _hex[c >> 4];
            r += _hex[c & 15];
        } else {
            r += ch;
        }
    }
    r += q;
    return r;
}

std::string bytes_repr(std::string_view s) {
    static constexpr char _hex[] = "0123456789abcdef";
    char q = (s.find('\'') != std::string_view::npos && s.find('"') == std::string_view::npos)
                     ? '"'
                     : '\'';
    std::string r = "b";
    r += q;
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\\' || c == static_cast<unsigned char>(q)) {
            r += '\\';
            r += ch;
        } else if (c == '\n') {
            r += "\\n";
        } else if (c == '\r') {
            r += "\\r";
        } else if (c == '\t') {
            r += "\\t";
        } else if (c < 0x20 || c >= 0x7f) {
            r += "\\x";
            r += _hex[c >> 4];
            r += _hex[c & 15];
        } else {
            r += ch;
        }
    }
    r += q;
    return r;
}

std::string repr_impl(const value_t &v, int depth);

template <typename Seq>
std::string join_repr(const Seq &items, int depth) {
    std::string r;
    for (std::size_t i = 0; i < items.size(); i++) {
        if (i) r += ", ";
        r += repr_impl(items[i], depth + 1);
    }
    return r;
}

std::string repr_impl(const value_t &v, int depth) {
    if (depth > _max_compare_depth) return "...";
    return std::visit(
            overloaded{
                    [](const none_t &) -> std::string { return "None"; },
                    [](bool b) -> std::string { return b ? "True" : "False"; },
                    [](i64 x) -> std::string { return std::to_string(x); },
                    [](const str_v &s) -> std::string {
                        bool has_single = s.get().find('\'') != std::string::npos;
                        bool has_double = s.get().find('"') != std::string::npos;
                        return quote(s.get(), has_single && !has_double ? '"' : '\'');
                    },
                    [](const bytes_v &b) -> std::string { return bytes_repr(b.get()); },
                    [](const std::shared_ptr<bytearray_obj> &b) -> std::string {
                        return "bytearray(" + bytes_repr(b->data) + ")";
                    },
                    [&](const std::shared_ptr<list_obj> &l) -> std::string {
                        return "[" + join_repr(l->items, depth) + "]";
                    },
                    [&](const std::shared_ptr<const tuple_obj> &t) -> std::string {
                        if (t->items.size() == 1) return "(" + repr_impl(t->items[0], depth + 1) + ",)";
                        return "(" + join_repr(t->items, depth) + ")";
                    },
                    [&](const std::shared_ptr<dict_obj> &d) -> std::string {
                        std::string r = "{";
                        for (std::size_t i = 0; i < d->entries.size(); i++) {
                            if (i) r += ", ";
                            r += repr_impl(d->entries[i].first, depth + 1) + ": " +
                                 repr_impl(d->entries[i].second, depth + 1);
                        }
                        return r + "}";
                    },
                    [](const range_v &r) -> std::string {
                        std::string s = "range(" + std::to_string(r.start) + ", " +
                                        std::to_string(r.stop);
                        if (r.step != 1) s += ", " + std::to_string(r.step);
                        return s + ")";
                    },
                    [](const std::shared_ptr<const function_obj> &f) -> std::string {
                        return "<function " + f->def->name + ">";
                    },
                    [](const std::shared_ptr<const method_obj> &m) -> std::string {
                        return "<built-in method " + m->name + ">";
                    },
                    [](const builtin_obj *b) -> std::string {
                        if (b->tag == type_tag::_none) {
                            return std::string("<built-in function ") + b->name + ">";
                        }
                        return std::string("<class '") + b->name + "'>";
                    },
                    [](const std::shared_ptr<const exception_obj> &e) -> std::string {
                        return e->type + "(" + quote(e->msg, '\'') + ")";
                    },
            },
            v);
}

bool equal_impl(const value_t &a, const value_t &b, int depth);

template <typename Seq>
bool seq_equal(const Seq &x, const Seq &y, int depth) {
    if (x.size() != y.size()) return false;
    for (std::size_t i = 0; i < x.size(); i++) {
        if (!equal_impl(x[i], y[i], depth + 1)) return false;
    }
    return true;
}

bool equal_impl(const value_t &a, const value_t &b, int depth) {
    if (depth > _max_compare_depth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded in comparison");
    }
    if (is_intlike(a) && is_intlike(b)) return int_of(a) == int_of(b);
    if (const auto *x = bytes_like(a)) {
        const auto *y = bytes_like(b);
        return y != nullptr && *x == *y;
    }
    if (a.index() != b.index()) return false;
    if (const auto *s = std::get_if<str_v>(&a)) return s->get() == std::get<str_v>(b).get();
    if (std::holds_alternative<none_t>(a)) return true;
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&a)) {
        const auto &r = std::get<std::shared_ptr<list_obj>>(b);
        return *l == r || seq_equal((*l)->items, r->items, depth);
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&a)) {
        const auto &r = std::get<std::shared_ptr<const tuple_obj>>(b);
        return *t == r || seq_equal((*t)->items, r->items, depth);
    }
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&a)) {
        const auto &r = std::get<std::shared_ptr<dict_obj>>(b);
        if (*d == r) return true;
        if ((*d)->entries.size() != r->entries.size()) return false;
        for (const auto &[k, v] : (*d)->entries) {
            const value_t *other = r->find(k);
            if (other == nullptr || !equal_impl(v, *other, depth + 1)) return false;
        }
        return true;
    }
    if (const auto *x = std::get_if<range_v>(&a)) {
        const auto &y = std::get<range_v>(b);
        i64 n = x->size();
        if (n != y.size()) return false;
        if (n == 0) return true;
        return x->start == y.start && (n == 1 || x->step == y.step);
    }
    return is_same_object(a, b);
}

template <typename Seq>
int seq_compare(const Seq &x, const Seq &y) {
    std::size_t n = std::min(x.size(), y.size());
    for (std::size_t i = 0; i < n; i++) {
        if (!values_equal(x[i], y[i])) return compare_values(x[i], y[i]);
    }
    return x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
}

void hash_key_impl(const value_t &v, std::string &out) {
    if (is_intlike(v)) {
        out += 'i';
        out += std::to_string(int_of(v));
        out += ';';
        return;
    }
    auto counted = [&](char tag, const std::string &s) {
        out += tag;
        out += std::to_string(s.size());
        out += ':';
        out += s;
    };
    std::visit(overloaded{
                       [&](const none_t &) { out += 'n'; },
                       [&](const str_v &s) { counted('s', s.get()); },
                       [&](const bytes_v &b) { counted('b', b.get()); },
                       [&](const std::shared_ptr<const tuple_obj> &t) {
                           out += '(';
                           for (const auto &item : t->items) hash_key_impl(item, out);
                           out += ')';
                       },
                       [&](const range_v &r) {
                           out += 'r' + std::to_string(r.start) + ',' + std::to_string(r.stop) +
                                  ',' + std::to_string(r.step) + ';';
                       },
                       [&](const std::shared_ptr<const function_obj> &f) {
                           out += 'f' + std::to_string(reinterpret_cast<std::uintptr_t>(f.get())) + ';';
                       },
                       [&](const std::shared_ptr<const method_obj> &m) {
                           out += 'm' + std::to_string(reinterpret_cast<std::uintptr_t>(m.get())) + ';';
                       },
                       [&](const builtin_obj *b) {
                           out += 'B' + std::to_string(reinterpret_cast<std::uintptr_t>(b)) + ';';
                       },
                       [&](const std::shared_ptr<const exception_obj> &e) {
                           out += 'e' + std::to_string(reinterpret_cast<std::uintptr_t>(e.get())) + ';';
                       },
                       [&](const auto &) { type_error("unhashable type: '" + type_name(v) + "'"); },
               },
               v);
}

std::string repeat(const std::string &s, i64 n) {
    if (n <= 0 || s.empty()) return {};
    i64 total = 0;
    if (__builtin_mul_overflow(static_cast<i64>(s.size()), n, &total)) {
        throw ScriptError("MemoryError", "");
    }
    std::string r;
    r.reserve(static_cast<std::size_t>(total));
    for (i64 i = 0; i < n; i++) r += s;
    return r;
}

std::vector<value_t> repeat(const std::vector<value_t> &items, i64 n) {
    if (n <= 0 || items.empty()) return {};
    i64 total = 0;
    if (__builtin_mul_overflow(static_cast<i64>(items.size()), n, &total)) {
        throw ScriptError("MemoryError", "");
    }
    std::vector<value_t> r;
    r.reserve(static_cast<std::size_t>(total));
    for (i64 i = 0; i < n; i++) r.insert(r.end(), items.begin(), items.end());
    return r;
}

value_t sequence_repeat(const value_t &seq, i64 n) {
    if (const auto *s = std::get_if<str_v>(&seq)) return make_str(repeat(s->get(), n));
    if (const auto *b = std::get_if<bytes_v>(&seq)) return make_bytes(repeat(b->get(), n));
    if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&seq)) {
        return make_bytearray(repeat((*ba)->data, n));
    }
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&seq)) {
        return make_list(repeat((*l)->items, n));
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&seq)) {
        return make_tuple(repeat((*t)->items, n));
    }
    return make_none();
}

[[noreturn]] void unsupported(const char *op, const value_t &a, const value_t &b) {
    type_error(std::string("unsupported operand type(s) for ") + op + ": '" + type_name(a) +
               "' and '" + type_name(b) + "'");
}

// Code point offsets of a non-ASCII string, so slicing can cut on character boundaries.
std::vector<std::size_t> char_offsets(const std::string &s) {
    std::vector<std::size_t> offs;
    for (std::size_t i = 0; i < s.size(); i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xc0) != 0x80) offs.push_back(i);
    }
    offs.push_back(s.size());
    return offs;
}

template <typename Seq, typename Out>
void collect_slice(const Seq &src, const slice_bounds_t &sb, Out &out) {
    for (i64 i = 0, p = sb.start; i < sb.count; i++, p += sb.step) {
        out.push_back(src[static_cast<std::size_t>(p)]);
    }
}

template <typename Seq>
void assign_slice(Seq &dst, const slice_bounds_t &sb, const Seq &src) {
    if (sb.step == 1) {
        auto first = dst.begin() + sb.start;
        auto last = dst.begin() + std::max(sb.start, sb.stop);
        auto pos = dst.erase(first, last);
        dst.insert(pos, src.begin(), src.end());
        return;
    }
    if (static_cast<i64>(src.size()) != sb.count) {
        throw ScriptError("ValueError", "attempt to assign sequence of size " +
                                                std::to_string(src.size()) +
                                                " to extended slice of size " +
                                                std::to_string(sb.count));
    }
    for (i64 i = 0, p = sb.start; i < sb.count; i++, p += sb.step) {
        dst[static_cast<std::size_t>(p)] = src[static_cast<std::size_t>(i)];
    }
}

}  // namespace

// ---- range / dict ----

std::int64_t range_v::size() const {
    if (step > 0 && start < stop) {
        return static_cast<i64>((static_cast<__int128>(stop) - start - 1) / step + 1);
    }
    if (step < 0 && start > stop) {
        return static_cast<i64>((static_cast<__int128>(start) - stop - 1) /
                                        (-static_cast<__int128>(step)) +
                                1);
    }
    return 0;
}

value_t *dict_obj::find(const value_t &key) {
    auto it = index.find(hash_key(key));
    return it == index.end() ? nullptr : &entries[it->second].second;
}

void dict_obj::set(const value_t &key, value_t value) {
    auto k = hash_key(key);
    auto it = index.find(k);
    if (it != index.end()) {
        entries[it->second].second = std::move(value);
        return;
    }
    index.emplace(std::move(k), entries.size());
    entries.emplace_back(key, std::move(value));
}

bool dict_obj::erase(const value_t &key, value_t *removed) {
    auto it = index.find(hash_key(key));
    if (it == index.end()) return false;
    std::size_t pos = it->second;
    if (removed != nullptr) *removed = std::move(entries[pos].second);
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
    index.erase(it);
    for (auto &[_, i] : index) {
        if (i > pos) --i;
    }
    return true;
}

// ---- inspection ----

std::string type_name(const value_t &v) {
    return std::visit(
            overloaded{
                    [](const none_t &) -> std::string { return "NoneType"; },
                    [](bool) -> std::string { return "bool"; },
                    [](i64) -> std::string { return "int"; },
                    [](const str_v &) -> std::string { return "str"; },
                    [](const bytes_v &) -> std::string { return "bytes"; },
                    [](const std::shared_ptr<bytearray_obj> &) -> std::string { return "bytearray"; },
                    [](const std::shared_ptr<list_obj> &) -> std::string { return "list"; },
                    [](const std::shared_ptr<const tuple_obj> &) -> std::string { return "tuple"; },
                    [](const std::shared_ptr<dict_obj> &) -> std::string { return "dict"; },
                    [](const range_v &) -> std::string { return "range"; },
                    [](const std::shared_ptr<const function_obj> &) -> std::string {
                        return "function";
                    },
                    [](const std::shared_ptr<const method_obj> &) -> std::string {
                        return "builtin_function_or_method";
                    },
                    [](const builtin_obj *b) -> std::string {
                        return b->tag == type_tag::_none ? "builtin_function_or_method" : "type";
                    },
                    [](const std::shared_ptr<const exception_obj> &e) -> std::string {
                        return e->type;
                    },
            },
            v);
}

bool truthy(const value_t &v) {
    return std::visit(overloaded{
                              [](const none_t &) { return false; },
                              [](bool b) { return b; },
                              [](i64 x) { return x != 0; },
                              [](const str_v &s) { return !s.get().empty(); },
                              [](const bytes_v &b) { return !b.get().empty(); },
                              [](const std::shared_ptr<bytearray_obj> &b) { return !b->data.empty(); },
                              [](const std::shared_ptr<list_obj> &l) { return !l->items.empty(); },
                              [](const std::shared_ptr<const tuple_obj> &t) {
                                  return !t->items.empty();
                              },
                              [](const std::shared_ptr<dict_obj> &d) { return !d->entries.empty(); },
                              [](const range_v &r) { return r.size() > 0; },
                              [](const auto &) { return true; },
                      },
                      v);
}

std::string repr(const value_t &v) { return repr_impl(v, 0); }

std::string to_str(const value_t &v) {
    if (const auto *s = std::get_if<str_v>(&v)) return s->get();
    if (const auto *e = std::get_if<std::shared_ptr<const exception_obj>>(&v)) return (*e)->msg;
    return repr(v);
}

std::int64_t expect_int(const value_t &v, const std::string_view what) {
    if (!is_intlike(v)) {
        type_error(std::string(what) + " must be an integer, not '" + type_name(v) + "'");
    }
    return int_of(v);
}

const std::string *bytes_like(const value_t &v) {
    if (const auto *b = std::get_if<bytes_v>(&v)) return &b->get();
    if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&v)) return &(*ba)->data;
    return nullptr;
}

const std::string &expect_bytes_like(const value_t &v, const std::string_view what) {
    const auto *p = bytes_like(v);
    if (p == nullptr) {
        type_error(std::string(what) + " must be a bytes-like object, not '" + type_name(v) + "'");
    }
    return *p;
}

const std::string &expect_str(const value_t &v, const std::string_view what) {
    const auto *s = std::get_if<str_v>(&v);
    if (s == nullptr) type_error(std::string(what) + " must be str, not '" + type_name(v) + "'");
    return s->get();
}

bool values_equal(const value_t &a, const value_t &b) { return equal_impl(a, b, 0); }

int compare_values(const value_t &a, const value_t &b) {
    if (is_intlike(a) && is_intlike(b)) {
        i64 x = int_of(a), y = int_of(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (const auto *s = std::get_if<str_v>(&a)) {
        if (const auto *t = std::get_if<str_v>(&b)) return s->get().compare(t->get());
    }
    if (const auto *x = bytes_like(a)) {
        if (const auto *y = bytes_like(b)) return x->compare(*y);
    }
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&a)) {
        if (const auto *r = std::get_if<std::shared_ptr<list_obj>>(&b)) {
            return seq_compare((*l)->items, (*r)->items);
        }
    }
    if (const auto *l = std::get_if<std::shared_ptr<const tuple_obj>>(&a)) {
        if (const auto *r = std::get_if<std::shared_ptr<const tuple_obj>>(&b)) {
            return seq_compare((*l)->items, (*r)->items);
        }
    }
    type_error("'<' not supported between instances of '" + type_name(a) + "' and '" +
               type_name(b) + "'");
}

bool is_same_object(const value_t &a, const value_t &b) {
    if (a.index() != b.index()) return false;
    return std::visit(
            [&](const auto &x) -> bool {
                using T = std::decay_t<decltype(x)>;
                const auto &y = std::get<T>(b);
                if constexpr (std::is_same_v<T, none_t>) {
                    return true;
                } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, i64> ||
                                     std::is_same_v<T, const builtin_obj *>) {
                    return x == y;
                } else if constexpr (std::is_same_v<T, str_v> || std::is_same_v<T, bytes_v>) {
                    return x.p == y.p;
                } else if constexpr (std::is_same_v<T, range_v>) {
                    return x.start == y.start && x.stop == y.stop && x.step == y.step;
                } else {
                    return x == y;
                }
            },
            a);
}

std::string hash_key(const value_t &v) {
    std::string out;
    hash_key_impl(v, out);
    return out;
}

// ---- text ----

bool is_ascii(const std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return (static_cast<unsigned char>(c) & 0x80) == 0; });
}

std::vector<std::uint32_t> code_points(const std::string_view utf8) {
    std::vector<std::uint32_t> r;
    for (std::size_t i = 0; i < utf8.size();) {
        auto c = static_cast<unsigned char>(utf8[i]);
        int len = c < 0x80 ? 1 : (c >> 5) == 6 ? 2 : (c >> 4) == 14 ? 3 : (c >> 3) == 30 ? 4 : 1;
        if (i + static_cast<std::size_t>(len) > utf8.size()) len = 1;
        std::uint32_t cp = len == 1 ? c : c & (0x7f >> len);
        for (int k = 1; k < len; k++) {
            cp = (cp << 6) | (static_cast<unsigned char>(utf8[i + k]) & 0x3f);
        }
        r.push_back(cp);
        i += static_cast<std::size_t>(len);
    }
    return r;
}

void append_utf8(std::string &out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}

void check_utf8(const std::string_view s) {
    auto fail = [](std::size_t pos) {
        throw ScriptError("UnicodeDecodeError",
                          "'utf-8' codec can't decode byte in position " + std::to_string(pos));
    };
    for (std::size_t i = 0; i < s.size();) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        std::uint32_t min_cp = 0;
        if (c < 0x80) {
            i++;
            continue;
        }
        if ((c >> 5) == 6) {
            len = 2, min_cp = 0x80;
        } else if ((c >> 4) == 14) {
            len = 3, min_cp = 0x800;
        } else if ((c >> 3) == 30) {
            len = 4, min_cp = 0x10000;
        } else {
            fail(i);
        }
        if (i + len > s.size()) fail(i);
        std::uint32_t cp = c & (0x7f >> len);
        for (std::size_t k = 1; k < len; k++) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xc0) != 0x80) fail(i);
            cp = (cp << 6) | (cc & 0x3f);
        }
        if (cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) fail(i);
        i += len;
    }
}

std::int64_t str_length(const std::string &s) {
    return static_cast<i64>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xc0) != 0x80;
    }));
}

// ---- arithmetic ----

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    i64 r = 0;
    if (__builtin_add_overflow(a, b, &r)) overflow();
    return r;
}
std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
    i64 r = 0;
    if (__builtin_sub_overflow(a, b, &r)) overflow();
    return r;
}
std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    i64 r = 0;
    if (__builtin_mul_overflow(a, b, &r)) overflow();
    return r;
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (a == std::numeric_limits<i64>::min() && b == -1) overflow();
    i64 q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (b == -1) return 0;
    i64 r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

std::int64_t int_pow(std::int64_t base, std::int64_t exp) {
    if (exp < 0) throw ScriptError("ValueError", "negative exponents are not supported");
    i64 result = 1;
    while (exp > 0) {
        if (exp & 1) result = checked_mul(result, base);
        exp >>= 1;
        if (exp > 0) base = checked_mul(base, base);
    }
    return result;
}

value_t binary_operation(binary_op op, const value_t &a, const value_t &b) {
    if (is_intlike(a) && is_intlike(b)) {
        i64 x = int_of(a), y = int_of(b);
        bool both_bool = std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b);
        switch (op) {
            case binary_op::_add: return make_int(checked_add(x, y));
            case binary_op::_sub: return make_int(checked_sub(x, y));
            case binary_op::_mul: return make_int(checked_mul(x, y));
            case binary_op::_floordiv: return make_int(floor_div(x, y));
            case binary_op::_mod: return make_int(floor_mod(x, y));
            case binary_op::_pow: return make_int(int_pow(x, y));
            case binary_op::_lshift: {
                if (y < 0) throw ScriptError("ValueError", "negative shift count");
                if (x == 0) return make_int(0);
                if (y >= 63) overflow();
                auto r = static_cast<i64>(static_cast<std::uint64_t>(x) << y);
                if ((r >> y) != x) overflow();
                return make_int(r);
            }
            case binary_op::_rshift: {
                if (y < 0) throw ScriptError("ValueError", "negative shift count");
                if (y >= 64) return make_int(x < 0 ? -1 : 0);
                return make_int(x >> y);
            }
            case binary_op::_and: return both_bool ? make_bool((x & y) != 0) : make_int(x & y);
            case binary_op::_or: return both_bool ? make_bool((x | y) != 0) : make_int(x | y);
            case binary_op::_xor: return both_bool ? make_bool((x ^ y) != 0) : make_int(x ^ y);
        }
    }

    if (op == binary_op::_add) {
        if (const auto *s = std::get_if<str_v>(&a)) {
            if (const auto *t = std::get_if<str_v>(&b)) return make_str(s->get() + t->get());
        }
        if (const auto *x = bytes_like(a)) {
            if (const auto *y = bytes_like(b)) {
                if (std::holds_alternative<bytes_v>(a)) return make_bytes(*x + *y);
                return make_bytearray(*x + *y);
            }
        }
        if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&a)) {
            if (const auto *r = std::get_if<std::shared_ptr<list_obj>>(&b)) {
                std::vector<value_t> items = (*l)->items;
                items.insert(items.end(), (*r)->items.begin(), (*r)->items.end());
                return make_list(std::move(items));
            }
        }
        if (const auto *l = std::get_if<std::shared_ptr<const tuple_obj>>(&a)) {
            if (const auto *r = std::get_if<std::shared_ptr<const tuple_obj>>(&b)) {
                std::vector<value_t> items = (*l)->items;
                items.insert(items.end(), (*r)->items.begin(), (*r)->items.end());
                return make_tuple(std::move(items));
            }
        }
    }
    if (op == binary_op::_mul) {
        if (is_intlike(b)) {
            value_t r = sequence_repeat(a, int_of(b));
            if (!std::holds_alternative<none_t>(r)) return r;
        }
        if (is_intlike(a)) {
            value_t r = sequence_repeat(b, int_of(a));
            if (!std::holds_alternative<none_t>(r)) return r;
        }
    }
    if (op == binary_op::_mod && std::holds_alternative<str_v>(a)) {
        type_error("printf-style string formatting is not supported");
    }
    unsupported(binary_op_str(op), a, b);
}

value_t unary_operation(unary_op op, const value_t &v) {
    if (op == unary_op::_not) return make_bool(!truthy(v));
    if (!is_intlike(v)) {
        static constexpr const char *_names[] = {"-", "+", "~"};
        type_error(std::string("bad operand type for unary ") +
                   _names[static_cast<int>(op)] + ": '" + type_name(v) + "'");
    }
    i64 x = int_of(v);
    switch (op) {
        case unary_op::_neg: return make_int(checked_sub(0, x));
        case unary_op::_invert: return make_int(~x);
        default: return make_int(x);
    }
}

bool contains(const value_t &container, const value_t &item) {
    if (const auto *s = std::get_if<str_v>(&container)) {
        return s->get().find(expect_str(item, "left operand of 'in <string>'")) !=
               std::string::npos;
    }
    if (const auto *data = bytes_like(container)) {
        if (is_intlike(item)) return data->find(expect_byte(item)) != std::string::npos;
        return data->find(expect_bytes_like(item, "left operand of 'in <bytes>'")) !=
               std::string::npos;
    }
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&container)) {
        return (*d)->find(item) != nullptr;
    }
    if (const auto *r = std::get_if<range_v>(&container)) {
        if (!is_intlike(item)) return false;
        i64 x = int_of(item);
        i64 n = r->size();
        if (n == 0) return false;
        __int128 off = static_cast<__int128>(x) - r->start;
        if (off % r->step != 0) return false;
        __int128 idx = off / r->step;
        return idx >= 0 && idx < n;
    }
    if (std::holds_alternative<std::shared_ptr<list_obj>>(container) ||
        std::holds_alternative<std::shared_ptr<const tuple_obj>>(container)) {
        bool found = false;
        iterate(container, [&](const value_t &v) {
            found = values_equal(v, item);
            return !found;
        });
        return found;
    }
    type_error("argument of type '" + type_name(container) + "' is not iterable");
}

// ---- sequences ----

slice_bounds_t adjust_slice(std::int64_t length, const value_t &lo, const value_t &hi,
                            const value_t &step) {
    slice_bounds_t sb{};
    sb.step = std::holds_alternative<none_t>(step) ? 1 : expect_int(step, "slice step");
    if (sb.step == 0) throw ScriptError("ValueError", "slice step cannot be zero");
    if (sb.step < -std::numeric_limits<i64>::max()) sb.step = -std::numeric_limits<i64>::max();
    i64 lower = sb.step > 0 ? 0 : -1;
    i64 upper = sb.step > 0 ? length : length - 1;
    auto clamp = [&](const value_t &v, i64 dflt) {
        if (std::holds_alternative<none_t>(v)) return dflt;
        i64 x = expect_int(v, "slice indices");
        if (x < 0) {
            x += length;
            return x < lower ? lower : x;
        }
        return x > upper ? upper : x;
    };
    sb.start = clamp(lo, sb.step > 0 ? lower : upper);
    sb.stop = clamp(hi, sb.step > 0 ? upper : lower);
    if (sb.step > 0) {
        sb.count = sb.start < sb.stop ? (sb.stop - sb.start - 1) / sb.step + 1 : 0;
    } else {
        sb.count = sb.stop < sb.start ? (sb.start - sb.stop - 1) / (-sb.step) + 1 : 0;
    }
    return sb;
}

std::int64_t normalize_index(std::int64_t idx, std::int64_t length, const char *what) {
    if (idx < 0) idx += length;
    if (idx < 0 || idx >= length) {
        throw ScriptError("IndexError", std::string(what) + " index out of range");
    }
    return idx;
}

value_t get_item(const value_t &obj, const value_t &index) {
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&obj)) {
        if (const value_t *v = (*d)->find(index)) return *v;
        throw ScriptError("KeyError", repr(index));
    }
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&obj)) {
        const auto &items = (*l)->items;
        i64 i = normalize_index(expect_int(index, "list indices"), static_cast<i64>(items.size()),
                                "list");
        return items[static_cast<std::size_t>(i)];
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&obj)) {
        const auto &items = (*t)->items;
        i64 i = normalize_index(expect_int(index, "tuple indices"), static_cast<i64>(items.size()),
                                "tuple");
        return items[static_cast<std::size_t>(i)];
    }
    if (const auto *data = bytes_like(obj)) {
        i64 i = normalize_index(expect_int(index, "byte indices"), static_cast<i64>(data->size()),
                                "index");
        return make_int(static_cast<unsigned char>((*data)[static_cast<std::size_t>(i)]));
    }
    if (const auto *s = std::get_if<str_v>(&obj)) {
        const std::string &str = s->get();
        i64 idx = expect_int(index, "string indices");
        if (is_ascii(str)) {
            i64 i = normalize_index(idx, static_cast<i64>(str.size()), "string");
            return make_str(std::string(1, str[static_cast<std::size_t>(i)]));
        }
        auto cps = code_points(str);
        i64 i = normalize_index(idx, static_cast<i64>(cps.size()), "string");
        std::string ch;
        append_utf8(ch, cps[static_cast<std::size_t>(i)]);
        return make_str(std::move(ch));
    }
    if (const auto *r = std::get_if<range_v>(&obj)) {
        i64 i = normalize_index(expect_int(index, "range indices"), r->size(), "range object");
        return make_int(r->at(i));
    }
    type_error("'" + type_name(obj) + "' object is not subscriptable");
}

value_t get_slice(const value_t &obj, const value_t &lo, const value_t &hi, const value_t &step) {
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&obj)) {
        const auto &items = (*l)->items;
        auto sb = adjust_slice(static_cast<i64>(items.size()), lo, hi, step);
        std::vector<value_t> out;
        collect_slice(items, sb, out);
        return make_list(std::move(out));
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&obj)) {
        const auto &items = (*t)->items;
        auto sb = adjust_slice(static_cast<i64>(items.size()), lo, hi, step);
        std::vector<value_t> out;
        collect_slice(items, sb, out);
        return make_tuple(std::move(out));
    }
    if (const auto *data = bytes_like(obj)) {
        auto sb = adjust_slice(static_cast<i64>(data->size()), lo, hi, step);
        std::string out;
        if (sb.step == 1) {
            out = data->substr(static_cast<std::size_t>(sb.start), static_cast<std::size_t>(sb.count));
        } else {
            collect_slice(*data, sb, out);
        }
        if (std::holds_alternative<bytes_v>(obj)) return make_bytes(std::move(out));
        return make_bytearray(std::move(out));
    }
    if (const auto *s = std::get_if<str_v>(&obj)) {
        const std::string &str = s->get();
        if (is_ascii(str)) {
            auto sb = adjust_slice(static_cast<i64>(str.size()), lo, hi, step);
            std::string out;
            collect_slice(str, sb, out);
            return make_str(std::move(out));
        }
        auto offs = char_offsets(str);
        auto sb = adjust_slice(static_cast<i64>(offs.size()) - 1, lo, hi, step);
        std::string out;
        for (i64 i = 0, p = sb.start; i < sb.count; i++, p += sb.step) {
            auto from = offs[static_cast<std::size_t>(p)];
            out.append(str, from, offs[static_cast<std::size_t>(p) + 1] - from);
        }
        return make_str(std::move(out));
    }
    if (const auto *r = std::get_if<range_v>(&obj)) {
        auto sb = adjust_slice(r->size(), lo, hi, step);
        std::vector<value_t> out;
        for (i64 i = 0, p = sb.start; i < sb.count; i++, p += sb.step) {
            out.push_back(make_int(r->at(p)));
        }
        return make_list(std::move(out));
    }
    type_error("'" + type_name(obj) + "' object is not subscriptable");
}

void set_item(const value_t &obj, const value_t &index, value_t v) {
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&obj)) {
        (*d)->set(index, std::move(v));
        return;
    }
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&obj)) {
        auto &items = (*l)->items;
        i64 i = normalize_index(expect_int(index, "list indices"), static_cast<i64>(items.size()),
                                "list assignment");
        items[static_cast<std::size_t>(i)] = std::move(v);
        return;
    }
    if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&obj)) {
        auto &data = (*ba)->data;
        i64 i = normalize_index(expect_int(index, "bytearray indices"),
                                static_cast<i64>(data.size()), "bytearray");
        data[static_cast<std::size_t>(i)] = expect_byte(v);
        return;
    }
    type_error("'" + type_name(obj) + "' object does not support item assignment");
}

void set_slice(const value_t &obj, const value_t &lo, const value_t &hi, const value_t &step,
               const value_t &v) {
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&obj)) {
        auto &items = (*l)->items;
        auto src = to_vector(v);
        assign_slice(items, adjust_slice(static_cast<i64>(items.size()), lo, hi, step), src);
        return;
    }
    if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&obj)) {
        auto &data = (*ba)->data;
        std::string src;
        if (const auto *p = bytes_like(v)) {
            src = *p;
        } else if (is_intlike(v)) {
            type_error("can assign only bytes, buffers, or iterables of ints in range(0, 256)");
        } else {
            iterate(v, [&](const value_t &x) {
                src += expect_byte(x);
                return true;
            });
        }
        assign_slice(data, adjust_slice(static_cast<i64>(data.size()), lo, hi, step), src);
        return;
    }
    type_error("'" + type_name(obj) + "' object does not support slice assignment");
}

std::int64_t length_of(const value_t &v) {
    if (const auto *s = std::get_if<str_v>(&v)) return str_length(s->get());
    if (const auto *data = bytes_like(v)) return static_cast<i64>(data->size());
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&v)) {
        return static_cast<i64>((*l)->items.size());
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&v)) {
        return static_cast<i64>((*t)->items.size());
    }
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&v)) {
        return static_cast<i64>((*d)->entries.size());
    }
    if (const auto *r = std::get_if<range_v>(&v)) return r->size();
    type_error("object of type '" + type_name(v) + "' has no len()");
}

std::vector<value_t> to_vector(const value_t &v) {
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&v)) return (*t)->items;
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&v)) return (*l)->items;
    std::vector<value_t> out;
    iterate(v, [&](const value_t &x) {
        out.push_back(x);
        return true;
    });
    return out;
}

char expect_byte(const value_t &v) {
    if (!is_intlike(v)) {
        type_error("'" + type_name(v) + "' object cannot be interpreted as an integer");
    }
    i64 x = int_of(v);
    if (x < 0 || x > 255) throw ScriptError("ValueError", "byte must be in range(0, 256)");
    return static_cast<char>(static_cast<unsigned char>(x));
}

}  // namespace arena::script
