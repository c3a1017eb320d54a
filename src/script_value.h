//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "script_ast.h"

namespace arena::script {

// A fault raised by a running script. `type` is the exception class name a submitter sees
// ("NameError", "TypeError", ...), `line` is filled in by the interpreter when unknown.
class ScriptError : public std::exception {
  public:
    ScriptError(std::string type, std::string msg, int line = 0)
            : type_(std::move(type)), msg_(std::move(msg)), line_(line) {
        update();
    }
    const char *what() const noexcept override { return what_str_.c_str(); }
    const std::string &type() const { return type_; }
    const std::string &message() const { return msg_; }
    int line() const { return line_; }
    void set_line(int line) {
        line_ = line;
        update();
    }

  private:
    void update() {
        what_str_ = msg_.empty() ? type_ : type_ + ": " + msg_;
        if (line_ > 0) what_str_ += " (line " + std::to_string(line_) + ")";
    }
    std::string type_, msg_, what_str_;
    int line_;
};

struct none_t {};

// Immutable text, UTF-8 encoded. Length and indexing count code points.
struct str_v {
    std::shared_ptr<const std::string> p;
    const std::string &get() const { return *p; }
};
struct bytes_v {
    std::shared_ptr<const std::string> p;
    const std::string &get() const { return *p; }
};
struct range_v {
    std::int64_t start, stop, step;
    std::int64_t size() const;
    std::int64_t at(std::int64_t i) const { return start + i * step; }
};

struct bytearray_obj;
struct list_obj;
struct tuple_obj;
struct dict_obj;
struct function_obj;
struct method_obj;
struct builtin_obj;
struct exception_obj;

using value_t = std::variant<none_t, bool, std::int64_t, str_v, bytes_v, std::shared_ptr<bytearray_obj>,
                             std::shared_ptr<list_obj>, std::shared_ptr<const tuple_obj>,
                             std::shared_ptr<dict_obj>, range_v, std::shared_ptr<const function_obj>,
                             std::shared_ptr<const method_obj>, const builtin_obj *,
                             std::shared_ptr<const exception_obj>>;

struct bytearray_obj {
    std::string data;
};
struct list_obj {
    std::vector<value_t> items;
};
struct tuple_obj {
    std::vector<value_t> items;
};

// Insertion-ordered mapping. Keys are indexed by their canonical hash key.
struct dict_obj {
    std::vector<std::pair<value_t, value_t>> entries;
    std::unordered_map<std::string, std::size_t> index;

    value_t *find(const value_t &key);
    void set(const value_t &key, value_t value);
    bool erase(const value_t &key, value_t *removed = nullptr);
    void clear() {
        entries.clear();
        index.clear();
    }
};

struct scope_t {
    std::unordered_map<std::string, value_t> vars;
    std::shared_ptr<scope_t> parent;
};

struct function_obj {
    const funcdef_s *def;
    std::vector<value_t> defaults;
    std::shared_ptr<scope_t> closure;
    std::shared_ptr<const std::unordered_set<std::string>> globals;
};

struct method_obj {
    value_t self;
    std::string name;
};

struct exception_obj {
    std::string type;
    std::string msg;
};

struct call_args_t {
    std::vector<value_t> pos;
    std::vector<std::pair<std::string, value_t>> kw;
};

class Interpreter;

enum class type_tag : std::int8_t {
    _none,
    _int,
    _bool,
    _str,
    _bytes,
    _bytearray,
    _list,
    _tuple,
    _dict,
    _range,
    _exception,
};

struct builtin_obj {
    const char *name;
    value_t (*fn)(Interpreter &, call_args_t &);
    type_tag tag = type_tag::_none;  // set for types and exception classes
};

// ---- construction ----

inline value_t make_int(std::int64_t v) { return value_t{std::in_place_type<std::int64_t>, v}; }
inline value_t make_bool(bool v) { return value_t{std::in_place_type<bool>, v}; }
inline value_t make_none() { return value_t{std::in_place_type<none_t>}; }
inline value_t make_str(std::string s) {
    return value_t{std::in_place_type<str_v>, str_v{std::make_shared<const std::string>(std::move(s))}};
}
inline value_t make_bytes(std::string s) {
    return value_t{std::in_place_type<bytes_v>,
                   bytes_v{std::make_shared<const std::string>(std::move(s))}};
}
inline value_t make_bytearray(std::string s) {
    return std::make_shared<bytearray_obj>(bytearray_obj{std::move(s)});
}
inline value_t make_list(std::vector<value_t> items = {}) {
    return std::make_shared<list_obj>(list_obj{std::move(items)});
}
inline value_t make_tuple(std::vector<value_t> items = {}) {
    return value_t{std::in_place_type<std::shared_ptr<const tuple_obj>>,
                   std::make_shared<const tuple_obj>(tuple_obj{std::move(items)})};
}

// ---- inspection ----

std::string type_name(const value_t &v);
bool truthy(const value_t &v);
std::string repr(const value_t &v);
std::string to_str(const value_t &v);

// Returns the integer value of an int or bool, or throws TypeError naming `what`.
std::int64_t expect_int(const value_t &v, std::string_view what);
// Returns the contents of bytes or bytearray, or nullptr.
const std::string *bytes_like(const value_t &v);
const std::string &expect_bytes_like(const value_t &v, std::string_view what);
const std::string &expect_str(const value_t &v, std::string_view what);

bool values_equal(const value_t &a, const value_t &b);
// Negative, zero or positive. Throws TypeError for unorderable operands.
int compare_values(const value_t &a, const value_t &b);
bool is_same_object(const value_t &a, const value_t &b);
std::string hash_key(const value_t &v);

// ---- text ----

bool is_ascii(std::string_view s);
std::vector<std::uint32_t> code_points(std::string_view utf8);
void append_utf8(std::string &out, std::uint32_t cp);
// Throws UnicodeDecodeError on malformed input.
void check_utf8(std::string_view s);
std::int64_t str_length(const std::string &s);

// ---- arithmetic and sequences ----

std::int64_t checked_add(std::int64_t a, std::int64_t b);
std::int64_t checked_sub(std::int64_t a, std::int64_t b);
std::int64_t checked_mul(std::int64_t a, std::int64_t b);
std::int64_t floor_div(std::int64_t a, std::int64_t b);
std::int64_t floor_mod(std::int64_t a, std::int64_t b);
std::int64_t int_pow(std::int64_t base, std::int64_t exp);

value_t binary_operation(binary_op op, const value_t &a, const value_t &b);
value_t unary_operation(unary_op op, const value_t &v);
bool contains(const value_t &container, const value_t &item);

struct slice_bounds_t {
    std::int64_t start, stop, step, count;
};
slice_bounds_t adjust_slice(std::int64_t length, const value_t &lo, const value_t &hi,
                            const value_t &step);
std::int64_t normalize_index(std::int64_t idx, std::int64_t length, const char *what);

value_t get_item(const value_t &obj, const value_t &index);
value_t get_slice(const value_t &obj, const value_t &lo, const value_t &hi, const value_t &step);
void set_item(const value_t &obj, const value_t &index, value_t v);
void set_slice(const value_t &obj, const value_t &lo, const value_t &hi, const value_t &step,
               const value_t &v);
std::int64_t length_of(const value_t &v);

// Calls `f(value)` for each element; stops early when `f` returns false. Lists and bytearrays
// are walked live by index, other containers are snapshotted.
template <typename F>
void iterate(const value_t &v, F &&f);

std::vector<value_t> to_vector(const value_t &v);

// Reads a byte value for bytes()/bytearray construction and mutation.
char expect_byte(const value_t &v);

template <typename F>
void iterate(const value_t &v, F &&f) {
    if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&v)) {
        auto lst = *l;
        for (std::size_t i = 0; i < lst->items.size(); i++) {
            value_t item = lst->items[i];
            if (!f(item)) return;
        }
        return;
    }
    if (const auto *t = std::get_if<std::shared_ptr<const tuple_obj>>(&v)) {
        auto tup = *t;
        for (const auto &item : tup->items) {
            if (!f(item)) return;
        }
        return;
    }
    if (const auto *r = std::get_if<range_v>(&v)) {
        std::int64_t n = r->size();
        for (std::int64_t i = 0; i < n; i++) {
            if (!f(make_int(r->at(i)))) return;
        }
        return;
    }
    if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&v)) {
        auto arr = *ba;
        for (std::size_t i = 0; i < arr->data.size(); i++) {
            if (!f(make_int(static_cast<unsigned char>(arr->data[i])))) return;
        }
        return;
    }
    if (const auto *b = std::get_if<bytes_v>(&v)) {
        auto keep = b->p;
        for (char c : *keep) {
            if (!f(make_int(static_cast<unsigned char>(c)))) return;
        }
        return;
    }
    if (const auto *s = std::get_if<str_v>(&v)) {
        auto keep = s->p;
        if (is_ascii(*keep)) {
            for (char c : *keep) {
                if (!f(make_str(std::string(1, c)))) return;
            }
            return;
        }
        for (auto cp : code_points(*keep)) {
            std::string ch;
            append_utf8(ch, cp);
            if (!f(make_str(std::move(ch)))) return;
        }
        return;
    }
    if (const auto *d = std::get_if<std::shared_ptr<dict_obj>>(&v)) {
        std::vector<value_t> keys;
        keys.reserve((*d)->entries.size());
        for (const auto &[k, _] : (*d)->entries) keys.push_back(k);
        for (const auto &k : keys) {
            if (!f(k)) return;
        }
        return;
    }
    throw ScriptError("TypeError", "'" + type_name(v) + "' object is not iterable");
}

}  // namespace arena::script
