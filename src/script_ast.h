//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "script_lexer.h"

namespace arena::script {

struct expr_t;
struct stmt_t;

using expr_ptr = std::unique_ptr<expr_t>;
using stmt_ptr = std::unique_ptr<stmt_t>;
using block_t = std::vector<stmt_ptr>;

enum class unary_op : std::int8_t { _neg, _pos, _invert, _not };

enum class binary_op : std::int8_t {
    _add,
    _sub,
    _mul,
    _floordiv,
    _mod,
    _pow,
    _lshift,
    _rshift,
    _and,
    _or,
    _xor,
};

enum class cmp_op : std::int8_t { _eq, _ne, _lt, _le, _gt, _ge, _in, _not_in, _is, _is_not };

enum class literal_kind : std::int8_t { _none, _true, _false, _int, _str, _bytes };

const char *binary_op_str(binary_op op);

// ---- expressions ----

struct name_e {
    std::string id;
};
struct literal_e {
    literal_kind kind;
    std::int64_t ival{};
    std::string sval;
};
struct attribute_e {
    expr_ptr obj;
    std::string attr;
};
struct slice_e {
    expr_ptr lo, hi, step;  // each may be null
};
struct subscript_e {
    expr_ptr obj;
    expr_ptr index;  // a slice_e for `a[x:y]`
};
struct keyword_arg_t {
    std::string name;
    expr_ptr value;
    location_t loc;
};
struct call_e {
    expr_ptr func;
    std::vector<expr_ptr> args;
    std::vector<keyword_arg_t> kwargs;
};
struct unary_e {
    unary_op op;
    expr_ptr operand;
};
struct binary_e {
    binary_op op;
    expr_ptr lhs, rhs;
};
struct boolop_e {
    bool is_and;
    expr_ptr lhs, rhs;
};
struct compare_e {
    expr_ptr first;
    std::vector<std::pair<cmp_op, expr_ptr>> rest;
};
struct ifexp_e {
    expr_ptr cond, then, orelse;
};
struct list_e {
    std::vector<expr_ptr> elts;
};
struct tuple_e {
    std::vector<expr_ptr> elts;
};
struct dict_e {
    std::vector<std::pair<expr_ptr, expr_ptr>> items;
};
struct listcomp_e {
    expr_ptr elt;
    expr_ptr target;
    expr_ptr iter;
    std::vector<expr_ptr> conds;
};

struct expr_t {
    std::variant<name_e, literal_e, attribute_e, slice_e, subscript_e, call_e, unary_e, binary_e,
                 boolop_e, compare_e, ifexp_e, list_e, tuple_e, dict_e, listcomp_e>
            node;
    location_t loc;
    int height = 1;  // longest path to a leaf, bounded by the parser
};

// ---- statements ----

struct expr_s {
    expr_ptr value;
};
struct assign_s {
    std::vector<expr_ptr> targets;  // `a = b = v` has two targets
    expr_ptr value;
};
struct augassign_s {
    expr_ptr target;
    binary_op op;
    expr_ptr value;
};
struct return_s {
    expr_ptr value;  // may be null
};
struct if_s {
    expr_ptr cond;
    block_t body, orelse;
};
struct while_s {
    expr_ptr cond;
    block_t body;
};
struct for_s {
    expr_ptr target;
    expr_ptr iter;
    block_t body;
};
struct funcdef_s {
    std::string name;
    std::vector<std::string> params;
    std::vector<location_t> param_locs;
    std::vector<expr_ptr> defaults;  // aligned to the last parameters
    block_t body;
};
struct pass_s {};
struct break_s {};
struct continue_s {};
struct global_s {
    std::vector<std::string> names;
};
struct raise_s {
    expr_ptr exc;  // may be null
};
struct assert_s {
    expr_ptr test, msg;
};
struct import_s {
    std::vector<std::string> modules;
};
struct importfrom_s {
    std::string module;
    std::vector<std::string> names;
    int level = 0;  // leading dots
};

struct stmt_t {
    std::variant<expr_s, assign_s, augassign_s, return_s, if_s, while_s, for_s, funcdef_s, pass_s,
                 break_s, continue_s, global_s, raise_s, assert_s, import_s, importfrom_s>
            node;
    location_t loc;
};

struct module_t {
    block_t body;
};

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace arena::script
