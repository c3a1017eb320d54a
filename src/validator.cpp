//
// Copyright (c) 2024-2025 JLGxy
//

#include "validator.h"

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "fmt/core.h"
#include "interpreter.h"
#include "script_lexer.h"

namespace arena {

namespace sc = script;

namespace {

constexpr std::string_view _denied_names[] = {
        "eval",     "exec",         "compile",      "__import__", "open",    "input",
        "breakpoint", "print",      "globals",      "locals",     "vars",    "dir",
        "getattr",  "setattr",      "delattr",      "hasattr",    "memoryview", "type",
        "object",   "super",        "help",         "exit",       "quit",    "id",
        "classmethod", "staticmethod", "property",
};

constexpr std::string_view _runtime_internals[] = {
        "__class__", "__bases__",    "__subclasses__", "__mro__",    "__globals__", "__code__",
        "__builtins__", "__import__", "__loader__",    "__spec__",   "__dict__",    "__slots__",
        "gi_frame",  "f_globals",    "f_back",         "tb_frame",
};

class Walker {
  public:
    std::vector<violation_t> found;

    void block(const sc::block_t &b) {
        for (const auto &s : b) stmt(*s);
    }

    void stmt(const sc::stmt_t &s) {
        const auto loc = s.loc;
        std::visit(sc::overloaded{
                           [&](const sc::expr_s &n) { expr(*n.value); },
                           [&](const sc::assign_s &n) {
                               for (const auto &t : n.targets) expr(*t);
                               expr(*n.value);
                           },
                           [&](const sc::augassign_s &n) {
                               expr(*n.target);
                               expr(*n.value);
                           },
                           [&](const sc::return_s &n) { opt(n.value); },
                           [&](const sc::if_s &n) {
                               expr(*n.cond);
                               block(n.body);
                               block(n.orelse);
                           },
                           [&](const sc::while_s &n) {
                               expr(*n.cond);
                               block(n.body);
                           },
                           [&](const sc::for_s &n) {
                               expr(*n.target);
                               expr(*n.iter);
                               block(n.body);
                           },
                           [&](const sc::funcdef_s &n) {
                               name(n.name, loc);
                               for (std::size_t i = 0; i < n.params.size(); i++) {
                                   name(n.params[i], n.param_locs[i]);
                               }
                               for (const auto &d : n.defaults) expr(*d);
                               block(n.body);
                           },
                           [&](const sc::pass_s &) {},
                           [&](const sc::break_s &) {},
                           [&](const sc::continue_s &) {},
                           [&](const sc::global_s &n) {
                               for (const auto &id : n.names) name(id, loc);
                           },
                           [&](const sc::raise_s &n) { opt(n.exc); },
                           [&](const sc::assert_s &n) {
                               expr(*n.test);
                               opt(n.msg);
                           },
                           [&](const sc::import_s &n) {
                               for (const auto &m : n.modules) {
                                   add(violation_kind::_import, loc,
                                       fmt::format(ARENA_FMT("import of '{}' is not allowed"), m));
                               }
                           },
                           [&](const sc::importfrom_s &n) {
                               add(violation_kind::_import, loc,
                                   fmt::format(ARENA_FMT("import from '{}{}' is not allowed"),
                                               std::string(static_cast<std::size_t>(n.level), '.'),
                                               n.module));
                           },
                   },
                   s.node);
    }

    void expr(const sc::expr_t &e) {
        const auto loc = e.loc;
        std::visit(sc::overloaded{
                           [&](const sc::name_e &n) { name(n.id, loc); },
                           [&](const sc::literal_e &n) {
                               if (n.kind == sc::literal_kind::_str && is_runtime_internal(n.sval)) {
                                   add(violation_kind::_forbidden_attribute, loc,
                                       fmt::format(ARENA_FMT("string constant '{}' names a "
                                                             "runtime internal"),
                                                   n.sval));
                               }
                           },
                           [&](const sc::attribute_e &n) {
                               expr(*n.obj);
                               if (sc::is_dunder(n.attr) || is_runtime_internal(n.attr)) {
                                   add(violation_kind::_forbidden_attribute, loc,
                                       fmt::format(ARENA_FMT("access to attribute '{}' is not "
                                                             "allowed"),
                                                   n.attr));
                               }
                           },
                           [&](const sc::slice_e &n) {
                               opt(n.lo);
                               opt(n.hi);
                               opt(n.step);
                           },
                           [&](const sc::subscript_e &n) {
                               expr(*n.obj);
                               expr(*n.index);
                           },
                           [&](const sc::call_e &n) {
                               expr(*n.func);
                               for (const auto &a : n.args) expr(*a);
                               for (const auto &kw : n.kwargs) {
                                   name(kw.name, kw.loc);
                                   expr(*kw.value);
                               }
                           },
                           [&](const sc::unary_e &n) { expr(*n.operand); },
                           [&](const sc::binary_e &n) {
                               expr(*n.lhs);
                               expr(*n.rhs);
                           },
                           [&](const sc::boolop_e &n) {
                               expr(*n.lhs);
                               expr(*n.rhs);
                           },
                           [&](const sc::compare_e &n) {
                               expr(*n.first);
                               for (const auto &[op, rhs] : n.rest) expr(*rhs);
                           },
                           [&](const sc::ifexp_e &n) {
                               expr(*n.cond);
                               expr(*n.then);
                               expr(*n.orelse);
                           },
                           [&](const sc::list_e &n) {
                               for (const auto &x : n.elts) expr(*x);
                           },
                           [&](const sc::tuple_e &n) {
                               for (const auto &x : n.elts) expr(*x);
                           },
                           [&](const sc::dict_e &n) {
                               for (const auto &[k, v] : n.items) {
                                   expr(*k);
                                   expr(*v);
                               }
                           },
                           [&](const sc::listcomp_e &n) {
                               expr(*n.elt);
                               expr(*n.target);
                               expr(*n.iter);
                               for (const auto &c : n.conds) expr(*c);
                           },
                   },
                   e.node);
    }

  private:
    void opt(const sc::expr_ptr &e) {
        if (e) expr(*e);
    }

    void name(const std::string &id, sc::location_t loc) {
        if (is_denied_name(id)) {
            add(violation_kind::_forbidden_name, loc,
                fmt::format(ARENA_FMT("use of name '{}' is not allowed"), id));
        }
    }

    void add(violation_kind kind, sc::location_t loc, std::string detail) {
        found.push_back(violation_t{kind, loc, std::move(detail)});
    }
};

std::string join_violations(const std::vector<violation_t> &violations) {
    std::string out;
    for (const auto &v : violations) {
        if (!out.empty()) out += '\n';
        out += v.to_str();
    }
    return out;
}

}  // namespace

std::string violation_kind_str(violation_kind kind) {
    switch (kind) {
        case violation_kind::_code_too_long: return "CodeTooLong";
        case violation_kind::_syntax: return "SyntaxError";
        case violation_kind::_import: return "ImportError";
        case violation_kind::_forbidden_name: return "ForbiddenName";
        case violation_kind::_forbidden_attribute: return "ForbiddenAttribute";
    }
    return "Unknown";
}

std::string violation_t::to_str() const {
    if (loc.line == 0) return violation_kind_str(kind) + ": " + detail;
    return fmt::format(ARENA_FMT("line {}:{}: {}: {}"), loc.line, loc.col, violation_kind_str(kind),
                       detail);
}

std::string validation_result_t::error_code() const {
    if (violations.empty()) return {};
    return "DECOMPRESSION_" + violation_kind_str(violations.front().kind);
}

std::string validation_result_t::message() const { return join_violations(violations); }

ValidationError::ValidationError(std::vector<violation_t> violations)
        : ArenaError(join_violations(violations)), violations_(std::move(violations)) {}

std::string ValidationError::error_code() const {
    if (violations_.empty()) return {};
    return "DECOMPRESSION_" + violation_kind_str(violations_.front().kind);
}

bool is_denied_name(const std::string_view name) {
    return sc::is_dunder(name) ||
           std::find(std::begin(_denied_names), std::end(_denied_names), name) !=
                   std::end(_denied_names);
}

bool is_runtime_internal(const std::string_view attr) {
    return std::find(std::begin(_runtime_internals), std::end(_runtime_internals), attr) !=
           std::end(_runtime_internals);
}

validation_result_t validate(const std::string_view source, const validator_conf_t &conf) {
    validation_result_t res;
    if (source.size() > conf.max_code_length) {
        res.violations.push_back(
                {violation_kind::_code_too_long,
                 {},
                 fmt::format(ARENA_FMT("source is {} bytes, the limit is {}"), source.size(),
                             conf.max_code_length)});
        return res;
    }

    auto mod = std::make_shared<sc::module_t>();
    try {
        *mod = sc::parse(source, conf.max_nesting_depth);
    } catch (const sc::SyntaxError &e) {
        res.violations.push_back({violation_kind::_syntax, e.where(), e.message()});
        return res;
    }

    Walker w;
    w.block(mod->body);
    if (!w.found.empty()) {
        std::stable_sort(w.found.begin(), w.found.end(),
                         [](const violation_t &a, const violation_t &b) {
                             return std::tie(a.loc.line, a.loc.col) <
                                    std::tie(b.loc.line, b.loc.col);
                         });
        res.violations = std::move(w.found);
        return res;
    }
    res.program = analyzed_program_t(std::move(mod),
                                     std::make_shared<const std::string>(source), conf);
    return res;
}

analyzed_program_t validate_or_throw(const std::string_view source,
                                     const validator_conf_t &conf) {
    auto res = validate(source, conf);
    if (!res.ok()) throw ValidationError(std::move(res.violations));
    return std::move(*res.program);
}

}  // namespace arena
