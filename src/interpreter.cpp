//
// Copyright (c) 2024-2025 JLGxy
//

#include "interpreter.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace arena::script {

namespace {

[[noreturn]] void attribute_error(const value_t &obj, const std::string &attr) {
    throw ScriptError("AttributeError",
                      "'" + type_name(obj) + "' object has no attribute '" + attr + "'");
}

void collect_globals(const block_t &block, std::unordered_set<std::string> &out) {
    for (const auto &st : block) {
        std::visit(overloaded{
                           [&](const global_s &g) { out.insert(g.names.begin(), g.names.end()); },
                           [&](const if_s &s) {
                               collect_globals(s.body, out);
                               collect_globals(s.orelse, out);
                           },
                           [&](const while_s &s) { collect_globals(s.body, out); },
                           [&](const for_s &s) { collect_globals(s.body, out); },
                           [](const auto &) {},
                   },
                   st->node);
    }
}

class DepthGuard {
  public:
    explicit DepthGuard(int &depth) : depth_(depth) { ++depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;
    ~DepthGuard() { --depth_; }

  private:
    int &depth_;
};

}  // namespace

Interpreter::Interpreter(const module_t &mod, int max_call_depth)
        : module_(mod), max_call_depth_(max_call_depth), globals_(std::make_shared<scope_t>()) {}

void Interpreter::run_module() {
    frame_t fr{globals_, nullptr, make_none()};
    flow_t flow = exec_block(module_.body, fr);
    if (flow == flow_t::_return) throw ScriptError("SyntaxError", "'return' outside function");
    if (flow != flow_t::_normal) throw ScriptError("SyntaxError", "'break' outside loop");
}

std::string Interpreter::call_entry(const std::string_view input, const std::string &entry) {
    auto it = globals_->vars.find(entry);
    if (it == globals_->vars.end()) {
        throw ScriptError("NameError", "name '" + entry + "' is not defined");
    }
    const auto *fn = std::get_if<std::shared_ptr<const function_obj>>(&it->second);
    if (fn == nullptr) throw ScriptError("TypeError", "'" + entry + "' must be a function");
    auto keep = *fn;
    call_args_t args;
    args.pos.push_back(make_bytes(std::string(input)));
    value_t r = call_function(*keep, args);
    if (const auto *data = bytes_like(r)) return *data;
    throw ScriptError("TypeError", entry + "() must return bytes or bytearray, not '" +
                                           type_name(r) + "'");
}

std::optional<value_t> Interpreter::global(const std::string &name) const {
    auto it = globals_->vars.find(name);
    if (it == globals_->vars.end()) return std::nullopt;
    return it->second;
}

// ---- statements ----

Interpreter::flow_t Interpreter::exec_block(const block_t &block, frame_t &fr) {
    for (const auto &st : block) {
        flow_t flow = exec(*st, fr);
        if (flow != flow_t::_normal) return flow;
    }
    return flow_t::_normal;
}

Interpreter::flow_t Interpreter::exec(const stmt_t &stmt, frame_t &fr) {
    try {
        return std::visit(
                overloaded{
                        [&](const expr_s &s) {
                            eval(*s.value, fr);
                            return flow_t::_normal;
                        },
                        [&](const assign_s &s) {
                            value_t v = eval(*s.value, fr);
                            for (const auto &target : s.targets) assign(*target, v, fr);
                            return flow_t::_normal;
                        },
                        [&](const augassign_s &s) {
                            exec_augassign(s, fr);
                            return flow_t::_normal;
                        },
                        [&](const return_s &s) {
                            fr.retval = s.value ? eval(*s.value, fr) : make_none();
                            return flow_t::_return;
                        },
                        [&](const if_s &s) {
                            return exec_block(truthy(eval(*s.cond, fr)) ? s.body : s.orelse, fr);
                        },
                        [&](const while_s &s) {
                            while (truthy(eval(*s.cond, fr))) {
                                flow_t flow = exec_block(s.body, fr);
                                if (flow == flow_t::_break) break;
                                if (flow == flow_t::_return) return flow;
                            }
                            return flow_t::_normal;
                        },
                        [&](const for_s &s) { return exec_for(s, fr); },
                        [&](const funcdef_s &s) {
                            store_name(s.name, make_function(s, fr), fr);
                            return flow_t::_normal;
                        },
                        [](const pass_s &) { return flow_t::_normal; },
                        [](const break_s &) { return flow_t::_break; },
                        [](const continue_s &) { return flow_t::_continue; },
                        [](const global_s &) { return flow_t::_normal; },
                        [&](const raise_s &s) -> flow_t { exec_raise(s, fr); },
                        [&](const assert_s &s) {
                            if (!truthy(eval(*s.test, fr))) {
                                throw ScriptError("AssertionError",
                                                  s.msg ? to_str(eval(*s.msg, fr)) : "");
                            }
                            return flow_t::_normal;
                        },
                        [](const import_s &) -> flow_t {
                            throw ScriptError("ImportError", "import is not available");
                        },
                        [](const importfrom_s &) -> flow_t {
                            throw ScriptError("ImportError", "import is not available");
                        },
                },
                stmt.node);
    } catch (ScriptError &e) {
        if (e.line() == 0) e.set_line(stmt.loc.line);
        throw;
    }
}

Interpreter::flow_t Interpreter::exec_for(const for_s &st, frame_t &fr) {
    value_t iterable = eval(*st.iter, fr);
    flow_t result = flow_t::_normal;
    iterate(iterable, [&](const value_t &v) {
        assign(*st.target, v, fr);
        flow_t flow = exec_block(st.body, fr);
        if (flow == flow_t::_break) return false;
        if (flow == flow_t::_return) {
            result = flow;
            return false;
        }
        return true;
    });
    return result;
}

void Interpreter::exec_augassign(const augassign_s &st, frame_t &fr) {
    // Lists and bytearrays grow in place so that aliases observe the change.
    auto apply = [&](const value_t &cur, const value_t &rhs) -> value_t {
        if (st.op == binary_op::_add) {
            if (const auto *l = std::get_if<std::shared_ptr<list_obj>>(&cur)) {
                auto items = to_vector(rhs);
                (*l)->items.insert((*l)->items.end(), items.begin(), items.end());
                return cur;
            }
            if (const auto *ba = std::get_if<std::shared_ptr<bytearray_obj>>(&cur)) {
                (*ba)->data += expect_bytes_like(rhs, "right operand of bytearray +=");
                return cur;
            }
        }
        return binary_operation(st.op, cur, rhs);
    };

    const expr_t &target = *st.target;
    if (const auto *n = std::get_if<name_e>(&target.node)) {
        value_t cur = load_name(n->id, fr);
        value_t rhs = eval(*st.value, fr);
        store_name(n->id, apply(cur, rhs), fr);
        return;
    }
    if (const auto *s = std::get_if<subscript_e>(&target.node)) {
        value_t obj = eval(*s->obj, fr);
        if (const auto *sl = std::get_if<slice_e>(&s->index->node)) {
            value_t lo = sl->lo ? eval(*sl->lo, fr) : make_none();
            value_t hi = sl->hi ? eval(*sl->hi, fr) : make_none();
            value_t step = sl->step ? eval(*sl->step, fr) : make_none();
            value_t cur = get_slice(obj, lo, hi, step);
            value_t rhs = eval(*st.value, fr);
            set_slice(obj, lo, hi, step, apply(cur, rhs));
            return;
        }
        value_t index = eval(*s->index, fr);
        value_t cur = get_item(obj, index);
        value_t rhs = eval(*st.value, fr);
        set_item(obj, index, apply(cur, rhs));
        return;
    }
    if (const auto *a = std::get_if<attribute_e>(&target.node)) {
        value_t obj = eval(*a->obj, fr);
        throw ScriptError("AttributeError",
                          "'" + type_name(obj) + "' object attribute '" + a->attr + "' is read-only");
    }
    throw ScriptError("SyntaxError", "illegal target for augmented assignment");
}

void Interpreter::exec_raise(const raise_s &st, frame_t &fr) {
    if (!st.exc) throw ScriptError("RuntimeError", "No active exception to reraise");
    value_t v = eval(*st.exc, fr);
    if (const auto *e = std::get_if<std::shared_ptr<const exception_obj>>(&v)) {
        throw ScriptError((*e)->type, (*e)->msg);
    }
    if (const auto *b = std::get_if<const builtin_obj *>(&v)) {
        if ((*b)->tag == type_tag::_exception) throw ScriptError((*b)->name, "");
    }
    throw ScriptError("TypeError", "exceptions must derive from BaseException");
}

// ---- expressions ----

value_t Interpreter::eval(const expr_t &e, frame_t &fr) {
    return std::visit(
            overloaded{
                    [&](const name_e &n) { return load_name(n.id, fr); },
                    [&](const literal_e &l) { return eval_literal(l); },
                    [&](const attribute_e &a) { return eval_attribute(a, fr); },
                    [](const slice_e &) -> value_t {
                        throw ScriptError("SyntaxError", "slice outside of a subscript");
                    },
                    [&](const subscript_e &s) { return eval_subscript(s, fr); },
                    [&](const call_e &c) { return eval_call(c, fr); },
                    [&](const unary_e &u) { return unary_operation(u.op, eval(*u.operand, fr)); },
                    [&](const binary_e &b) {
                        value_t lhs = eval(*b.lhs, fr);
                        value_t rhs = eval(*b.rhs, fr);
                        return binary_operation(b.op, lhs, rhs);
                    },
                    [&](const boolop_e &b) {
                        value_t lhs = eval(*b.lhs, fr);
                        if (truthy(lhs) != b.is_and) return lhs;
                        return eval(*b.rhs, fr);
                    },
                    [&](const compare_e &c) { return eval_compare(c, fr); },
                    [&](const ifexp_e &c) {
                        return truthy(eval(*c.cond, fr)) ? eval(*c.then, fr) : eval(*c.orelse, fr);
                    },
                    [&](const list_e &l) {
                        std::vector<value_t> items;
                        items.reserve(l.elts.size());
                        for (const auto &x : l.elts) items.push_back(eval(*x, fr));
                        return make_list(std::move(items));
                    },
                    [&](const tuple_e &t) {
                        std::vector<value_t> items;
                        items.reserve(t.elts.size());
                        for (const auto &x : t.elts) items.push_back(eval(*x, fr));
                        return make_tuple(std::move(items));
                    },
                    [&](const dict_e &d) {
                        auto obj = std::make_shared<dict_obj>();
                        for (const auto &[k, v] : d.items) {
                            value_t key = eval(*k, fr);
                            obj->set(key, eval(*v, fr));
                        }
                        return value_t{std::move(obj)};
                    },
                    [&](const listcomp_e &lc) { return eval_listcomp(lc, fr); },
            },
            e.node);
}

value_t Interpreter::eval_literal(const literal_e &l) {
    switch (l.kind) {
        case literal_kind::_none: return make_none();
        case literal_kind::_true: return make_bool(true);
        case literal_kind::_false: return make_bool(false);
        case literal_kind::_int: return make_int(l.ival);
        default: break;
    }
    auto it = literals_.find(&l);
    if (it != literals_.end()) return it->second;
    value_t v = l.kind == literal_kind::_str ? make_str(l.sval) : make_bytes(l.sval);
    literals_.emplace(&l, v);
    return v;
}

value_t Interpreter::eval_attribute(const attribute_e &a, frame_t &fr) {
    value_t obj = eval(*a.obj, fr);
    if (is_dunder(a.attr)) attribute_error(obj, a.attr);
    if (const auto *b = std::get_if<const builtin_obj *>(&obj)) {
        if (const builtin_obj *fn = find_type_attribute(*b, a.attr)) {
            return value_t{std::in_place_type<const builtin_obj *>, fn};
        }
        throw ScriptError("AttributeError",
                          std::string("type object '") + (*b)->name + "' has no attribute '" +
                                  a.attr + "'");
    }
    if (!has_method(obj, a.attr)) attribute_error(obj, a.attr);
    return value_t{std::in_place_type<std::shared_ptr<const method_obj>>,
                   std::make_shared<const method_obj>(method_obj{std::move(obj), a.attr})};
}

value_t Interpreter::eval_subscript(const subscript_e &s, frame_t &fr) {
    value_t obj = eval(*s.obj, fr);
    if (const auto *sl = std::get_if<slice_e>(&s.index->node)) {
        value_t lo = sl->lo ? eval(*sl->lo, fr) : make_none();
        value_t hi = sl->hi ? eval(*sl->hi, fr) : make_none();
        value_t step = sl->step ? eval(*sl->step, fr) : make_none();
        return get_slice(obj, lo, hi, step);
    }
    return get_item(obj, eval(*s.index, fr));
}

void Interpreter::eval_args(const call_e &c, frame_t &fr, call_args_t &args) {
    args.pos.reserve(c.args.size());
    for (const auto &a : c.args) args.pos.push_back(eval(*a, fr));
    for (const auto &k : c.kwargs) {
        for (const auto &[name, _] : args.kw) {
            if (name == k.name) {
                throw ScriptError("SyntaxError", "keyword argument repeated: " + k.name);
            }
        }
        args.kw.emplace_back(k.name, eval(*k.value, fr));
    }
}

value_t Interpreter::eval_call(const call_e &c, frame_t &fr) {
    call_args_t args;
    // obj.method(...) dispatches directly without materializing a bound method.
    if (const auto *a = std::get_if<attribute_e>(&c.func->node)) {
        value_t self = eval(*a->obj, fr);
        if (is_dunder(a->attr)) attribute_error(self, a->attr);
        if (const auto *b = std::get_if<const builtin_obj *>(&self)) {
            const builtin_obj *fn = find_type_attribute(*b, a->attr);
            if (fn == nullptr) {
                throw ScriptError("AttributeError",
                                  std::string("type object '") + (*b)->name +
                                          "' has no attribute '" + a->attr + "'");
            }
            eval_args(c, fr, args);
            return fn->fn(*this, args);
        }
        eval_args(c, fr, args);
        return call_method(*this, self, a->attr, args);
    }
    value_t callee = eval(*c.func, fr);
    eval_args(c, fr, args);
    return call(callee, args);
}

value_t Interpreter::eval_compare(const compare_e &c, frame_t &fr) {
    value_t lhs = eval(*c.first, fr);
    for (const auto &[op, rhs_e] : c.rest) {
        value_t rhs = eval(*rhs_e, fr);
        bool r = false;
        switch (op) {
            case cmp_op::_eq: r = values_equal(lhs, rhs); break;
            case cmp_op::_ne: r = !values_equal(lhs, rhs); break;
            case cmp_op::_lt: r = compare_values(lhs, rhs) < 0; break;
            case cmp_op::_le: r = compare_values(lhs, rhs) <= 0; break;
            case cmp_op::_gt: r = compare_values(lhs, rhs) > 0; break;
            case cmp_op::_ge: r = compare_values(lhs, rhs) >= 0; break;
            case cmp_op::_in: r = contains(rhs, lhs); break;
            case cmp_op::_not_in: r = !contains(rhs, lhs); break;
            case cmp_op::_is: r = is_same_object(lhs, rhs); break;
            case cmp_op::_is_not: r = !is_same_object(lhs, rhs); break;
        }
        if (!r) return make_bool(false);
        lhs = std::move(rhs);
    }
    return make_bool(true);
}

value_t Interpreter::eval_listcomp(const listcomp_e &lc, frame_t &fr) {
    value_t iterable = eval(*lc.iter, fr);
    auto scope = std::make_shared<scope_t>();
    scope->parent = fr.scope;
    frame_t inner{scope, nullptr, make_none()};
    std::vector<value_t> out;
    iterate(iterable, [&](const value_t &v) {
        assign(*lc.target, v, inner);
        for (const auto &cond : lc.conds) {
            if (!truthy(eval(*cond, inner))) return true;
        }
        out.push_back(eval(*lc.elt, inner));
        return true;
    });
    return make_list(std::move(out));
}

// ---- names and assignment ----

void Interpreter::assign(const expr_t &target, const value_t &v, frame_t &fr) {
    std::visit(overloaded{
                       [&](const name_e &n) { store_name(n.id, v, fr); },
                       [&](const subscript_e &s) {
                           value_t obj = eval(*s.obj, fr);
                           if (const auto *sl = std::get_if<slice_e>(&s.index->node)) {
                               value_t lo = sl->lo ? eval(*sl->lo, fr) : make_none();
                               value_t hi = sl->hi ? eval(*sl->hi, fr) : make_none();
                               value_t step = sl->step ? eval(*sl->step, fr) : make_none();
                               set_slice(obj, lo, hi, step, v);
                               return;
                           }
                           set_item(obj, eval(*s.index, fr), v);
                       },
                       [&](const attribute_e &a) {
                           value_t obj = eval(*a.obj, fr);
                           throw ScriptError("AttributeError", "'" + type_name(obj) +
                                                                       "' object attribute '" +
                                                                       a.attr + "' is read-only");
                       },
                       [&](const auto &node) {
                           using T = std::decay_t<decltype(node)>;
                           if constexpr (std::is_same_v<T, tuple_e> || std::is_same_v<T, list_e>) {
                               auto items = to_vector(v);
                               if (items.size() > node.elts.size()) {
                                   throw ScriptError("ValueError",
                                                     "too many values to unpack (expected " +
                                                             std::to_string(node.elts.size()) +
                                                             ")");
                               }
                               if (items.size() < node.elts.size()) {
                                   throw ScriptError("ValueError",
                                                     "not enough values to unpack (expected " +
                                                             std::to_string(node.elts.size()) +
                                                             ", got " +
                                                             std::to_string(items.size()) + ")");
                               }
                               for (std::size_t i = 0; i < items.size(); i++) {
                                   assign(*node.elts[i], items[i], fr);
                               }
                           } else {
                               throw ScriptError("SyntaxError", "cannot assign to expression");
                           }
                       },
               },
               target.node);
}

void Interpreter::store_name(const std::string &name, value_t v, frame_t &fr) {
    if (fr.globals != nullptr && fr.globals->count(name) != 0) {
        globals_->vars.insert_or_assign(name, std::move(v));
        return;
    }
    fr.scope->vars.insert_or_assign(name, std::move(v));
}

value_t Interpreter::load_name(const std::string &name, const frame_t &fr) const {
    if (fr.globals != nullptr && fr.globals->count(name) != 0) {
        auto it = globals_->vars.find(name);
        if (it != globals_->vars.end()) return it->second;
    } else {
        for (const scope_t *s = fr.scope.get(); s != nullptr; s = s->parent.get()) {
            auto it = s->vars.find(name);
            if (it != s->vars.end()) return it->second;
        }
    }
    if (const builtin_obj *b = find_builtin(name)) {
        return value_t{std::in_place_type<const builtin_obj *>, b};
    }
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

// ---- functions ----

std::shared_ptr<const function_obj> Interpreter::make_function(const funcdef_s &def,
                                                               frame_t &fr) {
    auto &decls = global_decls_[&def];
    if (!decls) {
        auto names = std::make_shared<std::unordered_set<std::string>>();
        collect_globals(def.body, *names);
        decls = std::move(names);
    }
    std::vector<value_t> defaults;
    defaults.reserve(def.defaults.size());
    for (const auto &d : def.defaults) defaults.push_back(eval(*d, fr));
    return std::make_shared<const function_obj>(
            function_obj{&def, std::move(defaults), fr.scope, decls});
}

value_t Interpreter::call(const value_t &callee, call_args_t &args) {
    if (const auto *f = std::get_if<std::shared_ptr<const function_obj>>(&callee)) {
        auto keep = *f;
        return call_function(*keep, args);
    }
    if (const auto *b = std::get_if<const builtin_obj *>(&callee)) return (*b)->fn(*this, args);
    if (const auto *m = std::get_if<std::shared_ptr<const method_obj>>(&callee)) {
        auto keep = *m;
        return call_method(*this, keep->self, keep->name, args);
    }
    throw ScriptError("TypeError", "'" + type_name(callee) + "' object is not callable");
}

value_t Interpreter::call_function(const function_obj &f, call_args_t &args) {
    const funcdef_s &def = *f.def;
    if (call_depth_ >= max_call_depth_) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded");
    }
    DepthGuard guard(call_depth_);

    const std::size_t n = def.params.size();
    if (args.pos.size() > n) {
        throw ScriptError("TypeError", def.name + "() takes " + std::to_string(n) +
                                               " positional arguments but " +
                                               std::to_string(args.pos.size()) + " were given");
    }
    auto scope = std::make_shared<scope_t>();
    scope->parent = f.closure;
    std::vector<bool> bound(n, false);
    for (std::size_t i = 0; i < args.pos.size(); i++) {
        scope->vars.insert_or_assign(def.params[i], std::move(args.pos[i]));
        bound[i] = true;
    }
    for (auto &[name, value] : args.kw) {
        std::size_t i = 0;
        while (i < n && def.params[i] != name) i++;
        if (i == n) {
            throw ScriptError("TypeError",
                              def.name + "() got an unexpected keyword argument '" + name + "'");
        }
        if (bound[i]) {
            throw ScriptError("TypeError",
                              def.name + "() got multiple values for argument '" + name + "'");
        }
        scope->vars.insert_or_assign(name, std::move(value));
        bound[i] = true;
    }
    const std::size_t first_default = n - f.defaults.size();
    for (std::size_t i = 0; i < n; i++) {
        if (bound[i]) continue;
        if (i < first_default) {
            throw ScriptError("TypeError", def.name + "() missing required argument: '" +
                                                   def.params[i] + "'");
        }
        scope->vars.insert_or_assign(def.params[i], f.defaults[i - first_default]);
    }

    frame_t fr{std::move(scope), f.globals.get(), make_none()};
    flow_t flow = exec_block(def.body, fr);
    if (flow == flow_t::_return) return std::move(fr.retval);
    if (flow != flow_t::_normal) throw ScriptError("SyntaxError", "'break' outside loop");
    return make_none();
}

}  // namespace arena::script
