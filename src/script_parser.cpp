//
// Copyright (c) 2024-2025 JLGxy
//

#include "script_parser.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "script_lexer.h"

namespace arena::script {

const char *binary_op_str(binary_op op) {
    switch (op) {
        case binary_op::_add: return "+";
        case binary_op::_sub: return "-";
        case binary_op::_mul: return "*";
        case binary_op::_floordiv: return "//";
        case binary_op::_mod: return "%";
        case binary_op::_pow: return "**";
        case binary_op::_lshift: return "<<";
        case binary_op::_rshift: return ">>";
        case binary_op::_and: return "&";
        case binary_op::_or: return "|";
        case binary_op::_xor: return "^";
        default: return "?";
    }
}

namespace {

int height(const expr_ptr &e) { return e ? e->height : 0; }

template <typename Range>
int max_height(const Range &r) {
    int h = 0;
    for (const auto &e : r) h = std::max(h, height(e));
    return h;
}

int node_height(const decltype(expr_t::node) &node) {
    return 1 + std::visit(
                       overloaded{
                               [](const name_e &) { return 0; },
                               [](const literal_e &) { return 0; },
                               [](const attribute_e &n) { return height(n.obj); },
                               [](const slice_e &n) {
                                   return std::max({height(n.lo), height(n.hi), height(n.step)});
                               },
                               [](const subscript_e &n) {
                                   return std::max(height(n.obj), height(n.index));
                               },
                               [](const call_e &n) {
                                   int h = std::max(height(n.func), max_height(n.args));
                                   for (const auto &k : n.kwargs) h = std::max(h, height(k.value));
                                   return h;
                               },
                               [](const unary_e &n) { return height(n.operand); },
                               [](const binary_e &n) { return std::max(height(n.lhs), height(n.rhs)); },
                               [](const boolop_e &n) { return std::max(height(n.lhs), height(n.rhs)); },
                               [](const compare_e &n) {
                                   int h = height(n.first);
                                   for (const auto &pr : n.rest) h = std::max(h, height(pr.second));
                                   return h;
                               },
                               [](const ifexp_e &n) {
                                   return std::max({height(n.cond), height(n.then), height(n.orelse)});
                               },
                               [](const list_e &n) { return max_height(n.elts); },
                               [](const tuple_e &n) { return max_height(n.elts); },
                               [](const dict_e &n) {
                                   int h = 0;
                                   for (const auto &[k, v] : n.items)
                                       h = std::max({h, height(k), height(v)});
                                   return h;
                               },
                               [](const listcomp_e &n) {
                                   return std::max({height(n.elt), height(n.target), height(n.iter),
                                                    max_height(n.conds)});
                               },
                       },
                       node);
}

bool is_assignable(const expr_t &e, bool allow_unpack) {
    return std::visit(overloaded{
                              [](const name_e &) { return true; },
                              [](const subscript_e &) { return true; },
                              [](const attribute_e &) { return true; },
                              [&](const tuple_e &n) {
                                  return allow_unpack && !n.elts.empty() &&
                                         std::all_of(n.elts.begin(), n.elts.end(),
                                                     [](const expr_ptr &x) {
                                                         return is_assignable(*x, true);
                                                     });
                              },
                              [&](const list_e &n) {
                                  return allow_unpack && !n.elts.empty() &&
                                         std::all_of(n.elts.begin(), n.elts.end(),
                                                     [](const expr_ptr &x) {
                                                         return is_assignable(*x, true);
                                                     });
                              },
                              [](const auto &) { return false; },
                      },
                      e.node);
}

class Parser {
  public:
    Parser(std::vector<token_t> toks, int max_nesting)
            : toks_(std::move(toks)), max_nesting_(max_nesting) {}

    module_t parse_module() {
        module_t m;
        while (!at(token_kind::_end)) {
            if (at(token_kind::_newline)) {
                next();
                continue;
            }
            parse_statement(m.body);
        }
        return m;
    }

  private:
    std::vector<token_t> toks_;
    std::size_t idx_ = 0;
    int depth_ = 0;
    int max_nesting_;

    class NestingGuard {
      public:
        explicit NestingGuard(Parser &p) : p_(p) {
            if (++p_.depth_ > p_.max_nesting_) p_.fail("too deeply nested");
        }
        NestingGuard(const NestingGuard &) = delete;
        NestingGuard &operator=(const NestingGuard &) = delete;
        ~NestingGuard() { --p_.depth_; }

      private:
        Parser &p_;
    };

    const token_t &cur() const { return toks_[idx_]; }
    const token_t &peek(std::size_t off = 1) const {
        return toks_[std::min(idx_ + off, toks_.size() - 1)];
    }
    bool at(token_kind k) const { return cur().kind == k; }
    bool at_op(std::string_view op) const { return cur().is_op(op); }
    bool at_kw(std::string_view kw) const { return cur().is_name(kw); }
    const token_t &next() {
        const token_t &t = toks_[idx_];
        if (idx_ + 1 < toks_.size()) idx_++;
        return t;
    }
    bool accept_op(std::string_view op) {
        if (!at_op(op)) return false;
        next();
        return true;
    }
    bool accept_kw(std::string_view kw) {
        if (!at_kw(kw)) return false;
        next();
        return true;
    }
    [[noreturn]] void fail(const std::string &msg) const { throw SyntaxError(cur().loc, msg); }
    void expect_op(std::string_view op) {
        if (!accept_op(op)) fail("expected '" + std::string(op) + "'");
    }
    void expect_kw(std::string_view kw) {
        if (!accept_kw(kw)) fail("expected '" + std::string(kw) + "'");
    }
    std::string expect_name() {
        if (!at(token_kind::_name) || is_keyword(cur().text)) fail("expected a name");
        return next().text;
    }
    void expect_newline() {
        if (at(token_kind::_end)) return;
        if (!at(token_kind::_newline)) fail("invalid syntax");
        next();
    }

    template <typename N>
    expr_ptr make(location_t loc, N &&node) {
        auto e = std::make_unique<expr_t>();
        e->node.template emplace<std::decay_t<N>>(std::forward<N>(node));
        e->loc = loc;
        e->height = node_height(e->node);
        if (e->height > _max_expr_height) throw SyntaxError(loc, "expression too deeply nested");
        return e;
    }
    template <typename N>
    stmt_ptr make_stmt(location_t loc, N &&node) {
        auto s = std::make_unique<stmt_t>();
        s->node.template emplace<std::decay_t<N>>(std::forward<N>(node));
        s->loc = loc;
        return s;
    }

    bool starts_expr() const {
        const token_t &t = cur();
        switch (t.kind) {
            case token_kind::_int:
            case token_kind::_str:
            case token_kind::_bytes: return true;
            case token_kind::_name:
                return !is_keyword(t.text) || t.text == "None" || t.text == "True" ||
                       t.text == "False" || t.text == "not" || t.text == "lambda";
            case token_kind::_op:
                return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" ||
                       t.text == "+" || t.text == "~";
            default: return false;
        }
    }

    // ---- statements ----

    void parse_statement(block_t &out) {
        const token_t &t = cur();
        if (t.kind == token_kind::_indent) fail("unexpected indent");
        if (t.kind == token_kind::_name) {
            if (t.text == "if") {
                out.push_back(parse_if());
                return;
            }
            if (t.text == "while") {
                out.push_back(parse_while());
                return;
            }
            if (t.text == "for") {
                out.push_back(parse_for());
                return;
            }
            if (t.text == "def") {
                out.push_back(parse_def());
                return;
            }
            if (t.text == "class" || t.text == "try" || t.text == "with" || t.text == "async") {
                fail("'" + t.text + "' statements are not supported");
            }
            if (t.text == "elif" || t.text == "else" || t.text == "except" ||
                t.text == "finally") {
                fail("invalid syntax");
            }
        }
        parse_simple_line(out);
    }

    void parse_simple_line(block_t &out) {
        out.push_back(parse_simple());
        while (accept_op(";")) {
            if (at(token_kind::_newline) || at(token_kind::_end)) break;
            out.push_back(parse_simple());
        }
        expect_newline();
    }

    block_t parse_block() {
        NestingGuard guard(*this);
        expect_op(":");
        block_t body;
        if (!at(token_kind::_newline)) {
            parse_simple_line(body);
            return body;
        }
        next();
        if (!at(token_kind::_indent)) fail("expected an indented block");
        next();
        while (!at(token_kind::_dedent) && !at(token_kind::_end)) parse_statement(body);
        if (at(token_kind::_dedent)) next();
        return body;
    }

    stmt_ptr parse_if() {
        location_t loc = next().loc;  // `if` or `elif`
        if_s node;
        node.cond = parse_expression();
        node.body = parse_block();
        if (at_kw("elif")) {
            NestingGuard guard(*this);
            node.orelse.push_back(parse_if());
        } else if (accept_kw("else")) {
            node.orelse = parse_block();
        }
        return make_stmt(loc, std::move(node));
    }

    stmt_ptr parse_while() {
        location_t loc = next().loc;
        while_s node;
        node.cond = parse_expression();
        node.body = parse_block();
        if (at_kw("else")) fail("while-else is not supported");
        return make_stmt(loc, std::move(node));
    }

    stmt_ptr parse_for() {
        location_t loc = next().loc;
        for_s node;
        node.target = parse_target_list();
        expect_kw("in");
        node.iter = parse_testlist();
        node.body = parse_block();
        if (at_kw("else")) fail("for-else is not supported");
        return make_stmt(loc, std::move(node));
    }

    stmt_ptr parse_def() {
        location_t loc = next().loc;
        funcdef_s node;
        node.name = expect_name();
        expect_op("(");
        while (!at_op(")")) {
            if (at_op("*") || at_op("**") || at_op("/")) {
                fail("variadic and positional-only parameters are not supported");
            }
            node.param_locs.push_back(cur().loc);
            node.params.push_back(expect_name());
            if (accept_op(":")) parse_expression();  // annotations are parsed and dropped
            if (accept_op("=")) {
                node.defaults.push_back(parse_expression());
            } else if (!node.defaults.empty()) {
                fail("non-default parameter follows default parameter");
            }
            if (!accept_op(",")) break;
        }
        expect_op(")");
        if (accept_op("->")) parse_expression();
        node.body = parse_block();
        return make_stmt(loc, std::move(node));
    }

    std::string parse_dotted() {
        std::string name = expect_name();
        while (accept_op(".")) name += "." + expect_name();
        return name;
    }

    stmt_ptr parse_import() {
        location_t loc = next().loc;
        import_s node;
        do {
            node.modules.push_back(parse_dotted());
            if (accept_kw("as")) expect_name();
        } while (accept_op(","));
        return make_stmt(loc, std::move(node));
    }

    stmt_ptr parse_import_from() {
        location_t loc = next().loc;
        importfrom_s node;
        while (at_op(".")) {
            next();
            node.level++;
        }
        if (!at_kw("import")) node.module = parse_dotted();
        if (node.module.empty() && node.level == 0) fail("expected a module name");
        expect_kw("import");
        if (accept_op("*")) {
            node.names.emplace_back("*");
            return make_stmt(loc, std::move(node));
        }
        bool paren = accept_op("(");
        do {
            if (paren && at_op(")")) break;
            node.names.push_back(expect_name());
            if (accept_kw("as")) expect_name();
        } while (accept_op(","));
        if (paren) expect_op(")");
        return make_stmt(loc, std::move(node));
    }

    stmt_ptr parse_simple() {
        const token_t &t = cur();
        location_t loc = t.loc;
        if (t.kind == token_kind::_name) {
            if (t.text == "pass") return next(), make_stmt(loc, pass_s{});
            if (t.text == "break") return next(), make_stmt(loc, break_s{});
            if (t.text == "continue") return next(), make_stmt(loc, continue_s{});
            if (t.text == "import") return parse_import();
            if (t.text == "from") return parse_import_from();
            if (t.text == "return") {
                next();
                return_s node;
                if (starts_expr()) node.value = parse_testlist();
                return make_stmt(loc, std::move(node));
            }
            if (t.text == "global") {
                next();
                global_s node;
                do {
                    node.names.push_back(expect_name());
                } while (accept_op(","));
                return make_stmt(loc, std::move(node));
            }
            if (t.text == "raise") {
                next();
                raise_s node;
                if (starts_expr()) node.exc = parse_expression();
                if (at_kw("from")) fail("'raise ... from' is not supported");
                return make_stmt(loc, std::move(node));
            }
            if (t.text == "assert") {
                next();
                assert_s node;
                node.test = parse_expression();
                if (accept_op(",")) node.msg = parse_expression();
                return make_stmt(loc, std::move(node));
            }
            if (t.text == "del" || t.text == "nonlocal" || t.text == "yield" ||
                t.text == "await") {
                fail("'" + t.text + "' is not supported");
            }
        }

        expr_ptr first = parse_testlist();
        if (at_op("=")) {
            std::vector<expr_ptr> items;
            items.push_back(std::move(first));
            while (accept_op("=")) items.push_back(parse_testlist());
            assign_s node;
            node.value = std::move(items.back());
            items.pop_back();
            for (auto &target : items) {
                if (!is_assignable(*target, true)) {
                    throw SyntaxError(target->loc, "cannot assign to expression");
                }
            }
            node.targets = std::move(items);
            return make_stmt(loc, std::move(node));
        }
        if (cur().kind == token_kind::_op && cur().text.size() >= 2 && cur().text.back() == '=' &&
            cur().text != "==" && cur().text != "!=" && cur().text != "<=" &&
            cur().text != ">=") {
            std::string op = next().text;
            augassign_s node;
            node.op = augmented_op(op);
            if (!is_assignable(*first, false)) {
                throw SyntaxError(first->loc, "illegal target for augmented assignment");
            }
            node.target = std::move(first);
            node.value = parse_testlist();
            return make_stmt(loc, std::move(node));
        }
        if (at_op(":")) fail("annotated assignments are not supported");
        return make_stmt(loc, expr_s{std::move(first)});
    }

    binary_op augmented_op(const std::string &op) const {
        if (op == "+=") return binary_op::_add;
        if (op == "-=") return binary_op::_sub;
        if (op == "*=") return binary_op::_mul;
        if (op == "//=") return binary_op::_floordiv;
        if (op == "%=") return binary_op::_mod;
        if (op == "**=") return binary_op::_pow;
        if (op == "<<=") return binary_op::_lshift;
        if (op == ">>=") return binary_op::_rshift;
        if (op == "&=") return binary_op::_and;
        if (op == "|=") return binary_op::_or;
        if (op == "^=") return binary_op::_xor;
        if (op == "/=") fail("true division is not supported, use //");
        fail("invalid syntax");
    }

    // ---- expressions ----

    expr_ptr parse_testlist() {
        location_t loc = cur().loc;
        expr_ptr first = parse_expression();
        if (!at_op(",")) return first;
        tuple_e node;
        node.elts.push_back(std::move(first));
        while (accept_op(",")) {
            if (!starts_expr()) break;
            node.elts.push_back(parse_expression());
        }
        return make(loc, std::move(node));
    }

    expr_ptr parse_target_list() {
        location_t loc = cur().loc;
        expr_ptr first = parse_bitor();
        expr_ptr target;
        if (at_op(",")) {
            tuple_e node;
            node.elts.push_back(std::move(first));
            while (accept_op(",")) {
                if (!starts_expr()) break;
                node.elts.push_back(parse_bitor());
            }
            target = make(loc, std::move(node));
        } else {
            target = std::move(first);
        }
        if (!is_assignable(*target, true)) throw SyntaxError(loc, "cannot assign to expression");
        return target;
    }

    expr_ptr parse_expression() {
        NestingGuard guard(*this);
        location_t loc = cur().loc;
        expr_ptr e = parse_or();
        if (!accept_kw("if")) return e;
        ifexp_e node;
        node.then = std::move(e);
        node.cond = parse_or();
        expect_kw("else");
        node.orelse = parse_expression();
        return make(loc, std::move(node));
    }

    expr_ptr parse_or() {
        location_t loc = cur().loc;
        expr_ptr lhs = parse_and();
        while (accept_kw("or")) lhs = make(loc, boolop_e{false, std::move(lhs), parse_and()});
        return lhs;
    }

    expr_ptr parse_and() {
        location_t loc = cur().loc;
        expr_ptr lhs = parse_not();
        while (accept_kw("and")) lhs = make(loc, boolop_e{true, std::move(lhs), parse_not()});
        return lhs;
    }

    expr_ptr parse_not() {
        if (!at_kw("not")) return parse_comparison();
        NestingGuard guard(*this);
        location_t loc = next().loc;
        return make(loc, unary_e{unary_op::_not, parse_not()});
    }

    bool comparison_op(cmp_op &op) {
        const token_t &t = cur();
        if (t.kind == token_kind::_op) {
            if (t.text == "==") op = cmp_op::_eq;
            else if (t.text == "!=") op = cmp_op::_ne;
            else if (t.text == "<") op = cmp_op::_lt;
            else if (t.text == "<=") op = cmp_op::_le;
            else if (t.text == ">") op = cmp_op::_gt;
            else if (t.text == ">=") op = cmp_op::_ge;
            else return false;
            next();
            return true;
        }
        if (t.is_name("in")) {
            next();
            op = cmp_op::_in;
            return true;
        }
        if (t.is_name("not") && peek().is_name("in")) {
            next();
            next();
            op = cmp_op::_not_in;
            return true;
        }
        if (t.is_name("is")) {
            next();
            op = accept_kw("not") ? cmp_op::_is_not : cmp_op::_is;
            return true;
        }
        return false;
    }

    expr_ptr parse_comparison() {
        location_t loc = cur().loc;
        expr_ptr first = parse_bitor();
        cmp_op op{};
        if (!comparison_op(op)) return first;
        compare_e node;
        node.first = std::move(first);
        do {
            node.rest.emplace_back(op, parse_bitor());
        } while (comparison_op(op));
        return make(loc, std::move(node));
    }

    template <typename Sub>
    expr_ptr parse_binary_level(std::initializer_list<std::pair<std::string_view, binary_op>> ops,
                                Sub sub) {
        location_t loc = cur().loc;
        expr_ptr lhs = (this->*sub)();
        while (true) {
            auto it = std::find_if(ops.begin(), ops.end(),
                                   [&](const auto &pr) { return at_op(pr.first); });
            if (it == ops.end()) return lhs;
            next();
            lhs = make(loc, binary_e{it->second, std::move(lhs), (this->*sub)()});
        }
    }

    expr_ptr parse_bitor() { return parse_binary_level({{"|", binary_op::_or}}, &Parser::parse_bitxor); }
    expr_ptr parse_bitxor() { return parse_binary_level({{"^", binary_op::_xor}}, &Parser::parse_bitand); }
    expr_ptr parse_bitand() { return parse_binary_level({{"&", binary_op::_and}}, &Parser::parse_shift); }
    expr_ptr parse_shift() {
        return parse_binary_level({{"<<", binary_op::_lshift}, {">>", binary_op::_rshift}},
                                  &Parser::parse_arith);
    }
    expr_ptr parse_arith() {
        return parse_binary_level({{"+", binary_op::_add}, {"-", binary_op::_sub}},
                                  &Parser::parse_term);
    }
    expr_ptr parse_term() {
        location_t loc = cur().loc;
        expr_ptr lhs = parse_factor();
        while (true) {
            binary_op op;
            if (at_op("*")) {
                op = binary_op::_mul;
            } else if (at_op("//")) {
                op = binary_op::_floordiv;
            } else if (at_op("%")) {
                op = binary_op::_mod;
            } else if (at_op("/")) {
                fail("true division is not supported, use //");
            } else if (at_op("@")) {
                fail("matrix multiplication is not supported");
            } else {
                return lhs;
            }
            next();
            lhs = make(loc, binary_e{op, std::move(lhs), parse_factor()});
        }
    }

    expr_ptr parse_factor() {
        unary_op op;
        if (at_op("-")) {
            op = unary_op::_neg;
        } else if (at_op("+")) {
            op = unary_op::_pos;
        } else if (at_op("~")) {
            op = unary_op::_invert;
        } else {
            return parse_power();
        }
        NestingGuard guard(*this);
        location_t loc = next().loc;
        return make(loc, unary_e{op, parse_factor()});
    }

    expr_ptr parse_power() {
        location_t loc = cur().loc;
        expr_ptr base = parse_primary();
        if (!accept_op("**")) return base;
        NestingGuard guard(*this);
        return make(loc, binary_e{binary_op::_pow, std::move(base), parse_factor()});
    }

    expr_ptr parse_primary() {
        expr_ptr e = parse_atom();
        while (true) {
            location_t loc = cur().loc;
            if (accept_op("(")) {
                e = parse_call(loc, std::move(e));
            } else if (accept_op("[")) {
                expr_ptr index = parse_subscript();
                expect_op("]");
                e = make(loc, subscript_e{std::move(e), std::move(index)});
            } else if (accept_op(".")) {
                std::string attr = expect_name();
                e = make(loc, attribute_e{std::move(e), std::move(attr)});
            } else {
                return e;
            }
        }
    }

    expr_ptr parse_call(location_t loc, expr_ptr func) {
        call_e node;
        node.func = std::move(func);
        while (!at_op(")")) {
            if (at_op("*") || at_op("**")) fail("argument unpacking is not supported");
            if (at(token_kind::_name) && peek().is_op("=")) {
                location_t kloc = cur().loc;
                std::string name = expect_name();
                next();  // '='
                node.kwargs.push_back(keyword_arg_t{std::move(name), parse_expression(), kloc});
            } else {
                if (!node.kwargs.empty()) fail("positional argument follows keyword argument");
                node.args.push_back(parse_expression());
                if (at_kw("for")) fail("generator expressions are not supported");
            }
            if (!accept_op(",")) break;
        }
        expect_op(")");
        return make(loc, std::move(node));
    }

    expr_ptr parse_subscript() {
        location_t loc = cur().loc;
        expr_ptr lo, hi, step;
        if (!at_op(":")) {
            lo = parse_expression();
            if (at_op(",")) fail("tuple subscripts are not supported");
            if (!at_op(":")) return lo;
        }
        expect_op(":");
        if (!at_op(":") && !at_op("]")) hi = parse_expression();
        if (accept_op(":") && !at_op("]")) step = parse_expression();
        return make(loc, slice_e{std::move(lo), std::move(hi), std::move(step)});
    }

    expr_ptr parse_atom() {
        const token_t &t = cur();
        location_t loc = t.loc;
        switch (t.kind) {
            case token_kind::_int: {
                std::int64_t v = next().ival;
                return make(loc, literal_e{literal_kind::_int, v, {}});
            }
            case token_kind::_str:
            case token_kind::_bytes: return parse_strings();
            case token_kind::_name: {
                if (t.text == "None") return next(), make(loc, literal_e{literal_kind::_none, 0, {}});
                if (t.text == "True") return next(), make(loc, literal_e{literal_kind::_true, 0, {}});
                if (t.text == "False") {
                    return next(), make(loc, literal_e{literal_kind::_false, 0, {}});
                }
                if (t.text == "lambda" || t.text == "yield" || t.text == "await") {
                    fail("'" + t.text + "' is not supported");
                }
                if (is_keyword(t.text)) fail("invalid syntax");
                return make(loc, name_e{next().text});
            }
            case token_kind::_op: {
                if (t.text == "(") return parse_paren();
                if (t.text == "[") return parse_list();
                if (t.text == "{") return parse_dict();
                break;
            }
            default: break;
        }
        fail("invalid syntax");
    }

    expr_ptr parse_strings() {
        location_t loc = cur().loc;
        bool is_bytes = at(token_kind::_bytes);
        std::string value;
        while (at(token_kind::_str) || at(token_kind::_bytes)) {
            if (at(token_kind::_bytes) != is_bytes) fail("cannot mix bytes and nonbytes literals");
            value += next().text;
        }
        return make(loc, literal_e{is_bytes ? literal_kind::_bytes : literal_kind::_str, 0,
                                   std::move(value)});
    }

    expr_ptr parse_paren() {
        NestingGuard guard(*this);
        location_t loc = next().loc;
        if (accept_op(")")) return make(loc, tuple_e{});
        expr_ptr first = parse_expression();
        if (at_kw("for")) fail("generator expressions are not supported");
        if (!at_op(",")) {
            expect_op(")");
            return first;
        }
        tuple_e node;
        node.elts.push_back(std::move(first));
        while (accept_op(",")) {
            if (at_op(")")) break;
            node.elts.push_back(parse_expression());
        }
        expect_op(")");
        return make(loc, std::move(node));
    }

    expr_ptr parse_list() {
        NestingGuard guard(*this);
        location_t loc = next().loc;
        if (accept_op("]")) return make(loc, list_e{});
        expr_ptr first = parse_expression();
        if (accept_kw("for")) {
            listcomp_e node;
            node.elt = std::move(first);
            node.target = parse_target_list();
            expect_kw("in");
            node.iter = parse_or();
            while (accept_kw("if")) node.conds.push_back(parse_or());
            if (at_kw("for")) fail("nested comprehension loops are not supported");
            expect_op("]");
            return make(loc, std::move(node));
        }
        list_e node;
        node.elts.push_back(std::move(first));
        while (accept_op(",")) {
            if (at_op("]")) break;
            node.elts.push_back(parse_expression());
        }
        expect_op("]");
        return make(loc, std::move(node));
    }

    expr_ptr parse_dict() {
        NestingGuard guard(*this);
        location_t loc = next().loc;
        dict_e node;
        if (accept_op("}")) return make(loc, std::move(node));
        do {
            if (at_op("}")) break;
            expr_ptr key = parse_expression();
            if (!at_op(":")) fail("set literals are not supported");
            next();
            expr_ptr value = parse_expression();
            if (at_kw("for")) fail("dict comprehensions are not supported");
            node.items.emplace_back(std::move(key), std::move(value));
        } while (accept_op(","));
        expect_op("}");
        return make(loc, std::move(node));
    }
};

}  // namespace

module_t parse(const std::string_view source, int max_nesting) {
    return Parser(tokenize(source), max_nesting).parse_module();
}

}  // namespace arena::script
