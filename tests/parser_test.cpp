//
// Copyright (c) 2024-2025 JLGxy
//

#include <string>
#include <variant>
#include <vector>

#include "gtest/gtest.h"
#include "script_lexer.h"
#include "script_parser.h"

namespace sc = arena::script;

namespace {

std::vector<sc::token_kind> kinds(const std::string &src) {
    std::vector<sc::token_kind> out;
    for (const auto &t : sc::tokenize(src)) out.push_back(t.kind);
    return out;
}

sc::location_t syntax_error_at(const std::string &src) {
    try {
        sc::parse(src);
    } catch (const sc::SyntaxError &e) {
        return e.where();
    }
    ADD_FAILURE() << "no SyntaxError for:\n" << src;
    return {};
}

}  // namespace

TEST(lexer, indentBlocks) {
    using K = sc::token_kind;
    auto k = kinds("if x:\n    y = 1\nz\n");
    std::vector<K> expect = {K::_name, K::_name, K::_op, K::_newline, K::_indent, K::_name,
                             K::_op, K::_int, K::_newline, K::_dedent, K::_name, K::_newline,
                             K::_end};
    EXPECT_EQ(k, expect);
}

TEST(lexer, bracketsJoinLines) {
    auto toks = sc::tokenize("x = (1 +\n     2)\n");
    int newlines = 0;
    for (const auto &t : toks) newlines += t.kind == sc::token_kind::_newline;
    EXPECT_EQ(newlines, 1);
}

TEST(lexer, literals) {
    auto toks = sc::tokenize("0x1f 0b101 1_000 'a\\x41' b'\\x00\\xff'\n");
    ASSERT_GE(toks.size(), 5u);
    EXPECT_EQ(toks[0].ival, 31);
    EXPECT_EQ(toks[1].ival, 5);
    EXPECT_EQ(toks[2].ival, 1000);
    EXPECT_EQ(toks[3].kind, sc::token_kind::_str);
    EXPECT_EQ(toks[3].text, "aA");
    EXPECT_EQ(toks[4].kind, sc::token_kind::_bytes);
    EXPECT_EQ(toks[4].text, std::string("\0\xff", 2));
}

TEST(lexer, rejects) {
    EXPECT_THROW(sc::tokenize("x = 1.5\n"), sc::SyntaxError);
    EXPECT_THROW(sc::tokenize("x = f'{y}'\n"), sc::SyntaxError);
    EXPECT_THROW(sc::tokenize("x = 'abc\n"), sc::SyntaxError);
    EXPECT_THROW(sc::tokenize("x = (1\n"), sc::SyntaxError);
    EXPECT_THROW(sc::tokenize("x = 99999999999999999999\n"), sc::SyntaxError);
    EXPECT_THROW(sc::tokenize("x = $\n"), sc::SyntaxError);
}

TEST(parser, functionDefinition) {
    auto mod = sc::parse("def decompress(data, n=2):\n    return data * n\n");
    ASSERT_EQ(mod.body.size(), 1u);
    const auto *fn = std::get_if<sc::funcdef_s>(&mod.body[0]->node);
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->name, "decompress");
    EXPECT_EQ(fn->params, (std::vector<std::string>{"data", "n"}));
    EXPECT_EQ(fn->defaults.size(), 1u);
    ASSERT_EQ(fn->body.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<sc::return_s>(fn->body[0]->node));
}

TEST(parser, elifChain) {
    auto mod = sc::parse("if a:\n    pass\nelif b:\n    pass\nelse:\n    x = 1\n");
    ASSERT_EQ(mod.body.size(), 1u);
    const auto *st = std::get_if<sc::if_s>(&mod.body[0]->node);
    ASSERT_NE(st, nullptr);
    ASSERT_EQ(st->orelse.size(), 1u);
    const auto *inner = std::get_if<sc::if_s>(&st->orelse[0]->node);
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->orelse.size(), 1u);
}

TEST(parser, imports) {
    auto mod = sc::parse("import os, sys\nfrom ..pkg import a, b\n");
    ASSERT_EQ(mod.body.size(), 2u);
    const auto *imp = std::get_if<sc::import_s>(&mod.body[0]->node);
    ASSERT_NE(imp, nullptr);
    EXPECT_EQ(imp->modules, (std::vector<std::string>{"os", "sys"}));
    const auto *from = std::get_if<sc::importfrom_s>(&mod.body[1]->node);
    ASSERT_NE(from, nullptr);
    EXPECT_EQ(from->level, 2);
    EXPECT_EQ(from->module, "pkg");
}

TEST(parser, errorLocation) {
    auto loc = syntax_error_at("x = 1\ny = = 2\n");
    EXPECT_EQ(loc.line, 2);
    loc = syntax_error_at("def f(:\n    pass\n");
    EXPECT_EQ(loc.line, 1);
}

TEST(parser, unsupportedStatements) {
    syntax_error_at("class A:\n    pass\n");
    syntax_error_at("try:\n    pass\nexcept:\n    pass\n");
    syntax_error_at("with x:\n    pass\n");
    syntax_error_at("while x:\n    pass\nelse:\n    pass\n");
    syntax_error_at("del x\n");
    syntax_error_at("def f(*a):\n    pass\n");
}

TEST(parser, nestingLimit) {
    std::string src;
    for (int i = 0; i < 5; i++) src += std::string(i * 4, ' ') + "if x:\n";
    src += std::string(20, ' ') + "pass\n";
    EXPECT_NO_THROW(sc::parse(src, 5));
    EXPECT_THROW(sc::parse(src, 4), sc::SyntaxError);

    std::string deep = "x = " + std::string(200, '(') + "1" + std::string(200, ')') + "\n";
    EXPECT_THROW(sc::parse(deep), sc::SyntaxError);
}
