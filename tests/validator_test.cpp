//
// Copyright (c) 2024-2025 JLGxy
//

#include <string>

#include "gtest/gtest.h"
#include "validator.h"

using arena::validate;
using arena::violation_kind;

TEST(validator, acceptsPlainDecompressor) {
    auto res = validate("def decompress(data):\n    return bytes(data)\n");
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.violations.empty());
    EXPECT_EQ(res.error_code(), "");
    EXPECT_GT(res.program->source_bytes(), 0u);
}

TEST(validator, importAnywhere) {
    const char *sources[] = {
            "import os\ndef decompress(d):\n    return d\n",
            "def decompress(d):\n    import zlib\n    return zlib.decompress(d)\n",
            "def decompress(d):\n    if len(d) > 100:\n        from . import x\n    return d\n",
            "from builtins import *\ndef decompress(d):\n    return d\n",
    };
    for (const char *src : sources) {
        auto res = validate(src);
        ASSERT_FALSE(res.ok()) << src;
        EXPECT_EQ(res.violations.front().kind, violation_kind::_import) << src;
        EXPECT_EQ(res.error_code(), "DECOMPRESSION_ImportError");
    }
}

TEST(validator, deniedNames) {
    auto res = validate("def decompress(d):\n    return eval('d')\n");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.violations.front().kind, violation_kind::_forbidden_name);
    EXPECT_EQ(res.violations.front().loc.line, 2);

    // stores, parameters and keyword names count as references too
    EXPECT_FALSE(validate("open = 1\n").ok());
    EXPECT_FALSE(validate("def f(exec):\n    pass\n").ok());
    EXPECT_FALSE(validate("def print():\n    pass\n").ok());
    EXPECT_FALSE(validate("x = sorted([1], globals=1)\n").ok());
    EXPECT_FALSE(validate("def f():\n    global vars\n").ok());
    EXPECT_FALSE(validate("x = __name__\n").ok());
}

TEST(validator, forbiddenAttributes) {
    auto res = validate("x = ().__class__.__bases__\n");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.violations.size(), 2u);
    for (const auto &v : res.violations) EXPECT_EQ(v.kind, violation_kind::_forbidden_attribute);
    EXPECT_EQ(res.error_code(), "DECOMPRESSION_ForbiddenAttribute");

    EXPECT_FALSE(validate("def f(g):\n    return g.gi_frame\n").ok());
    EXPECT_FALSE(validate("x = '__subclasses__'\n").ok());
    EXPECT_TRUE(validate("x = b'abc'.hex()\n").ok());
}

TEST(validator, violationsInSourceOrder) {
    auto res = validate("x = 1\ny = eval\nimport os\nz = x.__dict__\n");
    ASSERT_EQ(res.violations.size(), 3u);
    EXPECT_EQ(res.violations[0].kind, violation_kind::_forbidden_name);
    EXPECT_EQ(res.violations[1].kind, violation_kind::_import);
    EXPECT_EQ(res.violations[2].kind, violation_kind::_forbidden_attribute);
    EXPECT_EQ(res.error_code(), "DECOMPRESSION_ForbiddenName");
    EXPECT_NE(res.message().find("line 3"), std::string::npos);
}

TEST(validator, syntaxError) {
    auto res = validate("def decompress(d)\n    return d\n");
    ASSERT_FALSE(res.ok());
    ASSERT_EQ(res.violations.size(), 1u);
    EXPECT_EQ(res.violations[0].kind, violation_kind::_syntax);
    EXPECT_EQ(res.violations[0].loc.line, 1);
    EXPECT_EQ(res.error_code(), "DECOMPRESSION_SyntaxError");
}

TEST(validator, limits) {
    arena::validator_conf_t conf;
    conf.max_code_length = 16;
    auto res = validate("def decompress(d):\n    return d\n", conf);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.violations[0].kind, violation_kind::_code_too_long);
    EXPECT_EQ(res.error_code(), "DECOMPRESSION_CodeTooLong");

    conf = {};
    conf.max_nesting_depth = 2;
    res = validate("if a:\n    if b:\n        if c:\n            pass\n", conf);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.violations[0].kind, violation_kind::_syntax);
}

TEST(validator, orThrow) {
    EXPECT_NO_THROW(arena::validate_or_throw("def decompress(d):\n    return d\n"));
    try {
        arena::validate_or_throw("import os\n");
        FAIL() << "no ValidationError";
    } catch (const arena::ValidationError &e) {
        EXPECT_EQ(e.error_code(), "DECOMPRESSION_ImportError");
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_EQ(e.violations()[0].loc.line, 1);
    }
}

TEST(validator, deniedNameList) {
    EXPECT_TRUE(arena::is_denied_name("__import__"));
    EXPECT_TRUE(arena::is_denied_name("getattr"));
    EXPECT_TRUE(arena::is_denied_name("__anything__"));
    EXPECT_FALSE(arena::is_denied_name("len"));
    EXPECT_FALSE(arena::is_denied_name("_private"));
    EXPECT_TRUE(arena::is_runtime_internal("f_globals"));
    EXPECT_FALSE(arena::is_runtime_internal("append"));
}
