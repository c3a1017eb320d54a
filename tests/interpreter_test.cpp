//
// Copyright (c) 2024-2025 JLGxy
//

#include <string>

#include "gtest/gtest.h"
#include "interpreter.h"
#include "script_value.h"
#include "validator.h"

namespace sc = arena::script;

namespace {

std::string decompress(const std::string &src, const std::string &input,
                       int max_call_depth = sc::_default_max_call_depth) {
    auto prog = arena::validate_or_throw(src);
    sc::Interpreter interp(prog.module(), max_call_depth);
    interp.run_module();
    return interp.call_entry(input);
}

// Runs `body` as the body of decompress() and returns the type of the script fault it raises.
std::string fault_of(const std::string &body) {
    try {
        decompress("def decompress(data):\n" + body + "    return data\n", "");
    } catch (const sc::ScriptError &e) {
        return e.type();
    }
    return "none";
}

}  // namespace

TEST(interpreter, identity) {
    std::string data("\x00\x01\xfe\xff", 4);
    EXPECT_EQ(decompress("def decompress(data):\n    return data\n", data), data);
}

TEST(interpreter, runLengthDecoder) {
    const char *src = R"(
def decompress(data):
    out = bytearray()
    i = 0
    while i + 1 < len(data):
        count, value = data[i], data[i + 1]
        out.extend(bytes([value]) * count)
        i += 2
    return bytes(out)
)";
    EXPECT_EQ(decompress(src, std::string("\x03""a\x02""b", 4)), "aaabb");
}

TEST(interpreter, arithmetic) {
    const char *src = R"(
def decompress(data):
    vals = [7 // 2, -7 // 2, 7 % 3, -7 % 3, 2 ** 10, 1 << 5, 0xff & 0x0f, 5 ^ 3, ~0 + 2]
    q, r = divmod(17, 5)
    vals.append(q)
    vals.append(r)
    vals.append(pow(3, 4, 5))
    return bytes([v % 256 for v in vals])
)";
    std::string expect = {3, static_cast<char>(252), 1, 2, 0, 32, 15, 6, 1, 3, 2, 1};
    EXPECT_EQ(decompress(src, ""), expect);
}

TEST(interpreter, bytesAndInts) {
    const char *src = R"(
def decompress(data):
    n = int.from_bytes(data[:2], 'big')
    tail = (n + 1).to_bytes(2, 'little')
    return tail + bytes.fromhex('cafe') + data[2:].hex().encode()
)";
    EXPECT_EQ(decompress(src, std::string("\x01\x00\xab", 3)),
              std::string("\x01\x01\xca\xfe", 4) + "ab");
}

TEST(interpreter, stringsCountCodePoints) {
    const char *src = R"(
def decompress(data):
    s = data.decode('utf-8')
    parts = s.split(',')
    return str(len(s)).encode() + b':' + '|'.join(reversed(parts)).encode('utf-8')
)";
    EXPECT_EQ(decompress(src, "a,\xc3\xa9,c"), "5:c|\xc3\xa9|a");
}

TEST(interpreter, containersAndFunctions) {
    const char *src = R"(
table = {}

def build(words, start=1):
    for i, w in enumerate(words, start):
        table[w] = i
    return table

def decompress(data):
    build(['x', 'yy', 'zzz'])
    keys = sorted(table, key=len, reverse=True)
    sizes = [table[k] for k in keys if table[k] > 1]
    pairs = list(zip(keys, sizes))
    out = ''
    for k, v in pairs:
        out += k + str(v)
    return out.encode() + bytes([max(sizes), min(sizes), sum(sizes)])
)";
    EXPECT_EQ(decompress(src, ""), "zzz3yy2" + std::string("\x03\x02\x05", 3));
}

TEST(interpreter, globalsAndClosures) {
    const char *src = R"(
count = 0

def bump():
    global count
    count += 1

def decompress(data):
    for _ in range(len(data)):
        bump()
    return bytes([count])
)";
    EXPECT_EQ(decompress(src, "abcd"), "\x04");
}

TEST(interpreter, faults) {
    EXPECT_EQ(fault_of("    x = 1 // 0\n"), "ZeroDivisionError");
    EXPECT_EQ(fault_of("    x = 2 ** 63\n"), "OverflowError");
    EXPECT_EQ(fault_of("    x = undefined_name\n"), "NameError");
    EXPECT_EQ(fault_of("    x = [1][5]\n"), "IndexError");
    EXPECT_EQ(fault_of("    x = {}['k']\n"), "KeyError");
    EXPECT_EQ(fault_of("    x = b'a' + 'b'\n"), "TypeError");
    EXPECT_EQ(fault_of("    x = bytes([300])\n"), "ValueError");
    EXPECT_EQ(fault_of("    assert len(data) > 0, 'empty'\n"), "AssertionError");
    EXPECT_EQ(fault_of("    raise ValueError('bad header')\n"), "ValueError");
    EXPECT_EQ(fault_of("    x = b'\\xff'.decode('utf-8')\n"), "UnicodeDecodeError");
    EXPECT_EQ(fault_of("    x = data.missing\n"), "AttributeError");
}

TEST(interpreter, faultCarriesLine) {
    try {
        decompress("def decompress(data):\n    x = 1\n    raise RuntimeError('boom')\n", "");
        FAIL() << "no fault";
    } catch (const sc::ScriptError &e) {
        EXPECT_EQ(e.type(), "RuntimeError");
        EXPECT_EQ(e.message(), "boom");
        EXPECT_EQ(e.line(), 3);
    }
}

TEST(interpreter, recursionLimit) {
    const char *src = R"(
def down(n):
    return down(n + 1)

def decompress(data):
    return down(0)
)";
    try {
        decompress(src, "", 50);
        FAIL() << "no fault";
    } catch (const sc::ScriptError &e) {
        EXPECT_EQ(e.type(), "RecursionError");
    }
}

TEST(interpreter, entryPoint) {
    EXPECT_THROW(decompress("def other(data):\n    return data\n", ""), sc::ScriptError);
    EXPECT_THROW(decompress("decompress = 1\n", ""), sc::ScriptError);
    try {
        decompress("def decompress(data):\n    return len(data)\n", "abc");
        FAIL() << "no fault";
    } catch (const sc::ScriptError &e) {
        EXPECT_EQ(e.type(), "TypeError");
    }
    EXPECT_EQ(decompress("def decompress(data):\n    return bytearray(data)\n", "xy"), "xy");
}

TEST(interpreter, builtinAllowList) {
    EXPECT_NE(sc::find_builtin("len"), nullptr);
    EXPECT_NE(sc::find_builtin("bytearray"), nullptr);
    EXPECT_EQ(sc::find_builtin("open"), nullptr);
    EXPECT_EQ(sc::find_builtin("eval"), nullptr);
    EXPECT_EQ(sc::find_builtin("__import__"), nullptr);
}
