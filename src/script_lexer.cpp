//
// Copyright (c) 2024-2025 JLGxy
//

#include "script_lexer.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace arena::script {

namespace {

constexpr std::array<std::string_view, 35> _keywords = {
        "False",  "None",   "True",    "and",      "as",     "assert", "async",
        "await",  "break",  "class",   "continue", "def",    "del",    "elif",
        "else",   "except", "finally", "for",      "from",   "global", "if",
        "import", "in",     "is",      "lambda",   "nonlocal", "not",  "or",
        "pass",   "raise",  "return",  "try",      "while",  "with",   "yield",
};

// longest match first
constexpr std::array<std::string_view, 4> _ops3 = {"**=", "//=", ">>=", "<<="};
constexpr std::array<std::string_view, 18> _ops2 = {"**", "//", "<<", ">>", "<=", ">=",
                                                    "==", "!=", "+=", "-=", "*=", "%=",
                                                    "&=", "|=", "^=", "->", ":=", "/="};
constexpr std::string_view _ops1 = "+-*/%&|^~<>()[]{},:.;=@";

constexpr int _tab_size = 8;

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
bool is_ident_char(char c) { return is_ident_start(c) || (c >= '0' && c <= '9'); }

int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return 99;
}

void append_utf8(std::string &out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else {
        out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

class Lexer {
  public:
    explicit Lexer(std::string_view src) : src_(src) {}

    std::vector<token_t> run() {
        while (pos_ < src_.size()) {
            if (line_start_ && depth_ == 0) {
                if (!handle_indent()) continue;
            }
            char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                advance();
            } else if (c == '\n') {
                end_line();
            } else if (c == '#') {
                skip_comment();
            } else if (c == '\\') {
                continuation();
            } else if (static_cast<unsigned char>(c) >= 0x80) {
                throw SyntaxError(here(), "non-ASCII character outside a string literal");
            } else if (is_ident_start(c)) {
                name_or_string();
            } else if (c >= '0' && c <= '9') {
                number();
            } else if (c == '"' || c == '\'') {
                string_literal(false, false, here());
            } else {
                op();
            }
        }
        if (depth_ != 0) throw SyntaxError(here(), "unexpected end of input inside brackets");
        if (line_has_tokens_) push(token_kind::_newline, "", here());
        while (indents_.size() > 1) {
            indents_.pop_back();
            push(token_kind::_dedent, "", here());
        }
        push(token_kind::_end, "", here());
        return std::move(tokens_);
    }

  private:
    std::string_view src_;
    std::size_t pos_ = 0;
    int line_ = 1, col_ = 1;
    int depth_ = 0;
    bool line_start_ = true;
    bool line_has_tokens_ = false;
    std::vector<int> indents_{0};
    std::vector<token_t> tokens_;

    location_t here() const { return {line_, col_}; }
    char peek(std::size_t off = 0) const {
        return pos_ + off < src_.size() ? src_[pos_ + off] : '\0';
    }
    void advance() {
        if (src_[pos_] == '\n') {
            line_++;
            col_ = 1;
        } else {
            col_++;
        }
        pos_++;
    }
    void push(token_kind k, std::string text, location_t loc, std::int64_t ival = 0) {
        tokens_.push_back(token_t{k, std::move(text), ival, loc});
        if (k != token_kind::_newline && k != token_kind::_indent && k != token_kind::_dedent)
            line_has_tokens_ = true;
    }

    // Returns false if the whole line was blank and has been consumed.
    bool handle_indent() {
        int width = 0;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == ' ') {
                width++;
            } else if (c == '\t') {
                width = (width / _tab_size + 1) * _tab_size;
            } else if (c == '\f') {
                width = 0;
            } else {
                break;
            }
            advance();
        }
        char c = peek();
        if (c == '\0') return false;
        if (c == '\n' || c == '#' || c == '\r') {
            if (c == '#') skip_comment();
            if (peek() == '\r') advance();
            if (peek() == '\n') advance();
            return false;
        }
        line_start_ = false;
        if (width > indents_.back()) {
            indents_.push_back(width);
            push(token_kind::_indent, "", here());
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                push(token_kind::_dedent, "", here());
            }
            if (width != indents_.back()) {
                throw SyntaxError(here(), "unindent does not match any outer indentation level");
            }
        }
        return true;
    }

    void end_line() {
        location_t loc = here();
        advance();
        if (depth_ > 0) return;
        if (line_has_tokens_) {
            push(token_kind::_newline, "", loc);
            line_has_tokens_ = false;
        }
        line_start_ = true;
    }

    void skip_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') advance();
    }

    void continuation() {
        location_t loc = here();
        advance();
        if (peek() == '\r') advance();
        if (peek() != '\n') throw SyntaxError(loc, "unexpected character after line continuation");
        advance();
    }

    void name_or_string() {
        location_t loc = here();
        std::size_t st = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) advance();
        if (pos_ < src_.size() && static_cast<unsigned char>(src_[pos_]) >= 0x80) {
            throw SyntaxError(here(), "identifiers must be ASCII");
        }
        std::string word(src_.substr(st, pos_ - st));
        char q = peek();
        if ((q == '"' || q == '\'') && word.size() <= 2) {
            std::string lower = word;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](char ch) { return static_cast<char>(ch | 0x20); });
            if (lower == "b" || lower == "br" || lower == "rb") {
                string_literal(true, lower != "b", loc);
                return;
            }
            if (lower == "r" || lower == "u") {
                string_literal(false, lower == "r", loc);
                return;
            }
            if (lower.find('f') != std::string::npos) {
                throw SyntaxError(loc, "f-strings are not supported");
            }
        }
        push(token_kind::_name, std::move(word), loc);
    }

    void number() {
        location_t loc = here();
        int base = 10;
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' ||
                              peek(1) == 'O' || peek(1) == 'b' || peek(1) == 'B')) {
            char p = static_cast<char>(peek(1) | 0x20);
            base = p == 'x' ? 16 : (p == 'o' ? 8 : 2);
            advance();
            advance();
        }
        std::uint64_t val = 0;
        bool any = false, last_us = false;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '_') {
                if (!any || last_us) throw SyntaxError(here(), "invalid number literal");
                last_us = true;
                advance();
                continue;
            }
            int d = digit_value(c);
            if (d >= base) break;
            if (val > (static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) -
                       static_cast<std::uint64_t>(d)) /
                              static_cast<std::uint64_t>(base)) {
                throw SyntaxError(loc, "integer literal too large");
            }
            val = val * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(d);
            any = true;
            last_us = false;
            advance();
        }
        if (!any || last_us) throw SyntaxError(loc, "invalid number literal");
        char c = peek();
        if (c == '.' || (base == 10 && (c == 'e' || c == 'E' || c == 'j' || c == 'J'))) {
            throw SyntaxError(loc, "floating point literals are not supported");
        }
        if (is_ident_char(c)) throw SyntaxError(loc, "invalid number literal");
        push(token_kind::_int, std::string{}, loc, static_cast<std::int64_t>(val));
    }

    void string_literal(bool is_bytes, bool raw, location_t loc) {
        char q = peek();
        bool triple = peek(1) == q && peek(2) == q;
        advance();
        if (triple) {
            advance();
            advance();
        }
        std::string out;
        while (true) {
            if (pos_ >= src_.size()) throw SyntaxError(loc, "unterminated string literal");
            char c = src_[pos_];
            if (c == q) {
                if (!triple) {
                    advance();
                    break;
                }
                if (peek(1) == q && peek(2) == q) {
                    advance();
                    advance();
                    advance();
                    break;
                }
                out.push_back(c);
                advance();
                continue;
            }
            if (c == '\n' && !triple) throw SyntaxError(loc, "unterminated string literal");
            if (is_bytes && static_cast<unsigned char>(c) >= 0x80) {
                throw SyntaxError(here(), "bytes can only contain ASCII literal characters");
            }
            if (c != '\\') {
                out.push_back(c);
                advance();
                continue;
            }
            if (raw) {
                // a raw literal keeps the backslash, but an escaped quote still does not end it
                out.push_back(c);
                advance();
                if (pos_ < src_.size()) {
                    out.push_back(src_[pos_]);
                    advance();
                }
                continue;
            }
            escape(out, is_bytes);
        }
        push(is_bytes ? token_kind::_bytes : token_kind::_str, std::move(out), loc);
    }

    void escape(std::string &out, bool is_bytes) {
        location_t loc = here();
        advance();  // backslash
        if (pos_ >= src_.size()) throw SyntaxError(loc, "unterminated string literal");
        char c = src_[pos_];
        advance();
        switch (c) {
            case '\n': return;
            case '\r':
                if (peek() == '\n') advance();
                return;
            case '\\': out.push_back('\\'); return;
            case '\'': out.push_back('\''); return;
            case '"': out.push_back('"'); return;
            case 'a': out.push_back('\a'); return;
            case 'b': out.push_back('\b'); return;
            case 'f': out.push_back('\f'); return;
            case 'n': out.push_back('\n'); return;
            case 'r': out.push_back('\r'); return;
            case 't': out.push_back('\t'); return;
            case 'v': out.push_back('\v'); return;
            case 'x': {
                int hi = digit_value(peek()), lo = digit_value(peek(1));
                if (hi >= 16 || lo >= 16) throw SyntaxError(loc, "truncated \\xXX escape");
                advance();
                advance();
                auto v = static_cast<std::uint32_t>(hi * 16 + lo);
                if (is_bytes) {
                    out.push_back(static_cast<char>(v));
                } else {
                    append_utf8(out, v);
                }
                return;
            }
            case 'u':
            case 'U': {
                if (is_bytes) break;
                int len = c == 'u' ? 4 : 8;
                std::uint32_t v = 0;
                for (int i = 0; i < len; i++) {
                    int d = digit_value(peek());
                    if (d >= 16) throw SyntaxError(loc, "truncated unicode escape");
                    v = v * 16 + static_cast<std::uint32_t>(d);
                    advance();
                }
                if (v > 0x10ffff) throw SyntaxError(loc, "illegal unicode character");
                append_utf8(out, v);
                return;
            }
            case 'N':
                if (is_bytes) break;
                throw SyntaxError(loc, "named unicode escapes are not supported");
            default:
                if (c >= '0' && c <= '7') {
                    std::uint32_t v = static_cast<std::uint32_t>(c - '0');
                    for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; i++) {
                        v = v * 8 + static_cast<std::uint32_t>(peek() - '0');
                        advance();
                    }
                    if (is_bytes) {
                        out.push_back(static_cast<char>(v & 0xff));
                    } else {
                        append_utf8(out, v);
                    }
                    return;
                }
                break;
        }
        // unknown escapes are kept verbatim
        out.push_back('\\');
        out.push_back(c);
    }

    void op() {
        location_t loc = here();
        std::string_view rest = src_.substr(pos_);
        auto take = [&](std::string_view o) {
            for (std::size_t i = 0; i < o.size(); i++) advance();
            push(token_kind::_op, std::string(o), loc);
        };
        for (auto o : _ops3) {
            if (rest.starts_with(o)) return take(o);
        }
        for (auto o : _ops2) {
            if (rest.starts_with(o)) return take(o);
        }
        char c = rest.front();
        if (_ops1.find(c) == std::string_view::npos) {
            throw SyntaxError(loc, std::string("invalid character '") + c + "'");
        }
        if (c == '(' || c == '[' || c == '{') {
            depth_++;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth_ == 0) throw SyntaxError(loc, std::string("unmatched '") + c + "'");
            depth_--;
        }
        take(rest.substr(0, 1));
    }
};

}  // namespace

bool is_keyword(const std::string_view name) {
    return std::find(_keywords.begin(), _keywords.end(), name) != _keywords.end();
}

std::vector<token_t> tokenize(const std::string_view source) { return Lexer(source).run(); }

}  // namespace arena::script
