//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace arena::script {

struct location_t {
    int line = 0;
    int col = 0;
};

enum class token_kind : std::int8_t {
    _name,
    _int,
    _str,
    _bytes,
    _op,
    _newline,
    _indent,
    _dedent,
    _end,
};

struct token_t {
    token_kind kind;
    std::string text;  // identifier, operator, or the decoded literal contents
    std::int64_t ival{};
    location_t loc;

    bool is_op(std::string_view op) const { return kind == token_kind::_op && text == op; }
    bool is_name(std::string_view name) const {
        return kind == token_kind::_name && text == name;
    }
};

// Raised for anything the lexer or the parser cannot accept. Carries the position of the
// offending token.
class SyntaxError : public std::exception {
  public:
    SyntaxError(location_t loc, const std::string_view msg)
            : loc_(loc),
              msg_(msg),
              what_str_("line " + std::to_string(loc.line) + ":" + std::to_string(loc.col) +
                        ": " + std::string(msg)) {}
    const char *what() const noexcept override { return what_str_.c_str(); }
    location_t where() const { return loc_; }
    const std::string &message() const { return msg_; }

  private:
    location_t loc_;
    std::string msg_;
    std::string what_str_;
};

bool is_keyword(std::string_view name);

std::vector<token_t> tokenize(std::string_view source);

}  // namespace arena::script
