//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <string_view>

#include "script_ast.h"

namespace arena::script {

constexpr int _default_max_nesting = 100;
constexpr int _max_expr_height = 1000;

// Parses a decompressor script. Throws SyntaxError on the first problem; blocks and
// bracketed expressions nested deeper than `max_nesting` are rejected, as is any
// expression tree taller than _max_expr_height.
module_t parse(std::string_view source, int max_nesting = _default_max_nesting);

}  // namespace arena::script
