//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arena_error.h"
#include "script_ast.h"
#include "script_parser.h"

namespace arena {

enum class violation_kind : std::int8_t {
    _code_too_long,
    _syntax,
    _import,
    _forbidden_name,
    _forbidden_attribute,
};

std::string violation_kind_str(violation_kind kind);

struct violation_t {
    violation_kind kind;
    script::location_t loc;
    std::string detail;

    std::string to_str() const;
};

struct validator_conf_t {
    std::size_t max_code_length = 100000;
    int max_nesting_depth = script::_default_max_nesting;
};

struct validation_result_t;

// Pure function of `source` and `conf`.
validation_result_t validate(std::string_view source, const validator_conf_t &conf = {});

// A decompressor that passed validation. Only `validate` creates one, so holding an
// analyzed_program_t is proof that the static checks ran. Copies share the tree.
class analyzed_program_t {
  public:
    const script::module_t &module() const { return *module_; }
    const std::string &source() const { return *source_; }
    std::size_t source_bytes() const { return source_->size(); }
    // The limits the program was checked against.
    const validator_conf_t &conf() const { return conf_; }

  private:
    analyzed_program_t(std::shared_ptr<const script::module_t> mod,
                       std::shared_ptr<const std::string> src, const validator_conf_t &conf)
            : module_(std::move(mod)), source_(std::move(src)), conf_(conf) {}

    std::shared_ptr<const script::module_t> module_;
    std::shared_ptr<const std::string> source_;
    validator_conf_t conf_;

    friend validation_result_t validate(std::string_view source, const validator_conf_t &conf);
};

struct validation_result_t {
    std::optional<analyzed_program_t> program;
    std::vector<violation_t> violations;  // in source order

    bool ok() const { return program.has_value(); }
    // "DECOMPRESSION_<kind>" of the first violation. Empty when ok.
    std::string error_code() const;
    std::string message() const;
};

class ValidationError : public ArenaError {
  public:
    explicit ValidationError(std::vector<violation_t> violations);
    const std::vector<violation_t> &violations() const { return violations_; }
    std::string error_code() const;

  private:
    std::vector<violation_t> violations_;
};

bool is_denied_name(std::string_view name);
bool is_runtime_internal(std::string_view attr);

analyzed_program_t validate_or_throw(std::string_view source, const validator_conf_t &conf = {});

}  // namespace arena
