//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "script_ast.h"
#include "script_value.h"

namespace arena::script {

constexpr int _default_max_call_depth = 200;

// Tree-walking evaluator for a parsed decompressor. The global namespace starts empty; names
// that are not defined by the program resolve against the builtin allow-list only.
class Interpreter {
  public:
    explicit Interpreter(const module_t &mod, int max_call_depth = _default_max_call_depth);
    Interpreter(const Interpreter &) = delete;
    Interpreter &operator=(const Interpreter &) = delete;

    void run_module();
    // Calls the global function `entry` with `input` as bytes and returns the bytes it yields.
    std::string call_entry(std::string_view input, const std::string &entry = "decompress");

    value_t call(const value_t &callee, call_args_t &args);
    std::optional<value_t> global(const std::string &name) const;

  private:
    enum class flow_t : std::int8_t { _normal, _break, _continue, _return };

    struct frame_t {
        std::shared_ptr<scope_t> scope;
        const std::unordered_set<std::string> *globals;
        value_t retval;
    };

    const module_t &module_;
    int max_call_depth_;
    int call_depth_ = 0;
    std::shared_ptr<scope_t> globals_;
    std::unordered_map<const literal_e *, value_t> literals_;
    std::unordered_map<const funcdef_s *, std::shared_ptr<const std::unordered_set<std::string>>>
            global_decls_;

    flow_t exec_block(const block_t &block, frame_t &fr);
    flow_t exec(const stmt_t &stmt, frame_t &fr);
    flow_t exec_for(const for_s &st, frame_t &fr);
    void exec_augassign(const augassign_s &st, frame_t &fr);
    [[noreturn]] void exec_raise(const raise_s &st, frame_t &fr);

    value_t eval(const expr_t &e, frame_t &fr);
    value_t eval_literal(const literal_e &l);
    value_t eval_attribute(const attribute_e &a, frame_t &fr);
    value_t eval_subscript(const subscript_e &s, frame_t &fr);
    value_t eval_call(const call_e &c, frame_t &fr);
    value_t eval_compare(const compare_e &c, frame_t &fr);
    value_t eval_listcomp(const listcomp_e &lc, frame_t &fr);
    void eval_args(const call_e &c, frame_t &fr, call_args_t &args);

    void assign(const expr_t &target, const value_t &v, frame_t &fr);
    void store_name(const std::string &name, value_t v, frame_t &fr);
    value_t load_name(const std::string &name, const frame_t &fr) const;

    std::shared_ptr<const function_obj> make_function(const funcdef_s &def, frame_t &fr);
    value_t call_function(const function_obj &f, call_args_t &args);
};

const builtin_obj *find_builtin(std::string_view name);
// `int.from_bytes`, `bytes.fromhex` and the like. Returns nullptr for anything else.
const builtin_obj *find_type_attribute(const builtin_obj *type, std::string_view attr);
bool has_method(const value_t &self, std::string_view name);
value_t call_method(Interpreter &interp, const value_t &self, const std::string &name,
                    call_args_t &args);

inline bool is_dunder(const std::string_view name) {
    return name.size() > 4 && name.substr(0, 2) == "__" && name.substr(name.size() - 2) == "__";
}

}  // namespace arena::script
