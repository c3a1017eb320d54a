//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "arena_logs.h"

namespace arena {

// Base of the errors reported to an operator. `what()` carries the red "error:" prefix used
// on the console, `message()` the bare text recorded on submissions.
class ArenaError : public std::exception {
  public:
    explicit ArenaError(const std::string_view what_arg)
            : msg_(what_arg), what_str_(std::string(jl::_error_prefix) + msg_) {}
    const char *what() const noexcept override { return what_str_.c_str(); }
    const std::string &message() const { return msg_; }

  protected:
    std::string msg_;
    std::string what_str_;
};

class ConfigError : public ArenaError {
  public:
    ConfigError(const std::string_view key, const std::string_view what_arg)
            : ArenaError("in config key " + std::string(key) + ":\n  " + std::string(what_arg)),
              key_(key) {}
    const std::string &key() const { return key_; }

  private:
    std::string key_;
};

}  // namespace arena
