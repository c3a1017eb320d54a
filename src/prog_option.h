//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "arena_error.h"
#include "arena_logs.h"
#include "fmt/core.h"

namespace arena::po {

using strvec = std::vector<std::string>;

// Bad command line. Reported with the usage text.
class OptionError : public ArenaError {
  public:
    using ArenaError::ArenaError;
};
class ArgNotFound : public OptionError {
  public:
    using OptionError::OptionError;
};
class InvalidArg : public OptionError {
  public:
    using OptionError::OptionError;
};
class NotExist : public OptionError {
  public:
    using OptionError::OptionError;
};

template <typename T>
concept my_number = requires(T num) {
    std::from_chars(std::declval<const char *>(), std::declval<const char *>(), num);
};

template <my_number T>
inline T to_int(std::string_view s) {
    T ret;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
    if (ec == std::errc{} && ptr == s.data() + s.size()) return ret;
    throw InvalidArg("not a number: " + std::string(s));
}

// Options of one command: `--name value`, `--name=value`, `-x value` or `-xvalue`.
class Parser {
  public:
    Parser() = default;
    Parser(const Parser &) = delete;
    Parser &operator=(const Parser &) = delete;

    // `name` must be unique. A flag takes no value: min_arg = max_arg = 0.
    void add(const std::string_view name, const char short_name, const std::string_view description,
             bool optional, std::size_t min_arg, std::size_t max_arg) {
        opt_vector_.emplace_back(name, short_name, description, optional, min_arg, max_arg);
    }

    template <typename T>
    T get(std::string_view, const std::optional<T> & = std::nullopt) = delete;
    template <my_number T>
    T get(std::string_view, const std::optional<T> & = std::nullopt);

    std::string usage(std::string_view prefix) const {
        std::string out = fmt::format(ARENA_FMT("Usage: {} [options]\nOptions:\n"), prefix);
        for (const auto &opt : opt_vector_) {
            auto head = opt.short_name ? fmt::format(ARENA_FMT("-{}, --{}"), opt.short_name,
                                                     opt.name)
                                       : fmt::format(ARENA_FMT("    --{}"), opt.name);
            out += fmt::format(ARENA_FMT("  {:<24}{}{}\n"), head, opt.desc,
                               opt.optional ? "" : " (required)");
        }
        return out;
    }

    void parse_check(const strvec &argvec) {
        args_.clear();
        auto find_opt = [this](const option &opt) {
            return std::ranges::find_if(args_, [&](const option_value &pr) {
                return pr.first == std::addressof(opt);
            });
        };
        auto add_or_merge = [&](const option &opt, std::string_view s) {
            auto it = find_opt(opt);
            if (it != args_.end()) {
                it->second.emplace_back(s);
            } else {
                args_.emplace_back(&opt, strvec{std::string{s}});
            }
        };
        auto add_only = [&](const option &opt) {
            if (find_opt(opt) == args_.end()) args_.emplace_back(&opt, strvec{});
        };

        for (std::size_t i = 0; i < argvec.size(); i++) {
            const auto &arg = argvec[i];
            if (arg.size() < 2 || arg[0] != '-') throw InvalidArg("unexpected token `" + arg + "`");
            if (arg[1] != '-') {
                const auto &opt = find_option_by_short_name(arg[1]);
                if (arg.length() > 2) {
                    add_or_merge(opt, std::string_view(arg).substr(2));
                } else if (opt.max_cnt > 0 && i + 1 < argvec.size() &&
                           (argvec[i + 1].empty() || argvec[i + 1][0] != '-')) {
                    add_or_merge(opt, argvec[++i]);
                } else {
                    add_only(opt);
                }
            } else {
                if (arg.length() < 3) throw InvalidArg("unexpected token `--`");
                auto pos = arg.find('=');
                if (pos == std::string::npos) pos = arg.length();
                const auto &opt = find_option_by_name(std::string_view(arg).substr(2, pos - 2));
                if (pos != arg.length()) {
                    add_or_merge(opt, std::string_view(arg).substr(pos + 1));
                } else if (opt.max_cnt > 0 && i + 1 < argvec.size() &&
                           (argvec[i + 1].empty() || argvec[i + 1][0] != '-')) {
                    add_or_merge(opt, argvec[++i]);
                } else {
                    add_only(opt);
                }
            }
        }
        for (const auto &[opt, arg] : args_) {
            if (arg.size() < opt->min_cnt || arg.size() > opt->max_cnt)
                throw InvalidArg(fmt::format(
                        ARENA_FMT("invalid number of arguments for --{}, expect [{},{}], got {}"),
                        opt->name, opt->min_cnt, opt->max_cnt, arg.size()));
        }
        for (const auto &opt : opt_vector_) {
            if (!opt.optional && find_opt(opt) == args_.end()) {
                throw ArgNotFound("missing argument `--" + opt.name + "`");
            }
        }
    }

  private:
    struct option {
        std::string name;
        char short_name;
        std::string desc;
        bool optional;
        std::size_t min_cnt, max_cnt;
        option(std::string_view lname, char sname, std::string_view descr, bool opt,
               std::size_t min_c, std::size_t max_c)
                : name(lname),
                  short_name(sname),
                  desc(descr),
                  optional(opt),
                  min_cnt(min_c),
                  max_cnt(max_c) {}
    };

    using option_value = std::pair<const option *, strvec>;

    std::vector<option> opt_vector_;
    std::vector<option_value> args_;

    const option &find_option_by_name(std::string_view s) const {
        auto it =
                std::ranges::find_if(opt_vector_, [&](const option &opt) { return opt.name == s; });
        if (it == opt_vector_.end()) throw NotExist("no such option: --" + std::string(s));
        return *it;
    }

    const option &find_option_by_short_name(char s) const {
        auto it = std::ranges::find_if(opt_vector_,
                                       [&](const option &opt) { return opt.short_name == s; });
        if (it == opt_vector_.end()) throw NotExist(std::string("no such option: -") + s);
        return *it;
    }
    const option_value &get_value_by_name(std::string_view name) const {
        auto it = std::ranges::find_if(
                args_, [&](const option_value &arg) -> bool { return arg.first->name == name; });
        if (it == args_.end()) throw ArgNotFound("not found: --" + std::string(name));
        return *it;
    }
};

// Whether the flag was given.
template <>
inline bool Parser::get<bool>(std::string_view name, const std::optional<bool> &) {
    return std::ranges::any_of(
            args_, [&](const option_value &arg) -> bool { return arg.first->name == name; });
}

// The single value of `name`, or `default_value` when absent. Throws if neither exists.
template <>
inline std::string Parser::get<std::string>(std::string_view name,
                                            const std::optional<std::string> &default_value) {
    try {
        const auto &val = get_value_by_name(name);
        if (val.second.size() != 1)
            throw InvalidArg(fmt::format(ARENA_FMT("expected 1 argument for --{}, got {}"), name,
                                         val.second.size()));
        return val.second.front();
    } catch (const ArgNotFound &) {
        if (default_value.has_value()) return default_value.value();
        throw;
    }
}

template <my_number T>
inline T Parser::get(std::string_view name, const std::optional<T> &default_value) {
    try {
        const auto &val = get_value_by_name(name);
        if (val.second.size() != 1)
            throw InvalidArg(fmt::format(ARENA_FMT("expected 1 argument for --{}, got {}"), name,
                                         val.second.size()));
        return to_int<T>(val.second.front());
    } catch (const ArgNotFound &) {
        if (default_value.has_value()) return default_value.value();
        throw;
    }
}

class CommandBase {
  public:
    CommandBase() = default;
    CommandBase(const CommandBase &) = delete;
    CommandBase &operator=(const CommandBase &) = delete;
    virtual ~CommandBase() = default;
    virtual std::string_view get_name() const = 0;
    virtual std::string_view get_desc() const = 0;
    virtual void init_parser() = 0;
    virtual int run() = 0;
    Parser parser;
};

// Dispatches `prog <command> [options]` to the registered command.
class CommandHandler {
  public:
    void add_command(std::unique_ptr<CommandBase> ptr) {
        ptr->init_parser();
        cmd_vector_.emplace_back(std::move(ptr));
    }

    std::string usage() const {
        std::string out = fmt::format(ARENA_FMT("Usage: {} <command> [options]\nCommands:\n"),
                                      name_str_);
        for (const auto &cmd : cmd_vector_) {
            out += fmt::format(ARENA_FMT("  {:<10}{}\n"), cmd->get_name(), cmd->get_desc());
        }
        return out;
    }

    // Returns the exit status of the program.
    int parse_and_run(const strvec &argvec) {
        if (argvec.empty() || argvec[0] == "--help" || argvec[0] == "-h") {
            std::cerr << usage();
            return argvec.empty() ? 1 : 0;
        }
        if (argvec[0] == "--version" || argvec[0] == "-v") {
            std::cout << name_str_ << " " << version_str_ << std::endl;
            return 0;
        }
        auto it = std::ranges::find_if(cmd_vector_, [&](const std::unique_ptr<CommandBase> &cmd) {
            return cmd->get_name() == argvec[0];
        });
        if (it == cmd_vector_.end()) throw NotExist("unknown command `" + argvec[0] + "`");
        auto &cmd = *it;
        strvec rest(argvec.begin() + 1, argvec.end());
        if (std::ranges::any_of(rest, [](const std::string &a) { return a == "--help"; })) {
            std::cerr << cmd->parser.usage(name_str_ + " " + std::string(cmd->get_name()));
            return 0;
        }
        cmd->parser.parse_check(rest);
        return cmd->run();
    }

    void set_name(std::string_view name, std::string_view version) {
        name_str_ = std::string{name};
        version_str_ = std::string{version};
    }

  private:
    std::string name_str_, version_str_;
    std::vector<std::unique_ptr<CommandBase>> cmd_vector_;
};

}  // namespace arena::po
