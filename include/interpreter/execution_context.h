#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "control_flow.h"

// Everything the interpreter core needs from its host shell. Optional callables may be left
// empty; the core skips them.
struct ExecutionContext {
    // Runs one command unit and returns its exit code. Throws CommandExecutionError when the
    // command cannot be started at all.
    std::function<int(const std::string&)> execute_command;
    std::function<std::string(const std::string&)> expand;
    // Field-splitting expansion for loop items; when empty, `expand` plus whitespace splitting
    // is used for items that reference `$@`, `$*` or whole arrays.
    std::function<std::vector<std::string>(const std::string&)> expand_words;
    std::function<std::string(const std::string&)> get_variable;
    std::function<void(const std::string&, const std::string&)> set_variable;
    // Distinguish an unset variable from an empty one.
    std::function<std::optional<std::string>(const std::string&)> find_variable;
    std::function<void(const std::string&)> unset_variable;
    std::function<bool()> errexit_enabled;
    std::function<bool()> stop_requested;
    std::function<control_flow::ControlSignal()> poll_signal;

    // Parses and registers a function definition starting at the given line, returning the
    // index of its last line, or nothing when the line does not start a definition.
    std::function<std::optional<std::size_t>(const std::vector<std::string>&, std::size_t)>
        define_function;

    // Runs `body` with a compound statement's trailing redirection (`done < file`) applied.
    std::function<control_flow::ExecOutcome(const std::string&,
                                            const std::function<control_flow::ExecOutcome()>&)>
        with_redirection;

    std::function<void(int)> record_exit_code;
    std::function<void()> on_command_error;
    std::function<std::vector<std::string>()> get_positional_parameters;
    std::function<void(const std::vector<std::string>&)> set_positional_parameters;
    std::function<void(const std::string&)> set_script_name;

    std::istream* input = nullptr;
    std::ostream* output = nullptr;
};
