#include "shell.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

#include "builtin.h"
#include "control_flow_executor.h"
#include "control_flow_parser.h"
#include "error_out.h"
#include "exec.h"
#include "expansion_evaluator.h"
#include "function_manager.h"
#include "interpreter_utils.h"
#include "parser.h"
#include "script_error.h"
#include "script_manager.h"
#include "signal_handler.h"
#include "utils/debug.h"

extern char** environ;

using control_flow::ControlSignal;
using interpreter_utils::StatementKind;
using interpreter_utils::trim;

namespace {

constexpr size_t kMaxArrayIndex = 1 << 20;

bool is_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// Splits an assignment word into name, optional subscript, append flag and raw value. Returns
// false when the word is not an assignment.
struct AssignmentParts {
    std::string name;
    std::optional<std::string> subscript;
    bool append = false;
    std::string value;
};

bool split_assignment(const std::string& word, AssignmentParts& parts) {
    size_t eq_pos = word.find('=');
    if (eq_pos == std::string::npos || eq_pos == 0) {
        return false;
    }
    std::string lhs = word.substr(0, eq_pos);
    parts.append = lhs.back() == '+';
    if (parts.append) {
        lhs.pop_back();
    }
    size_t bracket = lhs.find('[');
    if (bracket != std::string::npos) {
        if (lhs.back() != ']' || bracket == 0) {
            return false;
        }
        parts.subscript = lhs.substr(bracket + 1, lhs.size() - bracket - 2);
        lhs = lhs.substr(0, bracket);
    }
    if (!interpreter_utils::is_identifier(lhs)) {
        return false;
    }
    parts.name = lhs;
    parts.value = word.substr(eq_pos + 1);
    return true;
}

bool is_array_literal(const AssignmentParts& parts) {
    return !parts.subscript && parts.value.size() >= 2 && parts.value.front() == '(' &&
           parts.value.back() == ')';
}

bool is_declaration_builtin(const std::string& name) {
    return name == "declare" || name == "typeset" || name == "local" || name == "export";
}

class ScopeExit {
   public:
    explicit ScopeExit(std::function<void()> action) : action_(std::move(action)) {
    }
    ~ScopeExit() {
        if (action_) {
            action_();
        }
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

   private:
    std::function<void()> action_;
};

}  // namespace

Shell::Shell(const InterpreterLimits& limits) : limits(limits) {
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string entry(*env);
        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string name = entry.substr(0, eq_pos);
        if (!interpreter_utils::is_identifier(name)) {
            continue;
        }
        variables[name] = entry.substr(eq_pos + 1);
        exported.insert(name);
    }

    control_flow_parser = std::make_unique<ControlFlowParser>(this->limits);
    executor = std::make_unique<ControlFlowExecutor>(context, *control_flow_parser);
    function_manager = std::make_unique<FunctionManager>(context, *executor, this->limits);
    script_manager =
        std::make_unique<ScriptManager>(context, *executor, *function_manager, this->limits);
    expansion = std::make_unique<ExpansionEvaluator>(*this);
    shell_parser = std::make_unique<Parser>();
    built_ins = std::make_unique<Built_ins>();
    built_ins->set_shell(this);
    shell_exec = std::make_unique<Exec>(*this);

    wire_context();
    den_debug_msg("shell initialized with %zu variables", variables.size());
}

Shell::~Shell() = default;

void Shell::wire_context() {
    context.execute_command = [this](const std::string& command) {
        return execute_command(command);
    };
    context.expand = [this](const std::string& word) {
        try {
            return expansion->expand_word(word);
        } catch (const ExpansionError& e) {
            throw ScriptError(ScriptErrorCode::EXPANSION_FAILED, e.what());
        }
    };
    context.expand_words = [this](const std::string& word) {
        try {
            return expansion->expand_to_words(word);
        } catch (const ExpansionError& e) {
            throw ScriptError(ScriptErrorCode::EXPANSION_FAILED, e.what());
        }
    };
    context.get_variable = [this](const std::string& name) { return get_variable(name); };
    context.set_variable = [this](const std::string& name, const std::string& value) {
        set_variable(name, value);
    };
    context.find_variable = [this](const std::string& name) { return find_variable(name); };
    context.unset_variable = [this](const std::string& name) { unset_variable(name); };
    context.errexit_enabled = [this]() { return errexit; };
    context.stop_requested = [this]() { return stop_requested(); };
    context.poll_signal = [this]() { return poll_signal(); };
    context.define_function = [this](const std::vector<std::string>& lines, size_t idx) {
        return function_manager->try_define_function(lines, idx);
    };
    context.with_redirection = [this](const std::string& redirection,
                                      const std::function<control_flow::ExecOutcome()>& body) {
        return run_redirected_statement(redirection, body);
    };
    context.record_exit_code = [this](int code) { last_exit_code = code; };
    context.on_command_error = [this]() { run_trap("ERR"); };
    context.get_positional_parameters = [this]() { return get_positional_parameters(); };
    context.set_positional_parameters = [this](const std::vector<std::string>& params) {
        set_positional_parameters(params);
    };
    context.set_script_name = [this](const std::string& name) { script_name = name; };
}

int Shell::execute(const std::string& script, const std::string& name) {
    ScriptResult result = script_manager->execute_source(script, name);
    last_exit_code = exit_flag ? exit_code : result.exit_code;
    return last_exit_code;
}

ScriptResult Shell::execute_script_file(const std::string& path,
                                        const std::vector<std::string>& args) {
    ScriptResult result = script_manager->execute_script(path, args);
    if (exit_flag) {
        result.exit_code = exit_code;
    }
    last_exit_code = result.exit_code;
    return result;
}

int Shell::execute_command(const std::string& text) {
    std::string command = trim(text);
    if (command.empty()) {
        return 0;
    }

    int code = 0;
    try {
        code = dispatch_command(command);
    } catch (const ParseError& e) {
        print_error({ErrorType::SYNTAX_ERROR, "den", e.what(), {}});
        code = 2;
    } catch (const ExpansionError& e) {
        print_error({ErrorType::RUNTIME_ERROR, "den", e.what(), {}});
        code = 1;
    }
    last_exit_code = code;
    return code;
}

int Shell::dispatch_command(const std::string& command) {
    std::string first_line = command.substr(0, command.find('\n'));
    if (interpreter_utils::find_heredoc(first_line)) {
        return run_pipeline(command);
    }

    std::vector<std::string> lines = split_lines(command);
    if (interpreter_utils::classify_statement(first_line) != StatementKind::NONE ||
        function_manager->parser().is_function_definition(lines, 0)) {
        return script_manager->execute_source(command, script_name).exit_code;
    }

    std::vector<LogicalCommand> list = shell_parser->parse_logical_commands(command);
    int code = 0;
    bool run = true;
    for (const auto& element : list) {
        if (run) {
            code = run_list_element(element.command);
            last_exit_code = code;
        }
        if (stop_requested() || signal_pending()) {
            break;
        }
        if (element.op == "&&") {
            run = code == 0;
        } else if (element.op == "||") {
            run = code != 0;
        }
    }
    return code;
}

int Shell::run_list_element(const std::string& text) {
    std::string command = trim(text);
    bool negate = false;
    while (command.size() > 1 && command[0] == '!' && (command[1] == ' ' || command[1] == '\t')) {
        negate = !negate;
        command = trim(command.substr(1));
    }

    int code = 0;
    if (command.size() >= 4 && command.compare(0, 2, "((") == 0 &&
        command.compare(command.size() - 2, 2, "))") == 0) {
        long long value = expansion->evaluate_arithmetic(command.substr(2, command.size() - 4));
        code = value != 0 ? 0 : 1;
    } else {
        code = run_pipeline(command);
    }
    return negate ? (code == 0 ? 1 : 0) : code;
}

int Shell::run_pipeline(const std::string& text) {
    std::vector<Command> commands = shell_parser->parse_pipeline(text);
    if (commands.empty()) {
        return 0;
    }
    if (commands.size() == 1) {
        return run_simple_command(commands[0]);
    }

    std::vector<Command> expanded;
    expanded.reserve(commands.size());
    for (const auto& raw : commands) {
        expanded.push_back(expand_command(raw, 0));
    }
    return shell_exec->execute_pipeline(expanded);
}

Command Shell::expand_command(const Command& raw, size_t first_word) {
    Command cmd = raw;
    cmd.args.clear();

    if (first_word < raw.args.size()) {
        const std::string& name = raw.args[first_word];
        if (is_declaration_builtin(name)) {
            cmd.args.push_back(name);
            bool associative = false;
            for (size_t i = first_word + 1; i < raw.args.size(); ++i) {
                const std::string& word = raw.args[i];
                if (word.size() > 1 && word[0] == '-' && word.find('A') != std::string::npos &&
                    word.find('=') == std::string::npos) {
                    associative = true;
                }
                AssignmentParts parts;
                if (!split_assignment(word, parts)) {
                    for (auto& field : expansion->expand_to_words(word)) {
                        cmd.args.push_back(std::move(field));
                    }
                    continue;
                }
                if (is_array_literal(parts) && name != "local") {
                    if (associative) {
                        declare_assoc_array(parts.name);
                    }
                    apply_assignment(word);
                    cmd.args.push_back(parts.name);
                    continue;
                }
                std::string lhs = word.substr(0, word.find('=') + 1);
                cmd.args.push_back(lhs + expansion->expand_word(parts.value));
            }
        } else {
            std::vector<std::string> words(
                raw.args.begin() + static_cast<std::ptrdiff_t>(first_word), raw.args.end());
            cmd.args = expansion->expand_arguments(words);
        }
    }

    auto expand_target = [this](std::string& target) {
        if (!target.empty()) {
            target = expansion->expand_word(target);
        }
    };
    expand_target(cmd.input_file);
    expand_target(cmd.output_file);
    expand_target(cmd.append_file);
    expand_target(cmd.stderr_file);
    expand_target(cmd.both_output_file);

    if (raw.here_doc) {
        std::string body;
        if (raw.here_string) {
            body = expansion->expand_word(*raw.here_doc);
        } else if (raw.here_doc_expand) {
            body = expansion->expand_here_doc(*raw.here_doc);
        } else {
            body = *raw.here_doc;
        }
        if (raw.here_string || !body.empty()) {
            body += '\n';
        }
        cmd.here_doc = body;
    }
    return cmd;
}

bool Shell::is_assignment_word(const std::string& word) {
    AssignmentParts parts;
    return split_assignment(word, parts);
}

int Shell::run_simple_command(const Command& raw) {
    size_t first_word = 0;
    while (first_word < raw.args.size() && is_assignment_word(raw.args[first_word])) {
        ++first_word;
    }

    expansion->reset_substitution_status();
    Command cmd = expand_command(raw, first_word);

    if (cmd.args.empty()) {
        for (size_t i = 0; i < first_word; ++i) {
            apply_assignment(raw.args[i]);
        }
        // A bare assignment takes the status of its last command substitution.
        int status = expansion->substitution_status().value_or(0);
        if (cmd.has_redirections()) {
            RedirectionScope scope(*shell_exec, cmd);
            return scope.ok() ? status : 1;
        }
        return status;
    }

    // Prefix assignments only last for the one command.
    std::vector<SavedAssignment> saved;
    for (size_t i = 0; i < first_word; ++i) {
        AssignmentParts parts;
        split_assignment(raw.args[i], parts);
        saved.push_back({parts.name, find_variable(parts.name), is_exported(parts.name)});
        apply_assignment(raw.args[i]);
        export_variable(parts.name);
    }
    ScopeExit restore([this, &saved]() { restore_assignments(saved); });

    const std::string& name = cmd.args[0];
    if (is_internal_command(name)) {
        RedirectionScope scope(*shell_exec, cmd);
        if (!scope.ok()) {
            return 1;
        }
        return run_internal_command(cmd.args);
    }
    return shell_exec->execute_command_sync(cmd);
}

control_flow::ExecOutcome Shell::run_redirected_statement(
    const std::string& redirection, const std::function<control_flow::ExecOutcome()>& body) {
    control_flow::ExecOutcome failed;
    failed.exit_code = 1;

    Command cmd;
    try {
        Command raw = shell_parser->parse_command(redirection);
        if (!raw.args.empty()) {
            print_error({ErrorType::SYNTAX_ERROR, "den",
                         "unexpected word after redirection: " + raw.args[0], {}});
            failed.exit_code = 2;
            return failed;
        }
        cmd = expand_command(raw, 0);
    } catch (const ParseError& e) {
        print_error({ErrorType::SYNTAX_ERROR, "den", e.what(), {}});
        failed.exit_code = 2;
        return failed;
    } catch (const ExpansionError& e) {
        print_error({ErrorType::RUNTIME_ERROR, "den", e.what(), {}});
        return failed;
    }

    RedirectionScope scope(*shell_exec, cmd);
    if (!scope.ok()) {
        return failed;
    }
    return body();
}

void Shell::restore_assignments(std::vector<SavedAssignment>& saved) {
    for (auto it = saved.rbegin(); it != saved.rend(); ++it) {
        if (it->value) {
            set_variable(it->name, *it->value);
        } else {
            unset_variable(it->name);
        }
        if (!it->was_exported && exported.erase(it->name) > 0) {
            unsetenv(it->name.c_str());
        }
    }
    saved.clear();
}

bool Shell::apply_assignment(const std::string& word) {
    AssignmentParts parts;
    if (!split_assignment(word, parts)) {
        return false;
    }

    if (is_array_literal(parts)) {
        std::string inner = parts.value.substr(1, parts.value.size() - 2);
        bool associative = assoc_arrays.count(parts.name) > 0;
        std::vector<std::string> values;
        if (parts.append) {
            if (const auto* existing = find_array(parts.name)) {
                values = *existing;
            }
        } else if (associative) {
            assoc_arrays[parts.name].clear();
        }

        for (const auto& element : interpreter_utils::split_words(inner)) {
            AssignmentParts keyed;
            bool has_key = element.size() > 2 && element[0] == '[' &&
                           element.find("]=") != std::string::npos;
            if (has_key) {
                size_t close = element.find("]=");
                keyed.subscript = element.substr(1, close - 1);
                keyed.value = element.substr(close + 2);
            }
            if (associative) {
                if (!has_key) {
                    throw ExpansionError(parts.name + ": must use subscript when assigning "
                                                      "associative array");
                }
                set_assoc_element(parts.name, expansion->expand_word(*keyed.subscript),
                                  expansion->expand_word(keyed.value));
                continue;
            }
            if (has_key) {
                long long index = expansion->evaluate_arithmetic(*keyed.subscript);
                if (index < 0) {
                    throw ExpansionError(parts.name + "[" + *keyed.subscript +
                                         "]: bad array subscript");
                }
                if (static_cast<size_t>(index) >= values.size()) {
                    values.resize(static_cast<size_t>(index) + 1);
                }
                values[static_cast<size_t>(index)] = expansion->expand_word(keyed.value);
                continue;
            }
            for (auto& field : expansion->expand_to_words(element)) {
                values.push_back(std::move(field));
            }
        }
        if (!associative) {
            set_array(parts.name, std::move(values));
        }
        return true;
    }

    std::string value = expansion->expand_word(parts.value);
    if (parts.subscript) {
        if (assoc_arrays.count(parts.name) > 0) {
            std::string key = expansion->expand_word(*parts.subscript);
            if (parts.append) {
                const auto& entries = assoc_arrays[parts.name];
                auto it = entries.find(key);
                if (it != entries.end()) {
                    value = it->second + value;
                }
            }
            set_assoc_element(parts.name, key, value);
            return true;
        }
        long long index = expansion->evaluate_arithmetic(*parts.subscript);
        const auto* existing = find_array(parts.name);
        if (index < 0 && existing != nullptr) {
            index += static_cast<long long>(existing->size());
        }
        if (index < 0) {
            throw ExpansionError(parts.name + "[" + *parts.subscript + "]: bad array subscript");
        }
        if (parts.append && existing != nullptr &&
            static_cast<size_t>(index) < existing->size()) {
            value = (*existing)[static_cast<size_t>(index)] + value;
        }
        set_array_element(parts.name, static_cast<size_t>(index), value);
        return true;
    }

    if (parts.append) {
        value = get_variable(parts.name) + value;
    }
    set_variable(parts.name, value);
    return true;
}

bool Shell::is_internal_command(const std::string& name) const {
    return built_ins->is_builtin_command(name) || function_manager->has_function(name);
}

int Shell::run_internal_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        return 0;
    }
    if (built_ins->is_builtin_command(args[0])) {
        return built_ins->builtin_command(args);
    }
    std::vector<std::string> call_args(args.begin() + 1, args.end());
    return function_manager->execute_function(args[0], call_args);
}

std::optional<std::string> Shell::find_variable(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    if (is_digits(name)) {
        size_t index = std::stoul(name);
        if (index == 0) {
            return script_name;
        }
        std::vector<std::string> params = get_positional_parameters();
        if (index > params.size()) {
            return std::nullopt;
        }
        return params[index - 1];
    }
    if (name == "?") {
        return std::to_string(last_exit_code);
    }
    if (name == "#") {
        return std::to_string(get_positional_parameter_count());
    }
    if (name == "$") {
        return std::to_string(getpid());
    }

    if (auto local = function_manager->get_local(name)) {
        return local;
    }
    auto it = variables.find(name);
    if (it != variables.end()) {
        return it->second;
    }
    auto array_it = arrays.find(name);
    if (array_it != arrays.end() && !array_it->second.empty()) {
        return array_it->second.front();
    }
    auto assoc_it = assoc_arrays.find(name);
    if (assoc_it != assoc_arrays.end()) {
        auto entry = assoc_it->second.find("0");
        if (entry != assoc_it->second.end()) {
            return entry->second;
        }
    }
    return std::nullopt;
}

std::string Shell::get_variable(const std::string& name) const {
    return find_variable(name).value_or("");
}

void Shell::set_variable(const std::string& name, const std::string& value) {
    if (function_manager->has_local(name)) {
        function_manager->set_local(name, value);
        return;
    }
    auto array_it = arrays.find(name);
    if (array_it != arrays.end()) {
        if (array_it->second.empty()) {
            array_it->second.push_back(value);
        } else {
            array_it->second.front() = value;
        }
        return;
    }
    variables[name] = value;
    if (exported.count(name) > 0) {
        setenv(name.c_str(), value.c_str(), 1);
    }
}

void Shell::unset_variable(const std::string& name) {
    if (function_manager->unset_local(name)) {
        return;
    }
    variables.erase(name);
    arrays.erase(name);
    assoc_arrays.erase(name);
    if (exported.erase(name) > 0) {
        unsetenv(name.c_str());
    }
}

void Shell::export_variable(const std::string& name) {
    exported.insert(name);
    auto it = variables.find(name);
    if (it != variables.end()) {
        setenv(name.c_str(), it->second.c_str(), 1);
    } else if (auto local = function_manager->get_local(name)) {
        setenv(name.c_str(), local->c_str(), 1);
    }
}

bool Shell::is_exported(const std::string& name) const {
    return exported.count(name) > 0;
}

std::vector<std::pair<std::string, std::string>> Shell::list_variables() const {
    std::vector<std::pair<std::string, std::string>> result(variables.begin(), variables.end());
    std::sort(result.begin(), result.end());
    return result;
}

const std::vector<std::string>* Shell::find_array(const std::string& name) const {
    auto it = arrays.find(name);
    return it == arrays.end() ? nullptr : &it->second;
}

void Shell::set_array(const std::string& name, std::vector<std::string> values) {
    variables.erase(name);
    assoc_arrays.erase(name);
    arrays[name] = std::move(values);
}

void Shell::set_array_element(const std::string& name, size_t index, const std::string& value) {
    if (index >= kMaxArrayIndex) {
        throw ExpansionError(name + "[" + std::to_string(index) + "]: array index out of range");
    }
    auto it = arrays.find(name);
    if (it == arrays.end()) {
        std::vector<std::string> values;
        auto scalar = variables.find(name);
        if (scalar != variables.end()) {
            values.push_back(scalar->second);
            variables.erase(scalar);
        }
        it = arrays.emplace(name, std::move(values)).first;
    }
    if (index >= it->second.size()) {
        it->second.resize(index + 1);
    }
    it->second[index] = value;
}

bool Shell::unset_array_element(const std::string& name, const std::string& key) {
    auto assoc_it = assoc_arrays.find(name);
    if (assoc_it != assoc_arrays.end()) {
        return assoc_it->second.erase(expansion->expand_word(key)) > 0;
    }
    auto it = arrays.find(name);
    if (it == arrays.end()) {
        return false;
    }
    long long index = expansion->evaluate_arithmetic(key);
    if (index < 0) {
        index += static_cast<long long>(it->second.size());
    }
    if (index < 0 || static_cast<size_t>(index) >= it->second.size()) {
        return false;
    }
    it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

const std::map<std::string, std::string>* Shell::find_assoc_array(const std::string& name) const {
    auto it = assoc_arrays.find(name);
    return it == assoc_arrays.end() ? nullptr : &it->second;
}

void Shell::declare_assoc_array(const std::string& name) {
    if (assoc_arrays.count(name) > 0) {
        return;
    }
    variables.erase(name);
    arrays.erase(name);
    assoc_arrays[name];
}

void Shell::set_assoc_element(const std::string& name, const std::string& key,
                              const std::string& value) {
    assoc_arrays[name][key] = value;
}

std::vector<std::string> Shell::get_positional_parameters() const {
    if (const auto* frame = function_manager->current_frame()) {
        return frame->positional_params;
    }
    return positional_parameters;
}

void Shell::set_positional_parameters(const std::vector<std::string>& params) {
    if (auto* frame = function_manager->current_frame()) {
        frame->positional_params = params;
        return;
    }
    positional_parameters = params;
}

int Shell::shift_positional_parameters(int count) {
    if (count < 0) {
        return 1;
    }
    size_t amount = static_cast<size_t>(count);
    if (amount > get_positional_parameter_count()) {
        print_error({ErrorType::INVALID_ARGUMENT, "shift", "shift count out of range", {}});
        return 1;
    }
    if (function_manager->in_function()) {
        function_manager->shift_positional_params(amount);
        return 0;
    }
    positional_parameters.erase(
        positional_parameters.begin(),
        positional_parameters.begin() + static_cast<std::ptrdiff_t>(amount));
    return 0;
}

size_t Shell::get_positional_parameter_count() const {
    if (function_manager->in_function()) {
        return function_manager->positional_count();
    }
    return positional_parameters.size();
}

void Shell::set_trap(const std::string& condition, const std::string& command) {
    traps[condition] = command;
}

void Shell::remove_trap(const std::string& condition) {
    traps.erase(condition);
}

std::optional<std::string> Shell::get_trap(const std::string& condition) const {
    auto it = traps.find(condition);
    if (it == traps.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, std::string>> Shell::list_traps() const {
    return {traps.begin(), traps.end()};
}

void Shell::run_trap(const std::string& condition) {
    if (in_trap) {
        return;
    }
    auto it = traps.find(condition);
    if (it == traps.end() || it->second.empty()) {
        return;
    }

    std::string command = it->second;
    if (condition == "EXIT") {
        traps.erase(it);
    }

    // An exit already in progress must not stop the trap body; an exit inside it wins.
    in_trap = true;
    int saved_status = last_exit_code;
    bool saved_exit_flag = exit_flag;
    int saved_exit_code = exit_code;
    exit_flag = false;
    ScopeExit reset([this, saved_status, saved_exit_flag, saved_exit_code]() {
        in_trap = false;
        last_exit_code = saved_status;
        if (!exit_flag) {
            exit_flag = saved_exit_flag;
            exit_code = saved_exit_code;
        }
    });
    den_debug_msg("running %s trap", condition.c_str());
    script_manager->execute_source(command, "trap");
}

void Shell::set_noexec(bool enabled) {
    script_manager->set_noexec(enabled);
}

bool Shell::is_noexec_enabled() const {
    return script_manager->noexec();
}

void Shell::request_exit(int code) {
    exit_flag = true;
    exit_code = code;
}

bool Shell::stop_requested() const {
    return exit_flag || SignalHandler::interrupt_pending();
}

bool Shell::signal_pending() const {
    if (!pending_loop_signal.is_none()) {
        return true;
    }
    const auto* frame = function_manager->current_frame();
    if (frame != nullptr && frame->return_requested) {
        return true;
    }
    return script_manager->pending_return().has_value();
}

ControlSignal Shell::poll_signal() {
    const auto* frame = function_manager->current_frame();
    if (frame != nullptr && frame->return_requested) {
        return ControlSignal::return_code(frame->return_code);
    }
    if (auto code = script_manager->pending_return()) {
        return ControlSignal::return_code(*code);
    }
    ControlSignal signal = pending_loop_signal;
    pending_loop_signal = ControlSignal::none();
    return signal;
}
