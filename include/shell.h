#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "control_flow.h"
#include "execution_context.h"
#include "interpreter_limits.h"

class Built_ins;
class ControlFlowExecutor;
class ControlFlowParser;
class Exec;
class ExpansionEvaluator;
class FunctionManager;
class Parser;
class ScriptManager;
struct Command;
struct ScriptResult;

class Shell {
   public:
    explicit Shell(const InterpreterLimits& limits = InterpreterLimits{});
    ~Shell();

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    // Runs script text through the script manager.
    int execute(const std::string& script, const std::string& name = "den");
    ScriptResult execute_script_file(const std::string& path,
                                     const std::vector<std::string>& args);

    // Runs one command unit: lists, pipelines, assignments, builtins, functions and external
    // programs.
    int execute_command(const std::string& text);

    bool is_internal_command(const std::string& name) const;
    int run_internal_command(const std::vector<std::string>& args);

    std::string get_variable(const std::string& name) const;
    std::optional<std::string> find_variable(const std::string& name) const;
    void set_variable(const std::string& name, const std::string& value);
    void unset_variable(const std::string& name);
    void export_variable(const std::string& name);
    bool is_exported(const std::string& name) const;
    // Global scalar variables sorted by name.
    std::vector<std::pair<std::string, std::string>> list_variables() const;

    const std::vector<std::string>* find_array(const std::string& name) const;
    void set_array(const std::string& name, std::vector<std::string> values);
    void set_array_element(const std::string& name, std::size_t index, const std::string& value);
    bool unset_array_element(const std::string& name, const std::string& key);

    const std::map<std::string, std::string>* find_assoc_array(const std::string& name) const;
    void declare_assoc_array(const std::string& name);
    void set_assoc_element(const std::string& name, const std::string& key,
                           const std::string& value);

    std::vector<std::string> get_positional_parameters() const;
    void set_positional_parameters(const std::vector<std::string>& params);
    int shift_positional_parameters(int count = 1);
    std::size_t get_positional_parameter_count() const;

    const std::string& get_script_name() const {
        return script_name;
    }
    void set_script_name(const std::string& name) {
        script_name = name;
    }

    int get_last_exit_code() const {
        return last_exit_code;
    }
    void set_last_exit_code(int code) {
        last_exit_code = code;
    }

    void set_trap(const std::string& condition, const std::string& command);
    void remove_trap(const std::string& condition);
    std::optional<std::string> get_trap(const std::string& condition) const;
    std::vector<std::pair<std::string, std::string>> list_traps() const;
    void run_trap(const std::string& condition);

    void set_errexit(bool enabled) {
        errexit = enabled;
    }
    bool is_errexit_enabled() const {
        return errexit;
    }
    void set_noexec(bool enabled);
    bool is_noexec_enabled() const;

    void request_exit(int code);
    bool exit_requested() const {
        return exit_flag;
    }
    int get_exit_code() const {
        return exit_code;
    }
    bool stop_requested() const;

    // Set by the break/continue builtins when they run as ordinary commands.
    void request_loop_signal(const control_flow::ControlSignal& signal) {
        pending_loop_signal = signal;
    }
    control_flow::ControlSignal poll_signal();

    const InterpreterLimits& get_limits() const {
        return limits;
    }
    ExecutionContext& get_context() {
        return context;
    }
    FunctionManager& get_function_manager() {
        return *function_manager;
    }
    ScriptManager& get_script_manager() {
        return *script_manager;
    }
    ControlFlowExecutor& get_executor() {
        return *executor;
    }
    ExpansionEvaluator& get_expansion() {
        return *expansion;
    }
    Built_ins* get_built_ins() {
        return built_ins.get();
    }
    Parser* get_parser() {
        return shell_parser.get();
    }

    std::unique_ptr<Exec> shell_exec;

   private:
    struct SavedAssignment {
        std::string name;
        std::optional<std::string> value;
        bool was_exported = false;
    };

    int dispatch_command(const std::string& command);
    int run_list_element(const std::string& text);
    int run_pipeline(const std::string& text);
    int run_simple_command(const Command& raw);
    control_flow::ExecOutcome run_redirected_statement(
        const std::string& redirection, const std::function<control_flow::ExecOutcome()>& body);
    // Expands the words from `first_word` on, the redirection targets and the heredoc body.
    Command expand_command(const Command& raw, std::size_t first_word);
    static bool is_assignment_word(const std::string& word);
    bool apply_assignment(const std::string& word);
    void restore_assignments(std::vector<SavedAssignment>& saved);
    bool signal_pending() const;
    void wire_context();

    InterpreterLimits limits;
    ExecutionContext context;
    std::unique_ptr<ControlFlowParser> control_flow_parser;
    std::unique_ptr<ControlFlowExecutor> executor;
    std::unique_ptr<FunctionManager> function_manager;
    std::unique_ptr<ScriptManager> script_manager;
    std::unique_ptr<ExpansionEvaluator> expansion;
    std::unique_ptr<Parser> shell_parser;
    std::unique_ptr<Built_ins> built_ins;

    std::unordered_map<std::string, std::string> variables;
    std::unordered_set<std::string> exported;
    std::unordered_map<std::string, std::vector<std::string>> arrays;
    std::unordered_map<std::string, std::map<std::string, std::string>> assoc_arrays;
    std::vector<std::string> positional_parameters;
    std::string script_name = "den";
    int last_exit_code = 0;

    std::map<std::string, std::string> traps;
    bool in_trap = false;

    bool errexit = false;
    bool exit_flag = false;
    int exit_code = 0;
    control_flow::ControlSignal pending_loop_signal;
};
