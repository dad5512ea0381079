#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "control_flow.h"
#include "control_flow_executor.h"
#include "execution_context.h"
#include "function_evaluator.h"
#include "function_parser.h"
#include "interpreter_limits.h"

// Owns the function table and the bounded call stack. Function bodies run through the same
// ControlFlowExecutor as top-level script text.
class FunctionManager {
   public:
    FunctionManager(ExecutionContext& context, ControlFlowExecutor& executor,
                    const InterpreterLimits& limits);

    FunctionManager(const FunctionManager&) = delete;
    FunctionManager& operator=(const FunctionManager&) = delete;

    void define_function(function_evaluator::Function function);
    bool remove_function(const std::string& name);
    bool has_function(const std::string& name) const;
    const function_evaluator::Function* get_function(const std::string& name) const;
    std::vector<std::string> list_functions() const;
    bool mark_exported(const std::string& name);

    // Registers the definition starting at `idx` and returns the index of its last line, or
    // nothing when the line does not start a definition.
    std::optional<std::size_t> try_define_function(const control_flow::Lines& lines,
                                                   std::size_t idx);

    int execute_function(const std::string& name, const std::vector<std::string>& args);

    function_evaluator::CallFrame* current_frame();
    const function_evaluator::CallFrame* current_frame() const;
    std::size_t call_depth() const {
        return call_stack_.size();
    }
    bool in_function() const {
        return !call_stack_.empty();
    }

    void set_local(const std::string& name, const std::string& value);
    std::optional<std::string> get_local(const std::string& name) const;
    bool has_local(const std::string& name) const;
    bool unset_local(const std::string& name);

    std::optional<std::string> get_positional_param(std::size_t index) const;
    std::size_t positional_count() const;
    void shift_positional_params(std::size_t count);

    void request_return(int code);

    void set_max_call_depth(std::size_t depth);

    const FunctionParser& parser() const {
        return parser_;
    }

   private:
    class FrameGuard;

    void push_frame(const std::string& name, const std::vector<std::string>& args);
    void pop_frame() noexcept;
    void bind_typed_args(const std::vector<function_evaluator::TypedParam>& params,
                         const std::vector<std::string>& args);

    ExecutionContext& context_;
    ControlFlowExecutor& executor_;
    InterpreterLimits limits_;
    FunctionParser parser_;
    std::unordered_map<std::string, function_evaluator::Function> functions_;
    std::vector<function_evaluator::CallFrame> call_stack_;
};
