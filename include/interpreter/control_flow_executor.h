#pragma once

#include <cstddef>
#include <string>

#include "control_flow.h"
#include "control_flow_parser.h"
#include "execution_context.h"
#include "pattern_matcher.h"

// Runs parsed control-flow nodes against the host's ExecutionContext. Every entry point reports
// the exit code together with any break/continue/return signal still travelling outwards.
class ControlFlowExecutor {
   public:
    ControlFlowExecutor(ExecutionContext& context, const ControlFlowParser& parser);

    ControlFlowExecutor(const ControlFlowExecutor&) = delete;
    ControlFlowExecutor& operator=(const ControlFlowExecutor&) = delete;

    bool evaluate_condition(const std::string& command);

    control_flow::ExecOutcome execute_if(const control_flow::IfStatement& statement);
    control_flow::ExecOutcome execute_while(const control_flow::WhileLoop& loop);
    control_flow::ExecOutcome execute_for(const control_flow::ForLoop& loop);
    control_flow::ExecOutcome execute_c_style_for(const control_flow::CStyleForLoop& loop);
    control_flow::ExecOutcome execute_select(const control_flow::SelectMenu& menu);
    control_flow::ExecOutcome execute_case(const control_flow::CaseStatement& statement);

    control_flow::ExecOutcome execute_body(const control_flow::Lines& lines);

    // Parses and runs the compound statement starting at `idx`, leaving `idx` on its last line.
    control_flow::ExecOutcome execute_statement(const control_flow::Lines& lines, std::size_t& idx);

    int loop_depth() const {
        return loop_depth_;
    }

    const ControlFlowParser& parser() const {
        return parser_;
    }

   private:
    enum class LoopAction : std::uint8_t {
        Proceed,
        Stop
    };

    LoopAction handle_loop_signal(control_flow::ControlSignal& signal,
                                  control_flow::ControlSignal& propagate);
    template <typename Node, typename Run>
    control_flow::ExecOutcome run_redirected(const Node& node, Run run);
    int run_command(const std::string& command);
    bool errexit_enabled() const;
    bool stop_requested() const;
    void print_menu(const std::vector<std::string>& items) const;
    std::vector<std::string> expand_items(const std::vector<std::string>& items) const;

    ExecutionContext& context_;
    const ControlFlowParser& parser_;
    PatternMatcher pattern_matcher_;
    int loop_depth_ = 0;
};
