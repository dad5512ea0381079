#include "control_flow_executor.h"

#include <cctype>
#include <iostream>

#include "error_out.h"
#include "interpreter_utils.h"
#include "script_error.h"
#include "utils/debug.h"

using namespace control_flow;
using interpreter_utils::StatementKind;
using interpreter_utils::trim;

namespace {

class LoopScope {
   public:
    explicit LoopScope(int& depth) : depth_(depth) {
        ++depth_;
    }
    ~LoopScope() {
        --depth_;
    }

    LoopScope(const LoopScope&) = delete;
    LoopScope& operator=(const LoopScope&) = delete;

   private:
    int& depth_;
};

bool splits_into_words(const std::string& item) {
    return interpreter_utils::references_array_expansion(item) ||
           item.find("$@") != std::string::npos || item.find("$*") != std::string::npos;
}

bool parse_menu_choice(const std::string& reply, size_t item_count, size_t& choice) {
    if (reply.empty() || reply.size() > 9) {
        return false;
    }
    for (char c : reply) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    size_t value = std::stoul(reply);
    if (value < 1 || value > item_count) {
        return false;
    }
    choice = value;
    return true;
}

}  // namespace

ControlFlowExecutor::ControlFlowExecutor(ExecutionContext& context,
                                         const ControlFlowParser& parser)
    : context_(context), parser_(parser) {
}

bool ControlFlowExecutor::errexit_enabled() const {
    return context_.errexit_enabled && context_.errexit_enabled();
}

bool ControlFlowExecutor::stop_requested() const {
    return context_.stop_requested && context_.stop_requested();
}

int ControlFlowExecutor::run_command(const std::string& command) {
    try {
        return context_.execute_command(command);
    } catch (const CommandExecutionError& e) {
        print_error({ErrorType::RUNTIME_ERROR, "den",
                     std::string("error in control flow body: ") + e.what(), {}});
        return 1;
    }
}

bool ControlFlowExecutor::evaluate_condition(const std::string& command) {
    try {
        return context_.execute_command(command) == 0;
    } catch (const CommandExecutionError& e) {
        den_debug_msg("condition '%s' could not run: %s", command.c_str(), e.what());
        return false;
    }
}

ControlFlowExecutor::LoopAction ControlFlowExecutor::handle_loop_signal(ControlSignal& signal,
                                                                        ControlSignal& propagate) {
    switch (signal.kind) {
        case SignalKind::Break:
            if (signal.levels > 1) {
                propagate = ControlSignal::break_levels(signal.levels - 1);
                den_debug_msg("break: %d more level(s) to unwind", propagate.levels);
            }
            return LoopAction::Stop;
        case SignalKind::Continue:
            if (signal.levels > 1) {
                propagate = ControlSignal::continue_levels(signal.levels - 1);
                den_debug_msg("continue: %d more level(s) to unwind", propagate.levels);
                return LoopAction::Stop;
            }
            return LoopAction::Proceed;
        case SignalKind::Return:
            propagate = signal;
            return LoopAction::Stop;
        case SignalKind::None:
        default:
            return LoopAction::Proceed;
    }
}

std::vector<std::string> ControlFlowExecutor::expand_items(
    const std::vector<std::string>& items) const {
    std::vector<std::string> expanded;
    for (const auto& item : items) {
        if (context_.expand_words) {
            for (auto& word : context_.expand_words(item)) {
                expanded.push_back(std::move(word));
            }
            continue;
        }
        if (!context_.expand) {
            expanded.push_back(item);
            continue;
        }
        if (splits_into_words(item)) {
            for (auto& word : interpreter_utils::split_whitespace(context_.expand(item))) {
                expanded.push_back(std::move(word));
            }
            continue;
        }
        expanded.push_back(context_.expand(item));
    }
    return expanded;
}

ExecOutcome ControlFlowExecutor::execute_if(const IfStatement& statement) {
    if (evaluate_condition(statement.condition)) {
        return execute_body(statement.then_body);
    }
    for (const auto& clause : statement.elif_clauses) {
        if (evaluate_condition(clause.condition)) {
            return execute_body(clause.body);
        }
    }
    if (statement.else_body) {
        return execute_body(*statement.else_body);
    }
    return {};
}

ExecOutcome ControlFlowExecutor::execute_while(const WhileLoop& loop) {
    LoopScope scope(loop_depth_);
    ExecOutcome result;

    while (true) {
        if (stop_requested()) {
            result.exit_code = 130;
            return result;
        }
        bool holds = evaluate_condition(loop.condition);
        if (loop.is_until ? holds : !holds) {
            break;
        }

        ExecOutcome body = execute_body(loop.body);
        result.exit_code = body.exit_code;
        if (handle_loop_signal(body.signal, result.signal) == LoopAction::Stop) {
            return result;
        }
        if (errexit_enabled() && result.exit_code != 0) {
            return result;
        }
    }
    return result;
}

ExecOutcome ControlFlowExecutor::execute_for(const ForLoop& loop) {
    std::vector<std::string> items = expand_items(loop.items);
    LoopScope scope(loop_depth_);
    ExecOutcome result;

    for (const auto& item : items) {
        if (stop_requested()) {
            result.exit_code = 130;
            return result;
        }
        if (context_.set_variable) {
            context_.set_variable(loop.variable, item);
        }

        ExecOutcome body = execute_body(loop.body);
        result.exit_code = body.exit_code;
        if (handle_loop_signal(body.signal, result.signal) == LoopAction::Stop) {
            return result;
        }
        if (errexit_enabled() && result.exit_code != 0) {
            return result;
        }
    }
    return result;
}

ExecOutcome ControlFlowExecutor::execute_c_style_for(const CStyleForLoop& loop) {
    LoopScope scope(loop_depth_);
    ExecOutcome result;

    if (loop.init) {
        run_command("((" + *loop.init + "))");
    }

    while (true) {
        if (stop_requested()) {
            result.exit_code = 130;
            return result;
        }
        if (loop.condition && !evaluate_condition("((" + *loop.condition + "))")) {
            break;
        }

        ExecOutcome body = execute_body(loop.body);
        result.exit_code = body.exit_code;
        // A plain continue still runs the update clause; break and deeper signals skip it.
        if (handle_loop_signal(body.signal, result.signal) == LoopAction::Stop) {
            return result;
        }
        if (errexit_enabled() && result.exit_code != 0) {
            return result;
        }

        if (loop.update) {
            run_command("((" + *loop.update + "))");
        }
    }
    return result;
}

void ControlFlowExecutor::print_menu(const std::vector<std::string>& items) const {
    std::ostream& out = context_.output != nullptr ? *context_.output : std::cerr;
    for (size_t i = 0; i < items.size(); ++i) {
        out << (i + 1) << ") " << items[i] << '\n';
    }
    out.flush();
}

ExecOutcome ControlFlowExecutor::execute_select(const SelectMenu& menu) {
    std::vector<std::string> items = expand_items(menu.items);
    std::istream& in = context_.input != nullptr ? *context_.input : std::cin;
    std::ostream& out = context_.output != nullptr ? *context_.output : std::cerr;

    LoopScope scope(loop_depth_);
    ExecOutcome result;
    print_menu(items);

    while (true) {
        if (stop_requested()) {
            result.exit_code = 130;
            return result;
        }

        std::string prompt = context_.get_variable ? context_.get_variable("PS3") : "";
        out << (prompt.empty() ? menu.prompt : prompt) << std::flush;

        std::string reply;
        if (!std::getline(in, reply)) {
            out << '\n' << std::flush;
            break;
        }
        reply = trim(reply);
        if (reply.empty()) {
            print_menu(items);
            continue;
        }

        size_t choice = 0;
        if (!parse_menu_choice(reply, items.size(), choice)) {
            out << "invalid selection: " << reply << '\n' << std::flush;
            continue;
        }

        if (context_.set_variable) {
            context_.set_variable(menu.variable, items[choice - 1]);
            context_.set_variable("REPLY", reply);
        }

        ExecOutcome body = execute_body(menu.body);
        result.exit_code = body.exit_code;
        if (handle_loop_signal(body.signal, result.signal) == LoopAction::Stop) {
            return result;
        }
        if (errexit_enabled() && result.exit_code != 0) {
            return result;
        }
    }
    return result;
}

ExecOutcome ControlFlowExecutor::execute_case(const CaseStatement& statement) {
    std::string value = context_.expand ? context_.expand(statement.value) : statement.value;
    ExecOutcome result;
    bool fall_through = false;

    for (const auto& clause : statement.cases) {
        bool run = fall_through;
        for (size_t p = 0; !run && p < clause.patterns.size(); ++p) {
            const std::string& pattern = clause.patterns[p];
            bool needs_expansion = context_.expand && (pattern.find('$') != std::string::npos ||
                                                       pattern.find('`') != std::string::npos);
            run = pattern_matcher_.matches_pattern(
                value, needs_expansion ? context_.expand(pattern) : pattern);
        }
        if (!run) {
            continue;
        }

        ExecOutcome body = execute_body(clause.body);
        result.exit_code = body.exit_code;
        if (!body.signal.is_none()) {
            result.signal = body.signal;
            return result;
        }
        if (errexit_enabled() && result.exit_code != 0) {
            return result;
        }

        switch (clause.terminator) {
            case CaseTerminator::NORMAL:
                return result;
            case CaseTerminator::FALLTHROUGH:
                fall_through = true;
                break;
            case CaseTerminator::CONTINUE_TESTING:
            default:
                fall_through = false;
                break;
        }
    }
    return result;
}

template <typename Node, typename Run>
ExecOutcome ControlFlowExecutor::run_redirected(const Node& node, Run run) {
    if (node.redirection.empty()) {
        return run();
    }
    if (!context_.with_redirection) {
        print_error({ErrorType::RUNTIME_ERROR, "den",
                     "cannot redirect compound statement: " + node.redirection, {}});
        ExecOutcome failed;
        failed.exit_code = 1;
        return failed;
    }
    den_debug_msg("running compound statement with redirection '%s'",
                  node.redirection.c_str());
    return context_.with_redirection(node.redirection, std::function<ExecOutcome()>(run));
}

ExecOutcome ControlFlowExecutor::execute_statement(const Lines& lines, size_t& idx) {
    switch (interpreter_utils::classify_statement(lines[idx])) {
        case StatementKind::IF: {
            auto parsed = parser_.parse_if(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_if(parsed.node); });
        }
        case StatementKind::WHILE:
        case StatementKind::UNTIL: {
            auto parsed = parser_.parse_while(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_while(parsed.node); });
        }
        case StatementKind::FOR: {
            auto parsed = parser_.parse_for(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_for(parsed.node); });
        }
        case StatementKind::C_STYLE_FOR: {
            auto parsed = parser_.parse_c_style_for(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_c_style_for(parsed.node); });
        }
        case StatementKind::SELECT: {
            auto parsed = parser_.parse_select(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_select(parsed.node); });
        }
        case StatementKind::CASE: {
            auto parsed = parser_.parse_case(lines, idx);
            idx = parsed.end_index;
            return run_redirected(parsed.node, [&]() { return execute_case(parsed.node); });
        }
        case StatementKind::NONE:
        default: {
            ExecOutcome outcome;
            outcome.exit_code = run_command(lines[idx]);
            return outcome;
        }
    }
}

ExecOutcome ControlFlowExecutor::execute_body(const Lines& lines) {
    ExecOutcome outcome;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (stop_requested()) {
            outcome.exit_code = 130;
            return outcome;
        }

        if (auto levels = interpreter_utils::parse_loop_control(line, "break")) {
            if (loop_depth_ > 0) {
                outcome.exit_code = 0;
                outcome.signal = ControlSignal::break_levels(*levels);
                return outcome;
            }
        }
        if (auto levels = interpreter_utils::parse_loop_control(line, "continue")) {
            if (loop_depth_ > 0) {
                outcome.exit_code = 0;
                outcome.signal = ControlSignal::continue_levels(*levels);
                return outcome;
            }
        }

        if (interpreter_utils::classify_statement(line) != StatementKind::NONE) {
            ExecOutcome nested = execute_statement(lines, i);
            outcome.exit_code = nested.exit_code;
            if (context_.record_exit_code) {
                context_.record_exit_code(nested.exit_code);
            }
            if (!nested.signal.is_none()) {
                outcome.signal = nested.signal;
                return outcome;
            }
        } else if (auto end = context_.define_function ? context_.define_function(lines, i)
                                                       : std::optional<size_t>{}) {
            i = *end;
            outcome.exit_code = 0;
            continue;
        } else {
            std::string unit;
            i = interpreter_utils::collect_heredoc(lines, i, unit);
            outcome.exit_code = run_command(unit);
        }

        if (context_.poll_signal) {
            ControlSignal pending = context_.poll_signal();
            if (!pending.is_none()) {
                outcome.signal = pending;
                return outcome;
            }
        }
        if (errexit_enabled() && outcome.exit_code != 0) {
            return outcome;
        }
    }
    return outcome;
}
