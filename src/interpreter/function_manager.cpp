#include "function_manager.h"

#include <algorithm>
#include <utility>

#include "error_out.h"
#include "script_error.h"
#include "utils/debug.h"

using function_evaluator::CallFrame;
using function_evaluator::Function;
using function_evaluator::TypedParam;

class FunctionManager::FrameGuard {
   public:
    FrameGuard(FunctionManager& manager, const std::string& name,
               const std::vector<std::string>& args)
        : manager_(manager) {
        manager_.push_frame(name, args);
    }
    ~FrameGuard() {
        manager_.pop_frame();
    }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

   private:
    FunctionManager& manager_;
};

namespace {

// Sets FUNCNAME for the duration of a call, then restores the caller's value or unsets it.
class FuncnameScope {
   public:
    FuncnameScope(ExecutionContext& context, const std::string& name) : context_(context) {
        if (context_.find_variable) {
            previous_ = context_.find_variable("FUNCNAME");
        } else if (context_.get_variable) {
            previous_ = context_.get_variable("FUNCNAME");
        }
        if (context_.set_variable) {
            context_.set_variable("FUNCNAME", name);
        }
    }
    ~FuncnameScope() {
        if (previous_) {
            if (context_.set_variable) {
                context_.set_variable("FUNCNAME", *previous_);
            }
        } else if (context_.unset_variable) {
            context_.unset_variable("FUNCNAME");
        } else if (context_.set_variable) {
            context_.set_variable("FUNCNAME", "");
        }
    }

    FuncnameScope(const FuncnameScope&) = delete;
    FuncnameScope& operator=(const FuncnameScope&) = delete;

   private:
    ExecutionContext& context_;
    std::optional<std::string> previous_;
};

}  // namespace

FunctionManager::FunctionManager(ExecutionContext& context, ControlFlowExecutor& executor,
                                 const InterpreterLimits& limits)
    : context_(context), executor_(executor), limits_(limits), parser_(limits) {
    call_stack_.reserve(limits_.max_call_depth);
}

void FunctionManager::define_function(Function function) {
    std::string name = function.name;
    auto it = functions_.find(name);
    if (it != functions_.end()) {
        bool exported = it->second.is_exported;
        it->second = std::move(function);
        it->second.is_exported = it->second.is_exported || exported;
        den_debug_msg("redefined function %s", name.c_str());
        return;
    }
    functions_.emplace(name, std::move(function));
    den_debug_msg("defined function %s", name.c_str());
}

bool FunctionManager::remove_function(const std::string& name) {
    return functions_.erase(name) > 0;
}

bool FunctionManager::has_function(const std::string& name) const {
    return functions_.find(name) != functions_.end();
}

const Function* FunctionManager::get_function(const std::string& name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : &it->second;
}

std::vector<std::string> FunctionManager::list_functions() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& entry : functions_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool FunctionManager::mark_exported(const std::string& name) {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        return false;
    }
    it->second.is_exported = true;
    return true;
}

std::optional<size_t> FunctionManager::try_define_function(const control_flow::Lines& lines,
                                                           size_t idx) {
    if (!parser_.is_function_definition(lines, idx)) {
        return std::nullopt;
    }
    auto parsed = parser_.parse_function(lines, idx);
    define_function(std::move(parsed.node));
    return parsed.end_index;
}

void FunctionManager::set_max_call_depth(size_t depth) {
    limits_.max_call_depth = depth;
    call_stack_.reserve(depth);
}

void FunctionManager::push_frame(const std::string& name, const std::vector<std::string>& args) {
    CallFrame frame;
    frame.function_name = name;
    frame.positional_params = args;
    call_stack_.push_back(std::move(frame));
    den_debug_msg("push frame %s (depth %zu)", name.c_str(), call_stack_.size());
}

void FunctionManager::pop_frame() noexcept {
    if (call_stack_.empty()) {
        return;
    }
    den_debug_msg("pop frame %s (depth %zu)", call_stack_.back().function_name.c_str(),
                  call_stack_.size());
    call_stack_.pop_back();
}

CallFrame* FunctionManager::current_frame() {
    return call_stack_.empty() ? nullptr : &call_stack_.back();
}

const CallFrame* FunctionManager::current_frame() const {
    return call_stack_.empty() ? nullptr : &call_stack_.back();
}

void FunctionManager::set_local(const std::string& name, const std::string& value) {
    CallFrame* frame = current_frame();
    if (frame == nullptr) {
        throw ScriptError(ScriptErrorCode::NOT_IN_FUNCTION,
                          "local: can only be used in a function");
    }
    frame->local_vars[name] = value;
}

std::optional<std::string> FunctionManager::get_local(const std::string& name) const {
    const CallFrame* frame = current_frame();
    if (frame == nullptr) {
        return std::nullopt;
    }
    auto it = frame->local_vars.find(name);
    if (it == frame->local_vars.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FunctionManager::has_local(const std::string& name) const {
    const CallFrame* frame = current_frame();
    return frame != nullptr && frame->local_vars.count(name) > 0;
}

bool FunctionManager::unset_local(const std::string& name) {
    CallFrame* frame = current_frame();
    return frame != nullptr && frame->local_vars.erase(name) > 0;
}

std::optional<std::string> FunctionManager::get_positional_param(size_t index) const {
    const CallFrame* frame = current_frame();
    if (frame == nullptr || index >= frame->positional_params.size()) {
        return std::nullopt;
    }
    return frame->positional_params[index];
}

size_t FunctionManager::positional_count() const {
    const CallFrame* frame = current_frame();
    return frame == nullptr ? 0 : frame->positional_params.size();
}

void FunctionManager::shift_positional_params(size_t count) {
    CallFrame* frame = current_frame();
    if (frame == nullptr) {
        return;
    }
    auto& params = frame->positional_params;
    params.erase(params.begin(), params.begin() + static_cast<std::ptrdiff_t>(
                                                      std::min(count, params.size())));
}

void FunctionManager::request_return(int code) {
    CallFrame* frame = current_frame();
    if (frame == nullptr) {
        throw ScriptError(ScriptErrorCode::NOT_IN_FUNCTION,
                          "return: can only return from a function or sourced script");
    }
    frame->return_requested = true;
    frame->return_code = code;
}

void FunctionManager::bind_typed_args(const std::vector<TypedParam>& params,
                                      const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    for (const auto& param : params) {
        if (param.is_flag) {
            bool is_bool = param.type_hint == "bool";
            set_local(param.name, param.default_value.value_or(is_bool ? "false" : ""));
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const TypedParam* flag = nullptr;
        for (const auto& param : params) {
            if (param.is_flag && (args[i] == "--" + param.name ||
                                  (param.short_flag && args[i] == "-" + *param.short_flag))) {
                flag = &param;
                break;
            }
        }
        if (flag == nullptr) {
            positional.push_back(args[i]);
        } else if (flag->type_hint == "bool") {
            set_local(flag->name, "true");
        } else if (i + 1 < args.size()) {
            set_local(flag->name, args[++i]);
        }
    }

    size_t next = 0;
    for (const auto& param : params) {
        if (param.is_flag) {
            continue;
        }
        if (param.is_rest) {
            std::string joined;
            for (; next < positional.size(); ++next) {
                if (!joined.empty()) {
                    joined += ' ';
                }
                joined += positional[next];
            }
            set_local(param.name, joined);
            continue;
        }
        if (next < positional.size()) {
            set_local(param.name, positional[next++]);
        } else {
            set_local(param.name, param.default_value.value_or(""));
        }
    }
}

int FunctionManager::execute_function(const std::string& name,
                                      const std::vector<std::string>& args) {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        throw ScriptError(ScriptErrorCode::FUNCTION_NOT_FOUND, "function not found: " + name);
    }
    if (call_stack_.size() >= limits_.max_call_depth) {
        throw ScriptError(ScriptErrorCode::CALL_STACK_OVERFLOW,
                          "maximum call depth " + std::to_string(limits_.max_call_depth) +
                              " exceeded calling '" + name + "'");
    }
    if (args.size() > limits_.max_positional_params) {
        throw ScriptError(ScriptErrorCode::TOO_MANY_ITEMS,
                          "'" + name + "' called with more than " +
                              std::to_string(limits_.max_positional_params) + " arguments");
    }

    // The body is copied so a redefinition during the call cannot pull it out from under us.
    Function function = it->second;

    FuncnameScope funcname(context_, name);
    FrameGuard frame(*this, name, args);

    if (function.typed_params) {
        auto mismatch = FunctionParser::validate_typed_args(*function.typed_params, args);
        if (mismatch) {
            print_error({ErrorType::INVALID_ARGUMENT, name, *mismatch, {}});
            return 2;
        }
        bind_typed_args(*function.typed_params, args);
    }

    control_flow::ExecOutcome outcome = executor_.execute_body(function.body);
    if (outcome.signal.kind == control_flow::SignalKind::Return) {
        return outcome.signal.code;
    }
    const CallFrame* current = current_frame();
    if (current != nullptr && current->return_requested) {
        return current->return_code;
    }
    if (!outcome.signal.is_none()) {
        den_debug_msg("function %s: dropping loop signal at function boundary", name.c_str());
    }
    return outcome.exit_code;
}
