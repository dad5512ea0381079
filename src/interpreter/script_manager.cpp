#include "script_manager.h"

#include <algorithm>
#include <utility>

#include "error_out.h"
#include "script_error.h"
#include "utils/debug.h"

using control_flow::SignalKind;
using interpreter_utils::StatementKind;
using interpreter_utils::trim;

class ScriptManager::SourceScope {
   public:
    SourceScope(ScriptManager& manager, size_t call_depth) : manager_(manager) {
        SourceFrame frame;
        frame.call_depth = call_depth;
        manager_.source_frames_.push_back(frame);
    }
    ~SourceScope() {
        manager_.source_frames_.pop_back();
    }

    SourceScope(const SourceScope&) = delete;
    SourceScope& operator=(const SourceScope&) = delete;

   private:
    ScriptManager& manager_;
};

ScriptManager::ScriptManager(ExecutionContext& context, ControlFlowExecutor& executor,
                             FunctionManager& functions, const InterpreterLimits& limits)
    : context_(context), executor_(executor), functions_(functions), limits_(limits) {
}

den_filesystem::Result<std::string> ScriptManager::load_script(const std::string& path) {
    auto mtime = den_filesystem::file_mtime_ns(path);
    if (mtime.is_error()) {
        return den_filesystem::Result<std::string>::error(mtime.error());
    }

    if (cache_enabled_) {
        auto it = cache_.find(path);
        if (it != cache_.end()) {
            if (it->second.mtime_ns == mtime.value()) {
                ++cache_hits_;
                den_debug_msg("script cache hit: %s", path.c_str());
                return den_filesystem::Result<std::string>::ok(it->second.content);
            }
            den_debug_msg("script cache stale: %s", path.c_str());
        }
    }

    ++cache_misses_;
    auto content = den_filesystem::read_file_content(path, limits_.max_script_bytes);
    if (content.is_error()) {
        return content;
    }

    if (cache_enabled_) {
        store_in_cache(path, content.value(), mtime.value());
    }
    return content;
}

den_filesystem::Result<std::string> ScriptManager::reload_script(const std::string& path) {
    cache_.erase(path);
    return load_script(path);
}

void ScriptManager::store_in_cache(const std::string& path, const std::string& content,
                                   std::int64_t mtime_ns) {
    if (limits_.script_cache_capacity == 0) {
        return;
    }
    if (cache_.find(path) == cache_.end()) {
        while (cache_.size() >= limits_.script_cache_capacity) {
            evict_oldest();
        }
    }

    CachedScript entry;
    entry.path = path;
    entry.content = content;
    entry.mtime_ns = mtime_ns;
    entry.line_count = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    cache_[path] = std::move(entry);
}

void ScriptManager::evict_oldest() {
    auto oldest = std::min_element(cache_.begin(), cache_.end(), [](const auto& a, const auto& b) {
        return a.second.mtime_ns < b.second.mtime_ns;
    });
    if (oldest != cache_.end()) {
        den_debug_msg("script cache evict: %s", oldest->first.c_str());
        cache_.erase(oldest);
    }
}

void ScriptManager::clear_cache() {
    cache_.clear();
}

CacheStats ScriptManager::cache_stats() const {
    CacheStats stats;
    stats.count = cache_.size();
    stats.max_size = limits_.script_cache_capacity;
    stats.enabled = cache_enabled_;
    stats.hits = cache_hits_;
    stats.misses = cache_misses_;
    return stats;
}

void ScriptManager::set_cache_enabled(bool enabled) {
    cache_enabled_ = enabled;
    if (!enabled) {
        cache_.clear();
    }
}

void ScriptManager::set_cache_capacity(size_t capacity) {
    limits_.script_cache_capacity = capacity;
    while (cache_.size() > capacity) {
        evict_oldest();
    }
}

bool ScriptManager::is_cached(const std::string& path) const {
    return cache_.find(path) != cache_.end();
}

bool ScriptManager::can_return_from_source() const {
    return !source_frames_.empty() && source_frames_.back().call_depth == functions_.call_depth();
}

void ScriptManager::request_return(int code) {
    if (source_frames_.empty()) {
        return;
    }
    source_frames_.back().return_requested = true;
    source_frames_.back().return_code = code;
}

std::optional<int> ScriptManager::pending_return() const {
    if (!can_return_from_source() || !source_frames_.back().return_requested) {
        return std::nullopt;
    }
    return source_frames_.back().return_code;
}

void ScriptManager::report_error(const std::string& name, const std::string& message,
                                 ErrorType type) {
    print_error({type, name, message, {}});
}

ScriptResult ScriptManager::execute_script(const std::string& path,
                                           const std::vector<std::string>& args) {
    PerformanceTracker tracker("execute_script");

    ScriptResult result;
    if (args.size() > limits_.max_positional_params) {
        std::string message = "more than " + std::to_string(limits_.max_positional_params) +
                              " positional parameters";
        report_error(path, message, ErrorType::CAPACITY_EXCEEDED);
        result.exit_code = 1;
        result.error_message = message;
        return result;
    }

    auto content = load_script(path);
    if (content.is_error()) {
        report_error(path, content.error(), ErrorType::FILE_NOT_FOUND);
        result.exit_code = 127;
        result.error_message = content.error();
        return result;
    }

    auto invalid = validate_script(content.value(), path);
    if (invalid) {
        report_error("den", *invalid, ErrorType::SYNTAX_ERROR);
        result.exit_code = 2;
        result.error_message = invalid;
        return result;
    }

    if (context_.set_positional_parameters) {
        context_.set_positional_parameters(args);
    }
    if (context_.set_script_name) {
        context_.set_script_name(path);
    }
    return run_content(content.value(), path);
}

ScriptResult ScriptManager::source_script(const std::string& path,
                                          const std::vector<std::string>& args) {
    ScriptResult result;
    if (args.size() > limits_.max_positional_params) {
        std::string message = "more than " + std::to_string(limits_.max_positional_params) +
                              " positional parameters";
        report_error("source", message, ErrorType::CAPACITY_EXCEEDED);
        result.exit_code = 1;
        result.error_message = message;
        return result;
    }

    auto content = load_script(path);
    if (content.is_error()) {
        report_error("source", path + ": " + content.error(), ErrorType::FILE_NOT_FOUND);
        result.exit_code = 1;
        result.error_message = content.error();
        return result;
    }

    auto invalid = validate_script(content.value(), path);
    if (invalid) {
        report_error("source", *invalid, ErrorType::SYNTAX_ERROR);
        result.exit_code = 2;
        result.error_message = invalid;
        return result;
    }

    std::vector<std::string> saved_params;
    bool rebind = !args.empty() && context_.set_positional_parameters;
    if (rebind) {
        if (context_.get_positional_parameters) {
            saved_params = context_.get_positional_parameters();
        }
        context_.set_positional_parameters(args);
    }

    {
        SourceScope scope(*this, functions_.call_depth());
        result = run_content(content.value(), path);
    }

    if (rebind) {
        context_.set_positional_parameters(saved_params);
    }
    return result;
}

ScriptResult ScriptManager::execute_source(const std::string& content, const std::string& name) {
    auto invalid = validate_script(content, name);
    if (invalid) {
        report_error("den", *invalid, ErrorType::SYNTAX_ERROR);
        ScriptResult result;
        result.exit_code = 2;
        result.error_message = invalid;
        return result;
    }
    return run_content(content, name);
}

ScriptResult ScriptManager::run_content(const std::string& content, const std::string& name) {
    interpreter_utils::NormalizedScript script;
    try {
        script = interpreter_utils::normalize_script(content, limits_.max_script_lines);
    } catch (const ScriptError& e) {
        report_error(name, e.what(), e.error_type());
        if (context_.on_command_error) {
            context_.on_command_error();
        }
        ScriptResult result;
        result.exit_code = 1;
        result.error_message = e.what();
        return result;
    }
    return run_lines(script, name);
}

int ScriptManager::run_command(const std::string& command) {
    try {
        return context_.execute_command(command);
    } catch (const CommandExecutionError& e) {
        print_error({ErrorType::RUNTIME_ERROR, "den", e.what(), {}});
        return 1;
    }
}

size_t ScriptManager::skip_statement(const control_flow::Lines& lines, size_t idx) const {
    if (functions_.parser().is_function_definition(lines, idx)) {
        return functions_.parser().parse_function(lines, idx).end_index;
    }
    if (interpreter_utils::classify_statement(lines[idx]) != StatementKind::NONE) {
        return executor_.parser().parse_statement(lines, idx);
    }
    std::string unit;
    return interpreter_utils::collect_heredoc(lines, idx, unit);
}

ScriptResult ScriptManager::run_lines(const interpreter_utils::NormalizedScript& script,
                                      const std::string& name) {
    const auto& lines = script.lines;
    ScriptResult result;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t line_number = script.line_numbers[i];
        result.line_executed = line_number;

        if (context_.stop_requested && context_.stop_requested()) {
            result.exit_code = 130;
            return result;
        }

        int code = 0;
        std::optional<int> returned;
        try {
            if (noexec_) {
                i = skip_statement(lines, i);
                continue;
            }

            if (auto end = functions_.try_define_function(lines, i)) {
                i = *end;
            } else if (interpreter_utils::classify_statement(line) != StatementKind::NONE) {
                control_flow::ExecOutcome outcome = executor_.execute_statement(lines, i);
                code = outcome.exit_code;
                if (context_.record_exit_code) {
                    context_.record_exit_code(code);
                }
                if (outcome.signal.kind == SignalKind::Return) {
                    returned = outcome.signal.code;
                } else if (!outcome.signal.is_none()) {
                    den_debug_msg("%s: dropping loop signal at top level", name.c_str());
                }
            } else {
                std::string unit;
                i = interpreter_utils::collect_heredoc(lines, i, unit);
                code = run_command(unit);
                if (context_.poll_signal) {
                    control_flow::ControlSignal signal = context_.poll_signal();
                    if (signal.kind == SignalKind::Return) {
                        returned = signal.code;
                    }
                }
            }
        } catch (const ScriptError& e) {
            print_error(ErrorInfo(e.error_type(), name, e.what(), {},
                                  "Context: line " + std::to_string(line_number) + ": " + line));
            if (context_.on_command_error) {
                context_.on_command_error();
            }
            result.exit_code = 1;
            result.error_message = e.what();
            return result;
        }

        result.exit_code = code;
        if (returned) {
            result.exit_code = *returned;
            return result;
        }
        if (code != 0) {
            if (context_.on_command_error) {
                context_.on_command_error();
            }
            if (context_.errexit_enabled && context_.errexit_enabled()) {
                den_debug_msg("%s: errexit at line %zu (status %d)", name.c_str(), line_number,
                              code);
                return result;
            }
        }
    }
    return result;
}
