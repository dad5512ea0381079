#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "control_flow_executor.h"
#include "den_filesystem.h"
#include "error_out.h"
#include "execution_context.h"
#include "function_manager.h"
#include "interpreter_limits.h"
#include "interpreter_utils.h"

struct CachedScript {
    std::string path;
    std::string content;
    std::int64_t mtime_ns = 0;
    std::size_t line_count = 0;
};

struct CacheStats {
    std::size_t count = 0;
    std::size_t max_size = 0;
    bool enabled = true;
    std::size_t hits = 0;
    std::size_t misses = 0;
};

struct ScriptResult {
    int exit_code = 0;
    std::size_t line_executed = 0;
    std::optional<std::string> error_message;
};

// Loads, caches, validates and runs scripts. Script text is normalized into logical lines and
// driven through a dispatch loop that hands compound statements to the ControlFlowExecutor and
// function definitions to the FunctionManager.
class ScriptManager {
   public:
    ScriptManager(ExecutionContext& context, ControlFlowExecutor& executor,
                  FunctionManager& functions, const InterpreterLimits& limits);

    ScriptManager(const ScriptManager&) = delete;
    ScriptManager& operator=(const ScriptManager&) = delete;

    den_filesystem::Result<std::string> load_script(const std::string& path);
    den_filesystem::Result<std::string> reload_script(const std::string& path);
    void clear_cache();
    CacheStats cache_stats() const;
    void set_cache_enabled(bool enabled);
    void set_cache_capacity(std::size_t capacity);
    bool is_cached(const std::string& path) const;

    static std::optional<std::string> validate_script(const std::string& content,
                                                      const std::string& name);

    ScriptResult execute_script(const std::string& path, const std::vector<std::string>& args);
    ScriptResult source_script(const std::string& path, const std::vector<std::string>& args);
    ScriptResult execute_source(const std::string& content, const std::string& name);

    void set_noexec(bool enabled) {
        noexec_ = enabled;
    }
    bool noexec() const {
        return noexec_;
    }

    // `return` at the top level of a sourced script.
    bool can_return_from_source() const;
    void request_return(int code);
    std::optional<int> pending_return() const;

   private:
    struct SourceFrame {
        std::size_t call_depth = 0;
        bool return_requested = false;
        int return_code = 0;
    };
    class SourceScope;

    void store_in_cache(const std::string& path, const std::string& content,
                        std::int64_t mtime_ns);
    void evict_oldest();
    ScriptResult run_content(const std::string& content, const std::string& name);
    ScriptResult run_lines(const interpreter_utils::NormalizedScript& script,
                           const std::string& name);
    std::size_t skip_statement(const control_flow::Lines& lines, std::size_t idx) const;
    int run_command(const std::string& command);
    void report_error(const std::string& name, const std::string& message, ErrorType type);

    ExecutionContext& context_;
    ControlFlowExecutor& executor_;
    FunctionManager& functions_;
    InterpreterLimits limits_;

    std::unordered_map<std::string, CachedScript> cache_;
    bool cache_enabled_ = true;
    std::size_t cache_hits_ = 0;
    std::size_t cache_misses_ = 0;

    std::vector<SourceFrame> source_frames_;
    bool noexec_ = false;
};
