#pragma once

#include <cstddef>
#include <memory>
#include <string>

const bool PRE_RELEASE = false;
constexpr const char* c_version_base = "1.0.0";

inline std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

namespace config {
extern bool execute_command;
extern std::string cmd_to_execute;
extern bool errexit;
extern bool noexec;
extern bool script_cache_enabled;
extern std::size_t script_cache_capacity;
extern std::size_t max_call_depth;
extern bool show_version;
extern bool show_help;
}  // namespace config
