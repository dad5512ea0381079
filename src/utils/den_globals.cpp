#include "den.h"

namespace config {
bool execute_command = false;
std::string cmd_to_execute;
bool errexit = false;
bool noexec = false;
bool script_cache_enabled = true;
std::size_t script_cache_capacity = 32;
std::size_t max_call_depth = 64;
bool show_version = false;
bool show_help = false;
}  // namespace config
