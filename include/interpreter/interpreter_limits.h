#pragma once

#include <cstddef>

struct InterpreterLimits {
    std::size_t max_body_lines = 1000;
    std::size_t max_items = 100;
    std::size_t max_elif_clauses = 10;
    std::size_t max_case_clauses = 256;
    std::size_t max_case_patterns = 32;
    std::size_t max_call_depth = 64;
    std::size_t max_positional_params = 64;
    std::size_t max_typed_params = 32;
    std::size_t max_function_lines = 1000;
    std::size_t max_script_lines = 10000;
    std::size_t max_script_bytes = 10 * 1024 * 1024;
    std::size_t script_cache_capacity = 32;
};
