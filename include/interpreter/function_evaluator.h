#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace function_evaluator {

// One entry of a `[a: int, --loud(-l), ...rest]` parameter list.
struct TypedParam {
    std::string name;
    std::optional<std::string> type_hint;
    std::optional<std::string> default_value;
    bool is_flag = false;
    std::optional<std::string> short_flag;
    bool is_rest = false;
    bool is_optional = false;
};

struct Function {
    std::string name;
    std::vector<std::string> body;
    bool is_exported = false;
    std::optional<std::vector<TypedParam>> typed_params;
    std::optional<std::string> return_type;
};

struct CallFrame {
    std::string function_name;
    std::vector<std::string> positional_params;
    std::unordered_map<std::string, std::string> local_vars;
    bool return_requested = false;
    int return_code = 0;
};

}  // namespace function_evaluator
