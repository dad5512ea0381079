#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "control_flow.h"
#include "function_evaluator.h"
#include "interpreter_limits.h"

class FunctionParser {
   public:
    explicit FunctionParser(const InterpreterLimits& limits);

    bool is_function_definition(const control_flow::Lines& lines, std::size_t idx) const;

    // Parses `function NAME ... { ... }` or `NAME() ... { ... }` starting at `idx`. The end
    // index is the line holding the closing brace.
    control_flow::Parsed<function_evaluator::Function> parse_function(
        const control_flow::Lines& lines, std::size_t idx) const;

    std::vector<function_evaluator::TypedParam> parse_typed_params(
        const std::string& param_list) const;

    static std::optional<std::string> parse_return_type(const std::string& header);

    // Checks supplied arguments against a typed parameter list; returns a description of the
    // mismatch, or nothing when the call is valid.
    static std::optional<std::string> validate_typed_args(
        const std::vector<function_evaluator::TypedParam>& params,
        const std::vector<std::string>& args);

   private:
    struct Header {
        std::string name;
        std::string param_list;
        std::optional<std::string> return_type;
        bool brace_on_header = false;
        std::string after_brace;
    };

    static std::optional<Header> parse_header(const std::string& line);

    InterpreterLimits limits_;
};
