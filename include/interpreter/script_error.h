#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "error_out.h"

enum class ScriptErrorCode : std::uint8_t {
    INVALID_IF,
    INVALID_LOOP,
    INVALID_FOR,
    INVALID_C_STYLE_FOR,
    INVALID_SELECT,
    INVALID_CASE,
    INVALID_FUNCTION,
    INVALID_PARAMETER_SYNTAX,
    UNTERMINATED_BLOCK,
    UNMATCHED_BRACES,
    TOO_MANY_LINES,
    TOO_MANY_ITEMS,
    TOO_MANY_ELIF_CLAUSES,
    TOO_MANY_CASES,
    TOO_MANY_PATTERNS,
    TOO_MANY_PARAMETERS,
    FUNCTION_TOO_LARGE,
    CALL_STACK_OVERFLOW,
    FUNCTION_NOT_FOUND,
    NOT_IN_FUNCTION,
    SCRIPT_LOAD_FAILED,
    EXPANSION_FAILED,
    VALIDATION_FAILED
};

enum class ScriptErrorCategory : std::uint8_t {
    SYNTAX,
    CAPACITY,
    RUNTIME
};

ScriptErrorCategory script_error_category(ScriptErrorCode code);
const char* script_error_code_name(ScriptErrorCode code);

class ScriptError : public std::runtime_error {
   public:
    ScriptError(ScriptErrorCode code, const std::string& message);

    ScriptErrorCode code() const {
        return code_;
    }

    ScriptErrorCategory category() const {
        return script_error_category(code_);
    }

    ErrorType error_type() const;

   private:
    ScriptErrorCode code_;
};

// Thrown by the host when a command cannot be started at all.
class CommandExecutionError : public std::runtime_error {
   public:
    explicit CommandExecutionError(const std::string& message) : std::runtime_error(message) {
    }
};
