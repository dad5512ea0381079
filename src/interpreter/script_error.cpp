#include "script_error.h"

ScriptErrorCategory script_error_category(ScriptErrorCode code) {
    switch (code) {
        case ScriptErrorCode::INVALID_IF:
        case ScriptErrorCode::INVALID_LOOP:
        case ScriptErrorCode::INVALID_FOR:
        case ScriptErrorCode::INVALID_C_STYLE_FOR:
        case ScriptErrorCode::INVALID_SELECT:
        case ScriptErrorCode::INVALID_CASE:
        case ScriptErrorCode::INVALID_FUNCTION:
        case ScriptErrorCode::INVALID_PARAMETER_SYNTAX:
        case ScriptErrorCode::UNTERMINATED_BLOCK:
        case ScriptErrorCode::UNMATCHED_BRACES:
            return ScriptErrorCategory::SYNTAX;
        case ScriptErrorCode::TOO_MANY_LINES:
        case ScriptErrorCode::TOO_MANY_ITEMS:
        case ScriptErrorCode::TOO_MANY_ELIF_CLAUSES:
        case ScriptErrorCode::TOO_MANY_CASES:
        case ScriptErrorCode::TOO_MANY_PATTERNS:
        case ScriptErrorCode::TOO_MANY_PARAMETERS:
        case ScriptErrorCode::FUNCTION_TOO_LARGE:
        case ScriptErrorCode::CALL_STACK_OVERFLOW:
            return ScriptErrorCategory::CAPACITY;
        case ScriptErrorCode::FUNCTION_NOT_FOUND:
        case ScriptErrorCode::NOT_IN_FUNCTION:
        case ScriptErrorCode::SCRIPT_LOAD_FAILED:
        case ScriptErrorCode::EXPANSION_FAILED:
        case ScriptErrorCode::VALIDATION_FAILED:
        default:
            return ScriptErrorCategory::RUNTIME;
    }
}

const char* script_error_code_name(ScriptErrorCode code) {
    switch (code) {
        case ScriptErrorCode::INVALID_IF:
            return "invalid if";
        case ScriptErrorCode::INVALID_LOOP:
            return "invalid loop";
        case ScriptErrorCode::INVALID_FOR:
            return "invalid for";
        case ScriptErrorCode::INVALID_C_STYLE_FOR:
            return "invalid c-style for";
        case ScriptErrorCode::INVALID_SELECT:
            return "invalid select";
        case ScriptErrorCode::INVALID_CASE:
            return "invalid case";
        case ScriptErrorCode::INVALID_FUNCTION:
            return "invalid function";
        case ScriptErrorCode::INVALID_PARAMETER_SYNTAX:
            return "invalid parameter syntax";
        case ScriptErrorCode::UNTERMINATED_BLOCK:
            return "unterminated block";
        case ScriptErrorCode::UNMATCHED_BRACES:
            return "unmatched braces";
        case ScriptErrorCode::TOO_MANY_LINES:
            return "too many lines";
        case ScriptErrorCode::TOO_MANY_ITEMS:
            return "too many items";
        case ScriptErrorCode::TOO_MANY_ELIF_CLAUSES:
            return "too many elif clauses";
        case ScriptErrorCode::TOO_MANY_CASES:
            return "too many case clauses";
        case ScriptErrorCode::TOO_MANY_PATTERNS:
            return "too many patterns";
        case ScriptErrorCode::TOO_MANY_PARAMETERS:
            return "too many parameters";
        case ScriptErrorCode::FUNCTION_TOO_LARGE:
            return "function too large";
        case ScriptErrorCode::CALL_STACK_OVERFLOW:
            return "call stack overflow";
        case ScriptErrorCode::FUNCTION_NOT_FOUND:
            return "function not found";
        case ScriptErrorCode::NOT_IN_FUNCTION:
            return "not in function";
        case ScriptErrorCode::SCRIPT_LOAD_FAILED:
            return "script load failed";
        case ScriptErrorCode::EXPANSION_FAILED:
            return "expansion failed";
        case ScriptErrorCode::VALIDATION_FAILED:
        default:
            return "validation failed";
    }
}

ScriptError::ScriptError(ScriptErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {
}

ErrorType ScriptError::error_type() const {
    switch (category()) {
        case ScriptErrorCategory::SYNTAX:
            return ErrorType::SYNTAX_ERROR;
        case ScriptErrorCategory::CAPACITY:
            return ErrorType::CAPACITY_EXCEEDED;
        case ScriptErrorCategory::RUNTIME:
        default:
            return ErrorType::RUNTIME_ERROR;
    }
}
