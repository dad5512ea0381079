#include "error_out.h"

#include <iostream>
#include <string>
#include <vector>

const char* error_type_text(ErrorType type) {
    switch (type) {
        case ErrorType::COMMAND_NOT_FOUND:
            return "command not found";
        case ErrorType::SYNTAX_ERROR:
            return "syntax error";
        case ErrorType::PERMISSION_DENIED:
            return "permission denied";
        case ErrorType::FILE_NOT_FOUND:
            return "file not found";
        case ErrorType::INVALID_ARGUMENT:
            return "invalid argument";
        case ErrorType::CAPACITY_EXCEEDED:
            return "capacity exceeded";
        case ErrorType::RUNTIME_ERROR:
            return "runtime error";
        case ErrorType::UNKNOWN_ERROR:
        default:
            return "unknown error";
    }
}

void print_error(const ErrorInfo& error) {
    std::cerr << "den: ";

    if (!error.command_used.empty()) {
        std::cerr << error.command_used << ": ";
    }

    std::cerr << error_type_text(error.type);

    if (!error.message.empty()) {
        std::cerr << ": " << error.message;
    }

    if (!error.context.empty()) {
        std::cerr << "\n" << error.context;
    }

    std::cerr << '\n';

    for (const auto& suggestion : error.suggestions) {
        std::cerr << suggestion << '\n';
    }
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg, const std::string& ctx)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg), context(ctx) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg, const std::string& ctx)
    : type(t),
      severity(get_default_severity(t)),
      command_used(cmd),
      message(msg),
      suggestions(sugg),
      context(ctx) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::CAPACITY_EXCEEDED:
            return ErrorSeverity::CRITICAL;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::WARNING;
        case ErrorType::COMMAND_NOT_FOUND:
        case ErrorType::PERMISSION_DENIED:
        case ErrorType::FILE_NOT_FOUND:
        case ErrorType::RUNTIME_ERROR:
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
