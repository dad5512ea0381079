#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// One simple command of a pipeline. Words are kept raw (quotes intact) and are expanded by the
// shell right before the command runs.
struct Command {
    std::vector<std::string> args;
    std::string input_file;
    std::string output_file;
    std::string append_file;
    std::string stderr_file;
    bool stderr_append = false;
    bool stderr_to_stdout = false;
    bool stdout_to_stderr = false;
    std::string both_output_file;
    std::optional<std::string> here_doc;
    bool here_doc_expand = true;
    bool here_string = false;

    bool has_redirections() const {
        return !input_file.empty() || !output_file.empty() || !append_file.empty() ||
               !stderr_file.empty() || stderr_to_stdout || stdout_to_stderr ||
               !both_output_file.empty() || here_doc.has_value();
    }
};

// A command text followed by the list operator (`&&`, `||`, or empty for the last one).
struct LogicalCommand {
    std::string command;
    std::string op;
};

class ParseError : public std::runtime_error {
   public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {
    }
};

class Parser {
   public:
    struct Token {
        std::string text;
        bool is_operator = false;
        std::size_t begin = 0;
        std::size_t end = 0;
    };

    static std::vector<Token> tokenize(const std::string& text);

    std::vector<LogicalCommand> parse_logical_commands(const std::string& text) const;
    std::vector<std::string> split_pipeline(const std::string& text) const;

    // Parses one pipeline segment. `here_doc_body` is consumed by a `<<` redirection.
    Command parse_command(const std::string& segment,
                          const std::optional<std::string>& here_doc_body = std::nullopt) const;

    // Splits a command unit (possibly carrying a heredoc body on following lines) into the
    // commands of its pipeline.
    std::vector<Command> parse_pipeline(const std::string& unit) const;
};
