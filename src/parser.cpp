#include "parser.h"

#include <utility>

#include "interpreter_utils.h"
#include "utils/debug.h"

using interpreter_utils::trim;

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

bool starts_with(const std::string& s, std::size_t i, const char* prefix) {
    return s.compare(i, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Length of the operator starting at `i`, or 0. File-descriptor forms such as `2>` are only
// operators at the start of a word.
std::size_t operator_length(const std::string& s, std::size_t i, bool word_start) {
    if (word_start) {
        static const char* const fd_ops[] = {"2>&1", "1>&2", "2>>", "1>>", "2>", "1>"};
        for (const char* op : fd_ops) {
            if (starts_with(s, i, op)) {
                return std::char_traits<char>::length(op);
            }
        }
    }
    static const char* const ops[] = {"&&", "||", "<<<", "<<-", "<<", "&>",
                                      ">>", ">&2", ">",  "<",   "|"};
    for (const char* op : ops) {
        if (starts_with(s, i, op)) {
            return std::char_traits<char>::length(op);
        }
    }
    return 0;
}

std::string normalize_operator(const std::string& op) {
    if (op == "1>") {
        return ">";
    }
    if (op == "1>>") {
        return ">>";
    }
    if (op == "1>&2") {
        return ">&2";
    }
    return op;
}

bool has_quoting(const std::string& word) {
    return word.find_first_of("'\"\\") != std::string::npos;
}

std::string unquote_delimiter(const std::string& word) {
    std::string out;
    for (char c : word) {
        if (c != '\'' && c != '"' && c != '\\') {
            out += c;
        }
    }
    return out;
}

std::string strip_leading_tabs(const std::string& body) {
    std::string out;
    bool line_start = true;
    for (char c : body) {
        if (line_start && c == '\t') {
            continue;
        }
        line_start = c == '\n';
        out += c;
    }
    return out;
}

}  // namespace

std::vector<Parser::Token> Parser::tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        while (i < n && is_blank(text[i])) {
            ++i;
        }
        if (i >= n) {
            break;
        }

        if (std::size_t len = operator_length(text, i, true)) {
            tokens.push_back({normalize_operator(text.substr(i, len)), true, i, i + len});
            i += len;
            continue;
        }

        std::size_t start = i;
        char quote = '\0';
        int depth = 0;
        for (; i < n; ++i) {
            char c = text[i];
            if (quote != '\0') {
                if (c == '\\' && quote != '\'' && i + 1 < n) {
                    ++i;
                } else if (c == quote) {
                    quote = '\0';
                }
                continue;
            }
            if (c == '\\' && i + 1 < n) {
                ++i;
                continue;
            }
            if (c == '\'' || c == '"' || c == '`') {
                quote = c;
                continue;
            }
            if (c == '$' && i + 1 < n && (text[i + 1] == '(' || text[i + 1] == '{')) {
                ++depth;
                ++i;
                continue;
            }
            if (depth > 0) {
                if (c == '(' || c == '{') {
                    ++depth;
                } else if (c == ')' || c == '}') {
                    --depth;
                }
                continue;
            }
            // A bare group such as the value of NAME=(a b c) stays in one word.
            if (c == '(') {
                ++depth;
                continue;
            }
            if (is_blank(c) || operator_length(text, i, false) > 0) {
                break;
            }
        }
        if (quote != '\0') {
            throw ParseError(std::string("unexpected EOF while looking for matching `") + quote +
                             "'");
        }
        tokens.push_back({text.substr(start, i - start), false, start, i});
    }
    return tokens;
}

std::vector<LogicalCommand> Parser::parse_logical_commands(const std::string& text) const {
    std::vector<LogicalCommand> result;
    std::size_t segment_start = 0;

    for (const auto& token : tokenize(text)) {
        if (!token.is_operator || (token.text != "&&" && token.text != "||")) {
            continue;
        }
        std::string piece = trim(text.substr(segment_start, token.begin - segment_start));
        if (piece.empty()) {
            throw ParseError("syntax error near unexpected token `" + token.text + "'");
        }
        result.push_back({piece, token.text});
        segment_start = token.end;
    }

    std::string last = trim(text.substr(segment_start));
    if (last.empty() && !result.empty()) {
        throw ParseError("syntax error: expected a command after `" + result.back().op + "'");
    }
    result.push_back({last, ""});
    return result;
}

std::vector<std::string> Parser::split_pipeline(const std::string& text) const {
    std::vector<std::string> segments;
    std::size_t segment_start = 0;

    for (const auto& token : tokenize(text)) {
        if (!token.is_operator || token.text != "|") {
            continue;
        }
        std::string piece = trim(text.substr(segment_start, token.begin - segment_start));
        if (piece.empty()) {
            throw ParseError("syntax error near unexpected token `|'");
        }
        segments.push_back(piece);
        segment_start = token.end;
    }

    std::string last = trim(text.substr(segment_start));
    if (last.empty() && !segments.empty()) {
        throw ParseError("syntax error: expected a command after `|'");
    }
    segments.push_back(last);
    return segments;
}

Command Parser::parse_command(const std::string& segment,
                              const std::optional<std::string>& here_doc_body) const {
    Command cmd;
    auto tokens = tokenize(segment);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (!token.is_operator) {
            cmd.args.push_back(token.text);
            continue;
        }

        const std::string& op = token.text;
        if (op == "2>&1") {
            cmd.stderr_to_stdout = true;
            continue;
        }
        if (op == ">&2") {
            cmd.stdout_to_stderr = true;
            continue;
        }
        if (op == "&&" || op == "||" || op == "|") {
            throw ParseError("syntax error near unexpected token `" + op + "'");
        }
        if (i + 1 >= tokens.size() || tokens[i + 1].is_operator) {
            throw ParseError("syntax error near unexpected token `" +
                             (i + 1 < tokens.size() ? tokens[i + 1].text : "newline") + "'");
        }

        const std::string& target = tokens[++i].text;
        if (op == "<") {
            cmd.input_file = target;
        } else if (op == ">") {
            cmd.output_file = target;
            cmd.append_file.clear();
        } else if (op == ">>") {
            cmd.append_file = target;
            cmd.output_file.clear();
        } else if (op == "2>" || op == "2>>") {
            cmd.stderr_file = target;
            cmd.stderr_append = op == "2>>";
        } else if (op == "&>") {
            cmd.both_output_file = target;
        } else if (op == "<<<") {
            cmd.here_doc = target;
            cmd.here_string = true;
        } else if (op == "<<" || op == "<<-") {
            cmd.here_doc_expand = !has_quoting(target);
            std::string body = here_doc_body.value_or("");
            cmd.here_doc = op == "<<-" ? strip_leading_tabs(body) : body;
            den_debug_msg("heredoc '%s' (%zu bytes)", unquote_delimiter(target).c_str(),
                          cmd.here_doc->size());
        }
    }
    return cmd;
}

std::vector<Command> Parser::parse_pipeline(const std::string& unit) const {
    std::string text = unit;
    std::optional<std::string> body;

    std::size_t nl = unit.find('\n');
    auto heredoc = interpreter_utils::find_heredoc(unit.substr(0, nl));
    if (heredoc) {
        body = std::string();
        if (nl != std::string::npos) {
            text = unit.substr(0, nl);
            std::vector<std::string> lines;
            std::size_t start = nl + 1;
            while (start <= unit.size()) {
                std::size_t next = unit.find('\n', start);
                lines.push_back(unit.substr(start, next == std::string::npos ? std::string::npos
                                                                              : next - start));
                if (next == std::string::npos) {
                    break;
                }
                start = next + 1;
            }
            if (!lines.empty() &&
                interpreter_utils::is_heredoc_terminator(lines.back(), *heredoc)) {
                lines.pop_back();
            }
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (i > 0) {
                    *body += '\n';
                }
                *body += lines[i];
            }
        }
    }

    std::vector<Command> commands;
    for (const auto& segment : split_pipeline(text)) {
        commands.push_back(parse_command(segment, body));
    }
    return commands;
}
