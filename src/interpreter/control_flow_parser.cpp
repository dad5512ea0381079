#include "control_flow_parser.h"

#include <cctype>
#include <string>
#include <utility>

#include "interpreter_utils.h"
#include "script_error.h"
#include "utils/debug.h"

using namespace control_flow;
using interpreter_utils::after_keyword;
using interpreter_utils::is_identifier;
using interpreter_utils::starts_with_keyword;
using interpreter_utils::trim;

namespace {

// Splits a header at its first unquoted `;`, e.g. `while true; do` -> {"while true", "do"}.
std::pair<std::string, std::string> split_header(const std::string& text) {
    char quote = '\0';
    int paren_depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote != '\0') {
            if (c == '\\' && quote != '\'' && i + 1 < text.size()) {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
        } else if (c == '(') {
            ++paren_depth;
        } else if (c == ')' && paren_depth > 0) {
            --paren_depth;
        } else if (c == ';' && paren_depth == 0) {
            return {trim(text.substr(0, i)), trim(text.substr(i + 1))};
        }
    }
    return {trim(text), ""};
}

bool is_closing_keyword(const std::string& line, const char* keyword) {
    if (starts_with_keyword(line, keyword)) {
        return true;
    }
    std::string t = trim(line);
    std::string word(keyword);
    return t.size() > word.size() && t.compare(0, word.size(), word) == 0 &&
           (t[word.size()] == '<' || t[word.size()] == '>' || t[word.size()] == '|' ||
            t[word.size()] == '&');
}

// Index of the last line belonging to a heredoc introduced on line `i`, or `i` itself.
size_t heredoc_span_end(const Lines& lines, size_t i) {
    if (is_closing_keyword(lines[i], "done") || is_closing_keyword(lines[i], "fi") ||
        is_closing_keyword(lines[i], "esac")) {
        return i;
    }
    auto heredoc = interpreter_utils::find_heredoc(lines[i]);
    if (!heredoc) {
        return i;
    }
    for (size_t j = i + 1; j < lines.size(); ++j) {
        if (interpreter_utils::is_heredoc_terminator(lines[j], *heredoc)) {
            return j;
        }
    }
    return lines.size() - 1;
}

bool starts_redirection(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
    }
    if (i < text.size() && (text[i] == '<' || text[i] == '>')) {
        return true;
    }
    return i == 0 && text.compare(0, 2, "&>") == 0;
}

// The text after a closing keyword may only redirect the whole statement.
std::string closing_redirection(const std::string& line, const char* keyword,
                                ScriptErrorCode code) {
    std::string rest = trim(trim(line).substr(std::string(keyword).size()));
    if (rest.empty()) {
        return rest;
    }
    if (interpreter_utils::find_heredoc(rest)) {
        throw ScriptError(code, std::string("here-document after '") + keyword +
                                    "' is not supported");
    }
    if (!starts_redirection(rest)) {
        throw ScriptError(code, std::string("unexpected text after '") + keyword + "': " + rest);
    }

    char quote = '\0';
    for (size_t i = 0; i < rest.size(); ++i) {
        char c = rest[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '|' || c == ';' ||
                   (c == '&' && (i == 0 || rest[i - 1] != '>') &&
                    (i + 1 >= rest.size() || rest[i + 1] != '>'))) {
            throw ScriptError(code, std::string("unexpected text after '") + keyword +
                                        "': " + rest);
        }
    }
    return rest;
}

// Parses `[(]pat1|pat2) rest` into its patterns and the text after the closing paren.
bool parse_pattern_line(const std::string& line, std::vector<std::string>& patterns,
                        std::string& rest) {
    std::string text = line;
    if (!text.empty() && text[0] == '(') {
        text = trim(text.substr(1));
    }

    char quote = '\0';
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote != '\0') {
            current += c;
            if (c == '\\' && quote == '"' && i + 1 < text.size()) {
                current += text[++i];
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < text.size()) {
            current += c;
            current += text[++i];
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            current += c;
            continue;
        }
        if (c == '|' || c == ')') {
            std::string pattern = trim(current);
            if (pattern.empty()) {
                return false;
            }
            patterns.push_back(pattern);
            current.clear();
            if (c == ')') {
                rest = trim(text.substr(i + 1));
                return true;
            }
            continue;
        }
        current += c;
    }
    return false;
}

}  // namespace

ControlFlowParser::ControlFlowParser(const InterpreterLimits& limits) : limits_(limits) {
}

void ControlFlowParser::append_body_line(Lines& body, const std::string& line) const {
    if (body.size() >= limits_.max_body_lines) {
        throw ScriptError(ScriptErrorCode::TOO_MANY_LINES,
                          "block body exceeds " + std::to_string(limits_.max_body_lines) +
                              " lines");
    }
    body.push_back(line);
}

std::optional<CaseTerminator> ControlFlowParser::detect_terminator(const std::string& line,
                                                                   std::string& body) {
    std::string t = trim(line);
    auto ends_with = [&t](const std::string& suffix) {
        return t.size() >= suffix.size() &&
               t.compare(t.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (ends_with(";;&")) {
        body = trim(t.substr(0, t.size() - 3));
        return CaseTerminator::CONTINUE_TESTING;
    }
    if (ends_with(";&")) {
        body = trim(t.substr(0, t.size() - 2));
        return CaseTerminator::FALLTHROUGH;
    }
    if (ends_with(";;")) {
        body = trim(t.substr(0, t.size() - 2));
        return CaseTerminator::NORMAL;
    }
    return std::nullopt;
}

size_t ControlFlowParser::collect_do_body(const Lines& lines, size_t from, Lines& body,
                                          std::string& redirection,
                                          const char* construct) const {
    size_t i = from;
    if (i < lines.size() && trim(lines[i]) == "do") {
        ++i;
    }

    int depth = 0;
    for (; i < lines.size(); ++i) {
        size_t span_end = heredoc_span_end(lines, i);
        if (span_end != i) {
            for (size_t k = i; k <= span_end; ++k) {
                append_body_line(body, lines[k]);
            }
            i = span_end;
            continue;
        }

        std::string t = trim(lines[i]);
        if (interpreter_utils::opens_do_block(t)) {
            ++depth;
        } else if (is_closing_keyword(t, "done")) {
            if (depth == 0) {
                redirection = closing_redirection(t, "done", ScriptErrorCode::INVALID_LOOP);
                return i;
            }
            --depth;
        }
        append_body_line(body, lines[i]);
    }

    throw ScriptError(ScriptErrorCode::UNTERMINATED_BLOCK,
                      std::string(construct) + " loop is missing 'done'");
}

Parsed<IfStatement> ControlFlowParser::parse_if(const Lines& lines, size_t start) const {
    enum class Section : std::uint8_t {
        THEN,
        ELIF,
        ELSE
    };

    std::string header = trim(lines[start]);
    if (!starts_with_keyword(header, "if")) {
        throw ScriptError(ScriptErrorCode::INVALID_IF, "expected 'if' at: " + header);
    }

    Parsed<IfStatement> result;
    auto [condition, inline_rest] = split_header(after_keyword(header, "if"));
    if (condition.empty()) {
        throw ScriptError(ScriptErrorCode::INVALID_IF, "missing condition after 'if'");
    }
    result.node.condition = condition;

    bool awaiting_then = inline_rest != "then";
    Section section = Section::THEN;
    Lines* body = &result.node.then_body;
    int depth = 0;

    for (size_t i = start + 1; i < lines.size(); ++i) {
        size_t span_end = heredoc_span_end(lines, i);
        if (span_end != i) {
            if (awaiting_then) {
                throw ScriptError(ScriptErrorCode::INVALID_IF, "expected 'then'");
            }
            for (size_t k = i; k <= span_end; ++k) {
                append_body_line(*body, lines[k]);
            }
            i = span_end;
            continue;
        }

        std::string t = trim(lines[i]);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        if (depth == 0) {
            if (t == "then") {
                if (!awaiting_then) {
                    throw ScriptError(ScriptErrorCode::INVALID_IF, "unexpected 'then'");
                }
                awaiting_then = false;
                continue;
            }
            if (awaiting_then) {
                throw ScriptError(ScriptErrorCode::INVALID_IF,
                                  "expected 'then' but found: " + t);
            }
            if (starts_with_keyword(t, "elif")) {
                if (section == Section::ELSE) {
                    throw ScriptError(ScriptErrorCode::INVALID_IF, "'elif' after 'else'");
                }
                if (result.node.elif_clauses.size() >= limits_.max_elif_clauses) {
                    throw ScriptError(ScriptErrorCode::TOO_MANY_ELIF_CLAUSES,
                                      "more than " + std::to_string(limits_.max_elif_clauses) +
                                          " elif clauses");
                }
                auto [elif_condition, elif_rest] = split_header(after_keyword(t, "elif"));
                if (elif_condition.empty()) {
                    throw ScriptError(ScriptErrorCode::INVALID_IF,
                                      "missing condition after 'elif'");
                }
                result.node.elif_clauses.push_back({elif_condition, {}});
                body = &result.node.elif_clauses.back().body;
                section = Section::ELIF;
                awaiting_then = elif_rest != "then";
                continue;
            }
            if (t == "else") {
                if (section == Section::ELSE) {
                    throw ScriptError(ScriptErrorCode::INVALID_IF, "duplicate 'else'");
                }
                result.node.else_body.emplace();
                body = &*result.node.else_body;
                section = Section::ELSE;
                continue;
            }
            if (is_closing_keyword(t, "fi")) {
                result.node.redirection =
                    closing_redirection(t, "fi", ScriptErrorCode::INVALID_IF);
                result.end_index = i;
                den_debug_msg("parsed if: %zu elif clause(s), else=%d, lines %zu-%zu",
                              result.node.elif_clauses.size(),
                              result.node.else_body.has_value() ? 1 : 0, start, i);
                return result;
            }
        }

        if (starts_with_keyword(t, "if")) {
            ++depth;
        } else if (is_closing_keyword(t, "fi")) {
            --depth;
        }
        append_body_line(*body, lines[i]);
    }

    throw ScriptError(ScriptErrorCode::UNTERMINATED_BLOCK, "if statement is missing 'fi'");
}

Parsed<WhileLoop> ControlFlowParser::parse_while(const Lines& lines, size_t start) const {
    std::string header = trim(lines[start]);
    bool is_until = starts_with_keyword(header, "until");
    const char* keyword = is_until ? "until" : "while";
    if (!is_until && !starts_with_keyword(header, "while")) {
        throw ScriptError(ScriptErrorCode::INVALID_LOOP, "expected 'while' or 'until' at: " +
                                                             header);
    }

    auto [condition, inline_rest] = split_header(after_keyword(header, keyword));
    if (condition.empty()) {
        throw ScriptError(ScriptErrorCode::INVALID_LOOP,
                          std::string("missing condition after '") + keyword + "'");
    }
    if (!inline_rest.empty() && inline_rest != "do") {
        throw ScriptError(ScriptErrorCode::INVALID_LOOP, "expected 'do' but found: " +
                                                             inline_rest);
    }

    Parsed<WhileLoop> result;
    result.node.condition = condition;
    result.node.is_until = is_until;
    result.end_index = collect_do_body(lines, start + 1, result.node.body, result.node.redirection,
                                       keyword);
    return result;
}

Parsed<ForLoop> ControlFlowParser::parse_for(const Lines& lines, size_t start) const {
    std::string header = trim(lines[start]);
    if (!starts_with_keyword(header, "for")) {
        throw ScriptError(ScriptErrorCode::INVALID_FOR, "expected 'for' at: " + header);
    }

    auto [spec, inline_rest] = split_header(after_keyword(header, "for"));
    auto words = interpreter_utils::split_words(spec);
    if (words.empty() || !is_identifier(words[0])) {
        throw ScriptError(ScriptErrorCode::INVALID_FOR, "invalid loop variable in: " + header);
    }

    Parsed<ForLoop> result;
    result.node.variable = words[0];
    if (words.size() == 1) {
        result.node.items.push_back("\"$@\"");
    } else if (words[1] != "in") {
        throw ScriptError(ScriptErrorCode::INVALID_FOR, "missing 'in' in: " + header);
    } else {
        if (words.size() - 2 > limits_.max_items) {
            throw ScriptError(ScriptErrorCode::TOO_MANY_ITEMS,
                              "for loop has more than " + std::to_string(limits_.max_items) +
                                  " items");
        }
        result.node.items.assign(words.begin() + 2, words.end());
    }
    if (!inline_rest.empty() && inline_rest != "do") {
        throw ScriptError(ScriptErrorCode::INVALID_FOR, "expected 'do' but found: " +
                                                            inline_rest);
    }

    result.end_index = collect_do_body(lines, start + 1, result.node.body, result.node.redirection,
                                       "for");
    return result;
}

Parsed<CStyleForLoop> ControlFlowParser::parse_c_style_for(const Lines& lines,
                                                           size_t start) const {
    std::string header = trim(lines[start]);
    size_t open = header.find("((");
    if (!starts_with_keyword(header, "for") && header.rfind("for((", 0) != 0) {
        throw ScriptError(ScriptErrorCode::INVALID_C_STYLE_FOR, "expected 'for ((' at: " +
                                                                    header);
    }
    if (open == std::string::npos) {
        throw ScriptError(ScriptErrorCode::INVALID_C_STYLE_FOR, "missing '((' in: " + header);
    }

    // A header may wrap across lines until its closing `))`.
    size_t header_end = start;
    while (header.find("))", open + 2) == std::string::npos && header_end + 1 < lines.size()) {
        ++header_end;
        header += " " + trim(lines[header_end]);
    }

    size_t close = header.rfind("))");
    if (close == std::string::npos || close < open + 2) {
        throw ScriptError(ScriptErrorCode::INVALID_C_STYLE_FOR, "missing '))' in: " + header);
    }

    std::string inner = header.substr(open + 2, close - open - 2);
    std::vector<std::string> parts;
    size_t part_start = 0;
    for (size_t i = 0; i <= inner.size(); ++i) {
        if (i == inner.size() || inner[i] == ';') {
            parts.push_back(trim(inner.substr(part_start, i - part_start)));
            part_start = i + 1;
        }
    }
    if (parts.size() != 3) {
        throw ScriptError(ScriptErrorCode::INVALID_C_STYLE_FOR,
                          "expected three clauses in: " + header);
    }

    std::string rest = trim(header.substr(close + 2));
    if (!rest.empty() && rest[0] == ';') {
        rest = trim(rest.substr(1));
    }
    if (!rest.empty() && rest != "do") {
        throw ScriptError(ScriptErrorCode::INVALID_C_STYLE_FOR, "expected 'do' but found: " +
                                                                    rest);
    }

    Parsed<CStyleForLoop> result;
    auto optional_part = [](const std::string& part) -> std::optional<std::string> {
        if (part.empty()) {
            return std::nullopt;
        }
        return part;
    };
    result.node.init = optional_part(parts[0]);
    result.node.condition = optional_part(parts[1]);
    result.node.update = optional_part(parts[2]);
    result.end_index = collect_do_body(lines, header_end + 1, result.node.body,
                                       result.node.redirection, "for");
    return result;
}

Parsed<SelectMenu> ControlFlowParser::parse_select(const Lines& lines, size_t start) const {
    std::string header = trim(lines[start]);
    if (!starts_with_keyword(header, "select")) {
        throw ScriptError(ScriptErrorCode::INVALID_SELECT, "expected 'select' at: " + header);
    }

    auto [spec, inline_rest] = split_header(after_keyword(header, "select"));
    auto words = interpreter_utils::split_words(spec);
    if (words.empty() || !is_identifier(words[0])) {
        throw ScriptError(ScriptErrorCode::INVALID_SELECT, "invalid menu variable in: " +
                                                               header);
    }

    Parsed<SelectMenu> result;
    result.node.variable = words[0];
    if (words.size() == 1) {
        result.node.items.push_back("\"$@\"");
    } else if (words[1] != "in") {
        throw ScriptError(ScriptErrorCode::INVALID_SELECT, "missing 'in' in: " + header);
    } else {
        if (words.size() - 2 > limits_.max_items) {
            throw ScriptError(ScriptErrorCode::TOO_MANY_ITEMS,
                              "select menu has more than " + std::to_string(limits_.max_items) +
                                  " items");
        }
        result.node.items.assign(words.begin() + 2, words.end());
    }
    if (!inline_rest.empty() && inline_rest != "do") {
        throw ScriptError(ScriptErrorCode::INVALID_SELECT, "expected 'do' but found: " +
                                                               inline_rest);
    }

    result.end_index = collect_do_body(lines, start + 1, result.node.body, result.node.redirection,
                                       "select");
    return result;
}

Parsed<CaseStatement> ControlFlowParser::parse_case(const Lines& lines, size_t start) const {
    std::string header = trim(lines[start]);
    if (!starts_with_keyword(header, "case")) {
        throw ScriptError(ScriptErrorCode::INVALID_CASE, "expected 'case' at: " + header);
    }

    auto words = interpreter_utils::split_words(after_keyword(header, "case"));
    if (words.size() < 2 || words[1] != "in") {
        throw ScriptError(ScriptErrorCode::INVALID_CASE, "missing 'in' in: " + header);
    }
    if (words.size() > 2) {
        throw ScriptError(ScriptErrorCode::INVALID_CASE,
                          "unexpected text after 'in' in: " + header);
    }

    Parsed<CaseStatement> result;
    result.node.value = words[0];

    std::optional<CaseClause> current;
    int depth = 0;

    auto close_clause = [&](CaseTerminator terminator) {
        current->terminator = terminator;
        result.node.cases.push_back(std::move(*current));
        current.reset();
    };

    for (size_t i = start + 1; i < lines.size(); ++i) {
        size_t span_end = heredoc_span_end(lines, i);
        if (span_end != i && current) {
            for (size_t k = i; k <= span_end; ++k) {
                append_body_line(current->body, lines[k]);
            }
            i = span_end;
            continue;
        }

        std::string t = trim(lines[i]);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        if (depth == 0 && is_closing_keyword(t, "esac")) {
            if (current) {
                close_clause(CaseTerminator::NORMAL);
            }
            result.node.redirection =
                closing_redirection(t, "esac", ScriptErrorCode::INVALID_CASE);
            result.end_index = i;
            den_debug_msg("parsed case: %zu clause(s), lines %zu-%zu", result.node.cases.size(),
                          start, i);
            return result;
        }

        if (!current) {
            std::vector<std::string> patterns;
            std::string rest;
            if (!parse_pattern_line(t, patterns, rest)) {
                throw ScriptError(ScriptErrorCode::INVALID_CASE, "expected a pattern but found: " +
                                                                     t);
            }
            if (patterns.size() > limits_.max_case_patterns) {
                throw ScriptError(ScriptErrorCode::TOO_MANY_PATTERNS,
                                  "case clause has more than " +
                                      std::to_string(limits_.max_case_patterns) + " patterns");
            }
            if (result.node.cases.size() >= limits_.max_case_clauses) {
                throw ScriptError(ScriptErrorCode::TOO_MANY_CASES,
                                  "case statement has more than " +
                                      std::to_string(limits_.max_case_clauses) + " clauses");
            }
            current.emplace();
            current->patterns = std::move(patterns);
            if (rest.empty()) {
                continue;
            }
            t = rest;
        }

        std::string stripped;
        auto terminator = detect_terminator(t, stripped);

        if (depth > 0) {
            // Lines of a nested case keep their own terminators.
            std::string base = terminator ? stripped : t;
            if (is_closing_keyword(base, "esac")) {
                --depth;
                if (depth == 0 && terminator) {
                    append_body_line(current->body, base);
                    close_clause(*terminator);
                    continue;
                }
            } else if (starts_with_keyword(base, "case")) {
                ++depth;
            }
            append_body_line(current->body, t);
            continue;
        }

        if (starts_with_keyword(t, "case")) {
            ++depth;
            append_body_line(current->body, t);
            continue;
        }
        if (terminator) {
            if (!stripped.empty()) {
                append_body_line(current->body, stripped);
            }
            close_clause(*terminator);
            continue;
        }
        append_body_line(current->body, t);
    }

    throw ScriptError(ScriptErrorCode::UNTERMINATED_BLOCK, "case statement is missing 'esac'");
}

size_t ControlFlowParser::parse_statement(const Lines& lines, size_t start) const {
    switch (interpreter_utils::classify_statement(lines[start])) {
        case interpreter_utils::StatementKind::IF:
            return parse_if(lines, start).end_index;
        case interpreter_utils::StatementKind::WHILE:
        case interpreter_utils::StatementKind::UNTIL:
            return parse_while(lines, start).end_index;
        case interpreter_utils::StatementKind::FOR:
            return parse_for(lines, start).end_index;
        case interpreter_utils::StatementKind::C_STYLE_FOR:
            return parse_c_style_for(lines, start).end_index;
        case interpreter_utils::StatementKind::SELECT:
            return parse_select(lines, start).end_index;
        case interpreter_utils::StatementKind::CASE:
            return parse_case(lines, start).end_index;
        case interpreter_utils::StatementKind::NONE:
        default:
            return start;
    }
}
