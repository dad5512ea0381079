/*
  interpreter_utils.cpp

  This file is part of den, Den Shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "interpreter_utils.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

#include "script_error.h"

namespace interpreter_utils {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

bool at_word_start(const std::string& text, std::size_t i) {
    if (i == 0) {
        return true;
    }
    char prev = text[i - 1];
    return is_blank(prev) || prev == ';' || prev == '&' || prev == '|' || prev == '(';
}

// End index (exclusive) of the shell word starting at `start`.
std::size_t word_end(const std::string& s, std::size_t start) {
    char quote = '\0';
    int depth = 0;
    std::size_t i = start;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (quote != '\0') {
            if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < s.size()) {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '$' && i + 1 < s.size() && (s[i + 1] == '{' || s[i + 1] == '(')) {
            ++depth;
            ++i;
            continue;
        }
        if (depth > 0) {
            if (c == '{' || c == '(') {
                ++depth;
            } else if (c == '}' || c == ')') {
                --depth;
            }
            continue;
        }
        if (is_blank(c)) {
            break;
        }
    }
    return i;
}

// True when the line leaves a quote open, so the logical line continues on the next one.
bool has_unclosed_quote(const std::string& line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != '\0') {
            if (c == '\\' && quote != '\'' && i + 1 < line.size()) {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < line.size()) {
            ++i;
            continue;
        }
        if (c == '#' && at_word_start(line, i)) {
            return false;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
        }
    }
    return quote != '\0';
}

// True for a `for ((` or `((` header whose parentheses are not closed yet.
bool has_unclosed_arithmetic(const std::string& line) {
    std::string head = trim(line);
    if (head.rfind("for", 0) == 0) {
        head = trim(head.substr(3));
    }
    if (head.rfind("((", 0) != 0) {
        return false;
    }
    int depth = 0;
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }
    }
    return depth > 0;
}

bool ends_with_continuation(const std::string& line) {
    std::size_t backslashes = 0;
    for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) {
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

void push_segment(const std::string& raw, std::vector<std::string>& out) {
    std::string seg = trim(raw);
    if (seg.empty()) {
        return;
    }

    static const char* const leading_keywords[] = {"then", "do", "else"};
    for (const char* keyword : leading_keywords) {
        std::string kw(keyword);
        if (seg.size() > kw.size() && starts_with_keyword(seg, kw)) {
            out.push_back(kw);
            push_segment(after_keyword(seg, kw), out);
            return;
        }
    }

    if (starts_with_keyword(seg, "case")) {
        std::size_t p = 4;
        while (p < seg.size() && is_blank(seg[p])) {
            ++p;
        }
        std::size_t q = word_end(seg, p);
        while (q < seg.size() && is_blank(seg[q])) {
            ++q;
        }
        if (seg.compare(q, 2, "in") == 0 && q + 2 < seg.size() && is_blank(seg[q + 2])) {
            std::string rest = trim(seg.substr(q + 2));
            if (!rest.empty()) {
                out.push_back(seg.substr(0, q + 2));
                push_segment(rest, out);
                return;
            }
        }
    }

    out.push_back(seg);
}

}  // namespace

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool is_identifier(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (std::isalpha(static_cast<unsigned char>(name[0])) == 0 && name[0] != '_') {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

bool starts_with_keyword(const std::string& line, const std::string& keyword) {
    std::string t = trim(line);
    if (t.compare(0, keyword.size(), keyword) != 0) {
        return false;
    }
    if (t.size() == keyword.size()) {
        return true;
    }
    char next = t[keyword.size()];
    return is_blank(next) || next == ';';
}

std::string after_keyword(const std::string& line, const std::string& keyword) {
    std::string t = trim(line);
    if (t.size() <= keyword.size()) {
        return "";
    }
    return trim(t.substr(keyword.size()));
}

bool should_skip_line(const std::string& line) {
    std::string t = trim(line);
    return t.empty() || t[0] == '#';
}

StatementKind classify_statement(const std::string& line) {
    std::string t = trim(line);
    if (t.empty()) {
        return StatementKind::NONE;
    }
    if (starts_with_keyword(t, "if")) {
        return StatementKind::IF;
    }
    if (starts_with_keyword(t, "while")) {
        return StatementKind::WHILE;
    }
    if (starts_with_keyword(t, "until")) {
        return StatementKind::UNTIL;
    }
    if (t.rfind("for((", 0) == 0) {
        return StatementKind::C_STYLE_FOR;
    }
    if (starts_with_keyword(t, "for")) {
        return after_keyword(t, "for").rfind("((", 0) == 0 ? StatementKind::C_STYLE_FOR
                                                           : StatementKind::FOR;
    }
    if (starts_with_keyword(t, "select")) {
        return StatementKind::SELECT;
    }
    if (starts_with_keyword(t, "case")) {
        return StatementKind::CASE;
    }
    return StatementKind::NONE;
}

bool opens_do_block(const std::string& line) {
    switch (classify_statement(line)) {
        case StatementKind::WHILE:
        case StatementKind::UNTIL:
        case StatementKind::FOR:
        case StatementKind::C_STYLE_FOR:
        case StatementKind::SELECT:
            return true;
        default:
            return false;
    }
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_blank(text[i])) {
            ++i;
        }
        if (i >= text.size()) {
            break;
        }
        std::size_t end = word_end(text, i);
        words.push_back(text.substr(i, end - i));
        i = end;
    }
    return words;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<int> parse_loop_control(const std::string& line, const std::string& keyword) {
    if (!starts_with_keyword(line, keyword)) {
        return std::nullopt;
    }
    std::string rest = after_keyword(line, keyword);
    if (rest.empty()) {
        return 1;
    }
    for (char c : rest) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return std::nullopt;
        }
    }
    long level = std::strtol(rest.c_str(), nullptr, 10);
    if (level <= 0) {
        return 1;
    }
    if (level > 1000000) {
        level = 1000000;
    }
    return static_cast<int>(level);
}

bool references_array_expansion(const std::string& item) {
    std::size_t open = item.find("${");
    if (open == std::string::npos) {
        return false;
    }
    return item.find("[@]}", open) != std::string::npos ||
           item.find("[*]}", open) != std::string::npos;
}

std::optional<HeredocIntroducer> find_heredoc(const std::string& line) {
    char quote = '\0';
    int paren_depth = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != '\0') {
            if (c == '\\' && quote != '\'' && i + 1 < line.size()) {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < line.size()) {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '#' && at_word_start(line, i)) {
            return std::nullopt;
        }
        if (c == '(') {
            ++paren_depth;
            continue;
        }
        if (c == ')') {
            if (paren_depth > 0) {
                --paren_depth;
            }
            continue;
        }
        if (paren_depth > 0 || c != '<' || i + 1 >= line.size() || line[i + 1] != '<') {
            continue;
        }
        if (i + 2 < line.size() && line[i + 2] == '<') {
            i += 2;
            continue;
        }

        HeredocIntroducer heredoc;
        std::size_t pos = i + 2;
        if (pos < line.size() && line[pos] == '-') {
            heredoc.strip_tabs = true;
            ++pos;
        }
        while (pos < line.size() && is_blank(line[pos])) {
            ++pos;
        }

        std::string delimiter;
        while (pos < line.size()) {
            char d = line[pos];
            if (d == '\'' || d == '"') {
                std::size_t close = line.find(d, pos + 1);
                if (close == std::string::npos) {
                    delimiter += line.substr(pos + 1);
                    pos = line.size();
                    break;
                }
                delimiter += line.substr(pos + 1, close - pos - 1);
                pos = close + 1;
                continue;
            }
            if (d == '\\') {
                ++pos;
                continue;
            }
            if (is_blank(d) || d == ';' || d == '|' || d == '&' || d == '<' || d == '>' ||
                d == '(' || d == ')') {
                break;
            }
            delimiter += d;
            ++pos;
        }

        if (delimiter.empty()) {
            return std::nullopt;
        }
        heredoc.delimiter = delimiter;
        return heredoc;
    }
    return std::nullopt;
}

bool is_heredoc_terminator(const std::string& line, const HeredocIntroducer& heredoc) {
    std::string candidate = line;
    if (!candidate.empty() && candidate.back() == '\r') {
        candidate.pop_back();
    }
    if (heredoc.strip_tabs) {
        std::size_t first = candidate.find_first_not_of('\t');
        candidate = first == std::string::npos ? std::string() : candidate.substr(first);
    }
    return candidate == heredoc.delimiter;
}

std::size_t collect_heredoc(const std::vector<std::string>& lines, std::size_t idx,
                            std::string& unit) {
    unit = lines[idx];
    auto heredoc = find_heredoc(lines[idx]);
    if (!heredoc) {
        return idx;
    }
    std::size_t j = idx + 1;
    for (; j < lines.size(); ++j) {
        unit += '\n';
        unit += lines[j];
        if (is_heredoc_terminator(lines[j], *heredoc)) {
            return j;
        }
    }
    return lines.size() - 1;
}

std::vector<std::string> split_statements(const std::string& line) {
    std::vector<std::string> segments;
    std::string cur;
    char quote = '\0';
    int paren_depth = 0;
    int brace_depth = 0;
    int bracket_depth = 0;

    auto flush = [&]() {
        push_segment(cur, segments);
        cur.clear();
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        char next = i + 1 < line.size() ? line[i + 1] : '\0';

        if (quote != '\0') {
            cur += c;
            if (c == '\\' && quote != '\'' && i + 1 < line.size()) {
                cur += line[++i];
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < line.size()) {
            cur += c;
            cur += line[++i];
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            cur += c;
            continue;
        }
        if (c == '$' && next == '{') {
            ++brace_depth;
            cur += "${";
            ++i;
            continue;
        }
        if (brace_depth > 0) {
            if (c == '{') {
                ++brace_depth;
            } else if (c == '}') {
                --brace_depth;
            }
            cur += c;
            continue;
        }
        if (c == '(') {
            ++paren_depth;
            cur += c;
            continue;
        }
        if (c == ')') {
            if (paren_depth > 0) {
                --paren_depth;
            }
            cur += c;
            continue;
        }
        if (paren_depth > 0) {
            cur += c;
            continue;
        }
        if (c == '[' && next == '[') {
            ++bracket_depth;
            cur += "[[";
            ++i;
            continue;
        }
        if (c == ']' && next == ']' && bracket_depth > 0) {
            --bracket_depth;
            cur += "]]";
            ++i;
            continue;
        }
        if (bracket_depth > 0) {
            cur += c;
            continue;
        }
        if (c == '#' && (cur.empty() || is_blank(cur.back()))) {
            break;
        }
        if (c == ';') {
            if (line.compare(i, 3, ";;&") == 0) {
                cur += ";;&";
                i += 2;
            } else if (next == ';') {
                cur += ";;";
                ++i;
            } else if (next == '&') {
                cur += ";&";
                ++i;
            }
            flush();
            continue;
        }
        cur += c;
    }
    flush();
    return segments;
}

NormalizedScript normalize_script(const std::string& content, std::size_t max_lines) {
    NormalizedScript script;

    auto push_line = [&](const std::string& text, std::size_t line_number) {
        if (max_lines != 0 && script.lines.size() >= max_lines) {
            throw ScriptError(ScriptErrorCode::TOO_MANY_LINES,
                              "script exceeds " + std::to_string(max_lines) + " lines");
        }
        script.lines.push_back(text);
        script.line_numbers.push_back(line_number);
    };

    std::vector<std::string> physical;
    {
        std::size_t start = 0;
        while (start <= content.size()) {
            std::size_t nl = content.find('\n', start);
            std::string line = content.substr(
                start, nl == std::string::npos ? std::string::npos : nl - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            physical.push_back(std::move(line));
            if (nl == std::string::npos) {
                break;
            }
            start = nl + 1;
        }
        if (!physical.empty() && physical.back().empty()) {
            physical.pop_back();
        }
    }

    std::optional<HeredocIntroducer> pending_heredoc;
    std::string carry;
    std::size_t carry_start = 0;

    for (std::size_t i = 0; i < physical.size(); ++i) {
        const std::string& line = physical[i];
        std::size_t line_number = i + 1;

        if (pending_heredoc) {
            push_line(line, line_number);
            if (is_heredoc_terminator(line, *pending_heredoc)) {
                pending_heredoc.reset();
            }
            continue;
        }

        if (carry.empty()) {
            carry_start = line_number;
        }

        if (ends_with_continuation(line)) {
            carry += line.substr(0, line.size() - 1);
            continue;
        }

        std::string logical = carry + line;
        if (has_unclosed_quote(logical) && i + 1 < physical.size()) {
            carry = logical + "\n";
            continue;
        }
        if (has_unclosed_arithmetic(logical) && i + 1 < physical.size()) {
            carry = logical + " ";
            continue;
        }
        carry.clear();

        if (should_skip_line(logical)) {
            continue;
        }

        auto heredoc = find_heredoc(logical);
        if (heredoc) {
            // A compound statement keeps its own lines so its closing keyword is still seen.
            auto statements = split_statements(logical);
            if (statements.size() > 1 &&
                classify_statement(statements.front()) != StatementKind::NONE &&
                find_heredoc(statements.back())) {
                for (const auto& statement : statements) {
                    push_line(statement, carry_start);
                }
            } else {
                push_line(trim(logical), carry_start);
            }
            pending_heredoc = heredoc;
            continue;
        }

        for (const auto& statement : split_statements(logical)) {
            push_line(statement, carry_start);
        }
    }

    if (!carry.empty()) {
        for (const auto& statement : split_statements(carry)) {
            push_line(statement, carry_start);
        }
    }

    return script;
}

}  // namespace interpreter_utils
