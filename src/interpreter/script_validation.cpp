/*
  script_validation.cpp

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

#include <optional>
#include <string>

#include "interpreter_utils.h"
#include "script_manager.h"

namespace {

bool is_word_boundary(char c) {
    return c == ' ' || c == '\t' || c == ';' || c == '&' || c == '|' || c == '(' || c == ')';
}

bool keyword_at(const std::string& line, size_t i, const char* keyword) {
    std::string kw(keyword);
    if (line.compare(i, kw.size(), kw) != 0) {
        return false;
    }
    bool starts = i == 0 || is_word_boundary(line[i - 1]);
    bool ends = i + kw.size() == line.size() || is_word_boundary(line[i + kw.size()]);
    return starts && ends;
}

struct ScanState {
    bool in_single = false;
    bool in_double = false;
    int brace_depth = 0;
    int paren_depth = 0;
    int case_depth = 0;
    bool braces_broken = false;
    bool parens_broken = false;
};

// Skips a `${...}` region starting at `i` (the `$`), returning the index of its closing brace
// or npos when it does not close on this line.
size_t skip_parameter_expansion(const std::string& line, size_t i) {
    int depth = 0;
    for (size_t j = i + 1; j < line.size(); ++j) {
        char c = line[j];
        if (c == '\\') {
            ++j;
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return j;
            }
        }
    }
    return std::string::npos;
}

void scan_line(const std::string& line, ScanState& state) {
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (state.in_single) {
            if (c == '\'') {
                state.in_single = false;
            }
            continue;
        }
        if (c == '\\' && i + 1 < line.size()) {
            ++i;
            continue;
        }
        if (c == '$' && i + 1 < line.size() && line[i + 1] == '{') {
            size_t close = skip_parameter_expansion(line, i);
            if (close == std::string::npos) {
                state.braces_broken = true;
                return;
            }
            i = close;
            continue;
        }
        if (state.in_double) {
            if (c == '"') {
                state.in_double = false;
            }
            continue;
        }

        if (c == '\'') {
            state.in_single = true;
            continue;
        }
        if (c == '"') {
            state.in_double = true;
            continue;
        }
        if (c == '#' && state.brace_depth <= 0 &&
            (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t' || line[i - 1] == ';')) {
            return;
        }

        if (keyword_at(line, i, "case")) {
            ++state.case_depth;
            i += 3;
            continue;
        }
        if (keyword_at(line, i, "esac")) {
            if (state.case_depth > 0) {
                --state.case_depth;
            }
            i += 3;
            continue;
        }

        switch (c) {
            case '{':
                ++state.brace_depth;
                break;
            case '}':
                if (--state.brace_depth < 0) {
                    state.braces_broken = true;
                }
                break;
            case '(':
                ++state.paren_depth;
                break;
            case ')':
                // Inside case...esac a bare `)` ends a pattern rather than closing a group.
                if (state.case_depth > 0 && state.paren_depth == 0) {
                    break;
                }
                if (--state.paren_depth < 0) {
                    state.parens_broken = true;
                }
                break;
            default:
                break;
        }
    }
}

}  // namespace

std::optional<std::string> ScriptManager::validate_script(const std::string& content,
                                                          const std::string& name) {
    ScanState state;
    std::optional<interpreter_utils::HeredocIntroducer> pending_heredoc;

    size_t start = 0;
    while (start <= content.size()) {
        size_t nl = content.find('\n', start);
        std::string line =
            content.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

        if (pending_heredoc) {
            if (interpreter_utils::is_heredoc_terminator(line, *pending_heredoc)) {
                pending_heredoc.reset();
            }
        } else {
            scan_line(line, state);
            if (state.braces_broken) {
                return "unmatched braces in '" + name + "'";
            }
            if (state.parens_broken) {
                return "unmatched parentheses in '" + name + "'";
            }
            if (!state.in_single && !state.in_double) {
                pending_heredoc = interpreter_utils::find_heredoc(line);
            }
        }

        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }

    if (state.in_single || state.in_double) {
        return "unmatched quotes in '" + name + "'";
    }
    if (state.brace_depth != 0) {
        return "unmatched braces in '" + name + "'";
    }
    if (state.paren_depth != 0) {
        return "unmatched parentheses in '" + name + "'";
    }
    return std::nullopt;
}
