#include "expansion_evaluator.h"

#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <optional>

#include "arithmetic_evaluator.h"
#include "den_filesystem.h"
#include "exec.h"
#include "interpreter_utils.h"
#include "shell.h"
#include "utils/debug.h"

namespace {

bool is_ifs(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

// Index of the bracket closing the one at `open`, skipping quoted text.
std::size_t find_closing(const std::string& text, std::size_t open) {
    char open_char = text[open];
    char close_char = open_char == '(' ? ')' : '}';
    int depth = 0;
    char quote = '\0';
    for (std::size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (quote != '\0') {
            if (c == '\\' && quote == '"' && i + 1 < text.size()) {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\\' && i + 1 < text.size()) {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == open_char) {
            ++depth;
        } else if (c == close_char) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

std::size_t find_backquote_end(const std::string& text, std::size_t open) {
    for (std::size_t i = open + 1; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            ++i;
            continue;
        }
        if (text[i] == '`') {
            return i;
        }
    }
    return std::string::npos;
}

std::string unescape_backquoted(const std::string& command) {
    std::string out;
    for (std::size_t i = 0; i < command.size(); ++i) {
        if (command[i] == '\\' && i + 1 < command.size() &&
            (command[i + 1] == '`' || command[i + 1] == '\\' || command[i + 1] == '$')) {
            ++i;
        }
        out += command[i];
    }
    return out;
}

std::string join(const std::vector<std::string>& values, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += values[i];
    }
    return out;
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

struct ExpansionEvaluator::Fields {
    bool split = true;
    std::vector<std::string> words;
    std::string current;
    bool has_current = false;

    void literal(const std::string& text) {
        current += text;
        has_current = true;
    }
    void literal(char c) {
        current += c;
        has_current = true;
    }
    void finish_word() {
        if (has_current) {
            words.push_back(current);
            current.clear();
            has_current = false;
        }
    }

    void unquoted(const std::string& value) {
        if (!split) {
            current += value;
            if (!value.empty()) {
                has_current = true;
            }
            return;
        }
        if (value.empty()) {
            return;
        }
        auto parts = interpreter_utils::split_whitespace(value);
        if (is_ifs(value.front())) {
            finish_word();
        }
        for (std::size_t k = 0; k < parts.size(); ++k) {
            if (k > 0) {
                finish_word();
            }
            literal(parts[k]);
        }
        if (is_ifs(value.back())) {
            finish_word();
        }
    }

    void unquoted_multiple(const std::vector<std::string>& values) {
        for (std::size_t k = 0; k < values.size(); ++k) {
            if (k > 0) {
                if (split) {
                    finish_word();
                } else {
                    current += ' ';
                }
            }
            unquoted(values[k]);
        }
    }

    void quoted_multiple(const std::vector<std::string>& values) {
        for (std::size_t k = 0; k < values.size(); ++k) {
            if (k > 0) {
                if (split) {
                    words.push_back(current);
                    current.clear();
                } else {
                    current += ' ';
                }
            }
            literal(values[k]);
        }
    }
};

ExpansionEvaluator::ExpansionEvaluator(Shell& shell) : shell(shell) {
}

std::string ExpansionEvaluator::expand_word(const std::string& word) {
    Fields fields;
    fields.split = false;
    expand_into(word, fields);
    return fields.current;
}

std::vector<std::string> ExpansionEvaluator::expand_to_words(const std::string& word) {
    Fields fields;
    expand_into(word, fields);
    fields.finish_word();
    return fields.words;
}

std::vector<std::string> ExpansionEvaluator::expand_arguments(
    const std::vector<std::string>& words) {
    std::vector<std::string> result;
    result.reserve(words.size());
    for (const auto& word : words) {
        for (auto& field : expand_to_words(word)) {
            result.push_back(std::move(field));
        }
    }
    return result;
}

void ExpansionEvaluator::expand_into(const std::string& word, Fields& fields) {
    const std::size_t n = word.size();
    std::size_t i = 0;

    if (n > 0 && word[0] == '~' && (n == 1 || word[1] == '/')) {
        std::string home = shell.get_variable("HOME");
        fields.literal(home.empty() ? den_filesystem::g_user_home_path.string() : home);
        i = 1;
    }

    while (i < n) {
        char c = word[i];

        if (c == '\'') {
            std::size_t close = word.find('\'', i + 1);
            if (close == std::string::npos) {
                fields.literal(word.substr(i + 1));
                break;
            }
            fields.literal(word.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }

        if (c == '"') {
            bool contributed = false;
            bool empty_multiple = false;
            std::size_t j = i + 1;
            for (; j < n && word[j] != '"'; ++j) {
                char q = word[j];
                if (q == '\\' && j + 1 < n &&
                    (word[j + 1] == '$' || word[j + 1] == '`' || word[j + 1] == '"' ||
                     word[j + 1] == '\\')) {
                    fields.literal(word[++j]);
                    contributed = true;
                } else if (q == '\\' && j + 1 < n && word[j + 1] == '\n') {
                    ++j;
                } else if (q == '$') {
                    Value value = expand_dollar(word, j);
                    if (value.multiple) {
                        if (value.values.empty()) {
                            empty_multiple = true;
                        } else {
                            fields.quoted_multiple(value.values);
                            contributed = true;
                        }
                    } else {
                        fields.literal(join_values(value));
                        contributed = true;
                    }
                } else if (q == '`') {
                    std::size_t close = find_backquote_end(word, j);
                    if (close == std::string::npos) {
                        throw ExpansionError("unexpected EOF while looking for matching ``'");
                    }
                    std::string inner = word.substr(j + 1, close - j - 1);
                    fields.literal(command_substitution(unescape_backquoted(inner)));
                    contributed = true;
                    j = close;
                } else {
                    fields.literal(q);
                    contributed = true;
                }
            }
            // "" is an empty field, "$@" with no parameters is no field at all.
            if (contributed || !empty_multiple) {
                fields.has_current = true;
            }
            i = j + 1;
            continue;
        }

        if (c == '\\') {
            if (i + 1 < n) {
                fields.literal(word[i + 1]);
                i += 2;
            } else {
                fields.literal('\\');
                ++i;
            }
            continue;
        }

        if (c == '$') {
            Value value = expand_dollar(word, i);
            if (value.multiple) {
                fields.unquoted_multiple(value.values);
            } else {
                fields.unquoted(join_values(value));
            }
            ++i;
            continue;
        }

        if (c == '`') {
            std::size_t close = find_backquote_end(word, i);
            if (close == std::string::npos) {
                throw ExpansionError("unexpected EOF while looking for matching ``'");
            }
            fields.unquoted(
                command_substitution(unescape_backquoted(word.substr(i + 1, close - i - 1))));
            i = close + 1;
            continue;
        }

        fields.literal(c);
        ++i;
    }
}

std::string ExpansionEvaluator::expand_here_doc(const std::string& body) {
    std::string out;
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size() &&
            (body[i + 1] == '$' || body[i + 1] == '`' || body[i + 1] == '\\')) {
            out += body[++i];
        } else if (c == '$') {
            out += join_values(expand_dollar(body, i));
        } else if (c == '`') {
            std::size_t close = find_backquote_end(body, i);
            if (close == std::string::npos) {
                out += c;
                continue;
            }
            out += command_substitution(unescape_backquoted(body.substr(i + 1, close - i - 1)));
            i = close;
        } else {
            out += c;
        }
    }
    return out;
}

std::string ExpansionEvaluator::join_values(const Value& value) const {
    return join(value.values, " ");
}

ExpansionEvaluator::Value ExpansionEvaluator::expand_dollar(const std::string& text,
                                                            std::size_t& i) {
    const std::size_t n = text.size();
    if (i + 1 >= n) {
        return Value{{"$"}, false};
    }
    char next = text[i + 1];

    if (next == '(') {
        if (i + 2 < n && text[i + 2] == '(') {
            std::size_t inner = find_closing(text, i + 2);
            if (inner != std::string::npos && inner + 1 < n && text[inner + 1] == ')') {
                std::string expr = text.substr(i + 3, inner - i - 3);
                i = inner + 1;
                return Value{{std::to_string(evaluate_arithmetic(expr))}, false};
            }
        }
        std::size_t close = find_closing(text, i + 1);
        if (close == std::string::npos) {
            throw ExpansionError("unexpected EOF while looking for matching `)'");
        }
        std::string command = text.substr(i + 2, close - i - 2);
        i = close;
        return Value{{command_substitution(command)}, false};
    }

    if (next == '{') {
        std::size_t close = find_closing(text, i + 1);
        if (close == std::string::npos) {
            throw ExpansionError("${" + text.substr(i + 2) + ": bad substitution");
        }
        std::string inner = text.substr(i + 2, close - i - 2);
        i = close;
        return expand_braced(inner);
    }

    if (is_name_start(next)) {
        std::size_t end = i + 1;
        while (end < n && is_name_char(text[end])) {
            ++end;
        }
        std::string name = text.substr(i + 1, end - i - 1);
        i = end - 1;
        return Value{{shell.get_variable(name)}, false};
    }

    if (std::isdigit(static_cast<unsigned char>(next)) != 0 || next == '#' || next == '?' ||
        next == '$' || next == '@' || next == '*' || next == '!' || next == '-') {
        ++i;
        return special_parameter(next);
    }

    return Value{{"$"}, false};
}

ExpansionEvaluator::Value ExpansionEvaluator::special_parameter(char c) const {
    switch (c) {
        case '#':
            return Value{{std::to_string(shell.get_positional_parameter_count())}, false};
        case '?':
            return Value{{std::to_string(shell.get_last_exit_code())}, false};
        case '$':
            return Value{{std::to_string(static_cast<long long>(getpid()))}, false};
        case '@':
            return Value{shell.get_positional_parameters(), true};
        case '*':
            return Value{{join(shell.get_positional_parameters(), " ")}, false};
        case '!':
            return Value{{""}, false};
        case '-': {
            std::string flags;
            if (shell.is_errexit_enabled()) {
                flags += 'e';
            }
            if (shell.is_noexec_enabled()) {
                flags += 'n';
            }
            return Value{{flags}, false};
        }
        default:
            return Value{{shell.get_variable(std::string(1, c))}, false};
    }
}

ExpansionEvaluator::Value ExpansionEvaluator::expand_braced(const std::string& inner) {
    if (inner.empty()) {
        throw ExpansionError("${}: bad substitution");
    }
    if (inner.size() == 1 && std::string("#?$@*!-").find(inner[0]) != std::string::npos) {
        return special_parameter(inner[0]);
    }

    if (inner[0] == '#') {
        std::string target = inner.substr(1);
        std::size_t bracket = target.find('[');
        if (bracket != std::string::npos && target.back() == ']') {
            std::string name = target.substr(0, bracket);
            std::string subscript = target.substr(bracket + 1, target.size() - bracket - 2);
            if (subscript == "@" || subscript == "*") {
                if (const auto* assoc = shell.find_assoc_array(name)) {
                    return Value{{std::to_string(assoc->size())}, false};
                }
                const auto* array = shell.find_array(name);
                std::size_t count = array != nullptr ? array->size()
                                                     : (shell.find_variable(name) ? 1 : 0);
                return Value{{std::to_string(count)}, false};
            }
            return Value{{std::to_string(join_values(expand_subscript(name, subscript)).size())},
                         false};
        }
        return Value{{std::to_string(shell.get_variable(target).size())}, false};
    }

    std::size_t p = 0;
    if (std::isdigit(static_cast<unsigned char>(inner[0])) != 0) {
        while (p < inner.size() && std::isdigit(static_cast<unsigned char>(inner[p])) != 0) {
            ++p;
        }
    } else if (is_name_start(inner[0])) {
        while (p < inner.size() && is_name_char(inner[p])) {
            ++p;
        }
    }
    if (p == 0) {
        throw ExpansionError("${" + inner + "}: bad substitution");
    }
    std::string name = inner.substr(0, p);

    if (p < inner.size() && inner[p] == '[') {
        std::size_t close = inner.find(']', p);
        if (close == std::string::npos || close + 1 != inner.size()) {
            throw ExpansionError("${" + inner + "}: bad substitution");
        }
        return expand_subscript(name, inner.substr(p + 1, close - p - 1));
    }

    std::string rest = inner.substr(p);
    if (rest.empty()) {
        return Value{{shell.get_variable(name)}, false};
    }

    bool colon = rest[0] == ':';
    if (colon && rest.size() < 2) {
        throw ExpansionError("${" + inner + "}: bad substitution");
    }
    char op = rest[colon ? 1 : 0];
    std::string word = rest.substr(colon ? 2 : 1);
    std::optional<std::string> current = shell.find_variable(name);
    bool use_word = colon ? (!current || current->empty()) : !current;

    switch (op) {
        case '-':
            return Value{{use_word ? expand_word(word) : *current}, false};
        case '=':
            if (use_word) {
                std::string value = expand_word(word);
                shell.set_variable(name, value);
                return Value{{value}, false};
            }
            return Value{{*current}, false};
        case '+':
            return Value{{use_word ? std::string() : expand_word(word)}, false};
        case '?':
            if (use_word) {
                throw ExpansionError(name + ": " +
                                     (word.empty() ? "parameter null or not set"
                                                   : expand_word(word)));
            }
            return Value{{*current}, false};
        default:
            throw ExpansionError("${" + inner + "}: bad substitution");
    }
}

ExpansionEvaluator::Value ExpansionEvaluator::expand_subscript(const std::string& name,
                                                               const std::string& subscript) {
    const auto* assoc = shell.find_assoc_array(name);
    if (subscript == "@" || subscript == "*") {
        std::vector<std::string> values;
        if (assoc != nullptr) {
            for (const auto& entry : *assoc) {
                values.push_back(entry.second);
            }
        } else if (const auto* array = shell.find_array(name)) {
            values = *array;
        } else if (auto scalar = shell.find_variable(name)) {
            values.push_back(*scalar);
        }
        if (subscript == "@") {
            return Value{values, true};
        }
        return Value{{join(values, " ")}, false};
    }

    if (assoc != nullptr) {
        auto it = assoc->find(expand_word(subscript));
        return Value{{it == assoc->end() ? std::string() : it->second}, false};
    }

    long long index = evaluate_arithmetic(subscript);
    const auto* array = shell.find_array(name);
    if (array == nullptr) {
        return Value{{index == 0 ? shell.get_variable(name) : std::string()}, false};
    }
    if (index < 0) {
        index += static_cast<long long>(array->size());
    }
    if (index < 0 || static_cast<std::size_t>(index) >= array->size()) {
        return Value{{""}, false};
    }
    return Value{{(*array)[static_cast<std::size_t>(index)]}, false};
}

long long ExpansionEvaluator::evaluate_arithmetic(const std::string& expr) {
    std::string expanded = expand_word(expr);
    ArithmeticEvaluator evaluator(
        [this](const std::string& name) -> long long {
            std::string value = interpreter_utils::trim(shell.get_variable(name));
            if (value.empty()) {
                return 0;
            }
            char* end = nullptr;
            long long result = std::strtoll(value.c_str(), &end, 0);
            if (end == nullptr || *end != '\0') {
                return 0;
            }
            return result;
        },
        [this](const std::string& name, long long value) {
            shell.set_variable(name, std::to_string(value));
        });

    try {
        return evaluator.evaluate(expanded);
    } catch (const std::runtime_error& e) {
        throw ExpansionError(interpreter_utils::trim(expr) + ": " + e.what());
    }
}

std::string ExpansionEvaluator::command_substitution(const std::string& command) {
    std::cout.flush();
    std::cerr.flush();
    (void)fflush(stdout);

    int pipe_fds[2] = {-1, -1};
    auto pipe_result = den_filesystem::create_pipe(pipe_fds);
    if (pipe_result.is_error()) {
        throw ExpansionError("command substitution: " + pipe_result.error());
    }

    pid_t pid = fork();
    if (pid < 0) {
        den_filesystem::close_pipe(pipe_fds);
        throw ExpansionError(std::string("command substitution: fork failed: ") +
                             std::strerror(errno));
    }

    if (pid == 0) {
        den_filesystem::safe_close(pipe_fds[0]);
        if (den_filesystem::safe_dup2(pipe_fds[1], STDOUT_FILENO).is_error()) {
            _exit(1);
        }
        den_filesystem::safe_close(pipe_fds[1]);
        int code = shell.execute(command, shell.get_script_name());
        std::cout.flush();
        (void)fflush(stdout);
        _exit(code & 0xFF);
    }

    den_filesystem::safe_close(pipe_fds[1]);
    std::string output;
    char buffer[4096];
    while (true) {
        ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
        if (count == 0) {
            break;
        }
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        output.append(buffer, static_cast<std::size_t>(count));
    }
    den_filesystem::safe_close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    last_substitution_status = extract_exit_code(status);
    shell.set_last_exit_code(*last_substitution_status);
    den_debug_msg("command substitution '%s' exited %d", command.c_str(),
                  *last_substitution_status);

    while (!output.empty() && output.back() == '\n') {
        output.pop_back();
    }
    return output;
}
