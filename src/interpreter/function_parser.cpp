#include "function_parser.h"

#include <cctype>

#include "interpreter_utils.h"
#include "script_error.h"
#include "utils/debug.h"

using function_evaluator::Function;
using function_evaluator::TypedParam;
using interpreter_utils::is_identifier;
using interpreter_utils::trim;

namespace {

bool is_function_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (std::isalpha(static_cast<unsigned char>(name[0])) == 0 && name[0] != '_') {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '-' &&
            c != '.' && c != ':') {
            return false;
        }
    }
    return true;
}

void skip_blanks(const std::string& text, size_t& pos) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
}

// Counts braces outside quotes and comments, starting from `depth`. When the depth returns to
// zero `close_pos` receives the position of the balancing `}`.
int scan_braces(const std::string& text, int depth, size_t& close_pos) {
    char quote = '\0';
    for (size_t i = 0; i < text.size(); ++i) {
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
        if (c == '#' && (i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t')) {
            break;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                close_pos = i;
                return 0;
            }
        }
    }
    return depth;
}

std::string split_type_and_default(const std::string& text, std::optional<std::string>& type_hint,
                                   std::optional<std::string>& default_value) {
    std::string head = text;
    size_t eq = head.find('=');
    if (eq != std::string::npos) {
        default_value = trim(head.substr(eq + 1));
        head = trim(head.substr(0, eq));
    }
    size_t colon = head.find(':');
    if (colon != std::string::npos) {
        std::string type = trim(head.substr(colon + 1));
        if (!type.empty()) {
            type_hint = type;
        }
        head = trim(head.substr(0, colon));
    }
    return head;
}

}  // namespace

FunctionParser::FunctionParser(const InterpreterLimits& limits) : limits_(limits) {
}

std::optional<FunctionParser::Header> FunctionParser::parse_header(const std::string& line) {
    std::string t = trim(line);
    Header header;
    size_t pos = 0;
    bool has_keyword = interpreter_utils::starts_with_keyword(t, "function");
    if (has_keyword) {
        pos = 8;
        skip_blanks(t, pos);
    }

    size_t name_start = pos;
    while (pos < t.size() && t[pos] != ' ' && t[pos] != '\t' && t[pos] != '(' &&
           t[pos] != '{' && t[pos] != '[') {
        ++pos;
    }
    header.name = t.substr(name_start, pos - name_start);
    if (!is_function_name(header.name)) {
        return std::nullopt;
    }

    skip_blanks(t, pos);
    bool has_parens = false;
    if (pos < t.size() && t[pos] == '(') {
        size_t close = pos + 1;
        skip_blanks(t, close);
        if (close >= t.size() || t[close] != ')') {
            return std::nullopt;
        }
        has_parens = true;
        pos = close + 1;
        skip_blanks(t, pos);
    }
    if (!has_keyword && !has_parens) {
        return std::nullopt;
    }

    if (pos < t.size() && t[pos] == '[') {
        size_t close = t.find(']', pos);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        header.param_list = t.substr(pos, close - pos + 1);
        pos = close + 1;
        skip_blanks(t, pos);
    }

    if (t.compare(pos, 2, "->") == 0) {
        header.return_type = parse_return_type(t.substr(pos));
        pos += 2;
        skip_blanks(t, pos);
        while (pos < t.size() && t[pos] != ' ' && t[pos] != '\t' && t[pos] != '{') {
            ++pos;
        }
        skip_blanks(t, pos);
    }

    if (pos >= t.size()) {
        return header;
    }
    if (t[pos] != '{') {
        return std::nullopt;
    }
    header.brace_on_header = true;
    header.after_brace = trim(t.substr(pos + 1));
    return header;
}

bool FunctionParser::is_function_definition(const control_flow::Lines& lines, size_t idx) const {
    if (idx >= lines.size()) {
        return false;
    }
    auto header = parse_header(lines[idx]);
    if (!header) {
        return false;
    }
    if (header->brace_on_header) {
        return true;
    }
    // A bare `name()` header needs its brace on the following line; the keyword form is always
    // a definition attempt.
    if (interpreter_utils::starts_with_keyword(lines[idx], "function")) {
        return true;
    }
    return idx + 1 < lines.size() && trim(lines[idx + 1]).rfind('{', 0) == 0;
}

std::optional<std::string> FunctionParser::parse_return_type(const std::string& header) {
    size_t brace = header.find('{');
    size_t arrow = header.find("->");
    if (arrow == std::string::npos || (brace != std::string::npos && arrow > brace)) {
        return std::nullopt;
    }
    size_t pos = arrow + 2;
    skip_blanks(header, pos);
    size_t end = pos;
    while (end < header.size() && header[end] != ' ' && header[end] != '\t' &&
           header[end] != '{') {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return header.substr(pos, end - pos);
}

std::vector<TypedParam> FunctionParser::parse_typed_params(const std::string& param_list) const {
    std::string text = trim(param_list);
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        throw ScriptError(ScriptErrorCode::INVALID_PARAMETER_SYNTAX,
                          "parameter list must be enclosed in [ ]: " + text);
    }

    std::vector<TypedParam> params;
    std::string inner = text.substr(1, text.size() - 2);
    size_t start = 0;
    while (start <= inner.size()) {
        size_t comma = inner.find(',', start);
        std::string entry =
            trim(inner.substr(start, comma == std::string::npos ? std::string::npos
                                                                : comma - start));
        start = comma == std::string::npos ? inner.size() + 1 : comma + 1;
        if (entry.empty()) {
            continue;
        }

        if (params.size() >= limits_.max_typed_params) {
            throw ScriptError(ScriptErrorCode::TOO_MANY_PARAMETERS,
                              "more than " + std::to_string(limits_.max_typed_params) +
                                  " typed parameters");
        }

        TypedParam param;
        if (entry.rfind("...", 0) == 0) {
            param.is_rest = true;
            param.name = split_type_and_default(entry.substr(3), param.type_hint,
                                                param.default_value);
            if (!param.type_hint) {
                param.type_hint = "list";
            }
        } else if (entry.rfind("--", 0) == 0) {
            param.is_flag = true;
            std::string rest = entry.substr(2);
            size_t open = rest.find('(');
            size_t colon = rest.find(':');
            if (open != std::string::npos && (colon == std::string::npos || open < colon)) {
                size_t close = rest.find(')', open);
                if (close == std::string::npos) {
                    throw ScriptError(ScriptErrorCode::INVALID_PARAMETER_SYNTAX,
                                      "unterminated short flag in: " + entry);
                }
                std::string short_flag = trim(rest.substr(open + 1, close - open - 1));
                if (short_flag.size() != 2 || short_flag[0] != '-') {
                    throw ScriptError(ScriptErrorCode::INVALID_PARAMETER_SYNTAX,
                                      "invalid short flag in: " + entry);
                }
                param.short_flag = short_flag.substr(1);
                rest = rest.substr(0, open) + rest.substr(close + 1);
            }
            param.name = split_type_and_default(rest, param.type_hint, param.default_value);
            if (!param.type_hint) {
                param.type_hint = "bool";
            }
        } else {
            std::string name = split_type_and_default(entry, param.type_hint,
                                                      param.default_value);
            if (!name.empty() && name.back() == '?') {
                param.is_optional = true;
                name = trim(name.substr(0, name.size() - 1));
            }
            param.name = name;
        }

        if (!is_identifier(param.name)) {
            throw ScriptError(ScriptErrorCode::INVALID_PARAMETER_SYNTAX,
                              "invalid parameter name in: " + entry);
        }
        params.push_back(std::move(param));
    }
    return params;
}

std::optional<std::string> FunctionParser::validate_typed_args(
    const std::vector<TypedParam>& params, const std::vector<std::string>& args) {
    size_t required = 0;
    size_t declared = 0;
    bool has_rest = false;
    for (const auto& param : params) {
        if (param.is_rest) {
            has_rest = true;
        } else if (!param.is_flag) {
            ++declared;
            if (!param.is_optional && !param.default_value) {
                ++required;
            }
        }
    }

    size_t supplied = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        const TypedParam* flag = nullptr;
        for (const auto& param : params) {
            if (param.is_flag && (args[i] == "--" + param.name ||
                                  (param.short_flag && args[i] == "-" + *param.short_flag))) {
                flag = &param;
                break;
            }
        }
        if (flag == nullptr) {
            ++supplied;
        } else if (flag->type_hint != "bool") {
            ++i;
        }
    }

    if (supplied < required) {
        return "missing required argument: expected at least " + std::to_string(required) +
               " positional arguments, got " + std::to_string(supplied);
    }
    if (!has_rest && supplied > declared) {
        return "too many arguments: expected at most " + std::to_string(declared) +
               " positional arguments, got " + std::to_string(supplied);
    }
    return std::nullopt;
}

control_flow::Parsed<Function> FunctionParser::parse_function(const control_flow::Lines& lines,
                                                              size_t idx) const {
    auto header = parse_header(lines[idx]);
    if (!header) {
        throw ScriptError(ScriptErrorCode::INVALID_FUNCTION,
                          "malformed function header: " + trim(lines[idx]));
    }

    control_flow::Parsed<Function> result;
    Function& function = result.node;
    function.name = header->name;
    function.return_type = header->return_type;
    if (!header->param_list.empty()) {
        function.typed_params = parse_typed_params(header->param_list);
    }

    std::string first_text;
    size_t i = idx;
    if (header->brace_on_header) {
        first_text = header->after_brace;
    } else {
        if (idx + 1 >= lines.size() || trim(lines[idx + 1]).rfind('{', 0) != 0) {
            throw ScriptError(ScriptErrorCode::INVALID_FUNCTION,
                              "missing '{' after function header '" + function.name + "'");
        }
        i = idx + 1;
        first_text = trim(trim(lines[i]).substr(1));
    }

    auto append = [&](const std::string& line) {
        if (function.body.size() >= limits_.max_function_lines) {
            throw ScriptError(ScriptErrorCode::FUNCTION_TOO_LARGE,
                              "function '" + function.name + "' exceeds " +
                                  std::to_string(limits_.max_function_lines) + " lines");
        }
        function.body.push_back(line);
    };

    int depth = 1;
    bool first = true;
    for (; i < lines.size(); ++i) {
        const std::string& text = first ? first_text : lines[i];

        size_t close_pos = std::string::npos;
        depth = scan_braces(text, depth, close_pos);
        if (depth == 0) {
            std::string before = trim(text.substr(0, close_pos));
            if (!before.empty()) {
                append(before);
            }
            std::string trailing = trim(text.substr(close_pos + 1));
            if (!trailing.empty()) {
                den_debug_msg("function %s: ignoring text after '}': %s", function.name.c_str(),
                              trailing.c_str());
            }
            result.end_index = i;
            den_debug_msg("parsed function %s: %zu body line(s)", function.name.c_str(),
                          function.body.size());
            return result;
        }

        if (!first || !text.empty()) {
            append(text);
        }
        first = false;

        auto heredoc = interpreter_utils::find_heredoc(text);
        if (heredoc) {
            size_t j = i + 1;
            for (; j < lines.size(); ++j) {
                append(lines[j]);
                if (interpreter_utils::is_heredoc_terminator(lines[j], *heredoc)) {
                    break;
                }
            }
            i = j;
        }
    }

    throw ScriptError(ScriptErrorCode::UNMATCHED_BRACES,
                      "function '" + function.name + "' is missing its closing '}'");
}
