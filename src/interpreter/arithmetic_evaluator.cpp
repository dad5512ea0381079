#include "arithmetic_evaluator.h"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace {

const char* const k_operators[] = {"<<=", ">>=", "**", "++", "--", "+=", "-=", "*=", "/=",
                                   "%=",  "&=",  "|=", "^=", "==", "!=", "<=", ">=", "<<",
                                   ">>",  "&&",  "||", "+",  "-",  "*",  "/",  "%",  "<",
                                   ">",   "&",   "|",  "^",  "!",  "~",  "?",  ":",  "="};

bool is_assignment_operator(const std::string& op) {
    return op == "=" || op == "+=" || op == "-=" || op == "*=" || op == "/=" || op == "%=" ||
           op == "<<=" || op == ">>=" || op == "&=" || op == "|=" || op == "^=";
}

}  // namespace

ArithmeticEvaluator::ArithmeticEvaluator(VariableReader var_reader, VariableWriter var_writer)
    : read_variable(std::move(var_reader)), write_variable(std::move(var_writer)) {
}

long long ArithmeticEvaluator::evaluate(const std::string& expr) {
    tokens = tokenize(expr);
    position = 0;
    if (peek().type == TokenType::END) {
        return 0;
    }
    long long result = parse_assignment(true);
    if (peek().type != TokenType::END) {
        throw std::runtime_error("syntax error in expression (error token is \"" + peek().text +
                                 "\")");
    }
    return result;
}

long long ArithmeticEvaluator::fast_pow(long long base, long long exp) {
    if (exp < 0)
        throw std::runtime_error("exponent less than 0");
    long long result = 1;
    long long current_base = base;

    while (exp > 0) {
        if (exp & 1) {
            result *= current_base;
        }
        current_base *= current_base;
        exp >>= 1;
    }

    return result;
}

std::vector<ArithmeticEvaluator::Token> ArithmeticEvaluator::tokenize(const std::string& expr) {
    std::vector<Token> result;
    result.reserve(expr.size() / 2 + 1);

    for (size_t i = 0; i < expr.size();) {
        char c = expr[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            size_t j = i;
            while (j < expr.size() && std::isalnum(static_cast<unsigned char>(expr[j])) != 0) {
                ++j;
            }
            std::string num_str = expr.substr(i, j - i);
            char* endptr = nullptr;
            long long val = std::strtoll(num_str.c_str(), &endptr, 0);
            if (endptr == nullptr || *endptr != '\0') {
                throw std::runtime_error("value too great for base (error token is \"" + num_str +
                                         "\")");
            }
            result.push_back({TokenType::NUMBER, val, num_str});
            i = j;
            continue;
        }

        if (c == '$' || std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
            size_t start = c == '$' ? i + 1 : i;
            size_t j = start;
            while (j < expr.size() &&
                   (std::isalnum(static_cast<unsigned char>(expr[j])) != 0 || expr[j] == '_')) {
                ++j;
            }
            if (j == start) {
                throw std::runtime_error("syntax error: operand expected");
            }
            result.push_back({TokenType::VARIABLE, 0, expr.substr(start, j - start)});
            i = j;
            continue;
        }

        if (c == '(') {
            result.push_back({TokenType::LPAREN, 0, "("});
            ++i;
            continue;
        }
        if (c == ')') {
            result.push_back({TokenType::RPAREN, 0, ")"});
            ++i;
            continue;
        }

        bool matched = false;
        for (const char* op : k_operators) {
            std::string candidate(op);
            if (expr.compare(i, candidate.size(), candidate) == 0) {
                result.push_back({TokenType::OPERATOR, 0, candidate});
                i += candidate.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw std::runtime_error(std::string("syntax error: invalid arithmetic operator '") +
                                     c + "'");
        }
    }

    result.push_back({TokenType::END, 0, ""});
    return result;
}

const ArithmeticEvaluator::Token& ArithmeticEvaluator::peek() const {
    return tokens[position];
}

ArithmeticEvaluator::Token ArithmeticEvaluator::advance() {
    Token token = tokens[position];
    if (token.type != TokenType::END) {
        ++position;
    }
    return token;
}

bool ArithmeticEvaluator::accept_operator(const std::string& op) {
    if (peek().type == TokenType::OPERATOR && peek().text == op) {
        ++position;
        return true;
    }
    return false;
}

int ArithmeticEvaluator::get_precedence(const std::string& op) {
    if (op == "||")
        return 1;
    if (op == "&&")
        return 2;
    if (op == "|")
        return 3;
    if (op == "^")
        return 4;
    if (op == "&")
        return 5;
    if (op == "==" || op == "!=")
        return 6;
    if (op == "<" || op == "<=" || op == ">" || op == ">=")
        return 7;
    if (op == "<<" || op == ">>")
        return 8;
    if (op == "+" || op == "-")
        return 9;
    if (op == "*" || op == "/" || op == "%")
        return 10;
    if (op == "**")
        return 11;
    return -1;
}

long long ArithmeticEvaluator::apply_binary_operator(long long a, long long b,
                                                     const std::string& op) {
    if (op == "+")
        return a + b;
    if (op == "-")
        return a - b;
    if (op == "*")
        return a * b;
    if (op == "/" || op == "%") {
        if (b == 0)
            throw std::runtime_error("division by 0");
        return op == "/" ? a / b : a % b;
    }
    if (op == "**")
        return fast_pow(a, b);
    if (op == "<<")
        return a << b;
    if (op == ">>")
        return a >> b;
    if (op == "&")
        return a & b;
    if (op == "|")
        return a | b;
    if (op == "^")
        return a ^ b;
    if (op == "==")
        return static_cast<long long>(a == b);
    if (op == "!=")
        return static_cast<long long>(a != b);
    if (op == "<")
        return static_cast<long long>(a < b);
    if (op == "<=")
        return static_cast<long long>(a <= b);
    if (op == ">")
        return static_cast<long long>(a > b);
    if (op == ">=")
        return static_cast<long long>(a >= b);
    throw std::runtime_error("syntax error: unknown operator '" + op + "'");
}

long long ArithmeticEvaluator::parse_assignment(bool live) {
    if (peek().type == TokenType::VARIABLE && position + 1 < tokens.size() &&
        tokens[position + 1].type == TokenType::OPERATOR &&
        is_assignment_operator(tokens[position + 1].text)) {
        std::string name = advance().text;
        std::string op = advance().text;
        long long rhs = parse_assignment(live);
        long long value = rhs;
        if (op != "=" && live) {
            value = apply_binary_operator(read_variable(name), rhs, op.substr(0, op.size() - 1));
        }
        if (live) {
            write_variable(name, value);
        }
        return value;
    }
    return parse_ternary(live);
}

long long ArithmeticEvaluator::parse_ternary(bool live) {
    long long condition = parse_binary(1, live);
    if (!accept_operator("?")) {
        return condition;
    }
    long long when_true = parse_assignment(live && condition != 0);
    if (!accept_operator(":")) {
        throw std::runtime_error("syntax error: expected ':' in conditional expression");
    }
    long long when_false = parse_assignment(live && condition == 0);
    return condition != 0 ? when_true : when_false;
}

long long ArithmeticEvaluator::parse_binary(int min_precedence, bool live) {
    long long left = parse_unary(live);

    while (peek().type == TokenType::OPERATOR) {
        std::string op = peek().text;
        int precedence = get_precedence(op);
        if (precedence < min_precedence) {
            break;
        }
        ++position;

        if (op == "&&") {
            long long right = parse_binary(precedence + 1, live && left != 0);
            left = static_cast<long long>(left != 0 && right != 0);
            continue;
        }
        if (op == "||") {
            long long right = parse_binary(precedence + 1, live && left == 0);
            left = static_cast<long long>(left != 0 || right != 0);
            continue;
        }

        // `**` is right associative.
        long long right = parse_binary(op == "**" ? precedence : precedence + 1, live);
        left = live ? apply_binary_operator(left, right, op) : 0;
    }
    return left;
}

long long ArithmeticEvaluator::parse_unary(bool live) {
    if (peek().type == TokenType::OPERATOR) {
        const std::string op = peek().text;
        if (op == "++" || op == "--") {
            ++position;
            if (peek().type != TokenType::VARIABLE) {
                throw std::runtime_error("syntax error: '" + op + "' requires a variable");
            }
            std::string name = advance().text;
            long long value = read_variable(name) + (op == "++" ? 1 : -1);
            if (live) {
                write_variable(name, value);
            }
            return value;
        }
        if (op == "!" || op == "~" || op == "-" || op == "+") {
            ++position;
            long long operand = parse_unary(live);
            if (op == "!")
                return static_cast<long long>(operand == 0);
            if (op == "~")
                return ~operand;
            if (op == "-")
                return -operand;
            return operand;
        }
    }
    return parse_postfix(live);
}

long long ArithmeticEvaluator::parse_postfix(bool live) {
    if (peek().type == TokenType::VARIABLE && position + 1 < tokens.size() &&
        tokens[position + 1].type == TokenType::OPERATOR &&
        (tokens[position + 1].text == "++" || tokens[position + 1].text == "--")) {
        std::string name = advance().text;
        std::string op = advance().text;
        long long old_value = read_variable(name);
        if (live) {
            write_variable(name, old_value + (op == "++" ? 1 : -1));
        }
        return old_value;
    }
    return parse_primary(live);
}

long long ArithmeticEvaluator::parse_primary(bool live) {
    Token token = advance();
    switch (token.type) {
        case TokenType::NUMBER:
            return token.value;
        case TokenType::VARIABLE:
            return read_variable(token.text);
        case TokenType::LPAREN: {
            long long value = parse_assignment(live);
            if (advance().type != TokenType::RPAREN) {
                throw std::runtime_error("syntax error: missing ')'");
            }
            return value;
        }
        case TokenType::END:
            throw std::runtime_error("syntax error: operand expected");
        default:
            throw std::runtime_error("syntax error: unexpected token '" + token.text + "'");
    }
}
