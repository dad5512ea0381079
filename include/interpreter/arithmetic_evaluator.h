#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Integer arithmetic for `((...))` and `$((...))`. Variables are read and written through the
// supplied callbacks; unset or non-numeric variables read as 0. Errors throw std::runtime_error.
class ArithmeticEvaluator {
   public:
    using VariableReader = std::function<long long(const std::string&)>;
    using VariableWriter = std::function<void(const std::string&, long long)>;

    ArithmeticEvaluator(VariableReader var_reader, VariableWriter var_writer);
    long long evaluate(const std::string& expr);

   private:
    enum class TokenType : std::uint8_t {
        NUMBER,
        VARIABLE,
        OPERATOR,
        LPAREN,
        RPAREN,
        END
    };

    struct Token {
        TokenType type{};
        long long value{};
        std::string text;
    };

    VariableReader read_variable;
    VariableWriter write_variable;
    std::vector<Token> tokens;
    size_t position = 0;

    static std::vector<Token> tokenize(const std::string& expr);

    const Token& peek() const;
    Token advance();
    bool accept_operator(const std::string& op);

    long long parse_assignment(bool live);
    long long parse_ternary(bool live);
    long long parse_binary(int min_precedence, bool live);
    long long parse_unary(bool live);
    long long parse_postfix(bool live);
    long long parse_primary(bool live);

    static int get_precedence(const std::string& op);
    static long long apply_binary_operator(long long a, long long b, const std::string& op);
    static long long fast_pow(long long base, long long exp);
};
