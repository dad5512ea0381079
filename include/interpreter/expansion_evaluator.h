#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class Shell;

class ExpansionError : public std::runtime_error {
   public:
    explicit ExpansionError(const std::string& message) : std::runtime_error(message) {
    }
};

// Parameter, command and arithmetic expansion plus quote removal for shell words.
class ExpansionEvaluator {
   public:
    explicit ExpansionEvaluator(Shell& shell);

    ExpansionEvaluator(const ExpansionEvaluator&) = delete;
    ExpansionEvaluator& operator=(const ExpansionEvaluator&) = delete;

    // Expands a word to a single string without field splitting.
    std::string expand_word(const std::string& word);

    // Expands a word into fields: unquoted expansion results are split on blanks and a quoted
    // "$@" yields one field per positional parameter.
    std::vector<std::string> expand_to_words(const std::string& word);
    std::vector<std::string> expand_arguments(const std::vector<std::string>& words);

    // Heredoc bodies expand `$` forms and backquotes but keep quote characters.
    std::string expand_here_doc(const std::string& body);

    std::string command_substitution(const std::string& command);
    long long evaluate_arithmetic(const std::string& expr);

    // Status of the most recent command substitution since the last reset.
    std::optional<int> substitution_status() const {
        return last_substitution_status;
    }
    void reset_substitution_status() {
        last_substitution_status.reset();
    }

   private:
    struct Value {
        std::vector<std::string> values;
        bool multiple = false;
    };
    struct Fields;

    void expand_into(const std::string& word, Fields& fields);
    Value expand_dollar(const std::string& text, std::size_t& i);
    Value expand_braced(const std::string& inner);
    Value expand_subscript(const std::string& name, const std::string& subscript);
    Value special_parameter(char c) const;
    std::string join_values(const Value& value) const;

    Shell& shell;
    std::optional<int> last_substitution_status;
};
