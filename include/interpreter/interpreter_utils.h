#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace interpreter_utils {

enum class StatementKind : std::uint8_t {
    NONE,
    IF,
    WHILE,
    UNTIL,
    FOR,
    C_STYLE_FOR,
    SELECT,
    CASE
};

struct HeredocIntroducer {
    std::string delimiter;
    bool strip_tabs = false;
};

// Logical lines produced from script text, each with the 1-based source line it started on.
struct NormalizedScript {
    std::vector<std::string> lines;
    std::vector<std::size_t> line_numbers;
};

std::string trim(const std::string& s);
bool is_identifier(const std::string& name);
bool starts_with_keyword(const std::string& line, const std::string& keyword);
std::string after_keyword(const std::string& line, const std::string& keyword);
bool should_skip_line(const std::string& line);

StatementKind classify_statement(const std::string& line);
bool opens_do_block(const std::string& line);

// Splits on unquoted blanks, keeping quotes and ${...} / $(...) groups inside their word.
std::vector<std::string> split_words(const std::string& text);
std::vector<std::string> split_whitespace(const std::string& text);

// Returns the level of a literal `break [N]` / `continue [N]` line; 0 is treated as 1.
std::optional<int> parse_loop_control(const std::string& line, const std::string& keyword);

bool references_array_expansion(const std::string& item);

std::optional<HeredocIntroducer> find_heredoc(const std::string& line);
bool is_heredoc_terminator(const std::string& line, const HeredocIntroducer& heredoc);

// Joins a heredoc introducer line with its body and delimiter into one command unit. Returns
// the index of the delimiter line, or the last line when the delimiter is missing.
std::size_t collect_heredoc(const std::vector<std::string>& lines, std::size_t idx,
                            std::string& unit);

std::vector<std::string> split_statements(const std::string& line);
NormalizedScript normalize_script(const std::string& content, std::size_t max_lines);

}  // namespace interpreter_utils
