#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "interpreter_utils.h"
#include "script_error.h"

using interpreter_utils::normalize_script;
using interpreter_utils::StatementKind;

using Lines = std::vector<std::string>;

// one-line compound statements become one statement per line
TEST(NormalizeScript, SplitsStatementsAndLeadingKeywords) {
    auto script = normalize_script("for i in 1 2 3; do echo $i; done\n", 0);
    EXPECT_EQ(script.lines, Lines({"for i in 1 2 3", "do", "echo $i", "done"}));

    auto if_script = normalize_script("if true; then echo a; else echo b; fi", 0);
    EXPECT_EQ(if_script.lines, Lines({"if true", "then", "echo a", "else", "echo b", "fi"}));
}

TEST(NormalizeScript, CaseTerminatorsStayWithTheirClause) {
    auto script = normalize_script("case $x in a) echo a ;; b) echo b ;& *) echo c ;;& esac", 0);
    EXPECT_EQ(script.lines,
              Lines({"case $x in", "a) echo a ;;", "b) echo b ;&", "*) echo c ;;&", "esac"}));
}

TEST(NormalizeScript, QuotesSubstitutionsAndArithmeticAreNotSplit) {
    auto script = normalize_script(
        "echo 'a;b' \"c;d\" $(x; y) ${v:-;}\nfor ((i=0; i<2; i++)); do :; done", 0);
    EXPECT_EQ(script.lines, Lines({"echo 'a;b' \"c;d\" $(x; y) ${v:-;}", "for ((i=0; i<2; i++))",
                                   "do", ":", "done"}));
}

// `#` starts a comment only at the start of a word
TEST(NormalizeScript, CommentsAndHashInsideWords) {
    auto script = normalize_script("# header\necho $# ${#x} # trailing\n\n   \necho a#b", 0);
    EXPECT_EQ(script.lines, Lines({"echo $# ${#x}", "echo a#b"}));
}

TEST(NormalizeScript, HeredocBodiesPassThroughWithLineNumbers) {
    auto script = normalize_script("cat <<EOF; echo after\na; b\nEOF\necho done", 0);
    EXPECT_EQ(script.lines, Lines({"cat <<EOF; echo after", "a; b", "EOF", "echo done"}));
    EXPECT_EQ(script.line_numbers, std::vector<std::size_t>({1, 2, 3, 4}));
}

TEST(NormalizeScript, ContinuationsAndMultiLineQuotes) {
    auto script = normalize_script("echo one \\\n  two\necho \"x\ny\"\necho z", 0);
    ASSERT_EQ(script.lines.size(), 3u);
    EXPECT_EQ(script.lines[0], "echo one   two");
    EXPECT_EQ(script.lines[1], "echo \"x\ny\"");
    EXPECT_EQ(script.line_numbers, std::vector<std::size_t>({1, 3, 5}));
}

// a `for ((` header spread over several lines is one statement
TEST(NormalizeScript, WrappedArithmeticHeaderIsJoined) {
    auto script = normalize_script("for ((i=0;\n      i<2;\n      i++)); do\n  log $i\ndone", 0);
    ASSERT_EQ(script.lines.size(), 4u);
    EXPECT_EQ(script.lines[0].rfind("for ((i=0;", 0), 0u);
    EXPECT_NE(script.lines[0].find("i<2;"), std::string::npos);
    EXPECT_NE(script.lines[0].find("i++))"), std::string::npos);
    EXPECT_EQ(script.lines[1], "do");
    EXPECT_EQ(script.lines[3], "done");
    EXPECT_EQ(script.line_numbers, std::vector<std::size_t>({1, 1, 4, 5}));
}

TEST(NormalizeScript, HeredocAfterLoopKeepsTheLoopLines) {
    auto script = normalize_script("while read l; do x=$l; done <<EOF\nq\nEOF", 0);
    EXPECT_EQ(script.lines, Lines({"while read l", "do", "x=$l", "done <<EOF", "q", "EOF"}));
}

TEST(NormalizeScript, LineLimitIsACapacityError) {
    try {
        normalize_script("a\nb\nc\n", 2);
        FAIL() << "expected TOO_MANY_LINES";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.code(), ScriptErrorCode::TOO_MANY_LINES);
        EXPECT_EQ(e.category(), ScriptErrorCategory::CAPACITY);
    }
}

TEST(InterpreterUtils, ClassifyStatement) {
    using interpreter_utils::classify_statement;
    EXPECT_EQ(classify_statement("if [ -f x ]"), StatementKind::IF);
    EXPECT_EQ(classify_statement("while true"), StatementKind::WHILE);
    EXPECT_EQ(classify_statement("until false"), StatementKind::UNTIL);
    EXPECT_EQ(classify_statement("for x in a"), StatementKind::FOR);
    EXPECT_EQ(classify_statement("for ((i=0;i<2;i++))"), StatementKind::C_STYLE_FOR);
    EXPECT_EQ(classify_statement("for((;;))"), StatementKind::C_STYLE_FOR);
    EXPECT_EQ(classify_statement("select x in a"), StatementKind::SELECT);
    EXPECT_EQ(classify_statement("case $x in"), StatementKind::CASE);
    EXPECT_EQ(classify_statement("iffy arg"), StatementKind::NONE);
    EXPECT_EQ(classify_statement("format disk"), StatementKind::NONE);
}

TEST(InterpreterUtils, ParseLoopControl) {
    using interpreter_utils::parse_loop_control;
    EXPECT_EQ(parse_loop_control("break", "break").value_or(-1), 1);
    EXPECT_EQ(parse_loop_control("break 3", "break").value_or(-1), 3);
    EXPECT_EQ(parse_loop_control("continue 0", "continue").value_or(-1), 1);
    EXPECT_FALSE(parse_loop_control("break $n", "break").has_value());
    EXPECT_FALSE(parse_loop_control("breakfast", "break").has_value());
}

TEST(InterpreterUtils, FindHeredoc) {
    using interpreter_utils::find_heredoc;
    auto plain = find_heredoc("cat <<EOF");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->delimiter, "EOF");
    EXPECT_FALSE(plain->strip_tabs);

    auto quoted = find_heredoc("cat <<-'END' > out");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted->delimiter, "END");
    EXPECT_TRUE(quoted->strip_tabs);

    EXPECT_FALSE(find_heredoc("cat <<< word").has_value());
    EXPECT_FALSE(find_heredoc("echo '<<EOF'").has_value());
    EXPECT_FALSE(find_heredoc("echo $((1 << 2))").has_value());
}

TEST(InterpreterUtils, SplitWordsKeepsGroups) {
    auto words = interpreter_utils::split_words("a \"b c\" ${x:- y} $(echo  z) 'q r'");
    EXPECT_EQ(words, Lines({"a", "\"b c\"", "${x:- y}", "$(echo  z)", "'q r'"}));
}
