#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "control_flow_parser.h"
#include "script_error.h"

using namespace control_flow;

namespace {

ScriptErrorCode parse_error_code(const std::function<void()>& parse) {
    try {
        parse();
    } catch (const ScriptError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a ScriptError";
    return ScriptErrorCode::VALIDATION_FAILED;
}

}  // namespace

// then, elif and else bodies are each collected
TEST(ControlFlowParserIf, CollectsEveryClauseBody) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"if test_a", "then",     "log a", "elif test_b", "then", "log b1",
                   "log b2",    "elif test_c", "then", "log c",      "else", "log d",
                   "fi",        "log after"};

    auto parsed = parser.parse_if(lines, 0);
    EXPECT_EQ(parsed.end_index, 12u);
    EXPECT_EQ(parsed.node.condition, "test_a");
    EXPECT_EQ(parsed.node.then_body, Lines({"log a"}));
    ASSERT_EQ(parsed.node.elif_clauses.size(), 2u);
    EXPECT_EQ(parsed.node.elif_clauses[0].condition, "test_b");
    EXPECT_EQ(parsed.node.elif_clauses[0].body, Lines({"log b1", "log b2"}));
    EXPECT_EQ(parsed.node.elif_clauses[1].body, Lines({"log c"}));
    ASSERT_TRUE(parsed.node.else_body.has_value());
    EXPECT_EQ(*parsed.node.else_body, Lines({"log d"}));
}

// `if cond; then` on the header line and a nested if inside the body
TEST(ControlFlowParserIf, InlineThenAndNestedIf) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"if outer; then", "if inner; then", "log x", "fi", "fi"};

    auto parsed = parser.parse_if(lines, 0);
    EXPECT_EQ(parsed.end_index, 4u);
    EXPECT_EQ(parsed.node.condition, "outer");
    EXPECT_EQ(parsed.node.then_body, Lines({"if inner; then", "log x", "fi"}));
    EXPECT_FALSE(parsed.node.else_body.has_value());
}

TEST(ControlFlowParserIf, MissingFiIsUnterminated) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"if true", "then", "log x"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_if(lines, 0); }),
              ScriptErrorCode::UNTERMINATED_BLOCK);
}

TEST(ControlFlowParserIf, MissingThenIsInvalid) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"if true", "log x", "fi"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_if(lines, 0); }), ScriptErrorCode::INVALID_IF);
}

TEST(ControlFlowParserIf, ElifLimitIsACapacityError) {
    InterpreterLimits limits;
    limits.max_elif_clauses = 1;
    ControlFlowParser parser{limits};
    Lines lines = {"if a", "then", "x", "elif b", "then", "y", "elif c", "then", "z", "fi"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_if(lines, 0); }),
              ScriptErrorCode::TOO_MANY_ELIF_CLAUSES);
}

TEST(ControlFlowParserLoops, WhileAndUntil) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"while (( n < 3 ))", "do", "(( n++ ))", "done"};
    auto parsed = parser.parse_while(lines, 0);
    EXPECT_EQ(parsed.end_index, 3u);
    EXPECT_EQ(parsed.node.condition, "(( n < 3 ))");
    EXPECT_FALSE(parsed.node.is_until);
    EXPECT_EQ(parsed.node.body, Lines({"(( n++ ))"}));

    Lines until_lines = {"until ready; do", "wait_more", "done"};
    auto until = parser.parse_while(until_lines, 0);
    EXPECT_TRUE(until.node.is_until);
    EXPECT_EQ(until.node.condition, "ready");
    EXPECT_EQ(until.end_index, 2u);
}

// nested do-blocks keep their own done
TEST(ControlFlowParserLoops, NestedLoopsFindTheirOwnDone) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"for a in x y", "do", "while true", "do", "break 2", "done", "log $a", "done",
                   "log end"};
    auto parsed = parser.parse_for(lines, 0);
    EXPECT_EQ(parsed.end_index, 7u);
    EXPECT_EQ(parsed.node.body, Lines({"while true", "do", "break 2", "done", "log $a"}));
}

TEST(ControlFlowParserLoops, ForItemsAndDefaultItems) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"for i in 1 \"two words\" $x; do", "log $i", "done"};
    auto parsed = parser.parse_for(lines, 0);
    EXPECT_EQ(parsed.node.variable, "i");
    EXPECT_EQ(parsed.node.items, std::vector<std::string>({"1", "\"two words\"", "$x"}));

    Lines bare = {"for arg", "do", "log $arg", "done"};
    auto bare_parsed = parser.parse_for(bare, 0);
    EXPECT_EQ(bare_parsed.node.items, std::vector<std::string>({"\"$@\""}));
}

TEST(ControlFlowParserLoops, ForErrors) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines missing_in = {"for i of 1 2", "do", "done"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_for(missing_in, 0); }),
              ScriptErrorCode::INVALID_FOR);

    Lines bad_variable = {"for 1x in a", "do", "done"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_for(bad_variable, 0); }),
              ScriptErrorCode::INVALID_FOR);

    Lines no_done = {"for i in a", "do", "log $i"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_for(no_done, 0); }),
              ScriptErrorCode::UNTERMINATED_BLOCK);
}

TEST(ControlFlowParserLoops, ItemAndBodyLimits) {
    InterpreterLimits limits;
    limits.max_items = 2;
    limits.max_body_lines = 2;
    ControlFlowParser parser{limits};

    Lines many_items = {"for i in a b c", "do", "done"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_for(many_items, 0); }),
              ScriptErrorCode::TOO_MANY_ITEMS);

    Lines long_body = {"while true", "do", "one", "two", "three", "done"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_while(long_body, 0); }),
              ScriptErrorCode::TOO_MANY_LINES);
}

TEST(ControlFlowParserCStyleFor, SplitsTheThreeClauses) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"for ((i=0; i<3; i++)); do", "log $i", "done"};
    auto parsed = parser.parse_c_style_for(lines, 0);
    ASSERT_TRUE(parsed.node.init && parsed.node.condition && parsed.node.update);
    EXPECT_EQ(*parsed.node.init, "i=0");
    EXPECT_EQ(*parsed.node.condition, "i<3");
    EXPECT_EQ(*parsed.node.update, "i++");
    EXPECT_EQ(parsed.node.body, Lines({"log $i"}));
    EXPECT_EQ(parsed.end_index, 2u);
}

TEST(ControlFlowParserCStyleFor, EmptyClausesAndWrappedHeader) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines empty = {"for (( ; ; ))", "do", "break", "done"};
    auto parsed = parser.parse_c_style_for(empty, 0);
    EXPECT_FALSE(parsed.node.init.has_value());
    EXPECT_FALSE(parsed.node.condition.has_value());
    EXPECT_FALSE(parsed.node.update.has_value());

    Lines wrapped = {"for ((i=0;", "i<2;", "i++))", "do", "log $i", "done"};
    auto wrapped_parsed = parser.parse_c_style_for(wrapped, 0);
    EXPECT_EQ(*wrapped_parsed.node.condition, "i<2");
    EXPECT_EQ(wrapped_parsed.end_index, 5u);
}

TEST(ControlFlowParserCStyleFor, MalformedHeaders) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines two_clauses = {"for ((i=0; i<3))", "do", "done"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_c_style_for(two_clauses, 0); }),
              ScriptErrorCode::INVALID_C_STYLE_FOR);

    Lines unclosed = {"for ((i=0; i<3; i++)"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_c_style_for(unclosed, 0); }),
              ScriptErrorCode::INVALID_C_STYLE_FOR);
}

// only a redirection may follow the closing keyword
TEST(ControlFlowParserRedirection, TextAfterClosingKeyword) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines loop = {"while read l", "do", "log $l", "done < input.txt"};
    EXPECT_EQ(parser.parse_while(loop, 0).node.redirection, "< input.txt");

    Lines branch = {"if true", "then", "log a", "fi 2> err.txt"};
    EXPECT_EQ(parser.parse_if(branch, 0).node.redirection, "2> err.txt");

    Lines choice = {"case $x in", "a) log a ;;", "esac >> out.txt"};
    EXPECT_EQ(parser.parse_case(choice, 0).node.redirection, ">> out.txt");

    Lines plain = {"for i in a", "do", "log $i", "done"};
    EXPECT_TRUE(parser.parse_for(plain, 0).node.redirection.empty());

    Lines piped = {"for i in a", "do", "log $i", "done | sort"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_for(piped, 0); }),
              ScriptErrorCode::INVALID_LOOP);

    Lines heredoc = {"while read l", "do", "log $l", "done <<EOF", "x", "EOF"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_while(heredoc, 0); }),
              ScriptErrorCode::INVALID_LOOP);

    Lines stray = {"if true", "then", "log a", "fi && log b"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_if(stray, 0); }), ScriptErrorCode::INVALID_IF);
}

TEST(ControlFlowParserSelect, ItemsAndBody) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"select fruit in apple banana", "do", "log $fruit", "break", "done"};
    auto parsed = parser.parse_select(lines, 0);
    EXPECT_EQ(parsed.node.variable, "fruit");
    EXPECT_EQ(parsed.node.items, std::vector<std::string>({"apple", "banana"}));
    EXPECT_EQ(parsed.node.body, Lines({"log $fruit", "break"}));
    EXPECT_EQ(parsed.node.prompt, "#? ");
}

TEST(ControlFlowParserCase, PatternsAndTerminators) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"case $x in", "a|b) log ab ;;", "(c)", "log c1", "log c2 ;&",
                   "d*) log d ;;&", "*) log any", ";;", "esac"};
    auto parsed = parser.parse_case(lines, 0);
    EXPECT_EQ(parsed.end_index, 8u);
    EXPECT_EQ(parsed.node.value, "$x");
    ASSERT_EQ(parsed.node.cases.size(), 4u);

    EXPECT_EQ(parsed.node.cases[0].patterns, std::vector<std::string>({"a", "b"}));
    EXPECT_EQ(parsed.node.cases[0].body, Lines({"log ab"}));
    EXPECT_EQ(parsed.node.cases[0].terminator, CaseTerminator::NORMAL);

    EXPECT_EQ(parsed.node.cases[1].patterns, std::vector<std::string>({"c"}));
    EXPECT_EQ(parsed.node.cases[1].body, Lines({"log c1", "log c2"}));
    EXPECT_EQ(parsed.node.cases[1].terminator, CaseTerminator::FALLTHROUGH);

    EXPECT_EQ(parsed.node.cases[2].terminator, CaseTerminator::CONTINUE_TESTING);
    EXPECT_EQ(parsed.node.cases[3].body, Lines({"log any"}));
    EXPECT_EQ(parsed.node.cases[3].terminator, CaseTerminator::NORMAL);
}

// a nested case keeps its terminators inside the outer clause body
TEST(ControlFlowParserCase, NestedCase) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"case $a in", "x)", "case $b in", "y) log xy ;;", "esac ;;", "z) log z ;;",
                   "esac"};
    auto parsed = parser.parse_case(lines, 0);
    ASSERT_EQ(parsed.node.cases.size(), 2u);
    EXPECT_EQ(parsed.node.cases[0].body, Lines({"case $b in", "y) log xy ;;", "esac"}));
    EXPECT_EQ(parsed.node.cases[1].patterns, std::vector<std::string>({"z"}));
}

TEST(ControlFlowParserCase, HeaderAndLimits) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines no_in = {"case $x", "a) log a ;;", "esac"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_case(no_in, 0); }),
              ScriptErrorCode::INVALID_CASE);

    Lines no_esac = {"case $x in", "a) log a ;;"};
    EXPECT_EQ(parse_error_code([&] { parser.parse_case(no_esac, 0); }),
              ScriptErrorCode::UNTERMINATED_BLOCK);

    InterpreterLimits limits;
    limits.max_case_patterns = 2;
    ControlFlowParser small{limits};
    Lines many_patterns = {"case $x in", "a|b|c) log abc ;;", "esac"};
    EXPECT_EQ(parse_error_code([&] { small.parse_case(many_patterns, 0); }),
              ScriptErrorCode::TOO_MANY_PATTERNS);
}

// longest terminator wins
TEST(ControlFlowParserCase, DetectTerminator) {
    std::string body;
    EXPECT_EQ(ControlFlowParser::detect_terminator("echo a ;;&", body),
              CaseTerminator::CONTINUE_TESTING);
    EXPECT_EQ(body, "echo a");
    EXPECT_EQ(ControlFlowParser::detect_terminator("echo b;&", body),
              CaseTerminator::FALLTHROUGH);
    EXPECT_EQ(body, "echo b");
    EXPECT_EQ(ControlFlowParser::detect_terminator(";;", body), CaseTerminator::NORMAL);
    EXPECT_EQ(body, "");
    EXPECT_FALSE(ControlFlowParser::detect_terminator("echo c", body).has_value());
}

TEST(ControlFlowParserStatement, ReturnsEndIndexForEachConstruct) {
    ControlFlowParser parser{InterpreterLimits{}};
    Lines lines = {"log start", "if a", "then", "x", "fi", "case $v in", "*) y ;;", "esac"};
    EXPECT_EQ(parser.parse_statement(lines, 0), 0u);
    EXPECT_EQ(parser.parse_statement(lines, 1), 4u);
    EXPECT_EQ(parser.parse_statement(lines, 5), 7u);
}
