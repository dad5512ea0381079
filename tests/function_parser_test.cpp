#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "function_parser.h"
#include "script_error.h"

using control_flow::Lines;
using function_evaluator::TypedParam;

namespace {

ScriptErrorCode parse_failure(const FunctionParser& parser, const Lines& lines) {
    try {
        parser.parse_function(lines, 0);
    } catch (const ScriptError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a ScriptError";
    return ScriptErrorCode::VALIDATION_FAILED;
}

}  // namespace

TEST(FunctionParser, RecognisesHeaderForms) {
    FunctionParser parser{InterpreterLimits{}};
    EXPECT_TRUE(parser.is_function_definition({"greet() {"}, 0));
    EXPECT_TRUE(parser.is_function_definition({"function greet {"}, 0));
    EXPECT_TRUE(parser.is_function_definition({"function greet() { echo hi; }"}, 0));
    EXPECT_TRUE(parser.is_function_definition({"greet()", "{", "}"}, 0));
    EXPECT_TRUE(parser.is_function_definition({"my-func.v2 () {"}, 0));
    EXPECT_FALSE(parser.is_function_definition({"greet()", "echo hi"}, 0));
    EXPECT_FALSE(parser.is_function_definition({"echo greet"}, 0));
    EXPECT_FALSE(parser.is_function_definition({"arr=(a b)"}, 0));
}

TEST(FunctionParser, BraceOnNextLine) {
    FunctionParser parser{InterpreterLimits{}};
    Lines lines = {"greet()", "{", "echo hello", "echo $1", "}", "echo after"};
    auto parsed = parser.parse_function(lines, 0);
    EXPECT_EQ(parsed.node.name, "greet");
    EXPECT_EQ(parsed.node.body, Lines({"echo hello", "echo $1"}));
    EXPECT_EQ(parsed.end_index, 4u);
}

TEST(FunctionParser, SingleLineAndTrailingBrace) {
    FunctionParser parser{InterpreterLimits{}};
    auto one_line = parser.parse_function({"function f { echo a; echo b; }"}, 0);
    EXPECT_EQ(one_line.node.body, Lines({"echo a; echo b;"}));
    EXPECT_EQ(one_line.end_index, 0u);

    auto trailing = parser.parse_function({"g() { echo first", "echo last }"}, 0);
    EXPECT_EQ(trailing.node.body, Lines({"echo first", "echo last"}));
    EXPECT_EQ(trailing.end_index, 1u);
}

// braces inside quotes and ${...} do not close the body
TEST(FunctionParser, NestedAndQuotedBraces) {
    FunctionParser parser{InterpreterLimits{}};
    Lines lines = {"f() {", "echo \"}\" '{'", "echo ${x:-y}", "if true; then { echo g; }; fi",
                   "}"};
    auto parsed = parser.parse_function(lines, 0);
    EXPECT_EQ(parsed.end_index, 4u);
    EXPECT_EQ(parsed.node.body.size(), 3u);
}

TEST(FunctionParser, HeredocInsideBody) {
    FunctionParser parser{InterpreterLimits{}};
    Lines lines = {"f() {", "cat <<EOF", "}", "EOF", "}"};
    auto parsed = parser.parse_function(lines, 0);
    EXPECT_EQ(parsed.node.body, Lines({"cat <<EOF", "}", "EOF"}));
    EXPECT_EQ(parsed.end_index, 4u);
}

TEST(FunctionParser, Errors) {
    FunctionParser parser{InterpreterLimits{}};
    EXPECT_EQ(parse_failure(parser, {"f() {", "echo never closed"}),
              ScriptErrorCode::UNMATCHED_BRACES);
    EXPECT_EQ(parse_failure(parser, {"function f", "echo no brace"}),
              ScriptErrorCode::INVALID_FUNCTION);

    InterpreterLimits limits;
    limits.max_function_lines = 2;
    FunctionParser small{limits};
    EXPECT_EQ(parse_failure(small, {"f() {", "a", "b", "c", "}"}),
              ScriptErrorCode::FUNCTION_TOO_LARGE);
}

TEST(FunctionParser, TypedParametersAndReturnType) {
    FunctionParser parser{InterpreterLimits{}};
    auto parsed = parser.parse_function(
        {"function deploy [target: string, retries?: int = 3, --force(-f), --tag: string, "
         "...rest] -> int {",
         "echo $target", "}"},
        0);

    EXPECT_EQ(parsed.node.return_type.value_or(""), "int");
    ASSERT_TRUE(parsed.node.typed_params.has_value());
    const auto& params = *parsed.node.typed_params;
    ASSERT_EQ(params.size(), 5u);

    EXPECT_EQ(params[0].name, "target");
    EXPECT_EQ(params[0].type_hint.value_or(""), "string");
    EXPECT_FALSE(params[0].is_optional);

    EXPECT_EQ(params[1].name, "retries");
    EXPECT_TRUE(params[1].is_optional);
    EXPECT_EQ(params[1].default_value.value_or(""), "3");

    EXPECT_TRUE(params[2].is_flag);
    EXPECT_EQ(params[2].name, "force");
    EXPECT_EQ(params[2].short_flag.value_or(""), "f");
    EXPECT_EQ(params[2].type_hint.value_or(""), "bool");

    EXPECT_TRUE(params[3].is_flag);
    EXPECT_EQ(params[3].type_hint.value_or(""), "string");

    EXPECT_TRUE(params[4].is_rest);
    EXPECT_EQ(params[4].type_hint.value_or(""), "list");
}

TEST(FunctionParser, TypedParameterErrors) {
    FunctionParser parser{InterpreterLimits{}};
    EXPECT_THROW(parser.parse_typed_params("a, b"), ScriptError);
    EXPECT_THROW(parser.parse_typed_params("[1bad]"), ScriptError);
    EXPECT_THROW(parser.parse_typed_params("[--flag(-ff)]"), ScriptError);
    EXPECT_TRUE(parser.parse_typed_params("[ , a, ]").size() == 1);

    InterpreterLimits limits;
    limits.max_typed_params = 2;
    FunctionParser small{limits};
    try {
        small.parse_typed_params("[a, b, c]");
        FAIL() << "expected TOO_MANY_PARAMETERS";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.code(), ScriptErrorCode::TOO_MANY_PARAMETERS);
    }
}

// flag arguments do not count towards the positional total
TEST(FunctionParser, ValidateTypedArgs) {
    FunctionParser parser{InterpreterLimits{}};
    auto params = parser.parse_typed_params("[name, count?, --verbose(-v), --level: int]");

    EXPECT_FALSE(FunctionParser::validate_typed_args(params, {"x"}).has_value());
    EXPECT_FALSE(
        FunctionParser::validate_typed_args(params, {"-v", "x", "--level", "2", "3"}).has_value());

    auto missing = FunctionParser::validate_typed_args(params, {"--verbose"});
    ASSERT_TRUE(missing.has_value());
    EXPECT_NE(missing->find("missing required argument"), std::string::npos);

    auto extra = FunctionParser::validate_typed_args(params, {"a", "b", "c"});
    ASSERT_TRUE(extra.has_value());
    EXPECT_NE(extra->find("too many arguments"), std::string::npos);

    auto with_rest = parser.parse_typed_params("[first, ...others]");
    EXPECT_FALSE(
        FunctionParser::validate_typed_args(with_rest, {"a", "b", "c", "d"}).has_value());
}

TEST(FunctionParser, ParseReturnType) {
    EXPECT_EQ(FunctionParser::parse_return_type("f() -> string {").value_or(""), "string");
    EXPECT_FALSE(FunctionParser::parse_return_type("f() { echo -> x; }").has_value());
}
