#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "control_flow_executor.h"
#include "control_flow_parser.h"
#include "fake_host.h"
#include "function_manager.h"
#include "script_error.h"

namespace {

class FunctionManagerTest : public ::testing::Test {
   protected:
    FunctionManagerTest()
        : parser(limits),
          executor(host.context, parser),
          functions(host.context, executor, limits) {
        host.functions = &functions;
    }

    void define(const std::string& text) {
        auto lines = script_lines(text);
        ASSERT_TRUE(functions.try_define_function(lines, 0).has_value()) << text;
    }

    InterpreterLimits limits;
    FakeHost host;
    ControlFlowParser parser;
    ControlFlowExecutor executor;
    FunctionManager functions;
};

}  // namespace

TEST_F(FunctionManagerTest, DefineReplaceAndRemove) {
    define("greet() { log hello; }");
    define("other() { log other; }");
    EXPECT_TRUE(functions.has_function("greet"));
    EXPECT_EQ(functions.list_functions(), std::vector<std::string>({"greet", "other"}));

    EXPECT_TRUE(functions.mark_exported("greet"));
    define("greet() { log replaced; }");
    ASSERT_NE(functions.get_function("greet"), nullptr);
    EXPECT_EQ(functions.get_function("greet")->body, std::vector<std::string>({"log replaced"}));
    EXPECT_TRUE(functions.get_function("greet")->is_exported);

    functions.execute_function("greet", {});
    EXPECT_EQ(host.log, std::vector<std::string>({"replaced"}));

    EXPECT_TRUE(functions.remove_function("greet"));
    EXPECT_FALSE(functions.remove_function("greet"));
    EXPECT_FALSE(functions.mark_exported("missing"));
}

TEST_F(FunctionManagerTest, FrameIsReleasedAfterTheCall) {
    define(
        "show() {\n"
        "  log called\n"
        "}");
    int code = functions.execute_function("show", {"a", "b"});
    EXPECT_EQ(code, 0);
    EXPECT_EQ(functions.call_depth(), 0u);
    EXPECT_FALSE(functions.get_positional_param(0).has_value());
    EXPECT_EQ(functions.positional_count(), 0u);
}

TEST_F(FunctionManagerTest, FrameHoldsArgumentsDuringTheCall) {
    define("probe() { inspect; }");
    std::vector<std::string> seen;
    std::size_t depth = 0;
    host.context.execute_command = [&](const std::string&) {
        depth = functions.call_depth();
        for (std::size_t i = 0; i < functions.positional_count(); ++i) {
            seen.push_back(functions.get_positional_param(i).value_or("?"));
        }
        functions.shift_positional_params(1);
        seen.push_back(functions.get_positional_param(0).value_or("none"));
        return 0;
    };
    functions.execute_function("probe", {"x", "y"});
    EXPECT_EQ(depth, 1u);
    EXPECT_EQ(seen, std::vector<std::string>({"x", "y", "y"}));
}

// a local disappears with its frame and leaves the global untouched
TEST_F(FunctionManagerTest, LocalsShadowGlobalsOnlyDuringTheCall) {
    host.vars["value"] = "global";
    define(
        "f() {\n"
        "  local value=inner\n"
        "  log $value\n"
        "}");
    functions.execute_function("f", {});
    EXPECT_EQ(host.log, std::vector<std::string>({"inner"}));
    EXPECT_EQ(host.vars["value"], "global");
    EXPECT_FALSE(functions.get_local("value").has_value());
    EXPECT_FALSE(functions.has_local("value"));
}

TEST_F(FunctionManagerTest, LocalOutsideFunctionIsAnError) {
    try {
        functions.set_local("x", "1");
        FAIL() << "expected NOT_IN_FUNCTION";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.code(), ScriptErrorCode::NOT_IN_FUNCTION);
    }
    EXPECT_THROW(functions.request_return(1), ScriptError);
    EXPECT_FALSE(functions.unset_local("x"));
}

TEST_F(FunctionManagerTest, ReturnStopsTheBodyWithItsCode) {
    define(
        "f() {\n"
        "  log one\n"
        "  return 3\n"
        "  log two\n"
        "}");
    EXPECT_EQ(functions.execute_function("f", {}), 3);
    EXPECT_EQ(host.log, std::vector<std::string>({"one"}));
}

TEST_F(FunctionManagerTest, ReturnInsideLoopLeavesTheFunction) {
    define(
        "f() {\n"
        "  for i in 1 2 3; do\n"
        "    log $i\n"
        "    if eq $i 2; then return 4; fi\n"
        "  done\n"
        "  log after\n"
        "}");
    EXPECT_EQ(functions.execute_function("f", {}), 4);
    EXPECT_EQ(host.log, std::vector<std::string>({"1", "2"}));
    EXPECT_EQ(executor.loop_depth(), 0);
}

TEST_F(FunctionManagerTest, ResultIsLastStatusWithoutReturn) {
    define("f() { log a; false; }");
    EXPECT_EQ(functions.execute_function("f", {}), 1);
}

// break inside a function called from a loop ends at the function boundary
TEST_F(FunctionManagerTest, LoopSignalsStopAtFunctionBoundary) {
    define("stop_here() { break; log unreachable; }");
    auto outcome = executor.execute_body(script_lines("for i in 1 2; do stop_here; log $i; done"));
    EXPECT_TRUE(outcome.signal.is_none());
    EXPECT_EQ(host.log, std::vector<std::string>({"1", "2"}));
}

TEST_F(FunctionManagerTest, FuncnameIsScopedToTheCall) {
    host.vars["FUNCNAME"] = "outer";
    define("f() { log $FUNCNAME; }");
    functions.execute_function("f", {});
    EXPECT_EQ(host.log, std::vector<std::string>({"f"}));
    EXPECT_EQ(host.vars["FUNCNAME"], "outer");

    host.vars.erase("FUNCNAME");
    functions.execute_function("f", {});
    EXPECT_EQ(host.vars.count("FUNCNAME"), 0u);
}

TEST_F(FunctionManagerTest, RecursionBeyondMaxDepthOverflows) {
    define("dive() { dive; }");
    try {
        functions.execute_function("dive", {});
        FAIL() << "expected CALL_STACK_OVERFLOW";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.code(), ScriptErrorCode::CALL_STACK_OVERFLOW);
        EXPECT_EQ(e.category(), ScriptErrorCategory::CAPACITY);
    }
    EXPECT_EQ(functions.call_depth(), 0u);

    // the manager stays usable after unwinding
    define("ok() { log fine; }");
    EXPECT_EQ(functions.execute_function("ok", {}), 0);
    EXPECT_EQ(host.log, std::vector<std::string>({"fine"}));
}

TEST_F(FunctionManagerTest, ConfigurableDepthCountsFrames) {
    functions.set_max_call_depth(3);
    host.vars["n"] = "0";
    define(
        "count() {\n"
        "  (( n++ ))\n"
        "  count\n"
        "}");
    EXPECT_THROW(functions.execute_function("count", {}), ScriptError);
    EXPECT_EQ(host.vars["n"], "3");
}

TEST_F(FunctionManagerTest, MissingFunctionAndTooManyArguments) {
    EXPECT_THROW(functions.execute_function("nope", {}), ScriptError);

    define("f() { :; }");
    std::vector<std::string> args(limits.max_positional_params + 1, "x");
    try {
        functions.execute_function("f", args);
        FAIL() << "expected TOO_MANY_ITEMS";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.code(), ScriptErrorCode::TOO_MANY_ITEMS);
    }
}

TEST_F(FunctionManagerTest, TypedParametersBindAsLocals) {
    define(
        "function deploy [target, retries = 2, --force(-f), --tag: string, ...rest] {\n"
        "  log $target $retries $force $tag $rest\n"
        "}");
    EXPECT_EQ(functions.execute_function("deploy", {"prod", "-f", "--tag", "v1", "5", "x", "y"}),
              0);
    EXPECT_EQ(host.log, std::vector<std::string>({"prod 5 true v1 x y"}));

    host.log.clear();
    functions.execute_function("deploy", {"stage"});
    EXPECT_EQ(host.log, std::vector<std::string>({"stage 2 false"}));
}

TEST_F(FunctionManagerTest, TypedArgumentMismatchReturnsTwo) {
    define("function need [a, b] { log ran; }");
    EXPECT_EQ(functions.execute_function("need", {"only"}), 2);
    EXPECT_TRUE(host.log.empty());
    EXPECT_EQ(functions.call_depth(), 0u);
}
