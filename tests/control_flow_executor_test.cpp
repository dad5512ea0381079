#include <gtest/gtest.h>

#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include "control_flow_executor.h"
#include "control_flow_parser.h"
#include "fake_host.h"

using namespace control_flow;

namespace {

class ControlFlowExecutorTest : public ::testing::Test {
   protected:
    ControlFlowExecutorTest() : parser(limits), executor(host.context, parser) {
    }

    ExecOutcome run(const std::string& script) {
        return executor.execute_body(script_lines(script));
    }

    InterpreterLimits limits;
    FakeHost host;
    ControlFlowParser parser;
    ControlFlowExecutor executor;
};

}  // namespace

// each iteration sees its own value before the next one overwrites it
TEST_F(ControlFlowExecutorTest, ForBindsItemsInOrder) {
    auto outcome = run("for i in 1 2 3; do log $i; done");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.signal.is_none());
    EXPECT_EQ(host.log, std::vector<std::string>({"1", "2", "3"}));
    EXPECT_EQ(host.vars["i"], "3");
}

TEST_F(ControlFlowExecutorTest, ForItemsAreExpanded) {
    host.vars["first"] = "alpha";
    run("for w in $first beta; do log $w; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"alpha", "beta"}));
}

TEST_F(ControlFlowExecutorTest, BreakTwoLeavesBothLoops) {
    auto outcome = run(
        "for a in x y\n"
        "do\n"
        "  for b in 1 2 3\n"
        "  do\n"
        "    log $a$b\n"
        "    break 2\n"
        "  done\n"
        "  log outer-$a\n"
        "done\n"
        "log end\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"x1", "end"}));
    EXPECT_TRUE(outcome.signal.is_none());
    EXPECT_EQ(executor.loop_depth(), 0);
}

TEST_F(ControlFlowExecutorTest, BareContinueResumesInnermostLoop) {
    run("for a in x y\n"
        "do\n"
        "  for b in 1 2\n"
        "  do\n"
        "    if eq $b 1; then continue; fi\n"
        "    log $a$b\n"
        "  done\n"
        "  log end-$a\n"
        "done\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"x2", "end-x", "y2", "end-y"}));
}

TEST_F(ControlFlowExecutorTest, ContinueTwoResumesOuterLoop) {
    run("for a in x y; do\n"
        "  for b in 1 2; do\n"
        "    log $a$b\n"
        "    continue 2\n"
        "    log never\n"
        "  done\n"
        "  log skipped\n"
        "done\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"x1", "y1"}));
}

// a level count larger than the nesting unwinds every loop and is then dropped
TEST_F(ControlFlowExecutorTest, BreakBeyondNestingPropagatesOutOfBody) {
    auto outcome = run("for a in x y; do log $a; break 5; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"x"}));
    EXPECT_EQ(outcome.signal.kind, SignalKind::Break);
    EXPECT_EQ(outcome.signal.levels, 4);
}

TEST_F(ControlFlowExecutorTest, BreakOutsideLoopIsAnOrdinaryCommand) {
    auto outcome = run("break\nlog after");
    EXPECT_TRUE(outcome.signal.is_none());
    EXPECT_EQ(host.commands.front(), "break");
    EXPECT_EQ(host.log, std::vector<std::string>({"after"}));
}

TEST_F(ControlFlowExecutorTest, WhileAndUntilLoops) {
    host.vars["n"] = "0";
    run("while (( n < 3 )); do (( n++ )); log $n; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"1", "2", "3"}));

    host.log.clear();
    run("until (( n == 0 )); do (( n-- )); log $n; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"2", "1", "0"}));
}

TEST_F(ControlFlowExecutorTest, IfPicksFirstMatchingClause) {
    host.vars["v"] = "b";
    run("if eq $v a; then log A; elif eq $v b; then log B; elif true; then log C; else log D; fi");
    EXPECT_EQ(host.log, std::vector<std::string>({"B"}));

    host.log.clear();
    host.vars["v"] = "z";
    auto outcome = run("if eq $v a; then log A; elif eq $v b; then log B; fi");
    EXPECT_TRUE(host.log.empty());
    EXPECT_EQ(outcome.exit_code, 0);
}

// the clause after `;&` runs even though its own pattern does not match
TEST_F(ControlFlowExecutorTest, CaseFallthroughRunsNextBody) {
    host.vars["x"] = "a";
    run("case $x in\n"
        "  a) log A ;&\n"
        "  b) log B ;;\n"
        "  c) log C ;;\n"
        "esac\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"A", "B"}));
}

// `;;&` keeps testing later patterns without forcing them
TEST_F(ControlFlowExecutorTest, CaseContinueTestingChecksLaterPatterns) {
    host.vars["x"] = "abc";
    run("case $x in\n"
        "  a*) log prefix ;;&\n"
        "  x*) log x ;;\n"
        "  *c) log suffix ;;\n"
        "  *) log default ;;\n"
        "esac\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"prefix", "suffix"}));
}

TEST_F(ControlFlowExecutorTest, CasePatternsAlternativesAndQuoting) {
    host.vars["x"] = "*";
    run("case $x in\n"
        "  a|b) log ab ;;\n"
        "  \"*\") log star ;;\n"
        "esac\n");
    EXPECT_EQ(host.log, std::vector<std::string>({"star"}));

    host.log.clear();
    host.vars["x"] = "abc";
    run("case $x in a|*b*) log infix ;; esac");
    EXPECT_EQ(host.log, std::vector<std::string>({"infix"}));
}

// the update clause runs after continue but not after break
TEST_F(ControlFlowExecutorTest, CStyleForUpdateAfterContinueNotBreak) {
    auto outcome = run(
        "for ((i=0; i<5; i++)); do\n"
        "  if eq $i 1; then continue; fi\n"
        "  if eq $i 3; then break; fi\n"
        "  log $i\n"
        "done\n");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(host.log, std::vector<std::string>({"0", "2"}));
    EXPECT_EQ(host.vars["i"], "3");
}

TEST_F(ControlFlowExecutorTest, CStyleForWithoutConditionNeedsBreak) {
    run("for ((n=0; ; n++)); do if eq $n 2; then break; fi; log $n; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"0", "1"}));
}

TEST_F(ControlFlowExecutorTest, SelectBindsChoiceAndReply) {
    std::istringstream input("9\n\n2\n");
    std::ostringstream output;
    host.context.input = &input;
    host.context.output = &output;

    run("select fruit in apple banana; do log $fruit $REPLY; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"banana 2"}));
    std::string shown = output.str();
    EXPECT_NE(shown.find("1) apple\n2) banana\n"), std::string::npos);
    EXPECT_NE(shown.find("invalid selection: 9"), std::string::npos);
    EXPECT_NE(shown.find("#? "), std::string::npos);
}

TEST_F(ControlFlowExecutorTest, SelectUsesPs3AndStopsOnBreak) {
    std::istringstream input("1\n2\n");
    std::ostringstream output;
    host.context.input = &input;
    host.context.output = &output;
    host.vars["PS3"] = "pick> ";

    run("select c in one two; do log $c; break; done");
    EXPECT_EQ(host.log, std::vector<std::string>({"one"}));
    EXPECT_NE(output.str().find("pick> "), std::string::npos);
}

TEST_F(ControlFlowExecutorTest, ErrexitStopsBodyAndLoop) {
    host.errexit = true;
    auto outcome = run("for i in 1 2; do log $i; false; log after-$i; done");
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(host.log, std::vector<std::string>({"1"}));
}

TEST_F(ControlFlowExecutorTest, FailingCommandWithoutErrexitContinues) {
    auto outcome = run("false\nlog next\nfalse");
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(host.log, std::vector<std::string>({"next"}));
}

TEST_F(ControlFlowExecutorTest, StopRequestEndsLoopWith130) {
    host.stop = true;
    auto outcome = run("while true; do log spin; done");
    EXPECT_EQ(outcome.exit_code, 130);
    EXPECT_TRUE(host.log.empty());
}

// a command that cannot start is a false condition and a failed body line
TEST_F(ControlFlowExecutorTest, CommandThatCannotStart) {
    EXPECT_FALSE(executor.evaluate_condition("fail-to-start"));
    auto outcome = run("if fail-to-start; then log yes; else log no; fi\nfail-to-start");
    EXPECT_EQ(host.log, std::vector<std::string>({"no"}));
    EXPECT_EQ(outcome.exit_code, 1);
}

TEST_F(ControlFlowExecutorTest, PendingReturnSignalPropagatesThroughLoops) {
    host.context.poll_signal = [this]() {
        if (!host.log.empty() && host.log.back() == "2") {
            return ControlSignal::return_code(7);
        }
        return ControlSignal::none();
    };
    auto outcome = run("for i in 1 2 3; do while true; do log $i; break; done; done");
    EXPECT_EQ(outcome.signal.kind, SignalKind::Return);
    EXPECT_EQ(outcome.signal.code, 7);
    EXPECT_EQ(host.log, std::vector<std::string>({"1", "2"}));
}

// the host wraps the whole statement, not each command in it
TEST_F(ControlFlowExecutorTest, TrailingRedirectionWrapsTheStatement) {
    std::vector<std::string> redirections;
    host.context.with_redirection = [&](const std::string& redirection,
                                        const std::function<ExecOutcome()>& body) {
        redirections.push_back(redirection);
        host.log.push_back("open");
        ExecOutcome outcome = body();
        host.log.push_back("close");
        return outcome;
    };
    auto outcome = run("for i in 1 2; do log $i; done > out.txt\nif true; then log yes; fi");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(redirections, std::vector<std::string>({"> out.txt"}));
    EXPECT_EQ(host.log, std::vector<std::string>({"open", "1", "2", "close", "yes"}));
}

TEST_F(ControlFlowExecutorTest, RedirectionWithoutHostSupportFails) {
    auto outcome = run("while true; do log never; done < in.txt");
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_TRUE(host.log.empty());
}

TEST_F(ControlFlowExecutorTest, HeredocLinesRunAsOneUnit) {
    run("for i in 1; do\ncat <<EOF\nbody $i\nEOF\nlog done\ndone");
    ASSERT_GE(host.commands.size(), 2u);
    EXPECT_EQ(host.commands[0], "cat <<EOF\nbody $i\nEOF");
    EXPECT_EQ(host.log, std::vector<std::string>({"done"}));
}
