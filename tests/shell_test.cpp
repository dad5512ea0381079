#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "function_manager.h"
#include "script_manager.h"
#include "shell.h"

namespace fs = std::filesystem;

namespace {

class ShellTest : public ::testing::Test {
   protected:
    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "den_shell_test_XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        dir = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string path_of(const std::string& name) const {
        return (fs::path(dir) / name).string();
    }

    std::string write_file(const std::string& name, const std::string& content) const {
        std::string path = path_of(name);
        std::ofstream out(path, std::ios::trunc);
        out << content;
        return path;
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    Shell shell;
    std::string dir;
};

}  // namespace

// a local shadows the global only while the function runs
TEST_F(ShellTest, LocalsShadowGlobals) {
    int code = shell.execute(
        "x=global\n"
        "f() {\n"
        "  local x=inner\n"
        "  seen=$x\n"
        "}\n"
        "f\n"
        "after=$x\n");
    EXPECT_EQ(code, 0);
    EXPECT_EQ(shell.get_variable("seen"), "inner");
    EXPECT_EQ(shell.get_variable("after"), "global");
    EXPECT_EQ(shell.get_function_manager().call_depth(), 0u);
}

TEST_F(ShellTest, ForLoopRunsInOrder) {
    shell.execute("out=\"\"; for i in a b c; do out=\"$out$i\"; done");
    EXPECT_EQ(shell.get_variable("out"), "abc");
    EXPECT_EQ(shell.get_variable("i"), "c");
}

TEST_F(ShellTest, ForWithoutInUsesPositionals) {
    shell.set_positional_parameters({"p", "q"});
    shell.execute("out=\"\"\nfor arg\ndo\n  out=\"$out-$arg\"\ndone");
    EXPECT_EQ(shell.get_variable("out"), "-p-q");
}

TEST_F(ShellTest, BreakTwoLeavesNestedLoops) {
    shell.execute(
        "trace=\"\"\n"
        "for a in 1 2; do\n"
        "  for b in x y; do\n"
        "    trace=\"$trace$a$b\"\n"
        "    break 2\n"
        "  done\n"
        "  trace=\"${trace}-outer\"\n"
        "done\n"
        "trace=\"${trace}.\"\n");
    EXPECT_EQ(shell.get_variable("trace"), "1x.");
}

TEST_F(ShellTest, WhileUntilAndCStyleFor) {
    shell.execute(
        "n=0\n"
        "while (( n < 3 )); do n=$((n + 1)); done\n"
        "until [ $n -eq 0 ]; do n=$((n - 1)); done\n"
        "sum=0\n"
        "for ((i = 1; i <= 4; i++)); do sum=$((sum + i)); done\n");
    EXPECT_EQ(shell.get_variable("n"), "0");
    EXPECT_EQ(shell.get_variable("sum"), "10");
    EXPECT_EQ(shell.get_variable("i"), "5");
}

TEST_F(ShellTest, CStyleForHeaderMayWrapLines) {
    std::string script = write_file("wrapped.sh",
                                    "sum=0\n"
                                    "for ((i = 0;\n"
                                    "      i < 4;\n"
                                    "      i++)); do\n"
                                    "  sum=$((sum + i))\n"
                                    "done\n");
    EXPECT_EQ(shell.execute_script_file(script, {}).exit_code, 0);
    EXPECT_EQ(shell.get_variable("sum"), "6");
    EXPECT_EQ(shell.get_variable("i"), "4");
}

TEST_F(ShellTest, RedirectionAfterCompoundStatement) {
    shell.set_variable("IN", write_file("in.txt", "alpha\nbeta\n"));
    std::string out = path_of("compound.txt");
    shell.set_variable("OUT", out);
    int code = shell.execute(
        "seen=\"\"\n"
        "while read line; do seen=\"$seen[$line]\"; done < \"$IN\"\n"
        "if true; then echo inside; fi > \"$OUT\"\n"
        "for w in a b; do echo $w; done >> \"$OUT\"\n"
        "case x in x) echo matched ;; esac >> \"$OUT\"\n");
    EXPECT_EQ(code, 0);
    EXPECT_EQ(shell.get_variable("seen"), "[alpha][beta]");
    EXPECT_EQ(read_file(out), "inside\na\nb\nmatched\n");
}

TEST_F(ShellTest, PipeOrHeredocAfterCompoundStatementIsRejected) {
    EXPECT_EQ(shell.execute("for i in 1; do echo $i; done | sort\nafter=yes"), 1);
    EXPECT_FALSE(shell.find_variable("after").has_value());

    EXPECT_EQ(shell.execute("while read l; do x=$l; done <<EOF\nq\nEOF\nafter=yes"), 1);
    EXPECT_FALSE(shell.find_variable("after").has_value());
    EXPECT_FALSE(shell.find_variable("x").has_value());
}

TEST_F(ShellTest, CaseFallthroughAndDefault) {
    shell.execute(
        "v=a\n"
        "r=\"\"\n"
        "case $v in\n"
        "  a) r=\"${r}A\" ;&\n"
        "  b) r=\"${r}B\" ;;\n"
        "  *) r=\"${r}Z\" ;;\n"
        "esac\n"
        "case other in x|y) d=xy ;; *) d=default ;; esac\n");
    EXPECT_EQ(shell.get_variable("r"), "AB");
    EXPECT_EQ(shell.get_variable("d"), "default");
}

TEST_F(ShellTest, RecursiveFunctionWithPositionals) {
    int code = shell.execute(
        "fact() {\n"
        "  if (( $1 <= 1 )); then\n"
        "    result=1\n"
        "  else\n"
        "    fact $(( $1 - 1 ))\n"
        "    result=$(( result * $1 ))\n"
        "  fi\n"
        "}\n"
        "fact 5\n");
    EXPECT_EQ(code, 0);
    EXPECT_EQ(shell.get_variable("result"), "120");
}

TEST_F(ShellTest, ReturnSetsFunctionStatus) {
    shell.execute(
        "check() {\n"
        "  if [ \"$1\" = yes ]; then return 0; fi\n"
        "  return 3\n"
        "}\n"
        "check no\n"
        "first=$?\n"
        "check yes\n"
        "second=$?\n");
    EXPECT_EQ(shell.get_variable("first"), "3");
    EXPECT_EQ(shell.get_variable("second"), "0");
}

// unbounded recursion fails the script but leaves the shell usable
TEST_F(ShellTest, StatusIsVisibleToTheNextCommand) {
    std::string out = path_of("status.txt");
    shell.set_variable("OUT", out);
    shell.execute(
        "false; echo \"status=$?\" > \"$OUT\"\n"
        "f() { return 7; }\n"
        "f; echo \"f=$?\" >> \"$OUT\"\n"
        "g() {\n"
        "  for i in 1 2; do\n"
        "    return 3\n"
        "  done\n"
        "}\n"
        "g; echo \"g=$?\" >> \"$OUT\"\n");
    EXPECT_EQ(read_file(out), "status=1\nf=7\ng=3\n");
}

// a bare assignment reports the status of its command substitution
TEST_F(ShellTest, AssignmentStatusComesFromSubstitution) {
    shell.execute("x=$(false)\na=$?\ny=$(true)\nb=$?\nfalse\nz=plain\nc=$?");
    EXPECT_EQ(shell.get_variable("a"), "1");
    EXPECT_EQ(shell.get_variable("b"), "0");
    EXPECT_EQ(shell.get_variable("c"), "0");
}

TEST_F(ShellTest, FuncnameIsUnsetAfterTopLevelCall) {
    shell.execute("f() { inside=$FUNCNAME; }\nf\nafter=${FUNCNAME-unset}");
    EXPECT_EQ(shell.get_variable("inside"), "f");
    EXPECT_EQ(shell.get_variable("after"), "unset");
}

TEST_F(ShellTest, RecursionLimitUnwindsCleanly) {
    int code = shell.execute("dive() { dive; }\ndive\nreached=yes");
    EXPECT_EQ(code, 1);
    EXPECT_EQ(shell.get_function_manager().call_depth(), 0u);
    EXPECT_FALSE(shell.find_variable("reached").has_value());

    EXPECT_EQ(shell.execute("ok() { value=fine; }\nok"), 0);
    EXPECT_EQ(shell.get_variable("value"), "fine");
}

TEST_F(ShellTest, IndexedAndAssociativeArrays) {
    shell.execute(
        "arr=(one two three)\n"
        "n=${#arr[@]}\n"
        "second=${arr[1]}\n"
        "last=${arr[-1]}\n"
        "arr[5]=six\n"
        "joined=\"\"\n"
        "for e in \"${arr[@]}\"; do joined=\"$joined[$e]\"; done\n"
        "declare -A colors\n"
        "colors[sky]=blue\n"
        "sky=${colors[sky]}\n");
    EXPECT_EQ(shell.get_variable("n"), "3");
    EXPECT_EQ(shell.get_variable("second"), "two");
    EXPECT_EQ(shell.get_variable("last"), "three");
    ASSERT_NE(shell.find_array("arr"), nullptr);
    EXPECT_EQ(shell.find_array("arr")->size(), 6u);
    EXPECT_EQ(shell.get_variable("joined"), "[one][two][three][][][six]");
    EXPECT_EQ(shell.get_variable("sky"), "blue");
}

TEST_F(ShellTest, PrefixAssignmentLastsOneCommand) {
    shell.execute("unset DEN_TEMP_VALUE\nDEN_TEMP_VALUE=1 true\nr=${DEN_TEMP_VALUE:-unset}");
    EXPECT_EQ(shell.get_variable("r"), "unset");
}

TEST_F(ShellTest, SourcedScriptCanReturn) {
    std::string lib = write_file("lib.sh",
                                 "sourced=yes\n"
                                 "helper() { helped=$1; }\n"
                                 "return 4\n"
                                 "sourced=no\n");
    shell.execute("source " + lib + "\nrc=$?\nhelper ok");
    EXPECT_EQ(shell.get_variable("sourced"), "yes");
    EXPECT_EQ(shell.get_variable("rc"), "4");
    EXPECT_EQ(shell.get_variable("helped"), "ok");
}

TEST_F(ShellTest, ScriptFileGetsArgumentsAndName) {
    std::string script = write_file("args.sh",
                                    "count=$#\n"
                                    "first=$1\n"
                                    "name=$0\n");
    ScriptResult result = shell.execute_script_file(script, {"alpha", "beta"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(shell.get_variable("count"), "2");
    EXPECT_EQ(shell.get_variable("first"), "alpha");
    EXPECT_EQ(shell.get_variable("name"), script);

    EXPECT_EQ(shell.execute_script_file(path_of("missing.sh"), {}).exit_code, 127);
}

TEST_F(ShellTest, ErrTrapAndExitTrap) {
    shell.execute("trap 'failures=$((failures + 1))' ERR\nfalse\ntrue\nfalse");
    EXPECT_EQ(shell.get_variable("failures"), "2");

    shell.execute("trap 'cleaned=yes' EXIT");
    ASSERT_TRUE(shell.get_trap("EXIT").has_value());
    shell.run_trap("EXIT");
    EXPECT_EQ(shell.get_variable("cleaned"), "yes");
    EXPECT_FALSE(shell.get_trap("EXIT").has_value());
}

TEST_F(ShellTest, ErrexitStopsScript) {
    int code = shell.execute("set -e\nstep=1\nfalse\nstep=2");
    EXPECT_EQ(code, 1);
    EXPECT_EQ(shell.get_variable("step"), "1");
}

TEST_F(ShellTest, ExitStopsWithItsCode) {
    int code = shell.execute("a=1\nexit 3\na=2");
    EXPECT_EQ(code, 3);
    EXPECT_TRUE(shell.exit_requested());
    EXPECT_EQ(shell.get_variable("a"), "1");
}

TEST_F(ShellTest, SyntaxErrorsAreReported) {
    EXPECT_EQ(shell.execute("echo \"open"), 2);
    EXPECT_EQ(shell.execute("if true; then\n  x=1\n"), 1);
    EXPECT_FALSE(shell.find_variable("x").has_value());
}

TEST_F(ShellTest, OutputRedirectionAndExternalCommands) {
    std::string out = path_of("out.txt");
    shell.set_variable("OUT", out);
    shell.execute(
        "for w in one two; do echo \"word $w\" >> \"$OUT\"; done\n"
        "cat <<EOF >> \"$OUT\"\n"
        "total: $((1 + 2))\n"
        "EOF\n");
    EXPECT_EQ(read_file(out), "word one\nword two\ntotal: 3\n");

    std::string piped = path_of("piped.txt");
    shell.set_variable("PIPED", piped);
    EXPECT_EQ(shell.execute("echo shout | tr a-z A-Z > \"$PIPED\""), 0);
    EXPECT_EQ(read_file(piped), "SHOUT\n");
}

TEST_F(ShellTest, CommandSubstitutionAndStatus) {
    shell.execute("greeting=$(echo hi there)\nfalse\nstatus=$?");
    EXPECT_EQ(shell.get_variable("greeting"), "hi there");
    EXPECT_EQ(shell.get_variable("status"), "1");
}
