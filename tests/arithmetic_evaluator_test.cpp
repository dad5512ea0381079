#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>

#include "arithmetic_evaluator.h"

namespace {

class ArithmeticEvaluatorTest : public ::testing::Test {
   protected:
    long long eval(const std::string& expr) {
        ArithmeticEvaluator evaluator(
            [this](const std::string& name) {
                auto it = vars.find(name);
                return it == vars.end() ? 0LL : it->second;
            },
            [this](const std::string& name, long long value) { vars[name] = value; });
        return evaluator.evaluate(expr);
    }

    std::map<std::string, long long> vars;
};

}  // namespace

TEST_F(ArithmeticEvaluatorTest, PrecedenceAndGrouping) {
    EXPECT_EQ(eval("1 + 2 * 3"), 7);
    EXPECT_EQ(eval("(1 + 2) * 3"), 9);
    EXPECT_EQ(eval("10 - 4 - 3"), 3);
    EXPECT_EQ(eval("17 % 5 + 1 << 2"), 12);
    EXPECT_EQ(eval("1 + 2 == 3 && 4 > 3"), 1);
    EXPECT_EQ(eval("6 & 3 | 8 ^ 1"), 11);
    EXPECT_EQ(eval("!0 + ~0"), 0);
    EXPECT_EQ(eval("-3 + +5"), 2);
    EXPECT_EQ(eval(""), 0);
}

TEST_F(ArithmeticEvaluatorTest, PowerIsRightAssociative) {
    EXPECT_EQ(eval("2 ** 3 ** 2"), 512);
    EXPECT_EQ(eval("2 * 3 ** 2"), 18);
    EXPECT_EQ(eval("7 ** 0"), 1);
}

TEST_F(ArithmeticEvaluatorTest, NumberBases) {
    EXPECT_EQ(eval("0x1f"), 31);
    EXPECT_EQ(eval("010"), 8);
    EXPECT_THROW(eval("09"), std::runtime_error);
}

TEST_F(ArithmeticEvaluatorTest, VariablesAndAssignment) {
    vars["x"] = 4;
    EXPECT_EQ(eval("x * $x"), 16);
    EXPECT_EQ(eval("unset_name + 1"), 1);

    EXPECT_EQ(eval("y = x + 1"), 5);
    EXPECT_EQ(vars["y"], 5);
    eval("y += 10");
    eval("y <<= 1");
    EXPECT_EQ(vars["y"], 30);
    eval("a = b = 7");
    EXPECT_EQ(vars["a"], 7);
    EXPECT_EQ(vars["b"], 7);
}

TEST_F(ArithmeticEvaluatorTest, IncrementAndDecrement) {
    vars["i"] = 5;
    EXPECT_EQ(eval("i++"), 5);
    EXPECT_EQ(vars["i"], 6);
    EXPECT_EQ(eval("++i"), 7);
    EXPECT_EQ(eval("i--"), 7);
    EXPECT_EQ(eval("--i"), 5);
    EXPECT_EQ(vars["i"], 5);
}

// the branch not taken is parsed but has no side effects
TEST_F(ArithmeticEvaluatorTest, ShortCircuitAndTernaryAreLazy) {
    EXPECT_EQ(eval("0 && (z = 1)"), 0);
    EXPECT_EQ(eval("1 || 1 / 0"), 1);
    EXPECT_EQ(vars.count("z"), 0u);

    EXPECT_EQ(eval("1 ? 2 : 1 / 0"), 2);
    EXPECT_EQ(eval("0 ? (w = 9) : 3"), 3);
    EXPECT_EQ(vars.count("w"), 0u);
    EXPECT_EQ(eval("1 ? 0 ? 4 : 5 : 6"), 5);
}

TEST_F(ArithmeticEvaluatorTest, ErrorsThrow) {
    try {
        eval("5 / 0");
        FAIL() << "expected division error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "division by 0");
    }
    EXPECT_THROW(eval("5 % 0"), std::runtime_error);
    EXPECT_THROW(eval("2 ** -1"), std::runtime_error);
    EXPECT_THROW(eval("(1 + 2"), std::runtime_error);
    EXPECT_THROW(eval("1 +"), std::runtime_error);
    EXPECT_THROW(eval("1 2"), std::runtime_error);
    EXPECT_THROW(eval("1 ? 2"), std::runtime_error);
    EXPECT_THROW(eval("++3"), std::runtime_error);
    EXPECT_THROW(eval("3 @ 4"), std::runtime_error);
}
