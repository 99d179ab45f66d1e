#include <gtest/gtest.h>
#include "bound_expression.hpp"
#include "errors.hpp"
#include "mesh.hpp"
#include <cmath>

namespace {

double eval(const std::string& text, const asian_pricer::ExpressionVariables& variables = {}) {
    return asian_pricer::BoundExpression::parse(text).evaluate(variables);
}

} // namespace

TEST(BoundExpressionTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(eval("1 + 2 * 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("10 - 4 - 3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("8 / 4 / 2"), 1.0);
    EXPECT_DOUBLE_EQ(eval("2 ^ 3 ^ 2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-2 ^ 2"), -4.0);
    EXPECT_DOUBLE_EQ(eval("2 ^ -1"), 0.5);
    EXPECT_DOUBLE_EQ(eval("--3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("1.5e-1 * 2"), 0.3);
    EXPECT_DOUBLE_EQ(eval(".5"), 0.5);
}

TEST(BoundExpressionTest, FunctionsAndConstants) {
    EXPECT_DOUBLE_EQ(eval("exp(0)"), 1.0);
    EXPECT_DOUBLE_EQ(eval("log(e)"), 1.0);
    EXPECT_DOUBLE_EQ(eval("sqrt(16)"), 4.0);
    EXPECT_DOUBLE_EQ(eval("abs(-2.5)"), 2.5);
    EXPECT_DOUBLE_EQ(eval("min(3, -1)"), -1.0);
    EXPECT_DOUBLE_EQ(eval("max(3, -1)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("2 * pi"), 2.0 * std::acos(-1.0));
}

TEST(BoundExpressionTest, Variables) {
    asian_pricer::ModelParameters p;
    p.M = 50;
    p.N = 100;
    p.xMin = -5.0;
    p.xMax = 5.0;
    p.T = 1.0;
    p.sigma = 0.2;
    p.r = 0.05;
    const auto c = asian_pricer::SchemeCoefficients::fromSteps(0.2, 2e-4);
    const auto vars = asian_pricer::boundVariables(p, c);

    EXPECT_EQ(vars.size(), asian_pricer::boundVariableNames().size());
    EXPECT_DOUBLE_EQ(eval("x_min + 2 * h", vars), -4.6);
    EXPECT_DOUBLE_EQ(eval("x_max / 2", vars), 2.5);
    EXPECT_DOUBLE_EQ(eval("N * k", vars), 0.02);
    EXPECT_DOUBLE_EQ(eval("tau_max", vars), p.tauMax());
    EXPECT_DOUBLE_EQ(eval("log(1 / T) - sigma + r", vars), -0.15);
    EXPECT_DOUBLE_EQ(eval("M", vars), 50.0);
}

TEST(BoundExpressionTest, CompiledOnceEvaluatedMany) {
    const auto expression = asian_pricer::BoundExpression::parse("x_min + 0.25 * (x_max - x_min)");
    EXPECT_EQ(expression.text(), "x_min + 0.25 * (x_max - x_min)");

    EXPECT_DOUBLE_EQ(expression.evaluate({{"x_min", 0.0}, {"x_max", 4.0}}), 1.0);
    EXPECT_DOUBLE_EQ(expression.evaluate({{"x_min", -2.0}, {"x_max", 2.0}}), -1.0);
    EXPECT_THROW(expression.evaluate({{"x_min", 0.0}}), asian_pricer::ExpressionError);
}

TEST(BoundExpressionTest, MalformedInputIsRejected) {
    const char* bad[] = {
        "", "   ", "1 +", "(1 + 2", "1 + 2)", "2 * * 3", "foo", "x_min + y",
        "exp(1, 2)", "max(1)", "unknown(1)", "1 2", "3 $ 4", "__import__('os')",
    };
    for (const char* text : bad) {
        EXPECT_THROW(asian_pricer::BoundExpression::parse(text), asian_pricer::ExpressionError) << text;
    }
}

TEST(BoundExpressionTest, NumbersAreDecimalLiterals) {
    EXPECT_DOUBLE_EQ(eval("1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(eval("2.5E+1"), 25.0);
    EXPECT_DOUBLE_EQ(eval("4."), 4.0);
    EXPECT_DOUBLE_EQ(eval("2e-1-1"), -0.8);

    const char* bad[] = {"0x1p3", "0x10", "2e", "1e+", "1.2.3", "3h", "inf", "nan", "."};
    for (const char* text : bad) {
        EXPECT_THROW(asian_pricer::BoundExpression::parse(text), asian_pricer::ExpressionError) << text;
    }
}

TEST(BoundExpressionTest, NonFiniteResultIsRejected) {
    EXPECT_THROW(eval("log(0)"), asian_pricer::ExpressionError);
    EXPECT_THROW(eval("1 / 0"), asian_pricer::ExpressionError);
    EXPECT_THROW(eval("sqrt(-1)"), asian_pricer::ExpressionError);

    asian_pricer::BoundExpression unparsed;
    EXPECT_THROW(unparsed.evaluate({}), asian_pricer::ExpressionError);
}
