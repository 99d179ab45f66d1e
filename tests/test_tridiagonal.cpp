#include <gtest/gtest.h>
#include "tridiagonal.hpp"
#include "errors.hpp"
#include <cmath>
#include <vector>

namespace {

void expectSolves(const asian_pricer::TridiagonalMatrix& A, const std::vector<double>& expected) {
    const auto b = A.multiply(expected);
    const auto x = asian_pricer::solveTridiagonal(A, b);
    ASSERT_EQ(x.size(), expected.size());
    for (size_t i = 0; i < x.size(); ++i) {
        EXPECT_NEAR(x[i], expected[i], 1e-12 * std::max(1.0, std::abs(expected[i])));
    }
}

} // namespace

TEST(TridiagonalTest, DiagonallyDominantSystem) {
    const size_t n = 8;
    asian_pricer::TridiagonalMatrix A(n);
    for (size_t i = 0; i < n; ++i) {
        A.setRow(i, -1.0, 4.0, -1.0);
    }

    EXPECT_EQ(A.at(0, 0), 4.0);
    EXPECT_EQ(A.at(3, 2), -1.0);
    EXPECT_EQ(A.at(3, 5), 0.0);
    EXPECT_EQ(A.lower(0), 0.0);
    EXPECT_EQ(A.upper(n - 1), 0.0);

    expectSolves(A, {1.0, -2.0, 3.0, 0.5, 0.0, 7.25, -1.0, 2.0});
}

TEST(TridiagonalTest, RowInterchangesOnSmallPivots) {
    // Leading entries far smaller than the sub-diagonal force a swap at every step
    asian_pricer::TridiagonalMatrix A(5);
    A.setRow(0, 0.0, 1e-3, 2.0);
    A.setRow(1, 5.0, 1e-3, 1.0);
    A.setRow(2, 3.0, 2e-3, -1.0);
    A.setRow(3, 4.0, 1e-3, 2.0);
    A.setRow(4, 6.0, 1.0, 0.0);

    expectSolves(A, {1.0, 2.0, -1.0, 0.5, 3.0});
}

TEST(TridiagonalTest, ZeroDiagonalNeedsPivoting) {
    asian_pricer::TridiagonalMatrix A(2);
    A.setRow(0, 0.0, 0.0, 1.0);
    A.setRow(1, 1.0, 0.0, 0.0);

    const auto x = asian_pricer::solveTridiagonal(A, {3.0, 5.0});
    EXPECT_DOUBLE_EQ(x[0], 5.0);
    EXPECT_DOUBLE_EQ(x[1], 3.0);
}

TEST(TridiagonalTest, IdentityRowsPassValuesThrough) {
    asian_pricer::TridiagonalMatrix A(4);
    A.setIdentityRow(0);
    A.setRow(1, 1.0, -3.0, 1.0);
    A.setRow(2, 1.0, -3.0, 1.0);
    A.setIdentityRow(3);

    const auto x = asian_pricer::solveTridiagonal(A, {2.0, 0.0, 0.0, -1.0});
    EXPECT_DOUBLE_EQ(x[0], 2.0);
    EXPECT_DOUBLE_EQ(x[3], -1.0);
    expectSolves(A, {2.0, 0.25, -0.75, -1.0});
}

TEST(TridiagonalTest, FactorisationIsReusable) {
    asian_pricer::TridiagonalMatrix A(6);
    for (size_t i = 0; i < 6; ++i) {
        A.setRow(i, 0.5, 2.0 + static_cast<double>(i), -0.25);
    }
    const asian_pricer::TridiagonalLU lu(A);
    EXPECT_EQ(lu.size(), 6u);

    const std::vector<double> first = {1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
    const std::vector<double> second = {0.0, -3.0, 2.0, 0.0, 1.5, 4.0};
    for (const auto& expected : {first, second}) {
        const auto x = lu.solve(A.multiply(expected));
        for (size_t i = 0; i < 6; ++i) {
            EXPECT_NEAR(x[i], expected[i], 1e-12);
        }
    }
}

TEST(TridiagonalTest, SingleRow) {
    asian_pricer::TridiagonalMatrix A(1);
    A.setRow(0, 9.0, 4.0, 9.0);
    EXPECT_EQ(A.lower(0), 0.0);
    EXPECT_EQ(A.upper(0), 0.0);

    const auto x = asian_pricer::solveTridiagonal(A, {2.0});
    EXPECT_DOUBLE_EQ(x[0], 0.5);
}

TEST(TridiagonalTest, SingularMatricesAreReported) {
    asian_pricer::TridiagonalMatrix dependent(2);
    dependent.setRow(0, 0.0, 1.0, 1.0);
    dependent.setRow(1, 1.0, 1.0, 0.0);
    try {
        asian_pricer::TridiagonalLU lu(dependent);
        FAIL() << "Expected SingularMatrix";
    } catch (const asian_pricer::SingularMatrix& e) {
        EXPECT_EQ(e.row(), 1u);
    }

    asian_pricer::TridiagonalMatrix zero(3);
    EXPECT_THROW(asian_pricer::TridiagonalLU lu(zero), asian_pricer::SingularMatrix);
}

TEST(TridiagonalTest, SizeMismatchIsRejected) {
    EXPECT_THROW(asian_pricer::TridiagonalMatrix(0), asian_pricer::InvalidParameters);

    asian_pricer::TridiagonalMatrix A(3);
    for (size_t i = 0; i < 3; ++i) {
        A.setRow(i, 1.0, 3.0, 1.0);
    }
    EXPECT_THROW(A.multiply({1.0, 2.0}), asian_pricer::InvalidParameters);
    EXPECT_THROW(asian_pricer::solveTridiagonal(A, {1.0}), asian_pricer::InvalidParameters);
}
