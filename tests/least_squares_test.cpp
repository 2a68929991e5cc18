#include "../solvers/least_squares.hpp"

#include <gtest/gtest.h>

#include <vector>

using usl::solvers::LeastSquares;

TEST(LeastSquaresTest, SolvesLinearSystemWithPivoting)
{
    // Leading zero forces a row swap.
    auto res = LeastSquares::solveLinearSystem(
        {{0, 2, 1}, {1, 1, 1}, {2, 1, 3}}, {7, 6, 13});
    ASSERT_TRUE(res.valid);
    ASSERT_EQ(res.x.size(), 3u);
    EXPECT_NEAR(res.x[0], 1.0, 1e-12);
    EXPECT_NEAR(res.x[1], 2.0, 1e-12);
    EXPECT_NEAR(res.x[2], 3.0, 1e-12);
}

TEST(LeastSquaresTest, ReportsSingularSystem)
{
    auto res = LeastSquares::solveLinearSystem(
        {{1, 2, 3}, {2, 4, 6}, {1, 0, 1}}, {1, 2, 3});
    EXPECT_FALSE(res.valid);

    EXPECT_FALSE(LeastSquares::solveLinearSystem({{0, 0}, {0, 0}}, {1, 1}).valid);
    EXPECT_FALSE(LeastSquares::solveLinearSystem({}, {}).valid);
}

TEST(LeastSquaresTest, LinearRegression)
{
    std::vector<double> x{1, 2, 3, 4};
    std::vector<double> y{3, 5, 7, 9};
    auto res = LeastSquares::solveLinearRegression(x, y);
    ASSERT_TRUE(res.valid);
    EXPECT_NEAR(res.slope, 2.0, 1e-12);
    EXPECT_NEAR(res.intercept, 1.0, 1e-12);
}

TEST(LeastSquaresTest, QuadraticRegressionExact)
{
    std::vector<double> x{0, 1, 2, 3, 4, 5};
    std::vector<double> y;
    for (double v : x)
        y.push_back(1.0 + 2.0 * v + 3.0 * v * v);

    auto res = LeastSquares::solveQuadraticRegression(x, y);
    ASSERT_TRUE(res.valid);
    EXPECT_NEAR(res.c0, 1.0, 1e-9);
    EXPECT_NEAR(res.c1, 2.0, 1e-9);
    EXPECT_NEAR(res.c2, 3.0, 1e-9);
}

TEST(LeastSquaresTest, QuadraticRegressionAveragesNoise)
{
    // Symmetric +/- offsets around y = x^2 cancel in the normal equations.
    std::vector<double> x{1, 1, 2, 2, 3, 3};
    std::vector<double> y{0.5, 1.5, 3.5, 4.5, 8.5, 9.5};
    auto res = LeastSquares::solveQuadraticRegression(x, y);
    ASSERT_TRUE(res.valid);
    EXPECT_NEAR(res.c0, 0.0, 1e-9);
    EXPECT_NEAR(res.c1, 0.0, 1e-9);
    EXPECT_NEAR(res.c2, 1.0, 1e-9);
}

TEST(LeastSquaresTest, QuadraticRegressionNeedsThreeLevels)
{
    std::vector<double> x{1, 2, 1, 2};
    std::vector<double> y{1, 2, 1, 2};
    EXPECT_FALSE(LeastSquares::solveQuadraticRegression(x, y).valid);
    EXPECT_FALSE(LeastSquares::solveQuadraticRegression({}, {}).valid);
    EXPECT_FALSE(LeastSquares::solveQuadraticRegression({1, 2}, {1}).valid);
}
