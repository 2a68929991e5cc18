#include "../core/errors.hpp"
#include "../model/regression.hpp"
#include "cisco_data.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using usl::Measurement;
namespace fit = usl::fit;

namespace
{

std::vector<Measurement> synthetic(double sigma, double kappa, double lambda)
{
    std::vector<Measurement> out;
    for (double n : {1.0, 2.0, 4.0, 8.0, 16.0, 32.0, 64.0})
    {
        const double x =
            lambda * n / (1.0 + sigma * (n - 1.0) + kappa * n * (n - 1.0));
        out.push_back(Measurement::ofConcurrencyAndThroughput(n, x));
    }
    return out;
}

} // namespace

TEST(RegressionTest, QuadraticEstimateExactOnNoiselessData)
{
    auto c = fit::quadraticEstimate(synthetic(0.05, 0.001, 100));
    EXPECT_NEAR(c.sigma, 0.05, 1e-9);
    EXPECT_NEAR(c.kappa, 0.001, 1e-9);
    EXPECT_NEAR(c.lambda, 100.0, 1e-7);
}

TEST(RegressionTest, QuadraticEstimateOnCisco)
{
    // Linearised fit weights points by N / X, so it differs from the
    // throughput-space optimum.
    auto c = fit::quadraticEstimate(usl::testdata::cisco());
    EXPECT_NEAR(c.sigma, 0.0214855, 1e-6);
    EXPECT_NEAR(c.kappa, 8.609103e-4, 1e-9);
    EXPECT_NEAR(c.lambda, 963.48034, 1e-4);
}

TEST(RegressionTest, RefineRecoversFromPoorSeed)
{
    auto data = synthetic(0.05, 0.001, 100);
    auto c = fit::refine(data, fit::Coefficients{0.1, 0.01, 80});
    EXPECT_NEAR(c.sigma, 0.05, 1e-9);
    EXPECT_NEAR(c.kappa, 0.001, 1e-10);
    EXPECT_NEAR(c.lambda, 100.0, 1e-7);
}

TEST(RegressionTest, LeastSquaresMatchesBook)
{
    using namespace usl::testdata;
    auto c = fit::leastSquares(cisco());
    EXPECT_NEAR(c.sigma, kBookSigma, percentOf(kBookSigma, 0.02));
    EXPECT_NEAR(c.kappa, kBookKappa, percentOf(kBookKappa, 0.02));
    EXPECT_NEAR(c.lambda, kBookLambda, percentOf(kBookLambda, 0.02));
}

TEST(RegressionTest, IndependentOfInputOrder)
{
    auto data = usl::testdata::cisco();
    auto reversed = std::vector<Measurement>(data.rbegin(), data.rend());

    auto a = fit::leastSquares(data);
    auto b = fit::leastSquares(reversed);
    EXPECT_NEAR(a.sigma, b.sigma, 1e-7);
    EXPECT_NEAR(a.kappa, b.kappa, 1e-9);
    EXPECT_NEAR(a.lambda, b.lambda, 1e-3);
}

TEST(RegressionTest, EmptyInput)
{
    EXPECT_THROW(fit::quadraticEstimate({}), usl::InsufficientData);
    EXPECT_THROW(fit::leastSquares({}), usl::InsufficientData);
}

TEST(RegressionTest, SingleConcurrencyLevel)
{
    std::vector<Measurement> data{
        Measurement::ofConcurrencyAndThroughput(4, 100),
        Measurement::ofConcurrencyAndThroughput(4, 110),
        Measurement::ofConcurrencyAndThroughput(4, 95),
    };
    EXPECT_THROW(fit::leastSquares(data), usl::DegenerateFit);
}

TEST(RegressionTest, TwoLevelsDoNotThrow)
{
    std::vector<Measurement> data{
        Measurement::ofConcurrencyAndThroughput(1, 100),
        Measurement::ofConcurrencyAndThroughput(2, 180),
    };

    fit::Coefficients c;
    ASSERT_NO_THROW(c = fit::leastSquares(data));
    EXPECT_TRUE(std::isfinite(c.sigma));
    EXPECT_TRUE(std::isfinite(c.kappa));
    EXPECT_TRUE(std::isfinite(c.lambda));
}
