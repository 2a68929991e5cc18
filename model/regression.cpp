#include "regression.hpp"

#include "../core/errors.hpp"
#include "../solvers/least_squares.hpp"
#include "../solvers/levenberg_marquardt.hpp"

#include <cmath>
#include <cstddef>
#include <set>

namespace usl::fit
{

using solvers::LeastSquares;
using solvers::LevenbergMarquardt;

static bool isFinite(const Coefficients& c)
{
    return std::isfinite(c.sigma) && std::isfinite(c.kappa) &&
           std::isfinite(c.lambda);
}

Coefficients quadraticEstimate(const std::vector<Measurement>& measurements)
{
    if (measurements.empty())
    {
        throw InsufficientData("at least one measurement is required");
    }

    std::set<double> levels;
    std::vector<double> n;
    std::vector<double> y;
    n.reserve(measurements.size());
    y.reserve(measurements.size());
    for (const auto& m : measurements)
    {
        levels.insert(m.concurrency());
        n.push_back(m.concurrency());
        y.push_back(m.concurrency() / m.throughput());
    }

    if (levels.size() < 2)
    {
        throw DegenerateFit(
            "measurements cover a single concurrency level");
    }

    double a = 0.0;
    double b = 0.0;
    double c = 0.0;

    auto quad = LeastSquares::solveQuadraticRegression(n, y);
    if (quad.valid)
    {
        a = quad.c0;
        b = quad.c1;
        c = quad.c2;
    }
    else
    {
        // Two levels only: the quadratic term is undetermined.
        auto line = LeastSquares::solveLinearRegression(n, y);
        if (!line.valid)
        {
            throw DegenerateFit("regression system is singular");
        }
        a = line.intercept;
        b = line.slope;
    }

    Coefficients out;
    out.lambda = 1.0 / (a + b + c);
    out.sigma = out.lambda * (b + c);
    out.kappa = out.lambda * c;

    if (!isFinite(out))
    {
        throw DegenerateFit("regression produced non-finite coefficients");
    }
    return out;
}

Coefficients refine(const std::vector<Measurement>& measurements,
                    const Coefficients& seed)
{
    auto residuals = [&measurements](const std::vector<double>& p,
                                     std::vector<double>& r,
                                     std::vector<std::vector<double>>& jac) {
        const double sigma = p[0];
        const double kappa = p[1];
        const double lambda = p[2];

        r.resize(measurements.size());
        jac.resize(measurements.size());
        for (size_t i = 0; i < measurements.size(); ++i)
        {
            const double n = measurements[i].concurrency();
            const double d = 1.0 + sigma * (n - 1.0) + kappa * n * (n - 1.0);
            const double d2 = d * d;

            r[i] = measurements[i].throughput() - lambda * n / d;
            jac[i] = {lambda * n * (n - 1.0) / d2,
                      lambda * n * n * (n - 1.0) / d2, -n / d};
        }
    };

    auto res = LevenbergMarquardt::solve({seed.sigma, seed.kappa, seed.lambda},
                                         residuals);

    Coefficients out{res.params[0], res.params[1], res.params[2]};
    if (!isFinite(out))
    {
        throw DegenerateFit("refinement produced non-finite coefficients");
    }
    return out;
}

Coefficients leastSquares(const std::vector<Measurement>& measurements)
{
    return refine(measurements, quadraticEstimate(measurements));
}

} // namespace usl::fit
