#pragma once

#include "least_squares.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <vector>

namespace usl::solvers
{

/**
 * @brief Levenberg-Marquardt non-linear least squares solver.
 * Minimizes sum(r_i^2) over a parameter vector.
 */
class LevenbergMarquardt
{
  public:
    /**
     * Fill residuals r_i and the Jacobian J[i][j] = d r_i / d p_j for the
     * given parameters. Both vectors are resized by the callee.
     */
    using ResidualFunction = std::function<void(
        const std::vector<double>& params, std::vector<double>& residuals,
        std::vector<std::vector<double>>& jacobian)>;

    struct Result
    {
        std::vector<double> params;
        double cost = 0.0;
        int iterations = 0;
        bool converged = false;
    };

    /**
     * @brief Solve the least squares problem.
     * @param initialParams Initial guess for parameters.
     * @param residualFunc Residual and Jacobian evaluation.
     * @param maxIter Maximum iterations (default 1000).
     * @param tol Relative step size at which the solve is considered done.
     * @return Optimized parameters.
     */
    static Result solve(const std::vector<double>& initialParams,
                        const ResidualFunction& residualFunc,
                        int maxIter = 1000, double tol = 1e-12)
    {
        const size_t n = initialParams.size();

        Result res;
        res.params = initialParams;

        std::vector<double> r;
        std::vector<std::vector<double>> jac;
        residualFunc(res.params, r, jac);
        res.cost = sumSquares(r);
        if (n == 0 || !std::isfinite(res.cost))
            return res;

        double mu = 1e-3; // damping, relative to diag(J^T J)
        double nu = 2.0;

        std::vector<double> trialR;
        std::vector<std::vector<double>> trialJac;

        while (res.iterations < maxIter)
        {
            ++res.iterations;

            // Normal equations J^T J and gradient J^T r.
            std::vector<std::vector<double>> jtj(n, std::vector<double>(n));
            std::vector<double> jtr(n, 0.0);
            for (size_t i = 0; i < r.size(); ++i)
            {
                for (size_t a = 0; a < n; ++a)
                {
                    jtr[a] += jac[i][a] * r[i];
                    for (size_t b = 0; b < n; ++b)
                        jtj[a][b] += jac[i][a] * jac[i][b];
                }
            }

            std::vector<double> diag(n);
            auto damped = jtj;
            std::vector<double> rhs(n);
            for (size_t a = 0; a < n; ++a)
            {
                diag[a] = jtj[a][a] > 0.0 ? jtj[a][a] : 1.0;
                damped[a][a] += mu * diag[a];
                rhs[a] = -jtr[a];
            }

            auto step = LeastSquares::solveLinearSystem(damped, rhs);
            if (!step.valid)
            {
                mu *= 10.0;
                if (mu > kMaxDamping)
                    break;
                continue;
            }
            const auto& d = step.x;

            std::vector<double> trial(n);
            for (size_t a = 0; a < n; ++a)
                trial[a] = res.params[a] + d[a];

            residualFunc(trial, trialR, trialJac);
            const double trialCost = sumSquares(trialR);

            // Gain ratio between actual and predicted reduction.
            double predicted = 0.0;
            for (size_t a = 0; a < n; ++a)
                predicted += d[a] * (mu * diag[a] * d[a] - jtr[a]);
            const double rho =
                predicted > 0.0 ? (res.cost - trialCost) / predicted : -1.0;

            if (std::isfinite(trialCost) && trialCost < res.cost)
            {
                res.params = trial;
                res.cost = trialCost;
                r.swap(trialR);
                jac.swap(trialJac);

                const double t = 2.0 * rho - 1.0;
                mu *= std::max(1.0 / 3.0, 1.0 - t * t * t);
                nu = 2.0;

                bool small = true;
                for (size_t a = 0; a < n; ++a)
                {
                    if (std::abs(d[a]) > tol * (std::abs(res.params[a]) + tol))
                    {
                        small = false;
                        break;
                    }
                }
                if (small)
                {
                    res.converged = true;
                    break;
                }
            }
            else
            {
                mu *= nu;
                nu *= 2.0;
                // No downhill step left at any damping: we sit on the minimum.
                if (mu > kMaxDamping)
                {
                    res.converged = true;
                    break;
                }
            }
        }

        return res;
    }

  private:
    static constexpr double kMaxDamping = 1e16;

    static double sumSquares(const std::vector<double>& r)
    {
        double s = 0.0;
        for (double v : r)
            s += v * v;
        return s;
    }
};

} // namespace usl::solvers
