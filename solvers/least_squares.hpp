#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace usl::solvers
{

class LeastSquares
{
  public:
    struct Result
    {
        double slope = 0.0;
        double intercept = 0.0;
        bool valid = false;
    };

    // y = c0 + c1 * x + c2 * x^2
    struct QuadraticResult
    {
        double c0 = 0.0;
        double c1 = 0.0;
        double c2 = 0.0;
        bool valid = false;
    };

    struct SystemResult
    {
        std::vector<double> x;
        bool valid = false;
    };

    /**
     * @brief Solve the square system A x = b by Gaussian elimination with
     * partial pivoting.
     *
     * The system is reported invalid when a pivot falls below 1e-12 of the
     * largest coefficient magnitude in A.
     */
    static SystemResult solveLinearSystem(std::vector<std::vector<double>> a,
                                          std::vector<double> b)
    {
        SystemResult res;
        const size_t n = b.size();
        if (n == 0 || a.size() != n)
            return res;

        double scale = 0.0;
        for (const auto& row : a)
        {
            if (row.size() != n)
                return res;
            for (double v : row)
                scale = std::max(scale, std::abs(v));
        }
        if (!(scale > 0.0) || !std::isfinite(scale))
            return res;

        for (size_t col = 0; col < n; ++col)
        {
            size_t pivot = col;
            for (size_t r = col + 1; r < n; ++r)
            {
                if (std::abs(a[r][col]) > std::abs(a[pivot][col]))
                    pivot = r;
            }
            if (std::abs(a[pivot][col]) <= 1e-12 * scale)
                return res;

            std::swap(a[col], a[pivot]);
            std::swap(b[col], b[pivot]);

            for (size_t r = col + 1; r < n; ++r)
            {
                const double f = a[r][col] / a[col][col];
                for (size_t k = col; k < n; ++k)
                    a[r][k] -= f * a[col][k];
                b[r] -= f * b[col];
            }
        }

        res.x.assign(n, 0.0);
        for (size_t i = n; i-- > 0;)
        {
            double acc = b[i];
            for (size_t k = i + 1; k < n; ++k)
                acc -= a[i][k] * res.x[k];
            res.x[i] = acc / a[i][i];
        }
        res.valid = true;
        return res;
    }

    /**
     * @brief Perform simple linear regression y = ax + b
     */
    static Result solveLinearRegression(const std::vector<double>& x,
                                        const std::vector<double>& y)
    {
        Result res;
        if (x.size() != y.size() || x.empty())
            return res;

        size_t n = x.size();
        double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumX2 = 0.0;

        for (size_t i = 0; i < n; ++i)
        {
            sumX += x[i];
            sumY += y[i];
            sumXY += x[i] * y[i];
            sumX2 += x[i] * x[i];
        }

        double denominator = n * sumX2 - sumX * sumX;
        if (std::abs(denominator) < 1e-9)
            return res;

        res.slope = (n * sumXY - sumX * sumY) / denominator;
        res.intercept = (sumY - res.slope * sumX) / n;
        res.valid = true;

        return res;
    }

    /**
     * @brief Fit y = c0 + c1 x + c2 x^2 through the normal equations.
     */
    static QuadraticResult solveQuadraticRegression(
        const std::vector<double>& x, const std::vector<double>& y)
    {
        QuadraticResult res;
        if (x.size() != y.size() || x.empty())
            return res;

        const double n = static_cast<double>(x.size());
        double sumX = 0.0, sumX2 = 0.0, sumX3 = 0.0, sumX4 = 0.0;
        double sumY = 0.0, sumXY = 0.0, sumX2Y = 0.0;

        for (size_t i = 0; i < x.size(); ++i)
        {
            const double xi = x[i];
            const double x2 = xi * xi;
            sumX += xi;
            sumX2 += x2;
            sumX3 += x2 * xi;
            sumX4 += x2 * x2;
            sumY += y[i];
            sumXY += xi * y[i];
            sumX2Y += x2 * y[i];
        }

        auto sol = solveLinearSystem({{n, sumX, sumX2},
                                      {sumX, sumX2, sumX3},
                                      {sumX2, sumX3, sumX4}},
                                     {sumY, sumXY, sumX2Y});
        if (!sol.valid)
            return res;

        res.c0 = sol.x[0];
        res.c1 = sol.x[1];
        res.c2 = sol.x[2];
        res.valid = true;
        return res;
    }
};

} // namespace usl::solvers
