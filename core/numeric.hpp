#pragma once

#include <cmath>
#include <optional>

namespace usl::numeric
{

// Truncate a floating value to N decimals without rounding.
inline double truncateDecimals(double value, int decimals)
{
    if (decimals <= 0)
    {
        return std::trunc(value);
    }
    const double scale = std::pow(10.0, decimals);
    return std::trunc(value * scale) / scale;
}

/**
 * @brief Smallest real root >= 0 of a*n^2 + b*n + c = 0.
 *
 * Degrades to the linear equation when a == 0. Returns std::nullopt when
 * the discriminant is negative or both roots are negative. Roots are taken
 * in the cancellation-free form q = -(b + sign(b) * sqrt(D)) / 2, n = q / a
 * and n = c / q.
 */
inline std::optional<double> smallestNonNegativeRoot(double a, double b,
                                                     double c)
{
    if (a == 0.0)
    {
        if (b == 0.0)
            return std::nullopt;
        const double n = -c / b;
        if (!std::isfinite(n) || n < 0.0)
            return std::nullopt;
        return n + 0.0; // normalise -0.0
    }

    const double disc = b * b - 4.0 * a * c;
    if (!(disc >= 0.0))
        return std::nullopt;

    const double q = -0.5 * (b + std::copysign(std::sqrt(disc), b));
    const double r1 = q / a;
    const double r2 = (q != 0.0) ? c / q : r1;

    std::optional<double> best;
    for (double r : {r1, r2})
    {
        if (std::isfinite(r) && r >= 0.0 && (!best || r < *best))
            best = r + 0.0;
    }
    return best;
}

} // namespace usl::numeric
