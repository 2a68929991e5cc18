#pragma once

#include "../core/measurement.hpp"

#include <vector>

namespace usl::fit
{

struct Coefficients
{
    double sigma{};  // contention
    double kappa{};  // coherency
    double lambda{}; // throughput at N = 1 without contention or coherency
};

// Closed-form estimate from the linearised law
//   N / X = (1 - sigma) / lambda + (sigma - kappa) / lambda * N
//           + kappa / lambda * N^2
// solved by ordinary least squares on N and N^2. Falls back to a straight
// line (kappa = 0) when only two distinct concurrency levels are present.
// Throws InsufficientData on empty input and DegenerateFit when fewer than
// two distinct concurrency levels exist or the result is not finite.
Coefficients quadraticEstimate(const std::vector<Measurement>& measurements);

// Levenberg-Marquardt on the throughput residuals X_i - X(N_i), starting
// from the given coefficients.
Coefficients refine(const std::vector<Measurement>& measurements,
                    const Coefficients& seed);

// quadraticEstimate() followed by refine().
Coefficients leastSquares(const std::vector<Measurement>& measurements);

} // namespace usl::fit
