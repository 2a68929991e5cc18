#pragma once

#include "../core/measurement.hpp"

#include <cstddef>
#include <vector>

namespace usl
{

/**
 * @brief Universal Scalability Law model.
 *
 *   X(N) = lambda * N / (1 + sigma * (N - 1) + kappa * N * (N - 1))
 *
 * Immutable once built; every query is a closed-form expression of the
 * three coefficients.
 */
class Model
{
  public:
    // Model with known coefficients (what-if analysis).
    static Model of(double sigma, double kappa, double lambda);

    // Least squares fit. Throws InsufficientData on an empty collection and
    // DegenerateFit when the coefficients cannot be determined.
    static Model build(const std::vector<Measurement>& measurements);

    double sigma() const
    {
        return s;
    }

    double kappa() const
    {
        return k;
    }

    double lambda() const
    {
        return l;
    }

    double throughputAtConcurrency(double n) const;
    double latencyAtConcurrency(double n) const;

    // Throws UnreachableThroughput when x is beyond the contention limit.
    double concurrencyAtThroughput(double x) const;
    double latencyAtThroughput(double x) const;

    // Throws UnreachableLatency when no non-negative concurrency yields r.
    double concurrencyAtLatency(double r) const;
    double throughputAtLatency(double r) const;

    // Concurrency level (whole units) of peak throughput; +inf if limitless.
    double maxConcurrency() const;
    // Throughput at maxConcurrency(); +inf if limitless.
    double maxThroughput() const;

    bool isLimitless() const;
    bool isCoherencyConstrained() const;
    bool isContentionConstrained() const;

  private:
    Model(double sigma, double kappa, double lambda);

    // 1 + sigma(N - 1) + kappa N(N - 1)
    double retrograde(double n) const;

    double s;
    double k;
    double l;
};

// Accumulates measurements and fits a Model from them.
class ModelBuilder
{
  public:
    ModelBuilder& add(const Measurement& m);
    ModelBuilder& addAll(const std::vector<Measurement>& ms);

    size_t size() const
    {
        return measurements.size();
    }

    Model build() const;

  private:
    std::vector<Measurement> measurements;
};

} // namespace usl
