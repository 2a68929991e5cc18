#include "model.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"
#include "regression.hpp"

#include <cmath>
#include <limits>

namespace usl
{

Model::Model(double sigma, double kappa, double lambda) :
    s(sigma), k(kappa), l(lambda)
{}

Model Model::of(double sigma, double kappa, double lambda)
{
    return Model(sigma, kappa, lambda);
}

Model Model::build(const std::vector<Measurement>& measurements)
{
    const auto c = fit::leastSquares(measurements);
    return Model(c.sigma, c.kappa, c.lambda);
}

double Model::retrograde(double n) const
{
    return 1.0 + s * (n - 1.0) + k * n * (n - 1.0);
}

double Model::throughputAtConcurrency(double n) const
{
    return (l * n) / retrograde(n);
}

double Model::latencyAtConcurrency(double n) const
{
    return retrograde(n) / l;
}

double Model::concurrencyAtThroughput(double x) const
{
    return latencyAtThroughput(x) * x;
}

double Model::latencyAtThroughput(double x) const
{
    if (!(x > 0.0))
    {
        throw UnreachableThroughput(x);
    }
    // Contention-only inverse: (sigma X - lambda) N + (1 - sigma) X = 0.
    auto n = numeric::smallestNonNegativeRoot(0.0, s * x - l, x - s * x);
    if (!n)
    {
        throw UnreachableThroughput(x);
    }
    return *n / x;
}

double Model::concurrencyAtLatency(double r) const
{
    // lambda R = 1 + sigma(N - 1) + kappa N(N - 1)
    auto n = numeric::smallestNonNegativeRoot(k, s - k, 1.0 - s - l * r);
    if (!n)
    {
        throw UnreachableLatency(r);
    }
    return *n;
}

double Model::throughputAtLatency(double r) const
{
    return concurrencyAtLatency(r) / r;
}

double Model::maxConcurrency() const
{
    if (isLimitless())
        return std::numeric_limits<double>::infinity();
    return std::floor(std::sqrt((1.0 - s) / k));
}

double Model::maxThroughput() const
{
    if (isLimitless())
        return std::numeric_limits<double>::infinity();
    return throughputAtConcurrency(maxConcurrency());
}

bool Model::isLimitless() const
{
    return k == 0.0;
}

bool Model::isCoherencyConstrained() const
{
    return s < k;
}

bool Model::isContentionConstrained() const
{
    return s > k;
}

ModelBuilder& ModelBuilder::add(const Measurement& m)
{
    measurements.push_back(m);
    return *this;
}

ModelBuilder& ModelBuilder::addAll(const std::vector<Measurement>& ms)
{
    measurements.insert(measurements.end(), ms.begin(), ms.end());
    return *this;
}

Model ModelBuilder::build() const
{
    return Model::build(measurements);
}

} // namespace usl
