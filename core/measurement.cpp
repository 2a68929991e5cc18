#include "measurement.hpp"

#include "errors.hpp"

#include <cmath>
#include <string>

namespace usl
{

static void requirePositive(const char* name, double v)
{
    if (!std::isfinite(v) || v <= 0.0)
    {
        throw InvalidMeasurement(std::string(name) + " must be positive, got " +
                                 std::to_string(v));
    }
}

Measurement::Measurement(double concurrency, double throughput) :
    n(concurrency), x(throughput)
{}

Measurement Measurement::ofConcurrencyAndThroughput(double concurrency,
                                                    double throughput)
{
    requirePositive("concurrency", concurrency);
    requirePositive("throughput", throughput);
    return Measurement(concurrency, throughput);
}

Measurement Measurement::ofConcurrencyAndLatency(double concurrency,
                                                 double latency)
{
    requirePositive("concurrency", concurrency);
    requirePositive("latency", latency);
    const double throughput = concurrency / latency;
    requirePositive("throughput", throughput);
    return Measurement(concurrency, throughput);
}

Measurement Measurement::ofThroughputAndLatency(double throughput,
                                                double latency)
{
    requirePositive("throughput", throughput);
    requirePositive("latency", latency);
    const double concurrency = throughput * latency;
    requirePositive("concurrency", concurrency);
    return Measurement(concurrency, throughput);
}

} // namespace usl
