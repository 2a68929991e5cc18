#pragma once

namespace usl
{

/**
 * @brief One observation of a running system, stored as concurrency and
 * throughput.
 *
 * Any two of concurrency, throughput and latency describe the same point;
 * the missing one follows from Little's Law (N = X * L).
 */
class Measurement
{
  public:
    static Measurement ofConcurrencyAndThroughput(double concurrency,
                                                  double throughput);
    static Measurement ofConcurrencyAndLatency(double concurrency,
                                               double latency);
    static Measurement ofThroughputAndLatency(double throughput,
                                              double latency);

    double concurrency() const
    {
        return n;
    }

    double throughput() const
    {
        return x;
    }

    // Mean latency at this point, N / X.
    double latency() const
    {
        return n / x;
    }

  private:
    Measurement(double concurrency, double throughput);

    double n;
    double x;
};

} // namespace usl
