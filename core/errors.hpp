#pragma once

#include <stdexcept>
#include <string>

namespace usl
{

// Base of every error raised by the model library.
class Error : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

// A Measurement was given a non-positive (or non-finite) quantity.
class InvalidMeasurement : public Error
{
  public:
    using Error::Error;
};

// The fit was asked to work on an empty collection.
class InsufficientData : public Error
{
  public:
    using Error::Error;
};

// The regression system is singular or produced non-finite coefficients.
class DegenerateFit : public Error
{
  public:
    using Error::Error;
};

class UnreachableThroughput : public Error
{
  public:
    explicit UnreachableThroughput(double x) :
        Error("throughput " + std::to_string(x) +
              " is not reachable by the model"),
        value(x)
    {}

    double throughput() const
    {
        return value;
    }

  private:
    double value;
};

class UnreachableLatency : public Error
{
  public:
    explicit UnreachableLatency(double r) :
        Error("latency " + std::to_string(r) +
              " is not reachable by the model"),
        value(r)
    {}

    double latency() const
    {
        return value;
    }

  private:
    double value;
};

} // namespace usl
