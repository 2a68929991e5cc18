#pragma once

#include "../core/measurement.hpp"
#include "../model/query.hpp"

#include <optional>
#include <string>
#include <vector>

namespace usl
{

struct BasicSettings
{
    int truncateDecimals{6}; // decimals kept in printed/report values
    std::string fitLogPath;  // optional append-only log; empty disables
};

// Explicit coefficients; replaces the fit when present.
struct ModelCfg
{
    double sigma{};
    double kappa{};
    double lambda{};
};

struct Config
{
    BasicSettings basic;
    std::vector<Measurement> measurements;
    std::optional<ModelCfg> model;
    std::vector<Query> queries;
    std::string reportPath;
};

// Load from file (JSON). Throws std::runtime_error on hard schema issues and
// InvalidMeasurement on non-positive measurement values.
Config loadConfigFromJsonFile(const std::string& jsonPath);

} // namespace usl
