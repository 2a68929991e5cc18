#pragma once

#include "model.hpp"

#include <optional>
#include <string>

namespace usl
{

enum class QueryType
{
    throughputAtConcurrency,
    latencyAtConcurrency,
    concurrencyAtThroughput,
    latencyAtThroughput,
    concurrencyAtLatency,
    throughputAtLatency,
};

struct Query
{
    QueryType type{QueryType::throughputAtConcurrency};
    double value{};
};

// Lower-case config name, e.g. "throughputatconcurrency".
std::string queryTypeName(QueryType t);
std::optional<QueryType> parseQueryType(const std::string& name);

// Dispatch to the matching Model query; model errors propagate.
double evaluate(const Model& model, const Query& q);

} // namespace usl
