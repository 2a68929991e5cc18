#include "query.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace usl
{

static const std::array<std::pair<QueryType, const char*>, 6> kNames{{
    {QueryType::throughputAtConcurrency, "throughputatconcurrency"},
    {QueryType::latencyAtConcurrency, "latencyatconcurrency"},
    {QueryType::concurrencyAtThroughput, "concurrencyatthroughput"},
    {QueryType::latencyAtThroughput, "latencyatthroughput"},
    {QueryType::concurrencyAtLatency, "concurrencyatlatency"},
    {QueryType::throughputAtLatency, "throughputatlatency"},
}};

std::string queryTypeName(QueryType t)
{
    for (const auto& [type, name] : kNames)
    {
        if (type == t)
            return name;
    }
    return {};
}

std::optional<QueryType> parseQueryType(const std::string& name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto& [type, n] : kNames)
    {
        if (lower == n)
            return type;
    }
    return std::nullopt;
}

double evaluate(const Model& model, const Query& q)
{
    switch (q.type)
    {
        case QueryType::throughputAtConcurrency:
            return model.throughputAtConcurrency(q.value);
        case QueryType::latencyAtConcurrency:
            return model.latencyAtConcurrency(q.value);
        case QueryType::concurrencyAtThroughput:
            return model.concurrencyAtThroughput(q.value);
        case QueryType::latencyAtThroughput:
            return model.latencyAtThroughput(q.value);
        case QueryType::concurrencyAtLatency:
            return model.concurrencyAtLatency(q.value);
        case QueryType::throughputAtLatency:
            return model.throughputAtLatency(q.value);
    }
    return 0.0;
}

} // namespace usl
