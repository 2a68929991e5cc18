#include "buildjson.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <stdexcept>

namespace j = nlohmann;

namespace usl
{

static std::optional<double> read_opt(const j::json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    return it->get<double>();
}

// Either [concurrency, throughput] or an object with two of
// "concurrency", "throughput" and "latency".
static Measurement parseMeasurement(const j::json& m, size_t index)
{
    const std::string where = "measurement #" + std::to_string(index);

    if (m.is_array())
    {
        if (m.size() != 2)
        {
            throw std::runtime_error(
                where + ": expected [concurrency, throughput]");
        }
        return Measurement::ofConcurrencyAndThroughput(m[0].get<double>(),
                                                       m[1].get<double>());
    }

    if (!m.is_object())
    {
        throw std::runtime_error(where + ": expected an object or a pair");
    }

    const auto n = read_opt(m, "concurrency");
    const auto x = read_opt(m, "throughput");
    const auto r = read_opt(m, "latency");
    const int given = (n ? 1 : 0) + (x ? 1 : 0) + (r ? 1 : 0);
    if (given != 2)
    {
        throw std::runtime_error(
            where + ": give exactly two of concurrency, throughput, latency");
    }

    if (n && x)
        return Measurement::ofConcurrencyAndThroughput(*n, *x);
    if (n)
        return Measurement::ofConcurrencyAndLatency(*n, *r);
    return Measurement::ofThroughputAndLatency(*x, *r);
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    j::json root = j::json::parse(ifs);

    Config out{};

    // ===== basic settings =====
    if (root.contains("basic settings") && root["basic settings"].is_array() &&
        !root["basic settings"].empty())
    {
        const auto& basic = root["basic settings"].at(0);
        out.basic.truncateDecimals =
            basic.value("truncatedecimals", out.basic.truncateDecimals);
        out.basic.fitLogPath = basic.value("fitlog", std::string{});
    }

    // ===== measurements =====
    if (root.contains("measurements"))
    {
        if (!root["measurements"].is_array())
        {
            throw std::runtime_error("measurements must be an array");
        }
        size_t index = 0;
        for (const auto& m : root["measurements"])
        {
            out.measurements.push_back(parseMeasurement(m, index++));
        }
    }

    // ===== what-if model =====
    if (root.contains("model"))
    {
        const auto& m = root["model"];
        if (!m.is_object() || !m.contains("sigma") || !m.contains("kappa") ||
            !m.contains("lambda"))
        {
            throw std::runtime_error("model requires sigma, kappa and lambda");
        }
        ModelCfg cfg{};
        cfg.sigma = m.at("sigma").get<double>();
        cfg.kappa = m.at("kappa").get<double>();
        cfg.lambda = m.at("lambda").get<double>();
        out.model = cfg;
    }

    // ===== queries =====
    if (root.contains("queries") && root["queries"].is_array())
    {
        for (const auto& q : root["queries"])
        {
            const std::string type = q.value("type", "");
            auto parsed = parseQueryType(type);
            if (!parsed)
            {
                throw std::runtime_error("Unknown query type: " + type);
            }
            if (!q.contains("value"))
            {
                throw std::runtime_error("Query without value: " + type);
            }
            out.queries.push_back(Query{*parsed, q.at("value").get<double>()});
        }
    }

    out.reportPath = root.value("report", std::string{});

    // ===== validation =====
    if (!out.model && out.measurements.empty())
    {
        throw std::runtime_error(
            "Invalid config: require measurements or an explicit model.");
    }

    return out;
}

} // namespace usl
