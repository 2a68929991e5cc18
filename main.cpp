#include "buildjson/buildjson.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/numeric.hpp"
#include "model/model.hpp"
#include "model/query.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using QueryResult = std::pair<usl::Query, std::optional<double>>;

static std::string fmt(double v, int decimals)
{
    std::ostringstream oss;
    oss << usl::numeric::truncateDecimals(v, decimals);
    return oss.str();
}

static std::string describeRegime(const usl::Model& m)
{
    if (m.isLimitless())
        return "limitless";
    if (m.isContentionConstrained())
        return "contention-constrained";
    if (m.isCoherencyConstrained())
        return "coherency-constrained";
    return "balanced";
}

static std::string summary(const usl::Model& m, int decimals)
{
    std::ostringstream oss;
    oss << "sigma=" << fmt(m.sigma(), decimals)
        << ",kappa=" << fmt(m.kappa(), decimals)
        << ",lambda=" << fmt(m.lambda(), decimals)
        << ",Nmax=" << fmt(m.maxConcurrency(), decimals)
        << ",Xmax=" << fmt(m.maxThroughput(), decimals)
        << ",regime=" << describeRegime(m);
    return oss.str();
}

// Write model and query results to a file. Creates parent directories if
// needed.
static bool writeReport(const std::string& path, const usl::Model& m,
                        const std::vector<QueryResult>& results, int decimals)
{
    if (path.empty())
        return false;

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        std::cerr << "[usl] mkdir failed: " << path << " ec=" << ec.message()
                  << "\n";
        return false;
    }

    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open())
    {
        std::cerr << "[usl] cannot open report: " << path << "\n";
        return false;
    }

    ofs << summary(m, decimals) << "\n";
    for (const auto& [q, value] : results)
    {
        ofs << usl::queryTypeName(q.type) << "(" << q.value << ")=";
        if (value)
            ofs << fmt(*value, decimals);
        else
            ofs << "unreachable";
        ofs << "\n";
    }
    ofs.flush();
    return true;
}

int main(int argc, char** argv)
{
    std::string jsonPath = "/usr/share/usl-capacity/configs/usl.json";
    if (argc > 1)
    {
        jsonPath = argv[1];
    }

    usl::Config cfg;
    try
    {
        cfg = usl::loadConfigFromJsonFile(jsonPath);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[usl] Config error: " << e.what() << "\n";
        return 1;
    }

    const int decimals = cfg.basic.truncateDecimals;
    const std::string& logPath = cfg.basic.fitLogPath;

    std::optional<usl::Model> model;
    try
    {
        if (cfg.model)
        {
            model = usl::Model::of(cfg.model->sigma, cfg.model->kappa,
                                   cfg.model->lambda);
            std::cerr << "[usl] using explicit model\n";
        }
        else
        {
            std::cerr << "[usl] fitting " << cfg.measurements.size()
                      << " measurements\n";
            model = usl::Model::build(cfg.measurements);
        }
    }
    catch (const usl::Error& e)
    {
        std::cerr << "[usl] Fit error: " << e.what() << "\n";
        usl::log::appendLine(logPath, std::string("fit failed: ") + e.what());
        return 1;
    }

    const std::string line = summary(*model, decimals);
    std::cout << line << "\n";
    usl::log::appendLine(logPath, line);

    std::vector<QueryResult> results;
    results.reserve(cfg.queries.size());
    for (const auto& q : cfg.queries)
    {
        try
        {
            const double v = usl::evaluate(*model, q);
            std::cout << usl::queryTypeName(q.type) << "(" << q.value
                      << ")=" << fmt(v, decimals) << "\n";
            results.emplace_back(q, v);
        }
        catch (const usl::Error& e)
        {
            std::cerr << "[usl] query skipped: " << e.what() << "\n";
            results.emplace_back(q, std::nullopt);
        }
    }

    if (writeReport(cfg.reportPath, *model, results, decimals))
        std::cerr << "[usl] report written to " << cfg.reportPath << "\n";

    return 0;
}
