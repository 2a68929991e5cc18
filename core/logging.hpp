#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

namespace usl::log
{

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
// An empty path disables the log.
inline void appendLine(const std::string& path, const std::string& line)
{
    if (path.empty())
        return;

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    std::ofstream f(path, std::ios::app);
    if (!f.is_open())
    {
        std::cerr << "[usl] cannot open log: " << path << "\n";
        return;
    }
    f << nowIso() << " " << line << "\n";
}

} // namespace usl::log
