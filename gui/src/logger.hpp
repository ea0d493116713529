#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <vector>

namespace simplelog {

enum class Level { Debug, Info, Warn, Error };

inline const char* level_tag(Level lv)
{
    switch (lv) {
    case Level::Debug: return "DBG";
    case Level::Info:  return "INF";
    case Level::Warn:  return "WRN";
    case Level::Error: return "ERR";
    }
    return "?";
}

inline std::string now_utc_iso8601()
{
    auto tp = std::chrono::system_clock::now();
    std::time_t t  = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// <state>/<appName>/logs, where <state> is $XDG_STATE_HOME, ~/.local/state,
// %LOCALAPPDATA% on Windows, or the working directory as a last resort.
inline std::filesystem::path pick_state_folder(const std::string& appName)
{
    std::error_code ec;
    std::filesystem::path base;

#if defined(_WIN32)
    if (const char* local = std::getenv("LOCALAPPDATA")) base = local;
#else
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME")) {
        base = std::filesystem::path(home) / ".local" / "state";
    }
#endif
    if (base.empty()) base = std::filesystem::current_path(ec);

    auto p = base / appName / "logs";
    if (!std::filesystem::exists(p, ec)) {
        std::cerr << "[DBG][log] Creating directory: " << p.string() << "\n";
        std::filesystem::create_directories(p, ec);
        if (ec) std::cerr << "[DBG][log][WARN] create_directories: " << ec.message() << "\n";
    }
    return p;
}

struct Logger {
    std::filesystem::path logPath;
    std::ofstream stream;
    Level threshold = Level::Debug;

    // Truncates the file on construction; an explicit `dir` bypasses the
    // per-user state folder.
    explicit Logger(const std::string& appName = "CfLoader",
                    const std::string& fileName = "cfloader.log",
                    const std::filesystem::path& dir = {})
    {
        logPath = (dir.empty() ? pick_state_folder(appName) : dir) / fileName;

        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);

        stream.open(logPath, std::ios::out | std::ios::trunc);
        if (!stream.is_open()) {
            std::cerr << "[DBG][log][ERR] Could not open " << logPath.string() << " for writing.\n";
            return;
        }
        stream << "===== " << appName << " log started " << now_utc_iso8601() << " =====\n";
        stream.flush();
    }

    bool is_open() const { return stream.is_open(); }

    // One timestamped line.
    void append(const std::string& line)
    {
        if (!stream.is_open()) return;
        stream << "[" << now_utc_iso8601() << "] " << line << "\n";
        stream.flush();
    }

    void append(Level lv, const std::string& line)
    {
        if (lv < threshold) return;
        append(std::string("[") + level_tag(lv) + "] " + line);
    }

    std::filesystem::path path() const { return logPath; }
};

inline void write_banner(Logger& log,
                         const std::vector<std::string>& lines,
                         char border = '*')
{
    if (!log.stream.is_open()) return;

    std::size_t inner = 0;
    for (const auto& s : lines) inner = std::max(inner, s.size());

    const std::string rule(inner + 4, border);
    std::ostream& os = log.stream;
    os << rule << "\n";
    for (const auto& s : lines)
        os << border << " " << s << std::string(inner - s.size(), ' ') << " " << border << "\n";
    os << rule << "\n";
    os.flush();
}

} // namespace simplelog
