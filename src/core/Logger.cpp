/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string_view>
#include <vector>

namespace TickGuard {
namespace {

namespace fs = std::filesystem;

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t LINES_PER_FLUSH = 50;
constexpr std::string_view LOG_PREFIX = "tickguard_";

std::tm localTime(std::time_t when) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &when);
#else
    localtime_r(&when, &out);
#endif
    return out;
}

/**
 * @brief Appends CRITICAL and ERROR lines to one file per server run.
 *
 * The file lives in <pref path>/logs and is named tickguard_YYYYMMDD_HHMMSS.log,
 * so lexical order of names is also age order. Opening is deferred to the
 * first line; a missing pref path leaves the sink closed for the whole run.
 */
class LogFileSink {
public:
    static LogFileSink& get() {
        static LogFileSink sink;
        return sink;
    }

    LogFileSink(const LogFileSink&) = delete;
    LogFileSink& operator=(const LogFileSink&) = delete;

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            m_opened = true;
            open();
        }
        if (!m_out) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;
        const std::tm stamp = localTime(std::chrono::system_clock::to_time_t(now));

        m_out << std::put_time(&stamp, "%H:%M:%S") << '.' << std::setw(3)
              << std::setfill('0') << millis << ' ' << level << " [" << system
              << "] " << message << '\n';

        const bool critical = std::string_view(level) == "CRITICAL";
        if (critical || ++m_unflushed >= LINES_PER_FLUSH) {
            m_out.flush();
            m_unflushed = 0;
        }
    }

private:
    LogFileSink() = default;
    ~LogFileSink() {
        if (m_out) {
            m_out.flush();
        }
    }

    void open() {
        // TICKGUARD_APP_NAME comes from CMake's ${PROJECT_NAME}
        char* base = SDL_GetPrefPath("TickGuard", TICKGUARD_APP_NAME);
        if (base == nullptr) {
            return;
        }
        const fs::path dir = fs::path(base) / "logs";
        SDL_free(base);

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }

        // Leave room for the file this run creates
        pruneOldLogs(dir, KEPT_LOG_FILES - 1);

        const std::tm started = localTime(std::time(nullptr));
        std::ostringstream name;
        name << LOG_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

        m_out.open(dir / name.str(), std::ios::out | std::ios::app);
        if (m_out) {
            m_out << "# " << TICKGUARD_APP_NAME << " session started "
                  << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << '\n';
            m_out.flush();
        }
    }

    static void pruneOldLogs(const fs::path& dir, size_t keep) {
        std::vector<fs::path> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const std::string name = entry.path().filename().string();
            if (name.starts_with(LOG_PREFIX) && entry.path().extension() == ".log") {
                logs.push_back(entry.path());
            }
        }
        if (logs.size() <= keep) {
            return;
        }

        std::sort(logs.begin(), logs.end());
        const auto stale = logs.size() - keep;
        std::for_each(logs.begin(), logs.begin() + static_cast<std::ptrdiff_t>(stale),
                      [&ec](const fs::path& path) { fs::remove(path, ec); });
    }

    std::mutex m_mutex;
    std::ofstream m_out;
    bool m_opened{false};
    size_t m_unflushed{0};
};

} // namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (IsBenchmarkMode()) {
        return;
    }
    LogFileSink::get().append(level, system, message);
}

} // namespace TickGuard

#endif // ifndef DEBUG
