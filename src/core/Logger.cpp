/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds use the inline console logger from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Deadlock {
namespace {

constexpr size_t KEPT_RUN_LOGS = 5;
constexpr const char* RUN_LOG_PREFIX = "deadlock_";

std::tm localTime(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &t);
#else
    localtime_r(&t, &result);
#endif
    return result;
}

// One file per process run; only CRITICAL and ERROR reach it, so every
// record is flushed immediately
class RunLogFile {
public:
    static RunLogFile& Instance() {
        static RunLogFile instance;
        return instance;
    }

    RunLogFile(const RunLogFile&) = delete;
    RunLogFile& operator=(const RunLogFile&) = delete;

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const std::tm local = localTime(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;

        m_stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << std::endl;
    }

private:
    RunLogFile() = default;
    ~RunLogFile() = default;

    void open() {
        m_opened = true;

        // DEADLOCK_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("DeadlockSim", DEADLOCK_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        const std::filesystem::path logDir = std::filesystem::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneRunLogs(logDir);

        const std::tm started = localTime(std::chrono::system_clock::now());
        std::ostringstream name;
        name << RUN_LOG_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << DEADLOCK_APP_NAME << " run started "
                     << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << " ===" << std::endl;
        }
    }

    // Keeps the newest KEPT_RUN_LOGS - 1 files so this run makes KEPT_RUN_LOGS
    static void pruneRunLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> runs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with(RUN_LOG_PREFIX)) {
                runs.push_back(entry);
            }
        }
        if (runs.size() < KEPT_RUN_LOGS) {
            return;
        }

        std::sort(runs.begin(), runs.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.last_write_time() < b.last_write_time();
        });
        const size_t excess = runs.size() - (KEPT_RUN_LOGS - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(runs[i].path(), ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
};

} // namespace

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    RunLogFile::Instance().append(level, system, message);
}

} // namespace Deadlock

#endif // ifndef DEBUG
