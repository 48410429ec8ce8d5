/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Chorus {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 50;

std::tm localTime(std::time_t time) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &time);
#else
    localtime_r(&time, &timeinfo);
#endif
    return timeinfo;
}

class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_initialized) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        // YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
        const std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_INTERVAL) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void open() {
        m_initialized = true;

        // CHORUS_APP_NAME comes from the build (${PROJECT_NAME})
        char* prefPath = SDL_GetPrefPath("Chorus", CHORUS_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        pruneOldLogs(logDir);

        const std::tm timeinfo =
            localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        std::ostringstream filename;
        filename << "chorus_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << CHORUS_APP_NAME << " client log, started "
                     << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << " ===\n";
            m_stream.flush();
        }
    }

    void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("chorus_")) {
                logs.push_back(entry);
            }
        }
        if (logs.size() <= KEEP_LOG_FILES) {
            return;
        }

        // Oldest first
        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        const size_t excess = logs.size() - KEEP_LOG_FILES;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_stream;
    bool m_initialized{false};
    size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace Chorus

#endif // ifndef DEBUG
