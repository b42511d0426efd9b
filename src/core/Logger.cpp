/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log through the inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace MarkerSync {
namespace {

namespace fs = std::filesystem;

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;
constexpr const char* LOG_PREFIX = "markersync_";

std::string formatLocalTime(std::chrono::system_clock::time_point when,
                            const char* pattern) {
    auto seconds = std::chrono::system_clock::to_time_t(when);
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif
    std::ostringstream out;
    out << std::put_time(&parts, pattern);
    return out.str();
}

// "markersync_YYYYmmdd_HHMMSS.log" names sort by age
void pruneLogDirectory(const fs::path& logDir, size_t keep) {
    std::error_code ec;
    std::vector<fs::path> logs;
    for (const auto& entry : fs::directory_iterator(logDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.starts_with(LOG_PREFIX)) {
            logs.push_back(entry.path());
        }
    }
    if (logs.size() <= keep) {
        return;
    }

    std::sort(logs.begin(), logs.end());
    const size_t excess = logs.size() - keep;
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(logs[i], ec);
    }
}

// Resolves <pref path>/logs, or an empty path if nothing is writable
fs::path resolveLogDirectory() {
    // MARKERSYNC_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char* prefPath = SDL_GetPrefPath("MarkerSync", MARKERSYNC_APP_NAME);
    if (prefPath == nullptr) {
        return {};
    }
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    return ec ? fs::path{} : logDir;
}

/**
 * Release sink for CRITICAL and ERROR lines. The file is opened lazily on the
 * first message so that a server which never fails never touches the disk.
 */
class ErrorLogSink {
public:
    static ErrorLogSink& Instance() {
        static ErrorLogSink sink;
        return sink;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }

        if (!m_file.is_open()) {
            std::fprintf(stderr, "MarkerSync - [%s] %s: %s\n", system, level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        m_file << std::format("{}.{:03} [{}] [{}] {}\n",
                              formatLocalTime(now, "%Y-%m-%d %H:%M:%S"), millis,
                              level, system, message);

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_unflushed >= FLUSH_EVERY) {
            m_file.flush();
            m_unflushed = 0;
        }
    }

private:
    ErrorLogSink() = default;
    ~ErrorLogSink() {
        if (m_file.is_open()) {
            m_file.flush();
        }
    }

    ErrorLogSink(const ErrorLogSink&) = delete;
    ErrorLogSink& operator=(const ErrorLogSink&) = delete;

    void open() {
        m_opened = true;

        fs::path logDir = resolveLogDirectory();
        if (logDir.empty()) {
            return;
        }
        pruneLogDirectory(logDir, KEPT_LOG_FILES - 1);

        auto started = std::chrono::system_clock::now();
        fs::path file = logDir / std::format("{}{}.log", LOG_PREFIX,
                                             formatLocalTime(started, "%Y%m%d_%H%M%S"));
        m_file.open(file, std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << std::format("# {} errors, started {}\n", MARKERSYNC_APP_NAME,
                                  formatLocalTime(started, "%Y-%m-%d %H:%M:%S"));
        }
    }

    std::mutex m_mutex;
    std::ofstream m_file;
    bool m_opened{false};
    size_t m_unflushed{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    ErrorLogSink::Instance().append(level, system, message);
}

} // namespace MarkerSync

#endif // ifndef DEBUG
