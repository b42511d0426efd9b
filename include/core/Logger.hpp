/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace MarkerSync {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs
  ERROR_LEVEL = 1, // Always logs
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

#ifdef DEBUG
// Every level in debug builds, printed to stdout and stamped with the
// milliseconds since the first log line
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    static const auto start = std::chrono::steady_clock::now();
    long long elapsedMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count();
    printf("MarkerSync %8lldms [%s] %s: %s\n", elapsedMs, system,
           getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define MARKERSYNC_CRITICAL(system, msg)                                       \
  MarkerSync::Logger::Log(MarkerSync::LogLevel::CRITICAL, system, msg)
#define MARKERSYNC_ERROR(system, msg)                                          \
  MarkerSync::Logger::Log(MarkerSync::LogLevel::ERROR_LEVEL, system, msg)
#define MARKERSYNC_WARN(system, msg)                                           \
  MarkerSync::Logger::Log(MarkerSync::LogLevel::WARNING, system, msg)
#define MARKERSYNC_INFO(system, msg)                                           \
  MarkerSync::Logger::Log(MarkerSync::LogLevel::INFO, system, msg)
#define MARKERSYNC_DEBUG(system, msg)                                          \
  MarkerSync::Logger::Log(MarkerSync::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR only, appended to a log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define MARKERSYNC_CRITICAL(system, msg)                                       \
  MarkerSync::Logger::Log("CRITICAL", system, msg)

#define MARKERSYNC_ERROR(system, msg)                                          \
  MarkerSync::Logger::Log("ERROR", system, msg)

#define MARKERSYNC_WARN(system, msg) ((void)0)
#define MARKERSYNC_INFO(system, msg) ((void)0)
#define MARKERSYNC_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_quietMode{false};
#ifdef DEBUG
inline std::mutex Logger::s_logMutex{};
#endif

// Convenience macros for each subsystem

#define SERVER_CRITICAL(msg) MARKERSYNC_CRITICAL("InteractiveMarkerServer", msg)
#define SERVER_ERROR(msg) MARKERSYNC_ERROR("InteractiveMarkerServer", msg)
#define SERVER_WARN(msg) MARKERSYNC_WARN("InteractiveMarkerServer", msg)
#define SERVER_INFO(msg) MARKERSYNC_INFO("InteractiveMarkerServer", msg)
#define SERVER_DEBUG(msg) MARKERSYNC_DEBUG("InteractiveMarkerServer", msg)

#define TRANSPORT_CRITICAL(msg) MARKERSYNC_CRITICAL("LoopbackTransport", msg)
#define TRANSPORT_ERROR(msg) MARKERSYNC_ERROR("LoopbackTransport", msg)
#define TRANSPORT_WARN(msg) MARKERSYNC_WARN("LoopbackTransport", msg)
#define TRANSPORT_INFO(msg) MARKERSYNC_INFO("LoopbackTransport", msg)
#define TRANSPORT_DEBUG(msg) MARKERSYNC_DEBUG("LoopbackTransport", msg)

#define SYNCLOOP_CRITICAL(msg) MARKERSYNC_CRITICAL("SyncLoop", msg)
#define SYNCLOOP_ERROR(msg) MARKERSYNC_ERROR("SyncLoop", msg)
#define SYNCLOOP_WARN(msg) MARKERSYNC_WARN("SyncLoop", msg)
#define SYNCLOOP_INFO(msg) MARKERSYNC_INFO("SyncLoop", msg)
#define SYNCLOOP_DEBUG(msg) MARKERSYNC_DEBUG("SyncLoop", msg)

#define SETTINGS_CRITICAL(msg) MARKERSYNC_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) MARKERSYNC_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) MARKERSYNC_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) MARKERSYNC_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) MARKERSYNC_DEBUG("SettingsManager", msg)

#define DEMO_CRITICAL(msg) MARKERSYNC_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) MARKERSYNC_ERROR("Demo", msg)
#define DEMO_WARN(msg) MARKERSYNC_WARN("Demo", msg)
#define DEMO_INFO(msg) MARKERSYNC_INFO("Demo", msg)
#define DEMO_DEBUG(msg) MARKERSYNC_DEBUG("Demo", msg)

// Tests and benchmarks silence all output
#define MARKERSYNC_ENABLE_QUIET_MODE() MarkerSync::Logger::SetQuietMode(true)
#define MARKERSYNC_DISABLE_QUIET_MODE() MarkerSync::Logger::SetQuietMode(false)

} // namespace MarkerSync

#endif // LOGGER_HPP
