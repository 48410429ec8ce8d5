/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Chorus {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (file in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Chorus - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define CHORUS_CRITICAL(system, msg)                                           \
  Chorus::Logger::Log(Chorus::LogLevel::CRITICAL, system, msg)
#define CHORUS_ERROR(system, msg)                                              \
  Chorus::Logger::Log(Chorus::LogLevel::ERROR_LEVEL, system, msg)
#define CHORUS_WARN(system, msg)                                               \
  Chorus::Logger::Log(Chorus::LogLevel::WARNING, system, msg)
#define CHORUS_INFO(system, msg)                                               \
  Chorus::Logger::Log(Chorus::LogLevel::INFO, system, msg)
#define CHORUS_DEBUG(system, msg)                                              \
  Chorus::Logger::Log(Chorus::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to a log file, the rest compile away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define CHORUS_CRITICAL(system, msg)                                           \
  Chorus::Logger::Log("CRITICAL", system, msg)
#define CHORUS_ERROR(system, msg) Chorus::Logger::Log("ERROR", system, msg)

#define CHORUS_WARN(system, msg) ((void)0)
#define CHORUS_INFO(system, msg) ((void)0)
#define CHORUS_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros per subsystem

#define CLIENT_CRITICAL(msg) CHORUS_CRITICAL("ChatClient", msg)
#define CLIENT_ERROR(msg) CHORUS_ERROR("ChatClient", msg)
#define CLIENT_WARN(msg) CHORUS_WARN("ChatClient", msg)
#define CLIENT_INFO(msg) CHORUS_INFO("ChatClient", msg)
#define CLIENT_DEBUG(msg) CHORUS_DEBUG("ChatClient", msg)

#define THREADSYSTEM_CRITICAL(msg) CHORUS_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) CHORUS_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) CHORUS_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) CHORUS_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) CHORUS_DEBUG("ThreadSystem", msg)

#define CONFIG_CRITICAL(msg) CHORUS_CRITICAL("ClientConfig", msg)
#define CONFIG_ERROR(msg) CHORUS_ERROR("ClientConfig", msg)
#define CONFIG_WARN(msg) CHORUS_WARN("ClientConfig", msg)
#define CONFIG_INFO(msg) CHORUS_INFO("ClientConfig", msg)
#define CONFIG_DEBUG(msg) CHORUS_DEBUG("ClientConfig", msg)

#define CACHE_CRITICAL(msg) CHORUS_CRITICAL("EntityCache", msg)
#define CACHE_ERROR(msg) CHORUS_ERROR("EntityCache", msg)
#define CACHE_WARN(msg) CHORUS_WARN("EntityCache", msg)
#define CACHE_INFO(msg) CHORUS_INFO("EntityCache", msg)
#define CACHE_DEBUG(msg) CHORUS_DEBUG("EntityCache", msg)

#define BUILDER_CRITICAL(msg) CHORUS_CRITICAL("EntityBuilder", msg)
#define BUILDER_ERROR(msg) CHORUS_ERROR("EntityBuilder", msg)
#define BUILDER_WARN(msg) CHORUS_WARN("EntityBuilder", msg)
#define BUILDER_INFO(msg) CHORUS_INFO("EntityBuilder", msg)
#define BUILDER_DEBUG(msg) CHORUS_DEBUG("EntityBuilder", msg)

#define EMOTE_CRITICAL(msg) CHORUS_CRITICAL("Emote", msg)
#define EMOTE_ERROR(msg) CHORUS_ERROR("Emote", msg)
#define EMOTE_WARN(msg) CHORUS_WARN("Emote", msg)
#define EMOTE_INFO(msg) CHORUS_INFO("Emote", msg)
#define EMOTE_DEBUG(msg) CHORUS_DEBUG("Emote", msg)

#define EMOTE_MANAGER_CRITICAL(msg) CHORUS_CRITICAL("EmoteManager", msg)
#define EMOTE_MANAGER_ERROR(msg) CHORUS_ERROR("EmoteManager", msg)
#define EMOTE_MANAGER_WARN(msg) CHORUS_WARN("EmoteManager", msg)
#define EMOTE_MANAGER_INFO(msg) CHORUS_INFO("EmoteManager", msg)
#define EMOTE_MANAGER_DEBUG(msg) CHORUS_DEBUG("EmoteManager", msg)

#define REST_CRITICAL(msg) CHORUS_CRITICAL("RestAction", msg)
#define REST_ERROR(msg) CHORUS_ERROR("RestAction", msg)
#define REST_WARN(msg) CHORUS_WARN("RestAction", msg)
#define REST_INFO(msg) CHORUS_INFO("RestAction", msg)
#define REST_DEBUG(msg) CHORUS_DEBUG("RestAction", msg)

#define JSON_ERROR(msg) CHORUS_ERROR("JsonReader", msg)
#define JSON_WARN(msg) CHORUS_WARN("JsonReader", msg)

// Benchmark mode convenience macros
#define CHORUS_ENABLE_BENCHMARK_MODE() Chorus::Logger::SetBenchmarkMode(true)
#define CHORUS_DISABLE_BENCHMARK_MODE() Chorus::Logger::SetBenchmarkMode(false)

} // namespace Chorus

#endif // LOGGER_HPP
