/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized console output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace BumperEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for contract violations)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("Bumper Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
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

// Debug build macros - full functionality
#define BUMPER_CRITICAL(system, msg)                                           \
  BumperEngine::Logger::Log(BumperEngine::LogLevel::CRITICAL, system, msg)
#define BUMPER_ERROR(system, msg)                                              \
  BumperEngine::Logger::Log(BumperEngine::LogLevel::ERROR_LEVEL, system, msg)
#define BUMPER_WARN(system, msg)                                               \
  BumperEngine::Logger::Log(BumperEngine::LogLevel::WARNING, system, msg)
#define BUMPER_INFO(system, msg)                                               \
  BumperEngine::Logger::Log(BumperEngine::LogLevel::INFO, system, msg)
#define BUMPER_DEBUG(system, msg)                                              \
  BumperEngine::Logger::Log(BumperEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

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

#define BUMPER_CRITICAL(system, msg)                                           \
  BumperEngine::Logger::Log("CRITICAL", system, msg)

#define BUMPER_ERROR(system, msg)                                              \
  BumperEngine::Logger::Log("ERROR", system, msg)

#define BUMPER_WARN(system, msg) ((void)0)  // Zero overhead
#define BUMPER_INFO(system, msg) ((void)0)  // Zero overhead
#define BUMPER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each engine subsystem

#define COLLISION_CRITICAL(msg) BUMPER_CRITICAL("CollisionWorld", msg)
#define COLLISION_ERROR(msg) BUMPER_ERROR("CollisionWorld", msg)
#define COLLISION_WARN(msg) BUMPER_WARN("CollisionWorld", msg)
#define COLLISION_INFO(msg) BUMPER_INFO("CollisionWorld", msg)
#define COLLISION_DEBUG(msg) BUMPER_DEBUG("CollisionWorld", msg)

#define BROADPHASE_CRITICAL(msg) BUMPER_CRITICAL("SpatialGrid", msg)
#define BROADPHASE_ERROR(msg) BUMPER_ERROR("SpatialGrid", msg)
#define BROADPHASE_WARN(msg) BUMPER_WARN("SpatialGrid", msg)
#define BROADPHASE_INFO(msg) BUMPER_INFO("SpatialGrid", msg)
#define BROADPHASE_DEBUG(msg) BUMPER_DEBUG("SpatialGrid", msg)

#define OBJECTSTORE_CRITICAL(msg) BUMPER_CRITICAL("ObjectStore", msg)
#define OBJECTSTORE_ERROR(msg) BUMPER_ERROR("ObjectStore", msg)
#define OBJECTSTORE_WARN(msg) BUMPER_WARN("ObjectStore", msg)
#define OBJECTSTORE_INFO(msg) BUMPER_INFO("ObjectStore", msg)
#define OBJECTSTORE_DEBUG(msg) BUMPER_DEBUG("ObjectStore", msg)

#define CLOCK_CRITICAL(msg) BUMPER_CRITICAL("FixedStepClock", msg)
#define CLOCK_ERROR(msg) BUMPER_ERROR("FixedStepClock", msg)
#define CLOCK_WARN(msg) BUMPER_WARN("FixedStepClock", msg)
#define CLOCK_INFO(msg) BUMPER_INFO("FixedStepClock", msg)
#define CLOCK_DEBUG(msg) BUMPER_DEBUG("FixedStepClock", msg)

#define DEMO_CRITICAL(msg) BUMPER_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) BUMPER_ERROR("Demo", msg)
#define DEMO_WARN(msg) BUMPER_WARN("Demo", msg)
#define DEMO_INFO(msg) BUMPER_INFO("Demo", msg)
#define DEMO_DEBUG(msg) BUMPER_DEBUG("Demo", msg)

// Benchmark mode convenience macros
#define BUMPER_ENABLE_BENCHMARK_MODE()                                         \
  BumperEngine::Logger::SetBenchmarkMode(true)
#define BUMPER_DISABLE_BENCHMARK_MODE()                                        \
  BumperEngine::Logger::SetBenchmarkMode(false)

} // namespace BumperEngine

#endif // LOGGER_HPP
