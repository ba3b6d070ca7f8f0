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
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace GridForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

inline const char *logLevelToString(LogLevel level) {
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

// Worker threads log concurrently during parallel dispatch, so every write
// goes through the same mutex.
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
    printf("GridForge - [%s] %s: %s\n", system, logLevelToString(level),
           message);
    fflush(stdout);
  }
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define GRIDFORGE_CRITICAL(system, msg)                                        \
  GridForge::Logger::Log(GridForge::LogLevel::CRITICAL, system, msg)
#define GRIDFORGE_ERROR(system, msg)                                           \
  GridForge::Logger::Log(GridForge::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define GRIDFORGE_WARN(system, msg)                                            \
  GridForge::Logger::Log(GridForge::LogLevel::WARNING, system, msg)
#define GRIDFORGE_INFO(system, msg)                                            \
  GridForge::Logger::Log(GridForge::LogLevel::INFO, system, msg)
#define GRIDFORGE_DEBUG(system, msg)                                           \
  GridForge::Logger::Log(GridForge::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define GRIDFORGE_WARN(system, msg) ((void)0)  // Zero overhead
#define GRIDFORGE_INFO(system, msg) ((void)0)  // Zero overhead
#define GRIDFORGE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each subsystem

#define SIM_CRITICAL(msg) GRIDFORGE_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) GRIDFORGE_ERROR("Simulation", msg)
#define SIM_WARN(msg) GRIDFORGE_WARN("Simulation", msg)
#define SIM_INFO(msg) GRIDFORGE_INFO("Simulation", msg)
#define SIM_DEBUG(msg) GRIDFORGE_DEBUG("Simulation", msg)

#define ENV_CRITICAL(msg) GRIDFORGE_CRITICAL("Environment", msg)
#define ENV_ERROR(msg) GRIDFORGE_ERROR("Environment", msg)
#define ENV_WARN(msg) GRIDFORGE_WARN("Environment", msg)
#define ENV_INFO(msg) GRIDFORGE_INFO("Environment", msg)
#define ENV_DEBUG(msg) GRIDFORGE_DEBUG("Environment", msg)

#define DISPATCH_CRITICAL(msg) GRIDFORGE_CRITICAL("Dispatch", msg)
#define DISPATCH_ERROR(msg) GRIDFORGE_ERROR("Dispatch", msg)
#define DISPATCH_WARN(msg) GRIDFORGE_WARN("Dispatch", msg)
#define DISPATCH_INFO(msg) GRIDFORGE_INFO("Dispatch", msg)
#define DISPATCH_DEBUG(msg) GRIDFORGE_DEBUG("Dispatch", msg)

#define THREADSYSTEM_CRITICAL(msg) GRIDFORGE_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) GRIDFORGE_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) GRIDFORGE_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) GRIDFORGE_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) GRIDFORGE_DEBUG("ThreadSystem", msg)

#define CONFIG_CRITICAL(msg) GRIDFORGE_CRITICAL("SimulationConfig", msg)
#define CONFIG_ERROR(msg) GRIDFORGE_ERROR("SimulationConfig", msg)
#define CONFIG_WARN(msg) GRIDFORGE_WARN("SimulationConfig", msg)
#define CONFIG_INFO(msg) GRIDFORGE_INFO("SimulationConfig", msg)
#define CONFIG_DEBUG(msg) GRIDFORGE_DEBUG("SimulationConfig", msg)

#define DEMO_CRITICAL(msg) GRIDFORGE_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) GRIDFORGE_ERROR("Demo", msg)
#define DEMO_WARN(msg) GRIDFORGE_WARN("Demo", msg)
#define DEMO_INFO(msg) GRIDFORGE_INFO("Demo", msg)
#define DEMO_DEBUG(msg) GRIDFORGE_DEBUG("Demo", msg)

// Benchmark mode convenience macros
#define GRIDFORGE_ENABLE_BENCHMARK_MODE()                                      \
  GridForge::Logger::SetBenchmarkMode(true)
#define GRIDFORGE_DISABLE_BENCHMARK_MODE()                                     \
  GridForge::Logger::SetBenchmarkMode(false)

} // namespace GridForge

#endif // LOGGER_HPP
