/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Deadlock {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file sink in release)
  ERROR_LEVEL = 1,  // Always logs (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

inline const char *getLevelString(LogLevel level) {
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

#ifdef DEBUG
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
    printf("Deadlock Sim - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }
};

#define DEADLOCK_CRITICAL(system, msg)                                         \
  Deadlock::Logger::Log(Deadlock::LogLevel::CRITICAL, system, msg)
#define DEADLOCK_ERROR(system, msg)                                            \
  Deadlock::Logger::Log(Deadlock::LogLevel::ERROR_LEVEL, system, msg)
#define DEADLOCK_WARN(system, msg)                                             \
  Deadlock::Logger::Log(Deadlock::LogLevel::WARNING, system, msg)
#define DEADLOCK_INFO(system, msg)                                             \
  Deadlock::Logger::Log(Deadlock::LogLevel::INFO, system, msg)
#define DEADLOCK_DEBUG(system, msg)                                            \
  Deadlock::Logger::Log(Deadlock::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: CRITICAL/ERROR go to a persistent log file, the rest compiles out
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
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message);
};

#define DEADLOCK_CRITICAL(system, msg)                                         \
  Deadlock::Logger::Log("CRITICAL", system, msg)

#define DEADLOCK_ERROR(system, msg) Deadlock::Logger::Log("ERROR", system, msg)

#define DEADLOCK_WARN(system, msg) ((void)0)  // Zero overhead
#define DEADLOCK_INFO(system, msg) ((void)0)  // Zero overhead
#define DEADLOCK_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define SIM_CRITICAL(msg) DEADLOCK_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) DEADLOCK_ERROR("Simulation", msg)
#define SIM_WARN(msg) DEADLOCK_WARN("Simulation", msg)
#define SIM_INFO(msg) DEADLOCK_INFO("Simulation", msg)
#define SIM_DEBUG(msg) DEADLOCK_DEBUG("Simulation", msg)

#define CLOCK_CRITICAL(msg) DEADLOCK_CRITICAL("SimulationClock", msg)
#define CLOCK_ERROR(msg) DEADLOCK_ERROR("SimulationClock", msg)
#define CLOCK_WARN(msg) DEADLOCK_WARN("SimulationClock", msg)
#define CLOCK_INFO(msg) DEADLOCK_INFO("SimulationClock", msg)
#define CLOCK_DEBUG(msg) DEADLOCK_DEBUG("SimulationClock", msg)

#define CONFIG_CRITICAL(msg) DEADLOCK_CRITICAL("SimulationConfig", msg)
#define CONFIG_ERROR(msg) DEADLOCK_ERROR("SimulationConfig", msg)
#define CONFIG_WARN(msg) DEADLOCK_WARN("SimulationConfig", msg)
#define CONFIG_INFO(msg) DEADLOCK_INFO("SimulationConfig", msg)
#define CONFIG_DEBUG(msg) DEADLOCK_DEBUG("SimulationConfig", msg)

// Simulation Systems
#define COLLISION_CRITICAL(msg) DEADLOCK_CRITICAL("CollisionWorld", msg)
#define COLLISION_ERROR(msg) DEADLOCK_ERROR("CollisionWorld", msg)
#define COLLISION_WARN(msg) DEADLOCK_WARN("CollisionWorld", msg)
#define COLLISION_INFO(msg) DEADLOCK_INFO("CollisionWorld", msg)
#define COLLISION_DEBUG(msg) DEADLOCK_DEBUG("CollisionWorld", msg)

#define NAV_CRITICAL(msg) DEADLOCK_CRITICAL("Navigation", msg)
#define NAV_ERROR(msg) DEADLOCK_ERROR("Navigation", msg)
#define NAV_WARN(msg) DEADLOCK_WARN("Navigation", msg)
#define NAV_INFO(msg) DEADLOCK_INFO("Navigation", msg)
#define NAV_DEBUG(msg) DEADLOCK_DEBUG("Navigation", msg)

#define DIRECTOR_CRITICAL(msg) DEADLOCK_CRITICAL("Director", msg)
#define DIRECTOR_ERROR(msg) DEADLOCK_ERROR("Director", msg)
#define DIRECTOR_WARN(msg) DEADLOCK_WARN("Director", msg)
#define DIRECTOR_INFO(msg) DEADLOCK_INFO("Director", msg)
#define DIRECTOR_DEBUG(msg) DEADLOCK_DEBUG("Director", msg)

// Entity and Combat Systems
#define ENTITY_CRITICAL(msg) DEADLOCK_CRITICAL("EntityRegistry", msg)
#define ENTITY_ERROR(msg) DEADLOCK_ERROR("EntityRegistry", msg)
#define ENTITY_WARN(msg) DEADLOCK_WARN("EntityRegistry", msg)
#define ENTITY_INFO(msg) DEADLOCK_INFO("EntityRegistry", msg)
#define ENTITY_DEBUG(msg) DEADLOCK_DEBUG("EntityRegistry", msg)

#define COMBAT_CRITICAL(msg) DEADLOCK_CRITICAL("CombatResolver", msg)
#define COMBAT_ERROR(msg) DEADLOCK_ERROR("CombatResolver", msg)
#define COMBAT_WARN(msg) DEADLOCK_WARN("CombatResolver", msg)
#define COMBAT_INFO(msg) DEADLOCK_INFO("CombatResolver", msg)
#define COMBAT_DEBUG(msg) DEADLOCK_DEBUG("CombatResolver", msg)

// Benchmark mode convenience macros
#define DEADLOCK_ENABLE_BENCHMARK_MODE()                                       \
  Deadlock::Logger::SetBenchmarkMode(true)
#define DEADLOCK_DISABLE_BENCHMARK_MODE()                                      \
  Deadlock::Logger::SetBenchmarkMode(false)

} // namespace Deadlock

#endif // LOGGER_HPP
