/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace HiveEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file in release)
  ERROR_LEVEL = 1,  // File in release
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
    printf("Hive Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define HIVE_CRITICAL(system, msg)                                             \
  HiveEngine::Logger::Log(HiveEngine::LogLevel::CRITICAL, system, msg)
#define HIVE_ERROR(system, msg)                                                \
  HiveEngine::Logger::Log(HiveEngine::LogLevel::ERROR_LEVEL, system, msg)
#define HIVE_WARN(system, msg)                                                 \
  HiveEngine::Logger::Log(HiveEngine::LogLevel::WARNING, system, msg)
#define HIVE_INFO(system, msg)                                                 \
  HiveEngine::Logger::Log(HiveEngine::LogLevel::INFO, system, msg)
#define HIVE_DEBUG(system, msg)                                                \
  HiveEngine::Logger::Log(HiveEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: CRITICAL and ERROR go to the log file (see Logger.cpp)
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

#define HIVE_CRITICAL(system, msg)                                             \
  HiveEngine::Logger::Log("CRITICAL", system, msg)

#define HIVE_ERROR(system, msg) HiveEngine::Logger::Log("ERROR", system, msg)

#define HIVE_WARN(system, msg) ((void)0)  // Zero overhead
#define HIVE_INFO(system, msg) ((void)0)  // Zero overhead
#define HIVE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

// Core
#define SIMULATION_CRITICAL(msg) HIVE_CRITICAL("SwarmSimulation", msg)
#define SIMULATION_ERROR(msg) HIVE_ERROR("SwarmSimulation", msg)
#define SIMULATION_WARN(msg) HIVE_WARN("SwarmSimulation", msg)
#define SIMULATION_INFO(msg) HIVE_INFO("SwarmSimulation", msg)
#define SIMULATION_DEBUG(msg) HIVE_DEBUG("SwarmSimulation", msg)

#define FRAMECLOCK_CRITICAL(msg) HIVE_CRITICAL("FrameClock", msg)
#define FRAMECLOCK_ERROR(msg) HIVE_ERROR("FrameClock", msg)
#define FRAMECLOCK_WARN(msg) HIVE_WARN("FrameClock", msg)
#define FRAMECLOCK_INFO(msg) HIVE_INFO("FrameClock", msg)
#define FRAMECLOCK_DEBUG(msg) HIVE_DEBUG("FrameClock", msg)

#define CONFIG_CRITICAL(msg) HIVE_CRITICAL("ConfigLoader", msg)
#define CONFIG_ERROR(msg) HIVE_ERROR("ConfigLoader", msg)
#define CONFIG_WARN(msg) HIVE_WARN("ConfigLoader", msg)
#define CONFIG_INFO(msg) HIVE_INFO("ConfigLoader", msg)
#define CONFIG_DEBUG(msg) HIVE_DEBUG("ConfigLoader", msg)

// Agents
#define AGENT_CRITICAL(msg) HIVE_CRITICAL("ParasiteAgent", msg)
#define AGENT_ERROR(msg) HIVE_ERROR("ParasiteAgent", msg)
#define AGENT_WARN(msg) HIVE_WARN("ParasiteAgent", msg)
#define AGENT_INFO(msg) HIVE_INFO("ParasiteAgent", msg)
#define AGENT_DEBUG(msg) HIVE_DEBUG("ParasiteAgent", msg)

#define STRATEGY_CRITICAL(msg) HIVE_CRITICAL("TargetingStrategy", msg)
#define STRATEGY_ERROR(msg) HIVE_ERROR("TargetingStrategy", msg)
#define STRATEGY_WARN(msg) HIVE_WARN("TargetingStrategy", msg)
#define STRATEGY_INFO(msg) HIVE_INFO("TargetingStrategy", msg)
#define STRATEGY_DEBUG(msg) HIVE_DEBUG("TargetingStrategy", msg)

// Managers
#define REGISTRY_CRITICAL(msg) HIVE_CRITICAL("AgentRegistry", msg)
#define REGISTRY_ERROR(msg) HIVE_ERROR("AgentRegistry", msg)
#define REGISTRY_WARN(msg) HIVE_WARN("AgentRegistry", msg)
#define REGISTRY_INFO(msg) HIVE_INFO("AgentRegistry", msg)
#define REGISTRY_DEBUG(msg) HIVE_DEBUG("AgentRegistry", msg)

#define SCHEDULER_CRITICAL(msg) HIVE_CRITICAL("AgentUpdateScheduler", msg)
#define SCHEDULER_ERROR(msg) HIVE_ERROR("AgentUpdateScheduler", msg)
#define SCHEDULER_WARN(msg) HIVE_WARN("AgentUpdateScheduler", msg)
#define SCHEDULER_INFO(msg) HIVE_INFO("AgentUpdateScheduler", msg)
#define SCHEDULER_DEBUG(msg) HIVE_DEBUG("AgentUpdateScheduler", msg)

#define TERRITORY_CRITICAL(msg) HIVE_CRITICAL("TerritoryControl", msg)
#define TERRITORY_ERROR(msg) HIVE_ERROR("TerritoryControl", msg)
#define TERRITORY_WARN(msg) HIVE_WARN("TerritoryControl", msg)
#define TERRITORY_INFO(msg) HIVE_INFO("TerritoryControl", msg)
#define TERRITORY_DEBUG(msg) HIVE_DEBUG("TerritoryControl", msg)

#define GOVERNOR_CRITICAL(msg) HIVE_CRITICAL("PerformanceGovernor", msg)
#define GOVERNOR_ERROR(msg) HIVE_ERROR("PerformanceGovernor", msg)
#define GOVERNOR_WARN(msg) HIVE_WARN("PerformanceGovernor", msg)
#define GOVERNOR_INFO(msg) HIVE_INFO("PerformanceGovernor", msg)
#define GOVERNOR_DEBUG(msg) HIVE_DEBUG("PerformanceGovernor", msg)

#define STATS_CRITICAL(msg) HIVE_CRITICAL("StatisticsCollector", msg)
#define STATS_ERROR(msg) HIVE_ERROR("StatisticsCollector", msg)
#define STATS_WARN(msg) HIVE_WARN("StatisticsCollector", msg)
#define STATS_INFO(msg) HIVE_INFO("StatisticsCollector", msg)
#define STATS_DEBUG(msg) HIVE_DEBUG("StatisticsCollector", msg)

// Spatial
#define SPATIAL_CRITICAL(msg) HIVE_CRITICAL("SpatialIndex", msg)
#define SPATIAL_ERROR(msg) HIVE_ERROR("SpatialIndex", msg)
#define SPATIAL_WARN(msg) HIVE_WARN("SpatialIndex", msg)
#define SPATIAL_INFO(msg) HIVE_INFO("SpatialIndex", msg)
#define SPATIAL_DEBUG(msg) HIVE_DEBUG("SpatialIndex", msg)

// Benchmark mode convenience macros
#define HIVE_ENABLE_BENCHMARK_MODE() HiveEngine::Logger::SetBenchmarkMode(true)
#define HIVE_DISABLE_BENCHMARK_MODE()                                          \
  HiveEngine::Logger::SetBenchmarkMode(false)

} // namespace HiveEngine

#endif // LOGGER_HPP
