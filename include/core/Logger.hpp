/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t log level
#include <cstdio> // IWYU pragma: keep - printf()/fflush() in debug builds
#include <mutex> // IWYU pragma: keep - console serialization
#include <string> // IWYU pragma: keep - std::string messages from std::format

namespace NightCage {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

#ifdef DEBUG
// Debug builds: everything goes to stdout
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
    printf("NightCage - [%s] %s: %s\n", system, getLevelString(level),
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

#define NIGHTCAGE_CRITICAL(system, msg)                                        \
  NightCage::Logger::Log(NightCage::LogLevel::CRITICAL, system, msg)
#define NIGHTCAGE_ERROR(system, msg)                                           \
  NightCage::Logger::Log(NightCage::LogLevel::ERROR_LEVEL, system, msg)
#define NIGHTCAGE_WARN(system, msg)                                            \
  NightCage::Logger::Log(NightCage::LogLevel::WARNING, system, msg)
#define NIGHTCAGE_INFO(system, msg)                                            \
  NightCage::Logger::Log(NightCage::LogLevel::INFO, system, msg)
#define NIGHTCAGE_DEBUG(system, msg)                                           \
  NightCage::Logger::Log(NightCage::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: only CRITICAL and ERROR survive, written to a log file
// (see Logger.cpp)
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

#define NIGHTCAGE_CRITICAL(system, msg)                                        \
  NightCage::Logger::Log("CRITICAL", system, msg)
#define NIGHTCAGE_ERROR(system, msg)                                           \
  NightCage::Logger::Log("ERROR", system, msg)

#define NIGHTCAGE_WARN(system, msg) ((void)0)
#define NIGHTCAGE_INFO(system, msg) ((void)0)
#define NIGHTCAGE_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

// Core
#define GAMEENGINE_CRITICAL(msg) NIGHTCAGE_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) NIGHTCAGE_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) NIGHTCAGE_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) NIGHTCAGE_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) NIGHTCAGE_DEBUG("GameEngine", msg)

#define GAMESTATE_CRITICAL(msg) NIGHTCAGE_CRITICAL("GameStateManager", msg)
#define GAMESTATE_ERROR(msg) NIGHTCAGE_ERROR("GameStateManager", msg)
#define GAMESTATE_WARN(msg) NIGHTCAGE_WARN("GameStateManager", msg)
#define GAMESTATE_INFO(msg) NIGHTCAGE_INFO("GameStateManager", msg)
#define GAMESTATE_DEBUG(msg) NIGHTCAGE_DEBUG("GameStateManager", msg)

#define INPUT_CRITICAL(msg) NIGHTCAGE_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) NIGHTCAGE_ERROR("InputManager", msg)
#define INPUT_WARN(msg) NIGHTCAGE_WARN("InputManager", msg)
#define INPUT_INFO(msg) NIGHTCAGE_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) NIGHTCAGE_DEBUG("InputManager", msg)

#define SETTINGS_CRITICAL(msg) NIGHTCAGE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) NIGHTCAGE_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) NIGHTCAGE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) NIGHTCAGE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) NIGHTCAGE_DEBUG("SettingsManager", msg)

#define PROGRESSION_CRITICAL(msg) NIGHTCAGE_CRITICAL("ProgressionManager", msg)
#define PROGRESSION_ERROR(msg) NIGHTCAGE_ERROR("ProgressionManager", msg)
#define PROGRESSION_WARN(msg) NIGHTCAGE_WARN("ProgressionManager", msg)
#define PROGRESSION_INFO(msg) NIGHTCAGE_INFO("ProgressionManager", msg)
#define PROGRESSION_DEBUG(msg) NIGHTCAGE_DEBUG("ProgressionManager", msg)

// World
#define MAZE_CRITICAL(msg) NIGHTCAGE_CRITICAL("Maze", msg)
#define MAZE_ERROR(msg) NIGHTCAGE_ERROR("Maze", msg)
#define MAZE_WARN(msg) NIGHTCAGE_WARN("Maze", msg)
#define MAZE_INFO(msg) NIGHTCAGE_INFO("Maze", msg)
#define MAZE_DEBUG(msg) NIGHTCAGE_DEBUG("Maze", msg)

#define LEVEL_CRITICAL(msg) NIGHTCAGE_CRITICAL("Level", msg)
#define LEVEL_ERROR(msg) NIGHTCAGE_ERROR("Level", msg)
#define LEVEL_WARN(msg) NIGHTCAGE_WARN("Level", msg)
#define LEVEL_INFO(msg) NIGHTCAGE_INFO("Level", msg)
#define LEVEL_DEBUG(msg) NIGHTCAGE_DEBUG("Level", msg)

#define ITEM_CRITICAL(msg) NIGHTCAGE_CRITICAL("ItemManager", msg)
#define ITEM_ERROR(msg) NIGHTCAGE_ERROR("ItemManager", msg)
#define ITEM_WARN(msg) NIGHTCAGE_WARN("ItemManager", msg)
#define ITEM_INFO(msg) NIGHTCAGE_INFO("ItemManager", msg)
#define ITEM_DEBUG(msg) NIGHTCAGE_DEBUG("ItemManager", msg)

#define HAZARD_CRITICAL(msg) NIGHTCAGE_CRITICAL("HazardManager", msg)
#define HAZARD_ERROR(msg) NIGHTCAGE_ERROR("HazardManager", msg)
#define HAZARD_WARN(msg) NIGHTCAGE_WARN("HazardManager", msg)
#define HAZARD_INFO(msg) NIGHTCAGE_INFO("HazardManager", msg)
#define HAZARD_DEBUG(msg) NIGHTCAGE_DEBUG("HazardManager", msg)

#define PUZZLE_CRITICAL(msg) NIGHTCAGE_CRITICAL("PuzzleManager", msg)
#define PUZZLE_ERROR(msg) NIGHTCAGE_ERROR("PuzzleManager", msg)
#define PUZZLE_WARN(msg) NIGHTCAGE_WARN("PuzzleManager", msg)
#define PUZZLE_INFO(msg) NIGHTCAGE_INFO("PuzzleManager", msg)
#define PUZZLE_DEBUG(msg) NIGHTCAGE_DEBUG("PuzzleManager", msg)

// Entities
#define PLAYER_CRITICAL(msg) NIGHTCAGE_CRITICAL("Player", msg)
#define PLAYER_ERROR(msg) NIGHTCAGE_ERROR("Player", msg)
#define PLAYER_WARN(msg) NIGHTCAGE_WARN("Player", msg)
#define PLAYER_INFO(msg) NIGHTCAGE_INFO("Player", msg)
#define PLAYER_DEBUG(msg) NIGHTCAGE_DEBUG("Player", msg)

// Rendering
#define RENDER_CRITICAL(msg) NIGHTCAGE_CRITICAL("RaycastRenderer", msg)
#define RENDER_ERROR(msg) NIGHTCAGE_ERROR("RaycastRenderer", msg)
#define RENDER_WARN(msg) NIGHTCAGE_WARN("RaycastRenderer", msg)
#define RENDER_INFO(msg) NIGHTCAGE_INFO("RaycastRenderer", msg)
#define RENDER_DEBUG(msg) NIGHTCAGE_DEBUG("RaycastRenderer", msg)

// Game states
#define GAMEPLAY_CRITICAL(msg) NIGHTCAGE_CRITICAL("GamePlayState", msg)
#define GAMEPLAY_ERROR(msg) NIGHTCAGE_ERROR("GamePlayState", msg)
#define GAMEPLAY_WARN(msg) NIGHTCAGE_WARN("GamePlayState", msg)
#define GAMEPLAY_INFO(msg) NIGHTCAGE_INFO("GamePlayState", msg)
#define GAMEPLAY_DEBUG(msg) NIGHTCAGE_DEBUG("GamePlayState", msg)

} // namespace NightCage

#endif // LOGGER_HPP
