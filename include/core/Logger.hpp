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
// - mutex: Required for serialized output when the host logs from several threads
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace AccessOverlay {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging in debug builds
class Logger {
private:
  inline static std::atomic<bool> s_quietMode{false};
  inline static std::mutex s_logMutex{};

public:
  // Quiet mode silences everything, used by the test suites
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
    printf("Access Overlay - [%s] %s: %s\n", system, getLevelString(level),
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

#define ACCESS_CRITICAL(system, msg)                                           \
  AccessOverlay::Logger::Log(AccessOverlay::LogLevel::CRITICAL, system, msg)
#define ACCESS_ERROR(system, msg)                                              \
  AccessOverlay::Logger::Log(AccessOverlay::LogLevel::ERROR_LEVEL, system, msg)
#define ACCESS_WARN(system, msg)                                               \
  AccessOverlay::Logger::Log(AccessOverlay::LogLevel::WARNING, system, msg)
#define ACCESS_INFO(system, msg)                                               \
  AccessOverlay::Logger::Log(AccessOverlay::LogLevel::INFO, system, msg)
#define ACCESS_DEBUG(system, msg)                                              \
  AccessOverlay::Logger::Log(AccessOverlay::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only failures are reported
class Logger {
private:
  inline static std::atomic<bool> s_quietMode{false};

public:
  inline static std::mutex s_logMutex{}; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Access Overlay - [%s] %s: %s\n", system, level, message);
    fflush(stdout);
  }
};

#define ACCESS_CRITICAL(system, msg)                                           \
  AccessOverlay::Logger::Log("CRITICAL", system, msg)

#define ACCESS_ERROR(system, msg)                                              \
  AccessOverlay::Logger::Log("ERROR", system, msg)

#define ACCESS_WARN(system, msg) ((void)0)  // Zero overhead
#define ACCESS_INFO(system, msg) ((void)0)  // Zero overhead
#define ACCESS_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each subsystem

#define OVERLAY_CRITICAL(msg) ACCESS_CRITICAL("AccessibilityOverlay", msg)
#define OVERLAY_ERROR(msg) ACCESS_ERROR("AccessibilityOverlay", msg)
#define OVERLAY_WARN(msg) ACCESS_WARN("AccessibilityOverlay", msg)
#define OVERLAY_INFO(msg) ACCESS_INFO("AccessibilityOverlay", msg)
#define OVERLAY_DEBUG(msg) ACCESS_DEBUG("AccessibilityOverlay", msg)

#define NAVIGATION_CRITICAL(msg) ACCESS_CRITICAL("Navigation", msg)
#define NAVIGATION_ERROR(msg) ACCESS_ERROR("Navigation", msg)
#define NAVIGATION_WARN(msg) ACCESS_WARN("Navigation", msg)
#define NAVIGATION_INFO(msg) ACCESS_INFO("Navigation", msg)
#define NAVIGATION_DEBUG(msg) ACCESS_DEBUG("Navigation", msg)

#define UI_ACCESS_CRITICAL(msg) ACCESS_CRITICAL("UIAccessibility", msg)
#define UI_ACCESS_ERROR(msg) ACCESS_ERROR("UIAccessibility", msg)
#define UI_ACCESS_WARN(msg) ACCESS_WARN("UIAccessibility", msg)
#define UI_ACCESS_INFO(msg) ACCESS_INFO("UIAccessibility", msg)
#define UI_ACCESS_DEBUG(msg) ACCESS_DEBUG("UIAccessibility", msg)

#define SPEECH_CRITICAL(msg) ACCESS_CRITICAL("Speech", msg)
#define SPEECH_ERROR(msg) ACCESS_ERROR("Speech", msg)
#define SPEECH_WARN(msg) ACCESS_WARN("Speech", msg)
#define SPEECH_INFO(msg) ACCESS_INFO("Speech", msg)
#define SPEECH_DEBUG(msg) ACCESS_DEBUG("Speech", msg)

#define INPUT_CRITICAL(msg) ACCESS_CRITICAL("KeyBindings", msg)
#define INPUT_ERROR(msg) ACCESS_ERROR("KeyBindings", msg)
#define INPUT_WARN(msg) ACCESS_WARN("KeyBindings", msg)
#define INPUT_INFO(msg) ACCESS_INFO("KeyBindings", msg)
#define INPUT_DEBUG(msg) ACCESS_DEBUG("KeyBindings", msg)

#define SETTINGS_CRITICAL(msg) ACCESS_CRITICAL("AccessSettings", msg)
#define SETTINGS_ERROR(msg) ACCESS_ERROR("AccessSettings", msg)
#define SETTINGS_WARNING(msg) ACCESS_WARN("AccessSettings", msg)
#define SETTINGS_INFO(msg) ACCESS_INFO("AccessSettings", msg)
#define SETTINGS_DEBUG(msg) ACCESS_DEBUG("AccessSettings", msg)

// Quiet mode convenience macros
#define ACCESS_ENABLE_QUIET_MODE() AccessOverlay::Logger::SetQuietMode(true)
#define ACCESS_DISABLE_QUIET_MODE() AccessOverlay::Logger::SetQuietMode(false)

} // namespace AccessOverlay

#endif // LOGGER_HPP
