/**
 * @file logging.hpp
 * @brief Standardized logging helpers for examples/tools/tests.
 *
 * Messages below the threshold named by the RK_LOG_LEVEL environment
 * variable (debug, info, warn, error; default info) are dropped.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "rk/types.hpp"

namespace rk::log {

enum class Level {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

inline std::string_view ToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "unknown";
}

inline Level ParseLevel(std::string_view token, Level fallback) {
  for (const Level level : {Level::kDebug, Level::kInfo, Level::kWarn, Level::kError}) {
    if (token == ToString(level)) {
      return level;
    }
  }
  return fallback;
}

inline Level Threshold() {
  static const Level threshold = [] {
    const char* env = std::getenv("RK_LOG_LEVEL");
    return (env == nullptr) ? Level::kInfo : ParseLevel(env, Level::kInfo);
  }();
  return threshold;
}

template <typename... Args>
inline std::string BuildMessage(Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return oss.str();
}

inline void Write(Level level, std::string_view message) {
  if (static_cast<int>(level) < static_cast<int>(Threshold())) {
    return;
  }
  FILE* stream = (level == Level::kError) ? stderr : stdout;
  std::fprintf(stream, "[%s] %.*s\n",
               ToString(level).data(),
               static_cast<int>(message.size()),
               message.data());
}

/** @brief One-line rendering of run counters, e.g. for a final status report. */
inline std::string Summary(IntegratorStatus status, const IntegratorStats& stats) {
  return BuildMessage("status=", rk::ToString(status),
                      " attempted=", stats.attempted_steps,
                      " accepted=", stats.accepted_steps,
                      " rejected=", stats.rejected_steps,
                      " rhs_evals=", stats.rhs_evals,
                      " last_h=", stats.last_h,
                      " last_error_ratio=", stats.last_error_ratio);
}

template <typename... Args>
inline void Debug(Args&&... args) {
  if (static_cast<int>(Level::kDebug) < static_cast<int>(Threshold())) {
    return;
  }
  Write(Level::kDebug, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Info(Args&&... args) {
  Write(Level::kInfo, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Warn(Args&&... args) {
  Write(Level::kWarn, BuildMessage(std::forward<Args>(args)...));
}

template <typename... Args>
inline void Error(Args&&... args) {
  Write(Level::kError, BuildMessage(std::forward<Args>(args)...));
}

}  // namespace rk::log
