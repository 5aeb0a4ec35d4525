// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sniffer {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (capture, lookup, session, userip, app, default).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Thread-safe: Uses std::call_once internally. Multiple calls are safe;
  // only the first call performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "session_sniffer.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component (e.g., "capture", "lookup", "userip").
  // Auto-initializes if not initialized. Returns cached logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace sniffer

// Convenience macros for logging
#define LOG_TRACE(...) sniffer::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) sniffer::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) sniffer::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) sniffer::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) sniffer::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CAPTURE_TRACE(...) sniffer::util::LogManager::GetLogger("capture")->trace(__VA_ARGS__)
#define LOG_CAPTURE_DEBUG(...) sniffer::util::LogManager::GetLogger("capture")->debug(__VA_ARGS__)
#define LOG_CAPTURE_INFO(...) sniffer::util::LogManager::GetLogger("capture")->info(__VA_ARGS__)
#define LOG_CAPTURE_WARN(...) sniffer::util::LogManager::GetLogger("capture")->warn(__VA_ARGS__)
#define LOG_CAPTURE_ERROR(...) sniffer::util::LogManager::GetLogger("capture")->error(__VA_ARGS__)

#define LOG_LOOKUP_TRACE(...) sniffer::util::LogManager::GetLogger("lookup")->trace(__VA_ARGS__)
#define LOG_LOOKUP_DEBUG(...) sniffer::util::LogManager::GetLogger("lookup")->debug(__VA_ARGS__)
#define LOG_LOOKUP_INFO(...) sniffer::util::LogManager::GetLogger("lookup")->info(__VA_ARGS__)
#define LOG_LOOKUP_WARN(...) sniffer::util::LogManager::GetLogger("lookup")->warn(__VA_ARGS__)
#define LOG_LOOKUP_ERROR(...) sniffer::util::LogManager::GetLogger("lookup")->error(__VA_ARGS__)

#define LOG_SESSION_TRACE(...) sniffer::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...) sniffer::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...) sniffer::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...) sniffer::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)
#define LOG_SESSION_ERROR(...) sniffer::util::LogManager::GetLogger("session")->error(__VA_ARGS__)

#define LOG_USERIP_DEBUG(...) sniffer::util::LogManager::GetLogger("userip")->debug(__VA_ARGS__)
#define LOG_USERIP_INFO(...) sniffer::util::LogManager::GetLogger("userip")->info(__VA_ARGS__)
#define LOG_USERIP_WARN(...) sniffer::util::LogManager::GetLogger("userip")->warn(__VA_ARGS__)
#define LOG_USERIP_ERROR(...) sniffer::util::LogManager::GetLogger("userip")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) sniffer::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) sniffer::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) sniffer::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) sniffer::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For paths that run once per packet or once per lookup cycle, where a
// persistent fault (dead network, flooded capture) would otherwise produce
// one line per iteration. Each file:line gets RateLimiter::DEFAULT_BURST
// lines per DEFAULT_PERIOD_SECONDS; the first line admitted after a quiet
// spell is followed by a note with the number of lines dropped.
//
// Not for startup/shutdown messages or fatal errors.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_RL_(logger_name, level, ...)                                                                               \
  do {                                                                                                                 \
    auto rl_admission_ = sniffer::util::RateLimiter::instance().admit(                                                 \
        CALLSITE_KEY_, sniffer::util::RateLimiter::DEFAULT_BURST, sniffer::util::RateLimiter::DEFAULT_PERIOD_SECONDS); \
    if (rl_admission_.allowed) {                                                                                       \
      auto rl_logger_ = sniffer::util::LogManager::GetLogger(logger_name);                                             \
      rl_logger_->level(__VA_ARGS__);                                                                                  \
      if (rl_admission_.suppressed > 0) {                                                                              \
        rl_logger_->level("({} similar messages suppressed)", rl_admission_.suppressed);                               \
      }                                                                                                                \
    }                                                                                                                  \
  } while (0)

#define LOG_ERROR_RL(...) LOG_RL_("default", error, __VA_ARGS__)
#define LOG_WARN_RL(...) LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_CAPTURE_WARN_RL(...) LOG_RL_("capture", warn, __VA_ARGS__)
#define LOG_LOOKUP_WARN_RL(...) LOG_RL_("lookup", warn, __VA_ARGS__)
#define LOG_USERIP_WARN_RL(...) LOG_RL_("userip", warn, __VA_ARGS__)
