#pragma once

#include <optional>
#include <string_view>
#include <utility>

namespace jose {
namespace logging {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

/**
 * @brief Level for a name such as "debug", std::nullopt for unknown names
 */
inline std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
  constexpr std::pair<std::string_view, LogLevel> names[] = {
      {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
      {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
      {"error", LogLevel::ERROR}, {"critical", LogLevel::CRITICAL},
      {"off", LogLevel::OFF}};
  for (const auto& [candidate, level] : names) {
    if (candidate == name) return level;
  }
  return std::nullopt;
}

}  // namespace logging
}  // namespace jose

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace jose {
namespace logging {

/**
 * @brief Process-wide "jose" logger. The initial level is read from the
 * JOSE_LOG_LEVEL environment variable and defaults to info.
 */
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) { logger_->set_level(toSpdlog(level)); }

  /// Unknown names select info
  void setLogLevel(const std::string& level_str) {
    setLevel(parseLogLevel(level_str).value_or(LogLevel::INFO));
  }

  [[nodiscard]] LogLevel level() const {
    switch (logger_->level()) {
      case spdlog::level::trace: return LogLevel::TRACE;
      case spdlog::level::debug: return LogLevel::DEBUG;
      case spdlog::level::warn: return LogLevel::WARN;
      case spdlog::level::err: return LogLevel::ERROR;
      case spdlog::level::critical: return LogLevel::CRITICAL;
      case spdlog::level::off: return LogLevel::OFF;
      default: return LogLevel::INFO;
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

 private:
  Logger() {
    logger_ = spdlog::get("jose");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("jose");
    }
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");

    const char* configured = std::getenv("JOSE_LOG_LEVEL");
    setLogLevel(configured ? configured : "info");
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE: return spdlog::level::trace;
      case LogLevel::DEBUG: return spdlog::level::debug;
      case LogLevel::INFO: return spdlog::level::info;
      case LogLevel::WARN: return spdlog::level::warn;
      case LogLevel::ERROR: return spdlog::level::err;
      case LogLevel::CRITICAL: return spdlog::level::critical;
      case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace jose

#define JOSE_LOG_TRACE(...) \
  jose::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define JOSE_LOG_DEBUG(...) \
  jose::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define JOSE_LOG_INFO(...) \
  jose::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define JOSE_LOG_WARN(...) \
  jose::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define JOSE_LOG_ERROR(...) \
  jose::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define JOSE_LOG_CRITICAL(...) \
  jose::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define JOSE_LOG_TRACE(...)
#define JOSE_LOG_DEBUG(...)
#define JOSE_LOG_INFO(...)
#define JOSE_LOG_WARN(...)
#define JOSE_LOG_ERROR(...)
#define JOSE_LOG_CRITICAL(...)

#include <string>

namespace jose {
namespace logging {
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(const std::string&) {}
  [[nodiscard]] LogLevel level() const { return LogLevel::OFF; }
};
}  // namespace logging
}  // namespace jose

#endif
