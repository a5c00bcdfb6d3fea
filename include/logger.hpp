#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <arrow/result.h>
#include <spdlog/spdlog.h>

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace poolcore {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// Accepts debug|info|warn|warning|error in any case.
arrow::Result<LogLevel> parse_log_level(std::string_view name);

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
    }
  }

  LogLevel getLevel() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      default:
        return LogLevel::INFO;
    }
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!spdlog::should_log(level)) {
      return;
    }
    // Extract filename from path (remove directory)
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

 private:
  Logger() {
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

// Format-string logging
template <typename... Args>
inline void log_debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::debug,
                            std::source_location::current(), fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::warn,
                            std::source_location::current(), fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::err,
                            std::source_location::current(), fmt,
                            std::forward<Args>(args)...);
}

// String logging with the caller's location
inline void log_debug(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().log(spdlog::level::debug, location, "{}", message);
}

// Contextual logger that prefixes every message with a component name
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    if (spdlog::should_log(spdlog::level::debug)) {
      log_debug(prefix_ + ": " +
                spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
    }
  }

 private:
  std::string prefix_;
};

}  // namespace poolcore

#endif  // LOGGER_HPP
