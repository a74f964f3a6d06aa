#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace meshlink {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline std::optional<LogLevel> parse_log_level(std::string_view name) {
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn" || name == "warning") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  return std::nullopt;
}

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

  void setLogToFile(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
      auto file_logger =
          std::make_shared<spdlog::logger>("meshlink_file", file_sink);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
    }
  }

  template <typename... Args>
  void debug(const std::source_location& location,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, location, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::source_location& location,
            spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, location, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::source_location& location,
            spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, location, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::source_location& location,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, location, fmt, std::forward<Args>(args)...);
  }

 private:
  Logger() { spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v"); }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    // Extract filename from path (remove directory)
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

/**
 * @brief Format string that remembers where it was written
 *
 * Built implicitly from the literal passed to the log_* helpers, so the
 * default argument picks up the caller's location.
 */
template <typename... Args>
struct LogFormat {
  spdlog::format_string_t<Args...> fmt;
  std::source_location location;

  template <typename S>
  consteval LogFormat(
      const S& format,
      const std::source_location& loc = std::source_location::current())
      : fmt(format), location(loc) {}
};

inline void log_debug(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().debug(location, "{}", message);
}

inline void log_info(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().info(location, "{}", message);
}

inline void log_warn(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().warn(location, "{}", message);
}

inline void log_error(
    const std::string& message,
    const std::source_location& location = std::source_location::current()) {
  Logger::getInstance().error(location, "{}", message);
}

template <typename... Args>
void log_debug(LogFormat<std::type_identity_t<Args>...> format,
               Args&&... args) {
  Logger::getInstance().debug(format.location, format.fmt,
                              std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(LogFormat<std::type_identity_t<Args>...> format,
              Args&&... args) {
  Logger::getInstance().info(format.location, format.fmt,
                             std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(LogFormat<std::type_identity_t<Args>...> format,
              Args&&... args) {
  Logger::getInstance().warn(format.location, format.fmt,
                             std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(LogFormat<std::type_identity_t<Args>...> format,
               Args&&... args) {
  Logger::getInstance().error(format.location, format.fmt,
                              std::forward<Args>(args)...);
}

// Prefixes every message with a component tag, e.g. "reconciler[source=3]".
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(LogFormat<std::type_identity_t<Args>...> format,
             Args&&... args) const {
    log_debug(with_prefix(format.fmt, std::forward<Args>(args)...),
              format.location);
  }

  template <typename... Args>
  void info(LogFormat<std::type_identity_t<Args>...> format,
            Args&&... args) const {
    log_info(with_prefix(format.fmt, std::forward<Args>(args)...),
             format.location);
  }

  template <typename... Args>
  void warn(LogFormat<std::type_identity_t<Args>...> format,
            Args&&... args) const {
    log_warn(with_prefix(format.fmt, std::forward<Args>(args)...),
             format.location);
  }

  template <typename... Args>
  void error(LogFormat<std::type_identity_t<Args>...> format,
             Args&&... args) const {
    log_error(with_prefix(format.fmt, std::forward<Args>(args)...),
              format.location);
  }

 private:
  template <typename... Args>
  std::string with_prefix(spdlog::format_string_t<Args...> fmt,
                          Args&&... args) const {
    return prefix_ + ": " +
           spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
  }

  std::string prefix_;
};

}  // namespace meshlink

#endif  // LOGGER_HPP
