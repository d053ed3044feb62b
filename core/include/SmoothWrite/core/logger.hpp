#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger: stderr console, optional file, listeners
 */

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SmoothWrite::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

class Logger {
public:
  using Listener = std::function<void(LogLevel, const std::string&)>;

  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;
  [[nodiscard]] bool isEnabled(LogLevel level) const;

  /**
   * @brief Mirror log output into a file (appending)
   * @return false if the file could not be opened; console output continues
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  void setConsoleOutput(bool enabled);

  /// Listeners get the unformatted message after console and file output
  void addListener(Listener listener);
  void clearListeners();

  void log(LogLevel level, std::string_view message);

  /// Formats only when @p level passes the current filter
  template <typename... Args>
  void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (!isEnabled(level)) {
      return;
    }
    const std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, std::string_view(message));
  }

  [[nodiscard]] static const char* levelToString(LogLevel level);

  /**
   * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
   *        "error", "fatal", "off"), case-insensitive
   */
  [[nodiscard]] static std::optional<LogLevel> levelFromString(std::string_view name);

private:
  Logger();
  ~Logger();

  [[nodiscard]] static std::string timestamp();

  LogLevel m_level = LogLevel::Info;
  bool m_colors = false;
  bool m_console = true;
  std::ofstream m_file;
  std::vector<Listener> m_listeners;
  mutable std::mutex m_mutex;
};

} // namespace SmoothWrite::core

#define SMOOTHWRITE_LOG_AT(level, ...)                                                             \
  ::SmoothWrite::core::Logger::instance().log(::SmoothWrite::core::LogLevel::level, __VA_ARGS__)

#define SMOOTHWRITE_LOG_TRACE(...) SMOOTHWRITE_LOG_AT(Trace, __VA_ARGS__)
#define SMOOTHWRITE_LOG_DEBUG(...) SMOOTHWRITE_LOG_AT(Debug, __VA_ARGS__)
#define SMOOTHWRITE_LOG_INFO(...) SMOOTHWRITE_LOG_AT(Info, __VA_ARGS__)
#define SMOOTHWRITE_LOG_WARN(...) SMOOTHWRITE_LOG_AT(Warning, __VA_ARGS__)
#define SMOOTHWRITE_LOG_ERROR(...) SMOOTHWRITE_LOG_AT(Error, __VA_ARGS__)
#define SMOOTHWRITE_LOG_FATAL(...) SMOOTHWRITE_LOG_AT(Fatal, __VA_ARGS__)
