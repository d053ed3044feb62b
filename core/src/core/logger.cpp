#include "SmoothWrite/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define SMOOTHWRITE_ISATTY _isatty
#define SMOOTHWRITE_FILENO _fileno
#else
#include <unistd.h>
#define SMOOTHWRITE_ISATTY isatty
#define SMOOTHWRITE_FILENO fileno
#endif

namespace SmoothWrite::core {

namespace {

const char* levelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

constexpr const char* COLOR_RESET = "\033[0m";

} // namespace

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : m_colors(SMOOTHWRITE_ISATTY(SMOOTHWRITE_FILENO(stderr)) != 0) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

bool Logger::isEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return level != LogLevel::Off && level >= m_level;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.close();
  }
  m_file.open(path, std::ios::out | std::ios::app);
  return m_file.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.flush();
    m_file.close();
  }
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_console = enabled;
}

void Logger::addListener(Listener listener) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_listeners.push_back(std::move(listener));
}

void Logger::clearListeners() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_listeners.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || level < m_level) {
      return;
    }

    const std::string prefix = std::format("[{}] [{}] ", timestamp(), levelToString(level));

    // stdout is reserved for command output
    if (m_console) {
      if (m_colors) {
        std::cerr << levelColor(level) << prefix << COLOR_RESET << message << '\n';
      } else {
        std::cerr << prefix << message << '\n';
      }
    }

    if (m_file.is_open()) {
      m_file << prefix << message << '\n';
      if (level >= LogLevel::Warning) {
        m_file.flush();
      }
    }

    listeners = m_listeners;
  }

  // Listeners run unlocked so they may log themselves
  const std::string text(message);
  for (const auto& listener : listeners) {
    if (listener) {
      listener(level, text);
    }
  }
}

const char* Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> Logger::levelFromString(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace")
    return LogLevel::Trace;
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "fatal")
    return LogLevel::Fatal;
  if (lower == "off")
    return LogLevel::Off;
  return std::nullopt;
}

std::string Logger::timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm localTime{};
#if defined(_WIN32)
  localtime_s(&localTime, &time);
#else
  localtime_r(&time, &localTime);
#endif

  std::ostringstream ss;
  ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace SmoothWrite::core
