#pragma once

/**
 * @file app_config.hpp
 * @brief Application settings with built-in defaults
 */

#include "SmoothWrite/core/logger.hpp"
#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/auto_save_scheduler.hpp"
#include <QString>
#include <optional>

namespace SmoothWrite::notes {

struct AppConfig {
  QString notesDirectory = QStringLiteral("notes");
  i32 autoSaveDelayMs = AutoSaveScheduler::DEFAULT_DELAY_MS;
  core::LogLevel logLevel = core::LogLevel::Info;
  QString logFile = QStringLiteral("logs/smoothwrite.log"); ///< Empty disables file logging
  bool createWelcomeNote = true;

  bool operator==(const AppConfig&) const = default;
};

/**
 * @brief Command-line values that take precedence over the config file
 *
 * Unset members leave the loaded value untouched.
 */
struct ConfigOverrides {
  std::optional<QString> notesDirectory;
  std::optional<i32> autoSaveDelayMs;
  std::optional<core::LogLevel> logLevel;
  std::optional<bool> createWelcomeNote;
};

} // namespace SmoothWrite::notes
