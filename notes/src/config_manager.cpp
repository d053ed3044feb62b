/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "SmoothWrite/notes/config_manager.hpp"
#include "SmoothWrite/core/logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace SmoothWrite::notes {

namespace {

constexpr const char* KEY_NOTES_DIRECTORY = "notes_directory";
constexpr const char* KEY_AUTO_SAVE_DELAY = "auto_save_delay_ms";
constexpr const char* KEY_LOG_LEVEL = "log_level";
constexpr const char* KEY_LOG_FILE = "log_file";
constexpr const char* KEY_WELCOME_NOTE = "create_welcome_note";

QString lowerLevelName(core::LogLevel level) {
  return QString::fromLatin1(core::Logger::levelToString(level)).toLower();
}

} // namespace

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

void ConfigManager::resetToDefaults() {
  m_config = AppConfig();
  m_loadedFrom.clear();
}

// ============================================================================
// JSON
// ============================================================================

QJsonObject ConfigManager::toJson(const AppConfig& config) {
  QJsonObject obj;
  obj[KEY_NOTES_DIRECTORY] = config.notesDirectory;
  obj[KEY_AUTO_SAVE_DELAY] = config.autoSaveDelayMs;
  obj[KEY_LOG_LEVEL] = lowerLevelName(config.logLevel);
  obj[KEY_LOG_FILE] = config.logFile;
  obj[KEY_WELCOME_NOTE] = config.createWelcomeNote;
  return obj;
}

AppConfig ConfigManager::fromJson(const QJsonObject& json, const AppConfig& base) {
  AppConfig config = base;

  if (json.contains(KEY_NOTES_DIRECTORY)) {
    const QString dir = json.value(KEY_NOTES_DIRECTORY).toString().trimmed();
    if (dir.isEmpty()) {
      SMOOTHWRITE_LOG_WARN("Config: empty '{}', keeping '{}'", KEY_NOTES_DIRECTORY,
                           config.notesDirectory.toStdString());
    } else {
      config.notesDirectory = dir;
    }
  }

  if (json.contains(KEY_AUTO_SAVE_DELAY)) {
    const QJsonValue value = json.value(KEY_AUTO_SAVE_DELAY);
    const i32 delay = value.toInt(-1);
    if (!value.isDouble() || delay < 0) {
      SMOOTHWRITE_LOG_WARN("Config: invalid '{}', keeping {}ms", KEY_AUTO_SAVE_DELAY,
                           config.autoSaveDelayMs);
    } else {
      config.autoSaveDelayMs = delay;
    }
  }

  if (json.contains(KEY_LOG_LEVEL)) {
    const std::string name = json.value(KEY_LOG_LEVEL).toString().toStdString();
    if (auto level = core::Logger::levelFromString(name)) {
      config.logLevel = *level;
    } else {
      SMOOTHWRITE_LOG_WARN("Config: unknown log level '{}'", name);
    }
  }

  if (json.contains(KEY_LOG_FILE)) {
    config.logFile = json.value(KEY_LOG_FILE).toString();
  }

  if (json.contains(KEY_WELCOME_NOTE)) {
    const QJsonValue value = json.value(KEY_WELCOME_NOTE);
    if (value.isBool()) {
      config.createWelcomeNote = value.toBool();
    } else {
      SMOOTHWRITE_LOG_WARN("Config: '{}' must be a boolean", KEY_WELCOME_NOTE);
    }
  }

  return config;
}

// ============================================================================
// Files
// ============================================================================

Result<void> ConfigManager::loadFromFile(const QString& path) {
  QFile file(path);
  if (!file.exists()) {
    SMOOTHWRITE_LOG_DEBUG("No config file at {}, using defaults", path.toStdString());
    return Result<void>::ok();
  }

  if (!file.open(QIODevice::ReadOnly)) {
    return Result<void>::error("Failed to open config file: " + path.toStdString());
  }
  const QByteArray data = file.readAll();
  file.close();

  QJsonParseError error;
  QJsonDocument doc = QJsonDocument::fromJson(data, &error);
  if (error.error != QJsonParseError::NoError) {
    return Result<void>::error("Failed to parse config file " + path.toStdString() + ": " +
                               error.errorString().toStdString());
  }
  if (!doc.isObject()) {
    return Result<void>::error("Config file is not a JSON object: " + path.toStdString());
  }

  m_config = fromJson(doc.object(), m_config);
  m_loadedFrom = path;
  SMOOTHWRITE_LOG_INFO("Loaded configuration from {}", path.toStdString());
  return Result<void>::ok();
}

Result<void> ConfigManager::saveToFile(const QString& path) const {
  const QFileInfo info(path);
  if (!QDir().mkpath(info.absolutePath())) {
    return Result<void>::error("Failed to create directory: " +
                               info.absolutePath().toStdString());
  }

  const QString tempPath = path + QStringLiteral(".tmp");
  {
    QFile file(tempPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
      return Result<void>::error("Failed to open for writing: " + tempPath.toStdString());
    }
    const QByteArray data = QJsonDocument(toJson(m_config)).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.flush()) {
      file.close();
      QFile::remove(tempPath);
      return Result<void>::error("Failed to write config: " + tempPath.toStdString());
    }
  }

  std::error_code ec;
  fs::rename(fs::path(tempPath.toStdU16String()), fs::path(path.toStdU16String()), ec);
  if (ec) {
    QFile::remove(tempPath);
    return Result<void>::error("Failed to replace " + path.toStdString() + ": " + ec.message());
  }

  SMOOTHWRITE_LOG_INFO("Saved configuration to {}", path.toStdString());
  return Result<void>::ok();
}

void ConfigManager::applyOverrides(const ConfigOverrides& overrides) {
  if (overrides.notesDirectory && !overrides.notesDirectory->trimmed().isEmpty()) {
    m_config.notesDirectory = overrides.notesDirectory->trimmed();
  }
  if (overrides.autoSaveDelayMs) {
    if (*overrides.autoSaveDelayMs < 0) {
      SMOOTHWRITE_LOG_WARN("Ignoring negative auto-save delay {}ms", *overrides.autoSaveDelayMs);
    } else {
      m_config.autoSaveDelayMs = *overrides.autoSaveDelayMs;
    }
  }
  if (overrides.logLevel) {
    m_config.logLevel = *overrides.logLevel;
  }
  if (overrides.createWelcomeNote) {
    m_config.createWelcomeNote = *overrides.createWelcomeNote;
  }
}

} // namespace SmoothWrite::notes
