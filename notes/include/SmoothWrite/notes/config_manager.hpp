#pragma once

/**
 * @file config_manager.hpp
 * @brief Load/save the application configuration
 *
 * Layered configuration:
 * 1. Defaults (built-in, see AppConfig)
 * 2. smoothwrite.json (optional; a missing file keeps the defaults)
 * 3. Command-line overrides
 *
 * Invalid values are logged and replaced by their defaults, so a bad entry
 * never prevents startup. A file that is not valid JSON is an error.
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/notes/app_config.hpp"
#include <QJsonObject>
#include <QString>

namespace SmoothWrite::notes {

class ConfigManager {
public:
  static constexpr const char* DEFAULT_CONFIG_FILE = "smoothwrite.json";

  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Layer a JSON config file over the current values
   * @return Success (also when the file does not exist) or error message
   */
  Result<void> loadFromFile(const QString& path);

  /**
   * @brief Write the current values to @p path (temp file + rename)
   */
  Result<void> saveToFile(const QString& path) const;

  /**
   * @brief Apply command-line overrides on top of the loaded values
   */
  void applyOverrides(const ConfigOverrides& overrides);

  void resetToDefaults();

  [[nodiscard]] const AppConfig& getConfig() const { return m_config; }
  AppConfig& getConfigMutable() { return m_config; }

  /**
   * @brief Path of the last file loaded, empty if none was found
   */
  [[nodiscard]] const QString& loadedFrom() const { return m_loadedFrom; }

  [[nodiscard]] static QJsonObject toJson(const AppConfig& config);

  /**
   * @brief Parse a JSON object, falling back to @p base for missing or
   *        invalid entries
   */
  [[nodiscard]] static AppConfig fromJson(const QJsonObject& json, const AppConfig& base = {});

private:
  AppConfig m_config;
  QString m_loadedFrom;
};

} // namespace SmoothWrite::notes
