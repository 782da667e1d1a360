#pragma once

/**
 * @file config_manager.hpp
 * @brief Loads and saves the engine configuration
 *
 * Configuration is layered:
 * 1. Built-in defaults
 * 2. config/engine_config.json (shipped with the scripts, never written)
 * 3. config/engine_user.json (user overrides, written by saveUserConfig())
 *
 * Both files are optional. A file that exists but is malformed is an error.
 */

#include "Branchline/core/result.hpp"
#include "Branchline/core/types.hpp"
#include "Branchline/runtime/runtime_config.hpp"
#include <functional>
#include <string>

namespace Branchline::runtime {

using ConfigChangeCallback = std::function<void(const EngineConfig&)>;

class ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Set the directory that contains config/
   */
  Result<void> initialize(const std::string& basePath);

  /**
   * @brief Defaults, then engine_config.json, then engine_user.json
   */
  Result<void> loadConfig();

  /**
   * @brief Overlay one explicit file on the current configuration
   */
  Result<void> loadConfigFile(const std::string& path);

  /**
   * @brief Apply a JSON document to the current configuration
   */
  Result<void> applyJson(const std::string& json);

  /**
   * @brief Write the user-adjustable sections to engine_user.json
   */
  Result<void> saveUserConfig();

  [[nodiscard]] const EngineConfig& getConfig() const { return m_config; }
  EngineConfig& getConfigMutable() { return m_config; }

  void resetToDefaults();

  /// Drop user overrides, keep engine_config.json
  void resetUserSettings();

  void setOnConfigChanged(ConfigChangeCallback callback);
  void notifyConfigChanged();

  [[nodiscard]] const std::string& getBasePath() const { return m_basePath; }
  [[nodiscard]] std::string getConfigPath() const;
  [[nodiscard]] std::string getScriptsPath() const;

  // Convenience setters
  void setLogLevel(const std::string& level);
  void setRepromptMessage(const std::string& message);
  void setFallbackMessage(const std::string& message);
  void setMaxChainedTransitions(i32 limit);

  [[nodiscard]] std::string serializeToJson(bool userSettingsOnly) const;

private:
  Result<void> loadFromFile(const std::string& path);
  Result<void> parseJson(const std::string& json, EngineConfig& config) const;

  std::string m_basePath;
  EngineConfig m_config;
  EngineConfig m_baseConfig; // After engine_config.json, before user overrides
  ConfigChangeCallback m_onConfigChanged;
  bool m_initialized = false;
};

} // namespace Branchline::runtime
