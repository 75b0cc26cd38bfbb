#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - layered JSON configuration
 *
 * Handles:
 * - Built-in defaults
 * - <vault>/.linkkeeper.json (per-vault settings)
 * - An explicit override file (--config)
 * - JSON serialization for writing a starter config
 */

#include "LinkKeeper/core/result.hpp"
#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/runtime/tool_config.hpp"

#include <functional>
#include <optional>
#include <string>

namespace LinkKeeper::runtime {

using ConfigChangeCallback = std::function<void(const ToolConfig&)>;

class ConfigManager {
public:
  static constexpr const char* VAULT_CONFIG_FILE = ".linkkeeper.json";

  ConfigManager();
  ~ConfigManager();

  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Set the vault root the per-vault config file is looked up in
   */
  Result<void> initialize(const std::string& vaultPath);

  /**
   * @brief Load configuration
   *
   * Loads in order:
   * 1. Built-in defaults
   * 2. <vault>/.linkkeeper.json (skipped if missing)
   * 3. overridePath (must exist when given)
   *
   * @return Success or the first error encountered
   */
  Result<void> loadConfig(const std::optional<std::string>& overridePath = std::nullopt);

  /**
   * @brief Merge a JSON document into the current configuration
   *
   * Unknown keys are ignored; known keys with the wrong type fail the whole
   * document and leave the configuration untouched.
   *
   * @param json JSON text
   * @param sourceName Name used in error messages
   */
  Result<void> applyJson(const std::string& json, const std::string& sourceName = "<string>");

  /**
   * @brief Write the current configuration as JSON
   */
  Result<void> saveConfig(const std::string& path) const;

  [[nodiscard]] std::string serializeToJson() const;

  [[nodiscard]] const ToolConfig& getConfig() const { return m_config; }
  ToolConfig& getConfigMutable() { return m_config; }

  void resetToDefaults();

  [[nodiscard]] const std::string& getVaultPath() const { return m_vaultPath; }
  [[nodiscard]] std::string getVaultConfigPath() const;

  void setOnConfigChanged(ConfigChangeCallback callback);
  void notifyConfigChanged();

private:
  Result<void> loadFromFile(const std::string& path);

  std::string m_vaultPath;
  ToolConfig m_config;
  ConfigChangeCallback m_onConfigChanged;
  bool m_initialized = false;
};

} // namespace LinkKeeper::runtime
