/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "LinkKeeper/runtime/config_manager.hpp"
#include "LinkKeeper/core/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace LinkKeeper::runtime {

using json = nlohmann::json;

namespace {

std::string normalizeExtension(std::string ext) {
  while (!ext.empty() && ext.front() == '.') {
    ext.erase(ext.begin());
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

Result<void> readExtensions(const json& section, const char* key, const std::string& where,
                            std::vector<std::string>& out) {
  if (!section.contains(key)) {
    return Result<void>::ok();
  }
  const json& value = section.at(key);
  if (!value.is_array()) {
    return Result<void>::error(where + "." + key + " must be an array of strings");
  }
  std::vector<std::string> extensions;
  for (const auto& item : value) {
    if (!item.is_string()) {
      return Result<void>::error(where + "." + key + " must be an array of strings");
    }
    std::string ext = normalizeExtension(item.get<std::string>());
    if (!ext.empty()) {
      extensions.push_back(std::move(ext));
    }
  }
  out = std::move(extensions);
  return Result<void>::ok();
}

Result<void> readMilliseconds(const json& section, const char* key, const std::string& where,
                              u64& out) {
  if (!section.contains(key)) {
    return Result<void>::ok();
  }
  const json& value = section.at(key);
  if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<i64>() >= 0)) {
    return Result<void>::error(where + "." + key + " must be a non-negative integer");
  }
  out = value.get<u64>();
  return Result<void>::ok();
}

Result<void> readBool(const json& section, const char* key, const std::string& where, bool& out) {
  if (!section.contains(key)) {
    return Result<void>::ok();
  }
  const json& value = section.at(key);
  if (!value.is_boolean()) {
    return Result<void>::error(where + "." + key + " must be a boolean");
  }
  out = value.get<bool>();
  return Result<void>::ok();
}

Result<void> readString(const json& section, const char* key, const std::string& where,
                        std::string& out) {
  if (!section.contains(key)) {
    return Result<void>::ok();
  }
  const json& value = section.at(key);
  if (!value.is_string()) {
    return Result<void>::error(where + "." + key + " must be a string");
  }
  out = value.get<std::string>();
  return Result<void>::ok();
}

/// Section object or nullptr if absent; error if present but not an object
Result<const json*> section(const json& root, const char* key) {
  if (!root.contains(key)) {
    return Result<const json*>::ok(nullptr);
  }
  const json& value = root.at(key);
  if (!value.is_object()) {
    return Result<const json*>::error(std::string(key) + " must be an object");
  }
  return Result<const json*>::ok(&value);
}

} // namespace

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::initialize(const std::string& vaultPath) {
  std::error_code ec;
  if (!fs::is_directory(vaultPath, ec)) {
    return Result<void>::error("Vault directory does not exist: " + vaultPath);
  }
  m_vaultPath = vaultPath;
  m_initialized = true;
  return Result<void>::ok();
}

Result<void> ConfigManager::loadConfig(const std::optional<std::string>& overridePath) {
  m_config = ToolConfig();

  if (m_initialized) {
    const std::string vaultConfig = getVaultConfigPath();
    std::error_code ec;
    if (fs::exists(vaultConfig, ec)) {
      auto result = loadFromFile(vaultConfig);
      if (result.isError()) {
        return result;
      }
      LINKKEEPER_LOG_DEBUG("Loaded vault configuration from " + vaultConfig);
    }
  }

  if (overridePath) {
    auto result = loadFromFile(*overridePath);
    if (result.isError()) {
      return result;
    }
    LINKKEEPER_LOG_DEBUG("Loaded configuration override from " + *overridePath);
  }

  notifyConfigChanged();
  return Result<void>::ok();
}

Result<void> ConfigManager::applyJson(const std::string& text, const std::string& sourceName) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    return Result<void>::error(sourceName + ": invalid JSON: " + e.what());
  }
  if (!root.is_object()) {
    return Result<void>::error(sourceName + ": top-level value must be an object");
  }

  ToolConfig updated = m_config;
  auto fail = [&sourceName](const std::string& message) {
    return Result<void>::error(sourceName + ": " + message);
  };

  auto documents = section(root, "documents");
  if (documents.isError()) {
    return fail(documents.error());
  }
  if (const json* s = documents.value()) {
    auto r = readExtensions(*s, "extensions", "documents", updated.documents.extensions);
    if (r.isError()) {
      return fail(r.error());
    }
  }

  auto assets = section(root, "assets");
  if (assets.isError()) {
    return fail(assets.error());
  }
  if (const json* s = assets.value()) {
    auto r = readExtensions(*s, "extensions", "assets", updated.assets.extensions);
    if (r.isError()) {
      return fail(r.error());
    }
  }

  auto guard = section(root, "renameGuard");
  if (guard.isError()) {
    return fail(guard.error());
  }
  if (const json* s = guard.value()) {
    auto r = readMilliseconds(*s, "suppressWindowMs", "renameGuard",
                              updated.renameGuard.suppressWindowMs);
    if (r.isError()) {
      return fail(r.error());
    }
    r = readMilliseconds(*s, "retentionMs", "renameGuard", updated.renameGuard.retentionMs);
    if (r.isError()) {
      return fail(r.error());
    }
  }

  auto scan = section(root, "scan");
  if (scan.isError()) {
    return fail(scan.error());
  }
  if (const json* s = scan.value()) {
    auto r = readBool(*s, "useStructuralHints", "scan", updated.scan.useStructuralHints);
    if (r.isError()) {
      return fail(r.error());
    }
  }

  auto logging = section(root, "logging");
  if (logging.isError()) {
    return fail(logging.error());
  }
  if (const json* s = logging.value()) {
    auto r = readString(*s, "level", "logging", updated.logging.level);
    if (r.isError()) {
      return fail(r.error());
    }
    if (!core::parseLogLevel(updated.logging.level)) {
      return fail("logging.level has unknown value '" + updated.logging.level + "'");
    }
    r = readString(*s, "file", "logging", updated.logging.file);
    if (r.isError()) {
      return fail(r.error());
    }
    r = readBool(*s, "debugOperations", "logging", updated.logging.debugOperations);
    if (r.isError()) {
      return fail(r.error());
    }
  }

  m_config = std::move(updated);
  return Result<void>::ok();
}

Result<void> ConfigManager::saveConfig(const std::string& path) const {
  try {
    const fs::path target(path);
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }

    // Write to temp, then rename
    const std::string tempPath = path + ".tmp";
    std::ofstream file(tempPath);
    if (!file.is_open()) {
      return Result<void>::error("Cannot open file for writing: " + path);
    }
    file << serializeToJson();
    file.close();

    fs::rename(tempPath, path);
    LINKKEEPER_LOG_INFO("Configuration saved to " + path);
    return Result<void>::ok();
  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to save config: ") + e.what());
  }
}

std::string ConfigManager::serializeToJson() const {
  json root;
  root["documents"]["extensions"] = m_config.documents.extensions;
  root["assets"]["extensions"] = m_config.assets.extensions;
  root["renameGuard"]["suppressWindowMs"] = m_config.renameGuard.suppressWindowMs;
  root["renameGuard"]["retentionMs"] = m_config.renameGuard.retentionMs;
  root["scan"]["useStructuralHints"] = m_config.scan.useStructuralHints;
  root["logging"]["level"] = m_config.logging.level;
  root["logging"]["file"] = m_config.logging.file;
  root["logging"]["debugOperations"] = m_config.logging.debugOperations;
  return root.dump(2) + "\n";
}

void ConfigManager::resetToDefaults() {
  m_config = ToolConfig();
  notifyConfigChanged();
}

std::string ConfigManager::getVaultConfigPath() const {
  return (fs::path(m_vaultPath) / VAULT_CONFIG_FILE).string();
}

void ConfigManager::setOnConfigChanged(ConfigChangeCallback callback) {
  m_onConfigChanged = std::move(callback);
}

void ConfigManager::notifyConfigChanged() {
  if (m_onConfigChanged) {
    m_onConfigChanged(m_config);
  }
}

Result<void> ConfigManager::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<void>::error("Cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return applyJson(buffer.str(), path);
}

} // namespace LinkKeeper::runtime
