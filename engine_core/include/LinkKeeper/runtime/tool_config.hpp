#pragma once

/**
 * @file tool_config.hpp
 * @brief Configuration structures for the link maintenance tool
 *
 * Loaded from (later layers override earlier ones):
 * 1. Built-in defaults
 * 2. <vault>/.linkkeeper.json
 * 3. The file passed with --config
 *
 * @code{.json}
 * {
 *   "documents": { "extensions": ["md"] },
 *   "assets": { "extensions": ["png", "jpg", "svg"] },
 *   "renameGuard": { "suppressWindowMs": 2000, "retentionMs": 5000 },
 *   "scan": { "useStructuralHints": true },
 *   "logging": { "level": "info", "file": "", "debugOperations": false }
 * }
 * @endcode
 */

#include "LinkKeeper/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace LinkKeeper::runtime {

/**
 * @brief True if the path's extension (case-insensitive) is in the list
 *
 * Extensions are stored lowercase without the leading dot.
 */
[[nodiscard]] inline bool hasListedExtension(std::string_view path,
                                             const std::vector<std::string>& extensions) {
  auto slash = path.find_last_of('/');
  auto dot = path.rfind('.');
  if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
    return false;
  }
  std::string ext(path.substr(dot + 1));
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

struct DocumentSettings {
  std::vector<std::string> extensions = {"md"};
};

struct AssetSettings {
  std::vector<std::string> extensions = {"png", "jpg", "jpeg", "gif", "bmp", "webp", "svg"};
};

struct RenameGuardSettings {
  u64 suppressWindowMs = 2000;
  u64 retentionMs = 5000;
};

struct ScanSettings {
  bool useStructuralHints = true;
};

struct LoggingSettings {
  std::string level = "info";
  std::string file;
  bool debugOperations = false;
};

struct ToolConfig {
  DocumentSettings documents;
  AssetSettings assets;
  RenameGuardSettings renameGuard;
  ScanSettings scan;
  LoggingSettings logging;

  [[nodiscard]] bool isDocument(std::string_view path) const {
    return hasListedExtension(path, documents.extensions);
  }

  [[nodiscard]] bool isAsset(std::string_view path) const {
    return hasListedExtension(path, assets.extensions);
  }
};

} // namespace LinkKeeper::runtime
