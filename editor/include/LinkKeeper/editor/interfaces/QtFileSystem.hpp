#pragma once

/**
 * @file QtFileSystem.hpp
 * @brief Qt-based implementation of IFileSystem interface
 *
 * Implements the IFileSystem interface using Qt's file system classes
 * (QFile, QSaveFile, QDir, QFileInfo).
 */

#include "LinkKeeper/editor/interfaces/IFileSystem.hpp"

namespace LinkKeeper::editor {

/**
 * @brief Qt-based implementation of IFileSystem
 *
 * Writes go through QSaveFile so a failed write never leaves a truncated
 * document behind.
 */
class QtFileSystem : public IFileSystem {
public:
  QtFileSystem() = default;
  ~QtFileSystem() override = default;

  // =========================================================================
  // IFileSystem Implementation
  // =========================================================================

  [[nodiscard]] bool fileExists(const std::string& path) const override;
  [[nodiscard]] bool directoryExists(const std::string& path) const override;

  [[nodiscard]] Result<std::string> readFile(const std::string& path) const override;
  [[nodiscard]] Result<void> writeFile(const std::string& path,
                                       const std::string& content) override;
  [[nodiscard]] Result<void> moveFile(const std::string& src, const std::string& dest) override;
  bool createDirectories(const std::string& path) override;

  [[nodiscard]] std::vector<std::string>
  listFilesRecursive(const std::string& directory) const override;

  [[nodiscard]] std::string getFileName(const std::string& path) const override;
  [[nodiscard]] std::string getParentDirectory(const std::string& path) const override;
  [[nodiscard]] std::string normalizePath(const std::string& path) const override;
  [[nodiscard]] std::string joinPath(const std::string& base,
                                     const std::string& component) const override;
  [[nodiscard]] std::string relativePath(const std::string& base,
                                         const std::string& path) const override;
};

} // namespace LinkKeeper::editor
