#pragma once

/**
 * @file IFileSystem.hpp
 * @brief File system interface for decoupling from QFile/QDir
 *
 * This interface provides an abstraction layer for the file operations the
 * vault tooling needs, allowing:
 * - Unit testing with an in-memory file system
 * - Injecting read/write failures in tests
 */

#include "LinkKeeper/core/result.hpp"
#include "LinkKeeper/core/types.hpp"

#include <string>
#include <vector>

namespace LinkKeeper::editor {

/**
 * @brief File system interface
 *
 * Paths use '/' separators. Implementations should handle path
 * normalization internally.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  // =========================================================================
  // File Existence Checks
  // =========================================================================

  /**
   * @brief Check if a file exists
   * @param path Path to the file
   * @return true if file exists and is a regular file
   */
  [[nodiscard]] virtual bool fileExists(const std::string& path) const = 0;

  /**
   * @brief Check if a directory exists
   * @param path Path to the directory
   * @return true if path exists and is a directory
   */
  [[nodiscard]] virtual bool directoryExists(const std::string& path) const = 0;

  // =========================================================================
  // File Operations
  // =========================================================================

  /**
   * @brief Read entire file content as bytes (no newline translation)
   * @param path Path to the file
   * @return File content or an error message
   */
  [[nodiscard]] virtual Result<std::string> readFile(const std::string& path) const = 0;

  /**
   * @brief Replace file content
   * @param path Path to the file
   * @param content Content to write
   */
  [[nodiscard]] virtual Result<void> writeFile(const std::string& path,
                                               const std::string& content) = 0;

  /**
   * @brief Move/rename a file; fails if the destination exists
   * @param src Source path
   * @param dest Destination path
   */
  [[nodiscard]] virtual Result<void> moveFile(const std::string& src, const std::string& dest) = 0;

  /**
   * @brief Create a directory and all missing parents
   * @return true if the directory exists afterwards
   */
  virtual bool createDirectories(const std::string& path) = 0;

  // =========================================================================
  // Directory Listing
  // =========================================================================

  /**
   * @brief List all files below a directory, recursively
   * @param directory Directory path
   * @return Full file paths
   */
  [[nodiscard]] virtual std::vector<std::string>
  listFilesRecursive(const std::string& directory) const = 0;

  // =========================================================================
  // Path Utilities
  // =========================================================================

  [[nodiscard]] virtual std::string getFileName(const std::string& path) const = 0;
  [[nodiscard]] virtual std::string getParentDirectory(const std::string& path) const = 0;
  [[nodiscard]] virtual std::string normalizePath(const std::string& path) const = 0;
  [[nodiscard]] virtual std::string joinPath(const std::string& base,
                                             const std::string& component) const = 0;

  /**
   * @brief Path of `path` relative to `base` ("" if path is not inside base)
   */
  [[nodiscard]] virtual std::string relativePath(const std::string& base,
                                                 const std::string& path) const = 0;
};

} // namespace LinkKeeper::editor
