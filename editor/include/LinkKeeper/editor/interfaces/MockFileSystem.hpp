#pragma once

/**
 * @file MockFileSystem.hpp
 * @brief In-memory IFileSystem for tests
 *
 * Files live in a map keyed by normalized path. Reads and writes of
 * selected paths can be made to fail so IO error handling can be
 * exercised without touching the disk.
 */

#include "LinkKeeper/editor/interfaces/IFileSystem.hpp"

#include <map>
#include <set>

namespace LinkKeeper::editor {

class MockFileSystem : public IFileSystem {
public:
  MockFileSystem() = default;
  ~MockFileSystem() override = default;

  // =========================================================================
  // IFileSystem Implementation
  // =========================================================================

  [[nodiscard]] bool fileExists(const std::string& path) const override {
    return m_files.find(normalizePath(path)) != m_files.end();
  }

  [[nodiscard]] bool directoryExists(const std::string& path) const override {
    return m_directories.find(normalizePath(path)) != m_directories.end();
  }

  [[nodiscard]] Result<std::string> readFile(const std::string& path) const override {
    std::string normalized = normalizePath(path);
    m_readCount++;
    if (m_readFailures.count(normalized) > 0) {
      return Result<std::string>::error("Simulated read failure: " + normalized);
    }
    auto it = m_files.find(normalized);
    if (it == m_files.end()) {
      return Result<std::string>::error("No such file: " + normalized);
    }
    return Result<std::string>::ok(it->second);
  }

  [[nodiscard]] Result<void> writeFile(const std::string& path,
                                       const std::string& content) override {
    std::string normalized = normalizePath(path);
    if (m_writeFailures.count(normalized) > 0) {
      return Result<void>::error("Simulated write failure: " + normalized);
    }
    m_files[normalized] = content;
    addParents(normalized);
    m_writeCount++;
    return Result<void>::ok();
  }

  [[nodiscard]] Result<void> moveFile(const std::string& src, const std::string& dest) override {
    std::string srcNorm = normalizePath(src);
    std::string destNorm = normalizePath(dest);

    auto it = m_files.find(srcNorm);
    if (it == m_files.end()) {
      return Result<void>::error("No such file: " + srcNorm);
    }
    if (m_files.count(destNorm) > 0) {
      return Result<void>::error("Destination already exists: " + destNorm);
    }
    std::string content = std::move(it->second);
    m_files.erase(it);
    m_files[destNorm] = std::move(content);
    addParents(destNorm);
    m_moveCount++;
    return Result<void>::ok();
  }

  bool createDirectories(const std::string& path) override {
    std::string normalized = normalizePath(path);
    m_directories.insert(normalized);
    addParents(normalized);
    return true;
  }

  [[nodiscard]] std::vector<std::string>
  listFilesRecursive(const std::string& directory) const override {
    std::string prefix = normalizePath(directory);
    if (!prefix.empty()) {
      prefix += '/';
    }
    std::vector<std::string> result;
    for (const auto& [path, content] : m_files) {
      if (path.compare(0, prefix.size(), prefix) == 0) {
        result.push_back(path);
      }
    }
    return result;
  }

  [[nodiscard]] std::string getFileName(const std::string& path) const override {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
  }

  [[nodiscard]] std::string getParentDirectory(const std::string& path) const override {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? "" : path.substr(0, pos);
  }

  [[nodiscard]] std::string normalizePath(const std::string& path) const override {
    std::string result = path;
    for (char& c : result) {
      if (c == '\\') {
        c = '/';
      }
    }
    while (!result.empty() && result.back() == '/') {
      result.pop_back();
    }
    return result;
  }

  [[nodiscard]] std::string joinPath(const std::string& base,
                                     const std::string& component) const override {
    if (base.empty()) {
      return normalizePath(component);
    }
    if (component.empty()) {
      return normalizePath(base);
    }
    return normalizePath(normalizePath(base) + "/" + component);
  }

  [[nodiscard]] std::string relativePath(const std::string& base,
                                         const std::string& path) const override {
    std::string prefix = normalizePath(base) + "/";
    std::string normalized = normalizePath(path);
    if (normalized.compare(0, prefix.size(), prefix) != 0) {
      return "";
    }
    return normalized.substr(prefix.size());
  }

  // =========================================================================
  // Mock Configuration
  // =========================================================================

  void addMockFile(const std::string& path, const std::string& content) {
    std::string normalized = normalizePath(path);
    m_files[normalized] = content;
    addParents(normalized);
  }

  void addMockDirectory(const std::string& path) { createDirectories(path); }

  /// Make every read of path fail until cleared
  void setReadFailure(const std::string& path, bool fail = true) {
    if (fail) {
      m_readFailures.insert(normalizePath(path));
    } else {
      m_readFailures.erase(normalizePath(path));
    }
  }

  /// Make every write of path fail until cleared
  void setWriteFailure(const std::string& path, bool fail = true) {
    if (fail) {
      m_writeFailures.insert(normalizePath(path));
    } else {
      m_writeFailures.erase(normalizePath(path));
    }
  }

  // =========================================================================
  // Test Helpers - Verification
  // =========================================================================

  [[nodiscard]] int getReadCount() const { return m_readCount; }
  [[nodiscard]] int getWriteCount() const { return m_writeCount; }
  [[nodiscard]] int getMoveCount() const { return m_moveCount; }

  /**
   * @brief Content of a file, or "" if it does not exist
   */
  [[nodiscard]] std::string contentOf(const std::string& path) const {
    auto it = m_files.find(normalizePath(path));
    return it == m_files.end() ? "" : it->second;
  }

  [[nodiscard]] const std::map<std::string, std::string>& getFiles() const { return m_files; }

  void reset() {
    m_files.clear();
    m_directories.clear();
    m_readFailures.clear();
    m_writeFailures.clear();
    m_readCount = 0;
    m_writeCount = 0;
    m_moveCount = 0;
  }

private:
  void addParents(const std::string& normalized) {
    std::string parent = getParentDirectory(normalized);
    while (!parent.empty()) {
      m_directories.insert(parent);
      parent = getParentDirectory(parent);
    }
  }

  std::map<std::string, std::string> m_files;
  std::set<std::string> m_directories;
  std::set<std::string> m_readFailures;
  std::set<std::string> m_writeFailures;

  mutable int m_readCount = 0;
  int m_writeCount = 0;
  int m_moveCount = 0;
};

} // namespace LinkKeeper::editor
