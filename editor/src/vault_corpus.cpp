/**
 * @file vault_corpus.cpp
 * @brief VaultCorpus implementation
 */

#include "LinkKeeper/editor/vault_corpus.hpp"
#include "LinkKeeper/core/logger.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <algorithm>

namespace LinkKeeper::editor {

namespace {

bool isHiddenPath(const std::string& vaultPath) {
  if (!vaultPath.empty() && vaultPath.front() == '.') {
    return true;
  }
  return vaultPath.find("/.") != std::string::npos;
}

} // namespace

VaultCorpus::VaultCorpus(IFileSystem& fileSystem, std::string vaultRoot,
                         runtime::ToolConfig config)
    : m_fileSystem(fileSystem), m_vaultRoot(fileSystem.normalizePath(vaultRoot)),
      m_config(std::move(config)) {}

std::vector<std::string> VaultCorpus::listAllFiles() const {
  std::vector<std::string> result;
  for (const auto& file : m_fileSystem.listFilesRecursive(m_vaultRoot)) {
    std::string relative = m_fileSystem.relativePath(m_vaultRoot, file);
    if (relative.empty() || isHiddenPath(relative)) {
      continue;
    }
    result.push_back(std::move(relative));
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<std::string> VaultCorpus::listDocuments() const {
  std::vector<std::string> documents;
  for (auto& file : listAllFiles()) {
    if (m_config.isDocument(file)) {
      documents.push_back(std::move(file));
    }
  }
  return documents;
}

Result<std::string> VaultCorpus::readDocument(const std::string& documentPath) const {
  if (!refs::PathValidator::isSafePath(documentPath)) {
    return Result<std::string>::error("Refusing to read outside the vault: " + documentPath);
  }
  return m_fileSystem.readFile(absolutePath(documentPath));
}

Result<void> VaultCorpus::writeDocument(const std::string& documentPath,
                                        const std::string& content) {
  if (!refs::PathValidator::isSafePath(documentPath)) {
    return Result<void>::error("Refusing to write outside the vault: " + documentPath);
  }
  auto result = m_fileSystem.writeFile(absolutePath(documentPath), content);
  if (result.isOk()) {
    LINKKEEPER_LOG_TRACE("Wrote " + documentPath + " (" + std::to_string(content.size()) +
                         " bytes)");
  }
  return result;
}

std::string VaultCorpus::absolutePath(const std::string& vaultPath) const {
  return m_fileSystem.joinPath(m_vaultRoot, vaultPath);
}

} // namespace LinkKeeper::editor
