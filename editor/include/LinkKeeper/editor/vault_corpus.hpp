#pragma once

/**
 * @file vault_corpus.hpp
 * @brief Document corpus backed by a vault directory
 *
 * Document ids are vault-relative paths. Files inside hidden folders
 * (".git", ".obsidian", ".trash") are not part of the corpus.
 */

#include "LinkKeeper/editor/interfaces/IFileSystem.hpp"
#include "LinkKeeper/refs/document_corpus.hpp"
#include "LinkKeeper/runtime/tool_config.hpp"

#include <string>
#include <vector>

namespace LinkKeeper::editor {

class VaultCorpus : public refs::IDocumentCorpus {
public:
  VaultCorpus(IFileSystem& fileSystem, std::string vaultRoot, runtime::ToolConfig config);

  /**
   * @brief Documents (by configured extension), sorted
   */
  [[nodiscard]] std::vector<std::string> listDocuments() const override;

  [[nodiscard]] Result<std::string> readDocument(const std::string& documentPath) const override;

  [[nodiscard]] Result<void> writeDocument(const std::string& documentPath,
                                           const std::string& content) override;

  /**
   * @brief Every file in the vault (documents and assets), sorted
   */
  [[nodiscard]] std::vector<std::string> listAllFiles() const;

  /**
   * @brief Absolute path of a vault-relative path
   */
  [[nodiscard]] std::string absolutePath(const std::string& vaultPath) const;

  [[nodiscard]] const std::string& vaultRoot() const { return m_vaultRoot; }
  [[nodiscard]] const runtime::ToolConfig& config() const { return m_config; }
  void setConfig(runtime::ToolConfig config) { m_config = std::move(config); }

private:
  IFileSystem& m_fileSystem;
  std::string m_vaultRoot;
  runtime::ToolConfig m_config;
};

} // namespace LinkKeeper::editor
