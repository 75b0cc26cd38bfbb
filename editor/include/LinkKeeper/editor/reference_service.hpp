#pragma once

/**
 * @file reference_service.hpp
 * @brief Entry point of the reference tracking core for the host
 *
 * Wires the reference finder, the rewrite engine and the rename guard to
 * one corpus, resolver and hint provider. Rename notifications pass
 * through the guard before any document is touched; listeners hear about
 * every admitted rename after its rewrite has finished.
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/code_span_detector.hpp"
#include "LinkKeeper/refs/document_corpus.hpp"
#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/operation_log.hpp"
#include "LinkKeeper/refs/reference_finder.hpp"
#include "LinkKeeper/refs/rename_guard.hpp"
#include "LinkKeeper/refs/rewrite_engine.hpp"
#include "LinkKeeper/refs/structural_hints.hpp"
#include "LinkKeeper/runtime/tool_config.hpp"

#include <functional>
#include <string>
#include <vector>

namespace LinkKeeper::editor {

/**
 * @brief Called after an admitted rename has been rewritten
 */
using RenameListener =
    std::function<void(const refs::RenameTransition& transition, const refs::RewriteResult&)>;

using ListenerId = u64;

class ReferenceService {
public:
  ReferenceService(refs::IDocumentCorpus& corpus, const refs::ILinkResolver& resolver,
                   const refs::IStructuralHintProvider& hintProvider,
                   refs::IOperationLogSink* logSink = nullptr,
                   refs::RenameGuard::Clock clock = {});

  ReferenceService(const ReferenceService&) = delete;
  ReferenceService& operator=(const ReferenceService&) = delete;

  /**
   * @brief Take guard windows and the asset filter from configuration
   */
  void applyConfig(const runtime::ToolConfig& config);

  // =========================================================================
  // Queries
  // =========================================================================

  /**
   * @brief Every occurrence of an asset outside code, position ordered
   */
  std::vector<refs::LinkOccurrence> findReferences(const refs::AssetIdentity& asset);

  /**
   * @brief Documents embedding an asset with its ordinal among their embeds
   */
  std::vector<refs::DocumentReference> findReferencingDocuments(const refs::AssetIdentity& asset);

  [[nodiscard]] static bool isCodeExcluded(const refs::StructuralHints& hints, u32 lineIndex,
                                           const std::string& lineContent,
                                           const std::vector<std::string>* allLines = nullptr);

  // =========================================================================
  // Rewrites
  // =========================================================================

  /**
   * @brief Rewrite links without consulting the rename guard
   */
  refs::RewriteResult rewriteReferences(const refs::AssetIdentity& oldIdentity,
                                        const refs::AssetIdentity& newIdentity,
                                        const std::string& oldDisplayName,
                                        const std::string& newDisplayName);

  /**
   * @brief Handle a rename notification from the host
   *
   * Paths are vault-relative and refer to the asset before and after the
   * move (the file is expected to exist at newPath already). A transition
   * the guard rejects returns an empty result with suppressed set; paths
   * that are not assets or do not normalize return an empty result.
   */
  refs::RewriteResult handleRename(const std::string& oldPath, const std::string& newPath);

  ListenerId addRenameListener(RenameListener listener);
  void removeRenameListener(ListenerId id);
  [[nodiscard]] usize renameListenerCount() const { return m_listeners.size(); }

  [[nodiscard]] refs::RenameGuard& guard() { return m_guard; }
  [[nodiscard]] refs::ReferenceFinder& finder() { return m_finder; }

private:
  void notifyListeners(const refs::RenameTransition& transition,
                       const refs::RewriteResult& result);

  struct ListenerEntry {
    ListenerId id = 0;
    RenameListener callback;
  };

  refs::IOperationLogSink* m_logSink;
  refs::ReferenceFinder m_finder;
  refs::RewriteEngine m_engine;
  refs::RenameGuard m_guard;
  refs::ReferenceFinder::AssetPredicate m_isAsset;

  std::vector<ListenerEntry> m_listeners;
  ListenerId m_nextListenerId = 1;
};

} // namespace LinkKeeper::editor
