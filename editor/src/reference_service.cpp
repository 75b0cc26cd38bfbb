/**
 * @file reference_service.cpp
 * @brief ReferenceService implementation
 */

#include "LinkKeeper/editor/reference_service.hpp"
#include "LinkKeeper/core/logger.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <algorithm>
#include <exception>

namespace LinkKeeper::editor {

ReferenceService::ReferenceService(refs::IDocumentCorpus& corpus,
                                   const refs::ILinkResolver& resolver,
                                   const refs::IStructuralHintProvider& hintProvider,
                                   refs::IOperationLogSink* logSink, refs::RenameGuard::Clock clock)
    : m_logSink(logSink), m_finder(corpus, resolver, hintProvider, logSink),
      m_engine(corpus, resolver, hintProvider, logSink),
      m_guard(clock ? std::move(clock) : refs::RenameGuard::Clock(&refs::RenameGuard::steadyNowMs)) {
  runtime::ToolConfig defaults;
  m_isAsset = [extensions = defaults.assets.extensions](const std::string& path) {
    return runtime::hasListedExtension(path, extensions);
  };
}

void ReferenceService::applyConfig(const runtime::ToolConfig& config) {
  m_guard.setSuppressWindow(config.renameGuard.suppressWindowMs);
  m_guard.setRetention(config.renameGuard.retentionMs);
  m_isAsset = [extensions = config.assets.extensions](const std::string& path) {
    return runtime::hasListedExtension(path, extensions);
  };
  m_finder.invalidateCache();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<refs::LinkOccurrence>
ReferenceService::findReferences(const refs::AssetIdentity& asset) {
  return m_finder.find(asset);
}

std::vector<refs::DocumentReference>
ReferenceService::findReferencingDocuments(const refs::AssetIdentity& asset) {
  return m_finder.findReferencingDocuments(asset, m_isAsset);
}

bool ReferenceService::isCodeExcluded(const refs::StructuralHints& hints, u32 lineIndex,
                                      const std::string& lineContent,
                                      const std::vector<std::string>* allLines) {
  return refs::CodeSpanDetector::isExcluded(hints, lineIndex, lineContent, allLines);
}

// ============================================================================
// Rewrites
// ============================================================================

refs::RewriteResult ReferenceService::rewriteReferences(const refs::AssetIdentity& oldIdentity,
                                                        const refs::AssetIdentity& newIdentity,
                                                        const std::string& oldDisplayName,
                                                        const std::string& newDisplayName) {
  auto result = m_engine.rewrite(oldIdentity, newIdentity, oldDisplayName, newDisplayName);
  m_finder.invalidateCache();
  return result;
}

refs::RewriteResult ReferenceService::handleRename(const std::string& oldPath,
                                                   const std::string& newPath) {
  refs::RewriteResult result;

  auto oldNormalized = refs::normalizeVaultPath(oldPath);
  auto newNormalized = refs::normalizeVaultPath(newPath);
  if (!oldNormalized || !newNormalized || oldNormalized->empty() || newNormalized->empty()) {
    LINKKEEPER_LOG_WARN("Ignoring rename with invalid path: " + oldPath + " -> " + newPath);
    return result;
  }
  if (*oldNormalized == *newNormalized) {
    return result;
  }
  if (!m_isAsset(*oldNormalized) && !m_isAsset(*newNormalized)) {
    LINKKEEPER_LOG_TRACE("Not an asset, ignoring rename of " + *oldNormalized);
    return result;
  }

  refs::AssetIdentity oldIdentity(*oldNormalized);
  refs::AssetIdentity newIdentity(*newNormalized);
  if (!m_guard.admit(oldIdentity, newIdentity)) {
    LINKKEEPER_LOG_DEBUG("Suppressed repeated rename " + *oldNormalized + " -> " +
                         *newNormalized);
    result.suppressed = true;
    return result;
  }

  auto transition =
      refs::RenameTransition::fromPaths(*oldNormalized, *newNormalized,
                                        refs::RenameGuard::steadyNowMs());

  m_finder.invalidateCache();
  result = m_engine.rewrite(transition);
  m_finder.invalidateCache();

  const bool moved = oldIdentity.folder() != newIdentity.folder();
  refs::emitOperation(
      m_logSink,
      refs::OperationRecord{core::LogLevel::Info,
                            moved ? refs::OperationType::Move : refs::OperationType::Rename,
                            (moved ? "Moved " : "Renamed ") + *oldNormalized + " to " +
                                *newNormalized,
                            "",
                            *newNormalized,
                            {{"updatedFiles", std::to_string(result.updatedFileCount)},
                             {"occurrences", std::to_string(result.occurrencesRewritten)},
                             {"failedFiles", std::to_string(result.failedFileCount())}}});

  notifyListeners(transition, result);
  return result;
}

// ============================================================================
// Listeners
// ============================================================================

ListenerId ReferenceService::addRenameListener(RenameListener listener) {
  ListenerId id = m_nextListenerId++;
  m_listeners.push_back({id, std::move(listener)});
  return id;
}

void ReferenceService::removeRenameListener(ListenerId id) {
  m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                   [id](const ListenerEntry& entry) { return entry.id == id; }),
                    m_listeners.end());
}

void ReferenceService::notifyListeners(const refs::RenameTransition& transition,
                                       const refs::RewriteResult& result) {
  // Listeners may add or remove listeners while being called
  std::vector<ListenerEntry> listenersCopy = m_listeners;

  for (const auto& entry : listenersCopy) {
    if (!entry.callback) {
      continue;
    }
    try {
      entry.callback(transition, result);
    } catch (const std::exception& e) {
      LINKKEEPER_LOG_ERROR("Rename listener failed: " + std::string(e.what()));
      refs::emitOperation(m_logSink,
                          refs::OperationRecord{core::LogLevel::Error,
                                                refs::OperationType::PluginError,
                                                "Rename listener failed",
                                                "",
                                                transition.newIdentity.path(),
                                                {{"error", e.what()}}});
    }
  }
}

} // namespace LinkKeeper::editor
