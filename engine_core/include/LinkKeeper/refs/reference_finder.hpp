#pragma once

/**
 * @file reference_finder.hpp
 * @brief Corpus-wide lookup of the links that point at an asset
 *
 * Each document is processed in one pass that merges three sources into a
 * single position-ordered map before anything is emitted:
 * 1. embeds reported by structural hints
 * 2. links reported by structural hints
 * 3. a manual token scan (markdown and HTML only when hints exist, since
 *    hosts typically do not report them; every format otherwise)
 * A manual token overlapping an already recorded one is dropped, so the
 * same (file, line, startCol, endCol) is never reported twice.
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/document_corpus.hpp"
#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/operation_log.hpp"
#include "LinkKeeper/refs/structural_hints.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LinkKeeper::refs {

/**
 * @brief A document that embeds an asset, with the asset's position among
 *        all asset embeds in that document
 */
struct DocumentReference {
  std::string documentPath;
  u32 ordinal = 0; // 0-based index among the document's asset embeds
  u32 line = 0;
};

struct FindStatistics {
  u32 documentsScanned = 0;
  u32 documentsFailed = 0;
  u32 occurrencesFound = 0;
};

class ReferenceFinder {
public:
  using AssetPredicate = std::function<bool(const std::string& linkPath)>;

  ReferenceFinder(const IDocumentCorpus& corpus, const ILinkResolver& resolver,
                  const IStructuralHintProvider& hintProvider,
                  IOperationLogSink* logSink = nullptr);

  /**
   * @brief Every non-code occurrence of target across the corpus
   *
   * Documents that cannot be read are logged and skipped. The result is
   * cached per identity until invalidateCache() is called.
   */
  std::vector<LinkOccurrence> find(const AssetIdentity& target);

  /**
   * @brief Occurrences of target inside one document's content
   */
  [[nodiscard]] std::vector<LinkOccurrence> findInDocument(const std::string& documentPath,
                                                           const std::string& content,
                                                           const AssetIdentity& target) const;

  /**
   * @brief Documents embedding target and its ordinal among their asset embeds
   *
   * Only embeds count (wiki "![[...]]", markdown and HTML images); the
   * predicate decides which link targets are assets.
   */
  std::vector<DocumentReference> findReferencingDocuments(const AssetIdentity& target,
                                                          const AssetPredicate& isAsset);

  /**
   * @brief Result of the last find() for target, if still cached
   */
  [[nodiscard]] std::optional<std::vector<LinkOccurrence>>
  cachedResult(const AssetIdentity& target) const;

  void invalidateCache();
  void invalidateCache(const AssetIdentity& target);

  [[nodiscard]] const FindStatistics& lastStatistics() const { return m_lastStats; }

private:
  /**
   * @brief All link occurrences in a document regardless of target,
   *        deduplicated and position ordered
   */
  [[nodiscard]] std::vector<LinkOccurrence> collectOccurrences(const std::string& documentPath,
                                                               const std::string& content) const;

  const IDocumentCorpus& m_corpus;
  const ILinkResolver& m_resolver;
  const IStructuralHintProvider& m_hintProvider;
  IOperationLogSink* m_logSink;

  std::unordered_map<AssetIdentity, std::vector<LinkOccurrence>> m_cache;
  FindStatistics m_lastStats;
};

} // namespace LinkKeeper::refs
