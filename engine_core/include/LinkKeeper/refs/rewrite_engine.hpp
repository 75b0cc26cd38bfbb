#pragma once

/**
 * @file rewrite_engine.hpp
 * @brief Rewrites every link to a renamed or moved asset
 *
 * Per document:
 * - pass 1 keeps only lines that textually mention the old path or name
 *   (plain or with %20 escapes)
 * - pass 2 skips lines in code blocks, tokenizes the rest and rewrites each
 *   token that points at the old asset, restarting the scan after every
 *   substitution since columns shift
 *
 * The link's path style survives the rewrite: a bare name stays bare when
 * the asset keeps its folder, a "./" or "../" path is recomputed from the
 * document's folder, anything else becomes the new full path. Display text
 * and size are kept as written.
 *
 * Links are matched against the vault as it looked before the rename, so a
 * bare name shared with another asset still counts as a link to the old one
 * when the resolver has already recorded the move.
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/document_corpus.hpp"
#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/operation_log.hpp"
#include "LinkKeeper/refs/structural_hints.hpp"

#include <set>
#include <string>
#include <vector>

namespace LinkKeeper::refs {

enum class FileRewriteStatus { Updated, Unchanged, ReadFailed, WriteFailed };

[[nodiscard]] const char* fileRewriteStatusName(FileRewriteStatus status);

struct FileRewriteOutcome {
  std::string documentPath;
  FileRewriteStatus status = FileRewriteStatus::Unchanged;
  u32 occurrencesRewritten = 0;
  std::vector<u32> changedLines;
  std::string error;
};

struct RewriteResult {
  u32 updatedFileCount = 0;
  std::set<std::string> touchedFiles;
  u32 occurrencesRewritten = 0;
  std::vector<FileRewriteOutcome> outcomes;
  /// Set when the rename guard rejected the transition and nothing ran
  bool suppressed = false;

  [[nodiscard]] u32 failedFileCount() const;
};

/**
 * @brief Rewritten text of one document
 */
struct DocumentRewrite {
  std::string content;
  u32 occurrencesRewritten = 0;
  std::vector<u32> changedLines;

  [[nodiscard]] bool changed() const { return occurrencesRewritten > 0; }
};

class RewriteEngine {
public:
  RewriteEngine(IDocumentCorpus& corpus, const ILinkResolver& resolver,
                const IStructuralHintProvider& hintProvider, IOperationLogSink* logSink = nullptr);

  /**
   * @brief Rewrite all links from oldIdentity to newIdentity
   *
   * Documents are processed one after another. A document is written only
   * if at least one line changed; read and write failures are logged,
   * reported in the outcomes and do not stop the remaining documents.
   */
  RewriteResult rewrite(const AssetIdentity& oldIdentity, const AssetIdentity& newIdentity,
                        const std::string& oldDisplayName, const std::string& newDisplayName);

  RewriteResult rewrite(const RenameTransition& transition);

  /**
   * @brief Rewrite one document's content without touching the corpus
   */
  [[nodiscard]] DocumentRewrite rewriteDocument(const std::string& documentPath,
                                                const std::string& content,
                                                const RenameTransition& transition) const;

private:
  [[nodiscard]] DocumentRewrite rewriteDocument(const std::string& documentPath,
                                                const std::string& content,
                                                const RenameTransition& transition,
                                                const ILinkResolver& matchResolver) const;

  [[nodiscard]] std::string newTargetFor(const std::string& writtenPath,
                                         const std::string& documentPath,
                                         const RenameTransition& transition) const;

  IDocumentCorpus& m_corpus;
  const ILinkResolver& m_resolver;
  const IStructuralHintProvider& m_hintProvider;
  IOperationLogSink* m_logSink;
};

} // namespace LinkKeeper::refs
