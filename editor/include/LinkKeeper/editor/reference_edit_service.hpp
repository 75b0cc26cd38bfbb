#pragma once

/**
 * @file reference_edit_service.hpp
 * @brief In-place edits of a single link's caption and size
 *
 * Works on all link formats:
 * - wiki: `![[path|caption|WxH]]`, `[[path|caption]]`
 * - markdown: `![caption](path)` (no size)
 * - HTML: `<img src="path" alt="caption" width="W" height="H">`
 *
 * The document is re-read before editing and the target line must still
 * contain a link to the asset; stale edits are refused.
 */

#include "LinkKeeper/core/result.hpp"
#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/document_corpus.hpp"
#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/operation_log.hpp"

#include <optional>
#include <string>

namespace LinkKeeper::editor {

struct EditOutcome {
  std::string oldLine;
  std::string newLine;
  refs::LinkFormat format = refs::LinkFormat::Wiki;
  u32 startCol = 0;

  [[nodiscard]] bool changed() const { return oldLine != newLine; }
};

class ReferenceEditService {
public:
  ReferenceEditService(refs::IDocumentCorpus& corpus, const refs::ILinkResolver& resolver,
                       refs::IOperationLogSink* logSink = nullptr);

  /**
   * @brief Change the caption and/or size of the first link to asset on a line
   *
   * @param documentPath Vault path of the note
   * @param line 0-based line number
   * @param asset Asset the link must point at
   * @param newDisplayText New caption; "" removes it, std::nullopt keeps it
   * @param newWidth New width; std::nullopt keeps the current size
   * @param newHeight New height, only used together with newWidth
   * @return What was changed, or an error if the document cannot be read
   *         or written, the line is out of range or no longer links the asset
   */
  Result<EditOutcome> editOccurrence(const std::string& documentPath, u32 line,
                                     const refs::AssetIdentity& asset,
                                     const std::optional<std::string>& newDisplayText,
                                     std::optional<u32> newWidth = std::nullopt,
                                     std::optional<u32> newHeight = std::nullopt);

private:
  refs::IDocumentCorpus& m_corpus;
  const refs::ILinkResolver& m_resolver;
  refs::IOperationLogSink* m_logSink;
};

} // namespace LinkKeeper::editor
