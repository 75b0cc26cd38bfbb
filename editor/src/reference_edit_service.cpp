/**
 * @file reference_edit_service.cpp
 * @brief ReferenceEditService implementation
 */

#include "LinkKeeper/editor/reference_edit_service.hpp"
#include "LinkKeeper/core/logger.hpp"
#include "LinkKeeper/refs/code_span_detector.hpp"
#include "LinkKeeper/refs/link_syntax.hpp"

namespace LinkKeeper::editor {

ReferenceEditService::ReferenceEditService(refs::IDocumentCorpus& corpus,
                                           const refs::ILinkResolver& resolver,
                                           refs::IOperationLogSink* logSink)
    : m_corpus(corpus), m_resolver(resolver), m_logSink(logSink) {}

Result<EditOutcome> ReferenceEditService::editOccurrence(
    const std::string& documentPath, u32 line, const refs::AssetIdentity& asset,
    const std::optional<std::string>& newDisplayText, std::optional<u32> newWidth,
    std::optional<u32> newHeight) {
  auto content = m_corpus.readDocument(documentPath);
  if (content.isError()) {
    return Result<EditOutcome>::error("Cannot read " + documentPath + ": " + content.error());
  }

  std::vector<std::string> lines = refs::splitLines(content.value());
  if (line >= lines.size()) {
    return Result<EditOutcome>::error("Line " + std::to_string(line + 1) + " is out of range in " +
                                      documentPath);
  }

  const std::string& text = lines[line];
  std::optional<refs::LinkToken> target;
  for (const auto& token : refs::tokenizeLine(text)) {
    if (refs::CodeSpanDetector::isInsideInlineSpan(text, token.startCol, token.endCol)) {
      continue;
    }
    auto parsed = refs::parseLinkToken(token);
    if (!parsed) {
      continue;
    }
    auto resolved = m_resolver.resolve(parsed->linkPath, documentPath);
    if (resolved && *resolved == asset) {
      target = token;
      break;
    }
  }

  if (!target) {
    LINKKEEPER_LOG_WARN("Line " + std::to_string(line + 1) + " of " + documentPath +
                        " no longer links " + asset.path());
    return Result<EditOutcome>::error("Line " + std::to_string(line + 1) + " of " + documentPath +
                                      " does not link " + asset.path());
  }

  refs::LinkEdit edit;
  edit.displayText = newDisplayText;
  if (newWidth) {
    edit.clearSize = true;
    edit.width = newWidth;
    edit.height = newHeight;
  }

  auto rebuilt = refs::applyLinkEdit(*target, edit);
  if (!rebuilt) {
    return Result<EditOutcome>::error("Cannot parse link at line " + std::to_string(line + 1) +
                                      " of " + documentPath);
  }

  EditOutcome outcome;
  outcome.oldLine = text;
  outcome.format = target->format;
  outcome.startCol = target->startCol;
  outcome.newLine = text.substr(0, target->startCol) + *rebuilt + text.substr(target->endCol);

  if (!outcome.changed()) {
    return Result<EditOutcome>::ok(std::move(outcome));
  }

  lines[line] = outcome.newLine;
  auto written = m_corpus.writeDocument(documentPath, refs::joinLines(lines));
  if (written.isError()) {
    LINKKEEPER_LOG_ERROR("Failed to write " + documentPath + ": " + written.error());
    refs::emitOperation(m_logSink, refs::OperationRecord{core::LogLevel::Error,
                                                         refs::OperationType::PluginError,
                                                         "Failed to write edited link",
                                                         documentPath,
                                                         asset.path(),
                                                         {{"error", written.error()}}});
    return Result<EditOutcome>::error("Cannot write " + documentPath + ": " + written.error());
  }

  refs::emitOperation(m_logSink,
                      refs::OperationRecord{core::LogLevel::Info,
                                            refs::OperationType::UpdateDisplayText,
                                            "Updated link caption/size",
                                            documentPath,
                                            asset.path(),
                                            {{"line", std::to_string(line + 1)},
                                             {"old", outcome.oldLine},
                                             {"new", outcome.newLine}}});
  return Result<EditOutcome>::ok(std::move(outcome));
}

} // namespace LinkKeeper::editor
