/**
 * @file rewrite_engine.cpp
 * @brief RewriteEngine implementation
 */

#include "LinkKeeper/refs/rewrite_engine.hpp"
#include "LinkKeeper/refs/code_span_detector.hpp"
#include "LinkKeeper/refs/link_syntax.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <algorithm>
#include <format>

namespace LinkKeeper::refs {

namespace {

bool endsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(std::string_view text, std::string_view prefix) {
  return text.rfind(prefix, 0) == 0;
}

/// Link path names the old asset as full path, bare name or path suffix
bool namesOldAsset(const std::string& linkPath, const RenameTransition& transition) {
  const std::string& oldPath = transition.oldIdentity.path();
  const std::string oldName = transition.oldIdentity.fileName();
  std::string_view path = linkPath;
  if (startsWith(path, "/")) {
    path.remove_prefix(1);
  }
  return path == oldPath || path == oldName || endsWith(path, "/" + oldName);
}

std::vector<std::string> candidateNeedles(const RenameTransition& transition) {
  std::vector<std::string> needles;
  auto add = [&needles](const std::string& needle) {
    if (!needle.empty() && std::find(needles.begin(), needles.end(), needle) == needles.end()) {
      needles.push_back(needle);
    }
  };
  const std::string& oldPath = transition.oldIdentity.path();
  const std::string oldName = transition.oldIdentity.fileName();
  add(oldPath);
  add(oldName);
  add(encodeSpaces(oldPath));
  add(encodeSpaces(oldName));
  add(transition.oldDisplayName);
  return needles;
}

} // namespace

const char* fileRewriteStatusName(FileRewriteStatus status) {
  switch (status) {
  case FileRewriteStatus::Updated:
    return "updated";
  case FileRewriteStatus::Unchanged:
    return "unchanged";
  case FileRewriteStatus::ReadFailed:
    return "read-failed";
  case FileRewriteStatus::WriteFailed:
    return "write-failed";
  }
  return "unknown";
}

u32 RewriteResult::failedFileCount() const {
  return static_cast<u32>(std::count_if(outcomes.begin(), outcomes.end(), [](const auto& outcome) {
    return outcome.status == FileRewriteStatus::ReadFailed ||
           outcome.status == FileRewriteStatus::WriteFailed;
  }));
}

RewriteEngine::RewriteEngine(IDocumentCorpus& corpus, const ILinkResolver& resolver,
                             const IStructuralHintProvider& hintProvider,
                             IOperationLogSink* logSink)
    : m_corpus(corpus), m_resolver(resolver), m_hintProvider(hintProvider), m_logSink(logSink) {}

RewriteResult RewriteEngine::rewrite(const AssetIdentity& oldIdentity,
                                     const AssetIdentity& newIdentity,
                                     const std::string& oldDisplayName,
                                     const std::string& newDisplayName) {
  RenameTransition transition;
  transition.oldIdentity = oldIdentity;
  transition.newIdentity = newIdentity;
  transition.oldDisplayName = oldDisplayName;
  transition.newDisplayName = newDisplayName;
  return rewrite(transition);
}

RewriteResult RewriteEngine::rewrite(const RenameTransition& transition) {
  RewriteResult result;
  if (transition.oldIdentity.isEmpty() || transition.newIdentity.isEmpty() ||
      transition.oldIdentity == transition.newIdentity) {
    return result;
  }

  LINKKEEPER_LOG_DEBUG("Rewriting references " + transition.oldIdentity.path() + " -> " +
                       transition.newIdentity.path());

  const auto rewound = m_resolver.rewoundBefore(transition.oldIdentity, transition.newIdentity);
  const ILinkResolver& matchResolver = rewound ? *rewound : m_resolver;

  for (const auto& documentPath : m_corpus.listDocuments()) {
    FileRewriteOutcome outcome;
    outcome.documentPath = documentPath;

    auto content = m_corpus.readDocument(documentPath);
    if (content.isError()) {
      outcome.status = FileRewriteStatus::ReadFailed;
      outcome.error = content.error();
      LINKKEEPER_LOG_ERROR("Failed to read " + documentPath + ": " + content.error());
      emitOperation(m_logSink, OperationRecord{core::LogLevel::Error,
                                               OperationType::PluginError,
                                               "Failed to read document during rewrite",
                                               documentPath,
                                               transition.oldIdentity.path(),
                                               {{"error", content.error()}}});
      result.outcomes.push_back(std::move(outcome));
      continue;
    }

    DocumentRewrite rewritten =
        rewriteDocument(documentPath, content.value(), transition, matchResolver);
    if (!rewritten.changed()) {
      result.outcomes.push_back(std::move(outcome));
      continue;
    }

    auto written = m_corpus.writeDocument(documentPath, rewritten.content);
    if (written.isError()) {
      outcome.status = FileRewriteStatus::WriteFailed;
      outcome.error = written.error();
      LINKKEEPER_LOG_ERROR("Failed to write " + documentPath + ": " + written.error());
      emitOperation(m_logSink, OperationRecord{core::LogLevel::Error,
                                               OperationType::PluginError,
                                               "Failed to write document during rewrite",
                                               documentPath,
                                               transition.oldIdentity.path(),
                                               {{"error", written.error()}}});
      result.outcomes.push_back(std::move(outcome));
      continue;
    }

    outcome.status = FileRewriteStatus::Updated;
    outcome.occurrencesRewritten = rewritten.occurrencesRewritten;
    outcome.changedLines = std::move(rewritten.changedLines);

    ++result.updatedFileCount;
    result.touchedFiles.insert(documentPath);
    result.occurrencesRewritten += outcome.occurrencesRewritten;

    emitOperation(m_logSink,
                  OperationRecord{core::LogLevel::Info,
                                  OperationType::UpdateReference,
                                  "Updated " + std::to_string(outcome.occurrencesRewritten) +
                                      " link(s)",
                                  documentPath,
                                  transition.newIdentity.path(),
                                  {{"from", transition.oldIdentity.path()}}});
    result.outcomes.push_back(std::move(outcome));
  }

  LINKKEEPER_LOG_INFO(std::format("Rewrote {} link(s) in {} document(s) for {} -> {}",
                                  result.occurrencesRewritten, result.updatedFileCount,
                                  transition.oldIdentity.path(), transition.newIdentity.path()));
  return result;
}

DocumentRewrite RewriteEngine::rewriteDocument(const std::string& documentPath,
                                               const std::string& content,
                                               const RenameTransition& transition) const {
  const auto rewound = m_resolver.rewoundBefore(transition.oldIdentity, transition.newIdentity);
  return rewriteDocument(documentPath, content, transition, rewound ? *rewound : m_resolver);
}

DocumentRewrite RewriteEngine::rewriteDocument(const std::string& documentPath,
                                               const std::string& content,
                                               const RenameTransition& transition,
                                               const ILinkResolver& matchResolver) const {
  DocumentRewrite rewrite;
  rewrite.content = content;

  std::vector<std::string> lines = splitLines(content);
  const std::vector<std::string> needles = candidateNeedles(transition);

  // Pass 1: cheap textual filter
  std::vector<u32> candidates;
  for (u32 i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (std::any_of(needles.begin(), needles.end(),
                    [&line](const std::string& needle) { return line.find(needle) != std::string::npos; })) {
      candidates.push_back(i);
    }
  }
  if (candidates.empty()) {
    return rewrite;
  }

  // Pass 2: parse and rebuild matching tokens
  const CodeSpanDetector detector(m_hintProvider.hintsFor(documentPath, lines), lines);
  for (u32 lineIndex : candidates) {
    if (detector.isLineExcluded(lineIndex)) {
      continue;
    }
    std::string& line = lines[lineIndex];
    bool lineChanged = false;
    u32 searchFrom = 0;

    while (searchFrom < line.size()) {
      bool substituted = false;
      for (const auto& token : tokenizeLine(line, searchFrom)) {
        if (CodeSpanDetector::isInsideInlineSpan(line, token.startCol, token.endCol)) {
          continue;
        }
        auto parsed = parseLinkToken(token);
        if (!parsed) {
          continue;
        }

        auto resolved = matchResolver.resolve(parsed->linkPath, documentPath);
        const bool pointsAtOld = resolved && *resolved == transition.oldIdentity;
        const bool stale = !resolved || *resolved == transition.newIdentity;
        if (!pointsAtOld && !(stale && namesOldAsset(parsed->linkPath, transition))) {
          continue;
        }

        LinkEdit edit;
        edit.target = newTargetFor(parsed->linkPath, documentPath, transition);

        auto rebuilt = applyLinkEdit(token, edit);
        if (!rebuilt || *rebuilt == token.text) {
          continue;
        }

        line.replace(token.startCol, token.endCol - token.startCol, *rebuilt);
        searchFrom = token.startCol + static_cast<u32>(rebuilt->size());
        ++rewrite.occurrencesRewritten;
        lineChanged = true;
        substituted = true;
        break;
      }
      if (!substituted) {
        break;
      }
    }

    if (lineChanged) {
      rewrite.changedLines.push_back(lineIndex);
    }
  }

  if (rewrite.changed()) {
    rewrite.content = joinLines(lines);
  }
  return rewrite;
}

std::string RewriteEngine::newTargetFor(const std::string& writtenPath,
                                        const std::string& documentPath,
                                        const RenameTransition& transition) const {
  const std::string& newPath = transition.newIdentity.path();

  if (startsWith(writtenPath, "./") || startsWith(writtenPath, "../")) {
    std::string relative = calculateRelativePath(documentPath, newPath);
    if (startsWith(writtenPath, "./") && !startsWith(relative, "../")) {
      relative = "./" + relative;
    }
    return relative;
  }

  // A bare name stays bare for an in-place rename; a move to another folder
  // or a name that would resolve elsewhere gets the full path
  if (writtenPath.find('/') == std::string::npos) {
    const std::string newName = transition.newIdentity.fileName();
    if (transition.newIdentity.folder() != transition.oldIdentity.folder()) {
      return newPath;
    }
    auto resolved = m_resolver.resolve(newName, documentPath);
    if (!resolved || *resolved == transition.newIdentity) {
      return newName;
    }
    return newPath;
  }

  if (startsWith(writtenPath, "/")) {
    return "/" + newPath;
  }
  return newPath;
}

} // namespace LinkKeeper::refs
