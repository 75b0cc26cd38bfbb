/**
 * @file reference_finder.cpp
 * @brief ReferenceFinder implementation
 */

#include "LinkKeeper/refs/reference_finder.hpp"
#include "LinkKeeper/refs/code_span_detector.hpp"
#include "LinkKeeper/refs/link_syntax.hpp"

#include <iterator>
#include <map>
#include <tuple>

namespace LinkKeeper::refs {

namespace {

using PositionKey = std::tuple<u32, u32, u32>; // line, startCol, endCol
using OccurrenceMap = std::map<PositionKey, LinkOccurrence>;

bool overlapsRecorded(const OccurrenceMap& recorded, u32 line, u32 startCol, u32 endCol) {
  auto it = recorded.lower_bound(PositionKey{line, 0, 0});
  for (; it != recorded.end() && std::get<0>(it->first) == line; ++it) {
    const u32 otherStart = std::get<1>(it->first);
    const u32 otherEnd = std::get<2>(it->first);
    if (startCol < otherEnd && otherStart < endCol) {
      return true;
    }
  }
  return false;
}

/// Rebuild the token a host hint points at; nullopt if the text there is
/// not a link token any more
std::optional<LinkToken> tokenFromHint(const LinkHint& hint, const std::string& line) {
  if (hint.startCol >= hint.endCol || hint.endCol > line.size()) {
    return std::nullopt;
  }
  u32 start = hint.startCol;
  // Some hosts report an embed starting at "[[" rather than "![["
  if (start > 0 && line[start - 1] == '!' && line.compare(start, 2, "[[") == 0) {
    --start;
  }
  auto tokens = tokenizeLine(line, start);
  if (tokens.empty() || tokens.front().startCol != start) {
    return std::nullopt;
  }
  return tokens.front();
}

} // namespace

ReferenceFinder::ReferenceFinder(const IDocumentCorpus& corpus, const ILinkResolver& resolver,
                                 const IStructuralHintProvider& hintProvider,
                                 IOperationLogSink* logSink)
    : m_corpus(corpus), m_resolver(resolver), m_hintProvider(hintProvider), m_logSink(logSink) {}

std::vector<LinkOccurrence> ReferenceFinder::collectOccurrences(const std::string& documentPath,
                                                                const std::string& content) const {
  const std::vector<std::string> lines = splitLines(content);
  CodeSpanDetector detector(m_hintProvider.hintsFor(documentPath, lines), lines);

  OccurrenceMap recorded;

  auto record = [&](const LinkToken& token, u32 lineIndex, const std::string* hintedLink) {
    if (detector.isOccurrenceExcluded(lineIndex, token.startCol, token.endCol)) {
      return;
    }
    auto parsed = parseLinkToken(token);
    if (!parsed) {
      return;
    }
    std::string linkPath = parsed->linkPath;
    if (hintedLink && !hintedLink->empty()) {
      linkPath = splitWikiSubpath(*hintedLink).first;
    }

    LinkOccurrence occurrence;
    occurrence.format = token.format;
    occurrence.rawMatch = token.text;
    occurrence.targetRaw = parsed->targetRaw;
    if (auto resolved = m_resolver.resolve(linkPath, documentPath)) {
      occurrence.resolvedPath = *resolved;
    }
    occurrence.displayText = parsed->displayText;
    occurrence.width = parsed->width;
    occurrence.height = parsed->height;
    occurrence.file = documentPath;
    occurrence.line = lineIndex;
    occurrence.startCol = token.startCol;
    occurrence.endCol = token.endCol;
    occurrence.lineContent = lines[lineIndex];
    recorded.emplace(PositionKey{lineIndex, token.startCol, token.endCol}, std::move(occurrence));
  };

  const auto* structure = std::get_if<DocumentStructure>(&detector.hints());
  if (structure) {
    for (const auto* hintList : {&structure->embeds, &structure->links}) {
      for (const auto& hint : *hintList) {
        if (hint.line >= lines.size()) {
          continue;
        }
        auto token = tokenFromHint(hint, lines[hint.line]);
        if (!token ||
            overlapsRecorded(recorded, hint.line, token->startCol, token->endCol)) {
          continue;
        }
        record(*token, hint.line, &hint.link);
      }
    }
  }

  for (u32 lineIndex = 0; lineIndex < lines.size(); ++lineIndex) {
    const std::string& line = lines[lineIndex];
    if (line.find_first_of("[<") == std::string::npos || detector.isLineExcluded(lineIndex)) {
      continue;
    }
    for (const auto& token : tokenizeLine(line)) {
      if (structure && token.format != LinkFormat::Markdown && token.format != LinkFormat::Html) {
        continue;
      }
      if (overlapsRecorded(recorded, lineIndex, token.startCol, token.endCol)) {
        continue;
      }
      record(token, lineIndex, nullptr);
    }
  }

  std::vector<LinkOccurrence> result;
  result.reserve(recorded.size());
  for (auto& [key, occurrence] : recorded) {
    result.push_back(std::move(occurrence));
  }
  return result;
}

std::vector<LinkOccurrence> ReferenceFinder::findInDocument(const std::string& documentPath,
                                                            const std::string& content,
                                                            const AssetIdentity& target) const {
  std::vector<LinkOccurrence> matches;
  for (auto& occurrence : collectOccurrences(documentPath, content)) {
    if (!occurrence.resolvedPath.isEmpty() && occurrence.resolvedPath == target) {
      matches.push_back(std::move(occurrence));
    }
  }
  return matches;
}

std::vector<LinkOccurrence> ReferenceFinder::find(const AssetIdentity& target) {
  m_lastStats = FindStatistics{};
  std::vector<LinkOccurrence> occurrences;

  for (const auto& documentPath : m_corpus.listDocuments()) {
    auto content = m_corpus.readDocument(documentPath);
    if (content.isError()) {
      ++m_lastStats.documentsFailed;
      LINKKEEPER_LOG_WARN("Skipping unreadable document " + documentPath + ": " +
                          content.error());
      emitOperation(m_logSink, OperationRecord{core::LogLevel::Error,
                                               OperationType::FindReference,
                                               "Failed to read document: " + content.error(),
                                               documentPath,
                                               target.path(),
                                               {}});
      continue;
    }
    ++m_lastStats.documentsScanned;

    auto found = findInDocument(documentPath, content.value(), target);
    occurrences.insert(occurrences.end(), std::make_move_iterator(found.begin()),
                       std::make_move_iterator(found.end()));
  }

  m_lastStats.occurrencesFound = static_cast<u32>(occurrences.size());
  emitOperation(m_logSink,
                OperationRecord{core::LogLevel::Info,
                                OperationType::FindReference,
                                "Found " + std::to_string(occurrences.size()) + " reference(s)",
                                "",
                                target.path(),
                                {{"documents", std::to_string(m_lastStats.documentsScanned)},
                                 {"failed", std::to_string(m_lastStats.documentsFailed)}}});

  m_cache[target] = occurrences;
  return occurrences;
}

std::vector<DocumentReference>
ReferenceFinder::findReferencingDocuments(const AssetIdentity& target,
                                          const AssetPredicate& isAsset) {
  m_lastStats = FindStatistics{};
  std::vector<DocumentReference> references;

  for (const auto& documentPath : m_corpus.listDocuments()) {
    auto content = m_corpus.readDocument(documentPath);
    if (content.isError()) {
      ++m_lastStats.documentsFailed;
      LINKKEEPER_LOG_WARN("Skipping unreadable document " + documentPath + ": " +
                          content.error());
      continue;
    }
    ++m_lastStats.documentsScanned;

    u32 ordinal = 0;
    for (const auto& occurrence : collectOccurrences(documentPath, content.value())) {
      if (occurrence.format == LinkFormat::WikiBare) {
        continue;
      }
      auto parsed = parseLinkToken(LinkToken{occurrence.format, occurrence.startCol,
                                             occurrence.endCol, occurrence.rawMatch});
      if (!parsed || (isAsset && !isAsset(parsed->linkPath))) {
        continue;
      }
      if (occurrence.resolvedPath == target) {
        references.push_back(DocumentReference{documentPath, ordinal, occurrence.line});
        ++m_lastStats.occurrencesFound;
        break;
      }
      ++ordinal;
    }
  }
  return references;
}

std::optional<std::vector<LinkOccurrence>>
ReferenceFinder::cachedResult(const AssetIdentity& target) const {
  auto it = m_cache.find(target);
  if (it == m_cache.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ReferenceFinder::invalidateCache() {
  m_cache.clear();
}

void ReferenceFinder::invalidateCache(const AssetIdentity& target) {
  m_cache.erase(target);
}

} // namespace LinkKeeper::refs
