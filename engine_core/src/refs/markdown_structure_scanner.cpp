#include "LinkKeeper/refs/markdown_structure_scanner.hpp"
#include "LinkKeeper/refs/code_span_detector.hpp"
#include "LinkKeeper/refs/link_syntax.hpp"

namespace LinkKeeper::refs {

StructuralHints MarkdownStructureScanner::hintsFor(const std::string& /*documentPath*/,
                                                   const std::vector<std::string>& lines) const {
  return scan(lines);
}

DocumentStructure MarkdownStructureScanner::scan(const std::vector<std::string>& lines) {
  DocumentStructure structure;
  const std::vector<bool> fenced = CodeSpanDetector::computeFenceMask(lines);

  // Code sections from consecutive fenced lines
  for (u32 i = 0; i < fenced.size(); ++i) {
    if (!fenced[i]) {
      continue;
    }
    u32 end = i;
    while (end + 1 < fenced.size() && fenced[end + 1]) {
      ++end;
    }
    structure.sections.push_back(SectionHint{"code", i, end});
    i = end;
  }

  for (u32 lineIndex = 0; lineIndex < lines.size(); ++lineIndex) {
    if (fenced[lineIndex]) {
      continue;
    }
    const std::string& line = lines[lineIndex];
    if (line.find("[[") == std::string::npos) {
      continue;
    }
    for (const auto& token : tokenizeLine(line)) {
      if (token.format != LinkFormat::Wiki && token.format != LinkFormat::WikiBare) {
        continue;
      }
      if (CodeSpanDetector::isInsideInlineSpan(line, token.startCol, token.endCol)) {
        continue;
      }
      const WikiLinkParts parts = parseWikiLink(token.text);
      if (parts.path.empty()) {
        continue;
      }
      LinkHint hint{parts.path, parts.displayText, lineIndex, token.startCol, token.endCol};
      if (token.format == LinkFormat::Wiki) {
        structure.embeds.push_back(std::move(hint));
      } else {
        structure.links.push_back(std::move(hint));
      }
    }
  }
  return structure;
}

} // namespace LinkKeeper::refs
