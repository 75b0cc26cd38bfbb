/**
 * @file code_span_detector.cpp
 * @brief Fenced block and inline code span detection
 */

#include "LinkKeeper/refs/code_span_detector.hpp"

#include <regex>

namespace LinkKeeper::refs {

namespace {

struct FenceMarker {
  char ch = 0;
  usize length = 0;
  bool onlyMarker = false; // nothing but whitespace after the run
};

FenceMarker readFenceMarker(std::string_view line) {
  FenceMarker marker;
  usize pos = line.find_first_not_of(" \t");
  if (pos == std::string_view::npos) {
    return marker;
  }
  const char c = line[pos];
  if (c != '`' && c != '~') {
    return marker;
  }
  usize end = pos;
  while (end < line.size() && line[end] == c) {
    ++end;
  }
  if (end - pos < 3) {
    return marker;
  }
  marker.ch = c;
  marker.length = end - pos;
  marker.onlyMarker = line.find_first_not_of(" \t\r", end) == std::string_view::npos;
  return marker;
}

std::string_view trimmed(std::string_view text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace

CodeSpanDetector::CodeSpanDetector(StructuralHints hints, const std::vector<std::string>& lines)
    : m_hints(std::move(hints)), m_lines(lines) {
  if (!hasHints(m_hints)) {
    m_fenceMask = computeFenceMask(lines);
  }
}

bool CodeSpanDetector::isLineExcluded(u32 lineIndex) const {
  if (const auto* structure = std::get_if<DocumentStructure>(&m_hints)) {
    return structure->isCodeLine(lineIndex);
  }
  return lineIndex < m_fenceMask.size() && m_fenceMask[lineIndex];
}

bool CodeSpanDetector::isOccurrenceExcluded(u32 lineIndex, u32 startCol, u32 endCol) const {
  if (isLineExcluded(lineIndex)) {
    return true;
  }
  if (lineIndex >= m_lines.size()) {
    return false;
  }
  return isInsideInlineSpan(m_lines[lineIndex], startCol, endCol);
}

bool CodeSpanDetector::isExcluded(const StructuralHints& hints, u32 lineIndex,
                                  std::string_view lineContent,
                                  const std::vector<std::string>* allLines) {
  if (isInlineCode(lineContent)) {
    return true;
  }
  if (const auto* structure = std::get_if<DocumentStructure>(&hints)) {
    return structure->isCodeLine(lineIndex);
  }
  if (allLines) {
    return isInFence(*allLines, lineIndex);
  }
  return false;
}

bool CodeSpanDetector::isInlineCode(std::string_view line) {
  const std::string_view text = trimmed(line);
  if (!text.empty() && text.front() == '`' && text.back() == '`') {
    usize run = text.find_first_not_of('`');
    if (run == std::string_view::npos) {
      run = text.size();
    }
    if (run == 1 || run == 3) {
      return true;
    }
  }

  static const std::regex kWikiInCode(R"(`[^`]*!?\[\[[^\]]*\]\][^`]*`)");
  static const std::regex kMarkdownInCode(R"(`[^`]*!\[[^\]]*\]\([^)]*\)[^`]*`)");
  static const std::regex kHtmlInCode(R"(`[^`]*<img[^>]*>[^`]*`)");

  const std::string owned(line);
  return std::regex_search(owned, kWikiInCode) || std::regex_search(owned, kMarkdownInCode) ||
         std::regex_search(owned, kHtmlInCode);
}

bool CodeSpanDetector::isInsideInlineSpan(std::string_view line, u32 startCol, u32 /*endCol*/) {
  usize pos = 0;
  while (pos < line.size()) {
    if (line[pos] != '`') {
      ++pos;
      continue;
    }
    usize runEnd = pos;
    while (runEnd < line.size() && line[runEnd] == '`') {
      ++runEnd;
    }
    const usize runLength = runEnd - pos;

    // Look for a closing run of exactly the same length
    usize search = runEnd;
    usize closeStart = std::string_view::npos;
    while (search < line.size()) {
      if (line[search] != '`') {
        ++search;
        continue;
      }
      usize closeEnd = search;
      while (closeEnd < line.size() && line[closeEnd] == '`') {
        ++closeEnd;
      }
      if (closeEnd - search == runLength) {
        closeStart = search;
        break;
      }
      search = closeEnd;
    }

    if (closeStart == std::string_view::npos) {
      pos = runEnd;
      continue;
    }
    const usize spanEnd = closeStart + runLength;
    if (startCol >= pos && startCol < spanEnd) {
      return true;
    }
    if (startCol < pos) {
      return false;
    }
    pos = spanEnd;
  }
  return false;
}

bool CodeSpanDetector::isInFence(const std::vector<std::string>& lines, u32 lineIndex) {
  if (lineIndex >= lines.size()) {
    return false;
  }
  char openChar = 0;
  for (u32 i = 0; i <= lineIndex; ++i) {
    const FenceMarker marker = readFenceMarker(lines[i]);
    if (openChar == 0) {
      if (marker.ch != 0) {
        openChar = marker.ch;
      }
    } else if (marker.ch == openChar && marker.onlyMarker) {
      if (i == lineIndex) {
        return true;
      }
      openChar = 0;
    }
  }
  return openChar != 0;
}

std::vector<bool> CodeSpanDetector::computeFenceMask(const std::vector<std::string>& lines) {
  std::vector<bool> mask(lines.size(), false);
  char openChar = 0;
  for (usize i = 0; i < lines.size(); ++i) {
    const FenceMarker marker = readFenceMarker(lines[i]);
    if (openChar == 0) {
      if (marker.ch != 0) {
        openChar = marker.ch;
        mask[i] = true;
      }
    } else {
      mask[i] = true;
      if (marker.ch == openChar && marker.onlyMarker) {
        openChar = 0;
      }
    }
  }
  return mask;
}

} // namespace LinkKeeper::refs
