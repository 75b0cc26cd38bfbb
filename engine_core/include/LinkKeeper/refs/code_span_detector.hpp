#pragma once

/**
 * @file code_span_detector.hpp
 * @brief Decides whether text lies inside fenced code or inline code
 *
 * Order of checks for a line:
 * 1. Inline code on the line itself (always first, independent of hints)
 * 2. Structural hints, when present, are authoritative ("code" sections)
 * 3. Manual fence scan over the document lines (``` or ~~~, length >= 3)
 * 4. Otherwise the line is not excluded
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/structural_hints.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace LinkKeeper::refs {

class CodeSpanDetector {
public:
  /**
   * @brief Build a detector for one document
   *
   * Precomputes the fence mask when no hints are available, so repeated
   * queries on the same document stay linear.
   */
  CodeSpanDetector(StructuralHints hints, const std::vector<std::string>& lines);

  /**
   * @brief Block-level check (hints or fence mask)
   */
  [[nodiscard]] bool isLineExcluded(u32 lineIndex) const;

  /**
   * @brief Check a single token position
   *
   * Excluded when its line is in a code block or when the token starts
   * inside a paired backtick span. A real link sharing a line with an
   * unrelated inline code span is not excluded.
   */
  [[nodiscard]] bool isOccurrenceExcluded(u32 lineIndex, u32 startCol, u32 endCol) const;

  [[nodiscard]] const StructuralHints& hints() const { return m_hints; }

  // =========================================================================
  // Stateless checks
  // =========================================================================

  /**
   * @brief Line-level exclusion
   * @param hints Structural hints for the document
   * @param lineIndex 0-based line number
   * @param lineContent Text of the line
   * @param allLines Whole document, or nullptr if unavailable
   */
  [[nodiscard]] static bool isExcluded(const StructuralHints& hints, u32 lineIndex,
                                       std::string_view lineContent,
                                       const std::vector<std::string>* allLines = nullptr);

  /**
   * @brief Whole trimmed line wrapped in ` or ```, or a link-shaped
   *        substring inside a backtick pair
   */
  [[nodiscard]] static bool isInlineCode(std::string_view line);

  /**
   * @brief True if [startCol, endCol) starts inside a paired backtick span
   */
  [[nodiscard]] static bool isInsideInlineSpan(std::string_view line, u32 startCol, u32 endCol);

  /**
   * @brief Whether lineIndex is inside a fenced block (fence lines included)
   */
  [[nodiscard]] static bool isInFence(const std::vector<std::string>& lines, u32 lineIndex);

  /**
   * @brief Per-line fenced-block mask; an unclosed fence runs to the end
   */
  [[nodiscard]] static std::vector<bool> computeFenceMask(const std::vector<std::string>& lines);

private:
  StructuralHints m_hints;
  const std::vector<std::string>& m_lines;
  std::vector<bool> m_fenceMask;
};

} // namespace LinkKeeper::refs
