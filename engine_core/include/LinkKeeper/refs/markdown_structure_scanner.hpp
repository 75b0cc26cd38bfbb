#pragma once

/**
 * @file markdown_structure_scanner.hpp
 * @brief Structural hint provider computed from the document text
 *
 * Plays the role of a host metadata cache: reports wiki embeds ("![[...]]"),
 * wiki links ("[[...]]") and fenced code sections. Like a typical host
 * cache it does not report markdown or HTML images, which the reference
 * finder picks up with its own scan.
 */

#include "LinkKeeper/refs/structural_hints.hpp"

namespace LinkKeeper::refs {

class MarkdownStructureScanner : public IStructuralHintProvider {
public:
  [[nodiscard]] StructuralHints hintsFor(const std::string& documentPath,
                                         const std::vector<std::string>& lines) const override;

  /**
   * @brief Scan a document split into lines
   */
  [[nodiscard]] static DocumentStructure scan(const std::vector<std::string>& lines);
};

} // namespace LinkKeeper::refs
