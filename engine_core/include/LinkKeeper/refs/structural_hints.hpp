#pragma once

/**
 * @file structural_hints.hpp
 * @brief Optional per-document structure supplied by the host
 *
 * A host that already parsed a document (its metadata cache) can report the
 * embeds, links and typed sections it found. When it cannot, it reports
 * HintsAbsent and callers fall back to scanning raw lines. The two cases are
 * a std::variant so every consumer has to handle both.
 */

#include "LinkKeeper/core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace LinkKeeper::refs {

/**
 * @brief One embed or link reported by the host
 *
 * Positions use the same convention as LinkOccurrence: 0-based line,
 * byte columns, exclusive end. For embeds startCol points at the '!'.
 */
struct LinkHint {
  std::string link;        // link target as written, without display text
  std::string displayText;
  u32 line = 0;
  u32 startCol = 0;
  u32 endCol = 0;
};

/**
 * @brief A typed block of lines ("code", "paragraph", "heading", ...)
 *
 * Both line bounds are inclusive.
 */
struct SectionHint {
  std::string type;
  u32 startLine = 0;
  u32 endLine = 0;
};

struct DocumentStructure {
  std::vector<LinkHint> embeds;
  std::vector<LinkHint> links;
  std::vector<SectionHint> sections;

  [[nodiscard]] bool isCodeLine(u32 line) const {
    for (const auto& section : sections) {
      if (section.type == "code" && line >= section.startLine && line <= section.endLine) {
        return true;
      }
    }
    return false;
  }
};

struct HintsAbsent {};

using StructuralHints = std::variant<HintsAbsent, DocumentStructure>;

[[nodiscard]] inline bool hasHints(const StructuralHints& hints) {
  return std::holds_alternative<DocumentStructure>(hints);
}

/**
 * @brief Capability interface for structural hints
 */
class IStructuralHintProvider {
public:
  virtual ~IStructuralHintProvider() = default;

  /**
   * @brief Hints for a document
   * @param documentPath Vault path of the document
   * @param lines Document content split into lines
   */
  [[nodiscard]] virtual StructuralHints hintsFor(const std::string& documentPath,
                                                 const std::vector<std::string>& lines) const = 0;
};

/**
 * @brief Provider for hosts without a metadata cache
 */
class NullHintProvider : public IStructuralHintProvider {
public:
  [[nodiscard]] StructuralHints hintsFor(const std::string&,
                                         const std::vector<std::string>&) const override {
    return HintsAbsent{};
  }
};

} // namespace LinkKeeper::refs
