#pragma once

/**
 * @file document_corpus.hpp
 * @brief Read/write access to the vault's text documents
 */

#include "LinkKeeper/core/result.hpp"
#include "LinkKeeper/core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace LinkKeeper::refs {

/**
 * @brief Corpus enumeration and whole-document IO
 *
 * Document ids are vault-relative paths ("notes/trip.md").
 */
class IDocumentCorpus {
public:
  virtual ~IDocumentCorpus() = default;

  /**
   * @brief All documents in a stable order
   */
  [[nodiscard]] virtual std::vector<std::string> listDocuments() const = 0;

  [[nodiscard]] virtual Result<std::string> readDocument(const std::string& documentPath) const = 0;

  /**
   * @brief Replace the full text of a document
   */
  [[nodiscard]] virtual Result<void> writeDocument(const std::string& documentPath,
                                                   const std::string& content) = 0;
};

/**
 * @brief Split on '\n'; a trailing '\r' stays on its line
 *
 * joinLines(splitLines(text)) == text for any input.
 */
[[nodiscard]] std::vector<std::string> splitLines(std::string_view text);

[[nodiscard]] std::string joinLines(const std::vector<std::string>& lines);

} // namespace LinkKeeper::refs
