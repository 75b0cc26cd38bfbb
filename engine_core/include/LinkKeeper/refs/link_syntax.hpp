#pragma once

/**
 * @file link_syntax.hpp
 * @brief Parsing and construction of asset link tokens
 *
 * Supported formats:
 * - Wiki embed:  ![[path]], ![[path|text]], ![[path|100x200]], ![[path|text|100]]
 * - Wiki bare:   [[path|text]]
 * - Markdown:    ![alt](path), ![alt](<path with spaces>), ![alt](path?v=2 "title")
 * - HTML:        <img src="path" alt="text" width="100" height="50">
 *
 * Lines are tokenized with a small hand-written scanner that looks for
 * "![[", "[[", "![" and "<img"; the per-format parsers then split a token
 * into its fields and the builders put it back together.
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/link_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace LinkKeeper::refs {

// =============================================================================
// Wiki links
// =============================================================================

/**
 * @brief Fields of a wiki link ("path|display text|WIDTHxHEIGHT")
 */
struct WikiLinkParts {
  std::string path;
  std::string displayText;
  std::optional<u32> width;
  std::optional<u32> height;
};

/**
 * @brief Parse a "W" or "WxH" size segment
 * @return true and fills width/height if the segment is a size
 */
[[nodiscard]] bool parseSizeSegment(std::string_view segment, u32& width,
                                    std::optional<u32>& height);

/**
 * @brief Parse a wiki token ("![[...]]" or "[[...]]")
 *
 * The first '|' segment is the path. Remaining segments are classified in
 * order: the first one that looks like a size ("800" or "800x600") becomes
 * the size, the first one that does not becomes the display text, anything
 * after both are found is dropped. A numeric caption such as "2024" is
 * therefore read as a width.
 *
 * @return Parsed parts; path is empty if the token is not a wiki link
 */
[[nodiscard]] WikiLinkParts parseWikiLink(std::string_view token);

/**
 * @brief Build "![[path|text|WxH]]" (or "[[...]]" when embed is false)
 *
 * A display text that looks like a size is emitted after the size
 * ("![[a.png|100|200]]") so the result parses back to the same fields.
 */
[[nodiscard]] std::string buildWikiLink(const WikiLinkParts& parts, bool embed = true);

/**
 * @brief Split "photo.png#section" into path and "#section" suffix
 */
[[nodiscard]] std::pair<std::string, std::string> splitWikiSubpath(std::string_view path);

// =============================================================================
// Markdown images
// =============================================================================

struct MarkdownImage {
  std::string label;
  std::string rawTarget;   // target as written, without title
  std::string path;        // decoded target without query and title
  std::string query;       // "?v=2" (kept verbatim)
  std::string title;       // ' "title"' including leading whitespace
  bool angleBrackets = false;
  bool percentEncoded = false;
};

[[nodiscard]] std::optional<MarkdownImage> parseMarkdownImage(std::string_view token);

/**
 * @brief Rebuild "![label](target)" using the original target encoding
 *        (angle brackets or %20 escapes)
 */
[[nodiscard]] std::string buildMarkdownImage(const MarkdownImage& image);

/**
 * @brief Escape characters that would end a markdown label early
 */
[[nodiscard]] std::string escapeMarkdownLabel(std::string_view label);

// =============================================================================
// HTML <img> tags
// =============================================================================

struct HtmlAttribute {
  std::string name;
  std::string value;
  char quote = '"'; // '"', '\'' or 0 for unquoted
  bool hasValue = true;
};

class HtmlImageTag {
public:
  std::string tagName = "img";
  std::vector<HtmlAttribute> attributes;
  bool selfClosing = false;
  bool spaceBeforeSlash = false;

  [[nodiscard]] const HtmlAttribute* find(std::string_view name) const;
  [[nodiscard]] HtmlAttribute* find(std::string_view name);

  [[nodiscard]] std::string src() const;
  [[nodiscard]] std::optional<std::string> alt() const;
  [[nodiscard]] std::optional<u32> width() const;
  [[nodiscard]] std::optional<u32> height() const;

  void setSrc(const std::string& value);
  /**
   * @brief Set alt text, escaping markup characters and the quote in use
   */
  void setAlt(std::string_view text);
  void setWidth(std::optional<u32> value);
  void setHeight(std::optional<u32> value);

private:
  void setAttribute(std::string_view name, const std::string& value);
  void removeAttribute(std::string_view name);
  [[nodiscard]] char preferredQuote() const;
};

/**
 * @brief Parse an "<img ...>" token; std::nullopt if it is not an img tag
 */
[[nodiscard]] std::optional<HtmlImageTag> parseHtmlImage(std::string_view token);

/**
 * @brief Build the tag with src, alt, width, height first, then the other
 *        attributes in their original order, keeping quote and closing style
 */
[[nodiscard]] std::string buildHtmlImage(const HtmlImageTag& tag);

struct HtmlImageSize {
  std::optional<u32> width;
  std::optional<u32> height;
};

/**
 * @brief Read width/height attributes (quoted or bare, any case)
 */
[[nodiscard]] HtmlImageSize parseHtmlImageSize(std::string_view tag);

// =============================================================================
// Tokenizing and uniform access
// =============================================================================

struct LinkToken {
  LinkFormat format = LinkFormat::Wiki;
  u32 startCol = 0;
  u32 endCol = 0;
  std::string text;
};

/**
 * @brief Locate every link token on a line starting at fromCol
 *
 * Tokens are returned in column order and never overlap.
 */
[[nodiscard]] std::vector<LinkToken> tokenizeLine(std::string_view line, u32 fromCol = 0);

/**
 * @brief Format-independent view of a parsed token
 */
struct ParsedLink {
  LinkFormat format = LinkFormat::Wiki;
  std::string targetRaw;  // target as written
  std::string linkPath;   // target used for resolution (decoded, no subpath/query)
  std::optional<std::string> displayText;
  std::optional<u32> width;
  std::optional<u32> height;
};

/**
 * @brief Parse any token produced by tokenizeLine
 * @return std::nullopt when the token carries no usable target
 */
[[nodiscard]] std::optional<ParsedLink> parseLinkToken(const LinkToken& token);

/**
 * @brief Field changes to apply to an existing token
 *
 * Unset members keep the token's current value. An empty displayText
 * removes the caption; clearSize drops width and height before the new
 * values (if any) are applied.
 */
struct LinkEdit {
  std::optional<std::string> target;
  std::optional<std::string> displayText;
  std::optional<u32> width;
  std::optional<u32> height;
  bool clearSize = false;
};

/**
 * @brief Rebuild a token with the requested changes
 *
 * Wiki subpaths ("#section"), markdown query/title parts and every HTML
 * attribute not being changed survive the rebuild.
 *
 * @return New token text, or std::nullopt if the token cannot be parsed
 */
[[nodiscard]] std::optional<std::string> applyLinkEdit(const LinkToken& token,
                                                       const LinkEdit& edit);

} // namespace LinkKeeper::refs
