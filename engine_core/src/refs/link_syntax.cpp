/**
 * @file link_syntax.cpp
 * @brief Link token scanner, parsers and builders
 */

#include "LinkKeeper/refs/link_syntax.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace LinkKeeper::refs {

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isSpace(text[begin])) {
    ++begin;
  }
  while (end > begin && isSpace(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool isDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}

std::optional<u32> toNumber(std::string_view digits) {
  u32 value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

/// Leading digits of an attribute value ("50px" -> 50)
std::optional<u32> leadingNumber(std::string_view value) {
  size_t start = 0;
  while (start < value.size() && isSpace(value[start])) {
    ++start;
  }
  size_t end = start;
  while (end < value.size() && value[end] >= '0' && value[end] <= '9') {
    ++end;
  }
  if (end == start) {
    return std::nullopt;
  }
  return toNumber(value.substr(start, end - start));
}

/// Encode the characters that cannot appear in a bare markdown target
std::string encodeMarkdownTarget(std::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (char c : path) {
    switch (c) {
    case ' ':
      result += "%20";
      break;
    case '(':
      result += "%28";
      break;
    case ')':
      result += "%29";
      break;
    default:
      result += c;
    }
  }
  return result;
}

std::string escapeAttributeValue(std::string_view text, char quote) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += (quote == '\'') ? "\"" : "&quot;";
      break;
    case '\'':
      result += (quote == '\'') ? "&#39;" : "'";
      break;
    default:
      result += c;
    }
  }
  return result;
}

std::pair<std::string, std::string> splitQuery(std::string_view target) {
  auto pos = target.find('?');
  if (pos == std::string_view::npos) {
    return {std::string(target), ""};
  }
  return {std::string(target.substr(0, pos)), std::string(target.substr(pos))};
}

// Scanner helpers. Each returns the exclusive end of the token starting at
// `start`, or npos if the text there is not a complete token.

size_t scanWiki(std::string_view line, size_t start) {
  // line[start..start+1] == "[["
  size_t j = start + 2;
  while (j < line.size()) {
    if (line[j] == ']') {
      if (j + 1 < line.size() && line[j + 1] == ']' && j > start + 2) {
        return j + 2;
      }
      return std::string_view::npos;
    }
    if (line[j] == '[') {
      return std::string_view::npos;
    }
    ++j;
  }
  return std::string_view::npos;
}

size_t scanMarkdown(std::string_view line, size_t start) {
  // line[start..start+1] == "!["
  size_t j = start + 2;
  while (j < line.size() && line[j] != ']') {
    j += (line[j] == '\\') ? 2 : 1;
  }
  if (j + 1 >= line.size() || line[j + 1] != '(') {
    return std::string_view::npos;
  }
  size_t targetStart = j + 2;
  size_t searchFrom = targetStart;
  if (targetStart < line.size() && line[targetStart] == '<') {
    auto gt = line.find('>', targetStart);
    if (gt == std::string_view::npos) {
      return std::string_view::npos;
    }
    searchFrom = gt;
  }
  auto close = line.find(')', searchFrom);
  if (close == std::string_view::npos || close == targetStart) {
    return std::string_view::npos;
  }
  return close + 1;
}

size_t scanHtmlImage(std::string_view line, size_t start) {
  // line[start] == '<'
  if (start + 4 > line.size() || !equalsIgnoreCase(line.substr(start + 1, 3), "img")) {
    return std::string_view::npos;
  }
  size_t j = start + 4;
  if (j >= line.size() || !(isSpace(line[j]) || line[j] == '/' || line[j] == '>')) {
    return std::string_view::npos;
  }
  char quote = 0;
  for (; j < line.size(); ++j) {
    char c = line[j];
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '>') {
      return j + 1;
    }
  }
  return std::string_view::npos;
}

} // namespace

// =============================================================================
// Wiki links
// =============================================================================

bool parseSizeSegment(std::string_view segment, u32& width, std::optional<u32>& height) {
  auto x = segment.find('x');
  std::string_view w = segment.substr(0, x);
  if (!isDigits(w)) {
    return false;
  }
  std::optional<u32> h;
  if (x != std::string_view::npos) {
    std::string_view hText = segment.substr(x + 1);
    if (!isDigits(hText)) {
      return false;
    }
    h = toNumber(hText);
    if (!h) {
      return false;
    }
  }
  auto wValue = toNumber(w);
  if (!wValue) {
    return false;
  }
  width = *wValue;
  height = h;
  return true;
}

WikiLinkParts parseWikiLink(std::string_view token) {
  WikiLinkParts parts;
  if (!token.empty() && token.front() == '!') {
    token.remove_prefix(1);
  }
  if (token.size() < 4 || token.substr(0, 2) != "[[" || token.substr(token.size() - 2) != "]]") {
    return parts;
  }
  std::string_view inner = token.substr(2, token.size() - 4);

  std::vector<std::string> segments;
  size_t from = 0;
  while (true) {
    auto bar = inner.find('|', from);
    segments.push_back(trim(inner.substr(from, bar - from)));
    if (bar == std::string_view::npos) {
      break;
    }
    from = bar + 1;
  }

  parts.path = segments.front();
  bool haveText = false;
  for (size_t i = 1; i < segments.size(); ++i) {
    const std::string& segment = segments[i];
    u32 width = 0;
    std::optional<u32> height;
    if (!parts.width && parseSizeSegment(segment, width, height)) {
      parts.width = width;
      parts.height = height;
    } else if (!haveText && !segment.empty()) {
      parts.displayText = segment;
      haveText = true;
    }
  }
  return parts;
}

std::string buildWikiLink(const WikiLinkParts& parts, bool embed) {
  std::string size;
  if (parts.width) {
    size = std::to_string(*parts.width);
    if (parts.height) {
      size += 'x';
      size += std::to_string(*parts.height);
    }
  }

  // A size-shaped caption must follow the size, or parsing would take it
  // as the size
  u32 width = 0;
  std::optional<u32> height;
  const bool sizeFirst =
      !size.empty() && parseSizeSegment(parts.displayText, width, height);

  std::string result = embed ? "![[" : "[[";
  result += parts.path;
  if (sizeFirst) {
    result += '|';
    result += size;
  }
  if (!parts.displayText.empty()) {
    result += '|';
    result += parts.displayText;
  }
  if (!size.empty() && !sizeFirst) {
    result += '|';
    result += size;
  }
  result += "]]";
  return result;
}

std::pair<std::string, std::string> splitWikiSubpath(std::string_view path) {
  auto hash = path.find('#');
  if (hash == std::string_view::npos) {
    return {std::string(path), ""};
  }
  return {std::string(path.substr(0, hash)), std::string(path.substr(hash))};
}

// =============================================================================
// Markdown images
// =============================================================================

std::optional<MarkdownImage> parseMarkdownImage(std::string_view token) {
  if (token.size() < 5 || token.substr(0, 2) != "![" || token.back() != ')') {
    return std::nullopt;
  }
  size_t labelEnd = 2;
  while (labelEnd < token.size() && token[labelEnd] != ']') {
    labelEnd += (token[labelEnd] == '\\') ? 2 : 1;
  }
  if (labelEnd + 1 >= token.size() || token[labelEnd + 1] != '(') {
    return std::nullopt;
  }

  MarkdownImage image;
  image.label = std::string(token.substr(2, labelEnd - 2));

  std::string_view inner = token.substr(labelEnd + 2, token.size() - labelEnd - 3);
  std::string_view target;
  if (!inner.empty() && inner.front() == '<') {
    auto gt = inner.find('>');
    if (gt == std::string_view::npos) {
      return std::nullopt;
    }
    image.angleBrackets = true;
    image.rawTarget = std::string(inner.substr(0, gt + 1));
    target = inner.substr(1, gt - 1);
    image.title = std::string(inner.substr(gt + 1));
  } else {
    size_t start = 0;
    while (start < inner.size() && isSpace(inner[start])) {
      ++start;
    }
    size_t end = inner.size();
    while (end > start && isSpace(inner[end - 1])) {
      --end;
    }
    // A trailing "title" or 'title' is split off; any other whitespace
    // belongs to the target.
    size_t targetEnd = end;
    if (end > start + 1 && (inner[end - 1] == '"' || inner[end - 1] == '\'')) {
      const char quote = inner[end - 1];
      auto open = inner.rfind(quote, end - 2);
      if (open != std::string_view::npos && open > start && isSpace(inner[open - 1])) {
        targetEnd = open - 1;
        while (targetEnd > start && isSpace(inner[targetEnd - 1])) {
          --targetEnd;
        }
      }
    }
    target = inner.substr(start, targetEnd - start);
    image.rawTarget = std::string(target);
    image.title = std::string(inner.substr(targetEnd));
  }

  auto [pathPart, query] = splitQuery(target);
  image.query = query;
  image.path = percentDecode(pathPart);
  image.percentEncoded = image.path != pathPart;
  if (image.path.empty()) {
    return std::nullopt;
  }
  return image;
}

std::string buildMarkdownImage(const MarkdownImage& image) {
  std::string target;
  if (image.angleBrackets) {
    target = "<" + (image.percentEncoded ? encodeSpaces(image.path) : image.path) +
             image.query + ">";
  } else {
    const bool rawSpaces = image.rawTarget.find(' ') != std::string::npos;
    target = (image.percentEncoded || !rawSpaces ? encodeMarkdownTarget(image.path) : image.path) +
             image.query;
  }
  return "![" + image.label + "](" + target + image.title + ")";
}

std::string escapeMarkdownLabel(std::string_view label) {
  std::string result;
  result.reserve(label.size());
  for (char c : label) {
    if (c == '[' || c == ']' || c == '\\') {
      result += '\\';
    }
    result += c;
  }
  return result;
}

// =============================================================================
// HTML <img> tags
// =============================================================================

const HtmlAttribute* HtmlImageTag::find(std::string_view name) const {
  for (const auto& attr : attributes) {
    if (equalsIgnoreCase(attr.name, name)) {
      return &attr;
    }
  }
  return nullptr;
}

HtmlAttribute* HtmlImageTag::find(std::string_view name) {
  for (auto& attr : attributes) {
    if (equalsIgnoreCase(attr.name, name)) {
      return &attr;
    }
  }
  return nullptr;
}

std::string HtmlImageTag::src() const {
  const auto* attr = find("src");
  return attr ? attr->value : std::string();
}

std::optional<std::string> HtmlImageTag::alt() const {
  const auto* attr = find("alt");
  if (!attr) {
    return std::nullopt;
  }
  return attr->value;
}

std::optional<u32> HtmlImageTag::width() const {
  const auto* attr = find("width");
  return attr ? leadingNumber(attr->value) : std::nullopt;
}

std::optional<u32> HtmlImageTag::height() const {
  const auto* attr = find("height");
  return attr ? leadingNumber(attr->value) : std::nullopt;
}

void HtmlImageTag::setSrc(const std::string& value) {
  setAttribute("src", value);
}

void HtmlImageTag::setAlt(std::string_view text) {
  const auto* existing = find("alt");
  char quote = (existing && existing->quote != 0) ? existing->quote : preferredQuote();
  setAttribute("alt", escapeAttributeValue(text, quote));
}

void HtmlImageTag::setWidth(std::optional<u32> value) {
  if (value) {
    setAttribute("width", std::to_string(*value));
  } else {
    removeAttribute("width");
  }
}

void HtmlImageTag::setHeight(std::optional<u32> value) {
  if (value) {
    setAttribute("height", std::to_string(*value));
  } else {
    removeAttribute("height");
  }
}

void HtmlImageTag::setAttribute(std::string_view name, const std::string& value) {
  if (auto* attr = find(name)) {
    attr->value = value;
    if (!attr->hasValue || (attr->quote == 0 &&
                            std::any_of(value.begin(), value.end(), [](char c) {
                              return isSpace(c) || c == '"' || c == '\'' || c == '>';
                            }))) {
      attr->quote = preferredQuote();
    }
    attr->hasValue = true;
    return;
  }
  HtmlAttribute attr;
  attr.name = std::string(name);
  attr.value = value;
  attr.quote = preferredQuote();
  attributes.push_back(std::move(attr));
}

void HtmlImageTag::removeAttribute(std::string_view name) {
  attributes.erase(std::remove_if(attributes.begin(), attributes.end(),
                                  [&](const HtmlAttribute& attr) {
                                    return equalsIgnoreCase(attr.name, name);
                                  }),
                   attributes.end());
}

char HtmlImageTag::preferredQuote() const {
  const auto* srcAttr = find("src");
  if (srcAttr && srcAttr->quote != 0) {
    return srcAttr->quote;
  }
  return '"';
}

std::optional<HtmlImageTag> parseHtmlImage(std::string_view token) {
  if (token.size() < 5 || token.front() != '<' || token.back() != '>') {
    return std::nullopt;
  }
  size_t pos = 1;
  size_t nameEnd = pos;
  while (nameEnd < token.size() && std::isalpha(static_cast<unsigned char>(token[nameEnd]))) {
    ++nameEnd;
  }
  if (!equalsIgnoreCase(token.substr(pos, nameEnd - pos), "img")) {
    return std::nullopt;
  }

  HtmlImageTag tag;
  tag.tagName = std::string(token.substr(pos, nameEnd - pos));
  pos = nameEnd;
  const size_t end = token.size() - 1; // index of '>'

  while (pos < end) {
    bool sawSpace = false;
    while (pos < end && isSpace(token[pos])) {
      ++pos;
      sawSpace = true;
    }
    if (pos >= end) {
      break;
    }
    if (token[pos] == '/' && pos + 1 == end) {
      tag.selfClosing = true;
      tag.spaceBeforeSlash = sawSpace;
      break;
    }

    size_t nameStart = pos;
    while (pos < end && !isSpace(token[pos]) && token[pos] != '=' &&
           !(token[pos] == '/' && pos + 1 == end)) {
      ++pos;
    }
    if (pos == nameStart) {
      ++pos;
      continue;
    }

    HtmlAttribute attr;
    attr.name = std::string(token.substr(nameStart, pos - nameStart));

    size_t look = pos;
    while (look < end && isSpace(token[look])) {
      ++look;
    }
    if (look < end && token[look] == '=') {
      pos = look + 1;
      while (pos < end && isSpace(token[pos])) {
        ++pos;
      }
      if (pos < end && (token[pos] == '"' || token[pos] == '\'')) {
        attr.quote = token[pos];
        auto closeQuote = token.find(attr.quote, pos + 1);
        if (closeQuote == std::string_view::npos || closeQuote > end) {
          closeQuote = end;
        }
        attr.value = std::string(token.substr(pos + 1, closeQuote - pos - 1));
        pos = std::min(closeQuote + 1, end);
      } else {
        attr.quote = 0;
        size_t valueStart = pos;
        while (pos < end && !isSpace(token[pos]) && !(token[pos] == '/' && pos + 1 == end)) {
          ++pos;
        }
        attr.value = std::string(token.substr(valueStart, pos - valueStart));
      }
    } else {
      attr.hasValue = false;
      attr.quote = 0;
    }
    tag.attributes.push_back(std::move(attr));
  }
  return tag;
}

std::string buildHtmlImage(const HtmlImageTag& tag) {
  static const std::string_view kLeading[] = {"src", "alt", "width", "height"};

  auto appendAttribute = [](std::string& out, const HtmlAttribute& attr) {
    out += ' ';
    out += attr.name;
    if (attr.hasValue) {
      out += '=';
      if (attr.quote != 0) {
        out += attr.quote;
      }
      out += attr.value;
      if (attr.quote != 0) {
        out += attr.quote;
      }
    }
  };

  std::string result = "<" + tag.tagName;
  for (std::string_view name : kLeading) {
    if (const auto* attr = tag.find(name)) {
      appendAttribute(result, *attr);
    }
  }
  for (const auto& attr : tag.attributes) {
    bool leading = std::any_of(std::begin(kLeading), std::end(kLeading),
                               [&](std::string_view name) { return equalsIgnoreCase(attr.name, name); });
    if (!leading) {
      appendAttribute(result, attr);
    }
  }
  if (tag.selfClosing) {
    result += tag.spaceBeforeSlash ? " />" : "/>";
  } else {
    result += '>';
  }
  return result;
}

HtmlImageSize parseHtmlImageSize(std::string_view tag) {
  HtmlImageSize size;
  auto parsed = parseHtmlImage(tag);
  if (parsed) {
    size.width = parsed->width();
    size.height = parsed->height();
  }
  return size;
}

// =============================================================================
// Tokenizing and uniform access
// =============================================================================

std::vector<LinkToken> tokenizeLine(std::string_view line, u32 fromCol) {
  std::vector<LinkToken> tokens;
  size_t i = fromCol;
  while (i < line.size()) {
    size_t end = std::string_view::npos;
    LinkFormat format = LinkFormat::Wiki;
    const char c = line[i];

    if (c == '!' && i + 2 < line.size() && line[i + 1] == '[' && line[i + 2] == '[') {
      end = scanWiki(line, i + 1);
      format = LinkFormat::Wiki;
    } else if (c == '[' && i + 1 < line.size() && line[i + 1] == '[') {
      end = scanWiki(line, i);
      format = LinkFormat::WikiBare;
    } else if (c == '!' && i + 1 < line.size() && line[i + 1] == '[') {
      end = scanMarkdown(line, i);
      format = LinkFormat::Markdown;
    } else if (c == '<') {
      end = scanHtmlImage(line, i);
      format = LinkFormat::Html;
    }

    if (end == std::string_view::npos) {
      ++i;
      continue;
    }
    LinkToken token;
    token.format = format;
    token.startCol = static_cast<u32>(i);
    token.endCol = static_cast<u32>(end);
    token.text = std::string(line.substr(i, end - i));
    tokens.push_back(std::move(token));
    i = end;
  }
  return tokens;
}

std::optional<ParsedLink> parseLinkToken(const LinkToken& token) {
  ParsedLink link;
  link.format = token.format;

  switch (token.format) {
  case LinkFormat::Wiki:
  case LinkFormat::WikiBare: {
    auto parts = parseWikiLink(token.text);
    auto [path, subpath] = splitWikiSubpath(parts.path);
    if (path.empty()) {
      return std::nullopt;
    }
    link.targetRaw = parts.path;
    link.linkPath = path;
    if (!parts.displayText.empty()) {
      link.displayText = parts.displayText;
    }
    link.width = parts.width;
    link.height = parts.height;
    return link;
  }
  case LinkFormat::Markdown: {
    auto image = parseMarkdownImage(token.text);
    if (!image) {
      return std::nullopt;
    }
    link.targetRaw = image->rawTarget;
    link.linkPath = image->path;
    if (!image->label.empty()) {
      link.displayText = image->label;
    }
    return link;
  }
  case LinkFormat::Html: {
    auto tag = parseHtmlImage(token.text);
    if (!tag) {
      return std::nullopt;
    }
    std::string src = tag->src();
    if (src.empty()) {
      return std::nullopt;
    }
    link.targetRaw = src;
    link.linkPath = percentDecode(splitQuery(src).first);
    link.displayText = tag->alt();
    link.width = tag->width();
    link.height = tag->height();
    return link;
  }
  }
  return std::nullopt;
}

std::optional<std::string> applyLinkEdit(const LinkToken& token, const LinkEdit& edit) {
  switch (token.format) {
  case LinkFormat::Wiki:
  case LinkFormat::WikiBare: {
    auto parts = parseWikiLink(token.text);
    if (parts.path.empty()) {
      return std::nullopt;
    }
    if (edit.target) {
      parts.path = *edit.target + splitWikiSubpath(parts.path).second;
    }
    if (edit.displayText) {
      parts.displayText = *edit.displayText;
    }
    if (edit.clearSize) {
      parts.width.reset();
      parts.height.reset();
    }
    if (edit.width) {
      parts.width = edit.width;
      parts.height = edit.height;
    }
    return buildWikiLink(parts, token.format == LinkFormat::Wiki);
  }
  case LinkFormat::Markdown: {
    auto image = parseMarkdownImage(token.text);
    if (!image) {
      return std::nullopt;
    }
    if (edit.target) {
      image->path = *edit.target;
    }
    if (edit.displayText) {
      image->label = escapeMarkdownLabel(*edit.displayText);
    }
    return buildMarkdownImage(*image);
  }
  case LinkFormat::Html: {
    auto tag = parseHtmlImage(token.text);
    if (!tag) {
      return std::nullopt;
    }
    if (edit.target) {
      const std::string oldSrc = tag->src();
      auto [oldPath, query] = splitQuery(oldSrc);
      const bool encoded = percentDecode(oldPath) != oldPath;
      tag->setSrc((encoded ? encodeSpaces(*edit.target) : *edit.target) + query);
    }
    if (edit.displayText) {
      tag->setAlt(*edit.displayText);
    }
    if (edit.clearSize) {
      tag->setWidth(std::nullopt);
      tag->setHeight(std::nullopt);
    }
    if (edit.width) {
      tag->setWidth(edit.width);
    }
    if (edit.height) {
      tag->setHeight(edit.height);
    }
    return buildHtmlImage(*tag);
  }
  }
  return std::nullopt;
}

} // namespace LinkKeeper::refs
