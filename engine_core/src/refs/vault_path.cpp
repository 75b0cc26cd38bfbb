/**
 * @file vault_path.cpp
 * @brief Vault path helpers and PathValidator
 */

#include "LinkKeeper/refs/vault_path.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace LinkKeeper::refs {

namespace {

std::vector<std::string> splitSegments(std::string_view path) {
  std::vector<std::string> segments;
  std::string current;
  for (char c : path) {
    if (c == '/' || c == '\\') {
      segments.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  segments.push_back(current);
  return segments;
}

std::string joinSegments(const std::vector<std::string>& segments, size_t first, size_t last) {
  std::string result;
  for (size_t i = first; i < last; ++i) {
    if (!result.empty()) {
      result += '/';
    }
    result += segments[i];
  }
  return result;
}

std::string upper(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

bool isIllegalFileNameChar(unsigned char c) {
  if (c < 0x20) {
    return true;
  }
  switch (c) {
  case '<':
  case '>':
  case ':':
  case '"':
  case '/':
  case '\\':
  case '|':
  case '?':
  case '*':
    return true;
  default:
    return false;
  }
}

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr size_t kMaxFileNameLength = 200;

} // namespace

std::optional<std::string> normalizeVaultPath(std::string_view path) {
  std::vector<std::string> out;
  for (auto& segment : splitSegments(path)) {
    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment == "..") {
      if (out.empty()) {
        return std::nullopt;
      }
      out.pop_back();
      continue;
    }
    out.push_back(std::move(segment));
  }
  return joinSegments(out, 0, out.size());
}

std::string fileNameOf(std::string_view path) {
  auto pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return std::string(path);
  }
  return std::string(path.substr(pos + 1));
}

std::string folderOf(std::string_view path) {
  auto pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return "";
  }
  return std::string(path.substr(0, pos));
}

std::string joinVaultPath(std::string_view folder, std::string_view child) {
  if (folder.empty()) {
    return std::string(child);
  }
  if (child.empty()) {
    return std::string(folder);
  }
  std::string result(folder);
  if (result.back() != '/') {
    result += '/';
  }
  result += child;
  return result;
}

std::string calculateRelativePath(std::string_view notePath, std::string_view assetPath) {
  const std::string noteDir = folderOf(notePath);
  const std::string assetDir = folderOf(assetPath);
  const std::string assetName = fileNameOf(assetPath);

  if (noteDir == assetDir) {
    return assetName;
  }

  std::vector<std::string> noteParts;
  std::vector<std::string> assetParts;
  if (!noteDir.empty()) {
    noteParts = splitSegments(noteDir);
  }
  if (!assetDir.empty()) {
    assetParts = splitSegments(assetDir);
  }

  size_t common = 0;
  while (common < noteParts.size() && common < assetParts.size() &&
         noteParts[common] == assetParts[common]) {
    ++common;
  }

  std::string relative;
  for (size_t i = common; i < noteParts.size(); ++i) {
    relative += "../";
  }
  for (size_t i = common; i < assetParts.size(); ++i) {
    relative += assetParts[i];
    relative += '/';
  }
  relative += assetName;
  return relative;
}

std::string percentDecode(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    result += text[i];
  }
  return result;
}

std::string encodeSpaces(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c == ' ') {
      result += "%20";
    } else {
      result += c;
    }
  }
  return result;
}

// ============================================================================
// PathValidator
// ============================================================================

bool PathValidator::isSafePath(std::string_view path) {
  std::string unified(path);
  std::replace(unified.begin(), unified.end(), '\\', '/');

  if (!unified.empty() && unified.front() == '/') {
    return false;
  }
  if (unified.size() >= 2 && std::isalpha(static_cast<unsigned char>(unified[0])) &&
      unified[1] == ':') {
    return false;
  }
  if (unified.find("..") != std::string::npos) {
    return false;
  }
  if (unified.find('\0') != std::string::npos) {
    return false;
  }
  return true;
}

std::string PathValidator::sanitizePath(std::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (char c : path) {
    char ch = (c == '\\') ? '/' : c;
    if (ch == '/' && !result.empty() && result.back() == '/') {
      continue;
    }
    result += ch;
  }

  while (!result.empty() && result.front() == '/') {
    result.erase(result.begin());
  }
  while (!result.empty() && result.back() == '/') {
    result.pop_back();
  }

  size_t pos;
  while ((pos = result.find("..")) != std::string::npos) {
    result.erase(pos, 2);
  }
  return result;
}

bool PathValidator::isValidFileName(std::string_view fileName) {
  if (fileName.empty()) {
    return false;
  }
  if (std::all_of(fileName.begin(), fileName.end(),
                  [](unsigned char c) { return std::isspace(c) != 0; })) {
    return false;
  }
  if (std::all_of(fileName.begin(), fileName.end(), [](char c) { return c == '.'; })) {
    return false;
  }
  if (std::any_of(fileName.begin(), fileName.end(),
                  [](char c) { return isIllegalFileNameChar(static_cast<unsigned char>(c)); })) {
    return false;
  }

  const std::string stem = upper(fileName.substr(0, fileName.find('.')));
  static const char* const kReserved[] = {"CON", "PRN", "AUX", "NUL"};
  for (const char* reserved : kReserved) {
    if (stem == reserved) {
      return false;
    }
  }
  if (stem.size() == 4 && (stem.rfind("COM", 0) == 0 || stem.rfind("LPT", 0) == 0) &&
      stem[3] >= '1' && stem[3] <= '9') {
    return false;
  }

  return fileName.size() <= kMaxFileNameLength;
}

std::string PathValidator::sanitizeFileName(std::string_view fileName) {
  std::string result(fileName);
  for (char& c : result) {
    if (isIllegalFileNameChar(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }

  auto first = result.find_first_not_of('.');
  result.erase(0, first == std::string::npos ? result.size() : first);
  while (!result.empty() && result.back() == '.') {
    result.pop_back();
  }

  auto begin = result.find_first_not_of(" \t\r\n");
  auto end = result.find_last_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  result = result.substr(begin, end - begin + 1);

  if (result.size() > kMaxFileNameLength) {
    result.resize(kMaxFileNameLength);
  }
  return result;
}

std::string PathValidator::combinePath(std::string_view directory, std::string_view fileName) {
  const std::string cleanDir = sanitizePath(directory);
  const std::string cleanName = sanitizeFileName(fileName);
  if (cleanDir.empty()) {
    return cleanName;
  }
  return cleanDir + "/" + cleanName;
}

std::optional<std::string> PathValidator::validateAndSanitize(std::string_view fullPath) {
  std::string sanitized = sanitizePath(fullPath);
  if (!isSafePath(sanitized)) {
    return std::nullopt;
  }

  const std::string name = fileNameOf(sanitized);
  if (!name.empty() && !isValidFileName(name)) {
    return std::nullopt;
  }
  return sanitized;
}

std::string PathValidator::escapeRegex(std::string_view text) {
  static const std::string_view kSpecial = ".*+?^${}()|[]\\";
  std::string result;
  result.reserve(text.size() * 2);
  for (char c : text) {
    if (kSpecial.find(c) != std::string_view::npos) {
      result += '\\';
    }
    result += c;
  }
  return result;
}

} // namespace LinkKeeper::refs
