#pragma once

/**
 * @file vault_path.hpp
 * @brief Vault-relative path arithmetic and path validation
 *
 * Vault paths always use '/' separators, never start with '/', and
 * never contain "." or ".." segments once normalized.
 */

#include <optional>
#include <string>
#include <string_view>

namespace LinkKeeper::refs {

/**
 * @brief Normalize a vault path
 *
 * Converts backslashes, drops empty and "." segments, folds ".." against
 * the preceding segment and strips leading/trailing slashes. Returns
 * std::nullopt when ".." would climb above the vault root.
 */
[[nodiscard]] std::optional<std::string> normalizeVaultPath(std::string_view path);

[[nodiscard]] std::string fileNameOf(std::string_view path);
[[nodiscard]] std::string folderOf(std::string_view path);
[[nodiscard]] std::string joinVaultPath(std::string_view folder, std::string_view child);

/**
 * @brief Relative path from a note to an asset
 *
 * Same folder yields the bare file name; otherwise "../" steps up to the
 * common prefix followed by the remaining asset folders.
 *
 * @param notePath Vault path of the referencing note ("a/b/note.md")
 * @param assetPath Vault path of the asset ("a/img/photo.png")
 * @return "../img/photo.png"
 */
[[nodiscard]] std::string calculateRelativePath(std::string_view notePath,
                                                std::string_view assetPath);

/**
 * @brief Decode %XX escapes (used by markdown link targets)
 */
[[nodiscard]] std::string percentDecode(std::string_view text);

/**
 * @brief Encode spaces as %20, leaving every other byte untouched
 */
[[nodiscard]] std::string encodeSpaces(std::string_view text);

/**
 * @brief Validation and sanitizing helpers for user-supplied paths
 */
class PathValidator {
public:
  /**
   * @brief Reject absolute paths, ".." traversal and NUL bytes
   */
  [[nodiscard]] static bool isSafePath(std::string_view path);

  /**
   * @brief Unify separators, collapse duplicate slashes, strip leading and
   *        trailing slashes and remove ".." sequences
   */
  [[nodiscard]] static std::string sanitizePath(std::string_view path);

  /**
   * @brief Check a single file name against Windows and Unix rules
   *
   * Rejects empty/blank names, dot-only names, the characters
   * <>:"/\|?* and control bytes, reserved device names (CON, PRN, AUX,
   * NUL, COM1-9, LPT1-9) and names longer than 200 bytes.
   */
  [[nodiscard]] static bool isValidFileName(std::string_view fileName);

  [[nodiscard]] static std::string sanitizeFileName(std::string_view fileName);

  [[nodiscard]] static std::string combinePath(std::string_view directory,
                                               std::string_view fileName);

  /**
   * @brief Sanitize a full path and validate the result
   * @return Sanitized path, or std::nullopt if it is unsafe or its file
   *         name is invalid
   */
  [[nodiscard]] static std::optional<std::string> validateAndSanitize(std::string_view fullPath);

  /**
   * @brief Escape ECMAScript regex metacharacters
   */
  [[nodiscard]] static std::string escapeRegex(std::string_view text);
};

} // namespace LinkKeeper::refs
