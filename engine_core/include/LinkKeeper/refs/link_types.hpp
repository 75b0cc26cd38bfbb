#pragma once

/**
 * @file link_types.hpp
 * @brief Value types shared by the reference tracking modules
 *
 * - AssetIdentity: stable handle of an asset (its full vault path)
 * - LinkFormat: the syntax a link token was written in
 * - LinkOccurrence: one located link token pointing at an asset
 */

#include "LinkKeeper/core/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace LinkKeeper::refs {

/**
 * @brief Opaque identity of an asset inside the vault
 *
 * Holds the normalized vault-relative path ("attachments/photo.png").
 * Two link targets written differently (bare name, relative path, full
 * path) refer to the same asset when they resolve to equal identities.
 */
class AssetIdentity {
public:
  AssetIdentity() = default;
  explicit AssetIdentity(std::string path);

  [[nodiscard]] const std::string& path() const { return m_path; }
  [[nodiscard]] bool isEmpty() const { return m_path.empty(); }

  /**
   * @brief File name component ("photo.png")
   */
  [[nodiscard]] std::string fileName() const;

  /**
   * @brief Folder component without trailing slash ("" for vault root)
   */
  [[nodiscard]] std::string folder() const;

  bool operator==(const AssetIdentity& other) const { return m_path == other.m_path; }
  bool operator!=(const AssetIdentity& other) const { return m_path != other.m_path; }
  bool operator<(const AssetIdentity& other) const { return m_path < other.m_path; }

private:
  std::string m_path;
};

enum class LinkFormat {
  Wiki,     // ![[target|...]]
  WikiBare, // [[target|...]]
  Markdown, // ![label](target)
  Html      // <img src="target" ...>
};

[[nodiscard]] const char* linkFormatName(LinkFormat format);

/**
 * @brief One link token located in a document
 *
 * Columns are byte offsets into the line, endCol is exclusive, line is
 * 0-based. rawMatch is the exact token text (line.substr(startCol,
 * endCol - startCol)).
 */
struct LinkOccurrence {
  LinkFormat format = LinkFormat::Wiki;
  std::string rawMatch;
  std::string targetRaw;
  AssetIdentity resolvedPath;
  std::optional<std::string> displayText;
  std::optional<u32> width;
  std::optional<u32> height;
  std::string file;
  u32 line = 0;
  u32 startCol = 0;
  u32 endCol = 0;
  std::string lineContent;
};

/**
 * @brief A rename/move of one asset, created once per notification
 */
struct RenameTransition {
  AssetIdentity oldIdentity;
  AssetIdentity newIdentity;
  std::string oldDisplayName;
  std::string newDisplayName;
  u64 observedAt = 0;

  /**
   * @brief Build a transition from two vault paths, deriving display names
   *        from the file name components
   */
  static RenameTransition fromPaths(const std::string& oldPath, const std::string& newPath,
                                    u64 observedAt);
};

} // namespace LinkKeeper::refs

template <> struct std::hash<LinkKeeper::refs::AssetIdentity> {
  size_t operator()(const LinkKeeper::refs::AssetIdentity& id) const noexcept {
    return std::hash<std::string>{}(id.path());
  }
};
