#pragma once

/**
 * @file link_resolver.hpp
 * @brief Resolution of raw link targets to asset identities
 */

#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/refs/link_types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace LinkKeeper::refs {

/**
 * @brief Resolves a link target written in a document to an asset
 */
class ILinkResolver {
public:
  virtual ~ILinkResolver() = default;

  /**
   * @brief Resolve a link target
   * @param linkPath Target without display text, subpath or query
   *        ("photo.png", "../img/photo.png", "attachments/photo.png")
   * @param sourceDocument Vault path of the document containing the link
   * @return Identity of the file the link points at, or std::nullopt when
   *         no file matches
   */
  [[nodiscard]] virtual std::optional<AssetIdentity>
  resolve(const std::string& linkPath, const std::string& sourceDocument) const = 0;

  /**
   * @brief Resolver answering as the vault looked before a rename
   * @return A resolver where newIdentity is back at oldIdentity, or nullptr
   *         when this resolver has not seen the rename yet
   */
  [[nodiscard]] virtual std::unique_ptr<ILinkResolver>
  rewoundBefore(const AssetIdentity& oldIdentity, const AssetIdentity& newIdentity) const {
    (void)oldIdentity;
    (void)newIdentity;
    return nullptr;
  }
};

/**
 * @brief Resolver backed by the list of files in the vault
 *
 * Resolution order:
 * 1. "./" and "../" targets relative to the source document's folder
 * 2. Exact vault path (a leading '/' is ignored)
 * 3. Path relative to the source document's folder
 * 4. Suffix match on the file name or trailing folders; when several files
 *    match, the one in the source folder wins, then the shortest path, then
 *    the lexicographically smallest
 *
 * Targets without an extension also try ".md".
 */
class VaultLinkResolver : public ILinkResolver {
public:
  VaultLinkResolver() = default;
  explicit VaultLinkResolver(const std::vector<std::string>& files);

  void setKnownFiles(const std::vector<std::string>& files);
  void addFile(const std::string& path);
  void removeFile(const std::string& path);
  void renameFile(const std::string& oldPath, const std::string& newPath);

  [[nodiscard]] bool contains(const std::string& path) const;
  [[nodiscard]] usize fileCount() const { return m_files.size(); }

  [[nodiscard]] std::optional<AssetIdentity>
  resolve(const std::string& linkPath, const std::string& sourceDocument) const override;

  [[nodiscard]] std::unique_ptr<ILinkResolver>
  rewoundBefore(const AssetIdentity& oldIdentity,
                const AssetIdentity& newIdentity) const override;

private:
  [[nodiscard]] std::optional<std::string> resolveExact(const std::string& linkPath,
                                                        const std::string& sourceFolder) const;
  [[nodiscard]] std::optional<std::string> resolveBySuffix(const std::string& linkPath,
                                                           const std::string& sourceFolder) const;

  std::set<std::string> m_files;
  std::map<std::string, std::set<std::string>> m_byName;
};

} // namespace LinkKeeper::refs
