#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

namespace LinkKeeper::refs {

AssetIdentity::AssetIdentity(std::string path)
    : m_path(normalizeVaultPath(path).value_or(std::move(path))) {}

std::string AssetIdentity::fileName() const {
  return fileNameOf(m_path);
}

std::string AssetIdentity::folder() const {
  return folderOf(m_path);
}

const char* linkFormatName(LinkFormat format) {
  switch (format) {
  case LinkFormat::Wiki:
    return "wiki";
  case LinkFormat::WikiBare:
    return "wiki-bare";
  case LinkFormat::Markdown:
    return "markdown";
  case LinkFormat::Html:
    return "html";
  }
  return "unknown";
}

RenameTransition RenameTransition::fromPaths(const std::string& oldPath,
                                             const std::string& newPath, u64 observedAt) {
  RenameTransition transition;
  transition.oldIdentity = AssetIdentity(oldPath);
  transition.newIdentity = AssetIdentity(newPath);
  transition.oldDisplayName = transition.oldIdentity.fileName();
  transition.newDisplayName = transition.newIdentity.fileName();
  transition.observedAt = observedAt;
  return transition;
}

} // namespace LinkKeeper::refs
