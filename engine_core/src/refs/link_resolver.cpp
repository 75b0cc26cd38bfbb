/**
 * @file link_resolver.cpp
 * @brief VaultLinkResolver implementation
 */

#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

namespace LinkKeeper::refs {

namespace {

bool hasExtension(const std::string& path) {
  const std::string name = fileNameOf(path);
  auto dot = name.rfind('.');
  return dot != std::string::npos && dot > 0 && dot + 1 < name.size();
}

bool isExplicitRelative(const std::string& path) {
  return path.rfind("./", 0) == 0 || path.rfind("../", 0) == 0;
}

} // namespace

VaultLinkResolver::VaultLinkResolver(const std::vector<std::string>& files) {
  setKnownFiles(files);
}

void VaultLinkResolver::setKnownFiles(const std::vector<std::string>& files) {
  m_files.clear();
  m_byName.clear();
  for (const auto& file : files) {
    addFile(file);
  }
}

void VaultLinkResolver::addFile(const std::string& path) {
  auto normalized = normalizeVaultPath(path);
  if (!normalized || normalized->empty()) {
    return;
  }
  m_files.insert(*normalized);
  m_byName[fileNameOf(*normalized)].insert(*normalized);
}

void VaultLinkResolver::removeFile(const std::string& path) {
  auto normalized = normalizeVaultPath(path);
  if (!normalized) {
    return;
  }
  m_files.erase(*normalized);
  auto it = m_byName.find(fileNameOf(*normalized));
  if (it != m_byName.end()) {
    it->second.erase(*normalized);
    if (it->second.empty()) {
      m_byName.erase(it);
    }
  }
}

void VaultLinkResolver::renameFile(const std::string& oldPath, const std::string& newPath) {
  removeFile(oldPath);
  addFile(newPath);
}

bool VaultLinkResolver::contains(const std::string& path) const {
  auto normalized = normalizeVaultPath(path);
  return normalized && m_files.count(*normalized) > 0;
}

std::optional<AssetIdentity> VaultLinkResolver::resolve(const std::string& linkPath,
                                                        const std::string& sourceDocument) const {
  if (linkPath.empty()) {
    return std::nullopt;
  }
  const std::string sourceFolder = folderOf(sourceDocument);

  std::vector<std::string> candidates{linkPath};
  if (!hasExtension(linkPath)) {
    candidates.push_back(linkPath + ".md");
  }

  for (const auto& candidate : candidates) {
    if (auto exact = resolveExact(candidate, sourceFolder)) {
      return AssetIdentity(*exact);
    }
  }
  if (isExplicitRelative(linkPath)) {
    return std::nullopt;
  }
  for (const auto& candidate : candidates) {
    if (auto bySuffix = resolveBySuffix(candidate, sourceFolder)) {
      return AssetIdentity(*bySuffix);
    }
  }
  return std::nullopt;
}

std::unique_ptr<ILinkResolver>
VaultLinkResolver::rewoundBefore(const AssetIdentity& oldIdentity,
                                 const AssetIdentity& newIdentity) const {
  if (!contains(newIdentity.path()) || contains(oldIdentity.path())) {
    return nullptr;
  }
  auto rewound = std::make_unique<VaultLinkResolver>(*this);
  rewound->renameFile(newIdentity.path(), oldIdentity.path());
  return rewound;
}

std::optional<std::string> VaultLinkResolver::resolveExact(const std::string& linkPath,
                                                           const std::string& sourceFolder) const {
  if (isExplicitRelative(linkPath)) {
    auto joined = normalizeVaultPath(joinVaultPath(sourceFolder, linkPath));
    if (joined && m_files.count(*joined) > 0) {
      return joined;
    }
    return std::nullopt;
  }

  auto direct = normalizeVaultPath(linkPath);
  if (direct && m_files.count(*direct) > 0) {
    return direct;
  }
  if (!sourceFolder.empty() && linkPath.front() != '/') {
    auto relative = normalizeVaultPath(joinVaultPath(sourceFolder, linkPath));
    if (relative && m_files.count(*relative) > 0) {
      return relative;
    }
  }
  return std::nullopt;
}

std::optional<std::string>
VaultLinkResolver::resolveBySuffix(const std::string& linkPath,
                                   const std::string& sourceFolder) const {
  auto normalized = normalizeVaultPath(linkPath);
  if (!normalized || normalized->empty()) {
    return std::nullopt;
  }
  auto it = m_byName.find(fileNameOf(*normalized));
  if (it == m_byName.end()) {
    return std::nullopt;
  }

  const std::string suffix = "/" + *normalized;
  const std::string* best = nullptr;
  for (const auto& path : it->second) {
    if (path != *normalized &&
        (path.size() < suffix.size() ||
         path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0)) {
      continue;
    }
    if (!best) {
      best = &path;
      continue;
    }
    const bool inSource = folderOf(path) == sourceFolder;
    const bool bestInSource = folderOf(*best) == sourceFolder;
    if (inSource != bestInSource) {
      if (inSource) {
        best = &path;
      }
      continue;
    }
    // std::set iterates in lexicographic order, so ties keep the earlier path
    if (path.size() < best->size()) {
      best = &path;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return *best;
}

} // namespace LinkKeeper::refs
