/**
 * @file QtFileSystem.cpp
 * @brief Qt-based implementation of IFileSystem interface
 */

#include "LinkKeeper/editor/interfaces/QtFileSystem.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <algorithm>

namespace LinkKeeper::editor {

bool QtFileSystem::fileExists(const std::string& path) const {
  QFileInfo info(QString::fromStdString(path));
  return info.exists() && info.isFile();
}

bool QtFileSystem::directoryExists(const std::string& path) const {
  QFileInfo info(QString::fromStdString(path));
  return info.exists() && info.isDir();
}

Result<std::string> QtFileSystem::readFile(const std::string& path) const {
  QFile file(QString::fromStdString(path));
  if (!file.open(QIODevice::ReadOnly)) {
    return Result<std::string>::error("Cannot open " + path + ": " +
                                      file.errorString().toStdString());
  }

  QByteArray content = file.readAll();
  if (file.error() != QFileDevice::NoError) {
    return Result<std::string>::error("Cannot read " + path + ": " +
                                      file.errorString().toStdString());
  }
  file.close();
  return Result<std::string>::ok(content.toStdString());
}

Result<void> QtFileSystem::writeFile(const std::string& path, const std::string& content) {
  QSaveFile file(QString::fromStdString(path));
  if (!file.open(QIODevice::WriteOnly)) {
    return Result<void>::error("Cannot open " + path + " for writing: " +
                               file.errorString().toStdString());
  }

  qint64 written = file.write(content.c_str(), static_cast<qint64>(content.size()));
  if (written != static_cast<qint64>(content.size())) {
    file.cancelWriting();
    return Result<void>::error("Short write to " + path);
  }
  if (!file.commit()) {
    return Result<void>::error("Cannot commit " + path + ": " + file.errorString().toStdString());
  }
  return Result<void>::ok();
}

Result<void> QtFileSystem::moveFile(const std::string& src, const std::string& dest) {
  if (QFile::exists(QString::fromStdString(dest))) {
    return Result<void>::error("Destination already exists: " + dest);
  }
  QFile file(QString::fromStdString(src));
  if (!file.rename(QString::fromStdString(dest))) {
    return Result<void>::error("Cannot move " + src + " to " + dest + ": " +
                               file.errorString().toStdString());
  }
  return Result<void>::ok();
}

bool QtFileSystem::createDirectories(const std::string& path) {
  QDir dir;
  return dir.mkpath(QString::fromStdString(path));
}

std::vector<std::string> QtFileSystem::listFilesRecursive(const std::string& directory) const {
  std::vector<std::string> result;

  QDirIterator it(QString::fromStdString(directory), QDir::Files | QDir::Hidden,
                  QDirIterator::Subdirectories);
  while (it.hasNext()) {
    result.push_back(QDir::fromNativeSeparators(it.next()).toStdString());
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::string QtFileSystem::getFileName(const std::string& path) const {
  QFileInfo info(QString::fromStdString(path));
  return info.fileName().toStdString();
}

std::string QtFileSystem::getParentDirectory(const std::string& path) const {
  QFileInfo info(QString::fromStdString(path));
  return info.path().toStdString();
}

std::string QtFileSystem::normalizePath(const std::string& path) const {
  return QDir::cleanPath(QDir::fromNativeSeparators(QString::fromStdString(path))).toStdString();
}

std::string QtFileSystem::joinPath(const std::string& base, const std::string& component) const {
  QDir dir(QString::fromStdString(base));
  return QDir::cleanPath(dir.filePath(QString::fromStdString(component))).toStdString();
}

std::string QtFileSystem::relativePath(const std::string& base, const std::string& path) const {
  QDir dir(QString::fromStdString(base));
  QString relative = dir.relativeFilePath(QString::fromStdString(path));
  if (relative.startsWith("..") || QDir::isAbsolutePath(relative)) {
    return "";
  }
  return QDir::fromNativeSeparators(relative).toStdString();
}

} // namespace LinkKeeper::editor
