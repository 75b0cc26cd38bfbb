/**
 * @file test_vault_rename.cpp
 * @brief End-to-end tests of the linkkeeper tool on a real vault directory
 */

#include <catch2/catch_test_macros.hpp>

#include "LinkKeeper/editor/interfaces/QtFileSystem.hpp"
#include "LinkKeeper/editor/vault_tool.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <sstream>
#include <string>
#include <vector>

using namespace LinkKeeper;
using namespace LinkKeeper::editor;

// Helper to ensure QCoreApplication exists for Qt functionality
struct QtAppFixture {
  QtAppFixture() {
    if (!QCoreApplication::instance()) {
      static int argc = 1;
      static char *argv[] = {const_cast<char *>("test")};
      static QCoreApplication app(argc, argv);
    }
  }
};

namespace {

void writeText(const QString &path, const std::string &content) {
  QDir().mkpath(QFileInfo(path).path());
  QFile file(path);
  REQUIRE(file.open(QIODevice::WriteOnly));
  file.write(content.c_str(), static_cast<qint64>(content.size()));
}

std::string readText(const QString &path) {
  QFile file(path);
  REQUIRE(file.open(QIODevice::ReadOnly));
  return file.readAll().toStdString();
}

i32 runTool(QtFileSystem &fs, std::ostringstream &out,
            const std::vector<std::string> &args, ToolError *error = nullptr) {
  VaultTool tool(fs, out);
  i32 code = tool.run(VaultTool::parseArgs(args));
  if (error) {
    *error = tool.getLastError();
  }
  return code;
}

} // namespace

TEST_CASE("linkkeeper renames an asset and rewrites the vault",
          "[integration][vault_rename]") {
  QtAppFixture fixture;
  QTemporaryDir tempDir;
  REQUIRE(tempDir.isValid());

  const QString root = tempDir.path();
  const std::string vault = root.toStdString();

  writeText(root + "/attachments/photo.png", "PNG");
  writeText(root + "/notes/trip.md",
            "![[photo.png]]\r\nSee ![beach](../attachments/photo.png)\r\n");
  writeText(root + "/index.md", "<img src=\"attachments/photo.png\" width=\"300\">\n"
                                "```\n"
                                "![[photo.png]]\n"
                                "```\n");
  writeText(root + "/.obsidian/cache.md", "![[photo.png]]");

  QtFileSystem fs;

  SECTION("find lists every reference outside code") {
    std::ostringstream out;
    REQUIRE(runTool(fs, out, {"find", vault, "attachments/photo.png"}) == ExitOk);
    CHECK(out.str().find("notes/trip.md:1:1: ![[photo.png]]") != std::string::npos);
    CHECK(out.str().find("notes/trip.md:2:5: ![beach](../attachments/photo.png)") !=
          std::string::npos);
    CHECK(out.str().find("index.md:1:1: <img") != std::string::npos);
    CHECK(out.str().find("3 reference(s) in 2 note(s)") != std::string::npos);
  }

  SECTION("refs lists embedding notes") {
    std::ostringstream out;
    REQUIRE(runTool(fs, out, {"refs", vault, "attachments/photo.png"}) == ExitOk);
    CHECK(out.str().find("notes/trip.md") != std::string::npos);
    CHECK(out.str().find("note(s) embed attachments/photo.png") != std::string::npos);
  }

  SECTION("rename moves the file and rewrites links") {
    std::ostringstream out;
    REQUIRE(runTool(fs, out,
                    {"rename", vault, "attachments/photo.png", "vacation/photo2.png"}) ==
            ExitOk);

    CHECK_FALSE(QFile::exists(root + "/attachments/photo.png"));
    CHECK(readText(root + "/vacation/photo2.png") == "PNG");

    CHECK(readText(root + "/notes/trip.md") ==
          "![[vacation/photo2.png]]\r\nSee ![beach](../vacation/photo2.png)\r\n");
    CHECK(readText(root + "/index.md") ==
          "<img src=\"vacation/photo2.png\" width=\"300\">\n"
          "```\n"
          "![[photo.png]]\n"
          "```\n");
    CHECK(readText(root + "/.obsidian/cache.md") == "![[photo.png]]");
    CHECK(out.str().find("3 link(s) in 2 note(s)") != std::string::npos);

    SECTION("then edit a caption and size") {
      std::ostringstream editOut;
      REQUIRE(runTool(fs, editOut,
                      {"edit", vault, "notes/trip.md", "1", "vacation/photo2.png", "--text",
                       "Beach", "--size", "640"}) == ExitOk);
      CHECK(readText(root + "/notes/trip.md") ==
            "![[vacation/photo2.png|Beach|640]]\r\nSee ![beach](../vacation/photo2.png)\r\n");
      CHECK(editOut.str().find("+ ![[vacation/photo2.png|Beach|640]]") != std::string::npos);
    }

    SECTION("then find the new path") {
      std::ostringstream findOut;
      REQUIRE(runTool(fs, findOut, {"find", vault, "vacation/photo2.png"}) == ExitOk);
      CHECK(findOut.str().find("3 reference(s) in 2 note(s)") != std::string::npos);
    }
  }

  SECTION("rename refuses an existing target") {
    writeText(root + "/vacation/photo2.png", "OTHER");
    std::ostringstream out;
    ToolError error;
    CHECK(runTool(fs, out, {"rename", vault, "attachments/photo.png", "vacation/photo2.png"},
                  &error) == ExitFailure);
    CHECK(error.code == "EXISTS");
    CHECK(readText(root + "/notes/trip.md").find("![[photo.png]]") == 0);
  }

  SECTION("rename refuses files that are not assets") {
    writeText(root + "/.linkkeeper.json", R"({"assets": {"extensions": ["jpg"]}})");
    std::ostringstream out;
    ToolError error;
    CHECK(runTool(fs, out, {"rename", vault, "attachments/photo.png", "photo.png"}, &error) ==
          ExitFailure);
    CHECK(error.code == "NOT_ASSET");
    CHECK(QFile::exists(root + "/attachments/photo.png"));
  }

  SECTION("rename rejects an invalid target name") {
    std::ostringstream out;
    ToolError error;
    CHECK(runTool(fs, out, {"rename", vault, "attachments/photo.png", "bad|name.png"},
                  &error) == ExitFailure);
    CHECK(error.code == "INVALID_NAME");
  }

  SECTION("broken configuration is reported") {
    writeText(root + "/.linkkeeper.json", "{");
    std::ostringstream out;
    ToolError error;
    CHECK(runTool(fs, out, {"find", vault, "attachments/photo.png"}, &error) == ExitFailure);
    CHECK(error.code == "CONFIG");
  }
}

TEST_CASE("QtFileSystem works on disk", "[integration][qt_file_system]") {
  QtAppFixture fixture;
  QTemporaryDir tempDir;
  REQUIRE(tempDir.isValid());

  QtFileSystem fs;
  const std::string root = fs.normalizePath(tempDir.path().toStdString());
  const std::string note = fs.joinPath(root, "notes/a.md");

  REQUIRE(fs.createDirectories(fs.getParentDirectory(note)));
  CHECK(fs.directoryExists(root + "/notes"));

  REQUIRE(fs.writeFile(note, "line one\r\nline two").isOk());
  CHECK(fs.fileExists(note));
  auto read = fs.readFile(note);
  REQUIRE(read.isOk());
  CHECK(read.value() == "line one\r\nline two");

  CHECK(fs.getFileName(note) == "a.md");
  CHECK(fs.relativePath(root, note) == "notes/a.md");
  CHECK(fs.relativePath(root + "/notes", root + "/b.md").empty());

  REQUIRE(fs.createDirectories(root + "/.hidden"));
  REQUIRE(fs.writeFile(root + "/.hidden/c.md", "x").isOk());
  auto files = fs.listFilesRecursive(root);
  CHECK(files == std::vector<std::string>{root + "/.hidden/c.md", note});

  REQUIRE(fs.moveFile(note, root + "/b.md").isOk());
  CHECK_FALSE(fs.fileExists(note));
  CHECK(fs.moveFile(root + "/b.md", root + "/.hidden/c.md").isError());
  CHECK(fs.readFile(root + "/missing.md").isError());
}
