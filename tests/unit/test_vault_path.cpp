/**
 * @file test_vault_path.cpp
 * @brief Unit tests for vault path arithmetic and PathValidator
 */

#include <catch2/catch_test_macros.hpp>
#include "LinkKeeper/refs/link_types.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <string>

using namespace LinkKeeper::refs;

TEST_CASE("Vault paths are normalized", "[vault_path]") {
    CHECK(normalizeVaultPath("./a//b/../c.png") == std::optional<std::string>("a/c.png"));
    CHECK(normalizeVaultPath("\\a\\b.png") == std::optional<std::string>("a/b.png"));
    CHECK(normalizeVaultPath("/attachments/photo.png/") ==
          std::optional<std::string>("attachments/photo.png"));
    CHECK(normalizeVaultPath("") == std::optional<std::string>(""));

    SECTION("Climbing above the root fails") {
        CHECK_FALSE(normalizeVaultPath("../x.png").has_value());
        CHECK_FALSE(normalizeVaultPath("a/../../x.png").has_value());
    }
}

TEST_CASE("File name and folder components", "[vault_path]") {
    CHECK(fileNameOf("a/b/photo.png") == "photo.png");
    CHECK(fileNameOf("photo.png") == "photo.png");
    CHECK(folderOf("a/b/photo.png") == "a/b");
    CHECK(folderOf("photo.png").empty());
    CHECK(joinVaultPath("", "photo.png") == "photo.png");
    CHECK(joinVaultPath("a/", "photo.png") == "a/photo.png");

    AssetIdentity identity("./vacation//photo2.png");
    CHECK(identity.path() == "vacation/photo2.png");
    CHECK(identity.fileName() == "photo2.png");
    CHECK(identity.folder() == "vacation");
    CHECK(AssetIdentity("photo.png").folder().empty());
}

TEST_CASE("Relative paths from a note to an asset", "[vault_path]") {
    CHECK(calculateRelativePath("a/b/note.md", "a/img/photo.png") == "../img/photo.png");
    CHECK(calculateRelativePath("a/note.md", "a/photo.png") == "photo.png");
    CHECK(calculateRelativePath("note.md", "img/photo.png") == "img/photo.png");
    CHECK(calculateRelativePath("a/note.md", "photo.png") == "../photo.png");
    CHECK(calculateRelativePath("x/y/z/note.md", "p/q.png") == "../../../p/q.png");
}

TEST_CASE("Percent escapes", "[vault_path]") {
    CHECK(percentDecode("my%20photo.png") == "my photo.png");
    CHECK(percentDecode("100%") == "100%");
    CHECK(percentDecode("bad%2Gx") == "bad%2Gx");
    CHECK(encodeSpaces("a b c") == "a%20b%20c");
    CHECK(encodeSpaces("plain") == "plain");
}

TEST_CASE("PathValidator accepts and rejects paths", "[vault_path][validator]") {
    SECTION("Safe paths") {
        CHECK(PathValidator::isSafePath("notes/a.md"));
        CHECK_FALSE(PathValidator::isSafePath("../etc/passwd"));
        CHECK_FALSE(PathValidator::isSafePath("/abs/path.png"));
        CHECK_FALSE(PathValidator::isSafePath("C:\\images\\a.png"));
        CHECK_FALSE(PathValidator::isSafePath(std::string("a\0b", 3)));
    }

    SECTION("File names") {
        CHECK(PathValidator::isValidFileName("photo.png"));
        CHECK(PathValidator::isValidFileName("COM0"));
        CHECK_FALSE(PathValidator::isValidFileName(""));
        CHECK_FALSE(PathValidator::isValidFileName("   "));
        CHECK_FALSE(PathValidator::isValidFileName("..."));
        CHECK_FALSE(PathValidator::isValidFileName("a:b.png"));
        CHECK_FALSE(PathValidator::isValidFileName("what?.png"));
        CHECK_FALSE(PathValidator::isValidFileName("CON.txt"));
        CHECK_FALSE(PathValidator::isValidFileName("lpt3"));
        CHECK_FALSE(PathValidator::isValidFileName(std::string(201, 'a')));
        CHECK(PathValidator::isValidFileName(std::string(200, 'a')));
    }

    SECTION("Sanitizing") {
        CHECK(PathValidator::sanitizeFileName("a<b>.png") == "a_b_.png");
        CHECK(PathValidator::sanitizeFileName("..hidden.") == "hidden");
        CHECK(PathValidator::sanitizePath("/a\\b//c/") == "a/b/c");
        CHECK(PathValidator::combinePath("img/", "x|y.png") == "img/x_y.png");
    }

    SECTION("Validate and sanitize a full path") {
        CHECK(PathValidator::validateAndSanitize("folder//sub/photo.png") ==
              std::optional<std::string>("folder/sub/photo.png"));
        CHECK_FALSE(PathValidator::validateAndSanitize("img/CON.png").has_value());
        CHECK_FALSE(PathValidator::validateAndSanitize("img/a|b.png").has_value());
    }

    SECTION("Regex escaping") {
        CHECK(PathValidator::escapeRegex("a.b*c(1)") == "a\\.b\\*c\\(1\\)");
    }
}
