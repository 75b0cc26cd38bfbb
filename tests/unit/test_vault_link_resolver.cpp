/**
 * @file test_vault_link_resolver.cpp
 * @brief Unit tests for VaultLinkResolver
 */

#include <catch2/catch_test_macros.hpp>
#include "LinkKeeper/refs/link_resolver.hpp"

#include <string>
#include <vector>

using namespace LinkKeeper::refs;

namespace {

std::string resolved(const VaultLinkResolver& resolver, const std::string& link,
                     const std::string& source) {
    auto identity = resolver.resolve(link, source);
    return identity ? identity->path() : std::string("<none>");
}

} // namespace

TEST_CASE("VaultLinkResolver resolution order", "[resolver]") {
    VaultLinkResolver resolver({
        "attachments/photo.png",
        "notes/trip.md",
        "notes/photo.png",
        "archive/2023/photo.png",
        "readme.md",
        "img/a b.png",
    });
    REQUIRE(resolver.fileCount() == 6);

    SECTION("Exact vault path") {
        CHECK(resolved(resolver, "attachments/photo.png", "notes/trip.md") ==
              "attachments/photo.png");
        CHECK(resolved(resolver, "/attachments/photo.png", "notes/trip.md") ==
              "attachments/photo.png");
    }

    SECTION("Relative to the source folder before suffix matching") {
        CHECK(resolved(resolver, "photo.png", "notes/trip.md") == "notes/photo.png");
    }

    SECTION("Suffix match prefers the shortest path") {
        CHECK(resolved(resolver, "photo.png", "readme.md") == "notes/photo.png");
        CHECK(resolved(resolver, "a b.png", "readme.md") == "img/a b.png");
    }

    SECTION("Trailing folders narrow the suffix match") {
        CHECK(resolved(resolver, "2023/photo.png", "readme.md") == "archive/2023/photo.png");
    }

    SECTION("Explicit relative paths never fall back") {
        CHECK(resolved(resolver, "./photo.png", "notes/trip.md") == "notes/photo.png");
        CHECK(resolved(resolver, "../attachments/photo.png", "notes/trip.md") ==
              "attachments/photo.png");
        CHECK(resolved(resolver, "./photo.png", "readme.md") == "<none>");
        CHECK(resolved(resolver, "../photo.png", "notes/trip.md") == "<none>");
    }

    SECTION("Targets without extension try markdown notes") {
        CHECK(resolved(resolver, "trip", "readme.md") == "notes/trip.md");
    }

    SECTION("Unknown targets and case differences do not resolve") {
        CHECK(resolved(resolver, "missing.png", "readme.md") == "<none>");
        CHECK(resolved(resolver, "Photo.png", "attachments/x.md") == "<none>");
        CHECK(resolved(resolver, "", "readme.md") == "<none>");
    }
}

TEST_CASE("VaultLinkResolver tie break", "[resolver]") {
    VaultLinkResolver resolver({"y/a.png", "x/a.png", "z/sub/a.png"});

    CHECK(resolved(resolver, "a.png", "root.md") == "x/a.png");
    CHECK(resolved(resolver, "a.png", "y/note.md") == "y/a.png");
    CHECK(resolved(resolver, "a.png", "z/sub/note.md") == "z/sub/a.png");
}

TEST_CASE("VaultLinkResolver tracks renames", "[resolver]") {
    VaultLinkResolver resolver;
    resolver.addFile("attachments/photo.png");
    resolver.addFile("trip.md");

    resolver.renameFile("attachments/photo.png", "vacation/photo2.png");

    CHECK_FALSE(resolver.contains("attachments/photo.png"));
    CHECK(resolver.contains("vacation/photo2.png"));
    CHECK(resolver.fileCount() == 2);
    CHECK(resolved(resolver, "photo.png", "trip.md") == "<none>");
    CHECK(resolved(resolver, "photo2.png", "trip.md") == "vacation/photo2.png");

    resolver.removeFile("trip.md");
    CHECK(resolver.fileCount() == 1);

    SECTION("Invalid paths are ignored") {
        resolver.addFile("../outside.png");
        CHECK(resolver.fileCount() == 1);
    }
}

TEST_CASE("VaultLinkResolver rewinds a recorded rename", "[resolver]") {
    VaultLinkResolver resolver;
    resolver.addFile("a/photo.png");
    resolver.addFile("b/photo.png");
    resolver.renameFile("a/photo.png", "a/pic.png");

    auto rewound = resolver.rewoundBefore(AssetIdentity("a/photo.png"), AssetIdentity("a/pic.png"));
    REQUIRE(rewound != nullptr);
    CHECK(rewound->resolve("photo.png", "a/note.md") == AssetIdentity("a/photo.png"));
    CHECK_FALSE(rewound->resolve("pic.png", "a/note.md").has_value());
    CHECK(resolved(resolver, "photo.png", "a/note.md") == "b/photo.png");

    SECTION("Nothing to rewind before the rename is recorded") {
        CHECK(rewound->rewoundBefore(AssetIdentity("a/photo.png"), AssetIdentity("a/pic.png")) ==
              nullptr);
    }
}
