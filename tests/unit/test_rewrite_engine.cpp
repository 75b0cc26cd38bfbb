/**
 * @file test_rewrite_engine.cpp
 * @brief Unit tests for RewriteEngine
 *
 * Tests cover:
 * - Caption and size preservation across a move
 * - Code blocks and inline code left untouched
 * - Idempotence of a second pass
 * - Path style preservation (bare, relative, full, leading slash)
 * - Bare names matched against the vault as it was before the rename
 * - Per-document read and write failures
 */

#include <catch2/catch_test_macros.hpp>
#include "LinkKeeper/refs/markdown_structure_scanner.hpp"
#include "LinkKeeper/refs/rewrite_engine.hpp"
#include "vault_fixture.hpp"

#include <string>

using namespace LinkKeeper;
using namespace LinkKeeper::refs;

namespace {

RenameTransition renameOf(const std::string& oldPath, const std::string& newPath) {
    return RenameTransition::fromPaths(oldPath, newPath, 0);
}

} // namespace

TEST_CASE("Move keeps caption and size", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("photo.png");
    vault.add("trip.md", "![[photo.png|Summer Trip|800x600]]");
    vault.move("photo.png", "vacation/photo2.png");
    RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

    auto result = engine.rewrite(renameOf("photo.png", "vacation/photo2.png"));

    CHECK(vault.read("trip.md") == "![[vacation/photo2.png|Summer Trip|800x600]]");
    CHECK(result.updatedFileCount == 1);
    CHECK(result.occurrencesRewritten == 1);
    CHECK(result.touchedFiles == std::set<std::string>{"trip.md"});
    CHECK_FALSE(result.suppressed);

    SECTION("A second pass changes nothing") {
        const int writes = vault.fs.getWriteCount();
        auto again = engine.rewrite(renameOf("photo.png", "vacation/photo2.png"));
        CHECK(again.updatedFileCount == 0);
        CHECK(again.touchedFiles.empty());
        CHECK(vault.fs.getWriteCount() == writes);
        CHECK(vault.read("trip.md") == "![[vacation/photo2.png|Summer Trip|800x600]]");
    }
}

TEST_CASE("Code is never rewritten", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("photo.png");
    vault.add("doc.md", "```\n![[photo.png]]\n```\n![[photo.png]]");
    vault.add("inline.md", "`![[photo.png]]` vs ![[photo.png]]");
    vault.move("photo.png", "photo2.png");
    MarkdownStructureScanner scanner;

    auto run = [&](const IStructuralHintProvider& hints) {
        RewriteEngine engine(vault.corpus, vault.resolver, hints);
        auto result = engine.rewrite(renameOf("photo.png", "photo2.png"));
        CHECK(result.updatedFileCount == 2);
        CHECK(vault.read("doc.md") == "```\n![[photo.png]]\n```\n![[photo2.png]]");
        CHECK(vault.read("inline.md") == "`![[photo.png]]` vs ![[photo2.png]]");
    };

    SECTION("Fence scan") {
        run(vault.noHints);
    }

    SECTION("Structural hints") {
        run(scanner);
    }
}

TEST_CASE("HTML image keeps its other attributes", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("a.png");
    vault.add("page.md", "<img src=\"a.png\" alt=\"A\" width=\"50\">");
    vault.move("a.png", "b.png");
    RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

    auto result = engine.rewrite(AssetIdentity("a.png"), AssetIdentity("b.png"), "a.png", "b.png");

    CHECK(result.updatedFileCount == 1);
    CHECK(vault.read("page.md") == "<img src=\"b.png\" alt=\"A\" width=\"50\">");
}

TEST_CASE("Link path style is preserved", "[rewrite_engine]") {
    test::VaultFixture vault;

    SECTION("Parent-relative markdown path is recomputed") {
        vault.add("attachments/photo.png");
        vault.add("notes/day.md", "![x](../attachments/photo.png)");
        vault.move("attachments/photo.png", "media/2024/photo.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("attachments/photo.png", "media/2024/photo.png"));
        CHECK(vault.read("notes/day.md") == "![x](../media/2024/photo.png)");
    }

    SECTION("Dot-relative path keeps its prefix") {
        vault.add("notes/photo.png");
        vault.add("notes/day.md", "![[./photo.png]]");
        vault.move("notes/photo.png", "notes/pic.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("notes/photo.png", "notes/pic.png"));
        CHECK(vault.read("notes/day.md") == "![[./pic.png]]");
    }

    SECTION("Full and rooted paths stay full") {
        vault.add("attachments/photo.png");
        vault.add("index.md", "![[attachments/photo.png]] ![[/attachments/photo.png]]");
        vault.move("attachments/photo.png", "attachments/renamed.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        auto result = engine.rewrite(renameOf("attachments/photo.png", "attachments/renamed.png"));
        CHECK(result.occurrencesRewritten == 2);
        CHECK(vault.read("index.md") ==
              "![[attachments/renamed.png]] ![[/attachments/renamed.png]]");
    }

    SECTION("Bare name stays bare for an in-place rename") {
        vault.add("attachments/photo.png");
        vault.add("index.md", "![[photo.png]]");
        vault.move("attachments/photo.png", "attachments/cover.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("attachments/photo.png", "attachments/cover.png"));
        CHECK(vault.read("index.md") == "![[cover.png]]");
    }

    SECTION("Bare name that would resolve elsewhere becomes a full path") {
        vault.add("attachments/photo.png");
        vault.add("cover.png");
        vault.add("index.md", "![[photo.png]]");
        vault.move("attachments/photo.png", "attachments/cover.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("attachments/photo.png", "attachments/cover.png"));
        CHECK(vault.read("index.md") == "![[attachments/cover.png]]");
    }

    SECTION("Percent-encoded target stays encoded") {
        vault.add("my photo.png");
        vault.add("index.md", "![a](my%20photo.png)");
        vault.move("my photo.png", "my trip.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("my photo.png", "my trip.png"));
        CHECK(vault.read("index.md") == "![a](my%20trip.png)");
    }
}

TEST_CASE("Captions naming the old file are kept as written", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("photo.png");
    vault.add("index.md", "![[photo.png|photo.png]]\n![photo.png](photo.png)\n![[photo.png|Beach]]");
    vault.move("photo.png", "pic.png");
    RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

    auto result = engine.rewrite(renameOf("photo.png", "pic.png"));

    CHECK(result.occurrencesRewritten == 3);
    CHECK(vault.read("index.md") ==
          "![[pic.png|photo.png]]\n![photo.png](pic.png)\n![[pic.png|Beach]]");
}

TEST_CASE("Only links to the renamed asset change", "[rewrite_engine]") {
    test::VaultFixture vault;

    SECTION("Several links on one line") {
        vault.add("a.png");
        vault.add("other.png");
        vault.add("index.md", "![[a.png]] and ![[a.png|A]] next to ![[other.png]]");
        vault.move("a.png", "c.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        auto result = engine.rewrite(renameOf("a.png", "c.png"));
        CHECK(result.occurrencesRewritten == 2);
        REQUIRE(result.outcomes.size() == 1);
        CHECK(result.outcomes[0].changedLines == std::vector<u32>{0});
        CHECK(vault.read("index.md") == "![[c.png]] and ![[c.png|A]] next to ![[other.png]]");
    }

    SECTION("Same file name in another folder is left alone") {
        vault.add("attachments/photo.png");
        vault.add("notes/photo.png");
        vault.add("notes/x.md", "![[photo.png]]");
        vault.move("attachments/photo.png", "attachments/p2.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        auto result = engine.rewrite(renameOf("attachments/photo.png", "attachments/p2.png"));
        CHECK(result.updatedFileCount == 0);
        CHECK(vault.read("notes/x.md") == "![[photo.png]]");
    }

    SECTION("Bare name shared with another folder follows the moved asset") {
        vault.add("a/photo.png");
        vault.add("b/photo.png");
        vault.add("a/note.md", "![[photo.png]]");
        vault.add("b/note.md", "![[photo.png]]");
        vault.move("a/photo.png", "a/pic.png");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        auto result = engine.rewrite(renameOf("a/photo.png", "a/pic.png"));
        CHECK(result.updatedFileCount == 1);
        CHECK(vault.read("a/note.md") == "![[pic.png]]");
        CHECK(vault.read("b/note.md") == "![[photo.png]]");

        SECTION("In memory as well") {
            auto rewritten = engine.rewriteDocument("a/other.md", "![[photo.png]]",
                                                    renameOf("a/photo.png", "a/pic.png"));
            CHECK(rewritten.content == "![[pic.png]]");
        }
    }

    SECTION("Links still resolving to the old file are rewritten") {
        vault.add("a.png");
        vault.add("index.md", "![[a.png]]");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        (void)engine.rewrite(renameOf("a.png", "b.png"));
        CHECK(vault.read("index.md") == "![[b.png]]");
    }

    SECTION("Identical or empty identities do nothing") {
        vault.add("a.png");
        vault.add("index.md", "![[a.png]]");
        RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

        CHECK(engine.rewrite(renameOf("a.png", "a.png")).outcomes.empty());
        CHECK(engine.rewrite(AssetIdentity(), AssetIdentity("b.png"), "", "b.png").outcomes.empty());
        CHECK(vault.fs.getWriteCount() == 0);
    }
}

TEST_CASE("Document failures are reported per file", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("a.png");
    vault.add("a.md", "![[a.png]]");
    vault.add("b.md", "![[a.png]]");
    vault.add("c.md", "![[a.png]]");
    vault.fs.setWriteFailure("vault/a.md");
    vault.fs.setReadFailure("vault/c.md");
    vault.move("a.png", "z.png");
    RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

    auto result = engine.rewrite(renameOf("a.png", "z.png"));

    REQUIRE(result.outcomes.size() == 3);
    CHECK(result.outcomes[0].status == FileRewriteStatus::WriteFailed);
    CHECK_FALSE(result.outcomes[0].error.empty());
    CHECK(result.outcomes[1].status == FileRewriteStatus::Updated);
    CHECK(result.outcomes[2].status == FileRewriteStatus::ReadFailed);
    CHECK(result.updatedFileCount == 1);
    CHECK(result.failedFileCount() == 2);
    CHECK(vault.read("a.md") == "![[a.png]]");
    CHECK(vault.read("b.md") == "![[z.png]]");
    CHECK(std::string(fileRewriteStatusName(FileRewriteStatus::WriteFailed)) == "write-failed");
}

TEST_CASE("Rewriting a single document in memory", "[rewrite_engine]") {
    test::VaultFixture vault;
    vault.add("b.png");
    RewriteEngine engine(vault.corpus, vault.resolver, vault.noHints);

    auto rewritten = engine.rewriteDocument("note.md", "intro\r\n![[a.png]]\r\nplain a.png\r\n",
                                            renameOf("a.png", "b.png"));

    CHECK(rewritten.changed());
    CHECK(rewritten.occurrencesRewritten == 1);
    CHECK(rewritten.changedLines == std::vector<u32>{1});
    CHECK(rewritten.content == "intro\r\n![[b.png]]\r\nplain a.png\r\n");
}
