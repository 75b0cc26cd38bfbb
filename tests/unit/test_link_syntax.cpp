/**
 * @file test_link_syntax.cpp
 * @brief Unit tests for link token scanning, parsing and building
 *
 * Tests cover:
 * - Wiki embeds with captions and sizes
 * - Markdown images (percent escapes, angle brackets, titles)
 * - HTML <img> tags (attribute order, quoting, self-closing)
 * - Line tokenizing and field edits
 */

#include <catch2/catch_test_macros.hpp>
#include "LinkKeeper/refs/link_syntax.hpp"

#include <string>
#include <vector>

using namespace LinkKeeper;
using namespace LinkKeeper::refs;

namespace {

LinkToken tokenOf(const std::string& text) {
    auto tokens = tokenizeLine(text);
    REQUIRE(tokens.size() == 1);
    return tokens.front();
}

} // namespace

// =============================================================================
// Wiki links
// =============================================================================

TEST_CASE("Wiki embed with caption and size is parsed", "[link_syntax][wiki]") {
    auto parts = parseWikiLink("![[photo.png|Summer Trip|800x600]]");

    CHECK(parts.path == "photo.png");
    CHECK(parts.displayText == "Summer Trip");
    REQUIRE(parts.width.has_value());
    CHECK(*parts.width == 800);
    REQUIRE(parts.height.has_value());
    CHECK(*parts.height == 600);
}

TEST_CASE("Wiki segments are classified in order", "[link_syntax][wiki]") {
    SECTION("Width only") {
        auto parts = parseWikiLink("[[photo.png|800]]");
        CHECK(parts.path == "photo.png");
        CHECK(parts.displayText.empty());
        CHECK(parts.width == 800u);
        CHECK_FALSE(parts.height.has_value());
    }

    SECTION("Numeric caption is read as a width") {
        auto parts = parseWikiLink("![[photo.png|2024]]");
        CHECK(parts.displayText.empty());
        CHECK(parts.width == 2024u);
    }

    SECTION("Extra segments after caption and size are dropped") {
        auto parts = parseWikiLink("![[a.png|first|second|300]]");
        CHECK(parts.displayText == "first");
        CHECK(parts.width == 300u);
    }

    SECTION("Segments are trimmed") {
        auto parts = parseWikiLink("![[ photo.png | Caption ]]");
        CHECK(parts.path == "photo.png");
        CHECK(parts.displayText == "Caption");
    }

    SECTION("Malformed token yields an empty path") {
        CHECK(parseWikiLink("![[broken").path.empty());
        CHECK(parseWikiLink("photo.png").path.empty());
    }
}

TEST_CASE("Size segments", "[link_syntax][wiki]") {
    u32 width = 0;
    std::optional<u32> height;

    CHECK(parseSizeSegment("640", width, height));
    CHECK(width == 640);
    CHECK_FALSE(height.has_value());

    CHECK(parseSizeSegment("640x480", width, height));
    CHECK(width == 640);
    CHECK(height == 480u);

    CHECK_FALSE(parseSizeSegment("640x", width, height));
    CHECK_FALSE(parseSizeSegment("x480", width, height));
    CHECK_FALSE(parseSizeSegment("wide", width, height));
    CHECK_FALSE(parseSizeSegment("99999999999", width, height));
}

TEST_CASE("Wiki links are rebuilt from their parts", "[link_syntax][wiki]") {
    WikiLinkParts parts;
    parts.path = "vacation/photo2.png";
    parts.displayText = "Summer Trip";
    parts.width = 800;
    parts.height = 600;
    CHECK(buildWikiLink(parts) == "![[vacation/photo2.png|Summer Trip|800x600]]");

    parts.displayText.clear();
    parts.height.reset();
    CHECK(buildWikiLink(parts, false) == "[[vacation/photo2.png|800]]");

    SECTION("Parsing a built link gives back the same fields") {
        for (const char* text : {"![[a.png]]", "![[a b/c.png|Cap]]", "![[x.png|Cap|10x20]]",
                                 "[[note#Heading|alias]]", "![[a.png|100|200]]",
                                 "![[a.png|800x600|1999]]", "[[a.png|1x2|3x4]]"}) {
            auto parsed = parseWikiLink(text);
            auto rebuilt = parseWikiLink(buildWikiLink(parsed, text[0] == '!'));
            CHECK(rebuilt.path == parsed.path);
            CHECK(rebuilt.displayText == parsed.displayText);
            CHECK(rebuilt.width == parsed.width);
            CHECK(rebuilt.height == parsed.height);
        }
    }
}

TEST_CASE("Size-shaped captions stay behind the size", "[link_syntax][wiki]") {
    auto parts = parseWikiLink("![[a.png|100|200]]");
    REQUIRE(parts.width == 100u);
    CHECK(parts.displayText == "200");
    CHECK(buildWikiLink(parts) == "![[a.png|100|200]]");

    parts = parseWikiLink("![[a.png|800x600|1999]]");
    CHECK(buildWikiLink(parts) == "![[a.png|800x600|1999]]");

    SECTION("A target change keeps width and caption apart") {
        LinkEdit edit;
        edit.target = "b/a.png";
        auto rebuilt = applyLinkEdit(tokenOf("![[a.png|100|200]]"), edit);
        REQUIRE(rebuilt.has_value());
        CHECK(*rebuilt == "![[b/a.png|100|200]]");
        auto reparsed = parseWikiLink(*rebuilt);
        CHECK(reparsed.width == 100u);
        CHECK(reparsed.displayText == "200");
    }

    SECTION("Without a size the caption is written as is") {
        WikiLinkParts captionOnly;
        captionOnly.path = "a.png";
        captionOnly.displayText = "2024";
        CHECK(buildWikiLink(captionOnly) == "![[a.png|2024]]");
    }
}

TEST_CASE("Wiki subpaths are split off", "[link_syntax][wiki]") {
    auto [path, subpath] = splitWikiSubpath("note#heading");
    CHECK(path == "note");
    CHECK(subpath == "#heading");

    auto [plain, none] = splitWikiSubpath("photo.png");
    CHECK(plain == "photo.png");
    CHECK(none.empty());
}

// =============================================================================
// Markdown images
// =============================================================================

TEST_CASE("Markdown image parsing", "[link_syntax][markdown]") {
    SECTION("Plain target") {
        auto image = parseMarkdownImage("![alt](images/photo.png)");
        REQUIRE(image.has_value());
        CHECK(image->label == "alt");
        CHECK(image->path == "images/photo.png");
        CHECK(image->rawTarget == "images/photo.png");
        CHECK(image->query.empty());
        CHECK(image->title.empty());
        CHECK_FALSE(image->percentEncoded);
    }

    SECTION("Percent-encoded target is decoded") {
        auto image = parseMarkdownImage("![x](my%20photo.png)");
        REQUIRE(image.has_value());
        CHECK(image->path == "my photo.png");
        CHECK(image->percentEncoded);
        CHECK(buildMarkdownImage(*image) == "![x](my%20photo.png)");
    }

    SECTION("Angle bracket target keeps its spaces") {
        auto image = parseMarkdownImage("![x](<my photo.png>)");
        REQUIRE(image.has_value());
        CHECK(image->angleBrackets);
        CHECK(image->path == "my photo.png");
        CHECK(buildMarkdownImage(*image) == "![x](<my photo.png>)");
    }

    SECTION("Query and title are separated from the path") {
        auto image = parseMarkdownImage("![x](photo.png?w=200 \"Title\")");
        REQUIRE(image.has_value());
        CHECK(image->path == "photo.png");
        CHECK(image->query == "?w=200");
        CHECK(image->title == " \"Title\"");
        CHECK(buildMarkdownImage(*image) == "![x](photo.png?w=200 \"Title\")");
    }

    SECTION("Raw spaces are kept as written") {
        auto image = parseMarkdownImage("![x](my photo.png)");
        REQUIRE(image.has_value());
        CHECK(image->path == "my photo.png");
        CHECK_FALSE(image->percentEncoded);
        CHECK(buildMarkdownImage(*image) == "![x](my photo.png)");
    }

    SECTION("Tokens without a target are rejected") {
        CHECK_FALSE(parseMarkdownImage("![]()").has_value());
        CHECK_FALSE(parseMarkdownImage("![a](  )").has_value());
        CHECK_FALSE(parseMarkdownImage("[a](b.png)").has_value());
    }
}

TEST_CASE("Markdown labels are escaped", "[link_syntax][markdown]") {
    CHECK(escapeMarkdownLabel("a [b]") == "a \\[b\\]");
    CHECK(escapeMarkdownLabel("back\\slash") == "back\\\\slash");
    CHECK(escapeMarkdownLabel("plain") == "plain");
}

// =============================================================================
// HTML images
// =============================================================================

TEST_CASE("HTML img tag attributes", "[link_syntax][html]") {
    auto tag = parseHtmlImage("<img src=\"a.png\" alt=\"A\" width=\"50\">");
    REQUIRE(tag.has_value());
    CHECK(tag->src() == "a.png");
    CHECK(tag->alt() == std::optional<std::string>("A"));
    CHECK(tag->width() == 50u);
    CHECK_FALSE(tag->height().has_value());
    CHECK_FALSE(tag->selfClosing);

    SECTION("Changing src keeps every other attribute") {
        tag->setSrc("b.png");
        CHECK(buildHtmlImage(*tag) == "<img src=\"b.png\" alt=\"A\" width=\"50\">");
    }

    SECTION("Removing the width drops the attribute") {
        tag->setWidth(std::nullopt);
        CHECK(buildHtmlImage(*tag) == "<img src=\"a.png\" alt=\"A\">");
    }

    SECTION("Alt text is escaped for the quote in use") {
        tag->setAlt("say \"hi\" & <wave>");
        CHECK(buildHtmlImage(*tag) ==
              "<img src=\"a.png\" alt=\"say &quot;hi&quot; &amp; &lt;wave&gt;\" width=\"50\">");
    }
}

TEST_CASE("HTML img tag layout is preserved", "[link_syntax][html]") {
    SECTION("Single quotes, unquoted values and self-closing slash") {
        auto tag = parseHtmlImage("<img src='x.png' class=thumb />");
        REQUIRE(tag.has_value());
        CHECK(tag->selfClosing);
        CHECK(tag->spaceBeforeSlash);
        CHECK(buildHtmlImage(*tag) == "<img src='x.png' class=thumb />");
    }

    SECTION("Well-known attributes are emitted first") {
        auto tag = parseHtmlImage("<img class=\"c\" width=\"10\" src=\"a.png\">");
        REQUIRE(tag.has_value());
        CHECK(buildHtmlImage(*tag) == "<img src=\"a.png\" width=\"10\" class=\"c\">");
    }

    SECTION("Tag and attribute case survive") {
        auto tag = parseHtmlImage("<IMG SRC=\"a.png\">");
        REQUIRE(tag.has_value());
        CHECK(tag->src() == "a.png");
        CHECK(buildHtmlImage(*tag) == "<IMG SRC=\"a.png\">");
    }

    SECTION("Non-img tags are rejected") {
        CHECK_FALSE(parseHtmlImage("<image src=\"a.png\">").has_value());
        CHECK_FALSE(parseHtmlImage("<div>").has_value());
    }
}

TEST_CASE("HTML image size", "[link_syntax][html]") {
    auto size = parseHtmlImageSize("<img src=\"a.png\" width=\"640\" height=480>");
    CHECK(size.width == 640u);
    CHECK(size.height == 480u);

    auto units = parseHtmlImageSize("<img src=\"a.png\" width=\"50px\">");
    CHECK(units.width == 50u);
    CHECK_FALSE(units.height.has_value());
}

// =============================================================================
// Tokenizing
// =============================================================================

TEST_CASE("Lines are tokenized in column order", "[link_syntax][tokenize]") {
    const std::string line =
        "See ![[a.png]] and [[note]] plus ![b](b.png) and <img src=\"c.png\">";
    auto tokens = tokenizeLine(line);

    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0].format == LinkFormat::Wiki);
    CHECK(tokens[0].startCol == 4);
    CHECK(tokens[0].endCol == 14);
    CHECK(tokens[0].text == "![[a.png]]");
    CHECK(tokens[1].format == LinkFormat::WikiBare);
    CHECK(tokens[1].text == "[[note]]");
    CHECK(tokens[2].format == LinkFormat::Markdown);
    CHECK(tokens[2].text == "![b](b.png)");
    CHECK(tokens[3].format == LinkFormat::Html);
    CHECK(tokens[3].text == "<img src=\"c.png\">");

    for (const auto& token : tokens) {
        CHECK(line.substr(token.startCol, token.endCol - token.startCol) == token.text);
    }
}

TEST_CASE("Tokenizer ignores incomplete tokens", "[link_syntax][tokenize]") {
    CHECK(tokenizeLine("[[]]").empty());
    CHECK(tokenizeLine("![[unterminated").empty());
    CHECK(tokenizeLine("<imgfoo src=\"a.png\">").empty());
    CHECK(tokenizeLine("![alt] (a.png)").empty());

    SECTION("A quoted '>' does not end an img tag") {
        auto tokens = tokenizeLine("x <img src='a>b.png'> y");
        REQUIRE(tokens.size() == 1);
        CHECK(tokens[0].text == "<img src='a>b.png'>");
    }

    SECTION("Scanning can start mid-line") {
        auto tokens = tokenizeLine("![[a.png]] ![[b.png]]", 10);
        REQUIRE(tokens.size() == 1);
        CHECK(tokens[0].text == "![[b.png]]");
    }
}

TEST_CASE("Tokens expose a uniform view", "[link_syntax][tokenize]") {
    SECTION("Wiki link without subpath") {
        auto link = parseLinkToken(tokenOf("[[note#Heading|alias]]"));
        REQUIRE(link.has_value());
        CHECK(link->targetRaw == "note#Heading");
        CHECK(link->linkPath == "note");
        CHECK(link->displayText == std::optional<std::string>("alias"));
    }

    SECTION("Markdown decoded path and empty label") {
        auto link = parseLinkToken(tokenOf("![](a%20b.png)"));
        REQUIRE(link.has_value());
        CHECK(link->linkPath == "a b.png");
        CHECK_FALSE(link->displayText.has_value());
    }

    SECTION("HTML src without query") {
        auto link = parseLinkToken(tokenOf("<img src=\"img/a%20b.png?v=2\" width=\"10\">"));
        REQUIRE(link.has_value());
        CHECK(link->targetRaw == "img/a%20b.png?v=2");
        CHECK(link->linkPath == "img/a b.png");
        CHECK(link->width == 10u);
    }

    SECTION("HTML without src carries no target") {
        CHECK_FALSE(parseLinkToken(tokenOf("<img alt=\"x\">")).has_value());
    }
}

// =============================================================================
// Edits
// =============================================================================

TEST_CASE("Link edits keep untouched fields", "[link_syntax][edit]") {
    SECTION("Wiki target change keeps caption and size") {
        LinkEdit edit;
        edit.target = "b/a.png";
        CHECK(applyLinkEdit(tokenOf("![[a.png|Cap|100x50]]"), edit) == "![[b/a.png|Cap|100x50]]");
    }

    SECTION("Wiki subpath survives") {
        LinkEdit edit;
        edit.target = "new";
        CHECK(applyLinkEdit(tokenOf("[[old#Sec]]"), edit) == "[[new#Sec]]");
    }

    SECTION("Empty display text removes the caption") {
        LinkEdit edit;
        edit.displayText = "";
        CHECK(applyLinkEdit(tokenOf("![[a.png|Cap|100]]"), edit) == "![[a.png|100]]");
    }

    SECTION("Markdown title survives and spaces are encoded") {
        LinkEdit edit;
        edit.target = "img/b c.png";
        CHECK(applyLinkEdit(tokenOf("![x](a.png \"T\")"), edit) == "![x](img/b%20c.png \"T\")");
    }

    SECTION("Markdown label is escaped") {
        LinkEdit edit;
        edit.displayText = "a [b]";
        CHECK(applyLinkEdit(tokenOf("![x](a.png)"), edit) == "![a \\[b\\]](a.png)");
    }

    SECTION("HTML encoded src stays encoded and keeps its query") {
        LinkEdit edit;
        edit.target = "my b.png";
        CHECK(applyLinkEdit(tokenOf("<img src=\"my%20a.png?v=2\">"), edit) ==
              "<img src=\"my%20b.png?v=2\">");
    }

    SECTION("HTML size can be cleared") {
        LinkEdit edit;
        edit.clearSize = true;
        CHECK(applyLinkEdit(tokenOf("<img src=\"a.png\" width=\"5\" height=\"6\">"), edit) ==
              "<img src=\"a.png\">");
    }

    SECTION("HTML size is added after alt") {
        LinkEdit edit;
        edit.width = 300;
        edit.height = 200;
        CHECK(applyLinkEdit(tokenOf("<img alt=\"x\" src=\"a.png\">"), edit) ==
              "<img src=\"a.png\" alt=\"x\" width=\"300\" height=\"200\">");
    }
}
