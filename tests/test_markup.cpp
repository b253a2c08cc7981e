/**
 * @file test_markup.cpp
 * @brief Tests for the HTML/XML well-formedness reader
 */

#include <gtest/gtest.h>
#include "rainbow_error.hpp"
#include "rainbow_markup.hpp"

using namespace rainbow;
using namespace rainbow::markup;

TEST(MarkupTest, XmlEventsAndDepth) {
    auto nodes = parse("<?xml version=\"1.0\"?>\n<root a=\"1\"><child>hi &amp; bye</child><e/></root>",
                       Dialect::XML);
    ASSERT_EQ(nodes.size(), 7u);

    EXPECT_EQ(nodes[0].kind, NodeKind::DECLARATION);

    EXPECT_EQ(nodes[1].kind, NodeKind::OPEN);
    EXPECT_EQ(nodes[1].name, "root");
    EXPECT_EQ(nodes[1].depth, 0u);
    ASSERT_NE(nodes[1].attribute("a"), nullptr);
    EXPECT_EQ(*nodes[1].attribute("a"), "1");
    EXPECT_EQ(nodes[1].attribute("b"), nullptr);

    EXPECT_EQ(nodes[2].kind, NodeKind::OPEN);
    EXPECT_EQ(nodes[2].depth, 1u);
    EXPECT_EQ(nodes[3].kind, NodeKind::TEXT);
    EXPECT_EQ(nodes[3].text, "hi & bye");
    EXPECT_EQ(nodes[3].depth, 2u);
    EXPECT_EQ(nodes[4].kind, NodeKind::CLOSE);
    EXPECT_EQ(nodes[4].depth, 1u);

    EXPECT_EQ(nodes[5].name, "e");
    EXPECT_TRUE(nodes[5].self_closing);

    EXPECT_EQ(nodes[6].kind, NodeKind::CLOSE);
    EXPECT_EQ(nodes[6].depth, 0u);
}

TEST(MarkupTest, CdataAndComments) {
    auto nodes = parse("<r><!-- note --><d><![CDATA[a<b>&c]]></d></r>", Dialect::XML);
    ASSERT_EQ(nodes.size(), 6u);
    EXPECT_EQ(nodes[1].kind, NodeKind::COMMENT);
    EXPECT_EQ(nodes[1].text, " note ");
    EXPECT_EQ(nodes[3].kind, NodeKind::CDATA);
    EXPECT_EQ(nodes[3].text, "a<b>&c");
}

TEST(MarkupTest, CharacterReferences) {
    auto nodes = parse("<r>&#65;&#x42;&lt;&gt;&quot;&apos;</r>", Dialect::XML);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[1].text, "AB<>\"'");
}

TEST(MarkupTest, XmlRejectsMalformedDocuments) {
    EXPECT_THROW(parse("<a><b></a></b>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a x=1></a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a x></a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a x=\"1\" x=\"2\"></a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a>&nbsp;</a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a><!-- a -- b --></a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a></a><b></b>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a></a>tail", Dialect::XML), FormatError);
    EXPECT_THROW(parse("lead<a></a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a><![CDATA[x</a>", Dialect::XML), FormatError);
    EXPECT_THROW(parse("<a>&#0;</a>", Dialect::XML), FormatError);
}

TEST(MarkupTest, HtmlDoctypeVoidAndRawText) {
    const char* page =
        "<!DOCTYPE html>\n"
        "<HTML lang=\"en\"><head><meta charset=\"utf-8\">"
        "<style>a < b { }</style></head>"
        "<body><p hidden>x<br></p></body></html>";
    auto nodes = parse(page, Dialect::HTML);

    EXPECT_EQ(nodes[0].kind, NodeKind::DOCTYPE);
    EXPECT_EQ(nodes[1].name, "html");

    bool saw_meta = false, saw_style_text = false, saw_hidden = false;
    for (const auto& n : nodes) {
        if (n.kind == NodeKind::OPEN && n.name == "meta") {
            saw_meta = true;
            EXPECT_TRUE(n.self_closing);
        }
        if (n.kind == NodeKind::TEXT && n.text == "a < b { }") saw_style_text = true;
        if (n.kind == NodeKind::OPEN && n.name == "p") {
            saw_hidden = n.attribute("hidden") != nullptr;
        }
    }
    EXPECT_TRUE(saw_meta);
    EXPECT_TRUE(saw_style_text);
    EXPECT_TRUE(saw_hidden);
}

TEST(MarkupTest, HtmlRejections) {
    EXPECT_THROW(parse("<html></html>", Dialect::HTML), FormatError);
    EXPECT_THROW(parse("<!DOCTYPE html><html><div/></html>", Dialect::HTML), FormatError);
    EXPECT_THROW(parse("<!DOCTYPE html><html><![CDATA[x]]></html>", Dialect::HTML), FormatError);
    EXPECT_THROW(parse("<!DOCTYPE xhtml><html></html>", Dialect::HTML), FormatError);
}

TEST(MarkupTest, EscapeRoundTripsThroughParser) {
    std::string raw = "a&b<c>\"d\"";
    std::string doc = "<r v=\"" + escape(raw) + "\">" + escape(raw) + "</r>";
    auto nodes = parse(doc, Dialect::XML);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(*nodes[0].attribute("v"), raw);
    EXPECT_EQ(nodes[1].text, raw);
}
