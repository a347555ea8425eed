#include <gtest/gtest.h>

#include "lm/wiki/wiki_links.hpp"

#include <string>
#include <vector>

using lm::preview::DecorationKind;
using lm::preview::DecorationLayer;
using lm::preview::WidgetKind;
using lm::text::TextDocument;
using lm::text::TextRange;
using lm::wiki::WikiLinkMatch;

namespace style = lm::preview::style;

namespace
{

const std::string kLinkLine = "See [[My Note|here]] for details";

} // namespace

TEST(WikiLinks, ScansTitleAndDisplay)
{
    auto matches = lm::wiki::scanWikiLinks("[[a]] and [[ b | c ]]");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0], (WikiLinkMatch{0, 5, "a", "a"}));
    EXPECT_EQ(matches[1].title, "b");
    EXPECT_EQ(matches[1].display, "c");
    EXPECT_EQ(matches[1].from, 10u);
}

TEST(WikiLinks, IgnoresMalformedLinks)
{
    EXPECT_TRUE(lm::wiki::scanWikiLinks("[[]]").empty());
    EXPECT_TRUE(lm::wiki::scanWikiLinks("[[open").empty());
    EXPECT_TRUE(lm::wiki::scanWikiLinks("[[half]").empty());
    EXPECT_TRUE(lm::wiki::scanWikiLinks("[[  ]]").empty());
}

TEST(WikiLinks, FirstClosingPairEndsLink)
{
    auto matches = lm::wiki::scanWikiLinks("[[a]]b]]", 100);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].from, 100u);
    EXPECT_EQ(matches[0].to, 105u);
}

TEST(WikiLinks, BlankDisplayFallsBackToTitle)
{
    auto matches = lm::wiki::scanWikiLinks("[[x| ]]");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].display, "x");
}

TEST(WikiLinks, RendersWidgetAwayFromCaret)
{
    TextDocument doc(kLinkLine + "\nnext");
    DecorationLayer layer = lm::wiki::buildWikiLinkDecorations(doc, TextRange{0, doc.length()}, doc.length());

    ASSERT_EQ(layer.size(), 1u);
    EXPECT_EQ(layer[0].kind, DecorationKind::ReplaceWithWidget);
    EXPECT_EQ(layer[0].range, (TextRange{4, 20}));
    ASSERT_TRUE(layer[0].widget.has_value());
    EXPECT_EQ(layer[0].widget->kind, WidgetKind::WikiLink);
    EXPECT_EQ(layer[0].widget->title, "My Note");
    EXPECT_EQ(lm::preview::renderText(*layer[0].widget), "here");
}

TEST(WikiLinks, MarksBracketsOnCaretLine)
{
    TextDocument doc(kLinkLine + "\nnext");
    DecorationLayer layer = lm::wiki::buildWikiLinkDecorations(doc, TextRange{0, doc.length()}, 8);

    ASSERT_EQ(layer.size(), 3u);
    for (const auto &instruction : layer)
        EXPECT_EQ(instruction.kind, DecorationKind::Mark);
    EXPECT_EQ(layer[0].range, (TextRange{4, 6}));
    EXPECT_EQ(layer[0].styleClass, style::kWikiLinkBracket);
    EXPECT_EQ(layer[1].range, (TextRange{6, 18}));
    EXPECT_EQ(layer[1].styleClass, style::kWikiLink);
    EXPECT_EQ(layer[2].range, (TextRange{18, 20}));
    EXPECT_EQ(layer[2].styleClass, style::kWikiLinkBracket);
}

TEST(WikiLinks, ScansOnlyViewportLines)
{
    TextDocument doc("[[One]]\n[[Two]]\n[[Three]]");
    DecorationLayer layer = lm::wiki::buildWikiLinkDecorations(doc, TextRange{8, 15}, 0);

    ASSERT_EQ(layer.size(), 1u);
    EXPECT_EQ(layer[0].widget->title, "Two");
}

TEST(WikiLinks, ResolvesFromWidgetOrLineText)
{
    TextDocument doc(kLinkLine);
    DecorationLayer rendered = lm::wiki::buildWikiLinkDecorations(doc, TextRange{0, doc.length()}, 100);

    EXPECT_EQ(lm::wiki::resolveWikiLinkAt(doc, rendered, 10), "My Note");
    EXPECT_EQ(lm::wiki::resolveWikiLinkAt(doc, DecorationLayer{}, 10), "My Note");
    EXPECT_FALSE(lm::wiki::resolveWikiLinkAt(doc, DecorationLayer{}, 25).has_value());
}

TEST(WikiLinks, ExtractsDistinctTitlesInOrder)
{
    auto titles = lm::wiki::extractWikiLinks("[[B]] [[A]]\n[[B]] [[C|see]]\n");
    EXPECT_EQ(titles, (std::vector<std::string>{"B", "A", "C"}));
}
