#include <gtest/gtest.h>

#include "lm/preview/decoration_builder.hpp"

#include <string>
#include <vector>

using lm::preview::DecorationKind;
using lm::preview::DecorationLayer;
using lm::preview::StaticSyntaxTree;
using lm::preview::SyntaxNode;
using lm::preview::SyntaxNodeKind;
using lm::preview::WidgetKind;
using lm::text::TextDocument;
using lm::text::TextRange;

namespace style = lm::preview::style;

namespace
{

DecorationLayer build(const TextDocument &doc, std::vector<SyntaxNode> nodes, std::size_t caret)
{
    StaticSyntaxTree tree(std::move(nodes));
    return lm::preview::buildMarkdownDecorations(doc, tree, TextRange{0, doc.length()}, caret);
}

std::size_t countKind(const DecorationLayer &layer, DecorationKind kind)
{
    std::size_t count = 0;
    for (const auto &instruction : layer)
    {
        if (instruction.kind == kind)
            ++count;
    }
    return count;
}

} // namespace

TEST(DecorationBuilder, HidesBoldMarkersAwayFromCaret)
{
    TextDocument doc("**bold**\nnext line");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::StrongEmphasis, 0, 8}}, 12);

    ASSERT_EQ(layer.size(), 3u);
    EXPECT_EQ(layer[0].kind, DecorationKind::Hide);
    EXPECT_EQ(layer[0].range, (TextRange{0, 2}));
    EXPECT_EQ(layer[1].kind, DecorationKind::Mark);
    EXPECT_EQ(layer[1].range, (TextRange{2, 6}));
    EXPECT_EQ(layer[1].styleClass, style::kBold);
    EXPECT_EQ(layer[2].range, (TextRange{6, 8}));
}

TEST(DecorationBuilder, LeavesCaretLineRaw)
{
    TextDocument doc("**bold**\nnext line");
    EXPECT_TRUE(build(doc, {{SyntaxNodeKind::StrongEmphasis, 0, 8}}, 4).empty());
    EXPECT_TRUE(build(doc, {{SyntaxNodeKind::StrongEmphasis, 0, 8}}, 8).empty());
}

TEST(DecorationBuilder, DecoratesHeadingsByLevel)
{
    TextDocument doc("## Title\nbody");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::ATXHeading2, 0, 8}}, 12);

    ASSERT_EQ(layer.size(), 2u);
    EXPECT_EQ(layer[0].range, (TextRange{0, 3}));
    EXPECT_EQ(layer[1].range, (TextRange{3, 8}));
    EXPECT_EQ(layer[1].styleClass, "lm-heading-2");
}

TEST(DecorationBuilder, HeadingMarkExcludesCarriageReturn)
{
    TextDocument doc("# Title\r\nbody");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::ATXHeading1, 0, 8}}, 12);

    ASSERT_EQ(layer.size(), 2u);
    EXPECT_EQ(layer[0].range, (TextRange{0, 2}));
    EXPECT_EQ(layer[1].range, (TextRange{2, 7}));
}

TEST(DecorationBuilder, SkipsDegenerateAndUnterminatedSpans)
{
    TextDocument doc("****\n**bold\n``\nend");
    DecorationLayer layer = build(doc,
                                  {{SyntaxNodeKind::StrongEmphasis, 0, 4},
                                   {SyntaxNodeKind::StrongEmphasis, 5, 11},
                                   {SyntaxNodeKind::InlineCode, 12, 14}},
                                  17);
    EXPECT_TRUE(layer.empty());
}

TEST(DecorationBuilder, ShowsOnlyLinkText)
{
    TextDocument doc("[site](http://x)\n");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::Link, 0, 16}}, 17);

    ASSERT_EQ(layer.size(), 3u);
    EXPECT_EQ(layer[0].range, (TextRange{0, 1}));
    EXPECT_EQ(layer[1].range, (TextRange{1, 5}));
    EXPECT_EQ(layer[1].styleClass, style::kLink);
    EXPECT_EQ(layer[2].kind, DecorationKind::Hide);
    EXPECT_EQ(layer[2].range, (TextRange{5, 16}));
}

TEST(DecorationBuilder, StylesInlineCodeAndStrikethrough)
{
    TextDocument doc("`x` ~~old~~\n");
    DecorationLayer layer = build(doc,
                                  {{SyntaxNodeKind::InlineCode, 0, 3}, {SyntaxNodeKind::Strikethrough, 4, 11}},
                                  12);

    ASSERT_EQ(layer.size(), 6u);
    EXPECT_EQ(layer[1].range, (TextRange{1, 2}));
    EXPECT_EQ(layer[1].styleClass, style::kCode);
    EXPECT_EQ(layer[4].range, (TextRange{6, 9}));
    EXPECT_EQ(layer[4].styleClass, style::kStrikethrough);
}

TEST(DecorationBuilder, ReplacesHorizontalRuleWithWidget)
{
    TextDocument doc("---\ntext");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::HorizontalRule, 0, 3}}, 6);

    ASSERT_EQ(layer.size(), 1u);
    EXPECT_EQ(layer[0].kind, DecorationKind::ReplaceWithWidget);
    EXPECT_EQ(layer[0].widget->kind, WidgetKind::HorizontalRule);
}

TEST(DecorationBuilder, DecoratesEveryBlockquoteLine)
{
    TextDocument doc("> quoted\n> more\ntail");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::Blockquote, 0, 15}}, 18);

    ASSERT_EQ(layer.size(), 4u);
    EXPECT_TRUE(layer[0].lineLevel);
    EXPECT_EQ(layer[0].styleClass, style::kBlockquoteLine);
    EXPECT_EQ(layer[1].range, (TextRange{0, 2}));
    EXPECT_TRUE(layer[2].lineLevel);
    EXPECT_EQ(layer[2].range.from, 9u);
    EXPECT_EQ(layer[3].range, (TextRange{9, 11}));
}

TEST(DecorationBuilder, ReplacesListMarkersOnly)
{
    TextDocument doc("- [x] done\n- plain\n3. third\nend");
    DecorationLayer layer = build(doc,
                                  {{SyntaxNodeKind::ListItem, 0, 10},
                                   {SyntaxNodeKind::ListItem, 11, 18},
                                   {SyntaxNodeKind::ListItem, 19, 27}},
                                  30);

    ASSERT_EQ(layer.size(), 4u);
    EXPECT_TRUE(layer[0].lineLevel);
    EXPECT_EQ(layer[0].styleClass, style::kTaskChecked);

    EXPECT_EQ(layer[1].range, (TextRange{0, 6}));
    EXPECT_EQ(layer[1].widget->kind, WidgetKind::Checkbox);
    EXPECT_TRUE(layer[1].widget->checked);
    EXPECT_EQ(layer[1].widget->anchor, 0u);

    EXPECT_EQ(layer[2].range, (TextRange{11, 13}));
    EXPECT_EQ(layer[2].widget->markerStyle, lm::preview::ListMarkerStyle::Bullet);

    EXPECT_EQ(layer[3].range, (TextRange{19, 22}));
    EXPECT_EQ(layer[3].widget->ordinal, 3u);
    EXPECT_EQ(countKind(layer, DecorationKind::ReplaceWithWidget), 3u);
}

TEST(DecorationBuilder, ReplacesParenthesisOrderedMarker)
{
    TextDocument doc("1) first\nend");
    DecorationLayer layer = build(doc, {{SyntaxNodeKind::ListItem, 0, 8}}, 11);

    ASSERT_EQ(layer.size(), 1u);
    EXPECT_EQ(layer[0].range, (TextRange{0, 3}));
    EXPECT_EQ(layer[0].widget->kind, WidgetKind::ListMarker);
    EXPECT_EQ(layer[0].widget->ordinal, 1u);
}

TEST(DecorationBuilder, VisitsOnlyViewportNodes)
{
    TextDocument doc("**a**\n\n**b**\n\n**c**");
    StaticSyntaxTree tree({{SyntaxNodeKind::StrongEmphasis, 0, 5},
                           {SyntaxNodeKind::StrongEmphasis, 7, 12},
                           {SyntaxNodeKind::StrongEmphasis, 14, 19}});

    DecorationLayer layer = lm::preview::buildMarkdownDecorations(doc, tree, TextRange{7, 12}, 0);
    ASSERT_EQ(layer.size(), 3u);
    for (const auto &instruction : layer)
    {
        EXPECT_GE(instruction.range.from, 7u);
        EXPECT_LE(instruction.range.to, 12u);
    }
}

TEST(DecorationBuilder, IsSortedAndIdempotent)
{
    TextDocument doc("# Head\n> **quote** and `code`\n- [ ] task with *em*\n\n---\nlast");
    std::vector<SyntaxNode> nodes{{SyntaxNodeKind::ATXHeading1, 0, 6},
                                  {SyntaxNodeKind::Blockquote, 7, 29},
                                  {SyntaxNodeKind::StrongEmphasis, 9, 18},
                                  {SyntaxNodeKind::InlineCode, 23, 29},
                                  {SyntaxNodeKind::ListItem, 30, 50},
                                  {SyntaxNodeKind::Emphasis, 46, 50},
                                  {SyntaxNodeKind::HorizontalRule, 52, 55}};
    StaticSyntaxTree tree(nodes);
    const TextRange viewport{0, doc.length()};

    DecorationLayer first = lm::preview::buildMarkdownDecorations(doc, tree, viewport, doc.length());
    DecorationLayer second = lm::preview::buildMarkdownDecorations(doc, tree, viewport, doc.length());

    EXPECT_FALSE(first.empty());
    EXPECT_TRUE(lm::preview::isSortedLayer(first));
    EXPECT_EQ(first, second);

    for (const auto &instruction : first)
    {
        bool insideNode = false;
        for (const auto &node : nodes)
        {
            if (instruction.range.from >= node.from && instruction.range.to <= node.to)
                insideNode = true;
        }
        EXPECT_TRUE(insideNode);
    }
}
