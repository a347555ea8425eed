#include <gtest/gtest.h>

#include "lm/edit/markdown_parser.hpp"
#include "lm/preview/decoration_builder.hpp"

#include <algorithm>
#include <string>
#include <vector>

using lm::edit::MarkdownAnalyzer;
using lm::edit::MarkdownLineInfo;
using lm::edit::MarkdownLineKind;
using lm::edit::MarkdownParserState;
using lm::edit::MarkdownSpan;
using lm::edit::MarkdownSpanKind;
using lm::edit::MarkdownTreeProvider;
using lm::preview::SyntaxNode;
using lm::preview::SyntaxNodeKind;
using lm::text::EditTransaction;
using lm::text::TextDocument;
using lm::text::TextRange;

namespace
{

const MarkdownSpan *findSpanKind(const MarkdownLineInfo &info, MarkdownSpanKind kind)
{
    for (const auto &span : info.spans)
    {
        if (span.kind == kind)
            return &span;
    }
    return nullptr;
}

std::string numberedLines(std::size_t count)
{
    std::string text;
    for (std::size_t i = 0; i < count; ++i)
        text += "line " + std::to_string(i) + "\n";
    return text;
}

TextRange lineRange(const TextDocument &doc, std::size_t number)
{
    const auto line = doc.line(number);
    return TextRange{line.from, line.to};
}

bool hasNode(const std::vector<SyntaxNode> &nodes, SyntaxNode wanted)
{
    return std::find(nodes.begin(), nodes.end(), wanted) != nodes.end();
}

bool hasKind(const std::vector<SyntaxNode> &nodes, SyntaxNodeKind kind)
{
    return std::any_of(nodes.begin(), nodes.end(), [&](const SyntaxNode &node) { return node.kind == kind; });
}

} // namespace

TEST(MarkdownParser, DetectsHeadingsAndTasks)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;

    MarkdownLineInfo heading = analyzer.analyzeLine("## Heading", state);
    EXPECT_EQ(heading.kind, MarkdownLineKind::Heading);
    EXPECT_EQ(heading.headingLevel, 2);

    MarkdownLineInfo task = analyzer.analyzeLine("- [x] finish docs", state);
    EXPECT_EQ(task.kind, MarkdownLineKind::BulletListItem);
    EXPECT_TRUE(task.isTask);
    EXPECT_EQ(task.contentColumn, 6u);

    MarkdownLineInfo ordered = analyzer.analyzeLine("12. twelfth", state);
    EXPECT_EQ(ordered.kind, MarkdownLineKind::OrderedListItem);
    EXPECT_EQ(ordered.marker, "12.");
}

TEST(MarkdownParser, TracksCodeFences)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;

    MarkdownLineInfo fenceStart = analyzer.analyzeLine("```cpp", state);
    EXPECT_EQ(fenceStart.kind, MarkdownLineKind::CodeFenceStart);
    EXPECT_EQ(fenceStart.language, "cpp");
    EXPECT_TRUE(state.inFence);

    MarkdownLineInfo fenceBody = analyzer.analyzeLine("**not bold**", state);
    EXPECT_EQ(fenceBody.kind, MarkdownLineKind::FencedCode);
    EXPECT_TRUE(fenceBody.spans.empty());

    MarkdownLineInfo fenceEnd = analyzer.analyzeLine("```", state);
    EXPECT_EQ(fenceEnd.kind, MarkdownLineKind::CodeFenceEnd);
    EXPECT_FALSE(state.inFence);

    MarkdownParserState before = analyzer.computeStateBefore("text\n~~~\nstill code\n");
    EXPECT_TRUE(before.inFence);
    EXPECT_EQ(before.fenceMarker, "~~~");
    EXPECT_EQ(before.fenceStart, 5u);
}

TEST(MarkdownParser, IdentifiesInlineSpans)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;
    MarkdownLineInfo line = analyzer.analyzeLine("This has **bold** text and `code` plus [link](https://example.com)", state);

    const MarkdownSpan *bold = findSpanKind(line, MarkdownSpanKind::Bold);
    ASSERT_NE(bold, nullptr);
    EXPECT_EQ(bold->start, 9u);
    EXPECT_EQ(bold->end, 17u);

    const MarkdownSpan *code = findSpanKind(line, MarkdownSpanKind::Code);
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(line.spans.size(), 3u);

    const MarkdownSpan *link = findSpanKind(line, MarkdownSpanKind::Link);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->attribute, "https://example.com");
}

TEST(MarkdownParser, CodeSpansHideEmphasis)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;

    MarkdownLineInfo masked = analyzer.analyzeLine("`**not bold**`", state);
    ASSERT_EQ(masked.spans.size(), 1u);
    EXPECT_EQ(masked.spans[0].kind, MarkdownSpanKind::Code);

    MarkdownLineInfo unmatched = analyzer.analyzeLine("a ` b", state);
    EXPECT_TRUE(unmatched.spans.empty());
}

TEST(MarkdownParser, UnderscoresInsideWordsAreLiteral)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;

    EXPECT_TRUE(analyzer.analyzeLine("snake_case_name", state).spans.empty());

    MarkdownLineInfo emphasis = analyzer.analyzeLine("an _emphasised_ word", state);
    const MarkdownSpan *italic = findSpanKind(emphasis, MarkdownSpanKind::Italic);
    ASSERT_NE(italic, nullptr);
    EXPECT_EQ(italic->start, 3u);
    EXPECT_EQ(italic->end, 15u);
}

TEST(MarkdownParser, TripleDelimitersNestBoldInItalic)
{
    MarkdownAnalyzer analyzer;
    MarkdownParserState state;
    MarkdownLineInfo line = analyzer.analyzeLine("***x*** and ~~gone~~", state);

    const MarkdownSpan *both = findSpanKind(line, MarkdownSpanKind::BoldItalic);
    ASSERT_NE(both, nullptr);
    EXPECT_EQ(both->start, 0u);
    EXPECT_EQ(both->end, 7u);
    ASSERT_NE(findSpanKind(line, MarkdownSpanKind::Strikethrough), nullptr);

    TextDocument doc("***x***\nnext");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, TextRange{0, doc.length()});
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::Emphasis, 0, 7}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::StrongEmphasis, 1, 6}));
}

TEST(MarkdownTreeProvider, EmitsBlockAndListNodes)
{
    TextDocument doc("# Title\n\n- [ ] task\n- item\n\n> quote\n\n```\n**x**\n```\n");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, TextRange{0, doc.length()});

    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::Document, 0, doc.length()}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::ATXHeading1, 0, 7}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::BulletList, 9, 26}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::ListItem, 9, 19}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::ListItem, 20, 26}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::Blockquote, 28, 35}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::FencedCode, 37, 50}));
    EXPECT_FALSE(hasKind(nodes, SyntaxNodeKind::StrongEmphasis));

    for (std::size_t i = 1; i < nodes.size(); ++i)
        EXPECT_LE(nodes[i - 1].from, nodes[i].from);
}

TEST(MarkdownTreeProvider, RecognisesFenceAboveQueriedRange)
{
    TextDocument doc("```\n\n**x**\n```\nafter **y**");
    MarkdownTreeProvider provider;

    auto inside = provider.nodesInRange(doc, TextRange{5, 10});
    EXPECT_TRUE(hasNode(inside, {SyntaxNodeKind::FencedCode, 0, 14}));
    EXPECT_FALSE(hasKind(inside, SyntaxNodeKind::StrongEmphasis));

    auto after = provider.nodesInRange(doc, TextRange{15, doc.length()});
    EXPECT_TRUE(hasNode(after, {SyntaxNodeKind::StrongEmphasis, 21, 26}));
}

TEST(MarkdownTreeProvider, OnlyReturnsNodesTouchingRange)
{
    TextDocument doc("**a**\n\n**b**\n\n**c**");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, TextRange{7, 12});

    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::StrongEmphasis, 7, 12}));
    EXPECT_FALSE(hasNode(nodes, {SyntaxNodeKind::StrongEmphasis, 0, 5}));
    EXPECT_FALSE(hasNode(nodes, {SyntaxNodeKind::StrongEmphasis, 14, 19}));
}

TEST(MarkdownTreeProvider, DrivesLivePreviewDecorations)
{
    TextDocument doc("Some **bold** text\nnext");
    MarkdownTreeProvider provider;
    auto layer = lm::preview::buildMarkdownDecorations(doc, provider, TextRange{0, doc.length()}, doc.length());

    ASSERT_EQ(layer.size(), 3u);
    EXPECT_EQ(layer[0].range, (TextRange{5, 7}));
    EXPECT_EQ(layer[1].range, (TextRange{7, 11}));
    EXPECT_EQ(layer[1].styleClass, lm::preview::style::kBold);
    EXPECT_EQ(layer[2].range, (TextRange{11, 13}));

    EXPECT_TRUE(lm::preview::buildMarkdownDecorations(doc, provider, TextRange{0, doc.length()}, 3).empty());
}

TEST(MarkdownTreeProvider, AcceptsParenthesisOrderedMarkers)
{
    TextDocument doc("1) first\n2) second");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, TextRange{0, doc.length()});

    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::OrderedList, 0, doc.length()}));
    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::ListItem, 0, 8}));
}

TEST(MarkdownTreeProvider, NodesStopBeforeCarriageReturn)
{
    TextDocument doc("# Title\r\nnext");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, TextRange{0, doc.length()});

    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::ATXHeading1, 0, 7}));
}

TEST(MarkdownTreeProvider, WideningStopsAtHeading)
{
    TextDocument doc("# Head\none\ntwo\nthree");
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, lineRange(doc, 3));

    EXPECT_TRUE(hasNode(nodes, {SyntaxNodeKind::Paragraph, 7, doc.length()}));
    EXPECT_FALSE(hasKind(nodes, SyntaxNodeKind::ATXHeading1));
}

TEST(MarkdownTreeProvider, WideningIsCappedForLongParagraphs)
{
    TextDocument doc(numberedLines(300));
    MarkdownTreeProvider provider;
    auto nodes = provider.nodesInRange(doc, lineRange(doc, 200));

    const std::size_t expectedStart = doc.line(200 - MarkdownTreeProvider::kContextLines).from;
    auto paragraph = std::find_if(nodes.begin(), nodes.end(), [](const SyntaxNode &node) {
        return node.kind == SyntaxNodeKind::Paragraph;
    });
    ASSERT_NE(paragraph, nodes.end());
    EXPECT_EQ(paragraph->from, expectedStart);
    EXPECT_EQ(paragraph->to, doc.line(200 + MarkdownTreeProvider::kContextLines).to);
}

TEST(MarkdownTreeProvider, ReusesCheckpointsBeforeAnEdit)
{
    TextDocument doc(numberedLines(2000));
    MarkdownTreeProvider provider;
    provider.nodesInRange(doc, lineRange(doc, 1500));
    EXPECT_GT(provider.checkpointCount(), 1u);

    const std::size_t editAt = doc.line(1400).from;
    EditTransaction insert;
    insert.changes = {{editAt, editAt, "more "}};
    ASSERT_TRUE(doc.apply(insert));
    provider.invalidateFrom(editAt);

    const std::size_t before = provider.linesAnalyzed();
    auto nodes = provider.nodesInRange(doc, lineRange(doc, 1500));
    EXPECT_LT(provider.linesAnalyzed() - before, 300u);
    EXPECT_TRUE(hasKind(nodes, SyntaxNodeKind::Paragraph));
}

TEST(MarkdownTreeProvider, UnreportedEditsRescanFromTheTop)
{
    TextDocument doc("```\n" + numberedLines(200));
    MarkdownTreeProvider provider;
    EXPECT_TRUE(hasKind(provider.nodesInRange(doc, lineRange(doc, 150)), SyntaxNodeKind::FencedCode));

    // Closing the fence without reporting the edit must not reuse stale state.
    EditTransaction close;
    close.changes = {{0, 0, "```\n"}};
    ASSERT_TRUE(doc.apply(close));

    auto nodes = provider.nodesInRange(doc, lineRange(doc, 151));
    EXPECT_FALSE(hasKind(nodes, SyntaxNodeKind::FencedCode));
    EXPECT_TRUE(hasKind(nodes, SyntaxNodeKind::Paragraph));
}
