#include "lm/preview/decoration_builder.hpp"

#include "lm/preview/line_patterns.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace lm::preview
{
namespace
{
bool startsWith(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::size_t runLength(std::string_view text, char ch) noexcept
{
    std::size_t count = 0;
    while (count < text.size() && text[count] == ch)
        ++count;
    return count;
}

void decorateDelimited(const SyntaxNode &node, std::size_t delimiter, std::string_view styleClass, DecorationLayer &out)
{
    out.push_back(hideRange(node.from, node.from + delimiter));
    out.push_back(markRange(node.from + delimiter, node.to - delimiter, styleClass));
    out.push_back(hideRange(node.to - delimiter, node.to));
}

void decorateHeading(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    std::size_t prefix = headingPrefixLength(text);
    if (prefix == 0)
        return;
    std::size_t contentStart = node.from + prefix;
    std::size_t contentEnd = node.to;
    while (contentEnd > contentStart && text[contentEnd - node.from - 1] == '\r')
        --contentEnd;
    if (contentStart >= contentEnd)
        return;
    out.push_back(hideRange(node.from, contentStart));
    out.push_back(markRange(contentStart, contentEnd, style::headingClass(headingLevel(node.kind))));
}

void decorateStrong(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    if (text.size() <= 4)
        return;
    bool stars = startsWith(text, "**") && endsWith(text, "**");
    bool underscores = startsWith(text, "__") && endsWith(text, "__");
    if (stars || underscores)
        decorateDelimited(node, 2, style::kBold, out);
}

void decorateEmphasis(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    if (text.size() <= 2)
        return;
    char open = text.front();
    if ((open == '*' || open == '_') && text.back() == open)
        decorateDelimited(node, 1, style::kItalic, out);
}

void decorateStrikethrough(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    if (text.size() > 4 && startsWith(text, "~~") && endsWith(text, "~~"))
        decorateDelimited(node, 2, style::kStrikethrough, out);
}

void decorateInlineCode(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    std::size_t ticks = std::min<std::size_t>(runLength(text, '`'), 2);
    if (ticks == 0 || text.size() <= ticks * 2)
        return;
    if (!endsWith(text, std::string(ticks, '`')))
        return;
    decorateDelimited(node, ticks, style::kCode, out);
}

// [text](target) with non-empty text and target and nothing around it.
void decorateLink(std::string_view text, const SyntaxNode &node, DecorationLayer &out)
{
    if (text.size() < 5 || text.front() != '[' || text.back() != ')')
        return;
    std::size_t close = text.find(']');
    if (close == std::string_view::npos || close < 2)
        return;
    if (close + 1 >= text.size() || text[close + 1] != '(')
        return;
    std::string_view target = text.substr(close + 2, text.size() - close - 3);
    if (target.empty() || target.find(')') != std::string_view::npos)
        return;
    out.push_back(hideRange(node.from, node.from + 1));
    out.push_back(markRange(node.from + 1, node.from + close, style::kLink));
    out.push_back(hideRange(node.from + close, node.to));
}

void decorateBlockquote(const text::TextSource &source, const SyntaxNode &node, DecorationLayer &out)
{
    text::LineInfo line = source.lineAt(node.from);
    const text::LineInfo last = source.lineAt(node.to);
    while (true)
    {
        std::string lineText = source.lineText(line);
        if (auto prefix = matchQuotePrefix(lineText))
        {
            std::size_t start = std::max(line.from, node.from);
            std::size_t end = std::min(line.from + *prefix, node.to);
            out.push_back(lineClass(start, style::kBlockquoteLine));
            if (end > start)
                out.push_back(hideRange(start, end));
        }
        if (line.number >= last.number || line.to >= source.length())
            break;
        line = source.lineAt(line.to + 1);
    }
}

void decorateListItem(const text::TextSource &source, const SyntaxNode &node, DecorationLayer &out)
{
    const text::LineInfo line = source.lineAt(node.from);
    auto match = matchListMarker(source.lineText(line));
    if (!match)
        return;
    std::size_t from = std::max(line.from + match->markerStart, node.from);
    std::size_t to = std::min(line.from + match->markerEnd, node.to);
    if (to <= from)
        return;

    switch (match->kind)
    {
    case ListMarkerKind::Task:
        out.push_back(replaceWithWidget(from, to, Widget::checkbox(match->checked, line.from)));
        if (match->checked)
            out.push_back(lineClass(std::max(line.from, node.from), style::kTaskChecked));
        break;
    case ListMarkerKind::Bullet:
        out.push_back(replaceWithWidget(from, to, Widget::bullet()));
        break;
    case ListMarkerKind::Ordered:
        out.push_back(replaceWithWidget(from, to, Widget::ordinalMarker(match->ordinal)));
        break;
    }
}

bool isDecorated(SyntaxNodeKind kind) noexcept
{
    switch (kind)
    {
    case SyntaxNodeKind::Document:
    case SyntaxNodeKind::BulletList:
    case SyntaxNodeKind::OrderedList:
    case SyntaxNodeKind::Paragraph:
    case SyntaxNodeKind::FencedCode:
    case SyntaxNodeKind::Other:
        return false;
    default:
        return true;
    }
}

} // namespace

bool caretTouchesLines(const text::TextSource &source, std::size_t from, std::size_t to, std::size_t caret)
{
    const std::size_t lineStart = source.lineAt(from).from;
    const std::size_t lineEnd = source.lineAt(to).to;
    return caret >= lineStart && caret <= lineEnd;
}

void decorateNode(const text::TextSource &source, const SyntaxNode &node, DecorationLayer &out)
{
    if (node.to <= node.from || node.to > source.length())
        return;

    switch (node.kind)
    {
    case SyntaxNodeKind::Blockquote:
        decorateBlockquote(source, node, out);
        return;
    case SyntaxNodeKind::ListItem:
        decorateListItem(source, node, out);
        return;
    case SyntaxNodeKind::HorizontalRule:
        out.push_back(replaceWithWidget(node.from, node.to, Widget::horizontalRule()));
        return;
    default:
        break;
    }

    const std::string text = source.slice(node.from, node.to);
    if (headingLevel(node.kind) > 0)
    {
        decorateHeading(text, node, out);
        return;
    }

    switch (node.kind)
    {
    case SyntaxNodeKind::StrongEmphasis:
        decorateStrong(text, node, out);
        break;
    case SyntaxNodeKind::Emphasis:
        decorateEmphasis(text, node, out);
        break;
    case SyntaxNodeKind::Strikethrough:
        decorateStrikethrough(text, node, out);
        break;
    case SyntaxNodeKind::InlineCode:
        decorateInlineCode(text, node, out);
        break;
    case SyntaxNodeKind::Link:
        decorateLink(text, node, out);
        break;
    default:
        break;
    }
}

DecorationLayer buildMarkdownDecorations(const text::TextSource &source,
                                         SyntaxTreeProvider &tree,
                                         text::TextRange viewport,
                                         std::size_t caret)
{
    DecorationLayer layer;
    for (const auto &node : tree.nodesInRange(source, viewport))
    {
        if (!isDecorated(node.kind))
            continue;
        if (caretTouchesLines(source, node.from, node.to, caret))
            continue;
        decorateNode(source, node, layer);
    }
    normalizeLayer(layer);
    return layer;
}

} // namespace lm::preview
