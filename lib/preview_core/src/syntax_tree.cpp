#include "lm/preview/syntax_tree.hpp"

#include <algorithm>

namespace lm::preview
{

int headingLevel(SyntaxNodeKind kind) noexcept
{
    switch (kind)
    {
    case SyntaxNodeKind::ATXHeading1:
        return 1;
    case SyntaxNodeKind::ATXHeading2:
        return 2;
    case SyntaxNodeKind::ATXHeading3:
        return 3;
    case SyntaxNodeKind::ATXHeading4:
        return 4;
    case SyntaxNodeKind::ATXHeading5:
        return 5;
    case SyntaxNodeKind::ATXHeading6:
        return 6;
    default:
        return 0;
    }
}

SyntaxNodeKind headingKind(int level) noexcept
{
    switch (level)
    {
    case 1:
        return SyntaxNodeKind::ATXHeading1;
    case 2:
        return SyntaxNodeKind::ATXHeading2;
    case 3:
        return SyntaxNodeKind::ATXHeading3;
    case 4:
        return SyntaxNodeKind::ATXHeading4;
    case 5:
        return SyntaxNodeKind::ATXHeading5;
    case 6:
        return SyntaxNodeKind::ATXHeading6;
    default:
        return SyntaxNodeKind::Other;
    }
}

std::string_view syntaxNodeKindName(SyntaxNodeKind kind) noexcept
{
    switch (kind)
    {
    case SyntaxNodeKind::Document:
        return "Document";
    case SyntaxNodeKind::ATXHeading1:
        return "ATXHeading1";
    case SyntaxNodeKind::ATXHeading2:
        return "ATXHeading2";
    case SyntaxNodeKind::ATXHeading3:
        return "ATXHeading3";
    case SyntaxNodeKind::ATXHeading4:
        return "ATXHeading4";
    case SyntaxNodeKind::ATXHeading5:
        return "ATXHeading5";
    case SyntaxNodeKind::ATXHeading6:
        return "ATXHeading6";
    case SyntaxNodeKind::StrongEmphasis:
        return "StrongEmphasis";
    case SyntaxNodeKind::Emphasis:
        return "Emphasis";
    case SyntaxNodeKind::Strikethrough:
        return "Strikethrough";
    case SyntaxNodeKind::InlineCode:
        return "InlineCode";
    case SyntaxNodeKind::Link:
        return "Link";
    case SyntaxNodeKind::HorizontalRule:
        return "HorizontalRule";
    case SyntaxNodeKind::Blockquote:
        return "Blockquote";
    case SyntaxNodeKind::BulletList:
        return "BulletList";
    case SyntaxNodeKind::OrderedList:
        return "OrderedList";
    case SyntaxNodeKind::ListItem:
        return "ListItem";
    case SyntaxNodeKind::Paragraph:
        return "Paragraph";
    case SyntaxNodeKind::FencedCode:
        return "FencedCode";
    default:
        return "Other";
    }
}

void sortSyntaxNodes(std::vector<SyntaxNode> &nodes)
{
    std::stable_sort(nodes.begin(), nodes.end(), [](const SyntaxNode &a, const SyntaxNode &b) {
        if (a.from != b.from)
            return a.from < b.from;
        return a.to > b.to;
    });
}

StaticSyntaxTree::StaticSyntaxTree(std::vector<SyntaxNode> nodes)
{
    setNodes(std::move(nodes));
}

void StaticSyntaxTree::setNodes(std::vector<SyntaxNode> nodes)
{
    allNodes = std::move(nodes);
    sortSyntaxNodes(allNodes);
}

std::vector<SyntaxNode> StaticSyntaxTree::nodesInRange(const text::TextSource &source, text::TextRange range)
{
    (void)source;
    std::vector<SyntaxNode> result;
    for (const auto &node : allNodes)
    {
        if (range.touches(text::TextRange{node.from, node.to}))
            result.push_back(node);
    }
    return result;
}

} // namespace lm::preview
