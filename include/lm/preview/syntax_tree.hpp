#pragma once

#include "lm/text/text_document.hpp"

#include <string_view>
#include <vector>

namespace lm::preview
{

enum class SyntaxNodeKind
{
    Document,
    ATXHeading1,
    ATXHeading2,
    ATXHeading3,
    ATXHeading4,
    ATXHeading5,
    ATXHeading6,
    StrongEmphasis,
    Emphasis,
    Strikethrough,
    InlineCode,
    Link,
    HorizontalRule,
    Blockquote,
    BulletList,
    OrderedList,
    ListItem,
    Paragraph,
    FencedCode,
    Other
};

struct SyntaxNode
{
    SyntaxNodeKind kind = SyntaxNodeKind::Other;
    std::size_t from = 0;
    std::size_t to = 0;

    bool operator==(const SyntaxNode &) const = default;
};

int headingLevel(SyntaxNodeKind kind) noexcept;
SyntaxNodeKind headingKind(int level) noexcept;
std::string_view syntaxNodeKindName(SyntaxNodeKind kind) noexcept;

// Parents sort before their children: by from ascending, then to descending.
void sortSyntaxNodes(std::vector<SyntaxNode> &nodes);

class SyntaxTreeProvider
{
public:
    virtual ~SyntaxTreeProvider() = default;

    // Every node touching range, sorted with sortSyntaxNodes().
    virtual std::vector<SyntaxNode> nodesInRange(const text::TextSource &source, text::TextRange range) = 0;
};

class StaticSyntaxTree : public SyntaxTreeProvider
{
public:
    StaticSyntaxTree() = default;
    explicit StaticSyntaxTree(std::vector<SyntaxNode> nodes);

    void setNodes(std::vector<SyntaxNode> nodes);
    const std::vector<SyntaxNode> &nodes() const noexcept { return allNodes; }

    std::vector<SyntaxNode> nodesInRange(const text::TextSource &source, text::TextRange range) override;

private:
    std::vector<SyntaxNode> allNodes;
};

} // namespace lm::preview
