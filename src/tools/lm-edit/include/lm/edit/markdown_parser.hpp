#pragma once

#include "lm/preview/syntax_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::edit
{

enum class MarkdownLineKind
{
    Blank,
    Heading,
    BlockQuote,
    BulletListItem,
    OrderedListItem,
    CodeFenceStart,
    CodeFenceEnd,
    FencedCode,
    IndentedCode,
    HorizontalRule,
    Paragraph
};

enum class MarkdownSpanKind
{
    Bold,
    Italic,
    BoldItalic,
    Strikethrough,
    Code,
    Link,
    Image
};

// Columns cover the outer delimiters: "**bold**" spans all eight bytes.
struct MarkdownSpan
{
    MarkdownSpanKind kind = MarkdownSpanKind::Bold;
    std::size_t start = 0;
    std::size_t end = 0;
    std::string attribute;
};

struct MarkdownLineInfo
{
    MarkdownLineKind kind = MarkdownLineKind::Paragraph;
    int headingLevel = 0;
    bool isTask = false;
    bool inFence = false;
    std::size_t indent = 0;
    std::size_t contentColumn = 0;
    std::string marker;
    std::string language;
    std::vector<MarkdownSpan> spans;
};

struct MarkdownParserState
{
    bool inFence = false;
    std::string fenceMarker;
    std::string fenceLanguage;
    std::size_t fenceStart = 0;
};

class MarkdownAnalyzer
{
public:
    MarkdownAnalyzer() = default;

    MarkdownParserState computeStateBefore(const std::string &text) const;
    MarkdownLineInfo analyzeLine(const std::string &line, MarkdownParserState &state) const;

private:
    static bool isHorizontalRule(std::string_view trimmed) noexcept;
    static std::string trim(std::string_view view);
    MarkdownLineInfo analyzeFencedState(const std::string &line, MarkdownParserState &state) const;
    void parseInline(std::string_view content, std::size_t column, MarkdownLineInfo &info) const;
    void parseCodeSpans(std::string_view line, std::vector<MarkdownSpan> &spans) const;
    void parseEmphasis(std::string_view line, std::vector<MarkdownSpan> &spans) const;
    void parseLinksAndImages(std::string_view line, std::vector<MarkdownSpan> &spans) const;
};

// Line-oriented syntax tree for the live preview. A query analyses the
// lines of the queried range plus at most kContextLines of block context on
// either side. The fence state above them comes from checkpoints taken every
// kCheckpointInterval lines.
class MarkdownTreeProvider : public preview::SyntaxTreeProvider
{
public:
    static constexpr std::size_t kContextLines = 50;
    static constexpr std::size_t kCheckpointInterval = 64;

    std::vector<preview::SyntaxNode> nodesInRange(const text::TextSource &source, text::TextRange range) override;

    // Reports an edit starting at offset. Checkpoints at or before it stay
    // valid across the next revision; without a report a new revision
    // discards all of them.
    void invalidateFrom(std::size_t offset) noexcept;

    std::size_t linesAnalyzed() const noexcept { return analyzedLines; }
    std::size_t checkpointCount() const noexcept { return checkpoints.size(); }

private:
    struct Checkpoint
    {
        std::size_t from = 0;
        MarkdownParserState state;
    };

    MarkdownParserState stateBefore(const text::TextSource &source, const text::LineInfo &line);
    void syncRevision(const text::TextSource &source);

    MarkdownAnalyzer analyzer;
    bool cacheValid = false;
    std::uint64_t cachedRevision = 0;
    std::optional<std::size_t> editedFrom;
    std::vector<Checkpoint> checkpoints;
    std::size_t analyzedLines = 0;
};

} // namespace lm::edit
