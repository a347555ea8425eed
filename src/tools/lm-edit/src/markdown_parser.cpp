#include "lm/edit/markdown_parser.hpp"

#include <algorithm>
#include <cctype>

namespace lm::edit
{
namespace
{
using preview::SyntaxNode;
using preview::SyntaxNodeKind;

// Stands in for bytes that inline parsing must not look at again (code
// span contents, link targets). Neither whitespace nor a delimiter.
constexpr char kMasked = '\x01';

bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

bool isAlphaNumeric(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

std::size_t leadingWhitespace(std::string_view line) noexcept
{
    std::size_t count = 0;
    while (count < line.size() && (line[count] == ' ' || line[count] == '\t'))
        ++count;
    return count;
}

void mask(std::string &line, std::size_t start, std::size_t end)
{
    end = std::min(end, line.size());
    for (std::size_t i = start; i < end; ++i)
        line[i] = kMasked;
}

struct AnalyzedLine
{
    text::LineInfo line;
    MarkdownLineInfo info;
};

bool isBlankLine(std::string_view line) noexcept
{
    return std::all_of(line.begin(), line.end(), isWhitespace);
}

bool startsWithRun(std::string_view text, char ch) noexcept
{
    return text.size() >= 3 && text[0] == ch && text[1] == ch && text[2] == ch;
}

// Lines that end the backward search for a block start.
bool startsBlock(std::string_view line) noexcept
{
    const std::size_t indent = leadingWhitespace(line);
    if (isBlankLine(line.substr(indent)))
        return true;
    const std::string_view rest = line.substr(indent);
    return rest.front() == '#' || startsWithRun(rest, '`') || startsWithRun(rest, '~');
}

bool isFenceLine(MarkdownLineKind kind) noexcept
{
    return kind == MarkdownLineKind::CodeFenceStart || kind == MarkdownLineKind::FencedCode ||
           kind == MarkdownLineKind::CodeFenceEnd;
}

void appendInlineNodes(const AnalyzedLine &entry, std::vector<SyntaxNode> &nodes)
{
    const std::size_t base = entry.line.from;
    for (const auto &span : entry.info.spans)
    {
        const std::size_t from = base + span.start;
        const std::size_t to = base + span.end;
        switch (span.kind)
        {
        case MarkdownSpanKind::Bold:
            nodes.push_back({SyntaxNodeKind::StrongEmphasis, from, to});
            break;
        case MarkdownSpanKind::Italic:
            nodes.push_back({SyntaxNodeKind::Emphasis, from, to});
            break;
        case MarkdownSpanKind::BoldItalic:
            nodes.push_back({SyntaxNodeKind::Emphasis, from, to});
            nodes.push_back({SyntaxNodeKind::StrongEmphasis, from + 1, to - 1});
            break;
        case MarkdownSpanKind::Strikethrough:
            nodes.push_back({SyntaxNodeKind::Strikethrough, from, to});
            break;
        case MarkdownSpanKind::Code:
            nodes.push_back({SyntaxNodeKind::InlineCode, from, to});
            break;
        case MarkdownSpanKind::Link:
            nodes.push_back({SyntaxNodeKind::Link, from, to});
            break;
        case MarkdownSpanKind::Image:
            break;
        }
    }
}

} // namespace

MarkdownParserState MarkdownAnalyzer::computeStateBefore(const std::string &text) const
{
    MarkdownParserState state;
    std::size_t offset = 0;
    while (offset < text.size())
    {
        const std::size_t lineStart = offset;
        std::size_t end = text.find('\n', offset);
        std::string line;
        if (end == std::string::npos)
        {
            line = text.substr(offset);
            offset = text.size();
        }
        else
        {
            line = text.substr(offset, end - offset);
            offset = end + 1;
        }
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (analyzeLine(line, state).kind == MarkdownLineKind::CodeFenceStart)
            state.fenceStart = lineStart;
    }
    return state;
}

MarkdownLineInfo MarkdownAnalyzer::analyzeLine(const std::string &line, MarkdownParserState &state) const
{
    if (state.inFence)
        return analyzeFencedState(line, state);

    MarkdownLineInfo info;
    info.indent = leadingWhitespace(line);
    const std::string trimmed = trim(line);
    if (trimmed.empty())
    {
        info.kind = MarkdownLineKind::Blank;
        return info;
    }

    if (trimmed.size() >= 3)
    {
        const char c = trimmed.front();
        if (c == '`' || c == '~')
        {
            std::size_t count = 0;
            while (count < trimmed.size() && trimmed[count] == c)
                ++count;
            const std::string rest = trim(std::string_view(trimmed).substr(count));
            if (count >= 3 && !(c == '`' && rest.find('`') != std::string::npos))
            {
                info.kind = MarkdownLineKind::CodeFenceStart;
                info.inFence = true;
                info.language = rest;
                state.inFence = true;
                state.fenceMarker = std::string(count, c);
                state.fenceLanguage = rest;
                return info;
            }
        }
    }

    int spaceCount = 0;
    for (char ch : line)
    {
        if (ch == ' ')
            ++spaceCount;
        else if (ch == '\t')
            spaceCount += 4;
        else
            break;
    }
    if (spaceCount >= 4 && trimmed.front() != '-' && trimmed.front() != '*' && trimmed.front() != '+' &&
        !std::isdigit(static_cast<unsigned char>(trimmed.front())))
    {
        info.kind = MarkdownLineKind::IndentedCode;
        return info;
    }

    if (trimmed.front() == '>')
    {
        info.kind = MarkdownLineKind::BlockQuote;
        std::size_t column = info.indent;
        while (column < line.size() && (line[column] == '>' || line[column] == ' ' || line[column] == '\t'))
            ++column;
        info.contentColumn = column;
        parseInline(std::string_view(line).substr(column), column, info);
        return info;
    }

    if (trimmed.front() == '#')
    {
        std::size_t level = 0;
        while (level < trimmed.size() && trimmed[level] == '#')
            ++level;
        if (level <= 6 && (trimmed.size() == level || trimmed[level] == ' '))
        {
            info.kind = MarkdownLineKind::Heading;
            info.headingLevel = static_cast<int>(level);
            std::size_t column = std::min(info.indent + level + 1, line.size());
            info.contentColumn = column;
            parseInline(std::string_view(line).substr(column), column, info);
            return info;
        }
    }

    if (isHorizontalRule(trimmed))
    {
        info.kind = MarkdownLineKind::HorizontalRule;
        return info;
    }

    bool isBullet = false;
    bool isOrdered = false;
    const char first = trimmed.front();
    if (first == '-' || first == '*' || first == '+')
    {
        if (trimmed.size() == 1 || trimmed[1] == ' ')
        {
            isBullet = true;
            info.marker.push_back(first);
        }
    }
    else
    {
        std::size_t pos = 0;
        while (pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[pos])))
            ++pos;
        if (pos > 0 && pos < trimmed.size() && (trimmed[pos] == '.' || trimmed[pos] == ')') &&
            (pos + 1 == trimmed.size() || trimmed[pos + 1] == ' '))
        {
            isOrdered = true;
            info.marker = trimmed.substr(0, pos + 1);
        }
    }

    if (isBullet || isOrdered)
    {
        info.kind = isOrdered ? MarkdownLineKind::OrderedListItem : MarkdownLineKind::BulletListItem;
        std::size_t column = info.indent + info.marker.size();
        while (column < line.size() && line[column] == ' ')
            ++column;
        std::string_view rest = std::string_view(line).substr(column);
        if (rest.size() >= 3 && rest[0] == '[' && rest[2] == ']' &&
            (rest[1] == ' ' || rest[1] == 'x' || rest[1] == 'X') && (rest.size() == 3 || rest[3] == ' '))
        {
            info.isTask = true;
            column = std::min(column + 4, line.size());
        }
        info.contentColumn = column;
        parseInline(std::string_view(line).substr(column), column, info);
        return info;
    }

    info.kind = MarkdownLineKind::Paragraph;
    info.contentColumn = info.indent;
    parseInline(std::string_view(line).substr(info.indent), info.indent, info);
    return info;
}

bool MarkdownAnalyzer::isHorizontalRule(std::string_view trimmed) noexcept
{
    if (trimmed.size() < 3)
        return false;
    const char first = trimmed.front();
    if (first != '-' && first != '*' && first != '_')
        return false;
    int count = 0;
    for (char ch : trimmed)
    {
        if (ch == first)
            ++count;
        else if (!isWhitespace(ch))
            return false;
    }
    return count >= 3;
}

std::string MarkdownAnalyzer::trim(std::string_view view)
{
    std::size_t start = 0;
    while (start < view.size() && isWhitespace(view[start]))
        ++start;
    std::size_t end = view.size();
    while (end > start && isWhitespace(view[end - 1]))
        --end;
    return std::string(view.substr(start, end - start));
}

MarkdownLineInfo MarkdownAnalyzer::analyzeFencedState(const std::string &line, MarkdownParserState &state) const
{
    MarkdownLineInfo info;
    info.inFence = true;
    info.indent = leadingWhitespace(line);
    info.language = state.fenceLanguage;
    const std::string trimmed = trim(line);
    if (!state.fenceMarker.empty() && trimmed.rfind(state.fenceMarker, 0) == 0 &&
        trimmed.find_first_not_of(state.fenceMarker.front()) == std::string::npos)
    {
        info.kind = MarkdownLineKind::CodeFenceEnd;
        state.inFence = false;
        state.fenceMarker.clear();
        state.fenceLanguage.clear();
    }
    else
    {
        info.kind = MarkdownLineKind::FencedCode;
    }
    return info;
}

void MarkdownAnalyzer::parseInline(std::string_view content, std::size_t column, MarkdownLineInfo &info) const
{
    std::vector<MarkdownSpan> spans;
    parseCodeSpans(content, spans);

    std::string masked(content);
    for (const auto &span : spans)
        mask(masked, span.start, span.end);

    const std::size_t codeCount = spans.size();
    parseLinksAndImages(masked, spans);
    for (std::size_t i = codeCount; i < spans.size(); ++i)
    {
        // Only the target is hidden from emphasis; the label keeps its markup.
        std::size_t close = masked.find("](", spans[i].start);
        if (close != std::string::npos && close < spans[i].end)
            mask(masked, close, spans[i].end);
    }
    parseEmphasis(masked, spans);

    for (auto &span : spans)
    {
        span.start += column;
        span.end += column;
    }
    std::sort(spans.begin(), spans.end(), [](const MarkdownSpan &a, const MarkdownSpan &b) {
        if (a.start != b.start)
            return a.start < b.start;
        return a.end > b.end;
    });
    info.spans = std::move(spans);
}

void MarkdownAnalyzer::parseCodeSpans(std::string_view line, std::vector<MarkdownSpan> &spans) const
{
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] != '`')
            continue;
        std::size_t j = i;
        while (j < line.size() && line[j] == '`')
            ++j;
        const std::size_t fenceLen = j - i;
        std::size_t search = j;
        std::size_t end = std::string_view::npos;
        while (search < line.size())
        {
            std::size_t candidate = line.find(std::string(fenceLen, '`'), search);
            if (candidate == std::string_view::npos)
                break;
            std::size_t runEnd = candidate;
            while (runEnd < line.size() && line[runEnd] == '`')
                ++runEnd;
            if (runEnd - candidate == fenceLen)
            {
                end = candidate;
                break;
            }
            search = runEnd;
        }
        if (end == std::string_view::npos)
        {
            // An unmatched run is literal text.
            i = j - 1;
            continue;
        }
        MarkdownSpan span;
        span.kind = MarkdownSpanKind::Code;
        span.start = i;
        span.end = end + fenceLen;
        spans.push_back(span);
        i = span.end - 1;
    }
}

void MarkdownAnalyzer::parseEmphasis(std::string_view line, std::vector<MarkdownSpan> &spans) const
{
    struct Marker
    {
        char ch;
        int length;
        std::size_t position;
    };
    std::vector<Marker> stack;
    for (std::size_t i = 0; i < line.size();)
    {
        const char ch = line[i];
        if (ch != '*' && ch != '_' && ch != '~')
        {
            ++i;
            continue;
        }

        std::size_t j = i;
        while (j < line.size() && line[j] == ch)
            ++j;
        const char before = i > 0 ? line[i - 1] : ' ';
        const char after = j < line.size() ? line[j] : ' ';
        bool canOpen = !isWhitespace(after);
        bool canClose = !isWhitespace(before);
        if (ch == '_')
        {
            canOpen = canOpen && !isAlphaNumeric(before);
            canClose = canClose && !isAlphaNumeric(after);
        }

        int sequence = static_cast<int>(j - i);
        std::size_t position = i;
        while (sequence > 0)
        {
            int segment = 0;
            if (ch == '~')
            {
                if (sequence < 2)
                    break;
                segment = 2;
            }
            else if (sequence >= 3)
                segment = 3;
            else
                segment = sequence;

            bool matched = false;
            if (canClose)
            {
                for (auto it = stack.rbegin(); it != stack.rend(); ++it)
                {
                    if (it->ch != ch || it->length != segment)
                        continue;
                    if (it->position + static_cast<std::size_t>(segment) < position)
                    {
                        MarkdownSpan span;
                        span.start = it->position;
                        span.end = position + static_cast<std::size_t>(segment);
                        if (ch == '~')
                            span.kind = MarkdownSpanKind::Strikethrough;
                        else if (segment == 3)
                            span.kind = MarkdownSpanKind::BoldItalic;
                        else if (segment == 2)
                            span.kind = MarkdownSpanKind::Bold;
                        else
                            span.kind = MarkdownSpanKind::Italic;
                        spans.push_back(span);
                        stack.erase(std::next(it).base(), stack.end());
                        matched = true;
                    }
                    break;
                }
            }
            if (!matched && canOpen)
                stack.push_back(Marker{ch, segment, position});
            position += static_cast<std::size_t>(segment);
            sequence -= segment;
        }
        i = j;
    }
}

void MarkdownAnalyzer::parseLinksAndImages(std::string_view line, std::vector<MarkdownSpan> &spans) const
{
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        bool isImage = false;
        if (line[i] == '!')
        {
            if (i + 1 < line.size() && line[i + 1] == '[')
            {
                isImage = true;
                ++i;
            }
            else
                continue;
        }
        if (line[i] != '[')
            continue;

        std::size_t depth = 1;
        std::size_t j = i + 1;
        while (j < line.size() && depth > 0)
        {
            if (line[j] == '[')
                ++depth;
            else if (line[j] == ']')
                --depth;
            ++j;
        }
        if (depth != 0)
            continue;
        const std::size_t closeBracket = j - 1;
        std::size_t k = closeBracket + 1;
        if (k >= line.size() || line[k] != '(')
            continue;
        ++k;
        const std::size_t urlStart = k;
        int parenDepth = 1;
        while (k < line.size() && parenDepth > 0)
        {
            if (line[k] == '(')
                ++parenDepth;
            else if (line[k] == ')')
                --parenDepth;
            ++k;
        }
        if (parenDepth != 0)
            continue;

        MarkdownSpan span;
        span.kind = isImage ? MarkdownSpanKind::Image : MarkdownSpanKind::Link;
        span.start = isImage ? i - 1 : i;
        span.end = k;
        std::string url = trim(line.substr(urlStart, k - 1 - urlStart));
        if (url.size() >= 2 && url.front() == '<' && url.back() == '>')
            url = url.substr(1, url.size() - 2);
        span.attribute = url;
        spans.push_back(span);
        i = k - 1;
    }
}

void MarkdownTreeProvider::invalidateFrom(std::size_t offset) noexcept
{
    editedFrom = editedFrom ? std::min(*editedFrom, offset) : offset;
}

void MarkdownTreeProvider::syncRevision(const text::TextSource &source)
{
    if (cacheValid && cachedRevision == source.revision())
        return;

    if (cacheValid && editedFrom)
    {
        // A checkpoint describes the text before its line, which an edit
        // starting at or after that line leaves untouched.
        const std::size_t edited = *editedFrom;
        auto stale = std::find_if(checkpoints.begin(), checkpoints.end(),
                                  [edited](const Checkpoint &checkpoint) { return checkpoint.from > edited; });
        checkpoints.erase(stale, checkpoints.end());
    }
    else
    {
        checkpoints.clear();
    }
    if (checkpoints.empty())
        checkpoints.push_back({0, MarkdownParserState{}});

    cacheValid = true;
    cachedRevision = source.revision();
    editedFrom.reset();
}

MarkdownParserState MarkdownTreeProvider::stateBefore(const text::TextSource &source, const text::LineInfo &line)
{
    syncRevision(source);

    const std::size_t slot = std::min(line.number / kCheckpointInterval, checkpoints.size() - 1);
    MarkdownParserState state = checkpoints[slot].state;
    std::size_t number = slot * kCheckpointInterval;
    std::size_t offset = checkpoints[slot].from;
    while (number < line.number && offset < source.length())
    {
        const text::LineInfo current = source.lineAt(offset);
        std::string lineText = source.lineText(current);
        if (!lineText.empty() && lineText.back() == '\r')
            lineText.pop_back();
        if (analyzer.analyzeLine(lineText, state).kind == MarkdownLineKind::CodeFenceStart)
            state.fenceStart = current.from;
        ++analyzedLines;
        offset = current.to + 1;
        ++number;
        if (number % kCheckpointInterval == 0 && number / kCheckpointInterval == checkpoints.size())
            checkpoints.push_back({offset, state});
    }
    return state;
}

std::vector<SyntaxNode> MarkdownTreeProvider::nodesInRange(const text::TextSource &source, text::TextRange range)
{
    const std::size_t length = source.length();
    range.from = std::min(range.from, length);
    range.to = std::clamp(range.to, range.from, length);

    // Widen to the start of the enclosing block so grouped lines are
    // complete, stopping at a blank line, heading or fence.
    text::LineInfo first = source.lineAt(range.from);
    for (std::size_t widened = 0; first.from > 0 && widened < kContextLines; ++widened)
    {
        const text::LineInfo previous = source.lineAt(first.from - 1);
        if (startsBlock(source.lineText(previous)))
            break;
        first = previous;
    }

    MarkdownParserState state = stateBefore(source, first);
    const bool startsInFence = state.inFence;
    const std::size_t enclosingFenceStart = state.fenceStart;

    std::vector<AnalyzedLine> lines;
    text::LineInfo line = first;
    std::size_t trailing = 0;
    while (true)
    {
        std::string lineText = source.lineText(line);
        text::LineInfo content = line;
        if (!lineText.empty() && lineText.back() == '\r')
        {
            lineText.pop_back();
            --content.to;
        }
        AnalyzedLine entry{content, analyzer.analyzeLine(lineText, state)};
        if (entry.info.kind == MarkdownLineKind::CodeFenceStart)
            state.fenceStart = line.from;
        ++analyzedLines;
        const bool blank = entry.info.kind == MarkdownLineKind::Blank;
        lines.push_back(std::move(entry));
        if (line.to >= length)
            break;
        if (line.from > range.to)
        {
            ++trailing;
            if ((blank && !state.inFence) || trailing >= kContextLines)
                break;
        }
        line = source.lineAt(line.to + 1);
    }

    std::vector<SyntaxNode> nodes;
    nodes.push_back({SyntaxNodeKind::Document, 0, length});

    std::size_t index = 0;
    while (index < lines.size())
    {
        const AnalyzedLine &entry = lines[index];
        const MarkdownLineInfo &info = entry.info;
        const std::size_t start = entry.line.from + info.indent;

        if (isFenceLine(info.kind))
        {
            std::size_t from = entry.line.from;
            if (index == 0 && startsInFence && info.kind != MarkdownLineKind::CodeFenceStart)
                from = enclosingFenceStart;
            std::size_t last = index;
            if (info.kind != MarkdownLineKind::CodeFenceEnd)
            {
                while (last + 1 < lines.size() && lines[last + 1].info.kind != MarkdownLineKind::CodeFenceStart &&
                       isFenceLine(lines[last + 1].info.kind))
                {
                    ++last;
                    if (lines[last].info.kind == MarkdownLineKind::CodeFenceEnd)
                        break;
                }
            }
            nodes.push_back({SyntaxNodeKind::FencedCode, from, lines[last].line.to});
            index = last + 1;
            continue;
        }

        switch (info.kind)
        {
        case MarkdownLineKind::Heading:
            nodes.push_back({preview::headingKind(info.headingLevel), start, entry.line.to});
            appendInlineNodes(entry, nodes);
            ++index;
            break;
        case MarkdownLineKind::HorizontalRule:
            nodes.push_back({SyntaxNodeKind::HorizontalRule, start, entry.line.to});
            ++index;
            break;
        case MarkdownLineKind::IndentedCode:
            nodes.push_back({SyntaxNodeKind::Other, entry.line.from, entry.line.to});
            ++index;
            break;
        case MarkdownLineKind::BlockQuote:
        case MarkdownLineKind::Paragraph:
        {
            const MarkdownLineKind kind = info.kind;
            std::size_t last = index;
            while (last + 1 < lines.size() && lines[last + 1].info.kind == kind)
                ++last;
            nodes.push_back({kind == MarkdownLineKind::BlockQuote ? SyntaxNodeKind::Blockquote
                                                                  : SyntaxNodeKind::Paragraph,
                             start, lines[last].line.to});
            for (std::size_t i = index; i <= last; ++i)
                appendInlineNodes(lines[i], nodes);
            index = last + 1;
            break;
        }
        case MarkdownLineKind::BulletListItem:
        case MarkdownLineKind::OrderedListItem:
        {
            const MarkdownLineKind kind = info.kind;
            std::size_t last = index;
            while (last + 1 < lines.size() && lines[last + 1].info.kind == kind)
                ++last;
            nodes.push_back({kind == MarkdownLineKind::OrderedListItem ? SyntaxNodeKind::OrderedList
                                                                       : SyntaxNodeKind::BulletList,
                             start, lines[last].line.to});
            for (std::size_t i = index; i <= last; ++i)
            {
                nodes.push_back({SyntaxNodeKind::ListItem, lines[i].line.from + lines[i].info.indent,
                                 lines[i].line.to});
                appendInlineNodes(lines[i], nodes);
            }
            index = last + 1;
            break;
        }
        default:
            ++index;
            break;
        }
    }

    std::vector<SyntaxNode> result;
    result.reserve(nodes.size());
    for (const auto &node : nodes)
    {
        if (range.touches(text::TextRange{node.from, node.to}))
            result.push_back(node);
    }
    preview::sortSyntaxNodes(result);
    return result;
}

} // namespace lm::edit
