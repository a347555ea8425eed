#include "lm/preview/line_patterns.hpp"

#include <charconv>

namespace lm::preview
{
namespace
{
bool isBulletChar(char ch) noexcept
{
    return ch == '-' || ch == '*' || ch == '+';
}

bool isDigit(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

bool isTaskStateChar(char ch) noexcept
{
    return ch == ' ' || ch == 'x' || ch == 'X';
}

std::size_t skipSpaces(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && isSpaceChar(line[pos]))
        ++pos;
    return pos;
}

} // namespace

bool isSpaceChar(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v' || ch == '\n';
}

std::size_t leadingSpaces(std::string_view line) noexcept
{
    return skipSpaces(line, 0);
}

std::optional<std::size_t> matchQuotePrefix(std::string_view line) noexcept
{
    std::size_t pos = leadingSpaces(line);
    if (pos >= line.size() || line[pos] != '>')
        return std::nullopt;
    while (pos < line.size() && line[pos] == '>')
        ++pos;
    return skipSpaces(line, pos);
}

std::optional<ListMarkerMatch> matchListMarker(std::string_view line) noexcept
{
    const std::size_t indent = leadingSpaces(line);
    if (indent >= line.size())
        return std::nullopt;

    if (isBulletChar(line[indent]))
    {
        std::size_t afterBullet = indent + 1;
        std::size_t open = skipSpaces(line, afterBullet);
        if (open + 2 < line.size() && line[open] == '[' && isTaskStateChar(line[open + 1]) &&
            line[open + 2] == ']')
        {
            ListMarkerMatch match;
            match.kind = ListMarkerKind::Task;
            match.markerStart = indent;
            match.markerEnd = skipSpaces(line, open + 3);
            match.checked = line[open + 1] != ' ';
            return match;
        }
        if (open > afterBullet)
        {
            ListMarkerMatch match;
            match.kind = ListMarkerKind::Bullet;
            match.markerStart = indent;
            match.markerEnd = open;
            return match;
        }
        return std::nullopt;
    }

    std::size_t digitsEnd = indent;
    while (digitsEnd < line.size() && isDigit(line[digitsEnd]))
        ++digitsEnd;
    if (digitsEnd == indent || digitsEnd >= line.size() || (line[digitsEnd] != '.' && line[digitsEnd] != ')'))
        return std::nullopt;
    std::size_t contentStart = skipSpaces(line, digitsEnd + 1);
    if (contentStart == digitsEnd + 1)
        return std::nullopt;

    std::uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(line.data() + indent, line.data() + digitsEnd, number);
    if (ec != std::errc() || ptr != line.data() + digitsEnd)
        return std::nullopt;

    ListMarkerMatch match;
    match.kind = ListMarkerKind::Ordered;
    match.markerStart = indent;
    match.markerEnd = contentStart;
    match.ordinal = number;
    return match;
}

std::optional<std::size_t> matchTaskState(std::string_view line) noexcept
{
    std::size_t pos = leadingSpaces(line);
    if (pos >= line.size() || !isBulletChar(line[pos]))
        return std::nullopt;
    pos = skipSpaces(line, pos + 1);
    if (pos + 2 < line.size() && line[pos] == '[' && isTaskStateChar(line[pos + 1]) && line[pos + 2] == ']')
        return pos + 1;
    return std::nullopt;
}

std::size_t headingPrefixLength(std::string_view headingText) noexcept
{
    std::size_t level = 0;
    while (level < headingText.size() && headingText[level] == '#')
        ++level;
    if (level == 0 || level >= headingText.size() || headingText[level] != ' ')
        return 0;
    return level + 1;
}

} // namespace lm::preview
