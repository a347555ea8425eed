#include "lm/wiki/wiki_links.hpp"

#include "lm/preview/line_patterns.hpp"

#include <algorithm>

namespace lm::wiki
{
namespace
{
std::string trim(std::string_view view)
{
    std::size_t start = 0;
    while (start < view.size() && preview::isSpaceChar(view[start]))
        ++start;
    std::size_t end = view.size();
    while (end > start && preview::isSpaceChar(view[end - 1]))
        --end;
    return std::string(view.substr(start, end - start));
}

// Tries to read a link starting at pos, which must point at "[[".
std::optional<WikiLinkMatch> matchAt(std::string_view text, std::size_t pos)
{
    std::size_t titleStart = pos + 2;
    std::size_t cursor = titleStart;
    while (cursor < text.size() && text[cursor] != ']' && text[cursor] != '|' && text[cursor] != '\n')
        ++cursor;
    if (cursor == titleStart || cursor >= text.size() || text[cursor] == '\n')
        return std::nullopt;
    std::string_view rawTitle = text.substr(titleStart, cursor - titleStart);

    std::string_view rawDisplay;
    if (text[cursor] == '|')
    {
        std::size_t displayStart = cursor + 1;
        cursor = displayStart;
        while (cursor < text.size() && text[cursor] != ']' && text[cursor] != '\n')
            ++cursor;
        if (cursor == displayStart || cursor >= text.size() || text[cursor] == '\n')
            return std::nullopt;
        rawDisplay = text.substr(displayStart, cursor - displayStart);
    }

    if (cursor + 1 >= text.size() || text[cursor] != ']' || text[cursor + 1] != ']')
        return std::nullopt;

    WikiLinkMatch match;
    match.from = pos;
    match.to = cursor + 2;
    match.title = trim(rawTitle);
    match.display = trim(rawDisplay);
    if (match.display.empty())
        match.display = match.title;
    return match;
}

} // namespace

std::vector<WikiLinkMatch> scanWikiLinks(std::string_view lineText, std::size_t lineFrom)
{
    std::vector<WikiLinkMatch> matches;
    std::size_t pos = 0;
    while (pos + 1 < lineText.size())
    {
        if (lineText[pos] != '[' || lineText[pos + 1] != '[')
        {
            ++pos;
            continue;
        }
        auto match = matchAt(lineText, pos);
        if (!match)
        {
            ++pos;
            continue;
        }
        pos = match->to;
        if (match->title.empty())
            continue;
        match->from += lineFrom;
        match->to += lineFrom;
        matches.push_back(std::move(*match));
    }
    return matches;
}

preview::DecorationLayer buildWikiLinkDecorations(const text::TextSource &source,
                                                  text::TextRange viewport,
                                                  std::size_t caret)
{
    preview::DecorationLayer layer;
    const std::size_t end = std::min(viewport.to, source.length());
    std::size_t pos = std::min(viewport.from, source.length());
    while (true)
    {
        const text::LineInfo line = source.lineAt(pos);
        const bool caretOnLine = line.contains(caret);
        for (auto &match : scanWikiLinks(source.lineText(line), line.from))
        {
            if (caretOnLine)
            {
                layer.push_back(preview::markRange(match.from, match.from + 2, preview::style::kWikiLinkBracket));
                layer.push_back(preview::markRange(match.from + 2, match.to - 2, preview::style::kWikiLink));
                layer.push_back(preview::markRange(match.to - 2, match.to, preview::style::kWikiLinkBracket));
            }
            else
            {
                layer.push_back(preview::replaceWithWidget(
                    match.from, match.to, preview::Widget::wikiLink(std::move(match.title), std::move(match.display))));
            }
        }
        if (line.to >= end || line.to >= source.length())
            break;
        pos = line.to + 1;
    }
    preview::normalizeLayer(layer);
    return layer;
}

std::optional<std::string> resolveWikiLinkAt(const text::TextSource &source,
                                             const preview::DecorationLayer &layer,
                                             std::size_t pos)
{
    if (const auto *instruction = preview::widgetAt(layer, pos))
    {
        if (instruction->widget->kind == preview::WidgetKind::WikiLink)
            return instruction->widget->title;
    }

    if (pos > source.length())
        return std::nullopt;
    const text::LineInfo line = source.lineAt(pos);
    for (const auto &match : scanWikiLinks(source.lineText(line), line.from))
    {
        if (pos >= match.from && pos <= match.to)
            return match.title;
    }
    return std::nullopt;
}

std::vector<std::string> extractWikiLinks(std::string_view text)
{
    std::vector<std::string> titles;
    std::size_t lineStart = 0;
    while (lineStart <= text.size())
    {
        std::size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
            lineEnd = text.size();
        for (auto &match : scanWikiLinks(text.substr(lineStart, lineEnd - lineStart)))
        {
            if (std::find(titles.begin(), titles.end(), match.title) == titles.end())
                titles.push_back(std::move(match.title));
        }
        if (lineEnd == text.size())
            break;
        lineStart = lineEnd + 1;
    }
    return titles;
}

} // namespace lm::wiki
