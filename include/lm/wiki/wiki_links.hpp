#pragma once

#include "lm/preview/decoration.hpp"
#include "lm/text/text_document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::wiki
{

struct WikiLinkMatch
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string title;
    std::string display;

    bool operator==(const WikiLinkMatch &) const = default;
};

// Finds [[title]] and [[title|display]] in one line of text. The title
// excludes ']' and '|', the display excludes ']'; both are trimmed and an
// empty display falls back to the title. Offsets are shifted by lineFrom.
std::vector<WikiLinkMatch> scanWikiLinks(std::string_view lineText, std::size_t lineFrom = 0);

// Caret line: bracket/text/bracket marks. Elsewhere: one widget per link.
preview::DecorationLayer buildWikiLinkDecorations(const text::TextSource &source,
                                                  text::TextRange viewport,
                                                  std::size_t caret);

// Title of the link under pos, from a rendered widget or by re-scanning
// the line.
std::optional<std::string> resolveWikiLinkAt(const text::TextSource &source,
                                             const preview::DecorationLayer &layer,
                                             std::size_t pos);

// Distinct titles referenced anywhere in text, in order of first use.
std::vector<std::string> extractWikiLinks(std::string_view text);

} // namespace lm::wiki
