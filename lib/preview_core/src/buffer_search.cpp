#include "lm/find/buffer_search.hpp"

#include <algorithm>

namespace lm::find
{
namespace
{
char foldAscii(char ch) noexcept
{
    if (ch >= 'A' && ch <= 'Z')
        return static_cast<char>(ch - 'A' + 'a');
    return ch;
}

bool matchesAt(std::string_view haystack, std::size_t pos, std::string_view needle, bool caseSensitive) noexcept
{
    for (std::size_t i = 0; i < needle.size(); ++i)
    {
        char a = haystack[pos + i];
        char b = needle[i];
        if (!caseSensitive)
        {
            a = foldAscii(a);
            b = foldAscii(b);
        }
        if (a != b)
            return false;
    }
    return true;
}

} // namespace

std::vector<SearchMatch> findAllMatches(std::string_view haystack, std::string_view needle, bool caseSensitive)
{
    std::vector<SearchMatch> result;
    if (needle.empty() || needle.size() > haystack.size())
        return result;
    std::size_t pos = 0;
    const std::size_t last = haystack.size() - needle.size();
    while (pos <= last)
    {
        if (matchesAt(haystack, pos, needle, caseSensitive))
        {
            result.push_back({pos, pos + needle.size()});
            pos += needle.size();
        }
        else
        {
            ++pos;
        }
    }
    return result;
}

std::string describeSearchState(const SearchState &state)
{
    if (state.matchCount == 0)
        return "No results";
    if (state.currentMatch == 0)
        return std::to_string(state.matchCount) + (state.matchCount == 1 ? " match" : " matches");
    return std::to_string(state.currentMatch) + "/" + std::to_string(state.matchCount);
}

BufferSearch::BufferSearch(text::EditorHost &editorHost) noexcept
    : host(editorHost)
{
}

void BufferSearch::setQuery(std::string query, bool caseSensitive)
{
    queryText = std::move(query);
    matchCase = caseSensitive;
    current = 0;
    rescan();
}

bool BufferSearch::next()
{
    refresh();
    if (found.empty())
        return false;
    select(current >= found.size() ? 1 : current + 1);
    return true;
}

bool BufferSearch::prev()
{
    refresh();
    if (found.empty())
        return false;
    select(current <= 1 ? found.size() : current - 1);
    return true;
}

bool BufferSearch::replaceCurrent(std::string_view replacement)
{
    refresh();
    if (found.empty())
        return false;

    std::size_t index = current;
    if (index == 0)
    {
        const std::size_t caret = host.caret();
        auto it = std::find_if(found.begin(), found.end(), [&](const SearchMatch &match) {
            return match.from >= caret;
        });
        index = it == found.end() ? 1 : static_cast<std::size_t>(it - found.begin()) + 1;
    }

    const SearchMatch target = found[index - 1];
    text::EditTransaction transaction;
    transaction.changes.push_back({target.from, target.to, std::string(replacement)});
    const std::size_t resume = target.from + replacement.size();
    transaction.selection = text::Selection{resume, resume};
    if (!host.dispatch(transaction))
        return false;

    current = 0;
    rescan();
    if (found.empty())
        return true;

    auto it = std::find_if(found.begin(), found.end(), [&](const SearchMatch &match) {
        return match.from >= resume;
    });
    select(it == found.end() ? 1 : static_cast<std::size_t>(it - found.begin()) + 1);
    return true;
}

std::size_t BufferSearch::replaceAll(std::string_view replacement)
{
    refresh();
    if (found.empty())
        return 0;

    text::EditTransaction transaction;
    transaction.changes.reserve(found.size());
    for (auto it = found.rbegin(); it != found.rend(); ++it)
        transaction.changes.push_back({it->from, it->to, std::string(replacement)});
    const std::size_t replaced = found.size();
    if (!host.dispatch(transaction))
        return 0;

    current = 0;
    rescan();
    return replaced;
}

void BufferSearch::close()
{
    queryText.clear();
    matchCase = false;
    found.clear();
    current = 0;
}

void BufferSearch::refresh()
{
    if (host.text().revision() == scannedRevision)
        return;
    current = 0;
    rescan();
}

void BufferSearch::rescan()
{
    const text::TextSource &source = host.text();
    scannedRevision = source.revision();
    found = findAllMatches(source.toString(), queryText, matchCase);
    if (current > found.size())
        current = 0;
}

void BufferSearch::select(std::size_t index)
{
    current = index;
    const SearchMatch &match = found[index - 1];
    host.setSelection(match.from, match.to);
    host.scrollIntoView(match.from);
}

} // namespace lm::find
