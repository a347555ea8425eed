#include "lm/text/text_document.hpp"

#include <algorithm>

namespace lm::text
{

TextDocument::TextDocument()
{
    rebuildLineIndex();
}

TextDocument::TextDocument(std::string initial)
    : content(std::move(initial))
{
    rebuildLineIndex();
}

std::string TextDocument::slice(std::size_t from, std::size_t to) const
{
    from = std::min(from, content.size());
    to = std::min(to, content.size());
    if (to <= from)
        return std::string();
    return content.substr(from, to - from);
}

LineInfo TextDocument::lineAt(std::size_t pos) const
{
    pos = std::min(pos, content.size());
    auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), pos);
    std::size_t number = static_cast<std::size_t>(std::distance(lineStarts.begin(), it)) - 1;
    return line(number);
}

LineInfo TextDocument::line(std::size_t number) const
{
    if (number >= lineStarts.size())
        number = lineStarts.size() - 1;
    LineInfo info;
    info.number = number;
    info.from = lineStarts[number];
    if (number + 1 < lineStarts.size())
        info.to = lineStarts[number + 1] - 1;
    else
        info.to = content.size();
    return info;
}

bool TextDocument::apply(const EditTransaction &transaction)
{
    if (!changesAreValid(transaction.changes, content.size()))
        return false;
    if (transaction.changes.empty())
        return true;

    for (const auto &change : sortedDescending(transaction.changes))
        content.replace(change.from, change.to - change.from, change.insert);
    rebuildLineIndex();
    ++rev;
    return true;
}

void TextDocument::reset(std::string replacement)
{
    content = std::move(replacement);
    rebuildLineIndex();
    ++rev;
}

void TextDocument::rebuildLineIndex()
{
    lineStarts.clear();
    lineStarts.push_back(0);
    for (std::size_t i = 0; i < content.size(); ++i)
    {
        if (content[i] == '\n')
            lineStarts.push_back(i + 1);
    }
}

bool changesAreValid(const std::vector<TextChange> &changes, std::size_t documentLength)
{
    std::vector<const TextChange *> ordered;
    ordered.reserve(changes.size());
    for (const auto &change : changes)
    {
        if (change.from > change.to || change.to > documentLength)
            return false;
        ordered.push_back(&change);
    }
    std::sort(ordered.begin(), ordered.end(), [](const TextChange *a, const TextChange *b) {
        return a->from < b->from;
    });
    for (std::size_t i = 1; i < ordered.size(); ++i)
    {
        const TextChange &prev = *ordered[i - 1];
        const TextChange &next = *ordered[i];
        if (next.from < prev.to)
            return false;
        // Two insertions at one point have no defined order.
        if (next.from == prev.from && prev.from == prev.to && next.from == next.to)
            return false;
    }
    return true;
}

std::vector<TextChange> sortedDescending(std::vector<TextChange> changes)
{
    std::stable_sort(changes.begin(), changes.end(), [](const TextChange &a, const TextChange &b) {
        return a.from > b.from;
    });
    return changes;
}

std::size_t mapThroughChanges(const std::vector<TextChange> &changes, std::size_t pos)
{
    std::vector<const TextChange *> ordered;
    ordered.reserve(changes.size());
    for (const auto &change : changes)
        ordered.push_back(&change);
    std::sort(ordered.begin(), ordered.end(), [](const TextChange *a, const TextChange *b) {
        return a->from < b->from;
    });

    std::ptrdiff_t shift = 0;
    for (const TextChange *entry : ordered)
    {
        const TextChange &change = *entry;
        std::ptrdiff_t delta = static_cast<std::ptrdiff_t>(change.insert.size()) -
                               static_cast<std::ptrdiff_t>(change.to - change.from);
        if (change.to <= pos && change.from < pos)
            shift += delta;
        else if (change.from == pos && change.to == pos)
            shift += delta;
        else if (change.from < pos && pos < change.to)
            return static_cast<std::size_t>(static_cast<std::ptrdiff_t>(change.from) + shift) + change.insert.size();
    }
    return static_cast<std::size_t>(static_cast<std::ptrdiff_t>(pos) + shift);
}

} // namespace lm::text
