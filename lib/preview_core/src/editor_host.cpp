#include "lm/text/editor_host.hpp"

#include <algorithm>

namespace lm::text
{

bool applyOrRestore(EditBuffer &buffer, const EditTransaction &transaction, std::string_view previous)
{
    if (!changesAreValid(transaction.changes, buffer.size()))
        return false;

    std::size_t growth = 0;
    for (const auto &change : transaction.changes)
        growth += change.insert.size();
    if (!buffer.reserve(buffer.size() + growth))
        return false;

    for (const auto &change : sortedDescending(transaction.changes))
    {
        if (change.to > change.from)
            buffer.erase(change.from, change.to);
        if (!change.insert.empty() && !buffer.insert(change.from, change.insert))
        {
            buffer.erase(0, buffer.size());
            // The capacity reserved above always fits the previous content.
            if (!previous.empty())
                buffer.insert(0, previous);
            return false;
        }
    }
    return true;
}

MemoryEditorHost::MemoryEditorHost(std::string initial)
    : document(std::move(initial))
{
}

TextRange MemoryEditorHost::viewport() const
{
    if (fixedViewport)
    {
        TextRange clamped = *fixedViewport;
        clamped.from = std::min(clamped.from, document.length());
        clamped.to = std::min(clamped.to, document.length());
        return clamped;
    }
    return TextRange{0, document.length()};
}

bool MemoryEditorHost::dispatch(const EditTransaction &transaction)
{
    if (!document.apply(transaction))
        return false;
    ++dispatched;
    if (transaction.selection)
    {
        setSelection(transaction.selection->anchor, transaction.selection->head);
    }
    else
    {
        current.anchor = mapThroughChanges(transaction.changes, current.anchor);
        current.head = mapThroughChanges(transaction.changes, current.head);
    }
    return true;
}

void MemoryEditorHost::setSelection(std::size_t anchor, std::size_t head)
{
    current.anchor = std::min(anchor, document.length());
    current.head = std::min(head, document.length());
}

void MemoryEditorHost::scrollIntoView(std::size_t pos)
{
    scrollTarget = std::min(pos, document.length());
}

} // namespace lm::text
