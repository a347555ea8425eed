#include "lm/edit/inline_commands.hpp"

#include <algorithm>

namespace lm::edit
{
namespace
{
using Placement = InlineCommandSpec::CursorPlacement;

const InlineCommandSpec kBoldSpec{"Bold", "**", "**", Placement::SelectInner, Placement::AfterPrefix};
const InlineCommandSpec kItalicSpec{"Italic", "*", "*", Placement::SelectInner, Placement::AfterPrefix};
const InlineCommandSpec kCodeSpec{"Inline Code", "`", "`", Placement::SelectInner, Placement::AfterPrefix};
const InlineCommandSpec kLinkSpec{"Link", "[", "](url)", Placement::SelectTarget, Placement::AfterPrefix};

text::Selection placeCursor(const InlineCommandSpec &spec, Placement placement, std::size_t start, std::size_t innerLength)
{
    const std::size_t innerStart = start + spec.prefix.size();
    const std::size_t innerEnd = innerStart + innerLength;
    switch (placement)
    {
    case Placement::SelectInner:
        return {innerStart, innerEnd};
    case Placement::SelectTarget:
    {
        // Between "](" and the closing ")" of the suffix.
        std::size_t open = spec.suffix.find('(');
        std::size_t close = spec.suffix.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close <= open)
            return {innerEnd, innerEnd};
        return {innerEnd + open + 1, innerEnd + close};
    }
    case Placement::AfterPrefix:
    default:
        return {innerStart, innerStart};
    }
}

} // namespace

const InlineCommandSpec &inlineCommandSpec(InlineCommand command)
{
    switch (command)
    {
    case InlineCommand::Bold:
        return kBoldSpec;
    case InlineCommand::Italic:
        return kItalicSpec;
    case InlineCommand::InlineCode:
        return kCodeSpec;
    case InlineCommand::Link:
    default:
        return kLinkSpec;
    }
}

text::EditTransaction applyInlineCommand(const text::TextSource &source,
                                         text::Selection selection,
                                         InlineCommand command)
{
    const InlineCommandSpec &spec = inlineCommandSpec(command);
    const std::size_t start = std::min(selection.from(), source.length());
    const std::size_t end = std::min(selection.to(), source.length());

    text::EditTransaction transaction;
    if (end > start)
    {
        transaction.changes.push_back({start, start, spec.prefix});
        transaction.changes.push_back({end, end, spec.suffix});
        transaction.selection = placeCursor(spec, spec.withSelection, start, end - start);
        return transaction;
    }

    transaction.changes.push_back({start, start, spec.prefix + spec.suffix});
    transaction.selection = placeCursor(spec, spec.withoutSelection, start, 0);
    return transaction;
}

} // namespace lm::edit
