#pragma once

#include "lm/text/text_document.hpp"

#include <string>

namespace lm::edit
{

enum class InlineCommand
{
    Bold,
    Italic,
    InlineCode,
    Link
};

struct InlineCommandSpec
{
    enum class CursorPlacement
    {
        AfterPrefix,
        SelectInner,
        SelectTarget
    };

    std::string name;
    std::string prefix;
    std::string suffix;
    CursorPlacement withSelection = CursorPlacement::SelectInner;
    CursorPlacement withoutSelection = CursorPlacement::AfterPrefix;
};

const InlineCommandSpec &inlineCommandSpec(InlineCommand command);

// Wraps the selection (or inserts an empty pair at the caret) as one
// transaction that also carries the resulting selection. Markers already
// around the selection are kept, so "*" over "**hi**" gives "***hi***".
text::EditTransaction applyInlineCommand(const text::TextSource &source,
                                         text::Selection selection,
                                         InlineCommand command);

} // namespace lm::edit
