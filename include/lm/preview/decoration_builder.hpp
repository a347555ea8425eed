#pragma once

#include "lm/preview/decoration.hpp"
#include "lm/preview/syntax_tree.hpp"
#include "lm/text/text_document.hpp"

namespace lm::preview
{

// True when the caret sits on any line spanned by [from, to].
bool caretTouchesLines(const text::TextSource &source, std::size_t from, std::size_t to, std::size_t caret);

// Live preview for one node. Appends nothing for malformed constructs.
void decorateNode(const text::TextSource &source, const SyntaxNode &node, DecorationLayer &out);

// Pure function of its inputs: only nodes touching the viewport are
// visited, and nodes on the caret's lines are left raw.
DecorationLayer buildMarkdownDecorations(const text::TextSource &source,
                                         SyntaxTreeProvider &tree,
                                         text::TextRange viewport,
                                         std::size_t caret);

} // namespace lm::preview
