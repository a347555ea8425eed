#pragma once

#include "lm/preview/widgets.hpp"
#include "lm/text/text_document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::preview
{

namespace style
{
inline constexpr std::string_view kBold = "lm-bold";
inline constexpr std::string_view kItalic = "lm-italic";
inline constexpr std::string_view kStrikethrough = "lm-strikethrough";
inline constexpr std::string_view kCode = "lm-code";
inline constexpr std::string_view kLink = "lm-link";
inline constexpr std::string_view kBlockquoteLine = "lm-blockquote-line";
inline constexpr std::string_view kTaskChecked = "lm-task-checked";
inline constexpr std::string_view kWikiLink = "lm-wikilink";
inline constexpr std::string_view kWikiLinkBracket = "lm-wikilink-bracket";

std::string headingClass(int level);
// 1..6 for "lm-heading-N", 0 otherwise.
int headingLevelOfClass(std::string_view styleClass) noexcept;
} // namespace style

enum class DecorationKind
{
    Hide,
    Mark,
    ReplaceWithWidget
};

struct DecorationInstruction
{
    DecorationKind kind = DecorationKind::Mark;
    text::TextRange range;
    std::string styleClass;
    // Line-level marks style the whole line and have an empty range at
    // the line start.
    bool lineLevel = false;
    std::optional<Widget> widget;

    bool replaces() const noexcept { return kind != DecorationKind::Mark; }
    bool operator==(const DecorationInstruction &) const = default;
};

using DecorationLayer = std::vector<DecorationInstruction>;

DecorationInstruction hideRange(std::size_t from, std::size_t to);
DecorationInstruction markRange(std::size_t from, std::size_t to, std::string_view styleClass);
DecorationInstruction lineClass(std::size_t lineFrom, std::string_view styleClass);
DecorationInstruction replaceWithWidget(std::size_t from, std::size_t to, Widget widget);

// Ascending by from; at equal from line-level first, then by to.
void sortLayer(DecorationLayer &layer);

// Sorts, then drops replacing ranges that overlap an earlier replacing
// range and marks that only partly cover a replacing range. Marks may nest.
void normalizeLayer(DecorationLayer &layer);

bool isSortedLayer(const DecorationLayer &layer) noexcept;

const DecorationInstruction *widgetAt(const DecorationLayer &layer, std::size_t pos) noexcept;

} // namespace lm::preview
