#pragma once

#include "lm/text/text_document.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lm::preview
{

enum class WidgetKind
{
    Checkbox,
    ListMarker,
    HorizontalRule,
    WikiLink
};

enum class ListMarkerStyle
{
    Bullet,
    Ordinal
};

// Renderers compare identities to decide whether an already drawn
// element can be reused.
struct WidgetIdentity
{
    WidgetKind kind = WidgetKind::HorizontalRule;
    std::string contentKey;

    bool operator==(const WidgetIdentity &) const = default;
};

struct Widget
{
    WidgetKind kind = WidgetKind::HorizontalRule;

    // Checkbox
    bool checked = false;
    std::size_t anchor = 0;

    // ListMarker
    ListMarkerStyle markerStyle = ListMarkerStyle::Bullet;
    std::uint64_t ordinal = 0;

    // WikiLink
    std::string title;
    std::string display;

    static Widget checkbox(bool isChecked, std::size_t lineAnchor);
    static Widget bullet();
    static Widget ordinalMarker(std::uint64_t number);
    static Widget horizontalRule();
    static Widget wikiLink(std::string linkTitle, std::string linkDisplay);

    WidgetIdentity identity() const;
    bool operator==(const Widget &) const = default;
};

std::string_view widgetKindName(WidgetKind kind) noexcept;

// Glyphs drawn in place of the replaced source characters.
std::string renderText(const Widget &widget, int ruleWidth = 3);

// Re-derives the task marker from the line that currently contains the
// widget's anchor. Returns nothing when that line no longer carries one.
std::optional<text::EditTransaction> checkboxToggle(const text::TextSource &source, const Widget &widget);
std::optional<text::EditTransaction> toggleTaskAt(const text::TextSource &source, std::size_t pos);

} // namespace lm::preview
