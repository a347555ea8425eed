#include "lm/preview/widgets.hpp"

#include "lm/preview/line_patterns.hpp"

namespace lm::preview
{

Widget Widget::checkbox(bool isChecked, std::size_t lineAnchor)
{
    Widget widget;
    widget.kind = WidgetKind::Checkbox;
    widget.checked = isChecked;
    widget.anchor = lineAnchor;
    return widget;
}

Widget Widget::bullet()
{
    Widget widget;
    widget.kind = WidgetKind::ListMarker;
    widget.markerStyle = ListMarkerStyle::Bullet;
    return widget;
}

Widget Widget::ordinalMarker(std::uint64_t number)
{
    Widget widget;
    widget.kind = WidgetKind::ListMarker;
    widget.markerStyle = ListMarkerStyle::Ordinal;
    widget.ordinal = number;
    return widget;
}

Widget Widget::horizontalRule()
{
    Widget widget;
    widget.kind = WidgetKind::HorizontalRule;
    return widget;
}

Widget Widget::wikiLink(std::string linkTitle, std::string linkDisplay)
{
    Widget widget;
    widget.kind = WidgetKind::WikiLink;
    widget.title = std::move(linkTitle);
    widget.display = std::move(linkDisplay);
    return widget;
}

WidgetIdentity Widget::identity() const
{
    switch (kind)
    {
    case WidgetKind::Checkbox:
        return {kind, checked ? "x" : " "};
    case WidgetKind::ListMarker:
        if (markerStyle == ListMarkerStyle::Ordinal)
            return {kind, std::to_string(ordinal) + "."};
        return {kind, "bullet"};
    case WidgetKind::WikiLink:
        return {kind, title + "|" + display};
    case WidgetKind::HorizontalRule:
    default:
        return {kind, std::string()};
    }
}

std::string_view widgetKindName(WidgetKind kind) noexcept
{
    switch (kind)
    {
    case WidgetKind::Checkbox:
        return "checkbox";
    case WidgetKind::ListMarker:
        return "list-marker";
    case WidgetKind::HorizontalRule:
        return "horizontal-rule";
    case WidgetKind::WikiLink:
        return "wiki-link";
    }
    return "unknown";
}

std::string renderText(const Widget &widget, int ruleWidth)
{
    switch (widget.kind)
    {
    case WidgetKind::Checkbox:
        return widget.checked ? "[x] " : "[ ] ";
    case WidgetKind::ListMarker:
        if (widget.markerStyle == ListMarkerStyle::Ordinal)
            return std::to_string(widget.ordinal) + ". ";
        return "\xE2\x80\xA2 ";
    case WidgetKind::HorizontalRule:
    {
        std::string rule;
        for (int i = 0; i < ruleWidth; ++i)
            rule += "\xE2\x94\x80";
        return rule;
    }
    case WidgetKind::WikiLink:
        return widget.display;
    }
    return std::string();
}

std::optional<text::EditTransaction> checkboxToggle(const text::TextSource &source, const Widget &widget)
{
    if (widget.kind != WidgetKind::Checkbox)
        return std::nullopt;
    return toggleTaskAt(source, widget.anchor);
}

std::optional<text::EditTransaction> toggleTaskAt(const text::TextSource &source, std::size_t pos)
{
    if (pos > source.length())
        return std::nullopt;
    const text::LineInfo line = source.lineAt(pos);
    const std::string lineText = source.lineText(line);
    auto column = matchTaskState(lineText);
    if (!column)
        return std::nullopt;

    const char current = lineText[*column];
    text::TextChange change;
    change.from = line.from + *column;
    change.to = change.from + 1;
    change.insert = current == ' ' ? "x" : " ";

    text::EditTransaction transaction;
    transaction.changes.push_back(std::move(change));
    return transaction;
}

} // namespace lm::preview
