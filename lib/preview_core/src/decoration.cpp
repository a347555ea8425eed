#include "lm/preview/decoration.hpp"

#include <algorithm>

namespace lm::preview
{

namespace style
{
std::string headingClass(int level)
{
    return "lm-heading-" + std::to_string(std::clamp(level, 1, 6));
}

int headingLevelOfClass(std::string_view styleClass) noexcept
{
    constexpr std::string_view prefix = "lm-heading-";
    if (styleClass.size() != prefix.size() + 1 || styleClass.substr(0, prefix.size()) != prefix)
        return 0;
    char digit = styleClass.back();
    if (digit < '1' || digit > '6')
        return 0;
    return digit - '0';
}
} // namespace style

namespace
{
bool crosses(const text::TextRange &mark, const text::TextRange &replaced) noexcept
{
    bool overlaps = mark.from < replaced.to && replaced.from < mark.to;
    if (!overlaps)
        return false;
    bool containsReplaced = mark.from <= replaced.from && replaced.to <= mark.to;
    bool insideReplaced = replaced.from <= mark.from && mark.to <= replaced.to;
    return !containsReplaced && !insideReplaced;
}

} // namespace

DecorationInstruction hideRange(std::size_t from, std::size_t to)
{
    DecorationInstruction instruction;
    instruction.kind = DecorationKind::Hide;
    instruction.range = {from, to};
    return instruction;
}

DecorationInstruction markRange(std::size_t from, std::size_t to, std::string_view styleClass)
{
    DecorationInstruction instruction;
    instruction.kind = DecorationKind::Mark;
    instruction.range = {from, to};
    instruction.styleClass = std::string(styleClass);
    return instruction;
}

DecorationInstruction lineClass(std::size_t lineFrom, std::string_view styleClass)
{
    DecorationInstruction instruction = markRange(lineFrom, lineFrom, styleClass);
    instruction.lineLevel = true;
    return instruction;
}

DecorationInstruction replaceWithWidget(std::size_t from, std::size_t to, Widget widget)
{
    DecorationInstruction instruction;
    instruction.kind = DecorationKind::ReplaceWithWidget;
    instruction.range = {from, to};
    instruction.widget = std::move(widget);
    return instruction;
}

void sortLayer(DecorationLayer &layer)
{
    std::stable_sort(layer.begin(), layer.end(), [](const DecorationInstruction &a, const DecorationInstruction &b) {
        if (a.range.from != b.range.from)
            return a.range.from < b.range.from;
        if (a.lineLevel != b.lineLevel)
            return a.lineLevel;
        return a.range.to < b.range.to;
    });
}

void normalizeLayer(DecorationLayer &layer)
{
    sortLayer(layer);

    std::vector<text::TextRange> replaced;
    DecorationLayer kept;
    kept.reserve(layer.size());
    for (auto &instruction : layer)
    {
        if (instruction.replaces())
        {
            if (instruction.range.empty())
                continue;
            bool overlaps = std::any_of(replaced.begin(), replaced.end(), [&](const text::TextRange &other) {
                return instruction.range.from < other.to && other.from < instruction.range.to;
            });
            if (overlaps)
                continue;
            replaced.push_back(instruction.range);
        }
        kept.push_back(std::move(instruction));
    }

    // Marks are checked against every kept replacement, including ones
    // that start after them.
    layer.clear();
    for (auto &instruction : kept)
    {
        if (!instruction.replaces() && !instruction.lineLevel)
        {
            if (instruction.range.empty())
                continue;
            bool crossing = std::any_of(replaced.begin(), replaced.end(), [&](const text::TextRange &other) {
                return crosses(instruction.range, other);
            });
            if (crossing)
                continue;
        }
        layer.push_back(std::move(instruction));
    }
}

bool isSortedLayer(const DecorationLayer &layer) noexcept
{
    for (std::size_t i = 1; i < layer.size(); ++i)
    {
        const auto &prev = layer[i - 1];
        const auto &next = layer[i];
        if (next.range.from < prev.range.from)
            return false;
        if (next.range.from == prev.range.from && next.lineLevel && !prev.lineLevel)
            return false;
    }
    return true;
}

const DecorationInstruction *widgetAt(const DecorationLayer &layer, std::size_t pos) noexcept
{
    for (const auto &instruction : layer)
    {
        if (instruction.range.from > pos)
            break;
        if (instruction.kind == DecorationKind::ReplaceWithWidget && instruction.widget &&
            instruction.range.contains(pos))
            return &instruction;
    }
    return nullptr;
}

} // namespace lm::preview
