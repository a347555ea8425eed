#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lm::preview
{

// Raw-line matchers for block markers. Tree nodes do not expose the
// marker-only spans of quotes and list items, so these read the line text.

bool isSpaceChar(char ch) noexcept;
std::size_t leadingSpaces(std::string_view line) noexcept;

// ^(\s*>+\s*) -> length of the whole prefix.
std::optional<std::size_t> matchQuotePrefix(std::string_view line) noexcept;

enum class ListMarkerKind
{
    Task,
    Bullet,
    Ordered
};

struct ListMarkerMatch
{
    ListMarkerKind kind = ListMarkerKind::Bullet;
    std::size_t markerStart = 0;
    std::size_t markerEnd = 0;
    bool checked = false;
    std::uint64_t ordinal = 0;
};

// Tries, in order:
//   ^(\s*)([-*+])\s*\[([ xX])\]\s*
//   ^(\s*)([-*+])\s+
//   ^(\s*)(\d+)[.)]\s+
std::optional<ListMarkerMatch> matchListMarker(std::string_view line) noexcept;

// ^(\s*[-*+]\s*)\[([ xX])\] -> column of the state character.
std::optional<std::size_t> matchTaskState(std::string_view line) noexcept;

// Length of the "#..# " prefix of a heading, or 0 if the run of '#' is
// not followed by a space.
std::size_t headingPrefixLength(std::string_view headingText) noexcept;

} // namespace lm::preview
