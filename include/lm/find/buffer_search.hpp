#pragma once

#include "lm/text/editor_host.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lm::find
{

struct SearchMatch
{
    std::size_t from = 0;
    std::size_t to = 0;

    bool operator==(const SearchMatch &) const = default;
};

// currentMatch is 1-based; 0 means nothing is selected.
struct SearchState
{
    std::size_t matchCount = 0;
    std::size_t currentMatch = 0;

    bool operator==(const SearchState &) const = default;
};

enum class SearchPhase
{
    Idle,
    Active
};

// Literal, non-overlapping matches in document order. Case folding is
// ASCII only.
std::vector<SearchMatch> findAllMatches(std::string_view haystack, std::string_view needle, bool caseSensitive);

std::string describeSearchState(const SearchState &state);

class BufferSearch
{
public:
    explicit BufferSearch(text::EditorHost &editorHost) noexcept;

    void setQuery(std::string query, bool caseSensitive);
    bool next();
    bool prev();
    bool replaceCurrent(std::string_view replacement);
    std::size_t replaceAll(std::string_view replacement);
    void close();

    // Rescans when the document changed since the last scan.
    void refresh();

    SearchPhase phase() const noexcept { return queryText.empty() ? SearchPhase::Idle : SearchPhase::Active; }
    SearchState state() const noexcept { return SearchState{found.size(), current}; }
    const std::vector<SearchMatch> &matches() const noexcept { return found; }
    const std::string &query() const noexcept { return queryText; }
    bool caseSensitive() const noexcept { return matchCase; }

private:
    void rescan();
    void select(std::size_t index);

    text::EditorHost &host;
    std::string queryText;
    bool matchCase = false;
    std::vector<SearchMatch> found;
    std::size_t current = 0;
    std::uint64_t scannedRevision = 0;
};

} // namespace lm::find
