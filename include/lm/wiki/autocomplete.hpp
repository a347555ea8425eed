#pragma once

#include "lm/text/text_document.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::wiki
{

inline constexpr std::size_t kDefaultCompletionLimit = 10;
inline constexpr std::string_view kCompletionPlaceholder = "Type to search notes...";

struct NoteTitleEntry
{
    std::string id;
    std::string title;
    std::chrono::system_clock::time_point updatedAt{};
};

// Read-only snapshot of the note list, replaced whenever it changes.
class NoteTitleIndex
{
public:
    NoteTitleIndex() = default;
    explicit NoteTitleIndex(std::vector<NoteTitleEntry> entries);

    void replace(std::vector<NoteTitleEntry> entries);
    const std::vector<NoteTitleEntry> &entries() const noexcept { return items; }
    std::size_t size() const noexcept { return items.size(); }
    bool empty() const noexcept { return items.empty(); }

private:
    std::vector<NoteTitleEntry> items;
};

struct CompletionOption
{
    std::string label;
    std::string detail;
    std::string applyText;
    bool actionable = true;
};

// Options replace [from, to); to is the caret.
struct CompletionResult
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string query;
    std::vector<CompletionOption> options;
};

// Column of the "[[" that opens the link being typed before caretColumn.
std::optional<std::size_t> findCompletionTrigger(std::string_view lineText, std::size_t caretColumn) noexcept;

std::string formatRelativeDate(std::chrono::system_clock::time_point updatedAt,
                               std::chrono::system_clock::time_point now);

std::optional<CompletionResult> completeWikiLink(const text::TextSource &source,
                                                 std::size_t caret,
                                                 const NoteTitleIndex &index,
                                                 std::size_t limit,
                                                 std::chrono::system_clock::time_point now);

std::optional<text::EditTransaction> completionTransaction(const CompletionResult &result,
                                                           const CompletionOption &option);

} // namespace lm::wiki
