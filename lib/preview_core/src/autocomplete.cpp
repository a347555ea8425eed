#include "lm/wiki/autocomplete.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace lm::wiki
{
namespace
{
std::string lower(std::string_view view)
{
    std::string result(view.begin(), view.end());
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

struct RankedEntry
{
    std::size_t position = 0;
    const NoteTitleEntry *entry = nullptr;
};

} // namespace

NoteTitleIndex::NoteTitleIndex(std::vector<NoteTitleEntry> entries)
    : items(std::move(entries))
{
}

void NoteTitleIndex::replace(std::vector<NoteTitleEntry> entries)
{
    items = std::move(entries);
}

std::optional<std::size_t> findCompletionTrigger(std::string_view lineText, std::size_t caretColumn) noexcept
{
    caretColumn = std::min(caretColumn, lineText.size());
    std::string_view before = lineText.substr(0, caretColumn);
    std::size_t searchFrom = 0;
    std::size_t lastClose = before.rfind(']');
    if (lastClose != std::string_view::npos)
        searchFrom = lastClose + 1;
    std::size_t open = before.find("[[", searchFrom);
    if (open == std::string_view::npos)
        return std::nullopt;
    return open;
}

std::string formatRelativeDate(std::chrono::system_clock::time_point updatedAt,
                               std::chrono::system_clock::time_point now)
{
    using namespace std::chrono;
    const auto elapsedDays = duration_cast<hours>(now - updatedAt).count() / 24;
    if (elapsedDays <= 0)
        return "Today";
    if (elapsedDays == 1)
        return "Yesterday";
    if (elapsedDays < 7)
        return std::to_string(elapsedDays) + " days ago";

    const year_month_day date{floor<days>(updatedAt)};
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
    return buffer;
}

std::optional<CompletionResult> completeWikiLink(const text::TextSource &source,
                                                 std::size_t caret,
                                                 const NoteTitleIndex &index,
                                                 std::size_t limit,
                                                 std::chrono::system_clock::time_point now)
{
    if (caret > source.length())
        return std::nullopt;
    const text::LineInfo line = source.lineAt(caret);
    const std::string lineText = source.lineText(line);
    auto trigger = findCompletionTrigger(lineText, caret - line.from);
    if (!trigger)
        return std::nullopt;

    CompletionResult result;
    result.from = line.from + *trigger + 2;
    result.to = caret;
    result.query = lineText.substr(*trigger + 2, caret - result.from);

    if (result.query.empty())
    {
        CompletionOption placeholder;
        placeholder.label = std::string(kCompletionPlaceholder);
        placeholder.actionable = false;
        result.options.push_back(std::move(placeholder));
        return result;
    }

    const std::string needle = lower(result.query);
    std::vector<RankedEntry> ranked;
    for (const auto &entry : index.entries())
    {
        std::size_t position = lower(entry.title).find(needle);
        if (position != std::string::npos)
            ranked.push_back({position, &entry});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedEntry &a, const RankedEntry &b) {
        return a.position < b.position;
    });
    if (ranked.size() > limit)
        ranked.resize(limit);

    for (const auto &item : ranked)
    {
        CompletionOption option;
        option.label = item.entry->title.empty() ? std::string("Untitled") : item.entry->title;
        option.detail = formatRelativeDate(item.entry->updatedAt, now);
        option.applyText = item.entry->title + "]]";
        result.options.push_back(std::move(option));
    }
    return result;
}

std::optional<text::EditTransaction> completionTransaction(const CompletionResult &result,
                                                           const CompletionOption &option)
{
    if (!option.actionable || result.to < result.from)
        return std::nullopt;
    text::EditTransaction transaction;
    transaction.changes.push_back({result.from, result.to, option.applyText});
    const std::size_t caret = result.from + option.applyText.size();
    transaction.selection = text::Selection{caret, caret};
    return transaction;
}

} // namespace lm::wiki
