#include <gtest/gtest.h>

#include "lm/wiki/autocomplete.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using lm::text::TextDocument;
using lm::wiki::CompletionOption;
using lm::wiki::CompletionResult;
using lm::wiki::NoteTitleEntry;
using lm::wiki::NoteTitleIndex;

namespace
{

using namespace std::chrono;

system_clock::time_point dateOf(int y, unsigned m, unsigned d)
{
    return sys_days{year{y} / month{m} / d};
}

NoteTitleIndex numberedNotes(int count, system_clock::time_point updatedAt)
{
    std::vector<NoteTitleEntry> entries;
    for (int i = 0; i < count; ++i)
        entries.push_back({std::to_string(i) + ".md", "Note " + std::to_string(i), updatedAt});
    return NoteTitleIndex(std::move(entries));
}

} // namespace

TEST(Autocomplete, FindsUnterminatedTrigger)
{
    EXPECT_EQ(lm::wiki::findCompletionTrigger("see [[Pro", 9), 4u);
    EXPECT_EQ(lm::wiki::findCompletionTrigger("[[done]] then", 13), std::nullopt);
    EXPECT_EQ(lm::wiki::findCompletionTrigger("[[done]] [[next", 15), 9u);
    EXPECT_EQ(lm::wiki::findCompletionTrigger("[[abc", 1), std::nullopt);
}

TEST(Autocomplete, EmptyQueryShowsPlaceholder)
{
    TextDocument doc("Go to [[");
    const auto now = dateOf(2024, 6, 1);
    auto result = lm::wiki::completeWikiLink(doc, doc.length(), numberedNotes(3, now), 10, now);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->options.size(), 1u);
    EXPECT_EQ(result->options[0].label, lm::wiki::kCompletionPlaceholder);
    EXPECT_FALSE(result->options[0].actionable);
    EXPECT_EQ(result->from, 8u);
    EXPECT_EQ(result->to, 8u);
}

TEST(Autocomplete, CapsResultsAtLimit)
{
    TextDocument doc("[[note");
    const auto now = dateOf(2024, 6, 1);
    auto result = lm::wiki::completeWikiLink(doc, doc.length(), numberedNotes(15, now), 10, now);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->query, "note");
    EXPECT_EQ(result->options.size(), 10u);
    EXPECT_EQ(result->options[0].applyText, "Note 0]]");
    EXPECT_EQ(result->options[0].detail, "Today");
}

TEST(Autocomplete, RanksEarlierMatchesFirst)
{
    TextDocument doc("[[plan");
    const auto now = dateOf(2024, 6, 1);
    NoteTitleIndex index({{"a.md", "Weekly plan", now}, {"b.md", "Plan B", now}, {"c.md", "Recipes", now}});
    auto result = lm::wiki::completeWikiLink(doc, doc.length(), index, 10, now);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->options.size(), 2u);
    EXPECT_EQ(result->options[0].label, "Plan B");
    EXPECT_EQ(result->options[1].label, "Weekly plan");
}

TEST(Autocomplete, NoTriggerOutsideLink)
{
    TextDocument doc("[[closed]] text");
    const auto now = dateOf(2024, 6, 1);
    EXPECT_FALSE(lm::wiki::completeWikiLink(doc, doc.length(), numberedNotes(2, now), 10, now).has_value());
}

TEST(Autocomplete, FormatsRelativeDates)
{
    const auto now = dateOf(2024, 6, 10) + hours(12);
    EXPECT_EQ(lm::wiki::formatRelativeDate(now - hours(2), now), "Today");
    EXPECT_EQ(lm::wiki::formatRelativeDate(now - hours(30), now), "Yesterday");
    EXPECT_EQ(lm::wiki::formatRelativeDate(now - hours(24 * 3), now), "3 days ago");
    EXPECT_EQ(lm::wiki::formatRelativeDate(dateOf(2024, 3, 5), now), "2024-03-05");
}

TEST(Autocomplete, AcceptingMovesCaretPastLink)
{
    CompletionResult result;
    result.from = 2;
    result.to = 4;
    CompletionOption option;
    option.applyText = "Target]]";

    auto transaction = lm::wiki::completionTransaction(result, option);
    ASSERT_TRUE(transaction.has_value());
    TextDocument doc("[[Ta");
    ASSERT_TRUE(doc.apply(*transaction));
    EXPECT_EQ(doc.text(), "[[Target]]");
    ASSERT_TRUE(transaction->selection.has_value());
    EXPECT_EQ(transaction->selection->head, 10u);

    option.actionable = false;
    EXPECT_FALSE(lm::wiki::completionTransaction(result, option).has_value());
}
