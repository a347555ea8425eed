#include <gtest/gtest.h>

#include "lm/find/buffer_search.hpp"

#include <optional>
#include <string>
#include <vector>

using lm::find::BufferSearch;
using lm::find::SearchMatch;
using lm::find::SearchPhase;
using lm::find::SearchState;
using lm::text::MemoryEditorHost;
using lm::text::Selection;

TEST(BufferSearch, CyclesThroughMatchesInOrder)
{
    MemoryEditorHost host("abcabc");
    BufferSearch search(host);

    search.setQuery("abc", false);
    EXPECT_EQ(search.phase(), SearchPhase::Active);
    EXPECT_EQ(search.matches(), (std::vector<SearchMatch>{{0, 3}, {3, 6}}));
    EXPECT_EQ(search.state(), (SearchState{2, 0}));

    ASSERT_TRUE(search.next());
    EXPECT_EQ(search.state().currentMatch, 1u);
    EXPECT_EQ(host.selection(), (Selection{0, 3}));
    EXPECT_EQ(host.lastScrollTarget(), 0u);

    ASSERT_TRUE(search.next());
    EXPECT_EQ(search.state().currentMatch, 2u);
    EXPECT_EQ(host.selection(), (Selection{3, 6}));

    ASSERT_TRUE(search.next());
    EXPECT_EQ(search.state().currentMatch, 1u);
}

TEST(BufferSearch, PrevWrapsToLastMatch)
{
    MemoryEditorHost host("one two one two one");
    BufferSearch search(host);
    search.setQuery("one", true);

    ASSERT_TRUE(search.prev());
    EXPECT_EQ(search.state(), (SearchState{3, 3}));
    ASSERT_TRUE(search.prev());
    EXPECT_EQ(search.state().currentMatch, 2u);
}

TEST(BufferSearch, ReplaceAllIsOneTransaction)
{
    MemoryEditorHost host("aaa");
    BufferSearch search(host);
    search.setQuery("a", false);

    EXPECT_EQ(search.replaceAll("b"), 3u);
    EXPECT_EQ(host.str(), "bbb");
    EXPECT_EQ(host.dispatchCount(), 1u);
    EXPECT_EQ(search.state().matchCount, 0u);
    EXPECT_EQ(search.query(), "a");
}

TEST(BufferSearch, ReplaceAllHandlesGrowingReplacement)
{
    MemoryEditorHost host("x-x-x");
    BufferSearch search(host);
    search.setQuery("x", false);

    EXPECT_EQ(search.replaceAll("xyz"), 3u);
    EXPECT_EQ(host.str(), "xyz-xyz-xyz");
    EXPECT_EQ(search.state().matchCount, 3u);
}

TEST(BufferSearch, MatchesCaseInsensitivelyByDefault)
{
    EXPECT_EQ(lm::find::findAllMatches("Foo foo FOO", "foo", false).size(), 3u);
    EXPECT_EQ(lm::find::findAllMatches("Foo foo FOO", "foo", true).size(), 1u);
    EXPECT_EQ(lm::find::findAllMatches("aaaa", "aa", false), (std::vector<SearchMatch>{{0, 2}, {2, 4}}));
    EXPECT_TRUE(lm::find::findAllMatches("abc", "", false).empty());
    EXPECT_TRUE(lm::find::findAllMatches("ab", "abc", false).empty());
}

TEST(BufferSearch, ReplaceCurrentSelectsFollowingMatch)
{
    MemoryEditorHost host("cat cat cat");
    BufferSearch search(host);
    search.setQuery("cat", false);
    ASSERT_TRUE(search.next());

    ASSERT_TRUE(search.replaceCurrent("dog"));
    EXPECT_EQ(host.str(), "dog cat cat");
    EXPECT_EQ(search.state(), (SearchState{2, 1}));
    EXPECT_EQ(host.selection(), (Selection{4, 7}));
}

TEST(BufferSearch, ReplacingLastMatchKeepsQuery)
{
    MemoryEditorHost host("x");
    BufferSearch search(host);
    search.setQuery("x", false);

    ASSERT_TRUE(search.replaceCurrent("y"));
    EXPECT_EQ(host.str(), "y");
    EXPECT_EQ(search.phase(), SearchPhase::Active);
    EXPECT_EQ(search.query(), "x");
    EXPECT_EQ(lm::find::describeSearchState(search.state()), "No results");
}

TEST(BufferSearch, EmptyMatchListIsNoOp)
{
    MemoryEditorHost host("nothing here");
    BufferSearch search(host);
    search.setQuery("zzz", false);

    EXPECT_FALSE(search.next());
    EXPECT_FALSE(search.prev());
    EXPECT_FALSE(search.replaceCurrent("a"));
    EXPECT_EQ(search.replaceAll("a"), 0u);
    EXPECT_EQ(host.dispatchCount(), 0u);
    EXPECT_EQ(host.str(), "nothing here");
}

TEST(BufferSearch, RescansAfterExternalEdits)
{
    MemoryEditorHost host("one");
    BufferSearch search(host);
    search.setQuery("one", false);
    ASSERT_TRUE(search.next());

    ASSERT_TRUE(host.dispatch({{{3, 3, " one"}}, std::nullopt}));
    search.refresh();
    EXPECT_EQ(search.state(), (SearchState{2, 0}));
}

TEST(BufferSearch, CloseReturnsToIdle)
{
    MemoryEditorHost host("abc");
    BufferSearch search(host);
    search.setQuery("ABC", true);
    EXPECT_TRUE(search.matches().empty());

    search.close();
    EXPECT_EQ(search.phase(), SearchPhase::Idle);
    EXPECT_TRUE(search.query().empty());
    EXPECT_FALSE(search.caseSensitive());
}

TEST(BufferSearch, DescribesState)
{
    EXPECT_EQ(lm::find::describeSearchState({0, 0}), "No results");
    EXPECT_EQ(lm::find::describeSearchState({1, 0}), "1 match");
    EXPECT_EQ(lm::find::describeSearchState({3, 0}), "3 matches");
    EXPECT_EQ(lm::find::describeSearchState({2, 1}), "1/2");
}
