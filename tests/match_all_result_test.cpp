#include "match_all_result.hpp"
#include "errors.hpp"
#include "options.hpp"
#include <iterator>
#include <gtest/gtest.h>

using relex::CaptureMode;
using relex::GroupKey;
using relex::MatchAllResult;
using relex::MatchResult;

TEST(MatchAllResult, ResultsInSubjectOrder) {
    auto all = MatchAllResult::of(R"(/\d+/)", "a1 b22 c333");
    EXPECT_TRUE(all.has_match());
    EXPECT_FALSE(all.is_empty());
    EXPECT_EQ(all.count(), 3u);
    std::vector<std::string> expected = {"1", "22", "333"};
    EXPECT_EQ(all.results(), expected);
}

TEST(MatchAllResult, NoMatches) {
    auto all = MatchAllResult::of(R"(/\d+/)", "abc");
    EXPECT_FALSE(all.has_match());
    EXPECT_TRUE(all.is_empty());
    EXPECT_EQ(all.count(), 0u);
    EXPECT_FALSE(all.first().has_value());
    EXPECT_FALSE(all.last().has_value());
    EXPECT_TRUE(all.results().empty());
}

TEST(MatchAllResult, FirstLastAndGet) {
    auto all = MatchAllResult::of(R"(/\d+/)", "a1 b22 c333");
    EXPECT_EQ(all.first()->result(), "1");
    EXPECT_EQ(all.last()->result(), "333");
    EXPECT_EQ(all.get(1)->result(), "22");
    EXPECT_FALSE(all.get(3).has_value());
    EXPECT_EQ(all.get(0)->subject(), "a1 b22 c333");
    EXPECT_EQ(all.get(0)->pattern(), R"(/\d+/)");
}

TEST(MatchAllResult, AllMaterializesEveryMatch) {
    auto matches = MatchAllResult::of(R"(/(\w)=(\d)/)", "a=1 b=2").all();
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].group(1), "a");
    EXPECT_EQ(matches[1].group(2), "2");
}

TEST(MatchAllResult, EmptyMatchesAdvance) {
    std::vector<std::string> expected = {"", "aa", ""};
    EXPECT_EQ(MatchAllResult::of("/a*/", "baa").results(), expected);
}

TEST(MatchAllResult, Utf8ModeAdvancesByCharacter) {
    EXPECT_EQ(MatchAllResult::of("/./u", "h\xC3\xA9llo").count(), 5u);
    EXPECT_EQ(MatchAllResult::of("/./", "h\xC3\xA9llo").count(), 6u);
}

TEST(MatchAllResult, StartOffset) {
    auto all = MatchAllResult::of(R"(/\d/)", "1 2 3", 0, 1);
    std::vector<std::string> expected = {"2", "3"};
    EXPECT_EQ(all.results(), expected);
}

TEST(MatchAllResult, RangeForYieldsMatchResults) {
    auto all = MatchAllResult::of(R"(/(\w)=(\d)/)", "a=1 b=2 c=3");
    std::vector<std::string> keys;
    for (const auto& m : all) {
        EXPECT_TRUE(m.has_match());
        keys.push_back(m.group_or(1, ""));
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(std::distance(all.begin(), all.end()), 3);

    auto none = MatchAllResult::of(R"(/\d/)", "abc");
    EXPECT_TRUE(none.begin() == none.end());
}

TEST(MatchAllResult, OffsetCaptureKeepsPositions) {
    int flags = static_cast<int>(relex::MatchFlag::OffsetCapture);
    auto all = MatchAllResult::of(R"(/(?<num>\d+)/)", "a1 b22", flags);
    ASSERT_TRUE(all.has_positions());
    EXPECT_EQ(all.get(1)->position("num"), relex::Position(4, 2));

    auto skipped = all.skip(1);
    EXPECT_EQ(skipped.first()->position(), relex::Position(4, 2));

    auto first = all.capture(CaptureMode::First);
    EXPECT_EQ(first.get(0)->position(1), relex::Position(1, 1));

    EXPECT_FALSE(MatchAllResult::of(R"(/\d/)", "1").has_positions());
    EXPECT_FALSE(MatchAllResult::of(R"(/\d/)", "1").first()->positions().has_value());
}

TEST(MatchAllResult, PluckByNameAndIndex) {
    auto all = MatchAllResult::of(R"(/(?<word>[a-z]+)(\d)?/)", "ab1 cd");
    std::vector<std::optional<std::string>> words = {std::string("ab"), std::string("cd")};
    EXPECT_EQ(all.pluck("word"), words);

    std::vector<std::optional<std::string>> digits = {std::string("1"), std::nullopt};
    EXPECT_EQ(all.pluck(2), digits);

    std::vector<std::optional<std::string>> missing = {std::nullopt, std::nullopt};
    EXPECT_EQ(all.pluck("missing"), missing);
}

TEST(MatchAllResult, NamedCaptures) {
    auto named = MatchAllResult::of(R"(/(?<key>\w)=(?<value>\d)/)", "a=1 b=2").named_captures();
    ASSERT_EQ(named.size(), 2u);
    std::vector<GroupKey> keys = {std::string("key"), std::string("value")};
    EXPECT_EQ(named[0].keys(), keys);
    EXPECT_EQ(*named[1].find("value"), std::optional<std::string>("2"));
}

TEST(MatchAllResult, FilterRebuildsCount) {
    auto all = MatchAllResult::of(R"(/\d+/)", "a1 b22 c333");
    auto longer = all.filter([](const MatchResult& m) { return m.result()->size() > 1; });
    EXPECT_EQ(longer.count(), 2u);
    std::vector<std::string> expected = {"22", "333"};
    EXPECT_EQ(longer.results(), expected);
    EXPECT_EQ(all.count(), 3u);
}

TEST(MatchAllResult, MapAndReduce) {
    auto all = MatchAllResult::of(R"(/\d+/)", "a1 b22 c333");
    auto lengths = all.map([](const MatchResult& m) { return m.result()->size(); });
    std::vector<size_t> expected = {1, 2, 3};
    EXPECT_EQ(lengths, expected);

    int sum = all.reduce([](int carry, const MatchResult& m) { return carry + std::stoi(*m.result()); }, 0);
    EXPECT_EQ(sum, 356);
}

TEST(MatchAllResult, EachPassesIndex) {
    std::vector<std::string> seen;
    MatchAllResult::of(R"(/\d/)", "1 2").each([&seen](const MatchResult& m, size_t i) {
        seen.push_back(std::to_string(i) + ":" + *m.result());
    });
    std::vector<std::string> expected = {"0:1", "1:2"};
    EXPECT_EQ(seen, expected);
}

TEST(MatchAllResult, TakeAndSkip) {
    auto all = MatchAllResult::of(R"(/\d/)", "1 2 3 4");
    std::vector<std::string> first_two = {"1", "2"};
    std::vector<std::string> last_one = {"4"};
    EXPECT_EQ(all.take(2).results(), first_two);
    EXPECT_EQ(all.skip(3).results(), last_one);
    EXPECT_EQ(all.take(10).count(), 4u);
    EXPECT_TRUE(all.skip(10).is_empty());
}

TEST(MatchAllResult, CaptureNoneHasNoEntries) {
    auto all = MatchAllResult::of(R"(/\d/)", "1 2 3");
    auto none = all.capture(CaptureMode::None);
    EXPECT_EQ(none.count(), 0u);
    EXPECT_TRUE(none.is_empty());
    EXPECT_TRUE(none.results().empty());
}

TEST(MatchAllResult, CaptureFirstKeepsOnlyGroupOne) {
    auto first = MatchAllResult::of(R"(/(\w)(\d)/)", "a1 b2").capture(CaptureMode::First);
    ASSERT_EQ(first.count(), 2u);
    const auto& groups = first.matches()[0];
    EXPECT_EQ(groups.size(), 1u);
    EXPECT_TRUE(groups.contains(1));
    EXPECT_FALSE(groups.contains(0));
    EXPECT_EQ(first.get(1)->group(1), "b");
}

TEST(MatchAllResult, CaptureFirstWithUnmatchedGroup) {
    auto first = MatchAllResult::of("/x(y)?/", "x").capture(CaptureMode::First);
    EXPECT_EQ(first.count(), 1u);
    EXPECT_TRUE(first.matches()[0].empty());
}

TEST(MatchAllResult, CaptureAllButFirstDropsFullMatch) {
    auto rest = MatchAllResult::of(R"(/(\w)(\d)/)", "a1").capture(CaptureMode::AllButFirst);
    const auto& groups = rest.matches()[0];
    EXPECT_FALSE(groups.contains(0));
    EXPECT_TRUE(groups.contains(1));
    EXPECT_TRUE(groups.contains(2));
}

TEST(MatchAllResult, CaptureNamedAndAll) {
    auto all = MatchAllResult::of(R"(/(?<k>\w)(\d)/)", "a1 b2");
    auto named = all.capture(CaptureMode::Named);
    std::vector<GroupKey> keys = {std::string("k")};
    EXPECT_EQ(named.matches()[1].keys(), keys);
    EXPECT_EQ(all.capture(CaptureMode::All).matches(), all.matches());
}

TEST(MatchAllResult, MalformedPatternRaisesMatchError) {
    EXPECT_THROW(MatchAllResult::of("/[invalid/", "abc"), relex::match_error);
}
