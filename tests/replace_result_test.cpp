#include "replace_result.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using relex::MatchResult;
using relex::Pattern;
using relex::ReplaceResult;

TEST(ReplaceResult, CountsReplacements) {
    auto r = ReplaceResult::of(R"(/\d+/)", "X", "a1 b2 c3");
    EXPECT_EQ(r.result(), "aX bX cX");
    EXPECT_EQ(r.count(), 3u);
    EXPECT_TRUE(r.has_replacements());
    EXPECT_FALSE(r.unchanged());
    EXPECT_FALSE(r.is_list());
}

TEST(ReplaceResult, LimitCapsReplacements) {
    auto r = ReplaceResult::of(R"(/\d+/)", "X", "a1 b2 c3", 2);
    EXPECT_EQ(r.result(), "aX bX c3");
    EXPECT_EQ(r.count(), 2u);

    auto none = ReplaceResult::of(R"(/\d+/)", "X", "a1 b2 c3", 0);
    EXPECT_EQ(none.result(), "a1 b2 c3");
    EXPECT_TRUE(none.unchanged());
}

TEST(ReplaceResult, Unchanged) {
    auto r = ReplaceResult::of("/z/", "x", "abc");
    EXPECT_EQ(r.result(), "abc");
    EXPECT_EQ(r.count(), 0u);
    EXPECT_TRUE(r.unchanged());
    EXPECT_FALSE(r.has_replacements());
}

TEST(ReplaceResult, ChainedReplace) {
    auto r = ReplaceResult::of("/a/", "A", "abc").then("/b/", "B").then("/c/", "C");
    EXPECT_EQ(r.result(), "ABC");
    EXPECT_EQ(r.to_string(), "ABC");
    EXPECT_TRUE(r.equals("ABC"));
    EXPECT_FALSE(r.equals("abc"));
}

TEST(ReplaceResult, Backreferences) {
    EXPECT_EQ(ReplaceResult::of(R"(/(\w+) (\w+)/)", "$2 ${1}", "hello world").result(), "world hello");
    EXPECT_EQ(ReplaceResult::of(R"(/(\w+) (\w+)/)", R"(\2-\1)", "hello world").result(), "world-hello");
    EXPECT_EQ(ReplaceResult::of(R"(/(\d+)/)", "<$0>", "a12").result(), "a<12>");
    // Groups that do not exist expand to nothing
    EXPECT_EQ(ReplaceResult::of(R"(/(\d+)/)", "[$5]", "a12").result(), "a[]");
}

TEST(ReplaceResult, EmptyMatchesAreReplacedBetweenCharacters) {
    auto r = ReplaceResult::of("/x*/", "-", "abc");
    EXPECT_EQ(r.result(), "-a-b-c-");
    EXPECT_EQ(r.count(), 4u);
}

TEST(ReplaceResult, Callback) {
    auto r = ReplaceResult::of(R"(/\d+/)", [](const MatchResult& m) {
        return std::to_string(std::stoi(*m.result()) * 2);
    }, "a1 b20");
    EXPECT_EQ(r.result(), "a2 b40");
    EXPECT_EQ(r.count(), 2u);
    EXPECT_TRUE(r.replacement().is_callback());
}

TEST(ReplaceResult, CallbackSeesNamedGroups) {
    auto r = ReplaceResult::of(R"(/(?<name>\w+)@(?<host>\w+)/)", [](const MatchResult& m) {
        return *m.group("host") + ":" + *m.group("name");
    }, "mail alice@example now");
    EXPECT_EQ(r.result(), "mail example:alice now");
}

TEST(ReplaceResult, CallbackFailureBecomesReplaceError) {
    auto failing = [](const MatchResult&) -> std::string {
        throw std::runtime_error("callback broke");
    };
    try {
        ReplaceResult::of("/a/", failing, "abc");
        FAIL() << "expected replace_error";
    } catch (const relex::replace_error& e) {
        EXPECT_NE(std::string(e.what()).find("callback broke"), std::string::npos);
    }
}

TEST(ReplaceResult, SubjectList) {
    auto r = ReplaceResult::of("/a/", "b", std::vector<std::string>{"aa", "ca", "xyz"});
    EXPECT_TRUE(r.is_list());
    std::vector<std::string> expected = {"bb", "cb", "xyz"};
    EXPECT_EQ(r.results(), expected);
    EXPECT_EQ(r.count(), 3u);
    EXPECT_EQ(r.result(), "bbcbxyz");
    EXPECT_FALSE(r.equals("bbcbxyz"));
    EXPECT_EQ(r.subject(), "[array]");
}

TEST(ReplaceResult, ThenKeepsSubjectList) {
    auto r = ReplaceResult::of("/a/", "b", std::vector<std::string>{"aa", "ca"}).then("/b/", "c");
    std::vector<std::string> expected = {"cc", "cc"};
    EXPECT_EQ(r.results(), expected);
    EXPECT_TRUE(r.is_list());
}

TEST(ReplaceResult, PatternListWithReplacementList) {
    std::vector<std::string> patterns = {"/a/", "/b/"};
    auto r = ReplaceResult::of(patterns, std::vector<std::string>{"1", "2"}, "abab");
    EXPECT_EQ(r.result(), "1212");
    EXPECT_EQ(r.count(), 4u);
    EXPECT_EQ(r.pattern(), "/a/, /b/");
    EXPECT_TRUE(r.patterns().is_list());
}

TEST(ReplaceResult, MissingReplacementsAreEmpty) {
    std::vector<std::string> patterns = {"/a/", "/b/"};
    auto r = ReplaceResult::of(patterns, std::vector<std::string>{"1"}, "abc");
    EXPECT_EQ(r.result(), "1c");
}

TEST(ReplaceResult, PatternListAppliesInOrder) {
    std::vector<std::string> patterns = {"/a/", "/b/"};
    // The second pattern sees the output of the first
    EXPECT_EQ(ReplaceResult::of(patterns, "b", "ab").result(), "bb");
    EXPECT_EQ(ReplaceResult::of(patterns, "b", "ab").count(), 3u);
}

TEST(ReplaceResult, ReplacementListNeedsPatternList) {
    EXPECT_THROW(ReplaceResult::of("/a/", std::vector<std::string>{"1", "2"}, "abc"), relex::replace_error);
}

TEST(ReplaceResult, AcceptsPatternObjects) {
    auto r = ReplaceResult::of(Pattern::create(R"(\s+)"), "-", "a b  c");
    EXPECT_EQ(r.result(), "a-b-c");
    EXPECT_EQ(r.pattern(), R"(/\s+/)");

    std::vector<Pattern> patterns = {Pattern::create("A").i(), Pattern::create("b")};
    EXPECT_EQ(ReplaceResult::of(patterns, "_", "aAb").result(), "___");
}

TEST(ReplaceResult, MalformedPatternRaisesReplaceError) {
    EXPECT_THROW(ReplaceResult::of("/[invalid/", "x", "abc"), relex::replace_error);
}

TEST(ReplaceResult, EmptyCallbackIsRejected) {
    relex::ReplaceCallback empty;
    try {
        ReplaceResult::of("/a/", empty, "abc");
        FAIL() << "expected replace_error";
    } catch (const relex::replace_error& e) {
        EXPECT_STREQ(e.what(), "Invalid replacement callback provided for pattern \"/a/\"");
    }
}
