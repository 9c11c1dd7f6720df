#include "errors.hpp"
#include <gtest/gtest.h>

using namespace relex;

TEST(Errors, InvalidSyntaxMessage) {
    auto e = pattern_compilation_error::invalid_syntax("/[a/", "missing terminating ]");
    EXPECT_STREQ(e.what(), "Invalid regex pattern \"/[a/\": missing terminating ]");
}

TEST(Errors, LongPatternsAreTruncated) {
    std::string pattern = "/" + std::string(60, 'a') + "/";
    auto e = pattern_compilation_error::invalid_syntax(pattern, "err");
    std::string expected = "Invalid regex pattern \"/" + std::string(49, 'a') + "...\": err";
    EXPECT_EQ(std::string(e.what()), expected);
}

TEST(Errors, MissingDelimiterMessage) {
    auto e = pattern_compilation_error::missing_delimiter("abc");
    EXPECT_STREQ(e.what(), "Pattern \"abc\" is missing delimiters. Expected format: /pattern/modifiers");
}

TEST(Errors, InvalidModifierMessage) {
    auto e = pattern_compilation_error::invalid_modifier("q");
    EXPECT_STREQ(e.what(), "Invalid pattern modifier \"q\". Valid modifiers are: i, m, s, x, u, A, D, U, J, S");
}

TEST(Errors, MatchMessages) {
    EXPECT_STREQ(match_error::match_failed("/a/", "b", "boom").what(),
                 "Error matching pattern \"/a/\" against subject \"b\": boom");
    EXPECT_STREQ(match_error::match_all_failed("/a/", "b", "boom").what(),
                 "Error matching all occurrences of pattern \"/a/\" in subject \"b\": boom");
}

TEST(Errors, SubjectsAreTruncatedToForty) {
    std::string subject(45, 'x');
    auto e = match_error::match_failed("/a/", subject, "boom");
    std::string expected = "Error matching pattern \"/a/\" against subject \"" + std::string(40, 'x') + "...\": boom";
    EXPECT_EQ(std::string(e.what()), expected);
}

TEST(Errors, ReplaceAndSplitMessages) {
    EXPECT_STREQ(replace_error::failed("/a/", "abc", "boom").what(),
                 "Error replacing pattern \"/a/\" in subject \"abc\": boom");
    EXPECT_STREQ(replace_error::invalid_callback("/a/").what(),
                 "Invalid replacement callback provided for pattern \"/a/\"");
    EXPECT_STREQ(split_error::failed("/,/", "a,b", "boom").what(),
                 "Error splitting subject \"a,b\" by pattern \"/,/\": boom");
}

TEST(Errors, GroupNotFoundMessages) {
    EXPECT_STREQ(group_not_found_error::by_index(5, "/(\\d+)/").what(),
                 "Capture group 5 does not exist in pattern \"/(\\d+)/\"");
    EXPECT_STREQ(group_not_found_error::by_name("year", "/(\\d+)/").what(),
                 "Named capture group \"year\" does not exist in pattern \"/(\\d+)/\"");
}

TEST(Errors, AllDeriveFromRelexError) {
    EXPECT_THROW(throw pattern_compilation_error::missing_delimiter("x"), relex_error);
    EXPECT_THROW(throw match_error::match_failed("/a/", "b", "c"), relex_error);
    EXPECT_THROW(throw replace_error::invalid_callback("/a/"), relex_error);
    EXPECT_THROW(throw split_error::failed("/a/", "b", "c"), relex_error);
    EXPECT_THROW(throw group_not_found_error::by_index(1, "/a/"), std::runtime_error);
}
