#include "capture_mode.hpp"
#include "options.hpp"
#include <gtest/gtest.h>

using relex::CaptureMode;

TEST(CaptureMode, Names) {
    EXPECT_EQ(relex::capture_mode::to_string(CaptureMode::All), "all");
    EXPECT_EQ(relex::capture_mode::to_string(CaptureMode::First), "first");
    EXPECT_EQ(relex::capture_mode::to_string(CaptureMode::AllButFirst), "all_but_first");
    EXPECT_EQ(relex::capture_mode::to_string(CaptureMode::Named), "named");
    EXPECT_EQ(relex::capture_mode::to_string(CaptureMode::None), "none");
}

TEST(CaptureMode, Descriptions) {
    EXPECT_EQ(relex::capture_mode::description(CaptureMode::First), "Capture only the first group");
    EXPECT_EQ(relex::capture_mode::description(CaptureMode::None), "No capture, boolean match only");
}

TEST(MatchFlag, CombineOrsValues) {
    using relex::MatchFlag;
    EXPECT_EQ(relex::options::combine(std::vector<MatchFlag>{MatchFlag::OffsetCapture, MatchFlag::UnmatchedAsNull}), 768);
    EXPECT_EQ(relex::options::combine(std::vector<MatchFlag>{}), 0);
    EXPECT_TRUE(relex::options::has_flag(768, MatchFlag::OffsetCapture));
    EXPECT_FALSE(relex::options::has_flag(768, MatchFlag::SetOrder));
    EXPECT_EQ(relex::options::description(MatchFlag::OffsetCapture), "Include byte offsets with matches");
}

TEST(SplitFlag, CombineOrsValues) {
    using relex::SplitFlag;
    int mask = relex::options::combine(std::vector<SplitFlag>{SplitFlag::NoEmpty, SplitFlag::DelimCapture});
    EXPECT_EQ(mask, 3);
    EXPECT_TRUE(relex::options::has_flag(mask, SplitFlag::DelimCapture));
}
