#include "termbar/bar/styles.hpp"
#include <gtest/gtest.h>

using namespace termbar::bar;

TEST(ParseAnimationTest, AcceptsSpellings) {
    EXPECT_EQ(parseAnimation("tqdm"), Animation::TQDM);
    EXPECT_EQ(parseAnimation("tqdm-ascii"), Animation::TQDM_ASCII);
    EXPECT_EQ(parseAnimation("FillUp"), Animation::FILL_UP);
    EXPECT_EQ(parseAnimation("fira_code"), Animation::FIRA_CODE);
    EXPECT_FALSE(parseAnimation("sparkles").has_value());
}

TEST(ParseAnimationTest, NamesRoundTrip) {
    for (auto animation : {Animation::TQDM, Animation::TQDM_ASCII, Animation::FILL_UP,
                           Animation::CLASSIC, Animation::ARROW, Animation::FIRA_CODE}) {
        EXPECT_EQ(parseAnimation(animationName(animation)), animation);
    }
}

TEST(ResolveStyleTest, BuiltInFamilies) {
    auto tqdm = resolveStyle(Animation::TQDM, false, " ", {});
    EXPECT_EQ(tqdm.glyphs.size(), 9u);
    EXPECT_EQ(tqdm.glyphs.back(), "\xe2\x96\x88");
    EXPECT_EQ(tqdm.spinner, charsets::classicSpinner());

    auto classic = resolveStyle(Animation::CLASSIC, false, " ", {});
    EXPECT_EQ(classic.glyphs, std::vector<std::string>{"#"});
    EXPECT_EQ(classic.fill, ".");
    EXPECT_EQ(familyOf(classic.animation), MeterFamily::SOLID);

    auto fira = resolveStyle(Animation::FIRA_CODE, false, " ", {});
    EXPECT_EQ(fira.spinner.size(), 6u);
    EXPECT_EQ(fira.fill, charsets::FIRA_CODE_FILL);
}

TEST(ResolveStyleTest, AsciiOverridesAnimation) {
    auto style = resolveStyle(Animation::ARROW, true, " ", {});
    EXPECT_EQ(style.animation, Animation::TQDM_ASCII);
    EXPECT_EQ(style.glyphs, charsets::ascii());
}

TEST(ResolveStyleTest, CustomCharsetSwitchesToBlockFamily) {
    std::vector<std::string> custom = {" ", "-", "="};
    auto style = resolveStyle(Animation::CLASSIC, false, "_", custom);
    EXPECT_EQ(style.animation, Animation::TQDM);
    EXPECT_EQ(style.glyphs, custom);
    EXPECT_EQ(style.fill, "_");
}
