#include "termbar/bar/render.hpp"
#include "termbar/format/format_utils.hpp"
#include <gtest/gtest.h>

using namespace termbar;
using namespace termbar::bar;

namespace {

BarOptions boundedOptions(uint64_t total) {
    BarOptions options;
    options.total = total;
    return options;
}

}

TEST(ProgressFractionTest, ClampedToUnitInterval) {
    for (uint64_t n = 0; n <= 37; ++n) {
        double progress = render::progressFraction(n, 37);
        EXPECT_GE(progress, 0.0);
        EXPECT_LE(progress, 1.0);
    }
    EXPECT_EQ(render::progressFraction(37, 37), 1.0);
    EXPECT_EQ(render::progressFraction(50, 37), 1.0);
    EXPECT_EQ(render::progressFraction(5, 0), 0.0);
}

TEST(RenderLeftTest, PercentagePadding) {
    auto options = boundedOptions(100);
    EXPECT_EQ(render::left(options, 0.05), "  5%");
    EXPECT_EQ(render::left(options, 0.5), " 50%");
    EXPECT_EQ(render::left(options, 1.0), "100%");

    options.desc = "Copying";
    EXPECT_EQ(render::left(options, 0.5), "Copying:  50%");
}

TEST(RenderRightTest, CountsTimesAndRate) {
    auto options = boundedOptions(10);
    EXPECT_EQ(render::right(options, Snapshot{2.0, 2.5}, 5), " 5/10 [00:02<00:02, 2.50it/s]");
}

TEST(RenderRightTest, ZeroCountHasUnknownRate) {
    auto options = boundedOptions(10);
    EXPECT_EQ(render::right(options, Snapshot{3.0, 0.0}, 0), " 0/10 [00:03<00:00, ?it/s]");
}

TEST(RenderRightTest, ZeroRateMidRunUsesPlaceholder) {
    auto options = boundedOptions(10);
    EXPECT_EQ(render::right(options, Snapshot{0.0, 0.0}, 4), " 4/10 [00:00<00:00, ?it/s]");
}

TEST(RenderRightTest, UnitScaleAndPostfix) {
    auto options = boundedOptions(2000);
    options.unit = "B";
    options.unit_scale = true;
    options.postfix = ", file=a.bin";
    EXPECT_EQ(render::right(options, Snapshot{1.0, 1500.0}, 1500),
              " 1.50k/2.00k [00:01<00:00, 1.50kB/s, file=a.bin]");
}

TEST(RenderMeterTest, BlockStyleSubCharacterResolution) {
    auto style = resolveStyle(Animation::TQDM, false, " ", {});
    EXPECT_EQ(render::meter(style, std::nullopt, 0.5, 10),
              "|\xe2\x96\x88\xe2\x96\x88\xe2\x96\x88\xe2\x96\x88\xe2\x96\x88\xe2\x96\x8f    |");
    EXPECT_EQ(render::meter(style, std::nullopt, 1.0, 3),
              "|\xe2\x96\x88\xe2\x96\x88\xe2\x96\x88|");
}

TEST(RenderMeterTest, AsciiRemainderGlyph) {
    auto style = resolveStyle(Animation::TQDM_ASCII, false, " ", {});
    EXPECT_EQ(render::meter(style, std::nullopt, 0.25, 10), "|##6       |");
    EXPECT_EQ(render::meter(style, std::nullopt, 0.0, 4), "|1   |");
}

TEST(RenderMeterTest, MeterWidthIsExact) {
    auto style = resolveStyle(Animation::TQDM, false, " ", {});
    for (int i = 0; i <= 20; ++i) {
        std::string meter = render::meter(style, std::nullopt, i / 20.0, 17);
        EXPECT_EQ(format::displayWidth(meter), 19u) << "progress " << i / 20.0;
    }
}

TEST(RenderMeterTest, SolidStyles) {
    auto classic = resolveStyle(Animation::CLASSIC, false, " ", {});
    EXPECT_EQ(render::meter(classic, std::nullopt, 0.3, 10), "[###.......]");

    auto arrow = resolveStyle(Animation::ARROW, false, " ", {});
    EXPECT_EQ(render::meter(arrow, std::nullopt, 0.5, 10), "[=====>    ]");
    EXPECT_EQ(render::meter(arrow, std::nullopt, 0.95, 10), "[=========>]");
    EXPECT_EQ(render::meter(arrow, std::nullopt, 1.0, 10), "[==========]");
}

TEST(RenderMeterTest, FiraCodeLigatures) {
    auto fira = resolveStyle(Animation::FIRA_CODE, false, " ", {});
    std::string expected = std::string(charsets::FIRA_CODE_OPEN) +
                           charsets::FIRA_CODE_BLOCK + charsets::FIRA_CODE_BLOCK +
                           charsets::FIRA_CODE_FILL + charsets::FIRA_CODE_FILL +
                           charsets::FIRA_CODE_CLOSE;
    EXPECT_EQ(render::meter(fira, std::nullopt, 0.5, 4), expected);

    std::string done = render::meter(fira, std::nullopt, 1.0, 4);
    EXPECT_EQ(done.substr(done.size() - 3), charsets::FIRA_CODE_CLOSE_DONE);
}

TEST(RenderMeterTest, ColourWrapsGlyphsNotBrackets) {
    auto style = resolveStyle(Animation::TQDM_ASCII, false, " ", {});
    EXPECT_EQ(render::meter(style, std::string("\x1b[32m"), 1.0, 4), "|\x1b[32m####\x1b[0m|");

    auto classic = resolveStyle(Animation::CLASSIC, false, " ", {});
    EXPECT_EQ(render::meter(classic, std::string("\x1b[31m"), 0.5, 2), "[\x1b[31m#.\x1b[0m]");
}

TEST(RenderIndefiniteTest, SpinnerCountAndRate) {
    BarOptions options;
    options.desc = "dl";
    options.unit = "B";
    EXPECT_EQ(render::indefinite(options, Snapshot{3.0, 2.0}, 6, "|"), "| dl: 6 [00:03, 2.00B/s]");

    options.desc.clear();
    EXPECT_EQ(render::indefinite(options, Snapshot{0.0, 0.0}, 0, "-"), "- 0 [00:00, ?B/s]");
}
