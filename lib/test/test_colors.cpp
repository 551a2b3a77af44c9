#include <iostream>
#include <stdexcept>

#include "ball_types.hpp"
#include "colors.hpp"
#include "table_heuristics.hpp"
#include "test_support.hpp"

static void testRgbToHsv() {
    HSVColor red = rgbToHsv({255, 0, 0});
    CHECK_NEAR(red.h, 0.0, 1e-9);
    CHECK_NEAR(red.s, 100.0, 1e-9);
    CHECK_NEAR(red.v, 100.0, 1e-9);

    CHECK_NEAR(rgbToHsv({0, 255, 0}).h, 120.0, 1e-9);
    CHECK_NEAR(rgbToHsv({0, 0, 255}).h, 240.0, 1e-9);

    // Red with a touch of blue sits just below 360, never at 360.
    HSVColor crimson = rgbToHsv({220, 20, 60});
    CHECK(crimson.h > 340.0 && crimson.h < 360.0);

    HSVColor gray = rgbToHsv({128, 128, 128});
    CHECK_NEAR(gray.s, 0.0, 1e-9);
    CHECK_NEAR(gray.h, 0.0, 1e-9);

    HSVColor black = rgbToHsv({0, 0, 0});
    CHECK_NEAR(black.v, 0.0, 1e-9);
}

static void testHsvRoundTrip() {
    const RGBColor samples[] = {{250, 250, 248}, {230, 200, 30}, {20, 150, 160}, {160, 25, 15},
                                {10, 10, 10},    {255, 107, 53}, {65, 105, 225}, {139, 69, 19}};
    for (const auto& rgb : samples) {
        RGBColor back = hsvToRgb(rgbToHsv(rgb));
        CHECK_NEAR(back.r, rgb.r, 1);
        CHECK_NEAR(back.g, rgb.g, 1);
        CHECK_NEAR(back.b, rgb.b, 1);
    }
}

static void testHueWraparound() {
    HSVColor lo{340, 50, 20};
    HSVColor hi{10, 100, 100};
    CHECK(isColorInRange({355, 80, 60}, lo, hi));
    CHECK(isColorInRange({5, 80, 60}, lo, hi));
    CHECK(isColorInRange({0, 80, 60}, lo, hi));
    CHECK(!isColorInRange({20, 80, 60}, lo, hi));
    CHECK(!isColorInRange({330, 80, 60}, lo, hi));
    // Saturation and value do not wrap.
    CHECK(!isColorInRange({355, 40, 60}, lo, hi));

    CHECK_NEAR(hueDifference(350, 10), 20.0, 1e-9);
    CHECK_NEAR(hueDifference(10, 350), 20.0, 1e-9);
    CHECK_NEAR(hueDifference(0, 180), 180.0, 1e-9);

    CHECK_NEAR(colorDistance({10, 50, 50}, {10, 50, 50}), 0.0, 1e-12);
    CHECK(colorDistance({355, 80, 60}, {5, 80, 60}) < colorDistance({20, 80, 60}, {5, 80, 60}));
}

static void testHexConversion() {
    CHECK(rgbToHex({255, 107, 53}) == "#ff6b35");
    CHECK(rgbToHex({0, 0, 0}) == "#000000");

    RGBColor c = hexToRgb("#FF6B35");
    CHECK(c.r == 255 && c.g == 107 && c.b == 53);
    RGBColor bare = hexToRgb("4169e1");
    CHECK(bare.r == 65 && bare.g == 105 && bare.b == 225);

    CHECK_THROWS(hexToRgb("#12345"), std::invalid_argument);
    CHECK_THROWS(hexToRgb("#zz0000"), std::invalid_argument);
}

static void testWhiteBalanceAndDominantColor() {
    RGBColor balanced = autoWhiteBalance({100, 100, 100});
    CHECK(balanced.r == 128 && balanced.g == 128 && balanced.b == 128);
    RGBColor dark = autoWhiteBalance({0, 0, 0});
    CHECK(dark.r == 0 && dark.g == 0 && dark.b == 0);

    cv::Mat image = makeTable(60, 60, {30, 120, 40});
    drawBall(image, {30, 30}, 12, {230, 200, 30});

    RGBColor inner = getDominantColor(image, cv::Point2f(30, 30), 7);
    CHECK(inner.r == 230 && inner.g == 200 && inner.b == 30);

    // Disk entirely outside the frame samples nothing.
    RGBColor none = getDominantColor(image, cv::Point2f(-50, -50), 5);
    CHECK(none.r == 0 && none.g == 0 && none.b == 0);

    // Partially outside: only in-frame pixels count.
    RGBColor corner = getDominantColor(image, cv::Point2f(0, 0), 4);
    CHECK(corner.r == 30 && corner.g == 120 && corner.b == 40);
}

static void testTableHeuristics() {
    CHECK(TableHeuristics::isTableFelt({20, 150, 160}));
    CHECK(TableHeuristics::isTableFelt({40, 160, 60}));
    CHECK(!TableHeuristics::isTableFelt({255, 255, 255}));

    CHECK(TableHeuristics::isPocketOrShadow({5, 5, 5}, false));
    CHECK(TableHeuristics::isPocketOrShadow({20, 20, 20}, true));
    CHECK(!TableHeuristics::isPocketOrShadow({20, 20, 20}, false));

    CHECK(TableHeuristics::isBallColor({255, 255, 255}));
    CHECK(TableHeuristics::isBallColor({230, 200, 30}));
    CHECK(TableHeuristics::isBallColor({40, 40, 40}));
    CHECK(!TableHeuristics::isBallColor({20, 150, 160}));
    CHECK(!TableHeuristics::isBallColor({128, 128, 128}));

    CHECK(TableHeuristics::isCueBallPixel({250, 250, 248}));
    CHECK(!TableHeuristics::isCueBallPixel({230, 200, 30}));
}

static void testGameModeNames() {
    CHECK(parseGameMode("pool") == GameMode::POOL);
    CHECK(parseGameMode("Snooker") == GameMode::SNOOKER);
    CHECK(gameModeToString(GameMode::SNOOKER) == "snooker");
    CHECK_THROWS(parseGameMode("carom"), std::invalid_argument);
    CHECK(ballTypeToString(BallType::STRIPES) == "stripes");
}

int main() {
    testRgbToHsv();
    testHsvRoundTrip();
    testHueWraparound();
    testHexConversion();
    testWhiteBalanceAndDominantColor();
    testTableHeuristics();
    testGameModeNames();
    return finishTest("colors");
}
