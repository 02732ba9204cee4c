#include "core/render_options.h"
#include <gtest/gtest.h>

TEST(RenderOptionsTest, SpeedIsClampedIntoRange) {
    StreamingConfig cfg;
    EXPECT_EQ(clampSpeed(0, cfg), cfg.minSpeed);
    EXPECT_EQ(clampSpeed(-5, cfg), cfg.minSpeed);
    EXPECT_EQ(clampSpeed(999, cfg), cfg.maxSpeed);
    EXPECT_EQ(clampSpeed(7, cfg), 7);
}

TEST(RenderOptionsTest, OutOfRangeSpeedBehavesAsBoundary) {
    StreamingConfig cfg;
    EXPECT_EQ(frameInterval(0, cfg), frameInterval(cfg.minSpeed, cfg));
    EXPECT_EQ(frameInterval(999, cfg), frameInterval(cfg.maxSpeed, cfg));
}

TEST(RenderOptionsTest, HigherSpeedMeansShorterInterval) {
    StreamingConfig cfg;
    for (int speed = cfg.minSpeed; speed < cfg.maxSpeed; speed++) {
        EXPECT_GT(frameInterval(speed, cfg), frameInterval(speed + 1, cfg));
    }
    EXPECT_EQ(frameInterval(1, cfg), std::chrono::milliseconds(500));
    EXPECT_EQ(frameInterval(10, cfg), std::chrono::milliseconds(50));
}

TEST(RenderOptionsTest, EffectiveTimeoutIsCappedByServerMaximum) {
    StreamingConfig cfg;
    cfg.maxTimeout = std::chrono::seconds(30);
    EXPECT_EQ(effectiveTimeout(100, cfg), std::chrono::seconds(30));
    EXPECT_EQ(effectiveTimeout(10, cfg), std::chrono::seconds(10));
}

TEST(RenderOptionsTest, ZeroTimeoutUsesServerDefault) {
    StreamingConfig cfg;
    cfg.defaultTimeout = std::chrono::seconds(30);
    cfg.maxTimeout = std::chrono::seconds(300);
    EXPECT_EQ(effectiveTimeout(0, cfg), std::chrono::seconds(30));

    cfg.maxTimeout = std::chrono::seconds(20);
    EXPECT_EQ(effectiveTimeout(0, cfg), std::chrono::seconds(20));
}

TEST(RenderOptionsTest, DefaultsComeFromConfig) {
    ShoutConfig cfg;
    cfg.fonts.defaultFont = "doom";
    cfg.text.defaultAlign = "right";
    cfg.streaming.defaultSpeed = 3;
    RenderOptions opts = makeDefaultRenderOptions(cfg);
    EXPECT_EQ(opts.font, "doom");
    EXPECT_EQ(opts.align, "right");
    EXPECT_EQ(opts.border, "none");
    EXPECT_EQ(opts.speed, 3);
    EXPECT_EQ(opts.timeout, 0);
}

TEST(RenderOptionsTest, ValidationRejectsBadValues) {
    RenderOptions opts;
    std::string error;
    EXPECT_TRUE(validateRenderOptions(opts, error)) << error;

    RenderOptions badAlign = opts;
    badAlign.align = "justify";
    EXPECT_FALSE(validateRenderOptions(badAlign, error));

    RenderOptions badBorder = opts;
    badBorder.border = "fancy";
    EXPECT_FALSE(validateRenderOptions(badBorder, error));

    RenderOptions badFont = opts;
    badFont.font = "../etc/passwd";
    EXPECT_FALSE(validateRenderOptions(badFont, error));

    RenderOptions badTimeout = opts;
    badTimeout.timeout = -1;
    EXPECT_FALSE(validateRenderOptions(badTimeout, error));

    RenderOptions badWidth = opts;
    badWidth.maxWidth = -10;
    EXPECT_FALSE(validateRenderOptions(badWidth, error));
}

TEST(RenderOptionsTest, SpeedAndColorAreNeverRejected) {
    RenderOptions opts;
    opts.speed = 999;
    opts.color = "plaid";
    std::string error;
    EXPECT_TRUE(validateRenderOptions(opts, error)) << error;
}

TEST(RenderOptionsTest, FontNamesArePlainIdentifiers) {
    EXPECT_TRUE(isValidFontName("standard"));
    EXPECT_TRUE(isValidFontName("3d"));
    EXPECT_TRUE(isValidFontName("big_money-ne"));
    EXPECT_FALSE(isValidFontName(""));
    EXPECT_FALSE(isValidFontName("a/b"));
    EXPECT_FALSE(isValidFontName(std::string(65, 'a')));
}
