// gui/tests/test_loader_progress.cpp: progress clamping, description and fill tween
#include <gtest/gtest.h>

#include "test_support.hpp"

#include <algorithm>

using cfl::CircularLoader;
using cfl_test::FakeClock;

TEST(LoaderProgress, ClampsAndDescribes)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);

    for (int p : {-1000, -1, 0, 1, 37, 99, 100, 101, 1000}) {
        l->setProgress(p);
        const int expected = std::clamp(p, 0, 100);
        EXPECT_EQ(l->progress(), expected) << "p=" << p;
        EXPECT_EQ(l->description(), QStringLiteral("Loading: %1 percent").arg(expected)) << "p=" << p;
        EXPECT_EQ(l->targetWaterLevelRatio(), 1.0f - static_cast<float>(expected) / 100.0f)
            << "p=" << p;
    }
}

TEST(LoaderProgress, InitialStateDescribesZero)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    EXPECT_EQ(l->progress(), 0);
    EXPECT_EQ(l->description(), QStringLiteral("Loading: 0 percent"));
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 1.0f);
}

TEST(LoaderProgress, ConstructionOptionIsApplied)
{
    FakeClock clock;
    cfl::LoaderOptions opts;
    opts.progress = 150;
    auto l = cfl_test::makeLoader(clock, opts);
    EXPECT_EQ(l->progress(), 100);
    EXPECT_FLOAT_EQ(l->targetWaterLevelRatio(), 0.0f);
    EXPECT_TRUE(l->isFillAnimating());
}

TEST(LoaderProgress, ZeroDurationJumpsAndFormatsText)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);

    l->setProgress(80, 0);
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 0.2f);
    EXPECT_FALSE(l->isFillAnimating());

    l->setShowProgressText(true);
    l->setProgressTextFormat(QStringLiteral("%d%%"));
    ASSERT_TRUE(l->displayText().has_value());
    EXPECT_EQ(*l->displayText(), QStringLiteral("80%"));
}

TEST(LoaderProgress, NegativeDurationIsImmediate)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setProgress(40, -250);
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 0.6f);
    EXPECT_FALSE(l->isFillAnimating());
}

TEST(LoaderProgress, EasesOutTowardsTarget)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setProgress(0, 0);

    l->setProgress(100, 1000);
    EXPECT_TRUE(l->isFillAnimating());
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 1.0f);

    clock.now = 500;
    EXPECT_TRUE(l->advance());
    // out-quad at t=0.5 covers 75% of the distance
    EXPECT_NEAR(l->waterLevelRatio(), 0.25f, 1e-4f);

    clock.now = 1000;
    l->advance();
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 0.0f);
    EXPECT_FALSE(l->isFillAnimating());

    clock.now = 1200;
    EXPECT_FALSE(l->advance());
}

TEST(LoaderProgress, RetargetStartsFromCurrentValue)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setProgress(0, 0);
    l->setProgress(100, 1000);

    clock.now = 500;
    l->advance();
    const float mid = l->waterLevelRatio();

    l->setProgress(0, 1000);
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), mid);   // no snapping
    EXPECT_FLOAT_EQ(l->targetWaterLevelRatio(), 1.0f);

    clock.now = 1000;
    l->advance();
    EXPECT_GT(l->waterLevelRatio(), mid);
    EXPECT_LT(l->waterLevelRatio(), 1.0f);

    clock.now = 1500;
    l->advance();
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 1.0f);
    EXPECT_FALSE(l->isFillAnimating());
}

TEST(LoaderProgress, RetargetAfterSkippedTicksStartsFromLevelNow)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setProgress(0, 0);
    l->setProgress(100, 1000);

    // host never ticked in between
    clock.now = 500;
    l->setProgress(0, 1000);
    EXPECT_NEAR(l->waterLevelRatio(), 0.25f, 1e-4f);
    EXPECT_TRUE(l->isFillAnimating());

    clock.now = 1500;
    l->advance();
    EXPECT_FLOAT_EQ(l->waterLevelRatio(), 1.0f);
}

TEST(LoaderProgress, RequestsRedraw)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    int redraws = 0;
    l->setRedrawRequest([&redraws]() { ++redraws; });

    l->setProgress(30, 0);
    EXPECT_GE(redraws, 1);
}

TEST(LoaderProgress, AmplitudeIsClampedToDefaultMaximum)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);

    l->setAmplitudeRatio(0.2f);
    EXPECT_FLOAT_EQ(l->amplitudeRatio(), cfl::kDefaultAmplitudeRatio);
    l->setAmplitudeRatio(-1.0f);
    EXPECT_FLOAT_EQ(l->amplitudeRatio(), 0.0f);
    l->setAmplitudeRatio(0.02f);
    EXPECT_FLOAT_EQ(l->amplitudeRatio(), 0.02f);
}

TEST(LoaderProgress, NegativeSizesClampToZero)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);

    l->setBorderWidth(-5.0f);
    EXPECT_FLOAT_EQ(l->borderWidth(), 0.0f);
    l->setTextSize(-3.0f);
    EXPECT_FLOAT_EQ(l->textState().font.size, 0.0f);
    l->setAutoSizeMinTextSize(-1.0f);
    EXPECT_FLOAT_EQ(l->autoSizeState().minSize, 0.0f);
}
