// gui/tests/test_wave_loop.cpp: wave phase loop lifecycle
#include <gtest/gtest.h>

#include "test_support.hpp"

using cfl_test::FakeClock;

TEST(WaveLoop, StartsOnlyWhenActive)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    EXPECT_FALSE(l->isWaveRunning());

    l->onActivate();
    EXPECT_TRUE(l->isWaveRunning());
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.0f);
}

TEST(WaveLoop, AdvancesAndWraps)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();

    clock.now = 250;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.25f);

    clock.now = 750;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.75f);

    clock.now = 1250;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.25f);
}

TEST(WaveLoop, DisableFreezesAndEnableRestartsAtZero)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();

    clock.now = 400;
    l->advance();
    l->setWaveEnabled(false);
    EXPECT_FALSE(l->isWaveRunning());

    clock.now = 900;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.4f);

    l->setWaveEnabled(true);
    EXPECT_TRUE(l->isWaveRunning());
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.0f);

    clock.now = 1000;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.1f);
}

TEST(WaveLoop, EnableWhileRunningKeepsPhase)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();

    clock.now = 300;
    l->advance();
    l->setWaveEnabled(true);
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.3f);
}

TEST(WaveLoop, HidingFreezesShowingRestarts)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();

    clock.now = 600;
    l->advance();
    l->onVisibilityChange(false);
    EXPECT_FALSE(l->isWaveRunning());

    clock.now = 800;
    EXPECT_FALSE(l->advance());
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.6f);

    l->onVisibilityChange(true);
    EXPECT_TRUE(l->isWaveRunning());
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.0f);
}

TEST(WaveLoop, DeactivateStops)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();
    l->onDeactivate();
    EXPECT_FALSE(l->isWaveRunning());
}

TEST(WaveLoop, SpeedChangeRestartsWithNewPeriod)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->onActivate();

    clock.now = 300;
    l->advance();
    l->setWaveSpeed(2000);
    EXPECT_EQ(l->waveSpeed(), 2000);
    EXPECT_TRUE(l->isWaveRunning());
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.0f);

    clock.now = 800;
    l->advance();
    EXPECT_FLOAT_EQ(l->waveShiftRatio(), 0.25f);
}

TEST(WaveLoop, NonPositivePeriodIsClamped)
{
    FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setWaveSpeed(0);
    EXPECT_EQ(l->waveSpeed(), 1);
    l->setWaveSpeed(-40);
    EXPECT_EQ(l->waveSpeed(), 1);
}

TEST(WaveLoop, DisabledByOptionsNeverStarts)
{
    FakeClock clock;
    cfl::LoaderOptions opts;
    opts.waveEnabled = false;
    auto l = cfl_test::makeLoader(clock, opts);
    l->onActivate();
    EXPECT_FALSE(l->isWaveRunning());
}
