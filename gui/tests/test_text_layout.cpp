// gui/tests/test_text_layout.cpp: display text, progress formatting, auto-size and text blocks
#include <gtest/gtest.h>

#include "test_support.hpp"
#include "../model/text_layout.hpp"

using namespace cfl;

TEST(ProgressFormat, SubstitutesIntegers)
{
    EXPECT_EQ(formatProgressText(QStringLiteral("%d%%"), 42), QStringLiteral("42%"));
    EXPECT_EQ(formatProgressText(QStringLiteral("%i"), 7), QStringLiteral("7"));
    EXPECT_EQ(formatProgressText(QStringLiteral("%3d"), 7), QStringLiteral("  7"));
    EXPECT_EQ(formatProgressText(QStringLiteral("%-3d|"), 7), QStringLiteral("7  |"));
    EXPECT_EQ(formatProgressText(QStringLiteral("%03d"), 5), QStringLiteral("005"));
    EXPECT_EQ(formatProgressText(QStringLiteral("Loading %d of 100"), 12),
              QStringLiteral("Loading 12 of 100"));
}

TEST(ProgressFormat, IsTotalOnOddInput)
{
    EXPECT_EQ(formatProgressText(QString(), 3), QString());
    EXPECT_EQ(formatProgressText(QStringLiteral("%s"), 3), QStringLiteral("%s"));
    EXPECT_EQ(formatProgressText(QStringLiteral("100%"), 3), QStringLiteral("100%"));
    EXPECT_EQ(formatProgressText(QStringLiteral("%%"), 3), QStringLiteral("%"));
    EXPECT_EQ(formatProgressText(QStringLiteral("no value"), 3), QStringLiteral("no value"));
}

TEST(DisplayText, ExplicitTextWins)
{
    TextState t;
    t.showProgressText = true;
    t.text = QStringLiteral("Hello");
    ASSERT_TRUE(resolveDisplayText(t, 50).has_value());
    EXPECT_EQ(*resolveDisplayText(t, 50), QStringLiteral("Hello"));
}

TEST(DisplayText, FallsBackToProgressThenNothing)
{
    TextState t;
    EXPECT_FALSE(resolveDisplayText(t, 50).has_value());

    t.showProgressText = true;
    ASSERT_TRUE(resolveDisplayText(t, 50).has_value());
    EXPECT_EQ(*resolveDisplayText(t, 50), QStringLiteral("50%"));
}

TEST(DisplayText, ClearingTextRestoresProgressText)
{
    cfl_test::FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->setProgress(25, 0);
    l->setShowProgressText(true);

    l->setText(QStringLiteral("X"));
    EXPECT_EQ(l->text(), std::optional<QString>(QStringLiteral("X")));
    EXPECT_EQ(*l->displayText(), QStringLiteral("X"));

    l->setText(std::nullopt);
    EXPECT_FALSE(l->text().has_value());
    ASSERT_TRUE(l->displayText().has_value());
    EXPECT_EQ(*l->displayText(), QStringLiteral("25%"));

    l->setShowProgressText(false);
    EXPECT_FALSE(l->displayText().has_value());
}

TEST(DisplayText, EmptyStringIsKeptButNotLaidOut)
{
    cfl_test::FakeClock clock;
    auto l = cfl_test::makeLoader(clock);
    l->resize(QSize(200, 200));
    l->setText(QString());
    ASSERT_TRUE(l->displayText().has_value());
    EXPECT_TRUE(l->displayText()->isEmpty());

    l->updateLayouts();
    EXPECT_EQ(l->textLayout(), nullptr);
}

TEST(MakeFont, RoundsSizeAndAppliesStyle)
{
    TextStyleSpec spec;
    spec.style = TextStyle::BoldItalic;
    const QFont f = makeFont(spec, 13.6f);
    EXPECT_EQ(f.pixelSize(), 14);
    EXPECT_TRUE(f.bold());
    EXPECT_TRUE(f.italic());

    EXPECT_EQ(makeFont(spec, 0.0f).pixelSize(), 1);
}

TEST(AutoFit, StaysWithinBoundsAndIsIdempotent)
{
    if (!cfl_test::fontsAvailable()) GTEST_SKIP() << "no fonts on this platform";

    TextStyleSpec spec;
    spec.size = 60.0f;
    const QString text = QStringLiteral("A fairly long loading caption");
    const float maxWidth = 120.0f;
    const float minSize = 8.0f;

    const float size = autoFitTextSize(spec, text, maxWidth, minSize);
    EXPECT_GE(size, minSize);
    EXPECT_LE(size, spec.size);
    if (size > minSize) {
        EXPECT_LE(measureTextWidth(makeFont(spec, size), text), maxWidth);
    }
    EXPECT_FLOAT_EQ(autoFitTextSize(spec, text, maxWidth, minSize), size);
}

TEST(AutoFit, ShortTextKeepsNearlyFullSize)
{
    if (!cfl_test::fontsAvailable()) GTEST_SKIP() << "no fonts on this platform";

    TextStyleSpec spec;
    spec.size = 20.0f;
    const float size = autoFitTextSize(spec, QStringLiteral("1%"), 1000.0f, 8.0f);
    EXPECT_GE(size, spec.size - 1.0f);
    EXPECT_LE(size, spec.size);
}

TEST(AutoFit, MinimumWinsWhenNothingFits)
{
    TextStyleSpec spec;
    spec.size = 40.0f;
    EXPECT_FLOAT_EQ(autoFitTextSize(spec, QStringLiteral("anything"), -1.0f, 9.0f), 9.0f);
}

TEST(TextBlockBuild, RejectsNonPositiveWidth)
{
    EXPECT_EQ(TextBlock::build(QStringLiteral("x"), QFont(), 0.0, Qt::white), nullptr);
    EXPECT_EQ(TextBlock::build(QStringLiteral("x"), QFont(), -4.0, Qt::white), nullptr);
}

TEST(TextBlockBuild, WrapsAtWidthAndHonoursNewlines)
{
    if (!cfl_test::fontsAvailable()) GTEST_SKIP() << "no fonts on this platform";

    QFont font;
    font.setPixelSize(14);

    auto wide = TextBlock::build(QStringLiteral("hello world"), font, 1000.0, Qt::white);
    ASSERT_NE(wide, nullptr);
    EXPECT_EQ(wide->lineCount(), 1);
    EXPECT_GT(wide->height(), 0.0);

    const qreal oneWord = measureTextWidth(font, QStringLiteral("hello"));
    auto narrow = TextBlock::build(QStringLiteral("hello world"), font, oneWord + 2.0, Qt::white);
    ASSERT_NE(narrow, nullptr);
    EXPECT_GE(narrow->lineCount(), 2);
    EXPECT_GT(narrow->height(), wide->height());

    auto split = TextBlock::build(QStringLiteral("a\nb"), font, 1000.0, Qt::white);
    ASSERT_NE(split, nullptr);
    EXPECT_EQ(split->lineCount(), 2);
}

TEST(TextBlockBuild, ShadowOnlyWithRadius)
{
    if (!cfl_test::fontsAvailable()) GTEST_SKIP() << "no fonts on this platform";

    QFont font;
    font.setPixelSize(14);

    TextShadow none;
    none.color = Qt::black;
    auto plain = TextBlock::build(QStringLiteral("50%"), font, 100.0, Qt::white, none);
    ASSERT_NE(plain, nullptr);
    EXPECT_FALSE(plain->hasShadow());

    TextShadow soft;
    soft.color = Qt::black;
    soft.radius = 4.0f;
    soft.dx = 1.0f;
    soft.dy = 1.0f;
    auto shaded = TextBlock::build(QStringLiteral("50%"), font, 100.0, Qt::white, soft);
    ASSERT_NE(shaded, nullptr);
    EXPECT_TRUE(shaded->hasShadow());
}
