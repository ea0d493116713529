// gui/tests/test_image_pipeline.cpp: centered crop, fallbacks and file loading
#include <gtest/gtest.h>

#include "../model/image_pipeline.hpp"

#include <QColor>
#include <QFile>
#include <QImage>
#include <QPainter>
#include <QTemporaryDir>

#include <string>

using namespace cfl;

namespace {

// Three vertical (or horizontal) bands: red | green | blue.
QImage threeBands(int w, int h, bool vertical)
{
    QImage img(w, h, QImage::Format_ARGB32_Premultiplied);
    QPainter p(&img);
    if (vertical) {
        p.fillRect(QRect(0, 0, w / 3, h), Qt::red);
        p.fillRect(QRect(w / 3, 0, w / 3, h), Qt::green);
        p.fillRect(QRect(2 * w / 3, 0, w - 2 * w / 3, h), Qt::blue);
    } else {
        p.fillRect(QRect(0, 0, w, h / 3), Qt::red);
        p.fillRect(QRect(0, h / 3, w, h / 3), Qt::green);
        p.fillRect(QRect(0, 2 * h / 3, w, h - 2 * h / 3), Qt::blue);
    }
    return img;
}

bool isGreen(const QColor& c) { return c.green() > 240 && c.red() < 15 && c.blue() < 15; }

} // namespace

TEST(ImagePipeline, LandscapeCropKeepsCenter)
{
    const QImage out = cropToSquare(threeBands(300, 100, true), 50);
    ASSERT_FALSE(out.isNull());
    EXPECT_EQ(out.size(), QSize(50, 50));
    EXPECT_TRUE(isGreen(out.pixelColor(0, 0)));
    EXPECT_TRUE(isGreen(out.pixelColor(25, 25)));
    EXPECT_TRUE(isGreen(out.pixelColor(49, 49)));
}

TEST(ImagePipeline, PortraitCropKeepsCenter)
{
    const QImage out = cropToSquare(threeBands(100, 300, false), 100);
    ASSERT_FALSE(out.isNull());
    EXPECT_EQ(out.size(), QSize(100, 100));
    EXPECT_TRUE(isGreen(out.pixelColor(0, 0)));
    EXPECT_TRUE(isGreen(out.pixelColor(99, 99)));
}

TEST(ImagePipeline, UpscalesSmallSources)
{
    QImage tiny(4, 4, QImage::Format_RGB32);
    tiny.fill(Qt::green);
    const QImage out = cropToSquare(tiny, 64);
    ASSERT_FALSE(out.isNull());
    EXPECT_EQ(out.size(), QSize(64, 64));
    EXPECT_TRUE(isGreen(out.pixelColor(32, 32)));
}

TEST(ImagePipeline, RejectsEmptyInput)
{
    EXPECT_TRUE(cropToSquare(QImage(), 10).isNull());
    EXPECT_TRUE(cropToSquare(threeBands(30, 30, true), 0).isNull());
    EXPECT_TRUE(cropToSquare(threeBands(30, 30, true), -3).isNull());
}

TEST(ImagePipeline, NullSourceGivesTransparentSquare)
{
    const QImage out = buildCircleImage(QImage(), 32, QSize(32, 32));
    ASSERT_FALSE(out.isNull());
    EXPECT_EQ(out.size(), QSize(32, 32));
    EXPECT_EQ(out.pixelColor(16, 16).alpha(), 0);
}

TEST(ImagePipeline, UnmeasuredSideFallsBackToViewSize)
{
    const QImage out = buildCircleImage(QImage(), 0, QSize(80, 60));
    EXPECT_EQ(out.size(), QSize(60, 60));

    EXPECT_TRUE(buildCircleImage(QImage(), 0, QSize()).isNull());
}

TEST(ImagePipeline, LoadImageFileReportsMissingFile)
{
    QImage img;
    std::string why;
    EXPECT_FALSE(loadImageFile(QStringLiteral("/nonexistent/cfl/none.png"), &img, &why));
    EXPECT_FALSE(why.empty());
    EXPECT_FALSE(loadImageFile(QStringLiteral("x.png"), nullptr, &why));
}

TEST(ImagePipeline, LoadImageFileDecodesPng)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("green.png"));

    QImage src(12, 8, QImage::Format_RGB32);
    src.fill(Qt::green);
    ASSERT_TRUE(src.save(path, "PNG"));

    QImage img;
    std::string why;
    ASSERT_TRUE(loadImageFile(path, &img, &why)) << why;
    EXPECT_EQ(img.size(), QSize(12, 8));
    EXPECT_TRUE(isGreen(img.pixelColor(5, 5)));
    EXPECT_EQ(img.pixelColor(5, 5).alpha(), 255);
}

TEST(ImagePipeline, LoadImageFileRejectsGarbage)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("broken.png"));
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("definitely not an image");
    }

    QImage img;
    std::string why;
    EXPECT_FALSE(loadImageFile(path, &img, &why));
    EXPECT_FALSE(why.empty());
}
