// gui/model/image_pipeline.cpp
#include "image_pipeline.hpp"
#include "diag.hpp"
#include "../src/image_utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <QFileInfo>

#include <algorithm>
#include <new>

namespace cfl {

namespace {

QImage blankSquare(int side)
{
    QImage img(side, side, QImage::Format_ARGB32_Premultiplied);
    if (img.isNull()) {
        log_fmt("[CFL][Image][ERR] blank %dx%d allocation failed", side, side);
        return {};
    }
    img.fill(Qt::transparent);
    return img;
}

} // namespace

QImage cropToSquare(const QImage& source, int side)
{
    if (source.isNull() || side <= 0) return {};

    try {
        const QImage src = source.convertToFormat(QImage::Format_ARGB32_Premultiplied);
        if (src.isNull()) {
            log_line("[CFL][Image][ERR] convertToFormat failed (out of memory?)");
            return {};
        }

        const int w = src.width();
        const int h = src.height();
        const int edge = std::min(w, h);
        const int x0 = (w >= h) ? (w / 2 - h / 2) : 0;
        const int y0 = (w >= h) ? 0 : (h / 2 - w / 2);

        const cv::Mat whole = imgutil::view_bgra(src);
        if (whole.empty()) return {};
        const cv::Mat roi = whole(cv::Rect(x0, y0, edge, edge));

        cv::Mat scaled;
        const int interp = (edge > side) ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(roi, scaled, cv::Size(side, side), 0, 0, interp);

        QImage out = imgutil::to_qimage_owned(scaled);
        log_fmt("[CFL][Image] crop %dx%d -> square %d at (%d,%d) -> %dx%d",
             w, h, edge, x0, y0, out.width(), out.height());
        return out;
    } catch (const cv::Exception& e) {
        log_fmt("[CFL][Image][ERR] OpenCV: %s", e.what());
        return {};
    } catch (const std::bad_alloc&) {
        log_line("[CFL][Image][ERR] bad_alloc while cropping");
        return {};
    }
}

QImage buildCircleImage(const QImage& source, int side, const QSize& viewSize)
{
    if (side <= 0) side = std::min(viewSize.width(), viewSize.height());
    if (side <= 0) {
        log_line("[CFL][Image] unmeasured view; no circle image yet");
        return {};
    }

    if (source.isNull() || source.width() <= 0 || source.height() <= 0) {
        return blankSquare(side);
    }
    return cropToSquare(source, side);
}

bool loadImageFile(const QString& path, QImage* out, std::string* why)
{
    if (!out) {
        if (why) *why = "null output image";
        return false;
    }
    if (!QFileInfo::exists(path)) {
        if (why) *why = "file does not exist";
        log_fmt("[CFL][Image][ERR] missing file '%s'", path.toUtf8().constData());
        return false;
    }

    try {
        const cv::Mat raw = cv::imread(path.toStdString(), cv::IMREAD_UNCHANGED);
        if (raw.empty()) {
            if (why) *why = "cv::imread returned an empty image";
            return false;
        }
        const cv::Mat bgra = imgutil::to_bgra(raw);
        if (bgra.empty()) {
            if (why) *why = "unsupported pixel layout";
            return false;
        }
        QImage straight = imgutil::to_qimage_owned(bgra, QImage::Format_ARGB32);
        *out = straight.convertToFormat(QImage::Format_ARGB32_Premultiplied);
        if (out->isNull()) {
            if (why) *why = "image allocation failed";
            return false;
        }
        log_fmt("[CFL][Image] loaded '%s' %dx%d ch=%d", path.toUtf8().constData(),
             raw.cols, raw.rows, raw.channels());
        return true;
    } catch (const cv::Exception& e) {
        if (why) *why = e.what();
        log_fmt("[CFL][Image][ERR] imread: %s", e.what());
        return false;
    } catch (const std::bad_alloc&) {
        if (why) *why = "out of memory";
        return false;
    }
}

} // namespace cfl
