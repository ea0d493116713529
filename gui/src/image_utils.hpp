#pragma once
#include <QImage>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>

namespace imgutil {

// QImage::Format_ARGB32(_Premultiplied) stores B,G,R,A in memory on
// little-endian hosts, which is OpenCV's CV_8UC4 BGRA order.

// Non-owning view over a 32-bit QImage. The image must outlive the Mat.
inline cv::Mat view_bgra(const QImage& img)
{
    if (img.isNull() || img.depth() != 32) {
        std::cerr << "[DBG][imgutil] view_bgra: null or non 32-bit image\n";
        return {};
    }
    return cv::Mat(img.height(), img.width(), CV_8UC4,
                   const_cast<uchar*>(img.constBits()),
                   static_cast<size_t>(img.bytesPerLine()));
}

// Deep copy of a BGRA Mat into a QImage of the given 32-bit format.
inline QImage to_qimage_owned(const cv::Mat& bgra,
                              QImage::Format fmt = QImage::Format_ARGB32_Premultiplied)
{
    if (bgra.empty() || bgra.type() != CV_8UC4) {
        std::cerr << "[DBG][imgutil] to_qimage_owned: empty or non-BGRA mat type="
                  << (bgra.empty() ? -1 : bgra.type()) << "\n";
        return {};
    }
    QImage q(bgra.data, bgra.cols, bgra.rows, static_cast<int>(bgra.step), fmt);
    return q.copy();
}

// Any 8-bit gray / BGR / BGRA mat -> BGRA (alpha opaque when absent).
inline cv::Mat to_bgra(const cv::Mat& src)
{
    if (src.empty()) return {};
    cv::Mat u8 = src;
    if (src.depth() != CV_8U) {
        double mn = 0.0, mx = 0.0;
        cv::minMaxLoc(src.reshape(1), &mn, &mx);
        const double scale = (mx > mn) ? 255.0 / (mx - mn) : 1.0;
        src.convertTo(u8, CV_8U, scale, -mn * scale);
        std::cerr << "[DBG][imgutil] to_bgra: rescaled depth=" << src.depth()
                  << " min=" << mn << " max=" << mx << "\n";
    }
    cv::Mat out;
    switch (u8.channels()) {
    case 1: cv::cvtColor(u8, out, cv::COLOR_GRAY2BGRA); break;
    case 3: cv::cvtColor(u8, out, cv::COLOR_BGR2BGRA);  break;
    case 4: out = u8.clone();                            break;
    default:
        std::cerr << "[ERR][imgutil] to_bgra: unsupported channels=" << u8.channels() << "\n";
        return {};
    }
    return out;
}

} // namespace imgutil
