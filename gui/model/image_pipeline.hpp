// gui/model/image_pipeline.hpp: circle image preparation
#pragma once

#include <QImage>
#include <QSize>
#include <QString>

#include <string>

namespace cfl {

// Centered min(w,h) square of `source`, resampled to side x side.
// Returns a null image when the source is empty, side <= 0, or allocation fails.
QImage cropToSquare(const QImage& source, int side);

// Bitmap drawn inside the circle. A null `source` produces a transparent
// side x side bitmap; an unmeasured side (<= 0) falls back to the shorter
// dimension of `viewSize`. Never throws: failures yield a null image.
QImage buildCircleImage(const QImage& source, int side, const QSize& viewSize);

// Decodes an image file (anything cv::imread reads) into a premultiplied
// ARGB32 QImage.
bool loadImageFile(const QString& path, QImage* out, std::string* why = nullptr);

} // namespace cfl
