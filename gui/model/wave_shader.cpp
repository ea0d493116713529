// gui/model/wave_shader.cpp
#include "wave_shader.hpp"
#include "loader_state.hpp"
#include "diag.hpp"

#include <QBrush>
#include <QPainter>
#include <QPainterPath>
#include <QPen>

#include <algorithm>
#include <cmath>
#include <vector>

namespace cfl {

namespace {
    constexpr double kPi = 3.14159265358979323846;
}

QColor adjustAlpha(const QColor& c, float factor)
{
    QColor out = c;
    out.setAlpha(static_cast<int>(std::lround(c.alpha() * factor)));
    return out;
}

WaveShader WaveShader::generate(int width, int height, const QColor& waveColor)
{
    WaveShader shader;
    if (width <= 0 || height <= 0) return shader;

    const double angularFrequency = 2.0 * kPi / kDefaultWaveLengthRatio / width;
    const double amplitude        = height * kDefaultAmplitudeRatio;
    const double waterLevel       = height * kDefaultWaterLevelRatio;

    QImage bmp(width, height, QImage::Format_ARGB32_Premultiplied);
    if (bmp.isNull()) {
        log_fmt("[CFL][Wave][ERR] bitmap %dx%d allocation failed", width, height);
        return shader;
    }
    bmp.fill(Qt::transparent);

    const int endX = width + 1;
    const int endY = height + 1;
    std::vector<double> waveY(static_cast<size_t>(endX));

    {
        QPainter p(&bmp);
        p.setRenderHint(QPainter::Antialiasing, true);
        QPen pen(adjustAlpha(waveColor, 0.3f));
        pen.setWidthF(2.0);
        p.setPen(pen);

        // back layer, translucent
        for (int x = 0; x < endX; ++x) {
            const double y = waterLevel + amplitude * std::sin(x * angularFrequency);
            p.drawLine(QPointF(x, y), QPointF(x, endY));
            waveY[static_cast<size_t>(x)] = y;
        }

        // front layer, a quarter wavelength ahead
        pen.setColor(waveColor);
        p.setPen(pen);
        const int shift = width / 4;
        for (int x = 0; x < endX; ++x) {
            const double y = waveY[static_cast<size_t>((x + shift) % endX)];
            p.drawLine(QPointF(x, y), QPointF(x, endY));
        }
    }

    shader.m_tile       = bmp;
    shader.m_baseline   = static_cast<float>(waterLevel);
    shader.m_clampColor = bmp.pixelColor(0, height - 1);
    log_fmt("[CFL][Wave] generated %dx%d color=%s", width, height,
         waveColor.name(QColor::HexArgb).toUtf8().constData());
    return shader;
}

QTransform WaveShader::frameTransform(float amplitudeRatio, float baseline,
                                      float shiftRatio, float waterLevelRatio,
                                      int width, int height)
{
    const qreal sy = amplitudeRatio / kDefaultAmplitudeRatio;
    const qreal tx = shiftRatio * width;
    const qreal ty = (kDefaultWaterLevelRatio - waterLevelRatio) * height;
    // y' = baseline + sy * (y - baseline) + ty
    return QTransform(1.0, 0.0,
                      0.0, sy,
                      tx, baseline - sy * baseline + ty);
}

void WaveShader::fill(QPainter& p, const QPainterPath& area) const
{
    if (m_tile.isNull() || area.isEmpty()) return;

    const QRectF bounds = area.boundingRect();
    const qreal y0 = m_transform.map(QPointF(0.0, 0.0)).y();
    const qreal y1 = m_transform.map(QPointF(0.0, m_tile.height())).y();
    const qreal top    = std::min(y0, y1);
    const qreal bottom = std::max(y0, y1);

    // clamped region below the tile; overlaps the last tile row by 1px
    const qreal belowTop = std::max(bounds.top(), bottom - 1.0);
    if (belowTop < bounds.bottom()) {
        QPainterPath below;
        below.addRect(QRectF(bounds.left(), belowTop, bounds.width(), bounds.bottom() - belowTop));
        p.fillPath(area.intersected(below), m_clampColor);
    }

    // degenerate (zero amplitude) transform: only the clamped fill exists
    if (bottom - top < 0.5) return;

    const qreal bandTop    = std::max(bounds.top(), top);
    const qreal bandBottom = std::min(bounds.bottom(), bottom);
    if (bandBottom <= bandTop) return;

    QPainterPath band;
    band.addRect(QRectF(bounds.left(), bandTop, bounds.width(), bandBottom - bandTop));

    QBrush brush(m_tile);
    brush.setTransform(m_transform);
    p.fillPath(area.intersected(band), brush);
}

} // namespace cfl
