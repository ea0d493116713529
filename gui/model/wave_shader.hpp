// gui/model/wave_shader.hpp: two-layer sine wave fill pattern
#pragma once

#include <QColor>
#include <QImage>
#include <QTransform>

class QPainter;
class QPainterPath;

namespace cfl {

class WaveShader {
public:
    WaveShader() = default;

    // Renders the wave bitmap for a width x height view. Returns a null shader
    // when the size is empty or the bitmap cannot be allocated.
    static WaveShader generate(int width, int height, const QColor& waveColor);

    // Per-frame matrix: scale (1, amplitudeRatio / 0.05) about the baseline,
    // then translate (shiftRatio * width, (0.5 - waterLevelRatio) * height).
    static QTransform frameTransform(float amplitudeRatio, float baseline,
                                     float shiftRatio, float waterLevelRatio,
                                     int width, int height);

    bool isNull() const { return m_tile.isNull(); }
    const QImage& tile() const { return m_tile; }
    float baseline() const { return m_baseline; }
    QColor clampColor() const { return m_clampColor; }

    void setLocalTransform(const QTransform& m) { m_transform = m; }
    const QTransform& localTransform() const { return m_transform; }

    // Fills `area` (painter coordinates) with the pattern under the local
    // transform: repeats horizontally, clamps to the edge rows vertically.
    void fill(QPainter& p, const QPainterPath& area) const;

private:
    QImage     m_tile;
    QTransform m_transform;
    QColor     m_clampColor;          // bottom row, extended below the tile
    float      m_baseline = 0.0f;
};

// Copy of `c` with alpha scaled by `factor`, rounded.
QColor adjustAlpha(const QColor& c, float factor);

} // namespace cfl
