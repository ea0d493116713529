// gui/model/circular_loader.cpp
#include "circular_loader.hpp"
#include "image_pipeline.hpp"
#include "diag.hpp"

#include <QBrush>
#include <QPainter>
#include <QPainterPath>
#include <QPen>

#include <algorithm>
#include <cmath>

namespace cfl {

CircularLoader::CircularLoader(const LoaderOptions& opts, Clock clock)
    : m_clock(std::move(clock))
{
    if (!m_clock) {
        m_elapsed.start();
        m_clock = [this]() -> Millis { return m_elapsed.elapsed(); };
    }

    setColor(opts.waveColor);
    setBorderWidth(opts.borderEnabled ? opts.borderWidth : 0.0f);
    setAmplitudeRatio(opts.waveAmplitude);
    setWaveSpeed(opts.waveSpeedMs);
    setWaveEnabled(opts.waveEnabled);

    const TextState& t = opts.text;
    setText(t.text);
    setTextSize(t.font.size);
    setTextColor(t.font.color);
    setTextFontFamily(t.font.fontFamily);
    setTextStyle(t.font.style);
    setTextLetterSpacing(t.font.letterSpacing);
    setTextOffsetX(t.offsetX);
    setTextOffsetY(t.offsetY);
    setTextWidthMode(t.widthMode);
    setTextShadow(t.shadow.radius, t.shadow.dx, t.shadow.dy, t.shadow.color);
    setShowProgressText(t.showProgressText);
    setProgressTextFormat(t.progressTextFormat);

    const SubtitleState& s = opts.subtitle;
    setSubtitleText(s.text);
    setSubtitleTextSize(s.font.size);
    setSubtitleTextColor(s.font.color);
    setSubtitleFontFamily(s.font.fontFamily);
    setSubtitleTextStyle(s.font.style);
    setSubtitleOffsetY(s.offsetY);

    setAutoSizeText(opts.autoSize.enabled);
    setAutoSizeMinTextSize(opts.autoSize.minSize);

    // last, so the first fill animation sees the final configuration
    setProgress(opts.progress);
}

CircularLoader::~CircularLoader() = default;

void CircularLoader::requestRedraw()
{
    if (m_redraw) m_redraw();
}

void CircularLoader::markTextDirty()
{
    m_textLayoutDirty = true;
    requestRedraw();
}

void CircularLoader::markSubtitleDirty()
{
    m_subtitleLayoutDirty = true;
    requestRedraw();
}

// ---------------------------------------------------------------------------
// Host hooks
// ---------------------------------------------------------------------------
void CircularLoader::resize(const QSize& size)
{
    const QSize s(std::max(0, size.width()), std::max(0, size.height()));
    if (s == m_size) return;

    m_size = s;
    m_canvasSize = std::min(s.width(), s.height());
    m_circleImageDirty = true;
    m_waveDirty = true;
    m_textLayoutDirty = true;
    m_subtitleLayoutDirty = true;
    log_fmt("[CFL][Loader] resize %dx%d canvas=%d", s.width(), s.height(), m_canvasSize);
    requestRedraw();
}

void CircularLoader::setImage(const QImage& image)
{
    m_source = image;
    m_circleImageDirty = true;
    requestRedraw();
}

bool CircularLoader::shouldWaveRun() const
{
    return m_state.waveEnabled && m_active && m_visible;
}

void CircularLoader::syncWaveLoop(bool restart)
{
    if (!shouldWaveRun()) {
        if (m_shift.isRunning()) {
            m_shift.cancel();
            log_fmt("[CFL][Wave] loop stopped at shift=%.3f", static_cast<double>(m_shift.ratio()));
        }
        return;
    }
    if (m_shift.isRunning() && !restart) return;

    m_shift.start(WaveLoop{m_state.waveCyclePeriodMs, now()});
    m_state.waveShiftRatio = m_shift.ratio();
    log_fmt("[CFL][Wave] loop started period=%dms", m_state.waveCyclePeriodMs);
    requestRedraw();
}

void CircularLoader::onActivate()
{
    m_active = true;
    syncWaveLoop(false);
}

void CircularLoader::onDeactivate()
{
    m_active = false;
    syncWaveLoop(false);
}

void CircularLoader::onVisibilityChange(bool visible)
{
    m_visible = visible;
    syncWaveLoop(false);
}

bool CircularLoader::advance()
{
    return advance(now());
}

bool CircularLoader::advance(Millis t)
{
    bool moved = false;
    if (m_fill.tick(t)) {
        m_state.currentWaterLevelRatio = m_fill.value();
        moved = true;
    }
    if (m_shift.tick(t)) {
        m_state.waveShiftRatio = m_shift.ratio();
        moved = true;
    }
    if (moved) requestRedraw();
    return moved;
}

// ---------------------------------------------------------------------------
// Progress and wave
// ---------------------------------------------------------------------------
void CircularLoader::setProgress(int value, int durationMs)
{
    const int clamped = std::clamp(value, 0, 100);
    m_state.progress = clamped;
    m_description = QStringLiteral("Loading: %1 percent").arg(clamped);

    // retarget from the level at the current time, not the last tick
    const Millis t = now();
    m_fill.tick(t);
    m_fill.start(FillTween{m_fill.value(), waterLevelForProgress(clamped),
                           std::max(0, durationMs), t});
    m_state.currentWaterLevelRatio = m_fill.value();

    if (m_text.showProgressText && !m_text.text) m_textLayoutDirty = true;
    requestRedraw();
}

void CircularLoader::setColor(const QColor& color)
{
    if (color == m_state.waveColor && !m_wave.isNull()) return;
    m_state.waveColor = color;
    m_waveDirty = true;
    requestRedraw();
}

void CircularLoader::setBorderWidth(float px)
{
    m_state.borderWidth = std::max(0.0f, px);
    // the inner radius bounds the text width
    m_textLayoutDirty = true;
    m_subtitleLayoutDirty = true;
    requestRedraw();
}

void CircularLoader::setAmplitudeRatio(float ratio)
{
    const float r = std::clamp(ratio, 0.0f, kDefaultAmplitudeRatio);
    if (r == m_state.amplitudeRatio) return;
    m_state.amplitudeRatio = r;
    requestRedraw();
}

void CircularLoader::setWaveEnabled(bool enabled)
{
    if (enabled == m_state.waveEnabled && (!enabled || m_shift.isRunning())) return;
    m_state.waveEnabled = enabled;
    syncWaveLoop(false);
    requestRedraw();
}

void CircularLoader::setWaveSpeed(int periodMs)
{
    m_state.waveCyclePeriodMs = std::max(1, periodMs);
    m_shift.cancel();
    syncWaveLoop(true);
}

// ---------------------------------------------------------------------------
// Primary text
// ---------------------------------------------------------------------------
std::optional<QString> CircularLoader::displayText() const
{
    return resolveDisplayText(m_text, m_state.progress);
}

void CircularLoader::setText(const std::optional<QString>& text)
{
    m_text.text = text;
    markTextDirty();
}

void CircularLoader::setTextSize(float px)
{
    m_text.font.size = std::max(0.0f, px);
    markTextDirty();
}

void CircularLoader::setTextColor(const QColor& color)
{
    m_text.font.color = color;
    markTextDirty();
}

void CircularLoader::setTextFontFamily(const std::optional<QString>& family)
{
    m_text.font.fontFamily = family;
    markTextDirty();
}

void CircularLoader::setTextStyle(TextStyle style)
{
    m_text.font.style = style;
    markTextDirty();
}

void CircularLoader::setTextLetterSpacing(float ems)
{
    m_text.font.letterSpacing = ems;
    markTextDirty();
}

void CircularLoader::setTextOffsetX(float px)
{
    m_text.offsetX = px;
    markTextDirty();
}

void CircularLoader::setTextOffsetY(float px)
{
    m_text.offsetY = px;
    markTextDirty();
}

void CircularLoader::setTextWidthMode(TextWidthMode mode)
{
    m_text.widthMode = mode;
    markTextDirty();
}

void CircularLoader::setTextShadow(float radius, float dx, float dy, const QColor& color)
{
    m_text.shadow.radius = std::max(0.0f, radius);
    m_text.shadow.dx = dx;
    m_text.shadow.dy = dy;
    m_text.shadow.color = color;
    markTextDirty();
}

void CircularLoader::setShowProgressText(bool show)
{
    m_text.showProgressText = show;
    markTextDirty();
}

void CircularLoader::setProgressTextFormat(const QString& format)
{
    m_text.progressTextFormat = format;
    markTextDirty();
}

// ---------------------------------------------------------------------------
// Subtitle
// ---------------------------------------------------------------------------
void CircularLoader::setSubtitleText(const std::optional<QString>& text)
{
    m_subtitle.text = text;
    markSubtitleDirty();
}

void CircularLoader::setSubtitleTextSize(float px)
{
    m_subtitle.font.size = std::max(0.0f, px);
    markSubtitleDirty();
}

void CircularLoader::setSubtitleTextColor(const QColor& color)
{
    m_subtitle.font.color = color;
    markSubtitleDirty();
}

void CircularLoader::setSubtitleFontFamily(const std::optional<QString>& family)
{
    m_subtitle.font.fontFamily = family;
    markSubtitleDirty();
}

void CircularLoader::setSubtitleTextStyle(TextStyle style)
{
    m_subtitle.font.style = style;
    markSubtitleDirty();
}

void CircularLoader::setSubtitleOffsetY(float px)
{
    m_subtitle.offsetY = px;
    markSubtitleDirty();
}

// ---------------------------------------------------------------------------
// Auto-size
// ---------------------------------------------------------------------------
void CircularLoader::setAutoSizeText(bool enabled)
{
    m_autoSize.enabled = enabled;
    markTextDirty();
}

void CircularLoader::setAutoSizeMinTextSize(float px)
{
    m_autoSize.minSize = std::max(0.0f, px);
    markTextDirty();
}

// ---------------------------------------------------------------------------
// Recycle
// ---------------------------------------------------------------------------
void CircularLoader::recycle()
{
    m_shift.cancel();
    m_fill.finish();
    m_state.currentWaterLevelRatio = m_fill.value();

    m_textLayout.reset();
    m_subtitleLayout.reset();
    m_textLayoutDirty = true;
    m_subtitleLayoutDirty = true;

    m_circleImage = QImage();
    m_circleImageDirty = true;
    m_wave = WaveShader();
    m_waveDirty = true;
    log_line("[CFL][Loader] recycled");
}

// ---------------------------------------------------------------------------
// Caches
// ---------------------------------------------------------------------------
int CircularLoader::maxTextWidth() const
{
    const float radius = m_canvasSize / 2.0f - m_state.borderWidth;
    return static_cast<int>(radius * 2.0f * kTextWidthFraction);
}

void CircularLoader::ensureCircleImage()
{
    if (!m_circleImageDirty) return;
    m_circleImage = buildCircleImage(m_source, m_canvasSize, m_size);
    ++m_circleImageGen;
    // a failed build on a measured view retries on the next frame
    m_circleImageDirty = m_circleImage.isNull() && m_canvasSize > 0;
}

void CircularLoader::ensureWaveShader()
{
    if (!m_waveDirty) return;
    m_wave = WaveShader::generate(m_canvasSize, m_canvasSize, m_state.waveColor);
    ++m_waveGen;
    m_waveDirty = m_wave.isNull() && m_canvasSize > 0;
}

void CircularLoader::updateLayouts()
{
    const int maxWidth = maxTextWidth();

    if (m_textLayoutDirty) {
        m_textLayout.reset();
        m_effectiveTextSize = m_text.font.size;

        const std::optional<QString> display = displayText();
        if (display && maxWidth > 0) {
            if (m_autoSize.enabled)
                m_effectiveTextSize = autoFitTextSize(m_text.font, *display,
                                                      static_cast<float>(maxWidth),
                                                      m_autoSize.minSize);

            const QFont font = makeFont(m_text.font, m_effectiveTextSize);
            qreal width = maxWidth;
            if (m_text.widthMode == TextWidthMode::Wrap)
                width = std::min<qreal>(std::ceil(measureTextWidth(font, *display)), maxWidth);

            m_textLayout = TextBlock::build(*display, font, width,
                                            m_text.font.color, m_text.shadow);
        }
        m_textLayoutDirty = false;
    }

    if (m_subtitleLayoutDirty) {
        m_subtitleLayout.reset();
        if (m_subtitle.text && maxWidth > 0) {
            const QFont font = makeFont(m_subtitle.font, m_subtitle.font.size);
            m_subtitleLayout = TextBlock::build(*m_subtitle.text, font, maxWidth,
                                                m_subtitle.font.color);
        }
        m_subtitleLayoutDirty = false;
    }
}

const TextBlock* CircularLoader::textLayout()
{
    updateLayouts();
    return m_textLayout.get();
}

const TextBlock* CircularLoader::subtitleLayout()
{
    updateLayouts();
    return m_subtitleLayout.get();
}

// ---------------------------------------------------------------------------
// Render
// ---------------------------------------------------------------------------
QPointF CircularLoader::canvasOrigin() const
{
    return QPointF((m_size.width() - m_canvasSize) / 2.0,
                   (m_size.height() - m_canvasSize) / 2.0);
}

void CircularLoader::render(QPainter& p)
{
    if (m_size.isEmpty()) return;

    ensureCircleImage();
    ensureWaveShader();

    p.save();
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setRenderHint(QPainter::SmoothPixmapTransform, true);

    // every layer lives on the centered canvas square
    p.translate(canvasOrigin());

    const int side = m_canvasSize;
    const float bw = m_state.borderWidth;
    const QPointF center(side / 2.0, side / 2.0);

    if (!m_circleImage.isNull()) {
        const qreal r = side / 2.0 - bw;
        if (r > 0.0) {
            p.setPen(Qt::NoPen);
            p.setBrush(QBrush(m_circleImage));
            p.drawEllipse(center, r, r);
        }

        if (!m_wave.isNull()) {
            m_wave.setLocalTransform(WaveShader::frameTransform(
                m_state.amplitudeRatio, m_wave.baseline(), m_state.waveShiftRatio,
                m_state.currentWaterLevelRatio, side, side));

            if (bw > 0.0f) {
                QPen pen(m_state.waveColor);
                pen.setWidthF(bw);
                p.setPen(pen);
                p.setBrush(Qt::NoBrush);
                const qreal br = (side - bw) / 2.0 - 1.0;
                if (br > 0.0) p.drawEllipse(center, br, br);
            }

            if (r > 0.0) {
                QPainterPath circle;
                circle.addEllipse(center, r, r);
                m_wave.fill(p, circle);
            }
        }
    }

    drawText(p);
    p.restore();
}

void CircularLoader::drawText(QPainter& p)
{
    updateLayouts();
    if (!m_textLayout) return;

    const qreal primaryH = m_textLayout->height();
    qreal total = primaryH;
    if (m_subtitleLayout) total += m_subtitle.offsetY + m_subtitleLayout->height();

    const qreal cx = m_canvasSize / 2.0 + m_text.offsetX;
    const qreal top = m_canvasSize / 2.0 - total / 2.0 + m_text.offsetY;

    m_textLayout->draw(p, QPointF(cx, top));
    if (m_subtitleLayout)
        m_subtitleLayout->draw(p, QPointF(cx, top + primaryH + m_subtitle.offsetY));
}

} // namespace cfl
