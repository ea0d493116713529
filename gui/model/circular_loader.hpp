// gui/model/circular_loader.hpp: circular image loader with animated wave fill
#pragma once

#include "fill_animator.hpp"
#include "loader_options.hpp"
#include "loader_state.hpp"
#include "text_layout.hpp"
#include "wave_shader.hpp"

#include <QElapsedTimer>
#include <QImage>
#include <QPointF>
#include <QSize>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

class QPainter;

namespace cfl {

// Toolkit-independent core of the loader. The host supplies the size, the
// source image, lifecycle signals and a frame tick (advance()), and paints by
// calling render(). Everything runs on the host's UI thread.
class CircularLoader {
public:
    using Clock         = std::function<Millis()>;
    using RedrawRequest = std::function<void()>;

    // `clock` defaults to a monotonic timer started at construction.
    explicit CircularLoader(const LoaderOptions& opts = LoaderOptions(), Clock clock = Clock());
    ~CircularLoader();

    CircularLoader(const CircularLoader&) = delete;
    CircularLoader& operator=(const CircularLoader&) = delete;

    // ---- Host hooks ----------------------------------------------------------
    void  setRedrawRequest(RedrawRequest cb) { m_redraw = std::move(cb); }
    void  resize(const QSize& size);
    QSize size() const { return m_size; }
    void  setImage(const QImage& image);          // image source changed
    const QImage& image() const { return m_source; }

    void onActivate();
    void onDeactivate();
    void onVisibilityChange(bool visible);
    bool isActive() const { return m_active; }
    bool isVisible() const { return m_visible; }

    // Frame tick. Returns true if a ratio moved (a redraw was requested).
    bool advance();
    bool advance(Millis now);
    bool isAnimating() const { return m_fill.isAnimating() || m_shift.isRunning(); }

    void render(QPainter& p);

    // ---- Progress and wave ---------------------------------------------------
    void    setProgress(int value, int durationMs = kDefaultProgressAnimMs);
    int     progress() const { return m_state.progress; }
    QString description() const { return m_description; }

    void   setColor(const QColor& color);
    QColor color() const { return m_state.waveColor; }
    void   setBorderWidth(float px);
    float  borderWidth() const { return m_state.borderWidth; }
    void   setAmplitudeRatio(float ratio);
    float  amplitudeRatio() const { return m_state.amplitudeRatio; }
    void   setWaveEnabled(bool enabled);
    bool   isWaveEnabled() const { return m_state.waveEnabled; }
    void   setWaveSpeed(int periodMs);
    int    waveSpeed() const { return m_state.waveCyclePeriodMs; }

    float waterLevelRatio() const { return m_state.currentWaterLevelRatio; }
    float targetWaterLevelRatio() const { return m_fill.target(); }
    float waveShiftRatio() const { return m_state.waveShiftRatio; }
    bool  isFillAnimating() const { return m_fill.isAnimating(); }
    bool  isWaveRunning() const { return m_shift.isRunning(); }

    // ---- Primary text --------------------------------------------------------
    void setText(const std::optional<QString>& text);
    std::optional<QString> text() const { return m_text.text; }
    void setTextSize(float px);
    void setTextColor(const QColor& color);
    void setTextFontFamily(const std::optional<QString>& family);
    void setTextStyle(TextStyle style);
    void setTextLetterSpacing(float ems);
    void setTextOffsetX(float px);
    void setTextOffsetY(float px);
    void setTextWidthMode(TextWidthMode mode);
    void setTextShadow(float radius, float dx, float dy, const QColor& color);
    void setShowProgressText(bool show);
    void setProgressTextFormat(const QString& format);
    const TextState& textState() const { return m_text; }

    // Explicit text, else the formatted progress, else nothing.
    std::optional<QString> displayText() const;

    // ---- Subtitle ------------------------------------------------------------
    void setSubtitleText(const std::optional<QString>& text);
    std::optional<QString> subtitleText() const { return m_subtitle.text; }
    void setSubtitleTextSize(float px);
    void setSubtitleTextColor(const QColor& color);
    void setSubtitleFontFamily(const std::optional<QString>& family);
    void setSubtitleTextStyle(TextStyle style);
    void setSubtitleOffsetY(float px);
    const SubtitleState& subtitleState() const { return m_subtitle; }

    // ---- Auto-size -----------------------------------------------------------
    void setAutoSizeText(bool enabled);
    void setAutoSizeMinTextSize(float px);
    const AutoSizeState& autoSizeState() const { return m_autoSize; }

    // Cancels animations and drops every cached bitmap and layout. The next
    // activation (or visibility change) restarts the wave from the current
    // properties. Safe to call repeatedly.
    void recycle();

    // ---- Caches --------------------------------------------------------------
    bool isTextLayoutDirty() const { return m_textLayoutDirty; }
    bool isSubtitleLayoutDirty() const { return m_subtitleLayoutDirty; }

    // Rebuild dirty layouts now (render() does this itself).
    void updateLayouts();
    // Current blocks; dirty layouts are rebuilt before they are returned.
    const TextBlock* textLayout();
    const TextBlock* subtitleLayout();

    // Width available to text: 85% of the circle's inner diameter.
    int   maxTextWidth() const;
    // Primary size used by the last rebuild (auto-sized when enabled).
    float effectiveTextSize() const { return m_effectiveTextSize; }

    const QImage&     circleImage() const { return m_circleImage; }
    const WaveShader& waveShader() const { return m_wave; }
    int circleImageGeneration() const { return m_circleImageGen; }
    int waveShaderGeneration() const { return m_waveGen; }

private:
    Millis now() const { return m_clock(); }
    void   requestRedraw();
    void   markTextDirty();
    void   markSubtitleDirty();
    bool   shouldWaveRun() const;
    void   syncWaveLoop(bool restart);
    void   ensureCircleImage();
    void   ensureWaveShader();
    void   drawText(QPainter& p);
    // Top-left of the min(w, h) square centered in the view.
    QPointF canvasOrigin() const;

    Clock         m_clock;
    QElapsedTimer m_elapsed;
    RedrawRequest m_redraw;

    LoaderState   m_state;
    TextState     m_text;
    SubtitleState m_subtitle;
    AutoSizeState m_autoSize;
    QString       m_description;

    QSize  m_size;
    int    m_canvasSize = 0;          // min(width, height)
    bool   m_active     = false;
    bool   m_visible    = true;

    QImage     m_source;
    QImage     m_circleImage;
    bool       m_circleImageDirty = true;
    int        m_circleImageGen   = 0;
    WaveShader m_wave;
    bool       m_waveDirty = true;
    int        m_waveGen   = 0;

    FillLevelAnimator m_fill{1.0f};
    WaveShiftAnimator m_shift;

    std::unique_ptr<TextBlock> m_textLayout;
    std::unique_ptr<TextBlock> m_subtitleLayout;
    bool  m_textLayoutDirty     = true;
    bool  m_subtitleLayoutDirty = true;
    float m_effectiveTextSize   = kDefaultTextSize;
};

} // namespace cfl
