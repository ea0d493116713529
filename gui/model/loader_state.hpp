// gui/model/loader_state.hpp: value types owned by a CircularLoader
#pragma once

#include <QColor>
#include <QString>

#include <optional>

namespace cfl {

// ---- Defaults (pixels at density 1) -----------------------------------------
constexpr float kDefaultAmplitudeRatio  = 0.05f;   // also the upper bound
constexpr float kDefaultWaterLevelRatio = 0.5f;    // shader baseline
constexpr float kDefaultWaveLengthRatio = 1.0f;
constexpr int   kDefaultWaveSpeedMs     = 1000;
constexpr int   kDefaultProgressAnimMs  = 1000;
constexpr float kDefaultBorderWidth     = 10.0f;
constexpr float kDefaultTextSize        = 14.0f;
constexpr float kDefaultSubtitleSize    = 12.0f;
constexpr float kDefaultAutoSizeMin     = 8.0f;
constexpr float kTextWidthFraction      = 0.85f;   // of the circle diameter

inline QString defaultProgressTextFormat() { return QStringLiteral("%d%%"); }

enum class TextStyle { Normal = 0, Bold = 1, Italic = 2, BoldItalic = 3 };

enum class TextWidthMode { Wrap = 0, Match = 1 };

struct TextShadow {
    QColor color  = QColor(0, 0, 0, 0);
    float  radius = 0.0f;   // 0 disables the shadow
    float  dx     = 0.0f;
    float  dy     = 0.0f;
};

// Font parameters shared by the primary text and the subtitle.
struct TextStyleSpec {
    float                  size          = kDefaultTextSize;
    QColor                 color         = QColor(Qt::white);
    std::optional<QString> fontFamily;
    TextStyle              style         = TextStyle::Normal;
    float                  letterSpacing = 0.0f;   // ems
};

struct LoaderState {
    int    progress               = 0;      // last committed target, [0,100]
    float  currentWaterLevelRatio = 1.0f;   // 0 = full, 1 = empty
    float  waveShiftRatio         = 0.0f;   // [0,1)
    float  amplitudeRatio         = kDefaultAmplitudeRatio;
    QColor waveColor              = QColor(Qt::black);
    bool   waveEnabled            = true;
    int    waveCyclePeriodMs      = kDefaultWaveSpeedMs;
    float  borderWidth            = kDefaultBorderWidth;
};

struct TextState {
    std::optional<QString> text;
    TextStyleSpec          font;
    float                  offsetX            = 0.0f;
    float                  offsetY            = 0.0f;
    TextWidthMode          widthMode          = TextWidthMode::Wrap;
    TextShadow             shadow;
    bool                   showProgressText   = false;
    QString                progressTextFormat = defaultProgressTextFormat();
};

struct SubtitleState {
    std::optional<QString> text;
    TextStyleSpec          font{kDefaultSubtitleSize};
    float                  offsetY = 0.0f;   // extra gap below the primary block
};

struct AutoSizeState {
    bool  enabled = false;
    float minSize = kDefaultAutoSizeMin;
};

// Water level ratio that corresponds to a committed progress value.
inline float waterLevelForProgress(int progress)
{
    const int p = progress < 0 ? 0 : (progress > 100 ? 100 : progress);
    return 1.0f - static_cast<float>(p) / 100.0f;
}

} // namespace cfl
