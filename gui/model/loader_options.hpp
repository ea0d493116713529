// gui/model/loader_options.hpp: construction options and their XML form
#pragma once

#include "loader_state.hpp"

#include <QColor>
#include <QString>

#include <string>

namespace pugi { class xml_node; }

namespace cfl {

// Everything a CircularLoader accepts at construction. Each field maps to one
// public setter; defaults match a default-constructed loader.
struct LoaderOptions {
    int    progress      = 0;
    bool   borderEnabled = true;
    float  borderWidth   = kDefaultBorderWidth;
    QColor waveColor     = QColor(Qt::black);
    float  waveAmplitude = kDefaultAmplitudeRatio;
    bool   waveEnabled   = true;
    int    waveSpeedMs   = kDefaultWaveSpeedMs;

    TextState     text;
    SubtitleState subtitle;
    AutoSizeState autoSize;
};

// Reads cfl_* attributes from `node`. Missing or malformed attributes keep
// their defaults (malformed ones are logged). dp/sp dimensions are scaled by
// `density`.
LoaderOptions optionsFromXmlNode(const pugi::xml_node& node, float density = 1.0f);

// Loads the first <loader> element of an XML file (or the root element when
// there is none).
bool loadOptionsXml(const QString& path, LoaderOptions* out,
                    std::string* why = nullptr, float density = 1.0f);

// "#RRGGBB" / "#AARRGGBB". Returns false (leaving *out untouched) otherwise.
bool parseColor(const QString& text, QColor* out);

// "12", "12px", "12dp", "12sp". Returns false on anything else.
bool parseDimension(const QString& text, float density, float* out);

} // namespace cfl
