// gui/model/loader_options.cpp: cfl_* attribute reader
#include "loader_options.hpp"
#include "diag.hpp"

#include <pugixml.hpp>

#include <QFileInfo>

#include <algorithm>
#include <cstring>

namespace cfl {

namespace {

    // Attribute text or an empty QString when absent.
    QString attr_text(const pugi::xml_node& n, const char* name, bool* present)
    {
        const pugi::xml_attribute a = n.attribute(name);
        *present = static_cast<bool>(a);
        if (!a) return QString();
        return QString::fromUtf8(a.value()).trimmed();
    }

    void warn_bad(const char* name, const QString& value, const char* expected)
    {
        log_fmt("[CFL][XML][WARN] %s='%s' is not %s; keeping default",
             name, value.toUtf8().constData(), expected);
    }

    int xml_int(const pugi::xml_node& n, const char* name, int def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present);
        if (!present) return def;
        bool ok = false;
        const int v = s.toInt(&ok);
        if (!ok) { warn_bad(name, s, "an integer"); return def; }
        log_fmt("[CFL][XML] %s = %d", name, v);
        return v;
    }

    float xml_float(const pugi::xml_node& n, const char* name, float def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present);
        if (!present) return def;
        bool ok = false;
        const float v = s.toFloat(&ok);
        if (!ok) { warn_bad(name, s, "a number"); return def; }
        log_fmt("[CFL][XML] %s = %g", name, static_cast<double>(v));
        return v;
    }

    bool xml_bool(const pugi::xml_node& n, const char* name, bool def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present).toLower();
        if (!present) return def;
        if (s == QLatin1String("true") || s == QLatin1String("1")) return true;
        if (s == QLatin1String("false") || s == QLatin1String("0")) return false;
        warn_bad(name, s, "a boolean");
        return def;
    }

    std::optional<QString> xml_str(const pugi::xml_node& n, const char* name,
                                   const std::optional<QString>& def)
    {
        const pugi::xml_attribute a = n.attribute(name);
        if (!a) return def;
        const QString v = QString::fromUtf8(a.value());
        log_fmt("[CFL][XML] %s = '%s'", name, a.value());
        return v;
    }

    float xml_dim(const pugi::xml_node& n, const char* name, float density, float def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present);
        if (!present) return def;
        float v = 0.0f;
        if (!parseDimension(s, density, &v)) {
            warn_bad(name, s, "a dimension (px, dp, sp)");
            return def;
        }
        log_fmt("[CFL][XML] %s = %gpx", name, static_cast<double>(v));
        return v;
    }

    QColor xml_color(const pugi::xml_node& n, const char* name, const QColor& def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present);
        if (!present) return def;
        QColor c = def;
        if (!parseColor(s, &c)) {
            warn_bad(name, s, "a #RRGGBB / #AARRGGBB color");
            return def;
        }
        return c;
    }

    TextStyle xml_text_style(const pugi::xml_node& n, const char* name, TextStyle def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present).toLower();
        if (!present) return def;
        if (s == QLatin1String("normal"))      return TextStyle::Normal;
        if (s == QLatin1String("bold"))        return TextStyle::Bold;
        if (s == QLatin1String("italic"))      return TextStyle::Italic;
        if (s == QLatin1String("bold_italic")) return TextStyle::BoldItalic;
        warn_bad(name, s, "normal|bold|italic|bold_italic");
        return def;
    }

    TextWidthMode xml_width_mode(const pugi::xml_node& n, const char* name, TextWidthMode def)
    {
        bool present = false;
        const QString s = attr_text(n, name, &present).toLower();
        if (!present) return def;
        if (s == QLatin1String("wrap_content"))  return TextWidthMode::Wrap;
        if (s == QLatin1String("match_parent"))  return TextWidthMode::Match;
        warn_bad(name, s, "wrap_content|match_parent");
        return def;
    }

} // namespace

bool parseColor(const QString& text, QColor* out)
{
    const QString s = text.trimmed();
    if (!s.startsWith(QLatin1Char('#'))) return false;
    const int digits = s.size() - 1;
    if (digits != 6 && digits != 8) return false;

    bool ok = false;
    const uint v = s.mid(1).toUInt(&ok, 16);
    if (!ok) return false;

    if (out) *out = QColor::fromRgba(digits == 6 ? (0xff000000u | v) : v);
    return true;
}

bool parseDimension(const QString& text, float density, float* out)
{
    QString s = text.trimmed().toLower();
    float scale = 1.0f;
    if (s.endsWith(QLatin1String("px"))) {
        s.chop(2);
    } else if (s.endsWith(QLatin1String("dp")) || s.endsWith(QLatin1String("sp"))) {
        s.chop(2);
        scale = density;
    } else if (s.endsWith(QLatin1String("dip"))) {
        s.chop(3);
        scale = density;
    }

    bool ok = false;
    const float v = s.trimmed().toFloat(&ok);
    if (!ok) return false;
    if (out) *out = v * scale;
    return true;
}

LoaderOptions optionsFromXmlNode(const pugi::xml_node& node, float density)
{
    LoaderOptions o;
    if (!node) {
        log_line("[CFL][XML] no <loader> node; using defaults");
        return o;
    }

    o.progress      = xml_int(node, "cfl_progress", o.progress);
    o.borderEnabled = xml_bool(node, "cfl_border", o.borderEnabled);
    o.borderWidth   = xml_dim(node, "cfl_border_width", density, o.borderWidth);
    o.waveColor     = xml_color(node, "cfl_wave_color", o.waveColor);
    o.waveAmplitude = std::min(kDefaultAmplitudeRatio,
                               xml_float(node, "cfl_wave_amplitude", o.waveAmplitude));
    o.waveEnabled   = xml_bool(node, "cfl_wave_enabled", o.waveEnabled);
    o.waveSpeedMs   = xml_int(node, "cfl_wave_speed", o.waveSpeedMs);

    TextState& t = o.text;
    t.text               = xml_str(node, "cfl_text", t.text);
    t.font.size          = xml_dim(node, "cfl_text_size", density, t.font.size);
    t.font.color         = xml_color(node, "cfl_text_color", t.font.color);
    t.font.fontFamily    = xml_str(node, "cfl_text_font_family", t.font.fontFamily);
    t.font.style         = xml_text_style(node, "cfl_text_style", t.font.style);
    t.font.letterSpacing = xml_float(node, "cfl_text_letter_spacing", t.font.letterSpacing);
    t.offsetX            = xml_dim(node, "cfl_text_offset_x", density, t.offsetX);
    t.offsetY            = xml_dim(node, "cfl_text_offset_y", density, t.offsetY);
    t.widthMode          = xml_width_mode(node, "cfl_text_width_mode", t.widthMode);
    t.shadow.color       = xml_color(node, "cfl_text_shadow_color", t.shadow.color);
    t.shadow.radius      = xml_float(node, "cfl_text_shadow_radius", t.shadow.radius);
    t.shadow.dx          = xml_float(node, "cfl_text_shadow_dx", t.shadow.dx);
    t.shadow.dy          = xml_float(node, "cfl_text_shadow_dy", t.shadow.dy);
    t.showProgressText   = xml_bool(node, "cfl_show_progress_text", t.showProgressText);
    t.progressTextFormat = xml_str(node, "cfl_progress_text_format", t.progressTextFormat)
                               .value_or(defaultProgressTextFormat());

    SubtitleState& s = o.subtitle;
    s.text            = xml_str(node, "cfl_subtitle_text", s.text);
    s.font.size       = xml_dim(node, "cfl_subtitle_text_size", density, s.font.size);
    s.font.color      = xml_color(node, "cfl_subtitle_text_color", s.font.color);
    s.font.fontFamily = xml_str(node, "cfl_subtitle_font_family", s.font.fontFamily);
    s.font.style      = xml_text_style(node, "cfl_subtitle_text_style", s.font.style);
    s.offsetY         = xml_dim(node, "cfl_subtitle_offset_y", density, s.offsetY);

    o.autoSize.enabled = xml_bool(node, "cfl_auto_size_text", o.autoSize.enabled);
    o.autoSize.minSize = xml_dim(node, "cfl_auto_size_min_text_size", density, o.autoSize.minSize);
    return o;
}

bool loadOptionsXml(const QString& path, LoaderOptions* out, std::string* why, float density)
{
    if (!out) {
        if (why) *why = "null output";
        return false;
    }
    if (!QFileInfo::exists(path)) {
        if (why) *why = "file not found: " + path.toStdString();
        return false;
    }

    pugi::xml_document doc;
    const pugi::xml_parse_result res = doc.load_file(path.toUtf8().constData());
    if (!res) {
        if (why) *why = std::string("XML parse error: ") + res.description()
                      + " at offset " + std::to_string(res.offset);
        log_fmt("[CFL][XML][ERR] %s: %s", path.toUtf8().constData(), res.description());
        return false;
    }

    pugi::xml_node node = doc.find_node([](const pugi::xml_node& n) {
        return std::strcmp(n.name(), "loader") == 0;
    });
    if (!node) node = doc.document_element();
    if (!node) {
        if (why) *why = "empty document";
        return false;
    }

    log_fmt("[CFL][XML] loading options from '%s' <%s>", path.toUtf8().constData(), node.name());
    *out = optionsFromXmlNode(node, density);
    return true;
}

} // namespace cfl
