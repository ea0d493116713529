// gui/model/text_layout.cpp
#include "text_layout.hpp"
#include "diag.hpp"

#include <QFontMetricsF>
#include <QPainter>
#include <QTextLine>
#include <QTextOption>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <new>

namespace cfl {

namespace {
    constexpr int   kMaxFormatWidth = 64;
    // blur radius -> gaussian sigma, as used by Android/Skia shadow layers
    constexpr float kBlurSigmaScale = 0.57735f;
    constexpr float kBlurSigmaBias  = 0.5f;
}

std::optional<QString> resolveDisplayText(const TextState& text, int progress)
{
    if (text.text) return text.text;
    if (text.showProgressText) return formatProgressText(text.progressTextFormat, progress);
    return std::nullopt;
}

QString formatProgressText(const QString& format, int value)
{
    static const QString kFlags = QStringLiteral("-+ 0#");

    QString out;
    out.reserve(format.size() + 8);
    const int n = format.size();
    for (int i = 0; i < n; ++i) {
        const QChar c = format.at(i);
        if (c != QLatin1Char('%')) { out += c; continue; }

        if (i + 1 < n && format.at(i + 1) == QLatin1Char('%')) {
            out += QLatin1Char('%');
            ++i;
            continue;
        }

        int j = i + 1;
        QString flags;
        while (j < n && kFlags.contains(format.at(j))) flags += format.at(j++);
        int width = 0;
        while (j < n && format.at(j).isDigit()) {
            width = std::min(kMaxFormatWidth, width * 10 + format.at(j).digitValue());
            ++j;
        }

        if (j < n && (format.at(j) == QLatin1Char('d') || format.at(j) == QLatin1Char('i'))) {
            QString spec = QStringLiteral("%") + flags;
            if (width > 0) spec += QString::number(width);
            spec += QLatin1Char('d');
            out += QString::asprintf(spec.toLatin1().constData(), value);
            i = j;
            continue;
        }
        out += c;   // not an integer conversion: literal '%'
    }
    return out;
}

QFont makeFont(const TextStyleSpec& spec, float size)
{
    QFont f;
    if (spec.fontFamily && !spec.fontFamily->isEmpty()) f.setFamily(*spec.fontFamily);

    const int px = std::max(1, static_cast<int>(std::lround(size)));
    f.setPixelSize(px);
    f.setBold(spec.style == TextStyle::Bold || spec.style == TextStyle::BoldItalic);
    f.setItalic(spec.style == TextStyle::Italic || spec.style == TextStyle::BoldItalic);
    if (spec.letterSpacing != 0.0f)
        f.setLetterSpacing(QFont::AbsoluteSpacing, spec.letterSpacing * px);
    return f;
}

qreal measureTextWidth(const QFont& font, const QString& text)
{
    if (text.isEmpty()) return 0.0;
    return QFontMetricsF(font).horizontalAdvance(text);
}

float autoFitTextSize(const TextStyleSpec& spec, const QString& text,
                      float maxWidth, float minSize)
{
    float hi = spec.size;
    float lo = minSize;
    while (hi - lo > 1.0f) {
        const float mid = (hi + lo) / 2.0f;
        if (measureTextWidth(makeFont(spec, mid), text) <= maxWidth) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

std::unique_ptr<TextBlock> TextBlock::build(const QString& text, const QFont& font,
                                            qreal width, const QColor& color,
                                            const TextShadow& shadow)
{
    if (width <= 0.0) return nullptr;

    std::unique_ptr<TextBlock> block(new TextBlock());
    block->m_color = color;
    block->m_width = width;

    QString body = text;
    body.replace(QLatin1Char('\n'), QChar::LineSeparator);

    QTextOption opt(Qt::AlignHCenter);
    opt.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);

    QTextLayout& layout = block->m_layout;
    layout.setText(body);
    layout.setFont(font);
    layout.setTextOption(opt);
    layout.setCacheEnabled(true);

    qreal y = 0.0;
    layout.beginLayout();
    for (;;) {
        QTextLine line = layout.createLine();
        if (!line.isValid()) break;
        line.setLineWidth(width);
        line.setPosition(QPointF(0.0, y));
        y += line.height();
    }
    layout.endLayout();
    block->m_height = y;

    if (shadow.radius > 0.0f && shadow.color.alpha() > 0)
        block->renderShadow(shadow);
    return block;
}

void TextBlock::renderShadow(const TextShadow& shadow)
{
    const double sigma = kBlurSigmaScale * shadow.radius + kBlurSigmaBias;
    const int pad = static_cast<int>(std::ceil(3.0 * sigma));
    const int w = static_cast<int>(std::ceil(m_width)) + 2 * pad;
    const int h = static_cast<int>(std::ceil(m_height)) + 2 * pad;

    QImage img(w, h, QImage::Format_ARGB32_Premultiplied);
    if (img.isNull()) {
        log_fmt("[CFL][Text][ERR] shadow %dx%d allocation failed; drawing without shadow", w, h);
        return;
    }
    img.fill(Qt::transparent);
    {
        QPainter p(&img);
        p.setRenderHint(QPainter::TextAntialiasing, true);
        p.setPen(shadow.color);
        m_layout.draw(&p, QPointF(pad, pad));
    }

    try {
        cv::Mat m(h, w, CV_8UC4, img.bits(), static_cast<size_t>(img.bytesPerLine()));
        cv::GaussianBlur(m, m, cv::Size(0, 0), sigma, sigma, cv::BORDER_CONSTANT);
    } catch (const cv::Exception& e) {
        log_fmt("[CFL][Text][ERR] shadow blur: %s", e.what());
        return;
    } catch (const std::bad_alloc&) {
        log_line("[CFL][Text][ERR] shadow blur: out of memory");
        return;
    }

    m_shadow = img;
    m_shadowOrigin = QPointF(shadow.dx - pad, shadow.dy - pad);
}

void TextBlock::draw(QPainter& p, const QPointF& topCenter) const
{
    const QPointF topLeft(topCenter.x() - m_width / 2.0, topCenter.y());
    if (!m_shadow.isNull())
        p.drawImage(topLeft + m_shadowOrigin, m_shadow);

    p.save();
    p.setPen(m_color);
    m_layout.draw(&p, topLeft);
    p.restore();
}

} // namespace cfl
