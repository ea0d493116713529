// gui/model/text_layout.hpp: text resolution, auto-size and centered text blocks
#pragma once

#include "loader_state.hpp"

#include <QColor>
#include <QFont>
#include <QImage>
#include <QPointF>
#include <QString>
#include <QTextLayout>

#include <memory>
#include <optional>

class QPainter;

namespace cfl {

// Explicit text wins, then the formatted progress text, otherwise nothing.
std::optional<QString> resolveDisplayText(const TextState& text, int progress);

// printf-like formatting restricted to integers: %d / %i (flags and width
// allowed) take `value`, %% emits '%', any other sequence is copied as-is.
QString formatProgressText(const QString& format, int value);

// Font for `spec` at `size` pixels (rounded, at least 1).
QFont makeFont(const TextStyleSpec& spec, float size);

qreal measureTextWidth(const QFont& font, const QString& text);

// Largest size in [minSize, spec.size] whose single-line width fits
// `maxWidth`; bisects until the interval is <= 1 and keeps the lower bound.
float autoFitTextSize(const TextStyleSpec& spec, const QString& text,
                      float maxWidth, float minSize);

// Centered, word-wrapped block of text at a fixed width.
class TextBlock {
public:
    static std::unique_ptr<TextBlock> build(const QString& text, const QFont& font,
                                            qreal width, const QColor& color,
                                            const TextShadow& shadow = TextShadow());

    TextBlock(const TextBlock&) = delete;
    TextBlock& operator=(const TextBlock&) = delete;

    qreal   width() const { return m_width; }
    qreal   height() const { return m_height; }
    int     lineCount() const { return m_layout.lineCount(); }
    QString text() const { return m_layout.text(); }
    QFont   font() const { return m_layout.font(); }
    bool    hasShadow() const { return !m_shadow.isNull(); }

    // Draws with the block's top edge at topCenter.y(), centered on topCenter.x().
    void draw(QPainter& p, const QPointF& topCenter) const;

private:
    TextBlock() = default;
    void renderShadow(const TextShadow& shadow);

    QTextLayout m_layout;
    QColor      m_color;
    qreal       m_width  = 0.0;
    qreal       m_height = 0.0;

    QImage      m_shadow;          // blurred copy, drawn under the text
    QPointF     m_shadowOrigin;    // top-left of m_shadow relative to the block
};

} // namespace cfl
