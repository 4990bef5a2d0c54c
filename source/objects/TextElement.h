#pragma once

// ============================================================================
// TextElement - A word-wrapped text box placed on a page
// ============================================================================

#include "PageElement.h"
#include <QColor>

class TextElement : public PageElement {
public:
    static constexpr qreal MIN_FONT_SIZE = 1.0;

    QString text;                                   ///< UTF-8, may contain newlines
    QString fontFamily = QStringLiteral("Helvetica");
    qreal fontSize = 14.0;                          ///< Points
    QString color = QStringLiteral("#000000");      ///< 6 hex digits, '#' optional

    TextElement() = default;
    TextElement(const TextElement&) = default;
    TextElement& operator=(const TextElement&) = default;

    TextElement(const QString& content, const QRectF& rect);

    Kind kind() const override { return Kind::Text; }
    void render(QPainter& painter, qreal zoom) const override;

    /**
     * @brief Set the font size, clamped to MIN_FONT_SIZE.
     */
    void setFontSize(qreal size);

    /**
     * @brief Decoded color, black if the hex string is malformed.
     */
    QColor rgbColor() const { return parseHexColor(color); }

    /**
     * @brief Parse "RRGGBB" or "#RRGGBB".
     * @return The color, or black for anything else.
     */
    static QColor parseHexColor(const QString& hex);
};
