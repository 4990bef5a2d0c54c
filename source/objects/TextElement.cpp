// ============================================================================
// TextElement - Implementation
// ============================================================================

#include "TextElement.h"
#include <QFont>
#include <QPaintDevice>
#include <QRegularExpression>
#include <QtGlobal>

TextElement::TextElement(const QString& content, const QRectF& r)
    : text(content)
{
    rect = r;
}

void TextElement::setFontSize(qreal size)
{
    fontSize = qMax(MIN_FONT_SIZE, size);
}

QColor TextElement::parseHexColor(const QString& hex)
{
    QString digits = hex.trimmed();
    if (digits.startsWith(QLatin1Char('#'))) {
        digits.remove(0, 1);
    }
    // toUInt() also accepts a "0x" prefix or a sign
    static const QRegularExpression sixHexDigits(QStringLiteral("^[0-9A-Fa-f]{6}$"));
    if (!sixHexDigits.match(digits).hasMatch()) {
        return QColor(Qt::black);
    }

    bool ok = false;
    uint value = digits.toUInt(&ok, 16);
    if (!ok) {
        return QColor(Qt::black);
    }
    return QColor((value >> 16) & 0xFF, (value >> 8) & 0xFF, value & 0xFF);
}

void TextElement::render(QPainter& painter, qreal zoom) const
{
    if (!visible || text.isEmpty()) {
        return;
    }

    painter.save();
    // Draw in page units so that fontSize maps to points regardless of zoom
    painter.scale(zoom, zoom);
    painter.setOpacity(painter.opacity() * opacity);
    applyRotation(painter, rect);

    QFont font(fontFamily);
    qreal dpi = painter.device() ? painter.device()->logicalDpiY() : 72.0;
    font.setPointSizeF(fontSize * 72.0 / dpi);
    painter.setFont(font);
    painter.setPen(rgbColor());
    painter.setClipRect(rect, Qt::IntersectClip);
    painter.drawText(rect, Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, text);
    painter.restore();
}
