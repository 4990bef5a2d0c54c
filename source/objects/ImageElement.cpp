// ============================================================================
// ImageElement - Implementation
// ============================================================================

#include "ImageElement.h"
#include <QDebug>

ImageElement::ImageElement(const QByteArray& bytes, const QString& path, const QRectF& r)
    : sourcePath(path)
    , imageBytes(bytes)
{
    rect = r;
}

const QImage& ImageElement::image() const
{
    if (!decodeAttempted) {
        decodeAttempted = true;
        if (!cachedImage.loadFromData(imageBytes)) {
            qWarning() << "[ImageElement] Could not decode image" << id << sourcePath;
        }
    }
    return cachedImage;
}

void ImageElement::render(QPainter& painter, qreal zoom) const
{
    if (!visible) {
        return;
    }

    const QImage& img = image();
    if (img.isNull()) {
        return;
    }

    QRectF targetRect(rect.x() * zoom, rect.y() * zoom,
                      rect.width() * zoom, rect.height() * zoom);

    painter.save();
    painter.setOpacity(painter.opacity() * opacity);
    applyRotation(painter, targetRect);
    painter.drawImage(targetRect, img);
    painter.restore();
}
