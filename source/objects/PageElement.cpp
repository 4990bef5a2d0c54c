// ============================================================================
// PageElement - Implementation
// ============================================================================

#include "PageElement.h"
#include "ImageElement.h"
#include "TextElement.h"

#include <QtGlobal>

bool PageElement::containsPoint(const QPointF& pt) const
{
    return rect.contains(pt);
}

void PageElement::moveTo(qreal x, qreal y)
{
    rect.moveTo(x, y);
}

void PageElement::resize(qreal width, qreal height)
{
    rect.setSize(QSizeF(qMax(MIN_DIMENSION, width), qMax(MIN_DIMENSION, height)));
}

void PageElement::setOpacity(qreal value)
{
    opacity = qBound(0.0, value, 1.0);
}

void PageElement::applyRotation(QPainter& painter, const QRectF& targetRect) const
{
    if (rotation == 0.0) {
        return;
    }
    QPointF centerPoint = targetRect.center();
    painter.translate(centerPoint);
    painter.rotate(rotation);
    painter.translate(-centerPoint);
}

std::unique_ptr<PageElement> cloneElement(const PageElement& element)
{
    // No default branch: -Wswitch flags a missing kind here.
    switch (element.kind()) {
        case PageElement::Kind::Image: {
            const auto& image = static_cast<const ImageElement&>(element);
            auto copy = std::make_unique<ImageElement>(image);
            // QByteArray is implicitly shared; detach so the copy owns its bytes.
            copy->imageBytes.detach();
            return copy;
        }
        case PageElement::Kind::Text:
            return std::make_unique<TextElement>(static_cast<const TextElement&>(element));
    }
    return nullptr;
}
