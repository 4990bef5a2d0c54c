// ============================================================================
// SnapEngine - Implementation
// ============================================================================

#include "SnapEngine.h"
#include "Page.h"

#include <QPair>

SnapResult SnapEngine::snap(const Page& page, const QString& elementId, const QRectF& proposed) const
{
    QVector<QPair<qreal, qreal>> spansX;
    QVector<QPair<qreal, qreal>> spansY;
    for (const auto& element : page.elements) {
        // Locked siblings still act as snap targets
        if (element->id == elementId || !element->visible) {
            continue;
        }
        spansX.append(qMakePair(element->rect.x(), element->rect.width()));
        spansY.append(qMakePair(element->rect.y(), element->rect.height()));
    }

    AxisResult x = snapAxis(proposed.x(), proposed.width(), page.size.width(), spansX);
    AxisResult y = snapAxis(proposed.y(), proposed.height(), page.size.height(), spansY);

    SnapResult result;
    result.position = QPointF(x.start, y.start);
    result.snappedX = x.snapped;
    result.snappedY = y.snapped;
    if (x.snapped) {
        result.guides.append(SnapGuide{Qt::Vertical, x.guide});
    }
    if (y.snapped) {
        result.guides.append(SnapGuide{Qt::Horizontal, y.guide});
    }
    return result;
}

SnapEngine::AxisResult SnapEngine::snapAxis(qreal start, qreal length, qreal extent,
                                            const QVector<QPair<qreal, qreal>>& siblingSpans) const
{
    AxisResult r;
    r.start = start;

    const qreal pageCenter = extent / 2.0;
    if (near(start + length / 2.0, pageCenter)) {
        r.start = pageCenter - length / 2.0;
        r.snapped = true;
        r.guide = pageCenter;
        return r;
    }
    if (near(start, 0.0)) {
        r.start = 0.0;
        r.snapped = true;
        r.guide = 0.0;
        return r;
    }
    if (near(start + length, extent)) {
        r.start = extent - length;
        r.snapped = true;
        r.guide = extent;
        return r;
    }

    // Offsets of the dragged element's left, center and right from its start
    const qreal draggedOffsets[3] = { 0.0, length / 2.0, length };

    for (const auto& span : siblingSpans) {
        const qreal targets[3] = { span.first, span.first + span.second / 2.0,
                                   span.first + span.second };
        for (qreal offset : draggedOffsets) {
            for (qreal target : targets) {
                if (near(start + offset, target)) {
                    r.start = target - offset;
                    r.snapped = true;
                    r.guide = target;
                    return r;
                }
            }
        }
    }
    return r;
}
