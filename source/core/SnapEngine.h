#pragma once

// ============================================================================
// SnapEngine - Alignment snapping for element drags
// ============================================================================
// Given a proposed position for an element being dragged, returns the
// (possibly adjusted) position plus the guide lines to draw. Axes are solved
// independently; on each axis the first matching rule wins:
//   1. element center near page center
//   2. left/top edge near 0
//   3. right/bottom edge near the page extent
//   4. dragged left/center/right (top/center/bottom) near the same edges of
//      any other visible element, in stacking order
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <QPair>
#include <QtGlobal>
#include <Qt>

class Page;

/**
 * @brief A guide line shown while a snap rule is active.
 *
 * Vertical guides sit at an x coordinate, horizontal guides at a y coordinate.
 */
struct SnapGuide {
    Qt::Orientation orientation = Qt::Vertical;
    qreal coordinate = 0.0;

    bool operator==(const SnapGuide& other) const {
        return orientation == other.orientation && coordinate == other.coordinate;
    }
};

struct SnapResult {
    QPointF position;               ///< Snapped top-left corner
    QVector<SnapGuide> guides;      ///< At most one per axis
    bool snappedX = false;
    bool snappedY = false;
};

class SnapEngine {
public:
    /// Distance (page units) under which a rule fires. Comparison is strict.
    static constexpr qreal DEFAULT_THRESHOLD = 6.0;

    explicit SnapEngine(qreal threshold = DEFAULT_THRESHOLD) : m_threshold(threshold) {}

    /**
     * @brief Snap a proposed rectangle.
     * @param page Page the element lives on (siblings are read from it).
     * @param elementId The dragged element (excluded from sibling matching).
     * @param proposed Proposed geometry; size is kept, only position may change.
     */
    SnapResult snap(const Page& page, const QString& elementId, const QRectF& proposed) const;

    qreal threshold() const { return m_threshold; }

private:
    struct AxisResult {
        qreal start = 0.0;
        bool snapped = false;
        qreal guide = 0.0;
    };

    /**
     * @brief Solve one axis.
     * @param start Proposed left (or top).
     * @param length Width (or height).
     * @param extent Page width (or height).
     * @param siblingSpans (start, length) of every other visible element.
     */
    AxisResult snapAxis(qreal start, qreal length, qreal extent,
                        const QVector<QPair<qreal, qreal>>& siblingSpans) const;

    bool near(qreal a, qreal b) const { return qAbs(a - b) < m_threshold; }

    qreal m_threshold;
};
