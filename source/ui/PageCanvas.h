#ifndef PAGECANVAS_H
#define PAGECANVAS_H

// ============================================================================
// PageCanvas - Interactive view of one page
// ============================================================================
// Paints the page preview, its elements, the selection frame with 8 resize
// handles, an optional grid and the snap guides of an active drag.
//
// Mouse interaction:
// - Click selects the topmost visible element under the cursor
// - Dragging the selection moves it, snapped by SnapEngine
// - Dragging a handle resizes it (minimum MIN_ELEMENT_SIZE per side)
// - Locked elements can be selected but not moved or resized
// - Esc during a drag restores the original geometry
//
// All geometry changes go through EditorSession.
// ============================================================================

#include "../core/SnapEngine.h"

#include <QWidget>
#include <QPointer>
#include <QRectF>
#include <QVector>

class EditorSession;
class Page;
class PageElement;

class PageCanvas : public QWidget {
    Q_OBJECT

public:
    /**
     * @brief Handle hit types for the selection frame.
     */
    enum class HandleHit {
        None,
        TopLeft, Top, TopRight,
        Left, Right,
        BottomLeft, Bottom, BottomRight,
        Inside    ///< Inside the frame (for move)
    };

    static constexpr qreal MIN_ELEMENT_SIZE = 12.0;   ///< Page units
    static constexpr qreal GRID_SPACING = 50.0;       ///< Page units
    static constexpr qreal HANDLE_VISUAL_SIZE = 8.0;  ///< Pixels
    static constexpr qreal HANDLE_HIT_SIZE = 14.0;    ///< Pixels

    explicit PageCanvas(QWidget* parent = nullptr);

    void setSession(EditorSession* session);

    /**
     * @brief Show a page. Clears the selection.
     */
    void setPage(const QString& pageUid);
    QString pageUid() const { return m_pageUid; }

    QString selectedElementId() const { return m_selectedId; }
    void selectElement(const QString& elementId);
    void clearSelection();

    void setZoom(qreal zoom);
    qreal zoom() const { return m_zoom; }

    void setGridVisible(bool visible);
    bool isGridVisible() const { return m_gridVisible; }

    QSize sizeHint() const override;

signals:
    void selectionChanged(const QString& pageUid, const QString& elementId);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    Page* currentPage() const;
    PageElement* selectedElement() const;

    QPointF widgetToPage(const QPointF& pt) const { return pt / m_zoom; }
    QRectF pageToWidget(const QRectF& rect) const;

    /**
     * @brief Handle centers in page coordinates, order TL T TR L R BL B BR.
     */
    static QVector<QPointF> handlePositions(const QRectF& rect);
    HandleHit hitTestHandles(const QPointF& widgetPos) const;

    /**
     * @brief New geometry while dragging a resize handle.
     */
    QRectF resizedRect(HandleHit handle, const QPointF& delta) const;

    void drawGrid(QPainter& painter, const QSizeF& pageSize) const;
    void drawSelection(QPainter& painter, const PageElement& element) const;
    void drawGuides(QPainter& painter, const QSizeF& pageSize) const;

    void endDrag();
    void updateGeometryForPage();

    QPointer<EditorSession> m_session;
    QString m_pageUid;
    QString m_selectedId;

    qreal m_zoom = 1.0;
    bool m_gridVisible = false;

    // Drag state
    HandleHit m_dragHandle = HandleHit::None;
    QPointF m_dragStartPagePos;
    QRectF m_dragStartRect;
    QVector<SnapGuide> m_guides;    ///< Only populated during a move
    SnapEngine m_snapEngine;
};

#endif // PAGECANVAS_H
