#include "PageCanvas.h"
#include "../core/EditorSession.h"
#include "../core/Page.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>

namespace {
const QColor GUIDE_COLOR(0xff, 0x70, 0x43);
const QColor SELECTION_COLOR(66, 133, 244);
const QColor GRID_COLOR(0, 0, 0, 28);
}

PageCanvas::PageCanvas(QWidget* parent)
    : QWidget(parent)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
}

// ============================================================================
// Binding
// ============================================================================

void PageCanvas::setSession(EditorSession* session)
{
    if (m_session == session) {
        return;
    }
    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
    }
    m_session = session;
    m_pageUid.clear();
    m_selectedId.clear();

    if (!m_session) {
        return;
    }

    connect(m_session, &EditorSession::documentReplaced, this, [this]() {
        endDrag();
        m_pageUid.clear();
        clearSelection();
        updateGeometryForPage();
    });
    connect(m_session, &EditorSession::pagesChanged, this, [this]() {
        if (!currentPage()) {
            endDrag();
            m_pageUid.clear();
            clearSelection();
            updateGeometryForPage();
        }
    });
    connect(m_session, &EditorSession::pageContentChanged, this, [this](const QString& uid) {
        if (uid != m_pageUid) {
            return;
        }
        // Undo/redo/delete can remove the selected element
        if (!m_selectedId.isEmpty() && !selectedElement()) {
            endDrag();
            clearSelection();
        }
        update();
    });
    connect(m_session, &EditorSession::elementChanged, this, [this](const QString& uid, const QString&) {
        if (uid == m_pageUid) {
            update();
        }
    });
}

void PageCanvas::setPage(const QString& pageUid)
{
    if (m_pageUid == pageUid) {
        return;
    }
    endDrag();
    m_pageUid = pageUid;
    clearSelection();
    updateGeometryForPage();
}

void PageCanvas::selectElement(const QString& elementId)
{
    if (m_selectedId == elementId) {
        return;
    }
    m_selectedId = elementId;
    emit selectionChanged(m_pageUid, m_selectedId);
    update();
}

void PageCanvas::clearSelection()
{
    selectElement(QString());
}

void PageCanvas::setZoom(qreal zoom)
{
    zoom = qBound(0.1, zoom, 8.0);
    if (qFuzzyCompare(m_zoom, zoom)) {
        return;
    }
    m_zoom = zoom;
    updateGeometryForPage();
}

void PageCanvas::setGridVisible(bool visible)
{
    if (m_gridVisible != visible) {
        m_gridVisible = visible;
        update();
    }
}

QSize PageCanvas::sizeHint() const
{
    const Page* page = currentPage();
    if (!page) {
        return QSize(400, 300);
    }
    return (page->size * m_zoom).toSize();
}

void PageCanvas::updateGeometryForPage()
{
    setFixedSize(sizeHint());
    update();
}

// ============================================================================
// Lookup
// ============================================================================

Page* PageCanvas::currentPage() const
{
    if (!m_session || !m_session->document() || m_pageUid.isEmpty()) {
        return nullptr;
    }
    return m_session->document()->findPageById(m_pageUid);
}

PageElement* PageCanvas::selectedElement() const
{
    Page* page = currentPage();
    return page && !m_selectedId.isEmpty() ? page->findElement(m_selectedId) : nullptr;
}

QRectF PageCanvas::pageToWidget(const QRectF& rect) const
{
    return QRectF(rect.x() * m_zoom, rect.y() * m_zoom,
                  rect.width() * m_zoom, rect.height() * m_zoom);
}

// ============================================================================
// Painting
// ============================================================================

void PageCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), palette().window());

    const Page* page = currentPage();
    if (!page) {
        return;
    }

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    const QRectF pageRect(QPointF(0, 0), page->size * m_zoom);
    const QImage preview = m_session->preview(m_pageUid);
    if (preview.isNull()) {
        painter.fillRect(pageRect, Qt::white);
    } else {
        painter.drawImage(pageRect, preview);
    }

    if (m_gridVisible) {
        drawGrid(painter, page->size);
    }

    page->renderElements(painter, m_zoom);

    if (const PageElement* selected = selectedElement()) {
        drawSelection(painter, *selected);
    }
    drawGuides(painter, page->size);
}

void PageCanvas::drawGrid(QPainter& painter, const QSizeF& pageSize) const
{
    painter.save();
    painter.setPen(QPen(GRID_COLOR, 1));
    for (qreal x = GRID_SPACING; x < pageSize.width(); x += GRID_SPACING) {
        painter.drawLine(QPointF(x * m_zoom, 0), QPointF(x * m_zoom, pageSize.height() * m_zoom));
    }
    for (qreal y = GRID_SPACING; y < pageSize.height(); y += GRID_SPACING) {
        painter.drawLine(QPointF(0, y * m_zoom), QPointF(pageSize.width() * m_zoom, y * m_zoom));
    }
    painter.restore();
}

void PageCanvas::drawSelection(QPainter& painter, const PageElement& element) const
{
    painter.save();

    QPen framePen(SELECTION_COLOR, 1, element.locked ? Qt::DashLine : Qt::SolidLine);
    painter.setPen(framePen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(pageToWidget(element.rect));

    // Locked elements get no handles
    if (!element.locked) {
        painter.setPen(QPen(SELECTION_COLOR, 1));
        painter.setBrush(Qt::white);
        const qreal half = HANDLE_VISUAL_SIZE / 2.0;
        for (const QPointF& pt : handlePositions(element.rect)) {
            const QPointF center = pt * m_zoom;
            painter.drawRect(QRectF(center.x() - half, center.y() - half,
                                    HANDLE_VISUAL_SIZE, HANDLE_VISUAL_SIZE));
        }
    }

    painter.restore();
}

void PageCanvas::drawGuides(QPainter& painter, const QSizeF& pageSize) const
{
    if (m_guides.isEmpty()) {
        return;
    }

    painter.save();
    painter.setPen(QPen(GUIDE_COLOR, 1, Qt::DashLine));
    for (const SnapGuide& guide : m_guides) {
        const qreal c = guide.coordinate * m_zoom;
        if (guide.orientation == Qt::Vertical) {
            painter.drawLine(QPointF(c, 0), QPointF(c, pageSize.height() * m_zoom));
        } else {
            painter.drawLine(QPointF(0, c), QPointF(pageSize.width() * m_zoom, c));
        }
    }
    painter.restore();
}

// ============================================================================
// Handles
// ============================================================================

QVector<QPointF> PageCanvas::handlePositions(const QRectF& rect)
{
    const qreal cx = rect.center().x();
    const qreal cy = rect.center().y();
    return {
        rect.topLeft(), QPointF(cx, rect.top()), rect.topRight(),
        QPointF(rect.left(), cy), QPointF(rect.right(), cy),
        rect.bottomLeft(), QPointF(cx, rect.bottom()), rect.bottomRight()
    };
}

PageCanvas::HandleHit PageCanvas::hitTestHandles(const QPointF& widgetPos) const
{
    const PageElement* element = selectedElement();
    if (!element) {
        return HandleHit::None;
    }

    // Order matches handlePositions()
    static const HandleHit handleTypes[] = {
        HandleHit::TopLeft, HandleHit::Top, HandleHit::TopRight,
        HandleHit::Left, HandleHit::Right,
        HandleHit::BottomLeft, HandleHit::Bottom, HandleHit::BottomRight
    };

    if (!element->locked) {
        const qreal hitRadius = HANDLE_HIT_SIZE / 2.0;
        const QVector<QPointF> positions = handlePositions(element->rect);
        for (int i = 0; i < positions.size(); ++i) {
            const QPointF d = widgetPos - positions[i] * m_zoom;
            if (qAbs(d.x()) <= hitRadius && qAbs(d.y()) <= hitRadius) {
                return handleTypes[i];
            }
        }
    }

    if (pageToWidget(element->rect).contains(widgetPos)) {
        return HandleHit::Inside;
    }
    return HandleHit::None;
}

QRectF PageCanvas::resizedRect(HandleHit handle, const QPointF& delta) const
{
    qreal left = m_dragStartRect.left();
    qreal top = m_dragStartRect.top();
    qreal right = m_dragStartRect.right();
    qreal bottom = m_dragStartRect.bottom();

    switch (handle) {
        case HandleHit::TopLeft:     left += delta.x(); top += delta.y(); break;
        case HandleHit::Top:         top += delta.y(); break;
        case HandleHit::TopRight:    right += delta.x(); top += delta.y(); break;
        case HandleHit::Left:        left += delta.x(); break;
        case HandleHit::Right:       right += delta.x(); break;
        case HandleHit::BottomLeft:  left += delta.x(); bottom += delta.y(); break;
        case HandleHit::Bottom:      bottom += delta.y(); break;
        case HandleHit::BottomRight: right += delta.x(); bottom += delta.y(); break;
        case HandleHit::None:
        case HandleHit::Inside:
            return m_dragStartRect;
    }

    // The edge opposite the handle stays put
    if (right - left < MIN_ELEMENT_SIZE) {
        if (left != m_dragStartRect.left()) {
            left = right - MIN_ELEMENT_SIZE;
        } else {
            right = left + MIN_ELEMENT_SIZE;
        }
    }
    if (bottom - top < MIN_ELEMENT_SIZE) {
        if (top != m_dragStartRect.top()) {
            top = bottom - MIN_ELEMENT_SIZE;
        } else {
            bottom = top + MIN_ELEMENT_SIZE;
        }
    }
    return QRectF(QPointF(left, top), QPointF(right, bottom));
}

// ============================================================================
// Mouse / Keyboard
// ============================================================================

void PageCanvas::mousePressEvent(QMouseEvent* event)
{
    Page* page = currentPage();
    if (!page || event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }

    setFocus(Qt::MouseFocusReason);
    const QPointF widgetPos = event->position();

    // Handles of the current selection take priority over elements above it
    HandleHit hit = hitTestHandles(widgetPos);
    if (hit == HandleHit::None || hit == HandleHit::Inside) {
        PageElement* element = page->elementAtPoint(widgetToPage(widgetPos));
        if (!element) {
            clearSelection();
            return;
        }
        selectElement(element->id);
        hit = HandleHit::Inside;
    }

    PageElement* selected = selectedElement();
    if (!selected || selected->locked) {
        return;
    }

    m_dragHandle = hit;
    m_dragStartPagePos = widgetToPage(widgetPos);
    m_dragStartRect = selected->rect;
}

void PageCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (m_dragHandle == HandleHit::None) {
        switch (hitTestHandles(event->position())) {
            case HandleHit::TopLeft:
            case HandleHit::BottomRight:
                setCursor(Qt::SizeFDiagCursor);
                break;
            case HandleHit::TopRight:
            case HandleHit::BottomLeft:
                setCursor(Qt::SizeBDiagCursor);
                break;
            case HandleHit::Top:
            case HandleHit::Bottom:
                setCursor(Qt::SizeVerCursor);
                break;
            case HandleHit::Left:
            case HandleHit::Right:
                setCursor(Qt::SizeHorCursor);
                break;
            case HandleHit::Inside:
                setCursor(selectedElement() && selectedElement()->locked ? Qt::ArrowCursor
                                                                         : Qt::SizeAllCursor);
                break;
            case HandleHit::None:
                unsetCursor();
                break;
        }
        return;
    }

    Page* page = currentPage();
    if (!page || !selectedElement() || !m_session) {
        endDrag();
        return;
    }

    const QPointF delta = widgetToPage(event->position()) - m_dragStartPagePos;

    if (m_dragHandle == HandleHit::Inside) {
        const QRectF proposed = m_dragStartRect.translated(delta);
        SnapResult snap = m_snapEngine.snap(*page, m_selectedId, proposed);
        m_guides = snap.guides;
        m_session->setElementGeometry(m_pageUid, m_selectedId,
                                      QRectF(snap.position, m_dragStartRect.size()));
    } else {
        m_session->setElementGeometry(m_pageUid, m_selectedId, resizedRect(m_dragHandle, delta));
    }
    update();
}

void PageCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        endDrag();
    }
    QWidget::mouseReleaseEvent(event);
}

void PageCanvas::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape && m_dragHandle != HandleHit::None) {
        if (m_session && selectedElement()) {
            m_session->setElementGeometry(m_pageUid, m_selectedId, m_dragStartRect);
        }
        endDrag();
        return;
    }
    QWidget::keyPressEvent(event);
}

void PageCanvas::endDrag()
{
    m_dragHandle = HandleHit::None;
    if (!m_guides.isEmpty()) {
        m_guides.clear();
        update();
    }
}
