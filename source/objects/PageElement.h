#pragma once

// ============================================================================
// PageElement - Abstract base class for all elements placed on a page
// ============================================================================
// PageElement is the base for any overlay content that is composited on top
// of a page:
// - Images (ImageElement)
// - Text boxes (TextElement)
//
// The set of element kinds is closed. Code that must treat every kind
// differently (cloning, export) switches over PageElement::Kind without a
// default branch, so adding a kind is a compile-time decision point.
// ============================================================================

#include <QString>
#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QUuid>
#include <QPainter>
#include <memory>

/**
 * @brief Abstract base class for elements placed on a page.
 *
 * Geometry is expressed in page space (points, origin top-left).
 * An element is owned by exactly one Page at a time.
 */
class PageElement {
public:
    /**
     * @brief Closed set of element kinds.
     */
    enum class Kind {
        Image,      ///< ImageElement
        Text        ///< TextElement
    };

    /// Smallest width/height an element can be resized to.
    static constexpr qreal MIN_DIMENSION = 1.0;

    // ===== Common Properties =====
    QString id;               ///< Stable UUID, assigned at creation, kept by clones
    QRectF rect;              ///< Bounding box in page coordinates
    qreal rotation = 0.0;     ///< Degrees, on-screen only (not exported)
    qreal opacity = 1.0;      ///< 0.0 - 1.0
    bool locked = false;      ///< If true, interactive move/resize is suppressed
    bool visible = true;      ///< If false, neither rendered nor exported

    /**
     * @brief Default constructor.
     * Creates an element with a unique ID.
     */
    PageElement() {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    virtual ~PageElement() = default;

    // ===== Pure Virtual Methods =====

    /**
     * @brief Kind discriminator for exhaustive switches.
     */
    virtual Kind kind() const = 0;

    /**
     * @brief Render this element.
     * @param painter The QPainter to render to.
     * @param zoom Current zoom level (1.0 = one pixel per point).
     *
     * Invisible elements render nothing.
     */
    virtual void render(QPainter& painter, qreal zoom) const = 0;

    // ===== Virtual Methods =====

    /**
     * @brief Hit test in page coordinates.
     */
    virtual bool containsPoint(const QPointF& pt) const;

    // ===== Geometry =====

    /**
     * @brief Move the top-left corner to (x, y). Size is unchanged.
     */
    void moveTo(qreal x, qreal y);

    /**
     * @brief Set the size, clamping each dimension to MIN_DIMENSION.
     */
    void resize(qreal width, qreal height);

    /**
     * @brief Set opacity, clamped to [0, 1].
     */
    void setOpacity(qreal value);

    QPointF center() const { return rect.center(); }

protected:
    PageElement(const PageElement&) = default;
    PageElement& operator=(const PageElement&) = default;

    /**
     * @brief Apply rotation around the element's center before drawing.
     *
     * Used by subclasses inside a painter.save()/restore() pair.
     */
    void applyRotation(QPainter& painter, const QRectF& targetRect) const;
};

/**
 * @brief Deep copy an element of any kind.
 * @param element The element to copy.
 * @return A fully detached copy with the same id and every field duplicated.
 *
 * Byte buffers are value-copied; mutating the copy never affects the source.
 */
std::unique_ptr<PageElement> cloneElement(const PageElement& element);
