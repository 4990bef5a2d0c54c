#pragma once

// ============================================================================
// Page - A single page in a document
// ============================================================================
// A page is a fixed-size canvas, optionally backed by a page of the source
// PDF, carrying an ordered stack of overlay elements (index 0 = bottom).
//
// Page is a pure data class - no caching or input handling. Pages are located
// by uid, never by position: the position of a page in the document changes
// whenever pages are inserted, removed or reordered.
// ============================================================================

#include "../objects/PageElement.h"

#include <QSizeF>
#include <QString>
#include <QUuid>
#include <vector>
#include <memory>

class Page {
public:
    // ===== Identity =====
    QString uid;                ///< Stable identity, independent of position
    QSizeF size;                ///< Page dimensions in points
    int rotation = 0;           ///< 0, 90, 180 or 270 (not validated)
    int sourceIndex = -1;       ///< Page index in the source PDF, -1 = blank page

    // ===== Annotations =====
    QString label;              ///< User-visible label (shown in the page list)
    QString note;               ///< Free-form note, never exported

    // ===== Elements =====
    // std::vector because QVector requires copyable types
    std::vector<std::unique_ptr<PageElement>> elements;  ///< index 0 = bottom

    // ===== Constructors & Rule of Five =====

    Page();
    explicit Page(const QSizeF& pageSize);
    ~Page() = default;

    // Page is non-copyable due to unique_ptr members
    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;

    Page(Page&&) = default;
    Page& operator=(Page&&) = default;

    // ===== Factory Methods =====

    /**
     * @brief Create a blank page with no PDF backing.
     */
    static std::unique_ptr<Page> createBlank(const QSizeF& pageSize);

    /**
     * @brief Create a page backed by a page of the source PDF.
     * @param pageSize Page size in points.
     * @param sourcePage 0-based page index in the source PDF.
     * @param pageRotation /Rotate of the source page.
     */
    static std::unique_ptr<Page> createForPdf(const QSizeF& pageSize, int sourcePage,
                                              int pageRotation = 0);

    // ===== Element Management =====

    /**
     * @brief Append an element on top of the stack.
     * @return Non-owning pointer to the added element (nullptr if element was null).
     */
    PageElement* addElement(std::unique_ptr<PageElement> element);

    /**
     * @brief Insert an element at a stack position (clamped to [0, count]).
     */
    PageElement* insertElement(int index, std::unique_ptr<PageElement> element);

    /**
     * @brief Remove an element by id.
     * @return The removed element, or nullptr if no element has that id.
     */
    std::unique_ptr<PageElement> removeElement(const QString& id);

    /**
     * @brief Find an element by id.
     * @return Non-owning pointer, or nullptr if not found.
     */
    PageElement* findElement(const QString& id);
    const PageElement* findElement(const QString& id) const;

    /**
     * @brief Stack position of an element, or -1.
     */
    int indexOfElement(const QString& id) const;

    /**
     * @brief Topmost visible element containing a point.
     * @param pt Point in page coordinates.
     */
    PageElement* elementAtPoint(const QPointF& pt);

    int elementCount() const { return static_cast<int>(elements.size()); }

    // ===== Utility =====

    bool hasSource() const { return sourceIndex >= 0; }

    /**
     * @brief True if at least one element would be drawn.
     */
    bool hasVisibleElements() const;

    /**
     * @brief Render every visible element, bottom to top.
     * @param painter Target painter (page coordinates scaled by zoom).
     * @param zoom Current zoom level.
     */
    void renderElements(QPainter& painter, qreal zoom) const;
};
