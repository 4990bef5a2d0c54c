#pragma once

// ============================================================================
// Document - The ordered list of pages being edited
// ============================================================================
// Document represents an open PDF and owns all of its Pages. It is created
// in one piece by PdfImporter (or as a blank document), edited in place, and
// replaced wholesale when another file is opened.
//
// Document is a pure data class - rendering and input are handled by the UI,
// change notification by EditorSession.
// ============================================================================

#include "Page.h"

#include <QString>
#include <QSizeF>
#include <vector>
#include <memory>

class Document {
public:
    /// A4 portrait in points
    static constexpr qreal DEFAULT_PAGE_WIDTH = 595.0;
    static constexpr qreal DEFAULT_PAGE_HEIGHT = 842.0;

    // ===== State =====
    bool modified = false;              ///< True if document has unsaved changes

    // ===== Constructors & Rule of Five =====

    Document() = default;
    explicit Document(const QString& source);
    ~Document() = default;

    // Document is non-copyable due to unique_ptr members
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    // ===== Factory Methods =====

    /**
     * @brief Create a document with a single blank page and no source file.
     */
    static std::unique_ptr<Document> createBlank(const QSizeF& pageSize =
                                                 QSizeF(DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT));

    // ===== Utility =====

    void markModified() { modified = true; }
    void clearModified() { modified = false; }

    /**
     * @brief Path of the PDF this document was imported from (empty for blank).
     */
    QString sourcePath() const { return m_sourcePath; }
    bool hasSource() const { return !m_sourcePath.isEmpty(); }

    /**
     * @brief File name without directory and extension, "untitled" if none.
     */
    QString sourceStem() const;

    // =========================================================================
    // Page Management
    // =========================================================================

    int pageCount() const { return static_cast<int>(m_pages.size()); }

    /**
     * @brief Page at a position.
     * @return Pointer to the page, or nullptr if index is out of range.
     */
    Page* page(int index);
    const Page* page(int index) const;

    /**
     * @brief Find a page by uid.
     * @return Pointer to the page, or nullptr if not found.
     */
    Page* findPageById(const QString& uid);
    const Page* findPageById(const QString& uid) const;

    /**
     * @brief Position of a page, or -1 if not found.
     */
    int indexOfPage(const QString& uid) const;

    /**
     * @brief Append a page at the end.
     * @return Non-owning pointer to the page.
     */
    Page* appendPage(std::unique_ptr<Page> page);

    /**
     * @brief Insert a page at a position (clamped to [0, pageCount]).
     */
    Page* insertPage(int index, std::unique_ptr<Page> page);

    /**
     * @brief Append a blank page of the given size.
     */
    Page* addBlankPage(const QSizeF& pageSize);

    /**
     * @brief Remove a page by uid.
     * @return The removed page, or nullptr if no page has that uid.
     */
    std::unique_ptr<Page> removePage(const QString& uid);

    /**
     * @brief Move a page from one position to another.
     * @return True if moved (or from == to), false if an index is invalid.
     */
    bool movePage(int from, int to);

    /**
     * @brief Total number of elements over all pages.
     */
    int elementCount() const;

private:
    QString m_sourcePath;
    std::vector<std::unique_ptr<Page>> m_pages;
};
