#pragma once

// ============================================================================
// EditorSession - The open document and every edit applied to it
// ============================================================================
// EditorSession owns:
// - The Document being edited (replaced wholesale on open)
// - The page previews produced at import, keyed by page uid
// - The undo/redo History
// - The unsaved-changes flag and autosave
//
// All edits go through EditorSession so that views (canvas, page list,
// property panel) learn about them from its signals instead of watching the
// model classes, which are plain data and know nothing about Qt objects.
// ============================================================================

#include "Document.h"
#include "History.h"
#include "../pdf/MuPdfExporter.h"

#include <QObject>
#include <QHash>
#include <QImage>
#include <QByteArray>
#include <memory>

struct Preferences;
class TextElement;

class EditorSession : public QObject {
    Q_OBJECT

public:
    /// Inserted images are at most this fraction of the page width.
    static constexpr qreal MAX_IMAGE_WIDTH_RATIO = 0.6;
    static constexpr qreal DEFAULT_TEXT_WIDTH = 200.0;
    static constexpr qreal DEFAULT_TEXT_HEIGHT = 60.0;

    explicit EditorSession(const Preferences& preferences, QObject* parent = nullptr);
    ~EditorSession() override;

    // =========================================================================
    // State
    // =========================================================================

    Document* document() { return m_document.get(); }
    const Document* document() const { return m_document.get(); }
    bool hasDocument() const { return m_document != nullptr; }

    /**
     * @brief Preview raster of a page (one pixel per point).
     *
     * Pages without a source get a white image of the page size.
     */
    QImage preview(const QString& pageUid) const;

    bool isModified() const { return m_document && m_document->modified; }

    /**
     * @brief Message of the most recent failed operation.
     */
    QString lastError() const { return m_lastError; }

    const History& history() const { return m_history; }
    bool canUndo() const { return m_history.canUndo(); }
    bool canRedo() const { return m_history.canRedo(); }

    // =========================================================================
    // Document Lifecycle
    // =========================================================================

    /**
     * @brief Import a PDF, replacing the current document.
     * @return False on failure (see lastError()); the current document is kept.
     */
    bool openPdf(const QString& path);

    /**
     * @brief Replace the current document with one blank page.
     */
    void newBlankDocument();

    /**
     * @brief Export the document.
     *
     * Clears the unsaved-changes flag on success.
     */
    PdfExportResult exportTo(const QString& path);

    // =========================================================================
    // Elements (insert/delete are undoable)
    // =========================================================================

    /**
     * @brief Read an image file and insert it centered on a page.
     * @return The new element, or nullptr (see lastError()).
     */
    PageElement* insertImageFile(const QString& pageUid, const QString& path);

    /**
     * @brief Insert encoded image bytes centered on a page.
     *
     * Width is the image's pixel width, capped at MAX_IMAGE_WIDTH_RATIO of
     * the page width; height follows the aspect ratio.
     */
    PageElement* insertImage(const QString& pageUid, const QByteArray& bytes,
                             const QString& sourcePath = QString());

    /**
     * @brief Insert a text box centered on a page.
     * @return The new element, or nullptr if text is empty or the page is unknown.
     */
    PageElement* insertText(const QString& pageUid, const QString& text);

    /**
     * @brief Delete an element. Unknown ids are ignored.
     */
    bool deleteElement(const QString& pageUid, const QString& elementId);

    // =========================================================================
    // Element Properties (not undoable)
    // =========================================================================

    bool setElementGeometry(const QString& pageUid, const QString& elementId, const QRectF& rect);
    bool setElementOpacity(const QString& pageUid, const QString& elementId, qreal opacity);
    bool setElementVisible(const QString& pageUid, const QString& elementId, bool visible);
    bool setElementLocked(const QString& pageUid, const QString& elementId, bool locked);
    bool setTextContent(const QString& pageUid, const QString& elementId, const QString& text);
    bool setTextStyle(const QString& pageUid, const QString& elementId,
                      const QString& fontFamily, qreal fontSize, const QString& color);

    PageElement* findElement(const QString& pageUid, const QString& elementId);

    // =========================================================================
    // Pages (not undoable)
    // =========================================================================

    /**
     * @brief Insert a blank page of the preferred default size.
     * @param afterUid Insert after this page; appended if empty or unknown.
     */
    Page* addBlankPage(const QString& afterUid = QString());

    /**
     * @brief Remove a page. The last remaining page cannot be removed.
     */
    bool removePage(const QString& uid);

    bool movePage(const QString& uid, int toIndex);
    bool setPageLabel(const QString& uid, const QString& label);
    bool setPageNote(const QString& uid, const QString& note);

    // =========================================================================
    // History
    // =========================================================================

    bool undo();
    bool redo();

    // =========================================================================
    // Autosave
    // =========================================================================

    /**
     * @brief <cache dir>/<source stem>_autosave.pdf
     */
    QString autosavePath() const;

    /**
     * @brief Override the autosave directory (default: the user cache location).
     */
    void setAutosaveDirectory(const QString& dir) { m_autosaveDir = dir; }

    /**
     * @brief Export a recovery copy if there are unsaved changes.
     *
     * Never fails loudly: errors are logged and reported via autosaveFailed().
     * The unsaved-changes flag is left as is.
     * @return True if a copy was written.
     */
    bool autosave();

signals:
    void documentReplaced();
    void pagesChanged();
    void pageContentChanged(const QString& pageUid);
    void elementChanged(const QString& pageUid, const QString& elementId);
    void historyChanged(bool canUndo, bool canRedo);
    void modifiedChanged(bool modified);
    void autosaved(const QString& path);
    void autosaveFailed(const QString& errorMessage);

private:
    void replaceDocument(std::unique_ptr<Document> document);
    void markModified();
    void emitHistoryChanged();
    TextElement* findText(const QString& pageUid, const QString& elementId);

    /**
     * @brief Top-left corner that centers a box on a page, clamped at 0.
     */
    static QPointF centeredPosition(const Page& page, const QSizeF& size);

    const Preferences& m_preferences;
    std::unique_ptr<Document> m_document;
    QHash<QString, QImage> m_previews;      ///< page uid -> preview
    History m_history;
    QString m_lastError;
    QString m_autosaveDir;
};
