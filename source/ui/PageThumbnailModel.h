#ifndef PAGETHUMBNAILMODEL_H
#define PAGETHUMBNAILMODEL_H

#include <QAbstractListModel>
#include <QPixmap>
#include <QHash>

class EditorSession;

/**
 * @brief QAbstractListModel providing page data for QListView.
 *
 * This model provides:
 * - Page uid, label, thumbnail pixmap, current/source state
 * - Drag-and-drop support via MIME data (internal move only, by page uid)
 * - Thumbnail cache keyed by page uid
 *
 * Thumbnails are the page preview with the page's visible elements drawn
 * on top. They are rendered on demand and cached until the page changes.
 */
class PageThumbnailModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom roles for page data.
     */
    enum Roles {
        PageUidRole = Qt::UserRole + 1,     ///< QString: page uid
        PageIndexRole,                      ///< Page index (0-based)
        ThumbnailRole,                      ///< QPixmap thumbnail
        IsCurrentPageRole,                  ///< bool: is this the current page?
        IsSourcePageRole,                   ///< bool: is this page backed by the source PDF?
        PageLabelRole,                      ///< QString: user label (may be empty)
        PageAspectRatioRole                 ///< qreal: page height/width ratio
    };

    explicit PageThumbnailModel(QObject* parent = nullptr);
    ~PageThumbnailModel() override;

    // ===== QAbstractListModel Interface =====

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QHash<int, QByteArray> roleNames() const override;

    // ===== Drag-and-Drop Support =====

    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData* mimeData(const QModelIndexList& indexes) const override;
    bool canDropMimeData(const QMimeData* data, Qt::DropAction action,
                         int row, int column, const QModelIndex& parent) const override;
    bool dropMimeData(const QMimeData* data, Qt::DropAction action,
                      int row, int column, const QModelIndex& parent) override;

    // ===== Session Binding =====

    /**
     * @brief Set the session whose document is displayed.
     * @param session Session pointer (not owned).
     */
    void setSession(EditorSession* session);

    /**
     * @brief Set the current page (for highlighting).
     * @param uid Page uid.
     */
    void setCurrentPage(const QString& uid);
    QString currentPage() const { return m_currentPageUid; }

    // ===== Thumbnail Management =====

    /**
     * @brief Set the thumbnail width for rendering.
     * @param width Thumbnail width in pixels.
     */
    void setThumbnailWidth(int width);
    int thumbnailWidth() const { return m_thumbnailWidth; }

    /**
     * @brief Set the device pixel ratio for high DPI rendering.
     */
    void setDevicePixelRatio(qreal dpr);

    /**
     * @brief Thumbnail for a page, rendered if not cached.
     */
    QPixmap thumbnailForPage(const QString& uid) const;

    void invalidateThumbnail(const QString& uid);
    void invalidateAllThumbnails();

signals:
    /**
     * @brief Emitted when a page was dropped to a new position.
     * @param uid Page that was dragged.
     * @param toIndex Target page index (after removal of the dragged page).
     */
    void pageDropped(const QString& uid, int toIndex);

public slots:
    /**
     * @brief Rebuild the model after pages were added, removed or reordered.
     */
    void onPagesChanged();

    /**
     * @brief Drop the cached thumbnail of a changed page.
     */
    void onPageContentChanged(const QString& uid);

private:
    QPixmap renderThumbnail(const QString& uid) const;
    int rowOf(const QString& uid) const;

    // Session reference (not owned)
    EditorSession* m_session = nullptr;

    QString m_currentPageUid;

    // uid -> thumbnail
    mutable QHash<QString, QPixmap> m_thumbnailCache;

    int m_thumbnailWidth = 120;
    qreal m_devicePixelRatio = 1.0;

    // MIME type for drag-and-drop
    static constexpr const char* MIME_TYPE = "application/x-pdfoverlay-page-uid";
};

#endif // PAGETHUMBNAILMODEL_H
