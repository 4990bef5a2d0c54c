#ifndef PAGEPANEL_H
#define PAGEPANEL_H

#include <QWidget>
#include <QSet>

class QListView;
class QTimer;
class EditorSession;
class PageThumbnailModel;
class PageThumbnailDelegate;

/**
 * @brief Page panel widget displaying page thumbnails.
 *
 * Provides a thumbnail view of all pages of the open document, allowing
 * users to navigate by clicking and reorder pages via drag-and-drop.
 *
 * Features:
 * - QListView with custom model and delegate
 * - Debounced thumbnail invalidation (300ms) while elements are edited
 * - Drag-and-drop reorder (applied through EditorSession::movePage)
 * - Auto-scroll to the current page
 *
 * Usage:
 * 1. MainWindow creates PagePanel in the left dock
 * 2. Call setSession() once
 * 3. Connect pageClicked to navigation
 */
class PagePanel : public QWidget {
    Q_OBJECT

public:
    explicit PagePanel(QWidget* parent = nullptr);
    ~PagePanel() override;

    /**
     * @brief Bind to a session (not owned). Follows its change signals.
     */
    void setSession(EditorSession* session);

    /**
     * @brief Highlight a page and scroll it into view.
     */
    void setCurrentPage(const QString& uid);

    void setThumbnailWidth(int width);
    void setDarkMode(bool dark);

signals:
    /**
     * @brief Emitted when a page thumbnail is clicked.
     */
    void pageClicked(const QString& uid);

private slots:
    void onItemClicked(const QModelIndex& index);
    void onModelPageDropped(const QString& uid, int toIndex);
    void onPageContentChanged(const QString& uid);
    void performPendingInvalidation();

private:
    void setupUI();
    void configureListView();
    void applyTheme();

    QListView* m_listView = nullptr;
    PageThumbnailModel* m_model = nullptr;
    PageThumbnailDelegate* m_delegate = nullptr;

    EditorSession* m_session = nullptr;
    bool m_darkMode = false;

    // Debounced invalidation
    QTimer* m_invalidationTimer = nullptr;
    QSet<QString> m_pendingInvalidations;

    static constexpr int INVALIDATION_DELAY_MS = 300;
};

#endif // PAGEPANEL_H
