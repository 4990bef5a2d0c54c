#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QCloseEvent>
#include <QString>

#include "core/Preferences.h"

class QAction;
class QDockWidget;
class QLabel;
class QScrollArea;
class QTimer;
class EditorSession;
class PageCanvas;
class PagePanel;
class PropertyPanel;

/**
 * @brief Top-level editor window.
 *
 * Layout:
 * - Left dock: PagePanel (page thumbnails, drag to reorder)
 * - Center: PageCanvas inside a scroll area
 * - Right dock: PropertyPanel
 * - Status bar: transient messages and the autosave indicator
 *
 * The window owns the EditorSession. Preferences are owned by main() and
 * shared by reference; the window updates and persists them when the
 * Preferences dialog is accepted.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(Preferences& preferences, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open a PDF, asking about unsaved changes first.
     * @return True if the file was opened.
     */
    bool openFile(const QString& path);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    // File
    void showOpenPdfDialog();
    void exportAs();
    void newBlankDocument();

    // Edit
    void undo();
    void redo();
    void insertImage();
    void insertText();
    void deleteSelectedElement();

    // Page
    void addBlankPage();
    void deleteCurrentPage();
    void moveCurrentPageUp();
    void moveCurrentPageDown();
    void goToPage();

    // View
    void toggleGrid(bool visible);
    void zoomIn();
    void zoomOut();
    void resetZoom();

    void showPreferences();

    // Session
    void onDocumentReplaced();
    void onPagesChanged();
    void onModifiedChanged(bool modified);
    void onAutosaved(const QString& path);
    void onAutosaveFailed(const QString& message);
    void onCanvasSelectionChanged(const QString& pageUid, const QString& elementId);
    void onAutosaveTimeout();

private:
    void setupUi();
    void createActions();
    void createMenus();
    void createToolbar();

    /**
     * @brief Show a page in the canvas and highlight it in the page list.
     */
    void setCurrentPage(const QString& uid);

    /**
     * @brief Ask whether to export unsaved changes.
     * @return False if the user cancelled (the pending action must stop).
     */
    bool maybeSave();

    void updateActions();
    void updateWindowTitle();
    void applyPreferences();
    void restartAutosaveTimer();

    /**
     * @brief Apply the preferred theme to the application palette.
     */
    void applyTheme();
    bool isDarkMode() const;

    Preferences& m_preferences;
    EditorSession* m_session = nullptr;
    QString m_currentPageUid;
    QString m_lastDirectory;

    // ===== Widgets =====
    QScrollArea* m_canvasScroll = nullptr;
    PageCanvas* m_canvas = nullptr;
    PagePanel* m_pagePanel = nullptr;
    PropertyPanel* m_propertyPanel = nullptr;
    QDockWidget* m_pageDock = nullptr;
    QDockWidget* m_propertyDock = nullptr;
    QLabel* m_pageLabel = nullptr;        ///< "Page N / M" in the status bar
    QLabel* m_autosaveLabel = nullptr;    ///< Autosave indicator

    QTimer* m_autosaveTimer = nullptr;

    // ===== Actions =====
    QAction* m_openAction = nullptr;
    QAction* m_exportAction = nullptr;
    QAction* m_newBlankAction = nullptr;
    QAction* m_quitAction = nullptr;
    QAction* m_undoAction = nullptr;
    QAction* m_redoAction = nullptr;
    QAction* m_insertImageAction = nullptr;
    QAction* m_insertTextAction = nullptr;
    QAction* m_deleteElementAction = nullptr;
    QAction* m_addPageAction = nullptr;
    QAction* m_deletePageAction = nullptr;
    QAction* m_movePageUpAction = nullptr;
    QAction* m_movePageDownAction = nullptr;
    QAction* m_goToPageAction = nullptr;
    QAction* m_gridAction = nullptr;
    QAction* m_zoomInAction = nullptr;
    QAction* m_zoomOutAction = nullptr;
    QAction* m_zoomResetAction = nullptr;
    QAction* m_preferencesAction = nullptr;

    static constexpr qreal ZOOM_STEP = 1.25;
    static constexpr int STATUS_MESSAGE_MS = 4000;
};

#endif // MAINWINDOW_H
