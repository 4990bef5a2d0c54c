#include "MainWindow.h"
#include "core/EditorSession.h"
#include "ui/PageCanvas.h"
#include "ui/dialogs/PreferencesDialog.h"
#include "ui/sidebars/PagePanel.h"
#include "ui/sidebars/PropertyPanel.h"

#include <QAction>
#include <QApplication>
#include <QDir>
#include <QDockWidget>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPalette>
#include <QScrollArea>
#include <QSettings>
#include <QStatusBar>
#include <QStyle>
#include <QStyleFactory>
#include <QTime>
#include <QTimer>
#include <QToolBar>

// ============================================================================
// Construction
// ============================================================================

MainWindow::MainWindow(Preferences& preferences, QWidget* parent)
    : QMainWindow(parent)
    , m_preferences(preferences)
{
    m_session = new EditorSession(m_preferences, this);

    m_autosaveTimer = new QTimer(this);
    connect(m_autosaveTimer, &QTimer::timeout, this, &MainWindow::onAutosaveTimeout);

    setupUi();
    createActions();
    createMenus();
    createToolbar();

    connect(m_session, &EditorSession::documentReplaced, this, &MainWindow::onDocumentReplaced);
    connect(m_session, &EditorSession::pagesChanged, this, &MainWindow::onPagesChanged);
    connect(m_session, &EditorSession::pageContentChanged, this, &MainWindow::updateActions);
    connect(m_session, &EditorSession::historyChanged, this, &MainWindow::updateActions);
    connect(m_session, &EditorSession::modifiedChanged, this, &MainWindow::onModifiedChanged);
    connect(m_session, &EditorSession::autosaved, this, &MainWindow::onAutosaved);
    connect(m_session, &EditorSession::autosaveFailed, this, &MainWindow::onAutosaveFailed);

    applyPreferences();

    resize(1200, 850);
    updateWindowTitle();
    updateActions();
    statusBar()->showMessage(tr("Open a PDF to start editing."));
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    // Center: canvas
    m_canvas = new PageCanvas();
    m_canvas->setSession(m_session);
    connect(m_canvas, &PageCanvas::selectionChanged, this, &MainWindow::onCanvasSelectionChanged);

    m_canvasScroll = new QScrollArea(this);
    m_canvasScroll->setWidget(m_canvas);
    m_canvasScroll->setAlignment(Qt::AlignCenter);
    m_canvasScroll->setBackgroundRole(QPalette::Dark);
    setCentralWidget(m_canvasScroll);

    // Left: page list
    m_pagePanel = new PagePanel(this);
    m_pagePanel->setSession(m_session);
    connect(m_pagePanel, &PagePanel::pageClicked, this, &MainWindow::setCurrentPage);

    m_pageDock = new QDockWidget(tr("Pages"), this);
    m_pageDock->setObjectName(QStringLiteral("pageDock"));
    m_pageDock->setFeatures(QDockWidget::DockWidgetMovable);
    m_pageDock->setWidget(m_pagePanel);
    addDockWidget(Qt::LeftDockWidgetArea, m_pageDock);

    // Right: properties
    m_propertyPanel = new PropertyPanel(this);
    m_propertyPanel->setSession(m_session);

    m_propertyDock = new QDockWidget(tr("Properties"), this);
    m_propertyDock->setObjectName(QStringLiteral("propertyDock"));
    m_propertyDock->setFeatures(QDockWidget::DockWidgetMovable);
    m_propertyDock->setWidget(m_propertyPanel);
    m_propertyDock->setMinimumWidth(240);
    addDockWidget(Qt::RightDockWidgetArea, m_propertyDock);

    // Status bar
    m_pageLabel = new QLabel(this);
    m_autosaveLabel = new QLabel(this);
    m_autosaveLabel->setStyleSheet("color: palette(mid);");
    statusBar()->addPermanentWidget(m_pageLabel);
    statusBar()->addPermanentWidget(m_autosaveLabel);
}

void MainWindow::createActions()
{
    // File
    m_openAction = new QAction(tr("&Open..."), this);
    m_openAction->setShortcut(QKeySequence::Open);
    connect(m_openAction, &QAction::triggered, this, &MainWindow::showOpenPdfDialog);

    m_exportAction = new QAction(tr("&Export As..."), this);
    m_exportAction->setShortcut(QKeySequence::SaveAs);
    connect(m_exportAction, &QAction::triggered, this, &MainWindow::exportAs);

    m_newBlankAction = new QAction(tr("&New Blank Document"), this);
    m_newBlankAction->setShortcut(QKeySequence::New);
    connect(m_newBlankAction, &QAction::triggered, this, &MainWindow::newBlankDocument);

    m_quitAction = new QAction(tr("&Quit"), this);
    m_quitAction->setShortcut(QKeySequence::Quit);
    connect(m_quitAction, &QAction::triggered, this, &QWidget::close);

    // Edit
    m_undoAction = new QAction(tr("&Undo"), this);
    m_undoAction->setShortcut(QKeySequence::Undo);
    connect(m_undoAction, &QAction::triggered, this, &MainWindow::undo);

    m_redoAction = new QAction(tr("&Redo"), this);
    m_redoAction->setShortcut(QKeySequence::Redo);
    connect(m_redoAction, &QAction::triggered, this, &MainWindow::redo);

    m_insertImageAction = new QAction(tr("Insert &Image..."), this);
    m_insertImageAction->setShortcut(QKeySequence(tr("Ctrl+I")));
    connect(m_insertImageAction, &QAction::triggered, this, &MainWindow::insertImage);

    m_insertTextAction = new QAction(tr("Insert &Text..."), this);
    m_insertTextAction->setShortcut(QKeySequence(tr("Ctrl+T")));
    connect(m_insertTextAction, &QAction::triggered, this, &MainWindow::insertText);

    m_deleteElementAction = new QAction(tr("&Delete Element"), this);
    m_deleteElementAction->setShortcut(QKeySequence::Delete);
    connect(m_deleteElementAction, &QAction::triggered, this, &MainWindow::deleteSelectedElement);

    // Page
    m_addPageAction = new QAction(tr("&Add Blank Page"), this);
    connect(m_addPageAction, &QAction::triggered, this, &MainWindow::addBlankPage);

    m_deletePageAction = new QAction(tr("&Delete Page"), this);
    connect(m_deletePageAction, &QAction::triggered, this, &MainWindow::deleteCurrentPage);

    m_movePageUpAction = new QAction(tr("Move Page &Up"), this);
    connect(m_movePageUpAction, &QAction::triggered, this, &MainWindow::moveCurrentPageUp);

    m_movePageDownAction = new QAction(tr("Move Page Do&wn"), this);
    connect(m_movePageDownAction, &QAction::triggered, this, &MainWindow::moveCurrentPageDown);

    m_goToPageAction = new QAction(tr("&Go to Page..."), this);
    m_goToPageAction->setShortcut(QKeySequence(tr("Ctrl+G")));
    connect(m_goToPageAction, &QAction::triggered, this, &MainWindow::goToPage);

    // View
    m_gridAction = new QAction(tr("Show &Grid"), this);
    m_gridAction->setCheckable(true);
    connect(m_gridAction, &QAction::toggled, this, &MainWindow::toggleGrid);

    m_zoomInAction = new QAction(tr("Zoom &In"), this);
    m_zoomInAction->setShortcut(QKeySequence::ZoomIn);
    connect(m_zoomInAction, &QAction::triggered, this, &MainWindow::zoomIn);

    m_zoomOutAction = new QAction(tr("Zoom &Out"), this);
    m_zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    connect(m_zoomOutAction, &QAction::triggered, this, &MainWindow::zoomOut);

    m_zoomResetAction = new QAction(tr("&Actual Size"), this);
    m_zoomResetAction->setShortcut(QKeySequence(tr("Ctrl+0")));
    connect(m_zoomResetAction, &QAction::triggered, this, &MainWindow::resetZoom);

    m_preferencesAction = new QAction(tr("&Preferences..."), this);
    m_preferencesAction->setShortcut(QKeySequence::Preferences);
    connect(m_preferencesAction, &QAction::triggered, this, &MainWindow::showPreferences);
}

void MainWindow::createMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_openAction);
    fileMenu->addAction(m_exportAction);
    fileMenu->addAction(m_newBlankAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_quitAction);

    QMenu* editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(m_undoAction);
    editMenu->addAction(m_redoAction);
    editMenu->addSeparator();
    editMenu->addAction(m_insertImageAction);
    editMenu->addAction(m_insertTextAction);
    editMenu->addAction(m_deleteElementAction);
    editMenu->addSeparator();
    editMenu->addAction(m_preferencesAction);

    QMenu* pageMenu = menuBar()->addMenu(tr("&Page"));
    pageMenu->addAction(m_addPageAction);
    pageMenu->addAction(m_deletePageAction);
    pageMenu->addSeparator();
    pageMenu->addAction(m_movePageUpAction);
    pageMenu->addAction(m_movePageDownAction);
    pageMenu->addSeparator();
    pageMenu->addAction(m_goToPageAction);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    viewMenu->addAction(m_gridAction);
    viewMenu->addSeparator();
    viewMenu->addAction(m_zoomInAction);
    viewMenu->addAction(m_zoomOutAction);
    viewMenu->addAction(m_zoomResetAction);
    viewMenu->addSeparator();
    viewMenu->addAction(m_pageDock->toggleViewAction());
    viewMenu->addAction(m_propertyDock->toggleViewAction());
}

void MainWindow::createToolbar()
{
    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName(QStringLiteral("mainToolbar"));
    toolbar->setMovable(false);
    toolbar->addAction(m_openAction);
    toolbar->addAction(m_exportAction);
    toolbar->addSeparator();
    toolbar->addAction(m_undoAction);
    toolbar->addAction(m_redoAction);
    toolbar->addSeparator();
    toolbar->addAction(m_insertImageAction);
    toolbar->addAction(m_insertTextAction);
}

// ============================================================================
// File
// ============================================================================

bool MainWindow::openFile(const QString& path)
{
    if (!maybeSave()) {
        return false;
    }

    if (!m_session->openPdf(path)) {
        QMessageBox::critical(this, tr("Open Failed"), m_session->lastError());
        return false;
    }

    m_lastDirectory = QFileInfo(path).absolutePath();
    statusBar()->showMessage(tr("Loaded %1.").arg(QFileInfo(path).fileName()), STATUS_MESSAGE_MS);
    return true;
}

void MainWindow::showOpenPdfDialog()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), m_lastDirectory,
                                                      tr("PDF Files (*.pdf)"));
    if (!path.isEmpty()) {
        openFile(path);
    }
}

void MainWindow::exportAs()
{
    Document* doc = m_session->document();
    if (!doc) {
        return;
    }

    QString suggested = m_lastDirectory.isEmpty() ? QDir::homePath() : m_lastDirectory;
    suggested += QLatin1Char('/') + doc->sourceStem() + QStringLiteral("_edited.pdf");

    QString path = QFileDialog::getSaveFileName(this, tr("Export Edited PDF"), suggested,
                                                tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return;
    }
    if (!path.endsWith(QStringLiteral(".pdf"), Qt::CaseInsensitive)) {
        path += QStringLiteral(".pdf");
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    const PdfExportResult result = m_session->exportTo(path);
    QApplication::restoreOverrideCursor();

    if (!result.success) {
        QMessageBox::critical(this, tr("Export Failed"), result.errorMessage);
        return;
    }
    m_lastDirectory = QFileInfo(path).absolutePath();
    statusBar()->showMessage(tr("Saved to %1.").arg(path), STATUS_MESSAGE_MS);
}

void MainWindow::newBlankDocument()
{
    if (!maybeSave()) {
        return;
    }
    m_session->newBlankDocument();
    statusBar()->showMessage(tr("Created a blank document."), STATUS_MESSAGE_MS);
}

bool MainWindow::maybeSave()
{
    if (!m_session->isModified()) {
        return true;
    }

    const QMessageBox::StandardButton reply = QMessageBox::warning(
        this, tr("Unsaved Changes"),
        tr("The document has unsaved changes.\nDo you want to export them first?"),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save);

    if (reply == QMessageBox::Cancel) {
        return false;
    }
    if (reply == QMessageBox::Save) {
        exportAs();
        // Export dialog cancelled or failed
        return !m_session->isModified();
    }
    return true;
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (!maybeSave()) {
        event->ignore();
        return;
    }
    m_autosaveTimer->stop();
    event->accept();
}

// ============================================================================
// Edit
// ============================================================================

void MainWindow::undo()
{
    if (!m_session->undo()) {
        statusBar()->showMessage(tr("Nothing to undo."), STATUS_MESSAGE_MS);
    }
}

void MainWindow::redo()
{
    if (!m_session->redo()) {
        statusBar()->showMessage(tr("Nothing to redo."), STATUS_MESSAGE_MS);
    }
}

void MainWindow::insertImage()
{
    if (m_currentPageUid.isEmpty()) {
        return;
    }

    const QString path = QFileDialog::getOpenFileName(
        this, tr("Select Image to Insert"), m_lastDirectory,
        tr("Image Files (*.png *.jpg *.jpeg *.bmp)"));
    if (path.isEmpty()) {
        return;
    }

    PageElement* element = m_session->insertImageFile(m_currentPageUid, path);
    if (!element) {
        QMessageBox::warning(this, tr("Image Error"), m_session->lastError());
        return;
    }
    m_canvas->selectElement(element->id);
}

void MainWindow::insertText()
{
    if (m_currentPageUid.isEmpty()) {
        return;
    }

    bool ok = false;
    const QString text = QInputDialog::getMultiLineText(this, tr("Insert Text"), tr("Text:"),
                                                        QString(), &ok);
    if (!ok) {
        return;
    }
    if (text.trimmed().isEmpty()) {
        statusBar()->showMessage(tr("Text is empty; nothing inserted."), STATUS_MESSAGE_MS);
        return;
    }

    PageElement* element = m_session->insertText(m_currentPageUid, text);
    if (element) {
        m_canvas->selectElement(element->id);
    }
}

void MainWindow::deleteSelectedElement()
{
    const QString elementId = m_canvas->selectedElementId();
    if (elementId.isEmpty()) {
        return;
    }
    m_session->deleteElement(m_currentPageUid, elementId);
}

// ============================================================================
// Page
// ============================================================================

void MainWindow::addBlankPage()
{
    if (!m_session->hasDocument()) {
        return;
    }
    if (Page* page = m_session->addBlankPage(m_currentPageUid)) {
        setCurrentPage(page->uid);
    }
}

void MainWindow::deleteCurrentPage()
{
    Document* doc = m_session->document();
    if (!doc || m_currentPageUid.isEmpty()) {
        return;
    }
    if (doc->pageCount() <= 1) {
        statusBar()->showMessage(tr("A document must keep at least one page."), STATUS_MESSAGE_MS);
        return;
    }

    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, tr("Delete Page"),
        tr("Delete page %1 and everything placed on it?").arg(doc->indexOfPage(m_currentPageUid) + 1),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (reply != QMessageBox::Yes) {
        return;
    }

    const int index = doc->indexOfPage(m_currentPageUid);
    if (m_session->removePage(m_currentPageUid)) {
        const Page* next = doc->page(qMin(index, doc->pageCount() - 1));
        setCurrentPage(next ? next->uid : QString());
    }
}

void MainWindow::moveCurrentPageUp()
{
    Document* doc = m_session->document();
    if (!doc || m_currentPageUid.isEmpty()) {
        return;
    }
    const int index = doc->indexOfPage(m_currentPageUid);
    if (index > 0) {
        m_session->movePage(m_currentPageUid, index - 1);
    }
}

void MainWindow::moveCurrentPageDown()
{
    Document* doc = m_session->document();
    if (!doc || m_currentPageUid.isEmpty()) {
        return;
    }
    const int index = doc->indexOfPage(m_currentPageUid);
    if (index >= 0 && index < doc->pageCount() - 1) {
        m_session->movePage(m_currentPageUid, index + 1);
    }
}

void MainWindow::goToPage()
{
    Document* doc = m_session->document();
    if (!doc) {
        return;
    }

    bool ok = false;
    const QString input = QInputDialog::getText(
        this, tr("Go to Page"), tr("Page number (1-%1):").arg(doc->pageCount()),
        QLineEdit::Normal, QString(), &ok);
    if (!ok) {
        return;
    }

    bool isNumber = false;
    const int number = input.trimmed().toInt(&isNumber);
    if (!isNumber) {
        statusBar()->showMessage(tr("\"%1\" is not a page number.").arg(input), STATUS_MESSAGE_MS);
        return;
    }
    if (number < 1 || number > doc->pageCount()) {
        statusBar()->showMessage(tr("Page %1 does not exist (1-%2).").arg(number).arg(doc->pageCount()),
                                 STATUS_MESSAGE_MS);
        return;
    }
    setCurrentPage(doc->page(number - 1)->uid);
}

void MainWindow::setCurrentPage(const QString& uid)
{
    m_currentPageUid = uid;
    m_canvas->setPage(uid);
    m_pagePanel->setCurrentPage(uid);
    m_propertyPanel->setSelection(uid, QString());
    updateActions();
}

// ============================================================================
// View
// ============================================================================

void MainWindow::toggleGrid(bool visible)
{
    m_canvas->setGridVisible(visible);
}

void MainWindow::zoomIn()
{
    m_canvas->setZoom(m_canvas->zoom() * ZOOM_STEP);
}

void MainWindow::zoomOut()
{
    m_canvas->setZoom(m_canvas->zoom() / ZOOM_STEP);
}

void MainWindow::resetZoom()
{
    m_canvas->setZoom(1.0);
}

void MainWindow::showPreferences()
{
    PreferencesDialog dialog(m_preferences, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    m_preferences = dialog.preferences();
    QSettings settings("PdfOverlay", "App");
    m_preferences.save(settings);
    applyPreferences();
}

void MainWindow::applyPreferences()
{
    applyTheme();
    m_pagePanel->setThumbnailWidth(m_preferences.thumbnailSize);
    m_pageDock->setMinimumWidth(m_preferences.thumbnailSize + 40);
    restartAutosaveTimer();
}

void MainWindow::applyTheme()
{
    if (m_preferences.theme == QLatin1String("dark")) {
        QApplication::setStyle(QStyleFactory::create(QStringLiteral("Fusion")));
        QPalette darkPalette;
        const QColor darkGray(53, 53, 53);
        const QColor gray(128, 128, 128);
        const QColor blue(42, 130, 218);
        darkPalette.setColor(QPalette::Window, QColor(45, 45, 45));
        darkPalette.setColor(QPalette::WindowText, Qt::white);
        darkPalette.setColor(QPalette::Base, QColor(35, 35, 35));
        darkPalette.setColor(QPalette::AlternateBase, darkGray);
        darkPalette.setColor(QPalette::Text, Qt::white);
        darkPalette.setColor(QPalette::Button, darkGray);
        darkPalette.setColor(QPalette::ButtonText, Qt::white);
        darkPalette.setColor(QPalette::Dark, QColor(35, 35, 35));
        darkPalette.setColor(QPalette::Mid, QColor(50, 50, 50));
        darkPalette.setColor(QPalette::Highlight, blue);
        darkPalette.setColor(QPalette::HighlightedText, Qt::white);
        darkPalette.setColor(QPalette::PlaceholderText, gray);
        darkPalette.setColor(QPalette::Disabled, QPalette::WindowText, gray);
        darkPalette.setColor(QPalette::Disabled, QPalette::Text, gray);
        darkPalette.setColor(QPalette::Disabled, QPalette::ButtonText, gray);
        QApplication::setPalette(darkPalette);
    } else if (m_preferences.theme == QLatin1String("light")) {
        QApplication::setStyle(QStyleFactory::create(QStringLiteral("Fusion")));
        QApplication::setPalette(QApplication::style()->standardPalette());
    }
    // "system" keeps whatever the platform provided at startup

    m_pagePanel->setDarkMode(isDarkMode());
}

bool MainWindow::isDarkMode() const
{
    const QColor bg = QApplication::palette().color(QPalette::Window);
    return bg.lightness() < 128;  // Lightness scale: 0 (black) - 255 (white)
}

// ============================================================================
// Autosave
// ============================================================================

void MainWindow::restartAutosaveTimer()
{
    m_autosaveTimer->stop();
    if (m_preferences.autosaveIntervalSec > 0) {
        m_autosaveTimer->start(m_preferences.autosaveIntervalSec * 1000);
        m_autosaveLabel->setText(tr("Autosave: every %1 s").arg(m_preferences.autosaveIntervalSec));
    } else {
        m_autosaveLabel->setText(tr("Autosave: off"));
    }
}

void MainWindow::onAutosaveTimeout()
{
    m_session->autosave();
}

void MainWindow::onAutosaved(const QString& path)
{
    m_autosaveLabel->setText(tr("Autosaved at %1").arg(QTime::currentTime().toString("HH:mm")));
    m_autosaveLabel->setToolTip(path);
}

void MainWindow::onAutosaveFailed(const QString& message)
{
    m_autosaveLabel->setText(tr("Autosave failed"));
    m_autosaveLabel->setToolTip(message);
}

// ============================================================================
// Session Signals
// ============================================================================

void MainWindow::onDocumentReplaced()
{
    const Document* doc = m_session->document();
    const Page* first = doc ? doc->page(0) : nullptr;
    setCurrentPage(first ? first->uid : QString());
    updateWindowTitle();
}

void MainWindow::onPagesChanged()
{
    const Document* doc = m_session->document();
    if (doc && !doc->findPageById(m_currentPageUid)) {
        const Page* first = doc->page(0);
        setCurrentPage(first ? first->uid : QString());
    } else {
        // Keep the highlight on the same page after a reorder
        m_pagePanel->setCurrentPage(m_currentPageUid);
        updateActions();
    }
}

void MainWindow::onModifiedChanged(bool modified)
{
    setWindowModified(modified);
}

void MainWindow::onCanvasSelectionChanged(const QString& pageUid, const QString& elementId)
{
    m_propertyPanel->setSelection(pageUid, elementId);
    updateActions();
}

// ============================================================================
// State
// ============================================================================

void MainWindow::updateActions()
{
    const Document* doc = m_session->document();
    const bool hasDoc = doc != nullptr;
    const bool hasPage = hasDoc && !m_currentPageUid.isEmpty();
    const int index = hasDoc ? doc->indexOfPage(m_currentPageUid) : -1;

    m_exportAction->setEnabled(hasDoc);
    m_undoAction->setEnabled(m_session->canUndo());
    m_redoAction->setEnabled(m_session->canRedo());
    m_insertImageAction->setEnabled(hasPage);
    m_insertTextAction->setEnabled(hasPage);
    m_deleteElementAction->setEnabled(hasPage && !m_canvas->selectedElementId().isEmpty());
    m_addPageAction->setEnabled(hasDoc);
    m_deletePageAction->setEnabled(hasPage && doc->pageCount() > 1);
    m_movePageUpAction->setEnabled(hasPage && index > 0);
    m_movePageDownAction->setEnabled(hasPage && index >= 0 && index < doc->pageCount() - 1);
    m_goToPageAction->setEnabled(hasDoc);

    if (hasPage && index >= 0) {
        m_pageLabel->setText(tr("Page %1 / %2").arg(index + 1).arg(doc->pageCount()));
    } else {
        m_pageLabel->clear();
    }
}

void MainWindow::updateWindowTitle()
{
    const Document* doc = m_session->document();
    const QString name = doc ? doc->sourceStem() : tr("No document");
    setWindowTitle(tr("%1[*] - PdfOverlay").arg(name));
    setWindowModified(m_session->isModified());
}
