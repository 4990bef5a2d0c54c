#include "PagePanel.h"
#include "../PageThumbnailModel.h"
#include "../PageThumbnailDelegate.h"
#include "../../core/EditorSession.h"

#include <QListView>
#include <QVBoxLayout>
#include <QTimer>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PagePanel::PagePanel(QWidget* parent)
    : QWidget(parent)
{
    setupUI();

    connect(m_listView, &QListView::clicked, this, &PagePanel::onItemClicked);
    connect(m_model, &PageThumbnailModel::pageDropped, this, &PagePanel::onModelPageDropped);
    connect(m_invalidationTimer, &QTimer::timeout, this, &PagePanel::performPendingInvalidation);
}

PagePanel::~PagePanel()
{
    // Children are parented, will be deleted automatically
}

// ============================================================================
// Setup
// ============================================================================

void PagePanel::setupUI()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_model = new PageThumbnailModel(this);
    m_delegate = new PageThumbnailDelegate(this);

    m_listView = new QListView(this);
    configureListView();
    m_listView->setModel(m_model);
    m_listView->setItemDelegate(m_delegate);
    layout->addWidget(m_listView);

    m_invalidationTimer = new QTimer(this);
    m_invalidationTimer->setSingleShot(true);
    m_invalidationTimer->setInterval(INVALIDATION_DELAY_MS);

    applyTheme();
}

void PagePanel::configureListView()
{
    m_listView->setViewMode(QListView::ListMode);
    m_listView->setFlow(QListView::TopToBottom);
    m_listView->setWrapping(false);
    m_listView->setResizeMode(QListView::Adjust);
    m_listView->setLayoutMode(QListView::SinglePass);

    m_listView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listView->setSelectionBehavior(QAbstractItemView::SelectRows);

    m_listView->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    m_listView->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    // Drag and drop
    m_listView->setDragEnabled(true);
    m_listView->setAcceptDrops(true);
    m_listView->setDropIndicatorShown(true);
    m_listView->setDragDropMode(QAbstractItemView::InternalMove);
    m_listView->setDefaultDropAction(Qt::MoveAction);

    m_listView->setFrameShape(QFrame::NoFrame);
    m_listView->setSpacing(0);
    m_listView->setUniformItemSizes(false);  // Pages may have different sizes

    m_listView->setMouseTracking(true);
    m_listView->viewport()->setAttribute(Qt::WA_Hover, true);
}

// ============================================================================
// Session Binding
// ============================================================================

void PagePanel::setSession(EditorSession* session)
{
    if (m_session == session) {
        return;
    }
    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
        disconnect(m_session, nullptr, m_model, nullptr);
    }

    m_session = session;
    m_model->setSession(session);
    m_pendingInvalidations.clear();

    if (!m_session) {
        return;
    }

    connect(m_session, &EditorSession::documentReplaced, m_model, [this]() {
        m_pendingInvalidations.clear();
        m_model->onPagesChanged();
        m_model->invalidateAllThumbnails();
    });
    connect(m_session, &EditorSession::pagesChanged, m_model, &PageThumbnailModel::onPagesChanged);
    connect(m_session, &EditorSession::pageContentChanged, this, &PagePanel::onPageContentChanged);
    connect(m_session, &EditorSession::elementChanged, this,
            [this](const QString& pageUid, const QString&) { onPageContentChanged(pageUid); });
}

void PagePanel::setCurrentPage(const QString& uid)
{
    m_model->setCurrentPage(uid);

    if (!m_session || !m_session->document()) {
        return;
    }
    const int row = m_session->document()->indexOfPage(uid);
    QModelIndex index = m_model->index(row, 0);
    if (index.isValid()) {
        m_listView->setCurrentIndex(index);
        m_listView->scrollTo(index, QAbstractItemView::EnsureVisible);
    }
}

void PagePanel::setThumbnailWidth(int width)
{
    m_model->setThumbnailWidth(width);
    m_model->setDevicePixelRatio(devicePixelRatioF());
    m_delegate->setThumbnailWidth(width);
    m_listView->doItemsLayout();
}

// ============================================================================
// Theme
// ============================================================================

void PagePanel::setDarkMode(bool dark)
{
    if (m_darkMode != dark) {
        m_darkMode = dark;
        m_delegate->setDarkMode(dark);
        applyTheme();
        m_listView->viewport()->update();
    }
}

void PagePanel::applyTheme()
{
    QString bgColor = m_darkMode ? "#2D2D2D" : "#F5F5F5";

    m_listView->setStyleSheet(QString(R"(
        QListView {
            background-color: %1;
            border: none;
            outline: none;
        }
        QListView::item {
            border: none;
            padding: 0px;
        }
        QListView::item:selected {
            background-color: transparent;
        }
    )").arg(bgColor));
}

// ============================================================================
// Private Slots
// ============================================================================

void PagePanel::onItemClicked(const QModelIndex& index)
{
    if (!index.isValid()) {
        return;
    }
    emit pageClicked(index.data(PageThumbnailModel::PageUidRole).toString());
}

void PagePanel::onModelPageDropped(const QString& uid, int toIndex)
{
    if (!m_session) {
        return;
    }
    // The model is rebuilt from pagesChanged once the move has happened
    m_session->movePage(uid, toIndex);
}

void PagePanel::onPageContentChanged(const QString& uid)
{
    m_pendingInvalidations.insert(uid);
    if (!m_invalidationTimer->isActive()) {
        m_invalidationTimer->start();
    }
}

void PagePanel::performPendingInvalidation()
{
    for (const QString& uid : m_pendingInvalidations) {
        m_model->invalidateThumbnail(uid);
    }
    m_pendingInvalidations.clear();
}
