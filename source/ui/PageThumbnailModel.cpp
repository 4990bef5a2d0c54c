#include "PageThumbnailModel.h"
#include "../core/EditorSession.h"
#include "../core/Document.h"
#include "../core/Page.h"

#include <QMimeData>
#include <QPainter>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PageThumbnailModel::PageThumbnailModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

PageThumbnailModel::~PageThumbnailModel()
{
}

// ============================================================================
// QAbstractListModel Interface
// ============================================================================

int PageThumbnailModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) {
        return 0;  // No children for list model
    }

    if (!m_session || !m_session->document()) {
        return 0;
    }

    return m_session->document()->pageCount();
}

QVariant PageThumbnailModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || !m_session || !m_session->document()) {
        return QVariant();
    }

    const int pageIndex = index.row();
    const Page* page = m_session->document()->page(pageIndex);
    if (!page) {
        return QVariant();
    }

    switch (role) {
        case Qt::DisplayRole:
            return page->label.isEmpty() ? QString::number(pageIndex + 1) : page->label;

        case PageUidRole:
            return page->uid;

        case PageIndexRole:
            return pageIndex;

        case ThumbnailRole:
            return QVariant::fromValue(thumbnailForPage(page->uid));

        case IsCurrentPageRole:
            return page->uid == m_currentPageUid;

        case IsSourcePageRole:
            return page->hasSource();

        case PageLabelRole:
            return page->label;

        case PageAspectRatioRole:
            if (page->size.width() <= 0) {
                return QVariant();
            }
            return page->size.height() / page->size.width();

        default:
            return QVariant();
    }
}

Qt::ItemFlags PageThumbnailModel::flags(const QModelIndex& index) const
{
    Qt::ItemFlags defaultFlags = QAbstractListModel::flags(index);

    if (!index.isValid()) {
        return defaultFlags | Qt::ItemIsDropEnabled;
    }

    // Every page can be reordered
    return defaultFlags | Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

QHash<int, QByteArray> PageThumbnailModel::roleNames() const
{
    QHash<int, QByteArray> roles = QAbstractListModel::roleNames();
    roles[PageUidRole] = "pageUid";
    roles[PageIndexRole] = "pageIndex";
    roles[ThumbnailRole] = "thumbnail";
    roles[IsCurrentPageRole] = "isCurrentPage";
    roles[IsSourcePageRole] = "isSourcePage";
    roles[PageLabelRole] = "label";
    return roles;
}

// ============================================================================
// Drag-and-Drop Support
// ============================================================================

Qt::DropActions PageThumbnailModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QStringList PageThumbnailModel::mimeTypes() const
{
    QStringList types;
    types << MIME_TYPE;
    return types;
}

QMimeData* PageThumbnailModel::mimeData(const QModelIndexList& indexes) const
{
    if (indexes.isEmpty()) {
        return nullptr;
    }

    // Only use the first index (single selection)
    const QModelIndex& index = indexes.first();
    if (!index.isValid()) {
        return nullptr;
    }

    QMimeData* mimeData = new QMimeData();
    mimeData->setData(MIME_TYPE, index.data(PageUidRole).toString().toUtf8());
    return mimeData;
}

bool PageThumbnailModel::canDropMimeData(const QMimeData* data, Qt::DropAction action,
                                          int row, int column, const QModelIndex& parent) const
{
    Q_UNUSED(column);
    Q_UNUSED(parent);

    if (!data || !data->hasFormat(MIME_TYPE)) {
        return false;
    }

    if (action != Qt::MoveAction) {
        return false;
    }

    if (row < 0 || !m_session || !m_session->document()) {
        return false;
    }

    return row <= m_session->document()->pageCount();
}

bool PageThumbnailModel::dropMimeData(const QMimeData* data, Qt::DropAction action,
                                       int row, int column, const QModelIndex& parent)
{
    if (!canDropMimeData(data, action, row, column, parent)) {
        return false;
    }

    const QString uid = QString::fromUtf8(data->data(MIME_TYPE));
    const int sourceIndex = rowOf(uid);
    if (sourceIndex < 0) {
        return false;
    }

    // If dropping after the source, adjust for the removal
    int targetIndex = row;
    if (targetIndex > sourceIndex) {
        targetIndex--;
    }

    if (sourceIndex == targetIndex) {
        return false;
    }

    // The view must not remove the row itself; the session performs the move
    emit pageDropped(uid, targetIndex);
    return false;
}

// ============================================================================
// Session Binding
// ============================================================================

void PageThumbnailModel::setSession(EditorSession* session)
{
    if (m_session == session) {
        return;
    }

    beginResetModel();
    m_session = session;
    m_currentPageUid.clear();
    m_thumbnailCache.clear();
    endResetModel();
}

void PageThumbnailModel::setCurrentPage(const QString& uid)
{
    if (m_currentPageUid == uid) {
        return;
    }

    const int oldRow = rowOf(m_currentPageUid);
    m_currentPageUid = uid;

    if (oldRow >= 0) {
        const QModelIndex oldModelIndex = createIndex(oldRow, 0);
        emit dataChanged(oldModelIndex, oldModelIndex, {IsCurrentPageRole});
    }

    const int newRow = rowOf(uid);
    if (newRow >= 0) {
        const QModelIndex newModelIndex = createIndex(newRow, 0);
        emit dataChanged(newModelIndex, newModelIndex, {IsCurrentPageRole});
    }
}

// ============================================================================
// Thumbnail Management
// ============================================================================

void PageThumbnailModel::setThumbnailWidth(int width)
{
    if (m_thumbnailWidth != width && width > 0) {
        m_thumbnailWidth = width;
        invalidateAllThumbnails();
    }
}

void PageThumbnailModel::setDevicePixelRatio(qreal dpr)
{
    if (!qFuzzyCompare(m_devicePixelRatio, dpr) && dpr > 0) {
        m_devicePixelRatio = dpr;
        invalidateAllThumbnails();
    }
}

QPixmap PageThumbnailModel::thumbnailForPage(const QString& uid) const
{
    auto it = m_thumbnailCache.constFind(uid);
    if (it != m_thumbnailCache.constEnd()) {
        return it.value();
    }

    QPixmap thumbnail = renderThumbnail(uid);
    if (!thumbnail.isNull()) {
        m_thumbnailCache.insert(uid, thumbnail);
    }
    return thumbnail;
}

void PageThumbnailModel::invalidateThumbnail(const QString& uid)
{
    if (!m_thumbnailCache.remove(uid)) {
        return;
    }

    const int row = rowOf(uid);
    if (row >= 0) {
        const QModelIndex modelIndex = createIndex(row, 0);
        emit dataChanged(modelIndex, modelIndex, {ThumbnailRole});
    }
}

void PageThumbnailModel::invalidateAllThumbnails()
{
    m_thumbnailCache.clear();

    const int count = rowCount();
    if (count > 0) {
        emit dataChanged(createIndex(0, 0), createIndex(count - 1, 0), {ThumbnailRole});
    }
}

// ============================================================================
// Slots
// ============================================================================

void PageThumbnailModel::onPagesChanged()
{
    // Pages keep their uids across reorders, so the cache stays valid;
    // entries of removed pages are dropped
    beginResetModel();

    const Document* doc = m_session ? m_session->document() : nullptr;
    for (auto it = m_thumbnailCache.begin(); it != m_thumbnailCache.end();) {
        if (!doc || !doc->findPageById(it.key())) {
            it = m_thumbnailCache.erase(it);
        } else {
            ++it;
        }
    }

    endResetModel();
}

void PageThumbnailModel::onPageContentChanged(const QString& uid)
{
    invalidateThumbnail(uid);
}

// ============================================================================
// Private Helpers
// ============================================================================

QPixmap PageThumbnailModel::renderThumbnail(const QString& uid) const
{
    if (!m_session || !m_session->document() || m_thumbnailWidth <= 0) {
        return QPixmap();
    }

    const Page* page = m_session->document()->findPageById(uid);
    if (!page || page->size.width() <= 0) {
        return QPixmap();
    }

    const qreal scale = m_thumbnailWidth * m_devicePixelRatio / page->size.width();
    const QSize pixelSize(qMax(1, qRound(page->size.width() * scale)),
                          qMax(1, qRound(page->size.height() * scale)));

    QPixmap pixmap(pixelSize);
    pixmap.fill(Qt::white);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.setRenderHint(QPainter::Antialiasing, true);

    const QImage preview = m_session->preview(uid);
    if (!preview.isNull()) {
        painter.drawImage(QRectF(QPointF(0, 0), QSizeF(pixelSize)), preview);
    }
    page->renderElements(painter, scale);
    painter.end();

    pixmap.setDevicePixelRatio(m_devicePixelRatio);
    return pixmap;
}

int PageThumbnailModel::rowOf(const QString& uid) const
{
    if (uid.isEmpty() || !m_session || !m_session->document()) {
        return -1;
    }
    return m_session->document()->indexOfPage(uid);
}
