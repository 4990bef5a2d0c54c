// ============================================================================
// EditorSession - Implementation
// ============================================================================

#include "EditorSession.h"
#include "Preferences.h"
#include "../objects/ImageElement.h"
#include "../objects/TextElement.h"
#include "../pdf/PdfImporter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

EditorSession::EditorSession(const Preferences& preferences, QObject* parent)
    : QObject(parent)
    , m_preferences(preferences)
{
}

EditorSession::~EditorSession() = default;

QImage EditorSession::preview(const QString& pageUid) const
{
    auto it = m_previews.constFind(pageUid);
    if (it != m_previews.constEnd()) {
        return it.value();
    }

    const Page* page = m_document ? m_document->findPageById(pageUid) : nullptr;
    if (!page) {
        return QImage();
    }
    QImage blank(page->size.toSize(), QImage::Format_ARGB32);
    blank.fill(Qt::white);
    return blank;
}

// ============================================================================
// Document Lifecycle
// ============================================================================

bool EditorSession::openPdf(const QString& path)
{
    PdfImportResult result = PdfImporter::import(path);
    if (!result.success) {
        m_lastError = result.errorMessage;
        return false;
    }

    m_previews.clear();
    for (const PagePreview& preview : result.previews) {
        QImage image;
        if (!image.loadFromData(preview.pngBytes, "PNG")) {
            qWarning() << "[EditorSession] Preview for page" << preview.pageUid << "is unreadable";
            continue;
        }
        m_previews.insert(preview.pageUid, image);
    }

    replaceDocument(std::move(result.document));
    qDebug() << "[EditorSession] Opened" << path;
    return true;
}

void EditorSession::newBlankDocument()
{
    m_previews.clear();
    replaceDocument(Document::createBlank(m_preferences.defaultPageSize()));
}

void EditorSession::replaceDocument(std::unique_ptr<Document> document)
{
    m_document = std::move(document);
    m_history.clear();
    m_lastError.clear();

    emit documentReplaced();
    emit modifiedChanged(false);
    emitHistoryChanged();
}

PdfExportResult EditorSession::exportTo(const QString& path)
{
    PdfExportResult result;
    if (!m_document) {
        result.errorMessage = tr("No document is open");
        m_lastError = result.errorMessage;
        return result;
    }

    MuPdfExporter exporter;
    exporter.setDocument(m_document.get());

    PdfExportOptions options;
    options.outputPath = path;
    result = exporter.exportPdf(options);

    if (result.success) {
        m_document->clearModified();
        emit modifiedChanged(false);
    } else {
        m_lastError = result.errorMessage;
    }
    return result;
}

// ============================================================================
// Elements
// ============================================================================

QPointF EditorSession::centeredPosition(const Page& page, const QSizeF& size)
{
    return QPointF(qMax(0.0, (page.size.width() - size.width()) / 2.0),
                   qMax(0.0, (page.size.height() - size.height()) / 2.0));
}

PageElement* EditorSession::insertImageFile(const QString& pageUid, const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = tr("Cannot read %1: %2").arg(path, file.errorString());
        qWarning() << "[EditorSession]" << m_lastError;
        return nullptr;
    }
    return insertImage(pageUid, file.readAll(), path);
}

PageElement* EditorSession::insertImage(const QString& pageUid, const QByteArray& bytes,
                                        const QString& sourcePath)
{
    Page* page = m_document ? m_document->findPageById(pageUid) : nullptr;
    if (!page) {
        return nullptr;
    }

    auto element = std::make_unique<ImageElement>(bytes, sourcePath, QRectF());
    const QSize natural = element->naturalSize();
    if (natural.isEmpty()) {
        m_lastError = tr("Not a supported image: %1")
                          .arg(sourcePath.isEmpty() ? tr("(clipboard)") : sourcePath);
        return nullptr;
    }

    qreal width = qMin<qreal>(natural.width(), page->size.width() * MAX_IMAGE_WIDTH_RATIO);
    qreal height = width * natural.height() / natural.width();
    element->resize(width, height);
    QPointF pos = centeredPosition(*page, element->rect.size());
    element->moveTo(pos.x(), pos.y());

    PageElement* inserted = page->addElement(std::move(element));
    m_history.push(HistoryCommand::Insert, pageUid, *inserted);

    markModified();
    emit pageContentChanged(pageUid);
    emitHistoryChanged();
    return inserted;
}

PageElement* EditorSession::insertText(const QString& pageUid, const QString& text)
{
    Page* page = m_document ? m_document->findPageById(pageUid) : nullptr;
    if (!page) {
        return nullptr;
    }
    if (text.trimmed().isEmpty()) {
        m_lastError = tr("Text is empty");
        return nullptr;
    }

    QSizeF size(qMin(DEFAULT_TEXT_WIDTH, page->size.width()),
                qMin(DEFAULT_TEXT_HEIGHT, page->size.height()));
    auto element = std::make_unique<TextElement>(text, QRectF(centeredPosition(*page, size), size));

    PageElement* inserted = page->addElement(std::move(element));
    m_history.push(HistoryCommand::Insert, pageUid, *inserted);

    markModified();
    emit pageContentChanged(pageUid);
    emitHistoryChanged();
    return inserted;
}

bool EditorSession::deleteElement(const QString& pageUid, const QString& elementId)
{
    Page* page = m_document ? m_document->findPageById(pageUid) : nullptr;
    if (!page) {
        return false;
    }

    std::unique_ptr<PageElement> removed = page->removeElement(elementId);
    if (!removed) {
        return false;
    }
    m_history.push(HistoryCommand::Delete, pageUid, *removed);

    markModified();
    emit pageContentChanged(pageUid);
    emitHistoryChanged();
    return true;
}

PageElement* EditorSession::findElement(const QString& pageUid, const QString& elementId)
{
    Page* page = m_document ? m_document->findPageById(pageUid) : nullptr;
    return page ? page->findElement(elementId) : nullptr;
}

TextElement* EditorSession::findText(const QString& pageUid, const QString& elementId)
{
    PageElement* element = findElement(pageUid, elementId);
    if (!element || element->kind() != PageElement::Kind::Text) {
        return nullptr;
    }
    return static_cast<TextElement*>(element);
}

bool EditorSession::setElementGeometry(const QString& pageUid, const QString& elementId,
                                       const QRectF& rect)
{
    PageElement* element = findElement(pageUid, elementId);
    if (!element) {
        return false;
    }
    element->moveTo(rect.x(), rect.y());
    element->resize(rect.width(), rect.height());

    markModified();
    emit elementChanged(pageUid, elementId);
    return true;
}

bool EditorSession::setElementOpacity(const QString& pageUid, const QString& elementId, qreal opacity)
{
    PageElement* element = findElement(pageUid, elementId);
    if (!element) {
        return false;
    }
    element->setOpacity(opacity);

    markModified();
    emit elementChanged(pageUid, elementId);
    return true;
}

bool EditorSession::setElementVisible(const QString& pageUid, const QString& elementId, bool visible)
{
    PageElement* element = findElement(pageUid, elementId);
    if (!element) {
        return false;
    }
    element->visible = visible;

    markModified();
    emit elementChanged(pageUid, elementId);
    return true;
}

bool EditorSession::setElementLocked(const QString& pageUid, const QString& elementId, bool locked)
{
    PageElement* element = findElement(pageUid, elementId);
    if (!element) {
        return false;
    }
    element->locked = locked;

    // Lock state does not affect the exported file
    emit elementChanged(pageUid, elementId);
    return true;
}

bool EditorSession::setTextContent(const QString& pageUid, const QString& elementId,
                                   const QString& text)
{
    TextElement* element = findText(pageUid, elementId);
    if (!element) {
        return false;
    }
    element->text = text;

    markModified();
    emit elementChanged(pageUid, elementId);
    return true;
}

bool EditorSession::setTextStyle(const QString& pageUid, const QString& elementId,
                                 const QString& fontFamily, qreal fontSize, const QString& color)
{
    TextElement* element = findText(pageUid, elementId);
    if (!element) {
        return false;
    }
    if (!fontFamily.isEmpty()) {
        element->fontFamily = fontFamily;
    }
    element->setFontSize(fontSize);
    element->color = color;

    markModified();
    emit elementChanged(pageUid, elementId);
    return true;
}

// ============================================================================
// Pages
// ============================================================================

Page* EditorSession::addBlankPage(const QString& afterUid)
{
    if (!m_document) {
        return nullptr;
    }

    int index = m_document->indexOfPage(afterUid);
    index = index >= 0 ? index + 1 : m_document->pageCount();
    Page* page = m_document->insertPage(index, Page::createBlank(m_preferences.defaultPageSize()));

    markModified();
    emit pagesChanged();
    return page;
}

bool EditorSession::removePage(const QString& uid)
{
    if (!m_document || m_document->indexOfPage(uid) < 0) {
        return false;
    }
    if (m_document->pageCount() <= 1) {
        m_lastError = tr("A document needs at least one page");
        return false;
    }

    std::unique_ptr<Page> removed = m_document->removePage(uid);
    m_previews.remove(uid);

    markModified();
    emit pagesChanged();
    return removed != nullptr;
}

bool EditorSession::movePage(const QString& uid, int toIndex)
{
    if (!m_document) {
        return false;
    }
    int from = m_document->indexOfPage(uid);
    if (from < 0 || !m_document->movePage(from, toIndex)) {
        return false;
    }
    if (from == toIndex) {
        return true;
    }

    markModified();
    emit pagesChanged();
    return true;
}

bool EditorSession::setPageLabel(const QString& uid, const QString& label)
{
    Page* page = m_document ? m_document->findPageById(uid) : nullptr;
    if (!page) {
        return false;
    }
    page->label = label;

    markModified();
    emit pagesChanged();
    return true;
}

bool EditorSession::setPageNote(const QString& uid, const QString& note)
{
    Page* page = m_document ? m_document->findPageById(uid) : nullptr;
    if (!page) {
        return false;
    }
    page->note = note;

    markModified();
    return true;
}

// ============================================================================
// History
// ============================================================================

bool EditorSession::undo()
{
    if (!m_document) {
        return false;
    }
    QString pageUid = m_history.nextUndoPageId();
    if (!m_history.undo(*m_document)) {
        return false;
    }

    markModified();
    emit pageContentChanged(pageUid);
    emitHistoryChanged();
    return true;
}

bool EditorSession::redo()
{
    if (!m_document) {
        return false;
    }
    QString pageUid = m_history.nextRedoPageId();
    if (!m_history.redo(*m_document)) {
        return false;
    }

    markModified();
    emit pageContentChanged(pageUid);
    emitHistoryChanged();
    return true;
}

void EditorSession::emitHistoryChanged()
{
    emit historyChanged(m_history.canUndo(), m_history.canRedo());
}

void EditorSession::markModified()
{
    if (!m_document) {
        return;
    }
    bool wasModified = m_document->modified;
    m_document->markModified();
    if (!wasModified) {
        emit modifiedChanged(true);
    }
}

// ============================================================================
// Autosave
// ============================================================================

QString EditorSession::autosavePath() const
{
    QString dir = m_autosaveDir;
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    }
    QString stem = m_document ? m_document->sourceStem() : QStringLiteral("untitled");
    return QDir(dir).filePath(stem + QStringLiteral("_autosave.pdf"));
}

bool EditorSession::autosave()
{
    if (!m_document || !m_document->modified) {
        return false;
    }

    QString path = autosavePath();
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        QString message = tr("Cannot create autosave directory for %1").arg(path);
        qWarning() << "[EditorSession] Autosave failed:" << message;
        emit autosaveFailed(message);
        return false;
    }

    MuPdfExporter exporter;
    exporter.setDocument(m_document.get());

    PdfExportOptions options;
    options.outputPath = path;
    PdfExportResult result = exporter.exportPdf(options);

    if (!result.success) {
        qWarning() << "[EditorSession] Autosave failed:" << result.errorMessage;
        emit autosaveFailed(result.errorMessage);
        return false;
    }

    qDebug() << "[EditorSession] Autosaved to" << path;
    emit autosaved(path);
    return true;
}
