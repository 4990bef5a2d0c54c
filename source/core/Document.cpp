// ============================================================================
// Document - Implementation
// ============================================================================

#include "Document.h"

#include <QFileInfo>
#include <algorithm>

Document::Document(const QString& source)
    : m_sourcePath(source)
{
}

std::unique_ptr<Document> Document::createBlank(const QSizeF& pageSize)
{
    auto doc = std::make_unique<Document>();
    doc->appendPage(Page::createBlank(pageSize));
    return doc;
}

QString Document::sourceStem() const
{
    if (m_sourcePath.isEmpty()) {
        return QStringLiteral("untitled");
    }
    QString stem = QFileInfo(m_sourcePath).completeBaseName();
    return stem.isEmpty() ? QStringLiteral("untitled") : stem;
}

// ===== Page Management =====

Page* Document::page(int index)
{
    if (index < 0 || index >= static_cast<int>(m_pages.size())) {
        return nullptr;
    }
    return m_pages[index].get();
}

const Page* Document::page(int index) const
{
    if (index < 0 || index >= static_cast<int>(m_pages.size())) {
        return nullptr;
    }
    return m_pages[index].get();
}

Page* Document::findPageById(const QString& uid)
{
    int index = indexOfPage(uid);
    return index >= 0 ? m_pages[index].get() : nullptr;
}

const Page* Document::findPageById(const QString& uid) const
{
    int index = indexOfPage(uid);
    return index >= 0 ? m_pages[index].get() : nullptr;
}

int Document::indexOfPage(const QString& uid) const
{
    for (size_t i = 0; i < m_pages.size(); ++i) {
        if (m_pages[i]->uid == uid) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Page* Document::appendPage(std::unique_ptr<Page> page)
{
    if (!page) {
        return nullptr;
    }
    Page* ptr = page.get();
    m_pages.push_back(std::move(page));
    return ptr;
}

Page* Document::insertPage(int index, std::unique_ptr<Page> page)
{
    if (!page) {
        return nullptr;
    }
    index = std::clamp(index, 0, pageCount());
    Page* ptr = page.get();
    m_pages.insert(m_pages.begin() + index, std::move(page));
    return ptr;
}

Page* Document::addBlankPage(const QSizeF& pageSize)
{
    return appendPage(Page::createBlank(pageSize));
}

std::unique_ptr<Page> Document::removePage(const QString& uid)
{
    int index = indexOfPage(uid);
    if (index < 0) {
        return nullptr;
    }
    std::unique_ptr<Page> removed = std::move(m_pages[index]);
    m_pages.erase(m_pages.begin() + index);
    return removed;
}

bool Document::movePage(int from, int to)
{
    int count = static_cast<int>(m_pages.size());

    if (from < 0 || from >= count || to < 0 || to >= count) {
        return false;
    }

    if (from == to) {
        return true;
    }

    auto pageToMove = std::move(m_pages[from]);
    m_pages.erase(m_pages.begin() + from);
    m_pages.insert(m_pages.begin() + to, std::move(pageToMove));
    return true;
}

int Document::elementCount() const
{
    int total = 0;
    for (const auto& page : m_pages) {
        total += page->elementCount();
    }
    return total;
}
