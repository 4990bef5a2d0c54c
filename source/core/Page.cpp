// ============================================================================
// Page - Implementation
// ============================================================================

#include "Page.h"

#include <algorithm>

Page::Page()
    : uid(QUuid::createUuid().toString(QUuid::WithoutBraces))
{
}

Page::Page(const QSizeF& pageSize)
    : uid(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , size(pageSize)
{
}

std::unique_ptr<Page> Page::createBlank(const QSizeF& pageSize)
{
    return std::make_unique<Page>(pageSize);
}

std::unique_ptr<Page> Page::createForPdf(const QSizeF& pageSize, int sourcePage, int pageRotation)
{
    auto page = std::make_unique<Page>(pageSize);
    page->sourceIndex = sourcePage;
    page->rotation = pageRotation;
    return page;
}

// ===== Element Management =====

PageElement* Page::addElement(std::unique_ptr<PageElement> element)
{
    if (!element) {
        return nullptr;
    }
    PageElement* ptr = element.get();
    elements.push_back(std::move(element));
    return ptr;
}

PageElement* Page::insertElement(int index, std::unique_ptr<PageElement> element)
{
    if (!element) {
        return nullptr;
    }
    index = std::clamp(index, 0, elementCount());
    PageElement* ptr = element.get();
    elements.insert(elements.begin() + index, std::move(element));
    return ptr;
}

std::unique_ptr<PageElement> Page::removeElement(const QString& id)
{
    for (auto it = elements.begin(); it != elements.end(); ++it) {
        if ((*it)->id == id) {
            std::unique_ptr<PageElement> removed = std::move(*it);
            elements.erase(it);
            return removed;
        }
    }
    return nullptr;
}

PageElement* Page::findElement(const QString& id)
{
    for (auto& element : elements) {
        if (element->id == id) {
            return element.get();
        }
    }
    return nullptr;
}

const PageElement* Page::findElement(const QString& id) const
{
    for (const auto& element : elements) {
        if (element->id == id) {
            return element.get();
        }
    }
    return nullptr;
}

int Page::indexOfElement(const QString& id) const
{
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i]->id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

PageElement* Page::elementAtPoint(const QPointF& pt)
{
    // Reverse order: topmost first
    for (auto it = elements.rbegin(); it != elements.rend(); ++it) {
        if ((*it)->visible && (*it)->containsPoint(pt)) {
            return it->get();
        }
    }
    return nullptr;
}

// ===== Utility =====

bool Page::hasVisibleElements() const
{
    return std::any_of(elements.begin(), elements.end(),
                       [](const std::unique_ptr<PageElement>& e) { return e->visible; });
}

void Page::renderElements(QPainter& painter, qreal zoom) const
{
    for (const auto& element : elements) {
        if (element->visible) {
            element->render(painter, zoom);
        }
    }
}
