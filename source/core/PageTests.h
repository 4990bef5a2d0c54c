#pragma once

// ============================================================================
// PageTests - Unit tests for the Page class
// ============================================================================
// - Element stack management (add/insert/remove/find)
// - Hit testing (topmost visible element)
// - Factory methods
// ============================================================================

#include "Page.h"
#include "../objects/TextElement.h"
#include <QDebug>

namespace PageTests {

inline bool testFactories()
{
    qDebug() << "=== Test: Page Factories ===";
    bool success = true;

    auto blank = Page::createBlank(QSizeF(300, 400));
    if (blank->hasSource() || blank->sourceIndex != -1 || blank->size != QSizeF(300, 400)) {
        qDebug() << "FAIL: blank page should have no source";
        success = false;
    }

    auto pdfPage = Page::createForPdf(QSizeF(612, 792), 3, 90);
    if (!pdfPage->hasSource() || pdfPage->sourceIndex != 3 || pdfPage->rotation != 90) {
        qDebug() << "FAIL: pdf page fields not set";
        success = false;
    }

    if (blank->uid.isEmpty() || blank->uid == pdfPage->uid) {
        qDebug() << "FAIL: pages need distinct non-empty uids";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Factories set size, source and uid";
    }
    return success;
}

inline bool testElementManagement()
{
    qDebug() << "=== Test: Page Element Management ===";
    bool success = true;

    auto page = Page::createBlank(QSizeF(595, 842));

    PageElement* a = page->addElement(std::make_unique<TextElement>(QStringLiteral("a"), QRectF(0, 0, 10, 10)));
    PageElement* b = page->addElement(std::make_unique<TextElement>(QStringLiteral("b"), QRectF(0, 0, 10, 10)));
    PageElement* c = page->insertElement(0, std::make_unique<TextElement>(QStringLiteral("c"), QRectF(0, 0, 10, 10)));

    if (page->elementCount() != 3) {
        qDebug() << "FAIL: expected 3 elements, got" << page->elementCount();
        success = false;
    }
    if (page->indexOfElement(c->id) != 0 || page->indexOfElement(a->id) != 1
        || page->indexOfElement(b->id) != 2) {
        qDebug() << "FAIL: stacking order wrong";
        success = false;
    }

    // Out-of-range insert is clamped to the top
    PageElement* d = page->insertElement(99, std::make_unique<TextElement>(QStringLiteral("d"), QRectF()));
    if (page->indexOfElement(d->id) != 3) {
        qDebug() << "FAIL: insert index not clamped";
        success = false;
    }

    if (page->addElement(nullptr) != nullptr || page->elementCount() != 4) {
        qDebug() << "FAIL: adding null should be a no-op";
        success = false;
    }

    if (page->findElement(a->id) != a) {
        qDebug() << "FAIL: findElement returned wrong element";
        success = false;
    }

    const QString aId = a->id;
    std::unique_ptr<PageElement> removed = page->removeElement(aId);
    if (!removed || removed->id != aId || page->findElement(aId) || page->elementCount() != 3) {
        qDebug() << "FAIL: removeElement did not remove";
        success = false;
    }

    if (page->removeElement(QStringLiteral("no-such-id")) != nullptr || page->elementCount() != 3) {
        qDebug() << "FAIL: removing an unknown id should change nothing";
        success = false;
    }
    if (page->indexOfElement(QStringLiteral("no-such-id")) != -1) {
        qDebug() << "FAIL: indexOfElement for unknown id should be -1";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Element add/insert/find/remove";
    }
    return success;
}

inline bool testHitTest()
{
    qDebug() << "=== Test: Page Hit Test ===";
    bool success = true;

    auto page = Page::createBlank(QSizeF(595, 842));
    PageElement* bottom = page->addElement(std::make_unique<TextElement>(QStringLiteral("bottom"), QRectF(0, 0, 100, 100)));
    PageElement* top = page->addElement(std::make_unique<TextElement>(QStringLiteral("top"), QRectF(50, 50, 100, 100)));

    if (page->elementAtPoint(QPointF(75, 75)) != top) {
        qDebug() << "FAIL: overlap should hit the topmost element";
        success = false;
    }
    if (page->elementAtPoint(QPointF(10, 10)) != bottom) {
        qDebug() << "FAIL: should hit the bottom element";
        success = false;
    }
    if (page->elementAtPoint(QPointF(400, 400)) != nullptr) {
        qDebug() << "FAIL: empty area should hit nothing";
        success = false;
    }

    top->visible = false;
    if (page->elementAtPoint(QPointF(75, 75)) != bottom) {
        qDebug() << "FAIL: hidden elements should not be hit";
        success = false;
    }
    if (!page->hasVisibleElements()) {
        qDebug() << "FAIL: bottom is still visible";
        success = false;
    }
    bottom->visible = false;
    if (page->hasVisibleElements()) {
        qDebug() << "FAIL: all elements hidden";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Hit testing picks the topmost visible element";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Page Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testFactories();
    allPass &= testElementManagement();
    allPass &= testHitTest();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PageTests
