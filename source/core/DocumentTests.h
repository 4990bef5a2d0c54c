#pragma once

// ============================================================================
// DocumentTests - Unit tests for the Document class
// ============================================================================
// - Page lookup by uid and by position
// - Page insert/remove/reorder
// - Source path helpers
// ============================================================================

#include "Document.h"
#include "../objects/TextElement.h"
#include <QDebug>

namespace DocumentTests {

inline bool testCreateBlank()
{
    qDebug() << "=== Test: Document::createBlank ===";
    bool success = true;

    auto doc = Document::createBlank();
    if (doc->pageCount() != 1) {
        qDebug() << "FAIL: expected 1 page, got" << doc->pageCount();
        success = false;
    }
    const Page* first = doc->page(0);
    if (!first || first->size != QSizeF(Document::DEFAULT_PAGE_WIDTH, Document::DEFAULT_PAGE_HEIGHT)) {
        qDebug() << "FAIL: default page size should be A4";
        success = false;
    }
    if (doc->hasSource() || doc->sourceStem() != QLatin1String("untitled")) {
        qDebug() << "FAIL: blank document should be untitled";
        success = false;
    }
    if (doc->modified) {
        qDebug() << "FAIL: new document should not be modified";
        success = false;
    }

    Document fromFile(QStringLiteral("/home/user/report.final.pdf"));
    if (fromFile.sourceStem() != QLatin1String("report.final")) {
        qDebug() << "FAIL: sourceStem" << fromFile.sourceStem();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Blank documents and source stems";
    }
    return success;
}

inline bool testLookup()
{
    qDebug() << "=== Test: Document Page Lookup ===";
    bool success = true;

    Document doc;
    Page* p0 = doc.addBlankPage(QSizeF(100, 100));
    Page* p1 = doc.addBlankPage(QSizeF(200, 200));

    if (doc.findPageById(p1->uid) != p1 || doc.indexOfPage(p1->uid) != 1) {
        qDebug() << "FAIL: lookup by uid";
        success = false;
    }
    if (doc.findPageById(QStringLiteral("missing")) != nullptr || doc.indexOfPage(QStringLiteral("missing")) != -1) {
        qDebug() << "FAIL: unknown uid should not resolve";
        success = false;
    }
    if (doc.page(0) != p0 || doc.page(2) != nullptr || doc.page(-1) != nullptr) {
        qDebug() << "FAIL: lookup by index";
        success = false;
    }

    p0->addElement(std::make_unique<TextElement>(QStringLiteral("x"), QRectF(0, 0, 5, 5)));
    p1->addElement(std::make_unique<TextElement>(QStringLiteral("y"), QRectF(0, 0, 5, 5)));
    p1->addElement(std::make_unique<TextElement>(QStringLiteral("z"), QRectF(0, 0, 5, 5)));
    if (doc.elementCount() != 3) {
        qDebug() << "FAIL: elementCount" << doc.elementCount();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Pages found by uid and index";
    }
    return success;
}

inline bool testRemoveAndMove()
{
    qDebug() << "=== Test: Document Remove/Move ===";
    bool success = true;

    Document doc;
    Page* a = doc.addBlankPage(QSizeF(100, 100));
    Page* b = doc.addBlankPage(QSizeF(100, 100));
    Page* c = doc.addBlankPage(QSizeF(100, 100));
    const QString aUid = a->uid;
    const QString bUid = b->uid;
    const QString cUid = c->uid;

    // Reorder: a b c -> b c a
    if (!doc.movePage(0, 2)) {
        qDebug() << "FAIL: movePage(0, 2) rejected";
        success = false;
    }
    if (doc.indexOfPage(bUid) != 0 || doc.indexOfPage(cUid) != 1 || doc.indexOfPage(aUid) != 2) {
        qDebug() << "FAIL: order after move";
        success = false;
    }
    if (doc.movePage(0, 3) || doc.movePage(-1, 0)) {
        qDebug() << "FAIL: out-of-range move should be rejected";
        success = false;
    }

    // uids survive the reorder
    if (doc.findPageById(aUid) != a) {
        qDebug() << "FAIL: page identity changed after move";
        success = false;
    }

    std::unique_ptr<Page> removed = doc.removePage(cUid);
    if (!removed || removed->uid != cUid || doc.pageCount() != 2 || doc.findPageById(cUid)) {
        qDebug() << "FAIL: removePage";
        success = false;
    }
    if (doc.removePage(cUid) != nullptr) {
        qDebug() << "FAIL: removing twice should return nullptr";
        success = false;
    }

    Page* inserted = doc.insertPage(1, Page::createBlank(QSizeF(50, 50)));
    if (doc.indexOfPage(inserted->uid) != 1 || doc.pageCount() != 3) {
        qDebug() << "FAIL: insertPage at index 1";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Pages removed, inserted and reordered by uid";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Document Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testCreateBlank();
    allPass &= testLookup();
    allPass &= testRemoveAndMove();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace DocumentTests
