#pragma once

// ============================================================================
// SnapEngineTests - Unit tests for drag snapping
// ============================================================================
// All tests use an A4 page (595 x 842). Page center is (297.5, 421).
// ============================================================================

#include "SnapEngine.h"
#include "Page.h"
#include "../objects/TextElement.h"
#include <QDebug>

namespace SnapEngineTests {

inline std::unique_ptr<Page> makePage()
{
    return Page::createBlank(QSizeF(595, 842));
}

/// A y position that does not snap for height 100 on an A4 page
constexpr qreal FREE_Y = 300.0;

inline bool testPageCenter()
{
    qDebug() << "=== Test: Snap to Page Center ===";
    bool success = true;

    auto page = makePage();
    SnapEngine engine;

    SnapResult r = engine.snap(*page, QString(), QRectF(196, FREE_Y, 200, 100));
    if (!r.snappedX || r.position.x() != 197.5) {
        qDebug() << "FAIL: x should snap to 197.5, got" << r.position.x();
        success = false;
    }
    if (r.snappedY || r.position.y() != FREE_Y) {
        qDebug() << "FAIL: y should be untouched, got" << r.position.y();
        success = false;
    }
    if (r.guides.size() != 1 || !(r.guides.first() == SnapGuide{Qt::Vertical, 297.5})) {
        qDebug() << "FAIL: expected one vertical guide at 297.5";
        success = false;
    }

    SnapResult ry = engine.snap(*page, QString(), QRectF(30, 370, 100, 100));
    if (!ry.snappedY || ry.position.y() != 371.0) {
        qDebug() << "FAIL: y should snap to 371, got" << ry.position.y();
        success = false;
    }
    if (ry.guides.size() != 1 || !(ry.guides.first() == SnapGuide{Qt::Horizontal, 421.0})) {
        qDebug() << "FAIL: expected one horizontal guide at 421";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Centers snap exactly onto the page center";
    }
    return success;
}

inline bool testPageEdges()
{
    qDebug() << "=== Test: Snap to Page Edges ===";
    bool success = true;

    auto page = makePage();
    SnapEngine engine;

    SnapResult left = engine.snap(*page, QString(), QRectF(4, FREE_Y, 100, 100));
    if (!left.snappedX || left.position.x() != 0.0) {
        qDebug() << "FAIL: x=4 should snap to 0, got" << left.position.x();
        success = false;
    }

    SnapResult right = engine.snap(*page, QString(), QRectF(490, FREE_Y, 100, 100));
    if (!right.snappedX || right.position.x() != 495.0) {
        qDebug() << "FAIL: right edge 590 should snap to 595, got" << right.position.x() + 100;
        success = false;
    }

    // Threshold is strict
    SnapResult exact = engine.snap(*page, QString(), QRectF(6, FREE_Y, 100, 100));
    if (exact.snappedX || exact.position.x() != 6.0 || !exact.guides.isEmpty()) {
        qDebug() << "FAIL: distance equal to the threshold must not snap";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Page edges snap within the threshold";
    }
    return success;
}

inline bool testSiblings()
{
    qDebug() << "=== Test: Snap to Sibling Edges ===";
    bool success = true;

    auto page = makePage();
    SnapEngine engine;
    PageElement* sibling = page->addElement(
        std::make_unique<TextElement>(QStringLiteral("s"), QRectF(100, 600, 80, 40)));

    SnapResult r = engine.snap(*page, QString(), QRectF(103, FREE_Y, 50, 100));
    if (!r.snappedX || r.position.x() != 100.0) {
        qDebug() << "FAIL: left should snap to sibling left 100, got" << r.position.x();
        success = false;
    }

    // Dragged right edge onto sibling right edge (180)
    SnapResult rr = engine.snap(*page, QString(), QRectF(132, FREE_Y, 50, 100));
    if (!rr.snappedX || rr.position.x() != 130.0) {
        qDebug() << "FAIL: right should snap to sibling right 180, got" << rr.position.x() + 50;
        success = false;
    }

    sibling->locked = true;
    SnapResult locked = engine.snap(*page, QString(), QRectF(103, FREE_Y, 50, 100));
    if (!locked.snappedX || locked.position.x() != 100.0) {
        qDebug() << "FAIL: locked siblings still act as targets";
        success = false;
    }

    sibling->visible = false;
    SnapResult hidden = engine.snap(*page, QString(), QRectF(103, FREE_Y, 50, 100));
    if (hidden.snappedX || hidden.position.x() != 103.0) {
        qDebug() << "FAIL: hidden siblings must be ignored";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Visible siblings (locked or not) are snap targets";
    }
    return success;
}

inline bool testSelfExcluded()
{
    qDebug() << "=== Test: Dragged Element Excluded ===";
    bool success = true;

    auto page = makePage();
    SnapEngine engine;
    PageElement* dragged = page->addElement(
        std::make_unique<TextElement>(QStringLiteral("d"), QRectF(400, 600, 50, 50)));

    SnapResult r = engine.snap(*page, dragged->id, QRectF(403, FREE_Y, 50, 100));
    if (r.snappedX || r.position.x() != 403.0) {
        qDebug() << "FAIL: element snapped to its own old position";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: The dragged element is not its own target";
    }
    return success;
}

inline bool testPriority()
{
    qDebug() << "=== Test: Snap Rule Priority ===";
    bool success = true;

    auto page = makePage();
    SnapEngine engine;
    // Sibling left edge at 290 is also within reach of the dragged left edge
    page->addElement(std::make_unique<TextElement>(QStringLiteral("s"), QRectF(290, 700, 40, 40)));

    SnapResult r = engine.snap(*page, QString(), QRectF(287, FREE_Y, 20, 100));
    if (!r.snappedX || r.position.x() != 287.5) {
        qDebug() << "FAIL: page center should win over sibling, got" << r.position.x();
        success = false;
    }
    if (r.guides.size() != 1 || r.guides.first().coordinate != 297.5) {
        qDebug() << "FAIL: only the winning rule should produce a guide";
        success = false;
    }

    // Both axes snap independently
    SnapResult both = engine.snap(*page, QString(), QRectF(3, 838 - 100, 100, 100));
    if (!both.snappedX || !both.snappedY || both.position != QPointF(0, 742) || both.guides.size() != 2) {
        qDebug() << "FAIL: both axes should snap, got" << both.position;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: First matching rule wins per axis";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running SnapEngine Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testPageCenter();
    allPass &= testPageEdges();
    allPass &= testSiblings();
    allPass &= testSelfExcluded();
    allPass &= testPriority();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace SnapEngineTests
