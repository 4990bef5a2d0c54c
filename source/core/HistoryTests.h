#pragma once

// ============================================================================
// HistoryTests - Unit tests for undo/redo of element insert/delete
// ============================================================================

#include "History.h"
#include "Document.h"
#include "../objects/TextElement.h"
#include <QDebug>

namespace HistoryTests {

inline bool testInverseLaw()
{
    qDebug() << "=== Test: History Undo/Redo Inverse ===";
    bool success = true;

    auto doc = Document::createBlank();
    Page* page = doc->page(0);
    History history;

    PageElement* inserted = page->addElement(
        std::make_unique<TextElement>(QStringLiteral("hello"), QRectF(10, 20, 200, 60)));
    const QString id = inserted->id;
    const QRectF rect = inserted->rect;
    history.push(HistoryCommand::Insert, page->uid, *inserted);

    if (!history.undo(*doc) || page->elementCount() != 0) {
        qDebug() << "FAIL: undo of insert should remove the element";
        success = false;
    }
    if (!history.redo(*doc) || page->elementCount() != 1) {
        qDebug() << "FAIL: redo of insert should restore the element";
        return false;
    }

    PageElement* restored = page->findElement(id);
    if (!restored || restored->rect != rect) {
        qDebug() << "FAIL: redo should restore the same id and rect";
        success = false;
    }

    // Delete then undo brings it back
    history.push(HistoryCommand::Delete, page->uid, *restored);
    page->removeElement(id);
    if (!history.undo(*doc) || !page->findElement(id)) {
        qDebug() << "FAIL: undo of delete should re-insert";
        success = false;
    }
    if (!history.redo(*doc) || page->findElement(id)) {
        qDebug() << "FAIL: redo of delete should remove again";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: undo and redo are inverses";
    }
    return success;
}

inline bool testPushClearsRedo()
{
    qDebug() << "=== Test: History Push Clears Redo ===";
    bool success = true;

    auto doc = Document::createBlank();
    Page* page = doc->page(0);
    History history;

    PageElement* first = page->addElement(std::make_unique<TextElement>(QStringLiteral("1"), QRectF(0, 0, 10, 10)));
    history.push(HistoryCommand::Insert, page->uid, *first);
    history.undo(*doc);
    if (!history.canRedo()) {
        qDebug() << "FAIL: redo should be available after undo";
        success = false;
    }

    PageElement* second = page->addElement(std::make_unique<TextElement>(QStringLiteral("2"), QRectF(0, 0, 10, 10)));
    history.push(HistoryCommand::Insert, page->uid, *second);
    if (history.canRedo() || history.redoCount() != 0) {
        qDebug() << "FAIL: push must clear redo";
        success = false;
    }
    if (history.undoCount() != 1) {
        qDebug() << "FAIL: undo stack should hold one command";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: push clears the redo stack";
    }
    return success;
}

inline bool testSnapshotIsolation()
{
    qDebug() << "=== Test: History Snapshot Isolation ===";
    bool success = true;

    auto doc = Document::createBlank();
    Page* page = doc->page(0);
    History history;

    PageElement* live = page->addElement(std::make_unique<TextElement>(QStringLiteral("orig"), QRectF(0, 0, 50, 50)));
    const QString id = live->id;
    history.push(HistoryCommand::Insert, page->uid, *live);

    // Later edits to the live element must not leak into history
    live->moveTo(300, 300);
    static_cast<TextElement*>(live)->text = QStringLiteral("edited");

    history.undo(*doc);
    history.redo(*doc);

    auto* restored = static_cast<TextElement*>(page->findElement(id));
    if (!restored || restored->rect.topLeft() != QPointF(0, 0) || restored->text != QLatin1String("orig")) {
        qDebug() << "FAIL: redo should restore the snapshot, not the edited element";
        return false;
    }

    // Each apply inserts a fresh clone
    restored->moveTo(111, 111);
    history.undo(*doc);
    history.redo(*doc);
    PageElement* again = page->findElement(id);
    if (!again || again->rect.topLeft() != QPointF(0, 0)) {
        qDebug() << "FAIL: stored snapshot was mutated through a previous redo";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: history holds detached snapshots";
    }
    return success;
}

inline bool testMissingPage()
{
    qDebug() << "=== Test: History Missing Page ===";
    bool success = true;

    auto doc = Document::createBlank();
    Page* keep = doc->page(0);
    Page* doomed = doc->addBlankPage(QSizeF(100, 100));
    History history;

    PageElement* element = doomed->addElement(std::make_unique<TextElement>(QStringLiteral("x"), QRectF(0, 0, 10, 10)));
    history.push(HistoryCommand::Insert, doomed->uid, *element);
    doc->removePage(doomed->uid);

    if (!history.undo(*doc)) {
        qDebug() << "FAIL: undo should still consume the command";
        success = false;
    }
    if (!history.canRedo() || history.canUndo()) {
        qDebug() << "FAIL: skipped command should move to redo";
        success = false;
    }
    if (!history.redo(*doc) || keep->elementCount() != 0) {
        qDebug() << "FAIL: redo onto a missing page should change nothing";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: commands for removed pages are skipped";
    }
    return success;
}

inline bool testEmptyStacks()
{
    qDebug() << "=== Test: History Empty Stacks ===";
    bool success = true;

    auto doc = Document::createBlank();
    History history;

    if (history.undo(*doc) || history.redo(*doc)) {
        qDebug() << "FAIL: empty history should report nothing to do";
        success = false;
    }
    if (!history.nextUndoPageId().isEmpty() || !history.nextRedoPageId().isEmpty()) {
        qDebug() << "FAIL: empty history has no next page";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: empty stacks are no-ops";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running History Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testInverseLaw();
    allPass &= testPushClearsRedo();
    allPass &= testSnapshotIsolation();
    allPass &= testMissingPage();
    allPass &= testEmptyStacks();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace HistoryTests
