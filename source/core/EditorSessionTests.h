#pragma once

// ============================================================================
// EditorSessionTests - Integration tests for EditorSession
// ============================================================================
// Runs the whole edit cycle against real files: import, insert, undo/redo,
// export and autosave.
// ============================================================================

#include "EditorSession.h"
#include "Preferences.h"
#include "../objects/TextElement.h"
#include "../pdf/PdfProvider.h"
#include "../pdf/PdfTestFixtures.h"

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace EditorSessionTests {

/**
 * @brief Open a 2-page A4 PDF, insert an image, undo and redo it.
 */
inline bool testImportInsertUndoRedo()
{
    qDebug() << "=== Test: Import / Insert / Undo / Redo ===";
    bool success = true;

    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("scenario.pdf"));
    if (!PdfTestFixtures::writeTextPdf(path, { QStringLiteral("One"), QStringLiteral("Two") })) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    Preferences prefs;
    EditorSession session(prefs);
    int replaced = 0;
    QObject::connect(&session, &EditorSession::documentReplaced, [&replaced]() { ++replaced; });

    if (!session.openPdf(path)) {
        qDebug() << "FAIL: open failed:" << session.lastError();
        return false;
    }
    Document* doc = session.document();
    if (replaced != 1 || doc->pageCount() != 2
        || doc->page(0)->sourceIndex != 0 || doc->page(1)->sourceIndex != 1) {
        qDebug() << "FAIL: expected 2 pages with source indices 0 and 1";
        return false;
    }
    if (session.preview(doc->page(0)->uid).size() != QSize(595, 842)) {
        qDebug() << "FAIL: preview missing for page 1";
        success = false;
    }

    const QString pageUid = doc->page(0)->uid;
    PageElement* image = session.insertImage(pageUid, PdfTestFixtures::solidPng(200, 100));
    if (!image) {
        qDebug() << "FAIL: insertImage:" << session.lastError();
        return false;
    }
    const QString id = image->id;
    const QRectF rect = image->rect;
    if (rect != QRectF(197.5, 371, 200, 100)) {
        qDebug() << "FAIL: image should be centered at 197.5, 371, got" << rect;
        success = false;
    }
    if (!session.isModified() || !session.canUndo()) {
        qDebug() << "FAIL: insert should mark modified and be undoable";
        success = false;
    }

    if (!session.undo() || doc->page(0)->elementCount() != 0) {
        qDebug() << "FAIL: undo should leave the page empty";
        success = false;
    }
    if (!session.redo()) {
        qDebug() << "FAIL: redo rejected";
        return false;
    }
    const PageElement* restored = doc->page(0)->findElement(id);
    if (!restored || restored->rect != rect) {
        qDebug() << "FAIL: redo should restore the same id and rect";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Insert is undone and redone with the same identity";
    }
    return success;
}

inline bool testInsertErrors()
{
    qDebug() << "=== Test: Insert Errors ===";
    bool success = true;

    Preferences prefs;
    EditorSession session(prefs);
    session.newBlankDocument();
    const QString pageUid = session.document()->page(0)->uid;

    if (session.insertImage(pageUid, QByteArray("garbage")) != nullptr) {
        qDebug() << "FAIL: garbage bytes should not insert";
        success = false;
    }
    if (session.lastError().isEmpty()) {
        qDebug() << "FAIL: failed insert should set an error";
        success = false;
    }
    if (session.insertImageFile(pageUid, QStringLiteral("/no/such/image.png")) != nullptr) {
        qDebug() << "FAIL: missing file should not insert";
        success = false;
    }
    if (session.insertText(pageUid, QStringLiteral("   ")) != nullptr) {
        qDebug() << "FAIL: blank text should not insert";
        success = false;
    }
    if (session.insertText(QStringLiteral("no-page"), QStringLiteral("x")) != nullptr) {
        qDebug() << "FAIL: unknown page should not insert";
        success = false;
    }
    if (session.canUndo() || session.isModified() || session.document()->elementCount() != 0) {
        qDebug() << "FAIL: failed inserts must not change the document or history";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Failed inserts change nothing";
    }
    return success;
}

inline bool testDeleteAndProperties()
{
    qDebug() << "=== Test: Delete and Properties ===";
    bool success = true;

    Preferences prefs;
    EditorSession session(prefs);
    session.newBlankDocument();
    const QString pageUid = session.document()->page(0)->uid;

    PageElement* text = session.insertText(pageUid, QStringLiteral("Note"));
    if (!text || text->rect != QRectF(197.5, 391, 200, 60)) {
        qDebug() << "FAIL: text box should be 200x60 centered";
        return false;
    }
    const QString id = text->id;

    session.setElementOpacity(pageUid, id, 0.5);
    session.setTextStyle(pageUid, id, QString(), 20, QStringLiteral("#ff0000"));
    session.setElementLocked(pageUid, id, true);
    auto* styled = static_cast<TextElement*>(session.findElement(pageUid, id));
    if (styled->opacity != 0.5 || styled->fontSize != 20 || styled->color != QLatin1String("#ff0000")
        || styled->fontFamily != QLatin1String("Helvetica") || !styled->locked) {
        qDebug() << "FAIL: property setters did not apply";
        success = false;
    }

    // Locked elements can still be deleted
    if (!session.deleteElement(pageUid, id) || session.findElement(pageUid, id)) {
        qDebug() << "FAIL: delete";
        success = false;
    }
    if (session.deleteElement(pageUid, id)) {
        qDebug() << "FAIL: deleting twice should fail";
        success = false;
    }

    // Undo restores the element as it was deleted
    session.undo();
    auto* back = static_cast<TextElement*>(session.findElement(pageUid, id));
    if (!back || back->opacity != 0.5 || back->fontSize != 20) {
        qDebug() << "FAIL: undo of delete should restore the element's last state";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Delete is undoable and keeps properties";
    }
    return success;
}

inline bool testPages()
{
    qDebug() << "=== Test: Page Operations ===";
    bool success = true;

    Preferences prefs;
    prefs.defaultPageWidth = 612;
    prefs.defaultPageHeight = 792;
    EditorSession session(prefs);
    session.newBlankDocument();
    Document* doc = session.document();
    const QString first = doc->page(0)->uid;

    if (session.removePage(first) || doc->pageCount() != 1) {
        qDebug() << "FAIL: the last page must not be removable";
        success = false;
    }

    Page* added = session.addBlankPage(first);
    if (!added || doc->indexOfPage(added->uid) != 1 || added->size != QSizeF(612, 792)) {
        qDebug() << "FAIL: addBlankPage should insert after the given page with the default size";
        success = false;
    }

    if (!session.movePage(added->uid, 0) || doc->indexOfPage(added->uid) != 0) {
        qDebug() << "FAIL: movePage";
        success = false;
    }

    session.setPageLabel(first, QStringLiteral("Cover"));
    if (doc->findPageById(first)->label != QLatin1String("Cover")) {
        qDebug() << "FAIL: setPageLabel";
        success = false;
    }

    if (!session.removePage(first) || doc->pageCount() != 1) {
        qDebug() << "FAIL: removePage with two pages";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Pages added, moved, labelled and removed";
    }
    return success;
}

inline bool testExportAndAutosave()
{
    qDebug() << "=== Test: Export and Autosave ===";
    bool success = true;

    QTemporaryDir dir;
    const QString source = dir.filePath(QStringLiteral("report.pdf"));
    if (!PdfTestFixtures::writeTextPdf(source, { QStringLiteral("Body") })) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    Preferences prefs;
    EditorSession session(prefs);
    session.setAutosaveDirectory(dir.filePath(QStringLiteral("cache")));
    if (!session.openPdf(source)) {
        qDebug() << "FAIL: open failed:" << session.lastError();
        return false;
    }

    const QString expected = dir.filePath(QStringLiteral("cache/report_autosave.pdf"));
    if (session.autosavePath() != expected) {
        qDebug() << "FAIL: autosave path" << session.autosavePath() << "!=" << expected;
        success = false;
    }

    // Nothing to save yet
    if (session.autosave() || QFile::exists(expected)) {
        qDebug() << "FAIL: autosave without changes should not write";
        success = false;
    }

    session.insertText(session.document()->page(0)->uid, QStringLiteral("Draft"));
    QString autosavedTo;
    QObject::connect(&session, &EditorSession::autosaved,
                     [&autosavedTo](const QString& path) { autosavedTo = path; });
    if (!session.autosave() || autosavedTo != expected || !QFile::exists(expected)) {
        qDebug() << "FAIL: autosave should write" << expected;
        success = false;
    }
    if (!session.isModified()) {
        qDebug() << "FAIL: autosave must not clear the unsaved-changes flag";
        success = false;
    }

    bool modifiedSignal = true;
    QObject::connect(&session, &EditorSession::modifiedChanged,
                     [&modifiedSignal](bool modified) { modifiedSignal = modified; });
    const QString output = dir.filePath(QStringLiteral("final.pdf"));
    PdfExportResult result = session.exportTo(output);
    if (!result.success || session.isModified() || modifiedSignal) {
        qDebug() << "FAIL: export should succeed and clear modified:" << result.errorMessage;
        success = false;
    }

    std::unique_ptr<PdfProvider> pdf = PdfProvider::open(output);
    if (!pdf || !pdf->pageText(0).contains(QLatin1String("Draft"))) {
        qDebug() << "FAIL: exported file lacks the inserted text";
        success = false;
    }

    // Unwritable autosave location is reported, not fatal
    session.insertText(session.document()->page(0)->uid, QStringLiteral("More"));
    QFile blocker(dir.filePath(QStringLiteral("blocker")));
    if (!blocker.open(QIODevice::WriteOnly)) {
        qDebug() << "FAIL: could not create blocker file";
        return false;
    }
    blocker.close();
    session.setAutosaveDirectory(dir.filePath(QStringLiteral("blocker/sub")));
    QString failure;
    QObject::connect(&session, &EditorSession::autosaveFailed,
                     [&failure](const QString& message) { failure = message; });
    if (session.autosave() || failure.isEmpty() || !session.isModified()) {
        qDebug() << "FAIL: autosave into a file path should report failure";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Export clears modified, autosave does not";
    }
    return success;
}

/**
 * @brief Exporting onto the opened PDF is refused and changes nothing.
 */
inline bool testExportOverSourceRefused()
{
    qDebug() << "=== Test: Export Over Source Refused ===";
    bool success = true;

    QTemporaryDir dir;
    const QString source = dir.filePath(QStringLiteral("letter.pdf"));
    if (!PdfTestFixtures::writeTextPdf(source, { QStringLiteral("Body") })) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }
    QByteArray original;
    {
        QFile file(source);
        if (!file.open(QIODevice::ReadOnly)) {
            qDebug() << "FAIL: could not read fixture";
            return false;
        }
        original = file.readAll();
    }

    Preferences prefs;
    EditorSession session(prefs);
    if (!session.openPdf(source)) {
        qDebug() << "FAIL: open failed:" << session.lastError();
        return false;
    }
    session.insertText(session.document()->page(0)->uid, QStringLiteral("Draft"));

    for (const QString& target : { source, dir.path() + QStringLiteral("/./letter.pdf") }) {
        PdfExportResult result = session.exportTo(target);
        if (result.success || result.errorMessage.isEmpty() || session.lastError().isEmpty()) {
            qDebug() << "FAIL: export to" << target << "should be refused";
            success = false;
        }
    }
    if (!session.isModified()) {
        qDebug() << "FAIL: a refused export must keep the unsaved-changes flag";
        success = false;
    }

    QFile file(source);
    if (!file.open(QIODevice::ReadOnly) || file.readAll() != original) {
        qDebug() << "FAIL: source file was modified";
        success = false;
    }

    // The overlay appears once in a real export
    const QString output = dir.filePath(QStringLiteral("letter_edited.pdf"));
    if (!session.exportTo(output).success) {
        qDebug() << "FAIL: export to a new file failed:" << session.lastError();
        return false;
    }
    std::unique_ptr<PdfProvider> pdf = PdfProvider::open(output);
    const QString text = pdf ? pdf->pageText(0) : QString();
    if (text.count(QLatin1String("Draft")) != 1 || !text.contains(QLatin1String("Body"))) {
        qDebug() << "FAIL: exported page text:" << text;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: The source PDF is never overwritten";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running EditorSession Integration Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testImportInsertUndoRedo();
    allPass &= testInsertErrors();
    allPass &= testDeleteAndProperties();
    allPass &= testPages();
    allPass &= testExportAndAutosave();
    allPass &= testExportOverSourceRefused();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace EditorSessionTests
