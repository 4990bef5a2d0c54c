#pragma once

// ============================================================================
// ElementTests - Unit tests for ImageElement / TextElement
// ============================================================================
// - Geometry mutation and clamping
// - Identity stability
// - cloneElement() isolation for every element kind
// - Hex color parsing
// ============================================================================

#include "ImageElement.h"
#include "TextElement.h"

#include <QBuffer>
#include <QDebug>
#include <QSet>

namespace ElementTests {

inline QByteArray makePng(int width, int height)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(QColor(0, 128, 255, 200));

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, "PNG")) {
        return QByteArray();
    }
    return bytes;
}

inline bool testGeometry()
{
    qDebug() << "=== Test: Element Geometry ===";
    bool success = true;

    TextElement text(QStringLiteral("hello"), QRectF(10, 20, 100, 50));

    text.moveTo(40, 60);
    if (text.rect != QRectF(40, 60, 100, 50)) {
        qDebug() << "FAIL: moveTo should keep the size:" << text.rect;
        success = false;
    }

    text.resize(0.2, -5);
    if (text.rect.width() != 1.0 || text.rect.height() != 1.0) {
        qDebug() << "FAIL: resize should clamp to 1.0:" << text.rect.size();
        success = false;
    }
    if (text.rect.topLeft() != QPointF(40, 60)) {
        qDebug() << "FAIL: resize moved the element";
        success = false;
    }

    text.setOpacity(1.7);
    if (text.opacity != 1.0) {
        qDebug() << "FAIL: opacity should clamp to 1.0";
        success = false;
    }
    text.setOpacity(-0.5);
    if (text.opacity != 0.0) {
        qDebug() << "FAIL: opacity should clamp to 0.0";
        success = false;
    }

    text.setFontSize(0);
    if (text.fontSize != TextElement::MIN_FONT_SIZE) {
        qDebug() << "FAIL: font size should clamp to" << TextElement::MIN_FONT_SIZE;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Geometry mutation and clamping";
    }
    return success;
}

inline bool testIdentity()
{
    qDebug() << "=== Test: Element Identity ===";
    bool success = true;

    QSet<QString> ids;
    for (int i = 0; i < 100; ++i) {
        TextElement text;
        ids.insert(text.id);
    }
    if (ids.size() != 100) {
        qDebug() << "FAIL: element ids are not unique";
        success = false;
    }

    ImageElement image(makePng(4, 4), QStringLiteral("a.png"), QRectF(0, 0, 4, 4));
    const QString id = image.id;
    image.moveTo(100, 100);
    image.resize(50, 50);
    image.setOpacity(0.3);
    image.visible = false;
    image.locked = true;
    if (image.id != id) {
        qDebug() << "FAIL: id changed after mutation";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Ids are unique and stable";
    }
    return success;
}

inline bool testCloneImage()
{
    qDebug() << "=== Test: Clone ImageElement ===";
    bool success = true;

    ImageElement original(makePng(8, 6), QStringLiteral("/tmp/photo.png"), QRectF(5, 6, 80, 60));
    original.opacity = 0.5;
    original.rotation = 15;
    original.locked = true;

    std::unique_ptr<PageElement> copy = cloneElement(original);
    if (!copy || copy->kind() != PageElement::Kind::Image) {
        qDebug() << "FAIL: clone has wrong kind";
        return false;
    }
    auto* image = static_cast<ImageElement*>(copy.get());

    if (image->id != original.id || image->rect != original.rect
        || image->opacity != 0.5 || image->rotation != 15 || !image->locked
        || image->sourcePath != original.sourcePath || image->imageBytes != original.imageBytes) {
        qDebug() << "FAIL: clone does not match the original";
        success = false;
    }

    // Mutating the clone must not reach the original
    const QByteArray originalBytes = original.imageBytes;
    image->imageBytes[0] = static_cast<char>(image->imageBytes[0] ^ 0xFF);
    image->moveTo(300, 300);
    image->visible = false;
    if (original.imageBytes != originalBytes) {
        qDebug() << "FAIL: clone shares image bytes with the original";
        success = false;
    }
    if (original.rect.topLeft() != QPointF(5, 6) || !original.visible) {
        qDebug() << "FAIL: clone shares geometry/state with the original";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Image clone is a detached copy";
    }
    return success;
}

inline bool testCloneText()
{
    qDebug() << "=== Test: Clone TextElement ===";
    bool success = true;

    TextElement original(QStringLiteral("line one\nline two"), QRectF(1, 2, 3, 4));
    original.fontFamily = QStringLiteral("Courier");
    original.fontSize = 22;
    original.color = QStringLiteral("#336699");

    std::unique_ptr<PageElement> copy = cloneElement(original);
    if (!copy || copy->kind() != PageElement::Kind::Text) {
        qDebug() << "FAIL: clone has wrong kind";
        return false;
    }
    auto* text = static_cast<TextElement*>(copy.get());

    if (text->text != original.text || text->fontFamily != QLatin1String("Courier")
        || text->fontSize != 22 || text->color != QLatin1String("#336699")
        || text->id != original.id) {
        qDebug() << "FAIL: text-specific fields were not copied";
        success = false;
    }

    text->text = QStringLiteral("changed");
    text->color = QStringLiteral("#000000");
    if (original.text != QLatin1String("line one\nline two") || original.color != QLatin1String("#336699")) {
        qDebug() << "FAIL: clone shares text state with the original";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Text clone is a detached copy";
    }
    return success;
}

inline bool testHexColor()
{
    qDebug() << "=== Test: Hex Color Parsing ===";
    bool success = true;

    if (TextElement::parseHexColor(QStringLiteral("#ff8000")) != QColor(255, 128, 0)) {
        qDebug() << "FAIL: #ff8000";
        success = false;
    }
    if (TextElement::parseHexColor(QStringLiteral("00FF00")) != QColor(0, 255, 0)) {
        qDebug() << "FAIL: 00FF00 without '#'";
        success = false;
    }
    const QStringList malformed = { QStringLiteral("#fff"), QStringLiteral("red"),
                                    QStringLiteral("#gg0000"), QStringLiteral("0x12ab"),
                                    QStringLiteral("+12345"), QStringLiteral("# 1234a"),
                                    QStringLiteral("#-12345"), QString() };
    for (const QString& value : malformed) {
        if (TextElement::parseHexColor(value) != QColor(Qt::black)) {
            qDebug() << "FAIL: malformed color" << value << "should fall back to black";
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Hex colors parsed, malformed ones fall back to black";
    }
    return success;
}

inline bool testImageDecode()
{
    qDebug() << "=== Test: Image Decode ===";
    bool success = true;

    ImageElement good(makePng(12, 7), QString(), QRectF(0, 0, 12, 7));
    if (good.naturalSize() != QSize(12, 7)) {
        qDebug() << "FAIL: naturalSize" << good.naturalSize() << "!= 12x7";
        success = false;
    }

    ImageElement bad(QByteArray("not an image"), QString(), QRectF(0, 0, 10, 10));
    if (!bad.image().isNull()) {
        qDebug() << "FAIL: garbage bytes should not decode";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Image bytes decoded lazily";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Element Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testGeometry();
    allPass &= testIdentity();
    allPass &= testCloneImage();
    allPass &= testCloneText();
    allPass &= testHexColor();
    allPass &= testImageDecode();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ElementTests
