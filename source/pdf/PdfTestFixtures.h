#pragma once

// ============================================================================
// PdfTestFixtures - Sample files for the import/export/session tests
// ============================================================================

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QByteArray>
#include <QColor>
#include <QDebug>
#include <QImage>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QVector>

namespace PdfTestFixtures {

/**
 * @brief Write a PDF with one page per entry of pageTexts.
 * @param path Output file.
 * @param pageTexts ASCII text drawn near the top of each page.
 * @param size Page size in points (default A4).
 */
inline bool writeTextPdf(const QString& path, const QStringList& pageTexts,
                         const QSizeF& size = QSizeF(595, 842))
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return false;
    }

    pdf_document* doc = nullptr;
    fz_font* font = nullptr;
    pdf_obj* fontRef = nullptr;
    bool ok = true;
    QByteArray pathUtf8 = path.toUtf8();

    fz_var(doc);
    fz_var(font);
    fz_var(fontRef);

    fz_try(ctx) {
        doc = pdf_create_document(ctx);
        font = fz_new_base14_font(ctx, "Helvetica");
        fontRef = pdf_add_simple_font(ctx, doc, font, PDF_SIMPLE_ENCODING_LATIN);

        for (const QString& text : pageTexts) {
            QByteArray content = QStringLiteral("BT /F1 24 Tf 72 %1 Td (%2) Tj ET\n")
                                     .arg(size.height() - 100).arg(text).toLatin1();

            pdf_obj* resources = pdf_new_dict(ctx, doc, 1);
            pdf_obj* fonts = pdf_dict_put_dict(ctx, resources, PDF_NAME(Font), 1);
            pdf_dict_puts(ctx, fonts, "F1", fontRef);

            fz_buffer* buf = fz_new_buffer_from_copied_data(ctx,
                reinterpret_cast<const unsigned char*>(content.constData()),
                static_cast<size_t>(content.size()));
            fz_rect mediabox = fz_make_rect(0, 0, static_cast<float>(size.width()),
                                            static_cast<float>(size.height()));
            pdf_obj* page = pdf_add_page(ctx, doc, mediabox, 0, resources, buf);
            pdf_insert_page(ctx, doc, -1, page);

            pdf_drop_obj(ctx, page);
            pdf_drop_obj(ctx, resources);
            fz_drop_buffer(ctx, buf);
        }

        pdf_save_document(ctx, doc, pathUtf8.constData(), nullptr);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, fontRef);
        fz_drop_font(ctx, font);
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        qDebug() << "PdfTestFixtures: could not write" << path << "-" << fz_caught_message(ctx);
        ok = false;
    }

    fz_drop_context(ctx);
    return ok;
}

/**
 * @brief A filled rectangle in unrotated PDF space (origin bottom-left).
 */
struct FilledRect {
    QRectF rect;
    QColor color;
};

/**
 * @brief Write a one-page PDF made of filled rectangles.
 * @param mediaSize MediaBox size in points.
 * @param rects Drawn in order.
 * @param rotate Value of the page's /Rotate entry.
 * @param cropBox CropBox in PDF space; none if null.
 */
inline bool writeRectsPdf(const QString& path, const QSizeF& mediaSize,
                          const QVector<FilledRect>& rects, int rotate = 0,
                          const QRectF& cropBox = QRectF())
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return false;
    }

    QByteArray content;
    for (const FilledRect& r : rects) {
        content += QStringLiteral("%1 %2 %3 rg %4 %5 %6 %7 re f\n")
                       .arg(r.color.redF()).arg(r.color.greenF()).arg(r.color.blueF())
                       .arg(r.rect.x()).arg(r.rect.y()).arg(r.rect.width()).arg(r.rect.height())
                       .toLatin1();
    }

    pdf_document* doc = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* page = nullptr;
    fz_buffer* buf = nullptr;
    bool ok = true;
    QByteArray pathUtf8 = path.toUtf8();

    fz_var(doc);
    fz_var(resources);
    fz_var(page);
    fz_var(buf);

    fz_try(ctx) {
        doc = pdf_create_document(ctx);
        resources = pdf_new_dict(ctx, doc, 1);
        buf = fz_new_buffer_from_copied_data(ctx,
            reinterpret_cast<const unsigned char*>(content.constData()),
            static_cast<size_t>(content.size()));
        fz_rect mediabox = fz_make_rect(0, 0, static_cast<float>(mediaSize.width()),
                                        static_cast<float>(mediaSize.height()));
        page = pdf_add_page(ctx, doc, mediabox, rotate, resources, buf);
        if (!cropBox.isNull()) {
            pdf_dict_put_rect(ctx, page, PDF_NAME(CropBox),
                              fz_make_rect(static_cast<float>(cropBox.left()),
                                           static_cast<float>(cropBox.top()),
                                           static_cast<float>(cropBox.right()),
                                           static_cast<float>(cropBox.bottom())));
        }
        pdf_insert_page(ctx, doc, -1, page);
        pdf_save_document(ctx, doc, pathUtf8.constData(), nullptr);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, page);
        pdf_drop_obj(ctx, resources);
        fz_drop_buffer(ctx, buf);
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        qDebug() << "PdfTestFixtures: could not write" << path << "-" << fz_caught_message(ctx);
        ok = false;
    }

    fz_drop_context(ctx);
    return ok;
}

/**
 * @brief Solid-color image of the given pixel size, encoded by Qt.
 * @param format Any format Qt can write ("PNG", "XPM", "BMP"...).
 */
inline QByteArray solidImage(int width, int height, const QColor& color, const char* format)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(color);

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, format)) {
        return QByteArray();
    }
    return bytes;
}

/**
 * @brief Solid-color PNG of the given pixel size.
 */
inline QByteArray solidPng(int width, int height, const QColor& color = QColor(255, 0, 0))
{
    return solidImage(width, height, color, "PNG");
}

} // namespace PdfTestFixtures
