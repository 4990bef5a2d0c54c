// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        m_error = QStringLiteral("Failed to create MuPDF context");
        qWarning() << "[MuPdfProvider]" << m_error;
        return;
    }

    // Register document handlers
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        m_error = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[MuPdfProvider] Failed to register document handlers:" << m_error;
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    bool isPdf = false;
    fz_var(isPdf);
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
        isPdf = pdf_document_from_fz_document(m_ctx, m_doc) != nullptr;
    }
    fz_catch(m_ctx) {
        m_error = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[MuPdfProvider] Failed to open" << pdfPath << "-" << m_error;
        m_doc = nullptr;
        return;
    }

    // MuPDF also opens images, XPS, EPUB and CBZ; only PDF can be exported
    if (!isPdf) {
        m_error = QStringLiteral("Not a PDF document");
        qWarning() << "[MuPdfProvider]" << pdfPath << "is not a PDF";
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
        return;
    }

    if (isLocked()) {
        m_error = QStringLiteral("Document requires a password");
        qWarning() << "[MuPdfProvider]" << pdfPath << "is password protected";
        return;
    }

    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        m_error = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[MuPdfProvider] Failed to get page count:" << m_error;
        m_pageCount = 0;
    }

    qDebug() << "[MuPdfProvider] Loaded" << pdfPath << "with" << m_pageCount << "pages";
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

bool MuPdfProvider::isLocked() const
{
    if (!m_doc) return false;
    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QString MuPdfProvider::filePath() const
{
    return m_path;
}

// ============================================================================
// Page Info
// ============================================================================

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_rect bounds = fz_empty_rect;
    fz_page* page = nullptr;

    fz_var(bounds);
    fz_var(page);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to bound page" << pageIndex;
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

int MuPdfProvider::pageRotation(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return 0;
    }

    int rotation = 0;
    fz_var(rotation);
    fz_try(m_ctx) {
        pdf_document* pdf = pdf_document_from_fz_document(m_ctx, m_doc);
        if (pdf) {
            pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, pdf, pageIndex);
            pdf_obj* rotateObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Rotate));
            if (rotateObj) {
                rotation = ((pdf_to_int(m_ctx, rotateObj) % 360) + 360) % 360;
            }
        }
    }
    fz_catch(m_ctx) {
        rotation = 0;
    }

    // Only multiples of 90 are meaningful
    if (rotation % 90 != 0) {
        rotation = 0;
    }
    return rotation;
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QImage();
    }

    // PDF points are 72 dpi
    float scale = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    QImage result;

    fz_var(page);
    fz_var(pix);
    fz_var(dev);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_matrix ctm = fz_scale(scale, scale);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, ctm));

        // BGRA for Qt compatibility
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_bgr(m_ctx), bbox, nullptr, 1);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        dev = fz_new_draw_device(m_ctx, ctm, pix);
        fz_run_page(m_ctx, page, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = fz_pixmap_stride(m_ctx, pix);
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        // Copy data to QImage (MuPDF pixmap will be freed)
        result = QImage(width, height, QImage::Format_ARGB32);
        for (int y = 0; y < height; ++y) {
            memcpy(result.scanLine(y), samples + y * stride, static_cast<size_t>(width) * 4);
        }
    }
    fz_always(m_ctx) {
        if (dev) fz_drop_device(m_ctx, dev);
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Render failed for page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}

// ============================================================================
// Text
// ============================================================================

QString MuPdfProvider::pageText(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QString();
    }

    fz_page* page = nullptr;
    fz_stext_page* textPage = nullptr;
    fz_buffer* buf = nullptr;
    QString text;

    fz_var(page);
    fz_var(textPage);
    fz_var(buf);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        textPage = fz_new_stext_page_from_page(m_ctx, page, nullptr);
        buf = fz_new_buffer_from_stext_page(m_ctx, textPage);
        text = QString::fromUtf8(fz_string_from_buffer(m_ctx, buf));
    }
    fz_always(m_ctx) {
        if (buf) fz_drop_buffer(m_ctx, buf);
        if (textPage) fz_drop_stext_page(m_ctx, textPage);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Text extraction failed for page" << pageIndex;
        return QString();
    }

    return text;
}
