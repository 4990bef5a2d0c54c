// ============================================================================
// MuPdfExporter - PDF Export Engine using MuPDF
// ============================================================================

#include "MuPdfExporter.h"

#include "../core/Document.h"
#include "../core/Page.h"
#include "../objects/ImageElement.h"
#include "../objects/TextElement.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStringList>

#include <cstdio>

// Forward declarations for static helper functions defined later in this file
static int getSourcePageRotation(fz_context* ctx, pdf_document* srcPdf, int pageIndex);
static fz_rect getSourcePageBBox(fz_context* ctx, pdf_document* srcPdf, int pageIndex);
static void appendSourceForm(fz_context* ctx, fz_buffer* buf, int rotation, fz_rect bbox);
static bool addImageToPage(fz_context* ctx, pdf_document* outputDoc,
                           const ImageElement& image, fz_buffer* contentBuf,
                           pdf_obj* xobjects, int imageIndex, float pageHeightPt);
static void addTextToPage(fz_context* ctx, fz_font* font, const TextElement& text,
                          fz_buffer* contentBuf, float pageHeightPt);

/// Resource name of the embedded source page
static const char* const SOURCE_FORM_NAME = "SrcForm";
/// Resource name of the text font
static const char* const TEXT_FONT_NAME = "Helv";

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfExporter::MuPdfExporter(QObject* parent)
    : QObject(parent)
{
}

MuPdfExporter::~MuPdfExporter()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

void MuPdfExporter::setDocument(const Document* document)
{
    m_document = document;
}

PdfExportResult MuPdfExporter::exportPdf(const PdfExportOptions& options)
{
    PdfExportResult result;

    auto fail = [&](const QString& message) {
        result.success = false;
        result.errorMessage = message;
        cleanup();
        qWarning() << "[MuPdfExporter] Export failed:" << message;
        return result;
    };

    if (!m_document) {
        return fail(tr("No document set for export"));
    }
    if (options.outputPath.isEmpty()) {
        return fail(tr("No output path specified"));
    }
    if (m_document->pageCount() == 0) {
        return fail(tr("The document has no pages"));
    }
    if (writesOverSource(options.outputPath)) {
        return fail(tr("Cannot export over the source PDF: %1").arg(options.outputPath));
    }

    qDebug() << "[MuPdfExporter] Starting export:" << m_document->pageCount()
             << "pages to" << options.outputPath;

    if (!initContext()) {
        return fail(tr("Failed to initialize PDF engine"));
    }

    QString sourceError;
    if (!openSourcePdf(sourceError)) {
        return fail(sourceError);
    }

    int total = m_document->pageCount();
    for (int i = 0; i < total; ++i) {
        const Page* page = m_document->page(i);
        bool pageSuccess = false;
        if (!page) {
            qWarning() << "[MuPdfExporter] Failed to get page" << i;
        } else if (page->hasSource() && !page->hasVisibleElements()) {
            // Nothing drawn on top: copy the source page as is
            pageSuccess = graftPage(*page);
        } else {
            pageSuccess = renderPage(*page, i);
        }

        if (!pageSuccess) {
            return fail(tr("Failed to export page %1").arg(i + 1));
        }
        result.pagesExported++;
    }

    if (!writeMetadata(options.producer)) {
        qWarning() << "[MuPdfExporter] Failed to write metadata (non-fatal)";
    }

    QString saveError;
    if (!saveDocument(options.outputPath, options.compress, saveError)) {
        return fail(saveError);
    }

    cleanup();
    result.fileSizeBytes = QFile(options.outputPath).size();
    result.success = true;

    qDebug() << "[MuPdfExporter] Export complete:"
             << result.pagesExported << "pages,"
             << (result.fileSizeBytes / 1024) << "KB";

    return result;
}

QImage MuPdfExporter::applyOpacity(const QImage& image, qreal opacity)
{
    QImage out = image.convertToFormat(QImage::Format_ARGB32);
    const qreal factor = qBound(0.0, opacity, 1.0);

    for (int y = 0; y < out.height(); ++y) {
        QRgb* line = reinterpret_cast<QRgb*>(out.scanLine(y));
        for (int x = 0; x < out.width(); ++x) {
            const QRgb p = line[x];
            line[x] = qRgba(qRed(p), qGreen(p), qBlue(p),
                            static_cast<int>(qAlpha(p) * factor));
        }
    }
    return out;
}

QByteArray MuPdfExporter::imageDataForExport(const ImageElement& image)
{
    if (image.opacity >= OPAQUE_THRESHOLD) {
        return image.imageBytes;
    }
    return pngDataForExport(image);
}

QByteArray MuPdfExporter::pngDataForExport(const ImageElement& image)
{
    const QImage& decoded = image.image();
    if (decoded.isNull()) {
        return QByteArray();
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)
        || !applyOpacity(decoded, image.opacity).save(&buffer, "PNG")) {
        qWarning() << "[MuPdfExporter] Failed to encode image" << image.id;
        return QByteArray();
    }
    return bytes;
}

bool MuPdfExporter::writesOverSource(const QString& outputPath) const
{
    if (!m_document || m_document->sourcePath().isEmpty()) {
        return false;
    }
    // Empty when the file does not exist yet, which can never be the source
    const QString target = QFileInfo(outputPath).canonicalFilePath();
    return !target.isEmpty()
        && target == QFileInfo(m_document->sourcePath()).canonicalFilePath();
}

// ============================================================================
// Initialization
// ============================================================================

bool MuPdfExporter::initContext()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create MuPDF context";
        return false;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create output PDF:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    return true;
}

void MuPdfExporter::cleanup()
{
    if (!m_ctx) {
        return;
    }

    // Graft map first (it references both documents)
    if (m_graftMap) {
        pdf_drop_graft_map(m_ctx, m_graftMap);
        m_graftMap = nullptr;
    }

    if (m_helveticaRef) {
        pdf_drop_obj(m_ctx, m_helveticaRef);
        m_helveticaRef = nullptr;
    }
    if (m_helvetica) {
        fz_drop_font(m_ctx, m_helvetica);
        m_helvetica = nullptr;
    }

    // m_sourcePdf and m_sourceDoc point to the same document
    if (m_sourceDoc) {
        fz_drop_document(m_ctx, m_sourceDoc);
        m_sourceDoc = nullptr;
        m_sourcePdf = nullptr;
    }

    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }

    fz_drop_context(m_ctx);
    m_ctx = nullptr;
}

bool MuPdfExporter::openSourcePdf(QString& error)
{
    bool needsSource = false;
    for (int i = 0; i < m_document->pageCount(); ++i) {
        if (m_document->page(i)->hasSource()) {
            needsSource = true;
            break;
        }
    }
    if (!needsSource) {
        qDebug() << "[MuPdfExporter] No source pages (blank document)";
        return true;
    }

    QString pdfPath = m_document->sourcePath();
    if (pdfPath.isEmpty() || !QFile::exists(pdfPath)) {
        error = tr("Source PDF not found: %1").arg(pdfPath);
        return false;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    bool isPdf = true;
    int sourcePages = 0;

    fz_var(isPdf);
    fz_var(sourcePages);

    fz_try(m_ctx) {
        m_sourceDoc = fz_open_document(m_ctx, pathUtf8.constData());
        m_sourcePdf = pdf_document_from_fz_document(m_ctx, m_sourceDoc);
        if (m_sourcePdf) {
            m_graftMap = pdf_new_graft_map(m_ctx, m_outputDoc);
            sourcePages = pdf_count_pages(m_ctx, m_sourcePdf);
        } else {
            isPdf = false;
        }
    }
    fz_catch(m_ctx) {
        error = tr("Failed to open source PDF: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        return false;
    }

    if (!isPdf) {
        error = tr("Source is not a PDF document: %1").arg(pdfPath);
        return false;
    }

    for (int i = 0; i < m_document->pageCount(); ++i) {
        int index = m_document->page(i)->sourceIndex;
        if (index >= sourcePages) {
            error = tr("Page %1 refers to source page %2, but the source has %3 pages")
                        .arg(i + 1).arg(index + 1).arg(sourcePages);
            return false;
        }
    }

    qDebug() << "[MuPdfExporter] Opened source PDF:" << pdfPath << "with" << sourcePages << "pages";
    return true;
}

// ============================================================================
// Page Processing
// ============================================================================

bool MuPdfExporter::graftPage(const Page& page)
{
    if (!m_sourcePdf || !m_outputDoc || !m_ctx) {
        return false;
    }

    fz_try(m_ctx) {
        // Copies the page object and its resources; the graft map avoids
        // duplicating resources shared between pages
        pdf_graft_mapped_page(m_ctx, m_graftMap, -1, m_sourcePdf, page.sourceIndex);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to graft source page" << page.sourceIndex
                   << ":" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

bool MuPdfExporter::renderPage(const Page& page, int pageIndex)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    const float widthPt = static_cast<float>(page.size.width());
    const float heightPt = static_cast<float>(page.size.height());

    pdf_obj* sourceForm = nullptr;
    int srcRotation = 0;
    fz_rect srcBBox = fz_empty_rect;
    if (page.hasSource()) {
        sourceForm = importPageAsXObject(page.sourceIndex);
        if (!sourceForm) {
            return false;
        }
        srcRotation = getSourcePageRotation(m_ctx, m_sourcePdf, page.sourceIndex);
        srcBBox = getSourcePageBBox(m_ctx, m_sourcePdf, page.sourceIndex);
    }

    bool hasText = false;
    for (const auto& element : page.elements) {
        if (element->visible && element->kind() == PageElement::Kind::Text) {
            hasText = true;
            break;
        }
    }
    pdf_obj* font = hasText ? helveticaResource() : nullptr;
    if (hasText && !font) {
        pdf_drop_obj(m_ctx, sourceForm);
        return false;
    }

    fz_buffer* content = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* pageObj = nullptr;
    int imageIndex = 0;

    fz_var(content);
    fz_var(resources);
    fz_var(pageObj);

    fz_try(m_ctx) {
        content = fz_new_buffer(m_ctx, 1024);
        resources = pdf_new_dict(m_ctx, m_outputDoc, 4);
        pdf_obj* xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 4);

        if (sourceForm) {
            pdf_dict_puts(m_ctx, xobjects, SOURCE_FORM_NAME, sourceForm);
            appendSourceForm(m_ctx, content, srcRotation, srcBBox);
        }

        if (font) {
            pdf_obj* fonts = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(Font), 1);
            pdf_dict_puts(m_ctx, fonts, TEXT_FONT_NAME, font);
        }

        // Bottom to top; hidden elements are never written
        for (const auto& element : page.elements) {
            if (!element->visible) {
                continue;
            }
            switch (element->kind()) {
                case PageElement::Kind::Image:
                    if (!addImageToPage(m_ctx, m_outputDoc, static_cast<const ImageElement&>(*element),
                                        content, xobjects, imageIndex++, heightPt)) {
                        fz_throw(m_ctx, FZ_ERROR_GENERIC, "cannot embed image %s",
                                 element->id.toUtf8().constData());
                    }
                    break;
                case PageElement::Kind::Text:
                    addTextToPage(m_ctx, m_helvetica, static_cast<const TextElement&>(*element),
                                  content, heightPt);
                    break;
            }
        }

        fz_rect mediabox = fz_make_rect(0, 0, widthPt, heightPt);
        pageObj = pdf_add_page(m_ctx, m_outputDoc, mediabox, 0, resources, content);
        pdf_insert_page(m_ctx, m_outputDoc, -1, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, sourceForm);
        fz_drop_buffer(m_ctx, content);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create page" << pageIndex
                   << ":" << fz_caught_message(m_ctx);
        return false;
    }

    qDebug() << "[MuPdfExporter] Rendered page" << pageIndex
             << (page.hasSource() ? "(source page" : "(blank") << page.sourceIndex << "+"
             << page.elementCount() << "elements)";
    return true;
}

// ============================================================================
// Source Page Embedding
// ============================================================================

/**
 * @brief Get the rotation of a source PDF page.
 * @return Rotation in degrees (0, 90, 180, or 270), normalized
 */
static int getSourcePageRotation(fz_context* ctx, pdf_document* srcPdf, int pageIndex)
{
    int rotation = 0;

    fz_var(rotation);

    fz_try(ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, srcPdf, pageIndex);
        pdf_obj* rotateObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(Rotate));
        if (rotateObj) {
            rotation = ((pdf_to_int(ctx, rotateObj) % 360) + 360) % 360;
        }
    }
    fz_catch(ctx) {
        rotation = 0;
    }

    if (rotation != 0 && rotation != 90 && rotation != 180 && rotation != 270) {
        rotation = 0;
    }
    return rotation;
}

/**
 * @brief Get the visible box of a source PDF page (CropBox, else MediaBox).
 */
static fz_rect getSourcePageBBox(fz_context* ctx, pdf_document* srcPdf, int pageIndex)
{
    fz_rect bbox = fz_empty_rect;

    fz_var(bbox);

    fz_try(ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, srcPdf, pageIndex);
        pdf_obj* boxObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(CropBox));
        if (!boxObj) {
            boxObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(MediaBox));
        }
        if (boxObj) {
            bbox = pdf_to_rect(ctx, boxObj);
        }
    }
    fz_catch(ctx) {
        bbox = fz_empty_rect;
    }

    return bbox;
}

/**
 * @brief Draw the source form over the whole output page.
 *
 * The form content is stored unrotated; the page's /Rotate (clockwise, as
 * viewers display it) is applied here.
 *
 * PDF matrix [a b c d e f]: x' = ax + cy + e, y' = bx + dy + f
 *   90:  [0 -1 1 0 0 w]   (x, y) -> (y, w - x)
 *   180: [-1 0 0 -1 w h]  (x, y) -> (w - x, h - y)
 *   270: [0 1 -1 0 h 0]   (x, y) -> (h - y, x)
 */
static void appendSourceForm(fz_context* ctx, fz_buffer* buf, int rotation, fz_rect bbox)
{
    const float bboxW = bbox.x1 - bbox.x0;
    const float bboxH = bbox.y1 - bbox.y0;
    char cmd[128];

    fz_append_string(ctx, buf, "q\n");

    switch (rotation) {
        case 90:
            snprintf(cmd, sizeof(cmd), "0 -1 1 0 0 %.4f cm\n", bboxW);
            fz_append_string(ctx, buf, cmd);
            break;
        case 180:
            snprintf(cmd, sizeof(cmd), "-1 0 0 -1 %.4f %.4f cm\n", bboxW, bboxH);
            fz_append_string(ctx, buf, cmd);
            break;
        case 270:
            snprintf(cmd, sizeof(cmd), "0 1 -1 0 %.4f 0 cm\n", bboxH);
            fz_append_string(ctx, buf, cmd);
            break;
        default:
            break;
    }

    // CropBox that does not start at the origin
    if (bbox.x0 != 0 || bbox.y0 != 0) {
        snprintf(cmd, sizeof(cmd), "1 0 0 1 %.4f %.4f cm\n", -bbox.x0, -bbox.y0);
        fz_append_string(ctx, buf, cmd);
    }

    snprintf(cmd, sizeof(cmd), "/%s Do\nQ\n", SOURCE_FORM_NAME);
    fz_append_string(ctx, buf, cmd);
}

pdf_obj* MuPdfExporter::importPageAsXObject(int sourcePageIndex)
{
    if (!m_sourcePdf || !m_outputDoc || !m_ctx) {
        qWarning() << "[MuPdfExporter] importPageAsXObject: No source PDF or output document";
        return nullptr;
    }

    pdf_obj* xobj = nullptr;
    pdf_obj* resources = nullptr;
    fz_buffer* contentBuf = nullptr;

    fz_var(xobj);
    fz_var(resources);
    fz_var(contentBuf);

    fz_try(m_ctx) {
        pdf_obj* srcPageObj = pdf_lookup_page_obj(m_ctx, m_sourcePdf, sourcePageIndex);

        pdf_obj* mediaBox = pdf_dict_get_inheritable(m_ctx, srcPageObj, PDF_NAME(MediaBox));
        if (!mediaBox) {
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "Source page has no MediaBox");
        }
        pdf_obj* cropBox = pdf_dict_get_inheritable(m_ctx, srcPageObj, PDF_NAME(CropBox));
        fz_rect bbox = pdf_to_rect(m_ctx, cropBox ? cropBox : mediaBox);

        // Fonts, images and color spaces are copied once through the graft map
        pdf_obj* srcResources = pdf_dict_get_inheritable(m_ctx, srcPageObj, PDF_NAME(Resources));
        if (srcResources) {
            resources = pdf_graft_mapped_object(m_ctx, m_graftMap, srcResources);
        }

        // Contents can be a single stream or an array of streams
        pdf_obj* srcContents = pdf_dict_get(m_ctx, srcPageObj, PDF_NAME(Contents));
        if (pdf_is_array(m_ctx, srcContents)) {
            contentBuf = fz_new_buffer(m_ctx, 1024);
            int numStreams = pdf_array_len(m_ctx, srcContents);
            for (int i = 0; i < numStreams; ++i) {
                fz_buffer* streamBuf = pdf_load_stream(m_ctx, pdf_array_get(m_ctx, srcContents, i));
                if (i > 0) {
                    fz_append_byte(m_ctx, contentBuf, ' ');
                }
                fz_append_buffer(m_ctx, contentBuf, streamBuf);
                fz_drop_buffer(m_ctx, streamBuf);
            }
        } else if (srcContents) {
            contentBuf = pdf_load_stream(m_ctx, srcContents);
        } else {
            contentBuf = fz_new_buffer(m_ctx, 1);
        }

        xobj = pdf_new_xobject(m_ctx, m_outputDoc, bbox, fz_identity, resources, contentBuf);
    }
    fz_always(m_ctx) {
        fz_drop_buffer(m_ctx, contentBuf);
        pdf_drop_obj(m_ctx, resources);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] importPageAsXObject failed:" << fz_caught_message(m_ctx);
        return nullptr;
    }

    return xobj;
}

// ============================================================================
// Images
// ============================================================================

/**
 * @brief Decode encoded image bytes with MuPDF.
 * @return New image reference, or nullptr if MuPDF does not read the format.
 */
static fz_image* decodeImage(fz_context* ctx, const QByteArray& data)
{
    fz_buffer* buf = nullptr;
    fz_image* img = nullptr;

    fz_var(buf);
    fz_var(img);

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx,
            reinterpret_cast<const unsigned char*>(data.constData()),
            static_cast<size_t>(data.size()));
        img = fz_new_image_from_buffer(ctx, buf);
    }
    fz_always(ctx) {
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        img = nullptr;
    }
    return img;
}

static bool addImageToPage(fz_context* ctx, pdf_document* outputDoc,
                           const ImageElement& image, fz_buffer* contentBuf,
                           pdf_obj* xobjects, int imageIndex, float pageHeightPt)
{
    const float widthPt = static_cast<float>(image.rect.width());
    const float heightPt = static_cast<float>(image.rect.height());
    if (image.imageBytes.isEmpty() || widthPt <= 0 || heightPt <= 0) {
        return true;
    }

    QByteArray data = MuPdfExporter::imageDataForExport(image);
    if (data.isEmpty()) {
        qWarning() << "[MuPdfExporter] Could not decode image" << image.id;
        return false;
    }

    fz_image* fzImage = decodeImage(ctx, data);
    if (!fzImage && image.opacity >= MuPdfExporter::OPAQUE_THRESHOLD) {
        // Formats only Qt reads (XPM, ICO, WebP...) go in as PNG
        qDebug() << "[MuPdfExporter] Re-encoding image" << image.id << "as PNG";
        data = MuPdfExporter::pngDataForExport(image);
        if (!data.isEmpty()) {
            fzImage = decodeImage(ctx, data);
        }
    }
    if (!fzImage) {
        qWarning() << "[MuPdfExporter] MuPDF cannot read image" << image.id;
        return false;
    }

    pdf_obj* imgRef = nullptr;
    bool ok = true;

    fz_var(imgRef);

    fz_try(ctx) {
        imgRef = pdf_add_image(ctx, outputDoc, fzImage);

        char imgName[16];
        snprintf(imgName, sizeof(imgName), "Img%d", imageIndex);
        pdf_dict_puts(ctx, xobjects, imgName, imgRef);

        // Image XObjects are 1x1 units; PDF origin is bottom-left
        const float posX = static_cast<float>(image.rect.x());
        const float pdfY = pageHeightPt - static_cast<float>(image.rect.y()) - heightPt;

        char cmd[160];
        snprintf(cmd, sizeof(cmd), "q\n%.4f 0 0 %.4f %.4f %.4f cm\n/%s Do\nQ\n",
                 widthPt, heightPt, posX, pdfY, imgName);
        fz_append_string(ctx, contentBuf, cmd);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, imgRef);
        fz_drop_image(ctx, fzImage);
    }
    fz_catch(ctx) {
        qWarning() << "[MuPdfExporter] Failed to add image" << image.id << ":" << fz_caught_message(ctx);
        ok = false;
    }

    return ok;
}

// ============================================================================
// Text
// ============================================================================

pdf_obj* MuPdfExporter::helveticaResource()
{
    if (m_helveticaRef) {
        return m_helveticaRef;
    }

    fz_try(m_ctx) {
        m_helvetica = fz_new_base14_font(m_ctx, "Helvetica");
        m_helveticaRef = pdf_add_simple_font(m_ctx, m_outputDoc, m_helvetica,
                                             PDF_SIMPLE_ENCODING_LATIN);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to load Helvetica:" << fz_caught_message(m_ctx);
        m_helveticaRef = nullptr;
    }
    return m_helveticaRef;
}

static float textWidth(fz_context* ctx, fz_font* font, const QString& text, float fontSize)
{
    float width = 0.0f;
    const QVector<uint> codepoints = text.toUcs4();
    for (uint cp : codepoints) {
        int glyph = fz_encode_character(ctx, font, static_cast<int>(cp));
        width += fz_advance_glyph(ctx, font, glyph, 0);
    }
    return width * fontSize;
}

/**
 * @brief Greedy word wrap. Words wider than the box are broken by character.
 */
static QStringList wrapText(fz_context* ctx, fz_font* font, const QString& text,
                            float fontSize, float maxWidth)
{
    QStringList lines;
    const QStringList paragraphs = text.split(QLatin1Char('\n'));

    for (const QString& paragraph : paragraphs) {
        const QStringList words = paragraph.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        QString line;

        for (QString word : words) {
            QString candidate = line.isEmpty() ? word : line + QLatin1Char(' ') + word;
            if (textWidth(ctx, font, candidate, fontSize) <= maxWidth) {
                line = candidate;
                continue;
            }
            if (!line.isEmpty()) {
                lines.append(line);
                line.clear();
            }
            while (textWidth(ctx, font, word, fontSize) > maxWidth && word.length() > 1) {
                int fit = 1;
                while (fit < word.length()
                       && textWidth(ctx, font, word.left(fit + 1), fontSize) <= maxWidth) {
                    ++fit;
                }
                lines.append(word.left(fit));
                word = word.mid(fit);
            }
            line = word;
        }
        lines.append(line);
    }
    return lines;
}

/**
 * @brief Encode as WinAnsi and escape for a PDF literal string.
 */
static QByteArray pdfLiteral(const QString& text)
{
    QByteArray out;
    const QVector<uint> codepoints = text.toUcs4();
    for (uint cp : codepoints) {
        int byte = fz_windows_1252_from_unicode(static_cast<int>(cp));
        if (byte < 0) {
            byte = '?';
        }
        if (byte == '(' || byte == ')' || byte == '\\') {
            out.append('\\');
            out.append(static_cast<char>(byte));
        } else if (byte < 32 || byte > 126) {
            char oct[8];
            snprintf(oct, sizeof(oct), "\\%03o", byte & 0xFF);
            out.append(oct);
        } else {
            out.append(static_cast<char>(byte));
        }
    }
    return out;
}

static void addTextToPage(fz_context* ctx, fz_font* font, const TextElement& text,
                          fz_buffer* contentBuf, float pageHeightPt)
{
    if (text.text.isEmpty()) {
        return;
    }

    const float fontSize = static_cast<float>(text.fontSize);
    const float ascent = fz_font_ascender(ctx, font) * fontSize;
    const float lineHeight = (fz_font_ascender(ctx, font) - fz_font_descender(ctx, font)) * fontSize;
    const float left = static_cast<float>(text.rect.x());
    const float top = static_cast<float>(text.rect.y());
    const float bottom = static_cast<float>(text.rect.bottom());

    const QStringList lines = wrapText(ctx, font, text.text, fontSize,
                                       static_cast<float>(text.rect.width()));
    const QColor color = text.rgbColor();

    char cmd[160];
    fz_append_string(ctx, contentBuf, "BT\n");
    snprintf(cmd, sizeof(cmd), "/%s %.4f Tf\n%.4f %.4f %.4f rg\n", TEXT_FONT_NAME, fontSize,
             color.redF(), color.greenF(), color.blueF());
    fz_append_string(ctx, contentBuf, cmd);

    for (int i = 0; i < lines.size(); ++i) {
        // Lines that would spill below the box are dropped
        if (top + (i + 1) * lineHeight > bottom + 0.01f) {
            break;
        }
        if (lines[i].isEmpty()) {
            continue;
        }
        const float baseline = pageHeightPt - (top + ascent + i * lineHeight);
        snprintf(cmd, sizeof(cmd), "1 0 0 1 %.4f %.4f Tm\n", left, baseline);
        fz_append_string(ctx, contentBuf, cmd);
        fz_append_byte(ctx, contentBuf, '(');
        QByteArray literal = pdfLiteral(lines[i]);
        fz_append_data(ctx, contentBuf, literal.constData(), static_cast<size_t>(literal.size()));
        fz_append_string(ctx, contentBuf, ") Tj\n");
    }

    fz_append_string(ctx, contentBuf, "ET\n");
}

// ============================================================================
// Metadata
// ============================================================================

bool MuPdfExporter::writeMetadata(const QString& producer)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    QByteArray producerUtf8 = producer.toUtf8();
    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_outputDoc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_dict_put_dict(m_ctx, trailer, PDF_NAME(Info), 4);
        }
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Producer), producerUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to write metadata:" << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

// ============================================================================
// Finalization
// ============================================================================

bool MuPdfExporter::saveDocument(const QString& outputPath, bool compress, QString& error)
{
    if (!m_outputDoc || !m_ctx) {
        error = tr("No PDF to save");
        return false;
    }

    fz_buffer* buf = nullptr;
    fz_output* out = nullptr;
    QByteArray bytes;

    fz_var(buf);
    fz_var(out);

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = compress ? 1 : 0;
        opts.do_compress_images = compress ? 1 : 0;
        opts.do_compress_fonts = compress ? 1 : 0;

        buf = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, buf);
        pdf_write_document(m_ctx, m_outputDoc, out, &opts);
        fz_close_output(m_ctx, out);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(m_ctx, buf, &data);
        bytes = QByteArray(reinterpret_cast<const char*>(data), static_cast<qsizetype>(len));
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, out);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx) {
        error = tr("Failed to write PDF: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        return false;
    }

    // Nothing appears at outputPath unless the whole file was written
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        error = tr("Cannot write %1: %2").arg(outputPath, file.errorString());
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        error = tr("Cannot write %1: %2").arg(outputPath, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        error = tr("Cannot write %1: %2").arg(outputPath, file.errorString());
        return false;
    }

    qDebug() << "[MuPdfExporter] Saved to" << outputPath << "(" << bytes.size() << "bytes)";
    return true;
}
