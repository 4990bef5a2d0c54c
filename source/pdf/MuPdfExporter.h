#pragma once

// ============================================================================
// MuPdfExporter - PDF Export Engine using MuPDF
// ============================================================================
// Writes a Document to a new PDF file:
// - Source pages are embedded as Form XObjects (vector quality preserved)
// - Source pages without visible elements are grafted unchanged
// - Image elements are embedded from their original bytes (re-encoded as
//   PNG when opacity has to be baked into the alpha channel, or when MuPDF
//   cannot read the original format)
// - The source PDF is never overwritten
// - Text elements are laid out as word-wrapped Helvetica text boxes
//
// The PDF is produced in memory and committed with QSaveFile, so a failed
// export never leaves a partial file at the target path.
// ============================================================================

#include <QObject>
#include <QString>
#include <QImage>
#include <QByteArray>

class Document;
class Page;
class ImageElement;
class TextElement;

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
// Note: fz_buffer cannot be forward declared (it's a typedef in MuPDF)
struct fz_context;
struct fz_document;
struct fz_font;
struct pdf_document;
struct pdf_obj;

/**
 * @brief Export options for PDF generation.
 */
struct PdfExportOptions {
    QString outputPath;                             ///< Path to output PDF file
    bool compress = true;                           ///< Compress streams, images and fonts
    QString producer = QStringLiteral("PdfOverlay"); ///< /Producer metadata entry
};

/**
 * @brief Result of a PDF export operation.
 */
struct PdfExportResult {
    bool success = false;
    QString errorMessage;
    int pagesExported = 0;
    qint64 fileSizeBytes = 0;
};

/**
 * @brief PDF Export Engine using MuPDF.
 *
 * Export never modifies the Document. Every MuPDF resource opened for an
 * export is released before exportPdf() returns, on success and on failure.
 *
 * Usage:
 * @code
 * MuPdfExporter exporter;
 * exporter.setDocument(document);
 *
 * PdfExportOptions options;
 * options.outputPath = "/path/to/output.pdf";
 *
 * PdfExportResult result = exporter.exportPdf(options);
 * if (!result.success) {
 *     qWarning() << "Export failed:" << result.errorMessage;
 * }
 * @endcode
 */
class MuPdfExporter : public QObject {
    Q_OBJECT

public:
    /// Opacity at or above this value is treated as fully opaque.
    static constexpr qreal OPAQUE_THRESHOLD = 0.999;

    explicit MuPdfExporter(QObject* parent = nullptr);
    ~MuPdfExporter() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfExporter(const MuPdfExporter&) = delete;
    MuPdfExporter& operator=(const MuPdfExporter&) = delete;

    /**
     * @brief Set the document to export.
     * @param document Must remain valid during export.
     */
    void setDocument(const Document* document);

    /**
     * @brief Export the document to PDF.
     * @return Result containing success status and any error message.
     *
     * Blocking.
     */
    PdfExportResult exportPdf(const PdfExportOptions& options);

    /**
     * @brief Multiply the alpha channel of an image by opacity.
     * @param image Source image (any format).
     * @param opacity 0.0 - 1.0.
     * @return ARGB32 image with scaled alpha.
     */
    static QImage applyOpacity(const QImage& image, qreal opacity);

    /**
     * @brief Bytes to embed for an image element.
     *
     * The original bytes when the element is opaque, otherwise a PNG with
     * the opacity multiplied into its alpha channel. Empty if the image
     * cannot be decoded.
     */
    static QByteArray imageDataForExport(const ImageElement& image);

    /**
     * @brief The decoded image as PNG, opacity multiplied into alpha.
     *
     * Used for translucent images and for formats MuPDF cannot read.
     */
    static QByteArray pngDataForExport(const ImageElement& image);

private:
    // ===== Initialization =====

    bool initContext();

    /**
     * @brief Release every MuPDF resource held by this exporter.
     */
    void cleanup();

    /**
     * @brief Open source PDF for embedding and grafting.
     * @return true if opened, or if no page needs a source.
     */
    bool openSourcePdf(QString& error);

    /**
     * @brief True if outputPath names the document's source file.
     */
    bool writesOverSource(const QString& outputPath) const;

    // ===== Page Processing =====

    /**
     * @brief Copy a source page unchanged.
     */
    bool graftPage(const Page& page);

    /**
     * @brief Build an output page: source XObject + visible elements.
     */
    bool renderPage(const Page& page, int pageIndex);

    /**
     * @brief Import a source PDF page as a Form XObject.
     * @return XObject reference, or nullptr on failure.
     */
    pdf_obj* importPageAsXObject(int sourcePageIndex);

    /**
     * @brief Helvetica font resource, created on first use.
     */
    pdf_obj* helveticaResource();

    // ===== Finalization =====

    bool writeMetadata(const QString& producer);

    /**
     * @brief Serialize to memory and commit atomically to outputPath.
     */
    bool saveDocument(const QString& outputPath, bool compress, QString& error);

private:
    const Document* m_document = nullptr;

    // MuPDF contexts (mutable because MuPDF modifies internal state on "read" ops)
    mutable fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;
    fz_document* m_sourceDoc = nullptr;
    pdf_document* m_sourcePdf = nullptr;

    // Graft map: shared resources (fonts, images) of the source are copied once
    struct pdf_graft_map* m_graftMap = nullptr;

    fz_font* m_helvetica = nullptr;         ///< Base-14 font used for metrics
    pdf_obj* m_helveticaRef = nullptr;      ///< Font resource in m_outputDoc
};
