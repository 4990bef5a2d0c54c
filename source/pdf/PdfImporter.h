#pragma once

// ============================================================================
// PdfImporter - Turns a PDF file into an editable Document
// ============================================================================
// Every source page becomes one Page with the source's size and rotation and
// a raster preview rendered at 72 DPI, so one preview pixel is one page point
// and overlay coordinates line up with the preview without scaling.
// ============================================================================

#include "../core/Document.h"

#include <QByteArray>
#include <QCoreApplication>
#include <QString>
#include <QVector>
#include <memory>

/**
 * @brief Rendered preview of one page.
 */
struct PagePreview {
    QString pageUid;        ///< Page this preview belongs to
    QByteArray pngBytes;    ///< PNG-encoded raster (one pixel per point)
};

/**
 * @brief Result of an import.
 *
 * On failure document is null and previews is empty.
 */
struct PdfImportResult {
    bool success = false;
    QString errorMessage;
    std::unique_ptr<Document> document;
    QVector<PagePreview> previews;      ///< Same order as the document's pages
};

class PdfImporter {
    Q_DECLARE_TR_FUNCTIONS(PdfImporter)

public:
    /// Render resolution for previews: one pixel per point.
    static constexpr qreal PREVIEW_DPI = 72.0;

    /**
     * @brief Load a PDF file.
     * @param pdfPath Path of the file to open.
     * @return Result with the new document and its previews, or an error.
     */
    static PdfImportResult import(const QString& pdfPath);

    /**
     * @brief Encode an image as PNG.
     * @return PNG bytes, empty on failure.
     */
    static QByteArray encodePng(const QImage& image);
};
