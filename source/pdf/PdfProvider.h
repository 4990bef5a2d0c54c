#pragma once

// ============================================================================
// PdfProvider - Abstract interface for reading PDF files
// ============================================================================
// Keeps backend types (MuPDF) out of the rest of the application. Everything
// that reads an existing PDF (import, previews, verification in tests) goes
// through this interface.
//
// Design: Uses simple Qt types instead of passing backend-specific types.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document reading.
 *
 * Implemented by MuPdfProvider.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Total number of pages, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Path this provider was opened from.
     */
    virtual QString filePath() const = 0;

    /**
     * @brief Backend error message if opening failed (empty otherwise).
     */
    virtual QString errorMessage() const = 0;

    // ===== Page Info =====

    /**
     * @brief Size of a page in points (1/72 inch), with /Rotate applied.
     * @return Page size, or empty QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    /**
     * @brief /Rotate of a page, normalized to 0, 90, 180 or 270.
     */
    virtual int pageRotation(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch (72 = one pixel per point).
     * @return Rendered image, or null QImage on error.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Text =====

    /**
     * @brief Plain text of a page in reading order.
     * @return Extracted text, empty on error.
     */
    virtual QString pageText(int pageIndex) const = 0;

    // ===== Factory =====

    /**
     * @brief Open a PDF file.
     * @param pdfPath Path to the PDF file.
     * @param errorMessage Receives the backend error if opening fails.
     * @return Provider instance, or nullptr on failure.
     */
    static std::unique_ptr<PdfProvider> open(const QString& pdfPath,
                                             QString* errorMessage = nullptr);
};
