#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "PdfProvider.h"

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_document;

/**
 * @brief PdfProvider implementation using MuPDF.
 *
 * Owns one MuPDF context and one open document for its whole lifetime.
 */
class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Open the given PDF file.
     *
     * Check isValid() after construction; errorMessage() holds the MuPDF
     * error if opening failed.
     */
    explicit MuPdfProvider(const QString& pdfPath);

    ~MuPdfProvider() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    // ===== Document Info =====
    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;
    QString filePath() const override;
    QString errorMessage() const override { return m_error; }

    // ===== Page Info =====
    QSizeF pageSize(int pageIndex) const override;
    int pageRotation(int pageIndex) const override;

    // ===== Rendering =====
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

    // ===== Text =====
    QString pageText(int pageIndex) const override;

private:
    fz_context* m_ctx = nullptr;        ///< MuPDF context (owns all allocations)
    fz_document* m_doc = nullptr;       ///< The loaded PDF document
    QString m_path;                     ///< Path to the PDF file
    QString m_error;                    ///< Error from opening, if any
    int m_pageCount = 0;                ///< Cached page count
};
