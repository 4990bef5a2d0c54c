// ============================================================================
// PdfProviderFactory - PDF provider creation
// ============================================================================
// MuPDF is the only backend; opening is done here so callers never include
// backend headers.
// ============================================================================

#include "PdfProvider.h"
#include "MuPdfProvider.h"

#include <QCoreApplication>
#include <QFileInfo>

std::unique_ptr<PdfProvider> PdfProvider::open(const QString& pdfPath, QString* errorMessage)
{
    auto setError = [errorMessage](const QString& message) {
        if (errorMessage) {
            *errorMessage = message;
        }
    };

    if (!QFileInfo::exists(pdfPath)) {
        setError(QCoreApplication::translate("PdfProvider", "File not found: %1").arg(pdfPath));
        return nullptr;
    }

    auto provider = std::make_unique<MuPdfProvider>(pdfPath);
    if (provider->isLocked()) {
        setError(QCoreApplication::translate("PdfProvider",
                                             "The PDF is password protected: %1").arg(pdfPath));
        return nullptr;
    }
    if (!provider->isValid()) {
        QString reason = provider->errorMessage();
        if (reason.isEmpty()) {
            reason = QCoreApplication::translate("PdfProvider", "The file contains no pages");
        }
        setError(reason);
        return nullptr;
    }
    return provider;
}
