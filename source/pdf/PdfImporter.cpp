// ============================================================================
// PdfImporter - Implementation
// ============================================================================

#include "PdfImporter.h"
#include "PdfProvider.h"

#include <QBuffer>
#include <QDebug>
#include <QImage>

PdfImportResult PdfImporter::import(const QString& pdfPath)
{
    PdfImportResult result;

    QString openError;
    std::unique_ptr<PdfProvider> provider = PdfProvider::open(pdfPath, &openError);
    if (!provider) {
        result.errorMessage = tr("Could not open %1: %2").arg(pdfPath, openError);
        qWarning() << "[PdfImporter]" << result.errorMessage;
        return result;
    }

    auto document = std::make_unique<Document>(pdfPath);
    QVector<PagePreview> previews;
    previews.reserve(provider->pageCount());

    for (int i = 0; i < provider->pageCount(); ++i) {
        QSizeF size = provider->pageSize(i);
        if (size.isEmpty()) {
            result.errorMessage = tr("Could not read the size of page %1").arg(i + 1);
            qWarning() << "[PdfImporter]" << result.errorMessage;
            return result;
        }

        Page* page = document->appendPage(Page::createForPdf(size, i, provider->pageRotation(i)));

        QImage rendered = provider->renderPageToImage(i, PREVIEW_DPI);
        if (rendered.isNull()) {
            result.errorMessage = tr("Could not render page %1").arg(i + 1);
            qWarning() << "[PdfImporter]" << result.errorMessage;
            return result;
        }
        previews.append(PagePreview{page->uid, encodePng(rendered)});
    }

    qDebug() << "[PdfImporter] Imported" << pdfPath << "-" << document->pageCount() << "pages";

    result.success = true;
    result.document = std::move(document);
    result.previews = std::move(previews);
    return result;
}

QByteArray PdfImporter::encodePng(const QImage& image)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) {
        return QByteArray();
    }
    if (!image.save(&buffer, "PNG")) {
        qWarning() << "[PdfImporter] PNG encoding failed";
        return QByteArray();
    }
    buffer.close();
    return bytes;
}
