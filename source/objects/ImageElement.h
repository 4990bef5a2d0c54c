#pragma once

// ============================================================================
// ImageElement - A raster image placed on a page
// ============================================================================
// ImageElement keeps the encoded image bytes exactly as they were read from
// disk. The bytes are embedded into the exported PDF; a decoded QImage is
// cached lazily for on-screen rendering only.
// ============================================================================

#include "PageElement.h"
#include <QByteArray>
#include <QImage>

/**
 * @brief An image element.
 *
 * imageBytes is never modified after creation (except through clones).
 */
class ImageElement : public PageElement {
public:
    // ===== Image-specific Properties =====
    QString sourcePath;       ///< Where the image came from (informational)
    QByteArray imageBytes;    ///< Encoded image payload (PNG, JPEG, ...)

    ImageElement() = default;
    ImageElement(const ImageElement&) = default;
    ImageElement& operator=(const ImageElement&) = default;

    /**
     * @brief Create an image element from encoded bytes.
     * @param bytes Encoded image data.
     * @param path Source path (informational).
     * @param rect Placement in page coordinates.
     */
    ImageElement(const QByteArray& bytes, const QString& path, const QRectF& rect);

    // ===== PageElement Interface =====
    Kind kind() const override { return Kind::Image; }
    void render(QPainter& painter, qreal zoom) const override;

    // ===== Image-specific Methods =====

    /**
     * @brief Decoded image, decoding imageBytes on first use.
     * @return The decoded image, or a null QImage if the bytes are not a
     *         supported format.
     */
    const QImage& image() const;

    /**
     * @brief Pixel size of the decoded image (empty if undecodable).
     */
    QSize naturalSize() const { return image().size(); }

private:
    mutable QImage cachedImage;     ///< Lazily decoded from imageBytes
    mutable bool decodeAttempted = false;
};
