#ifndef PAGETHUMBNAILDELEGATE_H
#define PAGETHUMBNAILDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>

/**
 * @brief Custom delegate for rendering page thumbnails in QListView.
 *
 * Renders each item as:
 * 1. Thumbnail image (or a paper-colored placeholder)
 * 2. Border (thin neutral for normal, thick accent for current page)
 * 3. Caption below: "N" or "N · label"
 * 4. A small "PDF" tag on pages backed by the source file
 */
class PageThumbnailDelegate : public QStyledItemDelegate {
    Q_OBJECT

public:
    explicit PageThumbnailDelegate(QObject* parent = nullptr);

    void paint(QPainter* painter, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override;

    QSize sizeHint(const QStyleOptionViewItem& option,
                   const QModelIndex& index) const override;

    void setThumbnailWidth(int width);
    int thumbnailWidth() const { return m_thumbnailWidth; }

    void setDarkMode(bool dark);
    bool isDarkMode() const { return m_darkMode; }

private:
    qreal aspectRatioFor(const QModelIndex& index) const;
    void drawBorder(QPainter* painter, const QRect& thumbRect, bool isCurrentPage) const;
    void drawSourceTag(QPainter* painter, const QRect& thumbRect) const;

    QColor accentColor() const;
    QColor neutralBorderColor() const;
    QColor placeholderColor() const;
    QColor textColor() const;
    QColor backgroundColor(bool isSelected, bool isHovered) const;

    int m_thumbnailWidth = 120;
    bool m_darkMode = false;

    // Visual constants
    static constexpr qreal DEFAULT_ASPECT_RATIO = 842.0 / 595.0;  // A4
    static constexpr int VERTICAL_PADDING = 8;
    static constexpr int HORIZONTAL_PADDING = 8;
    static constexpr int BORDER_RADIUS = 4;
    static constexpr int BORDER_WIDTH_NORMAL = 1;
    static constexpr int BORDER_WIDTH_CURRENT = 3;
    static constexpr int CAPTION_HEIGHT = 24;
    static constexpr int ITEM_SPACING = 8;
};

#endif // PAGETHUMBNAILDELEGATE_H
