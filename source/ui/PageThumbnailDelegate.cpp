#include "PageThumbnailDelegate.h"
#include "PageThumbnailModel.h"

#include <QPainter>
#include <QPainterPath>

// ============================================================================
// Constructor
// ============================================================================

PageThumbnailDelegate::PageThumbnailDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

// ============================================================================
// Size Hint
// ============================================================================

QSize PageThumbnailDelegate::sizeHint(const QStyleOptionViewItem& option,
                                       const QModelIndex& index) const
{
    Q_UNUSED(option);

    const int thumbHeight = static_cast<int>(m_thumbnailWidth * aspectRatioFor(index));

    // padding + thumbnail + spacing + caption + padding
    const int totalHeight = VERTICAL_PADDING + thumbHeight + ITEM_SPACING +
                            CAPTION_HEIGHT + VERTICAL_PADDING;
    const int totalWidth = HORIZONTAL_PADDING + m_thumbnailWidth + HORIZONTAL_PADDING;

    return QSize(totalWidth, totalHeight);
}

// ============================================================================
// Paint
// ============================================================================

void PageThumbnailDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option,
                                   const QModelIndex& index) const
{
    painter->save();
    painter->setRenderHint(QPainter::Antialiasing, true);
    painter->setRenderHint(QPainter::TextAntialiasing, true);

    const int pageIndex = index.data(PageThumbnailModel::PageIndexRole).toInt();
    const QString label = index.data(PageThumbnailModel::PageLabelRole).toString();
    const QPixmap thumbnail = index.data(PageThumbnailModel::ThumbnailRole).value<QPixmap>();
    const bool isCurrentPage = index.data(PageThumbnailModel::IsCurrentPageRole).toBool();
    const bool isSourcePage = index.data(PageThumbnailModel::IsSourcePageRole).toBool();

    const bool isSelected = option.state & QStyle::State_Selected;
    const bool isHovered = option.state & QStyle::State_MouseOver;

    const int thumbHeight = static_cast<int>(m_thumbnailWidth * aspectRatioFor(index));
    const int thumbX = option.rect.left() + (option.rect.width() - m_thumbnailWidth) / 2;
    const int thumbY = option.rect.top() + VERTICAL_PADDING;
    const QRect thumbRect(thumbX, thumbY, m_thumbnailWidth, thumbHeight);

    const QRect captionRect(option.rect.left(), thumbRect.bottom() + ITEM_SPACING,
                            option.rect.width(), CAPTION_HEIGHT);

    if (isSelected || isHovered) {
        painter->fillRect(option.rect, backgroundColor(isSelected, isHovered));
    }

    QPainterPath clipPath;
    clipPath.addRoundedRect(thumbRect, BORDER_RADIUS, BORDER_RADIUS);
    if (!thumbnail.isNull()) {
        painter->save();
        painter->setClipPath(clipPath);
        painter->drawPixmap(thumbRect, thumbnail);
        painter->restore();
    } else {
        painter->fillPath(clipPath, placeholderColor());
    }

    drawBorder(painter, thumbRect, isCurrentPage);
    if (isSourcePage) {
        drawSourceTag(painter, thumbRect);
    }

    painter->setPen(textColor());
    QFont font = option.font;
    font.setPixelSize(12);
    painter->setFont(font);

    QString caption = QString::number(pageIndex + 1);
    if (!label.isEmpty()) {
        caption += QStringLiteral(" · ") + label;
    }
    caption = painter->fontMetrics().elidedText(caption, Qt::ElideRight, captionRect.width() - 8);
    painter->drawText(captionRect, Qt::AlignHCenter | Qt::AlignTop, caption);

    painter->restore();
}

// ============================================================================
// Settings
// ============================================================================

void PageThumbnailDelegate::setThumbnailWidth(int width)
{
    if (width > 0) {
        m_thumbnailWidth = width;
    }
}

void PageThumbnailDelegate::setDarkMode(bool dark)
{
    m_darkMode = dark;
}

// ============================================================================
// Private Helpers
// ============================================================================

qreal PageThumbnailDelegate::aspectRatioFor(const QModelIndex& index) const
{
    if (index.isValid()) {
        QVariant ratio = index.data(PageThumbnailModel::PageAspectRatioRole);
        if (ratio.isValid() && ratio.toReal() > 0.1 && ratio.toReal() < 10.0) {
            return ratio.toReal();
        }
    }
    return DEFAULT_ASPECT_RATIO;
}

void PageThumbnailDelegate::drawBorder(QPainter* painter, const QRect& thumbRect,
                                        bool isCurrentPage) const
{
    const int borderWidth = isCurrentPage ? BORDER_WIDTH_CURRENT : BORDER_WIDTH_NORMAL;
    QPen pen(isCurrentPage ? accentColor() : neutralBorderColor());
    pen.setWidth(borderWidth);
    painter->setPen(pen);
    painter->setBrush(Qt::NoBrush);

    // Inset by half the pen width so the stroke stays inside the thumbnail
    const qreal inset = borderWidth / 2.0;
    QRectF borderRect = QRectF(thumbRect).adjusted(inset, inset, -inset, -inset);
    painter->drawRoundedRect(borderRect, BORDER_RADIUS, BORDER_RADIUS);
}

void PageThumbnailDelegate::drawSourceTag(QPainter* painter, const QRect& thumbRect) const
{
    QFont font = painter->font();
    font.setPixelSize(9);
    font.setBold(true);
    painter->setFont(font);

    const QString tag = QStringLiteral("PDF");
    const int tagWidth = painter->fontMetrics().horizontalAdvance(tag) + 8;
    const QRect tagRect(thumbRect.right() - tagWidth - 4, thumbRect.top() + 4, tagWidth, 14);

    painter->setPen(Qt::NoPen);
    painter->setBrush(QColor(0, 0, 0, 110));
    painter->drawRoundedRect(tagRect, 3, 3);
    painter->setPen(Qt::white);
    painter->drawText(tagRect, Qt::AlignCenter, tag);
}

QColor PageThumbnailDelegate::accentColor() const
{
    return m_darkMode ? QColor(100, 149, 237) : QColor(66, 133, 244);
}

QColor PageThumbnailDelegate::neutralBorderColor() const
{
    return m_darkMode ? QColor(80, 80, 80) : QColor(200, 200, 200);
}

QColor PageThumbnailDelegate::placeholderColor() const
{
    return m_darkMode ? QColor(55, 55, 50) : QColor(250, 250, 245);
}

QColor PageThumbnailDelegate::textColor() const
{
    return m_darkMode ? QColor(200, 200, 200) : QColor(80, 80, 80);
}

QColor PageThumbnailDelegate::backgroundColor(bool isSelected, bool isHovered) const
{
    if (m_darkMode) {
        if (isSelected) {
            return QColor(60, 60, 65);
        } else if (isHovered) {
            return QColor(50, 50, 55);
        }
    } else {
        if (isSelected) {
            return QColor(230, 240, 250);
        } else if (isHovered) {
            return QColor(240, 245, 250);
        }
    }
    return Qt::transparent;
}
