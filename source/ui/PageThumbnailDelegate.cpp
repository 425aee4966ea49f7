#include "PageThumbnailDelegate.h"
#include "PageThumbnailModel.h"

#include <QPainter>
#include <QPixmap>

namespace {

const QColor ACCENT_COLOR(0x1a, 0x73, 0xe8);
const QColor NEUTRAL_BORDER_COLOR(0xc0, 0xc0, 0xc0);
const QColor SELECTED_BACKGROUND(0x1a, 0x73, 0xe8, 40);

qreal aspectRatioOf(const QPixmap& pixmap, qreal fallback)
{
    if (pixmap.isNull() || pixmap.width() <= 0) {
        return fallback;
    }
    return static_cast<qreal>(pixmap.height()) / pixmap.width();
}

} // namespace

PageThumbnailDelegate::PageThumbnailDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

void PageThumbnailDelegate::setThumbnailWidth(int width)
{
    m_thumbnailWidth = qMax(16, width);
}

QSize PageThumbnailDelegate::sizeHint(const QStyleOptionViewItem& option,
                                      const QModelIndex& index) const
{
    Q_UNUSED(option);

    const QPixmap thumbnail = index.data(PageThumbnailModel::ThumbnailRole).value<QPixmap>();
    const int thumbHeight = qRound(m_thumbnailWidth * aspectRatioOf(thumbnail, DEFAULT_ASPECT_RATIO));

    return QSize(HORIZONTAL_PADDING * 2 + m_thumbnailWidth,
                 VERTICAL_PADDING * 2 + thumbHeight + PAGE_NUMBER_HEIGHT);
}

void PageThumbnailDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option,
                                  const QModelIndex& index) const
{
    painter->save();
    painter->setRenderHint(QPainter::Antialiasing, true);

    const int page = index.data(PageThumbnailModel::PageNumberRole).toInt();
    const QPixmap thumbnail = index.data(PageThumbnailModel::ThumbnailRole).value<QPixmap>();
    const bool isCurrentPage = index.data(PageThumbnailModel::IsCurrentPageRole).toBool();
    const bool isSelected = index.data(PageThumbnailModel::IsSelectedRole).toBool();

    const int thumbHeight = qRound(m_thumbnailWidth * aspectRatioOf(thumbnail, DEFAULT_ASPECT_RATIO));
    const QRect thumbRect(option.rect.left() + (option.rect.width() - m_thumbnailWidth) / 2,
                          option.rect.top() + VERTICAL_PADDING,
                          m_thumbnailWidth, thumbHeight);

    if (isSelected) {
        painter->fillRect(option.rect, SELECTED_BACKGROUND);
    }

    painter->drawPixmap(thumbRect, thumbnail);

    QPen border(isCurrentPage ? ACCENT_COLOR : NEUTRAL_BORDER_COLOR);
    border.setWidth(isCurrentPage ? BORDER_WIDTH_CURRENT : BORDER_WIDTH_NORMAL);
    if (isSelected && !isCurrentPage) {
        border.setColor(ACCENT_COLOR);
        border.setStyle(Qt::DashLine);
    }
    painter->setPen(border);
    painter->setBrush(Qt::NoBrush);
    painter->drawRect(thumbRect);

    QFont font = option.font;
    font.setPixelSize(12);
    font.setBold(isCurrentPage);
    painter->setFont(font);
    painter->setPen(option.palette.color(QPalette::Text));
    const QRect numberRect(option.rect.left(), thumbRect.bottom() + 2,
                           option.rect.width(), PAGE_NUMBER_HEIGHT);
    painter->drawText(numberRect, Qt::AlignCenter, QString::number(page));

    painter->restore();
}
