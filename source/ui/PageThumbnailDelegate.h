#ifndef PAGETHUMBNAILDELEGATE_H
#define PAGETHUMBNAILDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>

/**
 * @brief Delegate for the page strip.
 *
 * Renders each item as:
 * 1. Thumbnail image (the model supplies a placeholder until it is rendered)
 * 2. Border (thin neutral for normal, thick accent for the current page,
 *    dashed accent for pages in the selection)
 * 3. Page number below
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

private:
    int m_thumbnailWidth = 100;

    // Visual constants
    static constexpr int VERTICAL_PADDING = 6;
    static constexpr int HORIZONTAL_PADDING = 8;
    static constexpr int BORDER_WIDTH_NORMAL = 1;
    static constexpr int BORDER_WIDTH_CURRENT = 3;
    static constexpr int PAGE_NUMBER_HEIGHT = 20;
    static constexpr qreal DEFAULT_ASPECT_RATIO = 1.294;  // US Letter
};

#endif // PAGETHUMBNAILDELEGATE_H
