#include "Marks.h"

QRectF Mark::hitRect() const
{
    switch (kind) {
        case StickyNote:
        case FormField:
            return QRectF(rect.topLeft(), QSizeF(STICKY_ICON_SIZE, STICKY_ICON_SIZE));
        case DrawPath: {
            if (points.isEmpty()) {
                return QRectF();
            }
            qreal minX = points.first().x(), maxX = minX;
            qreal minY = points.first().y(), maxY = minY;
            for (const QPointF& pt : points) {
                minX = qMin(minX, pt.x());
                maxX = qMax(maxX, pt.x());
                minY = qMin(minY, pt.y());
                maxY = qMax(maxY, pt.y());
            }
            const qreal pad = strokeWidth / 2.0;
            return QRectF(QPointF(minX, minY), QPointF(maxX, maxY))
                .adjusted(-pad, -pad, pad, pad);
        }
        default:
            return rect;
    }
}

bool Mark::operator==(const Mark& other) const
{
    return kind == other.kind
        && id == other.id
        && page == other.page
        && rect == other.rect
        && points == other.points
        && color == other.color
        && qFuzzyCompare(strokeWidth, other.strokeWidth)
        && text == other.text
        && qFuzzyCompare(fontSize, other.fontSize)
        && fontFamily == other.fontFamily;
}

Mark Mark::redactRect(int page, const QRectF& rect, const QColor& color)
{
    Mark m;
    m.kind = RedactRect;
    m.page = page;
    m.rect = rect.normalized();
    m.color = color;
    return m;
}

Mark Mark::highlight(int page, const QPointF& center)
{
    Mark m;
    m.kind = Highlight;
    m.page = page;
    m.rect = QRectF(center.x() - HIGHLIGHT_WIDTH / 2.0, center.y() - HIGHLIGHT_HEIGHT / 2.0,
                    HIGHLIGHT_WIDTH, HIGHLIGHT_HEIGHT);
    return m;
}

Mark Mark::underline(int page, const QPointF& center)
{
    Mark m;
    m.kind = Underline;
    m.page = page;
    m.rect = QRectF(center.x() - HIGHLIGHT_WIDTH / 2.0, center.y() - UNDERLINE_HEIGHT / 2.0,
                    HIGHLIGHT_WIDTH, UNDERLINE_HEIGHT);
    return m;
}

Mark Mark::drawPath(int page, const QVector<QPointF>& points,
                    const QColor& color, qreal strokeWidth)
{
    Mark m;
    m.kind = DrawPath;
    m.page = page;
    m.points = points;
    m.color = color;
    m.strokeWidth = strokeWidth;
    return m;
}

Mark Mark::stickyNote(int page, const QPointF& pos, const QString& text)
{
    Mark m;
    m.kind = StickyNote;
    m.page = page;
    m.rect = QRectF(pos, QSizeF(0, 0));
    m.text = text;
    return m;
}

Mark Mark::textBox(int page, const QPointF& pos, const QString& text, qreal fontSize)
{
    Mark m;
    m.kind = TextBox;
    m.page = page;
    m.rect = QRectF(pos, QSizeF(TEXT_BOX_WIDTH, TEXT_BOX_HEIGHT));
    m.text = text;
    m.fontSize = fontSize;
    m.fontFamily = QStringLiteral("Helvetica");
    return m;
}

Mark Mark::formField(int page, const QPointF& pos)
{
    Mark m;
    m.kind = FormField;
    m.page = page;
    m.rect = QRectF(pos, QSizeF(0, 0));
    return m;
}
