#include "MarkPainter.h"

#include <QFont>
#include <QPainter>
#include <QPainterPath>

namespace {

const QColor HIGHLIGHT_FILL(255, 255, 0, 102);
const QColor UNDERLINE_FILL(255, 0, 0);
const QColor NOTE_FILL(255, 214, 64);
const QColor TEXT_BOX_OUTLINE(60, 120, 220);
const QColor FIELD_FILL(60, 120, 220, 40);

} // namespace

namespace MarkPainter {

OverlayKind layerFor(Mark::Kind kind)
{
    switch (kind) {
        case Mark::RedactRect:
            return OverlayKind::Redaction;
        case Mark::TextBox:
        case Mark::FormField:
            return OverlayKind::TextEdit;
        case Mark::Highlight:
        case Mark::Underline:
        case Mark::DrawPath:
        case Mark::StickyNote:
            break;
    }
    return OverlayKind::Annotation;
}

QVector<MarkPrimitive> primitives(const QVector<Mark>& marks, OverlayKind layer)
{
    QVector<MarkPrimitive> result;

    for (const Mark& mark : marks) {
        if (layerFor(mark.kind) != layer) {
            continue;
        }

        MarkPrimitive prim;
        prim.markId = mark.id;

        switch (mark.kind) {
            case Mark::RedactRect: {
                prim.shape = MarkPrimitive::FillRect;
                prim.rect = mark.rect;
                prim.color = mark.color;
                prim.color.setAlphaF(0.75f);
                result.append(prim);

                MarkPrimitive outline;
                outline.shape = MarkPrimitive::OutlineRect;
                outline.markId = mark.id;
                outline.rect = mark.rect;
                outline.color = Qt::red;
                result.append(outline);
                break;
            }
            case Mark::Highlight:
                prim.shape = MarkPrimitive::FillRect;
                prim.rect = mark.rect;
                prim.color = HIGHLIGHT_FILL;
                result.append(prim);
                break;
            case Mark::Underline:
                prim.shape = MarkPrimitive::FillRect;
                prim.rect = mark.rect;
                prim.color = UNDERLINE_FILL;
                result.append(prim);
                break;
            case Mark::DrawPath:
                if (mark.points.size() < 2) {
                    break;
                }
                prim.shape = MarkPrimitive::Polyline;
                prim.points = mark.points;
                prim.color = mark.color;
                prim.width = mark.strokeWidth;
                result.append(prim);
                break;
            case Mark::StickyNote:
                prim.shape = MarkPrimitive::NoteIcon;
                prim.rect = mark.hitRect();
                prim.color = NOTE_FILL;
                prim.text = mark.text;
                result.append(prim);
                break;
            case Mark::TextBox: {
                MarkPrimitive outline;
                outline.shape = MarkPrimitive::OutlineRect;
                outline.markId = mark.id;
                outline.rect = mark.rect;
                outline.color = TEXT_BOX_OUTLINE;
                outline.dashed = true;
                result.append(outline);

                if (!mark.text.isEmpty()) {
                    prim.shape = MarkPrimitive::Text;
                    prim.rect = mark.rect;
                    prim.color = Qt::black;
                    prim.text = mark.text;
                    prim.fontFamily = mark.fontFamily;
                    prim.fontSize = mark.fontSize;
                    result.append(prim);
                }
                break;
            }
            case Mark::FormField:
                prim.shape = MarkPrimitive::FillRect;
                prim.rect = QRectF(mark.rect.topLeft(), QSizeF(Mark::TEXT_BOX_WIDTH, Mark::STICKY_ICON_SIZE));
                prim.color = FIELD_FILL;
                result.append(prim);
                break;
        }
    }

    return result;
}

MarkPrimitive dragPreview(const QRectF& rect, const QColor& color)
{
    MarkPrimitive prim;
    prim.shape = MarkPrimitive::OutlineRect;
    prim.rect = rect.normalized();
    prim.color = color;
    prim.dashed = true;
    return prim;
}

MarkPrimitive pathPreview(const QVector<QPointF>& points, const QColor& color, qreal width)
{
    MarkPrimitive prim;
    prim.shape = MarkPrimitive::Polyline;
    prim.points = points;
    prim.color = color;
    prim.width = width;
    return prim;
}

void paint(QPainter& painter, const QVector<MarkPrimitive>& primitives)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const MarkPrimitive& prim : primitives) {
        switch (prim.shape) {
            case MarkPrimitive::FillRect:
                painter.fillRect(prim.rect, prim.color);
                break;
            case MarkPrimitive::OutlineRect: {
                QPen pen(prim.color, prim.width);
                if (prim.dashed) {
                    pen.setStyle(Qt::DashLine);
                }
                painter.setPen(pen);
                painter.setBrush(Qt::NoBrush);
                painter.drawRect(prim.rect);
                break;
            }
            case MarkPrimitive::Polyline: {
                QPen pen(prim.color, prim.width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
                painter.setPen(pen);
                painter.setBrush(Qt::NoBrush);
                painter.drawPolyline(prim.points.constData(), prim.points.size());
                break;
            }
            case MarkPrimitive::Text: {
                QFont font(prim.fontFamily);
                font.setPixelSize(qMax(1, qRound(prim.fontSize)));
                painter.setFont(font);
                painter.setPen(prim.color);
                painter.drawText(prim.rect, Qt::AlignLeft | Qt::AlignVCenter, prim.text);
                break;
            }
            case MarkPrimitive::NoteIcon: {
                painter.setPen(QPen(prim.color.darker(160), 1));
                painter.setBrush(prim.color);
                painter.drawRoundedRect(prim.rect, 3, 3);
                // Folded corner
                QPainterPath fold;
                fold.moveTo(prim.rect.right() - 6, prim.rect.bottom());
                fold.lineTo(prim.rect.right(), prim.rect.bottom() - 6);
                fold.lineTo(prim.rect.right() - 6, prim.rect.bottom() - 6);
                fold.closeSubpath();
                painter.setBrush(prim.color.darker(130));
                painter.drawPath(fold);
                break;
            }
        }
    }

    painter.restore();
}

} // namespace MarkPainter
