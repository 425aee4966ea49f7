#pragma once

// ============================================================================
// MarkPainter - Marks to drawable primitives
// ============================================================================
// primitives() is a pure function of the marks and the overlay layer. It
// does not touch any widget, so overlay output is testable without a
// display. paint() replays primitives onto a QPainter.
//
// Marks are drawn where they were placed. They do not follow later zoom
// changes; only a commit converts them to document space.
// ============================================================================

#include "OverlaySurface.h"
#include "../core/Marks.h"

#include <QColor>
#include <QRectF>
#include <QString>
#include <QVector>

class QPainter;

struct MarkPrimitive {
    enum Shape {
        FillRect,
        OutlineRect,
        Polyline,
        Text,
        NoteIcon
    };

    Shape shape = FillRect;
    int markId = 0;             ///< 0 for previews
    QRectF rect;
    QVector<QPointF> points;
    QColor color;
    qreal width = 1.0;          ///< Pen width for outlines and polylines
    bool dashed = false;
    QString text;
    QString fontFamily;
    qreal fontSize = 12.0;
};

namespace MarkPainter {

/// Overlay layer a mark kind is shown on.
OverlayKind layerFor(Mark::Kind kind);

/**
 * @brief Primitives for the marks that belong on @p layer, in mark order.
 */
QVector<MarkPrimitive> primitives(const QVector<Mark>& marks, OverlayKind layer);

/// Dashed outline shown while a redaction rectangle is dragged.
MarkPrimitive dragPreview(const QRectF& rect, const QColor& color);

/// Stroke shown while a path is being drawn.
MarkPrimitive pathPreview(const QVector<QPointF>& points, const QColor& color, qreal width);

void paint(QPainter& painter, const QVector<MarkPrimitive>& primitives);

} // namespace MarkPainter
