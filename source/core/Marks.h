#pragma once

// ============================================================================
// Mark - User-authored, uncommitted overlay data
// ============================================================================
// Marks are plain data. Positions are in screen space at the zoom that was
// active when the mark was created; they are converted to document space
// only when committed (see CoordinateTransform).
// ============================================================================

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

struct Mark {
    enum Kind {
        RedactRect,     ///< rect + color
        Highlight,      ///< rect
        Underline,      ///< rect
        DrawPath,       ///< points + color + strokeWidth
        StickyNote,     ///< rect.topLeft() is the icon position, text
        TextBox,        ///< rect + text + fontSize + fontFamily
        FormField       ///< rect.topLeft() is the placement point
    };

    Kind kind = RedactRect;
    int id = 0;                     ///< Assigned by MarkStore, 0 = unassigned
    int page = 1;                   ///< 1-based page number
    QRectF rect;
    QVector<QPointF> points;
    QColor color;
    qreal strokeWidth = 2.0;
    QString text;
    qreal fontSize = 14.0;
    QString fontFamily;

    QPointF position() const { return rect.topLeft(); }

    /**
     * @brief Area used for hit testing on the overlay.
     *
     * Point-like marks (sticky notes, field placements) get an icon-sized box,
     * paths get their bounding box grown by half the stroke width.
     */
    QRectF hitRect() const;

    bool operator==(const Mark& other) const;
    bool operator!=(const Mark& other) const { return !(*this == other); }

    // ===== Defaults =====
    static constexpr qreal TEXT_BOX_WIDTH = 150.0;
    static constexpr qreal TEXT_BOX_HEIGHT = 24.0;
    static constexpr qreal TEXT_BOX_FONT_SIZE = 14.0;
    static constexpr qreal HIGHLIGHT_WIDTH = 80.0;
    static constexpr qreal HIGHLIGHT_HEIGHT = 16.0;
    static constexpr qreal UNDERLINE_HEIGHT = 2.0;
    static constexpr qreal STICKY_ICON_SIZE = 20.0;
    static constexpr qreal MIN_REDACT_SIZE = 5.0;

    // ===== Factories =====
    static Mark redactRect(int page, const QRectF& rect, const QColor& color);
    static Mark highlight(int page, const QPointF& center);
    static Mark underline(int page, const QPointF& center);
    static Mark drawPath(int page, const QVector<QPointF>& points,
                         const QColor& color, qreal strokeWidth);
    static Mark stickyNote(int page, const QPointF& pos, const QString& text = QString());
    static Mark textBox(int page, const QPointF& pos, const QString& text = QString(),
                        qreal fontSize = TEXT_BOX_FONT_SIZE);
    static Mark formField(int page, const QPointF& pos);
};
