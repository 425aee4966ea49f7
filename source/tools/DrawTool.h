#pragma once

// ============================================================================
// DrawTool - Freehand paths on the annotation overlay
// ============================================================================
// A path belongs to the page that received the press. Moves append points
// and refresh the preview; a release with fewer than two points discards
// the path.
// ============================================================================

#include "ToolHandler.h"

#include <QColor>

class DrawTool : public ToolHandler {
    Q_OBJECT

public:
    explicit DrawTool(QObject* parent = nullptr);

    QString bannerText() const override;
    QVector<MarkPrimitive> previewPrimitives(int page) const override;

    void setPen(const QColor& color, qreal width);
    bool isDrawing() const { return m_page != 0; }

protected:
    bool handlePointer(const PointerEvent& event) override;
    void resetTransientState() override;

private:
    QColor m_color = QColor(0xFF, 0x00, 0x00);
    qreal m_width = 2.0;
    int m_page = 0;
    QVector<QPointF> m_points;
};
