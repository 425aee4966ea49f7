#pragma once

// ============================================================================
// RedactTool - Drag rectangles to be painted over on apply
// ============================================================================

#include "ToolHandler.h"

#include <QColor>

class RedactTool : public ToolHandler {
    Q_OBJECT

public:
    explicit RedactTool(QObject* parent = nullptr);

    QString bannerText() const override;
    QVector<MarkPrimitive> previewPrimitives(int page) const override;

    /// Fill colour for new rectangles (black or white).
    QColor color() const { return m_color; }
    void setColor(const QColor& color) { m_color = color; }

protected:
    bool handlePointer(const PointerEvent& event) override;
    void resetTransientState() override;

private:
    QColor m_color = Qt::black;
    int m_dragPage = 0;
    QPointF m_dragStart;
    QPointF m_dragCurrent;
};
