#pragma once

// ============================================================================
// TextEditTool - Place, move and edit free text boxes
// ============================================================================
// Click on empty space places an empty text box and opens its editor.
// Click on a box opens its editor, dragging it moves it. Right-click on a
// box removes it. Boxes stay uncommitted until applyTextEdits() or save.
// ============================================================================

#include "ToolHandler.h"

class TextEditTool : public ToolHandler {
    Q_OBJECT

public:
    explicit TextEditTool(QObject* parent = nullptr);

    QString bannerText() const override;
    Qt::CursorShape cursor() const override { return Qt::IBeamCursor; }

    int editingBox() const { return m_editingBox; }

protected:
    bool handlePointer(const PointerEvent& event) override;
    void resetTransientState() override;

private:
    int m_editingBox = 0;
    int m_dragBox = 0;
    QPointF m_dragOffset;
};
