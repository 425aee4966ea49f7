#pragma once

// ============================================================================
// AnnotateTool - Click-to-place highlights, underlines and sticky notes
// ============================================================================
// One instance per mode. Clicking an empty spot places a mark centred on
// (highlight, underline) or anchored at (sticky) the click. Clicking on an
// existing mark never stacks a new one. For sticky notes, clicking the icon
// toggles its inline editor. Right-click removes the mark under the pointer.
// ============================================================================

#include "ToolHandler.h"

class AnnotateTool : public ToolHandler {
    Q_OBJECT

public:
    /// @param mode ToolMode::Highlight, ToolMode::Underline or ToolMode::Sticky.
    explicit AnnotateTool(ToolMode mode, QObject* parent = nullptr);

    QString bannerText() const override;
    Qt::CursorShape cursor() const override;

    /// Sticky note whose editor is open, 0 if none.
    int editingNote() const { return m_editingNote; }

protected:
    bool handlePointer(const PointerEvent& event) override;
    void resetTransientState() override;

private:
    Mark::Kind markKind() const;

    int m_editingNote = 0;
};
