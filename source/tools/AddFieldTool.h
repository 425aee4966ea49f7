#pragma once

// ============================================================================
// AddFieldTool - Click to add a text form field
// ============================================================================
// The click leaves a FormField placement mark and asks for the field to be
// added to the document. The editor removes the placement once the engine
// job has finished.
// ============================================================================

#include "ToolHandler.h"

class AddFieldTool : public ToolHandler {
    Q_OBJECT

public:
    explicit AddFieldTool(QObject* parent = nullptr);

    QString bannerText() const override;

signals:
    void fieldPlacementRequested(int page, const QPointF& pos, int placementMarkId);

protected:
    bool handlePointer(const PointerEvent& event) override;
};
