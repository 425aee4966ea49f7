#include "AddFieldTool.h"
#include "../core/DocumentSession.h"

AddFieldTool::AddFieldTool(QObject* parent)
    : ToolHandler(ToolMode::AddField, OverlayKind::TextEdit, parent)
{
}

QString AddFieldTool::bannerText() const
{
    return tr("Add field mode: click where the new text field should go.");
}

bool AddFieldTool::handlePointer(const PointerEvent& event)
{
    DocumentSession* s = session();
    if (!s || event.type != PointerEvent::Press || event.button != Qt::LeftButton) {
        return false;
    }

    // Placement marks are replaced by the real field, no undo entry for them
    const int markId = s->marks()->add(Mark::formField(event.page, event.pos));
    emit fieldPlacementRequested(event.page, event.pos, markId);
    return true;
}
