#include "ToolHandler.h"
#include "../core/DocumentSession.h"

#include <QDebug>

ToolHandler::ToolHandler(ToolMode mode, OverlayKind layer, QObject* parent)
    : QObject(parent)
    , m_mode(mode)
    , m_layer(layer)
{
}

ToolHandler::~ToolHandler()
{
    detach();
}

void ToolHandler::attach(const QVector<OverlaySurface*>& overlays, DocumentSession* session)
{
    detach();
    m_session = session;

    for (OverlaySurface* overlay : overlays) {
        if (!overlay || overlay->kind() != m_layer) {
            continue;
        }
        Registration reg;
        reg.overlay = overlay;
        reg.token = overlay->addListener([this](const PointerEvent& event) {
            return handlePointer(event);
        });
        overlay->setCursorShape(cursor());
        m_registrations.append(reg);
    }
}

void ToolHandler::detach()
{
    for (const Registration& reg : m_registrations) {
        if (reg.overlay) {
            reg.overlay->removeListener(reg.token);
            reg.overlay->setCursorShape(Qt::ArrowCursor);
        }
    }
    m_registrations.clear();
    resetTransientState();
    m_session.clear();
}

QVector<MarkPrimitive> ToolHandler::previewPrimitives(int page) const
{
    Q_UNUSED(page);
    return QVector<MarkPrimitive>();
}

int ToolHandler::placeMark(const Mark& mark)
{
    DocumentSession* s = session();
    if (!s) {
        return 0;
    }

    const int id = s->marks()->add(mark);
    if (const Mark* placed = s->marks()->find(id)) {
        s->undoStack()->push(UndoAction::forMark(*placed));
    }
    return id;
}
