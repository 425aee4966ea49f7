#include "AnnotateTool.h"
#include "../core/DocumentSession.h"

namespace {
const QVector<Mark::Kind> ANNOTATION_KINDS = {
    Mark::Highlight, Mark::Underline, Mark::StickyNote, Mark::DrawPath
};
}

AnnotateTool::AnnotateTool(ToolMode mode, QObject* parent)
    : ToolHandler(mode, OverlayKind::Annotation, parent)
{
}

Mark::Kind AnnotateTool::markKind() const
{
    switch (mode()) {
        case ToolMode::Underline: return Mark::Underline;
        case ToolMode::Sticky:    return Mark::StickyNote;
        default:                  return Mark::Highlight;
    }
}

QString AnnotateTool::bannerText() const
{
    switch (mode()) {
        case ToolMode::Underline:
            return tr("Underline mode: click to underline, right-click to remove.");
        case ToolMode::Sticky:
            return tr("Sticky note mode: click to add a note, click a note to edit it.");
        default:
            return tr("Highlight mode: click to highlight, right-click to remove.");
    }
}

Qt::CursorShape AnnotateTool::cursor() const
{
    return mode() == ToolMode::Sticky ? Qt::CrossCursor : Qt::IBeamCursor;
}

bool AnnotateTool::handlePointer(const PointerEvent& event)
{
    DocumentSession* s = session();
    if (!s || event.type != PointerEvent::Press) {
        return false;
    }

    MarkStore* marks = s->marks();

    if (event.button == Qt::RightButton) {
        const int hit = marks->markAt(event.page, event.pos, {markKind()});
        if (hit <= 0) {
            return false;
        }
        if (hit == m_editingNote) {
            m_editingNote = 0;
            emit inlineEditorRequested(0);
        }
        marks->remove(hit);
        return true;
    }

    if (event.button != Qt::LeftButton) {
        return false;
    }

    const int hit = marks->markAt(event.page, event.pos, ANNOTATION_KINDS);
    if (hit > 0) {
        const Mark* existing = marks->find(hit);
        if (mode() == ToolMode::Sticky && existing && existing->kind == Mark::StickyNote) {
            m_editingNote = (m_editingNote == hit) ? 0 : hit;
            emit inlineEditorRequested(m_editingNote);
        }
        return true;  // Occupied spot, nothing new is placed
    }

    switch (mode()) {
        case ToolMode::Highlight:
            placeMark(Mark::highlight(event.page, event.pos));
            break;
        case ToolMode::Underline:
            placeMark(Mark::underline(event.page, event.pos));
            break;
        case ToolMode::Sticky:
            placeMark(Mark::stickyNote(event.page, event.pos));
            break;
        default:
            return false;
    }
    return true;
}

void AnnotateTool::resetTransientState()
{
    if (m_editingNote != 0) {
        m_editingNote = 0;
        emit inlineEditorRequested(0);
    }
}
