#include "TextEditTool.h"
#include "../core/DocumentSession.h"

TextEditTool::TextEditTool(QObject* parent)
    : ToolHandler(ToolMode::TextEdit, OverlayKind::TextEdit, parent)
{
}

QString TextEditTool::bannerText() const
{
    return tr("Edit mode: click to add text, drag a box to move it, right-click to remove it.");
}

bool TextEditTool::handlePointer(const PointerEvent& event)
{
    DocumentSession* s = session();
    if (!s) {
        return false;
    }
    MarkStore* marks = s->marks();

    switch (event.type) {
        case PointerEvent::Press: {
            const int hit = marks->markAt(event.page, event.pos, {Mark::TextBox});

            if (event.button == Qt::RightButton) {
                if (hit <= 0) {
                    return false;
                }
                if (hit == m_editingBox) {
                    m_editingBox = 0;
                    emit inlineEditorRequested(0);
                }
                marks->remove(hit);
                return true;
            }
            if (event.button != Qt::LeftButton) {
                return false;
            }

            if (hit > 0) {
                m_dragBox = hit;
                m_dragOffset = event.pos - marks->find(hit)->rect.topLeft();
                m_editingBox = hit;
                emit inlineEditorRequested(hit);
                return true;
            }

            m_editingBox = placeMark(Mark::textBox(event.page, event.pos));
            emit inlineEditorRequested(m_editingBox);
            return true;
        }

        case PointerEvent::Move:
            if (m_dragBox == 0) {
                return false;
            }
            marks->moveTo(m_dragBox, event.pos - m_dragOffset);
            return true;

        case PointerEvent::Release:
            if (m_dragBox == 0) {
                return false;
            }
            m_dragBox = 0;
            return true;

        case PointerEvent::DoubleClick:
            break;
    }
    return false;
}

void TextEditTool::resetTransientState()
{
    m_dragBox = 0;
    if (m_editingBox != 0) {
        m_editingBox = 0;
        emit inlineEditorRequested(0);
    }
}
