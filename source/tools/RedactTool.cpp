#include "RedactTool.h"
#include "../core/DocumentSession.h"

RedactTool::RedactTool(QObject* parent)
    : ToolHandler(ToolMode::Redact, OverlayKind::Redaction, parent)
{
}

QString RedactTool::bannerText() const
{
    return tr("Redact mode: drag to mark areas, right-click an area to remove it.");
}

QVector<MarkPrimitive> RedactTool::previewPrimitives(int page) const
{
    if (m_dragPage == 0 || page != m_dragPage) {
        return QVector<MarkPrimitive>();
    }
    return { MarkPainter::dragPreview(QRectF(m_dragStart, m_dragCurrent), Qt::red) };
}

bool RedactTool::handlePointer(const PointerEvent& event)
{
    DocumentSession* s = session();
    if (!s) {
        return false;
    }

    switch (event.type) {
        case PointerEvent::Press:
            if (event.button == Qt::RightButton) {
                const int hit = s->marks()->markAt(event.page, event.pos, {Mark::RedactRect});
                if (hit > 0) {
                    s->marks()->remove(hit);
                    return true;
                }
                return false;
            }
            if (event.button != Qt::LeftButton) {
                return false;
            }
            m_dragPage = event.page;
            m_dragStart = event.pos;
            m_dragCurrent = event.pos;
            emit previewChanged(m_dragPage);
            return true;

        case PointerEvent::Move:
            if (m_dragPage != event.page) {
                return false;
            }
            m_dragCurrent = event.pos;
            emit previewChanged(m_dragPage);
            return true;

        case PointerEvent::Release: {
            if (m_dragPage != event.page || event.button != Qt::LeftButton) {
                return false;
            }
            m_dragCurrent = event.pos;
            const QRectF rect = QRectF(m_dragStart, m_dragCurrent).normalized();
            const int page = m_dragPage;
            m_dragPage = 0;
            emit previewChanged(page);

            if (rect.width() < Mark::MIN_REDACT_SIZE || rect.height() < Mark::MIN_REDACT_SIZE) {
                return true;  // Too small, discarded
            }
            placeMark(Mark::redactRect(page, rect, m_color));
            return true;
        }

        case PointerEvent::DoubleClick:
            break;
    }
    return false;
}

void RedactTool::resetTransientState()
{
    const int page = m_dragPage;
    m_dragPage = 0;
    if (page > 0) {
        emit previewChanged(page);
    }
}
