#include "DrawTool.h"

DrawTool::DrawTool(QObject* parent)
    : ToolHandler(ToolMode::Draw, OverlayKind::Annotation, parent)
{
}

QString DrawTool::bannerText() const
{
    return tr("Draw mode: drag to draw on the page.");
}

void DrawTool::setPen(const QColor& color, qreal width)
{
    m_color = color;
    m_width = width;
}

QVector<MarkPrimitive> DrawTool::previewPrimitives(int page) const
{
    if (m_page == 0 || page != m_page || m_points.size() < 2) {
        return QVector<MarkPrimitive>();
    }
    return { MarkPainter::pathPreview(m_points, m_color, m_width) };
}

bool DrawTool::handlePointer(const PointerEvent& event)
{
    switch (event.type) {
        case PointerEvent::Press:
            if (event.button != Qt::LeftButton) {
                return false;
            }
            m_page = event.page;
            m_points = { event.pos };
            emit previewChanged(m_page);
            return true;

        case PointerEvent::Move:
            if (m_page == 0 || event.page != m_page) {
                return false;
            }
            m_points.append(event.pos);
            emit previewChanged(m_page);
            return true;

        case PointerEvent::Release: {
            if (m_page == 0 || event.page != m_page) {
                return false;
            }
            const int page = m_page;
            const QVector<QPointF> points = m_points;
            m_page = 0;
            m_points.clear();
            emit previewChanged(page);

            if (points.size() >= 2) {
                placeMark(Mark::drawPath(page, points, m_color, m_width));
            }
            return true;
        }

        case PointerEvent::DoubleClick:
            break;
    }
    return false;
}

void DrawTool::resetTransientState()
{
    const int page = m_page;
    m_page = 0;
    m_points.clear();
    if (page > 0) {
        emit previewChanged(page);
    }
}
