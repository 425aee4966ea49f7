// ============================================================================
// PageWidget - Implementation
// ============================================================================

#include "PageWidget.h"
#include "MarkPainter.h"
#include "PageRenderPipeline.h"
#include "../core/DocumentSession.h"
#include "../tools/ToolModeController.h"

#include <QMouseEvent>
#include <QPainter>

namespace {

const OverlayKind DISPATCH_ORDER[] = {
    OverlayKind::TextEdit,
    OverlayKind::Redaction,
    OverlayKind::Annotation
};

} // namespace

PageWidget::PageWidget(PageRenderPipeline* pipeline, ToolModeController* tools, int page,
                       QWidget* parent)
    : QWidget(parent)
    , m_pipeline(pipeline)
    , m_tools(tools)
    , m_page(page)
{
    setAttribute(Qt::WA_OpaquePaintEvent, true);

    if (const PageSlot* slot = m_pipeline->slot(page)) {
        for (OverlaySurface* overlay : slot->overlays) {
            if (!overlay) {
                continue;
            }
            connect(overlay, &OverlaySurface::repaintRequested, this, qOverload<>(&QWidget::update));
            connect(overlay, &OverlaySurface::cursorChanged, this, &PageWidget::updateCursor);
        }
    }
    connect(m_pipeline, &PageRenderPipeline::pageRendered, this, [this](int renderedPage) {
        if (renderedPage == m_page) {
            update();
        }
    });
    if (m_tools) {
        connect(m_tools, &ToolModeController::previewChanged, this, [this](int previewPage) {
            if (previewPage == m_page) {
                update();
            }
        });
    }

    updateCursor();
}

bool PageWidget::forwardPointer(PointerEvent::Type type, const QPointF& pos, Qt::MouseButton button,
                                Qt::KeyboardModifiers modifiers)
{
    if (!m_pipeline) {
        return false;
    }

    PointerEvent event;
    event.type = type;
    event.pos = pos;
    event.button = button;
    event.modifiers = modifiers;

    for (OverlayKind kind : DISPATCH_ORDER) {
        OverlaySurface* overlay = m_pipeline->overlay(m_page, kind);
        if (overlay && overlay->dispatch(event)) {
            return true;
        }
    }
    return false;
}

void PageWidget::updateCursor()
{
    if (!m_pipeline) {
        return;
    }

    // The overlay with a listener is the one the active tool is on
    Qt::CursorShape shape = Qt::ArrowCursor;
    for (OverlayKind kind : DISPATCH_ORDER) {
        OverlaySurface* overlay = m_pipeline->overlay(m_page, kind);
        if (overlay && overlay->listenerCount() > 0) {
            shape = overlay->cursorShape();
            break;
        }
    }
    setCursor(shape);
}

// ============================================================================
// Painting
// ============================================================================

void PageWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), Qt::white);

    if (!m_pipeline) {
        return;
    }

    const PageSlot* slot = m_pipeline->slot(m_page);
    if (slot && !slot->image.isNull()) {
        painter.drawImage(rect(), slot->image);
    } else {
        painter.setPen(Qt::gray);
        painter.drawText(rect(), Qt::AlignCenter, tr("Loading page %1...").arg(m_page));
    }

    painter.setRenderHint(QPainter::Antialiasing, true);

    if (DocumentSession* session = m_pipeline->session()) {
        const QVector<Mark> marks = session->marks()->marksOnPage(m_page);
        MarkPainter::paint(painter, MarkPainter::primitives(marks, OverlayKind::Annotation));
        MarkPainter::paint(painter, MarkPainter::primitives(marks, OverlayKind::Redaction));
        MarkPainter::paint(painter, MarkPainter::primitives(marks, OverlayKind::TextEdit));
    }

    if (m_tools) {
        MarkPainter::paint(painter, m_tools->previewPrimitives(m_page));
    }

    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setPen(QColor(0xb0, 0xb0, 0xb0));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect().adjusted(0, 0, -1, -1));
}

// ============================================================================
// Input
// ============================================================================

void PageWidget::mousePressEvent(QMouseEvent* event)
{
    if (forwardPointer(PointerEvent::Press, event->position(), event->button(), event->modifiers())) {
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void PageWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (forwardPointer(PointerEvent::Move, event->position(), Qt::NoButton, event->modifiers())) {
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void PageWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (forwardPointer(PointerEvent::Release, event->position(), event->button(), event->modifiers())) {
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void PageWidget::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (forwardPointer(PointerEvent::DoubleClick, event->position(), event->button(), event->modifiers())) {
        event->accept();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}
