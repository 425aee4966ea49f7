// ============================================================================
// PageWidget - One page of the continuous column
// ============================================================================
// PageWidget paints, bottom to top:
// - the page raster (or its placeholder while rendering)
// - the annotation, redaction and text-edit overlays (marks of the page)
// - the active tool's preview (drag rectangle, path in progress)
//
// Mouse input is forwarded to the page's OverlaySurfaces; the tool handler
// listening on one of them decides what happens. The widget itself knows
// nothing about tools.
//
// PageCanvasView creates one PageWidget per page slot.
// ============================================================================

#pragma once

#include "OverlaySurface.h"

#include <QPointer>
#include <QWidget>

class PageRenderPipeline;
class ToolModeController;

class PageWidget : public QWidget {
    Q_OBJECT

public:
    /**
     * @param pipeline Source of the raster and overlays (not owned).
     * @param tools Source of the preview primitives (not owned, may be nullptr).
     * @param page 1-based page number.
     */
    PageWidget(PageRenderPipeline* pipeline, ToolModeController* tools, int page,
               QWidget* parent = nullptr);

    int page() const { return m_page; }

    /**
     * @brief Build a PointerEvent and offer it to the overlays.
     *
     * Order is text-edit, redaction, annotation; the first consumer wins.
     * @return true if a listener consumed it.
     */
    bool forwardPointer(PointerEvent::Type type, const QPointF& pos, Qt::MouseButton button,
                        Qt::KeyboardModifiers modifiers);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    void updateCursor();

    QPointer<PageRenderPipeline> m_pipeline;
    QPointer<ToolModeController> m_tools;
    int m_page;
};
