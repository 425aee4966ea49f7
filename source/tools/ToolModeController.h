#pragma once

// ============================================================================
// ToolModeController - At most one active tool mode
// ============================================================================
// States: none, text-edit, redact, annotate:{highlight, underline, sticky,
// draw}, add-field. Entering a mode exits the current one first, then shows
// the mode banner and attaches the mode's handler to every overlay of its
// layer. Exiting detaches the handler, which removes every listener it
// registered and clears its previews.
//
// When the pipeline rebuilds its pages (zoom, commit, session switch) the
// active handler is detached from the old overlays and attached to the new
// ones; the mode itself stays active.
// ============================================================================

#include "../core/ToolMode.h"
#include "../viewport/MarkPainter.h"

#include <QMap>
#include <QObject>

class PageRenderPipeline;
class ToolHandler;
class RedactTool;
class DrawTool;
class AddFieldTool;

class ToolModeController : public QObject {
    Q_OBJECT

public:
    explicit ToolModeController(PageRenderPipeline* pipeline, QObject* parent = nullptr);
    ~ToolModeController() override;

    ToolMode mode() const { return m_mode; }

    /**
     * @brief Enter a mode, or exit it if it is already active.
     * @return The mode active afterwards.
     */
    ToolMode toggle(ToolMode mode);

    void enter(ToolMode mode);
    void exit();

    /**
     * @brief Escape key.
     * @return true if a mode was active and has been exited.
     */
    bool handleEscape();

    ToolHandler* handler(ToolMode mode) const { return m_handlers.value(mode, nullptr); }
    ToolHandler* activeHandler() const { return handler(m_mode); }

    RedactTool* redactTool() const;
    DrawTool* drawTool() const;
    AddFieldTool* addFieldTool() const;

    /// Banner of the active mode, empty when no mode is active.
    QString bannerText() const;

    QVector<MarkPrimitive> previewPrimitives(int page) const;

signals:
    void modeChanged(ToolMode mode, ToolMode previous);

    /// Empty text hides the banner.
    void bannerChanged(const QString& text);

    void previewChanged(int page);
    void inlineEditorRequested(int markId);

private slots:
    void onPagesAboutToReset();
    void onPagesReset();

private:
    void attachActive();

    PageRenderPipeline* m_pipeline;
    QMap<ToolMode, ToolHandler*> m_handlers;
    ToolMode m_mode = ToolMode::None;
};
