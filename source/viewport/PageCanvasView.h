#pragma once

// ============================================================================
// PageCanvasView - Scrollable continuous column of pages
// ============================================================================
// Hosts one PageWidget per slot of the PageRenderPipeline and keeps them in
// sync with pagesReset(). Scrolling reports the viewport position to the
// pipeline (current page tracking); scrollRequested() moves the viewport.
//
// Inline editors: when a tool asks for one, a QLineEdit (text box) or a
// QPlainTextEdit (sticky note) is placed over the mark. Edits are written
// straight into the mark; a request for mark 0 closes the editor.
// ============================================================================

#include <QPointer>
#include <QScrollArea>
#include <QVector>

class PageRenderPipeline;
class PageWidget;
class ToolModeController;

class PageCanvasView : public QScrollArea {
    Q_OBJECT

public:
    static constexpr int PAGE_MARGIN = 20;
    static constexpr int STICKY_EDITOR_WIDTH = 180;
    static constexpr int STICKY_EDITOR_HEIGHT = 72;

    PageCanvasView(PageRenderPipeline* pipeline, ToolModeController* tools, QWidget* parent = nullptr);

    PageWidget* pageWidget(int page) const;
    int pageWidgetCount() const { return m_pageWidgets.size(); }

    /// Mark currently being edited inline, 0 if none.
    int editingMark() const { return m_editingMark; }
    QWidget* inlineEditor() const { return m_editor.data(); }

    /// Open or close (markId 0) the inline editor.
    void showInlineEditor(int markId);

protected:
    void resizeEvent(QResizeEvent* event) override;

private:
    void onPagesAboutToReset();
    void onPagesReset();
    void onScrollRequested(int page, qreal y);
    void onScrolled(int value);
    void layoutPages();
    void positionEditor();
    void closeEditor();

    PageRenderPipeline* m_pipeline;
    ToolModeController* m_tools;
    QWidget* m_column;
    QVector<PageWidget*> m_pageWidgets;

    QPointer<QWidget> m_editor;
    int m_editingMark = 0;
    QMetaObject::Connection m_marksConnection;
};
