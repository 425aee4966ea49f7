#include "PageCanvasView.h"
#include "PageRenderPipeline.h"
#include "PageWidget.h"
#include "../core/DocumentSession.h"
#include "../tools/ToolModeController.h"

#include <QDebug>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QResizeEvent>
#include <QScrollBar>
#include <QtMath>

PageCanvasView::PageCanvasView(PageRenderPipeline* pipeline, ToolModeController* tools, QWidget* parent)
    : QScrollArea(parent)
    , m_pipeline(pipeline)
    , m_tools(tools)
    , m_column(new QWidget)
{
    setObjectName(QStringLiteral("pageCanvas"));
    setWidgetResizable(false);
    setAlignment(Qt::AlignLeft | Qt::AlignTop);
    setBackgroundRole(QPalette::Dark);
    setWidget(m_column);

    connect(m_pipeline, &PageRenderPipeline::pagesAboutToReset, this, &PageCanvasView::onPagesAboutToReset);
    connect(m_pipeline, &PageRenderPipeline::pagesReset, this, &PageCanvasView::onPagesReset);
    connect(m_pipeline, &PageRenderPipeline::scrollRequested, this, &PageCanvasView::onScrollRequested);
    connect(verticalScrollBar(), &QScrollBar::valueChanged, this, &PageCanvasView::onScrolled);

    if (m_tools) {
        connect(m_tools, &ToolModeController::inlineEditorRequested,
                this, &PageCanvasView::showInlineEditor);
    }

    onPagesReset();
}

PageWidget* PageCanvasView::pageWidget(int page) const
{
    if (page < 1 || page > m_pageWidgets.size()) {
        return nullptr;
    }
    return m_pageWidgets.at(page - 1);
}

// ============================================================================
// Pages
// ============================================================================

void PageCanvasView::onPagesAboutToReset()
{
    closeEditor();
    qDeleteAll(m_pageWidgets);
    m_pageWidgets.clear();
}

void PageCanvasView::onPagesReset()
{
    closeEditor();
    qDeleteAll(m_pageWidgets);
    m_pageWidgets.clear();

    for (int page = 1; page <= m_pipeline->slotCount(); ++page) {
        auto* widget = new PageWidget(m_pipeline, m_tools, page, m_column);
        widget->show();
        m_pageWidgets.append(widget);
    }
    layoutPages();
}

void PageCanvasView::layoutPages()
{
    const QSizeF content = m_pipeline->contentSize();
    const int columnWidth = qMax(viewport()->width(), qCeil(content.width()) + 2 * PAGE_MARGIN);
    const int columnHeight = qMax(viewport()->height(), qCeil(content.height()) + 2 * PAGE_MARGIN);
    m_column->resize(columnWidth, columnHeight);

    for (PageWidget* widget : m_pageWidgets) {
        const PageSlot* slot = m_pipeline->slot(widget->page());
        if (!slot) {
            continue;
        }
        const QRectF bounds = slot->bounds;
        const int x = qRound((columnWidth - bounds.width()) / 2.0);
        widget->setGeometry(x, qRound(bounds.top()) + PAGE_MARGIN,
                            qRound(bounds.width()), qRound(bounds.height()));
    }
    positionEditor();
}

void PageCanvasView::resizeEvent(QResizeEvent* event)
{
    QScrollArea::resizeEvent(event);
    layoutPages();
}

// ============================================================================
// Scrolling
// ============================================================================

void PageCanvasView::onScrollRequested(int page, qreal y)
{
    Q_UNUSED(page);
    verticalScrollBar()->setValue(qRound(y));
}

void PageCanvasView::onScrolled(int value)
{
    m_pipeline->updateScrollPosition(value - PAGE_MARGIN, viewport()->height());
}

// ============================================================================
// Inline editors
// ============================================================================

void PageCanvasView::showInlineEditor(int markId)
{
    closeEditor();

    DocumentSession* session = m_pipeline->session();
    if (markId <= 0 || !session) {
        return;
    }
    const Mark* mark = session->marks()->find(markId);
    PageWidget* page = mark ? pageWidget(mark->page) : nullptr;
    if (!page) {
        qWarning() << "PageCanvasView: No page for inline editor of mark" << markId;
        return;
    }

    MarkStore* marks = session->marks();
    m_editingMark = markId;

    if (mark->kind == Mark::StickyNote) {
        auto* editor = new QPlainTextEdit(page);
        editor->setObjectName(QStringLiteral("stickyEditor"));
        editor->setPlaceholderText(tr("Note..."));
        editor->setPlainText(mark->text);
        connect(editor, &QPlainTextEdit::textChanged, this, [marks, markId, editor]() {
            marks->setText(markId, editor->toPlainText());
        });
        m_editor = editor;
    } else {
        auto* editor = new QLineEdit(page);
        editor->setObjectName(QStringLiteral("textBoxEditor"));
        editor->setPlaceholderText(tr("Type text..."));
        editor->setFrame(false);
        QFont font = editor->font();
        font.setPixelSize(qRound(mark->fontSize));
        editor->setFont(font);
        editor->setText(mark->text);
        connect(editor, &QLineEdit::textEdited, this, [marks, markId](const QString& text) {
            marks->setText(markId, text);
        });
        m_editor = editor;
    }

    // Follow the mark while it is dragged
    m_marksConnection = connect(marks, &MarkStore::marksChanged, this, [this](int) {
        positionEditor();
    });

    positionEditor();
    m_editor->show();
    m_editor->setFocus();
}

void PageCanvasView::positionEditor()
{
    DocumentSession* session = m_pipeline->session();
    if (!m_editor || !session) {
        return;
    }
    const Mark* mark = session->marks()->find(m_editingMark);
    if (!mark) {
        closeEditor();
        return;
    }

    if (mark->kind == Mark::StickyNote) {
        const QRectF icon = mark->hitRect();
        m_editor->setGeometry(qRound(icon.left()), qRound(icon.bottom()) + 2,
                              STICKY_EDITOR_WIDTH, STICKY_EDITOR_HEIGHT);
    } else {
        m_editor->setGeometry(mark->rect.toRect().adjusted(1, 1, -1, -1));
    }
}

void PageCanvasView::closeEditor()
{
    disconnect(m_marksConnection);
    m_editingMark = 0;
    if (m_editor) {
        m_editor->deleteLater();
        m_editor = nullptr;
    }
}
