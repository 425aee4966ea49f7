#include "ToolModeController.h"
#include "AddFieldTool.h"
#include "AnnotateTool.h"
#include "DrawTool.h"
#include "RedactTool.h"
#include "TextEditTool.h"
#include "../viewport/PageRenderPipeline.h"

#include <QDebug>

ToolModeController::ToolModeController(PageRenderPipeline* pipeline, QObject* parent)
    : QObject(parent)
    , m_pipeline(pipeline)
{
    m_handlers.insert(ToolMode::TextEdit, new TextEditTool(this));
    m_handlers.insert(ToolMode::Redact, new RedactTool(this));
    m_handlers.insert(ToolMode::Highlight, new AnnotateTool(ToolMode::Highlight, this));
    m_handlers.insert(ToolMode::Underline, new AnnotateTool(ToolMode::Underline, this));
    m_handlers.insert(ToolMode::Sticky, new AnnotateTool(ToolMode::Sticky, this));
    m_handlers.insert(ToolMode::Draw, new DrawTool(this));
    m_handlers.insert(ToolMode::AddField, new AddFieldTool(this));

    for (ToolHandler* h : m_handlers) {
        connect(h, &ToolHandler::previewChanged, this, &ToolModeController::previewChanged);
        connect(h, &ToolHandler::inlineEditorRequested,
                this, &ToolModeController::inlineEditorRequested);
    }

    if (m_pipeline) {
        connect(m_pipeline, &PageRenderPipeline::pagesAboutToReset,
                this, &ToolModeController::onPagesAboutToReset);
        connect(m_pipeline, &PageRenderPipeline::pagesReset,
                this, &ToolModeController::onPagesReset);
    }
}

ToolModeController::~ToolModeController()
{
    // Handlers are children; detach them while the overlays still exist
    for (ToolHandler* h : m_handlers) {
        h->detach();
    }
}

ToolMode ToolModeController::toggle(ToolMode mode)
{
    if (mode == m_mode) {
        exit();
    } else {
        enter(mode);
    }
    return m_mode;
}

void ToolModeController::enter(ToolMode mode)
{
    if (mode == ToolMode::None) {
        exit();
        return;
    }
    if (mode == m_mode) {
        return;
    }

    const ToolMode previous = m_mode;
    if (ToolHandler* current = activeHandler()) {
        current->detach();
    }

    m_mode = mode;
    attachActive();

    qDebug() << "ToolModeController: Entered" << toolModeName(mode);
    emit modeChanged(m_mode, previous);
    emit bannerChanged(bannerText());
}

void ToolModeController::exit()
{
    if (m_mode == ToolMode::None) {
        return;
    }

    const ToolMode previous = m_mode;
    if (ToolHandler* current = activeHandler()) {
        current->detach();
    }
    m_mode = ToolMode::None;

    qDebug() << "ToolModeController: Exited" << toolModeName(previous);
    emit modeChanged(m_mode, previous);
    emit bannerChanged(QString());
}

bool ToolModeController::handleEscape()
{
    if (m_mode == ToolMode::None) {
        return false;
    }
    exit();
    return true;
}

RedactTool* ToolModeController::redactTool() const
{
    return static_cast<RedactTool*>(handler(ToolMode::Redact));
}

DrawTool* ToolModeController::drawTool() const
{
    return static_cast<DrawTool*>(handler(ToolMode::Draw));
}

AddFieldTool* ToolModeController::addFieldTool() const
{
    return static_cast<AddFieldTool*>(handler(ToolMode::AddField));
}

QString ToolModeController::bannerText() const
{
    ToolHandler* h = activeHandler();
    return h ? h->bannerText() : QString();
}

QVector<MarkPrimitive> ToolModeController::previewPrimitives(int page) const
{
    ToolHandler* h = activeHandler();
    return h ? h->previewPrimitives(page) : QVector<MarkPrimitive>();
}

void ToolModeController::attachActive()
{
    ToolHandler* h = activeHandler();
    if (!h || !m_pipeline) {
        return;
    }
    h->attach(m_pipeline->overlays(h->layer()), m_pipeline->session());
}

void ToolModeController::onPagesAboutToReset()
{
    if (ToolHandler* h = activeHandler()) {
        h->detach();
    }
}

void ToolModeController::onPagesReset()
{
    attachActive();
}
