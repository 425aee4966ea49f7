#ifndef TOOLMODECONTROLLERTESTS_H
#define TOOLMODECONTROLLERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QThreadPool>
#include "ToolModeController.h"
#include "AddFieldTool.h"
#include "DrawTool.h"
#include "RedactTool.h"
#include "../core/Workspace.h"
#include "../core/WorkspaceTestSupport.h"
#include "../pdf/MockPdfEngine.h"
#include "../viewport/PageRenderPipeline.h"

/**
 * Unit tests for ToolModeController and the tool handlers.
 * Run with: pdfdesk --test-tools
 */
class ToolModeControllerTests : public QObject {
    Q_OBJECT

private:
    MockPdfEngine m_engine;
    Workspace* m_workspace = nullptr;
    PageRenderPipeline* m_pipeline = nullptr;
    ToolModeController* m_controller = nullptr;

    DocumentSession* session() const { return m_workspace->activeSession(); }

    int listenersOn(OverlayKind kind) const {
        int total = 0;
        for (OverlaySurface* surface : m_pipeline->overlays(kind)) {
            total += surface->listenerCount();
        }
        return total;
    }

    bool send(int page, OverlayKind kind, PointerEvent::Type type, const QPointF& pos,
              Qt::MouseButton button = Qt::LeftButton) {
        PointerEvent event;
        event.type = type;
        event.pos = pos;
        event.button = button;
        return m_pipeline->overlay(page, kind)->dispatch(event);
    }

    void drag(int page, OverlayKind kind, const QPointF& from, const QPointF& to) {
        send(page, kind, PointerEvent::Press, from);
        send(page, kind, PointerEvent::Move, (from + to) / 2);
        send(page, kind, PointerEvent::Move, to);
        send(page, kind, PointerEvent::Release, to);
    }

private slots:
    void init() {
        m_workspace = new Workspace(&m_engine);
        openDocument(*m_workspace, MockPdfEngine::makeDocument(3), "tools.pdf", nullptr);
        m_pipeline = new PageRenderPipeline(&MockPdfProvider::create);
        m_pipeline->setSession(session());
        m_controller = new ToolModeController(m_pipeline);
    }

    void cleanup() {
        delete m_controller;
        delete m_pipeline;
        delete m_workspace;
        QThreadPool::globalInstance()->waitForDone();
    }

    void testToggleEntersAndExits() {
        QSignalSpy modes(m_controller, &ToolModeController::modeChanged);
        QSignalSpy banners(m_controller, &ToolModeController::bannerChanged);

        QCOMPARE(m_controller->toggle(ToolMode::Redact), ToolMode::Redact);
        QCOMPARE(listenersOn(OverlayKind::Redaction), 3);
        QVERIFY(!m_controller->bannerText().isEmpty());
        QCOMPARE(banners.last().at(0).toString(), m_controller->bannerText());

        QCOMPARE(m_controller->toggle(ToolMode::Redact), ToolMode::None);
        QCOMPARE(listenersOn(OverlayKind::Redaction), 0);
        QVERIFY(banners.last().at(0).toString().isEmpty());
        QCOMPARE(modes.count(), 2);
    }

    void testOnlyOneHandlerAttached() {
        m_controller->enter(ToolMode::TextEdit);
        m_controller->enter(ToolMode::Highlight);

        QCOMPARE(m_controller->mode(), ToolMode::Highlight);
        QCOMPARE(listenersOn(OverlayKind::TextEdit), 0);
        QCOMPARE(listenersOn(OverlayKind::Annotation), 3);

        // Sibling annotate modes share a layer but not listeners
        m_controller->enter(ToolMode::Draw);
        QCOMPARE(listenersOn(OverlayKind::Annotation), 3);
        QVERIFY(!m_controller->handler(ToolMode::Highlight)->isAttached());
        QVERIFY(m_controller->handler(ToolMode::Draw)->isAttached());
    }

    void testReattachAfterZoom() {
        m_controller->enter(ToolMode::Redact);
        session()->setZoom(2.0);

        QCOMPARE(m_controller->mode(), ToolMode::Redact);
        QCOMPARE(m_controller->activeHandler()->registrationCount(), 3);
        QCOMPARE(listenersOn(OverlayKind::Redaction), 3);
    }

    void testEscapeExits() {
        QVERIFY(!m_controller->handleEscape());
        m_controller->enter(ToolMode::Sticky);
        QVERIFY(m_controller->handleEscape());
        QCOMPARE(m_controller->mode(), ToolMode::None);
        QCOMPARE(listenersOn(OverlayKind::Annotation), 0);
    }

    void testRedactMinimumSize() {
        m_controller->enter(ToolMode::Redact);

        drag(1, OverlayKind::Redaction, QPointF(10, 10), QPointF(14, 40));
        QCOMPARE(session()->marks()->count(Mark::RedactRect), 0);

        // Exactly the minimum is kept
        drag(1, OverlayKind::Redaction, QPointF(10, 10), QPointF(15, 15));
        QCOMPARE(session()->marks()->count(Mark::RedactRect), 1);

        drag(2, OverlayKind::Redaction, QPointF(100, 100), QPointF(50, 80));
        const QVector<Mark> marks = session()->marks()->marksOnPage(2);
        QCOMPARE(marks.size(), 1);
        QCOMPARE(marks.first().rect, QRectF(50, 80, 50, 20));
        QCOMPARE(session()->undoStack()->undoCount(), 2);
    }

    void testRedactRightClickRemoves() {
        m_controller->enter(ToolMode::Redact);
        drag(1, OverlayKind::Redaction, QPointF(10, 10), QPointF(60, 60));
        QCOMPARE(session()->marks()->count(Mark::RedactRect), 1);

        QVERIFY(send(1, OverlayKind::Redaction, PointerEvent::Press, QPointF(30, 30), Qt::RightButton));
        QCOMPARE(session()->marks()->count(Mark::RedactRect), 0);
    }

    void testRedactPreviewWhileDragging() {
        m_controller->enter(ToolMode::Redact);
        send(1, OverlayKind::Redaction, PointerEvent::Press, QPointF(10, 10));
        send(1, OverlayKind::Redaction, PointerEvent::Move, QPointF(40, 40));
        QCOMPARE(m_controller->previewPrimitives(1).size(), 1);
        QCOMPARE(m_controller->previewPrimitives(2).size(), 0);

        // Leaving the mode drops the half-finished drag
        m_controller->exit();
        QCOMPARE(m_controller->redactTool()->previewPrimitives(1).size(), 0);
    }

    void testHighlightNeverStacks() {
        m_controller->enter(ToolMode::Highlight);
        QVERIFY(send(1, OverlayKind::Annotation, PointerEvent::Press, QPointF(200, 100)));
        QVERIFY(send(1, OverlayKind::Annotation, PointerEvent::Press, QPointF(210, 102)));
        QCOMPARE(session()->marks()->count(Mark::Highlight), 1);
        QCOMPARE(session()->marks()->marksOnPage(1).first().rect, QRectF(160, 92, 80, 16));
    }

    void testStickyClickOpensEditor() {
        m_controller->enter(ToolMode::Sticky);
        QSignalSpy editor(m_controller, &ToolModeController::inlineEditorRequested);

        send(1, OverlayKind::Annotation, PointerEvent::Press, QPointF(50, 50));
        const int id = session()->marks()->marksOfKind(Mark::StickyNote).first().id;

        send(1, OverlayKind::Annotation, PointerEvent::Press, QPointF(55, 55));
        QCOMPARE(editor.last().at(0).toInt(), id);
        send(1, OverlayKind::Annotation, PointerEvent::Press, QPointF(55, 55));
        QCOMPARE(editor.last().at(0).toInt(), 0);
    }

    void testDrawPath() {
        m_controller->enter(ToolMode::Draw);
        m_controller->drawTool()->setPen(Qt::blue, 3.0);
        drag(3, OverlayKind::Annotation, QPointF(0, 0), QPointF(40, 40));

        const QVector<Mark> paths = session()->marks()->marksOfKind(Mark::DrawPath);
        QCOMPARE(paths.size(), 1);
        QCOMPARE(paths.first().page, 3);
        QCOMPARE(paths.first().points.size(), 3);  // press + two moves
        QCOMPARE(paths.first().color, QColor(Qt::blue));
        QCOMPARE(paths.first().strokeWidth, 3.0);
    }

    void testTextBoxPlaceAndDrag() {
        m_controller->enter(ToolMode::TextEdit);
        send(1, OverlayKind::TextEdit, PointerEvent::Press, QPointF(20, 20));
        send(1, OverlayKind::TextEdit, PointerEvent::Release, QPointF(20, 20));
        QCOMPARE(session()->marks()->count(Mark::TextBox), 1);

        // Drag by a point inside the box
        drag(1, OverlayKind::TextEdit, QPointF(30, 30), QPointF(130, 80));
        QCOMPARE(session()->marks()->count(Mark::TextBox), 1);
        QCOMPARE(session()->marks()->marksOfKind(Mark::TextBox).first().rect.topLeft(),
                 QPointF(120, 70));
        QCOMPARE(session()->undoStack()->undoCount(), 1);
    }

    void testAddFieldRequestsPlacement() {
        m_controller->enter(ToolMode::AddField);
        QSignalSpy placed(m_controller->addFieldTool(), &AddFieldTool::fieldPlacementRequested);

        send(2, OverlayKind::TextEdit, PointerEvent::Press, QPointF(80, 90));
        QCOMPARE(placed.count(), 1);
        QCOMPARE(placed.last().at(0).toInt(), 2);
        QCOMPARE(placed.last().at(1).toPointF(), QPointF(80, 90));
        QCOMPARE(session()->marks()->count(Mark::FormField), 1);
        QVERIFY(!session()->undoStack()->canUndo());
    }
};

#endif // TOOLMODECONTROLLERTESTS_H
