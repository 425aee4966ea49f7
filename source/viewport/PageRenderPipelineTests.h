#ifndef PAGERENDERPIPELINETESTS_H
#define PAGERENDERPIPELINETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QThreadPool>
#include <QRegularExpression>
#include "PageRenderPipeline.h"
#include "../core/Workspace.h"
#include "../core/WorkspaceTestSupport.h"
#include "../pdf/MockPdfEngine.h"

/**
 * Unit tests for PageRenderPipeline.
 * Run with: pdfdesk --test-render
 */
class PageRenderPipelineTests : public QObject {
    Q_OBJECT

private:
    MockPdfEngine m_engine;

    static bool allRendered(const PageRenderPipeline& pipeline) {
        for (int page = 1; page <= pipeline.slotCount(); ++page) {
            if (!pipeline.slot(page)->rendered) {
                return false;
            }
        }
        return pipeline.slotCount() > 0;
    }

private slots:
    void cleanup() {
        QThreadPool::globalInstance()->waitForDone();
    }

    void testLayoutFollowsZoom() {
        Workspace ws(&m_engine);
        openDocument(ws, MockPdfEngine::makeDocument(3), "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        pipeline.setSession(ws.activeSession());

        QCOMPARE(pipeline.slotCount(), 3);
        QCOMPARE(pipeline.slot(1)->bounds, QRectF(0, 0, 612, 792));
        QCOMPARE(pipeline.slot(2)->bounds.top(), 792 + PageRenderPipeline::PAGE_GAP);
        QCOMPARE(pipeline.overlays(OverlayKind::Redaction).size(), 3);
        QCOMPARE(pipeline.overlay(2, OverlayKind::TextEdit)->page(), 2);

        QSignalSpy aboutToReset(&pipeline, &PageRenderPipeline::pagesAboutToReset);
        QSignalSpy reset(&pipeline, &PageRenderPipeline::pagesReset);
        ws.activeSession()->setZoom(2.0);
        QCOMPARE(aboutToReset.count(), 1);
        QCOMPARE(reset.count(), 1);
        QCOMPARE(pipeline.slot(1)->bounds.size(), QSizeF(1224, 1584));
    }

    void testPageAt() {
        Workspace ws(&m_engine);
        openDocument(ws, MockPdfEngine::makeDocument(3), "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        pipeline.setSession(ws.activeSession());

        QCOMPARE(pipeline.pageAt(10), 1);
        QCOMPARE(pipeline.pageAt(900), 2);
        QCOMPARE(pipeline.pageAt(100000), 3);
        QCOMPARE(pipeline.pageAt(-50), 1);
    }

    void testRendersEveryPage() {
        Workspace ws(&m_engine);
        openDocument(ws, MockPdfEngine::makeDocument(3), "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        pipeline.setSession(ws.activeSession());

        QTRY_VERIFY(allRendered(pipeline));
        QTRY_VERIFY(!pipeline.isRendering());
        QCOMPARE(pipeline.slot(3)->image.size(), QSize(612, 792));
        QVERIFY(!pipeline.slot(3)->failed);

        // Thumbnails arrive for every page
        QTRY_VERIFY(!ws.activeSession()->thumbnails().at(2).isNull());
        QCOMPARE(ws.activeSession()->thumbnails().at(0).width(),
                 PageRenderPipeline::DEFAULT_THUMBNAIL_WIDTH);
    }

    void testFailedPageGetsPlaceholder() {
        Workspace ws(&m_engine);
        const QByteArray bytes = MockPdfEngine::withPageProperty(
            MockPdfEngine::makeDocument(3), 1, "renderFails", true);
        openDocument(ws, bytes, "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Page 2 failed to render"));
        pipeline.setSession(ws.activeSession());

        QTRY_VERIFY(allRendered(pipeline));
        QVERIFY(pipeline.slot(2)->failed);
        QVERIFY(!pipeline.slot(2)->image.isNull());
        QVERIFY(!pipeline.slot(1)->failed);
        QVERIFY(!pipeline.slot(3)->failed);
    }

    void testSupersededRenderIsDropped() {
        Workspace ws(&m_engine);
        const QByteArray bytes = MockPdfEngine::withPageProperty(
            MockPdfEngine::makeDocument(2), 0, "renderDelayMs", 150);
        openDocument(ws, bytes, "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        QSignalSpy finished(&pipeline, &PageRenderPipeline::renderFinished);

        pipeline.setSession(ws.activeSession());
        const quint64 first = pipeline.generation();
        pipeline.render();
        pipeline.render();
        const quint64 latest = pipeline.generation();
        QCOMPARE(latest, first + 2);

        QTRY_VERIFY(!pipeline.isRendering());
        QVERIFY(allRendered(pipeline));
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.first().at(0).value<quint64>(), latest);
    }

    void testScrollTrackingCooldown() {
        Workspace ws(&m_engine);
        openDocument(ws, MockPdfEngine::makeDocument(4), "a.pdf", nullptr);
        DocumentSession* session = ws.activeSession();
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        pipeline.setTrackingCooldown(100);
        pipeline.setSession(session);

        QSignalSpy scroll(&pipeline, &PageRenderPipeline::scrollRequested);
        pipeline.scrollToPage(3);
        QCOMPARE(scroll.count(), 1);
        QCOMPARE(scroll.last().at(0).toInt(), 3);
        QCOMPARE(scroll.last().at(1).toReal(), pipeline.slot(3)->bounds.top());
        QVERIFY(!pipeline.isTracking());

        // Scroll events during the cooldown do not move the page number
        pipeline.updateScrollPosition(0, 400);
        QCOMPARE(session->currentPage(), 1);

        QTRY_VERIFY(pipeline.isTracking());
        pipeline.updateScrollPosition(pipeline.slot(4)->bounds.top(), 400);
        QCOMPARE(session->currentPage(), 4);
    }

    void testClearingSession() {
        Workspace ws(&m_engine);
        openDocument(ws, MockPdfEngine::makeDocument(2), "a.pdf", nullptr);
        PageRenderPipeline pipeline(&MockPdfProvider::create);
        pipeline.setSession(ws.activeSession());

        pipeline.setSession(nullptr);
        QCOMPARE(pipeline.slotCount(), 0);
        QVERIFY(pipeline.contentSize().isEmpty());
        QVERIFY(!pipeline.session());
    }
};

#endif // PAGERENDERPIPELINETESTS_H
