#ifndef WORKSPACETESTS_H
#define WORKSPACETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QRegularExpression>
#include "Workspace.h"
#include "WorkspaceTestSupport.h"
#include "../pdf/MockPdfEngine.h"

/**
 * Unit tests for Workspace and DocumentSession.
 * Run with: pdfdesk --test-workspace
 */
class WorkspaceTests : public QObject {
    Q_OBJECT

private:
    MockPdfEngine m_engine;

private slots:
    void testOpenAssignsIncreasingIds() {
        Workspace ws(&m_engine);
        QVERIFY(ws.isEmpty());
        QCOMPARE(ws.activeIndex(), -1);

        int first = 0;
        int second = 0;
        QVERIFY(openDocument(ws, MockPdfEngine::makeDocument(3), "a.pdf", &first).success);
        QVERIFY(openDocument(ws, MockPdfEngine::makeDocument(1), "b.pdf", &second).success);
        QCOMPARE(first, 1);
        QCOMPARE(second, 2);
        QCOMPARE(ws.sessionCount(), 2);
        QCOMPARE(ws.activeIndex(), 1);
        QCOMPARE(ws.activeSession()->name(), QString("b.pdf"));
        QCOMPARE(ws.session(first)->pageCount(), 3);
    }

    void testLoadErrorLeavesWorkspaceUnchanged() {
        Workspace ws(&m_engine);
        int id = 0;
        openDocument(ws, MockPdfEngine::makeDocument(2), "good.pdf", &id);
        QSignalSpy opened(&ws, &Workspace::sessionOpened);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Failed to load"));
        const OperationResult result = openDocument(ws, "not a pdf at all", "bad.pdf", nullptr);
        QVERIFY(!result.success);
        QCOMPARE(result.error, ErrorKind::LoadError);
        QVERIFY(result.message.contains("bad.pdf"));
        QCOMPARE(ws.sessionCount(), 1);
        QCOMPARE(ws.activeSession()->id(), id);
        QCOMPARE(opened.count(), 0);
    }

    void testZeroPageDocumentIsRejected() {
        Workspace ws(&m_engine);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Failed to load"));
        const OperationResult result = openDocument(ws, MockPdfEngine::makeDocument(0), "empty.pdf", nullptr);
        QVERIFY(!result.success);
        QVERIFY(ws.isEmpty());
    }

    void testSwitchPreservesViewState() {
        Workspace ws(&m_engine);
        int a = 0;
        int b = 0;
        openDocument(ws, MockPdfEngine::makeDocument(5), "a.pdf", &a);
        DocumentSession* first = ws.session(a);
        first->setCurrentPage(4);
        first->setZoom(1.5);
        first->togglePageSelection(2);

        openDocument(ws, MockPdfEngine::makeDocument(2), "b.pdf", &b);
        QCOMPARE(ws.activeSession()->currentPage(), 1);

        QSignalSpy active(&ws, &Workspace::activeSessionChanged);
        QVERIFY(ws.switchTo(a));
        QCOMPARE(active.count(), 1);
        QCOMPARE(ws.activeSession(), first);
        QCOMPARE(first->currentPage(), 4);
        QCOMPARE(first->zoom(), 1.5);
        QCOMPARE(first->selectedPages(), QVector<int>({2}));

        // Already active
        QVERIFY(ws.switchTo(a));
        QCOMPARE(active.count(), 1);
        QVERIFY(!ws.switchTo(99));
    }

    void testClosingLastSessionEmptiesWorkspace() {
        Workspace ws(&m_engine);
        int a = 0;
        int b = 0;
        openDocument(ws, MockPdfEngine::makeDocument(1), "a.pdf", &a);
        openDocument(ws, MockPdfEngine::makeDocument(1), "b.pdf", &b);

        QSignalSpy emptied(&ws, &Workspace::workspaceEmptied);
        QSignalSpy closed(&ws, &Workspace::sessionClosed);

        QVERIFY(ws.close(b));
        QCOMPARE(ws.activeSession()->id(), a);
        QCOMPARE(emptied.count(), 0);

        QVERIFY(ws.close(a));
        QVERIFY(ws.isEmpty());
        QVERIFY(!ws.activeSession());
        QCOMPARE(ws.activeIndex(), -1);
        QCOMPARE(emptied.count(), 1);
        QCOMPARE(closed.count(), 2);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Session not found"));
        QVERIFY(!ws.close(a));
    }

    void testClosingInactiveKeepsActive() {
        Workspace ws(&m_engine);
        int a = 0, b = 0, c = 0;
        openDocument(ws, MockPdfEngine::makeDocument(1), "a.pdf", &a);
        openDocument(ws, MockPdfEngine::makeDocument(1), "b.pdf", &b);
        openDocument(ws, MockPdfEngine::makeDocument(1), "c.pdf", &c);
        ws.switchTo(b);

        QVERIFY(ws.close(a));
        QCOMPARE(ws.activeSession()->id(), b);
        QCOMPARE(ws.activeIndex(), 0);
    }

    void testCommitReplacesSnapshot() {
        Workspace ws(&m_engine);
        int id = 0;
        openDocument(ws, MockPdfEngine::makeDocument(4), "a.pdf", &id);
        DocumentSession* session = ws.session(id);
        session->setCurrentPage(4);
        session->togglePageSelection(3);
        const quint64 before = session->snapshot().version();

        const QByteArray bytes = MockPdfEngine::makeDocument(2);
        DocumentInfo info;
        QVERIFY(m_engine.inspect(bytes, info));

        QSignalSpy committed(&ws, &Workspace::sessionCommitted);
        QVERIFY(ws.commit(DocumentSnapshot::create(bytes), info, 0));
        QCOMPARE(committed.count(), 1);
        QVERIFY(session->snapshot().version() > before);
        QCOMPARE(session->pageCount(), 2);
        // Current page clamped, selection cleared
        QCOMPARE(session->currentPage(), 2);
        QVERIFY(session->selection().isEmpty());
        QCOMPARE(session->thumbnails().size(), 2);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Rejected commit"));
        QVERIFY(!ws.commitTo(id, DocumentSnapshot(), info, 0));
    }

    void testSessionClampsNavigation() {
        Workspace ws(&m_engine);
        int id = 0;
        openDocument(ws, MockPdfEngine::makeDocument(3), "a.pdf", &id);
        DocumentSession* session = ws.session(id);

        session->setCurrentPage(10);
        QCOMPARE(session->currentPage(), 3);
        session->setCurrentPage(-1);
        QCOMPARE(session->currentPage(), 1);

        session->setZoom(9.0);
        QCOMPARE(session->zoom(), DocumentSession::MAX_ZOOM);
        session->setZoom(0.01);
        QCOMPARE(session->zoom(), DocumentSession::MIN_ZOOM);

        session->togglePageSelection(7);
        QVERIFY(session->selection().isEmpty());
        session->selectAllPages();
        QCOMPARE(session->selectedPages(), QVector<int>({1, 2, 3}));
        session->togglePageSelection(2);
        QCOMPARE(session->selectedPages(), QVector<int>({1, 3}));
    }

    void testUndoLimitAppliesToNewSessions() {
        Workspace ws(&m_engine);
        ws.setUndoLimit(7);
        int id = 0;
        openDocument(ws, MockPdfEngine::makeDocument(1), "a.pdf", &id);
        QCOMPARE(ws.session(id)->undoStack()->maxDepth(), 7);
    }

    void testRotatedDisplaySize() {
        Workspace ws(&m_engine);
        int id = 0;
        const QByteArray bytes = MockPdfEngine::withPageProperty(
            MockPdfEngine::makeDocument(2), 1, "rot", 90);
        openDocument(ws, bytes, "a.pdf", &id);
        DocumentSession* session = ws.session(id);
        QCOMPARE(session->rotation(2), 90);
        QCOMPARE(session->pageSize(2), QSizeF(612, 792));
        QCOMPARE(session->displaySize(2), QSizeF(792, 612));
        QCOMPARE(session->displaySize(1), QSizeF(612, 792));
    }
};

#endif // WORKSPACETESTS_H
