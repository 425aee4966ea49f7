#ifndef PAGETHUMBNAILMODELTESTS_H
#define PAGETHUMBNAILMODELTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QMimeData>
#include <QPixmap>
#include <memory>
#include "PageThumbnailModel.h"
#include "../core/Workspace.h"
#include "../core/WorkspaceTestSupport.h"
#include "../pdf/MockPdfEngine.h"

/**
 * Unit tests for PageThumbnailModel.
 * Run with: pdfdesk --test-model
 */
class PageThumbnailModelTests : public QObject {
    Q_OBJECT

private:
    MockPdfEngine m_engine;

    DocumentSession* openSession(Workspace& ws, int pages) {
        int id = 0;
        if (!openDocument(ws, MockPdfEngine::makeDocument(pages), "strip.pdf", &id).success) {
            return nullptr;
        }
        return ws.session(id);
    }

private slots:
    void testRowsFollowSession() {
        Workspace ws(&m_engine);
        PageThumbnailModel model;
        QCOMPARE(model.rowCount(), 0);

        DocumentSession* session = openSession(ws, 4);
        QVERIFY(session);
        model.setSession(session);
        QCOMPARE(model.rowCount(), 4);

        const QModelIndex second = model.index(1);
        QCOMPARE(model.data(second, Qt::DisplayRole).toString(), QString("2"));
        QCOMPARE(model.data(second, PageThumbnailModel::PageNumberRole).toInt(), 2);
        QVERIFY(!model.data(model.index(0), PageThumbnailModel::ThumbnailRole).value<QPixmap>().isNull());

        model.setSession(nullptr);
        QCOMPARE(model.rowCount(), 0);
    }

    void testCurrentAndSelectedRoles() {
        Workspace ws(&m_engine);
        DocumentSession* session = openSession(ws, 3);
        QVERIFY(session);
        PageThumbnailModel model;
        model.setSession(session);
        QSignalSpy changed(&model, &QAbstractItemModel::dataChanged);

        session->setCurrentPage(3);
        QVERIFY(changed.count() >= 1);
        QVERIFY(model.data(model.index(2), PageThumbnailModel::IsCurrentPageRole).toBool());
        QVERIFY(!model.data(model.index(0), PageThumbnailModel::IsCurrentPageRole).toBool());

        session->togglePageSelection(2);
        QVERIFY(model.data(model.index(1), PageThumbnailModel::IsSelectedRole).toBool());
        QVERIFY(!model.data(model.index(2), PageThumbnailModel::IsSelectedRole).toBool());
    }

    void testThumbnailChangeIsSignalled() {
        Workspace ws(&m_engine);
        DocumentSession* session = openSession(ws, 2);
        QVERIFY(session);
        PageThumbnailModel model;
        model.setSession(session);
        QSignalSpy changed(&model, &QAbstractItemModel::dataChanged);

        QImage image(100, 130, QImage::Format_ARGB32);
        image.fill(Qt::blue);
        session->setThumbnail(2, image);

        QCOMPARE(changed.count(), 1);
        QCOMPARE(changed.first().at(0).value<QModelIndex>().row(), 1);
        const QPixmap pixmap = model.data(model.index(1), PageThumbnailModel::ThumbnailRole).value<QPixmap>();
        QCOMPARE(pixmap.size(), QSize(100, 130));
    }

    void testDropEmitsPageMove() {
        Workspace ws(&m_engine);
        DocumentSession* session = openSession(ws, 4);
        QVERIFY(session);
        PageThumbnailModel model;
        model.setSession(session);
        QSignalSpy dropped(&model, &PageThumbnailModel::pageDropped);

        // Drag page 1 to the gap after page 3
        std::unique_ptr<QMimeData> mime(model.mimeData({model.index(0)}));
        QVERIFY(mime);
        QVERIFY(model.canDropMimeData(mime.get(), Qt::MoveAction, 3, 0, QModelIndex()));
        QVERIFY(!model.dropMimeData(mime.get(), Qt::MoveAction, 3, 0, QModelIndex()));

        QCOMPARE(dropped.count(), 1);
        QCOMPARE(dropped.first().at(0).toInt(), 1);
        QCOMPARE(dropped.first().at(1).toInt(), 3);
        // The model never reorders itself
        QCOMPARE(model.rowCount(), 4);
    }

    void testDropOntoItselfIsIgnored() {
        Workspace ws(&m_engine);
        DocumentSession* session = openSession(ws, 3);
        QVERIFY(session);
        PageThumbnailModel model;
        model.setSession(session);
        QSignalSpy dropped(&model, &PageThumbnailModel::pageDropped);

        std::unique_ptr<QMimeData> mime(model.mimeData({model.index(1)}));
        QVERIFY(mime);
        QVERIFY(!model.dropMimeData(mime.get(), Qt::MoveAction, 1, 0, QModelIndex()));
        QVERIFY(!model.canDropMimeData(mime.get(), Qt::CopyAction, 1, 0, QModelIndex()));
        QVERIFY(!model.canDropMimeData(mime.get(), Qt::MoveAction, 9, 0, QModelIndex()));
        QCOMPARE(dropped.count(), 0);
    }
};

#endif // PAGETHUMBNAILMODELTESTS_H
