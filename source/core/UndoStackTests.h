#ifndef UNDOSTACKTESTS_H
#define UNDOSTACKTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "UndoStack.h"

/**
 * Unit tests for UndoStack.
 * Run with: pdfdesk --test-undo
 */
class UndoStackTests : public QObject {
    Q_OBJECT

private:
    static UndoAction markAction(int id) {
        Mark mark = Mark::highlight(1, QPointF(100, 100));
        mark.id = id;
        return UndoAction::forMark(mark);
    }

private slots:
    void testEmptyStack() {
        UndoStack stack;
        QVERIFY(!stack.canUndo());
        QVERIFY(!stack.canRedo());
        UndoAction out;
        QVERIFY(!stack.takeUndo(out));
        QVERIFY(!stack.takeRedo(out));
        QCOMPARE(stack.maxDepth(), UndoStack::DEFAULT_MAX_DEPTH);
    }

    void testUndoMovesToRedo() {
        UndoStack stack;
        stack.push(markAction(1));
        stack.push(markAction(2));

        UndoAction out;
        QVERIFY(stack.takeUndo(out));
        QCOMPARE(out.mark.id, 2);
        QCOMPARE(stack.undoCount(), 1);
        QCOMPARE(stack.redoCount(), 1);

        QVERIFY(stack.takeRedo(out));
        QCOMPARE(out.mark.id, 2);
        QCOMPARE(stack.undoCount(), 2);
        QCOMPARE(stack.redoCount(), 0);
    }

    void testPushClearsRedo() {
        UndoStack stack;
        stack.push(markAction(1));
        UndoAction out;
        stack.takeUndo(out);
        QVERIFY(stack.canRedo());

        stack.push(markAction(2));
        QVERIFY(!stack.canRedo());
        QCOMPARE(stack.undoCount(), 1);
    }

    void testBoundEvictsOldest() {
        UndoStack stack(50);
        for (int i = 1; i <= 51; ++i) {
            stack.push(markAction(i));
        }
        QCOMPARE(stack.undoCount(), 50);
        // Entry 1 is gone, entry 2 is now the oldest
        QCOMPARE(stack.undoEntries().first().mark.id, 2);
        QCOMPARE(stack.undoEntries().last().mark.id, 51);

        UndoAction out;
        for (int i = 0; i < 50; ++i) {
            QVERIFY(stack.takeUndo(out));
        }
        QCOMPARE(out.mark.id, 2);
        QVERIFY(!stack.canUndo());
    }

    void testShrinkingBound() {
        UndoStack stack(10);
        for (int i = 1; i <= 8; ++i) {
            stack.push(markAction(i));
        }
        stack.setMaxDepth(3);
        QCOMPARE(stack.undoCount(), 3);
        QCOMPARE(stack.undoEntries().first().mark.id, 6);

        // Depth never drops below one
        stack.setMaxDepth(0);
        QCOMPARE(stack.maxDepth(), 1);
    }

    void testAmendRedoTop() {
        UndoStack stack;
        QVERIFY(!stack.amendRedoTop(markAction(9)));

        stack.push(markAction(1));
        UndoAction out;
        stack.takeUndo(out);

        UndoAction amended = out;
        amended.mark.text = "edited";
        QVERIFY(stack.amendRedoTop(amended));

        QVERIFY(stack.takeRedo(out));
        QCOMPARE(out.mark.text, QString("edited"));
    }

    void testSnapshotEntries() {
        const DocumentSnapshot snap = DocumentSnapshot::create("bytes");
        const UndoAction action = UndoAction::forSnapshot(UndoAction::RotatePages, snap, 3);
        QVERIFY(action.isSnapshot());
        QCOMPARE(action.keepPage, 3);
        QCOMPARE(action.prevSnapshot.bytes(), QByteArray("bytes"));
        QCOMPARE(action.prevSnapshot.version(), snap.version());
        QVERIFY(!markAction(1).isSnapshot());
        QCOMPARE(markAction(1).name(), QString("add-highlight"));
    }

    void testAvailabilitySignals() {
        UndoStack stack;
        QSignalSpy undoSpy(&stack, &UndoStack::undoAvailableChanged);
        QSignalSpy redoSpy(&stack, &UndoStack::redoAvailableChanged);

        stack.push(markAction(1));
        QCOMPARE(undoSpy.count(), 1);
        QCOMPARE(undoSpy.last().at(0).toBool(), true);

        // Second push does not change availability
        stack.push(markAction(2));
        QCOMPARE(undoSpy.count(), 1);

        UndoAction out;
        stack.takeUndo(out);
        QCOMPARE(redoSpy.count(), 1);
        QCOMPARE(redoSpy.last().at(0).toBool(), true);

        stack.takeUndo(out);
        QCOMPARE(undoSpy.count(), 2);
        QCOMPARE(undoSpy.last().at(0).toBool(), false);

        stack.clear();
        QCOMPARE(redoSpy.count(), 2);
        QCOMPARE(redoSpy.last().at(0).toBool(), false);
        QVERIFY(!stack.canUndo());
        QVERIFY(!stack.canRedo());
    }
};

#endif // UNDOSTACKTESTS_H
