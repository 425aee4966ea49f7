#ifndef MARKPAINTERTESTS_H
#define MARKPAINTERTESTS_H

#include <QObject>
#include <QTest>
#include <QImage>
#include <QPainter>
#include "MarkPainter.h"

/**
 * Unit tests for overlay primitives.
 * Run with: pdfdesk --test-painter
 */
class MarkPainterTests : public QObject {
    Q_OBJECT

private slots:
    void testLayers() {
        QCOMPARE(MarkPainter::layerFor(Mark::RedactRect), OverlayKind::Redaction);
        QCOMPARE(MarkPainter::layerFor(Mark::TextBox), OverlayKind::TextEdit);
        QCOMPARE(MarkPainter::layerFor(Mark::FormField), OverlayKind::TextEdit);
        QCOMPARE(MarkPainter::layerFor(Mark::Highlight), OverlayKind::Annotation);
        QCOMPARE(MarkPainter::layerFor(Mark::StickyNote), OverlayKind::Annotation);
        QCOMPARE(MarkPainter::layerFor(Mark::DrawPath), OverlayKind::Annotation);
    }

    void testFiltersByLayer() {
        Mark red = Mark::redactRect(1, QRectF(10, 10, 40, 20), Qt::black);
        red.id = 1;
        Mark hl = Mark::highlight(1, QPointF(100, 100));
        hl.id = 2;
        const QVector<Mark> marks = {red, hl};

        const QVector<MarkPrimitive> redaction = MarkPainter::primitives(marks, OverlayKind::Redaction);
        // Fill plus outline
        QCOMPARE(redaction.size(), 2);
        QCOMPARE(redaction.at(0).shape, MarkPrimitive::FillRect);
        QCOMPARE(redaction.at(0).markId, 1);
        QCOMPARE(redaction.at(1).shape, MarkPrimitive::OutlineRect);

        const QVector<MarkPrimitive> annotation = MarkPainter::primitives(marks, OverlayKind::Annotation);
        QCOMPARE(annotation.size(), 1);
        QCOMPARE(annotation.at(0).rect, hl.rect);

        QVERIFY(MarkPainter::primitives(marks, OverlayKind::TextEdit).isEmpty());
    }

    void testTextBoxShowsTextOnlyWhenSet() {
        Mark box = Mark::textBox(1, QPointF(0, 0));
        QCOMPARE(MarkPainter::primitives({box}, OverlayKind::TextEdit).size(), 1);

        box.text = "Hello";
        const QVector<MarkPrimitive> prims = MarkPainter::primitives({box}, OverlayKind::TextEdit);
        QCOMPARE(prims.size(), 2);
        QVERIFY(prims.at(0).dashed);
        QCOMPARE(prims.at(1).shape, MarkPrimitive::Text);
        QCOMPARE(prims.at(1).text, QString("Hello"));
        QCOMPARE(prims.at(1).fontSize, 14.0);
    }

    void testDegeneratePathIsSkipped() {
        const Mark dot = Mark::drawPath(1, {QPointF(5, 5)}, Qt::red, 2.0);
        QVERIFY(MarkPainter::primitives({dot}, OverlayKind::Annotation).isEmpty());
    }

    void testStickyIcon() {
        const Mark note = Mark::stickyNote(1, QPointF(30, 40), "memo");
        const QVector<MarkPrimitive> prims = MarkPainter::primitives({note}, OverlayKind::Annotation);
        QCOMPARE(prims.size(), 1);
        QCOMPARE(prims.at(0).shape, MarkPrimitive::NoteIcon);
        QCOMPARE(prims.at(0).rect, QRectF(30, 40, 20, 20));
    }

    void testDragPreviewNormalised() {
        const MarkPrimitive prim = MarkPainter::dragPreview(QRectF(QPointF(50, 50), QPointF(10, 20)), Qt::red);
        QCOMPARE(prim.rect, QRectF(10, 20, 40, 30));
        QVERIFY(prim.dashed);
    }

    void testPaintFillsRedaction() {
        QImage image(100, 100, QImage::Format_ARGB32);
        image.fill(Qt::white);
        const Mark red = Mark::redactRect(1, QRectF(20, 20, 40, 40), Qt::black);

        QPainter painter(&image);
        MarkPainter::paint(painter, MarkPainter::primitives({red}, OverlayKind::Redaction));
        painter.end();

        QVERIFY(qGray(image.pixel(40, 40)) < 128);
        QCOMPARE(image.pixel(5, 5), QColor(Qt::white).rgb());
    }
};

#endif // MARKPAINTERTESTS_H
