#ifndef COORDINATETRANSFORMTESTS_H
#define COORDINATETRANSFORMTESTS_H

#include <QObject>
#include <QTest>
#include <QRegularExpression>
#include "CoordinateTransform.h"

/**
 * Unit tests for the screen <-> document space mapping.
 * Run with: pdfdesk --test-transform
 */
class CoordinateTransformTests : public QObject {
    Q_OBJECT

private slots:
    void testRedactionAtDoubleZoom() {
        // Letter page, 100,100 50x20 drawn at 200%
        const QRectF doc = CoordinateTransform::toDocumentSpace(100, 100, 50, 20, 2.0, 792);
        QCOMPARE(doc.x(), 50.0);
        QCOMPARE(doc.y(), 732.0);
        QCOMPARE(doc.width(), 25.0);
        QCOMPARE(doc.height(), 10.0);
    }

    void testIdentityZoom() {
        const QRectF doc = CoordinateTransform::toDocumentSpace(QRectF(0, 0, 612, 792), 1.0, 792);
        QCOMPARE(doc, QRectF(0, 0, 612, 792));
    }

    void testRoundTrip_data() {
        QTest::addColumn<qreal>("zoom");
        QTest::newRow("min") << 0.25;
        QTest::newRow("half") << 0.5;
        QTest::newRow("one") << 1.0;
        QTest::newRow("odd") << 1.37;
        QTest::newRow("max") << 4.0;
    }

    void testRoundTrip() {
        QFETCH(qreal, zoom);
        const QRectF screen(33.5, 410.25, 120, 18);
        const QRectF doc = CoordinateTransform::toDocumentSpace(screen, zoom, 842);
        const QRectF back = CoordinateTransform::toScreenSpace(doc, zoom, 842);
        QVERIFY(qAbs(back.x() - screen.x()) < 1e-9);
        QVERIFY(qAbs(back.y() - screen.y()) < 1e-9);
        QVERIFY(qAbs(back.width() - screen.width()) < 1e-9);
        QVERIFY(qAbs(back.height() - screen.height()) < 1e-9);
    }

    void testPointConversion() {
        const QPointF doc = CoordinateTransform::pointToDocumentSpace(QPointF(144, 200), 2.0, 792);
        QCOMPARE(doc, QPointF(72, 692));
        QCOMPARE(CoordinateTransform::pointToScreenSpace(doc, 2.0, 792), QPointF(144, 200));
    }

    void testLengthScaling() {
        QCOMPARE(CoordinateTransform::lengthToDocumentSpace(6.0, 2.0), 3.0);
        QCOMPARE(CoordinateTransform::lengthToDocumentSpace(6.0, 0.5), 12.0);
    }

    void testInvalidZoom() {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("invalid zoom"));
        QVERIFY(CoordinateTransform::toDocumentSpace(10, 10, 10, 10, 0.0, 792).isNull());
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("invalid zoom"));
        QVERIFY(CoordinateTransform::toScreenSpace(QRectF(1, 1, 1, 1), -1.0, 792).isNull());
    }
};

#endif // COORDINATETRANSFORMTESTS_H
