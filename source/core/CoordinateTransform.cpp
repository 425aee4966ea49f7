#include "CoordinateTransform.h"

#include <QDebug>

namespace CoordinateTransform {

QRectF toDocumentSpace(qreal screenX, qreal screenY, qreal screenW, qreal screenH,
                       qreal zoom, qreal pageHeight)
{
    if (zoom <= 0) {
        qWarning() << "CoordinateTransform::toDocumentSpace: invalid zoom" << zoom;
        return QRectF();
    }

    const qreal docX = screenX / zoom;
    const qreal docY = pageHeight - screenY / zoom - screenH / zoom;
    return QRectF(docX, docY, screenW / zoom, screenH / zoom);
}

QRectF toDocumentSpace(const QRectF& screenRect, qreal zoom, qreal pageHeight)
{
    return toDocumentSpace(screenRect.x(), screenRect.y(),
                           screenRect.width(), screenRect.height(),
                           zoom, pageHeight);
}

QRectF toScreenSpace(const QRectF& docRect, qreal zoom, qreal pageHeight)
{
    if (zoom <= 0) {
        qWarning() << "CoordinateTransform::toScreenSpace: invalid zoom" << zoom;
        return QRectF();
    }

    // screenY = (pageHeight - docY - docH) * zoom
    const qreal screenY = (pageHeight - docRect.y() - docRect.height()) * zoom;
    return QRectF(docRect.x() * zoom, screenY,
                  docRect.width() * zoom, docRect.height() * zoom);
}

QPointF pointToDocumentSpace(const QPointF& screenPoint, qreal zoom, qreal pageHeight)
{
    return toDocumentSpace(screenPoint.x(), screenPoint.y(), 0, 0, zoom, pageHeight).topLeft();
}

QPointF pointToScreenSpace(const QPointF& docPoint, qreal zoom, qreal pageHeight)
{
    return toScreenSpace(QRectF(docPoint, QSizeF(0, 0)), zoom, pageHeight).topLeft();
}

qreal lengthToDocumentSpace(qreal screenLength, qreal zoom)
{
    return zoom > 0 ? screenLength / zoom : 0.0;
}

} // namespace CoordinateTransform
