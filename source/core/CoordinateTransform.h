#pragma once

// ============================================================================
// CoordinateTransform - Screen space <-> document space mapping
// ============================================================================
// Screen space: pixels of the rendered page at the current zoom, y-down,
// origin at the page's top-left corner.
// Document space: PDF points, y-up, origin at the page's bottom-left corner.
//
// Marks are authored in screen space and converted only when they are
// committed, using the zoom that is active at commit time. No rotation
// compensation is applied.
// ============================================================================

#include <QPointF>
#include <QRectF>

namespace CoordinateTransform {

/**
 * @brief Convert a screen-space rectangle to document space.
 * @param screenX Left edge in screen pixels.
 * @param screenY Top edge in screen pixels.
 * @param screenW Width in screen pixels.
 * @param screenH Height in screen pixels.
 * @param zoom Zoom factor the page is rendered at.
 * @param pageHeight Page height in document units (points).
 * @return Rectangle whose origin is the bottom-left corner in document space,
 *         or a null rect if zoom is not positive.
 */
QRectF toDocumentSpace(qreal screenX, qreal screenY, qreal screenW, qreal screenH,
                       qreal zoom, qreal pageHeight);

QRectF toDocumentSpace(const QRectF& screenRect, qreal zoom, qreal pageHeight);

/**
 * @brief Inverse of toDocumentSpace().
 * @param docRect Rectangle with bottom-left origin in document space.
 * @return Rectangle with top-left origin in screen space.
 */
QRectF toScreenSpace(const QRectF& docRect, qreal zoom, qreal pageHeight);

/**
 * @brief Convert a single point (no extent) to document space.
 */
QPointF pointToDocumentSpace(const QPointF& screenPoint, qreal zoom, qreal pageHeight);

QPointF pointToScreenSpace(const QPointF& docPoint, qreal zoom, qreal pageHeight);

/// Scale a screen length (stroke width, font size) into document units.
qreal lengthToDocumentSpace(qreal screenLength, qreal zoom);

} // namespace CoordinateTransform
