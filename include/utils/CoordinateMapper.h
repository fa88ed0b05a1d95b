#ifndef COORDINATEMAPPER_H
#define COORDINATEMAPPER_H

#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

/**
 * CoordinateMapper - Screen to logical canvas coordinate conversion
 *
 * The logical canvas has a fixed backing resolution; on screen it may be
 * shown larger or smaller, stretched non-uniformly, and zoomed. The display
 * scale is per axis: scaleX = logicalWidth / displayedWidth, likewise for Y.
 */
class CoordinateMapper {
public:
    CoordinateMapper() = delete;

    // Per-axis ratio of logical resolution to displayed size.
    // zoom multiplies the displayed size. Returns (0, 0) for an unmounted surface.
    static QSizeF displayScale(const QSize& logicalSize, const QSizeF& displayedSize, qreal zoom = 1.0);

    // Maps a client-space pointer position into logical canvas space.
    // surfaceBounds is the on-screen rectangle of the canvas in the same
    // client space. An unmounted surface (empty bounds or zero scale) maps
    // everything to the origin.
    static QPointF toLogical(const QPointF& clientPos, const QRectF& surfaceBounds, const QSizeF& displayScale);

    // Convenience overload deriving the scale from the bounds themselves
    static QPointF toLogical(const QPointF& clientPos, const QRectF& surfaceBounds, const QSize& logicalSize);

    // Inverse mapping, for placing overlays over logical positions
    static QPointF toClient(const QPointF& logicalPos, const QRectF& surfaceBounds, const QSizeF& displayScale);

    static bool isMounted(const QRectF& surfaceBounds, const QSizeF& displayScale);
};

#endif // COORDINATEMAPPER_H
