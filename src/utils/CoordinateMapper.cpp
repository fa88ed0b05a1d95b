#include "utils/CoordinateMapper.h"
#include <QtMath>

QSizeF CoordinateMapper::displayScale(const QSize& logicalSize, const QSizeF& displayedSize, qreal zoom)
{
    const qreal displayedWidth = displayedSize.width() * zoom;
    const qreal displayedHeight = displayedSize.height() * zoom;
    if (qFuzzyIsNull(displayedWidth) || qFuzzyIsNull(displayedHeight) || logicalSize.isEmpty()) {
        return QSizeF(0.0, 0.0);
    }

    return QSizeF(
        logicalSize.width() / displayedWidth,
        logicalSize.height() / displayedHeight
    );
}

bool CoordinateMapper::isMounted(const QRectF& surfaceBounds, const QSizeF& displayScale)
{
    return !surfaceBounds.isEmpty()
        && !qFuzzyIsNull(displayScale.width())
        && !qFuzzyIsNull(displayScale.height());
}

QPointF CoordinateMapper::toLogical(const QPointF& clientPos, const QRectF& surfaceBounds, const QSizeF& displayScale)
{
    if (!isMounted(surfaceBounds, displayScale)) {
        return QPointF(0.0, 0.0);
    }

    return QPointF(
        (clientPos.x() - surfaceBounds.left()) * displayScale.width(),
        (clientPos.y() - surfaceBounds.top()) * displayScale.height()
    );
}

QPointF CoordinateMapper::toLogical(const QPointF& clientPos, const QRectF& surfaceBounds, const QSize& logicalSize)
{
    return toLogical(clientPos, surfaceBounds, displayScale(logicalSize, surfaceBounds.size()));
}

QPointF CoordinateMapper::toClient(const QPointF& logicalPos, const QRectF& surfaceBounds, const QSizeF& displayScale)
{
    if (!isMounted(surfaceBounds, displayScale)) {
        return surfaceBounds.topLeft();
    }

    return QPointF(
        surfaceBounds.left() + logicalPos.x() / displayScale.width(),
        surfaceBounds.top() + logicalPos.y() / displayScale.height()
    );
}
