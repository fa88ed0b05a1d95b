#include "annotations/StrokeEraser.h"

#include <QRectF>

StrokeEraser::Result StrokeEraser::erase(const StrokeList& strokes,
                                         const QVector<QPointF>& eraserPoints,
                                         qreal radius)
{
    Result result;
    result.survivors.reserve(strokes.size());

    for (const InkStroke& stroke : strokes) {
        if (touches(stroke, eraserPoints, radius)) {
            ++result.removedCount;
        } else {
            result.survivors.append(stroke);
        }
    }

    return result;
}

bool StrokeEraser::touches(const InkStroke& stroke, const QVector<QPointF>& eraserPoints, qreal radius)
{
    if (stroke.isEmpty() || eraserPoints.isEmpty() || radius <= 0.0) {
        return false;
    }

    // Quick bounding box check first
    const QRectF reach = stroke.boundingRect().adjusted(-radius, -radius, radius, radius);

    for (const QPointF& eraserPoint : eraserPoints) {
        if (!reach.contains(eraserPoint)) {
            continue;
        }
        if (stroke.hasPointWithin(eraserPoint, radius)) {
            return true;
        }
    }
    return false;
}
