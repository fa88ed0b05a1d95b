#ifndef STROKEERASER_H
#define STROKEERASER_H

#include <QPointF>
#include <QVector>

#include "annotations/InkStroke.h"

/**
 * StrokeEraser - Whole-stroke proximity eraser
 *
 * A stroke is removed entirely when any of its points lies closer than the
 * eraser radius to any point of the eraser path. Strokes are never split.
 * The radius is independent of the erased stroke's width.
 */
class StrokeEraser {
public:
    StrokeEraser() = delete;

    struct Result {
        StrokeList survivors;
        int removedCount = 0;
    };

    static Result erase(const StrokeList& strokes, const QVector<QPointF>& eraserPoints, qreal radius);

    static bool touches(const InkStroke& stroke, const QVector<QPointF>& eraserPoints, qreal radius);
};

#endif // STROKEERASER_H
