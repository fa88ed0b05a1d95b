#ifndef ANNOTATIONPROFILE_H
#define ANNOTATIONPROFILE_H

#include <QColor>
#include <QSize>
#include <QString>

#include "tools/ToolId.h"

/**
 * @brief Per-instance configuration of an annotation surface.
 *
 * The image markup tool and the project whiteboard run the same engine;
 * everything that differs between them lives here.
 */
struct AnnotationProfile {
    QString name;

    ToolId defaultTool = ToolId::Marker;
    QColor defaultColor;
    QColor highlighterColor;
    qreal markerWidth = 1.0;
    qreal highlighterWidth = 1.0;
    qreal eraserRadius = 1.0;

    // Matches the surface backdrop so the eraser trail reads as "wiping"
    QColor eraserPreviewColor;

    // Background images larger than this are scaled down, aspect preserved.
    // A non-positive dimension means that axis is unbounded.
    QSize maxLogicalSize;

    // Used when no background is given or its size cannot be read
    QSize blankLogicalSize;

    // Whether strokes survive a background replacement
    bool keepStrokesOnBackgroundChange = false;

    static AnnotationProfile imageMarkup();
    static AnnotationProfile whiteboard();

    bool isValid() const;
};

#endif // ANNOTATIONPROFILE_H
