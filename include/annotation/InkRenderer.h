#ifndef INKRENDERER_H
#define INKRENDERER_H

#include "annotations/InkStroke.h"
#include <QImage>
#include <QPainter>
#include <QSize>

class InkSurface;

// Pure rendering of one surface state; holds no state of its own.
class InkRenderer {
public:
    struct Scene {
        QSize logicalSize;
        QImage background;          // drawn stretched when not null
        StrokeList strokes;         // committed, bottom to top
        InkStroke inProgress;       // empty when idle
    };

    static Scene sceneFor(const InkSurface* surface, const StrokeList& strokes,
                          const InkStroke& inProgress = InkStroke());

    // Clears the target to transparent, then draws background, strokes and
    // the in-progress capture in that order.
    static void render(QImage& target, const Scene& scene);

    static void render(QPainter& painter, const Scene& scene);

    static QImage renderToImage(const Scene& scene);

private:
    static void drawBackground(QPainter& painter, const QRect& canvasRect, const QImage& background);
    static void drawStrokes(QPainter& painter, const StrokeList& strokes);
};

#endif // INKRENDERER_H
