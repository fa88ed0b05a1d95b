#include "annotation/InkRenderer.h"
#include "annotation/InkSurface.h"

InkRenderer::Scene InkRenderer::sceneFor(const InkSurface* surface, const StrokeList& strokes,
                                         const InkStroke& inProgress)
{
    Scene scene;
    if (surface && surface->isValid()) {
        scene.logicalSize = surface->logicalSize();
        scene.background = surface->background();
    }
    scene.strokes = strokes;
    scene.inProgress = inProgress;
    return scene;
}

void InkRenderer::render(QImage& target, const Scene& scene)
{
    if (target.isNull()) {
        return;
    }

    target.fill(Qt::transparent);

    QPainter painter(&target);
    // Scene coordinates are logical; map them onto whatever resolution the target has
    if (!scene.logicalSize.isEmpty() && target.size() != scene.logicalSize) {
        painter.scale(qreal(target.width()) / scene.logicalSize.width(),
                      qreal(target.height()) / scene.logicalSize.height());
    }
    render(painter, scene);
    painter.end();
}

void InkRenderer::render(QPainter& painter, const Scene& scene)
{
    if (scene.logicalSize.isEmpty()) {
        return;
    }

    const QRect canvasRect(QPoint(0, 0), scene.logicalSize);

    painter.save();
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(canvasRect, Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    drawBackground(painter, canvasRect, scene.background);
    drawStrokes(painter, scene.strokes);

    if (!scene.inProgress.isEmpty()) {
        scene.inProgress.draw(painter);
    }
    painter.restore();
}

QImage InkRenderer::renderToImage(const Scene& scene)
{
    if (scene.logicalSize.isEmpty()) {
        return QImage();
    }

    QImage image(scene.logicalSize, QImage::Format_ARGB32_Premultiplied);
    render(image, scene);
    return image;
}

void InkRenderer::drawBackground(QPainter& painter, const QRect& canvasRect, const QImage& background)
{
    if (background.isNull()) {
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(canvasRect, background);
}

void InkRenderer::drawStrokes(QPainter& painter, const StrokeList& strokes)
{
    for (const InkStroke& stroke : strokes) {
        stroke.draw(painter);
    }
}
