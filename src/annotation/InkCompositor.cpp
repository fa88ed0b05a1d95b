#include "annotation/InkCompositor.h"
#include "annotation/InkRenderer.h"
#include "annotation/InkSurface.h"

#include <QDebug>

bool InkCompositor::composite(InkSurface* surface,
                              const StrokeList& strokes,
                              QImage* output,
                              Error* error)
{
    if (!surface || surface->isDisposed()) {
        setError(error, QStringLiteral("surface"), QStringLiteral("Surface is not available"));
        return false;
    }

    if (!surface->isValid()) {
        setError(error, QStringLiteral("surface"),
                 QStringLiteral("Surface has zero size (%1x%2)")
                     .arg(surface->logicalWidth())
                     .arg(surface->logicalHeight()));
        return false;
    }

    if (surface->isBackgroundPending()) {
        qDebug() << "InkCompositor: Waiting for background decode";
        surface->waitForBackground();
    }

    // A failed decode leaves the surface blank; export proceeds with strokes only
    const InkRenderer::Scene scene = InkRenderer::sceneFor(surface, strokes);
    const QImage image = InkRenderer::renderToImage(scene);
    if (image.isNull()) {
        setError(error, QStringLiteral("surface"), QStringLiteral("Failed to allocate output image"));
        return false;
    }

    if (output) {
        *output = image;
    }
    return true;
}

bool InkCompositor::compositeEncoded(InkSurface* surface,
                                     const StrokeList& strokes,
                                     const ImageEncodeUtils::Options& options,
                                     QByteArray* output,
                                     Error* error)
{
    QImage image;
    if (!composite(surface, strokes, &image, error)) {
        return false;
    }

    ImageEncodeUtils::Error encodeError;
    if (!ImageEncodeUtils::encode(image, options, output, &encodeError)) {
        qWarning() << "InkCompositor: Encode failed:" << ImageEncodeUtils::formatName(options.format)
                   << encodeError.stage << encodeError.message;
        setError(error, encodeError.stage, encodeError.message);
        return false;
    }

    return true;
}

void InkCompositor::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}
