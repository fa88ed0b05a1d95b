#ifndef INKCOMPOSITOR_H
#define INKCOMPOSITOR_H

#include <QByteArray>
#include <QImage>
#include <QString>

#include "annotations/InkStroke.h"
#include "utils/ImageEncodeUtils.h"

class InkSurface;

/**
 * @brief Flattens a surface and its committed strokes into one raster.
 *
 * The in-progress capture is never part of the output. A pending background
 * decode is awaited first so the snapshot is never taken without it.
 */
class InkCompositor
{
public:
    struct Error {
        QString message;
        QString stage; // surface / format / encode
    };

    static bool composite(InkSurface* surface,
                          const StrokeList& strokes,
                          QImage* output,
                          Error* error = nullptr);

    static bool compositeEncoded(InkSurface* surface,
                                 const StrokeList& strokes,
                                 const ImageEncodeUtils::Options& options,
                                 QByteArray* output,
                                 Error* error = nullptr);

private:
    static void setError(Error* error, const QString& stage, const QString& message);
};

#endif // INKCOMPOSITOR_H
