#include "utils/ImageEncodeUtils.h"
#include "Constants.h"

#include <QBuffer>
#include <QDebug>
#include <QImageWriter>
#include <QPainter>

#include <webp/encode.h>

namespace {

QByteArray normalizeFormat(QByteArray format)
{
    format = format.trimmed().toLower();
    while (!format.isEmpty() && format.startsWith('.')) {
        format.remove(0, 1);
    }
    return format;
}

QImage flattenOnWhite(const QImage& image)
{
    QImage flat(image.size(), QImage::Format_RGB32);
    flat.fill(Qt::white);
    QPainter painter(&flat);
    painter.drawImage(0, 0, image);
    painter.end();
    return flat;
}

} // namespace

bool ImageEncodeUtils::encode(const QImage& image,
                              Format format,
                              QByteArray* output,
                              Error* error)
{
    Options options;
    options.format = format;
    return encode(image, options, output, error);
}

bool ImageEncodeUtils::encode(const QImage& image,
                              const Options& options,
                              QByteArray* output,
                              Error* error)
{
    if (!output) {
        setError(error, QStringLiteral("encode"), QStringLiteral("No output buffer"));
        return false;
    }
    output->clear();

    if (image.isNull() || image.width() < 1 || image.height() < 1) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Image is null"));
        return false;
    }

    switch (options.format) {
    case Format::Png:
        return encodeWithWriter(image, formatName(Format::Png), -1, output, error);
    case Format::Jpeg: {
        const int quality = options.quality < 0
            ? ArchiNotes::Encoding::kJpegQualityDefault
            : qBound(ArchiNotes::Encoding::kQualityMin, options.quality, ArchiNotes::Encoding::kQualityMax);
        // JPEG has no alpha channel
        return encodeWithWriter(flattenOnWhite(image), formatName(Format::Jpeg), quality, output, error);
    }
    case Format::WebP: {
        const int quality = options.quality < 0
            ? ArchiNotes::Encoding::kWebPQualityDefault
            : qBound(ArchiNotes::Encoding::kQualityMin, options.quality, ArchiNotes::Encoding::kQualityMax);
        return encodeWebP(image, quality, options.lossless, output, error);
    }
    }

    setError(error, QStringLiteral("format"), QStringLiteral("Unknown export format"));
    return false;
}

bool ImageEncodeUtils::formatFromName(const QByteArray& name, Format* format)
{
    const QByteArray normalized = normalizeFormat(name);
    Format resolved;
    if (normalized.isEmpty() || normalized == "png") {
        resolved = Format::Png;
    } else if (normalized == "jpg" || normalized == "jpeg") {
        resolved = Format::Jpeg;
    } else if (normalized == "webp") {
        resolved = Format::WebP;
    } else {
        return false;
    }

    if (format) {
        *format = resolved;
    }
    return true;
}

QByteArray ImageEncodeUtils::formatName(Format format)
{
    switch (format) {
    case Format::Png:  return QByteArrayLiteral("png");
    case Format::Jpeg: return QByteArrayLiteral("jpeg");
    case Format::WebP: return QByteArrayLiteral("webp");
    }
    return QByteArray();
}

QString ImageEncodeUtils::mimeType(Format format)
{
    switch (format) {
    case Format::Png:  return QStringLiteral("image/png");
    case Format::Jpeg: return QStringLiteral("image/jpeg");
    case Format::WebP: return QStringLiteral("image/webp");
    }
    return QString();
}

bool ImageEncodeUtils::encodeWithWriter(const QImage& image, const QByteArray& format,
                                        int quality, QByteArray* output, Error* error)
{
    if (!QImageWriter::supportedImageFormats().contains(format)) {
        setError(error, QStringLiteral("format"),
                 QStringLiteral("Unsupported image format '%1'").arg(QString::fromLatin1(format)));
        return false;
    }

    QBuffer buffer(output);
    if (!buffer.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Failed to open output buffer"));
        return false;
    }

    QImageWriter writer(&buffer, format);
    if (quality >= 0) {
        writer.setQuality(quality);
    }
    if (!writer.write(image)) {
        buffer.close();
        output->clear();
        const QString writeError = writer.errorString().trimmed();
        setError(error, QStringLiteral("encode"),
                 writeError.isEmpty() ? QStringLiteral("Failed to encode image")
                                      : writeError);
        return false;
    }

    buffer.close();
    return true;
}

bool ImageEncodeUtils::encodeWebP(const QImage& image, int quality, bool lossless,
                                  QByteArray* output, Error* error)
{
    // libwebp expects tightly interpreted RGBA bytes, not premultiplied ARGB
    const QImage rgba = image.convertToFormat(QImage::Format_RGBA8888);

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Failed to initialize WebP config"));
        return false;
    }

    config.lossless = lossless ? 1 : 0;
    config.quality = static_cast<float>(quality);
    config.method = 4;  // 0-6, higher = slower but better compression
    if (lossless) {
        // Keep RGB under fully transparent pixels so a blank canvas stays exact
        config.exact = 1;
    }

    if (!WebPValidateConfig(&config)) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Invalid WebP config"));
        return false;
    }

    WebPPicture pic;
    if (!WebPPictureInit(&pic)) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Failed to init WebPPicture"));
        return false;
    }

    pic.width = rgba.width();
    pic.height = rgba.height();
    pic.use_argb = 1;

    if (!WebPPictureImportRGBA(&pic, rgba.constBits(), static_cast<int>(rgba.bytesPerLine()))) {
        WebPPictureFree(&pic);
        setError(error, QStringLiteral("encode"), QStringLiteral("Failed to import RGBA data"));
        return false;
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    pic.writer = WebPMemoryWrite;
    pic.custom_ptr = &writer;

    const int success = WebPEncode(&config, &pic);
    const int errorCode = pic.error_code;
    WebPPictureFree(&pic);

    if (!success) {
        WebPMemoryWriterClear(&writer);
        qWarning() << "ImageEncodeUtils: WebP encode failed, error code" << errorCode;
        setError(error, QStringLiteral("encode"),
                 QStringLiteral("WebP encoding failed (error %1)").arg(errorCode));
        return false;
    }

    *output = QByteArray(reinterpret_cast<const char*>(writer.mem), static_cast<int>(writer.size));
    WebPMemoryWriterClear(&writer);
    return true;
}

void ImageEncodeUtils::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}
