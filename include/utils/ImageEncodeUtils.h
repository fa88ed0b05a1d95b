#ifndef IMAGEENCODEUTILS_H
#define IMAGEENCODEUTILS_H

#include <QByteArray>
#include <QImage>
#include <QString>

/**
 * @brief Encodes a flattened canvas raster into PNG, JPEG or WebP bytes.
 *
 * PNG and JPEG go through QImageWriter; WebP goes through libwebp directly
 * so the lossless mode is always available regardless of installed Qt
 * image plugins.
 */
class ImageEncodeUtils
{
public:
    enum class Format {
        Png,
        Jpeg,
        WebP
    };

    struct Error {
        QString message;
        QString stage; // format / encode
    };

    struct Options {
        Format format = Format::Png;
        int quality = -1;      // -1 selects the per-format default
        bool lossless = true;  // WebP only
    };

    static bool encode(const QImage& image,
                       const Options& options,
                       QByteArray* output,
                       Error* error = nullptr);

    static bool encode(const QImage& image,
                       Format format,
                       QByteArray* output,
                       Error* error = nullptr);

    /**
     * @brief Resolve a format from a name such as "png", ".jpg" or "WEBP".
     * @return false for an unknown name
     */
    static bool formatFromName(const QByteArray& name, Format* format);

    static QByteArray formatName(Format format);
    static QString mimeType(Format format);

private:
    static bool encodeWithWriter(const QImage& image, const QByteArray& format,
                                 int quality, QByteArray* output, Error* error);
    static bool encodeWebP(const QImage& image, int quality, bool lossless,
                           QByteArray* output, Error* error);
    static void setError(Error* error, const QString& stage, const QString& message);
};

#endif // IMAGEENCODEUTILS_H
