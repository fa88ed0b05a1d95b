#ifndef IMAGESOURCEREADER_H
#define IMAGESOURCEREADER_H

#include <QByteArray>
#include <QImage>
#include <QSize>
#include <QString>

/**
 * @brief Opens a background reference and probes or decodes it.
 *
 * A reference is a plain file path, a file:// URL, or a data: URI with
 * base64 or percent-encoded payload. Both calls are safe to run off the
 * GUI thread.
 */
class ImageSourceReader
{
public:
    ImageSourceReader() = delete;

    enum class Kind {
        Invalid,
        File,
        DataUri
    };

    static Kind classify(const QString& source);

    /**
     * @brief Read the intrinsic size from the image header without decoding pixels.
     * @return invalid QSize on failure
     */
    static QSize probeSize(const QString& source, QString* errorMessage = nullptr);

    /**
     * @brief Decode the full image.
     * @return null QImage on failure
     */
    static QImage read(const QString& source, QString* errorMessage = nullptr);

private:
    static bool loadBytes(const QString& source, QByteArray* bytes, QString* filePath,
                          QString* errorMessage);
    static bool decodeDataUri(const QString& source, QByteArray* bytes, QString* errorMessage);
};

#endif // IMAGESOURCEREADER_H
