#include "utils/ImageSourceReader.h"

#include <QBuffer>
#include <QFileInfo>
#include <QImageIOHandler>
#include <QImageReader>
#include <QUrl>

namespace {

void setErrorMessage(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QString readerError(const QImageReader& reader, const QString& fallback)
{
    const QString text = reader.errorString().trimmed();
    return text.isEmpty() ? fallback : text;
}

} // namespace

ImageSourceReader::Kind ImageSourceReader::classify(const QString& source)
{
    const QString trimmed = source.trimmed();
    if (trimmed.isEmpty()) {
        return Kind::Invalid;
    }
    if (trimmed.startsWith(QLatin1String("data:"), Qt::CaseInsensitive)) {
        return Kind::DataUri;
    }
    return Kind::File;
}

bool ImageSourceReader::decodeDataUri(const QString& source, QByteArray* bytes, QString* errorMessage)
{
    // data:[<mediatype>][;base64],<payload>
    const int comma = source.indexOf(QLatin1Char(','));
    if (comma < 0) {
        setErrorMessage(errorMessage, QStringLiteral("Malformed data URI"));
        return false;
    }

    const QString header = source.left(comma);
    const QByteArray payload = source.mid(comma + 1).toLatin1();
    if (header.endsWith(QLatin1String(";base64"), Qt::CaseInsensitive)) {
        const auto result = QByteArray::fromBase64Encoding(
            payload, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
        if (!result) {
            setErrorMessage(errorMessage, QStringLiteral("Invalid base64 payload in data URI"));
            return false;
        }
        *bytes = result.decoded;
    } else {
        *bytes = QByteArray::fromPercentEncoding(payload);
    }

    if (bytes->isEmpty()) {
        setErrorMessage(errorMessage, QStringLiteral("Empty data URI payload"));
        return false;
    }
    return true;
}

bool ImageSourceReader::loadBytes(const QString& source, QByteArray* bytes, QString* filePath,
                                  QString* errorMessage)
{
    const QString trimmed = source.trimmed();
    switch (classify(trimmed)) {
    case Kind::Invalid:
        setErrorMessage(errorMessage, QStringLiteral("Empty image source"));
        return false;
    case Kind::DataUri:
        return decodeDataUri(trimmed, bytes, errorMessage);
    case Kind::File:
        break;
    }

    QString path = trimmed;
    if (trimmed.startsWith(QLatin1String("file:"), Qt::CaseInsensitive)) {
        const QUrl url(trimmed);
        if (!url.isLocalFile()) {
            setErrorMessage(errorMessage, QStringLiteral("Unsupported URL: %1").arg(trimmed));
            return false;
        }
        path = url.toLocalFile();
    }

    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        setErrorMessage(errorMessage, QStringLiteral("File not found: %1").arg(path));
        return false;
    }

    *filePath = info.absoluteFilePath();
    return true;
}

QSize ImageSourceReader::probeSize(const QString& source, QString* errorMessage)
{
    QByteArray bytes;
    QString filePath;
    if (!loadBytes(source, &bytes, &filePath, errorMessage)) {
        return QSize();
    }

    QBuffer buffer(&bytes);
    QImageReader reader;
    if (!filePath.isEmpty()) {
        reader.setFileName(filePath);
    } else if (buffer.open(QIODevice::ReadOnly)) {
        reader.setDevice(&buffer);
    } else {
        setErrorMessage(errorMessage, QStringLiteral("Failed to open image buffer"));
        return QSize();
    }
    reader.setAutoTransform(true);

    // size() reports the stored header size, before any EXIF orientation
    QSize size = reader.size();
    if (!size.isValid()) {
        setErrorMessage(errorMessage, readerError(reader, QStringLiteral("Cannot read image size")));
        return size;
    }
    if (reader.transformation() & QImageIOHandler::TransformationRotate90) {
        size.transpose();
    }
    return size;
}

QImage ImageSourceReader::read(const QString& source, QString* errorMessage)
{
    QByteArray bytes;
    QString filePath;
    if (!loadBytes(source, &bytes, &filePath, errorMessage)) {
        return QImage();
    }

    QBuffer buffer(&bytes);
    QImageReader reader;
    if (!filePath.isEmpty()) {
        reader.setFileName(filePath);
    } else if (buffer.open(QIODevice::ReadOnly)) {
        reader.setDevice(&buffer);
    } else {
        setErrorMessage(errorMessage, QStringLiteral("Failed to open image buffer"));
        return QImage();
    }
    reader.setAutoTransform(true);

    QImage image;
    if (!reader.read(&image)) {
        setErrorMessage(errorMessage, readerError(reader, QStringLiteral("Failed to decode image")));
        return QImage();
    }
    return image;
}
