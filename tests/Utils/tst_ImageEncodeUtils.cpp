#include <QtTest>

#include <QBuffer>
#include <QImageReader>

#include <webp/decode.h>

#include "utils/ImageEncodeUtils.h"

class tst_ImageEncodeUtils : public QObject
{
    Q_OBJECT

private slots:
    void testEncodePng_PreservesAlpha();
    void testEncodeJpeg_FlattensOnWhite();
    void testEncodeWebP_LosslessRoundTrip();
    void testEncodeWebP_Lossy();
    void testEncode_NullImageFails();
    void testEncode_NoOutputFails();
    void testFormatFromName();
    void testFormatName_ResolvesBack();
    void testMimeType();

private:
    static QImage decode(const QByteArray& bytes, const QByteArray& format);
};

QImage tst_ImageEncodeUtils::decode(const QByteArray& bytes, const QByteArray& format)
{
    QBuffer buffer;
    buffer.setData(bytes);
    buffer.open(QIODevice::ReadOnly);
    QImageReader reader(&buffer, format);
    return reader.read();
}

void tst_ImageEncodeUtils::testEncodePng_PreservesAlpha()
{
    QImage image(16, 16, QImage::Format_ARGB32);
    image.fill(Qt::transparent);
    image.setPixelColor(4, 4, QColor(255, 0, 0, 255));

    QByteArray bytes;
    ImageEncodeUtils::Error error;
    QVERIFY2(ImageEncodeUtils::encode(image, ImageEncodeUtils::Format::Png, &bytes, &error),
             qPrintable(error.message));
    QVERIFY(bytes.startsWith("\x89PNG"));

    const QImage decoded = decode(bytes, "png");
    QCOMPARE(decoded.pixelColor(0, 0).alpha(), 0);
    QCOMPARE(decoded.pixelColor(4, 4), QColor(255, 0, 0, 255));
}

void tst_ImageEncodeUtils::testEncodeJpeg_FlattensOnWhite()
{
    QImage image(16, 16, QImage::Format_ARGB32);
    image.fill(Qt::transparent);

    ImageEncodeUtils::Options options;
    options.format = ImageEncodeUtils::Format::Jpeg;
    options.quality = 95;

    QByteArray bytes;
    QVERIFY(ImageEncodeUtils::encode(image, options, &bytes));

    const QImage decoded = decode(bytes, "jpeg");
    QVERIFY(!decoded.isNull());
    const QColor corner = decoded.pixelColor(8, 8);
    QVERIFY(corner.red() > 245 && corner.green() > 245 && corner.blue() > 245);
}

void tst_ImageEncodeUtils::testEncodeWebP_LosslessRoundTrip()
{
    QImage image(20, 10, QImage::Format_ARGB32);
    image.fill(Qt::transparent);
    image.setPixelColor(3, 3, QColor(10, 200, 30, 255));

    QByteArray bytes;
    ImageEncodeUtils::Error error;
    QVERIFY2(ImageEncodeUtils::encode(image, ImageEncodeUtils::Format::WebP, &bytes, &error),
             qPrintable(error.message));
    QVERIFY(bytes.startsWith("RIFF"));

    int width = 0;
    int height = 0;
    uint8_t* rgba = WebPDecodeRGBA(reinterpret_cast<const uint8_t*>(bytes.constData()),
                                   static_cast<size_t>(bytes.size()), &width, &height);
    QVERIFY(rgba != nullptr);
    QCOMPARE(width, 20);
    QCOMPARE(height, 10);

    // Pixel (3, 3): RGBA bytes
    const uint8_t* px = rgba + (3 * width + 3) * 4;
    QCOMPARE(int(px[0]), 10);
    QCOMPARE(int(px[1]), 200);
    QCOMPARE(int(px[2]), 30);
    QCOMPARE(int(px[3]), 255);

    // Transparent pixels stay transparent
    QCOMPARE(int(rgba[3]), 0);
    WebPFree(rgba);
}

void tst_ImageEncodeUtils::testEncodeWebP_Lossy()
{
    QImage image(32, 32, QImage::Format_ARGB32);
    image.fill(QColor(40, 80, 160));

    ImageEncodeUtils::Options options;
    options.format = ImageEncodeUtils::Format::WebP;
    options.lossless = false;
    options.quality = 50;

    QByteArray bytes;
    QVERIFY(ImageEncodeUtils::encode(image, options, &bytes));

    int width = 0;
    int height = 0;
    QVERIFY(WebPGetInfo(reinterpret_cast<const uint8_t*>(bytes.constData()),
                        static_cast<size_t>(bytes.size()), &width, &height));
    QCOMPARE(width, 32);
    QCOMPARE(height, 32);
}

void tst_ImageEncodeUtils::testEncode_NullImageFails()
{
    QByteArray bytes("stale");
    ImageEncodeUtils::Error error;
    QVERIFY(!ImageEncodeUtils::encode(QImage(), ImageEncodeUtils::Format::Png, &bytes, &error));
    QCOMPARE(error.stage, QString("encode"));
    QVERIFY(bytes.isEmpty());
}

void tst_ImageEncodeUtils::testEncode_NoOutputFails()
{
    QImage image(4, 4, QImage::Format_ARGB32);
    image.fill(Qt::red);

    ImageEncodeUtils::Error error;
    QVERIFY(!ImageEncodeUtils::encode(image, ImageEncodeUtils::Format::Png, nullptr, &error));
    QVERIFY(!error.message.isEmpty());
}

void tst_ImageEncodeUtils::testFormatFromName()
{
    ImageEncodeUtils::Format format = ImageEncodeUtils::Format::Png;

    QVERIFY(ImageEncodeUtils::formatFromName(".JPG", &format));
    QCOMPARE(format, ImageEncodeUtils::Format::Jpeg);

    QVERIFY(ImageEncodeUtils::formatFromName("webp", &format));
    QCOMPARE(format, ImageEncodeUtils::Format::WebP);

    QVERIFY(ImageEncodeUtils::formatFromName(QByteArray(), &format));
    QCOMPARE(format, ImageEncodeUtils::Format::Png);

    QVERIFY(!ImageEncodeUtils::formatFromName("tiff", &format));
}

void tst_ImageEncodeUtils::testFormatName_ResolvesBack()
{
    QCOMPARE(ImageEncodeUtils::formatName(ImageEncodeUtils::Format::Png), QByteArray("png"));
    QCOMPARE(ImageEncodeUtils::formatName(ImageEncodeUtils::Format::Jpeg), QByteArray("jpeg"));
    QCOMPARE(ImageEncodeUtils::formatName(ImageEncodeUtils::Format::WebP), QByteArray("webp"));

    for (auto expected : { ImageEncodeUtils::Format::Png,
                           ImageEncodeUtils::Format::Jpeg,
                           ImageEncodeUtils::Format::WebP }) {
        ImageEncodeUtils::Format resolved = ImageEncodeUtils::Format::Png;
        QVERIFY(ImageEncodeUtils::formatFromName(ImageEncodeUtils::formatName(expected), &resolved));
        QCOMPARE(resolved, expected);
    }
}

void tst_ImageEncodeUtils::testMimeType()
{
    QCOMPARE(ImageEncodeUtils::mimeType(ImageEncodeUtils::Format::Png), QString("image/png"));
    QCOMPARE(ImageEncodeUtils::mimeType(ImageEncodeUtils::Format::Jpeg), QString("image/jpeg"));
    QCOMPARE(ImageEncodeUtils::mimeType(ImageEncodeUtils::Format::WebP), QString("image/webp"));
}

QTEST_MAIN(tst_ImageEncodeUtils)
#include "tst_ImageEncodeUtils.moc"
