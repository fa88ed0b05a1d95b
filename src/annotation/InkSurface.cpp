#include "annotation/InkSurface.h"
#include "utils/ImageSourceReader.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QPointer>
#include <QtConcurrent>
#include <QtMath>

InkSurface::InkSurface(const QSize& logicalSize, QObject* parent)
    : QObject(parent)
    , m_logicalSize(logicalSize)
{
}

InkSurface::~InkSurface() = default;

QSize InkSurface::deriveLogicalSize(const QSize& imageSize, const QSize& maxSize)
{
    if (imageSize.width() <= 0 || imageSize.height() <= 0) {
        return QSize();
    }

    qreal width = imageSize.width();
    qreal height = imageSize.height();

    if (maxSize.width() > 0 && width > maxSize.width()) {
        height *= maxSize.width() / width;
        width = maxSize.width();
    }
    if (maxSize.height() > 0 && height > maxSize.height()) {
        width *= maxSize.height() / height;
        height = maxSize.height();
    }

    return QSize(qMax(1, qRound(width)), qMax(1, qRound(height)));
}

bool InkSurface::isValid() const
{
    return !m_disposed && m_logicalSize.width() > 0 && m_logicalSize.height() > 0;
}

void InkSurface::setBackground(const QImage& image)
{
    if (m_disposed) {
        return;
    }

    // Supersede any decode still in flight
    m_generation++;
    m_pending = false;
    m_background = image;
    emit backgroundReady();
}

void InkSurface::clearBackground()
{
    if (m_disposed) {
        return;
    }

    m_generation++;
    m_pending = false;
    m_background = QImage();
    emit backgroundReady();
}

void InkSurface::loadBackground(const QString& source)
{
    if (m_disposed) {
        return;
    }

    const quint64 generation = ++m_generation;
    m_pending = true;

    qDebug() << "InkSurface: Loading background, generation" << generation;

    m_future = QtConcurrent::run([source]() {
        DecodeResult result;
        result.image = ImageSourceReader::read(source, &result.error);
        return result;
    });

    QPointer<InkSurface> weakThis = this;
    auto* watcher = new QFutureWatcher<DecodeResult>(this);
    connect(watcher, &QFutureWatcher<DecodeResult>::finished, this, [weakThis, watcher, generation]() {
        const DecodeResult result = watcher->result();
        watcher->deleteLater();
        if (!weakThis) {
            return;
        }
        weakThis->applyDecodeResult(generation, result);
    });
    watcher->setFuture(m_future);
}

bool InkSurface::waitForBackground()
{
    if (m_pending && !m_disposed) {
        m_future.waitForFinished();
        applyDecodeResult(m_generation, m_future.result());
    }
    return hasBackground();
}

void InkSurface::dispose()
{
    if (m_disposed) {
        return;
    }

    m_disposed = true;
    m_pending = false;
    m_generation++;
    m_background = QImage();
    qDebug() << "InkSurface: Disposed";
    emit disposed();
}

void InkSurface::applyDecodeResult(quint64 generation, const DecodeResult& result)
{
    // Stale: surface torn down, load superseded, or already applied by waitForBackground()
    if (m_disposed || generation != m_generation || !m_pending) {
        return;
    }

    m_pending = false;

    if (result.image.isNull()) {
        const QString reason = result.error.isEmpty()
            ? QStringLiteral("Failed to decode background image")
            : result.error;
        qWarning() << "InkSurface: Background decode failed:" << reason;
        m_background = QImage();
        emit backgroundFailed(reason);
        return;
    }

    m_background = result.image;
    qDebug() << "InkSurface: Background ready" << m_background.size()
             << "logical" << m_logicalSize;
    emit backgroundReady();
}
