#ifndef INKSURFACE_H
#define INKSURFACE_H

#include <QFuture>
#include <QImage>
#include <QObject>
#include <QSize>
#include <QString>

/**
 * @brief Logical canvas of one annotation surface plus its background raster.
 *
 * The logical size is fixed for the surface's lifetime. The background may be
 * decoded asynchronously; results of a load that was superseded, or that
 * completes after dispose(), are dropped.
 */
class InkSurface : public QObject
{
    Q_OBJECT

public:
    explicit InkSurface(const QSize& logicalSize, QObject* parent = nullptr);
    ~InkSurface() override;

    /**
     * @brief Fit an intrinsic image size inside maxSize, preserving aspect ratio.
     *
     * Images that already fit are kept at their intrinsic size. A non-positive
     * dimension in maxSize leaves that axis unbounded.
     */
    static QSize deriveLogicalSize(const QSize& imageSize, const QSize& maxSize);

    QSize logicalSize() const { return m_logicalSize; }
    int logicalWidth() const { return m_logicalSize.width(); }
    int logicalHeight() const { return m_logicalSize.height(); }

    /**
     * @brief Surface can be rendered and exported.
     */
    bool isValid() const;

    // Background raster
    bool hasBackground() const { return !m_background.isNull(); }
    QImage background() const { return m_background; }

    /**
     * @brief Install an already decoded background. Supersedes any pending load.
     */
    void setBackground(const QImage& image);

    /**
     * @brief Start decoding a background reference on the thread pool.
     *
     * Emits backgroundReady() or backgroundFailed() on the GUI thread.
     */
    void loadBackground(const QString& source);

    void clearBackground();

    bool isBackgroundPending() const { return m_pending; }

    /**
     * @brief Block until a pending decode finishes and apply its result.
     * @return true if a background is present afterwards
     */
    bool waitForBackground();

    /**
     * @brief Tear the surface down. Pending decode results are discarded.
     */
    void dispose();
    bool isDisposed() const { return m_disposed; }

    quint64 loadGeneration() const { return m_generation; }

signals:
    void backgroundReady();
    void backgroundFailed(const QString& reason);
    void disposed();

private:
    struct DecodeResult {
        QImage image;
        QString error;
    };

    void applyDecodeResult(quint64 generation, const DecodeResult& result);

    QSize m_logicalSize;
    QImage m_background;

    QFuture<DecodeResult> m_future;
    quint64 m_generation = 0;
    bool m_pending = false;
    bool m_disposed = false;
};

#endif // INKSURFACE_H
