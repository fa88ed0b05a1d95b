#ifndef ANNOTATIONSESSION_H
#define ANNOTATIONSESSION_H

#include "annotation/AnnotationProfile.h"
#include "annotation/InkCompositor.h"
#include "annotations/InkStroke.h"
#include "tools/ToolId.h"
#include "utils/ImageEncodeUtils.h"

#include <QByteArray>
#include <QImage>
#include <QObject>
#include <QPointF>
#include <QSize>
#include <QString>

class InkSurface;
class StrokeHistory;
class ToolManager;

/**
 * @brief One open annotation surface: surface, stroke history and tools.
 *
 * Used unchanged by the image markup tool and the project whiteboard; the
 * AnnotationProfile carries their differences. Pointer positions passed in
 * are already in logical canvas coordinates.
 *
 * Every state change marks the frame dirty; marks made in the same event
 * loop iteration coalesce into one render.
 */
class AnnotationSession : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationSession(const AnnotationProfile& profile = AnnotationProfile::imageMarkup(),
                               QObject* parent = nullptr);
    ~AnnotationSession() override;

    const AnnotationProfile& profile() const { return m_profile; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Open a surface over a background reference.
     *
     * The logical size comes from the image header; pixels decode in the
     * background. An unreadable source falls back to the blank size and
     * emits backgroundFailed() once the decode gives up.
     */
    void open(const QString& source, const StrokeList& strokes = StrokeList());
    void open(const QImage& background, const StrokeList& strokes = StrokeList());
    void openBlank(const StrokeList& strokes = StrokeList());

    /**
     * @brief Seed strokes from their persisted JSON form.
     * @return false without changing anything if the JSON is malformed
     */
    bool openWithJson(const QString& source, const QByteArray& strokesJson,
                      QString* errorMessage = nullptr);

    bool isOpen() const;

    /**
     * @brief Swap the background for a new one.
     *
     * Creates a new surface sized for the new image. Strokes are kept or
     * dropped according to the profile; kept strokes are not rescaled.
     */
    void replaceBackground(const QString& source);
    void replaceBackground(const QImage& background);

    /**
     * @brief Trash action: remove every stroke and the background.
     */
    void clearAll();

    /**
     * @brief Hand back the committed strokes and emit saved().
     */
    StrokeList save();
    QByteArray saveJson(bool compact = true);

    /**
     * @brief Tear the surface down without producing strokes.
     */
    void cancel();

    /**
     * @brief Tear the surface down quietly.
     */
    void close();

    // =========================================================================
    // Input (logical canvas coordinates)
    // =========================================================================
    void pointerPress(const QPointF& pos);
    void pointerMove(const QPointF& pos);
    void pointerRelease();
    void pointerLeave();

    bool isCapturing() const;

    // =========================================================================
    // Tools
    // =========================================================================
    void setTool(ToolId tool);
    ToolId tool() const;

    void setColor(const QColor& color);
    QColor color() const;

    void setMarkerWidth(qreal width);
    void setHighlighterWidth(qreal width);
    void setEraserRadius(qreal radius);
    qreal eraserRadius() const;

    /**
     * @brief Store the current color, widths and eraser radius for this profile.
     */
    void saveToolSettings() const;

    ToolManager* toolManager() const { return m_toolManager; }

    // =========================================================================
    // History
    // =========================================================================
    void undo();
    void redo();
    bool canUndo() const;
    bool canRedo() const;
    void clearStrokes();

    StrokeList strokes() const;
    StrokeHistory* history() const { return m_history; }

    // =========================================================================
    // Rendering
    // =========================================================================
    InkSurface* surface() const { return m_surface; }
    QSize logicalSize() const;

    void markDirty();
    void renderNow();
    bool isRenderPending() const { return m_renderPending; }
    int renderCount() const { return m_renderCount; }

    /**
     * @brief Last rendered frame, including the in-progress capture.
     */
    QImage frame() const { return m_frame; }

    // =========================================================================
    // Export
    // =========================================================================
    bool exportImage(QImage* output, InkCompositor::Error* error = nullptr);
    bool exportEncoded(const ImageEncodeUtils::Options& options, QByteArray* output,
                       InkCompositor::Error* error = nullptr);

signals:
    void frameRendered();
    void strokesChanged();
    void backgroundReady();
    void backgroundFailed(const QString& reason);
    void surfaceReplaced(const QSize& logicalSize);
    void toolChanged(ToolId tool);
    void saved(const StrokeList& strokes);
    void cancelled();
    void closed();

private:
    void applyProfileToTools();
    void installSurface(InkSurface* surface);
    void teardownSurface();
    QSize logicalSizeFor(const QSize& imageSize) const;
    InkSurface* createSurfaceForSource(const QString& source);
    InkSurface* createSurfaceForImage(const QImage& background);

    AnnotationProfile m_profile;
    InkSurface* m_surface = nullptr;
    StrokeHistory* m_history = nullptr;
    ToolManager* m_toolManager = nullptr;

    QImage m_frame;
    bool m_renderPending = false;
    int m_renderCount = 0;
};

#endif // ANNOTATIONSESSION_H
