#include "annotation/AnnotationSession.h"
#include "annotation/InkRenderer.h"
#include "annotation/InkSurface.h"
#include "annotations/StrokeHistory.h"
#include "annotations/StrokeSerializer.h"
#include "settings/AnnotationSettingsManager.h"
#include "tools/ToolManager.h"
#include "utils/ImageSourceReader.h"

#include <QDebug>
#include <QTimer>

namespace {

// Stored preferences override the preset values of a valid profile
AnnotationProfile resolveProfile(const AnnotationProfile& profile)
{
    if (!profile.isValid()) {
        qWarning() << "AnnotationSession: Invalid profile" << profile.name << ", using markup defaults";
        return AnnotationSettingsManager::instance().loadProfile(AnnotationProfile::imageMarkup());
    }
    return AnnotationSettingsManager::instance().loadProfile(profile);
}

} // namespace

AnnotationSession::AnnotationSession(const AnnotationProfile& profile, QObject* parent)
    : QObject(parent)
    , m_profile(resolveProfile(profile))
    , m_history(new StrokeHistory(this))
    , m_toolManager(new ToolManager(this))
{
    m_toolManager->setStrokeHistory(m_history);
    m_toolManager->registerDefaultHandlers();
    applyProfileToTools();

    connect(m_history, &StrokeHistory::changed, this, [this]() {
        emit strokesChanged();
        markDirty();
    });
    connect(m_toolManager, &ToolManager::needsRepaint, this, &AnnotationSession::markDirty);
    connect(m_toolManager, &ToolManager::toolChanged, this, &AnnotationSession::toolChanged);
}

AnnotationSession::~AnnotationSession() = default;

void AnnotationSession::applyProfileToTools()
{
    m_toolManager->setColor(m_profile.defaultColor);
    m_toolManager->setHighlighterColor(m_profile.highlighterColor);
    m_toolManager->setMarkerWidth(m_profile.markerWidth);
    m_toolManager->setHighlighterWidth(m_profile.highlighterWidth);
    m_toolManager->setEraserRadius(m_profile.eraserRadius);
    m_toolManager->setEraserPreviewColor(m_profile.eraserPreviewColor);
    m_toolManager->setCurrentTool(m_profile.defaultTool);
}

// ============================================================================
// Lifecycle
// ============================================================================

QSize AnnotationSession::logicalSizeFor(const QSize& imageSize) const
{
    const QSize derived = InkSurface::deriveLogicalSize(imageSize, m_profile.maxLogicalSize);
    return derived.isValid() ? derived : m_profile.blankLogicalSize;
}

InkSurface* AnnotationSession::createSurfaceForSource(const QString& source)
{
    QString probeError;
    const QSize imageSize = ImageSourceReader::probeSize(source, &probeError);
    if (!imageSize.isValid()) {
        qWarning() << "AnnotationSession: Cannot read background size, using blank size:" << probeError;
    }

    auto* surface = new InkSurface(logicalSizeFor(imageSize), this);
    installSurface(surface);
    surface->loadBackground(source);
    return surface;
}

InkSurface* AnnotationSession::createSurfaceForImage(const QImage& background)
{
    auto* surface = new InkSurface(logicalSizeFor(background.size()), this);
    installSurface(surface);
    if (!background.isNull()) {
        surface->setBackground(background);
    }
    return surface;
}

void AnnotationSession::installSurface(InkSurface* surface)
{
    m_surface = surface;

    connect(surface, &InkSurface::backgroundReady, this, [this]() {
        emit backgroundReady();
        markDirty();
    });
    connect(surface, &InkSurface::backgroundFailed, this, [this](const QString& reason) {
        emit backgroundFailed(reason);
        markDirty();
    });

    qDebug() << "AnnotationSession: Surface" << m_profile.name << surface->logicalSize();
}

void AnnotationSession::teardownSurface()
{
    m_toolManager->cancelDrawing();

    if (m_surface) {
        InkSurface* old = m_surface;
        m_surface = nullptr;
        old->disconnect(this);
        old->dispose();
        old->deleteLater();
    }
}

void AnnotationSession::open(const QString& source, const StrokeList& strokes)
{
    teardownSurface();
    createSurfaceForSource(source);
    m_history->reset(strokes);
    markDirty();
}

void AnnotationSession::open(const QImage& background, const StrokeList& strokes)
{
    teardownSurface();
    createSurfaceForImage(background);
    m_history->reset(strokes);
    markDirty();
}

void AnnotationSession::openBlank(const StrokeList& strokes)
{
    open(QImage(), strokes);
}

bool AnnotationSession::openWithJson(const QString& source, const QByteArray& strokesJson,
                                     QString* errorMessage)
{
    StrokeList strokes;
    if (!strokesJson.trimmed().isEmpty()
        && !StrokeSerializer::fromJson(strokesJson, &strokes, errorMessage)) {
        return false;
    }

    if (source.isEmpty()) {
        openBlank(strokes);
    } else {
        open(source, strokes);
    }
    return true;
}

bool AnnotationSession::isOpen() const
{
    return m_surface && !m_surface->isDisposed();
}

void AnnotationSession::replaceBackground(const QString& source)
{
    const StrokeList kept = m_profile.keepStrokesOnBackgroundChange ? m_history->strokes() : StrokeList();

    teardownSurface();
    InkSurface* surface = createSurfaceForSource(source);
    m_history->reset(kept);
    emit surfaceReplaced(surface->logicalSize());
    markDirty();
}

void AnnotationSession::replaceBackground(const QImage& background)
{
    const StrokeList kept = m_profile.keepStrokesOnBackgroundChange ? m_history->strokes() : StrokeList();

    teardownSurface();
    InkSurface* surface = createSurfaceForImage(background);
    m_history->reset(kept);
    emit surfaceReplaced(surface->logicalSize());
    markDirty();
}

void AnnotationSession::clearAll()
{
    m_toolManager->cancelDrawing();
    m_history->clear();

    // Dropping the background also drops its size; go back to the blank surface
    teardownSurface();
    InkSurface* surface = createSurfaceForImage(QImage());
    emit surfaceReplaced(surface->logicalSize());
    markDirty();
}

StrokeList AnnotationSession::save()
{
    // A half-finished gesture is not part of the saved result
    m_toolManager->cancelDrawing();

    const StrokeList result = m_history->strokes();
    qDebug() << "AnnotationSession: Saved" << result.size() << "strokes";
    emit saved(result);
    return result;
}

QByteArray AnnotationSession::saveJson(bool compact)
{
    return StrokeSerializer::toJson(save(), compact);
}

void AnnotationSession::cancel()
{
    teardownSurface();
    m_history->clear();
    m_frame = QImage();
    qDebug() << "AnnotationSession: Cancelled";
    emit cancelled();
}

void AnnotationSession::close()
{
    teardownSurface();
    m_history->clear();
    m_frame = QImage();
    emit closed();
}

// ============================================================================
// Input
// ============================================================================

void AnnotationSession::pointerPress(const QPointF& pos)
{
    if (!isOpen()) {
        return;
    }
    m_toolManager->handlePointerPress(pos);
}

void AnnotationSession::pointerMove(const QPointF& pos)
{
    if (!isOpen()) {
        return;
    }
    m_toolManager->handlePointerMove(pos);
}

void AnnotationSession::pointerRelease()
{
    m_toolManager->handlePointerRelease();
}

void AnnotationSession::pointerLeave()
{
    m_toolManager->handlePointerLeave();
}

bool AnnotationSession::isCapturing() const
{
    return m_toolManager->isDrawing();
}

// ============================================================================
// Tools
// ============================================================================

void AnnotationSession::setTool(ToolId tool)
{
    m_toolManager->setCurrentTool(tool);
}

ToolId AnnotationSession::tool() const
{
    return m_toolManager->currentTool();
}

void AnnotationSession::setColor(const QColor& color)
{
    if (color.isValid()) {
        m_toolManager->setColor(color);
    }
}

QColor AnnotationSession::color() const
{
    return m_toolManager->color();
}

void AnnotationSession::setMarkerWidth(qreal width)
{
    m_toolManager->setMarkerWidth(width);
}

void AnnotationSession::setHighlighterWidth(qreal width)
{
    m_toolManager->setHighlighterWidth(width);
}

void AnnotationSession::setEraserRadius(qreal radius)
{
    m_toolManager->setEraserRadius(radius);
}

qreal AnnotationSession::eraserRadius() const
{
    return m_toolManager->eraserRadius();
}

void AnnotationSession::saveToolSettings() const
{
    auto& settings = AnnotationSettingsManager::instance();
    settings.saveColor(m_profile.name, m_toolManager->color());
    settings.saveMarkerWidth(m_profile.name, m_toolManager->markerWidth());
    settings.saveHighlighterWidth(m_profile.name, m_toolManager->highlighterWidth());
    settings.saveEraserRadius(m_profile.name, m_toolManager->eraserRadius());
}

// ============================================================================
// History
// ============================================================================

void AnnotationSession::undo()
{
    m_history->undo();
}

void AnnotationSession::redo()
{
    m_history->redo();
}

bool AnnotationSession::canUndo() const
{
    return m_history->canUndo();
}

bool AnnotationSession::canRedo() const
{
    return m_history->canRedo();
}

void AnnotationSession::clearStrokes()
{
    m_toolManager->cancelDrawing();
    m_history->clear();
}

StrokeList AnnotationSession::strokes() const
{
    return m_history->strokes();
}

// ============================================================================
// Rendering
// ============================================================================

QSize AnnotationSession::logicalSize() const
{
    return m_surface ? m_surface->logicalSize() : QSize();
}

void AnnotationSession::markDirty()
{
    if (m_renderPending) {
        return;
    }

    m_renderPending = true;
    QTimer::singleShot(0, this, [this]() {
        // renderNow() may already have consumed this mark
        if (m_renderPending) {
            renderNow();
        }
    });
}

void AnnotationSession::renderNow()
{
    m_renderPending = false;

    if (!isOpen()) {
        m_frame = QImage();
        return;
    }

    const InkRenderer::Scene scene =
        InkRenderer::sceneFor(m_surface, m_history->strokes(), m_toolManager->previewStroke());
    m_frame = InkRenderer::renderToImage(scene);
    m_renderCount++;
    emit frameRendered();
}

// ============================================================================
// Export
// ============================================================================

bool AnnotationSession::exportImage(QImage* output, InkCompositor::Error* error)
{
    return InkCompositor::composite(m_surface, m_history->strokes(), output, error);
}

bool AnnotationSession::exportEncoded(const ImageEncodeUtils::Options& options, QByteArray* output,
                                      InkCompositor::Error* error)
{
    return InkCompositor::compositeEncoded(m_surface, m_history->strokes(), options, output, error);
}
