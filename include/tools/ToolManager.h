#ifndef TOOLMANAGER_H
#define TOOLMANAGER_H

#include <QCursor>
#include <QObject>
#include <QPointF>
#include <memory>
#include <map>

#include "ToolId.h"
#include "ToolContext.h"
#include "IToolHandler.h"

class StrokeHistory;

/**
 * @brief Central manager for tool handling.
 *
 * Owns one handler per tool and dispatches pointer events to the handler
 * of the current tool. Also owns the shared context with the current
 * tool settings.
 */
class ToolManager : public QObject {
    Q_OBJECT

public:
    enum class CaptureState {
        Idle,
        Capturing
    };

    explicit ToolManager(QObject* parent = nullptr);
    ~ToolManager() override;

    /**
     * @brief Register a tool handler.
     *
     * The manager takes ownership of the handler.
     */
    void registerHandler(std::unique_ptr<IToolHandler> handler);

    /**
     * @brief Register marker, highlighter and eraser handlers.
     */
    void registerDefaultHandlers();

    /**
     * @brief Set the current active tool.
     *
     * A capture in progress with the previous tool is discarded.
     */
    void setCurrentTool(ToolId id);

    /**
     * @brief Get the current active tool.
     */
    ToolId currentTool() const { return m_currentToolId; }

    /**
     * @brief Get the current tool handler.
     */
    IToolHandler* currentHandler();

    /**
     * @brief Get a specific tool handler.
     */
    IToolHandler* handler(ToolId id);

    // Event dispatch methods (logical canvas coordinates)
    void handlePointerPress(const QPointF& pos);
    void handlePointerMove(const QPointF& pos);
    void handlePointerRelease();
    // Leaving the surface ends the gesture exactly like a release
    void handlePointerLeave();

    /**
     * @brief In-progress capture of the current tool, empty when idle.
     */
    InkStroke previewStroke() const;

    bool isDrawing() const;
    CaptureState captureState() const;

    QCursor currentCursor() const;

    /**
     * @brief Cancel current drawing operation.
     */
    void cancelDrawing();

    // Context management
    ToolContext* context() { return m_context.get(); }
    const ToolContext* context() const { return m_context.get(); }

    void setStrokeHistory(StrokeHistory* history);

    // Drawing settings
    void setColor(const QColor& color);
    QColor color() const { return m_context->color; }

    void setHighlighterColor(const QColor& color);
    QColor highlighterColor() const { return m_context->highlighterColor; }

    void setMarkerWidth(qreal width);
    qreal markerWidth() const { return m_context->markerWidth; }

    void setHighlighterWidth(qreal width);
    qreal highlighterWidth() const { return m_context->highlighterWidth; }

    void setEraserRadius(qreal radius);
    qreal eraserRadius() const { return m_context->eraserRadius; }

    void setEraserPreviewColor(const QColor& color);
    QColor eraserPreviewColor() const { return m_context->eraserPreviewColor; }

signals:
    /**
     * @brief Emitted when the current tool changes.
     */
    void toolChanged(ToolId newTool);

    /**
     * @brief Emitted when a capture starts.
     */
    void drawingStarted();

    /**
     * @brief Emitted when a capture is committed or discarded.
     */
    void drawingFinished();

    /**
     * @brief Emitted when a repaint is needed.
     */
    void needsRepaint();

private:
    const IToolHandler* currentHandler() const;

    std::map<ToolId, std::unique_ptr<IToolHandler>> m_handlers;
    std::unique_ptr<ToolContext> m_context;
    ToolId m_currentToolId = ToolId::Marker;
};

#endif // TOOLMANAGER_H
