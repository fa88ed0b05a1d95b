#ifndef ITOOLHANDLER_H
#define ITOOLHANDLER_H

#include <QCursor>
#include <QPointF>
#include <QVector>

#include "ToolId.h"
#include "annotations/InkStroke.h"

class ToolContext;

/**
 * @brief Abstract interface for tool behavior handlers.
 *
 * Each tool implements this interface to define how a pointer gesture
 * becomes a committed stroke or an erase. The ToolManager dispatches
 * events to the handler of the current tool. All positions are in
 * logical canvas coordinates.
 */
class IToolHandler {
public:
    virtual ~IToolHandler() = default;

    /**
     * @brief Get the tool ID this handler is responsible for.
     */
    virtual ToolId toolId() const = 0;

    /**
     * @brief Called when this tool becomes active.
     */
    virtual void onActivate(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief Called when this tool is deactivated.
     */
    virtual void onDeactivate(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief Called when the primary pointer goes down.
     */
    virtual void onPointerPress(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called for each pointer move while the pointer is down.
     */
    virtual void onPointerMove(ToolContext* ctx, const QPointF& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when the pointer goes up or leaves the surface.
     */
    virtual void onPointerRelease(ToolContext* ctx) { Q_UNUSED(ctx); }

    /**
     * @brief The in-progress capture rendered with the captured tool style.
     *
     * Empty when nothing is being captured.
     */
    virtual InkStroke previewStroke() const { return InkStroke(); }

    /**
     * @brief Check if a capture is in progress.
     */
    virtual bool isDrawing() const { return false; }

    /**
     * @brief Points captured so far, in capture order.
     */
    virtual QVector<QPointF> capturedPoints() const { return QVector<QPointF>(); }

    /**
     * @brief Discard the current capture without committing.
     */
    virtual void cancelDrawing() {}

    /**
     * @brief Check if this tool supports color selection.
     */
    virtual bool supportsColor() const { return false; }

    /**
     * @brief Check if this tool supports width adjustment.
     */
    virtual bool supportsWidth() const { return false; }

    /**
     * @brief Get the cursor for this tool.
     */
    virtual QCursor cursor() const { return Qt::CrossCursor; }
};

#endif // ITOOLHANDLER_H
