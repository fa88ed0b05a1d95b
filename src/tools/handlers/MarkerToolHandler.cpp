#include "tools/handlers/MarkerToolHandler.h"
#include "tools/ToolContext.h"

FreehandToolHandler::CaptureStyle MarkerToolHandler::captureStyle(const ToolContext* ctx) const {
    CaptureStyle style;
    style.color = ctx->color;
    style.width = ctx->markerWidth;
    style.translucent = false;
    return style;
}

void MarkerToolHandler::finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                                      const CaptureStyle& style) {
    // A single point is kept; it just draws nothing
    ctx->addStroke(InkStroke(points, style.color, style.width, false));
}
