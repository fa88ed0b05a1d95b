#include "tools/handlers/HighlighterToolHandler.h"
#include "tools/ToolContext.h"

FreehandToolHandler::CaptureStyle HighlighterToolHandler::captureStyle(const ToolContext* ctx) const {
    CaptureStyle style;
    style.color = ctx->highlighterColor;
    style.width = ctx->highlighterWidth;
    style.translucent = true;
    return style;
}

void HighlighterToolHandler::finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                                           const CaptureStyle& style) {
    ctx->addStroke(InkStroke(points, style.color, style.width, true));
}
