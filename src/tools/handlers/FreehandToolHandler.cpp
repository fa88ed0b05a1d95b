#include "tools/handlers/FreehandToolHandler.h"
#include "tools/ToolContext.h"

void FreehandToolHandler::onPointerPress(ToolContext* ctx, const QPointF& pos) {
    // Only the primary pointer drives a capture
    if (m_isDrawing) {
        return;
    }

    m_isDrawing = true;
    m_style = captureStyle(ctx);
    m_points.clear();
    m_points.append(pos);

    ctx->repaint();
}

void FreehandToolHandler::onPointerMove(ToolContext* ctx, const QPointF& pos) {
    if (!m_isDrawing) {
        return;
    }

    m_points.append(pos);
    ctx->repaint();
}

void FreehandToolHandler::onPointerRelease(ToolContext* ctx) {
    if (!m_isDrawing) {
        return;
    }

    const QVector<QPointF> points = m_points;
    const CaptureStyle style = m_style;

    // Back to idle before handing off, so a repaint triggered by the
    // commit no longer shows the preview
    reset();

    if (!points.isEmpty()) {
        finishCapture(ctx, points, style);
    }

    ctx->repaint();
}

InkStroke FreehandToolHandler::previewStroke() const {
    if (!m_isDrawing || m_points.isEmpty()) {
        return InkStroke();
    }
    return InkStroke(m_points, m_style.color, m_style.width, m_style.translucent);
}

void FreehandToolHandler::cancelDrawing() {
    reset();
}

void FreehandToolHandler::reset() {
    m_isDrawing = false;
    m_points.clear();
    m_style = CaptureStyle();
}
