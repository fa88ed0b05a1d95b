#ifndef FREEHANDTOOLHANDLER_H
#define FREEHANDTOOLHANDLER_H

#include "../IToolHandler.h"

#include <QColor>
#include <QPointF>
#include <QVector>

/**
 * @brief Shared capture state machine for pointer-driven tools.
 *
 * Idle -> Capturing on press, one point per move, and on release the
 * captured points are handed to finishCapture(). The style (color, width,
 * opacity) is recorded when the capture starts and used for the preview.
 * Moves are never deduplicated or simplified.
 */
class FreehandToolHandler : public IToolHandler {
public:
    ~FreehandToolHandler() override = default;

    void onPointerPress(ToolContext* ctx, const QPointF& pos) override;
    void onPointerMove(ToolContext* ctx, const QPointF& pos) override;
    void onPointerRelease(ToolContext* ctx) override;

    InkStroke previewStroke() const override;
    bool isDrawing() const override { return m_isDrawing; }
    QVector<QPointF> capturedPoints() const override { return m_points; }
    void cancelDrawing() override;

protected:
    struct CaptureStyle {
        QColor color;
        qreal width = 1.0;
        bool translucent = false;
    };

    // Style to record at pointer-down
    virtual CaptureStyle captureStyle(const ToolContext* ctx) const = 0;

    // Called once per gesture on release with at least one point
    virtual void finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                               const CaptureStyle& style) = 0;

private:
    void reset();

    bool m_isDrawing = false;
    QVector<QPointF> m_points;
    CaptureStyle m_style;
};

#endif // FREEHANDTOOLHANDLER_H
