#ifndef ERASERTOOLHANDLER_H
#define ERASERTOOLHANDLER_H

#include "FreehandToolHandler.h"

#include <QPixmap>

/**
 * @brief Tool handler for erasing whole strokes.
 *
 * The gesture previews in the surface backdrop color; strokes are only
 * removed on release, for every stroke the path came within the context's
 * eraser radius of.
 */
class EraserToolHandler : public FreehandToolHandler {
public:
    EraserToolHandler() = default;
    ~EraserToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Eraser; }

    void onActivate(ToolContext* ctx) override;

    bool supportsColor() const override { return false; }
    bool supportsWidth() const override { return false; }

    QCursor cursor() const override;

    // Strokes removed by the last completed gesture
    int lastRemovedCount() const { return m_lastRemovedCount; }

protected:
    CaptureStyle captureStyle(const ToolContext* ctx) const override;
    void finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                       const CaptureStyle& style) override;

private:
    QPixmap createCursorPixmap(int diameter) const;

    int m_lastRemovedCount = 0;
    qreal m_cursorRadius = 0.0;

    // Cached cursor (regenerated when the radius changes)
    mutable QCursor m_cachedCursor;
    mutable qreal m_cachedCursorRadius = 0.0;
};

#endif // ERASERTOOLHANDLER_H
