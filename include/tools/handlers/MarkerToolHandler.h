#ifndef MARKERTOOLHANDLER_H
#define MARKERTOOLHANDLER_H

#include "FreehandToolHandler.h"

/**
 * @brief Tool handler for the opaque marker pen.
 */
class MarkerToolHandler : public FreehandToolHandler {
public:
    MarkerToolHandler() = default;
    ~MarkerToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Marker; }

    bool supportsColor() const override { return true; }
    bool supportsWidth() const override { return true; }

protected:
    CaptureStyle captureStyle(const ToolContext* ctx) const override;
    void finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                       const CaptureStyle& style) override;
};

#endif // MARKERTOOLHANDLER_H
