#ifndef HIGHLIGHTERTOOLHANDLER_H
#define HIGHLIGHTERTOOLHANDLER_H

#include "FreehandToolHandler.h"

/**
 * @brief Tool handler for the semi-transparent highlighter.
 *
 * Strokes are wide and render at fixed 40% opacity.
 */
class HighlighterToolHandler : public FreehandToolHandler {
public:
    HighlighterToolHandler() = default;
    ~HighlighterToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Highlighter; }

    bool supportsColor() const override { return true; }
    bool supportsWidth() const override { return true; }

protected:
    CaptureStyle captureStyle(const ToolContext* ctx) const override;
    void finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                       const CaptureStyle& style) override;
};

#endif // HIGHLIGHTERTOOLHANDLER_H
