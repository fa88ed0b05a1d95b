#ifndef TOOLCONTEXT_H
#define TOOLCONTEXT_H

#include <QColor>
#include <QPointF>
#include <QVector>
#include <functional>

#include "Constants.h"
#include "annotations/InkStroke.h"
#include "annotations/StrokeHistory.h"

/**
 * @brief Shared context passed to tool handlers.
 *
 * Holds the stroke history that completed captures land in, the current
 * tool settings, and host callbacks.
 */
class ToolContext {
public:
    // History for committed strokes
    StrokeHistory* history = nullptr;

    // Current drawing settings
    QColor color = ArchiNotes::Palette::kRed;
    QColor highlighterColor = ArchiNotes::Palette::kYellow;
    qreal markerWidth = ArchiNotes::Ink::kMarkupMarkerWidth;
    qreal highlighterWidth = ArchiNotes::Ink::kHighlighterWidth;

    // Eraser settings
    qreal eraserRadius = ArchiNotes::Ink::kDefaultEraserRadius;
    QColor eraserPreviewColor = ArchiNotes::Palette::kPaperWhite;

    // Callbacks
    std::function<void()> requestRepaint;
    std::function<void(const InkStroke&)> commitStroke;
    std::function<void(int removedCount)> notifyErased;

    /**
     * @brief Commit a finished stroke.
     *
     * Uses the callback when set, otherwise the history directly.
     */
    void addStroke(const InkStroke& stroke) {
        if (commitStroke) {
            commitStroke(stroke);
        } else if (history) {
            history->commit(stroke);
        }
    }

    /**
     * @brief Remove every committed stroke the eraser path touches.
     */
    int eraseAlong(const QVector<QPointF>& eraserPoints) {
        if (!history) {
            return 0;
        }
        const int removed = history->eraseAlong(eraserPoints, eraserRadius);
        if (notifyErased) {
            notifyErased(removed);
        }
        return removed;
    }

    /**
     * @brief Request a repaint of the canvas.
     */
    void repaint() {
        if (requestRepaint) {
            requestRepaint();
        }
    }
};

#endif // TOOLCONTEXT_H
