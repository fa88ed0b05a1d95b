#include "tools/handlers/EraserToolHandler.h"
#include "tools/ToolContext.h"

#include <QDebug>
#include <QPainter>
#include <QPen>
#include <QtMath>

void EraserToolHandler::onActivate(ToolContext* ctx) {
    m_cursorRadius = ctx->eraserRadius;
}

FreehandToolHandler::CaptureStyle EraserToolHandler::captureStyle(const ToolContext* ctx) const {
    // Preview only: drawn like a marker in the backdrop color
    CaptureStyle style;
    style.color = ctx->eraserPreviewColor;
    style.width = ctx->markerWidth;
    style.translucent = false;
    return style;
}

void EraserToolHandler::finishCapture(ToolContext* ctx, const QVector<QPointF>& points,
                                      const CaptureStyle& style) {
    Q_UNUSED(style);

    m_cursorRadius = ctx->eraserRadius;
    m_lastRemovedCount = ctx->eraseAlong(points);
    qDebug() << "EraserToolHandler: Removed" << m_lastRemovedCount << "strokes along"
             << points.size() << "points";
}

QCursor EraserToolHandler::cursor() const {
    const qreal radius = m_cursorRadius > 0.0 ? m_cursorRadius : ArchiNotes::Ink::kDefaultEraserRadius;

    // Return cached cursor if the radius hasn't changed
    if (qFuzzyCompare(m_cachedCursorRadius, radius) && !m_cachedCursor.pixmap().isNull()) {
        return m_cachedCursor;
    }

    QPixmap pixmap = createCursorPixmap(qRound(radius * 2));
    int hotspot = pixmap.width() / 2;
    m_cachedCursor = QCursor(pixmap, hotspot, hotspot);
    m_cachedCursorRadius = radius;

    return m_cachedCursor;
}

QPixmap EraserToolHandler::createCursorPixmap(int diameter) const {
    int size = diameter + 4;  // Add margin for border
    QPixmap pixmap(size, size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing, true);

    int center = size / 2;
    int radius = diameter / 2;

    // Draw semi-transparent fill
    painter.setBrush(QColor(200, 200, 200, 40));
    painter.setPen(Qt::NoPen);
    painter.drawEllipse(QPoint(center, center), radius, radius);

    // Draw circle border
    painter.setPen(QPen(QColor(80, 80, 80), 1, Qt::SolidLine));
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(QPoint(center, center), radius, radius);

    return pixmap;
}
