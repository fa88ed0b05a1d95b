#include "annotations/InkStroke.h"
#include "Constants.h"

#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QtMath>

InkStroke::InkStroke(const QVector<QPointF> &points, const QColor &color, qreal width,
                     bool isHighlighter)
    : m_points(points)
    , m_color(color)
    , m_width(width)
    , m_isHighlighter(isHighlighter)
{
}

qreal InkStroke::opacity() const
{
    return m_isHighlighter ? ArchiNotes::Ink::kHighlighterOpacity : ArchiNotes::Ink::kOpaque;
}

InkStroke InkStroke::withPoint(const QPointF &point) const
{
    QVector<QPointF> points = m_points;
    points.append(point);
    return InkStroke(points, m_color, m_width, m_isHighlighter);
}

QRectF InkStroke::boundingRect() const
{
    if (m_points.isEmpty()) return QRectF();

    qreal minX = m_points[0].x();
    qreal maxX = m_points[0].x();
    qreal minY = m_points[0].y();
    qreal maxY = m_points[0].y();

    for (const QPointF &p : m_points) {
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
        minY = qMin(minY, p.y());
        maxY = qMax(maxY, p.y());
    }

    const qreal margin = m_width / 2.0;
    return QRectF(minX - margin, minY - margin,
                  (maxX - minX) + 2 * margin, (maxY - minY) + 2 * margin);
}

QPainterPath InkStroke::linePath() const
{
    QPainterPath path;
    if (m_points.size() < 2) {
        return path;
    }

    // Straight segments between samples, no curve fitting
    path.moveTo(m_points[0]);
    for (int i = 1; i < m_points.size(); ++i) {
        path.lineTo(m_points[i]);
    }
    return path;
}

bool InkStroke::hasPointWithin(const QPointF &center, qreal radius) const
{
    const qreal radiusSquared = radius * radius;
    for (const QPointF &p : m_points) {
        const qreal dx = p.x() - center.x();
        const qreal dy = p.y() - center.y();
        if (dx * dx + dy * dy < radiusSquared) {
            return true;
        }
    }
    return false;
}

void InkStroke::draw(QPainter &painter) const
{
    if (m_points.size() < 2) return;

    painter.save();

    QPen pen(m_color, m_width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setOpacity(opacity());

    // One path per stroke so a translucent stroke never darkens where it crosses itself
    painter.drawPath(linePath());

    painter.restore();
}

bool InkStroke::operator==(const InkStroke &other) const
{
    return m_isHighlighter == other.m_isHighlighter
        && qFuzzyCompare(m_width, other.m_width)
        && m_color == other.m_color
        && m_points == other.m_points;
}
