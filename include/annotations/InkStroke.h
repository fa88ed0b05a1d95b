#ifndef INKSTROKE_H
#define INKSTROKE_H

#include <QColor>
#include <QMetaType>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

class QPainter;
class QPainterPath;

/**
 * @brief Immutable freehand stroke in logical canvas coordinates.
 *
 * Marker and highlighter strokes share this type; the highlighter flag only
 * changes the render opacity. Points keep capture order. Copies share their
 * point storage, so history snapshots stay cheap.
 */
class InkStroke
{
public:
    InkStroke() = default;
    InkStroke(const QVector<QPointF> &points, const QColor &color, qreal width,
              bool isHighlighter = false);

    const QVector<QPointF> &points() const { return m_points; }
    int pointCount() const { return m_points.size(); }
    bool isEmpty() const { return m_points.isEmpty(); }

    QColor color() const { return m_color; }
    QString colorName() const { return m_color.name(QColor::HexRgb); }
    qreal width() const { return m_width; }
    bool isHighlighter() const { return m_isHighlighter; }
    qreal opacity() const;

    // Returns a new stroke with one more point; this stroke is left untouched.
    InkStroke withPoint(const QPointF &point) const;

    QRectF boundingRect() const;
    QPainterPath linePath() const;

    // True if any point of this stroke lies strictly closer than radius to center.
    bool hasPointWithin(const QPointF &center, qreal radius) const;

    // Needs at least two points; single-point strokes draw nothing.
    void draw(QPainter &painter) const;

    bool operator==(const InkStroke &other) const;
    bool operator!=(const InkStroke &other) const { return !(*this == other); }

private:
    QVector<QPointF> m_points;
    QColor m_color;
    qreal m_width = 1.0;
    bool m_isHighlighter = false;
};

using StrokeList = QVector<InkStroke>;

Q_DECLARE_METATYPE(InkStroke)

#endif // INKSTROKE_H
