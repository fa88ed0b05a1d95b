#include "annotations/StrokeSerializer.h"

#include <QColor>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLatin1String>

namespace {

constexpr QLatin1String kKeyPoints("points");
constexpr QLatin1String kKeyColor("color");
constexpr QLatin1String kKeyWidth("width");
constexpr QLatin1String kKeyHighlighter("isHighlighter");
constexpr QLatin1String kKeyX("x");
constexpr QLatin1String kKeyY("y");

bool fail(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

} // namespace

QJsonObject StrokeSerializer::toJsonObject(const InkStroke& stroke)
{
    QJsonArray points;
    for (const QPointF& p : stroke.points()) {
        QJsonObject point;
        point.insert(kKeyX, p.x());
        point.insert(kKeyY, p.y());
        points.append(point);
    }

    QJsonObject object;
    object.insert(kKeyPoints, points);
    object.insert(kKeyColor, stroke.colorName());
    object.insert(kKeyWidth, stroke.width());
    object.insert(kKeyHighlighter, stroke.isHighlighter());
    return object;
}

QJsonArray StrokeSerializer::toJsonArray(const StrokeList& strokes)
{
    QJsonArray array;
    for (const InkStroke& stroke : strokes) {
        array.append(toJsonObject(stroke));
    }
    return array;
}

QByteArray StrokeSerializer::toJson(const StrokeList& strokes, bool compact)
{
    return QJsonDocument(toJsonArray(strokes))
        .toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented);
}

bool StrokeSerializer::fromJsonObject(const QJsonObject& object, InkStroke* stroke, QString* errorMessage)
{
    const QJsonValue pointsValue = object.value(kKeyPoints);
    if (!pointsValue.isArray()) {
        return fail(errorMessage, QStringLiteral("Stroke is missing a points array"));
    }

    const QJsonArray pointsArray = pointsValue.toArray();
    if (pointsArray.isEmpty()) {
        return fail(errorMessage, QStringLiteral("Stroke has no points"));
    }

    QVector<QPointF> points;
    points.reserve(pointsArray.size());
    for (const QJsonValue& value : pointsArray) {
        const QJsonObject point = value.toObject();
        const QJsonValue x = point.value(kKeyX);
        const QJsonValue y = point.value(kKeyY);
        if (!x.isDouble() || !y.isDouble()) {
            return fail(errorMessage, QStringLiteral("Stroke point is not numeric"));
        }
        points.append(QPointF(x.toDouble(), y.toDouble()));
    }

    const QColor color(object.value(kKeyColor).toString());
    if (!color.isValid()) {
        return fail(errorMessage, QStringLiteral("Stroke color '%1' is not a valid hex color")
                                      .arg(object.value(kKeyColor).toString()));
    }

    const double width = object.value(kKeyWidth).toDouble(0.0);
    if (width <= 0.0) {
        return fail(errorMessage, QStringLiteral("Stroke width must be positive"));
    }

    if (stroke) {
        *stroke = InkStroke(points, color, width, object.value(kKeyHighlighter).toBool(false));
    }
    return true;
}

bool StrokeSerializer::fromJsonArray(const QJsonArray& array, StrokeList* strokes, QString* errorMessage)
{
    StrokeList parsed;
    parsed.reserve(array.size());

    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            return fail(errorMessage, QStringLiteral("Stroke %1 is not an object").arg(i));
        }

        InkStroke stroke;
        QString strokeError;
        if (!fromJsonObject(array.at(i).toObject(), &stroke, &strokeError)) {
            return fail(errorMessage, QStringLiteral("Stroke %1: %2").arg(i).arg(strokeError));
        }
        parsed.append(stroke);
    }

    if (strokes) {
        *strokes = parsed;
    }
    return true;
}

bool StrokeSerializer::fromJson(const QByteArray& data, StrokeList* strokes, QString* errorMessage)
{
    if (errorMessage) {
        errorMessage->clear();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "StrokeSerializer: Rejected stroke data:" << parseError.errorString();
        return fail(errorMessage, QStringLiteral("Stroke data is not a JSON array"));
    }

    QString arrayError;
    if (!fromJsonArray(doc.array(), strokes, &arrayError)) {
        qWarning() << "StrokeSerializer: Rejected stroke data:" << arrayError;
        return fail(errorMessage, arrayError);
    }
    return true;
}
