#ifndef STROKESERIALIZER_H
#define STROKESERIALIZER_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "annotations/InkStroke.h"

/**
 * @brief JSON form of stroke lists, as persisted by the host document model.
 *
 * Each stroke is an object:
 * {"points": [{"x": 1, "y": 2}, ...], "color": "#ef4444", "width": 4, "isHighlighter": false}
 */
class StrokeSerializer
{
public:
    StrokeSerializer() = delete;

    static QJsonObject toJsonObject(const InkStroke& stroke);
    static QJsonArray toJsonArray(const StrokeList& strokes);
    static QByteArray toJson(const StrokeList& strokes, bool compact = true);

    // All-or-nothing: on failure *strokes is left untouched.
    static bool fromJsonObject(const QJsonObject& object, InkStroke* stroke, QString* errorMessage = nullptr);
    static bool fromJsonArray(const QJsonArray& array, StrokeList* strokes, QString* errorMessage = nullptr);
    static bool fromJson(const QByteArray& data, StrokeList* strokes, QString* errorMessage = nullptr);
};

#endif // STROKESERIALIZER_H
