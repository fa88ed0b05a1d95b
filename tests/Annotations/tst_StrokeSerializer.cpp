#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "annotations/StrokeSerializer.h"

/**
 * @brief Tests for StrokeSerializer persisted JSON shape.
 */
class TestStrokeSerializer : public QObject
{
    Q_OBJECT

private slots:
    // Writing
    void testToJsonObject_Shape();
    void testToJson_EmptyList();

    // Reading
    void testFromJson_PersistedDocument();
    void testFromJson_MissingHighlighterDefaultsToMarker();
    void testFromJson_PreservesPointOrder();

    // Rejection
    void testFromJson_RejectsInvalid_data();
    void testFromJson_RejectsInvalid();
    void testFromJson_FailureLeavesOutputUntouched();
};

// ============================================================================
// Writing
// ============================================================================

void TestStrokeSerializer::testToJsonObject_Shape()
{
    InkStroke stroke({ QPointF(1.5, 2), QPointF(3, 4) }, QColor("#ef4444"), 4.0, true);
    const QJsonObject object = StrokeSerializer::toJsonObject(stroke);

    QCOMPARE(object.value("color").toString(), QString("#ef4444"));
    QCOMPARE(object.value("width").toDouble(), 4.0);
    QCOMPARE(object.value("isHighlighter").toBool(), true);

    const QJsonArray points = object.value("points").toArray();
    QCOMPARE(points.size(), 2);
    QCOMPARE(points.at(0).toObject().value("x").toDouble(), 1.5);
    QCOMPARE(points.at(0).toObject().value("y").toDouble(), 2.0);
}

void TestStrokeSerializer::testToJson_EmptyList()
{
    QCOMPARE(StrokeSerializer::toJson(StrokeList()), QByteArray("[]"));
}

// ============================================================================
// Reading
// ============================================================================

void TestStrokeSerializer::testFromJson_PersistedDocument()
{
    const QByteArray json =
        "[{\"points\":[{\"x\":10,\"y\":20},{\"x\":30,\"y\":40}],"
        "\"color\":\"#3b82f6\",\"width\":3,\"isHighlighter\":false},"
        "{\"points\":[{\"x\":5,\"y\":5}],"
        "\"color\":\"#facc15\",\"width\":20,\"isHighlighter\":true}]";

    StrokeList strokes;
    QString error;
    QVERIFY2(StrokeSerializer::fromJson(json, &strokes, &error), qPrintable(error));

    QCOMPARE(strokes.size(), 2);
    QCOMPARE(strokes.at(0).points(), QVector<QPointF>({ QPointF(10, 20), QPointF(30, 40) }));
    QCOMPARE(strokes.at(0).colorName(), QString("#3b82f6"));
    QCOMPARE(strokes.at(0).width(), 3.0);
    QVERIFY(!strokes.at(0).isHighlighter());
    QVERIFY(strokes.at(1).isHighlighter());
    QCOMPARE(strokes.at(1).pointCount(), 1);
}

void TestStrokeSerializer::testFromJson_MissingHighlighterDefaultsToMarker()
{
    const QByteArray json = "[{\"points\":[{\"x\":1,\"y\":1}],\"color\":\"#ef4444\",\"width\":4}]";

    StrokeList strokes;
    QVERIFY(StrokeSerializer::fromJson(json, &strokes));
    QCOMPARE(strokes.size(), 1);
    QVERIFY(!strokes.first().isHighlighter());
}

void TestStrokeSerializer::testFromJson_PreservesPointOrder()
{
    QVector<QPointF> points;
    for (int i = 0; i < 50; ++i) {
        points.append(QPointF((i * 37) % 101, (i * 53) % 89));
    }
    const StrokeList original = { InkStroke(points, Qt::red, 4.0) };

    StrokeList parsed;
    QVERIFY(StrokeSerializer::fromJson(StrokeSerializer::toJson(original), &parsed));
    QCOMPARE(parsed.first().points(), points);
}

// ============================================================================
// Rejection
// ============================================================================

void TestStrokeSerializer::testFromJson_RejectsInvalid_data()
{
    QTest::addColumn<QByteArray>("json");

    QTest::newRow("not json") << QByteArray("not json");
    QTest::newRow("object root") << QByteArray("{\"points\":[]}");
    QTest::newRow("stroke not object") << QByteArray("[42]");
    QTest::newRow("missing points") << QByteArray("[{\"color\":\"#ef4444\",\"width\":4}]");
    QTest::newRow("empty points") << QByteArray("[{\"points\":[],\"color\":\"#ef4444\",\"width\":4}]");
    QTest::newRow("non-numeric point")
        << QByteArray("[{\"points\":[{\"x\":\"a\",\"y\":1}],\"color\":\"#ef4444\",\"width\":4}]");
    QTest::newRow("bad color")
        << QByteArray("[{\"points\":[{\"x\":1,\"y\":1}],\"color\":\"nope\",\"width\":4}]");
    QTest::newRow("zero width")
        << QByteArray("[{\"points\":[{\"x\":1,\"y\":1}],\"color\":\"#ef4444\",\"width\":0}]");
}

void TestStrokeSerializer::testFromJson_RejectsInvalid()
{
    QFETCH(QByteArray, json);

    StrokeList strokes;
    QString error;
    QVERIFY(!StrokeSerializer::fromJson(json, &strokes, &error));
    QVERIFY(!error.isEmpty());
}

void TestStrokeSerializer::testFromJson_FailureLeavesOutputUntouched()
{
    const StrokeList existing = { InkStroke({ QPointF(1, 1) }, Qt::red, 4.0) };
    StrokeList strokes = existing;

    // First stroke is fine, second is broken: nothing is applied
    const QByteArray json =
        "[{\"points\":[{\"x\":1,\"y\":1}],\"color\":\"#ef4444\",\"width\":4},"
        "{\"points\":[],\"color\":\"#ef4444\",\"width\":4}]";

    QVERIFY(!StrokeSerializer::fromJson(json, &strokes));
    QCOMPARE(strokes, existing);
}

QTEST_MAIN(TestStrokeSerializer)
#include "tst_StrokeSerializer.moc"
