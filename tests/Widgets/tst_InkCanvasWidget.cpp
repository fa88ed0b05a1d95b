#include <QtTest/QtTest>
#include <QSignalSpy>

#include "annotation/AnnotationSession.h"
#include "settings/Settings.h"
#include "widgets/InkCanvasWidget.h"

class TestInkCanvasWidget : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Mapping
    void testMapToLogical_HalfScaleCenter();
    void testMapToLogical_NoSessionIsOrigin();
    void testZoom_ClampedAndSignalled();
    void testSizeHint_FollowsLogicalSize();

    // Input
    void testMouseDrag_CommitsStroke();
    void testRightButton_Ignored();
    void testDragOffCanvas_CommitsStroke();
    void testTouchDrag_CommitsStroke();
    void testSecondFinger_Ignored();

    // Painting
    void testFrameRendered_Repaints();
    void testEraserTool_UsesRadiusCursor();

private:
    AnnotationSession* m_session = nullptr;
    InkCanvasWidget* m_widget = nullptr;
};

void TestInkCanvasWidget::init()
{
    // Sessions pick up stored preferences; start from the presets
    auto settings = ArchiNotes::getSettings();
    settings.remove("annotation/markup");
    settings.remove("annotation/whiteboard");
    settings.sync();

    m_session = new AnnotationSession();
    m_session->openBlank();

    m_widget = new InkCanvasWidget();
    m_widget->setSession(m_session);
    m_widget->resize(400, 300);
    m_widget->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_widget));
}

void TestInkCanvasWidget::cleanup()
{
    delete m_widget;
    delete m_session;
    m_widget = nullptr;
    m_session = nullptr;
}

// ============================================================================
// Mapping
// ============================================================================

void TestInkCanvasWidget::testMapToLogical_HalfScaleCenter()
{
    // 800x600 logical shown at 400x300
    QCOMPARE(m_widget->displayScale(), QSizeF(2.0, 2.0));
    QCOMPARE(m_widget->mapToLogical(QPointF(200, 150)), QPointF(400, 300));
}

void TestInkCanvasWidget::testMapToLogical_NoSessionIsOrigin()
{
    InkCanvasWidget widget;
    widget.resize(100, 100);
    QCOMPARE(widget.mapToLogical(QPointF(50, 50)), QPointF(0, 0));
}

void TestInkCanvasWidget::testZoom_ClampedAndSignalled()
{
    QSignalSpy zoomSpy(m_widget, &InkCanvasWidget::zoomChanged);

    m_widget->setZoom(2.0);
    QCOMPARE(m_widget->zoom(), 2.0);
    QCOMPARE(m_widget->displayScale(), QSizeF(1.0, 1.0));

    m_widget->setZoom(100.0);
    QCOMPARE(m_widget->zoom(), 5.0);

    m_widget->setZoom(5.0);
    QCOMPARE(zoomSpy.count(), 2);
}

void TestInkCanvasWidget::testSizeHint_FollowsLogicalSize()
{
    QCOMPARE(m_widget->sizeHint(), QSize(800, 600));

    AnnotationSession whiteboard(AnnotationProfile::whiteboard());
    whiteboard.openBlank();
    m_widget->setSession(&whiteboard);
    QCOMPARE(m_widget->sizeHint(), QSize(1600, 160));
    m_widget->setSession(m_session);
}

// ============================================================================
// Input
// ============================================================================

void TestInkCanvasWidget::testMouseDrag_CommitsStroke()
{
    QTest::mousePress(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(10, 10));
    QVERIFY(m_session->isCapturing());
    QTest::mouseMove(m_widget, QPoint(100, 10));
    QTest::mouseMove(m_widget, QPoint(200, 150));
    QTest::mouseRelease(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(200, 150));

    QCOMPARE(m_session->strokes().size(), 1);
    const InkStroke stroke = m_session->strokes().first();
    QCOMPARE(stroke.points().first(), QPointF(20, 20));
    QCOMPARE(stroke.points().last(), QPointF(400, 300));
}

void TestInkCanvasWidget::testRightButton_Ignored()
{
    QTest::mousePress(m_widget, Qt::RightButton, Qt::NoModifier, QPoint(10, 10));
    QVERIFY(!m_session->isCapturing());
    QTest::mouseRelease(m_widget, Qt::RightButton, Qt::NoModifier, QPoint(10, 10));
    QVERIFY(m_session->strokes().isEmpty());
}

void TestInkCanvasWidget::testDragOffCanvas_CommitsStroke()
{
    QTest::mousePress(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(10, 10));
    QTest::mouseMove(m_widget, QPoint(50, 10));
    QVERIFY(m_session->isCapturing());

    // Still holding the button, past the right edge of the widget
    QTest::mouseMove(m_widget, QPoint(500, 10));
    QVERIFY(!m_session->isCapturing());
    QCOMPARE(m_session->strokes().size(), 1);

    const InkStroke stroke = m_session->strokes().first();
    QCOMPARE(stroke.points().first(), QPointF(20, 20));
    for (const QPointF& point : stroke.points()) {
        QVERIFY(point.x() <= 800);
    }

    // The late release and the held-back leave change nothing
    QTest::mouseMove(m_widget, QPoint(520, 10));
    QTest::mouseRelease(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(520, 10));
    QEvent leave(QEvent::Leave);
    QCoreApplication::sendEvent(m_widget, &leave);
    QCOMPARE(m_session->strokes().size(), 1);
    QCOMPARE(m_session->strokes().first().points().size(), stroke.points().size());
}

void TestInkCanvasWidget::testTouchDrag_CommitsStroke()
{
    QPointingDevice* device = QTest::createTouchDevice();

    QTest::touchEvent(m_widget, device).press(0, QPoint(50, 50));
    QTest::touchEvent(m_widget, device).move(0, QPoint(100, 50));
    QTest::touchEvent(m_widget, device).release(0, QPoint(100, 50));

    QCOMPARE(m_session->strokes().size(), 1);
    QCOMPARE(m_session->strokes().first().points().first(), QPointF(100, 100));
}

void TestInkCanvasWidget::testSecondFinger_Ignored()
{
    QPointingDevice* device = QTest::createTouchDevice();

    QTest::touchEvent(m_widget, device).press(0, QPoint(50, 50));
    QTest::touchEvent(m_widget, device).stationary(0).press(1, QPoint(300, 200));
    QTest::touchEvent(m_widget, device).move(0, QPoint(100, 50)).move(1, QPoint(350, 250));
    QTest::touchEvent(m_widget, device).release(0, QPoint(100, 50)).release(1, QPoint(350, 250));

    QCOMPARE(m_session->strokes().size(), 1);
    for (const QPointF& point : m_session->strokes().first().points()) {
        QVERIFY(point.y() < 200);
    }
}

// ============================================================================
// Painting
// ============================================================================

void TestInkCanvasWidget::testFrameRendered_Repaints()
{
    m_session->setColor(QColor(255, 0, 0));
    m_session->setMarkerWidth(20.0);
    QTest::mousePress(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(50, 50));
    QTest::mouseMove(m_widget, QPoint(150, 50));
    QTest::mouseRelease(m_widget, Qt::LeftButton, Qt::NoModifier, QPoint(150, 50));

    m_session->renderNow();
    const QImage grabbed = m_widget->grab().toImage();
    QCOMPARE(grabbed.pixelColor(100, 50), QColor(255, 0, 0));
}

void TestInkCanvasWidget::testEraserTool_UsesRadiusCursor()
{
    QCOMPARE(m_widget->cursor().shape(), Qt::CrossCursor);

    m_session->setTool(ToolId::Eraser);
    QCOMPARE(m_widget->cursor().shape(), Qt::BitmapCursor);
    QCOMPARE(m_widget->cursor().pixmap().width(), 44);

    m_session->setTool(ToolId::Marker);
    QCOMPARE(m_widget->cursor().shape(), Qt::CrossCursor);
}

QTEST_MAIN(TestInkCanvasWidget)
#include "tst_InkCanvasWidget.moc"
