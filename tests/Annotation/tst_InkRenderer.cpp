#include <QtTest/QtTest>
#include <QImage>

#include "annotation/InkRenderer.h"
#include "annotation/InkSurface.h"

/**
 * @brief Pixel-level checks of the render pipeline order.
 */
class TestInkRenderer : public QObject
{
    Q_OBJECT

private slots:
    void testRender_EmptySceneIsTransparent();
    void testRender_LaterStrokeOnTop();
    void testRender_BackgroundStretched();
    void testRender_InProgressDrawnLast();
    void testRender_ClearsPreviousContent();
    void testRender_ScalesToTargetResolution();
    void testSceneFor_DisposedSurfaceIsEmpty();

private:
    static InkStroke horizontal(qreal y, const QColor& color, qreal width = 10.0);
};

InkStroke TestInkRenderer::horizontal(qreal y, const QColor& color, qreal width)
{
    return InkStroke({ QPointF(10, y), QPointF(90, y) }, color, width);
}

void TestInkRenderer::testRender_EmptySceneIsTransparent()
{
    InkRenderer::Scene scene;
    scene.logicalSize = QSize(40, 30);

    const QImage image = InkRenderer::renderToImage(scene);
    QCOMPARE(image.size(), QSize(40, 30));
    QCOMPARE(image.pixelColor(20, 15).alpha(), 0);

    scene.logicalSize = QSize();
    QVERIFY(InkRenderer::renderToImage(scene).isNull());
}

void TestInkRenderer::testRender_LaterStrokeOnTop()
{
    InkRenderer::Scene scene;
    scene.logicalSize = QSize(100, 100);
    scene.strokes = {
        horizontal(50, QColor(255, 0, 0)),
        horizontal(50, QColor(0, 255, 0)),
        horizontal(50, QColor(0, 0, 255)),
    };

    const QImage image = InkRenderer::renderToImage(scene);
    QCOMPARE(image.pixelColor(50, 50), QColor(0, 0, 255));
}

void TestInkRenderer::testRender_BackgroundStretched()
{
    QImage background(10, 10, QImage::Format_ARGB32);
    background.fill(QColor(200, 100, 50));

    InkRenderer::Scene scene;
    scene.logicalSize = QSize(100, 60);
    scene.background = background;

    const QImage image = InkRenderer::renderToImage(scene);
    QCOMPARE(image.pixelColor(1, 1), QColor(200, 100, 50));
    QCOMPARE(image.pixelColor(98, 58), QColor(200, 100, 50));
}

void TestInkRenderer::testRender_InProgressDrawnLast()
{
    InkRenderer::Scene scene;
    scene.logicalSize = QSize(100, 100);
    scene.strokes = { horizontal(50, QColor(255, 0, 0)) };
    scene.inProgress = horizontal(50, QColor(0, 255, 0));

    const QImage image = InkRenderer::renderToImage(scene);
    QCOMPARE(image.pixelColor(50, 50), QColor(0, 255, 0));
}

void TestInkRenderer::testRender_ClearsPreviousContent()
{
    QImage target(50, 50, QImage::Format_ARGB32_Premultiplied);
    target.fill(Qt::black);

    InkRenderer::Scene scene;
    scene.logicalSize = QSize(50, 50);
    InkRenderer::render(target, scene);

    QCOMPARE(target.pixelColor(25, 25).alpha(), 0);
}

void TestInkRenderer::testRender_ScalesToTargetResolution()
{
    InkRenderer::Scene scene;
    scene.logicalSize = QSize(100, 100);
    scene.strokes = { horizontal(50, QColor(255, 0, 0)) };

    QImage target(200, 200, QImage::Format_ARGB32_Premultiplied);
    InkRenderer::render(target, scene);

    // Logical (50, 50) lands at (100, 100) on a 2x target
    QCOMPARE(target.pixelColor(100, 100), QColor(255, 0, 0));
    QCOMPARE(target.pixelColor(100, 20).alpha(), 0);
}

void TestInkRenderer::testSceneFor_DisposedSurfaceIsEmpty()
{
    InkSurface surface(QSize(30, 30));
    const StrokeList strokes = { horizontal(5, Qt::red) };

    InkRenderer::Scene scene = InkRenderer::sceneFor(&surface, strokes);
    QCOMPARE(scene.logicalSize, QSize(30, 30));
    QCOMPARE(scene.strokes.size(), 1);

    surface.dispose();
    scene = InkRenderer::sceneFor(&surface, strokes);
    QVERIFY(scene.logicalSize.isEmpty());
    QVERIFY(InkRenderer::renderToImage(scene).isNull());
}

QTEST_MAIN(TestInkRenderer)
#include "tst_InkRenderer.moc"
