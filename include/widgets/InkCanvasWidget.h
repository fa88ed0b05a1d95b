#ifndef INKCANVASWIDGET_H
#define INKCANVASWIDGET_H

#include <QPointer>
#include <QRectF>
#include <QSizeF>
#include <QWidget>

class AnnotationSession;

/**
 * @brief Displays an annotation session and feeds it pointer input.
 *
 * The session frame is stretched over the widget rect and magnified by the
 * zoom factor from the top-left corner. Mouse and touch positions are mapped
 * into logical canvas coordinates before they reach the session.
 */
class InkCanvasWidget : public QWidget
{
    Q_OBJECT

public:
    explicit InkCanvasWidget(QWidget* parent = nullptr);
    ~InkCanvasWidget() override;

    void setSession(AnnotationSession* session);
    AnnotationSession* session() const { return m_session; }

    void setZoom(qreal zoom);
    qreal zoom() const { return m_zoom; }

    /**
     * @brief On-screen rectangle the canvas occupies, in widget coordinates.
     */
    QRectF surfaceBounds() const;

    QSizeF displayScale() const;
    QPointF mapToLogical(const QPointF& widgetPos) const;

    QSize sizeHint() const override;

signals:
    void zoomChanged(qreal zoom);

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void handleTouch(QTouchEvent* event);
    void updateToolCursor();

    QPointer<AnnotationSession> m_session;
    qreal m_zoom = 1.0;
    bool m_mouseCapturing = false;
    bool m_touchCapturing = false;
    int m_touchPointId = -1;
};

#endif // INKCANVASWIDGET_H
