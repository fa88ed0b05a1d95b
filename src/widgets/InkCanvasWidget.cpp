#include "widgets/InkCanvasWidget.h"
#include "annotation/AnnotationSession.h"
#include "tools/ToolManager.h"
#include "utils/CoordinateMapper.h"
#include "Constants.h"

#include <QMouseEvent>
#include <QPainter>
#include <QTouchEvent>

InkCanvasWidget::InkCanvasWidget(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_AcceptTouchEvents, true);
    setAttribute(Qt::WA_OpaquePaintEvent, false);
    setMouseTracking(false);
    setCursor(Qt::CrossCursor);
}

InkCanvasWidget::~InkCanvasWidget() = default;

void InkCanvasWidget::setSession(AnnotationSession* session)
{
    if (m_session == session) {
        return;
    }

    if (m_session) {
        m_session->disconnect(this);
    }

    m_session = session;
    m_mouseCapturing = false;
    m_touchCapturing = false;
    m_touchPointId = -1;

    if (m_session) {
        connect(m_session, &AnnotationSession::frameRendered,
                this, QOverload<>::of(&QWidget::update));
        connect(m_session, &AnnotationSession::surfaceReplaced,
                this, [this]() { updateGeometry(); });
        connect(m_session, &AnnotationSession::toolChanged,
                this, &InkCanvasWidget::updateToolCursor);
    }

    updateToolCursor();
    updateGeometry();
    update();
}

void InkCanvasWidget::updateToolCursor()
{
    if (m_session) {
        setCursor(m_session->toolManager()->currentCursor());
    } else {
        setCursor(Qt::CrossCursor);
    }
}

void InkCanvasWidget::setZoom(qreal zoom)
{
    const qreal bounded = qBound(ArchiNotes::Bounds::kMinZoom, zoom, ArchiNotes::Bounds::kMaxZoom);
    if (qFuzzyCompare(bounded, m_zoom)) {
        return;
    }

    m_zoom = bounded;
    updateGeometry();
    update();
    emit zoomChanged(m_zoom);
}

QRectF InkCanvasWidget::surfaceBounds() const
{
    return QRectF(QPointF(0, 0), QSizeF(width() * m_zoom, height() * m_zoom));
}

QSizeF InkCanvasWidget::displayScale() const
{
    if (!m_session) {
        return QSizeF(0.0, 0.0);
    }
    return CoordinateMapper::displayScale(m_session->logicalSize(), QSizeF(size()), m_zoom);
}

QPointF InkCanvasWidget::mapToLogical(const QPointF& widgetPos) const
{
    return CoordinateMapper::toLogical(widgetPos, surfaceBounds(), displayScale());
}

QSize InkCanvasWidget::sizeHint() const
{
    if (m_session && m_session->isOpen()) {
        return m_session->logicalSize();
    }
    return QWidget::sizeHint();
}

void InkCanvasWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    if (!m_session) {
        return;
    }

    const QImage frame = m_session->frame();
    if (frame.isNull()) {
        return;
    }

    QPainter painter(this);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(surfaceBounds(), frame);
}

void InkCanvasWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_session && !m_touchCapturing) {
        m_mouseCapturing = true;
        m_session->pointerPress(mapToLogical(event->position()));
        event->accept();
        return;
    }
    event->ignore();
}

void InkCanvasWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (m_mouseCapturing && m_session) {
        // The implicit grab holds back leaveEvent until release, so leaving
        // the visible surface mid-drag ends the gesture here.
        const QRectF visibleSurface = QRectF(rect()) & surfaceBounds();
        if (!visibleSurface.contains(event->position())) {
            m_mouseCapturing = false;
            m_session->pointerLeave();
        } else {
            m_session->pointerMove(mapToLogical(event->position()));
        }
        event->accept();
        return;
    }
    event->ignore();
}

void InkCanvasWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_mouseCapturing) {
        m_mouseCapturing = false;
        if (m_session) {
            m_session->pointerRelease();
        }
        event->accept();
        return;
    }
    event->ignore();
}

void InkCanvasWidget::leaveEvent(QEvent* event)
{
    if (m_mouseCapturing) {
        m_mouseCapturing = false;
        if (m_session) {
            m_session->pointerLeave();
        }
    }
    QWidget::leaveEvent(event);
}

bool InkCanvasWidget::event(QEvent* event)
{
    switch (event->type()) {
    case QEvent::TouchBegin:
    case QEvent::TouchUpdate:
    case QEvent::TouchEnd:
    case QEvent::TouchCancel:
        handleTouch(static_cast<QTouchEvent*>(event));
        return true;
    default:
        break;
    }
    return QWidget::event(event);
}

void InkCanvasWidget::handleTouch(QTouchEvent* event)
{
    event->accept();
    if (!m_session) {
        return;
    }

    if (event->type() == QEvent::TouchCancel) {
        if (m_touchCapturing) {
            m_touchCapturing = false;
            m_touchPointId = -1;
            m_session->pointerLeave();
        }
        return;
    }

    // Only the first finger draws; further fingers are ignored
    for (const QEventPoint& point : event->points()) {
        if (!m_touchCapturing) {
            if (point.state() == QEventPoint::Pressed && !m_mouseCapturing) {
                m_touchCapturing = true;
                m_touchPointId = point.id();
                m_session->pointerPress(mapToLogical(point.position()));
            }
            continue;
        }

        if (point.id() != m_touchPointId) {
            continue;
        }

        switch (point.state()) {
        case QEventPoint::Updated:
            m_session->pointerMove(mapToLogical(point.position()));
            break;
        case QEventPoint::Released:
            m_touchCapturing = false;
            m_touchPointId = -1;
            m_session->pointerRelease();
            break;
        default:
            break;
        }
    }
}
