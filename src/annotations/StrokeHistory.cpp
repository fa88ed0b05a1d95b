#include "annotations/StrokeHistory.h"
#include "annotations/StrokeEraser.h"

#include <QDebug>
#include <utility>

StrokeHistory::StrokeHistory(QObject *parent)
    : QObject(parent)
{
}

StrokeHistory::~StrokeHistory() = default;

void StrokeHistory::reset(const StrokeList &strokes)
{
    m_committed = strokes;
    m_redoBuffer.clear();
    emit changed();
}

void StrokeHistory::commit(const InkStroke &stroke)
{
    if (stroke.isEmpty()) {
        qWarning() << "StrokeHistory: Ignoring stroke without points";
        return;
    }

    m_committed.append(stroke);
    m_redoBuffer.clear();  // Redo does not survive a new edit
    emit changed();
}

int StrokeHistory::eraseAlong(const QVector<QPointF> &eraserPoints, qreal radius)
{
    StrokeEraser::Result result = StrokeEraser::erase(m_committed, eraserPoints, radius);
    if (result.removedCount > 0) {
        m_committed = std::move(result.survivors);
    }

    m_redoBuffer.clear();
    emit changed();
    return result.removedCount;
}

void StrokeHistory::undo()
{
    if (m_committed.isEmpty()) return;

    m_redoBuffer.prepend(m_committed.takeLast());
    emit changed();
}

void StrokeHistory::redo()
{
    if (m_redoBuffer.isEmpty()) return;

    m_committed.append(m_redoBuffer.takeFirst());
    emit changed();
}

void StrokeHistory::clear()
{
    m_committed.clear();
    m_redoBuffer.clear();
    emit changed();
}

bool StrokeHistory::canUndo() const
{
    return !m_committed.isEmpty();
}

bool StrokeHistory::canRedo() const
{
    return !m_redoBuffer.isEmpty();
}

bool StrokeHistory::isEmpty() const
{
    return m_committed.isEmpty();
}
