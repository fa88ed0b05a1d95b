#ifndef STROKEHISTORY_H
#define STROKEHISTORY_H

#include <QObject>
#include <QPointF>
#include <QVector>

#include "annotations/InkStroke.h"

// Ordered committed strokes with one-stroke undo/redo
class StrokeHistory : public QObject
{
    Q_OBJECT

public:
    explicit StrokeHistory(QObject *parent = nullptr);
    ~StrokeHistory() override;

    // Replace the whole list (pre-seeding from persisted state)
    void reset(const StrokeList &strokes);

    void commit(const InkStroke &stroke);

    // Remove every stroke the eraser path touches. Clears redo even when
    // nothing was removed. Returns the number of strokes removed.
    int eraseAlong(const QVector<QPointF> &eraserPoints, qreal radius);

    void undo();
    void redo();
    void clear();

    bool canUndo() const;
    bool canRedo() const;
    bool isEmpty() const;
    int strokeCount() const { return m_committed.size(); }

    const StrokeList &strokes() const { return m_committed; }

    // Most recently undone stroke first
    const StrokeList &redoBuffer() const { return m_redoBuffer; }

signals:
    void changed();

private:
    StrokeList m_committed;
    StrokeList m_redoBuffer;
};

#endif // STROKEHISTORY_H
