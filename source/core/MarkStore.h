#pragma once

// ============================================================================
// MarkStore - Per-document collection of uncommitted marks
// ============================================================================
// Marks are kept per page in insertion order. The store knows nothing about
// rendering; overlays repaint on marksChanged() and ask MarkPainter for
// primitives.
// ============================================================================

#include "Marks.h"

#include <QMap>
#include <QObject>
#include <QVector>

class MarkStore : public QObject {
    Q_OBJECT

public:
    explicit MarkStore(QObject* parent = nullptr);

    /**
     * @brief Append a mark to its page.
     * @return The id assigned to the mark.
     */
    int add(Mark mark);

    /**
     * @brief Put back a mark that was removed earlier, keeping its id.
     * @return false if a mark with that id is already present.
     */
    bool restore(const Mark& mark);

    bool remove(int markId);

    const Mark* find(int markId) const;

    QVector<Mark> marksOnPage(int page) const;
    QVector<Mark> marksOnPage(int page, Mark::Kind kind) const;
    QVector<Mark> marksOfKind(Mark::Kind kind) const;
    int count(Mark::Kind kind) const;
    int totalCount() const;

    /**
     * @brief Topmost mark of one of the given kinds under a screen position.
     * @return Mark id, or 0 if nothing was hit.
     */
    int markAt(int page, const QPointF& pos, const QVector<Mark::Kind>& kinds) const;

    bool setText(int markId, const QString& text);
    bool moveTo(int markId, const QPointF& topLeft);

    void clearKind(Mark::Kind kind);
    void clear();

signals:
    void marksChanged(int page);
    void countChanged(Mark::Kind kind, int count);

private:
    Mark* findMutable(int markId);

    QMap<int, QVector<Mark>> m_pages;  ///< page number -> marks in insertion order
    int m_nextId = 1;
};
