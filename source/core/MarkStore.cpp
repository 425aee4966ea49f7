#include "MarkStore.h"

#include <QDebug>

#include <algorithm>

MarkStore::MarkStore(QObject* parent)
    : QObject(parent)
{
}

int MarkStore::add(Mark mark)
{
    mark.id = m_nextId++;
    m_pages[mark.page].append(mark);

    emit marksChanged(mark.page);
    emit countChanged(mark.kind, count(mark.kind));
    return mark.id;
}

bool MarkStore::restore(const Mark& mark)
{
    if (mark.id <= 0 || find(mark.id)) {
        qWarning() << "MarkStore::restore: cannot restore mark" << mark.id;
        return false;
    }

    m_pages[mark.page].append(mark);
    m_nextId = qMax(m_nextId, mark.id + 1);

    emit marksChanged(mark.page);
    emit countChanged(mark.kind, count(mark.kind));
    return true;
}

bool MarkStore::remove(int markId)
{
    for (auto it = m_pages.begin(); it != m_pages.end(); ++it) {
        QVector<Mark>& marks = it.value();
        for (int i = 0; i < marks.size(); ++i) {
            if (marks[i].id != markId) {
                continue;
            }
            const Mark::Kind kind = marks[i].kind;
            const int page = it.key();
            marks.removeAt(i);
            if (marks.isEmpty()) {
                m_pages.erase(it);
            }
            emit marksChanged(page);
            emit countChanged(kind, count(kind));
            return true;
        }
    }
    return false;
}

const Mark* MarkStore::find(int markId) const
{
    for (const QVector<Mark>& marks : m_pages) {
        for (const Mark& mark : marks) {
            if (mark.id == markId) {
                return &mark;
            }
        }
    }
    return nullptr;
}

Mark* MarkStore::findMutable(int markId)
{
    for (QVector<Mark>& marks : m_pages) {
        for (Mark& mark : marks) {
            if (mark.id == markId) {
                return &mark;
            }
        }
    }
    return nullptr;
}

QVector<Mark> MarkStore::marksOnPage(int page) const
{
    return m_pages.value(page);
}

QVector<Mark> MarkStore::marksOnPage(int page, Mark::Kind kind) const
{
    QVector<Mark> result;
    for (const Mark& mark : m_pages.value(page)) {
        if (mark.kind == kind) {
            result.append(mark);
        }
    }
    return result;
}

QVector<Mark> MarkStore::marksOfKind(Mark::Kind kind) const
{
    QVector<Mark> result;
    for (const QVector<Mark>& marks : m_pages) {
        for (const Mark& mark : marks) {
            if (mark.kind == kind) {
                result.append(mark);
            }
        }
    }
    return result;
}

int MarkStore::count(Mark::Kind kind) const
{
    int n = 0;
    for (const QVector<Mark>& marks : m_pages) {
        for (const Mark& mark : marks) {
            if (mark.kind == kind) {
                ++n;
            }
        }
    }
    return n;
}

int MarkStore::totalCount() const
{
    int n = 0;
    for (const QVector<Mark>& marks : m_pages) {
        n += marks.size();
    }
    return n;
}

int MarkStore::markAt(int page, const QPointF& pos, const QVector<Mark::Kind>& kinds) const
{
    const QVector<Mark> marks = m_pages.value(page);
    // Last added is drawn on top
    for (int i = marks.size() - 1; i >= 0; --i) {
        const Mark& mark = marks[i];
        if (kinds.contains(mark.kind) && mark.hitRect().contains(pos)) {
            return mark.id;
        }
    }
    return 0;
}

bool MarkStore::setText(int markId, const QString& text)
{
    Mark* mark = findMutable(markId);
    if (!mark) {
        return false;
    }
    if (mark->text == text) {
        return true;
    }
    mark->text = text;
    emit marksChanged(mark->page);
    return true;
}

bool MarkStore::moveTo(int markId, const QPointF& topLeft)
{
    Mark* mark = findMutable(markId);
    if (!mark) {
        return false;
    }

    const QPointF delta = topLeft - mark->rect.topLeft();
    mark->rect.moveTopLeft(topLeft);
    for (QPointF& pt : mark->points) {
        pt += delta;
    }
    emit marksChanged(mark->page);
    return true;
}

void MarkStore::clearKind(Mark::Kind kind)
{
    QVector<int> touchedPages;
    for (auto it = m_pages.begin(); it != m_pages.end();) {
        QVector<Mark>& marks = it.value();
        const int before = marks.size();
        marks.erase(std::remove_if(marks.begin(), marks.end(),
                                   [kind](const Mark& m) { return m.kind == kind; }),
                    marks.end());
        if (marks.size() != before) {
            touchedPages.append(it.key());
        }
        if (marks.isEmpty()) {
            it = m_pages.erase(it);
        } else {
            ++it;
        }
    }

    for (int page : touchedPages) {
        emit marksChanged(page);
    }
    if (!touchedPages.isEmpty()) {
        emit countChanged(kind, 0);
    }
}

void MarkStore::clear()
{
    const QList<int> pages = m_pages.keys();
    QVector<Mark::Kind> kinds;
    for (const QVector<Mark>& marks : m_pages) {
        for (const Mark& mark : marks) {
            if (!kinds.contains(mark.kind)) {
                kinds.append(mark.kind);
            }
        }
    }
    m_pages.clear();

    for (int page : pages) {
        emit marksChanged(page);
    }
    for (Mark::Kind kind : kinds) {
        emit countChanged(kind, 0);
    }
}
