#include "DocumentSession.h"

#include <QDebug>
#include <QtMath>

#include <algorithm>

DocumentSession::DocumentSession(int id, const QString& name, const DocumentSnapshot& snapshot,
                                 const DocumentInfo& info, int undoLimit, QObject* parent)
    : QObject(parent)
    , m_id(id)
    , m_name(name)
    , m_snapshot(snapshot)
    , m_info(info)
    , m_thumbnails(info.pageCount)
    , m_undoStack(undoLimit)
{
}

QSizeF DocumentSession::pageSize(int page) const
{
    if (page < 1 || page > m_info.pageSizes.size()) {
        return QSizeF();
    }
    return m_info.pageSizes.at(page - 1);
}

QSizeF DocumentSession::displaySize(int page) const
{
    QSizeF size = pageSize(page);
    const int rot = rotation(page);
    if (rot == 90 || rot == 270) {
        size.transpose();
    }
    return size;
}

int DocumentSession::rotation(int page) const
{
    if (page < 1 || page > m_info.rotations.size()) {
        return 0;
    }
    return m_info.rotations.at(page - 1);
}

int DocumentSession::clampPage(int page) const
{
    if (m_info.pageCount <= 0) {
        return 1;
    }
    return qBound(1, page, m_info.pageCount);
}

void DocumentSession::setCurrentPage(int page)
{
    const int clamped = clampPage(page);
    if (clamped == m_currentPage) {
        return;
    }
    m_currentPage = clamped;
    emit currentPageChanged(m_currentPage);
}

void DocumentSession::setZoom(qreal zoom)
{
    const qreal clamped = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    if (qFuzzyCompare(clamped, m_zoom)) {
        return;
    }
    m_zoom = clamped;
    emit zoomChanged(m_zoom);
}

QVector<int> DocumentSession::selectedPages() const
{
    QVector<int> pages(m_selection.begin(), m_selection.end());
    std::sort(pages.begin(), pages.end());
    return pages;
}

void DocumentSession::togglePageSelection(int page)
{
    if (page < 1 || page > m_info.pageCount) {
        return;
    }
    if (!m_selection.remove(page)) {
        m_selection.insert(page);
    }
    emit selectionChanged();
}

void DocumentSession::selectOnly(int page)
{
    if (page < 1 || page > m_info.pageCount) {
        return;
    }
    m_selection.clear();
    m_selection.insert(page);
    emit selectionChanged();
}

void DocumentSession::clearSelection()
{
    if (m_selection.isEmpty()) {
        return;
    }
    m_selection.clear();
    emit selectionChanged();
}

void DocumentSession::selectAllPages()
{
    m_selection.clear();
    for (int page = 1; page <= m_info.pageCount; ++page) {
        m_selection.insert(page);
    }
    emit selectionChanged();
}

void DocumentSession::setThumbnail(int page, const QImage& image)
{
    if (page < 1 || page > m_thumbnails.size()) {
        return;
    }
    m_thumbnails[page - 1] = image;
    emit thumbnailChanged(page);
}

void DocumentSession::replaceSnapshot(const DocumentSnapshot& snapshot, const DocumentInfo& info, int keepPage)
{
    const int target = keepPage > 0 ? keepPage : m_currentPage;

    m_snapshot = snapshot;
    m_info = info;
    m_thumbnails = QVector<QImage>(info.pageCount);
    m_selection.clear();

    const int clamped = clampPage(target);
    const bool pageChanged = clamped != m_currentPage;
    m_currentPage = clamped;

    qDebug() << "DocumentSession:" << m_id << "now at version" << snapshot.version()
             << "with" << info.pageCount << "pages";

    emit selectionChanged();
    if (pageChanged) {
        emit currentPageChanged(m_currentPage);
    }
    emit snapshotReplaced();
}
