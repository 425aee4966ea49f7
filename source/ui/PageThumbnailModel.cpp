#include "PageThumbnailModel.h"
#include "ThumbnailRenderer.h"
#include "../core/DocumentSession.h"

#include <QByteArray>
#include <QDataStream>
#include <QMimeData>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PageThumbnailModel::PageThumbnailModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

PageThumbnailModel::~PageThumbnailModel()
{
}

// ============================================================================
// QAbstractListModel Interface
// ============================================================================

int PageThumbnailModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid() || !m_session) {
        return 0;
    }
    return m_session->pageCount();
}

QVariant PageThumbnailModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || !m_session) {
        return QVariant();
    }

    const int page = index.row() + 1;
    if (page > m_session->pageCount()) {
        return QVariant();
    }

    switch (role) {
        case Qt::DisplayRole:
            return QString::number(page);

        case PageNumberRole:
            return page;

        case ThumbnailRole: {
            const QVector<QImage>& thumbnails = m_session->thumbnails();
            const QImage image = index.row() < thumbnails.size() ? thumbnails.at(index.row()) : QImage();
            return QVariant::fromValue(QPixmap::fromImage(
                image.isNull() ? ThumbnailRenderer::placeholder(page) : image));
        }

        case IsCurrentPageRole:
            return page == m_session->currentPage();

        case IsSelectedRole:
            return m_session->isSelected(page);

        default:
            return QVariant();
    }
}

Qt::ItemFlags PageThumbnailModel::flags(const QModelIndex& index) const
{
    Qt::ItemFlags defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags | Qt::ItemIsDropEnabled;
    }
    return defaultFlags | Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

QHash<int, QByteArray> PageThumbnailModel::roleNames() const
{
    QHash<int, QByteArray> roles = QAbstractListModel::roleNames();
    roles[PageNumberRole] = "pageNumber";
    roles[ThumbnailRole] = "thumbnail";
    roles[IsCurrentPageRole] = "isCurrentPage";
    roles[IsSelectedRole] = "isSelected";
    return roles;
}

// ============================================================================
// Drag-and-Drop Support
// ============================================================================

Qt::DropActions PageThumbnailModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QStringList PageThumbnailModel::mimeTypes() const
{
    return QStringList() << MIME_TYPE;
}

QMimeData* PageThumbnailModel::mimeData(const QModelIndexList& indexes) const
{
    if (indexes.isEmpty() || !indexes.first().isValid()) {
        return nullptr;
    }

    // Single page per drag
    const int page = indexes.first().row() + 1;

    QMimeData* mimeData = new QMimeData();
    QByteArray encodedData;
    QDataStream stream(&encodedData, QIODevice::WriteOnly);
    stream << page;
    mimeData->setData(MIME_TYPE, encodedData);
    return mimeData;
}

bool PageThumbnailModel::canDropMimeData(const QMimeData* data, Qt::DropAction action,
                                         int row, int column, const QModelIndex& parent) const
{
    Q_UNUSED(column);
    Q_UNUSED(parent);

    if (!data || !data->hasFormat(MIME_TYPE) || action != Qt::MoveAction) {
        return false;
    }
    if (row < 0 || !m_session) {
        return false;
    }
    return row <= m_session->pageCount();
}

bool PageThumbnailModel::dropMimeData(const QMimeData* data, Qt::DropAction action,
                                      int row, int column, const QModelIndex& parent)
{
    if (!canDropMimeData(data, action, row, column, parent)) {
        return false;
    }

    QByteArray encodedData = data->data(MIME_TYPE);
    QDataStream stream(&encodedData, QIODevice::ReadOnly);
    int fromPage = 0;
    stream >> fromPage;

    // row is the insertion point before removal
    int toPage = row + 1;
    if (toPage > fromPage) {
        toPage--;
    }
    if (fromPage < 1 || fromPage == toPage) {
        return false;
    }

    // The move itself is an engine job; the model is rebuilt when it commits
    emit pageDropped(fromPage, toPage);
    return false;
}

// ============================================================================
// Session Binding
// ============================================================================

void PageThumbnailModel::setSession(DocumentSession* session)
{
    if (session && m_session == session) {
        return;
    }

    beginResetModel();

    disconnect(m_thumbnailConnection);
    disconnect(m_pageConnection);
    disconnect(m_selectionConnection);
    disconnect(m_snapshotConnection);

    m_session = session;
    m_currentPage = session ? session->currentPage() : 0;

    if (session) {
        m_thumbnailConnection = connect(session, &DocumentSession::thumbnailChanged,
                                        this, &PageThumbnailModel::onThumbnailChanged);
        m_pageConnection = connect(session, &DocumentSession::currentPageChanged,
                                   this, &PageThumbnailModel::onCurrentPageChanged);
        m_selectionConnection = connect(session, &DocumentSession::selectionChanged,
                                        this, &PageThumbnailModel::onSelectionChanged);
        m_snapshotConnection = connect(session, &DocumentSession::snapshotReplaced,
                                       this, &PageThumbnailModel::onSnapshotReplaced);
    }

    endResetModel();
}

void PageThumbnailModel::onThumbnailChanged(int page)
{
    if (page < 1 || page > rowCount()) {
        return;
    }
    const QModelIndex idx = createIndex(page - 1, 0);
    emit dataChanged(idx, idx, {ThumbnailRole});
}

void PageThumbnailModel::onCurrentPageChanged(int page)
{
    const int oldPage = m_currentPage;
    m_currentPage = page;

    if (oldPage >= 1 && oldPage <= rowCount()) {
        const QModelIndex oldIdx = createIndex(oldPage - 1, 0);
        emit dataChanged(oldIdx, oldIdx, {IsCurrentPageRole});
    }
    if (page >= 1 && page <= rowCount()) {
        const QModelIndex newIdx = createIndex(page - 1, 0);
        emit dataChanged(newIdx, newIdx, {IsCurrentPageRole});
    }
}

void PageThumbnailModel::onSelectionChanged()
{
    if (rowCount() == 0) {
        return;
    }
    emit dataChanged(createIndex(0, 0), createIndex(rowCount() - 1, 0), {IsSelectedRole});
}

void PageThumbnailModel::onSnapshotReplaced()
{
    // Page count may have changed
    beginResetModel();
    m_currentPage = m_session ? m_session->currentPage() : 0;
    endResetModel();
}
