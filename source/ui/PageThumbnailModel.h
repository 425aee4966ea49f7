#ifndef PAGETHUMBNAILMODEL_H
#define PAGETHUMBNAILMODEL_H

#include <QAbstractListModel>
#include <QPixmap>
#include <QPointer>

class DocumentSession;

/**
 * @brief QAbstractListModel providing the page strip of one session.
 *
 * This model provides:
 * - Page number, thumbnail pixmap, current/selected state
 * - Drag-and-drop support via MIME data (internal move only)
 *
 * Thumbnails are produced by the render pipeline and stored on the session;
 * the model only reflects them. Rows are 0-based, pages 1-based.
 */
class PageThumbnailModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom roles for page data.
     */
    enum Roles {
        PageNumberRole = Qt::UserRole + 1,  ///< 1-based page number
        ThumbnailRole,                       ///< QPixmap thumbnail (placeholder until rendered)
        IsCurrentPageRole,                   ///< bool: is this the current page?
        IsSelectedRole                       ///< bool: is the page in the selection?
    };

    explicit PageThumbnailModel(QObject* parent = nullptr);
    ~PageThumbnailModel() override;

    // ===== QAbstractListModel Interface =====

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QHash<int, QByteArray> roleNames() const override;

    // ===== Drag-and-Drop Support =====

    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData* mimeData(const QModelIndexList& indexes) const override;
    bool canDropMimeData(const QMimeData* data, Qt::DropAction action,
                         int row, int column, const QModelIndex& parent) const override;
    bool dropMimeData(const QMimeData* data, Qt::DropAction action,
                      int row, int column, const QModelIndex& parent) override;

    // ===== Session Binding =====

    /**
     * @brief Show the pages of a session.
     * @param session Session pointer (not owned), nullptr for none.
     */
    void setSession(DocumentSession* session);
    DocumentSession* session() const { return m_session.data(); }

signals:
    /**
     * @brief A page was dropped at a new position.
     * @param fromPage Original 1-based page number.
     * @param toPage Target 1-based page number.
     */
    void pageDropped(int fromPage, int toPage);

private:
    void onThumbnailChanged(int page);
    void onCurrentPageChanged(int page);
    void onSelectionChanged();
    void onSnapshotReplaced();

    QPointer<DocumentSession> m_session;
    QMetaObject::Connection m_thumbnailConnection;
    QMetaObject::Connection m_pageConnection;
    QMetaObject::Connection m_selectionConnection;
    QMetaObject::Connection m_snapshotConnection;
    int m_currentPage = 0;

    // MIME type for drag-and-drop
    static constexpr const char* MIME_TYPE = "application/x-pdfdesk-page-number";
};

#endif // PAGETHUMBNAILMODEL_H
