#pragma once

// ============================================================================
// DocumentSession - Viewer state of one open document
// ============================================================================
// A session holds the current snapshot of a document plus everything the
// user did to it that is not baked into the bytes yet: navigation, zoom,
// page selection, uncommitted marks and the undo history.
//
// Page numbers are 1-based at this level.
// Invariants:
// - 1 <= currentPage <= pageCount
// - MIN_ZOOM <= zoom <= MAX_ZOOM
// - selection is a subset of [1, pageCount]
// - thumbnails().size() == pageCount
// ============================================================================

#include "DocumentSnapshot.h"
#include "MarkStore.h"
#include "UndoStack.h"
#include "../pdf/PdfEngine.h"

#include <QImage>
#include <QObject>
#include <QSet>
#include <QVector>

class DocumentSession : public QObject {
    Q_OBJECT

public:
    static constexpr qreal MIN_ZOOM = 0.25;
    static constexpr qreal MAX_ZOOM = 4.0;

    DocumentSession(int id, const QString& name, const DocumentSnapshot& snapshot,
                    const DocumentInfo& info, int undoLimit = UndoStack::DEFAULT_MAX_DEPTH,
                    QObject* parent = nullptr);

    int id() const { return m_id; }
    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }

    /// Local file the session was opened from or last saved to, may be empty.
    QString filePath() const { return m_filePath; }
    void setFilePath(const QString& path) { m_filePath = path; }

    const DocumentSnapshot& snapshot() const { return m_snapshot; }
    const DocumentInfo& info() const { return m_info; }
    int pageCount() const { return m_info.pageCount; }
    bool hasPage(int page) const { return page >= 1 && page <= m_info.pageCount; }

    /// Unrotated media box of a page, in points.
    QSizeF pageSize(int page) const;

    /// Page size as displayed, width and height swapped for 90/270.
    QSizeF displaySize(int page) const;

    int rotation(int page) const;

    // ===== Navigation =====
    int currentPage() const { return m_currentPage; }
    void setCurrentPage(int page);

    qreal zoom() const { return m_zoom; }
    void setZoom(qreal zoom);

    // ===== Selection =====
    const QSet<int>& selection() const { return m_selection; }
    QVector<int> selectedPages() const;  ///< Ascending
    bool isSelected(int page) const { return m_selection.contains(page); }
    void togglePageSelection(int page);
    void selectOnly(int page);
    void clearSelection();
    void selectAllPages();

    // ===== Thumbnails =====
    const QVector<QImage>& thumbnails() const { return m_thumbnails; }
    void setThumbnail(int page, const QImage& image);

    // ===== Marks and history =====
    MarkStore* marks() { return &m_marks; }
    const MarkStore* marks() const { return &m_marks; }
    UndoStack* undoStack() { return &m_undoStack; }
    const UndoStack* undoStack() const { return &m_undoStack; }

    /**
     * @brief Install new bytes after a commit or undo.
     * @param keepPage Page to show afterwards, 0 keeps the current page.
     *
     * Clamps the current page, clears the selection and empties the
     * thumbnail list (the pipeline regenerates it).
     */
    void replaceSnapshot(const DocumentSnapshot& snapshot, const DocumentInfo& info, int keepPage = 0);

    /// True while an engine job started from this session is running.
    bool isBusy() const { return m_busy; }
    void setBusy(bool busy) { m_busy = busy; }

signals:
    void currentPageChanged(int page);
    void zoomChanged(qreal zoom);
    void selectionChanged();
    void thumbnailChanged(int page);
    void snapshotReplaced();

private:
    int clampPage(int page) const;

    int m_id;
    QString m_name;
    QString m_filePath;
    DocumentSnapshot m_snapshot;
    DocumentInfo m_info;

    int m_currentPage = 1;
    qreal m_zoom = 1.0;
    QSet<int> m_selection;
    QVector<QImage> m_thumbnails;

    MarkStore m_marks;
    UndoStack m_undoStack;
    bool m_busy = false;
};
