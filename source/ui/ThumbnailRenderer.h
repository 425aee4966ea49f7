#pragma once

// ============================================================================
// ThumbnailRenderer - Async thumbnail generation for the page list
// ============================================================================
// Renders page thumbnails in background threads using QtConcurrent.
// Emits thumbnailReady signal when rendering completes.
//
// Thread Safety:
// Each request carries its own copy of the snapshot bytes (implicitly
// shared QByteArray) and opens its own provider on the worker thread.
// Background threads never access a live DocumentSession.
// ============================================================================

#include <QByteArray>
#include <QFutureWatcher>
#include <QImage>
#include <QMutex>
#include <QObject>
#include <QSet>

#include "../pdf/PdfProvider.h"

/**
 * @brief Async thumbnail renderer.
 *
 * Limits concurrent renders to avoid overwhelming the system.
 * Supports cancellation when the document changes.
 */
class ThumbnailRenderer : public QObject {
    Q_OBJECT

public:
    static constexpr int PLACEHOLDER_WIDTH = 100;
    static constexpr int PLACEHOLDER_HEIGHT = 140;

    explicit ThumbnailRenderer(PdfProviderFactory factory, QObject* parent = nullptr);
    ~ThumbnailRenderer();

    /**
     * @brief Request a thumbnail for a specific page.
     *
     * Returns immediately. When rendering completes, thumbnailReady is emitted.
     * If a request for the same page of the same version is already pending,
     * this is a no-op.
     *
     * @param sessionId Session the bytes belong to.
     * @param version Snapshot version the bytes belong to.
     * @param bytes Document bytes.
     * @param page 1-based page number.
     * @param width Target thumbnail width in pixels.
     */
    void requestThumbnail(int sessionId, quint64 version, const QByteArray& bytes,
                          int page, int width);

    /**
     * @brief Cancel all pending thumbnail requests.
     *
     * Call this when the document changes to avoid rendering thumbnails
     * that are no longer needed.
     */
    void cancelAll();

    bool isPending(quint64 version, int page) const;

    /**
     * @brief Set maximum concurrent render tasks.
     * @param max Maximum number of concurrent renders (default: 2).
     */
    void setMaxConcurrentRenders(int max);

    /**
     * @brief Image used when a page cannot be rendered.
     */
    static QImage placeholder(int page);

signals:
    /**
     * @brief Emitted when a thumbnail has been rendered.
     *
     * A page that failed to render is delivered as placeholder(page).
     */
    void thumbnailReady(int sessionId, quint64 version, int page, QImage thumbnail);

private slots:
    void onRenderFinished();

private:
    struct ThumbnailRequest {
        int sessionId = 0;
        quint64 version = 0;
        QByteArray bytes;
        int page = 0;
        int width = 0;
    };

    struct ThumbnailResult {
        int sessionId = 0;
        quint64 version = 0;
        int page = 0;
        QImage image;
    };

    /**
     * @brief Render one thumbnail (called in worker thread).
     */
    static ThumbnailResult renderRequest(const PdfProviderFactory& factory,
                                         const ThumbnailRequest& request);

    /**
     * @brief Start the next pending task if slots are available.
     */
    void startNextTask();

    static quint64 pageKey(quint64 version, int page) { return (version << 16) ^ quint64(page); }

    PdfProviderFactory m_factory;

    // Requested but not yet started
    QList<ThumbnailRequest> m_pendingTasks;

    // version/page keys currently being rendered
    QSet<quint64> m_activeKeys;

    QList<QFutureWatcher<ThumbnailResult>*> m_activeWatchers;

    mutable QMutex m_mutex;

    int m_maxConcurrent = 2;

    // Flag to track if we're being destroyed
    bool m_shuttingDown = false;
};
