#pragma once

// ============================================================================
// PageRenderPipeline - Rasters, overlays and current-page tracking
// ============================================================================
// For the active session the pipeline lays out every page in one continuous
// column, renders each page at the session zoom and gives each page three
// OverlaySurfaces (annotation, redaction, text-edit).
//
// Rendering runs on a worker thread, one job per render request. Every
// request gets a new generation number; starting a new one cancels the job
// in flight, and any result carrying an old generation is dropped.
// A page whose raster fails is marked failed and shown as a placeholder;
// the remaining pages still render.
//
// Current-page tracking follows the viewport's vertical midpoint. A
// programmatic scroll (scrollToPage) disables tracking for a cooldown
// window so the scroll it causes does not feed back into the page number.
// ============================================================================

#include "OverlaySurface.h"
#include "../pdf/PdfProvider.h"

#include <QFutureWatcher>
#include <QImage>
#include <QObject>
#include <QPointer>
#include <QPromise>
#include <QRectF>
#include <QTimer>
#include <QVector>

#include <array>

class DocumentSession;
class ThumbnailRenderer;

/**
 * @brief Render output for one page (worker thread to GUI thread).
 */
struct PageRaster {
    quint64 generation = 0;
    int page = 0;
    QImage image;
};

/**
 * @brief Everything the view needs to show one page.
 */
struct PageSlot {
    int page = 0;
    QRectF bounds;                      ///< In the continuous column, at the session zoom
    QImage image;
    bool rendered = false;
    bool failed = false;
    std::array<OverlaySurface*, 3> overlays{};  ///< Indexed by OverlayKind

    OverlaySurface* overlay(OverlayKind kind) const { return overlays[static_cast<int>(kind)]; }
};

class PageRenderPipeline : public QObject {
    Q_OBJECT

public:
    static constexpr qreal PAGE_GAP = 16.0;
    static constexpr int DEFAULT_COOLDOWN_MS = 500;
    static constexpr int DEFAULT_THUMBNAIL_WIDTH = 100;

    explicit PageRenderPipeline(PdfProviderFactory factory, QObject* parent = nullptr);
    ~PageRenderPipeline() override;

    /**
     * @brief Show a session (nullptr clears the view).
     *
     * Rebuilds the slots, starts a render and regenerates thumbnails.
     */
    void setSession(DocumentSession* session);
    DocumentSession* session() const { return m_session.data(); }

    /**
     * @brief Re-render every page of the current session.
     *
     * Supersedes any render in flight.
     */
    void render();

    /**
     * @brief Generate thumbnails for the current snapshot.
     */
    void regenerateThumbnails();

    // ===== Slots =====
    int slotCount() const { return m_slots.size(); }
    const PageSlot* slot(int page) const;
    OverlaySurface* overlay(int page, OverlayKind kind) const;
    QVector<OverlaySurface*> overlays(OverlayKind kind) const;
    QSizeF contentSize() const;
    quint64 generation() const { return m_generation; }
    bool isRendering() const { return m_watcher != nullptr; }

    /// Page whose bounds are closest to a y coordinate in the column.
    int pageAt(qreal y) const;

    // ===== Scroll tracking =====

    /**
     * @brief Report the viewport position.
     *
     * While tracking is enabled this updates the session's current page to
     * the page closest to the viewport's vertical midpoint.
     */
    void updateScrollPosition(qreal viewportTop, qreal viewportHeight);

    /**
     * @brief Scroll to a page without letting the scroll move the page number.
     *
     * Emits scrollRequested() and disables tracking for the cooldown.
     */
    void scrollToPage(int page);

    bool isTracking() const { return m_tracking; }
    void setTrackingCooldown(int ms);

    void setThumbnailWidth(int width) { m_thumbnailWidth = width; }

signals:
    /// Slots and overlays are about to be destroyed.
    void pagesAboutToReset();

    /// New slots and overlays exist (may be zero when no session).
    void pagesReset();

    void pageRendered(int page);
    void renderFinished(quint64 generation);

    /// The view should scroll so that y is at the top.
    void scrollRequested(int page, qreal y);

private slots:
    void onRasterReady(int resultIndex);
    void onRenderJobFinished();
    void onThumbnailReady(int sessionId, quint64 version, int page, QImage thumbnail);
    void onSnapshotReplaced();
    void onZoomChanged();

private:
    void rebuildSlots();
    void clearSlots();
    void cancelRender();

    /// Worker body: renders pages in order until cancelled.
    static void renderPages(QPromise<PageRaster>& promise, PdfProviderFactory factory,
                            QByteArray bytes, QVector<int> pages, qreal zoom, quint64 generation);

    PdfProviderFactory m_factory;
    QPointer<DocumentSession> m_session;
    QVector<PageSlot> m_slots;

    quint64 m_generation = 0;
    QFutureWatcher<PageRaster>* m_watcher = nullptr;

    ThumbnailRenderer* m_thumbnails;
    int m_thumbnailWidth = DEFAULT_THUMBNAIL_WIDTH;

    bool m_tracking = true;
    QTimer m_cooldown;
};
