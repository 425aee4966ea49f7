#include "PageRenderPipeline.h"
#include "../core/DocumentSession.h"
#include "../ui/ThumbnailRenderer.h"

#include <QDebug>
#include <QPainter>
#include <QtConcurrent>

#include <cmath>

namespace {

QImage failedPagePlaceholder(const QSizeF& size, int page)
{
    QImage image(size.toSize().expandedTo(QSize(1, 1)), QImage::Format_ARGB32);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.setPen(QColor(150, 150, 150));
    painter.drawRect(image.rect().adjusted(0, 0, -1, -1));
    painter.drawText(image.rect(), Qt::AlignCenter,
                     QStringLiteral("Page %1 could not be rendered").arg(page));
    painter.end();
    return image;
}

} // namespace

PageRenderPipeline::PageRenderPipeline(PdfProviderFactory factory, QObject* parent)
    : QObject(parent)
    , m_factory(std::move(factory))
    , m_thumbnails(new ThumbnailRenderer(m_factory, this))
{
    m_cooldown.setSingleShot(true);
    m_cooldown.setInterval(DEFAULT_COOLDOWN_MS);
    connect(&m_cooldown, &QTimer::timeout, this, [this]() {
        m_tracking = true;
    });

    connect(m_thumbnails, &ThumbnailRenderer::thumbnailReady,
            this, &PageRenderPipeline::onThumbnailReady);
}

PageRenderPipeline::~PageRenderPipeline()
{
    if (m_watcher) {
        m_watcher->disconnect(this);
        m_watcher->cancel();
        m_watcher->waitForFinished();
        delete m_watcher;
        m_watcher = nullptr;
    }
}

// ============================================================================
// Session
// ============================================================================

void PageRenderPipeline::setSession(DocumentSession* session)
{
    if (session && m_session == session) {
        return;
    }

    if (m_session) {
        m_session->disconnect(this);
        m_session->marks()->disconnect(this);
    }

    cancelRender();
    m_thumbnails->cancelAll();
    m_session = session;

    if (m_session) {
        connect(m_session, &DocumentSession::snapshotReplaced,
                this, &PageRenderPipeline::onSnapshotReplaced);
        connect(m_session, &DocumentSession::zoomChanged,
                this, &PageRenderPipeline::onZoomChanged);
        connect(m_session->marks(), &MarkStore::marksChanged, this, [this](int page) {
            for (int k = 0; k < 3; ++k) {
                if (OverlaySurface* surface = overlay(page, static_cast<OverlayKind>(k))) {
                    surface->requestRepaint();
                }
            }
        });
    }

    rebuildSlots();
    render();

    if (m_session) {
        bool missing = false;
        for (const QImage& thumb : m_session->thumbnails()) {
            missing = missing || thumb.isNull();
        }
        if (missing) {
            regenerateThumbnails();
        }
        scrollToPage(m_session->currentPage());
    }
}

void PageRenderPipeline::onSnapshotReplaced()
{
    rebuildSlots();
    render();
    regenerateThumbnails();
    if (m_session) {
        scrollToPage(m_session->currentPage());
    }
}

void PageRenderPipeline::onZoomChanged()
{
    rebuildSlots();
    render();
    if (m_session) {
        scrollToPage(m_session->currentPage());
    }
}

// ============================================================================
// Slots
// ============================================================================

void PageRenderPipeline::clearSlots()
{
    if (m_slots.isEmpty()) {
        return;
    }

    // Listeners hold tokens on these overlays; let them release first
    emit pagesAboutToReset();

    for (PageSlot& pageSlot : m_slots) {
        for (OverlaySurface* surface : pageSlot.overlays) {
            delete surface;
        }
    }
    m_slots.clear();
}

void PageRenderPipeline::rebuildSlots()
{
    clearSlots();

    if (m_session) {
        const qreal zoom = m_session->zoom();
        qreal y = 0;
        m_slots.reserve(m_session->pageCount());
        for (int page = 1; page <= m_session->pageCount(); ++page) {
            PageSlot pageSlot;
            pageSlot.page = page;
            const QSizeF size = m_session->displaySize(page) * zoom;
            pageSlot.bounds = QRectF(QPointF(0, y), size);
            for (int k = 0; k < 3; ++k) {
                pageSlot.overlays[k] = new OverlaySurface(static_cast<OverlayKind>(k), page, this);
            }
            m_slots.append(pageSlot);
            y += size.height() + PAGE_GAP;
        }
    }

    emit pagesReset();
}

const PageSlot* PageRenderPipeline::slot(int page) const
{
    if (page < 1 || page > m_slots.size()) {
        return nullptr;
    }
    return &m_slots.at(page - 1);
}

OverlaySurface* PageRenderPipeline::overlay(int page, OverlayKind kind) const
{
    const PageSlot* pageSlot = slot(page);
    return pageSlot ? pageSlot->overlay(kind) : nullptr;
}

QVector<OverlaySurface*> PageRenderPipeline::overlays(OverlayKind kind) const
{
    QVector<OverlaySurface*> result;
    result.reserve(m_slots.size());
    for (const PageSlot& pageSlot : m_slots) {
        result.append(pageSlot.overlay(kind));
    }
    return result;
}

QSizeF PageRenderPipeline::contentSize() const
{
    if (m_slots.isEmpty()) {
        return QSizeF();
    }
    qreal width = 0;
    for (const PageSlot& pageSlot : m_slots) {
        width = qMax(width, pageSlot.bounds.width());
    }
    return QSizeF(width, m_slots.last().bounds.bottom());
}

int PageRenderPipeline::pageAt(qreal y) const
{
    int best = 0;
    qreal bestDistance = 0;
    for (const PageSlot& pageSlot : m_slots) {
        qreal distance = 0;
        if (y < pageSlot.bounds.top()) {
            distance = pageSlot.bounds.top() - y;
        } else if (y > pageSlot.bounds.bottom()) {
            distance = y - pageSlot.bounds.bottom();
        }
        if (best == 0 || distance < bestDistance) {
            best = pageSlot.page;
            bestDistance = distance;
        }
    }
    return best;
}

// ============================================================================
// Rendering
// ============================================================================

void PageRenderPipeline::cancelRender()
{
    if (!m_watcher) {
        return;
    }

    // The worker notices the cancel between pages; its late results are
    // dropped because the watcher is gone and the generation moved on.
    m_watcher->disconnect(this);
    m_watcher->cancel();
    m_watcher->deleteLater();
    m_watcher = nullptr;
}

void PageRenderPipeline::render()
{
    cancelRender();
    ++m_generation;

    if (!m_session || m_slots.isEmpty()) {
        return;
    }

    QVector<int> pages;
    pages.reserve(m_slots.size());
    // Current page first so the visible area fills in before the rest
    const int current = m_session->currentPage();
    pages.append(current);
    for (const PageSlot& pageSlot : m_slots) {
        if (pageSlot.page != current) {
            pages.append(pageSlot.page);
        }
    }

    m_watcher = new QFutureWatcher<PageRaster>(this);
    connect(m_watcher, &QFutureWatcher<PageRaster>::resultReadyAt,
            this, &PageRenderPipeline::onRasterReady);
    connect(m_watcher, &QFutureWatcher<PageRaster>::finished,
            this, &PageRenderPipeline::onRenderJobFinished);

    m_watcher->setFuture(QtConcurrent::run(&PageRenderPipeline::renderPages, m_factory,
                                           m_session->snapshot().bytes(), pages,
                                           m_session->zoom(), m_generation));
}

void PageRenderPipeline::renderPages(QPromise<PageRaster>& promise, PdfProviderFactory factory,
                                     QByteArray bytes, QVector<int> pages, qreal zoom,
                                     quint64 generation)
{
    std::unique_ptr<PdfProvider> provider = factory ? factory(bytes) : nullptr;
    if (!provider || !provider->isValid()) {
        qWarning() << "PageRenderPipeline: Cannot open document for rendering";
    }

    const qreal dpi = 72.0 * zoom;
    for (int page : pages) {
        if (promise.isCanceled()) {
            return;
        }

        PageRaster raster;
        raster.generation = generation;
        raster.page = page;
        if (provider && provider->isValid() && page - 1 < provider->pageCount()) {
            raster.image = provider->renderPageToImage(page - 1, dpi);
        }
        promise.addResult(raster);
    }
}

void PageRenderPipeline::onRasterReady(int resultIndex)
{
    auto* watcher = static_cast<QFutureWatcher<PageRaster>*>(sender());
    if (!watcher || watcher != m_watcher) {
        return;
    }

    const PageRaster raster = watcher->resultAt(resultIndex);
    if (raster.generation != m_generation || raster.page < 1 || raster.page > m_slots.size()) {
        return;  // Superseded
    }

    PageSlot& pageSlot = m_slots[raster.page - 1];
    if (raster.image.isNull()) {
        qWarning() << "PageRenderPipeline: Page" << raster.page << "failed to render";
        pageSlot.failed = true;
        pageSlot.image = failedPagePlaceholder(pageSlot.bounds.size(), raster.page);
    } else {
        pageSlot.failed = false;
        pageSlot.image = raster.image;
    }
    pageSlot.rendered = true;
    emit pageRendered(raster.page);
}

void PageRenderPipeline::onRenderJobFinished()
{
    auto* watcher = static_cast<QFutureWatcher<PageRaster>*>(sender());
    if (!watcher || watcher != m_watcher) {
        return;
    }

    m_watcher = nullptr;
    watcher->deleteLater();
    emit renderFinished(m_generation);
}

// ============================================================================
// Thumbnails
// ============================================================================

void PageRenderPipeline::regenerateThumbnails()
{
    m_thumbnails->cancelAll();
    if (!m_session) {
        return;
    }

    const DocumentSnapshot& snapshot = m_session->snapshot();
    for (int page = 1; page <= m_session->pageCount(); ++page) {
        m_thumbnails->requestThumbnail(m_session->id(), snapshot.version(), snapshot.bytes(),
                                       page, m_thumbnailWidth);
    }
}

void PageRenderPipeline::onThumbnailReady(int sessionId, quint64 version, int page, QImage thumbnail)
{
    if (!m_session || m_session->id() != sessionId
        || m_session->snapshot().version() != version) {
        return;
    }
    m_session->setThumbnail(page, thumbnail);
}

// ============================================================================
// Scroll tracking
// ============================================================================

void PageRenderPipeline::updateScrollPosition(qreal viewportTop, qreal viewportHeight)
{
    if (!m_tracking || !m_session || m_slots.isEmpty()) {
        return;
    }

    const int page = pageAt(viewportTop + viewportHeight / 2.0);
    if (page > 0) {
        m_session->setCurrentPage(page);
    }
}

void PageRenderPipeline::scrollToPage(int page)
{
    const PageSlot* pageSlot = slot(page);
    if (!pageSlot) {
        return;
    }

    m_tracking = false;
    m_cooldown.start();
    emit scrollRequested(page, pageSlot->bounds.top());
}

void PageRenderPipeline::setTrackingCooldown(int ms)
{
    m_cooldown.setInterval(qMax(0, ms));
}
