#include "ThumbnailRenderer.h"

#include <QDebug>
#include <QPainter>
#include <QtConcurrent>

ThumbnailRenderer::ThumbnailRenderer(PdfProviderFactory factory, QObject* parent)
    : QObject(parent)
    , m_factory(std::move(factory))
{
}

ThumbnailRenderer::~ThumbnailRenderer()
{
    m_shuttingDown = true;
    cancelAll();
}

void ThumbnailRenderer::requestThumbnail(int sessionId, quint64 version, const QByteArray& bytes,
                                         int page, int width)
{
    if (bytes.isEmpty() || page < 1 || width <= 0) {
        return;
    }

    {
        QMutexLocker locker(&m_mutex);

        const quint64 key = pageKey(version, page);
        if (m_activeKeys.contains(key)) {
            return;  // Already rendering
        }
        for (const ThumbnailRequest& pending : m_pendingTasks) {
            if (pending.version == version && pending.page == page) {
                return;  // Already queued
            }
        }

        ThumbnailRequest request;
        request.sessionId = sessionId;
        request.version = version;
        request.bytes = bytes;
        request.page = page;
        request.width = width;
        m_pendingTasks.append(request);
    }

    startNextTask();
}

void ThumbnailRenderer::cancelAll()
{
    QMutexLocker locker(&m_mutex);

    m_pendingTasks.clear();

    for (QFutureWatcher<ThumbnailResult>* watcher : m_activeWatchers) {
        watcher->disconnect(this);
        watcher->cancel();
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeWatchers.clear();
    m_activeKeys.clear();
}

bool ThumbnailRenderer::isPending(quint64 version, int page) const
{
    QMutexLocker locker(&m_mutex);

    if (m_activeKeys.contains(pageKey(version, page))) {
        return true;
    }
    for (const ThumbnailRequest& pending : m_pendingTasks) {
        if (pending.version == version && pending.page == page) {
            return true;
        }
    }
    return false;
}

void ThumbnailRenderer::setMaxConcurrentRenders(int max)
{
    QMutexLocker locker(&m_mutex);
    m_maxConcurrent = qMax(1, max);
}

void ThumbnailRenderer::startNextTask()
{
    QMutexLocker locker(&m_mutex);

    while (m_activeWatchers.size() < m_maxConcurrent && !m_pendingTasks.isEmpty()) {
        ThumbnailRequest request = m_pendingTasks.takeFirst();
        m_activeKeys.insert(pageKey(request.version, request.page));

        auto* watcher = new QFutureWatcher<ThumbnailResult>(this);
        connect(watcher, &QFutureWatcher<ThumbnailResult>::finished,
                this, &ThumbnailRenderer::onRenderFinished);
        m_activeWatchers.append(watcher);

        // The worker owns its copy of the request and the factory
        QFuture<ThumbnailResult> future = QtConcurrent::run(
            [factory = m_factory, request = std::move(request)]() {
                return renderRequest(factory, request);
            });
        watcher->setFuture(future);
    }
}

void ThumbnailRenderer::onRenderFinished()
{
    if (m_shuttingDown) {
        return;
    }

    // QFutureWatcher is a template without Q_OBJECT, so use static_cast
    auto* watcher = static_cast<QFutureWatcher<ThumbnailResult>*>(sender());
    if (!watcher) {
        return;
    }

    ThumbnailResult result;
    const bool wasCancelled = watcher->isCanceled();
    if (!wasCancelled) {
        result = watcher->result();
    }

    {
        QMutexLocker locker(&m_mutex);
        m_activeWatchers.removeOne(watcher);
        if (!wasCancelled) {
            m_activeKeys.remove(pageKey(result.version, result.page));
        }
    }

    watcher->deleteLater();

    if (!wasCancelled) {
        emit thumbnailReady(result.sessionId, result.version, result.page, result.image);
    }

    startNextTask();
}

ThumbnailRenderer::ThumbnailResult ThumbnailRenderer::renderRequest(
    const PdfProviderFactory& factory, const ThumbnailRequest& request)
{
    ThumbnailResult result;
    result.sessionId = request.sessionId;
    result.version = request.version;
    result.page = request.page;

    std::unique_ptr<PdfProvider> provider = factory ? factory(request.bytes) : nullptr;
    const int pageIndex = request.page - 1;
    if (!provider || !provider->isValid() || pageIndex >= provider->pageCount()) {
        qWarning() << "ThumbnailRenderer: Cannot open page" << request.page;
        result.image = placeholder(request.page);
        return result;
    }

    const QSizeF pageSize = provider->pageSize(pageIndex);
    if (pageSize.width() <= 0 || pageSize.height() <= 0) {
        result.image = placeholder(request.page);
        return result;
    }

    // DPI that maps the page width onto the thumbnail width
    qreal dpi = request.width / (pageSize.width() / 72.0);
    dpi = qMin(dpi, 150.0);

    QImage image = provider->renderPageToImage(pageIndex, dpi);
    if (image.isNull()) {
        qWarning() << "ThumbnailRenderer: Render failed for page" << request.page;
        result.image = placeholder(request.page);
        return result;
    }

    if (image.width() != request.width) {
        image = image.scaledToWidth(request.width, Qt::SmoothTransformation);
    }
    result.image = image;
    return result;
}

QImage ThumbnailRenderer::placeholder(int page)
{
    QImage image(PLACEHOLDER_WIDTH, PLACEHOLDER_HEIGHT, QImage::Format_ARGB32);
    image.fill(QColor(240, 240, 240));

    QPainter painter(&image);
    painter.setPen(QColor(120, 120, 120));
    painter.drawRect(image.rect().adjusted(0, 0, -1, -1));
    painter.drawText(image.rect(), Qt::AlignCenter, QStringLiteral("Page %1").arg(page));
    painter.end();
    return image;
}
