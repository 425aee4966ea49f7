// ============================================================================
// EditorSession Implementation
// ============================================================================

#include "EditorSession.h"
#include "CoordinateTransform.h"
#include "DocumentSession.h"
#include "EditorUi.h"
#include "Workspace.h"
#include "../tools/AddFieldTool.h"
#include "../tools/DrawTool.h"
#include "../tools/RedactTool.h"
#include "../tools/ToolModeController.h"
#include "../viewport/PageRenderPipeline.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QThreadPool>
#include <QTimer>
#include <QtConcurrent>

#include <algorithm>

const QStringList EditorSession::DOCUMENT_CONTROLS = {
    QStringLiteral("tb-save"),
    QStringLiteral("tb-print"),
    QStringLiteral("tb-merge"),
    QStringLiteral("tb-extract"),
    QStringLiteral("tb-zoomin"),
    QStringLiteral("tb-zoomout"),
    QStringLiteral("tb-fitpage"),
    QStringLiteral("tb-editmode"),
    QStringLiteral("side-merge"),
    QStringLiteral("side-extract"),
    QStringLiteral("side-edit"),
    QStringLiteral("side-print"),
    QStringLiteral("side-save")
};

namespace {

const QString UNDO_ID = QStringLiteral("tb-undo");
const QString REDO_ID = QStringLiteral("tb-redo");

const QColor HIGHLIGHT_COLOR(255, 255, 0);
const QColor UNDERLINE_COLOR(255, 0, 0);
constexpr qreal HIGHLIGHT_OPACITY = 0.4;
constexpr qreal STICKY_TEXT_SIZE = 9.0;
constexpr qreal STICKY_TEXT_OFFSET = 12.0;

/// Marker drawn in front of committed sticky note text.
const QString STICKY_MARKER = QStringLiteral("» ");

QVector<int> pagesOrCurrent(const DocumentSession* session)
{
    QVector<int> pages = session->selectedPages();
    if (pages.isEmpty()) {
        pages.append(session->currentPage());
    }
    return pages;
}

} // namespace

EditorSession::EditorSession(std::unique_ptr<PdfEngine> engine, PdfProviderFactory providerFactory,
                             EditorUi* ui, QObject* parent)
    : QObject(parent)
    , m_engine(std::move(engine))
    , m_providerFactory(std::move(providerFactory))
    , m_ui(ui)
    , m_workspace(new Workspace(m_engine.get(), this))
    , m_pipeline(new PageRenderPipeline(m_providerFactory, this))
    , m_tools(new ToolModeController(m_pipeline, this))
{
    m_workspace->setUndoLimit(m_settings.undoLimit());
    m_pipeline->setTrackingCooldown(m_settings.scrollCooldownMs());
    m_pipeline->setThumbnailWidth(m_settings.thumbnailWidth());
    m_tools->redactTool()->setColor(m_settings.redactColor());
    m_tools->drawTool()->setPen(m_settings.drawColor(), m_settings.drawWidth());

    connect(m_workspace, &Workspace::activeSessionChanged,
            this, &EditorSession::onActiveSessionChanged);
    connect(m_workspace, &Workspace::workspaceEmptied,
            this, &EditorSession::onWorkspaceEmptied);
    connect(m_workspace, &Workspace::sessionAboutToClose, this, [this](DocumentSession* session) {
        if (m_pipeline->session() == session) {
            m_pipeline->setSession(nullptr);
        }
    });

    connect(m_tools->addFieldTool(), &AddFieldTool::fieldPlacementRequested,
            this, [this](int page, const QPointF& pos, int markId) {
        addFieldAt(page, pos, markId);
    });
}

EditorSession::~EditorSession()
{
    // Jobs hold a pointer to the engine; let them finish before it goes away
    QThreadPool::globalInstance()->waitForDone();

    m_tools->exit();
    delete m_tools;
    delete m_pipeline;
    delete m_workspace;
}

DocumentSession* EditorSession::activeSession() const
{
    return m_workspace->activeSession();
}

// ============================================================================
// Reporting
// ============================================================================

void EditorSession::report(const QString& operation, const OperationResult& result)
{
    if (!result.success) {
        qDebug() << "EditorSession:" << operation << errorKindName(result.error) << "-" << result.message;
    }
    emit operationFinished(operation, result);
}

OperationResult EditorSession::reject(const QString& operation, const QString& message)
{
    const OperationResult result = OperationResult::failure(ErrorKind::ValidationError, message);
    if (m_ui) {
        m_ui->showMessage(tr("PdfDesk"), message, EditorUi::MessageLevel::Warning);
    }
    report(operation, result);
    return result;
}

OperationResult EditorSession::checkReady(DocumentSession** session, const QString& operation)
{
    DocumentSession* active = activeSession();
    if (!active) {
        return reject(operation, tr("No document open."));
    }
    if (active->isBusy()) {
        return reject(operation, tr("Another operation is still running."));
    }
    *session = active;
    return OperationResult::ok();
}

void EditorSession::setBusy(DocumentSession* session, bool busy)
{
    if (session) {
        session->setBusy(busy);
    }
    m_runningJobs = qMax(0, m_runningJobs + (busy ? 1 : -1));
    if (m_ui) {
        m_ui->setBusy(m_runningJobs > 0);
    }
}

// ============================================================================
// Engine jobs
// ============================================================================

EditorSession::JobOutcome EditorSession::executeEdit(const PdfEngine* engine, const QByteArray& base,
                                                     const EditFunction& edit)
{
    JobOutcome outcome;
    QString error;

    std::unique_ptr<PdfEditDocument> doc = engine->load(base, &error);
    if (!doc) {
        outcome.error = error.isEmpty() ? QStringLiteral("Could not load the document.") : error;
        return outcome;
    }

    if (edit && !edit(*doc, error)) {
        outcome.error = error.isEmpty() ? doc->lastError() : error;
        return outcome;
    }

    if (!doc->save(outcome.bytes)) {
        outcome.error = doc->lastError();
        return outcome;
    }

    if (!engine->inspect(outcome.bytes, outcome.info, &error)) {
        outcome.error = error;
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

OperationResult EditorSession::runEngineJob(DocumentSession* session, EngineJob job)
{
    const int sessionId = session->id();
    const quint64 baseVersion = session->snapshot().version();
    const int previousPage = session->currentPage();
    const QByteArray base = session->snapshot().bytes();

    setBusy(session, true);
    if (m_ui) {
        m_ui->setStatus(tr("Working..."));
    }
    qDebug() << "EditorSession: Starting" << job.operation << "on session" << sessionId
             << "version" << baseVersion;

    auto* watcher = new QFutureWatcher<JobOutcome>(this);
    connect(watcher, &QFutureWatcher<JobOutcome>::finished, this,
            [this, watcher, sessionId, baseVersion, previousPage, job]() {
        const JobOutcome outcome = watcher->result();
        watcher->deleteLater();
        finishEngineJob(sessionId, baseVersion, previousPage, job, outcome);
    });

    const PdfEngine* engine = m_engine.get();
    const EditFunction edit = job.edit;
    watcher->setFuture(QtConcurrent::run([engine, base, edit]() {
        return executeEdit(engine, base, edit);
    }));

    return OperationResult::ok();
}

void EditorSession::finishEngineJob(int sessionId, quint64 baseVersion, int previousPage,
                                    const EngineJob& job, const JobOutcome& outcome)
{
    OperationResult result;
    DocumentSession* session = m_workspace->session(sessionId);

    if (!session) {
        setBusy(nullptr, false);
        qDebug() << "EditorSession:" << job.operation << "finished after its document was closed";
        result = OperationResult::failure(ErrorKind::EngineError,
                                          tr("The document was closed before the operation finished."));
    } else {
        setBusy(session, false);

        if (session->snapshot().version() != baseVersion) {
            qWarning() << "EditorSession: Dropping stale result of" << job.operation;
            result = OperationResult::failure(ErrorKind::EngineError,
                                              tr("The document changed while the operation was running."));
        } else if (!outcome.ok) {
            qWarning() << "EditorSession:" << job.operation << "failed -" << outcome.error;
            const QString message = job.failureMessage.isEmpty()
                ? tr("The operation failed.") : job.failureMessage;
            if (m_ui) {
                m_ui->showMessage(tr("Error"), message + QLatin1Char('\n') + outcome.error,
                                  EditorUi::MessageLevel::Error);
                m_ui->setStatus(tr("Ready."));
            }
            result = OperationResult::failure(ErrorKind::EngineError, outcome.error);
        } else {
            if (job.pushUndo) {
                session->undoStack()->push(
                    UndoAction::forSnapshot(job.undoType, session->snapshot(), previousPage));
            }
            m_workspace->commitTo(sessionId, DocumentSnapshot::create(outcome.bytes),
                                  outcome.info, job.keepPage);
            if (job.onCommitted) {
                job.onCommitted(session);
            }
            if (m_ui) {
                m_ui->setStatus(job.successStatus);
            }
            result = OperationResult::ok(job.successStatus);
        }
    }

    report(job.operation, result);
    if (job.onFinished) {
        job.onFinished(result);
    }
}

OperationResult EditorSession::runCreateJob(const QString& operation, const QString& name,
                                            std::function<bool(PdfEditDocument&, QString&)> build)
{
    setBusy(nullptr, true);
    if (m_ui) {
        m_ui->setStatus(tr("Working..."));
    }

    auto* watcher = new QFutureWatcher<JobOutcome>(this);
    connect(watcher, &QFutureWatcher<JobOutcome>::finished, this,
            [this, watcher, operation, name]() {
        const JobOutcome outcome = watcher->result();
        watcher->deleteLater();
        setBusy(nullptr, false);

        if (!outcome.ok) {
            qWarning() << "EditorSession:" << operation << "failed -" << outcome.error;
            if (m_ui) {
                m_ui->showMessage(tr("Error"), tr("Failed to create %1.\n%2").arg(name, outcome.error),
                                  EditorUi::MessageLevel::Error);
                m_ui->setStatus(tr("Ready."));
            }
            report(operation, OperationResult::failure(ErrorKind::EngineError, outcome.error));
            return;
        }

        m_workspace->adopt(DocumentSnapshot::create(outcome.bytes), outcome.info, name);
        const QString status = tr("Created %1 (%2 pages).").arg(name).arg(outcome.info.pageCount);
        if (m_ui) {
            m_ui->setStatus(status);
        }
        report(operation, OperationResult::ok(status));
    });

    const PdfEngine* engine = m_engine.get();
    watcher->setFuture(QtConcurrent::run([engine, build]() {
        JobOutcome outcome;
        QString error;
        std::unique_ptr<PdfEditDocument> doc = engine->createEmpty(&error);
        if (!doc) {
            outcome.error = error;
            return outcome;
        }
        if (!build(*doc, error)) {
            outcome.error = error.isEmpty() ? doc->lastError() : error;
            return outcome;
        }
        if (!doc->save(outcome.bytes)) {
            outcome.error = doc->lastError();
            return outcome;
        }
        outcome.ok = engine->inspect(outcome.bytes, outcome.info, &outcome.error);
        return outcome;
    }));

    return OperationResult::ok();
}

// ============================================================================
// Documents
// ============================================================================

OperationResult EditorSession::openBytes(const QByteArray& bytes, const QString& name,
                                         const QString& filePath)
{
    if (bytes.isEmpty()) {
        const OperationResult result = OperationResult::failure(ErrorKind::LoadError,
            tr("Could not open %1: the file is empty.").arg(name));
        if (m_ui) {
            m_ui->showMessage(tr("Open"), result.message, EditorUi::MessageLevel::Error);
        }
        report(QStringLiteral("open"), result);
        return result;
    }

    setBusy(nullptr, true);
    if (m_ui) {
        m_ui->setStatus(tr("Loading %1...").arg(name));
    }

    auto* watcher = new QFutureWatcher<JobOutcome>(this);
    connect(watcher, &QFutureWatcher<JobOutcome>::finished, this,
            [this, watcher, name, filePath]() {
        const JobOutcome outcome = watcher->result();
        watcher->deleteLater();
        setBusy(nullptr, false);

        if (!outcome.ok) {
            const OperationResult result = OperationResult::failure(ErrorKind::LoadError, outcome.error);
            if (m_ui) {
                m_ui->showMessage(tr("Open"), result.message, EditorUi::MessageLevel::Error);
                m_ui->setStatus(tr("Ready."));
            }
            report(QStringLiteral("open"), result);
            return;
        }

        DocumentSession* session = m_workspace->adopt(DocumentSnapshot::create(outcome.bytes),
                                                      outcome.info, name);
        if (!filePath.isEmpty()) {
            session->setFilePath(filePath);
            m_settings.addRecentDocument(filePath);
        }
        const QString status = tr("Opened %1 (%2 pages).").arg(name).arg(outcome.info.pageCount);
        if (m_ui) {
            m_ui->setStatus(status);
        }
        report(QStringLiteral("open"), OperationResult::ok(status));
    });

    const Workspace* workspace = m_workspace;
    watcher->setFuture(QtConcurrent::run([workspace, bytes, name]() {
        JobOutcome outcome;
        outcome.bytes = bytes;
        const OperationResult checked = workspace->validate(bytes, name, outcome.info);
        outcome.ok = checked.success;
        outcome.error = checked.message;
        return outcome;
    }));

    return OperationResult::ok();
}

OperationResult EditorSession::openFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "EditorSession: Cannot read" << path << "-" << file.errorString();
        const OperationResult result = OperationResult::failure(ErrorKind::LoadError,
            tr("Could not read %1: %2").arg(path, file.errorString()));
        if (m_ui) {
            m_ui->showMessage(tr("Open"), result.message, EditorUi::MessageLevel::Error);
        }
        report(QStringLiteral("open"), result);
        return result;
    }

    const QByteArray bytes = file.readAll();
    file.close();

    const QFileInfo info(path);
    m_settings.setLastDirectory(info.absolutePath());
    return openBytes(bytes, info.fileName(), info.absoluteFilePath());
}

bool EditorSession::switchTo(int sessionId)
{
    return m_workspace->switchTo(sessionId);
}

bool EditorSession::closeSession(int sessionId)
{
    if (m_workspace->indexOf(sessionId) < 0) {
        return false;
    }
    m_tools->exit();
    return m_workspace->close(sessionId);
}

OperationResult EditorSession::saveActive(const QString& path)
{
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, QStringLiteral("save"));
    if (!ready.success) {
        return ready;
    }

    const QString target = path.isEmpty() ? session->filePath() : path;
    if (target.isEmpty()) {
        return reject(QStringLiteral("save"), tr("Choose a file name to save to."));
    }

    const int sessionId = session->id();
    auto writeFile = [this, sessionId, target]() {
        DocumentSession* s = m_workspace->session(sessionId);
        if (!s) {
            return;
        }

        QFile file(target);
        const QByteArray& bytes = s->snapshot().bytes();
        if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size()) {
            qWarning() << "EditorSession: Cannot write" << target << "-" << file.errorString();
            const OperationResult result = OperationResult::failure(ErrorKind::EngineError,
                tr("Could not save %1: %2").arg(target, file.errorString()));
            if (m_ui) {
                m_ui->showMessage(tr("Save"), result.message, EditorUi::MessageLevel::Error);
            }
            report(QStringLiteral("save"), result);
            return;
        }
        file.close();

        const QFileInfo info(target);
        s->setFilePath(info.absoluteFilePath());
        s->setName(info.fileName());
        m_settings.addRecentDocument(info.absoluteFilePath());

        const QString status = tr("Saved %1.").arg(info.fileName());
        if (m_ui) {
            m_ui->setStatus(status);
        }
        report(QStringLiteral("save"), OperationResult::ok(status));
    };

    // Pending text boxes go into the file
    bool hasText = false;
    for (const Mark& box : session->marks()->marksOfKind(Mark::TextBox)) {
        hasText = hasText || (session->hasPage(box.page) && !box.text.trimmed().isEmpty());
    }
    if (!hasText) {
        writeFile();
        return OperationResult::ok();
    }

    auto connection = std::make_shared<QMetaObject::Connection>();
    *connection = connect(this, &EditorSession::operationFinished, this,
            [this, writeFile, connection](const QString& operation, const OperationResult& result) {
        if (operation != QLatin1String("add-text-commit")) {
            return;
        }
        disconnect(*connection);
        if (result.success) {
            writeFile();
        } else {
            report(QStringLiteral("save"), result);
        }
    });

    return applyTextEdits();
}

// ============================================================================
// Navigation, zoom, selection
// ============================================================================

void EditorSession::goToPage(int page)
{
    DocumentSession* session = activeSession();
    if (!session) {
        return;
    }
    session->setCurrentPage(page);
    m_pipeline->scrollToPage(session->currentPage());
}

void EditorSession::nextPage()
{
    if (DocumentSession* session = activeSession()) {
        goToPage(session->currentPage() + 1);
    }
}

void EditorSession::prevPage()
{
    if (DocumentSession* session = activeSession()) {
        goToPage(session->currentPage() - 1);
    }
}

void EditorSession::firstPage()
{
    goToPage(1);
}

void EditorSession::lastPage()
{
    if (DocumentSession* session = activeSession()) {
        goToPage(session->pageCount());
    }
}

void EditorSession::zoomIn()
{
    if (DocumentSession* session = activeSession()) {
        setZoom(session->zoom() + m_settings.zoomStep());
    }
}

void EditorSession::zoomOut()
{
    if (DocumentSession* session = activeSession()) {
        setZoom(session->zoom() - m_settings.zoomStep());
    }
}

void EditorSession::setZoom(qreal zoom)
{
    DocumentSession* session = activeSession();
    if (!session) {
        return;
    }
    session->setZoom(zoom);
    if (m_ui) {
        m_ui->setStatus(tr("Zoom: %1%").arg(qRound(session->zoom() * 100)));
    }
}

void EditorSession::fitPage(const QSizeF& viewportSize)
{
    DocumentSession* session = activeSession();
    if (!session) {
        return;
    }
    const QSizeF page = session->displaySize(session->currentPage());
    if (page.width() <= 0 || page.height() <= 0) {
        return;
    }
    const qreal zoom = qMin((viewportSize.width() - FIT_MARGIN) / page.width(),
                            (viewportSize.height() - FIT_MARGIN) / page.height());
    setZoom(zoom);
}

void EditorSession::pageClicked(int page, Qt::KeyboardModifiers modifiers)
{
    DocumentSession* session = activeSession();
    if (!session) {
        return;
    }
    if (modifiers & Qt::ControlModifier) {
        session->togglePageSelection(page);
        return;
    }
    session->clearSelection();
    goToPage(page);
}

void EditorSession::pageContextRequested(int page)
{
    DocumentSession* session = activeSession();
    if (session && !session->isSelected(page)) {
        session->selectOnly(page);
    }
}

void EditorSession::selectAllPages()
{
    if (DocumentSession* session = activeSession()) {
        session->selectAllPages();
    }
}

// ============================================================================
// Tool modes
// ============================================================================

ToolMode EditorSession::toggleToolMode(ToolMode mode)
{
    if (mode != ToolMode::None && mode != m_tools->mode() && !activeSession()) {
        if (m_ui) {
            m_ui->setStatus(tr("Open a document first."));
        }
        return m_tools->mode();
    }
    return m_tools->toggle(mode);
}

bool EditorSession::handleEscape()
{
    return m_tools->handleEscape();
}

void EditorSession::setRedactColor(const QColor& color)
{
    m_tools->redactTool()->setColor(color);
    m_settings.setRedactColor(color);
}

// ============================================================================
// Page operations
// ============================================================================

OperationResult EditorSession::deletePages()
{
    const QString op = QStringLiteral("delete");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    QVector<int> pages = pagesOrCurrent(session);
    if (pages.size() >= session->pageCount()) {
        return reject(op, tr("Cannot delete all pages."));
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::DeletePages;
    job.keepPage = qMin(pages.first(), session->pageCount() - pages.size());
    job.successStatus = tr("Deleted %n page(s).", nullptr, pages.size());
    job.failureMessage = tr("Failed to delete pages.");
    job.edit = [pages](PdfEditDocument& doc, QString&) {
        QVector<int> descending = pages;
        std::sort(descending.begin(), descending.end(), std::greater<int>());
        for (int page : descending) {
            if (!doc.removePage(page - 1)) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::reorderPage(int fromPage, int toPage)
{
    const QString op = QStringLiteral("reorder");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    const int count = session->pageCount();
    if (fromPage < 1 || fromPage > count || toPage < 1 || toPage > count) {
        return reject(op, tr("Invalid page position."));
    }
    if (fromPage == toPage) {
        return OperationResult::ok();
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::ReorderPage;
    job.keepPage = toPage;
    job.successStatus = tr("Moved page %1 to position %2.").arg(fromPage).arg(toPage);
    job.failureMessage = tr("Failed to reorder pages.");
    job.edit = [fromPage, toPage](PdfEditDocument& doc, QString&) {
        return doc.movePage(fromPage - 1, toPage - 1);
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::movePageUp()
{
    DocumentSession* session = activeSession();
    if (!session) {
        return reject(QStringLiteral("reorder"), tr("No document open."));
    }
    if (session->currentPage() <= 1) {
        return reject(QStringLiteral("reorder"), tr("This is already the first page."));
    }
    return reorderPage(session->currentPage(), session->currentPage() - 1);
}

OperationResult EditorSession::movePageDown()
{
    DocumentSession* session = activeSession();
    if (!session) {
        return reject(QStringLiteral("reorder"), tr("No document open."));
    }
    if (session->currentPage() >= session->pageCount()) {
        return reject(QStringLiteral("reorder"), tr("This is already the last page."));
    }
    return reorderPage(session->currentPage(), session->currentPage() + 1);
}

OperationResult EditorSession::rotatePages(int degrees)
{
    const QString op = QStringLiteral("rotate");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    const QVector<int> pages = pagesOrCurrent(session);

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::RotatePages;
    job.successStatus = tr("Rotated %n page(s).", nullptr, pages.size());
    job.failureMessage = tr("Failed to rotate pages.");
    job.edit = [pages, degrees](PdfEditDocument& doc, QString&) {
        for (int page : pages) {
            int angle = (doc.rotation(page - 1) + degrees) % 360;
            if (angle < 0) {
                angle += 360;
            }
            if (!doc.setRotation(page - 1, angle)) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::cropPages(const QRectF& box)
{
    const QString op = QStringLiteral("crop");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }
    if (box.width() <= 0 || box.height() <= 0) {
        return reject(op, tr("Invalid crop box."));
    }

    const QVector<int> pages = pagesOrCurrent(session);

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::CropPages;
    job.successStatus = tr("Cropped %n page(s).", nullptr, pages.size());
    job.failureMessage = tr("Failed to crop pages.");
    job.edit = [pages, box](PdfEditDocument& doc, QString&) {
        for (int page : pages) {
            if (!doc.setCropBox(page - 1, box)) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::insertBlankPage()
{
    const QString op = QStringLiteral("insert-blank");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    const int current = session->currentPage();
    const QSizeF size = session->pageSize(current);

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::InsertBlankPage;
    job.keepPage = current + 1;
    job.successStatus = tr("Inserted a blank page after page %1.").arg(current);
    job.failureMessage = tr("Failed to insert a page.");
    job.edit = [current, size](PdfEditDocument& doc, QString&) {
        return doc.insertBlankPage(current, size);
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::addPageNumbers(const PageNumberOptions& options)
{
    const QString op = QStringLiteral("page-numbers");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::PageNumbers;
    job.successStatus = tr("Page numbers added.");
    job.failureMessage = tr("Failed to add page numbers.");
    job.edit = [options](PdfEditDocument& doc, QString&) {
        const int total = doc.pageCount();
        PdfTextStyle style;
        style.fontSize = options.fontSize;

        for (int i = 0; i < total; ++i) {
            const int number = options.startAt + i;
            QString text;
            switch (options.format) {
                case PageNumberOptions::Dashed:
                    text = QStringLiteral("- %1 -").arg(number);
                    break;
                case PageNumberOptions::PageOfTotal:
                    text = QStringLiteral("Page %1 of %2").arg(number).arg(total);
                    break;
                case PageNumberOptions::Plain:
                    text = QString::number(number);
                    break;
            }

            const QSizeF size = doc.pageSize(i);
            const qreal textWidth = doc.textWidth(text, style.fontName, style.fontSize);

            qreal x = (size.width() - textWidth) / 2.0;
            switch (options.position) {
                case PageNumberOptions::BottomLeft:
                case PageNumberOptions::TopLeft:
                    x = PAGE_NUMBER_MARGIN;
                    break;
                case PageNumberOptions::BottomRight:
                case PageNumberOptions::TopRight:
                    x = size.width() - PAGE_NUMBER_MARGIN - textWidth;
                    break;
                default:
                    break;
            }
            const bool top = options.position == PageNumberOptions::TopLeft
                || options.position == PageNumberOptions::TopCenter
                || options.position == PageNumberOptions::TopRight;
            const qreal y = top ? size.height() - 30.0 : 20.0;

            if (!doc.drawText(i, QPointF(x, y), text, style)) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::addStamp(const QString& text, const QColor& color, bool allPages)
{
    const QString op = QStringLiteral("stamp");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }
    if (text.trimmed().isEmpty()) {
        return reject(op, tr("Enter the stamp text."));
    }

    QVector<int> pages;
    if (allPages) {
        for (int page = 1; page <= session->pageCount(); ++page) {
            pages.append(page);
        }
    } else {
        pages.append(session->currentPage());
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::Stamp;
    job.successStatus = tr("Stamp applied.");
    job.failureMessage = tr("Failed to apply stamp.");
    job.edit = [pages, text, color](PdfEditDocument& doc, QString&) {
        PdfTextStyle style;
        style.fontName = QStringLiteral("Helvetica-Bold");
        style.fontSize = STAMP_FONT_SIZE;
        style.color = color;
        style.opacity = 0.35;
        style.rotationDegrees = -30.0;

        const qreal textWidth = doc.textWidth(text, style.fontName, style.fontSize);
        for (int page : pages) {
            const QSizeF size = doc.pageSize(page - 1);
            const QPointF origin((size.width() - textWidth * 0.7) / 2.0,
                                 size.height() / 2.0 - STAMP_FONT_SIZE / 2.0);
            if (!doc.drawText(page - 1, origin, text, style)) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

// ============================================================================
// Mark commits
// ============================================================================

OperationResult EditorSession::applyTextEdits()
{
    const QString op = QStringLiteral("add-text-commit");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    struct TextOp {
        int page;
        QPointF origin;
        QString text;
        qreal fontSize;
    };

    const qreal zoom = session->zoom();
    QVector<TextOp> ops;
    QVector<int> committed;
    for (const Mark& box : session->marks()->marksOfKind(Mark::TextBox)) {
        // Marks on pages that no longer exist stay in the store until undo brings the page back
        if (!session->hasPage(box.page) || box.text.trimmed().isEmpty()) {
            continue;
        }
        const qreal height = session->pageSize(box.page).height();
        TextOp textOp;
        textOp.page = box.page;
        textOp.origin = QPointF(box.rect.x() / zoom, height - box.rect.y() / zoom - box.fontSize);
        textOp.text = box.text;
        textOp.fontSize = box.fontSize;
        ops.append(textOp);
        committed.append(box.id);
    }
    if (ops.isEmpty()) {
        return reject(op, tr("No text to apply."));
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::ApplyText;
    job.successStatus = tr("Text applied.");
    job.failureMessage = tr("Failed to apply text.");
    job.edit = [ops](PdfEditDocument& doc, QString&) {
        for (const TextOp& textOp : ops) {
            PdfTextStyle style;
            style.fontSize = textOp.fontSize;
            if (!doc.drawText(textOp.page - 1, textOp.origin, textOp.text, style)) {
                return false;
            }
        }
        return true;
    };
    job.onCommitted = [committed](DocumentSession* s) {
        for (int id : committed) {
            s->marks()->remove(id);
        }
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::applyRedactions()
{
    const QString op = QStringLiteral("redact");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    QVector<Mark> rects;
    for (const Mark& mark : session->marks()->marksOfKind(Mark::RedactRect)) {
        if (session->hasPage(mark.page)) {
            rects.append(mark);
        }
    }
    if (rects.isEmpty()) {
        return reject(op, tr("No redaction areas defined."));
    }

    struct RectOp {
        int page;
        QRectF rect;
        QColor color;
    };

    const qreal zoom = session->zoom();
    QVector<RectOp> ops;
    QVector<int> committed;
    for (const Mark& mark : rects) {
        RectOp rectOp;
        rectOp.page = mark.page;
        rectOp.rect = CoordinateTransform::toDocumentSpace(mark.rect, zoom,
                                                           session->pageSize(mark.page).height());
        rectOp.color = mark.color;
        ops.append(rectOp);
        committed.append(mark.id);
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::Redact;
    job.successStatus = tr("Redaction applied to %n area(s).", nullptr, ops.size());
    job.failureMessage = tr("Failed to apply redaction.");
    job.edit = [ops](PdfEditDocument& doc, QString&) {
        for (const RectOp& rectOp : ops) {
            if (!doc.drawRectangle(rectOp.page - 1, rectOp.rect, rectOp.color, 1.0)) {
                return false;
            }
        }
        return true;
    };
    job.onCommitted = [this, committed](DocumentSession* s) {
        for (int id : committed) {
            s->marks()->remove(id);
        }
        if (m_ui) {
            m_ui->showMessage(tr("Redaction"),
                tr("Redaction applied. The areas are covered visually; "
                   "the underlying text is still present in the file."),
                EditorUi::MessageLevel::Info);
        }
    };
    return runEngineJob(session, job);
}

void EditorSession::clearRedactions()
{
    if (DocumentSession* session = activeSession()) {
        session->marks()->clearKind(Mark::RedactRect);
    }
}

OperationResult EditorSession::searchRedact(const QString& term, const QColor& color)
{
    const QString op = QStringLiteral("search-redact");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }
    if (term.trimmed().isEmpty()) {
        return reject(op, tr("Enter a search term."));
    }

    std::shared_ptr<PdfProvider> provider;
    if (m_providerFactory) {
        provider = m_providerFactory(session->snapshot().bytes());
    }
    if (!provider || !provider->isValid()) {
        const OperationResult result = OperationResult::failure(ErrorKind::EngineError,
            tr("Could not read the document text."));
        if (m_ui) {
            m_ui->showMessage(tr("Error"), result.message, EditorUi::MessageLevel::Error);
        }
        report(op, result);
        return result;
    }

    setBusy(session, true);
    const int sessionId = session->id();
    const quint64 version = session->snapshot().version();
    QTimer::singleShot(0, this, [this, sessionId, version, term, color, provider]() {
        searchRedactStep(sessionId, version, 1, term, color, provider, {});
    });
    return OperationResult::ok();
}

void EditorSession::searchRedactStep(int sessionId, quint64 baseVersion, int page, QString term,
                                     QColor color, std::shared_ptr<PdfProvider> provider,
                                     QVector<QPair<int, QRectF>> found)
{
    const QString op = QStringLiteral("search-redact");
    DocumentSession* session = m_workspace->session(sessionId);
    if (!session || session->snapshot().version() != baseVersion) {
        setBusy(session, false);
        report(op, OperationResult::failure(ErrorKind::RenderCancelled,
                                            tr("Search cancelled.")));
        return;
    }

    const int pageCount = qMin(session->pageCount(), provider->pageCount());
    if (page <= pageCount) {
        if (m_ui) {
            m_ui->setStatus(tr("Searching page %1 of %2...").arg(page).arg(pageCount));
        }

        const qreal height = session->pageSize(page).height();
        const QVector<PdfTextBox> boxes = provider->textBoxes(page - 1);
        for (const PdfTextBox& box : boxes) {
            if (!box.text.contains(term, Qt::CaseInsensitive)) {
                continue;
            }
            const qreal w = box.boundingBox.width() > 0 ? box.boundingBox.width() : 6.0 * box.text.size();
            const qreal h = box.boundingBox.height() > 0 ? box.boundingBox.height() : 12.0;
            const qreal x = box.boundingBox.x();
            const qreal y = box.boundingBox.y();
            found.append(qMakePair(page, QRectF(x - 1, height - y - h - 1, w + 2, h + 2)));
        }

        // Next page on the next event loop turn
        QTimer::singleShot(0, this, [=]() {
            searchRedactStep(sessionId, baseVersion, page + 1, term, color, provider, found);
        });
        return;
    }

    setBusy(session, false);

    if (found.isEmpty()) {
        if (m_ui) {
            m_ui->setStatus(tr("Ready."));
        }
        reject(op, tr("No matches found."));
        return;
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::SearchRedact;
    job.successStatus = tr("Redacted %n match(es).", nullptr, found.size());
    job.failureMessage = tr("Failed to apply redaction.");
    job.edit = [found, color](PdfEditDocument& doc, QString&) {
        for (const auto& match : found) {
            if (!doc.drawRectangle(match.first - 1, match.second, color, 1.0)) {
                return false;
            }
        }
        return true;
    };
    job.onCommitted = [this, found, term](DocumentSession*) {
        if (m_ui) {
            m_ui->showMessage(tr("Redaction"),
                tr("Redacted %1 occurrence(s) of \"%2\". The text is covered visually; "
                   "it is still present in the file.").arg(found.size()).arg(term),
                EditorUi::MessageLevel::Info);
        }
    };
    runEngineJob(session, job);
}

OperationResult EditorSession::applyAnnotations()
{
    const QString op = QStringLiteral("annotate");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    struct AnnotationOp {
        enum Type { Rect, Line, Text } type;
        int page;
        QRectF rect;
        QPointF from;
        QPointF to;
        qreal thickness = 1.0;
        QColor color;
        QString text;
    };

    const qreal zoom = session->zoom();
    QVector<AnnotationOp> ops;
    QVector<int> committed;

    for (const Mark::Kind kind : {Mark::Highlight, Mark::Underline, Mark::DrawPath, Mark::StickyNote}) {
        for (const Mark& mark : session->marks()->marksOfKind(kind)) {
            if (!session->hasPage(mark.page)) {
                continue;
            }
            committed.append(mark.id);
            const qreal height = session->pageSize(mark.page).height();

            switch (kind) {
                case Mark::Highlight: {
                    AnnotationOp a{AnnotationOp::Rect, mark.page};
                    a.rect = CoordinateTransform::toDocumentSpace(mark.rect, zoom, height);
                    a.color = HIGHLIGHT_COLOR;
                    ops.append(a);
                    break;
                }
                case Mark::Underline: {
                    AnnotationOp a{AnnotationOp::Line, mark.page};
                    a.from = QPointF(mark.rect.x() / zoom, height - mark.rect.y() / zoom);
                    a.to = QPointF(mark.rect.right() / zoom, height - mark.rect.y() / zoom);
                    a.color = UNDERLINE_COLOR;
                    ops.append(a);
                    break;
                }
                case Mark::DrawPath:
                    for (int i = 1; i < mark.points.size(); ++i) {
                        AnnotationOp a{AnnotationOp::Line, mark.page};
                        a.from = CoordinateTransform::pointToDocumentSpace(mark.points[i - 1], zoom, height);
                        a.to = CoordinateTransform::pointToDocumentSpace(mark.points[i], zoom, height);
                        a.thickness = CoordinateTransform::lengthToDocumentSpace(mark.strokeWidth, zoom);
                        a.color = mark.color;
                        ops.append(a);
                    }
                    break;
                case Mark::StickyNote: {
                    if (mark.text.trimmed().isEmpty()) {
                        break;
                    }
                    AnnotationOp a{AnnotationOp::Text, mark.page};
                    a.from = QPointF(mark.rect.x() / zoom,
                                     height - mark.rect.y() / zoom - STICKY_TEXT_OFFSET);
                    a.text = STICKY_MARKER + mark.text;
                    a.color = m_settings.stickyNoteColor();
                    ops.append(a);
                    break;
                }
                default:
                    break;
            }
        }
    }

    if (ops.isEmpty()) {
        return reject(op, tr("No annotations to apply."));
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::Annotate;
    job.successStatus = tr("Annotations applied.");
    job.failureMessage = tr("Failed to apply annotations.");
    job.edit = [ops](PdfEditDocument& doc, QString&) {
        for (const AnnotationOp& a : ops) {
            bool ok = false;
            switch (a.type) {
                case AnnotationOp::Rect:
                    ok = doc.drawRectangle(a.page - 1, a.rect, a.color, HIGHLIGHT_OPACITY);
                    break;
                case AnnotationOp::Line:
                    ok = doc.drawLine(a.page - 1, a.from, a.to, a.thickness, a.color);
                    break;
                case AnnotationOp::Text: {
                    PdfTextStyle style;
                    style.fontSize = STICKY_TEXT_SIZE;
                    style.color = a.color;
                    ok = doc.drawText(a.page - 1, a.from, a.text, style);
                    break;
                }
            }
            if (!ok) {
                return false;
            }
        }
        return true;
    };
    job.onCommitted = [committed](DocumentSession* s) {
        for (int id : committed) {
            s->marks()->remove(id);
        }
    };
    return runEngineJob(session, job);
}

// ============================================================================
// Forms
// ============================================================================

QVector<PdfFormField> EditorSession::formFields() const
{
    DocumentSession* session = activeSession();
    if (!session) {
        return QVector<PdfFormField>();
    }

    QString error;
    std::unique_ptr<PdfEditDocument> doc = m_engine->load(session->snapshot().bytes(), &error);
    if (!doc) {
        qWarning() << "EditorSession::formFields: Cannot load document -" << error;
        return QVector<PdfFormField>();
    }
    return doc->formFields();
}

OperationResult EditorSession::fillForm(const QMap<QString, QString>& values)
{
    const QString op = QStringLiteral("fill-form");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }
    if (values.isEmpty()) {
        return reject(op, tr("No form fields to fill."));
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::FillForm;
    job.successStatus = tr("Form filled.");
    job.failureMessage = tr("Failed to fill the form.");
    job.edit = [values](PdfEditDocument& doc, QString&) {
        for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
            if (!doc.setFieldValue(it.key(), it.value())) {
                return false;
            }
        }
        return true;
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::flattenForm()
{
    const QString op = QStringLiteral("flatten");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    if (m_ui && !m_ui->confirm(tr("Flatten Form"),
                               tr("Flattening makes all form fields permanent. Continue?"))) {
        const OperationResult result = OperationResult::failure(ErrorKind::ValidationError,
                                                                tr("Flatten cancelled."));
        report(op, result);
        return result;
    }

    if (formFields().isEmpty()) {
        return reject(op, tr("No form fields to flatten."));
    }

    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::FlattenForm;
    job.successStatus = tr("Form flattened.");
    job.failureMessage = tr("Failed to flatten the form.");
    job.edit = [](PdfEditDocument& doc, QString&) {
        return doc.flattenForms();
    };
    return runEngineJob(session, job);
}

OperationResult EditorSession::addFieldAt(int page, const QPointF& screenPos, int placementMarkId)
{
    const QString op = QStringLiteral("add-field");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        if (DocumentSession* active = activeSession()) {
            active->marks()->remove(placementMarkId);
        }
        return ready;
    }

    const qreal zoom = session->zoom();
    const qreal height = session->pageSize(page).height();
    const QString name = QStringLiteral("field_%1").arg(QDateTime::currentMSecsSinceEpoch());
    const QRectF rect(screenPos.x() / zoom, height - screenPos.y() / zoom - FIELD_HEIGHT,
                      FIELD_WIDTH, FIELD_HEIGHT);

    const int sessionId = session->id();
    EngineJob job;
    job.operation = op;
    job.undoType = UndoAction::AddField;
    job.successStatus = tr("Added field %1.").arg(name);
    job.failureMessage = tr("Failed to add the form field.");
    job.edit = [page, name, rect](PdfEditDocument& doc, QString&) {
        return doc.addTextField(page - 1, name, rect);
    };
    job.onFinished = [this, sessionId, placementMarkId](const OperationResult&) {
        if (placementMarkId <= 0) {
            return;
        }
        if (DocumentSession* s = m_workspace->session(sessionId)) {
            s->marks()->remove(placementMarkId);
        }
    };
    return runEngineJob(session, job);
}

// ============================================================================
// Multi-document
// ============================================================================

OperationResult EditorSession::mergeDocuments()
{
    const QString op = QStringLiteral("merge");
    if (m_workspace->sessionCount() < 2) {
        return reject(op, tr("Open at least two documents to merge."));
    }

    QVector<QPair<QByteArray, int>> sources;
    for (DocumentSession* session : m_workspace->sessions()) {
        sources.append(qMakePair(session->snapshot().bytes(), session->pageCount()));
    }

    return runCreateJob(op, QStringLiteral("Merged.pdf"), [sources](PdfEditDocument& doc, QString&) {
        for (const auto& source : sources) {
            QVector<int> indices;
            for (int i = 0; i < source.second; ++i) {
                indices.append(i);
            }
            if (!doc.appendPagesFrom(source.first, indices)) {
                return false;
            }
        }
        return true;
    });
}

OperationResult EditorSession::extractPages()
{
    const QString op = QStringLiteral("extract");
    DocumentSession* session = activeSession();
    if (!session) {
        return reject(op, tr("No document open."));
    }

    const QVector<int> pages = session->selectedPages();
    if (pages.isEmpty()) {
        return reject(op, tr("No pages selected."));
    }

    QVector<int> indices;
    for (int page : pages) {
        indices.append(page - 1);
    }

    const QString name = QFileInfo(session->name()).completeBaseName() + QStringLiteral("_extract.pdf");
    const QByteArray bytes = session->snapshot().bytes();
    return runCreateJob(op, name, [bytes, indices](PdfEditDocument& doc, QString&) {
        return doc.appendPagesFrom(bytes, indices);
    });
}

// ============================================================================
// History
// ============================================================================

bool EditorSession::canUndo() const
{
    DocumentSession* session = activeSession();
    return session && session->undoStack()->canUndo();
}

bool EditorSession::canRedo() const
{
    DocumentSession* session = activeSession();
    return session && session->undoStack()->canRedo();
}

OperationResult EditorSession::undo()
{
    const QString op = QStringLiteral("undo");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    UndoAction action;
    if (!session->undoStack()->takeUndo(action)) {
        const OperationResult result = OperationResult::failure(ErrorKind::ValidationError,
                                                                tr("Nothing to undo."));
        report(op, result);
        return result;
    }

    if (action.isSnapshot()) {
        restoreSnapshot(session, action);
        return OperationResult::ok();
    }

    // Redo should bring back the mark as it is now, not as it was placed
    if (const Mark* live = session->marks()->find(action.mark.id)) {
        action.mark = *live;
        session->undoStack()->amendRedoTop(action);
    }
    session->marks()->remove(action.mark.id);

    const QString status = tr("Undid %1.").arg(action.name());
    if (m_ui) {
        m_ui->setStatus(status);
    }
    report(op, OperationResult::ok(status));
    return OperationResult::ok(status);
}

void EditorSession::restoreSnapshot(DocumentSession* session, const UndoAction& action)
{
    const int sessionId = session->id();
    const QByteArray bytes = action.prevSnapshot.bytes();
    setBusy(session, true);

    auto* watcher = new QFutureWatcher<JobOutcome>(this);
    connect(watcher, &QFutureWatcher<JobOutcome>::finished, this,
            [this, watcher, sessionId, action]() {
        const JobOutcome outcome = watcher->result();
        watcher->deleteLater();

        const QString op = QStringLiteral("undo");
        DocumentSession* s = m_workspace->session(sessionId);
        setBusy(s, false);
        if (!s) {
            report(op, OperationResult::failure(ErrorKind::EngineError,
                tr("The document was closed before the operation finished.")));
            return;
        }
        if (!outcome.ok) {
            qWarning() << "EditorSession: Cannot restore snapshot -" << outcome.error;
            // Nothing was undone, so the entry goes back onto the undo stack
            UndoAction returned;
            if (!s->undoStack()->takeRedo(returned)) {
                qWarning() << "EditorSession: Undo entry was lost after a failed restore";
            }
            if (m_ui) {
                m_ui->showMessage(tr("Undo"), tr("Failed to undo.\n%1").arg(outcome.error),
                                  EditorUi::MessageLevel::Error);
            }
            report(op, OperationResult::failure(ErrorKind::EngineError, outcome.error));
            return;
        }

        m_workspace->commitTo(sessionId, DocumentSnapshot::create(outcome.bytes),
                              outcome.info, action.keepPage);
        const QString status = tr("Undid %1.").arg(action.name());
        if (m_ui) {
            m_ui->setStatus(status);
        }
        report(op, OperationResult::ok(status));
    });

    const PdfEngine* engine = m_engine.get();
    watcher->setFuture(QtConcurrent::run([engine, bytes]() {
        JobOutcome outcome;
        outcome.bytes = bytes;
        outcome.ok = engine->inspect(bytes, outcome.info, &outcome.error);
        return outcome;
    }));
}

OperationResult EditorSession::redo()
{
    const QString op = QStringLiteral("redo");
    DocumentSession* session = nullptr;
    const OperationResult ready = checkReady(&session, op);
    if (!ready.success) {
        return ready;
    }

    UndoAction action;
    if (!session->undoStack()->takeRedo(action)) {
        const OperationResult result = OperationResult::failure(ErrorKind::ValidationError,
                                                                tr("Nothing to redo."));
        report(op, result);
        return result;
    }

    QString status;
    if (action.isSnapshot()) {
        // Structural edits are not re-executed
        status = tr("Redo is not available for %1; the entry was returned to the undo history.")
                     .arg(action.name());
    } else {
        session->marks()->restore(action.mark);
        status = tr("Redid %1.").arg(action.name());
    }

    if (m_ui) {
        m_ui->setStatus(status);
    }
    report(op, OperationResult::ok(status));
    return OperationResult::ok(status);
}

// ============================================================================
// Workspace reactions
// ============================================================================

void EditorSession::onActiveSessionChanged(DocumentSession* session)
{
    disconnect(m_undoConnection);
    disconnect(m_redoConnection);
    disconnect(m_redactConnection);

    m_pipeline->setSession(session);

    if (session) {
        m_undoConnection = connect(session->undoStack(), &UndoStack::undoAvailableChanged,
                                   this, &EditorSession::updateUndoControls);
        m_redoConnection = connect(session->undoStack(), &UndoStack::redoAvailableChanged,
                                   this, &EditorSession::updateUndoControls);
        m_redactConnection = connect(session->marks(), &MarkStore::countChanged,
                                     this, [this](Mark::Kind kind, int count) {
            if (kind == Mark::RedactRect) {
                emit redactionCountChanged(count);
            }
        });
        if (m_ui) {
            m_ui->setControlsEnabled(DOCUMENT_CONTROLS, true);
        }
        emit redactionCountChanged(session->marks()->count(Mark::RedactRect));
    }

    updateUndoControls();
}

void EditorSession::onWorkspaceEmptied()
{
    m_tools->exit();

    if (m_ui) {
        QStringList ids = DOCUMENT_CONTROLS;
        ids << UNDO_ID << REDO_ID;
        m_ui->setControlsEnabled(ids, false);
        m_ui->setStatus(tr("No document open."));
    }
    emit redactionCountChanged(0);
    emit undoRedoStateChanged(false, false);
}

void EditorSession::updateUndoControls()
{
    const bool undoAvailable = canUndo();
    const bool redoAvailable = canRedo();
    if (m_ui) {
        m_ui->setControlsEnabled({UNDO_ID}, undoAvailable);
        m_ui->setControlsEnabled({REDO_ID}, redoAvailable);
    }
    emit undoRedoStateChanged(undoAvailable, redoAvailable);
}
