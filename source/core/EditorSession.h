#pragma once

// ============================================================================
// EditorSession - The editor context
// ============================================================================
// Owns the document engine, the workspace, the render pipeline and the tool
// mode controller, and talks to the window only through EditorUi. Nothing
// in the core is a singleton; every collaborator is reached through this
// object.
//
// Engine jobs
// -----------
// Every byte-producing operation runs as one job on a worker thread:
// load the session's current snapshot into a fresh PdfEditDocument, apply
// the edit, save, and inspect the result. On completion (GUI thread) the job
// pushes an undo entry carrying the previous snapshot and commits the new
// bytes. A failed job leaves the previous snapshot and view untouched and
// pushes nothing. One job per session at a time; further requests are
// rejected with a ValidationError until it finishes.
//
// Marks are converted to document space when the job is created, with the
// zoom active at that moment.
// ============================================================================

#include "EditorErrors.h"
#include "EditorSettings.h"
#include "ToolMode.h"
#include "UndoStack.h"
#include "../pdf/PdfEngine.h"
#include "../pdf/PdfProvider.h"

#include <QMap>
#include <QObject>
#include <QStringList>

#include <functional>
#include <memory>

class DocumentSession;
class EditorUi;
class PageRenderPipeline;
class ToolModeController;
class Workspace;

/**
 * @brief Options of addPageNumbers().
 */
struct PageNumberOptions {
    enum Position { BottomLeft, BottomCenter, BottomRight, TopLeft, TopCenter, TopRight };
    enum Format { Plain, Dashed, PageOfTotal };

    Position position = BottomCenter;
    Format format = Plain;
    qreal fontSize = 10.0;
    int startAt = 1;
};

class EditorSession : public QObject {
    Q_OBJECT

public:
    /// Controls enabled while at least one document is open.
    static const QStringList DOCUMENT_CONTROLS;

    static constexpr qreal FIT_MARGIN = 40.0;
    static constexpr qreal STAMP_FONT_SIZE = 54.0;
    static constexpr qreal PAGE_NUMBER_MARGIN = 36.0;
    static constexpr qreal FIELD_WIDTH = 150.0;
    static constexpr qreal FIELD_HEIGHT = 20.0;

    EditorSession(std::unique_ptr<PdfEngine> engine, PdfProviderFactory providerFactory,
                  EditorUi* ui, QObject* parent = nullptr);
    ~EditorSession() override;

    Workspace* workspace() const { return m_workspace; }
    PageRenderPipeline* pipeline() const { return m_pipeline; }
    ToolModeController* tools() const { return m_tools; }
    const PdfEngine* engine() const { return m_engine.get(); }
    EditorSettings& settings() { return m_settings; }
    DocumentSession* activeSession() const;

    // =========================================================================
    // Documents
    // =========================================================================

    /**
     * @brief Load bytes on a worker thread and open them as a new session.
     *
     * Returns immediately. LoadError is reported through the UI and
     * operationFinished("open", ...); the workspace is unchanged then.
     */
    OperationResult openBytes(const QByteArray& bytes, const QString& name,
                              const QString& filePath = QString());

    OperationResult openFile(const QString& path);

    bool switchTo(int sessionId);

    /**
     * @brief Close a session. Exits the active tool mode first.
     */
    bool closeSession(int sessionId);

    /**
     * @brief Write the active document to a file.
     *
     * Pending text boxes are applied first, then the bytes are written.
     * An empty path uses the session's file path.
     */
    OperationResult saveActive(const QString& path = QString());

    // =========================================================================
    // Navigation, zoom, selection
    // =========================================================================

    void goToPage(int page);
    void nextPage();
    void prevPage();
    void firstPage();
    void lastPage();

    void zoomIn();
    void zoomOut();
    void setZoom(qreal zoom);
    void fitPage(const QSizeF& viewportSize);

    /**
     * @brief Thumbnail click.
     *
     * Ctrl toggles the page in the selection. A plain click clears the
     * selection and navigates to the page.
     */
    void pageClicked(int page, Qt::KeyboardModifiers modifiers);

    /// Right-click on a thumbnail: select only that page unless it is already selected.
    void pageContextRequested(int page);

    void selectAllPages();

    // =========================================================================
    // Tool modes
    // =========================================================================

    ToolMode toggleToolMode(ToolMode mode);
    bool handleEscape();

    // =========================================================================
    // Page operations (engine jobs)
    // =========================================================================

    OperationResult deletePages();
    OperationResult reorderPage(int fromPage, int toPage);
    OperationResult movePageUp();
    OperationResult movePageDown();
    OperationResult rotatePages(int degrees);
    OperationResult cropPages(const QRectF& box);
    OperationResult insertBlankPage();
    OperationResult addPageNumbers(const PageNumberOptions& options);

    /**
     * @param allPages Stamp every page instead of the current one.
     */
    OperationResult addStamp(const QString& text, const QColor& color, bool allPages);

    // =========================================================================
    // Mark commits (engine jobs)
    // =========================================================================

    OperationResult applyTextEdits();
    OperationResult applyRedactions();
    void clearRedactions();
    OperationResult searchRedact(const QString& term, const QColor& color);
    OperationResult applyAnnotations();

    /// Set the redaction fill used for new rectangles.
    void setRedactColor(const QColor& color);

    // =========================================================================
    // Forms
    // =========================================================================

    /// Fields of the active document (reads the current snapshot).
    QVector<PdfFormField> formFields() const;
    OperationResult fillForm(const QMap<QString, QString>& values);
    OperationResult flattenForm();
    OperationResult addFieldAt(int page, const QPointF& screenPos, int placementMarkId = 0);

    // =========================================================================
    // Multi-document
    // =========================================================================

    OperationResult mergeDocuments();
    OperationResult extractPages();

    // =========================================================================
    // History
    // =========================================================================

    OperationResult undo();

    /**
     * @brief Redo the newest undone action.
     *
     * Mark placements are put back exactly. Engine operations are not
     * re-executed: the entry only moves back to the undo stack.
     */
    OperationResult redo();

    bool canUndo() const;
    bool canRedo() const;

signals:
    /**
     * @brief An operation completed (synchronously or after its job).
     * @param operation Operation tag ("open", "delete", "redact", ...).
     */
    void operationFinished(const QString& operation, const OperationResult& result);

    void undoRedoStateChanged(bool canUndo, bool canRedo);

    /// Number of pending redaction rectangles in the active session.
    void redactionCountChanged(int count);

private:
    using EditFunction = std::function<bool(PdfEditDocument& doc, QString& error)>;

    /**
     * @brief Result of a worker job.
     */
    struct JobOutcome {
        bool ok = false;
        QString error;
        QByteArray bytes;
        DocumentInfo info;
    };

    struct EngineJob {
        QString operation;
        UndoAction::Type undoType = UndoAction::DeletePages;
        bool pushUndo = true;
        int keepPage = 0;
        EditFunction edit;
        QString successStatus;
        QString failureMessage;
        std::function<void(DocumentSession*)> onCommitted;
        std::function<void(const OperationResult&)> onFinished;
    };

    OperationResult checkReady(DocumentSession** session, const QString& operation);
    OperationResult reject(const QString& operation, const QString& message);
    OperationResult runEngineJob(DocumentSession* session, EngineJob job);
    void finishEngineJob(int sessionId, quint64 baseVersion, int previousPage,
                         const EngineJob& job, const JobOutcome& outcome);

    /// Build a new document (merge/extract) and open it as a session.
    OperationResult runCreateJob(const QString& operation, const QString& name,
                                 std::function<bool(PdfEditDocument& doc, QString& error)> build);

    void restoreSnapshot(DocumentSession* session, const UndoAction& action);
    void searchRedactStep(int sessionId, quint64 baseVersion, int page, QString term,
                          QColor color, std::shared_ptr<PdfProvider> provider,
                          QVector<QPair<int, QRectF>> found);

    void report(const QString& operation, const OperationResult& result);
    void onActiveSessionChanged(DocumentSession* session);
    void onWorkspaceEmptied();
    void updateUndoControls();
    void setBusy(DocumentSession* session, bool busy);

    static JobOutcome executeEdit(const PdfEngine* engine, const QByteArray& base,
                                  const EditFunction& edit);

    std::unique_ptr<PdfEngine> m_engine;
    PdfProviderFactory m_providerFactory;
    EditorUi* m_ui;
    EditorSettings m_settings;

    Workspace* m_workspace;
    PageRenderPipeline* m_pipeline;
    ToolModeController* m_tools;
    QMetaObject::Connection m_undoConnection;
    QMetaObject::Connection m_redoConnection;
    QMetaObject::Connection m_redactConnection;
    int m_runningJobs = 0;
};
