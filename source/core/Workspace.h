#pragma once

// ============================================================================
// Workspace - Ordered set of open document sessions
// ============================================================================
// The Workspace OWNS every DocumentSession. Insertion order is tab order.
// Exactly one session is active while the workspace is non-empty; the
// active index is -1 when it is empty.
//
// The workspace is never persisted. Loading is delegated to the PdfEngine,
// which the workspace only uses to validate bytes and read page geometry.
// ============================================================================

#include "DocumentSession.h"
#include "EditorErrors.h"

#include <QObject>
#include <QVector>

class PdfEngine;

class Workspace : public QObject {
    Q_OBJECT

public:
    explicit Workspace(const PdfEngine* engine, QObject* parent = nullptr);
    ~Workspace() override;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Check that bytes form a loadable document and read its geometry.
     *
     * Does not touch the session list, so it may run on a worker thread.
     * @param name Display name, used in the error message.
     * @param info Receives page count, sizes and rotations on success.
     * @return LoadError if the engine rejects the bytes.
     */
    OperationResult validate(const QByteArray& bytes, const QString& name, DocumentInfo& info) const;

    /**
     * @brief Add a session for bytes that passed validate().
     *
     * Opening is validate() on a worker thread followed by adopt() on the GUI
     * thread. Merge/extract results come through here too. The new session
     * becomes active.
     */
    DocumentSession* adopt(const DocumentSnapshot& snapshot, const DocumentInfo& info,
                           const QString& name);

    /**
     * @brief Make a session active.
     * @return false (and no change) if the id is unknown.
     */
    bool switchTo(int sessionId);

    /**
     * @brief Close and delete a session.
     *
     * If the closed session was active, the session now at the same index
     * (or the last one) becomes active. Closing the last session empties the
     * workspace and emits workspaceEmptied().
     */
    bool close(int sessionId);

    /**
     * @brief Replace the active session's bytes.
     * @param keepPage Page to show afterwards, 0 keeps the current page.
     */
    bool commit(const DocumentSnapshot& snapshot, const DocumentInfo& info, int keepPage = 0);

    /// Same as commit() for a specific session.
    bool commitTo(int sessionId, const DocumentSnapshot& snapshot, const DocumentInfo& info,
                  int keepPage = 0);

    // =========================================================================
    // Access
    // =========================================================================

    bool isEmpty() const { return m_sessions.isEmpty(); }
    int sessionCount() const { return m_sessions.size(); }
    DocumentSession* sessionAt(int index) const;
    DocumentSession* session(int sessionId) const;
    int indexOf(int sessionId) const;
    int activeIndex() const { return m_activeIndex; }
    DocumentSession* activeSession() const { return sessionAt(m_activeIndex); }
    const QVector<DocumentSession*>& sessions() const { return m_sessions; }

    /// Undo bound given to sessions opened from now on.
    void setUndoLimit(int limit) { m_undoLimit = qMax(1, limit); }
    int undoLimit() const { return m_undoLimit; }

signals:
    void sessionOpened(DocumentSession* session);

    /**
     * @brief Active session changed.
     * @param session New active session, nullptr when the workspace emptied.
     */
    void activeSessionChanged(DocumentSession* session);

    /// Emitted before deletion; the pointer is invalid afterwards.
    void sessionAboutToClose(DocumentSession* session);
    void sessionClosed(int sessionId);

    void sessionCommitted(DocumentSession* session);

    void workspaceEmptied();

private:
    const PdfEngine* m_engine;
    QVector<DocumentSession*> m_sessions;
    int m_activeIndex = -1;
    int m_nextId = 1;
    int m_undoLimit = UndoStack::DEFAULT_MAX_DEPTH;
};
