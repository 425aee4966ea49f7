// ============================================================================
// Workspace Implementation
// ============================================================================

#include "Workspace.h"
#include "../pdf/PdfEngine.h"

#include <QDebug>

Workspace::Workspace(const PdfEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
}

Workspace::~Workspace()
{
    for (DocumentSession* session : m_sessions) {
        delete session;
    }
    m_sessions.clear();
}

// ============================================================================
// Lifecycle
// ============================================================================

OperationResult Workspace::validate(const QByteArray& bytes, const QString& name, DocumentInfo& info) const
{
    if (!m_engine) {
        return OperationResult::failure(ErrorKind::LoadError, tr("No document engine available."));
    }

    QString error;
    if (!m_engine->inspect(bytes, info, &error)) {
        qWarning() << "Workspace: Failed to load" << name << "-" << error;
        return OperationResult::failure(ErrorKind::LoadError,
            tr("Could not open %1: %2").arg(name, error));
    }
    return OperationResult::ok();
}

DocumentSession* Workspace::adopt(const DocumentSnapshot& snapshot, const DocumentInfo& info,
                                  const QString& name)
{
    auto* session = new DocumentSession(m_nextId++, name, snapshot, info, m_undoLimit);
    m_sessions.append(session);
    m_activeIndex = m_sessions.size() - 1;

    qDebug() << "Workspace: Opened session" << session->id() << name
             << "(" << info.pageCount << "pages )";

    emit sessionOpened(session);
    emit activeSessionChanged(session);
    return session;
}

bool Workspace::switchTo(int sessionId)
{
    const int index = indexOf(sessionId);
    if (index < 0) {
        return false;
    }
    if (index == m_activeIndex) {
        return true;
    }
    m_activeIndex = index;
    emit activeSessionChanged(m_sessions.at(index));
    return true;
}

bool Workspace::close(int sessionId)
{
    const int index = indexOf(sessionId);
    if (index < 0) {
        qWarning() << "Workspace::close: Session not found" << sessionId;
        return false;
    }

    const bool wasActive = index == m_activeIndex;
    DocumentSession* session = m_sessions.at(index);

    // Receivers drop their references before the session is deleted
    emit sessionAboutToClose(session);

    m_sessions.removeAt(index);
    delete session;

    if (m_sessions.isEmpty()) {
        m_activeIndex = -1;
        emit sessionClosed(sessionId);
        emit activeSessionChanged(nullptr);
        emit workspaceEmptied();
        return true;
    }

    if (wasActive) {
        m_activeIndex = qMin(index, m_sessions.size() - 1);
        emit sessionClosed(sessionId);
        emit activeSessionChanged(m_sessions.at(m_activeIndex));
    } else {
        if (index < m_activeIndex) {
            --m_activeIndex;
        }
        emit sessionClosed(sessionId);
    }
    return true;
}

bool Workspace::commit(const DocumentSnapshot& snapshot, const DocumentInfo& info, int keepPage)
{
    DocumentSession* session = activeSession();
    if (!session) {
        return false;
    }
    return commitTo(session->id(), snapshot, info, keepPage);
}

bool Workspace::commitTo(int sessionId, const DocumentSnapshot& snapshot, const DocumentInfo& info,
                         int keepPage)
{
    DocumentSession* target = session(sessionId);
    if (!target || snapshot.isNull() || !info.isValid()) {
        qWarning() << "Workspace::commitTo: Rejected commit for session" << sessionId;
        return false;
    }

    target->replaceSnapshot(snapshot, info, keepPage);
    emit sessionCommitted(target);
    return true;
}

// ============================================================================
// Access
// ============================================================================

DocumentSession* Workspace::sessionAt(int index) const
{
    if (index < 0 || index >= m_sessions.size()) {
        return nullptr;
    }
    return m_sessions.at(index);
}

DocumentSession* Workspace::session(int sessionId) const
{
    const int index = indexOf(sessionId);
    return index >= 0 ? m_sessions.at(index) : nullptr;
}

int Workspace::indexOf(int sessionId) const
{
    for (int i = 0; i < m_sessions.size(); ++i) {
        if (m_sessions.at(i)->id() == sessionId) {
            return i;
        }
    }
    return -1;
}
