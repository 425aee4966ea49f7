#ifndef WORKSPACETESTSUPPORT_H
#define WORKSPACETESTSUPPORT_H

#include "Workspace.h"

/**
 * Open bytes the way EditorSession::openBytes does (validate, then adopt),
 * minus the worker thread. Shared by the suites that build a Workspace directly.
 */
inline OperationResult openDocument(Workspace& ws, const QByteArray& bytes, const QString& name,
                                    int* sessionId = nullptr)
{
    DocumentInfo info;
    const OperationResult result = ws.validate(bytes, name, info);
    if (result.success) {
        DocumentSession* session = ws.adopt(DocumentSnapshot::create(bytes), info, name);
        if (sessionId) {
            *sessionId = session->id();
        }
    }
    return result;
}

#endif // WORKSPACETESTSUPPORT_H
