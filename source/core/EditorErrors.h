#pragma once

// ============================================================================
// EditorErrors - Result type shared by workspace and editor operations
// ============================================================================

#include <QString>

enum class ErrorKind {
    None,
    LoadError,          ///< Malformed or unreadable input, workspace unchanged
    EngineError,        ///< Document engine failed, previous snapshot kept
    RenderCancelled,    ///< Superseded render, never shown to the user
    ValidationError     ///< Rejected before any engine call
};

inline const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:            return "None";
        case ErrorKind::LoadError:       return "LoadError";
        case ErrorKind::EngineError:     return "EngineError";
        case ErrorKind::RenderCancelled: return "RenderCancelled";
        case ErrorKind::ValidationError: return "ValidationError";
    }
    return "Unknown";
}

/**
 * @brief Outcome of an editor operation.
 *
 * Asynchronous operations return a result with success == true when the job
 * was accepted; the final outcome is announced by EditorSession::operationFinished.
 */
struct OperationResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString message;

    static OperationResult ok(const QString& message = QString())
    {
        OperationResult r;
        r.success = true;
        r.message = message;
        return r;
    }

    static OperationResult failure(ErrorKind error, const QString& message)
    {
        OperationResult r;
        r.error = error;
        r.message = message;
        return r;
    }
};
