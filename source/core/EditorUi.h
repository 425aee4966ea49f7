#pragma once

// ============================================================================
// EditorUi - Chrome the editor core talks to
// ============================================================================
// Dialogs, confirmations, status text and toolbar enablement are owned by
// the window. The core only calls through this interface, so tests can
// record the calls instead of showing widgets.
// ============================================================================

#include <QString>
#include <QStringList>

class EditorUi {
public:
    enum class MessageLevel {
        Info,
        Warning,
        Error
    };

    virtual ~EditorUi() = default;

    virtual void showMessage(const QString& title, const QString& text, MessageLevel level) = 0;

    /// @return true if the user accepted.
    virtual bool confirm(const QString& title, const QString& text) = 0;

    virtual void setStatus(const QString& text) = 0;

    virtual void setControlsEnabled(const QStringList& ids, bool enabled) = 0;

    /// Spinner / wait cursor while an engine job runs.
    virtual void setBusy(bool busy) = 0;
};
