#pragma once

// ============================================================================
// ToolHandler - Base class for one tool mode's pointer behaviour
// ============================================================================
// A handler owns every listener it registers. attach() registers one
// listener per overlay of the handler's layer and records the token;
// detach() removes all of them, restores the cursors and drops transient
// state (drag rectangles, half-drawn paths). attach/detach are the enter
// and exit actions of the ToolModeController state machine.
// ============================================================================

#include "../core/ToolMode.h"
#include "../viewport/MarkPainter.h"
#include "../viewport/OverlaySurface.h"

#include <QObject>
#include <QPointer>
#include <QVector>

class DocumentSession;

class ToolHandler : public QObject {
    Q_OBJECT

public:
    ToolHandler(ToolMode mode, OverlayKind layer, QObject* parent = nullptr);
    ~ToolHandler() override;

    ToolMode mode() const { return m_mode; }
    OverlayKind layer() const { return m_layer; }

    /**
     * @brief Start listening on the given overlays.
     *
     * Detaches first if already attached.
     */
    void attach(const QVector<OverlaySurface*>& overlays, DocumentSession* session);

    /**
     * @brief Remove every listener this handler registered.
     */
    void detach();

    bool isAttached() const { return !m_registrations.isEmpty(); }
    int registrationCount() const { return m_registrations.size(); }

    virtual QString bannerText() const = 0;
    virtual Qt::CursorShape cursor() const { return Qt::CrossCursor; }

    /// In-progress visuals for a page (drag rectangle, path being drawn).
    virtual QVector<MarkPrimitive> previewPrimitives(int page) const;

signals:
    void previewChanged(int page);

    /// Open (markId > 0) or close (0) the inline editor for a mark.
    void inlineEditorRequested(int markId);

protected:
    /**
     * @brief Handle one event on an overlay of this handler's layer.
     * @return true if consumed.
     */
    virtual bool handlePointer(const PointerEvent& event) = 0;

    /// Drop drag and preview state. Called on detach.
    virtual void resetTransientState() {}

    DocumentSession* session() const { return m_session.data(); }

    /// Add a mark and record it on the session's undo stack.
    int placeMark(const Mark& mark);

private:
    struct Registration {
        QPointer<OverlaySurface> overlay;
        int token = 0;
    };

    ToolMode m_mode;
    OverlayKind m_layer;
    QPointer<DocumentSession> m_session;
    QVector<Registration> m_registrations;
};
