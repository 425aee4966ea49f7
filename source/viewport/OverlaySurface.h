#pragma once

// ============================================================================
// OverlaySurface - Transparent per-page layer that tools listen on
// ============================================================================
// Every rendered page carries three overlays stacked above its raster:
// annotation, redaction and text-edit. An overlay is tagged with its page
// number, so a listener receives events that already know which page they
// belong to.
//
// Listeners are registered with a token and must be removed with the same
// token. Tool handlers own their tokens and release all of them on exit.
// The surface holds no widget; PageWidget forwards input into dispatch().
// ============================================================================

#include <QMap>
#include <QObject>
#include <QPointF>

#include <functional>

enum class OverlayKind {
    Annotation,
    Redaction,
    TextEdit
};

struct PointerEvent {
    enum Type {
        Press,
        Move,
        Release,
        DoubleClick
    };

    Type type = Press;
    int page = 0;                           ///< Filled in by the surface
    QPointF pos;                            ///< Screen space, relative to the page's top-left
    Qt::MouseButton button = Qt::LeftButton;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

/// Returns true if the event was consumed.
using PointerListener = std::function<bool(const PointerEvent&)>;

class OverlaySurface : public QObject {
    Q_OBJECT

public:
    OverlaySurface(OverlayKind kind, int page, QObject* parent = nullptr);

    OverlayKind kind() const { return m_kind; }
    int page() const { return m_page; }

    /// @return Token for removeListener().
    int addListener(PointerListener listener);
    bool removeListener(int token);
    int listenerCount() const { return m_listeners.size(); }

    /**
     * @brief Deliver an event to the listeners in registration order.
     * @return true if a listener consumed it.
     */
    bool dispatch(PointerEvent event);

    Qt::CursorShape cursorShape() const { return m_cursor; }
    void setCursorShape(Qt::CursorShape shape);

    /// Ask the widget showing this overlay to repaint.
    void requestRepaint() { emit repaintRequested(); }

signals:
    void cursorChanged(Qt::CursorShape shape);
    void repaintRequested();

private:
    OverlayKind m_kind;
    int m_page;
    QMap<int, PointerListener> m_listeners;
    int m_nextToken = 1;
    Qt::CursorShape m_cursor = Qt::ArrowCursor;
};
