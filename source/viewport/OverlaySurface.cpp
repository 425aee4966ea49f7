#include "OverlaySurface.h"

OverlaySurface::OverlaySurface(OverlayKind kind, int page, QObject* parent)
    : QObject(parent)
    , m_kind(kind)
    , m_page(page)
{
}

int OverlaySurface::addListener(PointerListener listener)
{
    const int token = m_nextToken++;
    m_listeners.insert(token, std::move(listener));
    return token;
}

bool OverlaySurface::removeListener(int token)
{
    return m_listeners.remove(token) > 0;
}

bool OverlaySurface::dispatch(PointerEvent event)
{
    event.page = m_page;

    // Copy so a listener may unregister itself while handling the event
    const QMap<int, PointerListener> listeners = m_listeners;
    for (auto it = listeners.constBegin(); it != listeners.constEnd(); ++it) {
        if (it.value() && it.value()(event)) {
            return true;
        }
    }
    return false;
}

void OverlaySurface::setCursorShape(Qt::CursorShape shape)
{
    if (m_cursor == shape) {
        return;
    }
    m_cursor = shape;
    emit cursorChanged(shape);
}
