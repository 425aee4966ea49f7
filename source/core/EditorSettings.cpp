#include "EditorSettings.h"

#include <QFileInfo>

namespace {
const QString KEY_UNDO_LIMIT = QStringLiteral("Editor/undoLimit");
const QString KEY_THUMBNAIL_WIDTH = QStringLiteral("Editor/thumbnailWidth");
const QString KEY_ZOOM_STEP = QStringLiteral("Editor/zoomStep");
const QString KEY_SCROLL_COOLDOWN = QStringLiteral("Editor/scrollCooldownMs");
const QString KEY_REDACT_COLOR = QStringLiteral("Tools/redactColor");
const QString KEY_DRAW_COLOR = QStringLiteral("Tools/drawColor");
const QString KEY_DRAW_WIDTH = QStringLiteral("Tools/drawWidth");
const QString KEY_STICKY_COLOR = QStringLiteral("Tools/stickyNoteColor");
const QString KEY_RECENT = QStringLiteral("RecentDocuments");
const QString KEY_LAST_DIR = QStringLiteral("lastDirectory");
}

EditorSettings::EditorSettings()
    : m_settings(QStringLiteral("PdfDesk"), QStringLiteral("PdfDesk"))
{
}

int EditorSettings::undoLimit() const
{
    return qMax(1, m_settings.value(KEY_UNDO_LIMIT, DEFAULT_UNDO_LIMIT).toInt());
}

void EditorSettings::setUndoLimit(int limit)
{
    m_settings.setValue(KEY_UNDO_LIMIT, limit);
}

int EditorSettings::thumbnailWidth() const
{
    return m_settings.value(KEY_THUMBNAIL_WIDTH, DEFAULT_THUMBNAIL_WIDTH).toInt();
}

double EditorSettings::zoomStep() const
{
    return m_settings.value(KEY_ZOOM_STEP, DEFAULT_ZOOM_STEP).toDouble();
}

int EditorSettings::scrollCooldownMs() const
{
    return m_settings.value(KEY_SCROLL_COOLDOWN, DEFAULT_SCROLL_COOLDOWN_MS).toInt();
}

QColor EditorSettings::redactColor() const
{
    return m_settings.value(KEY_REDACT_COLOR, QColor(Qt::black)).value<QColor>();
}

void EditorSettings::setRedactColor(const QColor& color)
{
    m_settings.setValue(KEY_REDACT_COLOR, color);
}

QColor EditorSettings::drawColor() const
{
    return m_settings.value(KEY_DRAW_COLOR, QColor(0xFF, 0x00, 0x00)).value<QColor>();
}

qreal EditorSettings::drawWidth() const
{
    return m_settings.value(KEY_DRAW_WIDTH, 2.0).toDouble();
}

QColor EditorSettings::stickyNoteColor() const
{
    return m_settings.value(KEY_STICKY_COLOR, QColor::fromRgbF(0.6f, 0.3f, 0.0f)).value<QColor>();
}

QStringList EditorSettings::recentDocuments()
{
    const QStringList stored = m_settings.value(KEY_RECENT).toStringList();
    QStringList valid;
    for (const QString& path : stored) {
        if (QFileInfo::exists(path)) {
            valid.append(path);
        }
    }
    if (valid.size() != stored.size()) {
        m_settings.setValue(KEY_RECENT, valid);
    }
    return valid;
}

void EditorSettings::addRecentDocument(const QString& path)
{
    if (path.isEmpty()) {
        return;
    }

    QStringList paths = m_settings.value(KEY_RECENT).toStringList();
    paths.removeAll(path);
    paths.prepend(path);
    while (paths.size() > MAX_RECENT) {
        paths.removeLast();
    }
    m_settings.setValue(KEY_RECENT, paths);
}

void EditorSettings::clearRecentDocuments()
{
    m_settings.remove(KEY_RECENT);
}

QString EditorSettings::lastDirectory() const
{
    return m_settings.value(KEY_LAST_DIR).toString();
}

void EditorSettings::setLastDirectory(const QString& dir)
{
    m_settings.setValue(KEY_LAST_DIR, dir);
}
