#pragma once

// ============================================================================
// EditorSettings - Typed access to persisted preferences
// ============================================================================
// Thin QSettings wrapper. Every getter has a default so a fresh install
// behaves the same as one with an empty settings file.
// ============================================================================

#include <QColor>
#include <QSettings>
#include <QStringList>

class EditorSettings {
public:
    static constexpr int DEFAULT_UNDO_LIMIT = 50;
    static constexpr int DEFAULT_THUMBNAIL_WIDTH = 100;
    static constexpr double DEFAULT_ZOOM_STEP = 0.25;
    static constexpr int DEFAULT_SCROLL_COOLDOWN_MS = 500;
    static constexpr int MAX_RECENT = 20;

    EditorSettings();

    int undoLimit() const;
    void setUndoLimit(int limit);

    int thumbnailWidth() const;
    double zoomStep() const;
    int scrollCooldownMs() const;

    QColor redactColor() const;
    void setRedactColor(const QColor& color);

    QColor drawColor() const;
    qreal drawWidth() const;
    QColor stickyNoteColor() const;

    /**
     * @brief Recently opened files, most recent first.
     *
     * Entries whose file no longer exists are dropped (and the pruned list
     * written back).
     */
    QStringList recentDocuments();
    void addRecentDocument(const QString& path);
    void clearRecentDocuments();

    QString lastDirectory() const;
    void setLastDirectory(const QString& dir);

private:
    QSettings m_settings;
};
