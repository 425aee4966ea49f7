#ifndef MAINWINDOW_H
#define MAINWINDOW_H

// ============================================================================
// MainWindow - Top-level window of PdfDesk
// ============================================================================
// Chrome only: toolbar, menus, tab bar, page strip, page column, mode banner
// and status bar. Every command is forwarded to the EditorSession, which
// reports back through the EditorUi interface implemented here.
// ============================================================================

#include "core/EditorUi.h"
#include "core/ToolMode.h"

#include <QHash>
#include <QMainWindow>
#include <QMap>

class DocumentSession;
class EditorSession;
class PageCanvasView;
class PageThumbnailDelegate;
class PageThumbnailModel;
class QAction;
class QListView;
class QMenu;
class QTabBar;
class RedactApplyBar;
class ToolModeBanner;

class MainWindow : public QMainWindow, public EditorUi
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    EditorSession* editor() const { return m_editor; }

    /// Open a file given on the command line or dropped on the window.
    void openFile(const QString& path);

    // ===== EditorUi =====
    void showMessage(const QString& title, const QString& text, MessageLevel level) override;
    bool confirm(const QString& title, const QString& text) override;
    void setStatus(const QString& text) override;
    void setControlsEnabled(const QStringList& ids, bool enabled) override;
    void setBusy(bool busy) override;

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private:
    void setupActions();
    void setupMenus();
    void setupToolbar();
    void setupCentralArea();
    void setupPagePanel();
    void connectEditor();

    /// Create a window action, registered under its control id.
    QAction* addAction(const QString& id, const QString& text,
                       const QKeySequence& shortcut = QKeySequence());
    QAction* modeAction(ToolMode mode) const;

    void showOpenDialog();
    void saveDocument();
    void saveDocumentAs();
    void rebuildRecentMenu();

    void showCropDialog();
    void showPageNumberDialog();
    void showStampDialog();
    void showFormDialog();
    void showSearchRedactDialog();
    void showPageContextMenu(const QPoint& pos);
    void applyForMode();

    void onSessionOpened(DocumentSession* session);
    void onSessionClosed(int sessionId);
    void onActiveSessionChanged(DocumentSession* session);
    void onModeChanged(ToolMode mode);
    void updateWindowTitle();
    int tabIndexOf(int sessionId) const;

    EditorSession* m_editor = nullptr;

    QTabBar* m_tabBar = nullptr;
    PageCanvasView* m_canvas = nullptr;
    ToolModeBanner* m_banner = nullptr;
    RedactApplyBar* m_redactBar = nullptr;
    QListView* m_pageList = nullptr;
    PageThumbnailModel* m_thumbnailModel = nullptr;
    PageThumbnailDelegate* m_thumbnailDelegate = nullptr;
    QMenu* m_recentMenu = nullptr;

    QHash<QString, QAction*> m_actions;        ///< Control id -> action
    QMap<ToolMode, QAction*> m_modeActions;
    bool m_syncingTabs = false;
    bool m_busy = false;
};

#endif // MAINWINDOW_H
