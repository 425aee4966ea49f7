#include "MainWindow.h"

#include "core/DocumentSession.h"
#include "core/EditorSession.h"
#include "core/Workspace.h"
#include "pdf/PdfEngine.h"
#include "pdf/PdfProvider.h"
#include "tools/ToolModeController.h"
#include "ui/PageThumbnailDelegate.h"
#include "ui/PageThumbnailModel.h"
#include "ui/banners/RedactApplyBar.h"
#include "ui/banners/ToolModeBanner.h"
#include "ui/dialogs/CropDialog.h"
#include "ui/dialogs/FormFillDialog.h"
#include "ui/dialogs/PageNumberDialog.h"
#include "ui/dialogs/StampDialog.h"
#include "viewport/PageCanvasView.h"
#include "viewport/PageRenderPipeline.h"

#include <QAction>
#include <QApplication>
#include <QDebug>
#include <QDockWidget>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLineEdit>
#include <QListView>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QPushButton>
#include <QStatusBar>
#include <QTabBar>
#include <QToolBar>
#include <QVBoxLayout>

namespace {

const QString PDF_FILTER = QStringLiteral("PDF documents (*.pdf);;All files (*)");

} // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("PdfDesk"));
    resize(1200, 860);
    setAcceptDrops(true);

    m_editor = new EditorSession(PdfEngine::create(), &PdfProvider::create, this, this);

    setupActions();
    setupMenus();
    setupToolbar();
    setupCentralArea();
    setupPagePanel();
    connectEditor();

    // Nothing is open yet
    QStringList ids = EditorSession::DOCUMENT_CONTROLS;
    ids << QStringLiteral("tb-undo") << QStringLiteral("tb-redo");
    setControlsEnabled(ids, false);
    setStatus(tr("No document open."));
}

MainWindow::~MainWindow()
{
    // The editor calls back into EditorUi while it shuts down
    delete m_editor;
    m_editor = nullptr;
}

// ============================================================================
// Actions
// ============================================================================

QAction* MainWindow::addAction(const QString& id, const QString& text, const QKeySequence& shortcut)
{
    QAction* action = new QAction(text, this);
    action->setObjectName(id);
    if (!shortcut.isEmpty()) {
        action->setShortcut(shortcut);
    }
    QMainWindow::addAction(action);
    m_actions.insert(id, action);
    return action;
}

QAction* MainWindow::modeAction(ToolMode mode) const
{
    return m_modeActions.value(mode, nullptr);
}

void MainWindow::setupActions()
{
    connect(addAction("tb-open", tr("&Open..."), QKeySequence::Open),
            &QAction::triggered, this, &MainWindow::showOpenDialog);
    connect(addAction("tb-save", tr("&Save"), QKeySequence::Save),
            &QAction::triggered, this, &MainWindow::saveDocument);
    connect(addAction("tb-saveas", tr("Save &As..."), QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_S)),
            &QAction::triggered, this, &MainWindow::saveDocumentAs);
    // Printing is handed to the system viewer through a saved file
    connect(addAction("tb-print", tr("&Print..."), QKeySequence::Print),
            &QAction::triggered, this, &MainWindow::saveDocumentAs);
    connect(addAction("tb-close", tr("&Close"), QKeySequence::Close),
            &QAction::triggered, this, [this]() {
        if (DocumentSession* session = m_editor->activeSession()) {
            m_editor->closeSession(session->id());
        }
    });

    connect(addAction("tb-undo", tr("&Undo"), QKeySequence(Qt::CTRL | Qt::Key_Z)),
            &QAction::triggered, m_editor, &EditorSession::undo);
    connect(addAction("tb-redo", tr("&Redo"), QKeySequence(Qt::CTRL | Qt::Key_Y)),
            &QAction::triggered, m_editor, &EditorSession::redo);
    connect(addAction("tb-selectall", tr("Select &All Pages"), QKeySequence(Qt::CTRL | Qt::Key_A)),
            &QAction::triggered, m_editor, &EditorSession::selectAllPages);
    connect(addAction("tb-delete", tr("&Delete Pages"), QKeySequence::Delete),
            &QAction::triggered, m_editor, &EditorSession::deletePages);

    connect(addAction("tb-zoomin", tr("Zoom &In"), QKeySequence(Qt::CTRL | Qt::Key_Plus)),
            &QAction::triggered, m_editor, &EditorSession::zoomIn);
    m_actions.value("tb-zoomin")->setShortcuts({QKeySequence(Qt::CTRL | Qt::Key_Plus),
                                               QKeySequence(Qt::CTRL | Qt::Key_Equal)});
    connect(addAction("tb-zoomout", tr("Zoom &Out"), QKeySequence(Qt::CTRL | Qt::Key_Minus)),
            &QAction::triggered, m_editor, &EditorSession::zoomOut);
    connect(addAction("tb-fitpage", tr("&Fit Page"), QKeySequence(Qt::CTRL | Qt::Key_0)),
            &QAction::triggered, this, [this]() {
        m_editor->fitPage(m_canvas->viewport()->size());
    });

    // Navigation
    connect(addAction("nav-next", tr("Next Page")), &QAction::triggered, m_editor, &EditorSession::nextPage);
    m_actions.value("nav-next")->setShortcuts({QKeySequence(Qt::Key_Right), QKeySequence(Qt::Key_Down),
                                              QKeySequence(Qt::Key_PageDown)});
    connect(addAction("nav-prev", tr("Previous Page")), &QAction::triggered, m_editor, &EditorSession::prevPage);
    m_actions.value("nav-prev")->setShortcuts({QKeySequence(Qt::Key_Left), QKeySequence(Qt::Key_Up),
                                              QKeySequence(Qt::Key_PageUp)});
    connect(addAction("nav-first", tr("First Page"), QKeySequence(Qt::Key_Home)),
            &QAction::triggered, m_editor, &EditorSession::firstPage);
    connect(addAction("nav-last", tr("Last Page"), QKeySequence(Qt::Key_End)),
            &QAction::triggered, m_editor, &EditorSession::lastPage);
    connect(addAction("nav-escape", tr("Exit Mode"), QKeySequence(Qt::Key_Escape)),
            &QAction::triggered, m_editor, &EditorSession::handleEscape);

    // Pages
    connect(addAction("page-rotate-left", tr("Rotate &Left")), &QAction::triggered,
            this, [this]() { m_editor->rotatePages(-90); });
    connect(addAction("page-rotate-right", tr("Rotate &Right")), &QAction::triggered,
            this, [this]() { m_editor->rotatePages(90); });
    connect(addAction("page-move-up", tr("Move Page &Up")), &QAction::triggered,
            m_editor, &EditorSession::movePageUp);
    connect(addAction("page-move-down", tr("Move Page &Down")), &QAction::triggered,
            m_editor, &EditorSession::movePageDown);
    connect(addAction("page-insert-blank", tr("Insert &Blank Page")), &QAction::triggered,
            m_editor, &EditorSession::insertBlankPage);
    connect(addAction("page-crop", tr("&Crop...")), &QAction::triggered,
            this, &MainWindow::showCropDialog);
    connect(addAction("page-numbers", tr("Add Page &Numbers...")), &QAction::triggered,
            this, &MainWindow::showPageNumberDialog);
    connect(addAction("page-stamp", tr("Add &Stamp...")), &QAction::triggered,
            this, &MainWindow::showStampDialog);
    connect(addAction("tb-merge", tr("&Merge Open Documents")), &QAction::triggered,
            m_editor, &EditorSession::mergeDocuments);
    connect(addAction("tb-extract", tr("E&xtract Selected Pages")), &QAction::triggered,
            m_editor, &EditorSession::extractPages);

    // Forms
    connect(addAction("form-fill", tr("&Fill Form...")), &QAction::triggered,
            this, &MainWindow::showFormDialog);
    connect(addAction("form-flatten", tr("F&latten Form")), &QAction::triggered,
            m_editor, &EditorSession::flattenForm);

    // Tool modes
    const QList<QPair<ToolMode, QString>> modes = {
        {ToolMode::TextEdit, tr("&Edit Text")},
        {ToolMode::Redact, tr("&Redact")},
        {ToolMode::Highlight, tr("&Highlight")},
        {ToolMode::Underline, tr("&Underline")},
        {ToolMode::Sticky, tr("&Sticky Note")},
        {ToolMode::Draw, tr("&Draw")},
        {ToolMode::AddField, tr("Add &Field")}
    };
    for (const auto& entry : modes) {
        const QString id = entry.first == ToolMode::TextEdit
            ? QStringLiteral("tb-editmode")
            : QStringLiteral("mode-") + toolModeName(entry.first).section(':', -1);
        QAction* action = addAction(id, entry.second);
        action->setCheckable(true);
        const ToolMode mode = entry.first;
        connect(action, &QAction::triggered, this, [this, mode]() {
            onModeChanged(m_editor->toggleToolMode(mode));
        });
        m_modeActions.insert(mode, action);
    }
    modeAction(ToolMode::TextEdit)->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_actions.value("tb-open"));
    m_recentMenu = fileMenu->addMenu(tr("Open &Recent"));
    connect(m_recentMenu, &QMenu::aboutToShow, this, &MainWindow::rebuildRecentMenu);
    fileMenu->addAction(m_actions.value("tb-save"));
    fileMenu->addAction(m_actions.value("tb-saveas"));
    fileMenu->addAction(m_actions.value("tb-print"));
    fileMenu->addSeparator();
    fileMenu->addAction(m_actions.value("tb-close"));
    QAction* quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(m_actions.value("tb-undo"));
    editMenu->addAction(m_actions.value("tb-redo"));
    editMenu->addSeparator();
    editMenu->addAction(m_actions.value("tb-selectall"));
    editMenu->addAction(m_actions.value("tb-delete"));

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    viewMenu->addAction(m_actions.value("tb-zoomin"));
    viewMenu->addAction(m_actions.value("tb-zoomout"));
    viewMenu->addAction(m_actions.value("tb-fitpage"));
    viewMenu->addSeparator();
    viewMenu->addAction(m_actions.value("nav-first"));
    viewMenu->addAction(m_actions.value("nav-prev"));
    viewMenu->addAction(m_actions.value("nav-next"));
    viewMenu->addAction(m_actions.value("nav-last"));

    QMenu* pagesMenu = menuBar()->addMenu(tr("&Pages"));
    for (const char* id : {"page-rotate-left", "page-rotate-right", "page-move-up", "page-move-down",
                           "page-insert-blank", "page-crop", "page-numbers", "page-stamp"}) {
        pagesMenu->addAction(m_actions.value(QString::fromLatin1(id)));
    }
    pagesMenu->addSeparator();
    pagesMenu->addAction(m_actions.value("tb-extract"));
    pagesMenu->addAction(m_actions.value("tb-merge"));

    QMenu* toolsMenu = menuBar()->addMenu(tr("&Tools"));
    for (QAction* action : m_modeActions) {
        toolsMenu->addAction(action);
    }

    QMenu* formMenu = menuBar()->addMenu(tr("F&orms"));
    formMenu->addAction(m_actions.value("form-fill"));
    formMenu->addAction(m_actions.value("form-flatten"));
    formMenu->addAction(modeAction(ToolMode::AddField));
}

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName(QStringLiteral("mainToolbar"));
    toolbar->setMovable(false);

    for (const char* id : {"tb-open", "tb-save", "tb-print"}) {
        toolbar->addAction(m_actions.value(QString::fromLatin1(id)));
    }
    toolbar->addSeparator();
    toolbar->addAction(m_actions.value("tb-undo"));
    toolbar->addAction(m_actions.value("tb-redo"));
    toolbar->addSeparator();
    toolbar->addAction(m_actions.value("tb-zoomout"));
    toolbar->addAction(m_actions.value("tb-zoomin"));
    toolbar->addAction(m_actions.value("tb-fitpage"));
    toolbar->addSeparator();
    for (ToolMode mode : {ToolMode::TextEdit, ToolMode::Redact, ToolMode::Highlight,
                          ToolMode::Underline, ToolMode::Sticky, ToolMode::Draw}) {
        toolbar->addAction(modeAction(mode));
    }
    toolbar->addSeparator();
    toolbar->addAction(m_actions.value("tb-merge"));
    toolbar->addAction(m_actions.value("tb-extract"));
}

void MainWindow::setupCentralArea()
{
    QWidget* central = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_tabBar = new QTabBar(central);
    m_tabBar->setObjectName(QStringLiteral("documentTabs"));
    m_tabBar->setTabsClosable(true);
    m_tabBar->setMovable(false);
    m_tabBar->setExpanding(false);
    m_tabBar->setDocumentMode(true);
    layout->addWidget(m_tabBar);

    m_banner = new ToolModeBanner(central);
    layout->addWidget(m_banner);

    m_canvas = new PageCanvasView(m_editor->pipeline(), m_editor->tools(), central);
    layout->addWidget(m_canvas, 1);

    m_redactBar = new RedactApplyBar(central);
    layout->addWidget(m_redactBar);

    setCentralWidget(central);
}

void MainWindow::setupPagePanel()
{
    QDockWidget* dock = new QDockWidget(tr("Pages"), this);
    dock->setObjectName(QStringLiteral("pagePanel"));
    dock->setFeatures(QDockWidget::NoDockWidgetFeatures);

    QWidget* panel = new QWidget(dock);
    QVBoxLayout* layout = new QVBoxLayout(panel);
    layout->setContentsMargins(4, 4, 4, 4);

    m_thumbnailModel = new PageThumbnailModel(this);
    m_thumbnailDelegate = new PageThumbnailDelegate(this);
    m_thumbnailDelegate->setThumbnailWidth(m_editor->settings().thumbnailWidth());

    m_pageList = new QListView(panel);
    m_pageList->setObjectName(QStringLiteral("pageList"));
    m_pageList->setModel(m_thumbnailModel);
    m_pageList->setItemDelegate(m_thumbnailDelegate);
    m_pageList->setSelectionMode(QAbstractItemView::NoSelection);
    m_pageList->setDragEnabled(true);
    m_pageList->setAcceptDrops(true);
    m_pageList->setDropIndicatorShown(true);
    m_pageList->setDragDropMode(QAbstractItemView::InternalMove);
    m_pageList->setDefaultDropAction(Qt::MoveAction);
    m_pageList->setContextMenuPolicy(Qt::CustomContextMenu);
    m_pageList->setMinimumWidth(m_thumbnailDelegate->thumbnailWidth() + 40);
    layout->addWidget(m_pageList, 1);

    // Side buttons share the toolbar ids' enablement
    const QList<QPair<QString, QString>> sideButtons = {
        {QStringLiteral("side-merge"), tr("Merge")},
        {QStringLiteral("side-extract"), tr("Extract")},
        {QStringLiteral("side-edit"), tr("Edit Text")},
        {QStringLiteral("side-print"), tr("Print")},
        {QStringLiteral("side-save"), tr("Save")}
    };
    const QHash<QString, QString> targets = {
        {QStringLiteral("side-merge"), QStringLiteral("tb-merge")},
        {QStringLiteral("side-extract"), QStringLiteral("tb-extract")},
        {QStringLiteral("side-edit"), QStringLiteral("tb-editmode")},
        {QStringLiteral("side-print"), QStringLiteral("tb-print")},
        {QStringLiteral("side-save"), QStringLiteral("tb-save")}
    };
    for (const auto& entry : sideButtons) {
        QPushButton* button = new QPushButton(entry.second, panel);
        button->setObjectName(entry.first);
        QAction* target = m_actions.value(targets.value(entry.first));
        connect(button, &QPushButton::clicked, target, &QAction::trigger);
        layout->addWidget(button);
    }

    dock->setWidget(panel);
    addDockWidget(Qt::LeftDockWidgetArea, dock);

    connect(m_pageList, &QListView::clicked, this, [this](const QModelIndex& index) {
        m_editor->pageClicked(index.row() + 1, QApplication::keyboardModifiers());
    });
    connect(m_pageList, &QListView::customContextMenuRequested,
            this, &MainWindow::showPageContextMenu);
    connect(m_thumbnailModel, &PageThumbnailModel::pageDropped, m_editor, &EditorSession::reorderPage);
}

// ============================================================================
// Editor wiring
// ============================================================================

void MainWindow::connectEditor()
{
    Workspace* workspace = m_editor->workspace();
    connect(workspace, &Workspace::sessionOpened, this, &MainWindow::onSessionOpened);
    connect(workspace, &Workspace::sessionClosed, this, &MainWindow::onSessionClosed);
    connect(workspace, &Workspace::activeSessionChanged, this, &MainWindow::onActiveSessionChanged);

    connect(m_tabBar, &QTabBar::currentChanged, this, [this](int index) {
        if (m_syncingTabs || index < 0) {
            return;
        }
        m_editor->switchTo(m_tabBar->tabData(index).toInt());
    });
    connect(m_tabBar, &QTabBar::tabCloseRequested, this, [this](int index) {
        m_editor->closeSession(m_tabBar->tabData(index).toInt());
    });

    ToolModeController* tools = m_editor->tools();
    connect(tools, &ToolModeController::modeChanged, this, [this](ToolMode mode, ToolMode) {
        onModeChanged(mode);
    });
    connect(tools, &ToolModeController::bannerChanged, this, [this](const QString& text) {
        m_banner->setMode(m_editor->tools()->mode(), text);
    });

    connect(m_banner, &ToolModeBanner::applyClicked, this, &MainWindow::applyForMode);
    connect(m_banner, &ToolModeBanner::searchClicked, this, &MainWindow::showSearchRedactDialog);
    connect(m_banner, &ToolModeBanner::exitClicked, this, [this]() {
        m_editor->tools()->exit();
    });
    connect(m_banner, &ToolModeBanner::redactColorChanged, m_editor, &EditorSession::setRedactColor);
    connect(m_redactBar, &RedactApplyBar::applyClicked, m_editor, &EditorSession::applyRedactions);
    connect(m_redactBar, &RedactApplyBar::clearClicked, m_editor, &EditorSession::clearRedactions);
    connect(m_editor, &EditorSession::redactionCountChanged, m_redactBar, &RedactApplyBar::setRedactionCount);

    connect(m_editor, &EditorSession::operationFinished, this,
            [this](const QString& operation, const OperationResult& result) {
        if (operation == QLatin1String("save") && result.success) {
            updateWindowTitle();
        }
    });
}

void MainWindow::onSessionOpened(DocumentSession* session)
{
    m_syncingTabs = true;
    const int index = m_tabBar->addTab(session->name());
    m_tabBar->setTabData(index, session->id());
    m_tabBar->setTabToolTip(index, session->filePath());
    m_syncingTabs = false;
}

void MainWindow::onSessionClosed(int sessionId)
{
    const int index = tabIndexOf(sessionId);
    if (index >= 0) {
        m_syncingTabs = true;
        m_tabBar->removeTab(index);
        m_syncingTabs = false;
    }
}

void MainWindow::onActiveSessionChanged(DocumentSession* session)
{
    m_thumbnailModel->setSession(session);

    m_syncingTabs = true;
    m_tabBar->setCurrentIndex(session ? tabIndexOf(session->id()) : -1);
    m_syncingTabs = false;

    updateWindowTitle();
}

void MainWindow::onModeChanged(ToolMode mode)
{
    for (auto it = m_modeActions.constBegin(); it != m_modeActions.constEnd(); ++it) {
        it.value()->setChecked(it.key() == mode);
    }
}

void MainWindow::updateWindowTitle()
{
    DocumentSession* session = m_editor->activeSession();
    if (!session) {
        setWindowTitle(tr("PdfDesk"));
        return;
    }
    const int index = tabIndexOf(session->id());
    if (index >= 0) {
        m_tabBar->setTabText(index, session->name());
        m_tabBar->setTabToolTip(index, session->filePath());
    }
    setWindowTitle(tr("%1 - PdfDesk").arg(session->name()));
}

int MainWindow::tabIndexOf(int sessionId) const
{
    for (int i = 0; i < m_tabBar->count(); ++i) {
        if (m_tabBar->tabData(i).toInt() == sessionId) {
            return i;
        }
    }
    return -1;
}

// ============================================================================
// File commands
// ============================================================================

void MainWindow::openFile(const QString& path)
{
    m_editor->openFile(path);
}

void MainWindow::showOpenDialog()
{
    const QStringList paths = QFileDialog::getOpenFileNames(
        this, tr("Open PDF"), m_editor->settings().lastDirectory(), PDF_FILTER);
    for (const QString& path : paths) {
        openFile(path);
    }
}

void MainWindow::saveDocument()
{
    DocumentSession* session = m_editor->activeSession();
    if (!session) {
        return;
    }
    if (session->filePath().isEmpty()) {
        saveDocumentAs();
        return;
    }
    m_editor->saveActive();
}

void MainWindow::saveDocumentAs()
{
    DocumentSession* session = m_editor->activeSession();
    if (!session) {
        return;
    }

    QString suggested = session->filePath();
    if (suggested.isEmpty()) {
        suggested = m_editor->settings().lastDirectory() + QLatin1Char('/') + session->name();
    }
    QString path = QFileDialog::getSaveFileName(this, tr("Save PDF"), suggested, PDF_FILTER);
    if (path.isEmpty()) {
        return;
    }
    if (!path.endsWith(QLatin1String(".pdf"), Qt::CaseInsensitive)) {
        path += QStringLiteral(".pdf");
    }
    m_editor->settings().setLastDirectory(QFileInfo(path).absolutePath());
    m_editor->saveActive(path);
}

void MainWindow::rebuildRecentMenu()
{
    m_recentMenu->clear();
    const QStringList recent = m_editor->settings().recentDocuments();
    for (const QString& path : recent) {
        QAction* action = m_recentMenu->addAction(QFileInfo(path).fileName());
        action->setToolTip(path);
        connect(action, &QAction::triggered, this, [this, path]() { openFile(path); });
    }
    if (recent.isEmpty()) {
        m_recentMenu->addAction(tr("(empty)"))->setEnabled(false);
        return;
    }
    m_recentMenu->addSeparator();
    m_recentMenu->addAction(tr("Clear List"), this, [this]() {
        m_editor->settings().clearRecentDocuments();
    });
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event)
{
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void MainWindow::dropEvent(QDropEvent* event)
{
    for (const QUrl& url : event->mimeData()->urls()) {
        if (url.isLocalFile()) {
            openFile(url.toLocalFile());
        }
    }
    event->acceptProposedAction();
}

// ============================================================================
// Dialog commands
// ============================================================================

void MainWindow::showCropDialog()
{
    DocumentSession* session = m_editor->activeSession();
    if (!session) {
        return;
    }
    CropDialog dialog(session->pageSize(session->currentPage()), this);
    if (dialog.exec() == QDialog::Accepted) {
        m_editor->cropPages(dialog.cropBox());
    }
}

void MainWindow::showPageNumberDialog()
{
    if (!m_editor->activeSession()) {
        return;
    }
    PageNumberDialog dialog(this);
    if (dialog.exec() == QDialog::Accepted) {
        m_editor->addPageNumbers(dialog.options());
    }
}

void MainWindow::showStampDialog()
{
    if (!m_editor->activeSession()) {
        return;
    }
    StampDialog dialog(this);
    if (dialog.exec() == QDialog::Accepted) {
        m_editor->addStamp(dialog.stampText(), dialog.stampColor(), dialog.allPages());
    }
}

void MainWindow::showFormDialog()
{
    if (!m_editor->activeSession()) {
        return;
    }
    const QVector<PdfFormField> fields = m_editor->formFields();
    if (fields.isEmpty()) {
        showMessage(tr("Fill Form"), tr("This document has no form fields."), MessageLevel::Info);
        return;
    }
    FormFillDialog dialog(fields, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    const QMap<QString, QString> values = dialog.changedValues();
    if (values.isEmpty()) {
        setStatus(tr("No changes."));
        return;
    }
    m_editor->fillForm(values);
}

void MainWindow::showSearchRedactDialog()
{
    bool ok = false;
    const QString term = QInputDialog::getText(this, tr("Search & Redact"),
                                               tr("Redact every occurrence of:"),
                                               QLineEdit::Normal, QString(), &ok);
    if (ok) {
        m_editor->searchRedact(term, m_banner->redactColor());
    }
}

void MainWindow::showPageContextMenu(const QPoint& pos)
{
    const QModelIndex index = m_pageList->indexAt(pos);
    if (!index.isValid()) {
        return;
    }
    m_editor->pageContextRequested(index.row() + 1);

    QMenu menu(this);
    for (const char* id : {"tb-delete", "page-rotate-left", "page-rotate-right",
                           "page-move-up", "page-move-down", "page-insert-blank", "tb-extract"}) {
        menu.addAction(m_actions.value(QString::fromLatin1(id)));
    }
    menu.exec(m_pageList->viewport()->mapToGlobal(pos));
}

void MainWindow::applyForMode()
{
    switch (m_editor->tools()->mode()) {
        case ToolMode::Redact:
            m_editor->applyRedactions();
            break;
        case ToolMode::TextEdit:
            m_editor->applyTextEdits();
            break;
        case ToolMode::Highlight:
        case ToolMode::Underline:
        case ToolMode::Sticky:
        case ToolMode::Draw:
            m_editor->applyAnnotations();
            break;
        default:
            break;
    }
}

// ============================================================================
// EditorUi
// ============================================================================

void MainWindow::showMessage(const QString& title, const QString& text, MessageLevel level)
{
    switch (level) {
        case MessageLevel::Info:
            QMessageBox::information(this, title, text);
            break;
        case MessageLevel::Warning:
            QMessageBox::warning(this, title, text);
            break;
        case MessageLevel::Error:
            QMessageBox::critical(this, title, text);
            break;
    }
}

bool MainWindow::confirm(const QString& title, const QString& text)
{
    return QMessageBox::question(this, title, text, QMessageBox::Yes | QMessageBox::No,
                                 QMessageBox::No) == QMessageBox::Yes;
}

void MainWindow::setStatus(const QString& text)
{
    statusBar()->showMessage(text);
}

void MainWindow::setControlsEnabled(const QStringList& ids, bool enabled)
{
    for (const QString& id : ids) {
        if (QAction* action = m_actions.value(id, nullptr)) {
            action->setEnabled(enabled);
        }
        if (QWidget* widget = findChild<QWidget*>(id)) {
            widget->setEnabled(enabled);
        }
    }

    // Page commands follow the document controls
    if (ids.contains(QStringLiteral("tb-save"))) {
        for (const char* id : {"tb-saveas", "tb-close", "tb-selectall", "tb-delete",
                               "page-rotate-left", "page-rotate-right", "page-move-up",
                               "page-move-down", "page-insert-blank", "page-crop", "page-numbers",
                               "page-stamp", "form-fill", "form-flatten"}) {
            m_actions.value(QString::fromLatin1(id))->setEnabled(enabled);
        }
        for (QAction* action : m_modeActions) {
            action->setEnabled(enabled);
        }
    }
}

void MainWindow::setBusy(bool busy)
{
    if (busy == m_busy) {
        return;
    }
    m_busy = busy;
    if (busy) {
        QApplication::setOverrideCursor(Qt::WaitCursor);
    } else {
        QApplication::restoreOverrideCursor();
    }
}
