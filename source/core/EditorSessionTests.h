#ifndef EDITORSESSIONTESTS_H
#define EDITORSESSIONTESTS_H

#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include <QThreadPool>

#include "DocumentSession.h"
#include "EditorSession.h"
#include "EditorUi.h"
#include "Workspace.h"
#include "../pdf/MockPdfEngine.h"
#include "../tools/ToolModeController.h"
#include "../viewport/PageRenderPipeline.h"

/**
 * @brief EditorUi that records what the core asked for.
 */
class RecordingEditorUi : public EditorUi {
public:
    struct Message {
        QString title;
        QString text;
        MessageLevel level;
    };

    void showMessage(const QString& title, const QString& text, MessageLevel level) override {
        messages.append({title, text, level});
    }

    bool confirm(const QString& title, const QString& text) override {
        Q_UNUSED(title);
        Q_UNUSED(text);
        ++confirmCount;
        return confirmAnswer;
    }

    void setStatus(const QString& text) override { status = text; }

    void setControlsEnabled(const QStringList& ids, bool enabled) override {
        for (const QString& id : ids) {
            controls[id] = enabled;
        }
    }

    void setBusy(bool isBusy) override { busy = isBusy; }

    QVector<Message> messages;
    bool confirmAnswer = true;
    int confirmCount = 0;
    QString status;
    QMap<QString, bool> controls;
    bool busy = false;
};

/**
 * Integration tests for EditorSession against the JSON mock engine.
 * Run with: pdfdesk --test-editor
 */
class EditorSessionTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_settingsDir;
    RecordingEditorUi* m_ui = nullptr;
    EditorSession* m_editor = nullptr;
    QVector<QPair<QString, OperationResult>> m_results;

    int countOf(const QString& op) const {
        int n = 0;
        for (const auto& entry : m_results) {
            n += entry.first == op ? 1 : 0;
        }
        return n;
    }

    OperationResult lastResult(const QString& op) const {
        for (int i = m_results.size() - 1; i >= 0; --i) {
            if (m_results.at(i).first == op) {
                return m_results.at(i).second;
            }
        }
        return OperationResult::failure(ErrorKind::None, QStringLiteral("never reported"));
    }

    /// Run an operation and wait until it reports its outcome.
    OperationResult finish(const QString& op, const std::function<void()>& call) {
        const int before = countOf(op);
        call();
        if (!QTest::qWaitFor([&]() { return countOf(op) > before; }, 5000)) {
            return OperationResult::failure(ErrorKind::None, QStringLiteral("timed out"));
        }
        return lastResult(op);
    }

    DocumentSession* open(const QByteArray& bytes, const QString& name = QStringLiteral("test.pdf")) {
        const OperationResult result = finish("open", [&]() { m_editor->openBytes(bytes, name); });
        return result.success ? m_editor->activeSession() : nullptr;
    }

    QByteArray bytes() const { return m_editor->activeSession()->snapshot().bytes(); }

    QString label(int page) const {
        return MockPdfEngine::parse(bytes()).value("pages").toArray()
            .at(page - 1).toObject().value("label").toString();
    }

    QJsonArray ops(int page) const { return MockPdfEngine::pageOps(bytes(), page - 1); }

    bool click(int page, OverlayKind layer, const QPointF& pos,
               Qt::MouseButton button = Qt::LeftButton) {
        PointerEvent event;
        event.type = PointerEvent::Press;
        event.pos = pos;
        event.button = button;
        return m_editor->pipeline()->overlay(page, layer)->dispatch(event);
    }

private slots:
    void initTestCase() {
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_settingsDir.path());
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_settingsDir.path());
    }

    void init() {
        m_results.clear();
        m_ui = new RecordingEditorUi();
        m_editor = new EditorSession(std::make_unique<MockPdfEngine>(), &MockPdfProvider::create, m_ui);
        connect(m_editor, &EditorSession::operationFinished, this,
                [this](const QString& op, const OperationResult& result) {
            m_results.append(qMakePair(op, result));
        });
    }

    void cleanup() {
        delete m_editor;
        m_editor = nullptr;
        delete m_ui;
        m_ui = nullptr;
        QThreadPool::globalInstance()->waitForDone();
    }

    // ===== Documents =====

    void testOpenEnablesControls() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3), "a.pdf");
        QVERIFY(session);
        QCOMPARE(session->pageCount(), 3);
        QCOMPARE(m_ui->status, QString("Opened a.pdf (3 pages)."));
        QCOMPARE(m_ui->controls.value("tb-save"), true);
        QCOMPARE(m_ui->controls.value("side-merge"), true);
        QCOMPARE(m_ui->controls.value("tb-undo"), false);
        QVERIFY(!m_ui->busy);
    }

    void testOpenGarbageIsLoadError() {
        open(MockPdfEngine::makeDocument(1), "good.pdf");
        const OperationResult result = finish("open", [&]() {
            m_editor->openBytes("%PDF-broken", "bad.pdf");
        });
        QVERIFY(!result.success);
        QCOMPARE(result.error, ErrorKind::LoadError);
        QVERIFY(result.message.startsWith("Could not open bad.pdf"));
        QCOMPARE(m_editor->workspace()->sessionCount(), 1);
        QCOMPARE(m_ui->messages.last().level, EditorUi::MessageLevel::Error);
    }

    void testOpenEmptyBytes() {
        const OperationResult result = m_editor->openBytes(QByteArray(), "empty.pdf");
        QCOMPARE(result.error, ErrorKind::LoadError);
        QVERIFY(m_editor->workspace()->isEmpty());
    }

    void testOpenMissingFile() {
        const OperationResult result = m_editor->openFile(m_settingsDir.filePath("missing.pdf"));
        QCOMPARE(result.error, ErrorKind::LoadError);
        QVERIFY(m_editor->workspace()->isEmpty());
    }

    void testOperationsNeedDocument() {
        const OperationResult result = m_editor->rotatePages(90);
        QCOMPARE(result.error, ErrorKind::ValidationError);
        QCOMPARE(result.message, QString("No document open."));

        QCOMPARE(m_editor->toggleToolMode(ToolMode::Redact), ToolMode::None);
        QCOMPARE(m_ui->status, QString("Open a document first."));
    }

    void testCloseLastDisablesControls() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(2));
        m_editor->toggleToolMode(ToolMode::Redact);
        QVERIFY(m_editor->closeSession(session->id()));

        QCOMPARE(m_editor->tools()->mode(), ToolMode::None);
        QVERIFY(m_editor->workspace()->isEmpty());
        QCOMPARE(m_ui->controls.value("tb-save"), false);
        QCOMPARE(m_ui->controls.value("tb-redo"), false);
        QCOMPARE(m_ui->status, QString("No document open."));
        QCOMPARE(m_editor->pipeline()->slotCount(), 0);
    }

    void testSaveWritesSnapshot() {
        QTemporaryDir dir;
        open(MockPdfEngine::makeDocument(2), "a.pdf");
        QCOMPARE(m_editor->saveActive().error, ErrorKind::ValidationError);

        const QString path = dir.filePath("out.pdf");
        const OperationResult result = finish("save", [&]() { m_editor->saveActive(path); });
        QVERIFY(result.success);

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), bytes());
        QCOMPARE(m_editor->activeSession()->name(), QString("out.pdf"));
        QCOMPARE(m_editor->activeSession()->filePath(), QFileInfo(path).absoluteFilePath());
        QVERIFY(m_editor->settings().recentDocuments().contains(QFileInfo(path).absoluteFilePath()));
    }

    void testSaveAppliesPendingText() {
        QTemporaryDir dir;
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        session->marks()->add(Mark::textBox(1, QPointF(72, 100), "Signed"));

        const QString path = dir.filePath("signed.pdf");
        const OperationResult result = finish("save", [&]() { m_editor->saveActive(path); });
        QVERIFY(result.success);
        QCOMPARE(session->marks()->count(Mark::TextBox), 0);

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QJsonArray written = MockPdfEngine::pageOps(file.readAll(), 0);
        QCOMPARE(written.size(), 1);
        QCOMPARE(written.at(0).toObject().value("text").toString(), QString("Signed"));
    }

    void testMarksOnRemovedPageDoNotBlockCommits() {
        QTemporaryDir dir;
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        session->marks()->add(Mark::textBox(3, QPointF(10, 10), "orphan"));
        session->marks()->add(Mark::textBox(1, QPointF(72, 100), "kept"));
        session->marks()->add(Mark::redactRect(3, QRectF(10, 10, 50, 20), Qt::black));
        session->marks()->add(Mark::highlight(3, QPointF(100, 100)));
        session->selectOnly(2);
        QVERIFY(finish("delete", [&]() { m_editor->deletePages(); }).success);
        QCOMPARE(session->pageCount(), 2);

        const QString path = dir.filePath("trimmed.pdf");
        QVERIFY(finish("save", [&]() { m_editor->saveActive(path); }).success);
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QByteArray written = file.readAll();
        QCOMPARE(MockPdfEngine::pageOps(written, 0).size(), 1);
        QCOMPARE(MockPdfEngine::pageOps(written, 1).size(), 0);

        QCOMPARE(m_editor->applyRedactions().message, QString("No redaction areas defined."));
        QCOMPARE(m_editor->applyAnnotations().message, QString("No annotations to apply."));
        // Left for undo to bring page 3 back
        QCOMPARE(session->marks()->count(Mark::TextBox), 1);
        QCOMPARE(session->marks()->count(Mark::RedactRect), 1);
    }

    // ===== Navigation =====

    void testNavigationAndZoom() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(5));
        m_editor->nextPage();
        QCOMPARE(session->currentPage(), 2);
        m_editor->lastPage();
        QCOMPARE(session->currentPage(), 5);
        m_editor->nextPage();
        QCOMPARE(session->currentPage(), 5);
        m_editor->prevPage();
        QCOMPARE(session->currentPage(), 4);
        m_editor->goToPage(99);
        QCOMPARE(session->currentPage(), 5);
        m_editor->firstPage();
        QCOMPARE(session->currentPage(), 1);

        m_editor->zoomIn();
        QCOMPARE(session->zoom(), 1.25);
        QCOMPARE(m_ui->status, QString("Zoom: 125%"));
        m_editor->setZoom(10.0);
        QCOMPARE(session->zoom(), DocumentSession::MAX_ZOOM);
        m_editor->fitPage(QSizeF(346, 832));
        QCOMPARE(session->zoom(), 0.5);
    }

    void testThumbnailClicks() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(4));
        m_editor->pageClicked(2, Qt::ControlModifier);
        m_editor->pageClicked(4, Qt::ControlModifier);
        QCOMPARE(session->selectedPages(), QVector<int>({2, 4}));
        m_editor->pageClicked(2, Qt::ControlModifier);
        QCOMPARE(session->selectedPages(), QVector<int>({4}));

        m_editor->pageClicked(3, Qt::NoModifier);
        QVERIFY(session->selection().isEmpty());
        QCOMPARE(session->currentPage(), 3);

        m_editor->pageContextRequested(1);
        QCOMPARE(session->selectedPages(), QVector<int>({1}));
    }

    void testSwitchingKeepsViewState() {
        DocumentSession* first = open(MockPdfEngine::makeDocument(4), "a.pdf");
        m_editor->goToPage(3);
        m_editor->setZoom(1.5);
        DocumentSession* second = open(MockPdfEngine::makeDocument(2), "b.pdf");
        QCOMPARE(m_editor->pipeline()->session(), second);

        QVERIFY(m_editor->switchTo(first->id()));
        QCOMPARE(m_editor->pipeline()->session(), first);
        QCOMPARE(first->currentPage(), 3);
        QCOMPARE(first->zoom(), 1.5);
        QCOMPARE(m_editor->pipeline()->slotCount(), 4);
    }

    // ===== Page operations =====

    void testDeleteAllPagesRejected() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(2));
        m_editor->selectAllPages();
        const OperationResult result = m_editor->deletePages();
        QCOMPARE(result.error, ErrorKind::ValidationError);
        QCOMPARE(result.message, QString("Cannot delete all pages."));
        QCOMPARE(m_ui->messages.last().level, EditorUi::MessageLevel::Warning);
        QCOMPARE(session->pageCount(), 2);
        QVERIFY(!session->undoStack()->canUndo());
    }

    void testDeleteSelectedPages() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(5));
        session->togglePageSelection(2);
        session->togglePageSelection(4);

        const OperationResult result = finish("delete", [&]() { m_editor->deletePages(); });
        QVERIFY(result.success);
        QCOMPARE(session->pageCount(), 3);
        QCOMPARE(label(1), QString("1"));
        QCOMPARE(label(2), QString("3"));
        QCOMPARE(label(3), QString("5"));
        QCOMPARE(session->currentPage(), 2);
        QVERIFY(session->selection().isEmpty());
        QCOMPARE(m_ui->controls.value("tb-undo"), true);
    }

    void testRotateTwiceThenUndoRestoresBytes() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(4));
        const QByteArray original = bytes();

        for (int i = 0; i < 2; ++i) {
            session->togglePageSelection(2);
            session->togglePageSelection(3);
            QVERIFY(finish("rotate", [&]() { m_editor->rotatePages(90); }).success);
        }
        QCOMPARE(session->rotation(1), 0);
        QCOMPARE(session->rotation(2), 180);
        QCOMPARE(session->rotation(3), 180);

        QVERIFY(finish("undo", [&]() { m_editor->undo(); }).success);
        QCOMPARE(session->rotation(2), 90);
        QVERIFY(finish("undo", [&]() { m_editor->undo(); }).success);
        QCOMPARE(bytes(), original);
        QVERIFY(!m_editor->canUndo());
        QVERIFY(m_editor->canRedo());
    }

    void testRotationNormalised() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        QVERIFY(finish("rotate", [&]() { m_editor->rotatePages(-90); }).success);
        QCOMPARE(session->rotation(1), 270);
        QCOMPARE(session->displaySize(1), QSizeF(792, 612));
    }

    void testBusySessionRejectsSecondJob() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        QVERIFY(m_editor->rotatePages(90).success);
        QVERIFY(session->isBusy());
        QVERIFY(m_ui->busy);

        const OperationResult second = m_editor->insertBlankPage();
        QCOMPARE(second.error, ErrorKind::ValidationError);
        QCOMPARE(second.message, QString("Another operation is still running."));

        QTRY_VERIFY(!session->isBusy());
        QVERIFY(!m_ui->busy);
        QCOMPARE(session->pageCount(), 3);
        QCOMPARE(session->undoStack()->undoCount(), 1);
    }

    void testJobForClosedSession() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        const int id = session->id();
        const OperationResult result = finish("rotate", [&]() {
            m_editor->rotatePages(90);
            m_editor->closeSession(id);
        });
        QCOMPARE(result.error, ErrorKind::EngineError);
        QVERIFY(m_editor->workspace()->isEmpty());
        QVERIFY(!m_ui->busy);
    }

    void testReorderAndMove() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        QVERIFY(finish("reorder", [&]() { m_editor->reorderPage(1, 3); }).success);
        QCOMPARE(label(1), QString("2"));
        QCOMPARE(label(3), QString("1"));
        QCOMPARE(session->currentPage(), 3);

        QCOMPARE(m_editor->movePageDown().message, QString("This is already the last page."));
        QVERIFY(finish("reorder", [&]() { m_editor->movePageUp(); }).success);
        QCOMPARE(label(2), QString("1"));
        QCOMPARE(session->currentPage(), 2);

        QCOMPARE(m_editor->reorderPage(0, 2).error, ErrorKind::ValidationError);
        QVERIFY(m_editor->reorderPage(2, 2).success);
        QCOMPARE(session->undoStack()->undoCount(), 2);
    }

    void testInsertBlankAfterCurrent() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        m_editor->goToPage(2);
        QVERIFY(finish("insert-blank", [&]() { m_editor->insertBlankPage(); }).success);
        QCOMPARE(session->pageCount(), 4);
        QCOMPARE(label(3), QString("blank"));
        QCOMPARE(session->currentPage(), 3);
    }

    void testCropSelection() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(2));
        QCOMPARE(m_editor->cropPages(QRectF(0, 0, 0, 100)).message, QString("Invalid crop box."));

        session->togglePageSelection(2);
        QVERIFY(finish("crop", [&]() { m_editor->cropPages(QRectF(10, 20, 300, 400)); }).success);
        const QJsonObject pages = MockPdfEngine::parse(bytes());
        const QJsonArray crop = pages.value("pages").toArray().at(1).toObject().value("crop").toArray();
        QCOMPARE(crop.size(), 4);
        QCOMPARE(crop.at(0).toDouble(), 10.0);
        QCOMPARE(crop.at(1).toDouble(), 20.0);
        QCOMPARE(crop.at(2).toDouble(), 310.0);
        QCOMPARE(crop.at(3).toDouble(), 420.0);
        QVERIFY(!pages.value("pages").toArray().at(0).toObject().contains("crop"));
    }

    void testPageNumbers() {
        open(MockPdfEngine::makeDocument(2));
        QVERIFY(finish("page-numbers", [&]() { m_editor->addPageNumbers(PageNumberOptions()); }).success);

        const QJsonObject first = ops(1).at(0).toObject();
        QCOMPARE(first.value("text").toString(), QString("1"));
        QCOMPARE(first.value("x").toDouble(), (612 - 5) / 2.0);
        QCOMPARE(first.value("y").toDouble(), 20.0);
        QCOMPARE(ops(2).at(0).toObject().value("text").toString(), QString("2"));

        PageNumberOptions options;
        options.position = PageNumberOptions::TopRight;
        options.format = PageNumberOptions::PageOfTotal;
        QVERIFY(finish("page-numbers", [&]() { m_editor->addPageNumbers(options); }).success);
        const QJsonObject top = ops(1).at(1).toObject();
        QCOMPARE(top.value("text").toString(), QString("Page 1 of 2"));
        QCOMPARE(top.value("x").toDouble(), 612 - 36 - 55.0);
        QCOMPARE(top.value("y").toDouble(), 762.0);
    }

    void testStamp() {
        open(MockPdfEngine::makeDocument(2));
        QCOMPARE(m_editor->addStamp("  ", Qt::red, false).error, ErrorKind::ValidationError);

        QVERIFY(finish("stamp", [&]() { m_editor->addStamp("DRAFT", QColor(204, 0, 0), false); }).success);
        QCOMPARE(ops(1).size(), 1);
        QCOMPARE(ops(2).size(), 0);
        const QJsonObject stamp = ops(1).at(0).toObject();
        QCOMPARE(stamp.value("text").toString(), QString("DRAFT"));
        QCOMPARE(stamp.value("font").toString(), QString("Helvetica-Bold"));
        QCOMPARE(stamp.value("size").toDouble(), 54.0);
        QCOMPARE(stamp.value("rotation").toDouble(), -30.0);
        QCOMPARE(stamp.value("opacity").toDouble(), 0.35);

        QVERIFY(finish("stamp", [&]() { m_editor->addStamp("APPROVED", Qt::blue, true); }).success);
        QCOMPARE(ops(2).size(), 1);
    }

    // ===== Mark commits =====

    void testRedactionUsesCommitZoom() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        QCOMPARE(m_editor->applyRedactions().message, QString("No redaction areas defined."));

        m_editor->setZoom(2.0);
        session->marks()->add(Mark::redactRect(1, QRectF(100, 100, 50, 20), Qt::black));

        QVERIFY(finish("redact", [&]() { m_editor->applyRedactions(); }).success);
        const QJsonObject rect = ops(1).at(0).toObject();
        QCOMPARE(rect.value("op").toString(), QString("rect"));
        QCOMPARE(rect.value("x").toDouble(), 50.0);
        QCOMPARE(rect.value("y").toDouble(), 732.0);
        QCOMPARE(rect.value("w").toDouble(), 25.0);
        QCOMPARE(rect.value("h").toDouble(), 10.0);
        QCOMPARE(rect.value("color").toString(), QString("#000000"));
        QCOMPARE(session->marks()->count(Mark::RedactRect), 0);
        QCOMPARE(m_ui->messages.last().level, EditorUi::MessageLevel::Info);
    }

    void testClearRedactions() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        QSignalSpy counts(m_editor, &EditorSession::redactionCountChanged);
        session->marks()->add(Mark::redactRect(1, QRectF(0, 0, 20, 20), Qt::black));
        QCOMPARE(counts.last().at(0).toInt(), 1);
        m_editor->clearRedactions();
        QCOMPARE(counts.last().at(0).toInt(), 0);
        QCOMPARE(session->marks()->totalCount(), 0);
    }

    void testSearchRedact() {
        DocumentSession* session = open(MockPdfEngine::makeDocumentWithText(
            {{"alpha", "secret", "beta"}, {"none"}, {"Secret!"}}));

        const OperationResult result = finish("search-redact", [&]() {
            m_editor->searchRedact("secret", Qt::black);
        });
        QVERIFY(result.success);
        QCOMPARE(ops(1).size(), 1);
        QCOMPARE(ops(2).size(), 0);
        QCOMPARE(ops(3).size(), 1);

        const QJsonObject hit = ops(1).at(0).toObject();
        QCOMPARE(hit.value("x").toDouble(), 131.0);
        QCOMPARE(hit.value("y").toDouble(), 679.0);
        QCOMPARE(hit.value("w").toDouble(), 62.0);
        QCOMPARE(hit.value("h").toDouble(), 14.0);
        QCOMPARE(session->undoStack()->undoCount(), 1);
    }

    void testSearchRedactMatchesPhrase() {
        open(MockPdfEngine::makeDocumentWithText(
            {{"Name: Ada", "Social Security Number"}, {"Social", "Security"}}));

        const OperationResult result = finish("search-redact", [&]() {
            m_editor->searchRedact("social security", Qt::black);
        });
        QVERIFY(result.success);
        QCOMPARE(ops(1).size(), 1);
        QCOMPARE(ops(1).at(0).toObject().value("x").toDouble(), 131.0);
        // A phrase split over separate items is not matched
        QCOMPARE(ops(2).size(), 0);
    }

    void testSearchRedactWithoutMatches() {
        open(MockPdfEngine::makeDocumentWithText({{"alpha"}}));
        QCOMPARE(m_editor->searchRedact(" ", Qt::black).error, ErrorKind::ValidationError);

        const OperationResult result = finish("search-redact", [&]() {
            m_editor->searchRedact("omega", Qt::black);
        });
        QCOMPARE(result.error, ErrorKind::ValidationError);
        QCOMPARE(result.message, QString("No matches found."));
        QVERIFY(!m_editor->canUndo());
    }

    void testTextCommit() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        session->marks()->add(Mark::textBox(1, QPointF(72, 100)));
        QCOMPARE(m_editor->applyTextEdits().message, QString("No text to apply."));

        session->marks()->add(Mark::textBox(1, QPointF(72, 100), "Hello"));
        QVERIFY(finish("add-text-commit", [&]() { m_editor->applyTextEdits(); }).success);
        const QJsonObject text = ops(1).at(0).toObject();
        QCOMPARE(text.value("text").toString(), QString("Hello"));
        QCOMPARE(text.value("x").toDouble(), 72.0);
        QCOMPARE(text.value("y").toDouble(), 792 - 100 - 14.0);
        // Empty boxes stay behind
        QCOMPARE(session->marks()->count(Mark::TextBox), 1);
    }

    void testApplyAnnotations() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        QCOMPARE(m_editor->applyAnnotations().message, QString("No annotations to apply."));

        session->marks()->add(Mark::highlight(1, QPointF(200, 100)));
        session->marks()->add(Mark::underline(1, QPointF(200, 300)));
        session->marks()->add(Mark::stickyNote(1, QPointF(50, 50), "check this"));
        QVERIFY(finish("annotate", [&]() { m_editor->applyAnnotations(); }).success);

        const QJsonArray drawn = ops(1);
        QCOMPARE(drawn.size(), 3);
        const QJsonObject hl = drawn.at(0).toObject();
        QCOMPARE(hl.value("op").toString(), QString("rect"));
        QCOMPARE(hl.value("color").toString(), QString("#ffff00"));
        QCOMPARE(hl.value("opacity").toDouble(), 0.4);
        QCOMPARE(hl.value("y").toDouble(), 792 - 92 - 16.0);

        const QJsonObject ul = drawn.at(1).toObject();
        QCOMPARE(ul.value("op").toString(), QString("line"));
        QCOMPARE(ul.value("x1").toDouble(), 160.0);
        QCOMPARE(ul.value("x2").toDouble(), 240.0);
        QCOMPARE(ul.value("y1").toDouble(), 792 - 299.0);

        const QJsonObject note = drawn.at(2).toObject();
        QCOMPARE(note.value("text").toString(), QString("» check this"));
        QCOMPARE(note.value("size").toDouble(), 9.0);
        QCOMPARE(session->marks()->totalCount(), 0);
    }

    // ===== History =====

    void testUndoRedoMarkPlacement() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        m_editor->toggleToolMode(ToolMode::Sticky);
        QVERIFY(click(1, OverlayKind::Annotation, QPointF(40, 40)));
        const int id = session->marks()->marksOfKind(Mark::StickyNote).first().id;
        session->marks()->setText(id, "edited later");

        QVERIFY(m_editor->undo().success);
        QCOMPARE(session->marks()->totalCount(), 0);
        QCOMPARE(m_ui->controls.value("tb-redo"), true);

        QVERIFY(m_editor->redo().success);
        const Mark* restored = session->marks()->find(id);
        QVERIFY(restored);
        QCOMPARE(restored->text, QString("edited later"));
        QVERIFY(m_editor->canUndo());
        QVERIFY(!m_editor->canRedo());
    }

    void testNothingToUndo() {
        open(MockPdfEngine::makeDocument(1));
        const int dialogs = m_ui->messages.size();
        QCOMPARE(m_editor->undo().message, QString("Nothing to undo."));
        QCOMPARE(m_editor->redo().message, QString("Nothing to redo."));
        QCOMPARE(m_ui->messages.size(), dialogs);
    }

    void testRedoDoesNotReexecuteEdits() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(3));
        const QByteArray original = bytes();
        QVERIFY(finish("delete", [&]() { m_editor->deletePages(); }).success);
        QVERIFY(finish("undo", [&]() { m_editor->undo(); }).success);
        QCOMPARE(bytes(), original);

        QVERIFY(m_editor->redo().success);
        QCOMPARE(bytes(), original);
        QCOMPARE(session->pageCount(), 3);
        QVERIFY(m_editor->canUndo());
        QVERIFY(m_ui->status.contains("delete"));
    }

    void testFailedRestoreKeepsUndoEntry() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(2));
        const QByteArray current = bytes();
        session->undoStack()->push(UndoAction::forSnapshot(
            UndoAction::RotatePages, DocumentSnapshot::create("%PDF-broken")));

        const OperationResult result = finish("undo", [&]() { m_editor->undo(); });
        QCOMPARE(result.error, ErrorKind::EngineError);
        QCOMPARE(bytes(), current);
        QCOMPARE(session->undoStack()->undoCount(), 1);
        QVERIFY(!m_editor->canRedo());
        QCOMPARE(m_ui->controls.value("tb-undo"), true);
    }

    void testNewActionClearsRedo() {
        open(MockPdfEngine::makeDocument(2));
        QVERIFY(finish("rotate", [&]() { m_editor->rotatePages(90); }).success);
        QVERIFY(finish("undo", [&]() { m_editor->undo(); }).success);
        QVERIFY(m_editor->canRedo());
        QVERIFY(finish("rotate", [&]() { m_editor->rotatePages(180); }).success);
        QVERIFY(!m_editor->canRedo());
    }

    // ===== Forms =====

    void testFillAndFlattenForm() {
        QByteArray doc = MockPdfEngine::makeDocument(1);
        doc = MockPdfEngine::withField(doc, "name", "text");
        doc = MockPdfEngine::withField(doc, "color", "dropdown", "red", {"red", "green"});
        DocumentSession* session = open(doc);
        QCOMPARE(m_editor->formFields().size(), 2);
        QCOMPARE(m_editor->fillForm({}).message, QString("No form fields to fill."));

        QMap<QString, QString> values;
        values.insert("name", "Ada");
        values.insert("color", "green");
        QVERIFY(finish("fill-form", [&]() { m_editor->fillForm(values); }).success);
        QCOMPARE(m_editor->formFields().at(0).value, QString("Ada"));
        QCOMPARE(m_editor->formFields().at(1).value, QString("green"));

        m_ui->confirmAnswer = false;
        QCOMPARE(finish("flatten", [&]() { m_editor->flattenForm(); }).message,
                 QString("Flatten cancelled."));
        QCOMPARE(m_editor->formFields().size(), 2);

        m_ui->confirmAnswer = true;
        QVERIFY(finish("flatten", [&]() { m_editor->flattenForm(); }).success);
        QVERIFY(m_editor->formFields().isEmpty());
        QCOMPARE(ops(1).size(), 2);
        QCOMPARE(ops(1).at(0).toObject().value("op").toString(), QString("flattened-field"));
        QCOMPARE(session->undoStack()->undoCount(), 2);

        QCOMPARE(finish("flatten", [&]() { m_editor->flattenForm(); }).message,
                 QString("No form fields to flatten."));
    }

    void testFailedFillKeepsSnapshot() {
        QByteArray doc = MockPdfEngine::withField(MockPdfEngine::makeDocument(1), "color",
                                                  "dropdown", "red", {"red", "green"});
        DocumentSession* session = open(doc);
        const QByteArray before = bytes();

        QMap<QString, QString> values;
        values.insert("color", "blue");
        const OperationResult result = finish("fill-form", [&]() { m_editor->fillForm(values); });
        QCOMPARE(result.error, ErrorKind::EngineError);
        QVERIFY(result.message.contains("not an option"));
        QCOMPARE(m_ui->messages.last().level, EditorUi::MessageLevel::Error);
        QCOMPARE(bytes(), before);
        QVERIFY(!session->undoStack()->canUndo());
    }

    void testAddFieldFromTool() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(1));
        m_editor->toggleToolMode(ToolMode::AddField);

        const OperationResult result = finish("add-field", [&]() {
            click(1, OverlayKind::TextEdit, QPointF(100, 100));
        });
        QVERIFY(result.success);

        const QVector<PdfFormField> fields = m_editor->formFields();
        QCOMPARE(fields.size(), 1);
        QVERIFY(fields.first().name.startsWith("field_"));
        const QJsonArray rect = MockPdfEngine::parse(bytes()).value("fields").toArray()
            .at(0).toObject().value("rect").toArray();
        QCOMPARE(rect.at(0).toDouble(), 100.0);
        QCOMPARE(rect.at(1).toDouble(), 672.0);
        QCOMPARE(rect.at(2).toDouble(), 150.0);
        QCOMPARE(rect.at(3).toDouble(), 20.0);
        QCOMPARE(session->marks()->count(Mark::FormField), 0);
        QCOMPARE(session->undoStack()->undoCount(), 1);
    }

    // ===== Multi-document =====

    void testMergeAllSessions() {
        QCOMPARE(m_editor->mergeDocuments().message, QString("Open at least two documents to merge."));
        open(MockPdfEngine::makeDocument(2), "a.pdf");
        open(MockPdfEngine::makeDocument(3), "b.pdf");

        QVERIFY(finish("merge", [&]() { m_editor->mergeDocuments(); }).success);
        QCOMPARE(m_editor->workspace()->sessionCount(), 3);
        QCOMPARE(m_editor->activeSession()->name(), QString("Merged.pdf"));
        QCOMPARE(m_editor->activeSession()->pageCount(), 5);
        QCOMPARE(label(3), QString("1"));
    }

    void testExtractSelection() {
        DocumentSession* session = open(MockPdfEngine::makeDocument(4), "report.pdf");
        QCOMPARE(m_editor->extractPages().message, QString("No pages selected."));

        session->togglePageSelection(4);
        session->togglePageSelection(2);
        QVERIFY(finish("extract", [&]() { m_editor->extractPages(); }).success);
        QCOMPARE(m_editor->activeSession()->name(), QString("report_extract.pdf"));
        QCOMPARE(m_editor->activeSession()->pageCount(), 2);
        QCOMPARE(label(1), QString("2"));
        QCOMPARE(label(2), QString("4"));
        QCOMPARE(session->pageCount(), 4);
    }
};

#endif // EDITORSESSIONTESTS_H
