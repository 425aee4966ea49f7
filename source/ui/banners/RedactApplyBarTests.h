#ifndef REDACTAPPLYBARTESTS_H
#define REDACTAPPLYBARTESTS_H

#include <QObject>
#include <QPushButton>
#include <QSettings>
#include <QTemporaryDir>
#include <QTest>
#include <QThreadPool>

#include "RedactApplyBar.h"
#include "../../core/EditorSession.h"
#include "../../core/EditorSessionTests.h"
#include "../../pdf/MockPdfEngine.h"
#include "../../tools/ToolModeController.h"

/**
 * Tests for RedactApplyBar wired to an EditorSession the way MainWindow wires it.
 * Run with: pdfdesk --test-bar
 */
class RedactApplyBarTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_settingsDir;
    RecordingEditorUi* m_ui = nullptr;
    EditorSession* m_editor = nullptr;
    RedactApplyBar* m_bar = nullptr;

    DocumentSession* openMock(int pages) {
        bool done = false;
        const QMetaObject::Connection connection = connect(m_editor, &EditorSession::operationFinished,
                                                           this, [&done](const QString& op, const OperationResult&) {
            done = done || op == QLatin1String("open");
        });
        m_editor->openBytes(MockPdfEngine::makeDocument(pages), QStringLiteral("bar.pdf"));
        QTest::qWaitFor([&done]() { return done; }, 5000);
        disconnect(connection);
        return m_editor->activeSession();
    }

    QPushButton* button(const char* name) const {
        return m_bar->findChild<QPushButton*>(QString::fromLatin1(name));
    }

private slots:
    void initTestCase() {
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_settingsDir.path());
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_settingsDir.path());
    }

    void init() {
        m_ui = new RecordingEditorUi();
        m_editor = new EditorSession(std::make_unique<MockPdfEngine>(), &MockPdfProvider::create, m_ui);
        m_bar = new RedactApplyBar();
        connect(m_editor, &EditorSession::redactionCountChanged, m_bar, &RedactApplyBar::setRedactionCount);
        connect(m_bar, &RedactApplyBar::applyClicked, m_editor, &EditorSession::applyRedactions);
        connect(m_bar, &RedactApplyBar::clearClicked, m_editor, &EditorSession::clearRedactions);
    }

    void cleanup() {
        delete m_bar;
        m_bar = nullptr;
        delete m_editor;
        m_editor = nullptr;
        delete m_ui;
        m_ui = nullptr;
        QThreadPool::globalInstance()->waitForDone();
    }

    void testHiddenWithoutRedactions() {
        QVERIFY(m_bar->isHidden());
        openMock(2);
        m_editor->tools()->enter(ToolMode::Redact);
        QVERIFY(m_bar->isHidden());
    }

    void testStaysAfterLeavingRedactMode() {
        DocumentSession* session = openMock(2);
        QVERIFY(session);
        m_editor->tools()->enter(ToolMode::Redact);
        session->marks()->add(Mark::redactRect(1, QRectF(10, 10, 80, 20), Qt::black));
        QVERIFY(!m_bar->isHidden());
        QCOMPARE(m_bar->redactionCount(), 1);

        m_editor->tools()->exit();
        QCOMPARE(m_editor->tools()->mode(), ToolMode::None);
        QVERIFY(!m_bar->isHidden());

        QTest::mouseClick(button("redactClear"), Qt::LeftButton);
        QCOMPARE(session->marks()->count(Mark::RedactRect), 0);
        QVERIFY(m_bar->isHidden());
    }

    void testApplyCommitsAndHides() {
        DocumentSession* session = openMock(1);
        QVERIFY(session);
        session->marks()->add(Mark::redactRect(1, QRectF(10, 10, 80, 20), Qt::black));
        QVERIFY(!m_bar->isHidden());

        QTest::mouseClick(button("redactApply"), Qt::LeftButton);
        QVERIFY(QTest::qWaitFor([this]() { return m_bar->isHidden(); }, 5000));
        QCOMPARE(MockPdfEngine::pageOps(session->snapshot().bytes(), 0).size(), 1);
    }

    void testFollowsActiveDocument() {
        DocumentSession* first = openMock(1);
        first->marks()->add(Mark::redactRect(1, QRectF(10, 10, 80, 20), Qt::black));
        openMock(1);
        QVERIFY(m_bar->isHidden());

        QVERIFY(m_editor->switchTo(first->id()));
        QVERIFY(!m_bar->isHidden());
        QCOMPARE(m_bar->redactionCount(), 1);
    }
};

#endif // REDACTAPPLYBARTESTS_H
