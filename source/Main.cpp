// ============================================================================
// PdfDesk - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QTranslator>
#include <QLocale>
#include <QStandardPaths>
#include <QTest>
#include <QDebug>

#include "MainWindow.h"

#include "core/CoordinateTransformTests.h"
#include "core/UndoStackTests.h"
#include "core/MarkStoreTests.h"
#include "core/WorkspaceTests.h"
#include "core/EditorSessionTests.h"
#include "tools/ToolModeControllerTests.h"
#include "viewport/PageRenderPipelineTests.h"
#include "viewport/MarkPainterTests.h"
#include "ui/PageThumbnailModelTests.h"
#include "ui/banners/RedactApplyBarTests.h"
#include "pdf/MuPdfEngineTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    const QString langCode = QLocale::system().name().section('_', 0, 0);

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/pdfdesk/translations",
        "/usr/local/share/pdfdesk/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "pdfdesk/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/pdfdesk_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

template <typename T>
static int runSuite()
{
    T tests;
    return QTest::qExec(&tests);
}

static int runTests(const QString& testType)
{
    if (testType == "transform") {
        return runSuite<CoordinateTransformTests>();
    } else if (testType == "undo") {
        return runSuite<UndoStackTests>();
    } else if (testType == "marks") {
        return runSuite<MarkStoreTests>();
    } else if (testType == "workspace") {
        return runSuite<WorkspaceTests>();
    } else if (testType == "editor") {
        return runSuite<EditorSessionTests>();
    } else if (testType == "tools") {
        return runSuite<ToolModeControllerTests>();
    } else if (testType == "render") {
        return runSuite<PageRenderPipelineTests>();
    } else if (testType == "painter") {
        return runSuite<MarkPainterTests>();
    } else if (testType == "model") {
        return runSuite<PageThumbnailModelTests>();
    } else if (testType == "bar") {
        return runSuite<RedactApplyBarTests>();
    } else if (testType == "mupdf") {
        return runSuite<MuPdfEngineTests>();
    } else if (testType == "all") {
        int failures = 0;
        for (const char* area : {"transform", "undo", "marks", "workspace", "editor",
                                 "tools", "render", "painter", "model", "bar", "mupdf"}) {
            failures += runTests(QString::fromLatin1(area));
        }
        return failures == 0 ? 0 : 1;
    }

    qWarning() << "Unknown test area:" << testType;
    return 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("PdfDesk");
    app.setApplicationName("PdfDesk");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QStringList inputFiles;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--")) {
            inputFiles << arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();
    for (const QString& path : inputFiles) {
        w->openFile(path);
    }
    return app.exec();
}
