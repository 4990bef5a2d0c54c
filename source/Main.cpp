// ============================================================================
// PdfOverlay - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QTimer>

#include "MainWindow.h"
#include "core/Preferences.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

// Test includes
#include "objects/ElementTests.h"
#include "core/PageTests.h"
#include "core/DocumentTests.h"
#include "core/HistoryTests.h"
#include "core/SnapEngineTests.h"
#include "core/PreferencesTests.h"
#include "core/EditorSessionTests.h"
#include "pdf/MuPdfExporterTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    bool success = false;

    if (testType == "elements") {
        success = ElementTests::runAllTests();
    } else if (testType == "page") {
        success = PageTests::runAllTests();
    } else if (testType == "document") {
        success = DocumentTests::runAllTests();
    } else if (testType == "history") {
        success = HistoryTests::runAllTests();
    } else if (testType == "snap") {
        success = SnapEngineTests::runAllTests();
    } else if (testType == "preferences") {
        success = PreferencesTests::runAllTests();
    } else if (testType == "export") {
        success = MuPdfExporterTests::runAllTests();
    } else if (testType == "session") {
        success = EditorSessionTests::runAllTests();
    } else {
        qWarning() << "[Main] Unknown test suite:" << testType;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("PdfOverlay");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("-") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Preferences ==========
    QSettings settings("PdfOverlay", "App");
    Preferences preferences = Preferences::load(settings);

    // ========== Main Window ==========
    MainWindow window(preferences);
    window.show();

    if (!inputFile.isEmpty()) {
        const QString path = QFileInfo(inputFile).absoluteFilePath();
        // Open once the event loop runs so error dialogs have a visible parent
        QTimer::singleShot(0, &window, [&window, path]() {
            window.openFile(path);
        });
    }

    return app.exec();
}
