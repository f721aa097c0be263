// ============================================================================
// PdfNotes - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QFileInfo>
#include <QDebug>

#include "MainWindow.h"

// Test includes (desktop only)
#ifndef Q_OS_ANDROID
#include "core/ViewportTransformTests.h"
#include "core/SelectionTrackerTests.h"
#include "core/CaptureEngineTests.h"
#include "core/PlacementOverlayTests.h"
#include "core/LinkResolverTests.h"
#include "core/NotesStoreTests.h"
#include "core/GestureCoordinatorTests.h"
#include "core/ShortcutManagerTests.h"
#include "ui/ShortcutsDialogTests.h"
#endif

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings("PdfNotes", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/pdfnotes/translations",
        "/usr/local/share/pdfnotes/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "pdfnotes/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners (Desktop Only)
// ============================================================================

#ifndef Q_OS_ANDROID
static int runTests(const QString& testType)
{
    static const QStringList knownTests = {
        "all", "viewport", "selection", "capture", "placement",
        "link", "notes-store", "gesture", "shortcuts", "shortcuts-dialog"
    };
    if (!knownTests.contains(testType)) {
        qWarning() << "Unknown test suite:" << testType;
        return 2;
    }

    int failures = 0;
    const bool all = (testType == "all");

    if (all || testType == "viewport") {
        failures += runViewportTransformTests();
    }
    if (all || testType == "selection") {
        failures += runSelectionTrackerTests();
    }
    if (all || testType == "capture") {
        failures += runCaptureEngineTests();
    }
    if (all || testType == "placement") {
        failures += runPlacementOverlayTests();
    }
    if (all || testType == "link") {
        failures += runLinkResolverTests();
    }
    if (all || testType == "notes-store") {
        failures += runNotesStoreTests();
    }
    if (all || testType == "gesture") {
        failures += runGestureCoordinatorTests();
    }
    if (all || testType == "shortcuts") {
        failures += runShortcutManagerTests();
    }
    if (all || testType == "shortcuts-dialog") {
        failures += runShortcutsDialogTests();
    }

    return failures == 0 ? 0 : 1;
}
#endif

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("PdfNotes");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString inputFile;

#ifndef Q_OS_ANDROID
    QString testToRun;
#endif

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

#ifndef Q_OS_ANDROID
        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
            continue;
        }
#endif
        if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

#ifndef Q_OS_ANDROID
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }
#endif

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Launch Application ==========
    MainWindow w;
    w.show();

    if (!inputFile.isEmpty()) {
        w.openPdf(QFileInfo(inputFile).absoluteFilePath());
    }

    return app.exec();
}
