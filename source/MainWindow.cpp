// ============================================================================
// MainWindow - Implementation
// ============================================================================

#include "MainWindow.h"

#include "core/NotesStore.h"
#include "core/ShortcutManager.h"
#include "pdf/PdfProvider.h"
#include "ui/NotesEditor.h"
#include "ui/PdfPageView.h"
#include "ui/ShortcutsDialog.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QSettings>
#include <QSplitter>
#include <QStandardPaths>
#include <QStatusBar>
#include <QTimer>

// ============================================================================
// Constructor / Destructor
// ============================================================================

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_coordinator(new GestureCoordinator(this))
    , m_notesStore(std::make_unique<JsonNotesStore>())
{
    setAcceptDrops(true);
    setupUi();
    createActions();
    createMenus();
    loadSettings();

    connect(ShortcutManager::instance(), &ShortcutManager::shortcutChanged,
            this, &MainWindow::onShortcutChanged);

    updateWindowTitle();
    showStatus(tr("Open a PDF to start (Ctrl+O or drag a file here)"));
}

MainWindow::~MainWindow()
{
    // Views hold raw pointers to the provider
    m_coordinator->setProvider(nullptr);
    m_pageView->setProvider(nullptr);
}

void MainWindow::setupUi()
{
    m_splitter = new QSplitter(Qt::Horizontal, this);

    m_pageView = new PdfPageView(m_coordinator, m_splitter);
    m_notesEditor = new NotesEditor(m_coordinator, m_splitter);
    m_coordinator->setRichTextSurface(m_notesEditor);

    m_splitter->addWidget(m_pageView);
    m_splitter->addWidget(m_notesEditor);
    m_splitter->setSizes({700, 500});
    setCentralWidget(m_splitter);

    connect(m_notesEditor, &NotesEditor::contentModified, this, &MainWindow::onNotesModified);
    connect(m_pageView, &PdfPageView::pageChanged, this, &MainWindow::onPageChanged);
    connect(m_coordinator, &GestureCoordinator::payloadChanged, this, &MainWindow::onPayloadChanged);
    connect(m_coordinator, &GestureCoordinator::actionIgnored, this, &MainWindow::onActionIgnored);
    connect(m_coordinator, &GestureCoordinator::placementCommitted, this, [this](const QSize& size) {
        showStatus(tr("Image inserted (%1×%2)").arg(size.width()).arg(size.height()));
    });

    m_autosaveTimer = new QTimer(this);
    connect(m_autosaveTimer, &QTimer::timeout, this, &MainWindow::onAutosaveTimeout);

    resize(1200, 800);
}

// ============================================================================
// Actions & Menus
// ============================================================================

QAction* MainWindow::makeAction(const QString& actionId, const QString& text, QWidget* shortcutHost)
{
    auto* action = new QAction(text, this);
    action->setShortcut(ShortcutManager::instance()->keySequenceForAction(actionId));

    if (shortcutHost) {
        action->setShortcutContext(Qt::WidgetWithChildrenShortcut);
        shortcutHost->addAction(action);
    }

    m_actions.insert(actionId, action);
    return action;
}

void MainWindow::createActions()
{
    // ===== File =====
    connect(makeAction("file.open_pdf", tr("&Open PDF...")), &QAction::triggered,
            this, &MainWindow::openPdfDialog);
    connect(makeAction("file.save_notes", tr("&Save Notes")), &QAction::triggered,
            this, &MainWindow::saveNotes);
    connect(makeAction("file.quit", tr("E&xit")), &QAction::triggered, this, &MainWindow::close);

    // ===== Capture (page view) =====
    connect(makeAction("capture.copy_text", tr("&Copy Selected Text"), m_pageView),
            &QAction::triggered, m_coordinator, &GestureCoordinator::copySelectedText);
    connect(makeAction("capture.screenshot", tr("Capture &Screenshot"), m_pageView),
            &QAction::triggered, m_coordinator, &GestureCoordinator::captureScreenshot);
    connect(makeAction("capture.paste", tr("&Paste Capture into Notes"), m_pageView),
            &QAction::triggered, m_coordinator, &GestureCoordinator::paste);
    connect(makeAction("capture.paste_global", tr("Paste Capture")),
            &QAction::triggered, m_coordinator, &GestureCoordinator::paste);
    connect(makeAction("selection.clear", tr("Clear Selection"), m_pageView),
            &QAction::triggered, m_coordinator, &GestureCoordinator::clearSelection);
    connect(makeAction("placement.cancel", tr("Cancel Image &Placement"), m_notesEditor),
            &QAction::triggered, this, [this]() {
        if (m_coordinator->cancelPlacement()) {
            showStatus(tr("Placement cancelled, the capture is still available"));
        }
    });

    // ===== Navigation =====
    connect(makeAction("navigation.prev_page", tr("&Previous Page"), m_pageView),
            &QAction::triggered, m_pageView, &PdfPageView::previousPage);
    connect(makeAction("navigation.next_page", tr("&Next Page"), m_pageView),
            &QAction::triggered, m_pageView, &PdfPageView::nextPage);
    connect(makeAction("navigation.prev_page_alt", tr("Previous Page"), m_pageView),
            &QAction::triggered, m_pageView, &PdfPageView::previousPage);
    connect(makeAction("navigation.next_page_alt", tr("Next Page"), m_pageView),
            &QAction::triggered, m_pageView, &PdfPageView::nextPage);

    // ===== Zoom =====
    connect(makeAction("zoom.in", tr("Zoom &In")), &QAction::triggered,
            m_pageView, &PdfPageView::zoomIn);
    connect(makeAction("zoom.out", tr("Zoom &Out")), &QAction::triggered,
            m_pageView, &PdfPageView::zoomOut);
    connect(makeAction("zoom.reset", tr("&Reset Zoom")), &QAction::triggered,
            m_pageView, &PdfPageView::resetZoom);

    // ===== Formatting (notes editor) =====
    connect(makeAction("format.bold", tr("Bold"), m_notesEditor), &QAction::triggered,
            m_notesEditor, &NotesEditor::toggleBold);
    connect(makeAction("format.italic", tr("Italic"), m_notesEditor), &QAction::triggered,
            m_notesEditor, &NotesEditor::toggleItalic);
    connect(makeAction("format.underline", tr("Underline"), m_notesEditor), &QAction::triggered,
            m_notesEditor, &NotesEditor::toggleUnderline);

    // ===== Help =====
    connect(makeAction("help.shortcuts", tr("&Keyboard Shortcuts")), &QAction::triggered,
            this, &MainWindow::showShortcutsDialog);
}

void MainWindow::createMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_actions.value("file.open_pdf"));
    fileMenu->addAction(m_actions.value("file.save_notes"));
    fileMenu->addSeparator();
    fileMenu->addAction(m_actions.value("file.quit"));

    QMenu* editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(m_actions.value("capture.copy_text"));
    editMenu->addAction(m_actions.value("capture.screenshot"));
    editMenu->addAction(m_actions.value("capture.paste_global"));
    editMenu->addAction(m_actions.value("placement.cancel"));

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    viewMenu->addAction(m_actions.value("zoom.in"));
    viewMenu->addAction(m_actions.value("zoom.out"));
    viewMenu->addAction(m_actions.value("zoom.reset"));
    viewMenu->addSeparator();
    viewMenu->addAction(m_actions.value("navigation.prev_page"));
    viewMenu->addAction(m_actions.value("navigation.next_page"));

    QMenu* helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(m_actions.value("help.shortcuts"));
    QAction* aboutAction = helpMenu->addAction(tr("&About"));
    connect(aboutAction, &QAction::triggered, this, &MainWindow::showAboutDialog);
}

void MainWindow::onShortcutChanged(const QString& actionId, const QString& newShortcut)
{
    QAction* action = m_actions.value(actionId);
    if (action) {
        action->setShortcut(QKeySequence(newShortcut));
    }
}

// ============================================================================
// Settings
// ============================================================================

void MainWindow::loadSettings()
{
    QSettings settings("PdfNotes", "App");

    m_lastDirectory = settings.value("lastDirectory",
        QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation)).toString();

    const QByteArray splitterState = settings.value("splitterState").toByteArray();
    if (!splitterState.isEmpty()) {
        m_splitter->restoreState(splitterState);
    }

    const int autosaveSeconds = settings.value("autosaveIntervalSec", DEFAULT_AUTOSAVE_SECONDS).toInt();
    if (autosaveSeconds > 0) {
        m_autosaveTimer->start(autosaveSeconds * 1000);
    }

    const qreal asyncThreshold = settings.value("asyncCapturePixels",
        CaptureEngine::DEFAULT_ASYNC_PIXEL_THRESHOLD).toDouble();
    m_coordinator->captureEngine()->setAsyncPixelThreshold(asyncThreshold);
}

void MainWindow::saveSettings()
{
    QSettings settings("PdfNotes", "App");
    settings.setValue("lastDirectory", m_lastDirectory);
    settings.setValue("splitterState", m_splitter->saveState());
}

// ============================================================================
// Document / Notes
// ============================================================================

void MainWindow::openPdfDialog()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), m_lastDirectory,
                                                      tr("PDF Files (*.pdf)"));
    if (!path.isEmpty()) {
        openPdf(path);
    }
}

bool MainWindow::openPdf(const QString& path)
{
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(path);
    if (!provider) {
        QMessageBox::warning(this, tr("Open PDF"), tr("Could not open \"%1\".").arg(path));
        return false;
    }

    // Notes of the previous PDF go to disk before they are replaced
    if (m_notesDirty && !saveNotes()) {
        qWarning() << "MainWindow: Could not save notes for" << m_pdfPath;
    }

    const LinkKey key = LinkResolver::resolve(path);

    // Detach views before the old provider is destroyed
    m_coordinator->setProvider(provider.get());
    m_pageView->setProvider(provider.get());
    m_provider = std::move(provider);

    m_pdfPath = LinkResolver::normalizePath(path);
    m_linkKey = key;
    m_lastDirectory = QFileInfo(m_pdfPath).absolutePath();

    const NoteDocument notes = m_notesStore->load(m_linkKey);
    if (notes.isValid()) {
        m_notesEditor->setContent(notes.content, notes.images);
        showStatus(tr("Loaded %1 with saved notes").arg(QFileInfo(m_pdfPath).fileName()));
    } else {
        m_notesEditor->clearContent();
        showStatus(tr("Loaded %1").arg(QFileInfo(m_pdfPath).fileName()));
    }

    m_notesDirty = false;
    updateWindowTitle();
    m_pageView->setFocus();
    return true;
}

bool MainWindow::saveNotes()
{
    if (m_linkKey.isNull()) {
        return true;
    }

    NoteDocument doc;
    doc.pdfPath = m_pdfPath;
    doc.pdfFileName = QFileInfo(m_pdfPath).fileName();
    doc.content = m_notesEditor->html();
    doc.images = m_notesEditor->referencedImages();
    doc.lastModified = QDateTime::currentDateTime();

    if (!m_notesStore->save(m_linkKey, doc)) {
        showStatus(tr("Failed to save notes"));
        return false;
    }

    m_notesDirty = false;
    updateWindowTitle();
    showStatus(tr("Notes saved"));
    return true;
}

void MainWindow::onNotesModified()
{
    if (m_linkKey.isNull() || m_notesDirty) {
        return;
    }
    m_notesDirty = true;
    updateWindowTitle();
}

void MainWindow::onAutosaveTimeout()
{
    if (m_notesDirty) {
        saveNotes();
    }
}

bool MainWindow::maybeSave()
{
    if (!m_notesDirty) {
        return true;
    }

    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, tr("Unsaved Notes"),
        tr("The notes for \"%1\" have unsaved changes. Save them?")
            .arg(QFileInfo(m_pdfPath).fileName()),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save);

    if (reply == QMessageBox::Save) {
        return saveNotes();
    }
    return reply == QMessageBox::Discard;
}

void MainWindow::updateWindowTitle()
{
    const QString name = m_pdfPath.isEmpty() ? tr("Untitled") : QFileInfo(m_pdfPath).fileName();
    setWindowTitle(QStringLiteral("%1%2 - %3").arg(m_notesDirty ? QStringLiteral("*") : QString(),
                                                   name, tr("PDF Notes")));
}

// ============================================================================
// Coordinator feedback
// ============================================================================

void MainWindow::onPayloadChanged()
{
    const ClipboardPayload& payload = m_coordinator->payload();
    if (payload.isText()) {
        showStatus(payload.text.isEmpty()
            ? tr("No text found in the selection")
            : tr("Copied %1 characters").arg(payload.text.length()));
    } else if (payload.isImage()) {
        showStatus(tr("Screenshot captured (%1×%2). Press P to paste it into the notes.")
                       .arg(payload.width()).arg(payload.height()));
    }
}

void MainWindow::onActionIgnored(GestureCoordinator::IgnoredReason reason)
{
    switch (reason) {
        case GestureCoordinator::IgnoredReason::NoDocument:
            showStatus(tr("Open a PDF first"));
            break;
        case GestureCoordinator::IgnoredReason::NoSelection:
            showStatus(tr("No selection. Select a region first."));
            break;
        case GestureCoordinator::IgnoredReason::CaptureBusy:
            showStatus(tr("Still capturing the previous selection"));
            break;
        case GestureCoordinator::IgnoredReason::CaptureFailed:
            showStatus(tr("Could not capture the selection"));
            break;
        case GestureCoordinator::IgnoredReason::PlacementActive:
            showStatus(tr("Finish placing the current image first (click outside it or press Escape)"));
            break;
        case GestureCoordinator::IgnoredReason::SelectionInProgress:
            showStatus(tr("Finish the selection first"));
            break;
        case GestureCoordinator::IgnoredReason::NothingToPaste:
            showStatus(tr("Nothing to paste. Capture text (C) or a screenshot (S) first."));
            break;
    }
}

void MainWindow::onPageChanged(int pageIndex, int pageCount)
{
    Q_UNUSED(pageIndex);
    Q_UNUSED(pageCount);
    updateWindowTitle();
}

void MainWindow::showStatus(const QString& message)
{
    statusBar()->showMessage(message, STATUS_TIMEOUT_MS);
}

// ============================================================================
// Dialogs
// ============================================================================

void MainWindow::showShortcutsDialog()
{
    ShortcutsDialog dialog(this);
    dialog.exec();

    if (!dialog.saveChanges()) {
        QMessageBox::warning(this, tr("Keyboard Shortcuts"),
            tr("Could not save shortcuts to %1.")
                .arg(ShortcutManager::instance()->configFilePath()));
    }
}

void MainWindow::showAboutDialog()
{
    QMessageBox::about(this, tr("About PDF Notes"),
        tr("<h3>PDF Notes</h3>"
           "<p>Read a PDF next to your notes. Drag a rectangle over the page, "
           "press C to copy its text or S to capture it as an image, then P to "
           "paste it into the notes and drag or resize the image before clicking "
           "outside it to insert.</p>"
           "<p>PDF backend: %1</p>").arg(PdfProvider::backendName()));
}

// ============================================================================
// Window events
// ============================================================================

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (!maybeSave()) {
        event->ignore();
        return;
    }
    saveSettings();
    event->accept();
}

QString MainWindow::pdfPathFromMime(const QMimeData* mime)
{
    if (!mime || !mime->hasUrls()) {
        return QString();
    }
    for (const QUrl& url : mime->urls()) {
        if (url.isLocalFile() && url.toLocalFile().endsWith(".pdf", Qt::CaseInsensitive)) {
            return url.toLocalFile();
        }
    }
    return QString();
}

void MainWindow::dragEnterEvent(QDragEnterEvent *event)
{
    if (!pdfPathFromMime(event->mimeData()).isEmpty()) {
        event->acceptProposedAction();
    }
}

void MainWindow::dropEvent(QDropEvent *event)
{
    const QString path = pdfPathFromMime(event->mimeData());
    if (path.isEmpty()) {
        return;
    }
    event->acceptProposedAction();
    openPdf(path);
}
