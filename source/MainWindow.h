#ifndef MAINWINDOW_H
#define MAINWINDOW_H

// ============================================================================
// MainWindow - PDF on the left, notes on the right
// ============================================================================

#include "core/LinkResolver.h"
#include "core/GestureCoordinator.h"

#include <QHash>
#include <QMainWindow>
#include <memory>

class NotesEditor;
class NotesStore;
class PdfPageView;
class PdfProvider;
class QAction;
class QMimeData;
class QSplitter;
class QTimer;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_AUTOSAVE_SECONDS = 30;
    static constexpr int STATUS_TIMEOUT_MS = 5000;

    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open a PDF and its notes. Saves unsaved notes of the previous PDF.
     * @return False if the file could not be opened (previous PDF stays open).
     */
    bool openPdf(const QString& path);

public slots:
    void openPdfDialog();

    /**
     * @return True if saved or nothing needed saving.
     */
    bool saveNotes();

protected:
    void closeEvent(QCloseEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private slots:
    void onNotesModified();
    void onAutosaveTimeout();
    void onPayloadChanged();
    void onActionIgnored(GestureCoordinator::IgnoredReason reason);
    void onPageChanged(int pageIndex, int pageCount);
    void onShortcutChanged(const QString& actionId, const QString& newShortcut);
    void showShortcutsDialog();
    void showAboutDialog();

private:
    void setupUi();
    void createActions();
    void createMenus();
    void loadSettings();
    void saveSettings();
    void updateWindowTitle();
    void showStatus(const QString& message);

    /**
     * @brief Create an action bound to a ShortcutManager id.
     * @param shortcutHost Widget that scopes the shortcut; nullptr for window-wide.
     */
    QAction* makeAction(const QString& actionId, const QString& text, QWidget* shortcutHost = nullptr);

    /**
     * @brief Ask whether to save unsaved notes.
     * @return False if the user cancelled.
     */
    bool maybeSave();

    static QString pdfPathFromMime(const QMimeData* mime);

    GestureCoordinator* m_coordinator = nullptr;
    PdfPageView* m_pageView = nullptr;
    NotesEditor* m_notesEditor = nullptr;
    QSplitter* m_splitter = nullptr;
    QTimer* m_autosaveTimer = nullptr;

    std::unique_ptr<PdfProvider> m_provider;
    std::unique_ptr<NotesStore> m_notesStore;

    QString m_pdfPath;
    LinkKey m_linkKey;
    bool m_notesDirty = false;

    QHash<QString, QAction*> m_actions;   ///< By ShortcutManager action id
    QString m_lastDirectory;
};

#endif // MAINWINDOW_H
