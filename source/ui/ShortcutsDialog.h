#pragma once

// ============================================================================
// ShortcutsDialog - View and edit keyboard shortcuts
// ============================================================================
// One row per ShortcutManager action, grouped by category. Edits apply
// immediately (MainWindow rebinds its actions on shortcutChanged) and are
// written to shortcuts.json when the dialog closes with changes.
// A key already used in an overlapping scope is refused and the row reverts.
// ============================================================================

#include <QDialog>
#include <QHash>
#include <QKeySequence>

class QKeySequenceEdit;
class QLabel;
class QTreeWidget;
class QTreeWidgetItem;

class ShortcutsDialog : public QDialog {
    Q_OBJECT

public:
    explicit ShortcutsDialog(QWidget* parent = nullptr);

    /**
     * @brief Assign @p keys to an action.
     * @return False if the action is unknown or the keys clash with another
     *         action; the row is reverted and the clash reported.
     */
    bool applyShortcut(const QString& actionId, const QKeySequence& keys);

    /**
     * @brief Write overrides to disk if anything was changed.
     * @return False on write failure.
     */
    bool saveChanges();

    bool hasChanges() const { return m_changed; }
    QString conflictMessage() const;
    QKeySequenceEdit* editorForAction(const QString& actionId) const { return m_editors.value(actionId); }

public slots:
    void resetSelected();
    void resetAll();

private:
    void populate();
    void refreshRow(const QString& actionId);

    QTreeWidget* m_tree = nullptr;
    QLabel* m_messageLabel = nullptr;
    QHash<QString, QKeySequenceEdit*> m_editors;
    QHash<QString, QTreeWidgetItem*> m_items;
    bool m_changed = false;
};
