// ============================================================================
// ShortcutsDialog - Implementation
// ============================================================================

#include "ShortcutsDialog.h"
#include "../core/ShortcutManager.h"

#include <QDebug>
#include <QDialogButtonBox>
#include <QFont>
#include <QHeaderView>
#include <QKeySequenceEdit>
#include <QLabel>
#include <QPushButton>
#include <QSignalBlocker>
#include <QTreeWidget>
#include <QVBoxLayout>

ShortcutsDialog::ShortcutsDialog(QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Keyboard Shortcuts"));
    resize(520, 520);

    auto* layout = new QVBoxLayout(this);

    m_tree = new QTreeWidget(this);
    m_tree->setHeaderLabels({tr("Action"), tr("Shortcut")});
    m_tree->setRootIsDecorated(true);
    m_tree->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(m_tree);

    m_messageLabel = new QLabel(this);
    m_messageLabel->setWordWrap(true);
    m_messageLabel->setStyleSheet("color: #c62828;");
    m_messageLabel->hide();
    layout->addWidget(m_messageLabel);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Close, this);
    QPushButton* resetSelectedButton = buttons->addButton(tr("Reset Selected"), QDialogButtonBox::ResetRole);
    QPushButton* resetAllButton = buttons->addButton(tr("Reset All"), QDialogButtonBox::ResetRole);
    connect(resetSelectedButton, &QPushButton::clicked, this, &ShortcutsDialog::resetSelected);
    connect(resetAllButton, &QPushButton::clicked, this, &ShortcutsDialog::resetAll);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttons);

    populate();
}

void ShortcutsDialog::populate()
{
    ShortcutManager* shortcuts = ShortcutManager::instance();

    for (const QString& category : shortcuts->allCategories()) {
        auto* categoryItem = new QTreeWidgetItem(m_tree, {category});
        categoryItem->setFlags(Qt::ItemIsEnabled);

        for (const QString& actionId : shortcuts->actionsInCategory(category)) {
            auto* item = new QTreeWidgetItem(categoryItem, {shortcuts->displayNameForAction(actionId)});
            item->setData(0, Qt::UserRole, actionId);
            item->setToolTip(0, tr("Default: %1").arg(shortcuts->defaultShortcutForAction(actionId)));

            auto* editor = new QKeySequenceEdit(m_tree);
            editor->setKeySequence(shortcuts->keySequenceForAction(actionId));
            connect(editor, &QKeySequenceEdit::editingFinished, this, [this, actionId, editor]() {
                applyShortcut(actionId, editor->keySequence());
            });

            m_tree->setItemWidget(item, 1, editor);
            m_editors.insert(actionId, editor);
            m_items.insert(actionId, item);
            refreshRow(actionId);
        }
    }

    m_tree->expandAll();
    m_tree->header()->setSectionResizeMode(0, QHeaderView::Stretch);
}

void ShortcutsDialog::refreshRow(const QString& actionId)
{
    ShortcutManager* shortcuts = ShortcutManager::instance();

    QKeySequenceEdit* editor = m_editors.value(actionId);
    if (editor) {
        const QKeySequence current = shortcuts->keySequenceForAction(actionId);
        if (editor->keySequence() != current) {
            QSignalBlocker blocker(editor);
            editor->setKeySequence(current);
        }
    }

    // Overridden rows in bold
    QTreeWidgetItem* item = m_items.value(actionId);
    if (item) {
        QFont font = item->font(0);
        font.setBold(shortcuts->isUserOverridden(actionId));
        item->setFont(0, font);
    }
}

bool ShortcutsDialog::applyShortcut(const QString& actionId, const QKeySequence& keys)
{
    ShortcutManager* shortcuts = ShortcutManager::instance();
    if (!shortcuts->hasAction(actionId)) {
        qWarning() << "[ShortcutsDialog] Unknown action:" << actionId;
        return false;
    }

    const QString shortcut = keys.toString(QKeySequence::PortableText);
    if (shortcut == shortcuts->shortcutForAction(actionId)) {
        m_messageLabel->hide();
        return true;
    }

    const QStringList conflicts = shortcuts->findConflicts(shortcut, actionId);
    if (!conflicts.isEmpty()) {
        QStringList names;
        for (const QString& other : conflicts) {
            names.append(shortcuts->displayNameForAction(other));
        }
        m_messageLabel->setText(tr("%1 is already used by: %2")
                                    .arg(keys.toString(QKeySequence::NativeText), names.join(", ")));
        m_messageLabel->show();
        refreshRow(actionId);
        return false;
    }

    shortcuts->setUserShortcut(actionId, shortcut);
    m_changed = true;
    m_messageLabel->hide();
    refreshRow(actionId);
    return true;
}

void ShortcutsDialog::resetSelected()
{
    QTreeWidgetItem* item = m_tree->currentItem();
    if (!item) {
        return;
    }
    const QString actionId = item->data(0, Qt::UserRole).toString();
    if (actionId.isEmpty() || !ShortcutManager::instance()->isUserOverridden(actionId)) {
        return;
    }

    ShortcutManager::instance()->clearUserShortcut(actionId);
    m_changed = true;
    m_messageLabel->hide();
    refreshRow(actionId);
}

void ShortcutsDialog::resetAll()
{
    ShortcutManager::instance()->resetAllToDefaults();
    m_changed = true;
    m_messageLabel->hide();
    for (auto it = m_editors.constBegin(); it != m_editors.constEnd(); ++it) {
        refreshRow(it.key());
    }
}

bool ShortcutsDialog::saveChanges()
{
    if (!m_changed) {
        return true;
    }
    if (!ShortcutManager::instance()->saveUserShortcuts()) {
        return false;
    }
    m_changed = false;
    return true;
}

QString ShortcutsDialog::conflictMessage() const
{
    return m_messageLabel->isVisibleTo(this) ? m_messageLabel->text() : QString();
}
