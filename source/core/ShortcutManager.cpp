#include "ShortcutManager.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QSet>
#include <QStandardPaths>

static const int kShortcutsFormatVersion = 1;

/**
 * @brief Canonical text for a key sequence so "ctrl+s" and "Ctrl+S" compare
 * equal when stored.
 */
static QString canonicalShortcut(const QString& shortcut)
{
    if (shortcut.trimmed().isEmpty()) {
        return QString();
    }
    QKeySequence seq(shortcut);
    if (seq.isEmpty()) {
        return shortcut.trimmed();
    }
    return seq.toString(QKeySequence::PortableText);
}

// ============================================================================
// Singleton Instance
// ============================================================================

ShortcutManager* ShortcutManager::s_instance = nullptr;

ShortcutManager* ShortcutManager::instance()
{
    if (!s_instance) {
        s_instance = new ShortcutManager();
        s_instance->registerDefaults();
        s_instance->loadUserShortcuts();
    }
    return s_instance;
}

ShortcutManager::ShortcutManager(QObject* parent)
    : QObject(parent)
{
    QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    QDir dir(configDir);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    m_configPath = dir.filePath("shortcuts.json");

#ifdef PDFNOTES_DEBUG
    qDebug() << "[ShortcutManager] Config path:" << m_configPath;
#endif
}

// ============================================================================
// Default Shortcuts Registration
// ============================================================================

void ShortcutManager::registerDefaults()
{
    // ===== File =====
    registerAction("file.open_pdf", "Ctrl+O", tr("Open PDF"), tr("File"));
    registerAction("file.save_notes", "Ctrl+S", tr("Save Notes"), tr("File"));
    registerAction("file.quit", "Ctrl+Q", tr("Exit"), tr("File"));

    // ===== Capture (page view has focus) =====
    registerAction("capture.copy_text", "C", tr("Copy Selected Text"), tr("Capture"), Scope::PageView);
    registerAction("capture.screenshot", "S", tr("Capture Screenshot"), tr("Capture"), Scope::PageView);
    registerAction("capture.paste", "P", tr("Paste Capture into Notes"), tr("Capture"), Scope::PageView);
    registerAction("capture.paste_global", "Ctrl+Shift+V", tr("Paste Capture (anywhere)"), tr("Capture"));
    registerAction("selection.clear", "Escape", tr("Clear Selection"), tr("Capture"), Scope::PageView);
    registerAction("placement.cancel", "Escape", tr("Cancel Image Placement"), tr("Capture"), Scope::NotesEditor);

    // ===== Navigation =====
    registerAction("navigation.prev_page", "Left", tr("Previous Page"), tr("Navigation"), Scope::PageView);
    registerAction("navigation.next_page", "Right", tr("Next Page"), tr("Navigation"), Scope::PageView);
    registerAction("navigation.prev_page_alt", "PgUp", tr("Previous Page (Alternative)"), tr("Navigation"), Scope::PageView);
    registerAction("navigation.next_page_alt", "PgDown", tr("Next Page (Alternative)"), tr("Navigation"), Scope::PageView);

    // ===== Zoom =====
    registerAction("zoom.in", "Ctrl+=", tr("Zoom In"), tr("Zoom"));
    registerAction("zoom.out", "Ctrl+-", tr("Zoom Out"), tr("Zoom"));
    registerAction("zoom.reset", "Ctrl+0", tr("Reset Zoom"), tr("Zoom"));

    // ===== Formatting =====
    registerAction("format.bold", "Ctrl+B", tr("Bold"), tr("Formatting"), Scope::NotesEditor);
    registerAction("format.italic", "Ctrl+I", tr("Italic"), tr("Formatting"), Scope::NotesEditor);
    registerAction("format.underline", "Ctrl+U", tr("Underline"), tr("Formatting"), Scope::NotesEditor);

    // ===== Help =====
    registerAction("help.shortcuts", "F1", tr("Keyboard Shortcuts"), tr("Help"));

#ifdef PDFNOTES_DEBUG
    qDebug() << "[ShortcutManager] Registered" << m_shortcuts.size() << "default shortcuts";
#endif
}

void ShortcutManager::registerAction(const QString& actionId,
                                     const QString& defaultShortcut,
                                     const QString& displayName,
                                     const QString& category,
                                     Scope scope)
{
    if (actionId.isEmpty()) {
        qWarning() << "[ShortcutManager] Cannot register action with empty ID";
        return;
    }

    // Overrides loaded before registration are kept
    ShortcutEntry& entry = m_shortcuts[actionId];
    entry.defaultShortcut = canonicalShortcut(defaultShortcut);
    entry.displayName = displayName;
    entry.category = category;
    entry.scope = scope;
}

bool ShortcutManager::scopesCanConflict(Scope a, Scope b)
{
    if (a == Scope::Global || b == Scope::Global) {
        return true;
    }
    return a == b;
}

bool ShortcutManager::hasAction(const QString& actionId) const
{
    return m_shortcuts.contains(actionId);
}

// ============================================================================
// Shortcut Retrieval
// ============================================================================

QString ShortcutManager::shortcutForAction(const QString& actionId) const
{
    auto it = m_shortcuts.constFind(actionId);
    if (it == m_shortcuts.constEnd()) {
        return QString();
    }
    return it->userShortcut.isEmpty() ? it->defaultShortcut : it->userShortcut;
}

QKeySequence ShortcutManager::keySequenceForAction(const QString& actionId) const
{
    const QString shortcut = shortcutForAction(actionId);
    return shortcut.isEmpty() ? QKeySequence() : QKeySequence(shortcut);
}

QString ShortcutManager::defaultShortcutForAction(const QString& actionId) const
{
    return m_shortcuts.value(actionId).defaultShortcut;
}

bool ShortcutManager::isUserOverridden(const QString& actionId) const
{
    return !m_shortcuts.value(actionId).userShortcut.isEmpty();
}

ShortcutManager::Scope ShortcutManager::scopeForAction(const QString& actionId) const
{
    return m_shortcuts.value(actionId).scope;
}

// ============================================================================
// User Customization
// ============================================================================

void ShortcutManager::setUserShortcut(const QString& actionId, const QString& shortcut)
{
    auto it = m_shortcuts.find(actionId);
    if (it == m_shortcuts.end()) {
        qWarning() << "[ShortcutManager] Cannot set shortcut for unregistered action:" << actionId;
        return;
    }

    const QString oldShortcut = shortcutForAction(actionId);
    const QString canonical = canonicalShortcut(shortcut);

    // Storing the default as an override would be redundant
    it->userShortcut = (canonical == it->defaultShortcut) ? QString() : canonical;

    const QString newShortcut = shortcutForAction(actionId);
    if (oldShortcut != newShortcut) {
        emit shortcutChanged(actionId, newShortcut);
    }
}

void ShortcutManager::clearUserShortcut(const QString& actionId)
{
    auto it = m_shortcuts.find(actionId);
    if (it == m_shortcuts.end() || it->userShortcut.isEmpty()) {
        return;
    }

    it->userShortcut.clear();
    emit shortcutChanged(actionId, it->defaultShortcut);
}

void ShortcutManager::resetAllToDefaults()
{
    QStringList changed;
    for (auto it = m_shortcuts.begin(); it != m_shortcuts.end(); ++it) {
        if (!it->userShortcut.isEmpty()) {
            it->userShortcut.clear();
            changed.append(it.key());
        }
    }
    for (const QString& actionId : changed) {
        emit shortcutChanged(actionId, m_shortcuts.value(actionId).defaultShortcut);
    }
}

// ============================================================================
// Persistence
// ============================================================================

bool ShortcutManager::loadUserShortcuts()
{
    QFile file(m_configPath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[ShortcutManager] Failed to open shortcuts.json:" << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[ShortcutManager] Invalid shortcuts.json:" << parseError.errorString();
        return false;
    }

    QJsonObject root = doc.object();
    int version = root.value("version").toInt(kShortcutsFormatVersion);
    if (version > kShortcutsFormatVersion) {
        qWarning() << "[ShortcutManager] Unsupported shortcuts.json version:" << version;
    }

    const QJsonObject overrides = root.value("overrides").toObject();
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        // Unknown ids get a placeholder so a later registerAction keeps them
        ShortcutEntry& entry = m_shortcuts[it.key()];
        entry.userShortcut = canonicalShortcut(it.value().toString());
        if (entry.displayName.isEmpty()) {
            entry.displayName = it.key();
        }
    }

#ifdef PDFNOTES_DEBUG
    qDebug() << "[ShortcutManager] Loaded" << overrides.size() << "shortcut overrides";
#endif
    return true;
}

bool ShortcutManager::saveUserShortcuts()
{
    QJsonObject overrides;
    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (!it->userShortcut.isEmpty()) {
            overrides.insert(it.key(), it->userShortcut);
        }
    }

    QJsonObject root;
    root.insert("version", kShortcutsFormatVersion);
    root.insert("overrides", overrides);

    QSaveFile file(m_configPath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[ShortcutManager] Failed to save shortcuts.json:" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[ShortcutManager] Failed to write shortcuts.json:" << file.errorString();
        return false;
    }
    return true;
}

// ============================================================================
// Conflict Detection
// ============================================================================

QStringList ShortcutManager::findConflicts(const QString& shortcut,
                                           const QString& excludeActionId) const
{
    QStringList conflicts;

    const QKeySequence target(shortcut);
    if (target.isEmpty()) {
        return conflicts;
    }

    const Scope ownScope = m_shortcuts.contains(excludeActionId)
        ? m_shortcuts.value(excludeActionId).scope
        : Scope::Global;

    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (it.key() == excludeActionId) {
            continue;
        }
        const QString current = shortcutForAction(it.key());
        if (current.isEmpty() || QKeySequence(current) != target) {
            continue;
        }
        if (scopesCanConflict(ownScope, it->scope)) {
            conflicts.append(it.key());
        }
    }

    conflicts.sort();
    return conflicts;
}

// ============================================================================
// UI Helpers
// ============================================================================

QStringList ShortcutManager::allCategories() const
{
    QSet<QString> categories;
    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (!it->category.isEmpty()) {
            categories.insert(it->category);
        }
    }
    QStringList result = categories.values();
    result.sort();
    return result;
}

QStringList ShortcutManager::actionsInCategory(const QString& category) const
{
    QStringList actions;
    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (it->category == category) {
            actions.append(it.key());
        }
    }
    actions.sort();
    return actions;
}

QString ShortcutManager::displayNameForAction(const QString& actionId) const
{
    return m_shortcuts.value(actionId).displayName;
}
