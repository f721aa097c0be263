#ifndef SHORTCUTMANAGER_H
#define SHORTCUTMANAGER_H

#include <QObject>
#include <QString>
#include <QHash>
#include <QKeySequence>
#include <QStringList>

/**
 * @brief Keyboard shortcut registry with user overrides.
 *
 * Every user-facing trigger (open, save, copy text, capture, paste,
 * cancel placement, page/zoom navigation, formatting) is registered here
 * with a default key. Overrides live in <AppConfigLocation>/shortcuts.json:
 *
 *   { "version": 1, "overrides": { "capture.screenshot": "Ctrl+Shift+S" } }
 *
 * Usage:
 *   QAction* act = new QAction(tr("Capture Screenshot"), this);
 *   act->setShortcut(ShortcutManager::instance()->keySequenceForAction("capture.screenshot"));
 *   connect(ShortcutManager::instance(), &ShortcutManager::shortcutChanged, ...);
 */
class ShortcutManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Where a shortcut is active, used for conflict detection.
     *
     * PageView and NotesEditor shortcuts are bound with
     * Qt::WidgetWithChildrenShortcut, so the same key may be used by both.
     */
    enum class Scope {
        Global,       ///< Window-wide
        PageView,     ///< Only while the PDF page view has focus
        NotesEditor   ///< Only while the notes editor has focus
    };

    /**
     * @brief Get the singleton instance.
     * Registers the defaults and loads overrides on first call.
     */
    static ShortcutManager* instance();

    /**
     * @brief Register the application's actions and default keys.
     */
    void registerDefaults();

    /**
     * @brief Register an action with its default shortcut.
     *
     * Re-registering updates the default/name/category and keeps any
     * user override.
     */
    void registerAction(const QString& actionId,
                        const QString& defaultShortcut,
                        const QString& displayName,
                        const QString& category,
                        Scope scope = Scope::Global);

    bool hasAction(const QString& actionId) const;

    // ========== Shortcut Retrieval ==========

    /**
     * @brief Current shortcut (override if set, otherwise default).
     * Empty if the action is not registered.
     */
    QString shortcutForAction(const QString& actionId) const;
    QKeySequence keySequenceForAction(const QString& actionId) const;
    QString defaultShortcutForAction(const QString& actionId) const;
    bool isUserOverridden(const QString& actionId) const;
    Scope scopeForAction(const QString& actionId) const;

    // ========== User Customization ==========

    /**
     * @brief Override an action's shortcut. Setting the default again
     * removes the override. Emits shortcutChanged; does not save.
     */
    void setUserShortcut(const QString& actionId, const QString& shortcut);

    void clearUserShortcut(const QString& actionId);

    void resetAllToDefaults();

    // ========== Persistence ==========

    /**
     * @return False if the file exists but can't be read or parsed.
     */
    bool loadUserShortcuts();

    /**
     * @brief Write overrides only.
     * @return False on write failure.
     */
    bool saveUserShortcuts();

    QString configFilePath() const { return m_configPath; }

    // ========== Conflict Detection ==========

    /**
     * @brief Actions whose current shortcut equals @p shortcut and whose
     * scope overlaps the scope of @p excludeActionId (Global if none).
     */
    QStringList findConflicts(const QString& shortcut,
                              const QString& excludeActionId = QString()) const;

    // ========== UI Helpers ==========
    QStringList allCategories() const;
    QStringList actionsInCategory(const QString& category) const;
    QString displayNameForAction(const QString& actionId) const;

signals:
    /**
     * @brief Emitted when an action's effective shortcut changes.
     */
    void shortcutChanged(const QString& actionId, const QString& newShortcut);

private:
    explicit ShortcutManager(QObject* parent = nullptr);
    ~ShortcutManager() override = default;

    ShortcutManager(const ShortcutManager&) = delete;
    ShortcutManager& operator=(const ShortcutManager&) = delete;

    struct ShortcutEntry {
        QString defaultShortcut;   ///< Built-in default
        QString userShortcut;      ///< Override (empty = use default)
        QString displayName;
        QString category;
        Scope scope = Scope::Global;
    };

    static bool scopesCanConflict(Scope a, Scope b);

    QHash<QString, ShortcutEntry> m_shortcuts;
    QString m_configPath;

    static ShortcutManager* s_instance;
};

#endif // SHORTCUTMANAGER_H
