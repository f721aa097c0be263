#ifndef SHORTCUTMANAGERTESTS_H
#define SHORTCUTMANAGERTESTS_H

#include <QFile>
#include <QObject>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>
#include "ShortcutManager.h"

/**
 * Unit tests for ShortcutManager (defaults, scopes, overrides, persistence).
 * Run with: pdfnotes --test-shortcuts
 */
class ShortcutManagerTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Keep the user's shortcuts.json out of reach
        QStandardPaths::setTestModeEnabled(true);
        QFile::remove(ShortcutManager::instance()->configFilePath());
        ShortcutManager::instance()->resetAllToDefaults();
    }

    void cleanupTestCase() {
        ShortcutManager::instance()->resetAllToDefaults();
        QFile::remove(ShortcutManager::instance()->configFilePath());
    }

    void testDefaults() {
        ShortcutManager* sm = ShortcutManager::instance();
        QCOMPARE(sm->shortcutForAction("file.open_pdf"), QString("Ctrl+O"));
        QCOMPARE(sm->shortcutForAction("capture.copy_text"), QString("C"));
        QCOMPARE(sm->shortcutForAction("capture.screenshot"), QString("S"));
        QCOMPARE(sm->shortcutForAction("capture.paste"), QString("P"));
        QCOMPARE(sm->scopeForAction("capture.paste"), ShortcutManager::Scope::PageView);
        QCOMPARE(sm->scopeForAction("placement.cancel"), ShortcutManager::Scope::NotesEditor);
        QVERIFY(sm->shortcutForAction("no.such.action").isEmpty());
        QVERIFY(sm->keySequenceForAction("no.such.action").isEmpty());
    }

    void testScopedConflicts() {
        ShortcutManager* sm = ShortcutManager::instance();

        // Escape is bound in both panes without clashing
        QVERIFY(sm->findConflicts("Escape", "selection.clear").isEmpty());
        QVERIFY(sm->findConflicts("Escape", "placement.cancel").isEmpty());

        // Window-wide keys clash with everything
        QCOMPARE(sm->findConflicts("C", "file.quit"), QStringList() << "capture.copy_text");
        QCOMPARE(sm->findConflicts("Ctrl+O"), QStringList() << "file.open_pdf");

        // Page view keys don't clash with editor formatting
        QVERIFY(sm->findConflicts("Ctrl+B", "capture.paste").isEmpty());
    }

    void testUserOverride() {
        ShortcutManager* sm = ShortcutManager::instance();
        QSignalSpy spy(sm, &ShortcutManager::shortcutChanged);

        sm->setUserShortcut("capture.screenshot", "ctrl+shift+s");
        QCOMPARE(sm->shortcutForAction("capture.screenshot"), QString("Ctrl+Shift+S"));
        QVERIFY(sm->isUserOverridden("capture.screenshot"));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.first().at(0).toString(), QString("capture.screenshot"));

        // Setting the default again drops the override
        sm->setUserShortcut("capture.screenshot", "S");
        QVERIFY(!sm->isUserOverridden("capture.screenshot"));
        QCOMPARE(spy.count(), 2);

        // Unknown actions are rejected
        sm->setUserShortcut("no.such.action", "Ctrl+K");
        QVERIFY(!sm->hasAction("no.such.action"));
        QCOMPARE(spy.count(), 2);
    }

    void testSaveAndLoad() {
        ShortcutManager* sm = ShortcutManager::instance();

        sm->setUserShortcut("capture.paste", "Ctrl+Shift+P");
        QVERIFY(sm->saveUserShortcuts());
        QVERIFY(QFile::exists(sm->configFilePath()));

        sm->clearUserShortcut("capture.paste");
        QCOMPARE(sm->shortcutForAction("capture.paste"), QString("P"));

        QVERIFY(sm->loadUserShortcuts());
        QCOMPARE(sm->shortcutForAction("capture.paste"), QString("Ctrl+Shift+P"));

        sm->resetAllToDefaults();
        QCOMPARE(sm->shortcutForAction("capture.paste"), QString("P"));
    }

    void testCorruptConfig() {
        ShortcutManager* sm = ShortcutManager::instance();

        QFile file(sm->configFilePath());
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("not json at all");
        file.close();

        QVERIFY(!sm->loadUserShortcuts());
        QCOMPARE(sm->shortcutForAction("capture.paste"), QString("P"));
    }

    void testCategories() {
        ShortcutManager* sm = ShortcutManager::instance();
        const QStringList categories = sm->allCategories();
        QVERIFY(categories.contains("Capture"));
        QVERIFY(categories.contains("File"));
        QVERIFY(sm->actionsInCategory("Capture").contains("capture.screenshot"));
        QCOMPARE(sm->displayNameForAction("file.open_pdf"), QString("Open PDF"));
    }
};

inline int runShortcutManagerTests() {
    ShortcutManagerTests tests;
    return QTest::qExec(&tests);
}

#endif // SHORTCUTMANAGERTESTS_H
