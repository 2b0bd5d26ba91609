#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QApplication>
#include <QMainWindow>
#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QPointer>
#include <QSettings>
#include <QTemporaryDir>
#include <QRegularExpression>
#include "pluginmenu.h"
#include "packageregistry.h"
#include "fakeplugin.h"

using namespace plx;

// Records the dialogs instead of showing them
class RecordingMenu : public PluginMenu {
public:
    using PluginMenu::PluginMenu;

    QStringList errorTitles;
    QStringList errors;
    QStringList messages;
    QString     chosenLibrary;

protected:
    void showError(const QString& title, const QString& text) override {
        errorTitles.append(title);
        errors.append(text);
    }
    void showMessage(const QString&, const QString& text) override { messages.append(text); }
    QString chooseLibrary() override { return chosenLibrary; }
};

static QStringList actionTexts(const QList<QAction*>& actions) {
    QStringList result;
    for (QAction* a : actions)
        result.append(a->isSeparator() ? QStringLiteral("-") : a->text());
    return result;
}

static QAction* findItem(PluginMenu& pm, const QString& className) {
    for (QAction* a : pm.menus())
        if (a->objectName() == className) return a;
    return nullptr;
}

class TestPluginMenu : public QObject {
    Q_OBJECT
private:
    QTemporaryDir  m_settingsDir;
    PluginManager* m_mgr = nullptr;

    std::shared_ptr<FakeState> m_one, m_two, m_three, m_top;

    static void setDebugMode(bool on) {
        QSettings("Plugix", "Plugix").setValue("plugins/debug", on);
    }

private slots:
    void initTestCase() {
        // Keep the test away from the user's settings
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_settingsDir.path());
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_settingsDir.path());
    }

    void init() {
        setDebugMode(false);

        auto& reg = PackageRegistry::instance();
        reg.clear();
        reg.registerBuiltinPackage("a", "Analysis");
        reg.registerBuiltinPackage("a.b", "Beta");

        m_mgr = new PluginManager;
        m_one   = registerFake(*m_mgr, "a.b.One");
        m_two   = registerFake(*m_mgr, "a.Two");
        m_three = registerFake(*m_mgr, "c.Three");   // "c" has no label
        m_top   = registerFake(*m_mgr, "Top");
        m_mgr->Refresh();
    }

    void cleanup() {
        delete m_mgr;
        m_mgr = nullptr;
    }

    // ── Construction ──

    void addsPluginsMenuToMainWindow() {
        QMainWindow window;
        auto* pm = new PluginMenu(m_mgr, &window);

        QMenu* menu = pm->menu();
        QVERIFY(menu);
        QCOMPARE(menu->title(), QString("&Plugins"));
        QCOMPARE(menu->objectName(), QString("plugins"));
        QVERIFY(window.menuBar()->actions().contains(menu->menuAction()));
        QVERIFY(!pm->isLoading());
        QCOMPARE(pm->manager(), m_mgr);
        delete pm;
    }

    void adoptsExistingMenu() {
        QMenuBar bar;
        QMenu* menu = bar.addMenu("Extensions");
        auto* pm = new PluginMenu(m_mgr, menu);
        QCOMPARE(pm->menu(), menu);
        QCOMPARE(menu->title(), QString("Extensions"));
        delete pm;
    }

    void deletingPluginMenuDeletesMenu() {
        auto* pm = new PluginMenu(m_mgr);
        QPointer<QMenu> menu = pm->menu();
        QVERIFY(menu);
        delete pm;
        QVERIFY(menu.isNull());
    }

    void deletingMenuDeletesPluginMenu() {
        QMenuBar bar;
        QPointer<PluginMenu> pm = new PluginMenu(m_mgr, &bar);
        delete pm->menu();
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
        QVERIFY(pm.isNull());

        // The manager no longer talks to a dead menu
        m_mgr->RemovePlugin("Top");
    }

    void internalItemsComeLast() {
        PluginMenu pm(m_mgr);
        QStringList texts = actionTexts(pm.menu()->actions());

        QCOMPARE(texts.mid(texts.size() - 5),
                 QStringList({"-", "&Import Plugin...", "&Manage Plugins...", "-", "&Reload Plugins"}));

        auto actions = pm.menu()->actions();
        QCOMPARE(actions.last()->toolTip(), QString("Reload all active plugins"));
        QCOMPARE(actions.at(actions.size() - 3)->toolTip(), QString("Manage installed plugins"));
    }

    // ── Layout ──

    void itemsFollowLabelledPackages() {
        PluginMenu pm(m_mgr);
        QMenu* menu = pm.menu();

        QCOMPARE(pm.menus().size(), 4);
        QCOMPARE(pm.classes(), QStringList({"a.b.One", "a.Two", "c.Three", "Top"}));

        // Top level: the "Analysis" submenu, then the flattened plugins
        QStringList top = actionTexts(menu->actions()).mid(0, 3);
        QCOMPARE(top, QStringList({"Analysis", "Three", "Top"}));

        auto* analysis = menu->findChild<QMenu*>("a");
        QVERIFY(analysis);
        QCOMPARE(actionTexts(analysis->actions()), QStringList({"Beta", "Two"}));

        auto* beta = menu->findChild<QMenu*>("a.b");
        QVERIFY(beta);
        QCOMPARE(actionTexts(beta->actions()), QStringList({"One"}));
        QCOMPARE(beta->actions().first()->objectName(), QString("a.b.One"));

        // No submenu for packages without a label
        QVERIFY(!menu->findChild<QMenu*>("c"));
    }

    void pluginItemShowsDescription() {
        PluginMenu pm(m_mgr);
        QAction* one = findItem(pm, "a.b.One");
        QVERIFY(one);
        QCOMPARE(one->text(), QString("One"));
        QCOMPARE(one->toolTip(), QString("Description of a.b.One"));
    }

    void addedPluginLandsBeforeInternalItems() {
        PluginMenu pm(m_mgr);
        registerFake(*m_mgr, "Late");
        m_mgr->Refresh();

        QCOMPARE(pm.menus().size(), 5);
        QStringList texts = actionTexts(pm.menu()->actions());
        QCOMPARE(texts.indexOf("Late"), 3);
        QCOMPARE(texts.last(), QString("&Reload Plugins"));
    }

    void removedPluginLeavesMenuAndEmptySubmenusGo() {
        PluginMenu pm(m_mgr);
        QMenu* menu = pm.menu();

        QVERIFY(m_mgr->RemovePlugin("a.b.One"));
        QVERIFY(!findItem(pm, "a.b.One"));
        QVERIFY(!menu->findChild<QMenu*>("a.b"));
        QVERIFY(menu->findChild<QMenu*>("a"));

        QVERIFY(m_mgr->RemovePlugin("a.Two"));
        QVERIFY(!menu->findChild<QMenu*>("a"));
        QCOMPARE(pm.menus().size(), 2);
    }

    void managerClearEmptiesMenu() {
        PluginMenu pm(m_mgr);
        m_mgr->Clear();

        QVERIFY(pm.menus().isEmpty());
        QVERIFY(!pm.menu()->findChild<QMenu*>("a"));
        QCOMPARE(actionTexts(pm.menu()->actions()),
                 QStringList({"-", "&Import Plugin...", "&Manage Plugins...", "-", "&Reload Plugins"}));
    }

    // ── Availability ──

    void unavailablePluginIsDisabledWithReason() {
        PluginMenu pm(m_mgr);
        m_two->available = false;
        m_two->reason = "Needs an image";

        pm.checkAvailability();

        QAction* two = findItem(pm, "a.Two");
        QVERIFY(!two->isEnabled());
        QCOMPARE(two->toolTip(), QString("Needs an image"));
        QCOMPARE(two->data().toString(), QString("Needs an image"));
        QVERIFY(findItem(pm, "a.b.One")->isEnabled());

        m_two->available = true;
        pm.checkAvailability();
        QVERIFY(two->isEnabled());
        QCOMPARE(two->toolTip(), QString("Description of a.Two"));
        QVERIFY(two->data().toString().isEmpty());
    }

    void availabilityCheckedWhenMenuOpens() {
        PluginMenu pm(m_mgr);
        m_top->available = false;
        m_top->reason = "Not now";

        emit pm.menu()->aboutToShow();

        QVERIFY(!findItem(pm, "Top")->isEnabled());
        QCOMPARE(findItem(pm, "Top")->toolTip(), QString("Not now"));
    }

    void availabilityExceptionDisablesItem() {
        PluginMenu pm(m_mgr);
        m_two->throwOnAvailable = true;
        m_two->reason = "no image";

        QTest::ignoreMessage(QtWarningMsg, "PluginMenu: Availability check of \"a.Two\" threw: \"no image\"");
        pm.checkAvailability();

        QAction* two = findItem(pm, "a.Two");
        QVERIFY(!two->isEnabled());
        QCOMPARE(two->toolTip(), QString("no image"));
        QCOMPARE(two->data().toString(), QString("no image"));
        QVERIFY(findItem(pm, "Top")->isEnabled());
    }

    void availabilityIgnoredWhileLoading() {
        PluginMenu pm(m_mgr);
        bool loading = false;
        int callsDuringReload = -1;
        connect(m_mgr, &PluginManager::cleared, &pm, [&]() {
            loading = pm.isLoading();
            const int before = m_one->availableCalls;
            pm.checkAvailability();
            callsDuringReload = m_one->availableCalls - before;
        });

        pm.reload();

        QVERIFY(loading);
        QCOMPARE(callsDuringReload, 0);

        const int before = m_one->availableCalls;
        pm.checkAvailability();
        QCOMPARE(m_one->availableCalls, before + 1);
    }

    // ── Callback ──

    void triggerRunsLifecycle() {
        RecordingMenu pm(m_mgr);
        QSignalSpy status(&pm, &PluginMenu::status);

        findItem(pm, "a.Two")->trigger();

        QCOMPARE(m_two->validateCalls, 1);
        QCOMPARE(m_two->runCalls, 1);
        QCOMPARE(m_two->cleanupCalls, 1);
        QVERIFY(pm.errors.isEmpty());
        QCOMPARE(status.count(), 2);
        QCOMPARE(status.at(0).at(0).toString(), QString("Running Two..."));
        QVERIFY(status.at(1).at(0).toString().isEmpty());
    }

    void validationFailureShowsErrorAndSkipsRun() {
        RecordingMenu pm(m_mgr);
        m_one->validateOk = false;
        m_one->validateError = "bad input";

        findItem(pm, "a.b.One")->trigger();

        QCOMPARE(m_one->runCalls, 0);
        QCOMPARE(m_one->cleanupCalls, 1);
        QCOMPARE(pm.errorTitles, QStringList({"Plugin Error"}));
        QCOMPARE(pm.errors.first(), QString("One Plugin failed to complete.\n\nERROR: bad input"));
    }

    void runFailureClearsPluginStatus() {
        RecordingMenu pm(m_mgr);
        m_three->runOk = false;
        m_three->runError = "no data";

        IPlugin* three = m_mgr->FindPlugin("c.Three");
        pm.callback(three);

        QVERIFY(three->status().isEmpty());
        QCOMPARE(pm.errors.first(), QString("Three Plugin failed to complete.\n\nERROR: no data"));
        QCOMPARE(m_three->cleanupCalls, 1);
    }

    void exceptionFromPluginIsReported() {
        RecordingMenu pm(m_mgr);
        m_top->throwOnRun = true;
        m_top->runError = "boom";

        findItem(pm, "Top")->trigger();

        QCOMPARE(pm.errors.size(), 1);
        QVERIFY(pm.errors.first().endsWith("ERROR: boom"));
        QCOMPARE(m_top->cleanupCalls, 1);
    }

    void validationExceptionIsReported() {
        RecordingMenu pm(m_mgr);
        m_one->throwOnValidate = true;
        m_one->validateError = "bad state";

        findItem(pm, "a.b.One")->trigger();

        QCOMPARE(m_one->runCalls, 0);
        QCOMPARE(m_one->cleanupCalls, 1);
        QCOMPARE(pm.errors, QStringList({"One Plugin failed to complete.\n\nERROR: bad state"}));
    }

    void cleanupExceptionIsOnlyLogged() {
        RecordingMenu pm(m_mgr);
        QSignalSpy status(&pm, &PluginMenu::status);
        m_two->throwOnCleanup = true;
        m_two->cleanupError = "locked";

        QTest::ignoreMessage(QtWarningMsg, "Plugin cleanup for a.Two was unsuccessful.");
        QTest::ignoreMessage(QtWarningMsg, "locked");
        findItem(pm, "a.Two")->trigger();

        QVERIFY(pm.errors.isEmpty());
        QCOMPARE(m_two->runCalls, 1);
        QCOMPARE(status.count(), 2);
        QVERIFY(status.last().at(0).toString().isEmpty());
    }

    void foreignExceptionsAreUnknownErrors() {
        RecordingMenu pm(m_mgr);
        m_top->throwForeign = true;

        m_top->throwOnRun = true;
        findItem(pm, "Top")->trigger();
        QCOMPARE(pm.errors, QStringList({"Top Plugin failed to complete.\n\nERROR: Unknown error"}));
        QCOMPARE(m_top->cleanupCalls, 1);

        m_top->throwOnRun = false;
        m_top->throwOnCleanup = true;
        QTest::ignoreMessage(QtWarningMsg, "Plugin cleanup for Top was unsuccessful.");
        QTest::ignoreMessage(QtWarningMsg, "Unknown error");
        findItem(pm, "Top")->trigger();
        QCOMPARE(pm.errors.size(), 1);

        m_top->throwOnAvailable = true;
        QTest::ignoreMessage(QtWarningMsg, "PluginMenu: Availability check of \"Top\" threw: \"Unknown error\"");
        emit pm.menu()->aboutToShow();
        QVERIFY(!findItem(pm, "Top")->isEnabled());
        QCOMPARE(findItem(pm, "Top")->toolTip(), QString("Unknown error"));
    }

    void cleanupFailureIsOnlyLogged() {
        RecordingMenu pm(m_mgr);
        m_two->cleanupOk = false;
        m_two->cleanupError = "still busy";

        QTest::ignoreMessage(QtWarningMsg, "Plugin cleanup for a.Two was unsuccessful.");
        QTest::ignoreMessage(QtWarningMsg, "still busy");
        findItem(pm, "a.Two")->trigger();

        QVERIFY(pm.errors.isEmpty());
        QCOMPARE(m_two->runCalls, 1);
    }

    void debugModeLogsInsteadOfShowingDialog() {
        setDebugMode(true);
        QVERIFY(PluginMenu::debugMode());

        RecordingMenu pm(m_mgr);
        m_one->runOk = false;
        m_one->runError = "broken";

        QTest::ignoreMessage(QtCriticalMsg, QRegularExpression("a\\.b\\.One.*failed.*broken"));
        findItem(pm, "a.b.One")->trigger();

        QVERIFY(pm.errors.isEmpty());
        setDebugMode(false);
    }

    // ── remove / reset / reload ──

    void removeByIndex() {
        PluginMenu pm(m_mgr);
        QVERIFY(pm.remove(3));
        QVERIFY(!findItem(pm, "Top"));
        QCOMPARE(pm.plugins().size(), 3);
    }

    void removeSeveralIndices() {
        PluginMenu pm(m_mgr);
        QVERIFY(pm.remove(QList<int>({0, 1, 1})));
        QCOMPARE(pm.classes(), QStringList({"c.Three", "Top"}));
        QVERIFY(!pm.menu()->findChild<QMenu*>("a"));
    }

    void removeOutOfRangeFails() {
        PluginMenu pm(m_mgr);
        QString error;
        QVERIFY(!pm.remove(4, &error));
        QCOMPARE(error, QString("Index must be between 0 and 3"));
        QVERIFY(!pm.remove(-1, &error));
        QCOMPARE(pm.plugins().size(), 4);

        // Nothing is removed if any index is bad
        QVERIFY(!pm.remove(QList<int>({0, 9}), &error));
        QCOMPARE(pm.plugins().size(), 4);
    }

    void removeWithNothingLoaded() {
        PluginMenu pm(m_mgr);
        m_mgr->Clear();

        QString error;
        QTest::ignoreMessage(QtWarningMsg, "PluginMenu: \"No plugins are loaded\"");
        QVERIFY(!pm.remove(0, &error));
        QCOMPARE(error, QString("No plugins are loaded"));
    }

    void resetKeepsRemovedPluginsRemoved() {
        PluginMenu pm(m_mgr);
        QVERIFY(pm.remove(0));
        pm.reset();

        QCOMPARE(pm.menus().size(), 3);
        QVERIFY(!findItem(pm, "a.b.One"));
        QVERIFY(pm.menu()->findChild<QMenu*>("a"));
        QCOMPARE(actionTexts(pm.menu()->actions()).last(), QString("&Reload Plugins"));
    }

    void reloadBringsBackRemovedPlugins() {
        RecordingMenu pm(m_mgr);
        QVERIFY(pm.remove(0));
        QPointer<QAction> oldTwo = findItem(pm, "a.Two");
        QSignalSpy status(&pm, &PluginMenu::status);

        pm.reload();

        QVERIFY(!pm.isLoading());
        QCOMPARE(pm.menus().size(), 4);
        QVERIFY(findItem(pm, "a.b.One"));
        QVERIFY(oldTwo.isNull());
        QCOMPARE(m_one->constructed, 2);
        QCOMPARE(m_two->constructed, 2);
        QCOMPARE(status.count(), 1);
        QCOMPARE(status.at(0).at(0).toString(), QString("Reloaded 4 plugin(s)"));

        // Items of the reloaded plugins run the new instances
        findItem(pm, "a.Two")->trigger();
        QCOMPARE(m_two->runCalls, 1);
    }

    void managerNotificationsIgnoredDuringReload() {
        PluginMenu pm(m_mgr);
        int itemsAtClear = -1;
        QList<int> itemsAtAdd;
        connect(m_mgr, &PluginManager::cleared, &pm, [&]() { itemsAtClear = pm.menus().size(); });
        connect(m_mgr, &PluginManager::pluginAdded, &pm, [&]() { itemsAtAdd.append(pm.menus().size()); });

        pm.reload();

        // Outside a reload, cleared() would have emptied the menu right away
        QCOMPARE(itemsAtClear, 4);
        QCOMPARE(itemsAtAdd, QList<int>({0, 0, 0, 0}));
        QCOMPARE(pm.menus().size(), 4);
    }

    void reloadFromMenuItem() {
        PluginMenu pm(m_mgr);
        QVERIFY(pm.remove(3));
        pm.menu()->actions().last()->trigger();
        QVERIFY(findItem(pm, "Top"));
    }

    void deletedManagerLeavesInertMenu() {
        RecordingMenu pm(m_mgr);
        QPointer<QAction> two = findItem(pm, "a.Two");
        QVERIFY(two);

        delete m_mgr;
        m_mgr = nullptr;

        QVERIFY(two.isNull());
        QVERIFY(pm.menus().isEmpty());
        QVERIFY(pm.plugins().isEmpty());
        QVERIFY(pm.classes().isEmpty());
        QVERIFY(!pm.manager());

        emit pm.menu()->aboutToShow();
        pm.refresh();
        pm.menu()->actions().last()->trigger();
        QCOMPARE(actionTexts(pm.menu()->actions()),
                 QStringList({"-", "&Import Plugin...", "&Manage Plugins...", "-", "&Reload Plugins"}));

        QString error;
        QTest::ignoreMessage(QtWarningMsg, "PluginMenu: \"No plugins are loaded\"");
        QVERIFY(!pm.remove(0, &error));
        QVERIFY(!pm.importPlugin(QString(PLX_HELLO_PLUGIN_PATH)));
        QVERIFY(pm.errors.isEmpty());
        QVERIFY(pm.messages.isEmpty());
    }

    // ── Import ──

    void importCancelledDoesNothing() {
        RecordingMenu pm(m_mgr);
        pm.chosenLibrary.clear();
        pm.importPlugin();

        QVERIFY(pm.errors.isEmpty());
        QVERIFY(pm.messages.isEmpty());
        QCOMPARE(m_mgr->sourceCount(), 4);
    }

    void importFailureShowsError() {
        RecordingMenu pm(m_mgr);
        QVERIFY(!pm.importPlugin(QString("/nonexistent/libnothing.so")));

        QCOMPARE(pm.errors.size(), 1);
        QVERIFY(pm.errors.first().startsWith("UNKNOWN Plugin Installation Failed!"));
        QVERIFY(pm.messages.isEmpty());
    }

    void importFromMenuItemInstallsAndReloads() {
        RecordingMenu pm(m_mgr);
        pm.chosenLibrary = PLX_HELLO_PLUGIN_PATH;

        QAction* importItem = nullptr;
        for (QAction* a : pm.menu()->actions())
            if (a->text() == "&Import Plugin...") importItem = a;
        QVERIFY(importItem);
        importItem->trigger();

        QVERIFY2(pm.errors.isEmpty(), qPrintable(pm.errors.join('\n')));
        QCOMPARE(pm.messages, QStringList({"Hello Plugin Installed Successfully"}));

        QAction* hello = findItem(pm, "samples.Hello");
        QVERIFY(hello);
        auto* samples = pm.menu()->findChild<QMenu*>("samples");
        QVERIFY(samples);
        QCOMPARE(samples->title(), QString("Samples"));
        QCOMPARE(pm.menus().size(), 5);
    }
};

QTEST_MAIN(TestPluginMenu)
#include "test_plugin_menu.moc"
