#pragma once
#include "pluginmanager.h"
#include <QObject>
#include <QMenu>
#include <QMenuBar>
#include <QMainWindow>
#include <QAction>
#include <QPointer>
#include <QList>

namespace plx {

/**
 * Hierarchical menu of all loaded plugins
 *
 * Plugins are laid out by the package prefixes of their class names and
 * the items are enabled/disabled on every opening of the menu depending on
 * whether each plugin is available. The PluginMenu lives as long as its
 * QMenu: deleting either one deletes the other.
 */
class PluginMenu : public QObject {
    Q_OBJECT
public:
    // Standalone "&Plugins" menu
    explicit PluginMenu(PluginManager* manager);
    // Use an existing menu as the plugin menu
    PluginMenu(PluginManager* manager, QMenu* menu);
    // Add a "&Plugins" menu to a menu bar
    PluginMenu(PluginManager* manager, QMenuBar* menuBar);
    PluginMenu(PluginManager* manager, QMainWindow* window);
    ~PluginMenu() override;

    QMenu*         menu() const { return m_menu; }
    PluginManager* manager() const { return m_manager.data(); }

    // Menu items of the plugins (internal items excluded)
    QList<QAction*> menus() const;

    // Empty once the manager is gone
    QStringList       classes() const;
    QVector<IPlugin*> plugins() const;

    bool isLoading() const { return m_loading; }

    // Remove the items of plugins that are gone and add the new ones
    void refresh();
    // Reload every plugin, including the removed ones
    void reload();
    // Rebuild the menu from the plugins loaded right now
    void reset();

    // Remove plugin(s) by index into plugins()
    bool remove(int index, QString* errorMsg = nullptr);
    bool remove(const QList<int>& indices, QString* errorMsg = nullptr);

    // Run a plugin: validate, run, cleanup
    void callback(IPlugin* plugin);

    // Update enabled state and tooltips of the plugin items
    void checkAvailability();

    // Ask for a plugin library and install it
    void importPlugin();
    bool importPlugin(const QString& path);

    // Show the "Manage Plugins" dialog
    void managePlugins();

    static bool debugMode();

signals:
    void status(const QString& message);

protected:
    virtual void showError(const QString& title, const QString& text);
    virtual void showMessage(const QString& title, const QString& text);
    virtual QString chooseLibrary();

private:
    void initialize();
    void appendMenuItems(const QVector<IPlugin*>& plugins);
    void deleteEmptySubmenus();
    void deletePluginItems();
    void onManagerChanged();
    QList<QAction*> internalMenus() const;
    QList<QAction*> findActions(const QString& tag) const;
    QMenu* findSubmenu(const QString& tag) const;
    void placeAction(QMenu* parent, QAction* action);
    QAction* addInternalItem(const QString& text, const QString& toolTip);
    QWidget* dialogParent() const;

    QPointer<PluginManager> m_manager;
    QPointer<QMenu>         m_menu;
    QList<QPointer<QAction>> m_menus;     // plugin items
    QList<QPointer<QMenu>>  m_submenus;   // package submenus

    QPointer<QAction> m_importMenu;
    QPointer<QAction> m_manageMenu;
    QPointer<QAction> m_separator;
    QPointer<QAction> m_reloadSeparator;
    QPointer<QAction> m_reloadMenu;

    bool m_loading = false;
};

} // namespace plx
