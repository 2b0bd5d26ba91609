#include "pluginmenu.h"
#include "packageregistry.h"
#include "plugindialog.h"
#include <QCoreApplication>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QSettings>
#include <QDebug>
#include <exception>

namespace plx {

PluginMenu::PluginMenu(PluginManager* manager)
    : PluginMenu(manager, new QMenu(QStringLiteral("&Plugins")))
{
}

PluginMenu::PluginMenu(PluginManager* manager, QMenuBar* menuBar)
    : PluginMenu(manager, menuBar->addMenu(QStringLiteral("&Plugins")))
{
}

PluginMenu::PluginMenu(PluginManager* manager, QMainWindow* window)
    : PluginMenu(manager, window->menuBar())
{
}

PluginMenu::PluginMenu(PluginManager* manager, QMenu* menu)
    : QObject(nullptr)
    , m_manager(manager)
    , m_menu(menu)
{
    // Plugins coming and going are reflected in the menu right away
    connect(manager, &PluginManager::pluginAdded,   this, &PluginMenu::onManagerChanged);
    connect(manager, &PluginManager::pluginRemoved, this, &PluginMenu::onManagerChanged);
    connect(manager, &PluginManager::cleared,       this, &PluginMenu::onManagerChanged);

    // The menu owns us: once it is gone there is nothing left to manage
    connect(menu, &QObject::destroyed, this, &QObject::deleteLater);

    // The plugin instances die with their manager, and so do their items
    connect(manager, &QObject::destroyed, this, &PluginMenu::deletePluginItems);

    initialize();
}

PluginMenu::~PluginMenu() {
    if (m_manager)
        disconnect(m_manager.data(), nullptr, this, nullptr);

    if (m_menu) {
        QMenu* menu = m_menu;
        m_menu = nullptr;
        disconnect(menu, nullptr, this, nullptr);
        delete menu;
    }
}

QList<QAction*> PluginMenu::menus() const {
    QList<QAction*> result;
    for (const auto& action : m_menus) {
        if (action) result.append(action);
    }
    return result;
}

QStringList PluginMenu::classes() const {
    return m_manager ? m_manager->classes() : QStringList();
}

QVector<IPlugin*> PluginMenu::plugins() const {
    return m_manager ? m_manager->plugins() : QVector<IPlugin*>();
}

bool PluginMenu::debugMode() {
    return QSettings("Plugix", "Plugix").value("plugins/debug", false).toBool();
}

// ── Menu construction ──

QAction* PluginMenu::addInternalItem(const QString& text, const QString& toolTip) {
    auto* action = m_menu->addAction(text);
    action->setToolTip(toolTip);
    action->setStatusTip(toolTip);
    return action;
}

void PluginMenu::initialize() {
    m_menu->setObjectName(QStringLiteral("plugins"));
    m_menu->setToolTipsVisible(true);

    // Disable availability checks while we build everything
    m_loading = true;

    // Check availability of all plugins every time the menu is opened
    connect(m_menu.data(), &QMenu::aboutToShow, this, &PluginMenu::checkAvailability, Qt::UniqueConnection);

    // Ensure that the internal items are always there
    if (!m_separator) {
        m_separator = m_menu->addSeparator();
    }
    if (!m_importMenu) {
        QAction* action = addInternalItem("&Import Plugin...", "Install a plugin from a shared library");
        connect(action, &QAction::triggered, this, [this]() { importPlugin(); });
        m_importMenu = action;
    }
    if (!m_manageMenu) {
        QAction* action = addInternalItem("&Manage Plugins...", "Manage installed plugins");
        connect(action, &QAction::triggered, this, &PluginMenu::managePlugins);
        m_manageMenu = action;
    }
    if (!m_reloadSeparator) {
        m_reloadSeparator = m_menu->addSeparator();
    }
    if (!m_reloadMenu) {
        QAction* action = addInternalItem("&Reload Plugins", "Reload all active plugins");
        connect(action, &QAction::triggered, this, &PluginMenu::reload);
        m_reloadMenu = action;
    }

    refresh();

    // Internal items always come last, in a fixed order
    for (QAction* action : internalMenus()) {
        m_menu->removeAction(action);
        m_menu->addAction(action);
    }

    m_loading = false;
}

QList<QAction*> PluginMenu::internalMenus() const {
    QList<QAction*> result;
    for (QAction* action : {m_separator.data(), m_importMenu.data(), m_manageMenu.data(),
                            m_reloadSeparator.data(), m_reloadMenu.data()}) {
        if (action) result.append(action);
    }
    return result;
}

void PluginMenu::placeAction(QMenu* parent, QAction* action) {
    if (parent == m_menu && m_separator && m_menu->actions().contains(m_separator))
        parent->insertAction(m_separator, action);
    else
        parent->addAction(action);
}

QMenu* PluginMenu::findSubmenu(const QString& tag) const {
    for (const auto& submenu : m_submenus) {
        if (submenu && submenu->objectName() == tag)
            return submenu;
    }
    return nullptr;
}

QList<QAction*> PluginMenu::findActions(const QString& tag) const {
    QList<QAction*> result;
    for (const auto& action : m_menus) {
        if (action && action->objectName() == tag)
            result.append(action);
    }
    return result;
}

void PluginMenu::appendMenuItems(const QVector<IPlugin*>& plugins) {
    const auto& registry = PackageRegistry::instance();

    for (IPlugin* plugin : plugins) {
        const QString className = QString::fromStdString(plugin->ClassName());
        const QStringList pieces = className.split(QLatin1Char('.'));

        QMenu* parent = m_menu;

        // Walk the package prefixes, one submenu per labelled package
        for (int m = 1; m < pieces.size(); ++m) {
            const QString tag = pieces.mid(0, m).join(QLatin1Char('.'));
            const QString label = registry.label(tag);

            // Packages without a label are flattened into their parent
            if (label.isEmpty())
                continue;

            QMenu* submenu = findSubmenu(tag);
            if (!submenu) {
                submenu = new QMenu(label, parent);
                submenu->setObjectName(tag);
                submenu->setToolTipsVisible(true);
                placeAction(parent, submenu->menuAction());
                m_submenus.append(submenu);
            }
            parent = submenu;
        }

        QAction* action = plugin->createMenuAction(parent);
        action->setObjectName(className);

        // Look the plugin up on every click: the instance may have been
        // replaced by a reload since the item was created
        connect(action, &QAction::triggered, this, [this, className]() {
            IPlugin* current = m_manager ? m_manager->FindPlugin(className) : nullptr;
            if (!current) {
                qWarning() << "PluginMenu: Plugin no longer loaded:" << className;
                return;
            }
            callback(current);
        });

        placeAction(parent, action);
        m_menus.append(action);
    }
}

void PluginMenu::deleteEmptySubmenus() {
    bool deleted = true;
    while (deleted) {
        deleted = false;
        for (int i = m_submenus.size() - 1; i >= 0; --i) {
            QMenu* submenu = m_submenus[i];
            if (!submenu) {
                m_submenus.removeAt(i);
                continue;
            }
            if (submenu->actions().isEmpty()) {
                m_submenus.removeAt(i);
                delete submenu;
                deleted = true;
            }
        }
    }
}

void PluginMenu::deletePluginItems() {
    for (const auto& action : m_menus)
        delete action.data();
    m_menus.clear();

    for (const auto& submenu : m_submenus)
        delete submenu.data();
    m_submenus.clear();
}

// ── Public operations ──

void PluginMenu::refresh() {
    if (!m_menu || !m_manager)
        return;

    // Forget items that were deleted behind our back
    for (int i = m_menus.size() - 1; i >= 0; --i) {
        if (!m_menus[i])
            m_menus.removeAt(i);
    }

    const QStringList classes = m_manager->classes();

    // Items of plugins that are gone
    for (int i = m_menus.size() - 1; i >= 0; --i) {
        QAction* action = m_menus[i];
        if (!classes.contains(action->objectName())) {
            m_menus.removeAt(i);
            delete action;
        }
    }

    // Plugins that have no item yet
    QStringList tags;
    for (const auto& action : m_menus)
        tags.append(action->objectName());

    QVector<IPlugin*> missing;
    for (IPlugin* plugin : m_manager->plugins()) {
        if (!tags.contains(QString::fromStdString(plugin->ClassName())))
            missing.append(plugin);
    }

    if (!missing.isEmpty())
        appendMenuItems(missing);

    deleteEmptySubmenus();
}

void PluginMenu::reload() {
    if (!m_manager)
        return;

    m_loading = true;

    // Reload all plugins, including the removed ones
    m_manager->Clear();
    deletePluginItems();
    m_manager->Refresh();

    // If there was a menu before, be sure to keep it there
    if (m_menu)
        reset();

    m_loading = false;

    qDebug() << "PluginMenu: Reloaded" << m_manager->plugins().size() << "plugin(s)";
    emit status(QString("Reloaded %1 plugin(s)").arg(m_manager->plugins().size()));
}

void PluginMenu::reset() {
    if (!m_menu)
        return;
    deletePluginItems();
    initialize();
}

bool PluginMenu::remove(int index, QString* errorMsg) {
    return remove(QList<int>{index}, errorMsg);
}

bool PluginMenu::remove(const QList<int>& indices, QString* errorMsg) {
    const QVector<IPlugin*> plugins = this->plugins();

    QStringList toDelete;
    for (int index : indices) {
        if (index < 0 || index >= plugins.size()) {
            QString msg = plugins.isEmpty()
                ? QStringLiteral("No plugins are loaded")
                : QString("Index must be between 0 and %1").arg(plugins.size() - 1);
            qWarning() << "PluginMenu:" << msg;
            if (errorMsg) *errorMsg = msg;
            return false;
        }

        QString className = QString::fromStdString(plugins[index]->ClassName());
        if (!toDelete.contains(className))
            toDelete.append(className);
    }

    // pluginRemoved() refreshes the menu
    for (const QString& className : toDelete)
        m_manager->RemovePlugin(className);

    return true;
}

void PluginMenu::callback(IPlugin* plugin) {
    if (!plugin || !m_manager)
        return;

    const QVariant& data = m_manager->data();
    const QString name = QString::fromStdString(plugin->Name());
    const QString className = QString::fromStdString(plugin->ClassName());

    emit status(QString("Running %1...").arg(name));

    QString error;
    bool ok = false;
    try {
        ok = plugin->validate(data, &error) && plugin->run(data, &error);
    } catch (const std::exception& e) {
        ok = false;
        error = QString::fromLocal8Bit(e.what());
    } catch (...) {
        ok = false;
        error = QStringLiteral("Unknown error");
    }

    if (!ok) {
        plugin->setStatus(QString());
        if (error.isEmpty())
            error = QStringLiteral("Unknown error");

        if (debugMode()) {
            qCritical() << "PluginMenu:" << className << "failed:" << error;
        } else {
            showError("Plugin Error",
                      QString("%1 Plugin failed to complete.\n\nERROR: %2").arg(name, error));
        }
    }

    QString cleanupError;
    bool cleaned = false;
    try {
        cleaned = plugin->cleanup(&cleanupError);
    } catch (const std::exception& e) {
        cleanupError = QString::fromLocal8Bit(e.what());
    } catch (...) {
        cleanupError = QStringLiteral("Unknown error");
    }
    if (!cleaned) {
        qWarning().noquote() << QString("Plugin cleanup for %1 was unsuccessful.").arg(className);
        if (!cleanupError.isEmpty())
            qWarning().noquote() << cleanupError;
    }

    emit status(QString());
}

void PluginMenu::checkAvailability() {
    if (m_loading || !m_manager)
        return;

    const QVariant& data = m_manager->data();

    for (IPlugin* plugin : m_manager->plugins()) {
        const QString className = QString::fromStdString(plugin->ClassName());

        QString reason;
        bool available = false;
        try {
            available = plugin->isAvailable(data, &reason);
        } catch (const std::exception& e) {
            reason = QString::fromLocal8Bit(e.what());
            qWarning() << "PluginMenu: Availability check of" << className << "threw:" << reason;
        } catch (...) {
            reason = QStringLiteral("Unknown error");
            qWarning() << "PluginMenu: Availability check of" << className << "threw:" << reason;
        }

        // The tooltip shows the description, or why the plugin is disabled
        const QString tooltip = available ? QString::fromStdString(plugin->Description()) : reason;
        for (QAction* action : findActions(className)) {
            action->setEnabled(available);
            action->setData(available ? QString() : reason);
            action->setToolTip(tooltip);
        }
    }
}

// ── Import / manage ──

void PluginMenu::importPlugin() {
    QString path = chooseLibrary();

    // The user hit cancel
    if (path.isEmpty())
        return;

    importPlugin(path);
}

bool PluginMenu::importPlugin(const QString& path) {
    if (path.isEmpty() || !m_manager)
        return false;

    PluginManager::PluginInfo info;
    QString error;
    bool ok = m_manager->ImportPlugin(path, &info, &error);

    const QString name = info.name.isEmpty() ? QStringLiteral("UNKNOWN") : info.name;

    if (ok) {
        showMessage("Import Plugin", QString("%1 Plugin Installed Successfully").arg(name));
        reload();
    } else {
        QString msg = QString("%1 Plugin Installation Failed!").arg(name);
        if (!error.isEmpty())
            msg += "\n\n" + error;
        showError("Import Plugin", msg);
    }
    return ok;
}

void PluginMenu::managePlugins() {
    if (!m_manager)
        return;
    PluginDialog dialog(m_manager.data(), dialogParent());
    dialog.exec();
}

QWidget* PluginMenu::dialogParent() const {
    if (m_menu && m_menu->parentWidget())
        return m_menu->parentWidget()->window();
    return nullptr;
}

QString PluginMenu::chooseLibrary() {
    QSettings settings("Plugix", "Plugix");
    QString dir = settings.value("plugins/importDir",
                                 QCoreApplication::applicationDirPath() + "/Plugins").toString();

    QString path = QFileDialog::getOpenFileName(dialogParent(), "Import Plugin", dir,
                                                "Plugins (*.dll *.so *.dylib);;All Files (*)");
    if (!path.isEmpty())
        settings.setValue("plugins/importDir", QFileInfo(path).absolutePath());
    return path;
}

void PluginMenu::showError(const QString& title, const QString& text) {
    QMessageBox::critical(dialogParent(), title, text);
}

void PluginMenu::showMessage(const QString& title, const QString& text) {
    QMessageBox::information(dialogParent(), title, text);
}

void PluginMenu::onManagerChanged() {
    // reload() rebuilds everything once it is done
    if (m_loading)
        return;
    refresh();
}

} // namespace plx
