#include "pluginmanager.h"
#include "packageregistry.h"
#include <QFileInfo>
#include <QDebug>

namespace plx {

PluginManager::PluginManager(QObject* parent)
    : QObject(parent)
{
}

PluginManager::~PluginManager()
{
    for (auto& entry : m_entries)
    {
        delete entry.plugin;
        entry.plugin = nullptr;
        if (entry.library)
        {
            entry.library->unload();
            delete entry.library;
        }
    }

    m_entries.clear();
    m_plugins.clear();
    PackageRegistry::instance().clearPluginPackages();
}

void PluginManager::RegisterFactory(const QString& origin, Factory factory)
{
    if (!factory)
    {
        qWarning() << "PluginManager: Ignoring empty factory for" << origin;
        return;
    }

    PluginEntry entry{origin, nullptr, std::move(factory), nullptr, false};
    m_entries.append(entry);
    qDebug() << "PluginManager: Registered built-in source:" << origin;
}

bool PluginManager::Adopt(PluginEntry& entry, IPlugin* plugin, QString* errorMsg)
{
    QString className = QString::fromStdString(plugin->ClassName());
    if (className.isEmpty())
    {
        if (errorMsg) *errorMsg = QString("Plugin '%1' has no class name").arg(QString::fromStdString(plugin->Name()));
        delete plugin;
        return false;
    }

    if (FindPlugin(className))
    {
        if (errorMsg) *errorMsg = QString("A plugin with class '%1' is already loaded").arg(className);
        delete plugin;
        return false;
    }

    entry.plugin = plugin;

    QString label = QString::fromStdString(plugin->PackageLabel());
    if (!label.isEmpty())
        PackageRegistry::instance().registerPackage(PackageRegistry::packageOf(className), label);

    qDebug() << "PluginManager: Loaded plugin:" << plugin->Name().c_str() << plugin->Version().c_str()
             << "by" << plugin->Author().c_str() << "(" << className << ")";
    return true;
}

bool PluginManager::ImportPlugin(const QString& path, PluginInfo* info, QString* errorMsg)
{
    QFileInfo fileInfo(path);
    QString fileName = fileInfo.fileName();

    if (info)
    {
        *info = PluginInfo();
        info->path = path;
    }

    // Check if already loaded
    for (const auto& entry : m_entries)
    {
        if (entry.library && QFileInfo(entry.library->fileName()).fileName() == fileName)
        {
            qWarning() << "PluginManager: Plugin already loaded:" << fileName;
            if (errorMsg) *errorMsg = QString("Plugin already loaded: %1").arg(fileName);
            return false;
        }
    }

    QLibrary* library = new QLibrary(path);

    // Load the library
    if (!library->load())
    {
        qWarning() << "PluginManager: Failed to load plugin:" << path;
        qWarning() << "PluginManager: Error" << library->errorString();
        if (errorMsg) *errorMsg = library->errorString();
        delete library;
        return false;
    }

    // Resolve the CreatePlugin function
    CreatePluginFunc CreateFunc = (CreatePluginFunc)library->resolve("CreatePlugin");
    if (!CreateFunc)
    {
        qWarning() << "PluginManager: Plugin" << path << "does not export CreatePlugin()";
        if (errorMsg) *errorMsg = QString("%1 does not export CreatePlugin()").arg(fileName);
        library->unload();
        delete library;
        return false;
    }

    // Create plugin instance
    IPlugin* plugin = CreateFunc();
    if (!plugin)
    {
        qWarning() << "PluginManager: CreatePlugin() returned nullptr for" << path;
        if (errorMsg) *errorMsg = QString("CreatePlugin() returned nullptr for %1").arg(fileName);
        library->unload();
        delete library;
        return false;
    }

    if (info)
    {
        info->name = QString::fromStdString(plugin->Name());
        info->className = QString::fromStdString(plugin->ClassName());
        info->version = QString::fromStdString(plugin->Version());
    }

    PluginEntry entry{path, library, [CreateFunc]() { return CreateFunc(); }, nullptr, false};
    QString error;
    if (!Adopt(entry, plugin, &error))
    {
        qWarning() << "PluginManager:" << error;
        if (errorMsg) *errorMsg = error;
        library->unload();
        delete library;
        return false;
    }

    m_entries.append(entry);
    RebuildPluginList();

    emit pluginAdded(QString::fromStdString(plugin->ClassName()));
    return true;
}

QStringList PluginManager::classes() const
{
    QStringList result;
    for (IPlugin* plugin : m_plugins)
        result.append(QString::fromStdString(plugin->ClassName()));
    return result;
}

IPlugin* PluginManager::FindPlugin(const QString& className) const
{
    for (IPlugin* plugin : m_plugins)
    {
        if (QString::fromStdString(plugin->ClassName()) == className)
        {
            return plugin;
        }
    }
    return nullptr;
}

void PluginManager::DestroyInstance(PluginEntry& entry)
{
    delete entry.plugin;
    entry.plugin = nullptr;
}

bool PluginManager::RemovePlugin(const QString& className)
{
    for (auto& entry : m_entries)
    {
        if (entry.plugin && QString::fromStdString(entry.plugin->ClassName()) == className)
        {
            qDebug() << "PluginManager: Removing plugin:" << className;

            DestroyInstance(entry);
            entry.removed = true;
            RebuildPluginList();

            // The last plugin of a package takes the plugin-declared label along
            const QString package = PackageRegistry::packageOf(className);
            auto& registry = PackageRegistry::instance();
            if (!registry.isBuiltin(package) && !registry.label(package).isEmpty())
            {
                bool packageInUse = false;
                for (IPlugin* plugin : m_plugins)
                {
                    if (PackageRegistry::packageOf(QString::fromStdString(plugin->ClassName())) == package)
                        packageInUse = true;
                }
                if (!packageInUse)
                    registry.unregisterPackage(package);
            }

            emit pluginRemoved(className);
            return true;
        }
    }

    qWarning() << "PluginManager: Plugin not found:" << className;
    return false;
}

bool PluginManager::RemovePlugin(IPlugin* plugin)
{
    if (!plugin || !m_plugins.contains(plugin))
    {
        qWarning() << "PluginManager: Not a live plugin instance";
        return false;
    }
    return RemovePlugin(QString::fromStdString(plugin->ClassName()));
}

void PluginManager::Clear()
{
    qDebug() << "PluginManager: Clearing" << m_plugins.count() << "plugin(s)";

    for (auto& entry : m_entries)
    {
        DestroyInstance(entry);
        entry.removed = false;
    }

    PackageRegistry::instance().clearPluginPackages();
    m_plugins.clear();

    emit cleared();
}

void PluginManager::Refresh()
{
    QStringList added;

    for (auto& entry : m_entries)
    {
        if (entry.plugin || entry.removed)
            continue;

        IPlugin* plugin = entry.create();
        if (!plugin)
        {
            qWarning() << "PluginManager: Factory returned nullptr for" << entry.origin;
            continue;
        }

        QString error;
        if (!Adopt(entry, plugin, &error))
        {
            qWarning() << "PluginManager: Skipping" << entry.origin << ":" << error;
            continue;
        }

        // Adopt() looks at m_plugins for duplicates
        RebuildPluginList();
        added.append(QString::fromStdString(entry.plugin->ClassName()));
    }

    qDebug() << "PluginManager: Refreshed," << m_plugins.count() << "plugin(s) loaded";

    for (const QString& className : added)
        emit pluginAdded(className);
}

void PluginManager::RebuildPluginList()
{
    m_plugins.clear();
    for (const auto& entry : m_entries)
    {
        if (entry.plugin)
            m_plugins.append(entry.plugin);
    }
}

} // namespace plx
