#pragma once
#include "iplugin.h"
#include <QObject>
#include <QVector>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QLibrary>
#include <functional>

namespace plx {

/**
 * Manages plugin sources and the lifecycle of their instances
 *
 * A source is either a factory registered by the host or the CreatePlugin()
 * entry point of an imported shared library. Each source has at most one
 * live instance. Clear() destroys the instances but keeps the sources, so
 * Refresh() can bring them back.
 */
class PluginManager : public QObject
{
    Q_OBJECT
public:
    using Factory = std::function<IPlugin*()>;

    struct PluginInfo
    {
        QString name;
        QString className;
        QString version;
        QString path;
    };

    explicit PluginManager(QObject* parent = nullptr);
    ~PluginManager() override;

    // Register a built-in plugin source; instantiated on the next Refresh()
    void RegisterFactory(const QString& origin, Factory factory);

    // Load a plugin from a shared library and instantiate it
    bool ImportPlugin(const QString& path, PluginInfo* info = nullptr, QString* errorMsg = nullptr);

    // Live plugin instances, in registration order
    const QVector<IPlugin*>& plugins() const { return m_plugins; }

    // Class names of the live plugins
    QStringList classes() const;

    // Find plugin by class name
    IPlugin* FindPlugin(const QString& className) const;

    // Destroy a plugin instance; it stays gone until the next Clear()
    bool RemovePlugin(const QString& className);
    bool RemovePlugin(IPlugin* plugin);

    // Destroy all plugin instances, forget removals
    void Clear();

    // Instantiate every source that has no live instance and was not removed
    void Refresh();

    // Host data handed to every plugin call
    const QVariant& data() const { return m_data; }
    void setData(const QVariant& data) { m_data = data; }

    int sourceCount() const { return m_entries.size(); }

signals:
    void pluginAdded(const QString& className);
    void pluginRemoved(const QString& className);
    void cleared();

private:
    struct PluginEntry
    {
        QString   origin;
        QLibrary* library;   // nullptr for built-in factories
        Factory   create;
        IPlugin*  plugin;    // nullptr when not instantiated
        bool      removed;
    };

    QVector<PluginEntry> m_entries;
    QVector<IPlugin*> m_plugins; // Non-owning pointers for quick access
    QVariant m_data;

    bool Adopt(PluginEntry& entry, IPlugin* plugin, QString* errorMsg);
    void DestroyInstance(PluginEntry& entry);
    void RebuildPluginList();
};

} // namespace plx
