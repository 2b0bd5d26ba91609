#pragma once
#include <QString>
#include <QIcon>
#include <QVariant>
#include <QAction>
#include <string>

#ifdef _WIN32
    #define PLX_PLUGIN_EXPORT __declspec(dllexport)
#else
    #define PLX_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

namespace plx {

/**
 * Plugin interface for Plugix
 *
 * Plugins are either registered by the host as built-in factories or
 * imported from shared libraries. Each library must export a C function:
 * extern "C" PLX_PLUGIN_EXPORT plx::IPlugin* CreatePlugin();
 */
class IPlugin {
public:
    virtual ~IPlugin() = default;

    // Plugin metadata
    virtual std::string Name() const = 0;
    virtual std::string Version() const = 0;
    virtual std::string Author() const = 0;
    virtual std::string Description() const = 0;
    virtual QIcon       Icon() const { return QIcon(); }

    /**
     * Fully-qualified dotted class name, e.g. "analysis.strain.Radial".
     * Unique among loaded plugins; the package prefixes determine where
     * the plugin lands in the menu hierarchy.
     */
    virtual std::string ClassName() const = 0;

    /**
     * Display label of the package containing this plugin, or an empty
     * string if the package has no label (the level is then flattened).
     */
    virtual std::string PackageLabel() const { return std::string(); }

    /**
     * Check if the plugin can run on the current host data
     * @param data   - Host data shared by all plugins
     * @param reason - Output parameter, why the plugin is unavailable
     * @return true if the plugin can be run right now
     */
    virtual bool isAvailable(const QVariant& data, QString* reason = nullptr) const {
        Q_UNUSED(data); Q_UNUSED(reason);
        return true;
    }

    /**
     * Check the inputs before running
     * @param data     - Host data shared by all plugins
     * @param errorMsg - Output parameter for error message if validation fails
     * @return true if run() may be called
     */
    virtual bool validate(const QVariant& data, QString* errorMsg = nullptr) {
        Q_UNUSED(data); Q_UNUSED(errorMsg);
        return true;
    }

    virtual bool run(const QVariant& data, QString* errorMsg = nullptr) = 0;

    // Always called after validate()/run(), whether they succeeded or not
    virtual bool cleanup(QString* errorMsg = nullptr) { Q_UNUSED(errorMsg); return true; }

    virtual void setStatus(const QString& message) { m_status = message; }
    QString status() const { return m_status; }

    /**
     * Build the menu item for this plugin. The caller takes care of the
     * tag, the placement and the trigger connection.
     */
    virtual QAction* createMenuAction(QObject* owner) const {
        auto* action = new QAction(Icon(), QString::fromStdString(Name()), owner);
        action->setToolTip(QString::fromStdString(Description()));
        action->setStatusTip(QString::fromStdString(Description()));
        return action;
    }

private:
    QString m_status;
};

} // namespace plx

// Plugin factory function signature
typedef plx::IPlugin* (*CreatePluginFunc)();
