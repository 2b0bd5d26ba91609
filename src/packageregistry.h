#pragma once
#include <QList>
#include <QString>

namespace plx {

/**
 * Global registry of package display labels
 *
 * A package is a dotted prefix of a plugin class name ("analysis",
 * "analysis.strain"). Only packages with a label get a submenu; the others
 * are flattened into their parent. Labels come either from the host
 * (built-in, kept across plugin reloads) or from loaded plugins.
 */
class PackageRegistry {
public:
    struct PackageInfo {
        QString path;       // Dotted package path (e.g., "analysis.strain")
        QString label;      // Display label (e.g., "Strain Analysis")
        bool isBuiltin;

        PackageInfo(const QString& p, const QString& l, bool builtin)
            : path(p), label(l), isBuiltin(builtin) {}
    };

    static PackageRegistry& instance();

    // Register a label declared by a loaded plugin
    void registerPackage(const QString& path, const QString& label);

    // Register a label owned by the host application
    void registerBuiltinPackage(const QString& path, const QString& label);

    // Unregister a package label
    void unregisterPackage(const QString& path);

    // Label of a package, empty if it has none
    QString label(const QString& path) const;

    bool isBuiltin(const QString& path) const;

    const QList<PackageInfo>& packages() const { return m_packages; }

    // Drop the labels declared by plugins, keep the built-in ones
    void clearPluginPackages();

    // Drop everything
    void clear();

    // "a.b.C" -> "a.b", "C" -> ""
    static QString packageOf(const QString& className);

private:
    PackageRegistry() = default;
    void add(const QString& path, const QString& label, bool builtin);

    QList<PackageInfo> m_packages;
};

} // namespace plx
