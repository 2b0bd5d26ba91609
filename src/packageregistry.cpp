#include "packageregistry.h"
#include <QDebug>

namespace plx {

PackageRegistry& PackageRegistry::instance() {
    static PackageRegistry s_instance;
    return s_instance;
}

void PackageRegistry::add(const QString& path, const QString& label, bool builtin) {
    if (path.isEmpty() || label.isEmpty())
        return;

    for (auto& info : m_packages) {
        if (info.path == path) {
            // Host labels win over labels declared by plugins
            if (info.isBuiltin && !builtin) {
                qDebug() << "PackageRegistry: Keeping built-in label for" << path;
                return;
            }
            if (info.label != label)
                qWarning() << "PackageRegistry: Relabelling package" << path << ":" << info.label << "->" << label;
            info.label = label;
            info.isBuiltin = builtin;
            return;
        }
    }

    m_packages.append(PackageInfo(path, label, builtin));
    qDebug() << "PackageRegistry: Registered" << (builtin ? "builtin" : "plugin") << "package:" << label << "(" << path << ")";
}

void PackageRegistry::registerPackage(const QString& path, const QString& label) {
    add(path, label, false);
}

void PackageRegistry::registerBuiltinPackage(const QString& path, const QString& label) {
    add(path, label, true);
}

void PackageRegistry::unregisterPackage(const QString& path) {
    for (int i = 0; i < m_packages.size(); ++i) {
        if (m_packages[i].path == path) {
            qDebug() << "PackageRegistry: Unregistered package:" << path;
            m_packages.removeAt(i);
            return;
        }
    }
    qWarning() << "PackageRegistry: Package not found:" << path;
}

QString PackageRegistry::label(const QString& path) const {
    for (const auto& info : m_packages) {
        if (info.path == path)
            return info.label;
    }
    return QString();
}

bool PackageRegistry::isBuiltin(const QString& path) const {
    for (const auto& info : m_packages) {
        if (info.path == path)
            return info.isBuiltin;
    }
    return false;
}

void PackageRegistry::clearPluginPackages() {
    for (int i = m_packages.size() - 1; i >= 0; --i) {
        if (!m_packages[i].isBuiltin)
            m_packages.removeAt(i);
    }
}

void PackageRegistry::clear() {
    m_packages.clear();
}

QString PackageRegistry::packageOf(const QString& className) {
    int dot = className.lastIndexOf(QLatin1Char('.'));
    return dot < 0 ? QString() : className.left(dot);
}

} // namespace plx
