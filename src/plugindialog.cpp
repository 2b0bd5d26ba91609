#include "plugindialog.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QCoreApplication>
#include <QSettings>

namespace plx {

PluginDialog::PluginDialog(PluginManager* manager, QWidget* parent)
    : QDialog(parent)
    , m_manager(manager)
{
    setWindowTitle("Plugins");
    resize(600, 400);

    auto* layout = new QVBoxLayout(this);

    m_list = new QListWidget;
    m_list->setObjectName("pluginList");
    layout->addWidget(m_list);

    // Button row
    auto* btnLayout = new QHBoxLayout;

    m_btnLoad = new QPushButton("Load Plugin...");
    connect(m_btnLoad, &QPushButton::clicked, this, &PluginDialog::loadPlugin);

    m_btnUnload = new QPushButton("Unload Selected");
    connect(m_btnUnload, &QPushButton::clicked, this, &PluginDialog::confirmUnload);

    auto* btnClose = new QPushButton("Close");
    connect(btnClose, &QPushButton::clicked, this, &QDialog::accept);

    btnLayout->addWidget(m_btnLoad);
    btnLayout->addWidget(m_btnUnload);
    btnLayout->addStretch();
    btnLayout->addWidget(btnClose);

    layout->addLayout(btnLayout);

    // Changes made elsewhere (e.g. a reload from the menu) show up here too
    connect(m_manager, &PluginManager::pluginAdded,   this, &PluginDialog::refreshList);
    connect(m_manager, &PluginManager::pluginRemoved, this, &PluginDialog::refreshList);
    connect(m_manager, &PluginManager::cleared,       this, &PluginDialog::refreshList);

    refreshList();
}

void PluginDialog::refreshList() {
    m_list->clear();

    for (IPlugin* plugin : m_manager->plugins()) {
        QString text = QString("%1 v%2\n  %3\n  Class: %4\n  Author: %5")
                           .arg(QString::fromStdString(plugin->Name()))
                           .arg(QString::fromStdString(plugin->Version()))
                           .arg(QString::fromStdString(plugin->Description()))
                           .arg(QString::fromStdString(plugin->ClassName()))
                           .arg(QString::fromStdString(plugin->Author()));

        auto* item = new QListWidgetItem(plugin->Icon(), text);
        item->setData(Qt::UserRole, QString::fromStdString(plugin->ClassName()));
        m_list->addItem(item);
    }

    if (m_manager->plugins().isEmpty()) {
        m_list->addItem("No plugins loaded");
    }

    m_btnUnload->setEnabled(!m_manager->plugins().isEmpty());
}

bool PluginDialog::unloadSelected(QString* errorMsg) {
    auto* item = m_list->currentItem();
    QString className = item ? item->data(Qt::UserRole).toString() : QString();
    if (className.isEmpty()) {
        if (errorMsg) *errorMsg = "Please select a plugin to unload.";
        return false;
    }

    if (!m_manager->RemovePlugin(className)) {
        if (errorMsg) *errorMsg = QString("Could not unload '%1'.").arg(className);
        return false;
    }
    return true;
}

void PluginDialog::loadPlugin() {
    QSettings settings("Plugix", "Plugix");
    QString dir = settings.value("plugins/importDir",
                                 QCoreApplication::applicationDirPath() + "/Plugins").toString();

    QString path = QFileDialog::getOpenFileName(this, "Load Plugin", dir,
                                                "Plugins (*.dll *.so *.dylib);;All Files (*)");
    if (path.isEmpty())
        return;

    settings.setValue("plugins/importDir", QFileInfo(path).absolutePath());

    QString error;
    if (!m_manager->ImportPlugin(path, nullptr, &error)) {
        QMessageBox::warning(this, "Failed to Load Plugin",
                             QString("Could not load the selected plugin.\n%1").arg(error));
    }
}

void PluginDialog::confirmUnload() {
    auto* item = m_list->currentItem();
    if (!item || item->data(Qt::UserRole).toString().isEmpty()) {
        QMessageBox::information(this, "No Selection", "Please select a plugin to unload.");
        return;
    }

    QString className = item->data(Qt::UserRole).toString();
    auto reply = QMessageBox::question(this, "Unload Plugin",
                                       QString("Are you sure you want to unload '%1'?").arg(className),
                                       QMessageBox::Yes | QMessageBox::No);
    if (reply != QMessageBox::Yes)
        return;

    QString error;
    if (!unloadSelected(&error))
        QMessageBox::warning(this, "Failed to Unload", error);
}

} // namespace plx
