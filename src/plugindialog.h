#pragma once
#include "pluginmanager.h"
#include <QDialog>
#include <QListWidget>
#include <QPushButton>

namespace plx {

// "Manage Plugins" dialog: lists the loaded plugins, loads and unloads them
class PluginDialog : public QDialog {
    Q_OBJECT
public:
    explicit PluginDialog(PluginManager* manager, QWidget* parent = nullptr);

    QListWidget* list() const { return m_list; }

    void refreshList();

    // Remove the selected plugin without asking for confirmation
    bool unloadSelected(QString* errorMsg = nullptr);

private:
    void loadPlugin();
    void confirmUnload();

    PluginManager* m_manager;
    QListWidget*   m_list      = nullptr;
    QPushButton*   m_btnLoad   = nullptr;
    QPushButton*   m_btnUnload = nullptr;
};

} // namespace plx
