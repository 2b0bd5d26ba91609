#pragma once
#include "pluginmanager.h"
#include "pluginmenu.h"
#include <QMainWindow>
#include <QPlainTextEdit>
#include <QLabel>
#include <QPointer>

namespace plx {

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void about();

private:
    QPlainTextEdit*      m_editor;
    QLabel*              m_statusLabel;
    PluginManager        m_pluginManager;
    QPointer<PluginMenu> m_pluginMenu;

    void createMenus();
    void createStatusBar();
};

} // namespace plx
