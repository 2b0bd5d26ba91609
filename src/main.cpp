#include "mainwindow.h"
#include "builtinplugins.h"
#include <QApplication>
#include <QMenuBar>
#include <QStatusBar>
#include <QMessageBox>
#include <QAction>
#include <QDebug>

namespace plx {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle("Plugix");
    resize(900, 600);

    m_editor = new QPlainTextEdit(this);
    m_editor->setPlaceholderText("Type some text, then pick a plugin from the Plugins menu");
    setCentralWidget(m_editor);

    // Every plugin call gets the editor as host data
    m_pluginManager.setData(QVariant::fromValue<QObject*>(m_editor));

    registerBuiltinPlugins(m_pluginManager);
    m_pluginManager.Refresh();

    createMenus();
    createStatusBar();
}

MainWindow::~MainWindow() {
    // The plugin menu has to go before the manager it listens to
    delete m_pluginMenu;
}

template < typename...Args >
inline QAction* Qt5Qt6AddAction(QMenu* menu, const QString &text, const QKeySequence &shortcut, Args&&...args)
{
    QAction *result = menu->addAction(text);
    if (!shortcut.isEmpty())
        result->setShortcut(shortcut);
    QObject::connect(result, &QAction::triggered, std::forward<Args>(args)...);
    return result;
}

void MainWindow::createMenus() {
    // File
    auto* file = menuBar()->addMenu("&File");
    Qt5Qt6AddAction(file, "E&xit", QKeySequence::Quit, this, &QMainWindow::close);

    // Plugins
    m_pluginMenu = new PluginMenu(&m_pluginManager, this);

    // Help
    auto* help = menuBar()->addMenu("&Help");
    Qt5Qt6AddAction(help, "&About Plugix", QKeySequence::UnknownKey, this, &MainWindow::about);
}

void MainWindow::createStatusBar() {
    m_statusLabel = new QLabel("Ready");
    statusBar()->addWidget(m_statusLabel, 1);

    connect(m_pluginMenu.data(), &PluginMenu::status, this, [this](const QString& message) {
        m_statusLabel->setText(message.isEmpty() ? QStringLiteral("Ready") : message);
    });
}

void MainWindow::about() {
    QMessageBox::about(this, "About Plugix",
                       QString("Plugix\n\n%1 plugin(s) loaded.").arg(m_pluginManager.plugins().size()));
}

} // namespace plx

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Plugix");
    app.setOrganizationName("Plugix");

    if (plx::PluginMenu::debugMode())
        qDebug() << "Plugix: plugin debug mode is on, failures are logged instead of shown";

    plx::MainWindow window;
    window.show();

    return app.exec();
}
