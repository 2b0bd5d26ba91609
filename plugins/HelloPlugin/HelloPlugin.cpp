#include "HelloPlugin.h"
#include <QApplication>
#include <QMessageBox>
#include <QPlainTextEdit>

bool HelloPlugin::run(const QVariant& data, QString* errorMsg)
{
    auto* editor = qobject_cast<QPlainTextEdit*>(data.value<QObject*>());
    if (!editor)
    {
        if (errorMsg) *errorMsg = "No document is open";
        return false;
    }

    setStatus("Greeting");
    QMessageBox::information(QApplication::activeWindow(), "Hello",
                             QString("Hello! The document has %1 character(s).")
                                 .arg(editor->toPlainText().size()));
    setStatus(QString());
    return true;
}

extern "C" PLX_PLUGIN_EXPORT plx::IPlugin* CreatePlugin()
{
    return new HelloPlugin();
}
