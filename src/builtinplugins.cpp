#include "builtinplugins.h"
#include "packageregistry.h"
#include <QApplication>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QTextDocument>
#include <QRegularExpression>
#include <algorithm>

namespace plx {

namespace {

QPlainTextEdit* editorOf(const QVariant& data) {
    return qobject_cast<QPlainTextEdit*>(data.value<QObject*>());
}

// ── text.stats ──

class WordCountPlugin : public IPlugin {
public:
    std::string Name() const override { return "Word Count"; }
    std::string Version() const override { return "1.0.0"; }
    std::string Author() const override { return "Plugix"; }
    std::string Description() const override { return "Count the words of the document"; }
    std::string ClassName() const override { return "text.stats.WordCount"; }
    std::string PackageLabel() const override { return "Statistics"; }

    bool isAvailable(const QVariant& data, QString* reason) const override {
        if (editorOf(data)) return true;
        if (reason) *reason = "No document is open";
        return false;
    }

    bool run(const QVariant& data, QString* errorMsg) override {
        auto* editor = editorOf(data);
        if (!editor) {
            if (errorMsg) *errorMsg = "No document is open";
            return false;
        }
        const QString text = editor->toPlainText();
        int words = text.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts).size();
        QMessageBox::information(QApplication::activeWindow(), "Word Count",
                                 QString("%1 word(s), %2 character(s)").arg(words).arg(text.size()));
        return true;
    }
};

// ── text.transform ──

class UppercasePlugin : public IPlugin {
public:
    std::string Name() const override { return "Uppercase"; }
    std::string Version() const override { return "1.0.0"; }
    std::string Author() const override { return "Plugix"; }
    std::string Description() const override { return "Convert the selection to upper case"; }
    std::string ClassName() const override { return "text.transform.Uppercase"; }
    std::string PackageLabel() const override { return "Transform"; }

    bool isAvailable(const QVariant& data, QString* reason) const override {
        auto* editor = editorOf(data);
        if (editor && editor->textCursor().hasSelection()) return true;
        if (reason) *reason = "Select some text first";
        return false;
    }

    bool validate(const QVariant& data, QString* errorMsg) override {
        auto* editor = editorOf(data);
        if (editor && editor->isReadOnly()) {
            if (errorMsg) *errorMsg = "The document is read-only";
            return false;
        }
        return isAvailable(data, errorMsg);
    }

    bool run(const QVariant& data, QString* errorMsg) override {
        Q_UNUSED(errorMsg);
        QTextCursor cursor = editorOf(data)->textCursor();
        cursor.insertText(cursor.selectedText().toUpper());
        return true;
    }
};

class ReverseLinesPlugin : public IPlugin {
public:
    std::string Name() const override { return "Reverse Lines"; }
    std::string Version() const override { return "1.0.0"; }
    std::string Author() const override { return "Plugix"; }
    std::string Description() const override { return "Reverse the order of the lines of the document"; }
    std::string ClassName() const override { return "text.transform.ReverseLines"; }
    std::string PackageLabel() const override { return "Transform"; }

    bool run(const QVariant& data, QString* errorMsg) override {
        auto* editor = editorOf(data);
        if (!editor) {
            if (errorMsg) *errorMsg = "No document is open";
            return false;
        }
        QStringList lines = editor->toPlainText().split(QLatin1Char('\n'));
        std::reverse(lines.begin(), lines.end());
        editor->setPlainText(lines.join(QLatin1Char('\n')));
        return true;
    }
};

// ── tools (no package label, flattened into the top level) ──

class ClearPlugin : public IPlugin {
public:
    std::string Name() const override { return "Clear Document"; }
    std::string Version() const override { return "1.0.0"; }
    std::string Author() const override { return "Plugix"; }
    std::string Description() const override { return "Remove all text from the document"; }
    std::string ClassName() const override { return "tools.Clear"; }

    bool isAvailable(const QVariant& data, QString* reason) const override {
        auto* editor = editorOf(data);
        if (editor && !editor->document()->isEmpty()) return true;
        if (reason) *reason = "The document is already empty";
        return false;
    }

    bool run(const QVariant& data, QString* errorMsg) override {
        Q_UNUSED(errorMsg);
        editorOf(data)->clear();
        return true;
    }
};

} // namespace

void registerBuiltinPlugins(PluginManager& manager) {
    // Top-level package owned by the host; the sub-packages are labelled by their plugins
    PackageRegistry::instance().registerBuiltinPackage("text", "Text");

    manager.RegisterFactory("builtin:WordCount",    []() -> IPlugin* { return new WordCountPlugin(); });
    manager.RegisterFactory("builtin:Uppercase",    []() -> IPlugin* { return new UppercasePlugin(); });
    manager.RegisterFactory("builtin:ReverseLines", []() -> IPlugin* { return new ReverseLinesPlugin(); });
    manager.RegisterFactory("builtin:Clear",        []() -> IPlugin* { return new ClearPlugin(); });
}

} // namespace plx
