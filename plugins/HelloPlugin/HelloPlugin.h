#pragma once
#include "../../src/iplugin.h"

/**
 * Sample plugin shipped as a shared library
 * Greets the user with the length of the host document
 */
class HelloPlugin : public plx::IPlugin
{
public:
    std::string Name() const override { return "Hello"; }
    std::string Version() const override { return "1.0.0"; }
    std::string Author() const override { return "Plugix"; }
    std::string Description() const override { return "Say hello from a dynamically loaded plugin"; }
    std::string ClassName() const override { return "samples.Hello"; }
    std::string PackageLabel() const override { return "Samples"; }

    bool run(const QVariant& data, QString* errorMsg) override;
};

// Plugin export
extern "C" PLX_PLUGIN_EXPORT plx::IPlugin* CreatePlugin();
