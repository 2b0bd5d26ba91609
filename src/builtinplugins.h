#pragma once
#include "pluginmanager.h"

namespace plx {

// Register the plugins that ship with the demo host, and their package labels
void registerBuiltinPlugins(PluginManager& manager);

} // namespace plx
