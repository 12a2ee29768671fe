#pragma once

#include <string>
#include <vector>

#include "engine.hpp"

namespace enginehost {

// Registers the compiled-in engine types. An empty list enables all of them.
// Returns how many types were registered.
int registerBuiltinEngines(EngineCatalog &catalog, const std::vector<std::string> &enabled);

} // namespace enginehost
