#include "builtin_engines.hpp"

#include <algorithm>
#include <iostream>
#include <memory>

#include "kappa_engine.hpp"
#include "scaffold_engine.hpp"

namespace enginehost {

namespace {

struct BuiltinEngine {
	const char *type;
	std::vector<std::string> aliases;
	EngineFactory factory;
};

std::vector<BuiltinEngine> builtinEngines() {
	return {
		{ScaffoldEngine::kType,
		 {"com.actionml.engines.scaffold.ScaffoldEngine"},
		 [](const EngineContext &ctx) { return std::make_shared<ScaffoldEngine>(ctx); }},
		{KappaEngine::kType,
		 {"com.actionml.engines.kappa.KappaEngine"},
		 [](const EngineContext &ctx) { return std::make_shared<KappaEngine>(ctx); }},
	};
}

} // namespace

int registerBuiltinEngines(EngineCatalog &catalog, const std::vector<std::string> &enabled) {
	auto engines = builtinEngines();
	for (const auto &name : enabled) {
		bool known = std::any_of(engines.begin(), engines.end(), [&](const BuiltinEngine &e) { return name == e.type; });
		if (!known) std::cerr << "[Catalog] unknown engine type in --engines: " << name << std::endl;
	}

	int registered = 0;
	for (auto &e : engines) {
		if (!enabled.empty() && std::find(enabled.begin(), enabled.end(), e.type) == enabled.end()) continue;
		std::string error;
		if (!catalog.registerFactory(e.type, std::move(e.factory), e.aliases, &error)) {
			std::cerr << "[Catalog] " << error << std::endl;
			continue;
		}
		registered++;
	}
	std::cout << "[Catalog] " << registered << " engine type(s) available" << std::endl;
	return registered;
}

} // namespace enginehost
