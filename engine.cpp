#include "engine.hpp"

#include "errors.hpp"

namespace enginehost {

const char *disciplineName(Discipline discipline) {
	switch (discipline) {
	case Discipline::Continuous: return "continuous";
	case Discipline::Periodic: return "periodic";
	case Discipline::Mixed: return "mixed";
	}
	return "unknown";
}

Discipline disciplineOf(const Capabilities &caps) {
	if (caps.incrementalUpdate && caps.batchTrain) return Discipline::Mixed;
	if (caps.incrementalUpdate) return Discipline::Continuous;
	if (caps.batchTrain) return Discipline::Periodic;
	throw EngineError(ErrorKind::AlgorithmFailure, "engine declares neither incremental update nor batch training");
}

json Engine::applyIncremental(const Event &event) {
	throw validationError("event", "engine does not apply real-time updates for \"" + event.event + "\"");
}

json Engine::train() {
	throw EngineError(ErrorKind::Validation, "engine does not support batch training");
}

bool EngineCatalog::registerFactory(const std::string &type, EngineFactory factory,
									const std::vector<std::string> &aliases, std::string *error) {
	if (type.empty()) {
		if (error) *error = "type required";
		return false;
	}
	if (!factory) {
		if (error) *error = "factory is null";
		return false;
	}
	std::lock_guard<std::mutex> lock(mu_);
	if (index_.count(type)) {
		if (error) *error = "engine type already registered: " + type;
		return false;
	}
	for (const auto &alias : aliases) {
		if (index_.count(alias)) {
			if (error) *error = "engine alias already registered: " + alias;
			return false;
		}
	}
	size_t idx = records_.size();
	records_.push_back(FactoryRecord{type, aliases, std::move(factory)});
	index_[type] = idx;
	for (const auto &alias : aliases) index_[alias] = idx;
	return true;
}

bool EngineCatalog::contains(const std::string &type) const {
	std::lock_guard<std::mutex> lock(mu_);
	return index_.count(type) > 0;
}

std::string EngineCatalog::resolve(const std::string &type) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = index_.find(type);
	if (it == index_.end()) {
		throw validationError("engineFactory", "unknown engineFactory \"" + type + "\"");
	}
	return records_[it->second].type;
}

std::shared_ptr<Engine> EngineCatalog::create(const std::string &type, const EngineContext &ctx) const {
	EngineFactory factory;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = index_.find(type);
		if (it == index_.end()) {
			throw validationError("engineFactory", "unknown engineFactory \"" + type + "\"");
		}
		factory = records_[it->second].factory;
	}
	auto engine = factory(ctx);
	if (!engine) throw EngineError(ErrorKind::AlgorithmFailure, "factory for \"" + type + "\" returned null", "", ctx.engineId);
	return engine;
}

json EngineCatalog::list() const {
	std::lock_guard<std::mutex> lock(mu_);
	json out = json::array();
	for (const auto &rec : records_) {
		out.push_back(json{{"type", rec.type}, {"aliases", rec.aliases}});
	}
	return out;
}

} // namespace enginehost
