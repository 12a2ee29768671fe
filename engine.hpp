#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "event.hpp"
#include "store.hpp"

namespace enginehost {

using json = nlohmann::json;

enum class Discipline { Continuous, Periodic, Mixed };

const char *disciplineName(Discipline discipline);

struct Capabilities {
	bool incrementalUpdate{false};
	bool batchTrain{false};
};

// Throws AlgorithmFailure when an engine declares neither capability.
Discipline disciplineOf(const Capabilities &caps);

struct EngineContext {
	std::string engineId;
	std::shared_ptr<NamespacedStore> store;
};

// Contract every hosted engine implements. The core owns lifecycle and
// ordering; the engine owns its Dataset and Model inside its namespaced store.
//
// Concurrency: input/applyIncremental/train are never run concurrently for one
// instance, but query() runs unsynchronized alongside all of them. An engine
// whose state is not safe for concurrent read/write must lock internally.
class Engine {
public:
	virtual ~Engine() = default;

	// Reads the engine's own keys from the full parameter document. Called on
	// create and again on every update; an update that changes structure the
	// engine cannot migrate throws UnsupportedUpdate and leaves the old config.
	virtual void init(const json &params) = 0;

	virtual Capabilities capabilities() const = 0;

	// Runs before the event is mirrored or stored.
	virtual void validateEvent(const Event &event) const { (void)event; }

	// Accumulates the event into the Dataset.
	virtual json input(const Event &event) = 0;

	// Continuous hook, only called when capabilities().incrementalUpdate.
	virtual json applyIncremental(const Event &event);

	// Batch hook, only called when capabilities().batchTrain. Builds a new
	// model from the Dataset; on failure the previous model must remain.
	virtual json train();

	virtual json query(const json &query) = 0;

	// Releases Dataset and Model state.
	virtual void destroy() = 0;

	virtual json status() const = 0;
};

using EngineFactory = std::function<std::shared_ptr<Engine>(const EngineContext &)>;

// Maps engine type identifiers (and aliases) to constructors. Populated at
// startup; nothing is loaded at runtime.
class EngineCatalog {
public:
	bool registerFactory(const std::string &type, EngineFactory factory,
						 const std::vector<std::string> &aliases = {}, std::string *error = nullptr);
	bool contains(const std::string &type) const;

	// Canonical type for a type or alias. ValidationError on "engineFactory" when unknown.
	std::string resolve(const std::string &type) const;

	// ValidationError on "engineFactory" when the type is unknown.
	std::shared_ptr<Engine> create(const std::string &type, const EngineContext &ctx) const;

	json list() const;

private:
	struct FactoryRecord {
		std::string type;
		std::vector<std::string> aliases;
		EngineFactory factory;
	};

	mutable std::mutex mu_;
	std::vector<FactoryRecord> records_;
	std::unordered_map<std::string, size_t> index_;
};

} // namespace enginehost
