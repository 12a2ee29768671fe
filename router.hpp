#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "event.hpp"
#include "mirror_log.hpp"
#include "orchestrator.hpp"
#include "registry.hpp"

namespace enginehost {

using json = nlohmann::json;

// Resource id to instance dispatch. Keeps no state of its own; every call
// resolves the id again so a destroyed engine is never reached.
class Router {
public:
	Router(std::shared_ptr<EngineRegistry> registry, std::shared_ptr<MirrorLog> mirror,
		   std::shared_ptr<TrainingOrchestrator> orchestrator);

	// Validates, mirrors (when enabled) and applies one event. The reply carries
	// the mirror sequence when one was assigned.
	json input(const std::string &engineId, const json &body);

	json query(const std::string &engineId, const json &body);

	json train(const std::string &engineId);

	// Feeds the mirrored history of sourceId through sinkId's input path in
	// sequence order. Events the sink rejects as invalid are counted and skipped.
	json replay(const std::string &sourceId, const std::string &sinkId);

	json mirrorReport(const std::string &engineId) const;

private:
	json accept(const EngineInstance &instance, const Event &event, bool mirror);

	std::shared_ptr<EngineRegistry> registry_;
	std::shared_ptr<MirrorLog> mirror_;
	std::shared_ptr<TrainingOrchestrator> orchestrator_;
};

} // namespace enginehost
