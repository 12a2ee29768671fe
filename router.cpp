#include "router.hpp"

#include <iostream>

#include "errors.hpp"
#include "params.hpp"
#include "util.hpp"

namespace enginehost {

Router::Router(std::shared_ptr<EngineRegistry> registry, std::shared_ptr<MirrorLog> mirror,
			   std::shared_ptr<TrainingOrchestrator> orchestrator)
	: registry_(std::move(registry)), mirror_(std::move(mirror)), orchestrator_(std::move(orchestrator)) {}

json Router::input(const std::string &engineId, const json &body) {
	int64_t acceptedAt = nowEpochMs();
	auto instance = registry_->find(engineId);
	Event event;
	try {
		event = Event::fromJson(body, acceptedAt);
	} catch (const EngineError &e) {
		throw e.withEngine(engineId);
	}
	return accept(*instance, event, true);
}

json Router::accept(const EngineInstance &instance, const Event &event, bool mirror) {
	const std::string &id = instance.id();
	guardAlgorithm(id, "validateEvent", [&]() { instance.engine()->validateEvent(event); });

	// One input per instance at a time from here on, so mirror order is apply order.
	auto admission = orchestrator_->admit(id);
	json out{{"engineId", id}};
	if (mirror && mirror_->isEnabled(id)) {
		out["sequence"] = mirror_->record(id, event);
	}
	json applied = orchestrator_->onInput(admission, event);
	for (auto it = applied.begin(); it != applied.end(); ++it) out[it.key()] = it.value();
	return out;
}

json Router::query(const std::string &engineId, const json &body) {
	auto instance = registry_->find(engineId);
	if (!body.is_object()) {
		throw EngineError(ErrorKind::Validation, "query must be a JSON object", "query", engineId);
	}
	return guardAlgorithm(engineId, "query", [&]() { return instance->engine()->query(body); });
}

json Router::train(const std::string &engineId) {
	registry_->find(engineId);
	return orchestrator_->requestTrain(engineId);
}

json Router::replay(const std::string &sourceId, const std::string &sinkId) {
	auto sink = registry_->find(sinkId);
	if (sourceId.empty()) throw validationError("source", "replay source engine id required");
	if (!params::isValidEngineId(sourceId)) {
		throw validationError("source", "invalid replay source engine id \"" + sourceId + "\"");
	}
	fs::path file = mirror_->logFile(sourceId);
	if (!fs::exists(file)) {
		throw EngineError(ErrorKind::NotFound, "no mirror log for " + sourceId, "source", sourceId);
	}

	// Replaying an engine's own log must not append the records to it again.
	bool remirror = sourceId != sinkId;
	std::size_t accepted = 0;
	std::size_t skipped = 0;
	std::cout << "[Router] replaying " << file.string() << " into " << sinkId << std::endl;
	std::size_t total = mirror_->replayInto(sourceId, [&](const MirrorRecord &rec) {
		try {
			accept(*sink, rec.event, remirror);
			accepted++;
		} catch (const EngineError &e) {
			if (e.kind() != ErrorKind::Validation) throw;
			skipped++;
			std::cerr << "[Router] replay into " << sinkId << " skipped record " << rec.sequence << ": " << e.what() << std::endl;
		}
	});
	std::cout << "[Router] replayed " << accepted << " of " << total << " record(s) into " << sinkId << std::endl;
	return json{{"engineId", sinkId}, {"source", sourceId}, {"records", total}, {"replayed", accepted}, {"skipped", skipped}};
}

json Router::mirrorReport(const std::string &engineId) const {
	if (!params::isValidEngineId(engineId)) throw validationError("engineId", "invalid engine id \"" + engineId + "\"");
	if (!registry_->contains(engineId) && !fs::exists(mirror_->logFile(engineId))) throw notFound(engineId);
	return mirror_->verify(engineId);
}

} // namespace enginehost
