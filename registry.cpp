#include "registry.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <iostream>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "util.hpp"

namespace enginehost {

namespace {

constexpr const char *kMetadataPrefix = "engine:";

int64_t timeField(const json &rec, const char *key, int64_t fallback) {
	if (!rec.contains(key) || !rec[key].is_string()) return fallback;
	auto parsed = parseIsoTime(rec[key].get<std::string>());
	return parsed ? *parsed : fallback;
}

} // namespace

const char *instanceStateName(InstanceState state) {
	switch (state) {
	case InstanceState::Active: return "active";
	case InstanceState::Updating: return "updating";
	case InstanceState::Destroyed: return "destroyed";
	}
	return "unknown";
}

EngineInstance::EngineInstance(EngineParams params, std::shared_ptr<Engine> engine, std::shared_ptr<NamespacedStore> store,
							   Discipline discipline, int64_t createdAt, int64_t updatedAt)
	: id_(params.engineId), engine_(std::move(engine)), store_(std::move(store)), discipline_(discipline),
	  params_(std::move(params)), createdAt_(createdAt), updatedAt_(updatedAt) {}

EngineParams EngineInstance::params() const {
	std::lock_guard<std::mutex> lock(mu_);
	return params_;
}

InstanceState EngineInstance::state() const {
	std::lock_guard<std::mutex> lock(mu_);
	return state_;
}

int64_t EngineInstance::createdAt() const {
	std::lock_guard<std::mutex> lock(mu_);
	return createdAt_;
}

int64_t EngineInstance::updatedAt() const {
	std::lock_guard<std::mutex> lock(mu_);
	return updatedAt_;
}

json EngineInstance::summary() const {
	std::lock_guard<std::mutex> lock(mu_);
	json out{{"engineId", id_},
			 {"engineFactory", params_.engineFactory},
			 {"state", instanceStateName(state_)},
			 {"discipline", disciplineName(discipline_)},
			 {"mirroring", params_.mirroring()},
			 {"createdAt", formatIso(createdAt_)},
			 {"updatedAt", formatIso(updatedAt_)}};
	if (params_.mirroring()) out["mirrorType"] = params_.mirrorType;
	return out;
}

EngineRegistry::EngineRegistry(std::shared_ptr<KeyValueStore> metadata, std::shared_ptr<KeyValueStore> datasets,
							   std::shared_ptr<EngineCatalog> catalog, std::shared_ptr<MirrorLog> mirror,
							   std::shared_ptr<TrainingOrchestrator> orchestrator, std::shared_ptr<ClusterCoordinator> cluster)
	: metadata_(std::move(metadata)), datasets_(std::move(datasets)), catalog_(std::move(catalog)), mirror_(std::move(mirror)),
	  orchestrator_(std::move(orchestrator)), cluster_(std::move(cluster)) {}

std::shared_ptr<std::mutex> EngineRegistry::idLock(const std::string &engineId) {
	std::lock_guard<std::mutex> lock(idLocksMu_);
	auto &slot = idLocks_[engineId];
	if (!slot) slot = std::make_shared<std::mutex>();
	return slot;
}

void EngineRegistry::releaseIdLock(const std::string &engineId, std::shared_ptr<std::mutex> lock) {
	std::lock_guard<std::mutex> guard(idLocksMu_);
	auto it = idLocks_.find(engineId);
	// The map and this call hold the only references: nobody else is waiting.
	if (it != idLocks_.end() && it->second == lock && lock.use_count() == 2) idLocks_.erase(it);
}

EngineRegistry::IdGuard::IdGuard(EngineRegistry &registry, const std::string &engineId)
	: registry_(registry), engineId_(engineId), mu_(registry.idLock(engineId)) {
	mu_->lock();
}

EngineRegistry::IdGuard::~IdGuard() {
	mu_->unlock();
	registry_.releaseIdLock(engineId_, std::move(mu_));
}

std::size_t EngineRegistry::lockedIds() const {
	std::lock_guard<std::mutex> lock(idLocksMu_);
	return idLocks_.size();
}

ClusterCoordinator::Lock EngineRegistry::clusterLock(const std::string &engineId) {
	if (!cluster_) return ClusterCoordinator::Lock();
	return cluster_->acquire(engineId);
}

void EngineRegistry::announce(const std::string &op, const std::string &engineId) {
	if (cluster_) cluster_->publish(op, engineId);
}

std::shared_ptr<EngineInstance> EngineRegistry::find(const std::string &engineId) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = live_.find(engineId);
	if (it == live_.end()) throw notFound(engineId);
	return it->second;
}

bool EngineRegistry::contains(const std::string &engineId) const {
	std::lock_guard<std::mutex> lock(mu_);
	return live_.count(engineId) > 0;
}

std::size_t EngineRegistry::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return live_.size();
}

void EngineRegistry::persist(const EngineInstance &instance, const EngineParams &params, int64_t updatedAt) {
	json rec{{"engineId", params.engineId},
			 {"engineFactory", params.engineFactory},
			 {"params", params.raw},
			 {"mirroring", params.mirroring()},
			 {"createdAt", formatIso(instance.createdAt())},
			 {"updatedAt", formatIso(updatedAt)}};
	try {
		metadata_->put(metadataKey(params.engineId), rec);
		metadata_->flush();
	} catch (const EngineError &e) {
		throw e.withEngine(params.engineId);
	}
}

std::shared_ptr<EngineInstance> EngineRegistry::build(const EngineParams &params, int64_t createdAt, int64_t updatedAt, bool fresh) {
	const std::string &id = params.engineId;
	auto store = std::make_shared<NamespacedStore>(datasets_, id);
	if (fresh) {
		// Leftovers from a destroy that crashed half way.
		std::size_t stale = store->clear();
		if (stale > 0) std::cout << "[Registry] " << id << " dropped " << stale << " stale dataset key(s)" << std::endl;
	}

	auto engine = guardAlgorithm(id, "construct", [&]() { return catalog_->create(params.engineFactory, EngineContext{id, store}); });
	bool initialized = false;
	bool mirrored = false;
	bool attached = false;
	try {
		guardAlgorithm(id, "init", [&]() { engine->init(params.raw); });
		initialized = true;
		Discipline discipline = guardAlgorithm(id, "capabilities", [&]() { return disciplineOf(engine->capabilities()); });
		auto instance = std::make_shared<EngineInstance>(params, engine, store, discipline, createdAt, updatedAt);

		mirror_->configure(params);
		mirrored = params.mirroring();
		orchestrator_->attach(id, engine, discipline);
		attached = true;
		if (fresh) persist(*instance, params, updatedAt);
		return instance;
	} catch (...) {
		if (attached) orchestrator_->detach(id);
		if (mirrored) mirror_->disable(id);
		if (fresh) {
			try {
				if (initialized) engine->destroy();
				store->clear();
			} catch (const std::exception &e) {
				std::cerr << "[Registry] rollback of " << id << " incomplete: " << e.what() << std::endl;
			}
		}
		throw;
	}
}

std::string EngineRegistry::create(const json &raw) {
	EngineParams params = params::parseAndValidate(raw);
	catalog_->resolve(params.engineFactory);
	const std::string id = params.engineId;

	IdGuard guard(*this, id);
	auto remote = clusterLock(id);
	if (contains(id)) {
		throw EngineError(ErrorKind::DuplicateId, "engine already exists: " + id, "engineId", id);
	}

	int64_t now = nowEpochMs();
	auto instance = build(params, now, now, true);
	{
		std::lock_guard<std::mutex> liveLock(mu_);
		live_[id] = instance;
	}
	std::cout << "[Registry] created " << id << " (" << params.engineFactory << ", "
			  << disciplineName(instance->discipline()) << (params.mirroring() ? ", mirrored" : "") << ")" << std::endl;
	announce("create", id);
	return id;
}

void EngineRegistry::update(const std::string &engineId, const json &raw) {
	EngineParams next = params::parseAndValidate(raw);
	if (next.engineId != engineId) {
		throw validationError("engineId", "engineId \"" + next.engineId + "\" does not match \"" + engineId + "\"");
	}

	IdGuard guard(*this, engineId);
	auto remote = clusterLock(engineId);
	auto instance = find(engineId);
	EngineParams previous = instance->params();
	if (catalog_->resolve(next.engineFactory) != catalog_->resolve(previous.engineFactory)) {
		throw EngineError(ErrorKind::UnsupportedUpdate, "engineFactory cannot change on update", "engineFactory", engineId);
	}

	// Holding the input turn keeps events out while the engine is re-initialized.
	auto admission = orchestrator_->admit(engineId);
	{
		std::lock_guard<std::mutex> stateLock(instance->mu_);
		instance->state_ = InstanceState::Updating;
	}

	auto restoreEngine = [&]() {
		try {
			instance->engine()->init(previous.raw);
		} catch (const std::exception &e) {
			std::cerr << "[Registry] " << engineId << " could not reapply previous parameters: " << e.what() << std::endl;
		}
	};
	auto backToActive = [&]() {
		std::lock_guard<std::mutex> stateLock(instance->mu_);
		instance->state_ = InstanceState::Active;
	};

	int64_t now = nowEpochMs();
	try {
		guardAlgorithm(engineId, "init", [&]() { instance->engine()->init(next.raw); });
	} catch (...) {
		backToActive();
		throw;
	}
	try {
		Discipline discipline = guardAlgorithm(engineId, "capabilities", [&]() { return disciplineOf(instance->engine()->capabilities()); });
		if (discipline != instance->discipline()) {
			throw EngineError(ErrorKind::UnsupportedUpdate,
							  std::string("update would change training discipline from ") + disciplineName(instance->discipline()) +
								  " to " + disciplineName(discipline),
							  "", engineId);
		}
		mirror_->configure(next);
		try {
			persist(*instance, next, now);
		} catch (...) {
			try {
				mirror_->configure(previous);
			} catch (const std::exception &e) {
				std::cerr << "[Registry] " << engineId << " could not restore mirror settings: " << e.what() << std::endl;
			}
			throw;
		}
	} catch (...) {
		restoreEngine();
		backToActive();
		throw;
	}

	{
		std::lock_guard<std::mutex> stateLock(instance->mu_);
		instance->params_ = next;
		instance->updatedAt_ = now;
		instance->state_ = InstanceState::Active;
	}
	std::cout << "[Registry] updated " << engineId << std::endl;
	announce("update", engineId);
}

void EngineRegistry::destroy(const std::string &engineId) {
	IdGuard guard(*this, engineId);
	auto remote = clusterLock(engineId);

	std::shared_ptr<EngineInstance> instance;
	{
		std::lock_guard<std::mutex> liveLock(mu_);
		auto it = live_.find(engineId);
		if (it == live_.end()) throw notFound(engineId);
		instance = it->second;
		live_.erase(it);
	}
	{
		std::lock_guard<std::mutex> stateLock(instance->mu_);
		instance->state_ = InstanceState::Destroyed;
	}

	orchestrator_->detach(engineId);

	std::exception_ptr firstError;
	auto step = [&](const char *what, const std::function<void()> &fn) {
		try {
			fn();
		} catch (const std::exception &e) {
			std::cerr << "[Registry] destroy " << engineId << ": " << what << " failed: " << e.what() << std::endl;
			if (!firstError) firstError = std::current_exception();
		}
	};
	step("engine teardown", [&]() { guardAlgorithm(engineId, "destroy", [&]() { instance->engine()->destroy(); }); });
	step("dataset erase", [&]() {
		instance->store()->clear();
		instance->store()->flush();
	});
	step("metadata delete", [&]() {
		metadata_->del(metadataKey(engineId));
		metadata_->flush();
	});
	mirror_->disable(engineId);

	std::cout << "[Registry] destroyed " << engineId << std::endl;
	announce("destroy", engineId);
	if (firstError) std::rethrow_exception(firstError);
}

json EngineRegistry::restoreAll() {
	json restored = json::array();
	json failed = json::array();

	std::vector<std::pair<std::string, json>> records;
	try {
		records = metadata_->entries(kMetadataPrefix);
	} catch (const EngineError &e) {
		std::cerr << "[Registry] cannot read engine metadata: " << e.what() << std::endl;
		failed.push_back(json{{"engineId", nullptr}, {"error", e.what()}, {"kind", errorKindName(e.kind())}});
	}

	const std::size_t prefixLen = std::string(kMetadataPrefix).size();
	for (const auto &kv : records) {
		std::string id = kv.first.substr(prefixLen);
		try {
			const json &rec = kv.second;
			if (!rec.is_object() || !rec.contains("params")) throw storageFailure("metadata record has no params", id);
			EngineParams params = params::parseAndValidate(rec["params"]);
			if (params.engineId != id) {
				throw storageFailure("metadata key does not match engineId \"" + params.engineId + "\"", id);
			}

			IdGuard guard(*this, id);
			if (contains(id)) throw EngineError(ErrorKind::DuplicateId, "engine already exists: " + id, "engineId", id);
			int64_t now = nowEpochMs();
			int64_t createdAt = timeField(rec, "createdAt", now);
			int64_t updatedAt = timeField(rec, "updatedAt", createdAt);
			auto instance = build(params, createdAt, updatedAt, false);
			{
				std::lock_guard<std::mutex> liveLock(mu_);
				live_[id] = instance;
			}
			restored.push_back(id);
		} catch (const EngineError &e) {
			std::cerr << "[Registry] restore of " << id << " failed: " << e.what() << std::endl;
			failed.push_back(json{{"engineId", id}, {"error", e.what()}, {"kind", errorKindName(e.kind())}});
		} catch (const std::exception &e) {
			std::cerr << "[Registry] restore of " << id << " failed: " << e.what() << std::endl;
			failed.push_back(json{{"engineId", id}, {"error", e.what()}});
		}
	}

	std::cout << "[Registry] restored " << restored.size() << " of " << records.size() << " engine(s)" << std::endl;
	json report{{"restored", restored}, {"failed", failed}};
	std::lock_guard<std::mutex> lock(reportMu_);
	restoreReport_ = report;
	return report;
}

json EngineRegistry::restoreReport() const {
	std::lock_guard<std::mutex> lock(reportMu_);
	return restoreReport_;
}

json EngineRegistry::list() const {
	std::vector<std::shared_ptr<EngineInstance>> instances;
	{
		std::lock_guard<std::mutex> lock(mu_);
		instances.reserve(live_.size());
		for (const auto &kv : live_) instances.push_back(kv.second);
	}
	std::sort(instances.begin(), instances.end(), [](const std::shared_ptr<EngineInstance> &a, const std::shared_ptr<EngineInstance> &b) {
		return a->id() < b->id();
	});
	json out = json::array();
	for (const auto &instance : instances) {
		json item = instance->summary();
		try {
			item["training"] = trainingStateName(orchestrator_->state(instance->id()));
		} catch (const EngineError &) {
			// Destroyed after the snapshot.
			continue;
		}
		out.push_back(item);
	}
	return out;
}

json EngineRegistry::status(const std::string &engineId) const {
	auto instance = find(engineId);
	json out = instance->summary();
	out["params"] = instance->params().raw;
	out["training"] = orchestrator_->status(engineId);
	out["mirror"] = json{{"enabled", mirror_->isEnabled(engineId)}, {"file", mirror_->logFile(engineId).string()}};
	out["engine"] = guardAlgorithm(engineId, "status", [&]() { return instance->engine()->status(); });
	return out;
}

} // namespace enginehost
