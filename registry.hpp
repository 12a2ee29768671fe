#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "cluster.hpp"
#include "engine.hpp"
#include "mirror_log.hpp"
#include "orchestrator.hpp"
#include "params.hpp"
#include "store.hpp"

namespace enginehost {

using json = nlohmann::json;

enum class InstanceState { Active, Updating, Destroyed };

const char *instanceStateName(InstanceState state);

// Canonical record for one live engine. The registry is the only writer.
class EngineInstance {
public:
	EngineInstance(EngineParams params, std::shared_ptr<Engine> engine, std::shared_ptr<NamespacedStore> store,
				   Discipline discipline, int64_t createdAt, int64_t updatedAt);

	const std::string &id() const { return id_; }
	const std::shared_ptr<Engine> &engine() const { return engine_; }
	const std::shared_ptr<NamespacedStore> &store() const { return store_; }
	Discipline discipline() const { return discipline_; }

	EngineParams params() const;
	InstanceState state() const;
	int64_t createdAt() const;
	int64_t updatedAt() const;

	json summary() const;

private:
	friend class EngineRegistry;

	std::string id_;
	std::shared_ptr<Engine> engine_;
	std::shared_ptr<NamespacedStore> store_;
	Discipline discipline_;

	mutable std::mutex mu_;
	EngineParams params_;
	InstanceState state_{InstanceState::Active};
	int64_t createdAt_{0};
	int64_t updatedAt_{0};
};

class EngineRegistry {
public:
	EngineRegistry(std::shared_ptr<KeyValueStore> metadata, std::shared_ptr<KeyValueStore> datasets,
				   std::shared_ptr<EngineCatalog> catalog, std::shared_ptr<MirrorLog> mirror,
				   std::shared_ptr<TrainingOrchestrator> orchestrator, std::shared_ptr<ClusterCoordinator> cluster = nullptr);

	EngineRegistry(const EngineRegistry &) = delete;
	EngineRegistry &operator=(const EngineRegistry &) = delete;

	// Returns the new engine id. Nothing is left registered when it throws.
	std::string create(const json &raw);

	// Re-initializes the running engine with new parameters. The Dataset is untouched.
	void update(const std::string &engineId, const json &raw);

	// Unroutable first, then waits for in-flight work, then erases Dataset,
	// Model and metadata. Mirrored history stays on disk.
	void destroy(const std::string &engineId);

	// Rebuilds every instance with persisted metadata. Never throws for a single
	// bad record; returns {"restored": [...], "failed": [{"engineId", "error"}]}.
	json restoreAll();

	// NotFound unless the id is live.
	std::shared_ptr<EngineInstance> find(const std::string &engineId) const;
	bool contains(const std::string &engineId) const;

	json list() const;
	json status(const std::string &engineId) const;
	json restoreReport() const;
	std::size_t size() const;
	// Ids with a lifecycle operation running or waiting.
	std::size_t lockedIds() const;

	static std::string metadataKey(const std::string &engineId) { return "engine:" + engineId; }

private:
	// Serializes create, update, destroy and restore on one id. The per-id mutex
	// is dropped from the map once nothing holds or waits on it.
	class IdGuard {
	public:
		IdGuard(EngineRegistry &registry, const std::string &engineId);
		~IdGuard();
		IdGuard(const IdGuard &) = delete;
		IdGuard &operator=(const IdGuard &) = delete;

	private:
		EngineRegistry &registry_;
		std::string engineId_;
		std::shared_ptr<std::mutex> mu_;
	};

	std::shared_ptr<std::mutex> idLock(const std::string &engineId);
	void releaseIdLock(const std::string &engineId, std::shared_ptr<std::mutex> lock);
	ClusterCoordinator::Lock clusterLock(const std::string &engineId);
	void announce(const std::string &op, const std::string &engineId);

	// Shared by create and restoreAll. A fresh build starts from an empty
	// namespace and persists metadata; a restore keeps both as found.
	std::shared_ptr<EngineInstance> build(const EngineParams &params, int64_t createdAt, int64_t updatedAt, bool fresh);
	void persist(const EngineInstance &instance, const EngineParams &params, int64_t updatedAt);

	std::shared_ptr<KeyValueStore> metadata_;
	std::shared_ptr<KeyValueStore> datasets_;
	std::shared_ptr<EngineCatalog> catalog_;
	std::shared_ptr<MirrorLog> mirror_;
	std::shared_ptr<TrainingOrchestrator> orchestrator_;
	std::shared_ptr<ClusterCoordinator> cluster_;

	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<EngineInstance>> live_;

	mutable std::mutex idLocksMu_;
	std::unordered_map<std::string, std::shared_ptr<std::mutex>> idLocks_;

	mutable std::mutex reportMu_;
	json restoreReport_ = json{{"restored", json::array()}, {"failed", json::array()}};
};

} // namespace enginehost
