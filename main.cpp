#include <iostream>
#include <memory>

#include "builtin_engines.hpp"
#include "cluster.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "mirror_log.hpp"
#include "orchestrator.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "store.hpp"
#include "util.hpp"

using namespace enginehost;

int main(int argc, char **argv) {
	const auto config = loadConfig(argc, argv);

	try {
		ensureDir(config.baseDir);
		ensureDir(config.mirrorRoot);
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] cannot prepare " << config.baseDir.string() << ": " << e.what() << std::endl;
		return 1;
	}

	std::shared_ptr<KeyValueStore> metadata;
	std::shared_ptr<KeyValueStore> datasets;
	try {
		metadata = openStore(config.storeBackend, "engines", config.baseDir, config.lmdbMapSizeBytes);
		datasets = openStore(config.storeBackend, "datasets", config.baseDir, config.lmdbMapSizeBytes);
	} catch (const std::exception &e) {
		std::cerr << "[Bootstrap] cannot open " << config.storeBackend << " store: " << e.what() << std::endl;
		return 1;
	}

	auto catalog = std::make_shared<EngineCatalog>();
	if (registerBuiltinEngines(*catalog, config.enabledEngines) == 0) {
		std::cerr << "[Bootstrap] no engine types enabled" << std::endl;
		return 1;
	}

	std::shared_ptr<ClusterCoordinator> cluster;
	try {
		cluster = std::make_shared<ClusterCoordinator>(config.redisUrl, config.redisChannel, config.redisLockTtlMs,
													   config.redisLockWaitMs);
	} catch (const EngineError &e) {
		std::cerr << "[Bootstrap] " << e.what() << std::endl;
		return 1;
	}

	auto mirror = std::make_shared<MirrorLog>(config.mirrorRoot);
	auto orchestrator = std::make_shared<TrainingOrchestrator>(config.trainWorkers);
	auto registry = std::make_shared<EngineRegistry>(metadata, datasets, catalog, mirror, orchestrator, cluster);
	auto router = std::make_shared<Router>(registry, mirror, orchestrator);

	json report = registry->restoreAll();
	std::cout << "[Bootstrap] store=" << config.storeBackend << " base=" << config.baseDir.string()
			  << " mirrors=" << config.mirrorRoot.string() << " trainWorkers=" << config.trainWorkers << std::endl;
	if (!report["failed"].empty()) {
		std::cerr << "[Bootstrap] " << report["failed"].size() << " engine(s) failed to restore" << std::endl;
	}

	GatewayServer gateway(registry, router, catalog, cluster, config);
	gateway.listen();

	std::cout << "[Bootstrap] shutting down" << std::endl;
	orchestrator->stop();
	try {
		metadata->flush();
		datasets->flush();
	} catch (const EngineError &e) {
		std::cerr << "[Bootstrap] final flush failed: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
