#include "config.hpp"

#include <algorithm>
#include <thread>

#include "util.hpp"

namespace enginehost {

std::map<std::string, std::string> parseArgs(int argc, char **argv) {
	std::map<std::string, std::string> out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			out[item.substr(2)] = "true";
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

Config loadConfig(int argc, char **argv) {
	const auto args = parseArgs(argc, argv);
	auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
		auto it = args.find(argKey);
		if (it != args.end() && !it->second.empty()) return it->second;
		std::string v = getEnv(env);
		if (!v.empty()) return v;
		return def;
	};

	Config c;
	c.baseDir = fs::absolute(argOrEnv("base-dir", "ENGINEHOST_BASE_DIR", (fs::current_path() / "enginehost_store").string()));

	c.storeBackend = argOrEnv("store", "ENGINEHOST_STORE", "lmdb");
	std::transform(c.storeBackend.begin(), c.storeBackend.end(), c.storeBackend.begin(), ::tolower);
	if (c.storeBackend != "lmdb" && c.storeBackend != "json") c.storeBackend = "lmdb";
	c.lmdbMapSizeBytes = std::max<std::size_t>(64, (std::size_t)numberOr(argOrEnv("lmdb-map-mb", "ENGINEHOST_LMDB_MAP_MB", "512"), 512)) * 1024ull * 1024ull;

	c.mirrorRoot = fs::absolute(argOrEnv("mirror-root", "ENGINEHOST_MIRROR_ROOT", (c.baseDir / "mirrors").string()));

	c.host = argOrEnv("host", "ENGINEHOST_HOST", "127.0.0.1");
	c.port = std::max(1, (int)numberOr(argOrEnv("port", "ENGINEHOST_PORT", "9090"), 9090));

	int cpuCount = (int)std::max(2u, std::thread::hardware_concurrency());
	int workersRaw = (int)numberOr(argOrEnv("train-workers", "ENGINEHOST_TRAIN_WORKERS", "0"), 0);
	c.trainWorkers = std::max(1, workersRaw ? workersRaw : (cpuCount - 1));

	c.enabledEngines = splitList(argOrEnv("engines", "ENGINEHOST_ENGINES", ""));

	c.redisUrl = argOrEnv("redis-url", "ENGINEHOST_REDIS_URL", "");
	c.redisChannel = argOrEnv("redis-channel", "ENGINEHOST_REDIS_CHANNEL", "enginehost:lifecycle");
	c.redisLockTtlMs = std::max(1000, (int)numberOr(argOrEnv("redis-lock-ttl-ms", "ENGINEHOST_REDIS_LOCK_TTL_MS", "30000"), 30000));
	c.redisLockWaitMs = std::max(0, (int)numberOr(argOrEnv("redis-lock-wait-ms", "ENGINEHOST_REDIS_LOCK_WAIT_MS", "5000"), 5000));

	c.authEnabled = boolFrom(argOrEnv("auth", "ENGINEHOST_AUTH_ENABLED", "true"), true);
	c.jwtSecret = argOrEnv("jwt-secret", "ENGINEHOST_JWT_SECRET", "dev-secret-change-me");
	return c;
}

} // namespace enginehost
