#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace enginehost {

namespace fs = std::filesystem;

struct Config {
	fs::path baseDir;
	std::string storeBackend{"lmdb"};
	std::size_t lmdbMapSizeBytes{512ull * 1024ull * 1024ull};
	fs::path mirrorRoot;
	std::string host{"127.0.0.1"};
	int port{9090};
	int trainWorkers{1};
	std::vector<std::string> enabledEngines;
	std::string redisUrl;
	std::string redisChannel{"enginehost:lifecycle"};
	int redisLockTtlMs{30000};
	int redisLockWaitMs{5000};
	bool authEnabled{true};
	std::string jwtSecret{"dev-secret-change-me"};
};

std::map<std::string, std::string> parseArgs(int argc, char **argv);
Config loadConfig(int argc, char **argv);

} // namespace enginehost
