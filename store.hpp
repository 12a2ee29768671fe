#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <lmdb.h>
#include <nlohmann/json.hpp>

namespace enginehost {

using json = nlohmann::json;
namespace fs = std::filesystem;

// Writes raise EngineError(StorageFailure) when the backend rejects them.
class KeyValueStore {
public:
	virtual ~KeyValueStore() = default;
	virtual std::optional<json> get(const std::string &key) = 0;
	virtual void put(const std::string &key, const json &value) = 0;
	virtual void del(const std::string &key) = 0;
	virtual std::vector<std::pair<std::string, json>> entries(const std::string &prefix) = 0;
	virtual void flush() {}
};

// Deletes every key under prefix, returns the number removed.
std::size_t eraseAll(KeyValueStore &store, const std::string &prefix);

class LmdbStore : public KeyValueStore {
public:
	LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes);
	~LmdbStore() override;

	LmdbStore(const LmdbStore &) = delete;
	LmdbStore &operator=(const LmdbStore &) = delete;

	bool ok() const { return ok_; }
	const std::string &lastError() const { return lastError_; }

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override;

private:
	void check(int rc, const char *what) const;

	std::string name_;
	fs::path rootDir_;
	std::size_t mapSizeBytes_;
	bool ok_{false};
	std::string lastError_;
	MDB_env *env_{nullptr};
	MDB_dbi dbi_{0};
};

class JsonFileStore : public KeyValueStore {
public:
	JsonFileStore(const std::string &name, const fs::path &rootDir, int flushIntervalMs = 10000);
	~JsonFileStore() override;

	JsonFileStore(const JsonFileStore &) = delete;
	JsonFileStore &operator=(const JsonFileStore &) = delete;

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override;

	const fs::path &file() const { return file_; }

private:
	void load();
	void startFlushThread();
	void stopFlushThread();

	std::string name_;
	fs::path rootDir_;
	fs::path file_;
	int flushIntervalMs_{10000};
	bool dirty_{false};
	std::unordered_map<std::string, json> data_;
	std::vector<std::string> order_;
	std::mutex mu_;
	std::mutex flushMu_;
	std::atomic<bool> running_{false};
	std::thread flushThread_;
};

class NamespacedStore : public KeyValueStore {
public:
	NamespacedStore(std::shared_ptr<KeyValueStore> base, const std::string &ns);

	std::optional<json> get(const std::string &key) override { return base_->get(prefix_ + key); }
	void put(const std::string &key, const json &value) override { base_->put(prefix_ + key, value); }
	void del(const std::string &key) override { base_->del(prefix_ + key); }
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override { base_->flush(); }

	// Removes everything in this namespace.
	std::size_t clear();

	const std::string &prefix() const { return prefix_; }

private:
	std::shared_ptr<KeyValueStore> base_;
	std::string prefix_;
};

// LMDB when requested, otherwise a JSON file. Throws StorageFailure when the
// requested backend cannot be opened.
std::shared_ptr<KeyValueStore> openStore(const std::string &backend, const std::string &name,
										 const fs::path &rootDir, std::size_t lmdbMapSizeBytes);

} // namespace enginehost
