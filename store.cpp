#include "store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

#include "errors.hpp"
#include "util.hpp"

namespace enginehost {

std::size_t eraseAll(KeyValueStore &store, const std::string &prefix) {
	auto all = store.entries(prefix);
	for (auto &kv : all) store.del(kv.first);
	return all.size();
}

// ------------------ LMDB ------------------

LmdbStore::LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes)
	: name_(name), rootDir_(rootDir), mapSizeBytes_(mapSizeBytes) {
	fs::path envPath = rootDir_ / name_;
	std::error_code ec;
	fs::create_directories(envPath, ec);
	if (ec) {
		lastError_ = "cannot create " + envPath.string() + ": " + ec.message();
		return;
	}
	int rc = mdb_env_create(&env_);
	if (rc != 0) {
		env_ = nullptr;
		lastError_ = mdb_strerror(rc);
		return;
	}
	mdb_env_set_maxreaders(env_, 126);
	mdb_env_set_maxdbs(env_, 4);
	mdb_env_set_mapsize(env_, mapSizeBytes_);
	rc = mdb_env_open(env_, envPath.string().c_str(), 0, 0664);
	if (rc != 0) {
		lastError_ = mdb_strerror(rc);
		mdb_env_close(env_);
		env_ = nullptr;
		return;
	}
	MDB_txn *txn = nullptr;
	rc = mdb_txn_begin(env_, nullptr, 0, &txn);
	if (rc != 0) {
		lastError_ = mdb_strerror(rc);
		return;
	}
	rc = mdb_dbi_open(txn, "default", MDB_CREATE, &dbi_);
	if (rc != 0) {
		lastError_ = mdb_strerror(rc);
		mdb_txn_abort(txn);
		return;
	}
	rc = mdb_txn_commit(txn);
	if (rc != 0) {
		lastError_ = mdb_strerror(rc);
		return;
	}
	ok_ = true;
}

LmdbStore::~LmdbStore() {
	if (env_) {
		if (ok_) mdb_dbi_close(env_, dbi_);
		mdb_env_close(env_);
	}
}

void LmdbStore::check(int rc, const char *what) const {
	if (rc != 0) throw storageFailure("lmdb " + name_ + " " + what + ": " + mdb_strerror(rc));
}

std::optional<json> LmdbStore::get(const std::string &key) {
	if (!ok_) return std::nullopt;
	MDB_txn *txn = nullptr;
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v;
	check(mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn), "begin");
	int rc = mdb_get(txn, dbi_, &k, &v);
	if (rc == MDB_NOTFOUND) {
		mdb_txn_abort(txn);
		return std::nullopt;
	}
	if (rc != 0) {
		mdb_txn_abort(txn);
		check(rc, "get");
	}
	std::string raw((char *)v.mv_data, v.mv_size);
	mdb_txn_abort(txn);
	json parsed = json::parse(raw, nullptr, false);
	if (parsed.is_discarded()) return json(raw);
	return parsed;
}

void LmdbStore::put(const std::string &key, const json &value) {
	if (!ok_) throw storageFailure("lmdb " + name_ + " unavailable: " + lastError_);
	MDB_txn *txn = nullptr;
	check(mdb_txn_begin(env_, nullptr, 0, &txn), "begin");
	std::string encoded = value.dump();
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v{encoded.size(), (void *)encoded.data()};
	int rc = mdb_put(txn, dbi_, &k, &v, 0);
	if (rc != 0) {
		mdb_txn_abort(txn);
		check(rc, "put");
	}
	check(mdb_txn_commit(txn), "commit");
}

void LmdbStore::del(const std::string &key) {
	if (!ok_) throw storageFailure("lmdb " + name_ + " unavailable: " + lastError_);
	MDB_txn *txn = nullptr;
	check(mdb_txn_begin(env_, nullptr, 0, &txn), "begin");
	MDB_val k{key.size(), (void *)key.data()};
	int rc = mdb_del(txn, dbi_, &k, nullptr);
	if (rc != 0 && rc != MDB_NOTFOUND) {
		mdb_txn_abort(txn);
		check(rc, "del");
	}
	check(mdb_txn_commit(txn), "commit");
}

std::vector<std::pair<std::string, json>> LmdbStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	if (!ok_) return out;
	MDB_txn *txn = nullptr;
	MDB_cursor *cursor = nullptr;
	check(mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn), "begin");
	int rc = mdb_cursor_open(txn, dbi_, &cursor);
	if (rc != 0) {
		mdb_txn_abort(txn);
		check(rc, "cursor");
	}
	MDB_val k, v;
	std::string start = prefix;
	if (start.empty()) {
		rc = mdb_cursor_get(cursor, &k, &v, MDB_FIRST);
	} else {
		k.mv_size = start.size();
		k.mv_data = (void *)start.data();
		rc = mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
	}
	while (rc == 0) {
		std::string key((char *)k.mv_data, k.mv_size);
		if (!prefix.empty() && key.rfind(prefix, 0) != 0) break;
		std::string raw((char *)v.mv_data, v.mv_size);
		json parsed = json::parse(raw, nullptr, false);
		out.push_back({key, parsed.is_discarded() ? json(raw) : parsed});
		rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
	}
	mdb_cursor_close(cursor);
	mdb_txn_abort(txn);
	if (rc != 0 && rc != MDB_NOTFOUND) check(rc, "scan");
	return out;
}

void LmdbStore::flush() {
	if (!ok_) return;
	check(mdb_env_sync(env_, 1), "sync");
}

// ------------------ JSON file ------------------

JsonFileStore::JsonFileStore(const std::string &name, const fs::path &rootDir, int flushIntervalMs)
	: name_(name), rootDir_(rootDir), flushIntervalMs_(std::max(100, flushIntervalMs)) {
	ensureDir(rootDir_);
	file_ = rootDir_ / (name_ + ".json");
	load();
	startFlushThread();
}

JsonFileStore::~JsonFileStore() {
	stopFlushThread();
	try {
		flush();
	} catch (const std::exception &e) {
		std::cerr << "[Store] final flush of " << file_.string() << " failed: " << e.what() << std::endl;
	}
}

void JsonFileStore::load() {
	if (!fs::exists(file_)) return;
	std::ifstream in(file_);
	nlohmann::ordered_json j = nlohmann::ordered_json::parse(in, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw storageFailure("corrupt store file " + file_.string());
	}
	for (auto it = j.begin(); it != j.end(); ++it) {
		json value = it.value();
		if (value.is_string()) {
			json parsed = json::parse(value.get<std::string>(), nullptr, false);
			data_[it.key()] = parsed.is_discarded() ? value : parsed;
		} else {
			data_[it.key()] = value;
		}
		order_.push_back(it.key());
	}
}

std::optional<json> JsonFileStore::get(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = data_.find(key);
	if (it == data_.end()) return std::nullopt;
	return it->second;
}

void JsonFileStore::put(const std::string &key, const json &value) {
	std::lock_guard<std::mutex> lock(mu_);
	if (!data_.count(key)) order_.push_back(key);
	data_[key] = value;
	dirty_ = true;
}

void JsonFileStore::del(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	if (data_.erase(key) > 0) {
		order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
		dirty_ = true;
	}
}

std::vector<std::pair<std::string, json>> JsonFileStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	std::lock_guard<std::mutex> lock(mu_);
	for (auto &key : order_) {
		auto it = data_.find(key);
		if (it == data_.end()) continue;
		if (prefix.empty() || key.rfind(prefix, 0) == 0) out.push_back(*it);
	}
	return out;
}

void JsonFileStore::flush() {
	std::lock_guard<std::mutex> flushLock(flushMu_);
	nlohmann::ordered_json j = nlohmann::ordered_json::object();
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!dirty_) return;
		for (auto &key : order_) {
			auto it = data_.find(key);
			if (it != data_.end()) j[key] = it->second.dump();
		}
		dirty_ = false;
	}
	fs::path tmp = file_;
	tmp += ".tmp";
	{
		std::ofstream out(tmp, std::ios::trunc);
		out << j.dump(2);
		out.flush();
		if (!out) {
			std::lock_guard<std::mutex> lock(mu_);
			dirty_ = true;
			throw storageFailure("cannot write " + tmp.string());
		}
	}
	std::error_code ec;
	fs::rename(tmp, file_, ec);
	if (ec) {
		std::lock_guard<std::mutex> lock(mu_);
		dirty_ = true;
		throw storageFailure("cannot replace " + file_.string() + ": " + ec.message());
	}
}

void JsonFileStore::startFlushThread() {
	running_.store(true);
	flushThread_ = std::thread([this]() {
		while (running_.load()) {
			for (int waited = 0; waited < flushIntervalMs_ && running_.load(); waited += 50) {
				std::this_thread::sleep_for(std::chrono::milliseconds(50));
			}
			if (!running_.load()) break;
			try {
				flush();
			} catch (const std::exception &e) {
				std::cerr << "[Store] periodic flush failed: " << e.what() << std::endl;
			}
		}
	});
}

void JsonFileStore::stopFlushThread() {
	running_.store(false);
	if (flushThread_.joinable()) flushThread_.join();
}

// ------------------ Namespaces ------------------

NamespacedStore::NamespacedStore(std::shared_ptr<KeyValueStore> base, const std::string &ns)
	: base_(std::move(base)) {
	std::string trimmed = trimCopy(ns);
	if (trimmed.empty()) throw std::invalid_argument("NamespacedStore requires a namespace");
	prefix_ = "ns:" + trimmed + ":";
}

std::vector<std::pair<std::string, json>> NamespacedStore::entries(const std::string &prefix) {
	auto all = base_->entries(prefix_ + prefix);
	std::vector<std::pair<std::string, json>> out;
	out.reserve(all.size());
	for (auto &kv : all) {
		if (kv.first.rfind(prefix_, 0) == 0) {
			out.push_back({kv.first.substr(prefix_.size()), std::move(kv.second)});
		}
	}
	return out;
}

std::size_t NamespacedStore::clear() {
	return eraseAll(*base_, prefix_);
}

std::shared_ptr<KeyValueStore> openStore(const std::string &backend, const std::string &name,
										 const fs::path &rootDir, std::size_t lmdbMapSizeBytes) {
	if (backend == "lmdb") {
		auto lmdb = std::make_shared<LmdbStore>(name, rootDir, lmdbMapSizeBytes);
		if (!lmdb->ok()) throw storageFailure("cannot open lmdb store " + name + ": " + lmdb->lastError());
		return lmdb;
	}
	return std::make_shared<JsonFileStore>(name, rootDir);
}

} // namespace enginehost
