#include "cluster.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include "errors.hpp"
#include "util.hpp"

namespace enginehost {

namespace {

constexpr const char *kLockPrefix = "enginehost:lock:";

// Deletes the key only while it still holds our token.
constexpr const char *kReleaseScript =
	"if redis.call('get', KEYS[1]) == ARGV[1] then "
	"return redis.call('del', KEYS[1]) "
	"else return 0 end";

} // namespace

ClusterCoordinator::Lock::Lock(Lock &&other) noexcept
	: owner_(other.owner_), key_(std::move(other.key_)), token_(std::move(other.token_)) {
	other.owner_ = nullptr;
}

ClusterCoordinator::Lock &ClusterCoordinator::Lock::operator=(Lock &&other) noexcept {
	if (this != &other) {
		release();
		owner_ = other.owner_;
		key_ = std::move(other.key_);
		token_ = std::move(other.token_);
		other.owner_ = nullptr;
	}
	return *this;
}

ClusterCoordinator::Lock::~Lock() {
	release();
}

void ClusterCoordinator::Lock::release() {
	if (!owner_) return;
	owner_->releaseKey(key_, token_);
	owner_ = nullptr;
}

ClusterCoordinator::ClusterCoordinator(const std::string &url, const std::string &channel, int lockTtlMs, int lockWaitMs)
	: url_(url), channel_(channel), lockTtlMs_(lockTtlMs), lockWaitMs_(lockWaitMs) {
	if (url_.empty()) {
		std::cout << "[Cluster] redis not configured, per-id locks are process-local" << std::endl;
		return;
	}
	try {
		sw::redis::ConnectionOptions opts(url_);
		redis_ = std::make_unique<sw::redis::Redis>(opts);
		redis_->ping();
	} catch (const sw::redis::Error &e) {
		redis_.reset();
		throw storageFailure("cannot reach redis at " + url_ + ": " + e.what());
	}
	std::cout << "[Cluster] coordinating through " << url_ << " channel=" << channel_ << std::endl;
}

ClusterCoordinator::Lock ClusterCoordinator::acquire(const std::string &engineId) {
	if (!redis_) return Lock();
	std::string key = kLockPrefix + engineId;
	std::string token = randomHex(16);
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(lockWaitMs_);
	while (true) {
		try {
			if (redis_->set(key, token, std::chrono::milliseconds(lockTtlMs_), sw::redis::UpdateType::NOT_EXIST)) {
				return Lock(this, key, token);
			}
		} catch (const sw::redis::Error &e) {
			throw storageFailure(std::string("cluster lock failed: ") + e.what(), engineId);
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			throw storageFailure("engine is locked by another process", engineId);
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
	}
}

void ClusterCoordinator::releaseKey(const std::string &key, const std::string &token) {
	if (!redis_) return;
	try {
		redis_->eval<long long>(kReleaseScript, {key}, {token});
	} catch (const sw::redis::Error &e) {
		// The TTL frees the key eventually.
		std::cerr << "[Cluster] release of " << key << " failed: " << e.what() << std::endl;
	}
}

void ClusterCoordinator::publish(const std::string &op, const std::string &engineId) {
	if (!redis_) return;
	json msg{{"op", op}, {"engineId", engineId}, {"at", nowIso()}};
	try {
		redis_->publish(channel_, msg.dump());
		std::lock_guard<std::mutex> lock(mu_);
		published_++;
	} catch (const sw::redis::Error &e) {
		std::cerr << "[Cluster] publish " << op << " " << engineId << " failed: " << e.what() << std::endl;
		std::lock_guard<std::mutex> lock(mu_);
		publishFailures_++;
	}
}

json ClusterCoordinator::status() const {
	std::lock_guard<std::mutex> lock(mu_);
	return json{{"enabled", enabled()},
				{"channel", channel_},
				{"lockTtlMs", lockTtlMs_},
				{"published", published_},
				{"publishFailures", publishFailures_}};
}

} // namespace enginehost
