#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

namespace enginehost {

using json = nlohmann::json;

// Cross-process side of per-id serialization. With an empty URL every lock is
// local-only and publish() is a no-op, which is the single-process deployment.
class ClusterCoordinator {
public:
	class Lock {
	public:
		Lock() = default;
		Lock(Lock &&other) noexcept;
		Lock &operator=(Lock &&other) noexcept;
		Lock(const Lock &) = delete;
		Lock &operator=(const Lock &) = delete;
		~Lock();

		void release();

	private:
		friend class ClusterCoordinator;
		Lock(ClusterCoordinator *owner, std::string key, std::string token)
			: owner_(owner), key_(std::move(key)), token_(std::move(token)) {}

		ClusterCoordinator *owner_{nullptr};
		std::string key_;
		std::string token_;
	};

	ClusterCoordinator(const std::string &url, const std::string &channel, int lockTtlMs, int lockWaitMs);

	bool enabled() const { return redis_ != nullptr; }
	const std::string &channel() const { return channel_; }

	// Blocks up to the wait budget; StorageFailure if another process keeps the id.
	Lock acquire(const std::string &engineId);

	// Lifecycle notification for other processes. Failures are logged, never thrown:
	// the operation being announced has already committed.
	void publish(const std::string &op, const std::string &engineId);

	json status() const;

private:
	void releaseKey(const std::string &key, const std::string &token);

	std::string url_;
	std::string channel_;
	int lockTtlMs_{30000};
	int lockWaitMs_{5000};
	std::unique_ptr<sw::redis::Redis> redis_;
	mutable std::mutex mu_;
	uint64_t published_{0};
	uint64_t publishFailures_{0};
};

} // namespace enginehost
