#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "event.hpp"
#include "params.hpp"

namespace enginehost {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct MirrorRecord {
	std::string engineId;
	uint64_t sequence{0};
	Event event;
};

// Append-only archive of accepted events, one JSON line per record under
// <location>/<engineId>/events.jsonl. Appends for one engine are serialized and
// fsync'd before record() returns; different engines never share a lock.
class MirrorLog {
public:
	explicit MirrorLog(fs::path defaultRoot);
	~MirrorLog();

	MirrorLog(const MirrorLog &) = delete;
	MirrorLog &operator=(const MirrorLog &) = delete;

	// Applies the mirror settings from an engine's parameters. Turning mirroring
	// off closes the log but keeps every record already written. Moving an id to
	// a new location while its current log holds records is an UnsupportedUpdate.
	// A log closed after a failed append is reopened here.
	void configure(const EngineParams &params);
	void disable(const std::string &engineId);
	bool isEnabled(const std::string &engineId) const;

	// Returns the sequence number assigned to the event. Throws StorageFailure
	// when the record could not be made durable; nothing is then counted.
	uint64_t record(const std::string &engineId, const Event &event);

	// Feeds every intact record to sink in sequence order. A torn final line is
	// skipped; any other unreadable line is a StorageFailure.
	std::size_t replayInto(const std::string &engineId, const std::function<void(const MirrorRecord &)> &sink) const;

	// Record count, last sequence, sequence gaps and unreadable lines.
	json verify(const std::string &engineId) const;

	fs::path logFile(const std::string &engineId) const;

private:
	struct Channel {
		std::mutex mu;
		fs::path file;
		int fd{-1};
		uint64_t nextSequence{1};
	};

	std::shared_ptr<Channel> openChannel(const std::string &engineId, const fs::path &file);
	static void closeChannel(Channel &channel);
	fs::path locationFor(const EngineParams &params) const;

	fs::path defaultRoot_;
	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
	std::unordered_map<std::string, fs::path> files_;
};

} // namespace enginehost
