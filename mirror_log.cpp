#include "mirror_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "util.hpp"

namespace enginehost {

namespace {

constexpr const char *kLogFileName = "events.jsonl";

struct LogScan {
	std::vector<std::pair<std::size_t, json>> records;
	std::vector<std::size_t> unreadable;
	std::size_t lines{0};
	std::streamoff lastLineOffset{0};
	bool tornTail{false};
	bool endsWithNewline{true};
};

LogScan scanLog(const fs::path &file) {
	LogScan scan;
	std::ifstream in(file, std::ios::binary);
	if (!in) return scan;
	std::string line;
	std::streamoff offset = 0;
	while (std::getline(in, line)) {
		scan.lines++;
		scan.lastLineOffset = offset;
		offset += (std::streamoff)line.size() + 1;
		if (trimCopy(line).empty()) continue;
		json rec = json::parse(line, nullptr, false);
		if (rec.is_discarded() || !rec.is_object() || !rec.contains("sequence") ||
			!rec["sequence"].is_number_unsigned() || !rec.contains("event")) {
			scan.unreadable.push_back(scan.lines);
			continue;
		}
		scan.records.push_back({scan.lines, std::move(rec)});
	}
	in.clear();
	in.seekg(0, std::ios::end);
	auto size = (std::streamoff)in.tellg();
	if (size > 0) {
		in.seekg(size - 1);
		char last = 0;
		in.get(last);
		scan.endsWithNewline = (last == '\n');
	}
	if (!scan.endsWithNewline && !scan.unreadable.empty() && scan.unreadable.back() == scan.lines) scan.tornTail = true;
	return scan;
}

void writeAll(int fd, const std::string &data) {
	const char *p = data.data();
	std::size_t left = data.size();
	while (left > 0) {
		ssize_t n = ::write(fd, p, left);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw std::system_error(errno, std::generic_category(), "write");
		}
		p += n;
		left -= (std::size_t)n;
	}
}

} // namespace

MirrorLog::MirrorLog(fs::path defaultRoot) : defaultRoot_(std::move(defaultRoot)) {}

MirrorLog::~MirrorLog() {
	std::lock_guard<std::mutex> lock(mu_);
	for (auto &kv : channels_) {
		std::lock_guard<std::mutex> chLock(kv.second->mu);
		closeChannel(*kv.second);
	}
	channels_.clear();
}

fs::path MirrorLog::locationFor(const EngineParams &params) const {
	fs::path root = params.mirrorLocation.empty() ? defaultRoot_ : fs::path(params.mirrorLocation);
	return root / params.engineId / kLogFileName;
}

void MirrorLog::configure(const EngineParams &params) {
	if (!params.mirroring()) {
		disable(params.engineId);
		return;
	}
	fs::path file = locationFor(params);
	fs::path current;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = channels_.find(params.engineId);
		if (it != channels_.end() && it->second->file == file && it->second->fd >= 0) return;
		auto known = files_.find(params.engineId);
		current = known != files_.end() ? known->second : defaultRoot_ / params.engineId / kLogFileName;
	}
	if (current != file && !scanLog(current).records.empty()) {
		// Sequences are per id; a second log would restart them and hide the first.
		throw EngineError(ErrorKind::UnsupportedUpdate,
						  "mirrorLocation cannot move away from " + current.parent_path().parent_path().string() +
							  " while " + current.string() + " holds records",
						  "mirrorLocation", params.engineId);
	}
	auto channel = openChannel(params.engineId, file);
	std::shared_ptr<Channel> previous;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = channels_.find(params.engineId);
		if (it != channels_.end()) previous = it->second;
		channels_[params.engineId] = channel;
		files_[params.engineId] = file;
	}
	if (previous) {
		std::lock_guard<std::mutex> chLock(previous->mu);
		closeChannel(*previous);
	}
	std::cout << "[MirrorLog] " << params.engineId << " mirroring to " << file.string()
			  << " from sequence " << channel->nextSequence << std::endl;
}

std::shared_ptr<MirrorLog::Channel> MirrorLog::openChannel(const std::string &engineId, const fs::path &file) {
	std::error_code ec;
	fs::create_directories(file.parent_path(), ec);
	if (ec) throw storageFailure("cannot create mirror directory " + file.parent_path().string() + ": " + ec.message(), engineId);

	auto channel = std::make_shared<Channel>();
	channel->file = file;
	LogScan scan = scanLog(file);
	uint64_t lastSequence = 0;
	for (const auto &rec : scan.records) {
		lastSequence = std::max<uint64_t>(lastSequence, rec.second["sequence"].get<uint64_t>());
	}
	channel->nextSequence = lastSequence + 1;
	if (!scan.unreadable.empty()) {
		std::cerr << "[MirrorLog] " << engineId << " has " << scan.unreadable.size()
				  << " unreadable record(s) in " << file.string() << std::endl;
	}

	int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
	if (fd < 0) {
		throw storageFailure("cannot open mirror log " + file.string() + ": " + std::strerror(errno), engineId);
	}
	if (scan.tornTail && !scan.endsWithNewline) {
		// A partial last record was never acknowledged; drop it.
		if (::ftruncate(fd, scan.lastLineOffset) != 0) {
			int err = errno;
			::close(fd);
			throw storageFailure("cannot drop torn mirror record in " + file.string() + ": " + std::strerror(err), engineId);
		}
		std::cerr << "[MirrorLog] " << engineId << " dropped torn record at line " << scan.lines << std::endl;
	} else if (!scan.endsWithNewline) {
		try {
			writeAll(fd, "\n");
		} catch (const std::system_error &e) {
			::close(fd);
			throw storageFailure("cannot terminate last mirror record in " + file.string() + ": " + e.what(), engineId);
		}
	}
	channel->fd = fd;
	return channel;
}

void MirrorLog::closeChannel(Channel &channel) {
	if (channel.fd >= 0) {
		::close(channel.fd);
		channel.fd = -1;
	}
}

void MirrorLog::disable(const std::string &engineId) {
	std::shared_ptr<Channel> channel;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = channels_.find(engineId);
		if (it == channels_.end()) return;
		channel = it->second;
		channels_.erase(it);
	}
	std::lock_guard<std::mutex> chLock(channel->mu);
	closeChannel(*channel);
}

bool MirrorLog::isEnabled(const std::string &engineId) const {
	std::lock_guard<std::mutex> lock(mu_);
	return channels_.count(engineId) > 0;
}

uint64_t MirrorLog::record(const std::string &engineId, const Event &event) {
	std::shared_ptr<Channel> channel;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = channels_.find(engineId);
		if (it == channels_.end()) throw storageFailure("mirroring is not enabled", engineId);
		channel = it->second;
	}

	std::lock_guard<std::mutex> chLock(channel->mu);
	if (channel->fd < 0) throw storageFailure("mirror log is closed", engineId);

	uint64_t sequence = channel->nextSequence;
	json rec{{"sequence", sequence},
			 {"eventTime", formatIso(event.eventTime)},
			 {"creationTime", formatIso(event.creationTime)},
			 {"event", event.toJson()}};
	std::string line = rec.dump() + "\n";

	off_t before = ::lseek(channel->fd, 0, SEEK_END);
	try {
		writeAll(channel->fd, line);
		if (::fsync(channel->fd) != 0) throw std::system_error(errno, std::generic_category(), "fsync");
	} catch (const std::system_error &e) {
		if (before < 0 || ::ftruncate(channel->fd, before) != 0) {
			// The partial line would prefix the next record; stop appending until reconfigured.
			std::cerr << "[MirrorLog] " << engineId << " could not roll back partial record " << sequence
					  << ": " << std::strerror(errno) << ", closing " << channel->file.string() << std::endl;
			closeChannel(*channel);
		}
		throw storageFailure(std::string("mirror append failed: ") + e.what(), engineId);
	}
	channel->nextSequence++;
	return sequence;
}

fs::path MirrorLog::logFile(const std::string &engineId) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = files_.find(engineId);
	if (it != files_.end()) return it->second;
	return defaultRoot_ / engineId / kLogFileName;
}

std::size_t MirrorLog::replayInto(const std::string &engineId, const std::function<void(const MirrorRecord &)> &sink) const {
	fs::path file = logFile(engineId);
	LogScan scan = scanLog(file);
	for (std::size_t line : scan.unreadable) {
		if (scan.tornTail && line == scan.lines) {
			std::cerr << "[MirrorLog] " << engineId << " skipping torn record at line " << line << std::endl;
			continue;
		}
		throw storageFailure("unreadable mirror record at " + file.string() + ":" + std::to_string(line), engineId);
	}

	std::vector<MirrorRecord> records;
	records.reserve(scan.records.size());
	for (auto &rec : scan.records) {
		MirrorRecord out;
		out.engineId = engineId;
		out.sequence = rec.second["sequence"].get<uint64_t>();
		try {
			out.event = Event::fromStored(rec.second["event"]);
		} catch (const EngineError &e) {
			throw storageFailure("invalid mirrored event at " + file.string() + ":" + std::to_string(rec.first) + ": " + e.what(), engineId);
		}
		records.push_back(std::move(out));
	}
	std::stable_sort(records.begin(), records.end(), [](const MirrorRecord &a, const MirrorRecord &b) {
		return a.sequence < b.sequence;
	});
	for (const auto &rec : records) sink(rec);
	return records.size();
}

json MirrorLog::verify(const std::string &engineId) const {
	fs::path file = logFile(engineId);
	json report{{"engineId", engineId}, {"file", file.string()}, {"enabled", isEnabled(engineId)},
				{"exists", fs::exists(file)}, {"records", 0}, {"firstSequence", nullptr},
				{"lastSequence", nullptr}, {"gaps", json::array()}, {"unreadableLines", json::array()},
				{"tornTail", false}};
	if (!fs::exists(file)) return report;

	LogScan scan = scanLog(file);
	std::vector<uint64_t> sequences;
	sequences.reserve(scan.records.size());
	for (auto &rec : scan.records) sequences.push_back(rec.second["sequence"].get<uint64_t>());
	std::sort(sequences.begin(), sequences.end());

	report["records"] = sequences.size();
	report["unreadableLines"] = scan.unreadable;
	report["tornTail"] = scan.tornTail;
	if (sequences.empty()) return report;

	report["firstSequence"] = sequences.front();
	report["lastSequence"] = sequences.back();
	json gaps = json::array();
	if (sequences.front() > 1) gaps.push_back(json{{"from", 1}, {"to", sequences.front() - 1}});
	for (std::size_t i = 1; i < sequences.size(); i++) {
		if (sequences[i] == sequences[i - 1]) {
			gaps.push_back(json{{"duplicate", sequences[i]}});
		} else if (sequences[i] > sequences[i - 1] + 1) {
			gaps.push_back(json{{"from", sequences[i - 1] + 1}, {"to", sequences[i] - 1}});
		}
	}
	report["gaps"] = gaps;
	return report;
}

} // namespace enginehost
