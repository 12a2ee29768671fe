#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine.hpp"
#include "event.hpp"

namespace enginehost {

using json = nlohmann::json;

enum class TrainingState { Idle, Training, Failed };

const char *trainingStateName(TrainingState state);

// Decides what follows an accepted event and runs batch training off the
// request thread. Per instance it guarantees:
//  - inputs are admitted one at a time in arrival order,
//  - at most one mutation path (incremental update or batch run) is active,
//  - at most one batch run exists; a second request gets AlreadyTraining.
class TrainingOrchestrator {
	struct Slot;

public:
	// Held while one input is mirrored and applied. Releases the next waiter on destruction.
	class Admission {
	public:
		Admission(Admission &&other) noexcept : slot_(std::move(other.slot_)) {}
		Admission &operator=(Admission &&) = delete;
		Admission(const Admission &) = delete;
		~Admission();

	private:
		friend class TrainingOrchestrator;
		explicit Admission(std::shared_ptr<Slot> slot) : slot_(std::move(slot)) {}
		std::shared_ptr<Slot> slot_;
	};

	explicit TrainingOrchestrator(int workers);
	~TrainingOrchestrator();

	TrainingOrchestrator(const TrainingOrchestrator &) = delete;
	TrainingOrchestrator &operator=(const TrainingOrchestrator &) = delete;

	void attach(const std::string &engineId, std::shared_ptr<Engine> engine, Discipline discipline);

	// Removes the instance so no new work is admitted, then blocks until any
	// in-flight input, incremental update or batch run has finished.
	void detach(const std::string &engineId);

	// Waits for this instance's turn. NotFound if the instance is detached.
	Admission admit(const std::string &engineId);

	// Stores the event in the Dataset and, for Continuous and Mixed instances,
	// applies the incremental update (deferred while a batch run is in flight).
	json onInput(const Admission &admission, const Event &event);

	// Starts a batch run on the worker pool and returns without waiting for it.
	json requestTrain(const std::string &engineId);

	TrainingState state(const std::string &engineId) const;
	json status(const std::string &engineId) const;

	// True once the instance is no longer Training, false on timeout.
	bool waitUntilSettled(const std::string &engineId, std::chrono::milliseconds timeout) const;

	void stop();

private:
	struct Slot {
		std::string engineId;
		std::shared_ptr<Engine> engine;
		Discipline discipline{Discipline::Periodic};

		mutable std::mutex mu;
		mutable std::condition_variable cv;
		TrainingState state{TrainingState::Idle};
		bool incrementalInFlight{false};
		bool detached{false};
		uint64_t nextTicket{0};
		uint64_t serving{0};
		std::deque<Event> deferred;

		uint64_t runs{0};
		uint64_t failures{0};
		uint64_t incrementalUpdates{0};
		uint64_t deferredFailures{0};
		std::string lastError;
		int64_t lastStartedAt{0};
		int64_t lastFinishedAt{0};
		json lastResult;
	};

	std::shared_ptr<Slot> find(const std::string &engineId) const;
	void runBatch(const std::shared_ptr<Slot> &slot);
	bool enqueue(std::function<void()> task);
	void workerLoop();

	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

	std::atomic<bool> running_{false};
	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> queue_;
	std::mutex queueMu_;
	std::condition_variable queueCv_;
};

} // namespace enginehost
