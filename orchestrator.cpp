#include "orchestrator.hpp"

#include <algorithm>
#include <iostream>

#include "errors.hpp"
#include "util.hpp"

namespace enginehost {

const char *trainingStateName(TrainingState state) {
	switch (state) {
	case TrainingState::Idle: return "idle";
	case TrainingState::Training: return "training";
	case TrainingState::Failed: return "failed";
	}
	return "unknown";
}

TrainingOrchestrator::Admission::~Admission() {
	if (!slot_) return;
	{
		std::lock_guard<std::mutex> lock(slot_->mu);
		slot_->serving++;
	}
	slot_->cv.notify_all();
}

TrainingOrchestrator::TrainingOrchestrator(int workers) {
	int count = std::max(1, workers);
	running_ = true;
	workers_.reserve(count);
	for (int i = 0; i < count; i++) {
		workers_.emplace_back([this]() { workerLoop(); });
	}
}

TrainingOrchestrator::~TrainingOrchestrator() {
	stop();
}

void TrainingOrchestrator::stop() {
	if (!running_) return;
	{
		std::lock_guard<std::mutex> lock(queueMu_);
		running_ = false;
	}
	queueCv_.notify_all();
	for (auto &t : workers_) {
		if (t.joinable()) t.join();
	}
	workers_.clear();
}

bool TrainingOrchestrator::enqueue(std::function<void()> task) {
	{
		std::lock_guard<std::mutex> lock(queueMu_);
		if (!running_) return false;
		queue_.push(std::move(task));
	}
	queueCv_.notify_one();
	return true;
}

void TrainingOrchestrator::workerLoop() {
	while (true) {
		std::function<void()> task;
		{
			std::unique_lock<std::mutex> lock(queueMu_);
			queueCv_.wait(lock, [&]() { return !running_ || !queue_.empty(); });
			if (!running_ && queue_.empty()) return;
			task = std::move(queue_.front());
			queue_.pop();
		}
		task();
	}
}

void TrainingOrchestrator::attach(const std::string &engineId, std::shared_ptr<Engine> engine, Discipline discipline) {
	auto slot = std::make_shared<Slot>();
	slot->engineId = engineId;
	slot->engine = std::move(engine);
	slot->discipline = discipline;
	std::lock_guard<std::mutex> lock(mu_);
	if (slots_.count(engineId)) {
		throw EngineError(ErrorKind::DuplicateId, "engine already attached: " + engineId, "engineId", engineId);
	}
	slots_[engineId] = std::move(slot);
}

void TrainingOrchestrator::detach(const std::string &engineId) {
	std::shared_ptr<Slot> slot;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = slots_.find(engineId);
		if (it == slots_.end()) return;
		slot = it->second;
		slots_.erase(it);
	}
	std::unique_lock<std::mutex> lock(slot->mu);
	slot->detached = true;
	slot->cv.notify_all();
	if (slot->state == TrainingState::Training) {
		std::cout << "[Orchestrator] " << engineId << " waiting for batch run to finish before teardown" << std::endl;
	}
	slot->cv.wait(lock, [&]() {
		return slot->state != TrainingState::Training && !slot->incrementalInFlight && slot->serving == slot->nextTicket;
	});
	slot->deferred.clear();
}

std::shared_ptr<TrainingOrchestrator::Slot> TrainingOrchestrator::find(const std::string &engineId) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = slots_.find(engineId);
	if (it == slots_.end()) throw notFound(engineId);
	return it->second;
}

TrainingOrchestrator::Admission TrainingOrchestrator::admit(const std::string &engineId) {
	auto slot = find(engineId);
	std::unique_lock<std::mutex> lock(slot->mu);
	uint64_t ticket = slot->nextTicket++;
	slot->cv.wait(lock, [&]() { return slot->detached || slot->serving == ticket; });
	if (slot->detached) {
		// Give up the turn so teardown is not left waiting on this ticket.
		slot->cv.wait(lock, [&]() { return slot->serving == ticket; });
		slot->serving++;
		lock.unlock();
		slot->cv.notify_all();
		throw notFound(engineId);
	}
	return Admission(slot);
}

json TrainingOrchestrator::onInput(const Admission &admission, const Event &event) {
	Slot &slot = *admission.slot_;
	json out{{"engineId", slot.engineId}};
	out["dataset"] = guardAlgorithm(slot.engineId, "input", [&]() { return slot.engine->input(event); });

	if (slot.discipline == Discipline::Periodic) return out;

	{
		std::lock_guard<std::mutex> lock(slot.mu);
		if (slot.state == TrainingState::Training) {
			slot.deferred.push_back(event);
			out["deferred"] = true;
			return out;
		}
		slot.incrementalInFlight = true;
	}

	struct InFlightReset {
		Slot &slot;
		bool applied{false};
		~InFlightReset() {
			{
				std::lock_guard<std::mutex> lock(slot.mu);
				slot.incrementalInFlight = false;
				if (applied) slot.incrementalUpdates++;
			}
			slot.cv.notify_all();
		}
	} reset{slot};

	out["model"] = guardAlgorithm(slot.engineId, "applyIncremental", [&]() { return slot.engine->applyIncremental(event); });
	reset.applied = true;
	return out;
}

json TrainingOrchestrator::requestTrain(const std::string &engineId) {
	auto slot = find(engineId);
	if (slot->discipline == Discipline::Continuous) {
		throw EngineError(ErrorKind::Validation, "continuous engines have no batch training", "engineId", engineId);
	}
	{
		std::lock_guard<std::mutex> lock(slot->mu);
		if (slot->detached) throw notFound(engineId);
		if (slot->state == TrainingState::Training) {
			throw EngineError(ErrorKind::AlreadyTraining, "a batch run is already in flight", "", engineId);
		}
		slot->state = TrainingState::Training;
		slot->lastStartedAt = nowEpochMs();
		slot->runs++;
	}

	if (!enqueue([this, slot]() { runBatch(slot); })) {
		{
			std::lock_guard<std::mutex> lock(slot->mu);
			slot->state = TrainingState::Failed;
			slot->lastError = "orchestrator is stopped";
			slot->failures++;
		}
		slot->cv.notify_all();
		throw EngineError(ErrorKind::AlgorithmFailure, "training workers are stopped", "", engineId);
	}
	std::cout << "[Orchestrator] " << engineId << " batch run queued" << std::endl;
	return json{{"engineId", engineId}, {"status", "accepted"}, {"state", trainingStateName(TrainingState::Training)}};
}

void TrainingOrchestrator::runBatch(const std::shared_ptr<Slot> &slot) {
	{
		std::unique_lock<std::mutex> lock(slot->mu);
		slot->cv.wait(lock, [&]() { return !slot->incrementalInFlight; });
	}

	bool ok = false;
	json result;
	std::string error;
	try {
		result = guardAlgorithm(slot->engineId, "train", [&]() { return slot->engine->train(); });
		ok = true;
	} catch (const std::exception &e) {
		error = e.what();
	}
	if (ok) {
		std::cout << "[Orchestrator] " << slot->engineId << " batch run finished" << std::endl;
	} else {
		std::cerr << "[Orchestrator] " << slot->engineId << " batch run failed: " << error << std::endl;
	}

	// Incremental updates that arrived during the run go next, in arrival order,
	// before the instance leaves Training.
	while (true) {
		std::deque<Event> pending;
		{
			std::lock_guard<std::mutex> lock(slot->mu);
			if (slot->deferred.empty()) {
				slot->state = ok ? TrainingState::Idle : TrainingState::Failed;
				slot->lastFinishedAt = nowEpochMs();
				if (ok) {
					slot->lastResult = result;
					slot->lastError.clear();
				} else {
					slot->lastError = error;
					slot->failures++;
				}
				break;
			}
			pending.swap(slot->deferred);
		}
		for (const auto &event : pending) {
			try {
				guardAlgorithm(slot->engineId, "applyIncremental", [&]() { return slot->engine->applyIncremental(event); });
				std::lock_guard<std::mutex> lock(slot->mu);
				slot->incrementalUpdates++;
			} catch (const std::exception &e) {
				std::cerr << "[Orchestrator] " << slot->engineId << " deferred update for " << event.entityId
						  << " failed: " << e.what() << std::endl;
				std::lock_guard<std::mutex> lock(slot->mu);
				slot->deferredFailures++;
			}
		}
	}
	slot->cv.notify_all();
}

TrainingState TrainingOrchestrator::state(const std::string &engineId) const {
	auto slot = find(engineId);
	std::lock_guard<std::mutex> lock(slot->mu);
	return slot->state;
}

json TrainingOrchestrator::status(const std::string &engineId) const {
	auto slot = find(engineId);
	std::lock_guard<std::mutex> lock(slot->mu);
	json out{{"state", trainingStateName(slot->state)},
			 {"discipline", disciplineName(slot->discipline)},
			 {"runs", slot->runs},
			 {"failures", slot->failures},
			 {"incrementalUpdates", slot->incrementalUpdates},
			 {"deferred", slot->deferred.size()},
			 {"deferredFailures", slot->deferredFailures},
			 {"lastError", slot->lastError.empty() ? json(nullptr) : json(slot->lastError)},
			 {"lastStartedAt", slot->lastStartedAt ? json(formatIso(slot->lastStartedAt)) : json(nullptr)},
			 {"lastFinishedAt", slot->lastFinishedAt ? json(formatIso(slot->lastFinishedAt)) : json(nullptr)}};
	if (!slot->lastResult.is_null()) out["lastResult"] = slot->lastResult;
	return out;
}

bool TrainingOrchestrator::waitUntilSettled(const std::string &engineId, std::chrono::milliseconds timeout) const {
	auto slot = find(engineId);
	std::unique_lock<std::mutex> lock(slot->mu);
	return slot->cv.wait_for(lock, timeout, [&]() { return slot->state != TrainingState::Training; });
}

} // namespace enginehost
