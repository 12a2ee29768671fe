#include "scaffold_engine.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <utility>

#include "errors.hpp"
#include "params.hpp"
#include "util.hpp"

namespace enginehost {

namespace {

constexpr const char *kEventPrefix = "event:";
constexpr const char *kItemPrefix = "item:";
constexpr const char *kEventCountKey = "meta:eventCount";
constexpr const char *kModelKey = "model";

std::string eventKey(uint64_t n) {
	char buf[32];
	std::snprintf(buf, sizeof(buf), "event:%012llu", (unsigned long long)n);
	return buf;
}

} // namespace

ScaffoldEngine::ScaffoldEngine(EngineContext ctx) : ctx_(std::move(ctx)) {}

ScaffoldEngine::Settings ScaffoldEngine::parseSettings(const json &params) {
	json algo = params::section(params, "algorithm");
	Settings s;
	if (auto names = params::optStringList(algo, "eventNames", "algorithm")) {
		s.indicators = *names;
	} else if (algo.contains("indicators") && !algo["indicators"].is_null()) {
		const auto &list = algo["indicators"];
		if (!list.is_array()) throw validationError("algorithm.indicators", "\"algorithm.indicators\" must be an array");
		for (std::size_t i = 0; i < list.size(); i++) {
			std::string path = "algorithm.indicators[" + std::to_string(i) + "]";
			if (!list[i].is_object()) throw validationError(path, "\"" + path + "\" must be an object");
			s.indicators.push_back(params::requireString(list[i], "name", path));
		}
	}
	if (s.indicators.empty()) {
		throw validationError("algorithm.eventNames", "algorithm.eventNames or algorithm.indicators must name at least one event");
	}
	for (const auto &name : s.indicators) {
		if (name.empty() || name[0] == '$') throw validationError("algorithm.eventNames", "invalid indicator name \"" + name + "\"");
	}
	s.num = params::intOr(algo, "num", 20, "algorithm");
	if (s.num <= 0) throw validationError("algorithm.num", "\"algorithm.num\" must be positive");
	s.realtimeProperties = params::boolOr(algo, "realtimeProperties", false, "algorithm");
	return s;
}

bool ScaffoldEngine::isIndicator(const Settings &settings, const std::string &name) const {
	return std::find(settings.indicators.begin(), settings.indicators.end(), name) != settings.indicators.end();
}

void ScaffoldEngine::init(const json &params) {
	Settings next = parseSettings(params);
	std::lock_guard<std::mutex> lock(mu_);
	if (initialized_) {
		if (next.realtimeProperties != settings_.realtimeProperties) {
			throw EngineError(ErrorKind::UnsupportedUpdate, "realtimeProperties cannot change on an existing engine",
							  "algorithm.realtimeProperties", ctx_.engineId);
		}
		settings_ = std::move(next);
		return;
	}
	auto count = ctx_.store->get(kEventCountKey);
	eventCount_ = (count && count->is_number_unsigned()) ? count->get<uint64_t>() : 0;
	auto model = ctx_.store->get(kModelKey);
	if (model && model->is_object() && model->contains("ranking")) model_ = std::make_shared<const json>(*model);
	settings_ = std::move(next);
	initialized_ = true;
}

Capabilities ScaffoldEngine::capabilities() const {
	std::lock_guard<std::mutex> lock(mu_);
	Capabilities caps;
	caps.batchTrain = true;
	caps.incrementalUpdate = settings_.realtimeProperties;
	return caps;
}

void ScaffoldEngine::validateEvent(const Event &event) const {
	if (!event.isReserved()) return;
	std::lock_guard<std::mutex> lock(mu_);
	if (!settings_.realtimeProperties) {
		throw validationError("event", "\"" + event.event + "\" needs algorithm.realtimeProperties on this engine");
	}
	if (event.event != "$set" && event.event != "$unset" && event.event != "$delete") {
		throw validationError("event", "unknown reserved event \"" + event.event + "\"");
	}
	if (event.entityType != "item") {
		throw validationError("entityType", "\"" + event.event + "\" applies to entityType \"item\" only");
	}
}

json ScaffoldEngine::input(const Event &event) {
	if (event.isReserved()) return json{{"stored", false}};
	std::lock_guard<std::mutex> lock(mu_);
	if (!isIndicator(settings_, event.event)) return json{{"stored", false}};
	uint64_t next = eventCount_ + 1;
	ctx_.store->put(eventKey(next), event.toJson());
	ctx_.store->put(kEventCountKey, next);
	eventCount_ = next;
	return json{{"stored", true}, {"eventCount", eventCount_}};
}

json ScaffoldEngine::applyIncremental(const Event &event) {
	if (!event.isReserved()) return json{{"applied", false}};
	std::lock_guard<std::mutex> lock(mu_);
	if (!settings_.realtimeProperties) {
		throw validationError("event", "\"" + event.event + "\" needs algorithm.realtimeProperties on this engine");
	}
	std::string key = kItemPrefix + event.entityId;
	if (event.event == "$delete") {
		ctx_.store->del(key);
		return json{{"applied", true}, {"item", event.entityId}, {"deleted", true}};
	}

	auto current = ctx_.store->get(key);
	json props = (current && current->is_object()) ? *current : json::object();
	if (event.event == "$set") {
		for (auto it = event.properties.begin(); it != event.properties.end(); ++it) props[it.key()] = it.value();
	} else {
		for (auto it = event.properties.begin(); it != event.properties.end(); ++it) props.erase(it.key());
	}
	if (props.empty()) {
		ctx_.store->del(key);
	} else {
		ctx_.store->put(key, props);
	}
	return json{{"applied", true}, {"item", event.entityId}, {"properties", props}};
}

json ScaffoldEngine::train() {
	Settings s;
	{
		std::lock_guard<std::mutex> lock(mu_);
		s = settings_;
	}
	const std::string backfill = s.indicators.front();

	std::map<std::string, uint64_t> counts;
	uint64_t used = 0;
	for (const auto &kv : ctx_.store->entries(kEventPrefix)) {
		const json &ev = kv.second;
		if (!ev.is_object() || ev.value("event", "") != backfill) continue;
		if (!ev.contains("targetEntityId") || !ev["targetEntityId"].is_string()) continue;
		counts[ev["targetEntityId"].get<std::string>()]++;
		used++;
	}

	std::vector<std::pair<std::string, uint64_t>> ranked(counts.begin(), counts.end());
	std::stable_sort(ranked.begin(), ranked.end(), [](const std::pair<std::string, uint64_t> &a, const std::pair<std::string, uint64_t> &b) {
		return a.second > b.second;
	});
	json ranking = json::array();
	for (const auto &r : ranked) ranking.push_back(json{{"item", r.first}, {"score", (double)r.second}});

	json model{{"backfill", backfill}, {"events", used}, {"ranking", ranking}, {"trainedAt", nowIso()}};
	// Persist first: a failed write keeps the previous model serving.
	ctx_.store->put(kModelKey, model);
	{
		std::lock_guard<std::mutex> lock(mu_);
		model_ = std::make_shared<const json>(std::move(model));
	}
	return json{{"items", ranked.size()}, {"events", used}};
}

json ScaffoldEngine::query(const json &query) {
	std::shared_ptr<const json> model;
	Settings s;
	{
		std::lock_guard<std::mutex> lock(mu_);
		model = model_;
		s = settings_;
	}
	int num = params::intOr(query, "num", s.num);
	if (num <= 0) throw validationError("num", "\"num\" must be positive");

	json result = json::array();
	if (model) {
		for (const auto &entry : model->at("ranking")) {
			if ((int)result.size() >= num) break;
			json item = entry;
			if (s.realtimeProperties) {
				auto props = ctx_.store->get(kItemPrefix + entry.at("item").get<std::string>());
				if (props) item["properties"] = *props;
			}
			result.push_back(item);
		}
	}
	return json{{"result", result}};
}

void ScaffoldEngine::destroy() {
	std::lock_guard<std::mutex> lock(mu_);
	model_.reset();
	eventCount_ = 0;
	ctx_.store->clear();
}

json ScaffoldEngine::status() const {
	std::lock_guard<std::mutex> lock(mu_);
	json model{{"trained", model_ != nullptr}};
	if (model_) {
		model["trainedAt"] = model_->value("trainedAt", "");
		model["items"] = model_->at("ranking").size();
		model["events"] = model_->value("events", 0);
	}
	return json{{"dataset", {{"eventCount", eventCount_}, {"indicators", settings_.indicators}}},
				{"model", model},
				{"realtimeProperties", settings_.realtimeProperties}};
}

} // namespace enginehost
