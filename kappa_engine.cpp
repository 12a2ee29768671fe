#include "kappa_engine.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "errors.hpp"
#include "params.hpp"

namespace enginehost {

namespace {

constexpr const char *kEventCountKey = "meta:eventCount";
constexpr const char *kCountPrefix = "count:";
constexpr const char *kScorePrefix = "score:";

std::set<std::string> namesOf(const std::vector<std::string> &names) {
	return std::set<std::string>(names.begin(), names.end());
}

} // namespace

KappaEngine::KappaEngine(EngineContext ctx) : ctx_(std::move(ctx)) {}

std::vector<KappaEngine::Indicator> KappaEngine::parseIndicators(const json &params) {
	json algo = params::section(params, "algorithm");
	if (!algo.contains("indicators") || algo["indicators"].is_null()) {
		throw validationError("algorithm.indicators", "missing required parameter \"algorithm.indicators\"");
	}
	const auto &list = algo["indicators"];
	if (!list.is_array() || list.empty()) {
		throw validationError("algorithm.indicators", "\"algorithm.indicators\" must be a non-empty array");
	}
	std::vector<Indicator> out;
	for (std::size_t i = 0; i < list.size(); i++) {
		std::string path = "algorithm.indicators[" + std::to_string(i) + "]";
		if (!list[i].is_object()) throw validationError(path, "\"" + path + "\" must be an object");
		Indicator ind;
		ind.name = params::requireString(list[i], "name", path);
		if (ind.name.empty() || ind.name[0] == '$') throw validationError(path + ".name", "invalid indicator name \"" + ind.name + "\"");
		ind.weight = params::doubleOr(list[i], "weight", 1.0, path);
		for (const auto &seen : out) {
			if (seen.name == ind.name) throw validationError(path + ".name", "duplicate indicator \"" + ind.name + "\"");
		}
		out.push_back(ind);
	}
	return out;
}

void KappaEngine::load() {
	auto count = ctx_.store->get(kEventCountKey);
	eventCount_ = (count && count->is_number_unsigned()) ? count->get<uint64_t>() : 0;
	const std::size_t countPrefixLen = std::string(kCountPrefix).size();
	for (const auto &kv : ctx_.store->entries(kCountPrefix)) {
		if (kv.second.is_number_unsigned()) counts_[kv.first.substr(countPrefixLen)] = kv.second.get<uint64_t>();
	}
	const std::size_t scorePrefixLen = std::string(kScorePrefix).size();
	for (const auto &kv : ctx_.store->entries(kScorePrefix)) {
		if (kv.second.is_number()) scores_[kv.first.substr(scorePrefixLen)] = kv.second.get<double>();
	}
}

void KappaEngine::init(const json &params) {
	auto next = parseIndicators(params);
	json algo = params::section(params, "algorithm");
	int num = params::intOr(algo, "num", 10, "algorithm");
	if (num <= 0) throw validationError("algorithm.num", "\"algorithm.num\" must be positive");

	std::lock_guard<std::mutex> lock(mu_);
	if (initialized_) {
		std::vector<std::string> before, after;
		for (const auto &ind : indicators_) before.push_back(ind.name);
		for (const auto &ind : next) after.push_back(ind.name);
		if (namesOf(before) != namesOf(after)) {
			throw EngineError(ErrorKind::UnsupportedUpdate, "indicator names cannot change on a continuous engine",
							  "algorithm.indicators", ctx_.engineId);
		}
	} else {
		load();
		initialized_ = true;
	}
	indicators_ = std::move(next);
	num_ = num;
}

Capabilities KappaEngine::capabilities() const {
	Capabilities caps;
	caps.incrementalUpdate = true;
	return caps;
}

void KappaEngine::validateEvent(const Event &event) const {
	if (event.isReserved()) {
		throw validationError("event", "\"" + event.event + "\" is not supported by this engine");
	}
}

json KappaEngine::input(const Event &event) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = std::find_if(indicators_.begin(), indicators_.end(), [&](const Indicator &ind) { return ind.name == event.event; });
	if (it == indicators_.end()) return json{{"stored", false}};
	uint64_t count = counts_[event.event] + 1;
	uint64_t total = eventCount_ + 1;
	ctx_.store->put(kCountPrefix + event.event, count);
	ctx_.store->put(kEventCountKey, total);
	counts_[event.event] = count;
	eventCount_ = total;
	return json{{"stored", true}, {"eventCount", eventCount_}};
}

json KappaEngine::applyIncremental(const Event &event) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = std::find_if(indicators_.begin(), indicators_.end(), [&](const Indicator &ind) { return ind.name == event.event; });
	if (it == indicators_.end() || !event.targetEntityId) return json{{"applied", false}};
	const std::string &item = *event.targetEntityId;
	double score = scores_[item] + it->weight;
	ctx_.store->put(kScorePrefix + item, score);
	scores_[item] = score;
	updates_++;
	return json{{"applied", true}, {"item", item}, {"score", score}};
}

json KappaEngine::query(const json &query) {
	auto item = params::optString(query, "item");
	std::lock_guard<std::mutex> lock(mu_);
	if (item) {
		auto it = scores_.find(*item);
		return json{{"item", *item}, {"score", it == scores_.end() ? 0.0 : it->second}};
	}
	int num = params::intOr(query, "num", num_);
	if (num <= 0) throw validationError("num", "\"num\" must be positive");

	std::vector<std::pair<std::string, double>> ranked(scores_.begin(), scores_.end());
	std::sort(ranked.begin(), ranked.end(), [](const std::pair<std::string, double> &a, const std::pair<std::string, double> &b) {
		if (a.second != b.second) return a.second > b.second;
		return a.first < b.first;
	});
	json result = json::array();
	for (const auto &r : ranked) {
		if ((int)result.size() >= num) break;
		result.push_back(json{{"item", r.first}, {"score", r.second}});
	}
	return json{{"result", result}};
}

void KappaEngine::destroy() {
	std::lock_guard<std::mutex> lock(mu_);
	counts_.clear();
	scores_.clear();
	eventCount_ = 0;
	updates_ = 0;
	ctx_.store->clear();
}

json KappaEngine::status() const {
	std::lock_guard<std::mutex> lock(mu_);
	json weights = json::object();
	for (const auto &ind : indicators_) weights[ind.name] = ind.weight;
	return json{{"dataset", {{"eventCount", eventCount_}, {"counts", counts_}}},
				{"model", {{"items", scores_.size()}, {"updates", updates_}, {"weights", weights}}}};
}

} // namespace enginehost
