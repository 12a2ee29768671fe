#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine.hpp"

namespace enginehost {

using json = nlohmann::json;

// Kappa-style engine: every indicator event is folded into a per-item weighted
// score as it arrives. There is no batch step.
class KappaEngine : public Engine {
public:
	static constexpr const char *kType = "kappa";

	explicit KappaEngine(EngineContext ctx);

	void init(const json &params) override;
	Capabilities capabilities() const override;
	void validateEvent(const Event &event) const override;
	json input(const Event &event) override;
	json applyIncremental(const Event &event) override;
	json query(const json &query) override;
	void destroy() override;
	json status() const override;

private:
	struct Indicator {
		std::string name;
		double weight{1.0};
	};

	static std::vector<Indicator> parseIndicators(const json &params);
	void load();

	EngineContext ctx_;
	mutable std::mutex mu_;
	std::vector<Indicator> indicators_;
	int num_{10};
	bool initialized_{false};
	uint64_t eventCount_{0};
	uint64_t updates_{0};
	std::map<std::string, uint64_t> counts_;
	std::unordered_map<std::string, double> scores_;
};

} // namespace enginehost
